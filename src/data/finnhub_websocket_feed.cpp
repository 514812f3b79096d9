#include "data/finnhub_websocket_feed.h"
#include "utils/logger.h"

namespace tickagg {

FinnhubWebSocketFeed::FinnhubWebSocketFeed(const std::string& api_token)
    : api_token_(api_token) {

    ws_client_.init_asio();

    ws_client_.set_open_handler(
        std::bind(&FinnhubWebSocketFeed::on_open, this, std::placeholders::_1)
    );
    ws_client_.set_close_handler(
        std::bind(&FinnhubWebSocketFeed::on_close, this, std::placeholders::_1)
    );
    ws_client_.set_message_handler(
        std::bind(&FinnhubWebSocketFeed::on_message, this,
                  std::placeholders::_1, std::placeholders::_2)
    );
    ws_client_.set_fail_handler(
        std::bind(&FinnhubWebSocketFeed::on_fail, this, std::placeholders::_1)
    );
    ws_client_.set_tls_init_handler(
        std::bind(&FinnhubWebSocketFeed::on_tls_init, this, std::placeholders::_1)
    );

    ws_client_.set_access_channels(websocketpp::log::alevel::none);
    ws_client_.set_error_channels(websocketpp::log::elevel::warn |
                                  websocketpp::log::elevel::rerror |
                                  websocketpp::log::elevel::fatal);
}

FinnhubWebSocketFeed::~FinnhubWebSocketFeed() {
    disconnect();
}

bool FinnhubWebSocketFeed::connect(const std::string& url) {
    const std::string connection_string = url + "?token=" + api_token_;

    try {
        websocketpp::lib::error_code ec;
        client::connection_ptr con = ws_client_.get_connection(connection_string, ec);

        if (ec) {
            notifyError("Connection initialization error: " + ec.message());
            return false;
        }

        ws_client_.connect(con);

        startProcessing();

        ws_thread_ = std::thread([this]() {
            ws_client_.run();
        });

        LOG_INFO("Connecting to " + url);
        return true;

    } catch (const websocketpp::exception& e) {
        notifyError("Connection error: " + std::string(e.what()));
        return false;
    }
}

void FinnhubWebSocketFeed::disconnect() {
    if (isConnected()) {
        websocketpp::lib::error_code ec;
        ws_client_.close(connection_, websocketpp::close::status::going_away, "", ec);
        if (ec) {
            LOG_WARNING("WebSocket close error: " + ec.message());
        }
    }

    ws_client_.stop();

    if (ws_thread_.joinable()) {
        ws_thread_.join();
    }

    stopProcessing();
}

bool FinnhubWebSocketFeed::isConnected() const {
    if (connection_.expired()) {
        return false;
    }

    websocketpp::lib::error_code ec;
    auto con = ws_client_.get_con_from_hdl(connection_, ec);
    return !ec && con->get_state() == websocketpp::session::state::open;
}

bool FinnhubWebSocketFeed::sendText(const std::string& text, std::string& error) {
    websocketpp::lib::error_code ec;
    ws_client_.send(connection_, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    return true;
}

void FinnhubWebSocketFeed::subscribe(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(subscription_mutex_);
        subscribed_symbols_.insert(symbol);
    }

    if (!isConnected()) {
        LOG_SYMBOL_DEBUG(symbol, "Subscription deferred until connection opens");
        return;
    }

    std::string error;
    if (!sendText(makeSubscribeRequest(symbol), error)) {
        notifyError("Subscribe error for " + symbol + ": " + error);
        return;
    }
    LOG_SYMBOL_INFO(symbol, "Subscribed");
}

void FinnhubWebSocketFeed::unsubscribe(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(subscription_mutex_);
        subscribed_symbols_.erase(symbol);
    }

    if (!isConnected()) {
        return;
    }

    std::string error;
    if (!sendText(makeUnsubscribeRequest(symbol), error)) {
        LOG_SYMBOL_WARNING(symbol, "Unsubscribe error: " + error);
    }
}

void FinnhubWebSocketFeed::on_open(websocketpp::connection_hdl hdl) {
    connection_ = hdl;
    LOG_INFO("WebSocket connection opened");

    std::set<std::string> symbols;
    {
        std::lock_guard<std::mutex> lock(subscription_mutex_);
        symbols = subscribed_symbols_;
    }

    for (const auto& symbol : symbols) {
        std::string error;
        if (!sendText(makeSubscribeRequest(symbol), error)) {
            notifyError("Subscribe error for " + symbol + ": " + error);
            continue;
        }
        LOG_SYMBOL_INFO(symbol, "Subscribed");
    }
}

void FinnhubWebSocketFeed::on_close(websocketpp::connection_hdl hdl) {
    notifyError("WebSocket connection closed");
}

void FinnhubWebSocketFeed::on_message(websocketpp::connection_hdl hdl,
                                      client::message_ptr msg) {
    enqueuePayload(msg->get_payload());
}

void FinnhubWebSocketFeed::on_fail(websocketpp::connection_hdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = ws_client_.get_con_from_hdl(hdl, ec);
    std::string reason = ec ? ec.message() : con->get_ec().message();
    notifyError("WebSocket connection failed: " + reason);
}

FinnhubWebSocketFeed::context_ptr FinnhubWebSocketFeed::on_tls_init(
    websocketpp::connection_hdl) {

    context_ptr ctx = websocketpp::lib::make_shared<
        websocketpp::lib::asio::ssl::context>(
            websocketpp::lib::asio::ssl::context::tlsv12
    );

    try {
        ctx->set_options(
            websocketpp::lib::asio::ssl::context::default_workarounds |
            websocketpp::lib::asio::ssl::context::no_sslv2 |
            websocketpp::lib::asio::ssl::context::no_sslv3 |
            websocketpp::lib::asio::ssl::context::single_dh_use
        );
    } catch (const std::exception& e) {
        LOG_ERROR("TLS initialization error: " + std::string(e.what()));
    }

    return ctx;
}

} // namespace tickagg
