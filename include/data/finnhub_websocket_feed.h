#pragma once

#include "data/market_data_feed.h"
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <set>

namespace tickagg {

// Finnhub real-time trades over TLS WebSocket
class FinnhubWebSocketFeed : public MarketDataFeed {
private:
    using client = websocketpp::client<websocketpp::config::asio_tls_client>;
    using context_ptr = websocketpp::lib::shared_ptr<websocketpp::lib::asio::ssl::context>;

    mutable client ws_client_;
    websocketpp::connection_hdl connection_;
    std::thread ws_thread_;

    std::string api_token_;

    // Symbols requested before the socket opened are sent from on_open
    std::set<std::string> subscribed_symbols_;
    std::mutex subscription_mutex_;

    void on_open(websocketpp::connection_hdl hdl);
    void on_close(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, client::message_ptr msg);
    void on_fail(websocketpp::connection_hdl hdl);
    context_ptr on_tls_init(websocketpp::connection_hdl hdl);

    bool sendText(const std::string& text, std::string& error);

public:
    explicit FinnhubWebSocketFeed(const std::string& api_token);
    ~FinnhubWebSocketFeed() override;

    // url without credentials, e.g. wss://ws.finnhub.io
    bool connect(const std::string& url) override;
    void disconnect() override;
    bool isConnected() const override;

    void subscribe(const std::string& symbol) override;
    void unsubscribe(const std::string& symbol) override;
};

} // namespace tickagg
