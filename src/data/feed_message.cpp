#include "data/feed_message.h"
#include <nlohmann/json.hpp>

namespace tickagg {

namespace {

TradeTick parseTrade(const nlohmann::json& trade_json) {
    TradeTick trade;

    trade.symbol = trade_json.at("s").get<std::string>();
    trade.price = trade_json.at("p").get<double>();
    trade.volume = trade_json.value("v", 0.0);

    // Finnhub uses Unix timestamp in milliseconds
    trade.observed_at = Timestamp(trade_json.at("t").get<int64_t>());

    if (trade_json.contains("c") && trade_json["c"].is_array()) {
        for (const auto& condition : trade_json["c"]) {
            trade.conditions.push_back(
                condition.is_string() ? condition.get<std::string>() : condition.dump());
        }
    }

    return trade;
}

} // namespace

FeedMessage parseFeedMessage(const std::string& payload) {
    auto json_msg = nlohmann::json::parse(payload, nullptr, false);
    if (json_msg.is_discarded()) {
        return FeedError{"Malformed feed message: " + payload};
    }
    if (!json_msg.is_object()) {
        return FeedError{"Unexpected feed message: " + payload};
    }

    const std::string type = json_msg.value("type", "");

    if (json_msg.contains("data") && json_msg["data"].is_array()) {
        TradeBatch batch;
        try {
            for (const auto& trade_json : json_msg["data"]) {
                batch.trades.push_back(parseTrade(trade_json));
            }
        } catch (const nlohmann::json::exception& e) {
            return FeedError{"Malformed trade in feed message: " + std::string(e.what())};
        }
        return batch;
    }

    if (json_msg.contains("msg")) {
        const auto& msg = json_msg["msg"];
        return FeedError{msg.is_string() ? msg.get<std::string>() : msg.dump()};
    }

    if (type == "ping") {
        return KeepAlive{};
    }

    return FeedError{"Unrecognized feed message type '" + type + "'"};
}

std::string makeSubscribeRequest(const std::string& symbol) {
    nlohmann::json subscribe_msg = {
        {"type", "subscribe"},
        {"symbol", symbol}
    };
    return subscribe_msg.dump();
}

std::string makeUnsubscribeRequest(const std::string& symbol) {
    nlohmann::json unsubscribe_msg = {
        {"type", "unsubscribe"},
        {"symbol", symbol}
    };
    return unsubscribe_msg.dump();
}

} // namespace tickagg
