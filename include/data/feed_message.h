#pragma once

#include "core/types.h"
#include <string>
#include <variant>
#include <vector>

namespace tickagg {

// One trade as delivered by the feed
struct TradeTick {
    std::string symbol;
    Price price;
    double volume;
    Timestamp observed_at;
    std::vector<std::string> conditions;  // Trade conditions, may be empty
};

// {"type":"trade","data":[...]}: may batch ticks for several symbols
struct TradeBatch {
    std::vector<TradeTick> trades;
};

// {"type":"error","msg":"..."}, or anything that could not be resolved
struct FeedError {
    std::string message;
};

// {"type":"ping"}
struct KeepAlive {};

using FeedMessage = std::variant<TradeBatch, FeedError, KeepAlive>;

// Resolves a raw text frame into exactly one message shape. Never throws:
// malformed JSON and unknown shapes come back as FeedError.
FeedMessage parseFeedMessage(const std::string& payload);

// {"type":"subscribe","symbol":"<symbol>"}
std::string makeSubscribeRequest(const std::string& symbol);
std::string makeUnsubscribeRequest(const std::string& symbol);

} // namespace tickagg
