#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tickagg {

using Price = double;
using Timestamp = std::chrono::milliseconds;  // Millisecond Unix epoch

// One persisted trade for a tracked symbol
struct TickRecord {
    std::string symbol;
    Price price;
    Timestamp observed_at;   // Assigned by the exchange feed
    Timestamp recorded_at;   // Assigned when appended to the log

    bool operator==(const TickRecord& other) const {
        return symbol == other.symbol && price == other.price &&
               observed_at == other.observed_at && recorded_at == other.recorded_at;
    }
};

// OHLC summary of one window
struct CandlestickSummary {
    std::string symbol;
    Timestamp window_start;
    Price open;
    Price close;
    Price high;
    Price low;
    uint64_t count;
};

// Mean price over one window
struct MeanSummary {
    std::string symbol;
    Timestamp start_time;
    Timestamp end_time;
    Price mean_price;
    uint64_t count;
};

// Time helpers
Timestamp nowMillis();
Timestamp floorToMinute(Timestamp t);
Timestamp floorToSecond(Timestamp t);

// RFC 3339 UTC, e.g. 2022-07-21T22:07:38Z or 2022-07-21T22:07:38.376Z
std::string formatTimestamp(Timestamp t);

// Replaces every character outside [A-Za-z0-9_] with '_'
std::string sanitizeSymbol(const std::string& symbol);

} // namespace tickagg
