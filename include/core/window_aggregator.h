#pragma once

#include "core/types.h"
#include <optional>
#include <vector>

namespace tickagg {

// Pure reductions over a window of ticks. Callers supply records in append order.
class WindowAggregator {
public:
    // open/close come from the first/last record, window_start is the trigger
    // time passed in (not derived from the records). Empty input gives nullopt.
    static std::optional<CandlestickSummary> aggregateCandlestick(
        const std::vector<TickRecord>& records, Timestamp window_start);

    // start/end are min/max recorded_at. Empty input gives nullopt.
    static std::optional<MeanSummary> aggregateMean(const std::vector<TickRecord>& records);
};

} // namespace tickagg
