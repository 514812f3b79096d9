#include "core/window_aggregator.h"
#include <algorithm>

namespace tickagg {

std::optional<CandlestickSummary> WindowAggregator::aggregateCandlestick(
    const std::vector<TickRecord>& records, Timestamp window_start) {

    if (records.empty()) {
        return std::nullopt;
    }

    CandlestickSummary summary;
    summary.symbol = records.front().symbol;
    summary.window_start = window_start;
    summary.open = records.front().price;
    summary.close = records.back().price;
    summary.high = records.front().price;
    summary.low = records.front().price;
    summary.count = records.size();

    for (const auto& record : records) {
        summary.high = std::max(summary.high, record.price);
        summary.low = std::min(summary.low, record.price);
    }

    return summary;
}

std::optional<MeanSummary> WindowAggregator::aggregateMean(const std::vector<TickRecord>& records) {
    if (records.empty()) {
        return std::nullopt;
    }

    MeanSummary summary;
    summary.symbol = records.front().symbol;
    summary.start_time = records.front().recorded_at;
    summary.end_time = records.front().recorded_at;
    summary.count = records.size();

    double total = 0.0;
    for (const auto& record : records) {
        total += record.price;
        summary.start_time = std::min(summary.start_time, record.recorded_at);
        summary.end_time = std::max(summary.end_time, record.recorded_at);
    }
    summary.mean_price = total / static_cast<double>(records.size());

    return summary;
}

} // namespace tickagg
