#include "core/symbol_handle.h"
#include "core/window_aggregator.h"
#include "utils/logger.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace tickagg {

SymbolPaths SymbolPaths::forSymbol(const std::string& data_dir, const std::string& symbol) {
    const std::string file_name = sanitizeSymbol(symbol) + ".csv";
    const fs::path base(data_dir);

    SymbolPaths paths;
    paths.tick_log = (base / "rolling" / file_name).string();
    paths.candlestick = (base / "candlestick" / file_name).string();
    paths.mean = (base / "mean" / file_name).string();
    return paths;
}

SymbolHandle::SymbolHandle(const std::string& symbol, const SymbolPaths& paths)
    : symbol_(symbol),
      log_(paths.tick_log),
      candlestick_sink_(paths.candlestick),
      mean_sink_(paths.mean) {}

void SymbolHandle::initialize() {
    std::call_once(init_flag_, [this]() {
        if (log_.isEmpty() && log_.writeHeaderIfEmpty()) {
            LOG_SYMBOL_DEBUG(symbol_, "Wrote tick log header to " + log_.path());
        }

        // Zero-valued row so the candlestick store has its shape from the start
        CandlestickSummary placeholder{"", floorToSecond(nowMillis()), 0.0, 0.0, 0.0, 0.0, 0};
        candlestick_sink_.write(placeholder);
    });
}

void SymbolHandle::recordTick(Price price, Timestamp observed_at) {
    TickRecord record{symbol_, price, observed_at, nowMillis()};
    log_.append(record);
}

std::optional<CandlestickSummary> SymbolHandle::computeCandlestick(
    Timestamp reference_time, int window_minutes, Timestamp computed_at) {

    std::vector<TickRecord> records;
    {
        PERF_LOG("candlestick scan " + symbol_);
        records = log_.scanWindow(reference_time - std::chrono::minutes(window_minutes), window_minutes);
    }

    auto summary = WindowAggregator::aggregateCandlestick(records, computed_at);
    if (summary) {
        candlestick_sink_.write(*summary);
    }
    return summary;
}

std::optional<MeanSummary> SymbolHandle::computeMean(Timestamp reference_time, int window_minutes) {
    std::vector<TickRecord> records;
    {
        PERF_LOG("mean scan " + symbol_);
        records = log_.scanWindow(reference_time - std::chrono::minutes(window_minutes), window_minutes);
    }

    auto summary = WindowAggregator::aggregateMean(records);
    if (summary) {
        mean_sink_.write(*summary);
    }
    return summary;
}

} // namespace tickagg
