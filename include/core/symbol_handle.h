#pragma once

#include "core/signal_channel.h"
#include "core/summary_sink.h"
#include "core/symbol_log.h"
#include "core/types.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tickagg {

// Where one symbol's three stores live
struct SymbolPaths {
    std::string tick_log;
    std::string candlestick;
    std::string mean;

    // <data_dir>/{rolling,candlestick,mean}/<sanitized symbol>.csv
    static SymbolPaths forSymbol(const std::string& data_dir, const std::string& symbol);
};

// Everything the process keeps for one tracked symbol: the tick log, the two
// summary sinks and the two channels the dispatcher uses to trigger recomputation.
class SymbolHandle {
private:
    std::string symbol_;
    SymbolLog log_;
    CandlestickSink candlestick_sink_;
    MeanSink mean_sink_;
    SignalChannel<Timestamp> tick_minute_;
    SignalChannel<Timestamp> tick_fifteen_;
    std::once_flag init_flag_;

public:
    // Opens or creates the three stores; throws StartupFailure if any cannot be opened
    SymbolHandle(const std::string& symbol, const SymbolPaths& paths);

    SymbolHandle(const SymbolHandle&) = delete;
    SymbolHandle& operator=(const SymbolHandle&) = delete;

    // Runs once per handle no matter how many callers race on it: writes the
    // tick log header if the log is empty and a zero-valued candlestick row.
    void initialize();

    // Ingestion path: stamps recorded_at with the current time and appends
    void recordTick(Price price, Timestamp observed_at);

    // Scan the trailing window [floorToMinute(reference_time) - window_minutes,
    // floorToMinute(reference_time)), aggregate without holding any lock, write
    // the summary if there is one. Returns what was written.
    std::optional<CandlestickSummary> computeCandlestick(
        Timestamp reference_time, int window_minutes, Timestamp computed_at);
    std::optional<MeanSummary> computeMean(Timestamp reference_time, int window_minutes);

    const std::string& symbol() const { return symbol_; }
    SymbolLog& log() { return log_; }
    const SymbolLog& log() const { return log_; }
    CandlestickSink& candlestickSink() { return candlestick_sink_; }
    MeanSink& meanSink() { return mean_sink_; }
    SignalChannel<Timestamp>& tickMinute() { return tick_minute_; }
    SignalChannel<Timestamp>& tickFifteen() { return tick_fifteen_; }
};

} // namespace tickagg
