#pragma once

#include "core/symbol_registry.h"
#include <atomic>
#include <thread>
#include <vector>

namespace tickagg {

struct WindowSettings {
    int candlestick_window_minutes = 1;
    int mean_window_minutes = 15;
};

// Two loops per symbol, each blocked on its own channel:
// receive reference time -> scan the log (log lock only) -> aggregate
// (no lock) -> write the summary (sink lock only).
class WorkerPool {
private:
    SymbolRegistry& registry_;
    WindowSettings windows_;
    std::vector<std::thread> workers_;
    std::atomic<bool> started_{false};

    std::atomic<uint64_t> candlesticks_written_{0};
    std::atomic<uint64_t> means_written_{0};
    std::atomic<uint64_t> failed_computations_{0};

    void candlestickLoop(SymbolHandle& handle);
    void meanLoop(SymbolHandle& handle);

public:
    // Throws std::invalid_argument unless both windows are positive
    WorkerPool(SymbolRegistry& registry, WindowSettings windows = WindowSettings());
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    // Closes every handle's channels; loops finish the signals already queued and exit
    void stop();

    // One iteration of each loop. Errors are logged against the symbol and swallowed
    // so the loop can carry on with the next signal; returns true if a row was written.
    bool processCandlestick(SymbolHandle& handle, Timestamp reference_time);
    bool processMean(SymbolHandle& handle, Timestamp reference_time);

    size_t workerCount() const { return workers_.size(); }
    uint64_t candlesticksWritten() const { return candlesticks_written_.load(); }
    uint64_t meansWritten() const { return means_written_.load(); }
    uint64_t failedComputations() const { return failed_computations_.load(); }
};

} // namespace tickagg
