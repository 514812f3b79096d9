#include "engine/worker_pool.h"
#include "core/errors.h"
#include "utils/logger.h"
#include <functional>
#include <stdexcept>

namespace tickagg {

WorkerPool::WorkerPool(SymbolRegistry& registry, WindowSettings windows)
    : registry_(registry), windows_(windows) {
    if (windows_.candlestick_window_minutes <= 0 || windows_.mean_window_minutes <= 0) {
        throw std::invalid_argument("Summary windows must be positive");
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (started_.exchange(true)) {
        LOG_WARNING("Worker pool already started");
        return;
    }

    workers_.reserve(registry_.size() * 2);
    for (const auto& handle : registry_.handles()) {
        SymbolHandle& h = *handle;
        workers_.emplace_back(&WorkerPool::candlestickLoop, this, std::ref(h));
        workers_.emplace_back(&WorkerPool::meanLoop, this, std::ref(h));
    }

    LOG_INFO("Started " + std::to_string(workers_.size()) + " workers (candlestick window " +
             std::to_string(windows_.candlestick_window_minutes) + "m, mean window " +
             std::to_string(windows_.mean_window_minutes) + "m)");
}

void WorkerPool::stop() {
    for (const auto& handle : registry_.handles()) {
        handle->tickMinute().close();
        handle->tickFifteen().close();
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void WorkerPool::candlestickLoop(SymbolHandle& handle) {
    while (auto reference_time = handle.tickMinute().receive()) {
        processCandlestick(handle, *reference_time);
    }
    LOG_SYMBOL_DEBUG(handle.symbol(), "Candlestick worker exiting");
}

void WorkerPool::meanLoop(SymbolHandle& handle) {
    while (auto reference_time = handle.tickFifteen().receive()) {
        processMean(handle, *reference_time);
    }
    LOG_SYMBOL_DEBUG(handle.symbol(), "Mean worker exiting");
}

bool WorkerPool::processCandlestick(SymbolHandle& handle, Timestamp reference_time) {
    try {
        auto summary = handle.computeCandlestick(
            reference_time, windows_.candlestick_window_minutes, floorToSecond(nowMillis()));

        if (!summary) {
            LOG_SYMBOL_DEBUG(handle.symbol(), "No ticks in candlestick window at " +
                             formatTimestamp(reference_time));
            return false;
        }

        candlesticks_written_++;
        LOG_SYMBOL_DEBUG(handle.symbol(), "Candlestick " + std::to_string(summary->count) +
                         " ticks, open " + std::to_string(summary->open) +
                         " close " + std::to_string(summary->close));
        return true;

    } catch (const MalformedRecord& e) {
        failed_computations_++;
        LOG_SYMBOL_ERROR(handle.symbol(), "Candlestick scan aborted: " + std::string(e.what()));
    } catch (const IOFailure& e) {
        failed_computations_++;
        LOG_SYMBOL_ERROR(handle.symbol(), "Candlestick computation failed: " + std::string(e.what()));
    }
    return false;
}

bool WorkerPool::processMean(SymbolHandle& handle, Timestamp reference_time) {
    try {
        auto summary = handle.computeMean(reference_time, windows_.mean_window_minutes);

        if (!summary) {
            LOG_SYMBOL_DEBUG(handle.symbol(), "No ticks in mean window at " +
                             formatTimestamp(reference_time));
            return false;
        }

        means_written_++;
        LOG_SYMBOL_DEBUG(handle.symbol(), "Mean " + std::to_string(summary->mean_price) +
                         " over " + std::to_string(summary->count) + " ticks");
        return true;

    } catch (const MalformedRecord& e) {
        failed_computations_++;
        LOG_SYMBOL_ERROR(handle.symbol(), "Mean scan aborted: " + std::string(e.what()));
    } catch (const IOFailure& e) {
        failed_computations_++;
        LOG_SYMBOL_ERROR(handle.symbol(), "Mean computation failed: " + std::string(e.what()));
    }
    return false;
}

} // namespace tickagg
