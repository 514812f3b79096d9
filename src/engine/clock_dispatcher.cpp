#include "engine/clock_dispatcher.h"
#include "utils/logger.h"
#include <stdexcept>

namespace tickagg {

ClockDispatcher::ClockDispatcher(SymbolRegistry& registry,
                                 std::chrono::milliseconds period,
                                 Clock clock)
    : registry_(registry), period_(period), clock_(std::move(clock)), state_(State::IDLE) {
    if (period_.count() <= 0) {
        throw std::invalid_argument("dispatch period must be positive");
    }
}

ClockDispatcher::~ClockDispatcher() {
    stop();
}

void ClockDispatcher::start() {
    State expected = State::IDLE;
    if (!state_.compare_exchange_strong(expected, State::RUNNING)) {
        LOG_WARNING("Clock dispatcher already started");
        return;
    }

    timer_thread_ = std::thread(&ClockDispatcher::timerLoop, this);
    LOG_INFO("Clock dispatcher running, period " + std::to_string(period_.count()) +
             "ms, " + std::to_string(registry_.size()) + " symbols");
}

void ClockDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        stop_requested_ = true;
    }
    timer_cv_.notify_all();

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
    state_ = State::STOPPED;
}

void ClockDispatcher::timerLoop() {
    auto next_tick = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (!stop_requested_) {
        if (timer_cv_.wait_until(lock, next_tick, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        dispatchOnce(clock_());
        lock.lock();

        // Fixed-rate schedule; a late tick does not shift the ones after it
        next_tick += period_;
    }
}

size_t ClockDispatcher::dispatchOnce(Timestamp now) {
    const Timestamp truncated_now = floorToMinute(now);
    size_t delivered = 0;

    for (const auto& handle : registry_.handles()) {
        if (handle->tickMinute().send(truncated_now)) {
            delivered++;
        } else {
            failed_sends_++;
            LOG_SYMBOL_ERROR(handle->symbol(), "Candlestick channel closed, tick dropped");
        }

        if (handle->tickFifteen().send(truncated_now)) {
            delivered++;
        } else {
            failed_sends_++;
            LOG_SYMBOL_ERROR(handle->symbol(), "Mean channel closed, tick dropped");
        }
    }

    ticks_dispatched_++;
    LOG_DEBUG("Dispatched " + formatTimestamp(truncated_now) + " to " +
              std::to_string(delivered) + " channels");
    return delivered;
}

} // namespace tickagg
