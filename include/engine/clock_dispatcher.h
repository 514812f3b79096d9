#pragma once

#include "core/symbol_registry.h"
#include "core/types.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace tickagg {

// Single process heartbeat. Once per period it sends floorToMinute(now) to
// both channels of every handle. No 15-minute gating happens here: the mean
// worker recomputes a trailing window on every minute it receives.
class ClockDispatcher {
public:
    using Clock = std::function<Timestamp()>;

    enum class State {
        IDLE,
        RUNNING,
        STOPPED
    };

private:
    SymbolRegistry& registry_;
    std::chrono::milliseconds period_;
    Clock clock_;

    std::atomic<State> state_;
    std::atomic<uint64_t> ticks_dispatched_{0};
    std::atomic<uint64_t> failed_sends_{0};

    std::thread timer_thread_;
    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool stop_requested_ = false;

    void timerLoop();

public:
    ClockDispatcher(SymbolRegistry& registry,
                    std::chrono::milliseconds period = std::chrono::minutes(1),
                    Clock clock = nowMillis);
    ~ClockDispatcher();

    ClockDispatcher(const ClockDispatcher&) = delete;
    ClockDispatcher& operator=(const ClockDispatcher&) = delete;

    // First broadcast happens immediately, then one per period
    void start();
    void stop();

    // One synchronous broadcast; returns how many channels accepted the value
    size_t dispatchOnce(Timestamp now);

    State state() const { return state_.load(); }
    uint64_t ticksDispatched() const { return ticks_dispatched_.load(); }
    uint64_t failedSends() const { return failed_sends_.load(); }
};

} // namespace tickagg
