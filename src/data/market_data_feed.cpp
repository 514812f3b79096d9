#include "data/market_data_feed.h"
#include <type_traits>

namespace tickagg {

MarketDataFeed::MarketDataFeed() : running_(false) {}

MarketDataFeed::~MarketDataFeed() {
    stopProcessing();
}

void MarketDataFeed::startProcessing() {
    if (running_.exchange(true)) {
        return;
    }
    worker_thread_ = std::thread(&MarketDataFeed::messageProcessingLoop, this);
}

void MarketDataFeed::stopProcessing() {
    running_ = false;
    queue_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void MarketDataFeed::enqueuePayload(std::string payload) {
    messages_received_++;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        message_queue_.push(std::move(payload));
    }
    queue_cv_.notify_one();
}

void MarketDataFeed::messageProcessingLoop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] { return !message_queue_.empty() || !running_; });

        // Frames already received are still delivered on shutdown
        if (message_queue_.empty() && !running_) {
            break;
        }

        while (!message_queue_.empty()) {
            std::string payload = std::move(message_queue_.front());
            message_queue_.pop();
            lock.unlock();

            dispatch(parseFeedMessage(payload));
            messages_processed_++;

            lock.lock();
        }
    }
}

void MarketDataFeed::dispatch(const FeedMessage& message) {
    std::vector<std::shared_ptr<FeedListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }

    std::visit([&listeners](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        for (auto& listener : listeners) {
            if constexpr (std::is_same_v<T, TradeBatch>) {
                listener->onTrades(msg);
            } else if constexpr (std::is_same_v<T, FeedError>) {
                listener->onFeedError(msg);
            } else {
                listener->onKeepAlive();
            }
        }
    }, message);
}

void MarketDataFeed::notifyError(const std::string& error) {
    dispatch(FeedError{error});
}

void MarketDataFeed::subscribeAll(const std::vector<std::string>& symbols) {
    for (const auto& symbol : symbols) {
        subscribe(symbol);
    }
}

void MarketDataFeed::addListener(std::shared_ptr<FeedListener> listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

} // namespace tickagg
