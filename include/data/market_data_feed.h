#pragma once

#include "data/feed_message.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace tickagg {

// Market data callback interface
class FeedListener {
public:
    virtual ~FeedListener() = default;

    virtual void onTrades(const TradeBatch& batch) = 0;
    virtual void onFeedError(const FeedError& error) = 0;
    virtual void onKeepAlive() = 0;
};

// Base class for market data feeds.
// The network side pushes raw frames with enqueuePayload(); a processing thread
// resolves each frame into a FeedMessage and hands it to the listeners.
class MarketDataFeed {
protected:
    std::vector<std::shared_ptr<FeedListener>> listeners_;
    std::mutex listeners_mutex_;
    std::atomic<bool> running_;
    std::thread worker_thread_;

    // Message queue for async processing
    std::queue<std::string> message_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;

    std::atomic<uint64_t> messages_received_{0};
    std::atomic<uint64_t> messages_processed_{0};

    void enqueuePayload(std::string payload);
    void dispatch(const FeedMessage& message);
    void messageProcessingLoop();

    void startProcessing();
    void stopProcessing();

    // Local failures (connection, send) reported through the same listener path
    void notifyError(const std::string& error);

public:
    MarketDataFeed();
    virtual ~MarketDataFeed();

    MarketDataFeed(const MarketDataFeed&) = delete;
    MarketDataFeed& operator=(const MarketDataFeed&) = delete;

    // Connection management
    virtual bool connect(const std::string& url) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Subscription management
    virtual void subscribe(const std::string& symbol) = 0;
    virtual void unsubscribe(const std::string& symbol) = 0;
    void subscribeAll(const std::vector<std::string>& symbols);

    void addListener(std::shared_ptr<FeedListener> listener);

    uint64_t getMessagesReceived() const { return messages_received_.load(); }
    uint64_t getMessagesProcessed() const { return messages_processed_.load(); }
};

} // namespace tickagg
