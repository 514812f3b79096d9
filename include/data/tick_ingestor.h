#pragma once

#include "core/symbol_registry.h"
#include "data/market_data_feed.h"
#include <atomic>

namespace tickagg {

// Feed listener that persists trades for tracked symbols
class TickIngestor : public FeedListener {
private:
    SymbolRegistry& registry_;

    std::atomic<uint64_t> ticks_ingested_{0};
    std::atomic<uint64_t> ticks_dropped_{0};
    std::atomic<uint64_t> ticks_failed_{0};
    std::atomic<uint64_t> feed_errors_{0};
    std::atomic<uint64_t> keep_alives_{0};
    std::atomic<Timestamp> last_keep_alive_{Timestamp(0)};

public:
    explicit TickIngestor(SymbolRegistry& registry);

    void onTrades(const TradeBatch& batch) override;
    void onFeedError(const FeedError& error) override;
    void onKeepAlive() override;

    // Returns false if the symbol is not tracked or the append failed
    bool ingest(const TradeTick& trade);

    uint64_t ticksIngested() const { return ticks_ingested_.load(); }
    uint64_t ticksDropped() const { return ticks_dropped_.load(); }
    uint64_t ticksFailed() const { return ticks_failed_.load(); }
    uint64_t feedErrors() const { return feed_errors_.load(); }
    uint64_t keepAlives() const { return keep_alives_.load(); }
    Timestamp lastKeepAlive() const { return last_keep_alive_.load(); }
};

} // namespace tickagg
