#include "data/tick_ingestor.h"
#include "core/errors.h"
#include "utils/logger.h"

namespace tickagg {

TickIngestor::TickIngestor(SymbolRegistry& registry) : registry_(registry) {}

void TickIngestor::onTrades(const TradeBatch& batch) {
    for (const auto& trade : batch.trades) {
        ingest(trade);
    }
}

bool TickIngestor::ingest(const TradeTick& trade) {
    SymbolHandle* handle = registry_.find(trade.symbol);
    if (handle == nullptr) {
        ticks_dropped_++;
        LOG_SYMBOL_DEBUG(trade.symbol, "Dropping tick for untracked symbol");
        return false;
    }

    try {
        handle->recordTick(trade.price, trade.observed_at);
        ticks_ingested_++;
        return true;
    } catch (const IOFailure& e) {
        ticks_failed_++;
        LOG_SYMBOL_ERROR(trade.symbol, "Failed to record tick: " + std::string(e.what()));
        return false;
    }
}

void TickIngestor::onFeedError(const FeedError& error) {
    feed_errors_++;
    LOG_WARNING("Feed error: " + error.message);
}

void TickIngestor::onKeepAlive() {
    keep_alives_++;
    last_keep_alive_ = nowMillis();
    LOG_DEBUG("Keep-alive received");
}

} // namespace tickagg
