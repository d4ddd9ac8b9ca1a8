#pragma once

/**
 * MilestoneRecorder - first-crossing timestamps of PnL thresholds per trade.
 *
 * Records are created lazily on the first processed tick (cache, then store,
 * then a fresh record) and cached until the trade closes. Threshold slots are
 * write-once. Updates return a snapshot for the tracker's commit batch.
 *
 * Thread safety: the cache is guarded by a mutex. A given trade is only ever
 * updated from the watch thread of its instrument.
 *
 * Usage:
 *   MilestoneRecorder milestones(store, logger);
 *   auto snapshot = milestones.update_milestones(trade, pnl_pct, tick_ts);
 *   batch.milestones.push_back(snapshot);
 *   ...
 *   milestones.finalize(trade, exit_price, exit_at, final_pnl);
 *   milestones.clear_cache(trade.id);
 */

#include "../logging/async_logger.hpp"
#include "../storage/trade_store.hpp"

#include <map>
#include <mutex>
#include <optional>

namespace tickguard {
namespace tracking {

class MilestoneRecorder {
public:
    MilestoneRecorder(storage::ITradeStore& store, logging::AsyncLogger& logger) : store_(store), logger_(logger) {}

    MilestoneRecorder(const MilestoneRecorder&) = delete;
    MilestoneRecorder& operator=(const MilestoneRecorder&) = delete;

    /**
     * Idempotent. A newly created record is inserted into the store.
     * @throws storage::StoreError if the lookup or insert fails
     */
    trading::MilestoneRecord ensure_record(const trading::Trade& trade);

    /**
     * Set every threshold crossed by pnl_pct that is not set yet and refresh
     * the max profit / max drawdown marks.
     * @return snapshot of the updated record
     */
    trading::MilestoneRecord update_milestones(const trading::Trade& trade, double pnl_pct, Timestamp timestamp);

    /**
     * Record exit fields. Creates the record first if the trade never ticked.
     * @return snapshot of the finalized record
     */
    trading::MilestoneRecord finalize(const trading::Trade& trade, double exit_price, Timestamp exit_at,
                                      double final_pnl_pct);

    void clear_cache(TradeId trade_id);
    void clear_all();
    size_t cached_count() const;

    std::optional<trading::MilestoneRecord> cached(TradeId trade_id) const;

private:
    storage::ITradeStore& store_;
    logging::AsyncLogger& logger_;

    mutable std::mutex mutex_;
    std::map<TradeId, trading::MilestoneRecord> cache_;
};

} // namespace tracking
} // namespace tickguard
