#pragma once

/**
 * ITradeStore - durable state used by the engine.
 *
 * Logical layout:
 *   trades         keyed by surrogate id, unique identifier
 *   milestones     one per trade id
 *   price_samples  ephemeral rows keyed by trade id, deleted post-close
 *   asset_health   keyed by (symbol, direction, source)
 *
 * All implementations are thread-safe. Failures are reported as StoreError;
 * a failed commit_batch leaves the store unchanged.
 */

#include "../risk/asset_health.hpp"
#include "../trading/milestone.hpp"
#include "../trading/trade.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tickguard {
namespace storage {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Unit of work committed by the tracker's batching layer.
 */
struct Batch {
    std::vector<trading::Trade> trades;
    std::vector<trading::MilestoneRecord> milestones;
    std::vector<trading::PriceSample> samples;

    bool empty() const { return trades.empty() && milestones.empty() && samples.empty(); }
    size_t size() const { return trades.size() + milestones.size() + samples.size(); }

    void clear() {
        trades.clear();
        milestones.clear();
        samples.clear();
    }
};

class ITradeStore {
public:
    virtual ~ITradeStore() = default;

    // Trades
    virtual trading::Trade insert_trade(trading::Trade trade) = 0; // assigns id when 0
    virtual std::optional<trading::Trade> find_trade(TradeId id) const = 0;
    virtual std::vector<trading::Trade> load_active_trades() const = 0;

    /**
     * Completed trades for a circuit breaker key, newest first by completion time.
     * @param since only trades completed at or after this time (0 = all)
     */
    virtual std::vector<trading::Trade> recent_completed_trades(const risk::AssetKey& key, size_t limit,
                                                                Timestamp since = 0) const = 0;

    // Milestones
    virtual std::optional<trading::MilestoneRecord> find_milestone(TradeId trade_id) const = 0;
    // Returns false if a record already exists for the trade
    virtual bool insert_milestone(const trading::MilestoneRecord& record) = 0;

    // Price samples
    virtual std::vector<trading::PriceSample> price_samples(TradeId trade_id) const = 0;
    virtual size_t delete_price_samples(TradeId trade_id) = 0;

    // Asset health
    virtual std::optional<risk::AssetHealthRecord> find_asset_health(const risk::AssetKey& key) const = 0;
    virtual void save_asset_health(const risk::AssetHealthRecord& record) = 0;
    virtual std::vector<risk::AssetHealthRecord> all_asset_health() const = 0;

    /**
     * Apply trades, milestones and samples atomically.
     * @throws StoreError on failure; nothing is applied in that case
     */
    virtual void commit_batch(const Batch& batch) = 0;
};

} // namespace storage
} // namespace tickguard
