#pragma once

/**
 * MemoryTradeStore - in-process implementation of ITradeStore.
 *
 * Used directly by tests and as the state holder for JsonFileStore, which
 * overrides the persistence hooks. A mutation is applied in place; if its
 * write fails, only the entries it touched are rolled back.
 */

#include "trade_store.hpp"

#include <map>
#include <mutex>
#include <optional>

namespace tickguard {
namespace storage {

class MemoryTradeStore : public ITradeStore {
public:
    MemoryTradeStore() = default;
    ~MemoryTradeStore() override = default;

    MemoryTradeStore(const MemoryTradeStore&) = delete;
    MemoryTradeStore& operator=(const MemoryTradeStore&) = delete;

    trading::Trade insert_trade(trading::Trade trade) override;
    std::optional<trading::Trade> find_trade(TradeId id) const override;
    std::vector<trading::Trade> load_active_trades() const override;
    std::vector<trading::Trade> recent_completed_trades(const risk::AssetKey& key, size_t limit,
                                                        Timestamp since = 0) const override;

    std::optional<trading::MilestoneRecord> find_milestone(TradeId trade_id) const override;
    bool insert_milestone(const trading::MilestoneRecord& record) override;

    std::vector<trading::PriceSample> price_samples(TradeId trade_id) const override;
    size_t delete_price_samples(TradeId trade_id) override;

    std::optional<risk::AssetHealthRecord> find_asset_health(const risk::AssetKey& key) const override;
    void save_asset_health(const risk::AssetHealthRecord& record) override;
    std::vector<risk::AssetHealthRecord> all_asset_health() const override;

    void commit_batch(const Batch& batch) override;

    size_t trade_count() const;
    size_t milestone_count() const;
    size_t sample_count() const;

protected:
    struct State {
        std::map<TradeId, trading::Trade> trades;
        std::map<TradeId, trading::MilestoneRecord> milestones;
        std::map<TradeId, std::vector<trading::PriceSample>> samples;
        std::map<std::string, risk::AssetHealthRecord> asset_health; // by AssetKey::to_string()
        TradeId next_id = 1;
    };

    /**
     * Prior values of the snapshot entries a mutation touched, so a failed
     * write can put them back without copying the whole state.
     */
    struct Undo {
        std::map<TradeId, std::optional<trading::Trade>> trades;
        std::map<TradeId, std::optional<trading::MilestoneRecord>> milestones;
        std::map<std::string, std::optional<risk::AssetHealthRecord>> asset_health;
        TradeId next_id = 1;

        void touch_trade(const State& s, TradeId id);
        void touch_milestone(const State& s, TradeId id);
        void touch_asset_health(const State& s, const std::string& key);
        bool dirty() const { return !trades.empty() || !milestones.empty() || !asset_health.empty(); }
        void restore(State& s) const;
    };

    /**
     * Persistence hooks, called under mutex_. Each throws StoreError on
     * failure and leaves its own files as they were.
     *
     * write_snapshot() covers trades, milestones and asset health only.
     * Price samples go through append_samples() and erase_samples() so a
     * commit never rewrites the samples already stored.
     */
    virtual void write_snapshot(const State& /*state*/) {}
    virtual void append_samples(const std::vector<trading::PriceSample>& /*samples*/) {}
    // Reverts the most recent append_samples()
    virtual void revert_samples() noexcept {}
    virtual void erase_samples(TradeId /*trade_id*/) {}

    template <typename Fn>
    void mutate(Fn&& apply) {
        std::lock_guard<std::mutex> lock(mutex_);
        Undo undo;
        undo.next_id = state_.next_id;
        apply(state_, undo);
        if (!undo.dirty())
            return;
        try {
            write_snapshot(state_);
        } catch (const std::exception&) {
            undo.restore(state_);
            throw;
        }
    }

    mutable std::mutex mutex_;
    State state_;
};

} // namespace storage
} // namespace tickguard
