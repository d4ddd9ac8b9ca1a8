#include "../include/tickguard/risk/circuit_breaker.hpp"
#include "../include/tickguard/storage/memory_store.hpp"
#include "../include/tickguard/tracking/trade_tracker.hpp"
#include "../include/tickguard/util/time_utils.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <mutex>
#include <vector>

using namespace tickguard;
using namespace tickguard::tracking;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_DOUBLE_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

namespace {

constexpr Timestamp T0 = 1'700'000'000ULL * NS_PER_SEC;

// =============================================================================
// Test doubles
// =============================================================================

/**
 * Scripted tick source: ticks are delivered synchronously by emit().
 */
class FakeTickSource : public market::ITickSource {
public:
    market::ListenerId subscribe(const std::string& instrument, market::TickListener listener) override {
        std::lock_guard<std::mutex> lock(mutex_);
        market::ListenerId id = next_id_++;
        listeners_[instrument][id] = std::move(listener);
        return id;
    }

    void unsubscribe(const std::string& instrument, market::ListenerId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listeners_.find(instrument);
        if (it == listeners_.end())
            return;
        it->second.erase(id);
        if (it->second.empty())
            listeners_.erase(it);
    }

    void emit(const std::string& instrument, double price, Timestamp ts) {
        std::vector<market::TickListener> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = listeners_.find(instrument);
            if (it == listeners_.end())
                return;
            for (auto& [id, l] : it->second)
                targets.push_back(l);
        }
        for (auto& l : targets)
            l(instrument, price, ts);
    }

    size_t instrument_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    bool has(const std::string& instrument) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.count(instrument) > 0;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<market::ListenerId, market::TickListener>> listeners_;
    market::ListenerId next_id_ = 1;
};

class FlakyStore : public storage::MemoryTradeStore {
public:
    bool fail_commits = false;
    bool fail_milestones = false;

    void commit_batch(const storage::Batch& batch) override {
        if (fail_commits)
            throw storage::StoreError("disk full");
        MemoryTradeStore::commit_batch(batch);
    }

    std::optional<trading::MilestoneRecord> find_milestone(TradeId trade_id) const override {
        if (fail_milestones)
            throw storage::StoreError("milestone table locked");
        return MemoryTradeStore::find_milestone(trade_id);
    }
};

struct Completed {
    trading::Trade trade;
    Outcome outcome;
    double pnl;
};

class RecordingPipeline : public IPostTradePipeline {
public:
    bool throw_on_process = false;
    std::vector<Completed> completed;

    void process_completed_trade(const trading::Trade& trade, Outcome outcome, double final_pnl_pct) override {
        completed.push_back({trade, outcome, final_pnl_pct});
        if (throw_on_process)
            throw std::runtime_error("analysis service unavailable");
    }
};

config::TrackerSettings immediate_settings() {
    config::TrackerSettings s;
    s.tick_process_interval_ms = 0;
    s.commit_interval_ms = 0;
    return s;
}

struct Harness {
    explicit Harness(const config::TrackerSettings& settings = immediate_settings())
        : milestones(store, logger), tracker(source, store, milestones, exits, pipeline, settings, logger) {}

    FakeTickSource source;
    FlakyStore store;
    logging::AsyncLogger logger;
    MilestoneRecorder milestones;
    exits::ExitEvaluatorTable exits;
    RecordingPipeline pipeline;
    TradeTracker tracker;
};

trading::Trade make_trade(const std::string& identifier, const std::string& symbol, Direction direction,
                          double entry) {
    trading::Trade t;
    t.identifier = identifier;
    t.symbol = symbol;
    t.signal_source = "alpha";
    t.direction = direction;
    t.entry_price = entry;
    t.entry_time = T0;
    return t;
}

void set_tp_pcts(trading::Trade& t, double tp1, double tp2, double tp3) {
    t.tp[0].pct = tp1;
    t.tp[1].pct = tp2;
    t.tp[2].pct = tp3;
}

} // namespace

// =============================================================================
// Subscriptions
// =============================================================================

TEST(start_tracking_groups_by_instrument) {
    Harness h;
    h.store.insert_trade(make_trade("#A1", "BTCUSDT.P", Direction::Long, 100.0));
    h.store.insert_trade(make_trade("#A2", "BTCUSDT.P", Direction::Short, 100.0));
    auto eth = make_trade("#A3", "ETHUSDT", Direction::Long, 2000.0);
    eth.venue_symbol = "ETH/USDT";
    h.store.insert_trade(eth);
    auto done = make_trade("#A4", "SOLUSDT", Direction::Long, 20.0);
    done.status = TradeStatus::Completed;
    h.store.insert_trade(done);

    ASSERT_EQ(h.tracker.start_tracking(), 3u);
    ASSERT_EQ(h.source.instrument_count(), 2u);
    ASSERT_TRUE(h.source.has("BTC/USDT:USDT"));
    ASSERT_TRUE(h.source.has("ETH/USDT"));

    auto stats = h.tracker.stats();
    ASSERT_EQ(stats.active_trades, 3u);
    ASSERT_EQ(stats.tracked_instruments, 2u);

    h.tracker.stop();
    ASSERT_EQ(h.source.instrument_count(), 0u);
}

TEST(add_and_remove_adjust_subscriptions) {
    Harness h;
    auto a = make_trade("#B1", "BTCUSDT", Direction::Long, 100.0);
    auto b = make_trade("#B2", "BTCUSDT", Direction::Long, 100.0);
    ASSERT_TRUE(h.tracker.add_trade(a));
    ASSERT_TRUE(h.tracker.add_trade(b));
    ASSERT_EQ(h.source.instrument_count(), 1u);
    ASSERT_EQ(h.tracker.listener_count(), 1u);

    // ids were assigned by the store
    auto stored = h.store.load_active_trades();
    ASSERT_EQ(stored.size(), 2u);
    ASSERT_FALSE(h.tracker.add_trade(stored[0])); // duplicate

    ASSERT_TRUE(h.tracker.remove_trade(stored[0].id));
    ASSERT_EQ(h.source.instrument_count(), 1u);
    ASSERT_TRUE(h.tracker.remove_trade(stored[1].id));
    ASSERT_EQ(h.source.instrument_count(), 0u);
    ASSERT_FALSE(h.tracker.remove_trade(stored[1].id));
}

TEST(paused_key_refuses_new_trades) {
    Harness h;
    risk::CircuitBreaker breaker(h.store, config::BreakerSettings{}, h.logger);
    risk::AssetKey paused{"BTCUSDT", Direction::Long, "alpha"};

    risk::AssetHealthRecord record;
    record.key = paused;
    record.status = risk::AssetStatus::Paused;
    record.reason = "Consecutive losses: 5 >= 5";
    record.pause_count = 1;
    record.paused_at = util::wall_clock_ns();
    h.store.save_asset_health(record);

    // Accepted before the check is installed, so it is reloaded regardless
    auto earlier = make_trade("#J0", "BTCUSDT", Direction::Long, 100.0);
    earlier = h.store.insert_trade(earlier);

    h.tracker.set_admission_check([&breaker](const trading::Trade& t) {
        return breaker.is_trading_allowed(risk::AssetKey{t.symbol, t.direction, t.signal_source},
                                          util::wall_clock_ns());
    });

    ASSERT_FALSE(h.tracker.add_trade(make_trade("#J1", "BTCUSDT", Direction::Long, 100.0)));
    ASSERT_EQ(h.store.trade_count(), 1u); // never inserted
    ASSERT_EQ(h.tracker.stats().trades_rejected, 1u);
    ASSERT_FALSE(h.source.has("BTC/USDT"));

    // Other directions of the same symbol are unaffected
    ASSERT_TRUE(h.tracker.add_trade(make_trade("#J2", "BTCUSDT", Direction::Short, 100.0)));

    ASSERT_EQ(h.tracker.start_tracking(), 1u);
    ASSERT_TRUE(h.tracker.find_trade(earlier.id).has_value());
    ASSERT_EQ(h.tracker.stats().active_trades, 2u);
    ASSERT_EQ(h.tracker.stats().trades_rejected, 1u);
    h.tracker.stop();
}

TEST(completed_trade_is_not_tracked) {
    Harness h;
    auto t = make_trade("#B3", "BTCUSDT", Direction::Long, 100.0);
    t.status = TradeStatus::Completed;
    ASSERT_FALSE(h.tracker.add_trade(t));
    ASSERT_EQ(h.source.instrument_count(), 0u);
}

// =============================================================================
// Tick processing
// =============================================================================

TEST(take_profits_then_tp3_closes) {
    Harness h;
    auto t = make_trade("#C1", "BTCUSDT", Direction::Long, 100.0);
    set_tp_pcts(t, 1.0, 2.0, 3.0);
    h.tracker.add_trade(t);
    TradeId id = h.store.load_active_trades().at(0).id;

    h.source.emit("BTC/USDT", 101.0, T0 + NS_PER_MIN);
    auto live = h.tracker.find_trade(id);
    ASSERT_TRUE(live->tp[0].hit);
    ASSERT_FALSE(live->tp[1].hit);
    ASSERT_EQ(*live->tp[0].time_minutes, 1);
    ASSERT_DOUBLE_NEAR(*live->tp[0].hit_price, 101.0, 1e-9);

    h.source.emit("BTC/USDT", 102.0, T0 + 2 * NS_PER_MIN);
    h.source.emit("BTC/USDT", 103.0, T0 + 3 * NS_PER_MIN);

    ASSERT_EQ(h.pipeline.completed.size(), 1u);
    ASSERT_EQ(h.pipeline.completed[0].outcome, Outcome::TP3);
    ASSERT_DOUBLE_NEAR(h.pipeline.completed[0].pnl, 3.0, 1e-9);

    auto stored = h.store.find_trade(id);
    ASSERT_EQ(stored->status, TradeStatus::Completed);
    ASSERT_EQ(stored->final_outcome, Outcome::TP3);
    ASSERT_TRUE(stored->tp[2].hit);
    ASSERT_EQ(*stored->completed_at, T0 + 3 * NS_PER_MIN);

    auto milestone = h.store.find_milestone(id);
    ASSERT_DOUBLE_NEAR(*milestone->exit_price, 103.0, 1e-9);
    ASSERT_EQ(milestone->profit_milestones_reached(), 5u); // 0.5, 1, 1.5, 2, 3

    ASSERT_EQ(h.source.instrument_count(), 0u);
    ASSERT_EQ(h.milestones.cached_count(), 0u);
    ASSERT_EQ(h.tracker.stats().closes_by_outcome.at("tp3"), 1u);
}

TEST(stop_closes_one_trade_without_disturbing_sibling) {
    Harness h;
    auto stopped = make_trade("#C2", "ETHUSDT", Direction::Long, 100.0);
    stopped.planned_sl_pct = -1.0;
    auto sibling = make_trade("#C3", "ETHUSDT", Direction::Long, 100.0);
    h.tracker.add_trade(stopped);
    h.tracker.add_trade(sibling);

    h.source.emit("ETH/USDT", 98.5, T0 + NS_PER_MIN);

    ASSERT_EQ(h.pipeline.completed.size(), 1u);
    ASSERT_EQ(h.pipeline.completed[0].trade.identifier, std::string("#C2"));
    ASSERT_EQ(h.pipeline.completed[0].outcome, Outcome::SL);
    ASSERT_EQ(h.pipeline.completed[0].trade.sl_type_hit, std::string("static"));
    ASSERT_DOUBLE_NEAR(h.pipeline.completed[0].pnl, -1.5, 1e-9);

    ASSERT_EQ(h.tracker.stats().active_trades, 1u);
    ASSERT_TRUE(h.source.has("ETH/USDT"));

    // Sibling keeps receiving ticks
    h.source.emit("ETH/USDT", 99.0, T0 + 2 * NS_PER_MIN);
    auto active = h.store.load_active_trades();
    ASSERT_EQ(active.size(), 1u);
    ASSERT_DOUBLE_NEAR(*active[0].max_drawdown_pct, -1.5, 1e-9);
}

TEST(short_trade_excursion) {
    Harness h;
    h.tracker.add_trade(make_trade("#C4", "SOLUSDT", Direction::Short, 100.0));
    TradeId id = h.store.load_active_trades().at(0).id;

    h.source.emit("SOL/USDT", 98.0, T0 + NS_PER_MIN);
    h.source.emit("SOL/USDT", 101.0, T0 + 2 * NS_PER_MIN);

    auto t = h.tracker.find_trade(id);
    ASSERT_DOUBLE_NEAR(*t->max_profit_pct, 2.0, 1e-9);
    ASSERT_DOUBLE_NEAR(*t->max_favorable_excursion, 98.0, 1e-9);
    ASSERT_DOUBLE_NEAR(*t->max_drawdown_pct, -1.0, 1e-9);
}

TEST(rate_limit_by_tick_timestamp) {
    config::TrackerSettings s = immediate_settings();
    s.tick_process_interval_ms = 2000;
    Harness h(s);
    h.tracker.add_trade(make_trade("#D1", "BTCUSDT", Direction::Long, 100.0));

    h.source.emit("BTC/USDT", 100.5, T0);
    h.source.emit("BTC/USDT", 100.6, T0 + NS_PER_SEC);     // dropped
    h.source.emit("BTC/USDT", 100.7, T0 + 2 * NS_PER_SEC); // accepted

    auto stats = h.tracker.stats();
    ASSERT_EQ(stats.ticks_processed, 2u);
    ASSERT_EQ(stats.ticks_dropped, 1u);
    ASSERT_EQ(h.store.sample_count(), 2u);
}

TEST(older_ticks_are_dropped) {
    config::TrackerSettings s = immediate_settings();
    s.tick_process_interval_ms = 2000;
    Harness h(s);
    h.tracker.add_trade(make_trade("#D4", "BTCUSDT", Direction::Long, 100.0));
    TradeId id = h.store.load_active_trades().at(0).id;

    h.source.emit("BTC/USDT", 101.0, T0 + 10 * NS_PER_SEC);
    h.source.emit("BTC/USDT", 90.0, T0 + 5 * NS_PER_SEC);   // older than the last accepted tick
    h.source.emit("BTC/USDT", 100.9, T0 + 11 * NS_PER_SEC); // still throttled against T0+10s
    h.source.emit("BTC/USDT", 100.5, T0 + 12 * NS_PER_SEC);

    auto stats = h.tracker.stats();
    ASSERT_EQ(stats.ticks_processed, 2u);
    ASSERT_EQ(stats.ticks_dropped, 2u);
    ASSERT_DOUBLE_NEAR(*h.tracker.find_trade(id)->max_drawdown_pct, 0.5, 1e-9);
    ASSERT_EQ(h.store.sample_count(), 2u);
}

TEST(invalid_prices_are_skipped) {
    Harness h;
    h.tracker.add_trade(make_trade("#D2", "BTCUSDT", Direction::Long, 100.0));
    TradeId id = h.store.load_active_trades().at(0).id;

    h.source.emit("BTC/USDT", 0.0, T0 + NS_PER_SEC);
    h.source.emit("BTC/USDT", -5.0, T0 + 2 * NS_PER_SEC);
    h.source.emit("BTC/USDT", std::numeric_limits<double>::quiet_NaN(), T0 + 3 * NS_PER_SEC);

    auto stats = h.tracker.stats();
    ASSERT_EQ(stats.ticks_skipped, 3u);
    ASSERT_EQ(stats.ticks_processed, 0u);
    ASSERT_FALSE(h.tracker.find_trade(id)->max_profit_pct.has_value());
}

TEST(missing_entry_price_is_skipped) {
    Harness h;
    auto t = make_trade("#D3", "BTCUSDT", Direction::Long, 100.0);
    t.entry_price.reset();
    t.planned_sl_pct = -1.0;
    h.tracker.add_trade(t);

    h.source.emit("BTC/USDT", 50.0, T0 + NS_PER_MIN);
    ASSERT_EQ(h.pipeline.completed.size(), 0u);
    ASSERT_EQ(h.store.sample_count(), 0u);
    ASSERT_EQ(h.tracker.stats().active_trades, 1u);
}

// =============================================================================
// Batching
// =============================================================================

TEST(samples_batched_until_interval) {
    config::TrackerSettings s = immediate_settings();
    s.commit_interval_ms = 60'000;
    Harness h(s);
    h.tracker.add_trade(make_trade("#E1", "BTCUSDT", Direction::Long, 100.0));

    for (int i = 1; i <= 3; ++i)
        h.source.emit("BTC/USDT", 100.0 + i * 0.1, T0 + i * NS_PER_SEC);
    ASSERT_EQ(h.store.sample_count(), 0u);
    ASSERT_EQ(h.tracker.stats().commits, 0u);

    h.tracker.flush_all(true);
    ASSERT_EQ(h.store.sample_count(), 3u);
    ASSERT_EQ(h.tracker.stats().commits, 1u);
}

TEST(failed_commit_retains_pending_data) {
    Harness h;
    h.tracker.add_trade(make_trade("#E2", "BTCUSDT", Direction::Long, 100.0));

    h.store.fail_commits = true;
    h.source.emit("BTC/USDT", 100.2, T0 + NS_PER_SEC);
    ASSERT_EQ(h.tracker.stats().commit_failures, 1u);
    ASSERT_EQ(h.store.sample_count(), 0u);

    h.store.fail_commits = false;
    h.source.emit("BTC/USDT", 100.4, T0 + 2 * NS_PER_SEC);
    ASSERT_EQ(h.store.sample_count(), 2u);
}

TEST(close_force_flushes_despite_interval) {
    config::TrackerSettings s = immediate_settings();
    s.commit_interval_ms = 60'000;
    Harness h(s);
    auto t = make_trade("#E3", "BTCUSDT", Direction::Long, 100.0);
    t.planned_sl_price = 99.0;
    h.tracker.add_trade(t);
    TradeId id = h.store.load_active_trades().at(0).id;

    h.source.emit("BTC/USDT", 99.5, T0 + NS_PER_SEC);
    ASSERT_EQ(h.store.sample_count(), 0u);

    h.source.emit("BTC/USDT", 98.9, T0 + 2 * NS_PER_SEC);
    ASSERT_EQ(h.store.sample_count(), 2u);
    ASSERT_EQ(h.store.find_trade(id)->status, TradeStatus::Completed);
}

// =============================================================================
// Timeouts
// =============================================================================

TEST(timeout_closes_with_max_profit) {
    Harness h;
    h.tracker.add_trade(make_trade("#F1", "BTCUSDT", Direction::Long, 100.0));
    h.tracker.add_trade(make_trade("#F2", "ETHUSDT", Direction::Long, 100.0));

    h.source.emit("BTC/USDT", 101.5, T0 + NS_PER_HOUR);
    h.source.emit("BTC/USDT", 100.2, T0 + 2 * NS_PER_HOUR);

    ASSERT_EQ(h.tracker.check_timeouts(T0 + 23 * NS_PER_HOUR), 0u);
    ASSERT_EQ(h.tracker.check_timeouts(T0 + 25 * NS_PER_HOUR), 2u);

    ASSERT_EQ(h.pipeline.completed.size(), 2u);
    for (const auto& c : h.pipeline.completed) {
        ASSERT_EQ(c.outcome, Outcome::Timeout);
        if (c.trade.identifier == "#F1") {
            ASSERT_DOUBLE_NEAR(c.pnl, 1.5, 1e-9);
        } else {
            ASSERT_DOUBLE_NEAR(c.pnl, 0.0, 1e-9); // never ticked
        }
    }
    ASSERT_EQ(h.source.instrument_count(), 0u);
    ASSERT_EQ(h.tracker.stats().closes_by_outcome.at("timeout"), 2u);
}

// =============================================================================
// Fault isolation
// =============================================================================

TEST(milestone_failure_does_not_block_exit) {
    Harness h;
    auto t = make_trade("#G1", "BTCUSDT", Direction::Long, 100.0);
    t.planned_sl_pct = -1.0;
    h.tracker.add_trade(t);

    h.store.fail_milestones = true;
    h.source.emit("BTC/USDT", 98.0, T0 + NS_PER_MIN);

    ASSERT_EQ(h.pipeline.completed.size(), 1u);
    ASSERT_EQ(h.pipeline.completed[0].outcome, Outcome::SL);
    ASSERT_EQ(h.store.load_active_trades().size(), 0u);
}

TEST(pipeline_failure_is_contained) {
    Harness h;
    h.pipeline.throw_on_process = true;
    auto t = make_trade("#G2", "BTCUSDT", Direction::Long, 100.0);
    set_tp_pcts(t, 0.5, 0.8, 1.0);
    h.tracker.add_trade(t);

    h.source.emit("BTC/USDT", 101.0, T0 + NS_PER_MIN);

    ASSERT_EQ(h.pipeline.completed.size(), 1u);
    ASSERT_EQ(h.tracker.stats().active_trades, 0u);
    ASSERT_EQ(h.source.instrument_count(), 0u);
}

TEST(default_pipeline_updates_breaker_and_cleans_samples) {
    FakeTickSource source;
    storage::MemoryTradeStore store;
    logging::AsyncLogger logger;
    MilestoneRecorder milestones(store, logger);
    exits::ExitEvaluatorTable exits;
    risk::CircuitBreaker breaker(store, config::BreakerSettings{}, logger);
    DefaultPostTradePipeline pipeline(breaker, store, logger);
    TradeTracker tracker(source, store, milestones, exits, pipeline, immediate_settings(), logger);

    auto t = make_trade("#H1", "BTCUSDT", Direction::Long, 100.0);
    t.planned_sl_pct = -2.0;
    tracker.add_trade(t);

    source.emit("BTC/USDT", 99.0, T0 + NS_PER_MIN);
    ASSERT_EQ(store.sample_count(), 1u);
    source.emit("BTC/USDT", 97.5, T0 + 2 * NS_PER_MIN);

    ASSERT_EQ(store.sample_count(), 0u);
    auto health = store.find_asset_health(risk::AssetKey{"BTCUSDT", Direction::Long, "alpha"});
    ASSERT_TRUE(health.has_value());
    ASSERT_EQ(health->metrics.total_trades, 1);
    ASSERT_EQ(health->status, risk::AssetStatus::Active);
}

TEST(failed_close_commit_defers_post_trade_processing) {
    FakeTickSource source;
    FlakyStore store;
    logging::AsyncLogger logger;
    MilestoneRecorder milestones(store, logger);
    exits::ExitEvaluatorTable exits;
    risk::CircuitBreaker breaker(store, config::BreakerSettings{}, logger);
    DefaultPostTradePipeline pipeline(breaker, store, logger);
    TradeTracker tracker(source, store, milestones, exits, pipeline, immediate_settings(), logger);
    risk::AssetKey key{"BTCUSDT", Direction::Long, "alpha"};

    auto t = make_trade("#H2", "BTCUSDT", Direction::Long, 100.0);
    t.planned_sl_pct = -2.0;
    tracker.add_trade(t);
    TradeId id = store.load_active_trades().at(0).id;

    source.emit("BTC/USDT", 99.0, T0 + NS_PER_MIN);
    ASSERT_EQ(store.sample_count(), 1u);

    // Stop hit while the store rejects commits
    store.fail_commits = true;
    source.emit("BTC/USDT", 97.5, T0 + 2 * NS_PER_MIN);
    ASSERT_EQ(tracker.stats().closes_by_outcome.at("sl"), 1u);
    ASSERT_EQ(store.find_trade(id)->status, TradeStatus::Active);
    ASSERT_FALSE(store.find_asset_health(key).has_value());
    ASSERT_EQ(store.sample_count(), 1u);
    ASSERT_TRUE(source.has("BTC/USDT")); // kept so later ticks retry the commit

    // The retry commits the close, then the breaker sees it and samples are cleaned up
    store.fail_commits = false;
    tracker.flush_all(true);
    ASSERT_EQ(store.find_trade(id)->status, TradeStatus::Completed);
    ASSERT_EQ(store.find_trade(id)->final_outcome, Outcome::SL);
    ASSERT_EQ(store.sample_count(), 0u);
    auto health = store.find_asset_health(key);
    ASSERT_TRUE(health.has_value());
    ASSERT_EQ(health->metrics.total_trades, 1);
    ASSERT_EQ(source.instrument_count(), 0u);
    ASSERT_EQ(tracker.stats().active_trades, 0u);
}

int main() {
    std::cout << "\n=== Trade Tracker Tests ===\n\n";

    std::cout << "Subscription Tests:\n";
    RUN_TEST(start_tracking_groups_by_instrument);
    RUN_TEST(add_and_remove_adjust_subscriptions);
    RUN_TEST(completed_trade_is_not_tracked);
    RUN_TEST(paused_key_refuses_new_trades);

    std::cout << "\nTick Processing Tests:\n";
    RUN_TEST(take_profits_then_tp3_closes);
    RUN_TEST(stop_closes_one_trade_without_disturbing_sibling);
    RUN_TEST(short_trade_excursion);
    RUN_TEST(rate_limit_by_tick_timestamp);
    RUN_TEST(older_ticks_are_dropped);
    RUN_TEST(invalid_prices_are_skipped);
    RUN_TEST(missing_entry_price_is_skipped);

    std::cout << "\nBatching Tests:\n";
    RUN_TEST(samples_batched_until_interval);
    RUN_TEST(failed_commit_retains_pending_data);
    RUN_TEST(close_force_flushes_despite_interval);

    std::cout << "\nTimeout Tests:\n";
    RUN_TEST(timeout_closes_with_max_profit);

    std::cout << "\nFault Isolation Tests:\n";
    RUN_TEST(milestone_failure_does_not_block_exit);
    RUN_TEST(pipeline_failure_is_contained);
    RUN_TEST(default_pipeline_updates_breaker_and_cleans_samples);
    RUN_TEST(failed_close_commit_defers_post_trade_processing);

    std::cout << "\n=== All Trade Tracker Tests Passed! ===\n";
    return 0;
}
