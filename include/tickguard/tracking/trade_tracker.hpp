#pragma once

/**
 * TradeTracker - drives every open trade from the live tick stream.
 *
 * Trades are grouped by venue-neutral instrument with one tick listener per
 * instrument. For each accepted tick, every trade on the instrument is
 * processed in order:
 *
 *   1. PnL% against the entry price
 *   2. max profit / max drawdown / best price
 *   3. milestone thresholds
 *   4. TP1..TP3 by percentage (TP3 closes the trade)
 *   5. the exit evaluator of the trade's risk strategy (close = outcome sl)
 *
 * Ticks closer than tick_process_interval to the previous accepted tick of
 * the instrument are dropped, as are ticks older than it. Price samples, milestone snapshots and dirty
 * trades are buffered per instrument and committed every commit_interval,
 * or immediately when a trade closes. A failed commit keeps the buffer for
 * the next attempt. A closed trade reaches the post-trade pipeline only once
 * its closing commit has succeeded.
 *
 * Threading: ticks arrive on the instrument's watch thread; the instrument
 * mutex serialises tick processing, timeout closes and commits for that
 * instrument. Lock order is tracker mutex, then instrument mutex. Listener
 * removal and post-trade processing run with no lock held.
 *
 * Usage:
 *   TradeTracker tracker(mux, store, milestones, exits, pipeline, config.tracker, logger);
 *   tracker.start_tracking();   // loads active trades from the store
 *   tracker.add_trade(trade);
 *   ...
 *   tracker.stop();
 */

#include "../config/engine_config.hpp"
#include "../exits/exit_evaluator.hpp"
#include "../logging/async_logger.hpp"
#include "../market/tick_source.hpp"
#include "../storage/trade_store.hpp"
#include "milestone_recorder.hpp"
#include "post_trade_pipeline.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tickguard {
namespace tracking {

struct TrackerStats {
    size_t active_trades = 0;
    size_t tracked_instruments = 0;
    uint64_t ticks_processed = 0;
    uint64_t ticks_dropped = 0; // rate limited
    uint64_t ticks_skipped = 0; // invalid price
    uint64_t trade_errors = 0;
    uint64_t trades_rejected = 0; // refused by the admission check
    uint64_t commits = 0;
    uint64_t commit_failures = 0;
    std::map<std::string, uint64_t> closes_by_outcome;
};

class TradeTracker {
public:
    TradeTracker(market::ITickSource& source, storage::ITradeStore& store, MilestoneRecorder& milestones,
                 const exits::ExitEvaluatorTable& exits, IPostTradePipeline& pipeline,
                 const config::TrackerSettings& settings, logging::AsyncLogger& logger);
    ~TradeTracker();

    // Non-copyable
    TradeTracker(const TradeTracker&) = delete;
    TradeTracker& operator=(const TradeTracker&) = delete;

    /**
     * Load active trades from the store, subscribe their instruments and
     * start the timeout checker.
     * @return number of trades loaded
     * @throws storage::StoreError if the active trades cannot be loaded
     */
    size_t start_tracking();

    using AdmissionCheck = std::function<bool(const trading::Trade&)>;

    /**
     * Consulted by add_trade() before a new trade is accepted. Trades
     * reloaded by start_tracking() were admitted earlier and skip it.
     * Set before trades are added.
     */
    void set_admission_check(AdmissionCheck check) { admission_check_ = std::move(check); }

    /**
     * Track a new trade. A trade with id 0 is inserted into the store first.
     * @return false if the trade is already tracked, is not active or is
     *         refused by the admission check
     * @throws storage::StoreError if the insert fails
     */
    bool add_trade(trading::Trade trade);

    /**
     * Stop tracking without closing. Unsubscribes when it was the last trade
     * on its instrument.
     */
    bool remove_trade(TradeId trade_id);

    /**
     * Stop the timeout checker, flush every buffer and unsubscribe.
     */
    void stop();

    /**
     * Close trades open longer than the timeout. Called by the timeout
     * checker thread; exposed for tests.
     * @param now wall clock
     * @return number of trades closed
     */
    size_t check_timeouts(Timestamp now);

    /**
     * Commit every buffer whose interval elapsed (all of them when force).
     */
    void flush_all(bool force);

    TrackerStats stats() const;

    std::optional<trading::Trade> find_trade(TradeId trade_id) const;
    size_t listener_count() const;

    /**
     * Venue-neutral instrument a trade is grouped under.
     */
    static std::string instrument_for(const trading::Trade& trade);

private:
    struct ClosedTrade {
        trading::Trade trade;
        Outcome outcome;
        double final_pnl;
    };

    struct InstrumentState {
        std::string instrument;

        std::mutex mutex; // everything below
        std::map<TradeId, trading::Trade> trades;
        std::optional<market::ListenerId> listener;
        std::optional<Timestamp> last_tick; // last accepted tick, wall clock
        double last_price = 0;
        storage::Batch batch;
        uint64_t last_commit_ns = 0; // steady clock
        // Closed, waiting for the batch holding their final state to commit
        std::vector<ClosedTrade> closed;

        bool idle() const { return trades.empty() && !listener && batch.empty() && closed.empty(); }
    };

    using StatePtr = std::shared_ptr<InstrumentState>;

    market::ITickSource& source_;
    storage::ITradeStore& store_;
    MilestoneRecorder& milestones_;
    const exits::ExitEvaluatorTable& exits_;
    IPostTradePipeline& pipeline_;
    config::TrackerSettings settings_;
    logging::AsyncLogger& logger_;
    AdmissionCheck admission_check_;

    mutable std::mutex mutex_;
    std::map<std::string, StatePtr> instruments_;
    std::map<TradeId, std::string> trade_index_;

    std::atomic<bool> running_;
    std::thread timeout_thread_;
    std::mutex timeout_mutex_;
    std::condition_variable timeout_cv_;

    std::atomic<uint64_t> ticks_processed_;
    std::atomic<uint64_t> ticks_dropped_;
    std::atomic<uint64_t> ticks_skipped_;
    std::atomic<uint64_t> trade_errors_;
    std::atomic<uint64_t> trades_rejected_;
    std::atomic<uint64_t> commits_;
    std::atomic<uint64_t> commit_failures_;
    mutable std::mutex closes_mutex_;
    std::map<std::string, uint64_t> closes_by_outcome_;

    bool track(trading::Trade trade);

    StatePtr find_state(const std::string& instrument) const;

    void on_tick(const std::string& instrument, double price, Timestamp timestamp);

    /**
     * @return the closing outcome, or nullopt to keep the trade open
     */
    std::optional<Outcome> process_trade(InstrumentState& state, trading::Trade& trade, double price,
                                         Timestamp timestamp);

    // Caller holds state.mutex; moves the trade from state.trades to state.closed and flushes
    void close_locked(InstrumentState& state, TradeId trade_id, Outcome outcome, double final_pnl,
                      double exit_price, Timestamp exit_at);

    // Caller holds state.mutex; closed trades whose final state is committed
    static std::vector<ClosedTrade> take_committed_locked(InstrumentState& state);

    // Pipeline hand-off and index cleanup, no lock held
    void finish_close(const std::string& instrument, const ClosedTrade& closed);

    // Drops the instrument if it has no trades; returns the listener to unsubscribe
    std::optional<market::ListenerId> release_instrument_locked(const std::string& instrument);

    // Caller holds state.mutex
    bool flush_locked(InstrumentState& state, bool force);

    void timeout_loop();
};

} // namespace tracking
} // namespace tickguard
