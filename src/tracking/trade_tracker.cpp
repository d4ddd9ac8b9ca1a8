#include "../../include/tickguard/tracking/trade_tracker.hpp"
#include "../../include/tickguard/util/symbol_utils.hpp"
#include "../../include/tickguard/util/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>

namespace tickguard::tracking {

namespace {

void upsert_trade(storage::Batch& batch, const trading::Trade& trade) {
    for (auto& pending : batch.trades) {
        if (pending.id == trade.id) {
            pending = trade;
            return;
        }
    }
    batch.trades.push_back(trade);
}

void upsert_milestone(storage::Batch& batch, const trading::MilestoneRecord& record) {
    for (auto& pending : batch.milestones) {
        if (pending.trade_id == record.trade_id) {
            pending = record;
            return;
        }
    }
    batch.milestones.push_back(record);
}

} // namespace

TradeTracker::TradeTracker(market::ITickSource& source, storage::ITradeStore& store, MilestoneRecorder& milestones,
                           const exits::ExitEvaluatorTable& exits, IPostTradePipeline& pipeline,
                           const config::TrackerSettings& settings, logging::AsyncLogger& logger)
    : source_(source), store_(store), milestones_(milestones), exits_(exits), pipeline_(pipeline),
      settings_(settings), logger_(logger), running_(false), ticks_processed_(0), ticks_dropped_(0),
      ticks_skipped_(0), trade_errors_(0), trades_rejected_(0), commits_(0), commit_failures_(0) {}

TradeTracker::~TradeTracker() { stop(); }

std::string TradeTracker::instrument_for(const trading::Trade& trade) {
    if (!trade.venue_symbol.empty())
        return trade.venue_symbol;
    try {
        return util::parse_venue_symbol(trade.symbol).venue_symbol;
    } catch (const std::invalid_argument&) {
        // Unrecognised quote currency: subscribe with the native symbol
        return trade.symbol;
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

size_t TradeTracker::start_tracking() {
    auto trades = store_.load_active_trades();
    size_t loaded = 0;
    for (auto& trade : trades) {
        if (track(std::move(trade)))
            ++loaded;
    }

    if (!running_.exchange(true)) {
        timeout_thread_ = std::thread(&TradeTracker::timeout_loop, this);
    }

    TICKGUARD_LOGF(logger_, Info, Tracker, "Tracking %zu active trades on %zu instruments", loaded,
                   stats().tracked_instruments);
    return loaded;
}

void TradeTracker::stop() {
    if (running_.exchange(false)) {
        timeout_cv_.notify_all();
    }
    if (timeout_thread_.joinable()) {
        timeout_thread_.join();
    }

    std::vector<std::pair<std::string, market::ListenerId>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [instrument, state] : instruments_) {
            std::lock_guard<std::mutex> state_lock(state->mutex);
            if (state->listener) {
                listeners.emplace_back(instrument, *state->listener);
                state->listener.reset();
            }
        }
    }

    for (const auto& [instrument, id] : listeners) {
        source_.unsubscribe(instrument, id);
    }

    // No more ticks can arrive
    flush_all(true);
    if (!listeners.empty()) {
        TICKGUARD_LOGF(logger_, Info, Tracker, "Tracker stopped, released %zu instruments", listeners.size());
    }
}

// =============================================================================
// Trade registration
// =============================================================================

bool TradeTracker::add_trade(trading::Trade trade) {
    if (admission_check_ && trade.is_active() && !admission_check_(trade)) {
        trades_rejected_.fetch_add(1, std::memory_order_relaxed);
        TICKGUARD_LOGF(logger_, Warn, Tracker, "Rejecting %s: %s %s from %s is not allowed to trade",
                       trade.identifier.c_str(), trade.symbol.c_str(), direction_to_string(trade.direction),
                       trade.signal_source.c_str());
        return false;
    }
    return track(std::move(trade));
}

bool TradeTracker::track(trading::Trade trade) {
    if (!trade.is_active()) {
        TICKGUARD_LOGF(logger_, Warn, Tracker, "Not tracking %s: status %s", trade.identifier.c_str(),
                       trade_status_to_string(trade.status));
        return false;
    }
    if (trade.id == 0) {
        trade = store_.insert_trade(std::move(trade));
    }

    std::string instrument = instrument_for(trade);
    TradeId id = trade.id;

    std::lock_guard<std::mutex> lock(mutex_);
    if (trade_index_.count(id))
        return false;

    auto& slot = instruments_[instrument];
    if (!slot) {
        slot = std::make_shared<InstrumentState>();
        slot->instrument = instrument;
        slot->last_commit_ns = util::now_ns();
    }
    StatePtr state = slot;

    bool need_listener;
    {
        std::lock_guard<std::mutex> state_lock(state->mutex);
        TICKGUARD_LOGF(logger_, Info, Tracker, "Tracking %s %s %s on %s (%s)", trade.identifier.c_str(),
                       trade.symbol.c_str(), direction_to_string(trade.direction), instrument.c_str(),
                       risk_strategy_to_string(trade.risk_strategy));
        state->trades.emplace(id, std::move(trade));
        need_listener = !state->listener.has_value();
    }
    trade_index_[id] = instrument;

    if (need_listener) {
        market::ListenerId listener =
            source_.subscribe(instrument, [this](const std::string& sym, double price, Timestamp ts) {
                on_tick(sym, price, ts);
            });
        std::lock_guard<std::mutex> state_lock(state->mutex);
        state->listener = listener;
    }
    return true;
}

bool TradeTracker::remove_trade(TradeId trade_id) {
    std::string instrument;
    std::optional<market::ListenerId> listener;
    std::vector<ClosedTrade> committed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = trade_index_.find(trade_id);
        if (it == trade_index_.end())
            return false;
        instrument = it->second;
        trade_index_.erase(it);

        auto state_it = instruments_.find(instrument);
        if (state_it != instruments_.end()) {
            std::lock_guard<std::mutex> state_lock(state_it->second->mutex);
            state_it->second->trades.erase(trade_id);
            flush_locked(*state_it->second, true);
            committed = take_committed_locked(*state_it->second);
        }
        listener = release_instrument_locked(instrument);
    }

    milestones_.clear_cache(trade_id);
    if (listener) {
        source_.unsubscribe(instrument, *listener);
    }
    for (const auto& c : committed) {
        finish_close(instrument, c);
    }
    TICKGUARD_LOGF(logger_, Info, Tracker, "Stopped tracking trade %lld on %s", static_cast<long long>(trade_id),
                   instrument.c_str());
    return true;
}

std::optional<market::ListenerId> TradeTracker::release_instrument_locked(const std::string& instrument) {
    auto it = instruments_.find(instrument);
    if (it == instruments_.end())
        return std::nullopt;

    StatePtr state = it->second;
    std::lock_guard<std::mutex> state_lock(state->mutex);
    if (!state->trades.empty())
        return std::nullopt;

    std::optional<market::ListenerId> listener = state->listener;
    state->listener.reset();
    // Keep uncommitted data and pending hand-offs around for the next flush
    if (state->idle()) {
        instruments_.erase(it);
    }
    return listener;
}

TradeTracker::StatePtr TradeTracker::find_state(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instruments_.find(instrument);
    return it == instruments_.end() ? nullptr : it->second;
}

// =============================================================================
// Tick processing (instrument watch thread)
// =============================================================================

void TradeTracker::on_tick(const std::string& instrument, double price, Timestamp timestamp) {
    if (!std::isfinite(price) || price <= 0) {
        ticks_skipped_.fetch_add(1, std::memory_order_relaxed);
        TICKGUARD_LOGF(logger_, Debug, Tracker, "Skipping invalid price %f for %s", price, instrument.c_str());
        return;
    }

    StatePtr state = find_state(instrument);
    if (!state)
        return;

    std::vector<ClosedTrade> closed;
    {
        std::lock_guard<std::mutex> lock(state->mutex);

        Timestamp interval = util::ms_to_ns(settings_.tick_process_interval_ms);
        if (state->last_tick && (timestamp < *state->last_tick || timestamp - *state->last_tick < interval)) {
            ticks_dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        state->last_tick = timestamp;
        state->last_price = price;
        ticks_processed_.fetch_add(1, std::memory_order_relaxed);

        std::vector<std::pair<TradeId, Outcome>> closing;
        for (auto& [id, trade] : state->trades) {
            try {
                if (auto outcome = process_trade(*state, trade, price, timestamp)) {
                    closing.emplace_back(id, *outcome);
                }
            } catch (const std::exception& e) {
                trade_errors_.fetch_add(1, std::memory_order_relaxed);
                TICKGUARD_LOGF(logger_, Error, Tracker, "Tick processing failed for %s: %s", trade.identifier.c_str(),
                               e.what());
            }
        }

        for (const auto& [id, outcome] : closing) {
            const trading::Trade& trade = state->trades.at(id);
            double pnl = trading::calculate_pnl_pct(trade.direction, trade.entry_price.value_or(0.0), price);
            close_locked(*state, id, outcome, pnl, price, timestamp);
        }

        if (closing.empty()) {
            flush_locked(*state, false);
        }
        closed = take_committed_locked(*state);
    }

    for (const auto& c : closed) {
        finish_close(instrument, c);
    }
}

std::optional<Outcome> TradeTracker::process_trade(InstrumentState& state, trading::Trade& trade, double price,
                                                   Timestamp timestamp) {
    if (!trade.entry_price) {
        TICKGUARD_LOGF(logger_, Debug, Tracker, "Skipping %s: no entry price", trade.identifier.c_str());
        return std::nullopt;
    }

    double entry = *trade.entry_price;
    double pnl = trading::calculate_pnl_pct(trade.direction, entry, price);
    double minutes = util::minutes_between(trade.entry_time, timestamp);

    // Excursion
    if (!trade.max_profit_pct || pnl > *trade.max_profit_pct) {
        trade.max_profit_pct = pnl;
        trade.max_favorable_excursion = price;
    }
    if (!trade.max_drawdown_pct || pnl < *trade.max_drawdown_pct) {
        trade.max_drawdown_pct = pnl;
    }

    // Milestones must not block exit decisions
    try {
        upsert_milestone(state.batch, milestones_.update_milestones(trade, pnl, timestamp));
    } catch (const std::exception& e) {
        TICKGUARD_LOGF(logger_, Error, Milestone, "Milestone update failed for %s: %s", trade.identifier.c_str(),
                       e.what());
    }

    trading::PriceSample sample;
    sample.trade_id = trade.id;
    sample.timestamp = timestamp;
    sample.price = price;
    sample.pnl_pct = pnl;
    sample.max_profit_so_far = trade.max_profit_pct;
    sample.max_drawdown_so_far = trade.max_drawdown_pct;
    state.batch.samples.push_back(sample);

    std::optional<Outcome> outcome;

    for (size_t i = 0; i < trading::Trade::TP_LEVELS; ++i) {
        auto& tp = trade.tp[i];
        if (tp.hit || !tp.pct || pnl < *tp.pct)
            continue;

        tp.hit = true;
        tp.hit_at = timestamp;
        tp.hit_price = price;
        tp.time_minutes = static_cast<int>(minutes);
        tp.mae_pct = std::min(0.0, trade.max_drawdown_pct.value_or(0.0));
        TICKGUARD_LOGF(logger_, Info, Exit, "%s TP%zu hit at %.8g (%+.2f%%, %d min)", trade.identifier.c_str(), i + 1,
                       price, pnl, *tp.time_minutes);

        if (i == trading::Trade::TP_LEVELS - 1)
            outcome = Outcome::TP3;
    }

    if (!outcome && !trade.sl_hit) {
        exits::ExitContext ctx{price, pnl, timestamp, minutes};
        if (exits_.evaluate(trade, ctx)) {
            TICKGUARD_LOGF(logger_, Info, Exit, "%s stop hit (%s) at %.8g (%+.2f%%)", trade.identifier.c_str(),
                           trade.sl_type_hit.c_str(), price, pnl);
            outcome = Outcome::SL;
        }
    }

    upsert_trade(state.batch, trade);
    return outcome;
}

// =============================================================================
// Closing
// =============================================================================

void TradeTracker::close_locked(InstrumentState& state, TradeId trade_id, Outcome outcome, double final_pnl,
                                double exit_price, Timestamp exit_at) {
    auto it = state.trades.find(trade_id);
    trading::Trade trade = std::move(it->second);
    state.trades.erase(it);

    trade.status = TradeStatus::Completed;
    trade.completed_at = exit_at;
    trade.final_outcome = outcome;
    trade.final_pnl_pct = final_pnl;

    try {
        upsert_milestone(state.batch, milestones_.finalize(trade, exit_price, exit_at, final_pnl));
    } catch (const std::exception& e) {
        TICKGUARD_LOGF(logger_, Error, Milestone, "Milestone finalize failed for %s: %s", trade.identifier.c_str(),
                       e.what());
    }

    upsert_trade(state.batch, trade);

    {
        std::lock_guard<std::mutex> lock(closes_mutex_);
        ++closes_by_outcome_[outcome_to_string(outcome)];
    }

    TICKGUARD_LOGF(logger_, Info, Exit, "CLOSED %s %s %s | outcome %s | P&L %+.2f%% | max %+.2f%% / %+.2f%%",
                   trade.identifier.c_str(), trade.symbol.c_str(), direction_to_string(trade.direction),
                   outcome_to_string(outcome), final_pnl, trade.max_profit_pct.value_or(0.0),
                   trade.max_drawdown_pct.value_or(0.0));

    state.closed.push_back(ClosedTrade{std::move(trade), outcome, final_pnl});
    if (!flush_locked(state, true)) {
        TICKGUARD_LOGF(logger_, Warn, Tracker, "%s closed but not yet committed, post-trade processing deferred",
                       state.closed.back().trade.identifier.c_str());
    }
}

std::vector<TradeTracker::ClosedTrade> TradeTracker::take_committed_locked(InstrumentState& state) {
    if (!state.batch.empty())
        return {};
    std::vector<ClosedTrade> committed = std::move(state.closed);
    state.closed.clear();
    return committed;
}

void TradeTracker::finish_close(const std::string& instrument, const ClosedTrade& closed) {
    try {
        pipeline_.process_completed_trade(closed.trade, closed.outcome, closed.final_pnl);
    } catch (const std::exception& e) {
        TICKGUARD_LOGF(logger_, Error, Tracker, "Post-trade processing failed for %s: %s",
                       closed.trade.identifier.c_str(), e.what());
    }

    milestones_.clear_cache(closed.trade.id);

    std::optional<market::ListenerId> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        trade_index_.erase(closed.trade.id);
        listener = release_instrument_locked(instrument);
    }
    if (listener) {
        source_.unsubscribe(instrument, *listener);
    }
}

size_t TradeTracker::check_timeouts(Timestamp now) {
    auto timeout = static_cast<Timestamp>(settings_.trade_timeout_hours * static_cast<double>(NS_PER_HOUR));

    std::vector<StatePtr> states;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [instrument, state] : instruments_)
            states.push_back(state);
    }

    std::vector<std::pair<std::string, ClosedTrade>> closed;
    for (const auto& state : states) {
        std::lock_guard<std::mutex> lock(state->mutex);

        std::vector<TradeId> expired;
        for (const auto& [id, trade] : state->trades) {
            if (now > trade.entry_time && now - trade.entry_time > timeout)
                expired.push_back(id);
        }

        for (TradeId id : expired) {
            const trading::Trade& trade = state->trades.at(id);
            // Best excursion stands in for the exit
            double final_pnl = trade.max_profit_pct.value_or(0.0);
            double exit_price = state->last_price > 0 ? state->last_price : trade.entry_price.value_or(0.0);
            TICKGUARD_LOGF(logger_, Warn, Tracker, "%s timed out after %.1f hours", trade.identifier.c_str(),
                           util::minutes_between(trade.entry_time, now) / 60.0);
            close_locked(*state, id, Outcome::Timeout, final_pnl, exit_price, now);
        }
        for (auto& c : take_committed_locked(*state))
            closed.emplace_back(state->instrument, std::move(c));
    }

    for (const auto& [instrument, c] : closed) {
        finish_close(instrument, c);
    }
    return closed.size();
}

void TradeTracker::timeout_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(timeout_mutex_);
            timeout_cv_.wait_for(lock, std::chrono::milliseconds(settings_.timeout_check_interval_ms),
                                 [this] { return !running_.load(); });
        }
        if (!running_.load())
            break;

        try {
            check_timeouts(util::wall_clock_ns());
            flush_all(false);
        } catch (const std::exception& e) {
            TICKGUARD_LOGF(logger_, Error, Tracker, "Timeout check failed: %s", e.what());
        }
    }
}

// =============================================================================
// Batching
// =============================================================================

bool TradeTracker::flush_locked(InstrumentState& state, bool force) {
    if (state.batch.empty())
        return true;

    uint64_t now = util::now_ns();
    if (!force && now - state.last_commit_ns < util::ms_to_ns(settings_.commit_interval_ms))
        return false;

    size_t pending = state.batch.size();
    try {
        store_.commit_batch(state.batch);
    } catch (const std::exception& e) {
        commit_failures_.fetch_add(1, std::memory_order_relaxed);
        TICKGUARD_LOGF(logger_, Error, Store, "Commit failed for %s, keeping %zu pending rows: %s",
                       state.instrument.c_str(), pending, e.what());
        return false;
    }

    state.batch.clear();
    state.last_commit_ns = now;
    commits_.fetch_add(1, std::memory_order_relaxed);
    TICKGUARD_LOGF(logger_, Debug, Store, "Committed %zu rows for %s", pending, state.instrument.c_str());
    return true;
}

void TradeTracker::flush_all(bool force) {
    std::vector<StatePtr> states;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [instrument, state] : instruments_)
            states.push_back(state);
    }

    std::vector<std::pair<std::string, ClosedTrade>> committed;
    for (const auto& state : states) {
        std::lock_guard<std::mutex> lock(state->mutex);
        flush_locked(*state, force);
        for (auto& c : take_committed_locked(*state))
            committed.emplace_back(state->instrument, std::move(c));
    }

    for (const auto& [instrument, c] : committed) {
        finish_close(instrument, c);
    }

    // Drop released instruments once their data is committed
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = instruments_.begin(); it != instruments_.end();) {
        std::unique_lock<std::mutex> state_lock(it->second->mutex);
        bool idle = it->second->idle();
        state_lock.unlock();
        it = idle ? instruments_.erase(it) : std::next(it);
    }
}

// =============================================================================
// Queries
// =============================================================================

TrackerStats TradeTracker::stats() const {
    TrackerStats s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.active_trades = trade_index_.size();
        std::set<std::string> instruments;
        for (const auto& [id, instrument] : trade_index_)
            instruments.insert(instrument);
        s.tracked_instruments = instruments.size();
    }
    s.ticks_processed = ticks_processed_.load();
    s.ticks_dropped = ticks_dropped_.load();
    s.ticks_skipped = ticks_skipped_.load();
    s.trade_errors = trade_errors_.load();
    s.trades_rejected = trades_rejected_.load();
    s.commits = commits_.load();
    s.commit_failures = commit_failures_.load();
    {
        std::lock_guard<std::mutex> lock(closes_mutex_);
        s.closes_by_outcome = closes_by_outcome_;
    }
    return s;
}

std::optional<trading::Trade> TradeTracker::find_trade(TradeId trade_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trade_index_.find(trade_id);
    if (it == trade_index_.end())
        return std::nullopt;
    auto state_it = instruments_.find(it->second);
    if (state_it == instruments_.end())
        return std::nullopt;

    std::lock_guard<std::mutex> state_lock(state_it->second->mutex);
    auto trade_it = state_it->second->trades.find(trade_id);
    if (trade_it == state_it->second->trades.end())
        return std::nullopt;
    return trade_it->second;
}

size_t TradeTracker::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [instrument, state] : instruments_) {
        std::lock_guard<std::mutex> state_lock(state->mutex);
        n += state->listener.has_value() ? 1 : 0;
    }
    return n;
}

} // namespace tickguard::tracking
