#include "../../include/tickguard/exits/exit_evaluator.hpp"

#include <algorithm>

namespace tickguard::exits {

void record_stop_hit(trading::Trade& trade, const ExitContext& ctx, const char* stop_type) {
    trade.sl_hit = true;
    trade.sl_hit_at = ctx.now;
    trade.sl_hit_price = ctx.price;
    trade.sl_time_minutes = static_cast<int>(ctx.minutes_since_entry);
    trade.sl_type_hit = stop_type;
}

bool check_static_stop(trading::Trade& trade, const ExitContext& ctx, const char* stop_type) {
    bool hit = false;
    if (trade.planned_sl_price) {
        // Price level is exact regardless of leverage
        double sl = *trade.planned_sl_price;
        hit = trade.is_long() ? ctx.price <= sl : ctx.price >= sl;
    } else if (trade.planned_sl_pct) {
        hit = ctx.pnl_pct <= *trade.planned_sl_pct;
    }

    if (hit)
        record_stop_hit(trade, ctx, stop_type);
    return hit;
}

// =============================================================================
// StaticStopEvaluator
// =============================================================================

bool StaticStopEvaluator::evaluate(trading::Trade& trade, const ExitContext& ctx) const {
    return check_static_stop(trade, ctx, StopType::Static);
}

// =============================================================================
// EarlyMomentumEvaluator
// =============================================================================

bool EarlyMomentumEvaluator::evaluate(trading::Trade& trade, const ExitContext& ctx) const {
    if (trade.early_momentum_detected) {
        // Stop sits at entry; a tick exactly at entry keeps the trade open
        if (ctx.pnl_pct < 0.0) {
            record_stop_hit(trade, ctx, StopType::Breakeven);
            return true;
        }
        return false;
    }

    double time_threshold = trade.early_profit_time_threshold.value_or(settings_.early_time_threshold_min);
    double profit_threshold = trade.early_profit_pct_threshold.value_or(settings_.early_profit_threshold_pct);

    if (ctx.minutes_since_entry <= time_threshold) {
        if (ctx.pnl_pct >= profit_threshold) {
            trade.early_momentum_detected = true;
            trade.early_momentum_time = ctx.minutes_since_entry;
            trade.early_momentum_pnl = ctx.pnl_pct;
            trade.sl_moved_to_be = true;
            trade.sl_move_timestamp = ctx.now;
            return false;
        }
        return check_static_stop(trade, ctx, StopType::Static);
    }

    // Window expired without momentum
    trade.low_quality_signal = true;
    record_stop_hit(trade, ctx, StopType::QualityFilter);
    return true;
}

// =============================================================================
// AdaptiveTrailingEvaluator
// =============================================================================

double AdaptiveTrailingEvaluator::trail_distance_pct(MomentumState state, double volatility_mult) const {
    double state_mult = settings_.trail_pre_tp1_mult;
    switch (state) {
    case MomentumState::PreTp1:
        state_mult = settings_.trail_pre_tp1_mult;
        break;
    case MomentumState::Tp1Tp2:
        state_mult = settings_.trail_tp1_tp2_mult;
        break;
    case MomentumState::PostTp2:
        state_mult = settings_.trail_post_tp2_mult;
        break;
    }
    return settings_.trail_base_distance_pct * state_mult * volatility_mult;
}

void AdaptiveTrailingEvaluator::advance_momentum_state(trading::Trade& trade) {
    if (trade.tp[1].hit && trade.momentum_state != MomentumState::PostTp2) {
        trade.momentum_state = MomentumState::PostTp2;
        ++trade.trailing_stop_updates;
    } else if (trade.tp[0].hit && trade.momentum_state == MomentumState::PreTp1) {
        trade.momentum_state = MomentumState::Tp1Tp2;
        ++trade.trailing_stop_updates;
    }
}

bool AdaptiveTrailingEvaluator::evaluate(trading::Trade& trade, const ExitContext& ctx) const {
    // The initial stop is never overridden by the trail
    if (check_static_stop(trade, ctx, StopType::StaticInitial))
        return true;

    advance_momentum_state(trade);

    double volatility = trade.volatility_multiplier.value_or(settings_.default_volatility_mult);
    double distance = trail_distance_pct(trade.momentum_state, volatility);
    trade.trailing_stop_pct = distance;

    // High-water mark for longs, low-water mark for shorts
    double entry = trade.entry_price.value_or(ctx.price);
    double mark = trade.trailing_high_water.value_or(entry);
    double next_mark = trade.is_long() ? std::max(mark, ctx.price) : std::min(mark, ctx.price);
    if (!trade.trailing_high_water || next_mark != mark) {
        if (next_mark != mark)
            ++trade.trailing_stop_updates;
        trade.trailing_high_water = next_mark;
    }

    if (!trade.trailing_triggered) {
        if (!trade.trailing_activation_pct || ctx.pnl_pct >= *trade.trailing_activation_pct)
            trade.trailing_triggered = true;
    }
    if (!trade.trailing_triggered)
        return false;

    double stop = trade.is_long() ? next_mark * (1.0 - distance / 100.0) : next_mark * (1.0 + distance / 100.0);
    bool hit = trade.is_long() ? ctx.price <= stop : ctx.price >= stop;
    if (hit)
        record_stop_hit(trade, ctx, StopType::AdaptiveTrailing);
    return hit;
}

// =============================================================================
// ExitEvaluatorTable
// =============================================================================

ExitEvaluatorTable::ExitEvaluatorTable(const config::ExitSettings& settings) {
    evaluators_[static_cast<size_t>(RiskStrategy::Static)] = std::make_unique<StaticStopEvaluator>();
    evaluators_[static_cast<size_t>(RiskStrategy::EarlyMomentum)] =
        std::make_unique<EarlyMomentumEvaluator>(settings);
    evaluators_[static_cast<size_t>(RiskStrategy::AdaptiveTrailing)] =
        std::make_unique<AdaptiveTrailingEvaluator>(settings);
}

const IExitEvaluator& ExitEvaluatorTable::get(RiskStrategy strategy) const {
    size_t index = static_cast<size_t>(strategy);
    if (index >= SIZE)
        index = static_cast<size_t>(RiskStrategy::Static);
    return *evaluators_[index];
}

} // namespace tickguard::exits
