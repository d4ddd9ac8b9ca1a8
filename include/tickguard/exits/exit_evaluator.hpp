#pragma once

/**
 * Exit evaluators - one decision function per RiskStrategy.
 *
 * An evaluator inspects the trade at the current tick and answers "close" or
 * "keep open". It may mutate the trade (stop-loss hit fields, trailing state,
 * momentum flags) but touches nothing else, so evaluators are stateless and a
 * single table is shared by every instrument thread.
 *
 * Usage:
 *   ExitEvaluatorTable exits(config.exits);
 *   ExitContext ctx{price, pnl_pct, now, minutes_since_entry};
 *   if (exits.evaluate(trade, ctx)) close_trade(trade, Outcome::SL);
 */

#include "../config/engine_config.hpp"
#include "../trading/trade.hpp"

#include <array>
#include <memory>

namespace tickguard {
namespace exits {

// =============================================================================
// Evaluation input
// =============================================================================

struct ExitContext {
    double price = 0;
    double pnl_pct = 0;
    Timestamp now = 0; // tick time, wall clock
    double minutes_since_entry = 0;
};

// sl_type_hit values
namespace StopType {
constexpr const char* Static = "static";
constexpr const char* StaticInitial = "static_initial";
constexpr const char* Breakeven = "breakeven";
constexpr const char* QualityFilter = "quality_filter";
constexpr const char* AdaptiveTrailing = "adaptive_trailing";
} // namespace StopType

// =============================================================================
// Evaluator interface
// =============================================================================

class IExitEvaluator {
public:
    virtual ~IExitEvaluator() = default;

    /**
     * @return true if the trade must be closed at this tick
     */
    virtual bool evaluate(trading::Trade& trade, const ExitContext& ctx) const = 0;

    virtual RiskStrategy strategy() const = 0;
};

/**
 * Planned stop: price level first, percentage as fallback.
 * Returns true and records the hit fields with the given stop type.
 */
bool check_static_stop(trading::Trade& trade, const ExitContext& ctx, const char* stop_type);

/**
 * Record a stop-loss hit on the trade.
 */
void record_stop_hit(trading::Trade& trade, const ExitContext& ctx, const char* stop_type);

// =============================================================================
// Strategy: static stop
// =============================================================================

class StaticStopEvaluator : public IExitEvaluator {
public:
    bool evaluate(trading::Trade& trade, const ExitContext& ctx) const override;
    RiskStrategy strategy() const override { return RiskStrategy::Static; }
};

// =============================================================================
// Strategy: early momentum filter
//
// Inside the window (default 5 min) the trade must reach the profit threshold
// (default 0.5%). Reaching it moves the stop to breakeven for the rest of the
// trade's life; missing it closes the trade as a low-quality signal.
// =============================================================================

class EarlyMomentumEvaluator : public IExitEvaluator {
public:
    explicit EarlyMomentumEvaluator(const config::ExitSettings& settings) : settings_(settings) {}

    bool evaluate(trading::Trade& trade, const ExitContext& ctx) const override;
    RiskStrategy strategy() const override { return RiskStrategy::EarlyMomentum; }

private:
    config::ExitSettings settings_;
};

// =============================================================================
// Strategy: adaptive trailing stop
//
// Trail distance = base * state multiplier * volatility multiplier, where the
// state multiplier tightens as TP1 and TP2 are hit:
//   pre_tp1  1.5  (wide)
//   tp1_tp2  1.0
//   post_tp2 0.7  (tight)
// =============================================================================

class AdaptiveTrailingEvaluator : public IExitEvaluator {
public:
    explicit AdaptiveTrailingEvaluator(const config::ExitSettings& settings) : settings_(settings) {}

    bool evaluate(trading::Trade& trade, const ExitContext& ctx) const override;
    RiskStrategy strategy() const override { return RiskStrategy::AdaptiveTrailing; }

    /**
     * Effective trail distance in percent for a momentum state.
     */
    double trail_distance_pct(MomentumState state, double volatility_mult) const;

private:
    // Advance pre_tp1 -> tp1_tp2 -> post_tp2 from the TP hit flags; never goes back
    static void advance_momentum_state(trading::Trade& trade);

    config::ExitSettings settings_;
};

// =============================================================================
// Dispatch table indexed by RiskStrategy
// =============================================================================

class ExitEvaluatorTable {
public:
    explicit ExitEvaluatorTable(const config::ExitSettings& settings = {});

    ExitEvaluatorTable(const ExitEvaluatorTable&) = delete;
    ExitEvaluatorTable& operator=(const ExitEvaluatorTable&) = delete;

    const IExitEvaluator& get(RiskStrategy strategy) const;

    bool evaluate(trading::Trade& trade, const ExitContext& ctx) const {
        return get(trade.risk_strategy).evaluate(trade, ctx);
    }

private:
    static constexpr size_t SIZE = static_cast<size_t>(RiskStrategy::Count);
    std::array<std::unique_ptr<IExitEvaluator>, SIZE> evaluators_;
};

} // namespace exits
} // namespace tickguard
