#pragma once

/**
 * Trade - an open or closed position tracked by the engine.
 *
 * Owned by TradeTracker while active. Mutated only from the tick callback of
 * its instrument (and by the exit evaluator invoked there), or by the timeout
 * checker under the same instrument lock.
 *
 * Percentages are plain percent values (1.5 = 1.5%). Stop-loss percentages
 * are negative (-2.0 = stop at -2%).
 */

#include "../types.hpp"

#include <optional>
#include <string>

namespace tickguard {
namespace trading {

/**
 * Take-profit level state (one per TP1..TP3)
 */
struct TakeProfitLevel {
    std::optional<double> price;
    std::optional<double> pct;

    bool hit = false;
    std::optional<Timestamp> hit_at;
    std::optional<double> hit_price;
    std::optional<int> time_minutes;
    std::optional<double> mae_pct; // max drawdown observed when the level was hit
};

struct Trade {
    static constexpr size_t TP_LEVELS = 3;

    // Identity
    TradeId id = 0;
    std::string identifier; // unique human-readable id, e.g. "#ALPHALONG_A_001"
    std::string symbol;       // signal-source native form ("HIPPOUSDT.P")
    std::string venue_symbol; // venue-neutral form ("HIPPO/USDT:USDT")
    std::string signal_source;
    std::string timeframe;
    Direction direction = Direction::Long;

    // Entry
    std::optional<double> entry_price;
    Timestamp entry_time = 0;

    // Plan
    RiskStrategy risk_strategy = RiskStrategy::Static;
    TakeProfitLevel tp[TP_LEVELS];
    std::optional<double> planned_sl_price;
    std::optional<double> planned_sl_pct;

    // Trailing stop
    std::optional<double> trailing_activation_pct;
    std::optional<double> trailing_distance_pct;
    std::optional<double> trailing_high_water; // low-water mark for shorts
    bool trailing_triggered = false;
    std::optional<double> trailing_stop_pct;
    int trailing_stop_updates = 0;
    std::optional<double> volatility_multiplier;
    MomentumState momentum_state = MomentumState::PreTp1;

    // Early momentum
    std::optional<double> early_profit_time_threshold; // minutes
    std::optional<double> early_profit_pct_threshold;  // percent
    bool early_momentum_detected = false;
    std::optional<double> early_momentum_time;
    std::optional<double> early_momentum_pnl;
    bool low_quality_signal = false;
    bool sl_moved_to_be = false;
    std::optional<Timestamp> sl_move_timestamp;

    // Excursion
    std::optional<double> max_favorable_excursion; // best price reached
    std::optional<double> max_profit_pct;
    std::optional<double> max_drawdown_pct;

    // Stop-loss hit
    bool sl_hit = false;
    std::optional<Timestamp> sl_hit_at;
    std::optional<double> sl_hit_price;
    std::optional<int> sl_time_minutes;
    std::string sl_type_hit;

    // Lifecycle
    TradeStatus status = TradeStatus::Active;
    std::optional<Timestamp> completed_at;
    Outcome final_outcome = Outcome::None;
    std::optional<double> final_pnl_pct;

    /**
     * Symbol used for the upstream subscription.
     */
    const std::string& subscription_symbol() const { return venue_symbol.empty() ? symbol : venue_symbol; }

    bool is_long() const { return direction == Direction::Long; }
    bool is_active() const { return status == TradeStatus::Active; }
};

/**
 * Directional PnL in percent. Returns 0 when entry is 0.
 */
inline double calculate_pnl_pct(Direction direction, double entry, double price) {
    if (entry == 0.0)
        return 0.0;
    if (direction == Direction::Long)
        return (price - entry) / entry * 100.0;
    return (entry - price) / entry * 100.0;
}

} // namespace trading
} // namespace tickguard
