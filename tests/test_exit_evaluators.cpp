#include "../include/tickguard/exits/exit_evaluator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace tickguard;
using namespace tickguard::exits;

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

constexpr Timestamp ENTRY_TIME = 1'700'000'000ULL * NS_PER_SEC;

trading::Trade make_trade(Direction direction, double entry, RiskStrategy strategy) {
    trading::Trade t;
    t.id = 1;
    t.identifier = "#TEST_001";
    t.symbol = "BTCUSDT.P";
    t.direction = direction;
    t.entry_price = entry;
    t.entry_time = ENTRY_TIME;
    t.risk_strategy = strategy;
    return t;
}

ExitContext at(const trading::Trade& t, double price, double minutes) {
    ExitContext ctx;
    ctx.price = price;
    ctx.pnl_pct = trading::calculate_pnl_pct(t.direction, *t.entry_price, price);
    ctx.minutes_since_entry = minutes;
    ctx.now = ENTRY_TIME + static_cast<Timestamp>(minutes * NS_PER_MIN);
    return ctx;
}

} // namespace

// =============================================================================
// Static stop
// =============================================================================

TEST(static_long_price_stop) {
    StaticStopEvaluator eval;
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::Static);
    t.planned_sl_price = 98.0;

    ASSERT_FALSE(eval.evaluate(t, at(t, 98.5, 1)));
    ASSERT_FALSE(t.sl_hit);

    ASSERT_TRUE(eval.evaluate(t, at(t, 98.0, 12.7)));
    ASSERT_TRUE(t.sl_hit);
    ASSERT_EQ(t.sl_type_hit, std::string("static"));
    ASSERT_DOUBLE_NEAR(*t.sl_hit_price, 98.0, 1e-9);
    ASSERT_EQ(*t.sl_time_minutes, 12);
    ASSERT_TRUE(t.sl_hit_at.has_value());
}

TEST(static_short_price_stop) {
    StaticStopEvaluator eval;
    auto t = make_trade(Direction::Short, 100.0, RiskStrategy::Static);
    t.planned_sl_price = 102.0;

    ASSERT_FALSE(eval.evaluate(t, at(t, 101.9, 1)));
    ASSERT_FALSE(eval.evaluate(t, at(t, 95.0, 2)));
    ASSERT_TRUE(eval.evaluate(t, at(t, 102.5, 3)));
    ASSERT_EQ(t.sl_type_hit, std::string("static"));
}

TEST(static_pct_fallback) {
    StaticStopEvaluator eval;
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::Static);
    t.planned_sl_pct = -2.0;

    ASSERT_FALSE(eval.evaluate(t, at(t, 98.1, 1)));
    ASSERT_TRUE(eval.evaluate(t, at(t, 97.9, 1)));
}

TEST(static_price_preferred_over_pct) {
    StaticStopEvaluator eval;
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::Static);
    t.planned_sl_price = 95.0;
    t.planned_sl_pct = -1.0;

    // -2% would trip the percentage but not the price level
    ASSERT_FALSE(eval.evaluate(t, at(t, 98.0, 1)));
    ASSERT_TRUE(eval.evaluate(t, at(t, 95.0, 1)));
}

TEST(static_without_stop_never_closes) {
    StaticStopEvaluator eval;
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::Static);
    ASSERT_FALSE(eval.evaluate(t, at(t, 1.0, 1)));
    ASSERT_FALSE(t.sl_hit);
}

// =============================================================================
// Early momentum
// =============================================================================

TEST(early_momentum_detected_moves_stop_to_breakeven) {
    EarlyMomentumEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::EarlyMomentum);
    t.planned_sl_pct = -3.0;

    ASSERT_FALSE(eval.evaluate(t, at(t, 100.6, 3)));
    ASSERT_TRUE(t.early_momentum_detected);
    ASSERT_TRUE(t.sl_moved_to_be);
    ASSERT_DOUBLE_NEAR(*t.early_momentum_time, 3.0, 1e-9);
    ASSERT_DOUBLE_NEAR(*t.early_momentum_pnl, 0.6, 1e-6);
    ASSERT_TRUE(t.sl_move_timestamp.has_value());

    // Exactly at entry stays open
    ASSERT_FALSE(eval.evaluate(t, at(t, 100.0, 20)));

    ASSERT_TRUE(eval.evaluate(t, at(t, 99.99, 25)));
    ASSERT_EQ(t.sl_type_hit, std::string("breakeven"));
    ASSERT_FALSE(t.low_quality_signal);
}

TEST(early_momentum_window_expiry_closes) {
    EarlyMomentumEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::EarlyMomentum);

    ASSERT_FALSE(eval.evaluate(t, at(t, 100.3, 4)));
    ASSERT_FALSE(t.early_momentum_detected);

    ASSERT_TRUE(eval.evaluate(t, at(t, 100.3, 5.1)));
    ASSERT_TRUE(t.low_quality_signal);
    ASSERT_EQ(t.sl_type_hit, std::string("quality_filter"));
}

TEST(early_momentum_static_stop_inside_window) {
    EarlyMomentumEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Short, 100.0, RiskStrategy::EarlyMomentum);
    t.planned_sl_pct = -1.0;

    ASSERT_TRUE(eval.evaluate(t, at(t, 101.5, 2)));
    ASSERT_EQ(t.sl_type_hit, std::string("static"));
    ASSERT_FALSE(t.low_quality_signal);
}

TEST(early_momentum_per_trade_thresholds) {
    EarlyMomentumEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::EarlyMomentum);
    t.early_profit_time_threshold = 10.0;
    t.early_profit_pct_threshold = 1.0;

    ASSERT_FALSE(eval.evaluate(t, at(t, 100.6, 7)));
    ASSERT_FALSE(t.early_momentum_detected);

    ASSERT_FALSE(eval.evaluate(t, at(t, 101.0, 8)));
    ASSERT_TRUE(t.early_momentum_detected);
}

TEST(early_momentum_short_direction) {
    EarlyMomentumEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Short, 200.0, RiskStrategy::EarlyMomentum);

    ASSERT_FALSE(eval.evaluate(t, at(t, 198.0, 1)));
    ASSERT_TRUE(t.early_momentum_detected);
    ASSERT_TRUE(eval.evaluate(t, at(t, 200.5, 30)));
    ASSERT_EQ(t.sl_type_hit, std::string("breakeven"));
}

// =============================================================================
// Adaptive trailing
// =============================================================================

TEST(trailing_distance_by_state) {
    AdaptiveTrailingEvaluator eval(config::ExitSettings{});
    ASSERT_DOUBLE_NEAR(eval.trail_distance_pct(MomentumState::PreTp1, 1.0), 3.0, 1e-9);
    ASSERT_DOUBLE_NEAR(eval.trail_distance_pct(MomentumState::Tp1Tp2, 1.0), 2.0, 1e-9);
    ASSERT_DOUBLE_NEAR(eval.trail_distance_pct(MomentumState::PostTp2, 1.0), 1.4, 1e-9);
    ASSERT_DOUBLE_NEAR(eval.trail_distance_pct(MomentumState::PreTp1, 2.0), 6.0, 1e-9);
}

TEST(trailing_long_follows_high_water) {
    AdaptiveTrailingEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::AdaptiveTrailing);

    ASSERT_FALSE(eval.evaluate(t, at(t, 100.0, 1)));
    ASSERT_TRUE(t.trailing_triggered);
    ASSERT_DOUBLE_NEAR(*t.trailing_high_water, 100.0, 1e-9);

    ASSERT_FALSE(eval.evaluate(t, at(t, 110.0, 2)));
    ASSERT_DOUBLE_NEAR(*t.trailing_high_water, 110.0, 1e-9);
    ASSERT_DOUBLE_NEAR(*t.trailing_stop_pct, 3.0, 1e-9);

    // Stop at 110 * 0.97 = 106.7
    ASSERT_FALSE(eval.evaluate(t, at(t, 107.0, 3)));
    ASSERT_DOUBLE_NEAR(*t.trailing_high_water, 110.0, 1e-9);
    ASSERT_TRUE(eval.evaluate(t, at(t, 106.5, 4)));
    ASSERT_EQ(t.sl_type_hit, std::string("adaptive_trailing"));
}

TEST(trailing_short_follows_low_water) {
    AdaptiveTrailingEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Short, 100.0, RiskStrategy::AdaptiveTrailing);

    ASSERT_FALSE(eval.evaluate(t, at(t, 90.0, 1)));
    ASSERT_DOUBLE_NEAR(*t.trailing_high_water, 90.0, 1e-9);

    // Stop at 90 * 1.03 = 92.7
    ASSERT_FALSE(eval.evaluate(t, at(t, 92.0, 2)));
    ASSERT_TRUE(eval.evaluate(t, at(t, 93.0, 3)));
    ASSERT_EQ(t.sl_type_hit, std::string("adaptive_trailing"));
}

TEST(trailing_waits_for_activation) {
    AdaptiveTrailingEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::AdaptiveTrailing);
    t.trailing_activation_pct = 5.0;

    ASSERT_FALSE(eval.evaluate(t, at(t, 104.0, 1)));
    ASSERT_FALSE(t.trailing_triggered);
    // Far below the would-be stop, but the trail is not active yet
    ASSERT_FALSE(eval.evaluate(t, at(t, 100.0, 2)));

    ASSERT_FALSE(eval.evaluate(t, at(t, 105.0, 3)));
    ASSERT_TRUE(t.trailing_triggered);
    // Stop at 105 * 0.97 = 101.85
    ASSERT_TRUE(eval.evaluate(t, at(t, 101.0, 4)));
}

TEST(trailing_momentum_state_tightens) {
    AdaptiveTrailingEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::AdaptiveTrailing);

    ASSERT_FALSE(eval.evaluate(t, at(t, 100.0, 1)));
    ASSERT_EQ(t.momentum_state, MomentumState::PreTp1);
    int updates = t.trailing_stop_updates;

    t.tp[0].hit = true;
    ASSERT_FALSE(eval.evaluate(t, at(t, 100.0, 2)));
    ASSERT_EQ(t.momentum_state, MomentumState::Tp1Tp2);
    ASSERT_DOUBLE_NEAR(*t.trailing_stop_pct, 2.0, 1e-9);
    ASSERT_EQ(t.trailing_stop_updates, updates + 1);

    t.tp[1].hit = true;
    ASSERT_FALSE(eval.evaluate(t, at(t, 100.0, 3)));
    ASSERT_EQ(t.momentum_state, MomentumState::PostTp2);
    ASSERT_DOUBLE_NEAR(*t.trailing_stop_pct, 1.4, 1e-9);
    ASSERT_EQ(t.trailing_stop_updates, updates + 2);

    // Never goes back
    ASSERT_FALSE(eval.evaluate(t, at(t, 100.0, 4)));
    ASSERT_EQ(t.momentum_state, MomentumState::PostTp2);
    ASSERT_EQ(t.trailing_stop_updates, updates + 2);
}

TEST(trailing_static_initial_checked_first) {
    AdaptiveTrailingEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::AdaptiveTrailing);
    t.planned_sl_price = 99.0;

    ASSERT_TRUE(eval.evaluate(t, at(t, 98.9, 1)));
    ASSERT_EQ(t.sl_type_hit, std::string("static_initial"));
}

TEST(trailing_volatility_multiplier_widens) {
    AdaptiveTrailingEvaluator eval(config::ExitSettings{});
    auto t = make_trade(Direction::Long, 100.0, RiskStrategy::AdaptiveTrailing);
    t.volatility_multiplier = 2.0;

    ASSERT_FALSE(eval.evaluate(t, at(t, 110.0, 1)));
    // 6% trail: stop at 103.4
    ASSERT_FALSE(eval.evaluate(t, at(t, 104.0, 2)));
    ASSERT_TRUE(eval.evaluate(t, at(t, 103.0, 3)));
}

// =============================================================================
// Dispatch table
// =============================================================================

TEST(table_dispatches_by_strategy) {
    ExitEvaluatorTable table;
    ASSERT_EQ(table.get(RiskStrategy::Static).strategy(), RiskStrategy::Static);
    ASSERT_EQ(table.get(RiskStrategy::EarlyMomentum).strategy(), RiskStrategy::EarlyMomentum);
    ASSERT_EQ(table.get(RiskStrategy::AdaptiveTrailing).strategy(), RiskStrategy::AdaptiveTrailing);
    ASSERT_EQ(table.get(static_cast<RiskStrategy>(42)).strategy(), RiskStrategy::Static);
}

TEST(unknown_strategy_name_is_static) {
    ASSERT_EQ(string_to_risk_strategy("fibonacci_magic"), RiskStrategy::Static);
    ASSERT_EQ(string_to_risk_strategy("early_momentum"), RiskStrategy::EarlyMomentum);

    ExitEvaluatorTable table;
    auto t = make_trade(Direction::Long, 100.0, string_to_risk_strategy("fibonacci_magic"));
    t.planned_sl_pct = -1.0;
    ASSERT_TRUE(table.evaluate(t, at(t, 98.0, 1)));
    ASSERT_EQ(t.sl_type_hit, std::string("static"));
}

int main() {
    std::cout << "\n=== Exit Evaluator Tests ===\n\n";

    std::cout << "Static Stop Tests:\n";
    RUN_TEST(static_long_price_stop);
    RUN_TEST(static_short_price_stop);
    RUN_TEST(static_pct_fallback);
    RUN_TEST(static_price_preferred_over_pct);
    RUN_TEST(static_without_stop_never_closes);

    std::cout << "\nEarly Momentum Tests:\n";
    RUN_TEST(early_momentum_detected_moves_stop_to_breakeven);
    RUN_TEST(early_momentum_window_expiry_closes);
    RUN_TEST(early_momentum_static_stop_inside_window);
    RUN_TEST(early_momentum_per_trade_thresholds);
    RUN_TEST(early_momentum_short_direction);

    std::cout << "\nAdaptive Trailing Tests:\n";
    RUN_TEST(trailing_distance_by_state);
    RUN_TEST(trailing_long_follows_high_water);
    RUN_TEST(trailing_short_follows_low_water);
    RUN_TEST(trailing_waits_for_activation);
    RUN_TEST(trailing_momentum_state_tightens);
    RUN_TEST(trailing_static_initial_checked_first);
    RUN_TEST(trailing_volatility_multiplier_widens);

    std::cout << "\nDispatch Tests:\n";
    RUN_TEST(table_dispatches_by_strategy);
    RUN_TEST(unknown_strategy_name_is_static);

    std::cout << "\n=== All Exit Evaluator Tests Passed! ===\n";
    return 0;
}
