#pragma once

/**
 * MilestoneRecord - first-crossing timestamps of fixed PnL thresholds.
 *
 * One record per trade. Each threshold slot is write-once: after it is set it
 * never changes, regardless of later price action. Downstream simulation
 * replays these timestamps after the trade closes.
 */

#include "../types.hpp"

#include <array>
#include <optional>

namespace tickguard {
namespace trading {

constexpr size_t MILESTONE_COUNT = 8;
constexpr std::array<double, MILESTONE_COUNT> PROFIT_MILESTONES = {0.5, 1.0, 1.5, 2.0, 3.0, 5.0, 8.0, 10.0};
constexpr std::array<double, MILESTONE_COUNT> DRAWDOWN_MILESTONES = {-0.5, -1.0, -1.5, -2.0,
                                                                      -3.0, -5.0, -8.0, -10.0};

struct MilestoneRecord {
    TradeId trade_id = 0;
    double entry_price = 0;
    Timestamp entry_at = 0;

    std::array<std::optional<Timestamp>, MILESTONE_COUNT> reached_profit{};
    std::array<std::optional<Timestamp>, MILESTONE_COUNT> reached_drawdown{};

    std::optional<double> max_profit_pct;
    std::optional<Timestamp> max_profit_at;
    std::optional<double> max_drawdown_pct;
    std::optional<Timestamp> max_drawdown_at;

    std::optional<double> exit_price;
    std::optional<Timestamp> exit_at;
    std::optional<double> final_pnl_pct;

    size_t profit_milestones_reached() const {
        size_t n = 0;
        for (const auto& r : reached_profit)
            n += r.has_value() ? 1 : 0;
        return n;
    }

    size_t drawdown_milestones_reached() const {
        size_t n = 0;
        for (const auto& r : reached_drawdown)
            n += r.has_value() ? 1 : 0;
        return n;
    }
};

/**
 * Ephemeral per-tick sample. Deleted once the trade is closed and consumed.
 */
struct PriceSample {
    TradeId trade_id = 0;
    Timestamp timestamp = 0;
    double price = 0;
    double pnl_pct = 0;
    std::optional<double> max_profit_so_far;
    std::optional<double> max_drawdown_so_far;
};

} // namespace trading
} // namespace tickguard
