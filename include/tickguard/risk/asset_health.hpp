#pragma once

#include "../types.hpp"

#include <optional>
#include <string>

namespace tickguard {
namespace risk {

enum class AssetStatus : uint8_t { Active = 0, Paused, Recovery, Blacklisted };

inline const char* asset_status_to_string(AssetStatus s) {
    switch (s) {
    case AssetStatus::Active:
        return "active";
    case AssetStatus::Paused:
        return "paused";
    case AssetStatus::Recovery:
        return "recovery";
    case AssetStatus::Blacklisted:
        return "blacklisted";
    default:
        return "active";
    }
}

inline AssetStatus string_to_asset_status(const std::string& s) {
    if (s == "paused")
        return AssetStatus::Paused;
    if (s == "recovery")
        return AssetStatus::Recovery;
    if (s == "blacklisted")
        return AssetStatus::Blacklisted;
    return AssetStatus::Active;
}

// Lower rank = more severe, used for summary ordering
inline int asset_status_rank(AssetStatus s) {
    switch (s) {
    case AssetStatus::Blacklisted:
        return 1;
    case AssetStatus::Recovery:
        return 2;
    case AssetStatus::Paused:
        return 3;
    default:
        return 4;
    }
}

enum class RiskProfile : uint8_t { Standard = 0, HighWinRate, ModerateWinRate, LowWinRate };

inline const char* risk_profile_to_string(RiskProfile p) {
    switch (p) {
    case RiskProfile::Standard:
        return "STANDARD";
    case RiskProfile::HighWinRate:
        return "HIGH_WR";
    case RiskProfile::ModerateWinRate:
        return "MODERATE_WR";
    case RiskProfile::LowWinRate:
        return "LOW_WR";
    default:
        return "STANDARD";
    }
}

inline RiskProfile string_to_risk_profile(const std::string& s) {
    if (s == "HIGH_WR")
        return RiskProfile::HighWinRate;
    if (s == "MODERATE_WR")
        return RiskProfile::ModerateWinRate;
    if (s == "LOW_WR")
        return RiskProfile::LowWinRate;
    return RiskProfile::Standard;
}

/**
 * Circuit breaker key: one health record per combination.
 */
struct AssetKey {
    std::string symbol;
    Direction direction = Direction::Long;
    std::string source;

    // "BTCUSDT|LONG|alpha"
    std::string to_string() const { return symbol + "|" + direction_to_string(direction) + "|" + source; }

    bool operator==(const AssetKey& o) const {
        return symbol == o.symbol && direction == o.direction && source == o.source;
    }
    bool operator<(const AssetKey& o) const {
        if (symbol != o.symbol)
            return symbol < o.symbol;
        if (direction != o.direction)
            return direction < o.direction;
        return source < o.source;
    }
};

/**
 * Rolling performance over the most recent completed trades (newest first).
 * Percent values throughout.
 */
struct HealthMetrics {
    int total_trades = 0;
    double win_rate = 0;
    double cumulative_pnl_5 = 0;
    double cumulative_pnl_10 = 0;
    double cumulative_pnl_20 = 0;
    int losses_in_10 = 0;
    int consecutive_losses = 0;
    int consecutive_wins = 0;
    double risk_reward = 1.0;
    double hourly_pnl = 0;
    double daily_pnl = 0;
    double max_drawdown = 0;
    double expected_win_rate = 50.0;
    double breakeven_win_rate = 50.0;
    double kelly_fraction = 0;

    bool operator==(const HealthMetrics& o) const = default;
};

struct AssetHealthRecord {
    AssetKey key;
    AssetStatus status = AssetStatus::Active;
    std::string reason;
    RiskProfile profile = RiskProfile::Standard;
    int pause_count = 0;
    std::optional<Timestamp> paused_at;
    std::optional<Timestamp> recovery_started_at;
    // Trades completed before this point are ignored by the pause conditions
    std::optional<Timestamp> window_start;
    Timestamp updated_at = 0;
    HealthMetrics metrics;

    bool is_trading_allowed() const { return status == AssetStatus::Active || status == AssetStatus::Recovery; }
};

} // namespace risk
} // namespace tickguard
