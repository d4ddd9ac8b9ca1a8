#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tickguard {

// Wall-clock nanoseconds since Unix epoch
using Timestamp = uint64_t;
using TradeId = int64_t;

constexpr Timestamp NS_PER_SEC = 1'000'000'000ULL;
constexpr Timestamp NS_PER_MIN = 60 * NS_PER_SEC;
constexpr Timestamp NS_PER_HOUR = 60 * NS_PER_MIN;
constexpr Timestamp NS_PER_DAY = 24 * NS_PER_HOUR;

// =============================================================================
// Direction
// =============================================================================

enum class Direction : uint8_t { Long = 0, Short = 1 };

inline const char* direction_to_string(Direction d) {
    switch (d) {
    case Direction::Long:
        return "LONG";
    case Direction::Short:
        return "SHORT";
    default:
        return "UNKNOWN";
    }
}

inline Direction string_to_direction(const std::string& s) {
    if (s == "LONG" || s == "long" || s == "buy" || s == "BUY")
        return Direction::Long;
    if (s == "SHORT" || s == "short" || s == "sell" || s == "SELL")
        return Direction::Short;
    throw std::invalid_argument("Unknown direction: " + s);
}

// =============================================================================
// Trade lifecycle
// =============================================================================

enum class TradeStatus : uint8_t { Active = 0, Completed };

inline const char* trade_status_to_string(TradeStatus s) {
    switch (s) {
    case TradeStatus::Active:
        return "active";
    case TradeStatus::Completed:
        return "completed";
    default:
        return "unknown";
    }
}

inline TradeStatus string_to_trade_status(const std::string& s) {
    if (s == "completed")
        return TradeStatus::Completed;
    return TradeStatus::Active;
}

enum class Outcome : uint8_t { None = 0, TP1, TP2, TP3, SL, Timeout };

inline const char* outcome_to_string(Outcome o) {
    switch (o) {
    case Outcome::None:
        return "";
    case Outcome::TP1:
        return "tp1";
    case Outcome::TP2:
        return "tp2";
    case Outcome::TP3:
        return "tp3";
    case Outcome::SL:
        return "sl";
    case Outcome::Timeout:
        return "timeout";
    default:
        return "";
    }
}

inline Outcome string_to_outcome(const std::string& s) {
    if (s == "tp1")
        return Outcome::TP1;
    if (s == "tp2")
        return Outcome::TP2;
    if (s == "tp3")
        return Outcome::TP3;
    if (s == "sl")
        return Outcome::SL;
    if (s == "timeout")
        return Outcome::Timeout;
    return Outcome::None;
}

// =============================================================================
// Risk strategy variants (selects the exit evaluator)
// =============================================================================

enum class RiskStrategy : uint8_t { Static = 0, EarlyMomentum, AdaptiveTrailing, Count };

inline const char* risk_strategy_to_string(RiskStrategy r) {
    switch (r) {
    case RiskStrategy::Static:
        return "static";
    case RiskStrategy::EarlyMomentum:
        return "early_momentum";
    case RiskStrategy::AdaptiveTrailing:
        return "adaptive_trailing";
    default:
        return "static";
    }
}

// Unknown names fall back to Static
inline RiskStrategy string_to_risk_strategy(const std::string& s) {
    if (s == "early_momentum")
        return RiskStrategy::EarlyMomentum;
    if (s == "adaptive_trailing")
        return RiskStrategy::AdaptiveTrailing;
    return RiskStrategy::Static;
}

enum class MomentumState : uint8_t { PreTp1 = 0, Tp1Tp2, PostTp2 };

inline const char* momentum_state_to_string(MomentumState m) {
    switch (m) {
    case MomentumState::PreTp1:
        return "pre_tp1";
    case MomentumState::Tp1Tp2:
        return "tp1_tp2";
    case MomentumState::PostTp2:
        return "post_tp2";
    default:
        return "pre_tp1";
    }
}

inline MomentumState string_to_momentum_state(const std::string& s) {
    if (s == "tp1_tp2")
        return MomentumState::Tp1Tp2;
    if (s == "post_tp2")
        return MomentumState::PostTp2;
    return MomentumState::PreTp1;
}

} // namespace tickguard
