#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

/**
 * Centralized defaults for the engine.
 *
 * Naming:
 * - _MS / _SEC / _HOURS suffix: duration unit
 * - _PCT suffix: plain percent (0.5 = 0.5%)
 * - _MULT suffix: dimensionless multiplier
 */

namespace tickguard::config {

// =============================================================================
// Connection Multiplexer
// =============================================================================
namespace multiplexer {
constexpr uint64_t HEALTH_CHECK_INTERVAL_MS = 10'000;
constexpr uint64_t STALE_TIMEOUT_MS = 30'000;
constexpr uint64_t POLL_INTERVAL_MS = 1'000;
constexpr uint64_t POLL_ERROR_BACKOFF_MS = 5'000;
// How long polling runs before streaming venues are retried
constexpr uint64_t STREAMING_RETRY_MS = 60'000;
// Pause between full rounds of failed venues when polling is unavailable
constexpr uint64_t ALL_FAILED_BACKOFF_MS = 5'000;
constexpr std::array<const char*, 3> VENUE_PRIORITY = {"bybit", "binance", "okx"};
constexpr const char* POLLING_VENUE = "binance";
} // namespace multiplexer

// =============================================================================
// Trade Tracking Engine
// =============================================================================
namespace tracker {
constexpr uint64_t TICK_PROCESS_INTERVAL_MS = 2'000;
constexpr uint64_t COMMIT_INTERVAL_MS = 5'000;
constexpr uint64_t TIMEOUT_CHECK_INTERVAL_MS = 60'000;
constexpr double TRADE_TIMEOUT_HOURS = 24.0;
} // namespace tracker

// =============================================================================
// Exit evaluators
// =============================================================================
namespace exits {
constexpr double EARLY_TIME_THRESHOLD_MIN = 5.0;
constexpr double EARLY_PROFIT_THRESHOLD_PCT = 0.5;

constexpr double TRAIL_BASE_DISTANCE_PCT = 2.0;
constexpr double TRAIL_PRE_TP1_MULT = 1.5;  // wide before TP1
constexpr double TRAIL_TP1_TP2_MULT = 1.0;  // normal between TP1 and TP2
constexpr double TRAIL_POST_TP2_MULT = 0.7; // tight after TP2
constexpr double DEFAULT_VOLATILITY_MULT = 1.0;
} // namespace exits

// =============================================================================
// Circuit Breaker
// =============================================================================
namespace breaker {
constexpr size_t LOOKBACK_TRADES = 20;
constexpr size_t MIN_TRADES = 10;
constexpr size_t RECOVERY_LOOKBACK_TRADES = 10;
constexpr uint64_t ALERT_RETENTION_HOURS = 24;

// Profile classification
constexpr double HIGH_WR_MIN_WIN_RATE = 65.0;
constexpr double MODERATE_WR_MIN_WIN_RATE = 50.0;
constexpr double LOW_WR_MIN_RISK_REWARD = 2.0;

// Position sizing
constexpr double RECOVERY_SIZE_MULT = 0.25;
constexpr double KELLY_CAP = 0.25;
} // namespace breaker

} // namespace tickguard::config
