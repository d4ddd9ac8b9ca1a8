#pragma once

/**
 * Engine configuration
 *
 * Loaded from a JSON file; every key is optional and falls back to the
 * values in defaults.hpp. Unknown keys are ignored.
 *
 * Format:
 * {
 *   "venues":          { "priority": ["bybit", "binance", "okx"], "polling_venue": "binance" },
 *   "multiplexer":     { "health_check_interval_ms": 10000, "stale_timeout_ms": 30000, ... },
 *   "tracker":         { "tick_process_interval_ms": 2000, "commit_interval_ms": 5000, ... },
 *   "exits":           { "early_time_threshold_min": 5.0, "trail_base_distance_pct": 2.0, ... },
 *   "circuit_breaker": { "enforce": true, "lookback_trades": 20, "min_trades": 10 },
 *   "logging":         { "level": "info" },
 *   "store":           { "path": "tickguard_state.json" }
 * }
 */

#include "defaults.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace tickguard {
namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct VenueSettings {
    std::vector<std::string> priority{multiplexer::VENUE_PRIORITY.begin(), multiplexer::VENUE_PRIORITY.end()};
    std::string polling_venue = multiplexer::POLLING_VENUE;
    bool use_testnet = false;
};

struct MultiplexerSettings {
    uint64_t health_check_interval_ms = multiplexer::HEALTH_CHECK_INTERVAL_MS;
    uint64_t stale_timeout_ms = multiplexer::STALE_TIMEOUT_MS;
    uint64_t poll_interval_ms = multiplexer::POLL_INTERVAL_MS;
    uint64_t poll_error_backoff_ms = multiplexer::POLL_ERROR_BACKOFF_MS;
    uint64_t streaming_retry_ms = multiplexer::STREAMING_RETRY_MS;
    uint64_t all_failed_backoff_ms = multiplexer::ALL_FAILED_BACKOFF_MS;
};

struct TrackerSettings {
    uint64_t tick_process_interval_ms = tracker::TICK_PROCESS_INTERVAL_MS;
    uint64_t commit_interval_ms = tracker::COMMIT_INTERVAL_MS;
    uint64_t timeout_check_interval_ms = tracker::TIMEOUT_CHECK_INTERVAL_MS;
    double trade_timeout_hours = tracker::TRADE_TIMEOUT_HOURS;
};

struct ExitSettings {
    double early_time_threshold_min = exits::EARLY_TIME_THRESHOLD_MIN;
    double early_profit_threshold_pct = exits::EARLY_PROFIT_THRESHOLD_PCT;
    double trail_base_distance_pct = exits::TRAIL_BASE_DISTANCE_PCT;
    double trail_pre_tp1_mult = exits::TRAIL_PRE_TP1_MULT;
    double trail_tp1_tp2_mult = exits::TRAIL_TP1_TP2_MULT;
    double trail_post_tp2_mult = exits::TRAIL_POST_TP2_MULT;
    double default_volatility_mult = exits::DEFAULT_VOLATILITY_MULT;
};

struct BreakerSettings {
    bool enforce = true; // false: record metrics only, never pause
    size_t lookback_trades = breaker::LOOKBACK_TRADES;
    size_t min_trades = breaker::MIN_TRADES;
};

struct LoggingSettings {
    std::string level = "info";
};

struct StoreSettings {
    std::string path = "tickguard_state.json";
};

struct EngineConfig {
    VenueSettings venues;
    MultiplexerSettings multiplexer;
    TrackerSettings tracker;
    ExitSettings exits;
    BreakerSettings circuit_breaker;
    LoggingSettings logging;
    StoreSettings store;
};

class ConfigParser {
public:
    /**
     * @throws ConfigError if the file cannot be opened or parsed
     */
    static EngineConfig load(const std::string& filename);

    /**
     * @throws ConfigError on malformed JSON or wrongly typed values
     */
    static EngineConfig parse(const std::string& text);

    static std::string dump(const EngineConfig& config);

    /**
     * @throws ConfigError if the file cannot be written
     */
    static void save(const std::string& filename, const EngineConfig& config);
};

} // namespace config
} // namespace tickguard
