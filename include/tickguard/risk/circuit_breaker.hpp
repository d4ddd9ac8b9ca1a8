#pragma once

/**
 * CircuitBreaker - adaptive per-asset trading gate.
 *
 * One AssetHealthRecord per (symbol, direction, signal source). After every
 * completed trade the last 20 completed trades for the key are scored and
 * the record moves through:
 *
 *   active -> paused -> recovery -> active
 *                  \-> blacklisted (terminal until reset())
 *
 * Thresholds depend on the risk profile detected from the trades
 * (HIGH_WR assets are held to tighter limits). Pausing an asset that has
 * already been paused max_pause_count - 1 times blacklists it instead.
 *
 * Usage:
 *   CircuitBreaker breaker(store, config.circuit_breaker, logger);
 *   breaker.set_alert_callback([](const Alert& a) { ... });
 *   breaker.on_trade_completed(key, now);
 *   if (!breaker.is_trading_allowed(key, now)) reject_signal();
 *   double size = base_size * breaker.position_size_multiplier(key, now);
 */

#include "../config/engine_config.hpp"
#include "../logging/async_logger.hpp"
#include "../storage/trade_store.hpp"
#include "asset_health.hpp"

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tickguard {
namespace risk {

// =============================================================================
// Profile thresholds
// =============================================================================

struct ProfileThresholds {
    int consecutive_loss_limit;
    int losses_in_10_limit;
    double max_drawdown_pct;
    double min_win_rate_20;
    int pause_duration_days;
    int max_pause_count;
    int recovery_wins_required;
    double recovery_win_rate_10;
    double recovery_pnl_threshold;
    double position_size_multiplier;
    double rapid_loss_hourly;
    double rapid_loss_daily;
};

const ProfileThresholds& thresholds_for(RiskProfile profile);

/**
 * HIGH_WR: wr >= 65 and rr >= 1
 * MODERATE_WR: 50 <= wr < 65 and 1 <= rr <= 2
 * LOW_WR: wr < 50 and rr > 2
 * STANDARD otherwise
 */
RiskProfile classify_profile(double win_rate, double risk_reward);

// =============================================================================
// Alerts
// =============================================================================

enum class AlertSeverity : uint8_t { High = 0, Critical };

inline const char* alert_severity_to_string(AlertSeverity s) { return s == AlertSeverity::Critical ? "CRITICAL" : "HIGH"; }

struct Alert {
    AssetKey key;
    AssetStatus status = AssetStatus::Paused;
    AlertSeverity severity = AlertSeverity::High;
    RiskProfile profile = RiskProfile::Standard;
    std::string reason;
    Timestamp at = 0;
    HealthMetrics metrics;
};

using AlertCallback = std::function<void(const Alert&)>;

// =============================================================================
// Summary
// =============================================================================

struct AssetSummary {
    AssetHealthRecord record;
    double health_score = 100.0;
};

struct BreakerSummary {
    size_t active = 0;
    size_t paused = 0;
    size_t recovery = 0;
    size_t blacklisted = 0;
    std::vector<AssetSummary> assets; // most severe status first
    std::vector<Alert> recent_alerts;  // newest first
};

// =============================================================================
// CircuitBreaker
// =============================================================================

class CircuitBreaker {
public:
    CircuitBreaker(storage::ITradeStore& store, const config::BreakerSettings& settings, logging::AsyncLogger& logger);

    // Non-copyable
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * Re-score the key after a trade closed and apply any transition.
     * @throws storage::StoreError if the record cannot be read or saved
     */
    AssetHealthRecord on_trade_completed(const AssetKey& key, Timestamp now);

    /**
     * Current record, moving an elapsed pause into recovery first.
     * Unknown keys report active without creating a record.
     */
    AssetHealthRecord check_asset_status(const AssetKey& key, Timestamp now);

    bool is_trading_allowed(const AssetKey& key, Timestamp now);

    /**
     * Position size scaling in [0, 1]. Always 1 when enforcement is off.
     */
    double position_size_multiplier(const AssetKey& key, Timestamp now);

    /**
     * Manual review: return the key to active with a fresh window.
     */
    AssetHealthRecord reset(const AssetKey& key, Timestamp now);

    BreakerSummary summary(Timestamp now);
    std::vector<Alert> recent_alerts(Timestamp now);

    void set_alert_callback(AlertCallback cb) { alert_callback_ = std::move(cb); }

    // =========================================================================
    // Scoring (pure)
    // =========================================================================

    /**
     * @param trades completed trades, newest first
     */
    static HealthMetrics compute_metrics(const std::vector<trading::Trade>& trades, Timestamp now);

    static double breakeven_win_rate(double risk_reward);
    static double kelly_fraction(double win_rate, double risk_reward);
    static double health_score(const HealthMetrics& metrics);
    static double size_multiplier(const AssetHealthRecord& record);

    /**
     * First tripped condition for an active asset, in priority order.
     * @return target status and reason, or nullopt when healthy
     */
    static std::optional<std::pair<AssetStatus, std::string>> evaluate_conditions(const HealthMetrics& metrics,
                                                                                  RiskProfile profile);

private:
    storage::ITradeStore& store_;
    config::BreakerSettings settings_;
    logging::AsyncLogger& logger_;
    AlertCallback alert_callback_;

    std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> key_locks_;

    std::mutex alerts_mutex_;
    std::deque<Alert> alerts_;

    std::shared_ptr<std::mutex> key_lock(const AssetKey& key);
    AssetHealthRecord load_or_create(const AssetKey& key, Timestamp now) const;

    // paused -> recovery once the profile's pause duration has elapsed
    bool apply_pause_elapse(AssetHealthRecord& record, Timestamp now);
    void evaluate_recovery(AssetHealthRecord& record, Timestamp now);
    void pause(AssetHealthRecord& record, const std::string& reason, Timestamp now);
    void blacklist(AssetHealthRecord& record, const std::string& reason, Timestamp now);
    void raise_alert(const AssetHealthRecord& record, Timestamp now);
    void prune_alerts(Timestamp now);
};

} // namespace risk
} // namespace tickguard
