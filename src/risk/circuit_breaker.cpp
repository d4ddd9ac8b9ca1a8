#include "../../include/tickguard/risk/circuit_breaker.hpp"

#include <algorithm>
#include <cstdio>

namespace tickguard::risk {

namespace {

// clang-format off
constexpr ProfileThresholds STANDARD_THRESHOLDS    = {5, 7, -5.0, 40.0, 7, 3, 2, 50.0, 1.0, 1.0,  -3.0, -5.0};
constexpr ProfileThresholds HIGH_WR_THRESHOLDS     = {3, 5, -3.0, 55.0, 3, 2, 3, 60.0, 2.0, 0.75, -1.5, -3.0};
constexpr ProfileThresholds MODERATE_WR_THRESHOLDS = {4, 6, -4.0, 45.0, 5, 3, 2, 55.0, 1.5, 0.9,  -2.0, -4.0};
// clang-format on

template <typename... Args>
std::string format(const char* fmt, Args... args) {
    char buf[256];
    std::snprintf(buf, sizeof(buf), fmt, args...);
    return buf;
}

double pnl_of(const trading::Trade& t) { return t.final_pnl_pct.value_or(0.0); }

} // namespace

const ProfileThresholds& thresholds_for(RiskProfile profile) {
    switch (profile) {
    case RiskProfile::HighWinRate:
        return HIGH_WR_THRESHOLDS;
    case RiskProfile::ModerateWinRate:
        return MODERATE_WR_THRESHOLDS;
    case RiskProfile::LowWinRate: // low-WR assets are held to standard limits
    case RiskProfile::Standard:
    default:
        return STANDARD_THRESHOLDS;
    }
}

RiskProfile classify_profile(double win_rate, double risk_reward) {
    if (win_rate >= config::breaker::HIGH_WR_MIN_WIN_RATE && risk_reward >= 1.0)
        return RiskProfile::HighWinRate;
    if (win_rate >= config::breaker::MODERATE_WR_MIN_WIN_RATE && win_rate < config::breaker::HIGH_WR_MIN_WIN_RATE &&
        risk_reward >= 1.0 && risk_reward <= 2.0)
        return RiskProfile::ModerateWinRate;
    if (win_rate < config::breaker::MODERATE_WR_MIN_WIN_RATE && risk_reward > config::breaker::LOW_WR_MIN_RISK_REWARD)
        return RiskProfile::LowWinRate;
    return RiskProfile::Standard;
}

CircuitBreaker::CircuitBreaker(storage::ITradeStore& store, const config::BreakerSettings& settings,
                               logging::AsyncLogger& logger)
    : store_(store), settings_(settings), logger_(logger) {}

// =============================================================================
// Scoring
// =============================================================================

double CircuitBreaker::breakeven_win_rate(double risk_reward) {
    if (risk_reward <= 0)
        return 100.0;
    return 100.0 / (1.0 + risk_reward);
}

double CircuitBreaker::kelly_fraction(double win_rate, double risk_reward) {
    double p = win_rate / 100.0;
    double q = 1.0 - p;
    double b = risk_reward;
    if (b <= 0)
        return 0.0;

    // Quarter Kelly, capped
    double kelly = (p * b - q) / b;
    return std::clamp(kelly * 0.25, 0.0, config::breaker::KELLY_CAP);
}

HealthMetrics CircuitBreaker::compute_metrics(const std::vector<trading::Trade>& trades, Timestamp now) {
    HealthMetrics m;
    m.total_trades = static_cast<int>(trades.size());
    if (trades.empty())
        return m;

    size_t n = trades.size();
    double sum_wins = 0, sum_losses = 0;
    int win_count = 0, loss_count = 0;

    for (size_t i = 0; i < n; ++i) {
        double pnl = pnl_of(trades[i]);
        if (pnl > 0) {
            sum_wins += pnl;
            ++win_count;
        } else if (pnl < 0) {
            sum_losses += -pnl;
            ++loss_count;
        }

        m.cumulative_pnl_20 += pnl;
        if (i < 5)
            m.cumulative_pnl_5 += pnl;
        if (i < 10) {
            m.cumulative_pnl_10 += pnl;
            if (pnl <= 0)
                ++m.losses_in_10;
        }

        if (trades[i].completed_at) {
            Timestamp done = *trades[i].completed_at;
            if (done + NS_PER_HOUR > now)
                m.hourly_pnl += pnl;
            if (done + NS_PER_DAY > now)
                m.daily_pnl += pnl;
        }
    }

    // Partial windows do not count
    if (n < 5)
        m.cumulative_pnl_5 = 0;
    if (n < 10) {
        m.cumulative_pnl_10 = 0;
        m.losses_in_10 = 0;
    }

    m.win_rate = static_cast<double>(win_count) / static_cast<double>(n) * 100.0;

    for (const auto& t : trades) {
        if (pnl_of(t) > 0)
            break;
        ++m.consecutive_losses;
    }
    for (const auto& t : trades) {
        if (pnl_of(t) <= 0)
            break;
        ++m.consecutive_wins;
    }

    if (win_count > 0 && loss_count > 0) {
        double avg_win = sum_wins / win_count;
        double avg_loss = sum_losses / loss_count;
        m.risk_reward = avg_loss > 0 ? avg_win / avg_loss : 1.0;
    } else {
        m.risk_reward = 1.0;
    }

    // Chronological walk, peak starts at zero
    double cumulative = 0, peak = 0;
    for (auto it = trades.rbegin(); it != trades.rend(); ++it) {
        cumulative += pnl_of(*it);
        peak = std::max(peak, cumulative);
        m.max_drawdown = std::min(m.max_drawdown, cumulative - peak);
    }

    m.expected_win_rate = m.risk_reward > 1.0 ? 70.0 : 50.0;
    m.breakeven_win_rate = breakeven_win_rate(m.risk_reward);
    m.kelly_fraction = kelly_fraction(m.win_rate, m.risk_reward);
    return m;
}

std::optional<std::pair<AssetStatus, std::string>> CircuitBreaker::evaluate_conditions(const HealthMetrics& m,
                                                                                       RiskProfile profile) {
    const ProfileThresholds& th = thresholds_for(profile);
    const char* profile_name = risk_profile_to_string(profile);

    if (m.consecutive_losses >= th.consecutive_loss_limit) {
        return std::make_pair(AssetStatus::Paused, format("Consecutive losses: %d (limit: %d for %s)",
                                                          m.consecutive_losses, th.consecutive_loss_limit, profile_name));
    }

    if (profile == RiskProfile::HighWinRate && m.total_trades >= 10 && m.losses_in_10 >= th.losses_in_10_limit) {
        return std::make_pair(AssetStatus::Blacklisted, format("HIGH-WR FAILURE: %d losses in 10 trades (limit: %d)",
                                                               m.losses_in_10, th.losses_in_10_limit));
    }

    if (m.max_drawdown < th.max_drawdown_pct) {
        return std::make_pair(AssetStatus::Paused,
                              format("Max drawdown: %.2f%% (limit: %.1f%%)", m.max_drawdown, th.max_drawdown_pct));
    }

    if (m.total_trades >= 10 && m.cumulative_pnl_10 < th.max_drawdown_pct) {
        return std::make_pair(AssetStatus::Paused, format("10-trade P&L: %.2f%% (limit: %.1f%%)", m.cumulative_pnl_10,
                                                          th.max_drawdown_pct));
    }

    if (m.total_trades >= 20 && m.win_rate < th.min_win_rate_20) {
        if (profile == RiskProfile::HighWinRate) {
            return std::make_pair(AssetStatus::Paused,
                                  format("WIN RATE DEGRADATION: %.1f%% (minimum: %.1f%%) - Strategy regeneration needed",
                                         m.win_rate, th.min_win_rate_20));
        }
        return std::make_pair(AssetStatus::Paused, format("Low win rate: %.1f%% over 20 trades (minimum: %.1f%%)",
                                                          m.win_rate, th.min_win_rate_20));
    }

    if (m.hourly_pnl < th.rapid_loss_hourly) {
        return std::make_pair(AssetStatus::Paused,
                              format("Rapid hourly loss: %.2f%% (limit: %.1f%%)", m.hourly_pnl, th.rapid_loss_hourly));
    }

    if (m.daily_pnl < th.rapid_loss_daily) {
        return std::make_pair(AssetStatus::Paused,
                              format("Daily loss: %.2f%% (limit: %.1f%%)", m.daily_pnl, th.rapid_loss_daily));
    }

    return std::nullopt;
}

double CircuitBreaker::health_score(const HealthMetrics& m) {
    double score = 100.0;

    if (m.expected_win_rate > 0) {
        double deviation = (m.win_rate - m.expected_win_rate) / m.expected_win_rate * 100.0;
        if (deviation < -20)
            score -= 40;
        else if (deviation < -10)
            score -= 30;
        else if (deviation < -5)
            score -= 20;
        else if (deviation < 0)
            score -= 10;
    }

    if (m.cumulative_pnl_20 < -15)
        score -= 40;
    else if (m.cumulative_pnl_20 < -10)
        score -= 30;
    else if (m.cumulative_pnl_20 < -5)
        score -= 20;
    else if (m.cumulative_pnl_20 < 0)
        score -= 10;

    if (m.consecutive_losses >= 5)
        score -= 20;
    else if (m.consecutive_losses >= 4)
        score -= 15;
    else if (m.consecutive_losses >= 3)
        score -= 10;
    else if (m.consecutive_losses >= 2)
        score -= 5;

    return std::clamp(score, 0.0, 100.0);
}

double CircuitBreaker::size_multiplier(const AssetHealthRecord& record) {
    const ProfileThresholds& th = thresholds_for(record.profile);
    const HealthMetrics& m = record.metrics;

    double multiplier = th.position_size_multiplier;

    switch (record.status) {
    case AssetStatus::Paused:
    case AssetStatus::Blacklisted:
        return 0.0;
    case AssetStatus::Recovery:
        multiplier *= config::breaker::RECOVERY_SIZE_MULT;
        break;
    default:
        break;
    }

    if (m.consecutive_losses >= 2)
        multiplier *= 0.5;
    else if (m.consecutive_losses >= 1)
        multiplier *= 0.75;

    if (m.cumulative_pnl_10 < -2.0)
        multiplier *= 0.7;

    if (record.profile == RiskProfile::HighWinRate) {
        if (m.win_rate < m.expected_win_rate - 10)
            multiplier *= 0.5;
        else if (m.win_rate < m.expected_win_rate - 5)
            multiplier *= 0.75;
    }

    // Half of the (already quartered) Kelly suggestion
    if (m.kelly_fraction > 0)
        multiplier *= 1.0 + m.kelly_fraction * 0.5;

    return std::clamp(multiplier, 0.0, 1.0);
}

// =============================================================================
// State machine
// =============================================================================

std::shared_ptr<std::mutex> CircuitBreaker::key_lock(const AssetKey& key) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = key_locks_[key.to_string()];
    if (!slot)
        slot = std::make_shared<std::mutex>();
    return slot;
}

AssetHealthRecord CircuitBreaker::load_or_create(const AssetKey& key, Timestamp now) const {
    if (auto existing = store_.find_asset_health(key))
        return *existing;

    AssetHealthRecord record;
    record.key = key;
    record.updated_at = now;
    return record;
}

bool CircuitBreaker::apply_pause_elapse(AssetHealthRecord& record, Timestamp now) {
    if (record.status != AssetStatus::Paused || !record.paused_at)
        return false;

    const ProfileThresholds& th = thresholds_for(record.profile);
    Timestamp duration = static_cast<Timestamp>(th.pause_duration_days) * NS_PER_DAY;
    if (now < *record.paused_at + duration)
        return false;

    record.status = AssetStatus::Recovery;
    record.recovery_started_at = now;
    record.reason = format("Pause elapsed after %d days, entering recovery", th.pause_duration_days);
    record.updated_at = now;
    return true;
}

AssetHealthRecord CircuitBreaker::on_trade_completed(const AssetKey& key, Timestamp now) {
    auto guard = key_lock(key);
    std::lock_guard<std::mutex> lock(*guard);

    AssetHealthRecord record = load_or_create(key, now);
    if (apply_pause_elapse(record, now)) {
        TICKGUARD_LOGF(logger_, Info, Risk, "%s: %s", key.to_string().c_str(), record.reason.c_str());
    }

    auto trades = store_.recent_completed_trades(key, settings_.lookback_trades, record.window_start.value_or(0));
    record.metrics = compute_metrics(trades, now);
    if (record.metrics.total_trades >= static_cast<int>(settings_.min_trades)) {
        record.profile = classify_profile(record.metrics.win_rate, record.metrics.risk_reward);
    }
    record.updated_at = now;

    if (settings_.enforce) {
        switch (record.status) {
        case AssetStatus::Active:
            if (record.metrics.total_trades >= static_cast<int>(settings_.min_trades)) {
                if (auto tripped = evaluate_conditions(record.metrics, record.profile)) {
                    if (tripped->first == AssetStatus::Blacklisted) {
                        blacklist(record, tripped->second, now);
                    } else {
                        pause(record, tripped->second, now);
                    }
                }
            }
            break;
        case AssetStatus::Recovery:
            evaluate_recovery(record, now);
            break;
        default:
            // Paused waits out its duration; blacklist is terminal
            break;
        }
    }

    store_.save_asset_health(record);

    TICKGUARD_LOGF(logger_, Info, Risk, "Circuit breaker check %s | %s | %s | WR %.1f%% | losses %d | P&L(20) %.2f%%",
                   key.to_string().c_str(), asset_status_to_string(record.status),
                   risk_profile_to_string(record.profile), record.metrics.win_rate, record.metrics.consecutive_losses,
                   record.metrics.cumulative_pnl_20);
    return record;
}

void CircuitBreaker::evaluate_recovery(AssetHealthRecord& record, Timestamp now) {
    const ProfileThresholds& th = thresholds_for(record.profile);
    Timestamp since = record.recovery_started_at.value_or(now);

    auto trades = store_.recent_completed_trades(record.key, config::breaker::RECOVERY_LOOKBACK_TRADES, since);
    if (trades.empty()) {
        record.reason = "In recovery: no trades completed yet";
        return;
    }

    HealthMetrics rm = compute_metrics(trades, now);
    double recovery_pnl = 0;
    for (const auto& t : trades)
        recovery_pnl += pnl_of(t);

    if (rm.consecutive_losses >= th.consecutive_loss_limit) {
        pause(record,
              format("Recovery failed: %d consecutive losses (limit: %d)", rm.consecutive_losses,
                     th.consecutive_loss_limit),
              now);
        return;
    }

    std::string recovered;
    if (rm.consecutive_wins >= th.recovery_wins_required) {
        recovered = format("%d consecutive wins", rm.consecutive_wins);
    } else if (trades.size() >= config::breaker::RECOVERY_LOOKBACK_TRADES && rm.win_rate >= th.recovery_win_rate_10) {
        recovered = format("%.1f%% win rate over 10 trades", rm.win_rate);
    } else if (recovery_pnl >= th.recovery_pnl_threshold) {
        recovered = format("%+.2f%% P&L", recovery_pnl);
    }

    if (recovered.empty()) {
        record.reason = format("In recovery: %d/%d wins, P&L: %.2f%%/%.1f%%", rm.consecutive_wins,
                               th.recovery_wins_required, recovery_pnl, th.recovery_pnl_threshold);
        return;
    }

    record.status = AssetStatus::Active;
    record.reason = "Recovered: " + recovered;
    record.paused_at.reset();
    record.recovery_started_at.reset();
    // Pre-pause losses no longer count against the asset
    record.window_start = now;
    TICKGUARD_LOGF(logger_, Info, Risk, "Recovery complete for %s: %s", record.key.to_string().c_str(),
                   recovered.c_str());
}

void CircuitBreaker::pause(AssetHealthRecord& record, const std::string& reason, Timestamp now) {
    const ProfileThresholds& th = thresholds_for(record.profile);
    int new_count = record.pause_count + 1;

    if (new_count >= th.max_pause_count) {
        blacklist(record, format("Exceeded max pause count (%d): %s", th.max_pause_count, reason.c_str()), now);
        return;
    }

    record.status = AssetStatus::Paused;
    record.reason = reason;
    record.pause_count = new_count;
    record.paused_at = now;
    record.recovery_started_at.reset();

    TICKGUARD_LOGF(logger_, Warn, Risk, "PAUSING ASSET %s | Profile: %s | Pause #%d/%d | Reason: %s",
                   record.key.to_string().c_str(), risk_profile_to_string(record.profile), new_count,
                   th.max_pause_count, reason.c_str());
    raise_alert(record, now);
}

void CircuitBreaker::blacklist(AssetHealthRecord& record, const std::string& reason, Timestamp now) {
    record.status = AssetStatus::Blacklisted;
    record.reason = reason;
    record.paused_at = now;
    record.recovery_started_at.reset();

    TICKGUARD_LOGF(logger_, Error, Risk, "BLACKLISTING ASSET %s | Profile: %s | Reason: %s",
                   record.key.to_string().c_str(), risk_profile_to_string(record.profile), reason.c_str());
    raise_alert(record, now);
}

AssetHealthRecord CircuitBreaker::reset(const AssetKey& key, Timestamp now) {
    auto guard = key_lock(key);
    std::lock_guard<std::mutex> lock(*guard);

    AssetHealthRecord record = load_or_create(key, now);
    AssetStatus previous = record.status;

    record.status = AssetStatus::Active;
    record.reason = "Manual reset";
    record.pause_count = 0;
    record.paused_at.reset();
    record.recovery_started_at.reset();
    record.window_start = now;
    record.metrics = HealthMetrics{};
    record.updated_at = now;
    store_.save_asset_health(record);

    TICKGUARD_LOGF(logger_, Warn, Risk, "Manual reset of %s (was %s)", key.to_string().c_str(),
                   asset_status_to_string(previous));
    return record;
}

// =============================================================================
// Queries
// =============================================================================

AssetHealthRecord CircuitBreaker::check_asset_status(const AssetKey& key, Timestamp now) {
    auto guard = key_lock(key);
    std::lock_guard<std::mutex> lock(*guard);

    auto existing = store_.find_asset_health(key);
    if (!existing) {
        AssetHealthRecord record;
        record.key = key;
        record.updated_at = now;
        return record;
    }

    AssetHealthRecord record = *existing;
    if (apply_pause_elapse(record, now)) {
        store_.save_asset_health(record);
        TICKGUARD_LOGF(logger_, Info, Risk, "%s: %s", key.to_string().c_str(), record.reason.c_str());
    }
    return record;
}

bool CircuitBreaker::is_trading_allowed(const AssetKey& key, Timestamp now) {
    if (!settings_.enforce)
        return true;
    return check_asset_status(key, now).is_trading_allowed();
}

double CircuitBreaker::position_size_multiplier(const AssetKey& key, Timestamp now) {
    if (!settings_.enforce)
        return 1.0;
    return size_multiplier(check_asset_status(key, now));
}

// =============================================================================
// Alerts and summary
// =============================================================================

void CircuitBreaker::raise_alert(const AssetHealthRecord& record, Timestamp now) {
    Alert alert;
    alert.key = record.key;
    alert.status = record.status;
    alert.severity = record.status == AssetStatus::Blacklisted ? AlertSeverity::Critical : AlertSeverity::High;
    alert.profile = record.profile;
    alert.reason = record.reason;
    alert.at = now;
    alert.metrics = record.metrics;

    {
        std::lock_guard<std::mutex> lock(alerts_mutex_);
        alerts_.push_back(alert);
    }
    prune_alerts(now);

    if (alert_callback_) {
        try {
            alert_callback_(alert);
        } catch (const std::exception& e) {
            TICKGUARD_LOGF(logger_, Error, Risk, "Alert callback failed for %s: %s", record.key.to_string().c_str(),
                           e.what());
        }
    }
}

void CircuitBreaker::prune_alerts(Timestamp now) {
    Timestamp retention = config::breaker::ALERT_RETENTION_HOURS * NS_PER_HOUR;
    std::lock_guard<std::mutex> lock(alerts_mutex_);
    while (!alerts_.empty() && alerts_.front().at + retention < now) {
        alerts_.pop_front();
    }
}

std::vector<Alert> CircuitBreaker::recent_alerts(Timestamp now) {
    prune_alerts(now);
    std::lock_guard<std::mutex> lock(alerts_mutex_);
    return std::vector<Alert>(alerts_.rbegin(), alerts_.rend());
}

BreakerSummary CircuitBreaker::summary(Timestamp now) {
    BreakerSummary out;

    for (auto& record : store_.all_asset_health()) {
        apply_pause_elapse(record, now);

        switch (record.status) {
        case AssetStatus::Active:
            ++out.active;
            break;
        case AssetStatus::Paused:
            ++out.paused;
            break;
        case AssetStatus::Recovery:
            ++out.recovery;
            break;
        case AssetStatus::Blacklisted:
            ++out.blacklisted;
            break;
        }

        AssetSummary asset;
        asset.health_score = health_score(record.metrics);
        asset.record = std::move(record);
        out.assets.push_back(std::move(asset));
    }

    std::sort(out.assets.begin(), out.assets.end(), [](const AssetSummary& a, const AssetSummary& b) {
        int ra = asset_status_rank(a.record.status);
        int rb = asset_status_rank(b.record.status);
        if (ra != rb)
            return ra < rb;
        return a.record.key < b.record.key;
    });

    out.recent_alerts = recent_alerts(now);
    return out;
}

} // namespace tickguard::risk
