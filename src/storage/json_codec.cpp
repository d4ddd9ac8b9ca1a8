#include "../../include/tickguard/storage/json_codec.hpp"

#include <string>

namespace tickguard {

namespace {

template <typename T>
void put(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
void get(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
    } else {
        out = it->get<T>();
    }
}

template <typename T>
void get(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

std::string get_string(const json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return fallback;
    return it->get<std::string>();
}

} // namespace

namespace trading {

// =============================================================================
// Trade
// =============================================================================

void to_json(json& j, const Trade& t) {
    j = json::object();
    j["id"] = t.id;
    j["identifier"] = t.identifier;
    j["symbol"] = t.symbol;
    j["venue_symbol"] = t.venue_symbol;
    j["signal_source"] = t.signal_source;
    j["timeframe"] = t.timeframe;
    j["direction"] = direction_to_string(t.direction);
    put(j, "entry_price", t.entry_price);
    j["entry_time"] = t.entry_time;
    j["risk_strategy"] = risk_strategy_to_string(t.risk_strategy);

    json levels = json::array();
    for (const auto& level : t.tp) {
        json l = json::object();
        put(l, "price", level.price);
        put(l, "pct", level.pct);
        l["hit"] = level.hit;
        put(l, "hit_at", level.hit_at);
        put(l, "hit_price", level.hit_price);
        put(l, "time_minutes", level.time_minutes);
        put(l, "mae_pct", level.mae_pct);
        levels.push_back(l);
    }
    j["take_profit"] = levels;
    put(j, "planned_sl_price", t.planned_sl_price);
    put(j, "planned_sl_pct", t.planned_sl_pct);

    put(j, "trailing_activation_pct", t.trailing_activation_pct);
    put(j, "trailing_distance_pct", t.trailing_distance_pct);
    put(j, "trailing_high_water", t.trailing_high_water);
    j["trailing_triggered"] = t.trailing_triggered;
    put(j, "trailing_stop_pct", t.trailing_stop_pct);
    j["trailing_stop_updates"] = t.trailing_stop_updates;
    put(j, "volatility_multiplier", t.volatility_multiplier);
    j["momentum_state"] = momentum_state_to_string(t.momentum_state);

    put(j, "early_profit_time_threshold", t.early_profit_time_threshold);
    put(j, "early_profit_pct_threshold", t.early_profit_pct_threshold);
    j["early_momentum_detected"] = t.early_momentum_detected;
    put(j, "early_momentum_time", t.early_momentum_time);
    put(j, "early_momentum_pnl", t.early_momentum_pnl);
    j["low_quality_signal"] = t.low_quality_signal;
    j["sl_moved_to_be"] = t.sl_moved_to_be;
    put(j, "sl_move_timestamp", t.sl_move_timestamp);

    put(j, "max_favorable_excursion", t.max_favorable_excursion);
    put(j, "max_profit_pct", t.max_profit_pct);
    put(j, "max_drawdown_pct", t.max_drawdown_pct);

    j["sl_hit"] = t.sl_hit;
    put(j, "sl_hit_at", t.sl_hit_at);
    put(j, "sl_hit_price", t.sl_hit_price);
    put(j, "sl_time_minutes", t.sl_time_minutes);
    j["sl_type_hit"] = t.sl_type_hit;

    j["status"] = trade_status_to_string(t.status);
    put(j, "completed_at", t.completed_at);
    j["final_outcome"] = outcome_to_string(t.final_outcome);
    put(j, "final_pnl_pct", t.final_pnl_pct);
}

void from_json(const json& j, Trade& t) {
    t = Trade{};
    get(j, "id", t.id);
    t.identifier = get_string(j, "identifier");
    t.symbol = get_string(j, "symbol");
    t.venue_symbol = get_string(j, "venue_symbol");
    t.signal_source = get_string(j, "signal_source");
    t.timeframe = get_string(j, "timeframe");
    t.direction = string_to_direction(get_string(j, "direction", "LONG"));
    get(j, "entry_price", t.entry_price);
    get(j, "entry_time", t.entry_time);
    t.risk_strategy = string_to_risk_strategy(get_string(j, "risk_strategy", "static"));

    auto levels = j.find("take_profit");
    if (levels != j.end() && levels->is_array()) {
        for (size_t i = 0; i < Trade::TP_LEVELS && i < levels->size(); ++i) {
            const json& l = (*levels)[i];
            auto& level = t.tp[i];
            get(l, "price", level.price);
            get(l, "pct", level.pct);
            get(l, "hit", level.hit);
            get(l, "hit_at", level.hit_at);
            get(l, "hit_price", level.hit_price);
            get(l, "time_minutes", level.time_minutes);
            get(l, "mae_pct", level.mae_pct);
        }
    }
    get(j, "planned_sl_price", t.planned_sl_price);
    get(j, "planned_sl_pct", t.planned_sl_pct);

    get(j, "trailing_activation_pct", t.trailing_activation_pct);
    get(j, "trailing_distance_pct", t.trailing_distance_pct);
    get(j, "trailing_high_water", t.trailing_high_water);
    get(j, "trailing_triggered", t.trailing_triggered);
    get(j, "trailing_stop_pct", t.trailing_stop_pct);
    get(j, "trailing_stop_updates", t.trailing_stop_updates);
    get(j, "volatility_multiplier", t.volatility_multiplier);
    t.momentum_state = string_to_momentum_state(get_string(j, "momentum_state", "pre_tp1"));

    get(j, "early_profit_time_threshold", t.early_profit_time_threshold);
    get(j, "early_profit_pct_threshold", t.early_profit_pct_threshold);
    get(j, "early_momentum_detected", t.early_momentum_detected);
    get(j, "early_momentum_time", t.early_momentum_time);
    get(j, "early_momentum_pnl", t.early_momentum_pnl);
    get(j, "low_quality_signal", t.low_quality_signal);
    get(j, "sl_moved_to_be", t.sl_moved_to_be);
    get(j, "sl_move_timestamp", t.sl_move_timestamp);

    get(j, "max_favorable_excursion", t.max_favorable_excursion);
    get(j, "max_profit_pct", t.max_profit_pct);
    get(j, "max_drawdown_pct", t.max_drawdown_pct);

    get(j, "sl_hit", t.sl_hit);
    get(j, "sl_hit_at", t.sl_hit_at);
    get(j, "sl_hit_price", t.sl_hit_price);
    get(j, "sl_time_minutes", t.sl_time_minutes);
    t.sl_type_hit = get_string(j, "sl_type_hit");

    t.status = string_to_trade_status(get_string(j, "status", "active"));
    get(j, "completed_at", t.completed_at);
    t.final_outcome = string_to_outcome(get_string(j, "final_outcome"));
    get(j, "final_pnl_pct", t.final_pnl_pct);
}

// =============================================================================
// Milestones and samples
// =============================================================================

void to_json(json& j, const MilestoneRecord& m) {
    j = json::object();
    j["trade_id"] = m.trade_id;
    j["entry_price"] = m.entry_price;
    j["entry_at"] = m.entry_at;

    json profit = json::array();
    json drawdown = json::array();
    for (size_t i = 0; i < MILESTONE_COUNT; ++i) {
        profit.push_back(m.reached_profit[i] ? json(*m.reached_profit[i]) : json(nullptr));
        drawdown.push_back(m.reached_drawdown[i] ? json(*m.reached_drawdown[i]) : json(nullptr));
    }
    j["reached_profit"] = profit;
    j["reached_drawdown"] = drawdown;

    put(j, "max_profit_pct", m.max_profit_pct);
    put(j, "max_profit_at", m.max_profit_at);
    put(j, "max_drawdown_pct", m.max_drawdown_pct);
    put(j, "max_drawdown_at", m.max_drawdown_at);
    put(j, "exit_price", m.exit_price);
    put(j, "exit_at", m.exit_at);
    put(j, "final_pnl_pct", m.final_pnl_pct);
}

void from_json(const json& j, MilestoneRecord& m) {
    m = MilestoneRecord{};
    get(j, "trade_id", m.trade_id);
    get(j, "entry_price", m.entry_price);
    get(j, "entry_at", m.entry_at);

    auto read_slots = [&](const char* key, std::array<std::optional<Timestamp>, MILESTONE_COUNT>& slots) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_array())
            return;
        for (size_t i = 0; i < MILESTONE_COUNT && i < it->size(); ++i) {
            const json& v = (*it)[i];
            if (!v.is_null())
                slots[i] = v.get<Timestamp>();
        }
    };
    read_slots("reached_profit", m.reached_profit);
    read_slots("reached_drawdown", m.reached_drawdown);

    get(j, "max_profit_pct", m.max_profit_pct);
    get(j, "max_profit_at", m.max_profit_at);
    get(j, "max_drawdown_pct", m.max_drawdown_pct);
    get(j, "max_drawdown_at", m.max_drawdown_at);
    get(j, "exit_price", m.exit_price);
    get(j, "exit_at", m.exit_at);
    get(j, "final_pnl_pct", m.final_pnl_pct);
}

void to_json(json& j, const PriceSample& s) {
    j = json::object();
    j["trade_id"] = s.trade_id;
    j["timestamp"] = s.timestamp;
    j["price"] = s.price;
    j["pnl_pct"] = s.pnl_pct;
    put(j, "max_profit_so_far", s.max_profit_so_far);
    put(j, "max_drawdown_so_far", s.max_drawdown_so_far);
}

void from_json(const json& j, PriceSample& s) {
    s = PriceSample{};
    get(j, "trade_id", s.trade_id);
    get(j, "timestamp", s.timestamp);
    get(j, "price", s.price);
    get(j, "pnl_pct", s.pnl_pct);
    get(j, "max_profit_so_far", s.max_profit_so_far);
    get(j, "max_drawdown_so_far", s.max_drawdown_so_far);
}

} // namespace trading

namespace risk {

// =============================================================================
// Asset health
// =============================================================================

void to_json(json& j, const AssetKey& k) {
    j = json{{"symbol", k.symbol}, {"direction", direction_to_string(k.direction)}, {"source", k.source}};
}

void from_json(const json& j, AssetKey& k) {
    k.symbol = get_string(j, "symbol");
    k.direction = string_to_direction(get_string(j, "direction", "LONG"));
    k.source = get_string(j, "source");
}

void to_json(json& j, const HealthMetrics& m) {
    j = json::object();
    j["total_trades"] = m.total_trades;
    j["win_rate"] = m.win_rate;
    j["cumulative_pnl_5"] = m.cumulative_pnl_5;
    j["cumulative_pnl_10"] = m.cumulative_pnl_10;
    j["cumulative_pnl_20"] = m.cumulative_pnl_20;
    j["losses_in_10"] = m.losses_in_10;
    j["consecutive_losses"] = m.consecutive_losses;
    j["consecutive_wins"] = m.consecutive_wins;
    j["risk_reward"] = m.risk_reward;
    j["hourly_pnl"] = m.hourly_pnl;
    j["daily_pnl"] = m.daily_pnl;
    j["max_drawdown"] = m.max_drawdown;
    j["expected_win_rate"] = m.expected_win_rate;
    j["breakeven_win_rate"] = m.breakeven_win_rate;
    j["kelly_fraction"] = m.kelly_fraction;
}

void from_json(const json& j, HealthMetrics& m) {
    m = HealthMetrics{};
    get(j, "total_trades", m.total_trades);
    get(j, "win_rate", m.win_rate);
    get(j, "cumulative_pnl_5", m.cumulative_pnl_5);
    get(j, "cumulative_pnl_10", m.cumulative_pnl_10);
    get(j, "cumulative_pnl_20", m.cumulative_pnl_20);
    get(j, "losses_in_10", m.losses_in_10);
    get(j, "consecutive_losses", m.consecutive_losses);
    get(j, "consecutive_wins", m.consecutive_wins);
    get(j, "risk_reward", m.risk_reward);
    get(j, "hourly_pnl", m.hourly_pnl);
    get(j, "daily_pnl", m.daily_pnl);
    get(j, "max_drawdown", m.max_drawdown);
    get(j, "expected_win_rate", m.expected_win_rate);
    get(j, "breakeven_win_rate", m.breakeven_win_rate);
    get(j, "kelly_fraction", m.kelly_fraction);
}

void to_json(json& j, const AssetHealthRecord& r) {
    j = json::object();
    j["key"] = r.key;
    j["status"] = asset_status_to_string(r.status);
    j["reason"] = r.reason;
    j["profile"] = risk_profile_to_string(r.profile);
    j["pause_count"] = r.pause_count;
    put(j, "paused_at", r.paused_at);
    put(j, "recovery_started_at", r.recovery_started_at);
    put(j, "window_start", r.window_start);
    j["updated_at"] = r.updated_at;
    j["metrics"] = r.metrics;
}

void from_json(const json& j, AssetHealthRecord& r) {
    r = AssetHealthRecord{};
    if (j.contains("key"))
        r.key = j.at("key").get<AssetKey>();
    r.status = string_to_asset_status(get_string(j, "status", "active"));
    r.reason = get_string(j, "reason");
    r.profile = string_to_risk_profile(get_string(j, "profile", "STANDARD"));
    get(j, "pause_count", r.pause_count);
    get(j, "paused_at", r.paused_at);
    get(j, "recovery_started_at", r.recovery_started_at);
    get(j, "window_start", r.window_start);
    get(j, "updated_at", r.updated_at);
    if (j.contains("metrics"))
        r.metrics = j.at("metrics").get<HealthMetrics>();
}

} // namespace risk

} // namespace tickguard
