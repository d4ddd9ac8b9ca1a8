#include "../../include/tickguard/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace tickguard::config {

using json = nlohmann::json;

namespace {

template <typename T>
void read(const json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

const json& section(const json& doc, const char* name) {
    static const json empty = json::object();
    auto it = doc.find(name);
    if (it == doc.end() || !it->is_object())
        return empty;
    return *it;
}

} // namespace

EngineConfig ConfigParser::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

EngineConfig ConfigParser::parse(const std::string& text) {
    EngineConfig config;

    try {
        json doc = json::parse(text);
        if (!doc.is_object()) {
            throw ConfigError("Config root must be an object");
        }

        const json& venues = section(doc, "venues");
        read(venues, "priority", config.venues.priority);
        read(venues, "polling_venue", config.venues.polling_venue);
        read(venues, "use_testnet", config.venues.use_testnet);

        const json& mux = section(doc, "multiplexer");
        read(mux, "health_check_interval_ms", config.multiplexer.health_check_interval_ms);
        read(mux, "stale_timeout_ms", config.multiplexer.stale_timeout_ms);
        read(mux, "poll_interval_ms", config.multiplexer.poll_interval_ms);
        read(mux, "poll_error_backoff_ms", config.multiplexer.poll_error_backoff_ms);
        read(mux, "streaming_retry_ms", config.multiplexer.streaming_retry_ms);
        read(mux, "all_failed_backoff_ms", config.multiplexer.all_failed_backoff_ms);

        const json& tracker = section(doc, "tracker");
        read(tracker, "tick_process_interval_ms", config.tracker.tick_process_interval_ms);
        read(tracker, "commit_interval_ms", config.tracker.commit_interval_ms);
        read(tracker, "timeout_check_interval_ms", config.tracker.timeout_check_interval_ms);
        read(tracker, "trade_timeout_hours", config.tracker.trade_timeout_hours);

        const json& exits = section(doc, "exits");
        read(exits, "early_time_threshold_min", config.exits.early_time_threshold_min);
        read(exits, "early_profit_threshold_pct", config.exits.early_profit_threshold_pct);
        read(exits, "trail_base_distance_pct", config.exits.trail_base_distance_pct);
        read(exits, "trail_pre_tp1_mult", config.exits.trail_pre_tp1_mult);
        read(exits, "trail_tp1_tp2_mult", config.exits.trail_tp1_tp2_mult);
        read(exits, "trail_post_tp2_mult", config.exits.trail_post_tp2_mult);
        read(exits, "default_volatility_mult", config.exits.default_volatility_mult);

        const json& breaker = section(doc, "circuit_breaker");
        read(breaker, "enforce", config.circuit_breaker.enforce);
        read(breaker, "lookback_trades", config.circuit_breaker.lookback_trades);
        read(breaker, "min_trades", config.circuit_breaker.min_trades);

        read(section(doc, "logging"), "level", config.logging.level);
        read(section(doc, "store"), "path", config.store.path);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }

    if (config.venues.priority.empty()) {
        throw ConfigError("venues.priority must name at least one venue");
    }
    if (config.circuit_breaker.min_trades > config.circuit_breaker.lookback_trades) {
        throw ConfigError("circuit_breaker.min_trades cannot exceed lookback_trades");
    }

    return config;
}

std::string ConfigParser::dump(const EngineConfig& config) {
    json doc;
    doc["venues"] = {{"priority", config.venues.priority},
                     {"polling_venue", config.venues.polling_venue},
                     {"use_testnet", config.venues.use_testnet}};
    doc["multiplexer"] = {{"health_check_interval_ms", config.multiplexer.health_check_interval_ms},
                          {"stale_timeout_ms", config.multiplexer.stale_timeout_ms},
                          {"poll_interval_ms", config.multiplexer.poll_interval_ms},
                          {"poll_error_backoff_ms", config.multiplexer.poll_error_backoff_ms},
                          {"streaming_retry_ms", config.multiplexer.streaming_retry_ms},
                          {"all_failed_backoff_ms", config.multiplexer.all_failed_backoff_ms}};
    doc["tracker"] = {{"tick_process_interval_ms", config.tracker.tick_process_interval_ms},
                      {"commit_interval_ms", config.tracker.commit_interval_ms},
                      {"timeout_check_interval_ms", config.tracker.timeout_check_interval_ms},
                      {"trade_timeout_hours", config.tracker.trade_timeout_hours}};
    doc["exits"] = {{"early_time_threshold_min", config.exits.early_time_threshold_min},
                    {"early_profit_threshold_pct", config.exits.early_profit_threshold_pct},
                    {"trail_base_distance_pct", config.exits.trail_base_distance_pct},
                    {"trail_pre_tp1_mult", config.exits.trail_pre_tp1_mult},
                    {"trail_tp1_tp2_mult", config.exits.trail_tp1_tp2_mult},
                    {"trail_post_tp2_mult", config.exits.trail_post_tp2_mult},
                    {"default_volatility_mult", config.exits.default_volatility_mult}};
    doc["circuit_breaker"] = {{"enforce", config.circuit_breaker.enforce},
                              {"lookback_trades", config.circuit_breaker.lookback_trades},
                              {"min_trades", config.circuit_breaker.min_trades}};
    doc["logging"] = {{"level", config.logging.level}};
    doc["store"] = {{"path", config.store.path}};
    return doc.dump(2);
}

void ConfigParser::save(const std::string& filename, const EngineConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw ConfigError("Cannot create config file: " + filename);
    }
    file << dump(config) << "\n";
}

} // namespace tickguard::config
