#include "../include/tickguard/config/engine_config.hpp"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <unistd.h>

using namespace tickguard;
using namespace tickguard::config;

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

bool parse_fails(const std::string& text) {
    try {
        ConfigParser::parse(text);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

} // namespace

TEST(empty_document_uses_defaults) {
    EngineConfig cfg = ConfigParser::parse("{}");

    ASSERT_EQ(cfg.venues.priority.size(), 3u);
    ASSERT_EQ(cfg.venues.priority[0], std::string("bybit"));
    ASSERT_EQ(cfg.venues.polling_venue, std::string("binance"));
    ASSERT_FALSE(cfg.venues.use_testnet);

    ASSERT_EQ(cfg.multiplexer.health_check_interval_ms, 10'000u);
    ASSERT_EQ(cfg.multiplexer.stale_timeout_ms, 30'000u);
    ASSERT_EQ(cfg.multiplexer.poll_interval_ms, 1'000u);
    ASSERT_EQ(cfg.multiplexer.poll_error_backoff_ms, 5'000u);

    ASSERT_EQ(cfg.tracker.tick_process_interval_ms, 2'000u);
    ASSERT_EQ(cfg.tracker.commit_interval_ms, 5'000u);
    ASSERT_EQ(cfg.tracker.timeout_check_interval_ms, 60'000u);
    ASSERT_DOUBLE_NEAR(cfg.tracker.trade_timeout_hours, 24.0, 1e-12);

    ASSERT_DOUBLE_NEAR(cfg.exits.early_time_threshold_min, 5.0, 1e-12);
    ASSERT_DOUBLE_NEAR(cfg.exits.early_profit_threshold_pct, 0.5, 1e-12);
    ASSERT_DOUBLE_NEAR(cfg.exits.trail_base_distance_pct, 2.0, 1e-12);

    ASSERT_TRUE(cfg.circuit_breaker.enforce);
    ASSERT_EQ(cfg.circuit_breaker.lookback_trades, 20u);
    ASSERT_EQ(cfg.circuit_breaker.min_trades, 10u);
    ASSERT_EQ(cfg.logging.level, std::string("info"));
}

TEST(sections_override_individual_keys) {
    EngineConfig cfg = ConfigParser::parse(R"({
        "venues": { "priority": ["okx", "bybit"], "polling_venue": "okx", "use_testnet": true },
        "tracker": { "commit_interval_ms": 1000, "trade_timeout_hours": 12.5 },
        "exits": { "trail_post_tp2_mult": 0.5 },
        "circuit_breaker": { "enforce": false },
        "logging": { "level": "debug" },
        "store": { "path": "/var/lib/tickguard/state.json" },
        "unknown_section": { "ignored": 1 }
    })");

    ASSERT_EQ(cfg.venues.priority.size(), 2u);
    ASSERT_EQ(cfg.venues.priority[0], std::string("okx"));
    ASSERT_EQ(cfg.venues.polling_venue, std::string("okx"));
    ASSERT_TRUE(cfg.venues.use_testnet);

    ASSERT_EQ(cfg.tracker.commit_interval_ms, 1000u);
    ASSERT_EQ(cfg.tracker.tick_process_interval_ms, 2'000u); // untouched
    ASSERT_DOUBLE_NEAR(cfg.tracker.trade_timeout_hours, 12.5, 1e-12);
    ASSERT_DOUBLE_NEAR(cfg.exits.trail_post_tp2_mult, 0.5, 1e-12);
    ASSERT_DOUBLE_NEAR(cfg.exits.trail_pre_tp1_mult, 1.5, 1e-12);
    ASSERT_FALSE(cfg.circuit_breaker.enforce);
    ASSERT_EQ(cfg.logging.level, std::string("debug"));
    ASSERT_EQ(cfg.store.path, std::string("/var/lib/tickguard/state.json"));
}

TEST(invalid_documents_raise_config_error) {
    ASSERT_TRUE(parse_fails("{ not json"));
    ASSERT_TRUE(parse_fails("[1, 2, 3]"));
    ASSERT_TRUE(parse_fails(R"({"tracker": {"commit_interval_ms": "soon"}})"));
    ASSERT_TRUE(parse_fails(R"({"venues": {"priority": []}})"));
    ASSERT_TRUE(parse_fails(R"({"circuit_breaker": {"lookback_trades": 5, "min_trades": 10}})"));
    ASSERT_FALSE(parse_fails(R"({"tracker": null})"));
}

TEST(dump_and_save_round_trip) {
    EngineConfig cfg;
    cfg.venues.priority = {"binance"};
    cfg.multiplexer.stale_timeout_ms = 15'000;
    cfg.exits.default_volatility_mult = 1.8;
    cfg.circuit_breaker.min_trades = 5;

    std::string path = "/tmp/tickguard_config_" + std::to_string(::getpid()) + ".json";
    ConfigParser::save(path, cfg);
    EngineConfig loaded = ConfigParser::load(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.venues.priority.size(), 1u);
    ASSERT_EQ(loaded.multiplexer.stale_timeout_ms, 15'000u);
    ASSERT_DOUBLE_NEAR(loaded.exits.default_volatility_mult, 1.8, 1e-12);
    ASSERT_EQ(loaded.circuit_breaker.min_trades, 5u);
    ASSERT_EQ(ConfigParser::dump(loaded), ConfigParser::dump(cfg));
}

TEST(missing_file_raises_config_error) {
    bool threw = false;
    try {
        ConfigParser::load("/nonexistent/tickguard.json");
    } catch (const ConfigError& e) {
        threw = true;
        ASSERT_TRUE(std::string(e.what()).find("/nonexistent/tickguard.json") != std::string::npos);
    }
    ASSERT_TRUE(threw);
}

int main() {
    std::cout << "\n=== Engine Config Tests ===\n\n";

    RUN_TEST(empty_document_uses_defaults);
    RUN_TEST(sections_override_individual_keys);
    RUN_TEST(invalid_documents_raise_config_error);
    RUN_TEST(dump_and_save_round_trip);
    RUN_TEST(missing_file_raises_config_error);

    std::cout << "\n=== All Engine Config Tests Passed! ===\n";
    return 0;
}
