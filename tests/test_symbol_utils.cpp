#include "../include/tickguard/util/cli.hpp"
#include "../include/tickguard/util/symbol_utils.hpp"
#include "../include/tickguard/util/time_utils.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace tickguard;
using namespace tickguard::util;

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

// =============================================================================
// Symbols
// =============================================================================

TEST(normalize_spot_and_perpetual) {
    auto spot = normalize_symbol("BTCUSDT");
    ASSERT_EQ(spot.venue_symbol, std::string("BTC/USDT"));
    ASSERT_EQ(spot.base, std::string("BTC"));
    ASSERT_EQ(spot.quote, std::string("USDT"));
    ASSERT_FALSE(spot.perpetual);

    auto perp = normalize_symbol("HIPPOUSDT.P");
    ASSERT_EQ(perp.venue_symbol, std::string("HIPPO/USDT:USDT"));
    ASSERT_TRUE(perp.perpetual);

    ASSERT_EQ(normalize_symbol("ethusdc").venue_symbol, std::string("ETH/USDC"));
    ASSERT_EQ(normalize_symbol("SOLUSDPERP").venue_symbol, std::string("SOL/USD:USD"));
    ASSERT_EQ(normalize_symbol("ETHBTC").venue_symbol, std::string("ETH/BTC"));
}

TEST(normalize_rejects_unknown_quotes) {
    bool threw = false;
    try {
        normalize_symbol("FOOBAR");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw);

    threw = false;
    try {
        normalize_symbol("USDT"); // quote only
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(venue_symbol_conversions) {
    auto parsed = parse_venue_symbol("BTC/USDT:USDT");
    ASSERT_EQ(parsed.base, std::string("BTC"));
    ASSERT_EQ(parsed.quote, std::string("USDT"));
    ASSERT_TRUE(parsed.perpetual);

    ASSERT_EQ(parse_venue_symbol("ADAUSDT").venue_symbol, std::string("ADA/USDT"));

    ASSERT_EQ(to_concatenated("BTC/USDT:USDT"), std::string("BTCUSDT"));
    ASSERT_EQ(to_dashed("BTC/USDT"), std::string("BTC-USDT"));
    ASSERT_EQ(to_dashed("BTC/USDT:USDT"), std::string("BTC-USDT-SWAP"));
    ASSERT_EQ(display_symbol("BTCUSDT.P"), std::string("BTCUSDT"));
}

// =============================================================================
// Time
// =============================================================================

TEST(time_helpers) {
    ASSERT_EQ(ms_to_ns(1500), 1'500'000'000ULL);
    ASSERT_DOUBLE_NEAR(minutes_between(0, 90 * NS_PER_SEC), 1.5, 1e-12);
    ASSERT_DOUBLE_NEAR(minutes_between(NS_PER_MIN, 0), 0.0, 1e-12);
    ASSERT_EQ(format_timestamp(1'700'000'000ULL * NS_PER_SEC), std::string("2023-11-14 22:13:20"));
    ASSERT_TRUE(wall_clock_ns() > 1'700'000'000ULL * NS_PER_SEC);
}

// =============================================================================
// CLI
// =============================================================================

TEST(parse_cli_options) {
    const char* argv[] = {"tickguard", "-c",      "cfg.json",           "--store", "state.json", "-i",
                          "new.json",  "--reset", "BTCUSDT|LONG|alpha", "-d",      "600",        "-v"};
    CLIArgs args;
    ASSERT_TRUE(parse_args(12, const_cast<char**>(argv), args));
    ASSERT_EQ(args.config_path, std::string("cfg.json"));
    ASSERT_EQ(args.store_path, std::string("state.json"));
    ASSERT_EQ(args.import_path, std::string("new.json"));
    ASSERT_EQ(args.reset_keys.size(), 1u);
    ASSERT_EQ(args.duration, 600);
    ASSERT_TRUE(args.verbose);
    ASSERT_FALSE(args.summary);

    const char* bad_duration[] = {"tickguard", "-d", "soon"};
    CLIArgs bad;
    ASSERT_FALSE(parse_args(3, const_cast<char**>(bad_duration), bad));

    const char* unknown[] = {"tickguard", "--frobnicate"};
    CLIArgs other;
    ASSERT_FALSE(parse_args(2, const_cast<char**>(unknown), other));
}

TEST(split_asset_keys) {
    std::string symbol, direction, source;
    ASSERT_TRUE(split_asset_key("BTCUSDT|LONG|alpha", symbol, direction, source));
    ASSERT_EQ(symbol, std::string("BTCUSDT"));
    ASSERT_EQ(direction, std::string("LONG"));
    ASSERT_EQ(source, std::string("alpha"));

    ASSERT_FALSE(split_asset_key("BTCUSDT|LONG", symbol, direction, source));
    ASSERT_FALSE(split_asset_key("BTCUSDT||alpha", symbol, direction, source));
    ASSERT_FALSE(split_asset_key("A|B|C|D", symbol, direction, source));
}

int main() {
    std::cout << "\n=== Symbol and CLI Utility Tests ===\n\n";

    RUN_TEST(normalize_spot_and_perpetual);
    RUN_TEST(normalize_rejects_unknown_quotes);
    RUN_TEST(venue_symbol_conversions);
    RUN_TEST(time_helpers);
    RUN_TEST(parse_cli_options);
    RUN_TEST(split_asset_keys);

    std::cout << "\n=== All Symbol and CLI Utility Tests Passed! ===\n";
    return 0;
}
