#include "../include/tickguard/venue/ivenue.hpp"
#include "../include/tickguard/venue/venue_protocol.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace tickguard;
using namespace tickguard::venue;
using json = nlohmann::json;

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

const util::NormalizedSymbol BTC_PERP = util::parse_venue_symbol("BTC/USDT:USDT");
const util::NormalizedSymbol ETH_SPOT = util::parse_venue_symbol("ETH/USDT");

} // namespace

// =============================================================================
// Price decoding
// =============================================================================

TEST(json_price_accepts_strings_and_numbers) {
    ASSERT_DOUBLE_NEAR(*json_price(json("50000.10")), 50000.10, 1e-9);
    ASSERT_DOUBLE_NEAR(*json_price(json(42.5)), 42.5, 1e-9);
    ASSERT_DOUBLE_NEAR(*json_price(json(7)), 7.0, 1e-9);

    ASSERT_FALSE(json_price(json("")).has_value());
    ASSERT_FALSE(json_price(json("12abc")).has_value());
    ASSERT_FALSE(json_price(json(nullptr)).has_value());
    ASSERT_FALSE(json_price(json::object()).has_value());
}

// =============================================================================
// Bybit
// =============================================================================

TEST(bybit_endpoint_by_market) {
    auto p = bybit_protocol();
    auto perp = p.endpoint(BTC_PERP);
    ASSERT_EQ(perp.host, std::string("stream.bybit.com"));
    ASSERT_EQ(perp.path, std::string("/v5/public/linear"));
    ASSERT_EQ(perp.port, 443);

    json sub = json::parse(perp.subscribe_message);
    ASSERT_EQ(sub["op"], "subscribe");
    ASSERT_EQ(sub["args"][0], "tickers.BTCUSDT");

    auto spot = p.endpoint(ETH_SPOT);
    ASSERT_EQ(spot.path, std::string("/v5/public/spot"));

    auto testnet = bybit_protocol(true).endpoint(BTC_PERP);
    ASSERT_EQ(testnet.host, std::string("stream-testnet.bybit.com"));
}

TEST(bybit_tick_parsing) {
    auto p = bybit_protocol();

    json snapshot = json::parse(
        R"({"topic":"tickers.BTCUSDT","type":"snapshot","data":{"symbol":"BTCUSDT","lastPrice":"50000.1"},"ts":1})");
    ASSERT_DOUBLE_NEAR(*p.parse_tick(snapshot), 50000.1, 1e-9);

    // Delta without a last price
    json delta = json::parse(R"({"topic":"tickers.BTCUSDT","type":"delta","data":{"symbol":"BTCUSDT","bid1Price":"1"}})");
    ASSERT_FALSE(p.parse_tick(delta).has_value());

    json ack = json::parse(R"({"success":true,"ret_msg":"","op":"subscribe"})");
    ASSERT_FALSE(p.parse_tick(ack).has_value());

    json pong = json::parse(R"({"op":"pong"})");
    ASSERT_FALSE(p.parse_tick(pong).has_value());
}

TEST(bybit_rest) {
    auto p = bybit_protocol();
    ASSERT_EQ(p.rest_url(BTC_PERP), std::string("https://api.bybit.com/v5/market/tickers?category=linear&symbol=BTCUSDT"));
    ASSERT_EQ(p.rest_url(ETH_SPOT), std::string("https://api.bybit.com/v5/market/tickers?category=spot&symbol=ETHUSDT"));

    json ok = json::parse(R"({"retCode":0,"result":{"category":"linear","list":[{"lastPrice":"50001.5"}]}})");
    ASSERT_DOUBLE_NEAR(*p.parse_rest_price(ok), 50001.5, 1e-9);

    json err = json::parse(R"({"retCode":10001,"retMsg":"params error","result":{}})");
    ASSERT_FALSE(p.parse_rest_price(err).has_value());

    json empty = json::parse(R"({"retCode":0,"result":{"list":[]}})");
    ASSERT_FALSE(p.parse_rest_price(empty).has_value());
}

// =============================================================================
// Binance
// =============================================================================

TEST(binance_endpoint_by_market) {
    auto p = binance_protocol();
    auto perp = p.endpoint(BTC_PERP);
    ASSERT_EQ(perp.host, std::string("fstream.binance.com"));
    ASSERT_EQ(perp.path, std::string("/ws/btcusdt@ticker"));
    ASSERT_TRUE(perp.subscribe_message.empty());

    auto spot = p.endpoint(ETH_SPOT);
    ASSERT_EQ(spot.host, std::string("stream.binance.com"));
    ASSERT_EQ(spot.port, 9443);
    ASSERT_EQ(spot.path, std::string("/ws/ethusdt@ticker"));
}

TEST(binance_tick_parsing) {
    auto p = binance_protocol();

    json ticker = json::parse(R"({"e":"24hrTicker","E":1672515782136,"s":"BTCUSDT","c":"50000.10"})");
    ASSERT_DOUBLE_NEAR(*p.parse_tick(ticker), 50000.10, 1e-9);

    json combined = json::parse(R"({"stream":"btcusdt@ticker","data":{"s":"BTCUSDT","c":"49999.9"}})");
    ASSERT_DOUBLE_NEAR(*p.parse_tick(combined), 49999.9, 1e-9);

    json result = json::parse(R"({"result":null,"id":1})");
    ASSERT_FALSE(p.parse_tick(result).has_value());
}

TEST(binance_rest) {
    auto p = binance_protocol();
    ASSERT_EQ(p.rest_url(BTC_PERP), std::string("https://fapi.binance.com/fapi/v1/ticker/price?symbol=BTCUSDT"));
    ASSERT_EQ(p.rest_url(ETH_SPOT), std::string("https://api.binance.com/api/v3/ticker/price?symbol=ETHUSDT"));

    json ok = json::parse(R"({"symbol":"BTCUSDT","price":"50000.10"})");
    ASSERT_DOUBLE_NEAR(*p.parse_rest_price(ok), 50000.10, 1e-9);

    json err = json::parse(R"({"code":-1121,"msg":"Invalid symbol."})");
    ASSERT_FALSE(p.parse_rest_price(err).has_value());
}

// =============================================================================
// OKX
// =============================================================================

TEST(okx_endpoint_uses_dashed_instrument) {
    auto p = okx_protocol();
    auto perp = p.endpoint(BTC_PERP);
    ASSERT_EQ(perp.host, std::string("ws.okx.com"));
    ASSERT_EQ(perp.port, 8443);
    ASSERT_EQ(perp.path, std::string("/ws/v5/public"));

    json sub = json::parse(perp.subscribe_message);
    ASSERT_EQ(sub["args"][0]["channel"], "tickers");
    ASSERT_EQ(sub["args"][0]["instId"], "BTC-USDT-SWAP");

    json spot = json::parse(p.endpoint(ETH_SPOT).subscribe_message);
    ASSERT_EQ(spot["args"][0]["instId"], "ETH-USDT");

    ASSERT_EQ(p.ping_message, std::string("ping"));
}

TEST(okx_tick_and_rest_parsing) {
    auto p = okx_protocol();

    json tick = json::parse(R"({"arg":{"channel":"tickers","instId":"BTC-USDT"},"data":[{"last":"50000.1","ts":"1"}]})");
    ASSERT_DOUBLE_NEAR(*p.parse_tick(tick), 50000.1, 1e-9);

    json event = json::parse(R"({"event":"subscribe","arg":{"channel":"tickers","instId":"BTC-USDT"}})");
    ASSERT_FALSE(p.parse_tick(event).has_value());

    ASSERT_EQ(p.rest_url(BTC_PERP), std::string("https://www.okx.com/api/v5/market/ticker?instId=BTC-USDT-SWAP"));

    json ok = json::parse(R"({"code":"0","msg":"","data":[{"instId":"BTC-USDT","last":"50002"}]})");
    ASSERT_DOUBLE_NEAR(*p.parse_rest_price(ok), 50002.0, 1e-9);

    json err = json::parse(R"({"code":"51001","msg":"Instrument ID does not exist","data":[]})");
    ASSERT_FALSE(p.parse_rest_price(err).has_value());
}

// =============================================================================
// Factory
// =============================================================================

TEST(make_protocol_by_name) {
    ASSERT_EQ(make_protocol("bybit").name, std::string("bybit"));
    ASSERT_EQ(make_protocol("Binance").name, std::string("binance"));
    ASSERT_EQ(make_protocol("OKX").name, std::string("okx"));

    bool threw = false;
    try {
        make_protocol("kraken");
    } catch (const VenueError& e) {
        threw = true;
        ASSERT_TRUE(std::string(e.what()).find("kraken") != std::string::npos);
    }
    ASSERT_TRUE(threw);
}

int main() {
    std::cout << "\n=== Venue Protocol Tests ===\n\n";

    RUN_TEST(json_price_accepts_strings_and_numbers);
    RUN_TEST(bybit_endpoint_by_market);
    RUN_TEST(bybit_tick_parsing);
    RUN_TEST(bybit_rest);
    RUN_TEST(binance_endpoint_by_market);
    RUN_TEST(binance_tick_parsing);
    RUN_TEST(binance_rest);
    RUN_TEST(okx_endpoint_uses_dashed_instrument);
    RUN_TEST(okx_tick_and_rest_parsing);
    RUN_TEST(make_protocol_by_name);

    std::cout << "\n=== All Venue Protocol Tests Passed! ===\n";
    return 0;
}
