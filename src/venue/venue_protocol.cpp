#include "../../include/tickguard/venue/venue_protocol.hpp"
#include "../../include/tickguard/venue/ivenue.hpp"

#include <cstdlib>

namespace tickguard::venue {

using json = nlohmann::json;

std::optional<double> json_price(const json& value) {
    if (value.is_number())
        return value.get<double>();
    if (!value.is_string())
        return std::nullopt;

    const std::string& text = value.get_ref<const std::string&>();
    if (text.empty())
        return std::nullopt;
    char* end = nullptr;
    double price = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0')
        return std::nullopt;
    return price;
}

namespace {

std::optional<double> field_price(const json& obj, const char* key) {
    if (!obj.is_object())
        return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end())
        return std::nullopt;
    return json_price(*it);
}

// Both OKX and Bybit REST wrap results in a list; take the first entry
std::optional<double> first_in_list(const json& list, const char* key) {
    if (!list.is_array() || list.empty())
        return std::nullopt;
    return field_price(list.front(), key);
}

} // namespace

// =============================================================================
// Bybit v5
// =============================================================================

VenueProtocol bybit_protocol(bool use_testnet) {
    VenueProtocol p;
    p.name = "bybit";
    std::string ws_host = use_testnet ? "stream-testnet.bybit.com" : "stream.bybit.com";
    std::string rest_base = use_testnet ? "https://api-testnet.bybit.com" : "https://api.bybit.com";

    p.endpoint = [ws_host](const util::NormalizedSymbol& s) {
        VenueEndpoint ep;
        ep.host = ws_host;
        ep.path = s.perpetual ? "/v5/public/linear" : "/v5/public/spot";
        json sub = {{"op", "subscribe"}, {"args", json::array({"tickers." + s.base + s.quote})}};
        ep.subscribe_message = sub.dump();
        return ep;
    };

    // {"topic":"tickers.BTCUSDT","type":"snapshot","data":{"symbol":"BTCUSDT","lastPrice":"50000.1"},"ts":...}
    // Delta messages omit unchanged fields, so lastPrice may be absent
    p.parse_tick = [](const json& msg) -> std::optional<double> {
        if (!msg.is_object() || !msg.contains("topic"))
            return std::nullopt;
        return field_price(msg.value("data", json::object()), "lastPrice");
    };

    p.rest_url = [rest_base](const util::NormalizedSymbol& s) {
        return rest_base + "/v5/market/tickers?category=" + (s.perpetual ? "linear" : "spot") +
               "&symbol=" + s.base + s.quote;
    };

    // {"retCode":0,"result":{"list":[{"lastPrice":"50000.1",...}]}}
    p.parse_rest_price = [](const json& doc) -> std::optional<double> {
        if (!doc.is_object() || doc.value("retCode", -1) != 0)
            return std::nullopt;
        auto result = doc.find("result");
        if (result == doc.end() || !result->is_object())
            return std::nullopt;
        return first_in_list(result->value("list", json::array()), "lastPrice");
    };

    p.ping_message = R"({"op":"ping"})";
    p.ping_interval_sec = 20;
    return p;
}

// =============================================================================
// Binance
// =============================================================================

VenueProtocol binance_protocol(bool use_testnet) {
    VenueProtocol p;
    p.name = "binance";

    p.endpoint = [use_testnet](const util::NormalizedSymbol& s) {
        VenueEndpoint ep;
        std::string stream = util::to_lower(s.base + s.quote) + "@ticker";
        if (use_testnet) {
            ep.host = s.perpetual ? "stream.binancefuture.com" : "testnet.binance.vision";
            ep.port = 443;
        } else if (s.perpetual) {
            ep.host = "fstream.binance.com";
            ep.port = 443;
        } else {
            ep.host = "stream.binance.com";
            ep.port = 9443;
        }
        ep.path = "/ws/" + stream;
        return ep;
    };

    // {"e":"24hrTicker","E":1672515782136,"s":"BTCUSDT","c":"50000.10",...}
    p.parse_tick = [](const json& msg) -> std::optional<double> {
        if (!msg.is_object())
            return std::nullopt;
        // Combined stream wrapper
        if (msg.contains("data"))
            return field_price(msg["data"], "c");
        return field_price(msg, "c");
    };

    p.rest_url = [use_testnet](const util::NormalizedSymbol& s) {
        std::string symbol = s.base + s.quote;
        if (s.perpetual) {
            std::string base = use_testnet ? "https://testnet.binancefuture.com" : "https://fapi.binance.com";
            return base + "/fapi/v1/ticker/price?symbol=" + symbol;
        }
        std::string base = use_testnet ? "https://testnet.binance.vision" : "https://api.binance.com";
        return base + "/api/v3/ticker/price?symbol=" + symbol;
    };

    // {"symbol":"BTCUSDT","price":"50000.10"}
    p.parse_rest_price = [](const json& doc) { return field_price(doc, "price"); };

    // Binance sends ws ping frames; libwebsockets answers them
    p.ping_interval_sec = 0;
    return p;
}

// =============================================================================
// OKX v5
// =============================================================================

VenueProtocol okx_protocol() {
    VenueProtocol p;
    p.name = "okx";

    p.endpoint = [](const util::NormalizedSymbol& s) {
        VenueEndpoint ep;
        ep.host = "ws.okx.com";
        ep.port = 8443;
        ep.path = "/ws/v5/public";
        json sub = {{"op", "subscribe"},
                    {"args", json::array({{{"channel", "tickers"}, {"instId", util::to_dashed(s.venue_symbol)}}})}};
        ep.subscribe_message = sub.dump();
        return ep;
    };

    // {"arg":{"channel":"tickers","instId":"BTC-USDT"},"data":[{"last":"50000.1","ts":"1672515782136"}]}
    p.parse_tick = [](const json& msg) -> std::optional<double> {
        if (!msg.is_object() || !msg.contains("arg"))
            return std::nullopt;
        return first_in_list(msg.value("data", json::array()), "last");
    };

    p.rest_url = [](const util::NormalizedSymbol& s) {
        return "https://www.okx.com/api/v5/market/ticker?instId=" + util::to_dashed(s.venue_symbol);
    };

    // {"code":"0","data":[{"last":"50000.1",...}]}
    p.parse_rest_price = [](const json& doc) -> std::optional<double> {
        if (!doc.is_object() || doc.value("code", std::string()) != "0")
            return std::nullopt;
        return first_in_list(doc.value("data", json::array()), "last");
    };

    // Server drops idle connections after 30s
    p.ping_message = "ping";
    p.ping_interval_sec = 20;
    return p;
}

VenueProtocol make_protocol(const std::string& name, bool use_testnet) {
    std::string lower = util::to_lower(name);
    if (lower == "bybit")
        return bybit_protocol(use_testnet);
    if (lower == "binance")
        return binance_protocol(use_testnet);
    if (lower == "okx")
        return okx_protocol();
    throw VenueError("Unknown venue: " + name);
}

} // namespace tickguard::venue
