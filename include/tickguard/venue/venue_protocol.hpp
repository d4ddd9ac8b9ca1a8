#pragma once

/**
 * VenueProtocol - per-venue wire details for WsVenue.
 *
 * Describes where to connect for an instrument, what to send after the
 * handshake, how to pull a last price out of a stream message and how to
 * poll the REST ticker. Parsers return nullopt for messages that carry no
 * price (acks, pongs, partial deltas).
 *
 * Built-in descriptors:
 *   bybit    wss://stream.bybit.com/v5/public/{linear|spot}   tickers.<SYM>
 *   binance  wss://stream.binance.com:9443/ws/<sym>@ticker    (fstream for perpetuals)
 *   okx      wss://ws.okx.com:8443/ws/v5/public               tickers <BASE-QUOTE[-SWAP]>
 */

#include "../util/symbol_utils.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace tickguard {
namespace venue {

struct VenueEndpoint {
    std::string host;
    int port = 443;
    std::string path;
    std::string subscribe_message; // empty: stream selected by path
};

struct VenueProtocol {
    std::string name;

    std::function<VenueEndpoint(const util::NormalizedSymbol&)> endpoint;
    std::function<std::optional<double>(const nlohmann::json&)> parse_tick;

    std::function<std::string(const util::NormalizedSymbol&)> rest_url;
    std::function<std::optional<double>(const nlohmann::json&)> parse_rest_price;

    // Application-level keepalive, sent as text every ping_interval_sec
    std::string ping_message;
    int ping_interval_sec = 20;
};

VenueProtocol bybit_protocol(bool use_testnet = false);
VenueProtocol binance_protocol(bool use_testnet = false);
VenueProtocol okx_protocol();

/**
 * Descriptor by venue name ("bybit", "binance", "okx").
 * @throws VenueError for unknown names
 */
VenueProtocol make_protocol(const std::string& name, bool use_testnet = false);

/**
 * Parse a decimal that venues send either as a JSON string or number.
 */
std::optional<double> json_price(const nlohmann::json& value);

} // namespace venue
} // namespace tickguard
