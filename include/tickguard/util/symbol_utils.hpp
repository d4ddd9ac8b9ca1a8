#pragma once

/**
 * Symbol normalization
 *
 * Trades carry two symbol forms:
 * - signal-source native:  "BTCUSDT", "HIPPOUSDT.P" (".P" = perpetual)
 * - venue-neutral:         "BTC/USDT", "HIPPO/USDT:USDT" (BASE/QUOTE[:SETTLE])
 *
 * Venue adapters convert the neutral form into their native format:
 *   Binance/Bybit: "BTCUSDT"
 *   OKX:           "BTC-USDT" (spot), "BTC-USDT-SWAP" (perpetual)
 */

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace tickguard {
namespace util {

struct NormalizedSymbol {
    std::string venue_symbol; // "BTC/USDT:USDT"
    std::string base;         // "BTC"
    std::string quote;        // "USDT"
    bool perpetual = false;
};

inline std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * Strip perpetual suffixes: "BTCUSDT.P" -> "BTCUSDT"
 */
inline std::string display_symbol(const std::string& native) {
    static const std::array<const char*, 4> suffixes = {".P", ".PERP", "-PERP", "PERP"};
    for (const char* suffix : suffixes) {
        if (ends_with(native, suffix)) {
            return native.substr(0, native.size() - std::char_traits<char>::length(suffix));
        }
    }
    return native;
}

/**
 * Normalize a signal-source symbol into venue-neutral form.
 *
 * @throws std::invalid_argument if no known quote currency matches
 */
inline NormalizedSymbol normalize_symbol(const std::string& native) {
    NormalizedSymbol result;
    std::string raw = to_upper(native);
    std::string stripped = display_symbol(raw);
    result.perpetual = stripped.size() != raw.size();

    // Longer quotes first so "USDT" wins over "USD"
    static const std::array<const char*, 7> quotes = {"USDT", "USDC", "BUSD", "USD", "EUR", "BTC", "ETH"};
    for (const char* quote : quotes) {
        if (ends_with(stripped, quote) && stripped.size() > std::char_traits<char>::length(quote)) {
            result.quote = quote;
            result.base = stripped.substr(0, stripped.size() - result.quote.size());
            break;
        }
    }

    if (result.base.empty()) {
        throw std::invalid_argument("Unable to parse symbol: " + native);
    }

    result.venue_symbol = result.base + "/" + result.quote;
    if (result.perpetual) {
        result.venue_symbol += ":" + result.quote;
    }
    return result;
}

/**
 * Split a venue-neutral symbol. Native symbols pass through normalize_symbol.
 */
inline NormalizedSymbol parse_venue_symbol(const std::string& symbol) {
    size_t slash = symbol.find('/');
    if (slash == std::string::npos) {
        return normalize_symbol(symbol);
    }

    NormalizedSymbol result;
    result.venue_symbol = symbol;
    result.base = symbol.substr(0, slash);
    size_t colon = symbol.find(':', slash);
    if (colon == std::string::npos) {
        result.quote = symbol.substr(slash + 1);
    } else {
        result.quote = symbol.substr(slash + 1, colon - slash - 1);
        result.perpetual = true;
    }
    if (result.base.empty() || result.quote.empty()) {
        throw std::invalid_argument("Unable to parse symbol: " + symbol);
    }
    return result;
}

// "BTC/USDT:USDT" -> "BTCUSDT"
inline std::string to_concatenated(const std::string& symbol) {
    auto parsed = parse_venue_symbol(symbol);
    return parsed.base + parsed.quote;
}

// "BTC/USDT" -> "BTC-USDT", "BTC/USDT:USDT" -> "BTC-USDT-SWAP"
inline std::string to_dashed(const std::string& symbol) {
    auto parsed = parse_venue_symbol(symbol);
    std::string out = parsed.base + "-" + parsed.quote;
    if (parsed.perpetual) {
        out += "-SWAP";
    }
    return out;
}

} // namespace util
} // namespace tickguard
