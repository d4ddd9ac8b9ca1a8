#pragma once

/**
 * Time utilities
 *
 * Two clocks are used across the engine:
 * - steady_clock (now_ns) for intervals: batching, polling, health checks
 * - system_clock (wall_clock_ns) for trade facts: entry, hits, completion
 */

#include "../types.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace tickguard {
namespace util {

/**
 * Returns current time in nanoseconds since steady_clock epoch.
 * Monotonic; suitable for measuring elapsed time only.
 */
inline uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 */
inline Timestamp wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

inline Timestamp ms_to_ns(uint64_t ms) { return ms * 1'000'000ULL; }

inline double minutes_between(Timestamp from, Timestamp to) {
    if (to <= from)
        return 0.0;
    return static_cast<double>(to - from) / static_cast<double>(NS_PER_MIN);
}

/**
 * Format a wall-clock timestamp as "YYYY-MM-DD HH:MM:SS" (UTC).
 */
inline std::string format_timestamp(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / NS_PER_SEC);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // namespace util
} // namespace tickguard
