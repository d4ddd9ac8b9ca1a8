#pragma once

/**
 * ITickSource - subscription surface consumed by the trade tracker.
 *
 * Implemented by ConnectionMultiplexer; tests substitute a scripted source.
 */

#include "../types.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace tickguard {
namespace market {

using ListenerId = uint64_t;

// (instrument, price, wall-clock timestamp)
using TickListener = std::function<void(const std::string& instrument, double price, Timestamp timestamp)>;

class ITickSource {
public:
    virtual ~ITickSource() = default;

    virtual ListenerId subscribe(const std::string& instrument, TickListener listener) = 0;

    /**
     * Safe to call from inside a listener of the same instrument.
     */
    virtual void unsubscribe(const std::string& instrument, ListenerId id) = 0;
};

} // namespace market
} // namespace tickguard
