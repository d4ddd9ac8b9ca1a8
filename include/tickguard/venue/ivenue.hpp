#pragma once

/**
 * IVenue - upstream market-data source.
 *
 * A venue delivers last-trade prices for one instrument per stream() call.
 * stream() blocks on the caller's thread, so the multiplexer runs one watch
 * thread per instrument and may call stream() for different instruments
 * concurrently.
 *
 * Instruments are passed in venue-neutral form ("BTC/USDT:USDT"); each venue
 * converts to its own native symbol.
 */

#include "../types.hpp"

#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>

namespace tickguard {
namespace venue {

class VenueError : public std::runtime_error {
public:
    explicit VenueError(const std::string& what) : std::runtime_error(what) {}
};

// (price, wall-clock timestamp)
using PriceHandler = std::function<void(double price, Timestamp timestamp)>;

class IVenue {
public:
    virtual ~IVenue() = default;

    virtual const std::string& name() const = 0;

    /**
     * Stream prices until cancel becomes true.
     *
     * Returns normally only when cancelled or closed.
     * @throws VenueError on connect failure, disconnect or protocol error
     */
    virtual void stream(const std::string& instrument, const PriceHandler& on_price,
                        const std::atomic<bool>& cancel) = 0;

    /**
     * One-shot price fetch used by polling mode.
     * @throws VenueError on failure
     */
    virtual double fetch_price(const std::string& instrument) = 0;

    /**
     * Release connections. Active streams return promptly.
     */
    virtual void close() = 0;
};

} // namespace venue
} // namespace tickguard
