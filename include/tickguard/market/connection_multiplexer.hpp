#pragma once

/**
 * ConnectionMultiplexer - one upstream subscription per instrument.
 *
 * Any number of listeners may subscribe to an instrument; the first one
 * starts a watch thread that streams from the highest-priority venue that
 * works and fans every tick out to all listeners. The last unsubscribe stops
 * and joins the thread.
 *
 * Watch loop per instrument:
 *   1. try streaming venues in priority order; a VenueError fails over
 *   2. every streaming venue failed: poll the polling venue every second
 *      (5s backoff on error) until the streaming retry interval elapses, a
 *      new listener arrives or the health monitor asks for a restart
 *   3. back to 1
 *
 * A health monitor thread restarts any instrument that has listeners but
 * has not produced a tick within the stale timeout.
 *
 * Usage:
 *   ConnectionMultiplexer mux(std::move(venues), config.venues, config.multiplexer, logger);
 *   mux.start();
 *   auto id = mux.subscribe("BTC/USDT:USDT", [](const std::string& s, double p, Timestamp ts) { ... });
 *   mux.unsubscribe("BTC/USDT:USDT", id);
 *   mux.stop();
 */

#include "../config/engine_config.hpp"
#include "../logging/async_logger.hpp"
#include "../venue/ivenue.hpp"
#include "tick_source.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tickguard {
namespace market {

struct ConnectionStats {
    size_t total_instruments = 0;
    size_t total_listeners = 0;
    size_t active_streams = 0;
    size_t polling_instruments = 0;
    std::vector<std::string> venues_available;
    std::map<std::string, size_t> instruments_by_venue;
    uint64_t failovers = 0;
    uint64_t health_failures = 0;
    uint64_t listener_errors = 0;
};

class ConnectionMultiplexer : public ITickSource {
public:
    ConnectionMultiplexer(std::vector<std::unique_ptr<venue::IVenue>> venues, const config::VenueSettings& venue_settings,
                          const config::MultiplexerSettings& settings, logging::AsyncLogger& logger);
    ~ConnectionMultiplexer() override;

    // Non-copyable
    ConnectionMultiplexer(const ConnectionMultiplexer&) = delete;
    ConnectionMultiplexer& operator=(const ConnectionMultiplexer&) = delete;

    /**
     * Start the health monitor thread
     */
    void start();

    /**
     * Cancel every watch loop, join threads and close venues.
     */
    void stop();

    ListenerId subscribe(const std::string& instrument, TickListener listener) override;
    void unsubscribe(const std::string& instrument, ListenerId id) override;

    ConnectionStats connection_stats() const;

    /**
     * Restart every instrument whose last tick is older than the stale
     * timeout. Called by the monitor thread; exposed for tests.
     * @param now steady-clock nanoseconds
     * @return number of instruments restarted
     */
    size_t check_health(uint64_t now);

    bool is_polling(const std::string& instrument) const;
    std::string current_venue(const std::string& instrument) const;

private:
    struct Subscription {
        std::string instrument;

        mutable std::mutex mutex; // listeners and current_venue
        std::map<ListenerId, TickListener> listeners;
        std::string current_venue;

        std::atomic<bool> cancel{false};   // ends the current stream or polling round
        std::atomic<bool> shutdown{false}; // ends the watch loop
        std::atomic<bool> polling{false};
        std::atomic<bool> finished{false};
        std::atomic<uint64_t> last_update_ns{0}; // steady clock

        std::mutex wait_mutex;
        std::condition_variable wait_cv;

        std::thread thread;
    };

    using SubscriptionPtr = std::shared_ptr<Subscription>;

    std::vector<std::unique_ptr<venue::IVenue>> venues_;
    config::VenueSettings venue_settings_;
    config::MultiplexerSettings settings_;
    logging::AsyncLogger& logger_;

    mutable std::mutex mutex_;
    std::map<std::string, SubscriptionPtr> subscriptions_;
    std::vector<SubscriptionPtr> retired_; // loops stopped from their own thread
    ListenerId next_listener_id_ = 1;

    std::atomic<bool> running_;
    std::thread monitor_thread_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;

    std::atomic<uint64_t> failovers_;
    std::atomic<uint64_t> health_failures_;
    std::atomic<uint64_t> listener_errors_;

    venue::IVenue* find_venue(const std::string& name) const;

    void watch_loop(SubscriptionPtr sub);
    bool stream_from_venues(Subscription& sub);
    void run_polling(Subscription& sub);
    void dispatch(Subscription& sub, double price, Timestamp timestamp);

    // Interrupted early by cancel or shutdown
    void wait_for(Subscription& sub, uint64_t ms);
    static void request_restart(Subscription& sub);
    static void request_shutdown(Subscription& sub);

    void set_current_venue(Subscription& sub, const std::string& venue, bool polling);
    void monitor_loop();
    void reap_retired();
};

} // namespace market
} // namespace tickguard
