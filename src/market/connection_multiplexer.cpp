#include "../../include/tickguard/market/connection_multiplexer.hpp"
#include "../../include/tickguard/util/time_utils.hpp"

#include <chrono>
#include <utility>

namespace tickguard::market {

ConnectionMultiplexer::ConnectionMultiplexer(std::vector<std::unique_ptr<venue::IVenue>> venues,
                                             const config::VenueSettings& venue_settings,
                                             const config::MultiplexerSettings& settings,
                                             logging::AsyncLogger& logger)
    : venues_(std::move(venues)), venue_settings_(venue_settings), settings_(settings), logger_(logger),
      running_(false), failovers_(0), health_failures_(0), listener_errors_(0) {}

ConnectionMultiplexer::~ConnectionMultiplexer() { stop(); }

// =============================================================================
// Lifecycle
// =============================================================================

void ConnectionMultiplexer::start() {
    if (running_.exchange(true))
        return;

    monitor_thread_ = std::thread([this]() { monitor_loop(); });
    TICKGUARD_LOGF(logger_, Info, Market, "Multiplexer started with %zu venues (health check every %llums)",
                   venues_.size(), static_cast<unsigned long long>(settings_.health_check_interval_ms));
}

void ConnectionMultiplexer::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
    }
    monitor_cv_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    std::vector<SubscriptionPtr> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [instrument, sub] : subscriptions_)
            all.push_back(sub);
        subscriptions_.clear();
        for (auto& sub : retired_)
            all.push_back(sub);
        retired_.clear();
    }

    for (auto& sub : all)
        request_shutdown(*sub);

    for (auto& sub : all) {
        if (!sub->thread.joinable())
            continue;
        if (sub->thread.get_id() == std::this_thread::get_id()) {
            sub->thread.detach();
        } else {
            sub->thread.join();
        }
    }

    for (auto& v : venues_) {
        try {
            v->close();
        } catch (const std::exception& e) {
            TICKGUARD_LOGF(logger_, Warn, Venue, "Error closing %s: %s", v->name().c_str(), e.what());
        }
    }

    if (!all.empty()) {
        TICKGUARD_LOGF(logger_, Info, Market, "Multiplexer stopped (%zu watch loops cancelled)", all.size());
    }
}

// =============================================================================
// Subscriptions
// =============================================================================

ListenerId ConnectionMultiplexer::subscribe(const std::string& instrument, TickListener listener) {
    reap_retired();

    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_listener_id_++;

    auto it = subscriptions_.find(instrument);
    if (it != subscriptions_.end()) {
        SubscriptionPtr sub = it->second;
        {
            std::lock_guard<std::mutex> sub_lock(sub->mutex);
            sub->listeners.emplace(id, std::move(listener));
        }
        // A new subscriber is a cue to try streaming again
        if (sub->polling.load())
            request_restart(*sub);
        return id;
    }

    auto sub = std::make_shared<Subscription>();
    sub->instrument = instrument;
    sub->listeners.emplace(id, std::move(listener));
    sub->last_update_ns.store(util::now_ns());
    subscriptions_.emplace(instrument, sub);
    sub->thread = std::thread(&ConnectionMultiplexer::watch_loop, this, sub);

    TICKGUARD_LOGF(logger_, Info, Market, "Watch loop started for %s", instrument.c_str());
    return id;
}

void ConnectionMultiplexer::unsubscribe(const std::string& instrument, ListenerId id) {
    SubscriptionPtr to_join;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(instrument);
        if (it == subscriptions_.end())
            return;

        SubscriptionPtr sub = it->second;
        bool empty;
        {
            std::lock_guard<std::mutex> sub_lock(sub->mutex);
            sub->listeners.erase(id);
            empty = sub->listeners.empty();
        }
        if (!empty)
            return;

        subscriptions_.erase(it);
        request_shutdown(*sub);

        // Last listener removed from inside its own tick callback
        if (sub->thread.get_id() == std::this_thread::get_id()) {
            retired_.push_back(sub);
        } else {
            to_join = sub;
        }
    }

    if (to_join && to_join->thread.joinable()) {
        to_join->thread.join();
    }
    TICKGUARD_LOGF(logger_, Info, Market, "Watch loop stopped for %s", instrument.c_str());
}

void ConnectionMultiplexer::reap_retired() {
    std::vector<SubscriptionPtr> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = retired_.begin(); it != retired_.end();) {
            if ((*it)->finished.load()) {
                done.push_back(*it);
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& sub : done) {
        if (sub->thread.joinable())
            sub->thread.join();
    }
}

// =============================================================================
// Watch loop
// =============================================================================

void ConnectionMultiplexer::watch_loop(SubscriptionPtr sub) {
    while (!sub->shutdown.load()) {
        sub->cancel.store(false);

        if (stream_from_venues(*sub))
            continue; // cancelled: restart from the top of the priority list
        if (sub->shutdown.load())
            break;

        if (find_venue(venue_settings_.polling_venue)) {
            run_polling(*sub);
        } else {
            TICKGUARD_LOGF(logger_, Error, Market, "No polling venue for %s, retrying in %llums",
                           sub->instrument.c_str(), static_cast<unsigned long long>(settings_.all_failed_backoff_ms));
            wait_for(*sub, settings_.all_failed_backoff_ms);
        }
    }

    set_current_venue(*sub, "", false);
    sub->finished.store(true);
}

bool ConnectionMultiplexer::stream_from_venues(Subscription& sub) {
    for (const auto& name : venue_settings_.priority) {
        if (sub.shutdown.load() || sub.cancel.load())
            return true;

        venue::IVenue* v = find_venue(name);
        if (!v)
            continue;

        set_current_venue(sub, name, false);
        TICKGUARD_LOGF(logger_, Info, Venue, "Streaming %s from %s", sub.instrument.c_str(), name.c_str());

        try {
            v->stream(
                sub.instrument, [this, &sub](double price, Timestamp ts) { dispatch(sub, price, ts); }, sub.cancel);
            return true;
        } catch (const venue::VenueError& e) {
            TICKGUARD_LOGF(logger_, Warn, Venue, "%s failed for %s: %s", name.c_str(), sub.instrument.c_str(),
                           e.what());
        } catch (const std::exception& e) {
            TICKGUARD_LOGF(logger_, Error, Venue, "%s raised unexpected error for %s: %s", name.c_str(),
                           sub.instrument.c_str(), e.what());
        }
        failovers_.fetch_add(1);
    }

    set_current_venue(sub, "", false);
    TICKGUARD_LOGF(logger_, Error, Market, "All streaming venues failed for %s", sub.instrument.c_str());
    return false;
}

void ConnectionMultiplexer::run_polling(Subscription& sub) {
    venue::IVenue* poller = find_venue(venue_settings_.polling_venue);
    set_current_venue(sub, poller->name(), true);
    TICKGUARD_LOGF(logger_, Warn, Market, "Polling fallback for %s via %s every %llums", sub.instrument.c_str(),
                   poller->name().c_str(), static_cast<unsigned long long>(settings_.poll_interval_ms));

    uint64_t started = util::now_ns();
    uint64_t retry_after = util::ms_to_ns(settings_.streaming_retry_ms);

    while (!sub.shutdown.load() && !sub.cancel.load()) {
        if (util::now_ns() - started >= retry_after) {
            TICKGUARD_LOGF(logger_, Info, Market, "Retrying streaming for %s", sub.instrument.c_str());
            break;
        }

        try {
            double price = poller->fetch_price(sub.instrument);
            dispatch(sub, price, util::wall_clock_ns());
            wait_for(sub, settings_.poll_interval_ms);
        } catch (const venue::VenueError& e) {
            TICKGUARD_LOGF(logger_, Warn, Venue, "Poll failed for %s: %s", sub.instrument.c_str(), e.what());
            wait_for(sub, settings_.poll_error_backoff_ms);
        } catch (const std::exception& e) {
            TICKGUARD_LOGF(logger_, Error, Venue, "Poll raised unexpected error for %s: %s", sub.instrument.c_str(),
                           e.what());
            wait_for(sub, settings_.poll_error_backoff_ms);
        }
    }

    sub.polling.store(false);
}

void ConnectionMultiplexer::dispatch(Subscription& sub, double price, Timestamp timestamp) {
    sub.last_update_ns.store(util::now_ns());

    std::vector<std::pair<ListenerId, TickListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(sub.mutex);
        listeners.assign(sub.listeners.begin(), sub.listeners.end());
    }

    for (auto& [id, listener] : listeners) {
        try {
            listener(sub.instrument, price, timestamp);
        } catch (const std::exception& e) {
            listener_errors_.fetch_add(1);
            TICKGUARD_LOGF(logger_, Error, Market, "Listener %llu for %s failed: %s", static_cast<unsigned long long>(id),
                           sub.instrument.c_str(), e.what());
        }
    }
}

void ConnectionMultiplexer::wait_for(Subscription& sub, uint64_t ms) {
    std::unique_lock<std::mutex> lock(sub.wait_mutex);
    sub.wait_cv.wait_for(lock, std::chrono::milliseconds(ms),
                         [&sub]() { return sub.cancel.load() || sub.shutdown.load(); });
}

void ConnectionMultiplexer::request_restart(Subscription& sub) {
    {
        std::lock_guard<std::mutex> lock(sub.wait_mutex);
        sub.cancel.store(true);
    }
    sub.wait_cv.notify_all();
}

void ConnectionMultiplexer::request_shutdown(Subscription& sub) {
    {
        std::lock_guard<std::mutex> lock(sub.wait_mutex);
        sub.shutdown.store(true);
        sub.cancel.store(true);
    }
    sub.wait_cv.notify_all();
}

void ConnectionMultiplexer::set_current_venue(Subscription& sub, const std::string& venue, bool polling) {
    std::lock_guard<std::mutex> lock(sub.mutex);
    sub.current_venue = venue;
    sub.polling.store(polling);
}

venue::IVenue* ConnectionMultiplexer::find_venue(const std::string& name) const {
    for (const auto& v : venues_) {
        if (v->name() == name)
            return v.get();
    }
    return nullptr;
}

// =============================================================================
// Health monitor
// =============================================================================

void ConnectionMultiplexer::monitor_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(monitor_mutex_);
            monitor_cv_.wait_for(lock, std::chrono::milliseconds(settings_.health_check_interval_ms),
                                 [this]() { return !running_.load(); });
        }
        if (!running_.load())
            break;

        check_health(util::now_ns());
        reap_retired();
    }
}

size_t ConnectionMultiplexer::check_health(uint64_t now) {
    uint64_t stale_after = util::ms_to_ns(settings_.stale_timeout_ms);

    std::vector<SubscriptionPtr> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [instrument, sub] : subscriptions_) {
            bool has_listeners;
            {
                std::lock_guard<std::mutex> sub_lock(sub->mutex);
                has_listeners = !sub->listeners.empty();
            }
            uint64_t last = sub->last_update_ns.load();
            if (has_listeners && now > last && now - last > stale_after)
                stale.push_back(sub);
        }
    }

    for (auto& sub : stale) {
        uint64_t silent_ns = now - sub->last_update_ns.load();
        health_failures_.fetch_add(1);
        TICKGUARD_LOGF(logger_, Warn, Market, "Health check failed for %s: no tick for %.0fs, restarting",
                       sub->instrument.c_str(), static_cast<double>(silent_ns) / 1e9);
        // Give the restarted loop a full stale window before the next check
        sub->last_update_ns.store(now);
        request_restart(*sub);
    }
    return stale.size();
}

// =============================================================================
// Queries
// =============================================================================

ConnectionStats ConnectionMultiplexer::connection_stats() const {
    ConnectionStats stats;
    for (const auto& v : venues_)
        stats.venues_available.push_back(v->name());
    stats.failovers = failovers_.load();
    stats.health_failures = health_failures_.load();
    stats.listener_errors = listener_errors_.load();

    std::lock_guard<std::mutex> lock(mutex_);
    stats.total_instruments = subscriptions_.size();
    for (const auto& [instrument, sub] : subscriptions_) {
        std::lock_guard<std::mutex> sub_lock(sub->mutex);
        stats.total_listeners += sub->listeners.size();
        if (sub->current_venue.empty())
            continue;
        stats.instruments_by_venue[sub->current_venue]++;
        if (sub->polling.load()) {
            stats.polling_instruments++;
        } else {
            stats.active_streams++;
        }
    }
    return stats;
}

bool ConnectionMultiplexer::is_polling(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(instrument);
    return it != subscriptions_.end() && it->second->polling.load();
}

std::string ConnectionMultiplexer::current_venue(const std::string& instrument) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(instrument);
    if (it == subscriptions_.end())
        return "";
    std::lock_guard<std::mutex> sub_lock(it->second->mutex);
    return it->second->current_venue;
}

} // namespace tickguard::market
