#pragma once

/**
 * WsVenue - libwebsockets streaming venue driven by a VenueProtocol.
 *
 * Each stream() call owns its own lws context and runs the service loop on
 * the calling thread (the multiplexer's watch thread for that instrument),
 * so instruments never share a connection or a lock.
 *
 * fetch_price() polls the venue's REST ticker through libcurl.
 *
 * Usage:
 *   WsVenue bybit(bybit_protocol());
 *   std::atomic<bool> cancel{false};
 *   bybit.stream("BTC/USDT:USDT", [](double price, Timestamp ts) { ... }, cancel);
 */

#include "http_client.hpp"
#include "ivenue.hpp"
#include "venue_protocol.hpp"

#include <libwebsockets.h>

#include <atomic>
#include <string>

namespace tickguard {
namespace venue {

class WsVenue : public IVenue {
public:
    // Connection must be established within this window
    static constexpr int CONNECT_TIMEOUT_SEC = 15;
    static constexpr int SERVICE_TIMEOUT_MS = 100;

    explicit WsVenue(VenueProtocol protocol);
    ~WsVenue() override;

    // Non-copyable
    WsVenue(const WsVenue&) = delete;
    WsVenue& operator=(const WsVenue&) = delete;

    const std::string& name() const override { return protocol_.name; }

    void stream(const std::string& instrument, const PriceHandler& on_price,
                const std::atomic<bool>& cancel) override;

    double fetch_price(const std::string& instrument) override;

    void close() override;

    const VenueProtocol& protocol() const { return protocol_; }

private:
    struct Session;

    VenueProtocol protocol_;
    HttpClient http_;
    std::atomic<bool> closed_;

    static int ws_callback(struct lws* wsi, enum lws_callback_reasons reason, void* user, void* in, size_t len);
    static void handle_message(Session& session);
};

} // namespace venue
} // namespace tickguard
