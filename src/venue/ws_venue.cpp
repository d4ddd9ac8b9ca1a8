#include "../../include/tickguard/venue/ws_venue.hpp"
#include "../../include/tickguard/util/time_utils.hpp"

#include <chrono>
#include <cstring>
#include <deque>
#include <vector>

namespace tickguard::venue {

using json = nlohmann::json;

namespace {

constexpr size_t RX_BUFFER_SIZE = 65536;
constexpr size_t MAX_MESSAGE_SIZE = 1 << 20;

struct ContextGuard {
    struct lws_context* context;
    ~ContextGuard() {
        if (context)
            lws_context_destroy(context);
    }
};

} // namespace

/**
 * Per-stream state handed to libwebsockets as context user data.
 */
struct WsVenue::Session {
    const VenueProtocol* protocol = nullptr;
    const PriceHandler* on_price = nullptr;
    std::string subscribe_message;

    struct lws* wsi = nullptr;
    bool connected = false;
    bool closed = false;
    std::string error;

    std::string rx_buffer;
    std::deque<std::string> outbox;
};

WsVenue::WsVenue(VenueProtocol protocol) : protocol_(std::move(protocol)), closed_(false) {}

WsVenue::~WsVenue() { close(); }

void WsVenue::close() { closed_.store(true); }

// =============================================================================
// libwebsockets callback
// =============================================================================

void WsVenue::handle_message(Session& session) {
    json msg = json::parse(session.rx_buffer, nullptr, false);
    session.rx_buffer.clear();
    if (msg.is_discarded())
        return; // "pong" and other plain-text frames

    std::optional<double> price;
    try {
        price = session.protocol->parse_tick(msg);
    } catch (const json::exception&) {
        return; // unexpected field types: not a ticker message
    }
    if (!price || *price <= 0.0)
        return;

    try {
        (*session.on_price)(*price, util::wall_clock_ns());
    } catch (const std::exception& e) {
        session.error = std::string("price handler failed: ") + e.what();
        session.closed = true;
    }
}

int WsVenue::ws_callback(struct lws* wsi, enum lws_callback_reasons reason, void* /*user*/, void* in,
                         size_t len) {
    struct lws_context* context = lws_get_context(wsi);
    Session* session = context ? static_cast<Session*>(lws_context_user(context)) : nullptr;
    if (!session)
        return 0;

    switch (reason) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED: {
        session->wsi = wsi;
        session->connected = true;
        if (!session->subscribe_message.empty()) {
            session->outbox.push_back(session->subscribe_message);
            lws_callback_on_writable(wsi);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_RECEIVE:
        if (in && len > 0) {
            session->rx_buffer.append(static_cast<const char*>(in), len);
            if (session->rx_buffer.size() > MAX_MESSAGE_SIZE) {
                session->error = "message exceeds " + std::to_string(MAX_MESSAGE_SIZE) + " bytes";
                session->closed = true;
                return -1;
            }
            if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0) {
                handle_message(*session);
            }
        }
        break;

    case LWS_CALLBACK_CLIENT_WRITEABLE: {
        if (session->outbox.empty())
            break;
        const std::string& text = session->outbox.front();
        std::vector<unsigned char> buf(LWS_PRE + text.size());
        std::memcpy(buf.data() + LWS_PRE, text.data(), text.size());
        int written = lws_write(wsi, buf.data() + LWS_PRE, text.size(), LWS_WRITE_TEXT);
        session->outbox.pop_front();
        if (written < static_cast<int>(text.size())) {
            session->error = "write failed";
            session->closed = true;
            return -1;
        }
        if (!session->outbox.empty())
            lws_callback_on_writable(wsi);
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        session->error = in ? std::string(static_cast<const char*>(in), len) : "connection error";
        session->connected = false;
        session->closed = true;
        session->wsi = nullptr;
        break;

    case LWS_CALLBACK_CLIENT_CLOSED:
        session->connected = false;
        session->closed = true;
        session->wsi = nullptr;
        break;

    default:
        break;
    }

    return 0;
}

// =============================================================================
// Streaming
// =============================================================================

void WsVenue::stream(const std::string& instrument, const PriceHandler& on_price,
                     const std::atomic<bool>& cancel) {
    util::NormalizedSymbol symbol;
    try {
        symbol = util::parse_venue_symbol(instrument);
    } catch (const std::invalid_argument& e) {
        throw VenueError(protocol_.name + ": " + e.what());
    }
    VenueEndpoint ep = protocol_.endpoint(symbol);

    Session session;
    session.protocol = &protocol_;
    session.on_price = &on_price;
    session.subscribe_message = ep.subscribe_message;

    static const struct lws_protocols protocols[] = {
        {
            "tickguard-ws",
            &WsVenue::ws_callback,
            0,
            RX_BUFFER_SIZE,
        },
        {nullptr, nullptr, 0, 0}};

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    info.user = &session;

    ContextGuard guard{lws_create_context(&info)};
    if (!guard.context) {
        throw VenueError(protocol_.name + ": failed to create WebSocket context");
    }

    struct lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof(ccinfo));
    ccinfo.context = guard.context;
    ccinfo.address = ep.host.c_str();
    ccinfo.port = ep.port;
    ccinfo.path = ep.path.c_str();
    ccinfo.host = ep.host.c_str();
    ccinfo.origin = ep.host.c_str();
    ccinfo.local_protocol_name = protocols[0].name;
    ccinfo.ssl_connection = LCCSCF_USE_SSL;

    if (!lws_client_connect_via_info(&ccinfo)) {
        throw VenueError(protocol_.name + ": failed to connect to " + ep.host);
    }

    auto started = std::chrono::steady_clock::now();
    auto last_ping = started;

    while (!cancel.load() && !closed_.load() && !session.closed) {
        lws_service(guard.context, SERVICE_TIMEOUT_MS);

        auto now = std::chrono::steady_clock::now();
        if (!session.connected && !session.closed &&
            now - started > std::chrono::seconds(CONNECT_TIMEOUT_SEC)) {
            throw VenueError(protocol_.name + ": connect timeout for " + instrument);
        }

        if (session.connected && session.wsi && !protocol_.ping_message.empty() &&
            protocol_.ping_interval_sec > 0 && now - last_ping > std::chrono::seconds(protocol_.ping_interval_sec)) {
            session.outbox.push_back(protocol_.ping_message);
            lws_callback_on_writable(session.wsi);
            last_ping = now;
        }
    }

    if (cancel.load() || closed_.load())
        return;

    throw VenueError(protocol_.name + ": stream for " + instrument +
                     " closed: " + (session.error.empty() ? "connection closed" : session.error));
}

// =============================================================================
// Polling
// =============================================================================

double WsVenue::fetch_price(const std::string& instrument) {
    util::NormalizedSymbol symbol;
    try {
        symbol = util::parse_venue_symbol(instrument);
    } catch (const std::invalid_argument& e) {
        throw VenueError(protocol_.name + ": " + e.what());
    }

    std::string body = http_.get(protocol_.rest_url(symbol));
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        throw VenueError(protocol_.name + ": malformed ticker response for " + instrument);
    }

    std::optional<double> price;
    try {
        price = protocol_.parse_rest_price(doc);
    } catch (const json::exception& e) {
        throw VenueError(protocol_.name + ": unexpected ticker response: " + e.what());
    }
    if (!price || *price <= 0.0) {
        throw VenueError(protocol_.name + ": no price in ticker response for " + instrument);
    }
    return *price;
}

} // namespace tickguard::venue
