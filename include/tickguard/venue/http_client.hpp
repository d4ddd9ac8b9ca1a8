#pragma once

/**
 * Minimal libcurl GET client used by venue polling.
 *
 * One easy handle per client, serialized by a mutex: polling is one request
 * per instrument per second at most, so contention is irrelevant.
 */

#include <curl/curl.h>

#include <mutex>
#include <string>

namespace tickguard {
namespace venue {

class HttpClient {
public:
    static constexpr long DEFAULT_TIMEOUT_SEC = 10;

    explicit HttpClient(long timeout_sec = DEFAULT_TIMEOUT_SEC);
    ~HttpClient();

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @throws VenueError on transport failure or a non-200 status
     */
    std::string get(const std::string& url);

private:
    CURL* curl_;
    long timeout_sec_;
    std::mutex mutex_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output);
};

} // namespace venue
} // namespace tickguard
