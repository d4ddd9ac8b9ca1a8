#include "../../include/tickguard/venue/http_client.hpp"
#include "../../include/tickguard/venue/ivenue.hpp"

namespace tickguard::venue {

HttpClient::HttpClient(long timeout_sec) : curl_(nullptr), timeout_sec_(timeout_sec) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl_ = curl_easy_init();
    if (!curl_) {
        curl_global_cleanup();
        throw VenueError("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string HttpClient::get(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string response;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_sec_);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L); // called from worker threads

    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        throw VenueError(std::string("CURL error: ") + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        throw VenueError("HTTP error " + std::to_string(http_code) + " from " + url);
    }

    return response;
}

} // namespace tickguard::venue
