#include "market_data/http_client.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>

namespace updown {

namespace {
    // CURL write callback
    size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }
}

CurlHttpClient::CurlHttpClient() {
    curl_global_init(CURL_GLOBAL_ALL);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(const std::string& url, int timeout_ms) {
    return perform(url, nullptr, timeout_ms);
}

HttpResponse CurlHttpClient::post(const std::string& url, const std::string& body, int timeout_ms) {
    return perform(url, &body, timeout_ms);
}

HttpResponse CurlHttpClient::perform(const std::string& url, const std::string* body, int timeout_ms) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw UpstreamError("Failed to initialize CURL");
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        spdlog::debug("{} {} failed: {}", body ? "POST" : "GET", url, curl_easy_strerror(res));
        throw UpstreamError(std::string("CURL request failed: ") + curl_easy_strerror(res));
    }

    return response;
}

} // namespace updown
