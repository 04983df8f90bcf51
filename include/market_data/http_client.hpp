#pragma once

#include <string>

namespace updown {

struct HttpResponse {
    long status{0};
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * Minimal blocking HTTP transport used by the REST clients.
 * Transport failures (DNS, connect, timeout) throw UpstreamError;
 * HTTP error statuses are returned, not thrown.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, int timeout_ms) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body, int timeout_ms) = 0;
};

/**
 * libcurl implementation. One easy handle per request.
 */
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url, int timeout_ms) override;
    HttpResponse post(const std::string& url, const std::string& body, int timeout_ms) override;

private:
    HttpResponse perform(const std::string& url, const std::string* body, int timeout_ms);
};

} // namespace updown
