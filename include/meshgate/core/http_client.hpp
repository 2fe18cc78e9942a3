#ifndef MESHGATE_CORE_HTTP_CLIENT_HPP
#define MESHGATE_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <curl/curl.h>

namespace meshgate {

// Bodies beyond this are treated as a failed request
const size_t HTTP_MAX_BODY_BYTES = 1024 * 1024;

struct HttpResponse {
    long status_code;
    std::string body;
    std::string error;

    HttpResponse() : status_code(0) {}

    bool ok() const { return status_code >= 200 && status_code < 300; }

    // Parsed body, or null JSON when the body is not JSON
    Json json() const {
        Json parsed = Json::parse(body, nullptr, false);
        return parsed.is_discarded() ? Json() : parsed;
    }
};

// Blocking JSON-over-HTTP client used by discovery probes.
// Wraps one curl easy handle, so an instance must stay on one thread.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    void set_timeout(long ms);

    // Route requests through a unix domain socket (tailscaled's LocalAPI).
    // The URL host is then only used for the Host header.
    void set_unix_socket(const std::string& path);

    HttpResponse get(const std::string& url);

private:
    HttpClient(const HttpClient&);
    HttpClient& operator=(const HttpClient&);

    CURL* curl_;
    long timeout_ms_;
    std::string unix_socket_;

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
};

} // namespace meshgate

#endif // MESHGATE_CORE_HTTP_CLIENT_HPP
