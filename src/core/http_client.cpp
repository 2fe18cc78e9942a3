#include <meshgate/core/http_client.hpp>
#include <meshgate/core/logger.hpp>
#include <sstream>

namespace meshgate {

HttpClient::HttpClient() : curl_(nullptr), timeout_ms_(30000) {
    curl_ = curl_easy_init();
    if (!curl_) {
        LOG_ERROR("[HTTP] curl_easy_init failed");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

void HttpClient::set_timeout(long ms) {
    timeout_ms_ = ms;
}

void HttpClient::set_unix_socket(const std::string& path) {
    unix_socket_ = path;
}

size_t HttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    std::string* body = static_cast<std::string*>(userdata);
    if (body->size() + total > HTTP_MAX_BODY_BYTES) {
        return 0;    // aborts the transfer with CURLE_WRITE_ERROR
    }
    body->append(ptr, total);
    return total;
}

HttpResponse HttpClient::get(const std::string& url) {
    HttpResponse resp;

    if (!curl_) {
        resp.error = "CURL not initialized";
        return resp;
    }

    curl_easy_reset(curl_);

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);

    // NOSIGNAL: probes may run off the main thread
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_ / 2);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (!unix_socket_.empty()) {
        curl_easy_setopt(curl_, CURLOPT_UNIX_SOCKET_PATH, unix_socket_.c_str());
    }

    struct curl_slist* header_list = curl_slist_append(nullptr, "Accept: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    std::string body;
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &body);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        resp.error = res == CURLE_WRITE_ERROR ? "response body too large" : curl_easy_strerror(res);
        return resp;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status_code);
    resp.body = body;

    if (!resp.ok()) {
        std::ostringstream oss;
        oss << "HTTP " << resp.status_code;
        if (!body.empty()) {
            oss << ": " << (body.size() > 200 ? body.substr(0, 200) + "..." : body);
        }
        resp.error = oss.str();
    }

    return resp;
}

} // namespace meshgate
