// libcurl transport for non-Linux builds. Same contract as http_socket.cpp:
// transport failures come back as status_code 0 and are logged here.
#include "http.hpp"
#include "util.hpp"

#include <curl/curl.h>
#include <iostream>
#include <string>

namespace smsrelay {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

// ── RAII curl handle ──────────────────────────────────────────

class CurlRequest {
public:
    CurlRequest() : curl_(curl_easy_init()) {}
    ~CurlRequest() {
        curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl_ != nullptr; }
    CURL* handle() const { return curl_; }

    void add_header(const std::string& name, const std::string& value) {
        headers_ = curl_slist_append(headers_, (name + ": " + value).c_str());
    }
    void apply_headers() {
        if (headers_) curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    }

private:
    CURL* curl_;
    curl_slist* headers_ = nullptr;
};

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::request(HttpMethod method,
                                     const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers) {
    CurlRequest req;
    if (!req) {
        std::cerr << "[http] curl_easy_init failed\n";
        return {};
    }
    CURL* curl = req.handle();

    for (const auto& h : headers) req.add_header(h.first, h.second);
    req.apply_headers();

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "smsrelay/0.1");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (g_http_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }

    if (method == HttpMethod::Get) {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        // POST and PUT both send the body as request fields; PUT only
        // swaps the verb.
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        if (method == HttpMethod::Put)
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::cerr << "[http] " << method_name(method) << " " << redact_url(url)
                  << ": " << curl_easy_strerror(res) << "\n";
        return {};
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace smsrelay
