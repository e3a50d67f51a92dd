#pragma once
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <atomic>

namespace smsrelay {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

enum class HttpMethod { Get, Post, Put };

// "GET", "POST" or "PUT"
const char* method_name(HttpMethod method);

// Exact, case-sensitive match of the names above
std::optional<HttpMethod> parse_method(const std::string& name);

// status_code == 0 means the request never got a response
// (DNS failure, refused connection, timeout, TLS error).
struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse request(HttpMethod method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers) = 0;

    HttpResponse get(const std::string& url, const std::vector<Header>& headers = {}) {
        return request(HttpMethod::Get, url, "", headers);
    }
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::vector<Header>& headers = {}) {
        return request(HttpMethod::Post, url, body, headers);
    }
    HttpResponse put(const std::string& url, const std::string& body,
                     const std::vector<Header>& headers = {}) {
        return request(HttpMethod::Put, url, body, headers);
    }
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    explicit SocketHttpClient(long timeout_seconds = 30) : timeout_seconds_(timeout_seconds) {}

    HttpResponse request(HttpMethod method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers) override;

private:
    long timeout_seconds_;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long timeout_seconds = 30) : timeout_seconds_(timeout_seconds) {}

    HttpResponse request(HttpMethod method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers) override;

private:
    long timeout_seconds_;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace smsrelay
