// Linux HTTP/HTTPS transport over POSIX sockets + OpenSSL.
// One connection per request ("Connection: close"); any failure before a
// status line arrives is reported as status_code 0.
#ifdef __linux__

#include "http.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>

namespace smsrelay {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

static bool aborted() {
    return g_socket_abort_flag && g_socket_abort_flag->load(std::memory_order_relaxed);
}

static constexpr const char* kUserAgent = "smsrelay/0.1";

// ── Endpoint ───────────────────────────────────────────────────

struct Endpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target; // origin-form: path plus query, always starts with '/'
};

// Forwarder URLs are built by string concatenation, so "host?q" and a bare
// "host" must both map to a valid request target.
static std::optional<Endpoint> parse_endpoint(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    Endpoint ep;
    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "https")
        ep.tls = true;
    else if (scheme != "http")
        return std::nullopt;

    size_t authority_start = scheme_end + 3;
    size_t target_start = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start, target_start - authority_start);

    if (target_start == std::string::npos || url[target_start] == '#')
        ep.target = "/";
    else if (url[target_start] == '?')
        ep.target = "/" + url.substr(target_start);
    else
        ep.target = url.substr(target_start);
    size_t fragment = ep.target.find('#');
    if (fragment != std::string::npos) ep.target.erase(fragment);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = ep.tls ? "443" : "80";
    }
    // "[::1]" → "::1" for getaddrinfo
    if (ep.host.size() > 2 && ep.host.front() == '[' && ep.host.back() == ']')
        ep.host = ep.host.substr(1, ep.host.size() - 2);

    if (ep.host.empty() || ep.port.empty()) return std::nullopt;
    return ep;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    // Empty string on success, otherwise a short reason for the log
    std::string open(const Endpoint& ep, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(ep.host.c_str(), ep.port.c_str(), &hints, &res);
        if (gai != 0)
            return std::string("cannot resolve ") + ep.host + ": " + gai_strerror(gai);

        for (auto* ai = res; ai && fd_ < 0; ai = ai->ai_next)
            fd_ = connect_with_timeout(ai, timeout_secs);
        freeaddrinfo(res);
        if (fd_ < 0) return "cannot connect to " + ep.host + ":" + ep.port;

        struct timeval tv{timeout_secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (ep.tls) return start_tls(ep.host);
        return "";
    }

    // >0 bytes read, 0 on EOF, -1 on error, timeout or abort
    ssize_t read_some(char* buf, size_t len) {
        if (aborted()) return -1;
        if (ssl_) {
            for (;;) {
                int n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                return -1;
            }
        }
        for (;;) {
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EINTR && !aborted()) continue;
            return -1;
        }
    }

    bool write_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            if (aborted()) return false;
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, p, static_cast<int>(left));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) continue;
                    return false;
                }
            } else {
                n = ::send(fd_, p, left, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    // Non-blocking connect bounded by timeout_secs; returns the fd or -1.
    static int connect_with_timeout(const struct addrinfo* ai, long timeout_secs) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) return -1;

        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        bool ok = false;
        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            ok = true;
        } else if (errno == EINPROGRESS) {
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd, &wset);
            struct timeval tv{timeout_secs, 0};
            if (select(fd + 1, nullptr, &wset, nullptr, &tv) > 0) {
                int err = 0;
                socklen_t elen = sizeof(err);
                ok = getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen) == 0 && err == 0;
            }
        }
        if (!ok) {
            ::close(fd);
            return -1;
        }
        fcntl(fd, F_SETFL, flags);
        return fd;
    }

    std::string start_tls(const std::string& host) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return "cannot create TLS context";
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return "cannot create TLS session";
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, host.c_str()); // SNI
        SSL_set1_host(ssl_, host.c_str());

        if (SSL_connect(ssl_) != 1) {
            char err[256];
            ERR_error_string_n(ERR_get_error(), err, sizeof(err));
            return std::string("TLS handshake with ") + host + " failed: " + err;
        }
        return "";
    }

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};

// ── Request ────────────────────────────────────────────────────

static std::string build_request(HttpMethod method,
                                 const Endpoint& ep,
                                 const std::string& body,
                                 const std::vector<Header>& headers) {
    std::string req;
    req.reserve(256 + ep.target.size() + body.size());
    req += method_name(method);
    req += " " + ep.target + " HTTP/1.1\r\n";
    req += "Host: " + ep.host;
    if (ep.port != (ep.tls ? "443" : "80")) req += ":" + ep.port;
    req += "\r\n";

    bool has_length = false, has_agent = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        std::string name = to_lower(h.first);
        has_length = has_length || name == "content-length";
        has_agent = has_agent || name == "user-agent";
    }
    if (!has_agent) req += std::string("User-Agent: ") + kUserAgent + "\r\n";
    // POST/PUT always carry a length, even when empty
    if (method != HttpMethod::Get && !has_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response ───────────────────────────────────────────────────

// Buffers socket reads so the head can be parsed line by line and the body
// framed by chunked encoding, Content-Length, or connection close.
class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    // Status code of the final response (interim 1xx responses are skipped),
    // or 0 when no valid status line arrived.
    long read_head() {
        for (;;) {
            long status = read_status_line();
            if (status == 0) return 0;
            if (!read_headers()) return 0;
            if (status >= 200 || status < 100) return status;
            chunked_ = false;
            content_length_.reset();
        }
    }

    std::string read_body() {
        std::string body;
        if (chunked_) {
            read_chunked(body);
        } else if (content_length_) {
            read_exactly(*content_length_, body);
        } else {
            body.swap(buffer_);
            char buf[4096];
            ssize_t n;
            while ((n = conn_.read_some(buf, sizeof(buf))) > 0)
                body.append(buf, static_cast<size_t>(n));
        }
        return body;
    }

private:
    bool fill() {
        char buf[4096];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        buffer_.append(buf, static_cast<size_t>(n));
        return true;
    }

    // CRLF-terminated line without the terminator; nullopt on EOF/error
    std::optional<std::string> read_line() {
        size_t pos;
        while ((pos = buffer_.find('\n')) == std::string::npos)
            if (!fill()) return std::nullopt;
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return line;
    }

    bool read_exactly(size_t n, std::string& out) {
        while (buffer_.size() < n)
            if (!fill()) {
                out += buffer_;
                buffer_.clear();
                return false;
            }
        out.append(buffer_, 0, n);
        buffer_.erase(0, n);
        return true;
    }

    // "HTTP/1.1 200 OK" → 200
    long read_status_line() {
        auto line = read_line();
        if (!line || line->compare(0, 5, "HTTP/") != 0) return 0;
        size_t sp = line->find(' ');
        if (sp == std::string::npos || line->size() < sp + 4) return 0;
        std::string code = line->substr(sp + 1, 3);
        if (!std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; }))
            return 0;
        return std::stol(code);
    }

    bool read_headers() {
        for (;;) {
            auto line = read_line();
            if (!line) return false;
            if (line->empty()) return true;

            size_t colon = line->find(':');
            if (colon == std::string::npos) continue;
            std::string name = to_lower(line->substr(0, colon));
            std::string value = to_lower(trim(line->substr(colon + 1)));

            if (name == "transfer-encoding") {
                chunked_ = value.find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                char* end = nullptr;
                unsigned long long len = std::strtoull(value.c_str(), &end, 10);
                if (end && *end == '\0' && !value.empty())
                    content_length_ = static_cast<size_t>(len);
            }
        }
    }

    void read_chunked(std::string& body) {
        for (;;) {
            auto size_line = read_line();
            if (!size_line) return;
            // Hex size, optionally followed by ";extensions"
            size_t chunk = std::strtoul(size_line->c_str(), nullptr, 16);
            if (chunk == 0) return;
            std::string crlf;
            if (!read_exactly(chunk, body) || !read_exactly(2, crlf)) return;
        }
    }

    Connection& conn_;
    std::string buffer_;
    bool chunked_ = false;
    std::optional<size_t> content_length_;
};

// ── Public API ─────────────────────────────────────────────────

static HttpResponse fail(HttpMethod method, const std::string& url, const std::string& reason) {
    std::cerr << "[http] " << method_name(method) << " " << redact_url(url)
              << ": " << reason << "\n";
    return {};
}

HttpResponse SocketHttpClient::request(HttpMethod method,
                                       const std::string& url,
                                       const std::string& body,
                                       const std::vector<Header>& headers) {
    auto ep = parse_endpoint(url);
    if (!ep) return fail(method, url, "unsupported URL");

    Connection conn;
    std::string error = conn.open(*ep, timeout_seconds_);
    if (!error.empty()) return fail(method, url, error);

    if (!conn.write_all(build_request(method, *ep, body, headers)))
        return fail(method, url, aborted() ? "aborted" : "write failed");

    ResponseReader reader(conn);
    HttpResponse resp;
    resp.status_code = reader.read_head();
    if (resp.status_code == 0)
        return fail(method, url, aborted() ? "aborted" : "no response (timeout or connection closed)");
    resp.body = reader.read_body();
    return resp;
}

} // namespace smsrelay

#endif // __linux__
