/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/socket_transport.hpp"
#include "restcl/log.hpp"

#include "restcl/internal/utils.hpp"
#include "restcl/internal/http_parser.hpp"
#include "restcl/internal/tls_cli_ctx.hpp"
#include "restcl/internal/http_low.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sstream>
#include <algorithm>
#include <mutex>
#include <memory>

#include <chrono>
#include <limits>
#include <cstring>

#include <poll.h>
#include <cerrno>
#include <fcntl.h>

#include <sys/types.h>
#include <sys/socket.h>

namespace {

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

[[nodiscard]] bool wait_fd(int fd, short ev, int ms) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = ev;
    int pr = 0;
    do {
        pr = ::poll(&pfd, 1, ms);
    } while (pr < 0 && errno == EINTR);
    return pr > 0;
}

// TLS handshake that handles WANT_READ/WANT_WRITE within a bounded deadline.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_sec) {
    if (!ssl || fd < 0) return false;

    const int effective_timeout = std::max(1, timeout_sec);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) {
            return true;
        }

        const int ssl_err = ::SSL_get_error(ssl, rc);

        if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
            const short ev = (ssl_err == SSL_ERROR_WANT_READ) ? POLLIN : POLLOUT;
            const int ms = remaining_ms(deadline);
            if (ms <= 0 || !wait_fd(fd, ev, ms)) {
                restcl::log_line("TRANSPORT", "SSL_connect timeout", restcl::LogLevel::Warn);
                return false;
            }
            continue;
        }

        if (ssl_err == SSL_ERROR_SYSCALL) {
            const int e = errno;
            if (e == EINTR) {
                continue;
            }
            if (e == EAGAIN || e == EWOULDBLOCK) {
                const int ms = remaining_ms(deadline);
                if (ms <= 0 || !wait_fd(fd, POLLIN, ms)) {
                    restcl::log_line("TRANSPORT", "SSL_connect timeout (EAGAIN)", restcl::LogLevel::Warn);
                    return false;
                }
                continue;
            }

            restcl::log_line("TRANSPORT", "SSL_connect syscall error: errno=" + std::to_string(e) +
                             " (" + std::strerror(e) + ")", restcl::LogLevel::Error);
            (void)restcl::internal::drain_openssl_errors("SSL_connect");
            return false;
        }

        restcl::log_line("TRANSPORT", "SSL_connect failed: ssl_error=" + std::to_string(ssl_err),
                         restcl::LogLevel::Error);
        (void)restcl::internal::drain_openssl_errors("SSL_connect");
        return false;
    }
}

} // namespace

namespace restcl {

struct SocketTransport::Impl {
    TransportConfig cfg;

    std::unique_ptr<internal::TlsClientContext> tls; // created on first https request

    // Keep-alive state
    std::mutex mtx;
    std::unique_ptr<internal::TcpConn> plain;
    std::unique_ptr<SSL, void(*)(SSL*)> ssl{nullptr, [](SSL* s){ if(s){ SSL_free(s); } }};
    std::string conn_key;   // "scheme://host:port" of the open connection
    int served_on_conn = 0;

    explicit Impl(const TransportConfig& c): cfg(c) {}

    ~Impl() {
        std::lock_guard<std::mutex> lk(mtx);
        close_conn_locked();
    }

    static std::string key_of(const Url& u) {
        return u.scheme + "://" + u.host + ":" + std::to_string(u.port);
    }

    void close_conn_locked() {
        if (ssl) {
            SSL_shutdown(ssl.get());
            ssl.reset(nullptr);
        }
        if (plain) {
            plain->close();
            plain.reset();
        }
        conn_key.clear();
        served_on_conn = 0;
    }

    void fail_conn_locked(SSL* s) {
        if (s) SSL_free(s);
        if (plain) {
            plain->close();
            plain.reset();
        }
    }

    bool ensure_conn_locked(const Url& u, std::string& err) {
        const std::string key = key_of(u);
        const bool open = u.is_tls() ? static_cast<bool>(ssl) : static_cast<bool>(plain);
        if (open && key == conn_key && served_on_conn < cfg.ka_max) return true;
        close_conn_locked();

        plain = std::make_unique<internal::TcpConn>();
        if (!plain->open(u.host, u.port, cfg.connect_timeout_sec, cfg.io_timeout_sec)) {
            plain.reset();
            err = "connect to " + u.authority() + " failed";
            return false;
        }

        if (!u.is_tls()) {
            conn_key = key;
            served_on_conn = 0;
            return true;
        }

        if (!tls) {
            tls = std::make_unique<internal::TlsClientContext>(cfg);
        }
        SSL* s = tls->new_session(plain->fd(), u.host, err);
        if (!s) {
            fail_conn_locked(nullptr);
            return false;
        }

        const int fd = plain->fd();
        const int old_flags = ::fcntl(fd, F_GETFL, 0);
        if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
            fail_conn_locked(s);
            err = "fcntl(O_NONBLOCK) failed";
            return false;
        }

        const int handshake_timeout_sec = std::max(5, cfg.connect_timeout_sec);
        const bool hs_ok = ssl_connect_with_deadline(s, fd, handshake_timeout_sec);

        (void)::fcntl(fd, F_SETFL, old_flags);

        if (!hs_ok) {
            fail_conn_locked(s);
            err = "TLS handshake with " + u.authority() + " failed";
            return false;
        }

        if (!tls->check_peer(s, err)) {
            fail_conn_locked(s);
            return false;
        }

        ssl.reset(s);
        conn_key = key;
        served_on_conn = 0;
        return true;
    }

    bool send_all_locked(const std::string& data) {
        if (ssl) {
            std::size_t off = 0;
            while (off < data.size()) {
                int n = SSL_write(ssl.get(), data.data() + off, (int)(data.size() - off));
                if (n <= 0) { (void)SSL_get_error(ssl.get(), n); return false; }
                off += (std::size_t)n;
            }
            return true;
        }
        return plain->send_all(data.data(), data.size());
    }

    long read_some_locked(char* buf, std::size_t len) {
        if (ssl) {
            const int n = SSL_read(ssl.get(), buf, (int)std::min<std::size_t>(len, 1u<<20));
            if (n <= 0) { (void)SSL_get_error(ssl.get(), n); }
            return n;
        }
        return plain->recv_some(buf, len);
    }

    static std::string build_head(const HttpRequest& req, const std::string& user_agent) {
        const Url& u = req.url;
        std::string target = u.path.empty() ? "/" : u.path;
        if (!u.query.empty()) target += "?" + u.query;

        std::ostringstream oss;
        oss << internal::upper_copy(req.method) << " " << target << " HTTP/1.1\r\n";
        oss << "Host: " << u.authority() << "\r\n";
        if (internal::hdr_ci(req.headers, "User-Agent").empty()) {
            oss << "User-Agent: " << user_agent << "\r\n";
        }
        if (internal::hdr_ci(req.headers, "Accept").empty()) {
            oss << "Accept: application/json, */*\r\n";
        }
        for (const auto& kv : req.headers) {
            oss << kv.first << ": " << kv.second << "\r\n";
        }
        oss << "Connection: keep-alive\r\n";
        oss << "Content-Length: " << req.body.size() << "\r\n";
        oss << "\r\n";
        return oss.str();
    }
};

SocketTransport::SocketTransport(const TransportConfig& cfg)
    : _p(std::make_unique<SocketTransport::Impl>(cfg)) {}

SocketTransport::~SocketTransport() = default;

bool SocketTransport::round_trip(const HttpRequest& req,
                                 std::chrono::milliseconds timeout,
                                 HttpResponse& out,
                                 std::string& err)
{
    std::lock_guard<std::mutex> lk(_p->mtx);
    if (!_p->ensure_conn_locked(req.url, err)) {
        restcl::log_line("TRANSPORT", err, LogLevel::Warn);
        return false;
    }

    const long io_ms = timeout.count() > 0
        ? static_cast<long>(timeout.count())
        : static_cast<long>(std::max(1, _p->cfg.io_timeout_sec)) * 1000;
    if (!_p->plain->set_io_timeout_ms(io_ms)) {
        _p->close_conn_locked();
        err = "setting socket timeout failed";
        return false;
    }

    const std::string head = Impl::build_head(req, _p->cfg.user_agent);
    if (!_p->send_all_locked(head) ||
        (!req.body.empty() && !_p->send_all_locked(req.body))) {
        _p->close_conn_locked();
        err = "send to " + req.url.authority() + " failed";
        return false;
    }

    bool must_close = false;
    const internal::ReadSomeFn read_some = [this](char* buf, std::size_t len) {
        return _p->read_some_locked(buf, len);
    };
    const bool head_req = internal::upper_copy(req.method) == "HEAD";
    if (!internal::read_http_response(read_some, head_req, out, must_close)) {
        _p->close_conn_locked();
        err = "reading response from " + req.url.authority() + " failed";
        return false;
    }

    _p->served_on_conn++;
    if (must_close || _p->served_on_conn >= _p->cfg.ka_max) {
        _p->close_conn_locked();
    }
    return true;
}

} // namespace restcl
