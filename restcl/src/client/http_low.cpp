// SPDX-License-Identifier: Apache-2.0
// Part of the RestCL project.
// restcl/src/client/http_low.cpp

#include "restcl/internal/http_low.hpp"
#include "restcl/log.hpp"
#include "restcl/internal/utils.hpp"
#include "restcl/internal/http_parser.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/tcp.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <algorithm>

#include <fcntl.h>   // fcntl, O_NONBLOCK
#include <poll.h>    // poll

namespace restcl::internal {

namespace {

// Buffered line/byte reader over a ReadSomeFn.
class Reader {
public:
    explicit Reader(const ReadSomeFn& fn) : _fn(fn) {}

    std::string& buf() { return _buf; }

    bool fill() {
        char tmp[4096];
        const long n = _fn(tmp, sizeof(tmp));
        if (n <= 0) return false;
        _buf.append(tmp, tmp + n);
        return true;
    }

    bool read_line(std::string& line, std::size_t max_len) {
        std::size_t pos;
        while ((pos = _buf.find("\r\n")) == std::string::npos) {
            if (_buf.size() > max_len) return false;
            if (!fill()) return false;
        }
        line = _buf.substr(0, pos);
        _buf.erase(0, pos + 2);
        return true;
    }

    bool read_exact(std::string& out, std::size_t n) {
        while (_buf.size() < n) {
            if (!fill()) return false;
        }
        out.append(_buf, 0, n);
        _buf.erase(0, n);
        return true;
    }

    void read_to_eof(std::string& out) {
        while (fill()) {}
        out += _buf;
        _buf.clear();
    }

private:
    const ReadSomeFn& _fn;
    std::string _buf;
};

bool read_chunked(Reader& rd, std::string& body) {
    std::string line;
    for (;;) {
        if (!rd.read_line(line, 1024)) return false;
        const std::size_t semi = line.find(';'); // chunk extensions are ignored
        if (semi != std::string::npos) line.erase(semi);
        trim_inplace(line);
        if (line.empty()) return false;

        std::size_t size = 0;
        for (char c : line) {
            const int v = hexval(c);
            if (v < 0) return false;
            if (size > (std::size_t(1) << 40)) return false;
            size = (size << 4) | static_cast<std::size_t>(v);
        }
        if (size == 0) break;

        if (!rd.read_exact(body, size)) return false;
        std::string crlf;
        if (!rd.read_exact(crlf, 2) || crlf != "\r\n") return false;
    }
    // trailer section up to the empty line
    for (;;) {
        if (!rd.read_line(line, 8192)) return false;
        if (line.empty()) return true;
    }
}

} // namespace

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const std::string& host, std::uint16_t port,
                   int connect_timeout_sec, int io_timeout_sec) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        restcl::log_line("TCP", std::string("getaddrinfo failed: ") + gai_strerror(rc), restcl::LogLevel::Warn);
        return false;
    }

    const int connect_timeout_ms = std::max(1, connect_timeout_sec) * 1000;

    int s_ok = -1;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) continue;

        // Switch to non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0) { ::close(s); continue; }
        if (fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) { ::close(s); continue; }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd     = s;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            int pr = ::poll(&pfd, 1, connect_timeout_ms);
            if (pr <= 0 || !(pfd.revents & POLLOUT)) {
                ::close(s);
                continue;
            }
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                ::close(s);
                continue;
            }
        } else if (ret < 0) {
            ::close(s);
            continue;
        }

        // Back to blocking mode for normal I/O (SO_*TIMEO will work)
        (void)fcntl(s, F_SETFL, flags);

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        restcl::log_line("TCP", "connect to " + host + ":" + std::to_string(port) +
                         " failed (timed out or refused)", restcl::LogLevel::Warn);
        return false;
    }

    _fd = s_ok;
    return set_io_timeout_ms(static_cast<long>(std::max(1, io_timeout_sec)) * 1000);
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

bool TcpConn::set_io_timeout_ms(long ms) {
    if (_fd < 0) return false;
    timeval tv{};
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    if (setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) return false;
    if (setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) return false;
    return true;
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += (std::size_t)n;
    }
    return true;
}

long TcpConn::recv_some(char* d, std::size_t len) {
    ssize_t n = 0;
    do {
        n = ::recv(_fd, d, len, 0);
    } while (n < 0 && errno == EINTR);
    return static_cast<long>(n);
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    if (line_end == std::string::npos) line_end = hdrs.size();
    std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    std::getline(iss, status_text);
    if (!status_text.empty() && status_text[0] == ' ') status_text.erase(0,1);

    headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < hdrs.size()) {
        std::size_t next = hdrs.find("\r\n", pos);
        if (next == std::string::npos) next = hdrs.size();
        std::string line = hdrs.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            headers[k] = v;
        }
    }
    return true;
}

bool read_http_response(const ReadSomeFn& read_some,
                        bool head_request,
                        HttpResponse& out,
                        bool& must_close,
                        std::size_t max_header_bytes)
{
    Reader rd(read_some);
    const std::string delim = "\r\n\r\n";
    while (rd.buf().find(delim) == std::string::npos) {
        if (rd.buf().size() > max_header_bytes) return false;
        if (!rd.fill()) return false;
    }

    std::size_t hdr_end_off = 0;
    if (!parse_http_response(rd.buf(), hdr_end_off, out.status_code, out.status_text, out.headers)) {
        return false;
    }
    rd.buf().erase(0, hdr_end_off);

    const std::string conn = lower_copy(hdr_ci(out.headers, "Connection"));
    must_close = (conn == "close");

    out.body.clear();
    const bool no_body = head_request || out.status_code == 204 || out.status_code == 304 ||
                         (out.status_code >= 100 && out.status_code < 200);
    if (no_body) return true;

    const std::string te = lower_copy(hdr_ci(out.headers, "Transfer-Encoding"));
    if (te.find("chunked") != std::string::npos) {
        return read_chunked(rd, out.body);
    }

    const std::string cl = hdr_ci(out.headers, "Content-Length");
    if (!cl.empty()) {
        if (!std::all_of(cl.begin(), cl.end(), [](unsigned char c){ return c >= '0' && c <= '9'; }) ||
            cl.size() > 18) {
            return false;
        }
        const std::size_t content_len = static_cast<std::size_t>(std::stoull(cl));
        return rd.read_exact(out.body, content_len);
    }

    // No framing: body runs to end of stream.
    must_close = true;
    rd.read_to_eof(out.body);
    return true;
}

} // namespace restcl::internal
