/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#pragma once
#include <string>
#include <unordered_map>
#include <functional>
#include <cstddef>
#include <cstdint>
#include "restcl/http_response.hpp"

namespace restcl::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to host:port with a bounded connect.
    bool open(const std::string& host, std::uint16_t port,
              int connect_timeout_sec, int io_timeout_sec);

    void close();
    int  fd() const { return _fd; }

    // Replace SO_SNDTIMEO/SO_RCVTIMEO on the open socket.
    bool set_io_timeout_ms(long ms);

    bool send_all(const char* d, std::size_t len);
    long recv_some(char* d, std::size_t len);

private:
    int _fd = -1;
};

// Reads up to len bytes; returns <= 0 on EOF, timeout or error.
using ReadSomeFn = std::function<long(char*, std::size_t)>;

// Parse status line and headers. hdr_end_off points past the blank line.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers);

// Read one HTTP/1.1 response. The body is framed by chunked encoding,
// Content-Length or connection close, in that order of precedence.
// must_close is set when the connection cannot carry another request.
bool read_http_response(const ReadSomeFn& read_some,
                        bool head_request,
                        HttpResponse& out,
                        bool& must_close,
                        std::size_t max_header_bytes = (1u<<20));

} // namespace restcl::internal
