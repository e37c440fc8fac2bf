/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#pragma once
#include <memory>
#include "restcl/transport.hpp"
#include "restcl/transport_config.hpp"

namespace restcl {

// HTTP/1.1 over TCP or TLS with keep-alive. Connections are opened lazily on
// the first request and reused while scheme, host and port stay the same.
class SocketTransport : public HttpTransport {
public:
    explicit SocketTransport(const TransportConfig& cfg = TransportConfig{});
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    bool round_trip(const HttpRequest& req,
                    std::chrono::milliseconds timeout,
                    HttpResponse& out,
                    std::string& err) override;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace restcl
