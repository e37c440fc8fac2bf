/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include "restcl/transport_config.hpp"

namespace restcl::internal {

// Drain the OpenSSL error queue into the log under the TLS-CLI tag.
// Returns the text of the last error, empty when the queue was empty.
std::string drain_openssl_errors(const char* where);

bool is_ip_literal(const std::string& host);

// Client side TLS state shared by every connection of one transport:
// trust store, optional client identity, and the peer naming rules of
// TransportConfig (SNI override, hostname/IP verification).
class TlsClientContext {
public:
    explicit TlsClientContext(const restcl::TransportConfig& cfg);
    ~TlsClientContext();

    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

    bool ready() const { return _ctx != nullptr && _err.empty(); }
    // First setup failure, empty when ready().
    const std::string& error() const { return _err; }

    // New session over fd for a server reached as host. Sends SNI (the
    // configured override, else host unless it is an IP literal) and, when
    // peer verification is on, binds the certificate check to that name.
    // Returns nullptr and sets err on failure.
    SSL* new_session(int fd, const std::string& host, std::string& err) const;

    // Post-handshake chain check; always true with verification off.
    bool check_peer(SSL* s, std::string& err) const;

private:
    bool load_trust(const restcl::TransportConfig& cfg);
    bool load_identity(const restcl::TransportConfig& cfg);
    void fail(const std::string& what, const char* where);

    SSL_CTX* _ctx = nullptr;
    bool _verify_peer = true;
    std::string _sni_override;
    std::string _err;
};

} // namespace restcl::internal
