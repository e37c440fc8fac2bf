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

namespace restcl {

// Socket transport configuration. Per-instance; thread-safe at call level.
struct TransportConfig {
    // Timeouts
    int connect_timeout_sec = 5;   // TCP connect timeout
    int io_timeout_sec      = 30;  // recv/send timeout unless the request sets one
    int ka_max              = 100; // max requests per connection before re-open

    // TLS (https base addresses)
    bool tls_verify_peer = true;       // verify server certificate
    std::string tls_ca_file;           // optional CA file path
    std::string tls_sni;               // optional SNI servername override
    std::string tls_client_cert_file;  // optional mTLS
    std::string tls_client_key_file;   // optional mTLS

    std::string user_agent = "restcl/1";
};

} // namespace restcl
