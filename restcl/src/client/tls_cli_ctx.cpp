/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/internal/tls_cli_ctx.hpp"
#include "restcl/log.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>

namespace restcl::internal {

std::string drain_openssl_errors(const char* where) {
    std::string last;
    unsigned long e = 0;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        last = buf;
        restcl::log_line("TLS-CLI", std::string(where) + ": " + buf, restcl::LogLevel::Error);
    }
    return last;
}

bool is_ip_literal(const std::string& host) {
    unsigned char tmp[16];
    return ::inet_pton(AF_INET, host.c_str(), tmp) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), tmp) == 1;
}

TlsClientContext::TlsClientContext(const restcl::TransportConfig& cfg)
    : _verify_peer(cfg.tls_verify_peer), _sni_override(cfg.tls_sni) {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx) {
        fail("cannot create TLS context", "SSL_CTX_new");
        return;
    }
    if (SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION) != 1) {
        fail("cannot require TLS 1.2", "set_min_proto");
        return;
    }
    if (!load_trust(cfg) || !load_identity(cfg)) return;

    SSL_CTX_set_verify(_ctx, _verify_peer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) SSL_CTX_free(_ctx);
}

void TlsClientContext::fail(const std::string& what, const char* where) {
    const std::string detail = drain_openssl_errors(where);
    _err = detail.empty() ? what : what + ": " + detail;
    restcl::log_line("TLS-CLI", _err, restcl::LogLevel::Error);
}

bool TlsClientContext::load_trust(const restcl::TransportConfig& cfg) {
    if (cfg.tls_ca_file.empty()) {
        // missing system paths only matter once a peer has to be verified
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            drain_openssl_errors("set_default_verify_paths");
        }
        return true;
    }
    if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_ca_file.c_str(), nullptr) != 1) {
        fail("cannot load CA file " + cfg.tls_ca_file, "load_verify_locations");
        return false;
    }
    return true;
}

bool TlsClientContext::load_identity(const restcl::TransportConfig& cfg) {
    const bool has_cert = !cfg.tls_client_cert_file.empty();
    const bool has_key  = !cfg.tls_client_key_file.empty();
    if (!has_cert && !has_key) return true;
    if (has_cert != has_key) {
        _err = "client certificate and key must be given together";
        restcl::log_line("TLS-CLI", _err, restcl::LogLevel::Error);
        return false;
    }
    if (SSL_CTX_use_certificate_file(_ctx, cfg.tls_client_cert_file.c_str(), SSL_FILETYPE_PEM) != 1) {
        fail("cannot load client certificate " + cfg.tls_client_cert_file, "use_certificate_file");
        return false;
    }
    if (SSL_CTX_use_PrivateKey_file(_ctx, cfg.tls_client_key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
        fail("cannot load client key " + cfg.tls_client_key_file, "use_PrivateKey_file");
        return false;
    }
    if (SSL_CTX_check_private_key(_ctx) != 1) {
        fail("client key does not match certificate", "check_private_key");
        return false;
    }
    return true;
}

SSL* TlsClientContext::new_session(int fd, const std::string& host, std::string& err) const {
    if (!ready()) {
        err = _err.empty() ? "TLS context not ready" : _err;
        return nullptr;
    }
    SSL* s = SSL_new(_ctx);
    if (!s) {
        err = "SSL_new failed";
        drain_openssl_errors("SSL_new");
        return nullptr;
    }
    if (SSL_set_fd(s, fd) != 1) {
        SSL_free(s);
        err = "SSL_set_fd failed";
        drain_openssl_errors("SSL_set_fd");
        return nullptr;
    }

    const std::string peer = _sni_override.empty() ? host : _sni_override;
    const bool ip = is_ip_literal(peer);
    // RFC 6066: SNI carries host names only
    if (!ip && SSL_set_tlsext_host_name(s, peer.c_str()) != 1) {
        SSL_free(s);
        err = "cannot set SNI " + peer;
        drain_openssl_errors("set_tlsext_host_name");
        return nullptr;
    }

    if (_verify_peer) {
        bool bound = false;
        if (ip) {
            X509_VERIFY_PARAM* param = SSL_get0_param(s);
            bound = param && X509_VERIFY_PARAM_set1_ip_asc(param, peer.c_str()) == 1;
        } else {
            bound = SSL_set1_host(s, peer.c_str()) == 1;
        }
        if (!bound) {
            SSL_free(s);
            err = "cannot bind certificate check to " + peer;
            drain_openssl_errors("verify_param");
            return nullptr;
        }
    }
    return s;
}

bool TlsClientContext::check_peer(SSL* s, std::string& err) const {
    if (!_verify_peer) return true;
    const long vr = SSL_get_verify_result(s);
    if (vr != X509_V_OK) {
        err = std::string("TLS verify failed: ") + X509_verify_cert_error_string(vr);
        return false;
    }
    return true;
}

} // namespace restcl::internal
