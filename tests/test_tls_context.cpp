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

#include <gtest/gtest.h>

#include <openssl/ssl.h>

#include <sys/socket.h>
#include <unistd.h>

using restcl::TransportConfig;
using restcl::internal::TlsClientContext;

class TlsContextTest : public testing::Test
{
protected:
    void SetUp() override
    {
        restcl::set_log_file("");
        restcl::set_log_stdout(false);
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    }

    void TearDown() override
    {
        ::close(fds[0]);
        ::close(fds[1]);
        restcl::set_log_stdout(true);
    }

    int fds[2] = {-1, -1};
};

TEST_F(TlsContextTest, DefaultConfigIsReady)
{
    TlsClientContext ctx(TransportConfig{});
    EXPECT_TRUE(ctx.ready());
    EXPECT_TRUE(ctx.error().empty());
}

TEST_F(TlsContextTest, MissingCaFileFailsSetup)
{
    TransportConfig cfg;
    cfg.tls_ca_file = "/nonexistent/restcl-ca.pem";
    TlsClientContext ctx(cfg);
    EXPECT_FALSE(ctx.ready());
    EXPECT_NE(ctx.error().find("/nonexistent/restcl-ca.pem"), std::string::npos);

    std::string err;
    EXPECT_EQ(ctx.new_session(fds[0], "example.com", err), nullptr);
    EXPECT_EQ(err, ctx.error());
}

TEST_F(TlsContextTest, CertificateWithoutKeyFailsSetup)
{
    TransportConfig cfg;
    cfg.tls_client_cert_file = "client.pem";
    TlsClientContext ctx(cfg);
    EXPECT_FALSE(ctx.ready());
    EXPECT_EQ(ctx.error(), "client certificate and key must be given together");
}

TEST_F(TlsContextTest, SessionSendsHostAsSni)
{
    TlsClientContext ctx(TransportConfig{});
    std::string err;
    SSL* s = ctx.new_session(fds[0], "api.example.com", err);
    ASSERT_TRUE(s != nullptr) << err;
    const char* sni = SSL_get_servername(s, TLSEXT_NAMETYPE_host_name);
    ASSERT_TRUE(sni != nullptr);
    EXPECT_STREQ(sni, "api.example.com");
    SSL_free(s);
}

TEST_F(TlsContextTest, SniOverrideWins)
{
    TransportConfig cfg;
    cfg.tls_sni = "kube.internal";
    TlsClientContext ctx(cfg);
    std::string err;
    SSL* s = ctx.new_session(fds[0], "10.0.0.1", err);
    ASSERT_TRUE(s != nullptr) << err;
    const char* sni = SSL_get_servername(s, TLSEXT_NAMETYPE_host_name);
    ASSERT_TRUE(sni != nullptr);
    EXPECT_STREQ(sni, "kube.internal");
    SSL_free(s);
}

TEST_F(TlsContextTest, IpLiteralGetsNoSni)
{
    TlsClientContext ctx(TransportConfig{});
    std::string err;
    SSL* s = ctx.new_session(fds[0], "127.0.0.1", err);
    ASSERT_TRUE(s != nullptr) << err;
    EXPECT_TRUE(SSL_get_servername(s, TLSEXT_NAMETYPE_host_name) == nullptr);
    SSL_free(s);
}

TEST_F(TlsContextTest, VerificationOffAcceptsAnyPeer)
{
    TransportConfig cfg;
    cfg.tls_verify_peer = false;
    TlsClientContext ctx(cfg);
    std::string err;
    SSL* s = ctx.new_session(fds[0], "example.com", err);
    ASSERT_TRUE(s != nullptr) << err;
    EXPECT_TRUE(ctx.check_peer(s, err));
    SSL_free(s);
}

TEST(TlsHelpers, IpLiteral)
{
    EXPECT_TRUE(restcl::internal::is_ip_literal("127.0.0.1"));
    EXPECT_TRUE(restcl::internal::is_ip_literal("::1"));
    EXPECT_FALSE(restcl::internal::is_ip_literal("localhost"));
    EXPECT_FALSE(restcl::internal::is_ip_literal("1.2.3"));
}
