/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/url.hpp"

#include <gtest/gtest.h>

using restcl::Url;
using restcl::parse_url;
using restcl::normalize_base;

TEST(Url, ParsesAllComponents)
{
    Url u;
    ASSERT_TRUE(parse_url("https://api.example.com:6443/api/v1?watch=1#frag", u));
    EXPECT_EQ(u.scheme, "https");
    EXPECT_EQ(u.host, "api.example.com");
    EXPECT_EQ(u.port, 6443);
    EXPECT_EQ(u.path, "/api/v1");
    EXPECT_EQ(u.query, "watch=1");
    EXPECT_EQ(u.fragment, "frag");
}

TEST(Url, DefaultPortFollowsScheme)
{
    Url u;
    ASSERT_TRUE(parse_url("http://host", u));
    EXPECT_EQ(u.port, 80);
    EXPECT_EQ(u.path, "");
    ASSERT_TRUE(parse_url("HTTPS://host/x", u));
    EXPECT_EQ(u.scheme, "https");
    EXPECT_EQ(u.port, 443);
}

TEST(Url, Ipv6Literal)
{
    Url u;
    ASSERT_TRUE(parse_url("http://[::1]:8080/api", u));
    EXPECT_EQ(u.host, "::1");
    EXPECT_EQ(u.port, 8080);
    EXPECT_EQ(u.to_string(), "http://[::1]:8080/api");
}

TEST(Url, RejectsMalformed)
{
    Url u;
    EXPECT_FALSE(parse_url("", u));
    EXPECT_FALSE(parse_url("host/api", u));
    EXPECT_FALSE(parse_url("ftp://host/api", u));
    EXPECT_FALSE(parse_url("http:///api", u));
    EXPECT_FALSE(parse_url("http://host:abc/", u));
    EXPECT_FALSE(parse_url("http://host:70000/", u));
    EXPECT_FALSE(parse_url("http://host:0/", u));
    EXPECT_FALSE(parse_url("http://user@host/", u));
    EXPECT_FALSE(parse_url("http://host:/api", u));
    EXPECT_FALSE(parse_url("http://host:", u));
    EXPECT_FALSE(parse_url("https://[::1]:/", u));
}

TEST(Url, ToStringOmitsDefaultPort)
{
    Url u;
    ASSERT_TRUE(parse_url("http://host:80/api?x=1", u));
    EXPECT_EQ(u.to_string(), "http://host/api?x=1");
    ASSERT_TRUE(parse_url("https://host:8443", u));
    EXPECT_EQ(u.to_string(), "https://host:8443/");
}

TEST(Url, NormalizeBaseAddsSlashAndStripsQuery)
{
    Url u;
    ASSERT_TRUE(parse_url("http://host/api?labels=a#top", u));
    const Url n = normalize_base(u);
    EXPECT_EQ(n.path, "/api/");
    EXPECT_TRUE(n.query.empty());
    EXPECT_TRUE(n.fragment.empty());
    EXPECT_EQ(n.to_string(), "http://host/api/");
    // the input is untouched
    EXPECT_EQ(u.path, "/api");
    EXPECT_EQ(u.query, "labels=a");
}

TEST(Url, NormalizeBaseIsIdempotent)
{
    Url u;
    ASSERT_TRUE(parse_url("http://host", u));
    const Url once = normalize_base(u);
    const Url twice = normalize_base(once);
    EXPECT_EQ(once.path, "/");
    EXPECT_EQ(twice.to_string(), once.to_string());
}
