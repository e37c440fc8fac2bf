/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/json_codec.hpp"
#include "restcl/rest_client.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace std::chrono_literals;
using restcl::Request;
using restcl::RestClient;

namespace {

std::shared_ptr<const restcl::Codec> codec_v1() {
    return std::make_shared<restcl::JsonCodec>("v1");
}

} // namespace

TEST(RestClient, BaseGetsExactlyOneTrailingSlash)
{
    RestClient c("http://host/api", "v1", codec_v1(), false);
    EXPECT_EQ(c.base_url().to_string(), "http://host/api/");

    RestClient bare("http://host", "v1", codec_v1(), false);
    EXPECT_EQ(bare.base_url().to_string(), "http://host/");
}

TEST(RestClient, BaseWithSlashIsUnchanged)
{
    RestClient c("http://host/api/", "v1", codec_v1(), false);
    EXPECT_EQ(c.base_url().to_string(), "http://host/api/");
}

TEST(RestClient, BaseDropsQueryAndFragment)
{
    RestClient c("https://host:6443/api?watch=true#x", "v1", codec_v1(), false);
    EXPECT_EQ(c.base_url().to_string(), "https://host:6443/api/");
    EXPECT_TRUE(c.base_url().query.empty());
    EXPECT_TRUE(c.base_url().fragment.empty());
}

TEST(RestClient, CallerUrlIsNotMutated)
{
    restcl::Url u;
    ASSERT_TRUE(restcl::parse_url("http://host/api?x=1", u));
    RestClient c(u, "v1", codec_v1(), false);
    EXPECT_EQ(u.path, "/api");
    EXPECT_EQ(u.query, "x=1");
    EXPECT_EQ(c.base_url().path, "/api/");
}

TEST(RestClient, MalformedBaseThrows)
{
    EXPECT_THROW(RestClient("not a url", "v1", codec_v1(), false), std::invalid_argument);
    EXPECT_THROW(RestClient("http://:80/api", "v1", codec_v1(), false), std::invalid_argument);
}

TEST(RestClient, Defaults)
{
    RestClient c("http://host/api", "v1", codec_v1(), true);
    EXPECT_TRUE(c.legacy_behavior);
    EXPECT_FALSE(c.sync);
    EXPECT_EQ(c.poll_period, 2s);
    EXPECT_EQ(c.timeout.count(), 0);
    EXPECT_FALSE(static_cast<bool>(c.poller));
    EXPECT_TRUE(c.transport != nullptr);
}

TEST(RestClient, ApiVersionIsUnaffectedByConfiguration)
{
    RestClient c("http://host/api", "v1beta1", codec_v1(), false);
    c.sync = true;
    c.poll_period = 0ms;
    c.timeout = 5s;
    c.legacy_behavior = true;
    c.codec = std::make_shared<restcl::JsonCodec>("v1beta3");
    EXPECT_EQ(c.api_version(), "v1beta1");
}

TEST(RestClient, ConvenienceVerbs)
{
    RestClient c("http://host/api", "v1", codec_v1(), false);
    EXPECT_EQ(c.get().method(), "GET");
    EXPECT_EQ(c.post().method(), "POST");
    EXPECT_EQ(c.put().method(), "PUT");
    EXPECT_EQ(c.del().method(), "DELETE");
}

TEST(RestClient, VerbCarriesClientConfiguration)
{
    RestClient c("http://host/api", "v1", codec_v1(), false);
    c.sync = true;
    c.timeout = 7s;
    Request req = c.verb("GET");
    EXPECT_TRUE(req.sync_enabled());
    EXPECT_EQ(req.timeout_value(), 7s);
    EXPECT_TRUE(req.polling_enabled());
    req.resource("pods");
    EXPECT_EQ(req.final_url(), "http://host/api/pods?sync=true&timeout=7s");
}

TEST(RestClient, VerbAppliesLegacyBehavior)
{
    RestClient c("http://host/api/v1beta1", "v1beta1", codec_v1(), true);
    Request req = c.get();
    req.namespace_("ns1").resource("minionList");
    EXPECT_EQ(req.final_url(), "http://host/api/v1beta1/minionList?namespace=ns1");
}

TEST(RestClient, VerbCallsProduceIndependentBuilders)
{
    RestClient c("http://host/api", "v1", codec_v1(), false);
    Request a = c.verb("GET");
    Request b = c.verb("GET");
    a.timeout(30s).sync(true).resource("pods").no_poll();
    EXPECT_EQ(b.timeout_value().count(), 0);
    EXPECT_FALSE(b.sync_enabled());
    EXPECT_TRUE(b.polling_enabled());
    EXPECT_TRUE(b.target_resource().empty());
}

TEST(RestClient, OperationTargetsOperationsCollection)
{
    RestClient c("http://host/api", "v1", codec_v1(), false);
    c.sync = true;
    Request op = c.operation("op1");
    EXPECT_EQ(op.method(), "GET");
    EXPECT_EQ(op.target_resource(), "operations");
    EXPECT_EQ(op.target_name(), "op1");
    EXPECT_FALSE(op.sync_enabled());
    EXPECT_FALSE(op.polling_enabled());
    EXPECT_EQ(op.final_url(), "http://host/api/operations/op1");
}

TEST(RestClient, DefaultPollDisabledByZeroPeriod)
{
    RestClient c("http://host/api", "v1", codec_v1(), false);
    c.poll_period = 0ms;
    std::unique_ptr<Request> next = std::make_unique<Request>(c.get());
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(c.default_poll("op1", next));
    EXPECT_TRUE(next == nullptr);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 500ms);
}

TEST(RestClient, DefaultPollWaitsOnePeriod)
{
    RestClient c("http://host/api", "v1", codec_v1(), false);
    c.poll_period = 50ms;
    std::unique_ptr<Request> next;
    const auto t0 = std::chrono::steady_clock::now();
    ASSERT_TRUE(c.default_poll("op-42", next));
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 50ms);
    ASSERT_TRUE(next != nullptr);
    EXPECT_EQ(next->target_resource(), "operations");
    EXPECT_EQ(next->target_name(), "op-42");
    EXPECT_FALSE(next->sync_enabled());
    // the default poller re-installs itself on the poll request
    EXPECT_TRUE(next->polling_enabled());
}

TEST(RestClient, PollerOverrideIsInstalled)
{
    RestClient c("http://host/api", "v1", codec_v1(), false);
    int calls = 0;
    c.poller = [&calls](const std::string&, std::unique_ptr<Request>&) {
        ++calls;
        return false;
    };
    Request req = c.get();
    EXPECT_TRUE(req.polling_enabled());
    EXPECT_EQ(calls, 0);
}
