/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "restcl/codec.hpp"
#include "restcl/request.hpp"
#include "restcl/transport.hpp"
#include "restcl/url.hpp"

namespace restcl {

// Imposes common API conventions on a set of resource paths below a base
// address. The server answers with a decodable resource, or with a Status
// describing a failure or a still-running operation.
//
// Requests built by a RestClient refer back to it through the default
// poller, so the client must outlive them. Configuration fields are read by
// every verb call and must not be changed while calls are in flight.
class RestClient {
public:
    // base is copied, then given a trailing '/' and stripped of query and
    // fragment. legacy_behavior selects namespace-as-query-parameter and
    // case-preserving resource names used by older API versions.
    RestClient(const Url& base,
               std::string api_version,
               std::shared_ptr<const Codec> codec,
               bool legacy_behavior);

    // Throws std::invalid_argument if base is not an absolute http(s) address.
    RestClient(const std::string& base,
               std::string api_version,
               std::shared_ptr<const Codec> codec,
               bool legacy_behavior);

    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    // Begin a request with a verb (GET, POST, PUT, DELETE).
    //
    //   restcl::Result res;
    //   bool ok = client.verb("GET")
    //                 .resource("pods")
    //                 .selector_param("labels", "area=staging")
    //                 .timeout(std::chrono::seconds(10))
    //                 .execute(res);
    Request verb(const std::string& method) const;

    Request post() const { return verb("POST"); }
    Request put() const  { return verb("PUT"); }
    Request get() const  { return verb("GET"); }
    Request del() const  { return verb("DELETE"); }

    // Single, non-polling status check of the named operation.
    Request operation(const std::string& name) const;

    // Built-in poller: waits one poll_period, then hands back an operation
    // lookup with itself re-installed. A zero poll_period disables polling.
    bool default_poll(const std::string& name, std::unique_ptr<Request>& next) const;

    const std::string& api_version() const { return _api_version; }
    const Url& base_url() const { return _base; }

    bool legacy_behavior = false;
    std::shared_ptr<const Codec> codec;
    // Defaults to a SocketTransport; a null transport also means that one.
    std::shared_ptr<HttpTransport> transport;
    // Overrides default_poll when set.
    PollFunc poller;

    bool sync = false;
    std::chrono::milliseconds poll_period{std::chrono::seconds(2)};
    std::chrono::milliseconds timeout{0};

private:
    Url _base;
    std::string _api_version;
    std::shared_ptr<HttpTransport> _default_transport;
};

} // namespace restcl
