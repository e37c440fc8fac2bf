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
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "restcl/codec.hpp"
#include "restcl/http_request.hpp"
#include "restcl/status.hpp"
#include "restcl/transport.hpp"
#include "restcl/url.hpp"

namespace restcl {

class Request;

// Given the name of a running operation, decide whether to poll again.
// Returns true and sets next to the request to issue, or false to stop.
using PollFunc = std::function<bool(const std::string& operation, std::unique_ptr<Request>& next)>;

// Outcome of Request::execute.
struct Result {
    int            http_status = 0;
    std::string    body;           // raw payload of the final response
    nlohmann::json object;         // decoded payload, null if undecodable
    bool           created = false;
    bool           has_status = false;
    Status         status;         // set when the server answered with a Status
    std::string    error;          // empty on success

    // Operation still running when polling stopped or sync mode was on.
    bool in_progress() const { return has_status && status.is_working(); }
};

// One logical call against the API. Built by RestClient::verb and friends,
// configured by chaining, consumed once by execute().
class Request {
public:
    Request(std::shared_ptr<HttpTransport> transport,
            std::string method,
            const Url& base,
            std::shared_ptr<const Codec> codec,
            bool namespace_in_query,
            bool preserve_resource_case);

    Request(Request&&) = default;
    Request& operator=(Request&&) = default;
    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;

    // Raw path below the base address, e.g. "proxy/minions".
    Request& path(const std::string& item);
    Request& namespace_(const std::string& ns);
    Request& resource(const std::string& r);
    Request& name(const std::string& n);
    Request& suffix(const std::string& item);
    Request& param(const std::string& key, const std::string& value);
    // Label/field selector, passed through as an opaque query value.
    Request& selector_param(const std::string& key, const std::string& selector);
    Request& header(const std::string& key, const std::string& value);
    Request& body(std::string data);
    Request& body_object(const nlohmann::json& obj);
    Request& poller(PollFunc fn);
    Request& no_poll();
    Request& sync(bool on);
    Request& timeout(std::chrono::milliseconds d);

    // Perform the exchange, polling running operations through the poller
    // unless sync is on. Returns false on transport, decode or server
    // failure with out.error set. A still-running operation whose polling
    // stopped is returned with true and out.in_progress().
    bool execute(Result& out);

    const std::string& method() const { return _method; }
    const std::string& target_resource() const { return _resource; }
    const std::string& target_name() const { return _name; }
    const std::string& target_namespace() const { return _namespace; }
    bool sync_enabled() const { return _sync; }
    bool polling_enabled() const { return static_cast<bool>(_poller); }
    std::chrono::milliseconds timeout_value() const { return _timeout; }

    Url final_address() const;
    std::string final_url() const { return final_address().to_string(); }

private:
    bool round_trip_once(Result& out);
    bool transform_response(const HttpResponse& resp, Result& out) const;
    bool should_poll(const Status& st, std::unique_ptr<Request>& next) const;
    void set_error(const std::string& e);

    std::shared_ptr<HttpTransport> _transport;
    std::shared_ptr<const Codec>   _codec;
    std::string _method;
    Url         _base;
    bool        _namespace_in_query = false;
    bool        _preserve_resource_case = false;

    std::vector<std::string> _path;
    std::string _namespace;
    bool        _namespace_set = false;
    std::string _resource;
    std::string _name;
    std::string _suffix;
    std::unordered_map<std::string, std::string> _params;
    std::unordered_map<std::string, std::string> _headers;
    std::string _body;

    PollFunc _poller;
    bool     _sync = false;
    std::chrono::milliseconds _timeout{0};

    std::string _err;   // first configuration error, reported by execute
    bool        _consumed = false;
};

} // namespace restcl
