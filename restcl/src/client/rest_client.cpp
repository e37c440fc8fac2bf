/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/rest_client.hpp"
#include "restcl/log.hpp"
#include "restcl/socket_transport.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

namespace restcl {

namespace {

Url parse_base_or_throw(const std::string& text) {
    Url u;
    if (!parse_url(text, u)) {
        throw std::invalid_argument("invalid base address: '" + text + "'");
    }
    return u;
}

} // namespace

RestClient::RestClient(const Url& base,
                       std::string api_version,
                       std::shared_ptr<const Codec> c,
                       bool legacy)
    : legacy_behavior(legacy),
      codec(std::move(c)),
      _base(normalize_base(base)),
      _api_version(std::move(api_version)),
      _default_transport(std::make_shared<SocketTransport>())
{
    transport = _default_transport;
}

RestClient::RestClient(const std::string& base,
                       std::string api_version,
                       std::shared_ptr<const Codec> c,
                       bool legacy)
    : RestClient(parse_base_or_throw(base), std::move(api_version), std::move(c), legacy) {}

Request RestClient::verb(const std::string& method) const {
    // A non-zero request timeout takes precedence over the transport's own
    // I/O timeout (see HttpTransport::round_trip).
    PollFunc effective = poller;
    if (!effective) {
        effective = [this](const std::string& name, std::unique_ptr<Request>& next) {
            return default_poll(name, next);
        };
    }
    Request req(transport ? transport : _default_transport,
                method, _base, codec, legacy_behavior, legacy_behavior);
    req.poller(std::move(effective)).sync(sync).timeout(timeout);
    return req;
}

Request RestClient::operation(const std::string& name) const {
    Request req = get();
    req.resource("operations").name(name).sync(false).no_poll();
    return req;
}

bool RestClient::default_poll(const std::string& name, std::unique_ptr<Request>& next) const {
    next.reset();
    if (poll_period.count() <= 0) {
        return false;
    }
    restcl::log_line("POLL", "Waiting for completion of operation " + name);
    std::this_thread::sleep_for(poll_period);

    next = std::make_unique<Request>(operation(name));
    next->poller([this](const std::string& op, std::unique_ptr<Request>& n) {
        return default_poll(op, n);
    });
    return true;
}

} // namespace restcl
