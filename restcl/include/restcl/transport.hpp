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
#include <string>
#include "restcl/http_request.hpp"
#include "restcl/http_response.hpp"

namespace restcl {

// HTTP capability shared by every request a RestClient builds.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Perform one exchange. A non-zero timeout replaces the transport's own
    // I/O timeout for this exchange only. Returns false on connection, TLS or
    // framing failure; err then describes it. HTTP error statuses are not
    // failures at this level.
    virtual bool round_trip(const HttpRequest& req,
                            std::chrono::milliseconds timeout,
                            HttpResponse& out,
                            std::string& err) = 0;
};

} // namespace restcl
