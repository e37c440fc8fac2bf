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
#include <unordered_map>
#include "restcl/url.hpp"

namespace restcl {

// One fully addressed HTTP exchange as handed to a transport.
struct HttpRequest {
    std::string method = "GET";
    Url         url;               // absolute, query already encoded
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

} // namespace restcl
