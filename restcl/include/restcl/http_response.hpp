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

namespace restcl {

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    std::unordered_map<std::string, std::string> headers;
    std::string body;        // de-chunked payload
};

} // namespace restcl
