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
#include <cstdint>

namespace restcl {

// Absolute http/https address split into its components.
struct Url {
    std::string   scheme = "http";   // "http" or "https"
    std::string   host;
    std::uint16_t port = 80;
    std::string   path;              // as written, e.g. "/api"
    std::string   query;             // without leading '?'
    std::string   fragment;          // without leading '#'

    bool is_tls() const { return scheme == "https"; }
    std::uint16_t default_port() const { return is_tls() ? 443 : 80; }

    // "host" or "host:port" when the port is not the scheme default.
    std::string authority() const;
    std::string to_string() const;
};

// Parse "http[s]://host[:port][/path][?query][#fragment]".
// Returns false for relative addresses, unknown schemes, empty host or bad port.
bool parse_url(const std::string& text, Url& out);

// Copy of u with a slash-terminated path and no query or fragment.
Url normalize_base(const Url& u);

} // namespace restcl
