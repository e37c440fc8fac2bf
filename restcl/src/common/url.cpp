/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/url.hpp"
#include "restcl/internal/utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace restcl {

std::string Url::authority() const {
    std::string a = host;
    if (a.find(':') != std::string::npos) a = "[" + a + "]"; // IPv6 literal
    if (port != default_port()) a += ":" + std::to_string(port);
    return a;
}

std::string Url::to_string() const {
    std::ostringstream oss;
    oss << scheme << "://" << authority();
    if (path.empty() || path[0] != '/') oss << '/';
    oss << path;
    if (!query.empty())    oss << '?' << query;
    if (!fragment.empty()) oss << '#' << fragment;
    return oss.str();
}

bool parse_url(const std::string& text, Url& out) {
    const std::size_t sep = text.find("://");
    if (sep == std::string::npos || sep == 0) return false;

    Url u;
    u.scheme = internal::lower_copy(text.substr(0, sep));
    if (u.scheme != "http" && u.scheme != "https") return false;

    std::string rest = text.substr(sep + 3);

    // Fragment first, then query, so '?' inside a fragment stays there.
    const std::size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        u.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }
    const std::size_t qm = rest.find('?');
    if (qm != std::string::npos) {
        u.query = rest.substr(qm + 1);
        rest.erase(qm);
    }

    const std::size_t slash = rest.find('/');
    std::string auth = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    u.path = (slash == std::string::npos) ? std::string() : rest.substr(slash);

    // userinfo is not supported
    if (auth.find('@') != std::string::npos) return false;

    std::string port_s;
    if (!auth.empty() && auth[0] == '[') {
        const std::size_t close = auth.find(']');
        if (close == std::string::npos) return false;
        u.host = auth.substr(1, close - 1);
        if (close + 1 < auth.size()) {
            if (auth[close + 1] != ':') return false;
            port_s = auth.substr(close + 2);
            if (port_s.empty()) return false;
        }
    } else {
        const std::size_t colon = auth.rfind(':');
        if (colon != std::string::npos) {
            u.host = auth.substr(0, colon);
            port_s = auth.substr(colon + 1);
            // "host:" names no port
            if (port_s.empty()) return false;
        } else {
            u.host = auth;
        }
    }
    if (u.host.empty()) return false;

    u.port = u.default_port();
    if (!port_s.empty()) {
        if (port_s.size() > 5 ||
            !std::all_of(port_s.begin(), port_s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
            return false;
        }
        const unsigned long p = std::stoul(port_s);
        if (p == 0 || p > 65535) return false;
        u.port = static_cast<std::uint16_t>(p);
    }

    out = u;
    return true;
}

Url normalize_base(const Url& u) {
    Url base = u;
    if (base.path.empty() || base.path.back() != '/') {
        base.path += "/";
    }
    if (base.path[0] != '/') base.path = "/" + base.path;
    base.query.clear();
    base.fragment.clear();
    return base;
}

} // namespace restcl
