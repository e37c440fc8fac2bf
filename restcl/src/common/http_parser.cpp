/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/internal/http_parser.hpp"
#include <sstream>
#include <vector>
#include <algorithm>
#include <strings.h> // strcasecmp
#include "restcl/internal/utils.hpp"

namespace restcl::internal {

std::string canonical_query_sorted(const std::unordered_map<std::string,std::string>& params){
    std::vector<std::pair<std::string,std::string>> v(params.begin(), params.end());
    std::sort(v.begin(), v.end(), [](const auto& a, const auto& b){
        if(a.first<b.first) return true;
        if(a.first>b.first) return false;
        return a.second<b.second;
    });
    std::ostringstream oss;
    bool first=true;
    for(const auto& kv: v){
        if(!first) oss << '&';
        first=false;
        oss << escape_component(kv.first) << '=' << escape_component(kv.second);
    }
    return oss.str();
}

std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name){
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

} // namespace restcl::internal
