/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/internal/utils.hpp"
#include <algorithm>
#include <cctype>

namespace restcl::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}
std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string escape_component(const std::string& s){
    static const char* H="0123456789ABCDEF";
    std::string out; out.reserve(s.size()*3);
    for(unsigned char c: s){
        if(std::isalnum(c) || c=='-' || c=='.' || c=='_' || c=='~') {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(H[c>>4]);
            out.push_back(H[c&0xF]);
        }
    }
    return out;
}

std::string format_duration(std::chrono::milliseconds d){
    const auto ms = d.count();
    if (ms % 1000 == 0) return std::to_string(ms / 1000) + "s";
    return std::to_string(ms) + "ms";
}

} // namespace restcl::internal
