/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/status.hpp"

namespace restcl {

namespace {

std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool known_status(const std::string& st) {
    return st == kStatusSuccess || st == kStatusFailure || st == kStatusWorking;
}

} // namespace

bool status_from_object(const nlohmann::json& obj, Status& out) {
    if (!obj.is_object()) return false;
    const std::string st = string_field(obj, "status");
    if (st.empty()) return false;

    if (obj.contains("kind")) {
        if (string_field(obj, "kind") != kStatusKind) return false;
    } else if (!known_status(st)) {
        return false;
    }

    Status s;
    s.status  = st;
    s.message = string_field(obj, "message");
    s.reason  = string_field(obj, "reason");

    auto code = obj.find("code");
    if (code != obj.end() && code->is_number_integer()) {
        s.code = code->get<int>();
    }

    auto details = obj.find("details");
    if (details != obj.end() && details->is_object()) {
        s.details.id   = string_field(*details, "id");
        s.details.kind = string_field(*details, "kind");
    }

    out = s;
    return true;
}

} // namespace restcl
