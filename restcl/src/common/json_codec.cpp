/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/json_codec.hpp"
#include "restcl/log.hpp"
#include <utility>

namespace restcl {

JsonCodec::JsonCodec(std::string api_version)
    : _api_version(std::move(api_version)) {}

bool JsonCodec::encode(const nlohmann::json& obj, std::string& out) const {
    if (!obj.is_object()) {
        restcl::log_line("CODEC", "refusing to encode a non-object document", LogLevel::Warn);
        return false;
    }
    nlohmann::json doc = obj;
    if (!_api_version.empty() && !doc.contains("apiVersion")) {
        doc["apiVersion"] = _api_version;
    }
    // Replace invalid UTF-8 rather than throwing from dump().
    out = doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return true;
}

bool JsonCodec::decode(const std::string& data, nlohmann::json& out) const {
    nlohmann::json doc = nlohmann::json::parse(data, nullptr, /*allow_exceptions*/ false);
    if (doc.is_discarded()) return false;
    out = std::move(doc);
    return true;
}

} // namespace restcl
