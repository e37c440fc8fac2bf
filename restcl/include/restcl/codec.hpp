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
#include <nlohmann/json.hpp>

namespace restcl {

// Encoding scheme between wire payloads and API objects.
class Codec {
public:
    virtual ~Codec() = default;

    virtual bool encode(const nlohmann::json& obj, std::string& out) const = 0;
    virtual bool decode(const std::string& data, nlohmann::json& out) const = 0;
};

} // namespace restcl
