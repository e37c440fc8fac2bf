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
#include "restcl/codec.hpp"

namespace restcl {

// JSON codec for one API version. Objects without "apiVersion" are stamped
// with it on encode.
class JsonCodec : public Codec {
public:
    explicit JsonCodec(std::string api_version);

    bool encode(const nlohmann::json& obj, std::string& out) const override;
    bool decode(const std::string& data, nlohmann::json& out) const override;

    const std::string& api_version() const { return _api_version; }

private:
    std::string _api_version;
};

} // namespace restcl
