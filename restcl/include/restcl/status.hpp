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

// Values of Status::status.
inline constexpr const char* kStatusSuccess = "Success";
inline constexpr const char* kStatusFailure = "Failure";
inline constexpr const char* kStatusWorking = "Working";

// Value of "kind" on a Status document.
inline constexpr const char* kStatusKind = "Status";

struct StatusDetails {
    std::string id;     // operation name while Working
    std::string kind;
};

// Server-side outcome report returned instead of a resource.
struct Status {
    std::string   status;
    std::string   message;
    std::string   reason;
    int           code = 0;
    StatusDetails details;

    bool is_working() const { return status == kStatusWorking; }
    bool is_success() const { return status == kStatusSuccess; }
};

// True when obj is a Status document: "kind" is "Status", or "kind" is absent
// and "status" is one of Success, Failure or Working. Any other object is a
// resource, whatever its own "status" field holds.
bool status_from_object(const nlohmann::json& obj, Status& out);

} // namespace restcl
