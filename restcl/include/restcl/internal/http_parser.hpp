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

namespace restcl::internal {

// Sorted, percent-encoded "k1=v1&k2=v2". Empty map gives an empty string.
std::string canonical_query_sorted(const std::unordered_map<std::string,std::string>& params);

// Case-insensitive header lookup in a response-hash (utility)
std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name);

} // namespace restcl::internal
