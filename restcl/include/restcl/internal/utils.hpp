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
#include <chrono>

namespace restcl::internal {

void trim_inplace(std::string& s);
int  hexval(char c);
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);

// Percent-encode everything outside the RFC 3986 unreserved set.
std::string escape_component(const std::string& s);

// Duration in the "<n>s" / "<n>ms" form API servers accept for ?timeout=.
std::string format_duration(std::chrono::milliseconds d);

} // namespace restcl::internal
