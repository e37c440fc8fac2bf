/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#pragma once
#include <functional>
#include <string>

namespace restcl {

enum class LogLevel { Debug, Info, Warn, Error };

// Receives each formatted line after the file and stdout sinks.
using LogSink = std::function<void(const std::string& line)>;

// Thread-safe logging. Lines look like
//   2025-01-02T03:04:05.678Z WARN [TRANSPORT] connect to host:443 failed
// and go to the log file (if any), stdout (unless disabled) and the extra sink.
// An empty path disables the file sink.
void set_log_file(const std::string& path);
void set_log_stdout(bool on);
void set_log_level(LogLevel min);
void set_log_sink(LogSink sink);

// Lines below the configured level are dropped.
void log_line(const char* component, const std::string& msg, LogLevel level = LogLevel::Info);

const char* to_string(LogLevel level) noexcept;
bool parse_log_level(const std::string& text, LogLevel& out);

} // namespace restcl
