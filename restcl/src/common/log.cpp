/*
 * Part of the RestCL project.
 *
 * SPDX-FileCopyrightText: 2025 RestCL contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RestCL. See LICENSE for details.
 */

#include "restcl/log.hpp"
#include "restcl/internal/utils.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <utility>

namespace {

struct LogState {
    std::mutex mtx;
    std::ofstream ofs;
    std::string path = "restcl.log";
    bool to_stdout = true;
    restcl::LogLevel min_level = restcl::LogLevel::Info;
    restcl::LogSink sink;
};

LogState& state() {
    static LogState s;
    return s;
}

void open_file_locked(LogState& s) {
    if (!s.ofs.is_open() && !s.path.empty()) {
        s.ofs.open(s.path, std::ios::out | std::ios::app);
    }
}

std::string utc_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

} // namespace

namespace restcl {

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

bool parse_log_level(const std::string& text, LogLevel& out) {
    const std::string t = internal::lower_copy(text);
    if (t == "debug") out = LogLevel::Debug;
    else if (t == "info") out = LogLevel::Info;
    else if (t == "warn" || t == "warning") out = LogLevel::Warn;
    else if (t == "error") out = LogLevel::Error;
    else return false;
    return true;
}

void set_log_file(const std::string& path) {
    LogState& s = state();
    std::lock_guard<std::mutex> lk(s.mtx);
    if (s.ofs.is_open()) s.ofs.close();
    s.path = path;
    open_file_locked(s);
}

void set_log_stdout(bool on) {
    LogState& s = state();
    std::lock_guard<std::mutex> lk(s.mtx);
    s.to_stdout = on;
}

void set_log_level(LogLevel min) {
    LogState& s = state();
    std::lock_guard<std::mutex> lk(s.mtx);
    s.min_level = min;
}

void set_log_sink(LogSink sink) {
    LogState& s = state();
    std::lock_guard<std::mutex> lk(s.mtx);
    s.sink = std::move(sink);
}

void log_line(const char* component, const std::string& msg, LogLevel level) {
    LogState& s = state();
    std::lock_guard<std::mutex> lk(s.mtx);
    if (level < s.min_level) return;

    std::string line = utc_timestamp();
    line += ' ';
    line += to_string(level);
    line += " [";
    line += component;
    line += "] ";
    line += msg;

    open_file_locked(s);
    if (s.ofs.is_open() && s.ofs) {
        s.ofs << line << '\n';
        s.ofs.flush();
    }
    if (s.to_stdout) std::cout << line << '\n';
    if (s.sink) s.sink(line);
}

} // namespace restcl
