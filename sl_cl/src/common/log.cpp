/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/log.hpp"
#include "sl/internal/time.hpp"
#include <atomic>
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path;
bool g_log_stdout = true;
std::atomic<int> g_log_level{static_cast<int>(sl::LogLevel::Info)};

const char* level_tag(sl::LogLevel lvl) {
    switch (lvl) {
        case sl::LogLevel::Debug: return "DEBUG";
        case sl::LogLevel::Info:  return "INFO";
        case sl::LogLevel::Warn:  return "WARN";
        case sl::LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void open_if_needed_unlocked() {
    if (!g_log_ofs.is_open() && !g_log_path.empty()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
}
} // namespace

namespace sl {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    open_if_needed_unlocked();
}

void set_log_stdout(bool enabled) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_stdout = enabled;
}

void set_log_level(LogLevel min_level) {
    g_log_level.store(static_cast<int>(min_level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load());
}

void log_line(const std::string& line) {
    log_line(LogLevel::Info, line);
}

void log_line(LogLevel level, const std::string& line) {
    if (static_cast<int>(level) < g_log_level.load()) return;

    const std::string out = utc_iso8601_now() + " " + level_tag(level) + " " + line;

    std::lock_guard<std::mutex> lk(g_log_mtx);
    open_if_needed_unlocked();
    if (g_log_ofs) {
        g_log_ofs << out << '\n';
        g_log_ofs.flush();
    }
    if (g_log_stdout) {
        std::cout << out << '\n';
    }
}

std::function<void(const std::string&)> make_log_sink(LogLevel level) {
    return [level](const std::string& line) { log_line(level, line); };
}

} // namespace sl
