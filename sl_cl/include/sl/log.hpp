/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <string>

namespace sl {

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Thread-safe logging (to file + stdout).
// An empty path disables the file; stdout stays on unless set_log_stdout(false).
void set_log_file(const std::string& path);
void set_log_stdout(bool enabled);
void set_log_level(LogLevel min_level);
LogLevel log_level();

void log_line(const std::string& line);  // LogLevel::Info
void log_line(LogLevel level, const std::string& line);

// Adapter for components that take an injected diagnostic sink.
std::function<void(const std::string&)> make_log_sink(LogLevel level = LogLevel::Debug);

} // namespace sl
