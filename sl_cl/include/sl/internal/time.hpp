/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <string>
#include <sys/time.h>

namespace sl {
// Return current UTC timestamp in strict ISO8601 "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_iso8601_now();

namespace internal {
// Socket timeout unit conversions. A zero duration maps to a zero timeval,
// which SO_RCVTIMEO/SO_SNDTIMEO treat as "block forever".
timeval to_timeval(std::chrono::milliseconds d);
std::chrono::milliseconds from_timeval(const timeval& tv);
} // namespace internal

} // namespace sl
