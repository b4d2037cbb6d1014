/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/internal/time.hpp"
#include <ctime>
#include <cstdio>

namespace sl {

std::string utc_iso8601_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32]{0};
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

namespace internal {

timeval to_timeval(std::chrono::milliseconds d) {
    if (d.count() <= 0) return timeval{0, 0};
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(d);
    const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(d - secs);
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(secs.count());
    tv.tv_usec = static_cast<suseconds_t>(usec.count());
    return tv;
}

std::chrono::milliseconds from_timeval(const timeval& tv) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec));
}

} // namespace internal
} // namespace sl
