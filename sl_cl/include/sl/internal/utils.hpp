/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>

namespace sl::internal {

void trim_inplace(std::string& s);
std::string lower_copy(std::string s);

std::string join(const std::vector<std::string>& items, const char* sep);
// Split on sep, trimming each item and dropping empty ones.
std::vector<std::string> split_list(const std::string& s, char sep);

// True for IPv4/IPv6 literals (as accepted by inet_pton).
bool is_ip_literal(const std::string& host);

// Drain the OpenSSL error queue into one "; "-separated string.
std::string drain_openssl_errors();

} // namespace sl::internal
