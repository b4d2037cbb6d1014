/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <openssl/err.h>

namespace sl::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos <= s.size()) {
        std::size_t next = s.find(sep, pos);
        if (next == std::string::npos) next = s.size();
        std::string item = s.substr(pos, next - pos);
        trim_inplace(item);
        if (!item.empty()) out.push_back(std::move(item));
        pos = next + 1;
    }
    return out;
}

bool is_ip_literal(const std::string& host) {
    unsigned char tmp[16];
    return ::inet_pton(AF_INET, host.c_str(), tmp) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), tmp) == 1;
}

std::string drain_openssl_errors() {
    std::string out;
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

} // namespace sl::internal
