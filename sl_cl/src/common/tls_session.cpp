/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/tls_session.hpp"
#include "sl/internal/utils.hpp"
#include <algorithm>

namespace sl {

bool TlsParameters::add_server_name(const std::string& name) {
    if (name.empty()) return false;
    const std::string key = internal::lower_copy(name);
    const bool present = std::any_of(server_names.begin(), server_names.end(),
        [&key](const std::string& n) { return internal::lower_copy(n) == key; });
    if (present) return false;
    server_names.push_back(name);
    return true;
}

} // namespace sl
