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
#include "sl/types.hpp"

namespace sl {

// Out-parameter filled by failing transport operations.
struct TransportError {
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    // Only set for ErrorKind::PeerIdentity.
    std::string expected_host;
    std::string peer_host;

    bool ok() const noexcept { return kind == ErrorKind::None; }

    void clear() {
        kind = ErrorKind::None;
        message.clear();
        expected_host.clear();
        peer_host.clear();
    }

    // "<kind>: <message>"
    std::string describe() const;
};

} // namespace sl
