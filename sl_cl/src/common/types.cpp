/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/types.hpp"
#include "sl/transport_error.hpp"

namespace sl {

const char* to_string(State s) noexcept {
    switch (s) {
        case State::Unstarted:        return "unstarted";
        case State::TcpConnected:     return "tcp-connected";
        case State::CiphersApplied:   return "ciphers-applied";
        case State::ParamsConfigured: return "params-configured";
        case State::HandshakeDone:    return "handshake-done";
        case State::Verified:         return "verified";
        case State::Closed:           return "closed";
        case State::Failed:           return "failed";
    }
    return "unknown";
}

const char* to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::None:          return "none";
        case ErrorKind::Connection:    return "connection";
        case ErrorKind::Handshake:     return "handshake";
        case ErrorKind::PeerIdentity:  return "peer-identity";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::InvalidState:  return "invalid-state";
    }
    return "unknown";
}

std::string TransportError::describe() const {
    std::string s = to_string(kind);
    if (!message.empty()) {
        s += ": ";
        s += message;
    }
    return s;
}

} // namespace sl
