/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#pragma once

namespace sl {

// Lifecycle of one SecureTransport::start() attempt.
enum class State {
    Unstarted,
    TcpConnected,
    CiphersApplied,
    ParamsConfigured,
    HandshakeDone,
    Verified,   // channel usable
    Closed,     // terminal, closed by the caller after Verified
    Failed      // terminal, socket closed
};

enum class ErrorKind {
    None,
    Connection,    // raw TCP could not be established
    Handshake,     // TLS negotiation failed or timed out
    PeerIdentity,  // handshake ok, hostname verifier rejected the peer
    Configuration, // context/cipher setup unusable
    InvalidState   // start() on an instance that already ran
};

const char* to_string(State s) noexcept;
const char* to_string(ErrorKind k) noexcept;

} // namespace sl
