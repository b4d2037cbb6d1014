/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "sl/hostname_verifier.hpp"
#include "sl/tls_client_context.hpp"
#include "sl/tls_session.hpp"
#include "sl/tls_socket.hpp"
#include "sl/transport_config.hpp"
#include "sl/transport_error.hpp"
#include "sl/types.hpp"

namespace sl {

// TLS upgrade of one TCP connection to host:port.
//
// Single-shot: start() connects, applies ciphers, bounds the handshake by
// the handshake timeout, adds SNI, handshakes, runs the hostname verifier
// and restores the ambient read timeout. Any failure closes the socket
// before start() returns. A second start() is rejected with
// ErrorKind::InvalidState; build a new instance to reconnect.
//
// Setters are meant to be called before start(). Only abort() may be called
// from another thread while start() is running.
class SecureTransport {
public:
    using DiagnosticSink = std::function<void(const std::string&)>;

    SecureTransport(std::shared_ptr<const TlsClientContext> ctx,
                    std::string host, std::uint16_t port,
                    std::string resource_name = {});
    ~SecureTransport();

    SecureTransport(const SecureTransport&) = delete;
    SecureTransport& operator=(const SecureTransport&) = delete;

    // Absent or empty = library default suites. When a TLS socket already
    // exists the list is applied to it right away; false if that failed.
    const std::optional<std::vector<std::string>>& enabled_ciphers() const;
    bool set_enabled_ciphers(std::optional<std::vector<std::string>> ciphers);

    // Whole seconds; 0 keeps the ambient read timeout during the handshake.
    // A non-zero value also becomes the TCP connect timeout, unless one was
    // set with set_connect_timeout_sec().
    int  handshake_timeout_sec() const;
    void set_handshake_timeout_sec(int seconds);

    int  connect_timeout_sec() const;
    void set_connect_timeout_sec(int seconds);

    // Ambient SO_RCVTIMEO/SO_SNDTIMEO installed on connect; 0 = unbounded.
    int  io_timeout_sec() const;
    void set_io_timeout_sec(int seconds);

    const HostnameVerifier& hostname_verifier() const;
    void set_hostname_verifier(HostnameVerifier verifier);

    bool https_hostname_verification() const;
    void set_https_hostname_verification(bool enabled);

    void set_diagnostic_sink(DiagnosticSink sink);

    bool start(TransportError& err);

    // "ssl://<host>:<port>", valid in any state.
    std::string server_uri() const;

    const std::string& host() const;
    std::uint16_t port() const;
    State state() const;

    // Non-null only while state() == State::Verified.
    TlsSocket* tls_socket();
    TlsSession session() const;

    bool send_all(const char* d, std::size_t len);
    long recv_some(char* d, std::size_t len);

    // close_notify, then release the descriptor. Verified becomes Closed.
    void close();

    // Interrupt a blocked start()/recv_some() from another thread. Also
    // effective while the TCP connect is in progress, or before start().
    void abort();

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

// Copy cipher, timeout and verification settings from cfg.
// False if the cipher list could not be applied to an open socket.
bool apply_config(SecureTransport& t, const TransportConfig& cfg);

} // namespace sl
