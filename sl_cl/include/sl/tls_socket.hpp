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
#include <memory>
#include <string>
#include <vector>
#include <openssl/ssl.h>
#include "sl/tls_session.hpp"

namespace sl {

// RAII wrapper over one SSL object bound to a connected descriptor.
// Does not own the descriptor; the plain transport closes it.
class TlsSocket {
public:
    // Takes ownership of ssl. initial seeds parameters() (e.g. SNI override).
    TlsSocket(SSL* ssl, TlsParameters initial);
    ~TlsSocket() = default;

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    TlsParameters parameters() const { return _params; }
    bool set_parameters(const TlsParameters& p, std::string& err);

    // Names starting with "TLS_" are TLS 1.3 suites, the rest go to the
    // TLS 1.2 cipher list. An empty list lifts an earlier restriction and
    // goes back to the library defaults and the context's protocol range.
    bool set_enabled_ciphers(const std::vector<std::string>& ciphers, std::string& err);

    // Blocking SSL_connect. The descriptor's SO_RCVTIMEO bounds each read;
    // expiry, peer EOF or shutdown() of the descriptor all end it.
    bool handshake(std::string& err);

    TlsSession session() const;

    // Remove the session from the context cache so it is never resumed.
    void invalidate_session();

    bool send_all(const char* d, std::size_t len);
    // >0 bytes read, 0 orderly close, <0 error or timeout.
    long recv_some(char* d, std::size_t len);

    // Send close_notify. The descriptor stays open.
    void shutdown();

    SSL* native_handle() const { return _ssl.get(); }

private:
    std::unique_ptr<SSL, void(*)(SSL*)> _ssl;
    TlsParameters _params;
    bool _handshake_done = false;

    bool clear_cipher_restriction(std::string& err);
};

} // namespace sl
