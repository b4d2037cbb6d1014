/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <memory>
#include <string>
#include "sl/transport_config.hpp"
#include "sl/tls_socket.hpp"

namespace sl {

// TLS client context and socket factory. Loads system CA or custom CA,
// optional mTLS client certificate, and the default SNI name.
// Shared between transports; wrap() is safe to call concurrently.
class TlsClientContext {
public:
    explicit TlsClientContext(const TransportConfig& cfg);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }

    // False when any required piece of the configuration failed to load.
    bool ok() const { return _ctx != nullptr && _error.empty(); }
    const std::string& error() const { return _error; }

    bool verify_peer() const { return _verify_peer; }

    // New SSL bound to a connected descriptor. The socket's parameters start
    // with the configured SNI override, if any.
    std::unique_ptr<TlsSocket> wrap(int fd, std::string& err) const;

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    bool _verify_peer = true;
    std::string _default_sni;
    std::string _error;

    void record_error(const char* where);
};

} // namespace sl
