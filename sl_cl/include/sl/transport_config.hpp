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
#include <cstdint>

namespace sl {

// Public transport configuration. Plain values; copy freely.
struct TransportConfig {
    // Endpoint
    std::string   host = "127.0.0.1";
    std::uint16_t port = 8883;

    // Timeouts (seconds)
    int connect_timeout_sec   = 5;  // TCP connect
    int io_timeout_sec        = 5;  // ambient SO_RCVTIMEO/SO_SNDTIMEO, 0 = none
    int handshake_timeout_sec = 0;  // TLS handshake bound, 0 = keep ambient

    // TLS trust and identity
    bool tls_verify_peer = true;       // engine validates the certificate chain
    std::string tls_ca_file;           // optional CA bundle, else system paths
    std::string tls_sni;               // optional server name pre-populated on every socket
    std::string tls_client_cert_file;  // optional mTLS
    std::string tls_client_key_file;   // optional mTLS

    // Cipher restriction, OpenSSL names. Empty = library defaults.
    std::vector<std::string> enabled_ciphers;

    // Engine endpoint identification ("HTTPS" algorithm).
    bool https_hostname_verification = true;

    // Logging
    std::string resource_name;         // tag for diagnostics
    std::string log_file = "sl_client.log";
};

} // namespace sl
