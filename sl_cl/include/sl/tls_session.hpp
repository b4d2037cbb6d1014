/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include <openssl/x509.h>

namespace sl {

// Per-socket TLS parameters. A value type: read it out of a TlsSocket,
// modify the copy, write it back with TlsSocket::set_parameters().
struct TlsParameters {
    // SNI / identity names, in insertion order, without duplicates.
    std::vector<std::string> server_names;

    // "" (engine does no name check) or "HTTPS" (RFC 2818 style check
    // against every entry of server_names during the handshake).
    std::string endpoint_identification;

    // Empty means library defaults.
    std::vector<std::string> cipher_suites;

    // Appends name unless already present (case-insensitive).
    // Returns true when the list changed.
    bool add_server_name(const std::string& name);
};

inline constexpr const char* kEndpointIdentificationHttps = "HTTPS";

// Snapshot of a completed handshake.
struct TlsSession {
    std::string peer_host;     // SNI name sent, else numeric peer address
    std::string protocol;      // e.g. "TLSv1.3"
    std::string cipher;        // OpenSSL cipher name
    std::string peer_subject;  // one-line subject DN

    std::vector<std::string> peer_dns_names;     // SAN dNSName entries
    std::vector<std::string> peer_ip_addresses;  // SAN iPAddress entries, textual

    std::shared_ptr<X509> peer_certificate;

    bool established() const { return !protocol.empty(); }
};

} // namespace sl
