/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/hostname_verifier.hpp"
#include "sl/internal/utils.hpp"
#include <openssl/x509v3.h>

namespace sl {

bool certificate_matches_host(const std::string& hostname, const TlsSession& session) {
    X509* cert = session.peer_certificate.get();
    if (!cert || hostname.empty()) return false;

    if (internal::is_ip_literal(hostname)) {
        return X509_check_ip_asc(cert, hostname.c_str(), 0) == 1;
    }
    return X509_check_host(cert, hostname.c_str(), hostname.size(),
                           X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS, nullptr) == 1;
}

HostnameVerifier make_certificate_hostname_verifier() {
    return [](const std::string& hostname, const TlsSession& session) {
        return certificate_matches_host(hostname, session);
    };
}

HostnameVerifier make_accept_all_verifier() {
    return [](const std::string&, const TlsSession&) { return true; };
}

} // namespace sl
