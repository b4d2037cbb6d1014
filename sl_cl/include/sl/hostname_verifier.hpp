/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <string>
#include "sl/tls_session.hpp"

namespace sl {

// Post-handshake identity check. Return false to reject the peer.
// An empty std::function means "no check".
using HostnameVerifier = std::function<bool(const std::string& hostname, const TlsSession& session)>;

// True when the peer certificate matches hostname: DNS names via
// X509_check_host (no partial wildcards), IP literals via X509_check_ip_asc.
bool certificate_matches_host(const std::string& hostname, const TlsSession& session);

HostnameVerifier make_certificate_hostname_verifier();
HostnameVerifier make_accept_all_verifier();

} // namespace sl
