/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/tls_client_context.hpp"
#include "sl/internal/socket_bio.hpp"
#include "sl/internal/utils.hpp"
#include "sl/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace sl {

TlsClientContext::TlsClientContext(const TransportConfig& cfg)
    : _verify_peer(cfg.tls_verify_peer),
      _default_sni(cfg.tls_sni) {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx) {
        record_error("SSL_CTX_new");
        return;
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        record_error("set_min_proto");
    }

    // Trust store
    if (!cfg.tls_ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_ca_file.c_str(), nullptr) != 1) {
            record_error("load_verify_locations(CA)");
        }
    } else {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            record_error("set_default_verify_paths");
        }
    }

    // Optional mTLS
    if (!cfg.tls_client_cert_file.empty() && !cfg.tls_client_key_file.empty()) {
        if (SSL_CTX_use_certificate_file(_ctx, cfg.tls_client_cert_file.c_str(), SSL_FILETYPE_PEM) != 1) {
            record_error("use_certificate_file(client)");
        }
        if (SSL_CTX_use_PrivateKey_file(_ctx, cfg.tls_client_key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
            record_error("use_privatekey_file(client)");
        }
        if (SSL_CTX_check_private_key(_ctx) != 1) {
            record_error("check_private_key(client)");
        }
    }

    // Chain verification belongs to the engine; identity checks are layered on top.
    SSL_CTX_set_verify(_ctx, _verify_peer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    // Client session cache for resumption
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

std::unique_ptr<TlsSocket> TlsClientContext::wrap(int fd, std::string& err) const {
    if (!ok()) {
        err = "TLS context not ready: " + _error;
        return nullptr;
    }
    if (fd < 0) {
        err = "no connected socket to wrap";
        return nullptr;
    }

    SSL* s = SSL_new(_ctx);
    if (!s) {
        err = "SSL_new failed: " + internal::drain_openssl_errors();
        return nullptr;
    }
    // SIGPIPE-free writes on the descriptor; the SSL owns the BIO.
    BIO* bio = internal::new_socket_bio(fd);
    if (!bio) {
        err = "socket BIO setup failed: " + internal::drain_openssl_errors();
        SSL_free(s);
        return nullptr;
    }
    SSL_set_bio(s, bio, bio);

    TlsParameters initial;
    initial.add_server_name(_default_sni);
    return std::make_unique<TlsSocket>(s, std::move(initial));
}

void TlsClientContext::record_error(const char* where) {
    std::string detail = internal::drain_openssl_errors();
    if (detail.empty()) detail = "unknown error";
    sl::log_line(LogLevel::Error, std::string("[TLS-CLI] error at ") + where + ": " + detail);
    if (!_error.empty()) _error += "; ";
    _error += std::string(where) + ": " + detail;
}

} // namespace sl
