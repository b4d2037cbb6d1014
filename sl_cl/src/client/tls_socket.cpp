/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/tls_socket.hpp"
#include "sl/internal/utils.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <utility>

namespace {

const char* kTimedOut = "handshake timed out waiting for peer";

std::string peer_address(int fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (fd < 0 || ::getpeername(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) return {};
    char buf[INET6_ADDRSTRLEN]{0};
    if (ss.ss_family == AF_INET) {
        auto* in = reinterpret_cast<sockaddr_in*>(&ss);
        if (::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf))) return buf;
    } else if (ss.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<sockaddr_in6*>(&ss);
        if (::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf))) return buf;
    }
    return {};
}

void collect_subject_alt_names(X509* cert, sl::TlsSession& out) {
    auto* names = static_cast<GENERAL_NAMES*>(
        ::X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    if (!names) return;

    for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i) {
        const GENERAL_NAME* gn = sk_GENERAL_NAME_value(names, i);
        if (gn->type == GEN_DNS) {
            const unsigned char* d = ::ASN1_STRING_get0_data(gn->d.dNSName);
            const int l = ::ASN1_STRING_length(gn->d.dNSName);
            out.peer_dns_names.emplace_back(reinterpret_cast<const char*>(d), static_cast<std::size_t>(l));
        } else if (gn->type == GEN_IPADD) {
            const unsigned char* d = ::ASN1_STRING_get0_data(gn->d.iPAddress);
            const int l = ::ASN1_STRING_length(gn->d.iPAddress);
            char buf[INET6_ADDRSTRLEN]{0};
            const int af = (l == 4) ? AF_INET : (l == 16 ? AF_INET6 : -1);
            if (af != -1 && ::inet_ntop(af, d, buf, sizeof(buf))) {
                out.peer_ip_addresses.emplace_back(buf);
            }
        }
    }
    GENERAL_NAMES_free(names);
}

} // namespace

namespace sl {

TlsSocket::TlsSocket(SSL* ssl, TlsParameters initial)
    : _ssl(ssl, [](SSL* s){ if (s) { SSL_free(s); } }),
      _params(std::move(initial)) {}

bool TlsSocket::set_parameters(const TlsParameters& p, std::string& err) {
    SSL* s = _ssl.get();

    // SNI carries one host_name; the first non-IP entry wins.
    for (const auto& n : p.server_names) {
        if (internal::is_ip_literal(n)) continue;
        if (SSL_set_tlsext_host_name(s, n.c_str()) != 1) {
            err = "SSL_set_tlsext_host_name(" + n + ") failed: " + internal::drain_openssl_errors();
            return false;
        }
        break;
    }

    X509_VERIFY_PARAM* vp = SSL_get0_param(s);
    if (!vp) {
        err = "SSL_get0_param failed";
        return false;
    }
    if (X509_VERIFY_PARAM_set1_host(vp, nullptr, 0) != 1 ||
        X509_VERIFY_PARAM_set1_ip(vp, nullptr, 0) != 1) {
        err = "resetting verify identities failed: " + internal::drain_openssl_errors();
        return false;
    }

    const std::string algo = internal::lower_copy(p.endpoint_identification);
    if (algo == "https") {
        X509_VERIFY_PARAM_set_hostflags(vp, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);

        // Any DNS entry is an acceptable identity. IP literals are only
        // checked when no DNS name is configured, since OpenSSL would
        // require both to match.
        bool have_dns = false;
        for (const auto& n : p.server_names) {
            if (internal::is_ip_literal(n)) continue;
            const int rc = have_dns ? X509_VERIFY_PARAM_add1_host(vp, n.c_str(), 0)
                                    : X509_VERIFY_PARAM_set1_host(vp, n.c_str(), 0);
            if (rc != 1) {
                err = "X509_VERIFY_PARAM host(" + n + ") failed: " + internal::drain_openssl_errors();
                return false;
            }
            have_dns = true;
        }
        if (!have_dns) {
            for (const auto& n : p.server_names) {
                if (X509_VERIFY_PARAM_set1_ip_asc(vp, n.c_str()) != 1) {
                    err = "X509_VERIFY_PARAM_set1_ip_asc(" + n + ") failed: " + internal::drain_openssl_errors();
                    return false;
                }
                break;
            }
        }
    } else if (!algo.empty()) {
        err = "unsupported endpoint identification algorithm: " + p.endpoint_identification;
        return false;
    }

    if (p.cipher_suites != _params.cipher_suites) {
        if (!set_enabled_ciphers(p.cipher_suites, err)) return false;
    }

    _params = p;
    return true;
}

bool TlsSocket::set_enabled_ciphers(const std::vector<std::string>& ciphers, std::string& err) {
    if (ciphers.empty()) return clear_cipher_restriction(err);

    std::vector<std::string> tls13, tls12;
    for (const auto& c : ciphers) {
        if (c.rfind("TLS_", 0) == 0) tls13.push_back(c);
        else tls12.push_back(c);
    }

    SSL* s = _ssl.get();
    ::ERR_clear_error();

    // An empty TLS 1.3 list is legal and disables those suites.
    if (SSL_set_ciphersuites(s, internal::join(tls13, ":").c_str()) != 1) {
        err = "no usable TLS 1.3 cipher suite in [" + internal::join(tls13, ",") + "]: " +
              internal::drain_openssl_errors();
        return false;
    }
    if (!tls12.empty() && SSL_set_cipher_list(s, internal::join(tls12, ":").c_str()) != 1) {
        err = "no usable cipher in [" + internal::join(tls12, ",") + "]: " +
              internal::drain_openssl_errors();
        return false;
    }

    // Keep the protocol range consistent with the suites left enabled.
    const int min_ver = tls12.empty() ? TLS1_3_VERSION : TLS1_2_VERSION;
    const int max_ver = tls13.empty() ? TLS1_2_VERSION : 0;
    if (SSL_set_min_proto_version(s, min_ver) != 1 || SSL_set_max_proto_version(s, max_ver) != 1) {
        err = "setting protocol range failed: " + internal::drain_openssl_errors();
        return false;
    }

    _params.cipher_suites = ciphers;
    return true;
}

bool TlsSocket::clear_cipher_restriction(std::string& err) {
    if (_params.cipher_suites.empty()) return true;

    SSL* s = _ssl.get();
    SSL_CTX* ctx = SSL_get_SSL_CTX(s);
    ::ERR_clear_error();
    if (SSL_set_ciphersuites(s, OSSL_default_ciphersuites()) != 1 ||
        SSL_set_cipher_list(s, OSSL_default_cipher_list()) != 1 ||
        SSL_set_min_proto_version(s, static_cast<int>(SSL_CTX_get_min_proto_version(ctx))) != 1 ||
        SSL_set_max_proto_version(s, static_cast<int>(SSL_CTX_get_max_proto_version(ctx))) != 1) {
        err = "restoring default cipher suites failed: " + internal::drain_openssl_errors();
        return false;
    }
    _params.cipher_suites.clear();
    return true;
}

bool TlsSocket::handshake(std::string& err) {
    SSL* s = _ssl.get();

    while (true) {
        ::ERR_clear_error();
        errno = 0;
        const int rc = SSL_connect(s);
        if (rc == 1) {
            _handshake_done = true;
            return true;
        }

        const int ssl_err = SSL_get_error(s, rc);

        // Blocking descriptor: a retry request means SO_RCVTIMEO/SO_SNDTIMEO fired.
        if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
            err = kTimedOut;
            return false;
        }

        if (ssl_err == SSL_ERROR_SYSCALL) {
            const int e = errno;
            if (e == EINTR) continue;
            if (e == EAGAIN || e == EWOULDBLOCK) {
                err = kTimedOut;
                return false;
            }
            err = e ? std::string("socket error during handshake: ") + std::strerror(e)
                    : std::string("peer closed connection during handshake");
            const std::string q = internal::drain_openssl_errors();
            if (!q.empty()) err += " (" + q + ")";
            return false;
        }

        if (ssl_err == SSL_ERROR_ZERO_RETURN) {
            err = "peer closed connection during handshake";
            return false;
        }

        // Protocol / certificate / other SSL-layer error.
        err = "TLS handshake failed";
        const long vr = SSL_get_verify_result(s);
        if (vr != X509_V_OK) {
            err += std::string(": certificate verify failed: ") + X509_verify_cert_error_string(vr);
        }
        const std::string q = internal::drain_openssl_errors();
        if (!q.empty()) err += " (" + q + ")";
        return false;
    }
}

TlsSession TlsSocket::session() const {
    TlsSession out;
    if (!_handshake_done) return out;

    SSL* s = _ssl.get();
    out.protocol = SSL_get_version(s);
    if (const SSL_CIPHER* c = SSL_get_current_cipher(s)) {
        out.cipher = SSL_CIPHER_get_name(c);
    }

    if (const char* sn = SSL_get_servername(s, TLSEXT_NAMETYPE_host_name)) {
        out.peer_host = sn;
    } else {
        out.peer_host = peer_address(SSL_get_fd(s));
    }

    if (X509* cert = SSL_get1_peer_certificate(s)) {
        out.peer_certificate.reset(cert, X509_free);
        char buf[512]{0};
        if (X509_NAME_oneline(X509_get_subject_name(cert), buf, sizeof(buf))) {
            out.peer_subject = buf;
        }
        collect_subject_alt_names(cert, out);
    }
    return out;
}

void TlsSocket::invalidate_session() {
    SSL* s = _ssl.get();
    if (SSL_SESSION* sess = SSL_get_session(s)) {
        SSL_CTX_remove_session(SSL_get_SSL_CTX(s), sess);
    }
}

bool TlsSocket::send_all(const char* d, std::size_t len) {
    if (!_handshake_done) return false;
    std::size_t off = 0;
    while (off < len) {
        const std::size_t chunk = std::min<std::size_t>(len - off, INT_MAX);
        int n = SSL_write(_ssl.get(), d + off, static_cast<int>(chunk));
        if (n <= 0) { (void)SSL_get_error(_ssl.get(), n); return false; }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

long TlsSocket::recv_some(char* d, std::size_t len) {
    if (!_handshake_done) return -1;
    const int n = SSL_read(_ssl.get(), d, static_cast<int>(std::min<std::size_t>(len, INT_MAX)));
    if (n > 0) return n;
    return SSL_get_error(_ssl.get(), n) == SSL_ERROR_ZERO_RETURN ? 0 : -1;
}

void TlsSocket::shutdown() {
    if (_handshake_done) {
        (void)SSL_shutdown(_ssl.get());
        _handshake_done = false;
    }
}

} // namespace sl
