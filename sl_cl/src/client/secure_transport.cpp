/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/secure_transport.hpp"
#include "sl/internal/plain_transport.hpp"
#include "sl/internal/utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <utility>

namespace sl {

struct SecureTransport::Impl {
    std::shared_ptr<const TlsClientContext> ctx;
    const std::string   host;
    const std::uint16_t port;
    std::string resource_name;

    // Configuration surface
    std::optional<std::vector<std::string>> enabled_ciphers;
    int  handshake_timeout_sec = 0;
    int  connect_timeout_sec   = 5;
    bool connect_timeout_set   = false;
    int  io_timeout_sec        = 0;
    HostnameVerifier verifier;
    bool https_verification = true;
    DiagnosticSink sink;

    // Connection state
    internal::PlainTransport plain;
    std::unique_ptr<TlsSocket> tls;
    std::atomic<State> state{State::Unstarted};

    Impl(std::shared_ptr<const TlsClientContext> c, std::string h, std::uint16_t p, std::string res)
        : ctx(std::move(c)), host(std::move(h)), port(p), resource_name(std::move(res)) {}

    void diag(const std::string& line) const {
        if (!sink) return;
        if (resource_name.empty()) sink(line);
        else sink("[" + resource_name + "] " + line);
    }

    bool apply_ciphers(std::string& why) {
        if (!tls || !enabled_ciphers) return true;
        if (!enabled_ciphers->empty()) {
            diag("enabled ciphers: " + internal::join(*enabled_ciphers, ","));
        }
        return tls->set_enabled_ciphers(*enabled_ciphers, why);
    }

    void release_socket() {
        tls.reset();
        plain.close();
    }

    bool fail(TransportError& err, ErrorKind kind, std::string message) {
        release_socket();
        state = State::Failed;
        err.kind = kind;
        err.message = std::move(message);
        diag(std::string("start failed (") + to_string(kind) + "): " + err.message);
        return false;
    }
};

SecureTransport::SecureTransport(std::shared_ptr<const TlsClientContext> ctx,
                                 std::string host, std::uint16_t port,
                                 std::string resource_name)
    : _p(std::make_unique<Impl>(std::move(ctx), std::move(host), port, std::move(resource_name))) {}

SecureTransport::~SecureTransport() {
    close();
}

const std::optional<std::vector<std::string>>& SecureTransport::enabled_ciphers() const {
    return _p->enabled_ciphers;
}

bool SecureTransport::set_enabled_ciphers(std::optional<std::vector<std::string>> ciphers) {
    _p->enabled_ciphers = std::move(ciphers);
    std::string why;
    if (!_p->apply_ciphers(why)) {
        _p->diag("applying ciphers failed: " + why);
        return false;
    }
    return true;
}

int SecureTransport::handshake_timeout_sec() const { return _p->handshake_timeout_sec; }

void SecureTransport::set_handshake_timeout_sec(int seconds) {
    _p->handshake_timeout_sec = std::max(0, seconds);
    if (_p->handshake_timeout_sec > 0 && !_p->connect_timeout_set) {
        _p->connect_timeout_sec = _p->handshake_timeout_sec;
    }
}

int SecureTransport::connect_timeout_sec() const { return _p->connect_timeout_sec; }
void SecureTransport::set_connect_timeout_sec(int seconds) {
    _p->connect_timeout_sec = std::max(1, seconds);
    _p->connect_timeout_set = true;
}

int SecureTransport::io_timeout_sec() const { return _p->io_timeout_sec; }
void SecureTransport::set_io_timeout_sec(int seconds) { _p->io_timeout_sec = std::max(0, seconds); }

const HostnameVerifier& SecureTransport::hostname_verifier() const { return _p->verifier; }
void SecureTransport::set_hostname_verifier(HostnameVerifier verifier) { _p->verifier = std::move(verifier); }

bool SecureTransport::https_hostname_verification() const { return _p->https_verification; }
void SecureTransport::set_https_hostname_verification(bool enabled) { _p->https_verification = enabled; }

void SecureTransport::set_diagnostic_sink(DiagnosticSink sink) { _p->sink = std::move(sink); }

bool SecureTransport::start(TransportError& err) {
    err.clear();
    Impl& p = *_p;

    if (p.state != State::Unstarted) {
        err.kind = ErrorKind::InvalidState;
        err.message = std::string("start() already ran on this transport (state ") +
                      to_string(p.state.load()) + ")";
        return false;
    }
    if (!p.ctx || !p.ctx->ok()) {
        return p.fail(err, ErrorKind::Configuration,
                      p.ctx ? "TLS context not ready: " + p.ctx->error() : "no TLS context");
    }

    std::string why;

    // 1. Raw connection, then wrap it.
    if (!p.plain.open(p.host, p.port, p.connect_timeout_sec, p.io_timeout_sec, why)) {
        return p.fail(err, ErrorKind::Connection, why);
    }
    p.tls = p.ctx->wrap(p.plain.fd(), why);
    if (!p.tls) {
        return p.fail(err, ErrorKind::Configuration, why);
    }
    p.state = State::TcpConnected;

    // 2. Cipher restriction.
    if (!p.apply_ciphers(why)) {
        return p.fail(err, ErrorKind::Configuration, why);
    }
    p.state = State::CiphersApplied;

    // 3. Bound the handshake through the read timeout.
    std::chrono::milliseconds saved_timeout{0};
    if (!p.plain.read_timeout(saved_timeout)) {
        return p.fail(err, ErrorKind::Connection, "cannot read socket read timeout");
    }
    if (p.handshake_timeout_sec > 0) {
        if (!p.plain.set_read_timeout(std::chrono::seconds(p.handshake_timeout_sec))) {
            return p.fail(err, ErrorKind::Connection, "cannot install handshake timeout");
        }
    }

    // 4. SNI and endpoint identification, on a copy of the parameters.
    TlsParameters params = p.tls->parameters();
    params.add_server_name(p.host);
    if (p.https_verification) {
        params.endpoint_identification = kEndpointIdentificationHttps;
    }
    if (!p.tls->set_parameters(params, why)) {
        return p.fail(err, ErrorKind::Configuration, why);
    }
    p.diag("server names: " + internal::join(params.server_names, ",") +
           (p.https_verification ? " (endpoint identification HTTPS)" : ""));
    p.state = State::ParamsConfigured;

    // 5. Handshake.
    if (!p.tls->handshake(why)) {
        return p.fail(err, ErrorKind::Handshake, why);
    }
    p.state = State::HandshakeDone;

    // 6. Pluggable identity check.
    if (p.verifier) {
        const TlsSession session = p.tls->session();
        if (!p.verifier(p.host, session)) {
            p.tls->invalidate_session();
            err.expected_host = p.host;
            err.peer_host = session.peer_host;
            return p.fail(err, ErrorKind::PeerIdentity,
                          "Host: " + p.host + ", Peer Host: " + session.peer_host);
        }
    }

    // 7. Back to the ambient read timeout.
    if (!p.plain.set_read_timeout(saved_timeout)) {
        return p.fail(err, ErrorKind::Connection, "cannot restore socket read timeout");
    }
    p.state = State::Verified;
    p.diag("connected to " + server_uri());
    return true;
}

std::string SecureTransport::server_uri() const {
    return "ssl://" + _p->host + ":" + std::to_string(_p->port);
}

const std::string& SecureTransport::host() const { return _p->host; }
std::uint16_t SecureTransport::port() const { return _p->port; }
State SecureTransport::state() const { return _p->state.load(); }

TlsSocket* SecureTransport::tls_socket() {
    return _p->state == State::Verified ? _p->tls.get() : nullptr;
}

TlsSession SecureTransport::session() const {
    if (_p->state != State::Verified || !_p->tls) return {};
    return _p->tls->session();
}

bool SecureTransport::send_all(const char* d, std::size_t len) {
    TlsSocket* s = tls_socket();
    return s && s->send_all(d, len);
}

long SecureTransport::recv_some(char* d, std::size_t len) {
    TlsSocket* s = tls_socket();
    return s ? s->recv_some(d, len) : -1;
}

void SecureTransport::close() {
    if (_p->tls) {
        _p->tls->shutdown();
    }
    _p->release_socket();
    if (_p->state == State::Verified) {
        _p->state = State::Closed;
    }
}

void SecureTransport::abort() {
    _p->plain.abort();
}

bool apply_config(SecureTransport& t, const TransportConfig& cfg) {
    t.set_connect_timeout_sec(cfg.connect_timeout_sec);
    t.set_io_timeout_sec(cfg.io_timeout_sec);
    t.set_handshake_timeout_sec(cfg.handshake_timeout_sec);
    t.set_https_hostname_verification(cfg.https_hostname_verification);
    if (cfg.enabled_ciphers.empty()) return true;
    return t.set_enabled_ciphers(cfg.enabled_ciphers);
}

} // namespace sl
