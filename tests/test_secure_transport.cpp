/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include "sl/secure_transport.hpp"
#include "sl/internal/time.hpp"
#include "test_support.hpp"

#include <sys/socket.h>

#include <atomic>
#include <climits>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace sl {
namespace {

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

std::chrono::milliseconds socket_read_timeout(SecureTransport& t) {
    TlsSocket* s = t.tls_socket();
    if (!s) return std::chrono::milliseconds(-1);
    timeval tv{};
    socklen_t len = sizeof(tv);
    if (getsockopt(SSL_get_fd(s->native_handle()), SOL_SOCKET, SO_RCVTIMEO, &tv, &len) != 0) {
        return std::chrono::milliseconds(-1);
    }
    return internal::from_timeval(tv);
}

class SecureTransportTest : public ::testing::Test {
protected:
    // Valid for both the IP literal and localhost.
    test::TestCert cert = test::make_self_signed("localhost", {"localhost"}, {"127.0.0.1"});

    std::shared_ptr<TlsClientContext> trusting(TransportConfig cfg = {}) {
        auto ctx = test::make_trusting_context(cert, std::move(cfg));
        EXPECT_TRUE(ctx->ok()) << ctx->error();
        return ctx;
    }
};

TEST(SecureTransportUriTest, ServerUriIsSchemeHostPort) {
    SecureTransport t(nullptr, "broker.example.com", 8883);
    EXPECT_EQ(t.server_uri(), "ssl://broker.example.com:8883");
    EXPECT_EQ(t.state(), State::Unstarted);

    TransportError err;
    EXPECT_FALSE(t.start(err));
    EXPECT_EQ(err.kind, ErrorKind::Configuration);
    EXPECT_EQ(t.state(), State::Failed);
    EXPECT_EQ(t.server_uri(), "ssl://broker.example.com:8883");
}

TEST(SecureTransportConfigTest, DefaultsAndSetters) {
    SecureTransport t(nullptr, "broker.example.com", 8883);
    EXPECT_FALSE(t.enabled_ciphers().has_value());
    EXPECT_EQ(t.handshake_timeout_sec(), 0);
    EXPECT_TRUE(t.https_hostname_verification());
    EXPECT_FALSE(static_cast<bool>(t.hostname_verifier()));

    EXPECT_TRUE(t.set_enabled_ciphers(std::vector<std::string>{"ECDHE-ECDSA-AES128-GCM-SHA256"}));
    ASSERT_TRUE(t.enabled_ciphers().has_value());
    EXPECT_EQ(t.enabled_ciphers()->size(), 1u);

    t.set_handshake_timeout_sec(7);
    EXPECT_EQ(t.handshake_timeout_sec(), 7);
    EXPECT_EQ(t.connect_timeout_sec(), 7);

    t.set_handshake_timeout_sec(-3);
    EXPECT_EQ(t.handshake_timeout_sec(), 0);
    EXPECT_EQ(t.connect_timeout_sec(), 7);

    t.set_https_hostname_verification(false);
    EXPECT_FALSE(t.https_hostname_verification());

    t.set_hostname_verifier(make_accept_all_verifier());
    EXPECT_TRUE(static_cast<bool>(t.hostname_verifier()));
}

TEST(SecureTransportConfigTest, ApplyConfigCopiesSettings) {
    TransportConfig cfg;
    cfg.connect_timeout_sec = 4;
    cfg.io_timeout_sec = 9;
    cfg.handshake_timeout_sec = 0;
    cfg.https_hostname_verification = false;
    cfg.enabled_ciphers = {"TLS_AES_128_GCM_SHA256"};

    SecureTransport t(nullptr, "broker.example.com", 8883);
    ASSERT_TRUE(apply_config(t, cfg));
    EXPECT_EQ(t.connect_timeout_sec(), 4);
    EXPECT_EQ(t.io_timeout_sec(), 9);
    EXPECT_EQ(t.handshake_timeout_sec(), 0);
    EXPECT_FALSE(t.https_hostname_verification());
    ASSERT_TRUE(t.enabled_ciphers().has_value());
    EXPECT_EQ(*t.enabled_ciphers(), cfg.enabled_ciphers);
}

TEST(SecureTransportConfigTest, ExplicitConnectTimeoutSurvivesHandshakeTimeout) {
    TransportConfig cfg;
    cfg.connect_timeout_sec = 2;
    cfg.handshake_timeout_sec = 10;

    SecureTransport t(nullptr, "broker.example.com", 8883);
    ASSERT_TRUE(apply_config(t, cfg));
    EXPECT_EQ(t.connect_timeout_sec(), 2);
    EXPECT_EQ(t.handshake_timeout_sec(), 10);

    SecureTransport direct(nullptr, "broker.example.com", 8883);
    direct.set_connect_timeout_sec(3);
    direct.set_handshake_timeout_sec(8);
    EXPECT_EQ(direct.connect_timeout_sec(), 3);
}

TEST_F(SecureTransportTest, HandshakeSucceedsAndCarriesData) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());
    t.set_handshake_timeout_sec(5);

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();
    EXPECT_TRUE(err.ok());
    EXPECT_EQ(t.state(), State::Verified);
    ASSERT_NE(t.tls_socket(), nullptr);

    const TlsSession s = t.session();
    EXPECT_TRUE(s.established());
    EXPECT_FALSE(s.cipher.empty());
    EXPECT_NE(s.peer_certificate, nullptr);
    EXPECT_EQ(s.peer_host, "127.0.0.1");
    EXPECT_EQ(s.peer_dns_names, std::vector<std::string>{"localhost"});
    EXPECT_EQ(s.peer_ip_addresses, std::vector<std::string>{"127.0.0.1"});

    const std::string msg = "CONNECT";
    ASSERT_TRUE(t.send_all(msg.data(), msg.size()));
    std::string echoed;
    char buf[64];
    while (echoed.size() < msg.size()) {
        const long n = t.recv_some(buf, sizeof(buf));
        ASSERT_GT(n, 0);
        echoed.append(buf, static_cast<std::size_t>(n));
    }
    EXPECT_EQ(echoed, msg);
    EXPECT_EQ(server.handshakes(), 1);

    t.close();
    EXPECT_EQ(t.state(), State::Closed);
    EXPECT_EQ(t.tls_socket(), nullptr);
    EXPECT_FALSE(t.send_all(msg.data(), msg.size()));
    EXPECT_LT(t.recv_some(buf, sizeof(buf)), 0);

    EXPECT_FALSE(t.start(err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidState);
    EXPECT_EQ(t.state(), State::Closed);
}

TEST_F(SecureTransportTest, OversizedBufferLengthIsClamped) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();
    ASSERT_TRUE(t.send_all("PING", 4));

    // Only four bytes are pending, so SSL_read never fills past them.
    char buf[64];
    const std::size_t huge = static_cast<std::size_t>(INT_MAX) + 16;
    long got = 0;
    while (got < 4) {
        const long n = t.recv_some(buf + got, huge);
        ASSERT_GT(n, 0);
        got += n;
    }
    EXPECT_EQ(std::string(buf, 4), "PING");
}

TEST_F(SecureTransportTest, ReadTimeoutIsRestoredAfterHandshake) {
    test::TlsTestServer server(cert);
    for (int handshake_timeout : {0, 1, 10}) {
        SecureTransport t(trusting(), "127.0.0.1", server.port());
        t.set_io_timeout_sec(3);
        t.set_handshake_timeout_sec(handshake_timeout);

        TransportError err;
        ASSERT_TRUE(t.start(err)) << err.describe();
        EXPECT_EQ(socket_read_timeout(t), 3s) << "handshake timeout " << handshake_timeout;
        t.close();
    }
}

TEST_F(SecureTransportTest, UnboundedAmbientTimeoutIsRestoredToo) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());
    t.set_io_timeout_sec(0);
    t.set_handshake_timeout_sec(2);

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();
    EXPECT_EQ(socket_read_timeout(t), 0ms);
}

TEST_F(SecureTransportTest, SilentPeerIsBoundedByHandshakeTimeout) {
    test::TlsTestServer server(cert, test::TlsTestServer::Mode::Silent);
    SecureTransport t(trusting(), "127.0.0.1", server.port());
    t.set_io_timeout_sec(0);  // nothing else would stop the handshake
    t.set_handshake_timeout_sec(1);

    TransportError err;
    const auto t0 = Clock::now();
    EXPECT_FALSE(t.start(err));
    const auto elapsed = Clock::now() - t0;

    EXPECT_EQ(err.kind, ErrorKind::Handshake) << err.describe();
    EXPECT_EQ(t.state(), State::Failed);
    EXPECT_GE(elapsed, 900ms);
    EXPECT_LT(elapsed, 4s);
}

TEST_F(SecureTransportTest, AbortFromAnotherThreadEndsHandshake) {
    test::TlsTestServer server(cert, test::TlsTestServer::Mode::Silent);
    SecureTransport t(trusting(), "127.0.0.1", server.port());
    t.set_io_timeout_sec(0);
    t.set_handshake_timeout_sec(20);  // safety net only

    TransportError err;
    std::atomic<bool> done{false};
    bool ok = true;
    const auto t0 = Clock::now();
    std::thread worker([&] {
        ok = t.start(err);
        done = true;
    });

    std::this_thread::sleep_for(300ms);
    t.abort();
    worker.join();

    EXPECT_TRUE(done.load());
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, ErrorKind::Handshake) << err.describe();
    EXPECT_LT(Clock::now() - t0, 5s);
}

TEST_F(SecureTransportTest, SingleAbortDuringConnectEndsStart) {
    test::StalledListener listener;
    if (!listener.stalled()) GTEST_SKIP() << "kernel did not stall the accept queue";

    SecureTransport t(trusting(), "127.0.0.1", listener.port());
    t.set_connect_timeout_sec(5);

    TransportError err;
    bool ok = true;
    const auto t0 = Clock::now();
    std::thread worker([&] { ok = t.start(err); });

    std::this_thread::sleep_for(300ms);
    t.abort();
    worker.join();

    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, ErrorKind::Connection) << err.describe();
    EXPECT_NE(err.message.find("aborted"), std::string::npos) << err.message;
    EXPECT_EQ(t.state(), State::Failed);
    EXPECT_LT(Clock::now() - t0, 2s);
}

TEST_F(SecureTransportTest, AbortBeforeStartFailsWithoutHandshake) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());
    t.abort();

    TransportError err;
    EXPECT_FALSE(t.start(err));
    EXPECT_EQ(err.kind, ErrorKind::Connection) << err.describe();
    EXPECT_EQ(server.handshakes(), 0);
}

TEST_F(SecureTransportTest, PeerHangUpMakesSendFailWithoutSignal) {
    test::TlsTestServer server(cert, test::TlsTestServer::Mode::HangUp);
    SecureTransport t(trusting(), "127.0.0.1", server.port());

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();

    // The first writes may still land in the socket buffer; once the RST
    // is back the next one gets EPIPE, which must come back as false.
    const std::string msg = "PINGREQ";
    bool failed = false;
    for (int i = 0; i < 100 && !failed; ++i) {
        failed = !t.send_all(msg.data(), msg.size());
        if (!failed) std::this_thread::sleep_for(20ms);
    }
    EXPECT_TRUE(failed);
    EXPECT_EQ(server.handshakes(), 1);

    t.close();
    EXPECT_EQ(t.state(), State::Closed);
}

TEST_F(SecureTransportTest, RejectingVerifierClosesSocketAndReportsIdentity) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());

    int calls = 0;
    std::string seen_host;
    t.set_hostname_verifier([&](const std::string& host, const TlsSession& session) {
        ++calls;
        seen_host = host;
        EXPECT_TRUE(session.established());
        return false;
    });

    TransportError err;
    EXPECT_FALSE(t.start(err));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen_host, "127.0.0.1");
    EXPECT_EQ(err.kind, ErrorKind::PeerIdentity);
    EXPECT_EQ(err.expected_host, "127.0.0.1");
    EXPECT_EQ(err.peer_host, "127.0.0.1");
    EXPECT_NE(err.message.find("Host: 127.0.0.1"), std::string::npos);
    EXPECT_EQ(t.state(), State::Failed);

    // The engine accepted the peer; only the identity check failed.
    EXPECT_TRUE(server.wait_for_peer_close(3s));
    EXPECT_EQ(server.handshakes(), 1);

    const char ping[] = "x";
    char buf[8];
    EXPECT_EQ(t.tls_socket(), nullptr);
    EXPECT_FALSE(t.send_all(ping, 1));
    EXPECT_LT(t.recv_some(buf, sizeof(buf)), 0);
}

TEST_F(SecureTransportTest, CertificateVerifierAcceptsMatchingPeer) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());
    t.set_hostname_verifier(make_certificate_hostname_verifier());

    TransportError err;
    EXPECT_TRUE(t.start(err)) << err.describe();
    EXPECT_EQ(t.state(), State::Verified);
}

TEST_F(SecureTransportTest, NoVerifierPassesWhateverTheEngineAccepts) {
    // Trusted, but issued for a different name.
    const auto other = test::make_self_signed("other.example", {"other.example"}, {});
    test::TlsTestServer server(other);

    SecureTransport t(test::make_trusting_context(other), "127.0.0.1", server.port());
    t.set_https_hostname_verification(false);

    TransportError err;
    EXPECT_TRUE(t.start(err)) << err.describe();
    EXPECT_EQ(t.state(), State::Verified);
}

TEST_F(SecureTransportTest, EndpointIdentificationRejectsWrongName) {
    const auto other = test::make_self_signed("other.example", {"other.example"}, {});
    test::TlsTestServer server(other);

    SecureTransport t(test::make_trusting_context(other), "127.0.0.1", server.port());
    ASSERT_TRUE(t.https_hostname_verification());

    TransportError err;
    EXPECT_FALSE(t.start(err));
    EXPECT_EQ(err.kind, ErrorKind::Handshake) << err.describe();
    EXPECT_NE(err.message.find("certificate verify failed"), std::string::npos) << err.message;
    EXPECT_EQ(t.state(), State::Failed);
}

TEST_F(SecureTransportTest, UntrustedCertificateIsHandshakeError) {
    test::TlsTestServer server(cert);
    const auto stranger = test::make_self_signed("stranger", {"stranger"}, {});

    SecureTransport t(test::make_trusting_context(stranger), "127.0.0.1", server.port());
    TransportError err;
    EXPECT_FALSE(t.start(err));
    EXPECT_EQ(err.kind, ErrorKind::Handshake) << err.describe();
}

TEST_F(SecureTransportTest, ConnectionRefusedIsConnectionError) {
    SecureTransport t(trusting(), "127.0.0.1", test::unused_port());
    t.set_connect_timeout_sec(1);

    TransportError err;
    EXPECT_FALSE(t.start(err));
    EXPECT_EQ(err.kind, ErrorKind::Connection) << err.describe();
    EXPECT_EQ(t.state(), State::Failed);
    EXPECT_EQ(t.tls_socket(), nullptr);
}

TEST_F(SecureTransportTest, StartIsSingleShot) {
    test::TlsTestServer server(cert);
    SecureTransport ok(trusting(), "127.0.0.1", server.port());

    TransportError err;
    ASSERT_TRUE(ok.start(err)) << err.describe();
    EXPECT_FALSE(ok.start(err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidState);
    EXPECT_EQ(ok.state(), State::Verified);
    EXPECT_NE(ok.tls_socket(), nullptr);
    ok.close();

    SecureTransport failed(trusting(), "127.0.0.1", test::unused_port());
    EXPECT_FALSE(failed.start(err));
    EXPECT_EQ(err.kind, ErrorKind::Connection);
    EXPECT_FALSE(failed.start(err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidState);
    EXPECT_EQ(failed.state(), State::Failed);
}

TEST_F(SecureTransportTest, SniCarriesHostWhenNothingPreconfigured) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "localhost", server.port());

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();
    EXPECT_EQ(server.last_sni(), "localhost");

    ASSERT_NE(t.tls_socket(), nullptr);
    const TlsParameters p = t.tls_socket()->parameters();
    EXPECT_EQ(p.server_names, std::vector<std::string>{"localhost"});
    EXPECT_EQ(p.endpoint_identification, kEndpointIdentificationHttps);
    EXPECT_EQ(t.session().peer_host, "localhost");
}

TEST_F(SecureTransportTest, SniAppendsToPreconfiguredNames) {
    const auto multi = test::make_self_signed("localhost", {"localhost", "alias.test"}, {"127.0.0.1"});
    test::TlsTestServer server(multi);

    TransportConfig cfg;
    cfg.tls_sni = "alias.test";
    SecureTransport t(test::make_trusting_context(multi, cfg), "localhost", server.port());

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();

    ASSERT_NE(t.tls_socket(), nullptr);
    const std::vector<std::string> expected{"alias.test", "localhost"};
    EXPECT_EQ(t.tls_socket()->parameters().server_names, expected);
    // Single host_name on the wire: the preconfigured entry.
    EXPECT_EQ(server.last_sni(), "alias.test");
}

TEST_F(SecureTransportTest, TargetAlreadyPreconfiguredIsNotDuplicated) {
    test::TlsTestServer server(cert);
    TransportConfig cfg;
    cfg.tls_sni = "localhost";
    SecureTransport t(trusting(cfg), "localhost", server.port());

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();
    EXPECT_EQ(t.tls_socket()->parameters().server_names, std::vector<std::string>{"localhost"});
}

TEST_F(SecureTransportTest, CipherListRestrictsTls12Negotiation) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());

    const std::vector<std::string> only{"ECDHE-ECDSA-AES128-GCM-SHA256"};
    EXPECT_TRUE(t.set_enabled_ciphers(only));
    EXPECT_TRUE(t.set_enabled_ciphers(only));

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();
    const TlsSession s = t.session();
    EXPECT_EQ(s.cipher, "ECDHE-ECDSA-AES128-GCM-SHA256");
    EXPECT_EQ(s.protocol, "TLSv1.2");
    EXPECT_EQ(t.tls_socket()->parameters().cipher_suites, only);
}

TEST_F(SecureTransportTest, CipherListRestrictsTls13Negotiation) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());
    ASSERT_TRUE(t.set_enabled_ciphers(std::vector<std::string>{"TLS_AES_256_GCM_SHA384"}));

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();
    EXPECT_EQ(t.session().cipher, "TLS_AES_256_GCM_SHA384");
    EXPECT_EQ(t.session().protocol, "TLSv1.3");
}

TEST_F(SecureTransportTest, EmptyCipherListUsesLibraryDefaults) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());
    ASSERT_TRUE(t.set_enabled_ciphers(std::vector<std::string>{}));

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();
    EXPECT_EQ(t.session().protocol, "TLSv1.3");
    EXPECT_TRUE(t.tls_socket()->parameters().cipher_suites.empty());
}

TEST_F(SecureTransportTest, CipherSetterAppliesToOpenSocket) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();

    const std::vector<std::string> next{"TLS_CHACHA20_POLY1305_SHA256"};
    EXPECT_TRUE(t.set_enabled_ciphers(next));
    EXPECT_EQ(t.tls_socket()->parameters().cipher_suites, next);
}

TEST_F(SecureTransportTest, EmptyCipherListLiftsEarlierRestriction) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());
    ASSERT_TRUE(t.set_enabled_ciphers(std::vector<std::string>{"TLS_AES_256_GCM_SHA384"}));

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();
    TlsSocket* s = t.tls_socket();
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(SSL_get_min_proto_version(s->native_handle()), TLS1_3_VERSION);

    TlsParameters p = s->parameters();
    p.cipher_suites.clear();
    std::string why;
    ASSERT_TRUE(s->set_parameters(p, why)) << why;
    EXPECT_TRUE(s->parameters().cipher_suites.empty());
    EXPECT_EQ(SSL_get_min_proto_version(s->native_handle()), TLS1_2_VERSION);

    // Unchanged restriction stays recorded.
    ASSERT_TRUE(t.set_enabled_ciphers(std::vector<std::string>{"TLS_AES_128_GCM_SHA256"}));
    p = s->parameters();
    ASSERT_TRUE(s->set_parameters(p, why)) << why;
    EXPECT_EQ(s->parameters().cipher_suites, std::vector<std::string>{"TLS_AES_128_GCM_SHA256"});
}

TEST_F(SecureTransportTest, UnknownCipherIsConfigurationError) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "127.0.0.1", server.port());
    ASSERT_TRUE(t.set_enabled_ciphers(std::vector<std::string>{"NOT-A-REAL-CIPHER"}));

    TransportError err;
    EXPECT_FALSE(t.start(err));
    EXPECT_EQ(err.kind, ErrorKind::Configuration) << err.describe();
    EXPECT_EQ(t.state(), State::Failed);
    EXPECT_EQ(server.handshakes(), 0);
}

TEST_F(SecureTransportTest, BrokenContextIsConfigurationError) {
    TransportConfig cfg;
    cfg.tls_ca_file = "/nonexistent/sl-ca.pem";
    auto ctx = std::make_shared<TlsClientContext>(cfg);
    EXPECT_FALSE(ctx->ok());

    SecureTransport t(ctx, "127.0.0.1", test::unused_port());
    TransportError err;
    EXPECT_FALSE(t.start(err));
    EXPECT_EQ(err.kind, ErrorKind::Configuration);
}

TEST_F(SecureTransportTest, DiagnosticSinkSeesTaggedLines) {
    test::TlsTestServer server(cert);
    SecureTransport t(trusting(), "localhost", server.port(), "client-7");

    std::vector<std::string> lines;
    t.set_diagnostic_sink([&lines](const std::string& l) { lines.push_back(l); });
    ASSERT_TRUE(t.set_enabled_ciphers(std::vector<std::string>{"TLS_AES_128_GCM_SHA256"}));

    TransportError err;
    ASSERT_TRUE(t.start(err)) << err.describe();

    ASSERT_FALSE(lines.empty());
    for (const auto& l : lines) {
        EXPECT_EQ(l.rfind("[client-7] ", 0), 0u) << l;
    }
    bool saw_ciphers = false;
    for (const auto& l : lines) {
        if (l.find("enabled ciphers: TLS_AES_128_GCM_SHA256") != std::string::npos) saw_ciphers = true;
    }
    EXPECT_TRUE(saw_ciphers);
}

} // namespace
} // namespace sl
