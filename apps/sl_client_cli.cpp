// SPDX-License-Identifier: Apache-2.0
// Part of SecureLink (SL) project.
// apps/sl_client_cli.cpp

#include "sl/secure_transport.hpp"
#include "sl/tls_client_context.hpp"
#include "sl/hostname_verifier.hpp"
#include "sl/internal/utils.hpp"
#include "sl/log.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --host broker.example.com --port 8883 "
      "[--ca server.crt] [--cert client.crt --key client.key] [--insecure 0|1] "
      "[--sni NAME] [--ciphers A:B:C] [--https_verify 0|1] [--verify_host 0|1] "
      "[--log FILE] [--debug 0|1]\n"
      "\n"
      "Timeouts:\n"
      "  --connect_timeout <sec>    TCP connect timeout in seconds (default 5)\n"
      "  --io_timeout <sec>         ambient read/write timeout, 0 = none (default 5)\n"
      "  --handshake_timeout <sec>  TLS handshake bound, 0 = keep ambient (default 10)\n";
}

int main(int argc, char** argv){
    sl::TransportConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 8883;
    cfg.handshake_timeout_sec = 10;
    cfg.resource_name = "sl_client";

    bool verify_host = false;
    bool debug = false;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--host" && i+1<argc) cfg.host = argv[++i];
            else if(a=="--port" && i+1<argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if(a=="--ca" && i+1<argc) cfg.tls_ca_file = argv[++i];
            else if(a=="--cert" && i+1<argc) cfg.tls_client_cert_file = argv[++i];
            else if(a=="--key" && i+1<argc) cfg.tls_client_key_file = argv[++i];
            else if(a=="--insecure" && i+1<argc) cfg.tls_verify_peer = (std::stoi(argv[++i])==0);
            else if(a=="--sni" && i+1<argc) cfg.tls_sni = argv[++i];
            else if(a=="--ciphers" && i+1<argc) cfg.enabled_ciphers = sl::internal::split_list(argv[++i], ':');
            else if(a=="--https_verify" && i+1<argc) cfg.https_hostname_verification = (std::stoi(argv[++i])!=0);
            else if(a=="--verify_host" && i+1<argc) verify_host = (std::stoi(argv[++i])!=0);
            else if(a=="--log" && i+1<argc) cfg.log_file = argv[++i];
            else if(a=="--debug" && i+1<argc) debug = (std::stoi(argv[++i])!=0);
            else if(a=="--connect_timeout" && i+1<argc) cfg.connect_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else if(a=="--io_timeout" && i+1<argc) cfg.io_timeout_sec = std::max(0, std::stoi(argv[++i]));
            else if(a=="--handshake_timeout" && i+1<argc) cfg.handshake_timeout_sec = std::max(0, std::stoi(argv[++i]));
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    sl::set_log_file(cfg.log_file);
    sl::set_log_level(debug ? sl::LogLevel::Debug : sl::LogLevel::Info);

    auto ctx = std::make_shared<sl::TlsClientContext>(cfg);
    if (!ctx->ok()) {
        sl::log_line(sl::LogLevel::Error, "[CLI] TLS context: " + ctx->error());
        return 1;
    }

    sl::SecureTransport transport(ctx, cfg.host, cfg.port, cfg.resource_name);
    transport.set_diagnostic_sink(sl::make_log_sink(sl::LogLevel::Debug));
    if (!sl::apply_config(transport, cfg)) {
        sl::log_line(sl::LogLevel::Error, "[CLI] cipher list rejected");
        return 1;
    }
    if (verify_host) {
        transport.set_hostname_verifier(sl::make_certificate_hostname_verifier());
    }

    sl::log_line("[CLI] connecting to " + transport.server_uri());

    sl::TransportError err;
    if (!transport.start(err)) {
        sl::log_line(sl::LogLevel::Error, "[CLI] " + transport.server_uri() + " " + err.describe());
        return 1;
    }

    const sl::TlsSession s = transport.session();
    std::cout << "uri      : " << transport.server_uri() << "\n"
              << "protocol : " << s.protocol << "\n"
              << "cipher   : " << s.cipher << "\n"
              << "peer     : " << s.peer_host << "\n"
              << "subject  : " << s.peer_subject << "\n";

    transport.close();
    return 0;
}
