/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace sl::internal {

// RAII TCP connection with bounded connect and socket-level read/write timeouts.
class PlainTransport {
public:
    PlainTransport() = default;
    ~PlainTransport();

    PlainTransport(const PlainTransport&) = delete;
    PlainTransport& operator=(const PlainTransport&) = delete;

    // Resolve host and connect, trying every address in turn.
    // io_timeout_sec > 0 installs SO_RCVTIMEO/SO_SNDTIMEO, 0 leaves them unbounded.
    bool open(const std::string& host, std::uint16_t port,
              int connect_timeout_sec, int io_timeout_sec, std::string& err);

    void close();

    // shutdown(SHUT_RDWR) without releasing the descriptor. Safe from another
    // thread; a peer blocked in recv()/send() on it returns promptly.
    // Sticky: a connect in progress, or any later open(), fails.
    void abort();

    int  fd() const;
    bool is_open() const { return fd() >= 0; }

    bool read_timeout(std::chrono::milliseconds& out) const;
    bool set_read_timeout(std::chrono::milliseconds t);

private:
    mutable std::mutex _mtx;
    int  _fd = -1;
    int  _pending = -1;  // socket still connecting
    bool _aborted = false;

    bool publish_pending(int s);
    void drop_pending(int s);
    bool aborted() const;
};

} // namespace sl::internal
