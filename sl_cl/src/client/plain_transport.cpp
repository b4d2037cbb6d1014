/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/internal/plain_transport.hpp"
#include "sl/internal/time.hpp"
#include "sl/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace sl::internal {

namespace {
constexpr long long kAbortPollMs = 100;
}

PlainTransport::~PlainTransport() { close(); }

bool PlainTransport::open(const std::string& host, std::uint16_t port,
                          int connect_timeout_sec, int io_timeout_sec, std::string& err) {
    close();

    const std::string aborted_msg = "connect to " + host + ":" + std::to_string(port) + " aborted";
    if (aborted()) {
        err = aborted_msg;
        return false;
    }

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        err = std::string("getaddrinfo(") + host + ") failed: " + gai_strerror(rc);
        sl::log_line(LogLevel::Warn, "[TCP] " + err);
        return false;
    }

    const int connect_timeout_ms = std::max(1, connect_timeout_sec) * 1000;

    int s_ok = -1;
    int last_errno = 0;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype | SOCK_CLOEXEC, p->ai_protocol);
        if (s < 0) { last_errno = errno; continue; }

        // Visible to abort() while connecting
        if (!publish_pending(s)) {
            ::close(s);
            break;
        }

        // Non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) {
            last_errno = errno;
            drop_pending(s);
            continue;
        }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            pollfd pfd{};
            pfd.fd     = s;
            pfd.events = POLLOUT;

            // Short slices so a pending abort() is noticed even if the
            // shutdown() does not wake the poll.
            const auto deadline = std::chrono::steady_clock::now() +
                                  std::chrono::milliseconds(connect_timeout_ms);
            int pr = 0;
            while (true) {
                if (aborted()) break;
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now()).count();
                if (left <= 0) { pr = 0; break; }
                pr = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left, kAbortPollMs)));
                if (pr > 0) break;
                if (pr < 0 && errno != EINTR) break;
            }

            if (aborted()) {
                drop_pending(s);
                break;
            }
            if (pr <= 0 || !(pfd.revents & (POLLOUT | POLLERR | POLLHUP))) {
                last_errno = (pr == 0) ? ETIMEDOUT : errno;
                drop_pending(s);
                continue;
            }
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                last_errno = soerr != 0 ? soerr : errno;
                drop_pending(s);
                continue;
            }
        } else if (ret < 0) {
            last_errno = errno;
            drop_pending(s);
            continue;
        }

        // Back to blocking mode so SO_*TIMEO governs I/O
        if (fcntl(s, F_SETFL, flags) < 0) {
            last_errno = errno;
            drop_pending(s);
            continue;
        }

        int one = 1;
        if (p->ai_family == AF_INET || p->ai_family == AF_INET6) {
            setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        }

        if (io_timeout_sec > 0) {
            timeval tv = to_timeval(std::chrono::seconds(io_timeout_sec));
            setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        }

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0 && aborted()) {
        err = aborted_msg;
        sl::log_line(LogLevel::Warn, "[TCP] " + err);
        return false;
    }
    if (s_ok < 0) {
        err = "connect to " + host + ":" + std::to_string(port) + " failed: " +
              (last_errno ? std::strerror(last_errno) : "no usable address");
        sl::log_line(LogLevel::Warn, "[TCP] " + err);
        return false;
    }

    std::lock_guard<std::mutex> lk(_mtx);
    _pending = -1;
    if (_aborted) {
        ::close(s_ok);
        err = aborted_msg;
        return false;
    }
    _fd = s_ok;
    return true;
}

bool PlainTransport::publish_pending(int s) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_aborted) return false;
    _pending = s;
    return true;
}

void PlainTransport::drop_pending(int s) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_pending == s) _pending = -1;
    ::close(s);
}

bool PlainTransport::aborted() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _aborted;
}

void PlainTransport::close() {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_fd >= 0) { ::close(_fd); _fd = -1; }
}

void PlainTransport::abort() {
    std::lock_guard<std::mutex> lk(_mtx);
    _aborted = true;
    if (_pending >= 0) {
        ::shutdown(_pending, SHUT_RDWR);
    }
    if (_fd >= 0) {
        ::shutdown(_fd, SHUT_RDWR);
    }
}

int PlainTransport::fd() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _fd;
}

bool PlainTransport::read_timeout(std::chrono::milliseconds& out) const {
    const int s = fd();
    if (s < 0) return false;
    timeval tv{};
    socklen_t len = sizeof(tv);
    if (getsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, &len) < 0) {
        sl::log_line(LogLevel::Warn, std::string("[TCP] getsockopt(SO_RCVTIMEO): ") + std::strerror(errno));
        return false;
    }
    out = from_timeval(tv);
    return true;
}

bool PlainTransport::set_read_timeout(std::chrono::milliseconds t) {
    const int s = fd();
    if (s < 0) return false;
    timeval tv = to_timeval(t);
    if (setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        sl::log_line(LogLevel::Warn, std::string("[TCP] setsockopt(SO_RCVTIMEO): ") + std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace sl::internal
