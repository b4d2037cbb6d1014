/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#include "sl/internal/socket_bio.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <cerrno>
#include <cstdint>

namespace {

int fd_of(BIO* b) {
    return static_cast<int>(reinterpret_cast<std::intptr_t>(BIO_get_data(b)));
}

bool is_retryable(int e) {
    return e == EAGAIN || e == EWOULDBLOCK;
}

int sock_write(BIO* b, const char* in, int len) {
    if (!in || len <= 0) return 0;
    ssize_t n;
    do {
        n = ::send(fd_of(b), in, static_cast<std::size_t>(len), MSG_NOSIGNAL);
    } while (n < 0 && errno == EINTR);

    BIO_clear_retry_flags(b);
    if (n < 0 && is_retryable(errno)) BIO_set_retry_write(b);
    return static_cast<int>(n);
}

int sock_read(BIO* b, char* out, int len) {
    if (!out || len <= 0) return 0;
    ssize_t n;
    do {
        n = ::recv(fd_of(b), out, static_cast<std::size_t>(len), 0);
    } while (n < 0 && errno == EINTR);

    BIO_clear_retry_flags(b);
    if (n == 0) {
        BIO_set_flags(b, BIO_FLAGS_IN_EOF);
    } else if (n < 0 && is_retryable(errno)) {
        BIO_set_retry_read(b);
    }
    return static_cast<int>(n);
}

int sock_puts(BIO* b, const char* str) {
    int len = 0;
    while (str && str[len]) ++len;
    return sock_write(b, str, len);
}

long sock_ctrl(BIO* b, int cmd, long num, void* ptr) {
    switch (cmd) {
        case BIO_C_GET_FD:
            if (ptr) *static_cast<int*>(ptr) = fd_of(b);
            return fd_of(b);
        case BIO_CTRL_EOF:
            return BIO_test_flags(b, BIO_FLAGS_IN_EOF) != 0 ? 1 : 0;
        case BIO_CTRL_GET_CLOSE:
            return BIO_get_shutdown(b);
        case BIO_CTRL_SET_CLOSE:
            BIO_set_shutdown(b, static_cast<int>(num));
            return 1;
        case BIO_CTRL_FLUSH:
            return 1;
        default:
            return 0;
    }
}

int sock_create(BIO* b) {
    BIO_set_init(b, 0);
    BIO_set_data(b, nullptr);
    return 1;
}

int sock_destroy(BIO* b) {
    if (!b) return 0;
    BIO_set_init(b, 0);
    BIO_set_data(b, nullptr);
    return 1;
}

BIO_METHOD* socket_method() {
    // Built once, shared by every socket; never freed.
    static BIO_METHOD* method = [] {
        BIO_METHOD* m = BIO_meth_new(BIO_get_new_index() | BIO_TYPE_SOURCE_SINK | BIO_TYPE_DESCRIPTOR,
                                     "sl nosignal socket");
        if (!m) return m;
        BIO_meth_set_write(m, sock_write);
        BIO_meth_set_read(m, sock_read);
        BIO_meth_set_puts(m, sock_puts);
        BIO_meth_set_ctrl(m, sock_ctrl);
        BIO_meth_set_create(m, sock_create);
        BIO_meth_set_destroy(m, sock_destroy);
        return m;
    }();
    return method;
}

} // namespace

namespace sl::internal {

BIO* new_socket_bio(int fd) {
    if (fd < 0) return nullptr;
    BIO_METHOD* m = socket_method();
    if (!m) return nullptr;
    BIO* b = BIO_new(m);
    if (!b) return nullptr;
    BIO_set_data(b, reinterpret_cast<void*>(static_cast<std::intptr_t>(fd)));
    BIO_set_shutdown(b, BIO_NOCLOSE);
    BIO_set_init(b, 1);
    return b;
}

} // namespace sl::internal
