/*
 * Part of the SecureLink (SL) project.
 *
 * SPDX-FileCopyrightText: 2025 SecureLink contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SecureLink (SL). See LICENSE for details.
 */

#pragma once
#include <openssl/bio.h>

namespace sl::internal {

// Socket BIO over a connected descriptor that writes with send(MSG_NOSIGNAL),
// so a peer hang-up surfaces as EPIPE instead of SIGPIPE.
// The descriptor is not owned and not closed when the BIO is freed.
// Retry flags follow the stock socket BIO: EAGAIN from an expired
// SO_RCVTIMEO/SO_SNDTIMEO reads as SSL_ERROR_WANT_READ/WRITE.
BIO* new_socket_bio(int fd);

} // namespace sl::internal
