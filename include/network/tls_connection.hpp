#pragma once
#include <cstdint>
#include <string>
#include <openssl/types.h>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2023
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ossblob::network {
//---------------------------------------------------------------------------
class TLSContext;
//---------------------------------------------------------------------------
/// A blocking TLS session on top of a connected socket
class TLSConnection {
    /// The tls context
    TLSContext& _context;
    /// The SSL connection
    SSL* _ssl;
    /// The socket
    int _fd;

    /// Throws with the queued OpenSSL errors
    [[noreturn]] void fail(const std::string& what);

    public:
    /// The constructor
    TLSConnection(TLSContext& context, int fd);
    /// The destructor
    ~TLSConnection();
    /// No copies
    TLSConnection(const TLSConnection&) = delete;
    TLSConnection& operator=(const TLSConnection&) = delete;

    /// Handshake with server name indication and host name verification
    void connect(const std::string& hostname);
    /// Send the full buffer
    void send(const char* buffer, uint64_t length);
    /// Receive up to length bytes, 0 on a closed connection
    [[nodiscard]] uint64_t recv(char* buffer, uint64_t length);
    /// Graceful shutdown, errors are ignored as the socket is closed afterwards
    void shutdown();
};
//---------------------------------------------------------------------------
} // namespace ossblob::network
