#pragma once
#include <array>
#include <cstdint>
#include <mutex>
#include <openssl/ssl.h>
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
class TLSConnection;
//---------------------------------------------------------------------------
// The client context shared by all connections of a socket client.
// Sessions are cached per peer address to allow abbreviated handshakes.
class TLSContext {
    /// The ssl context
    SSL_CTX* _ctx;
    /// The cache size as power of 2
    static constexpr uint8_t cachePower = 8;
    /// The cache mask
    static constexpr uint64_t cacheMask = (~0ull) >> (64 - cachePower);
    /// The session cache
    std::array<std::pair<uint64_t, SSL_SESSION*>, 1ull << cachePower> _sessionCache;
    /// The session cache mutex
    std::mutex _mutex;

    public:
    /// The constructor, throws if the context cannot be created
    explicit TLSContext(bool verifyPeer = true);
    /// The destructor
    ~TLSContext();
    /// No copies
    TLSContext(const TLSContext&) = delete;
    TLSContext& operator=(const TLSContext&) = delete;

    /// Caches the SSL session
    bool cacheSession(int fd, SSL* ssl);
    /// Drops the SSL session
    bool dropSession(int fd);
    /// Reuses a SSL session
    bool reuseSession(int fd, SSL* ssl);

    /// Init the OpenSSL algos and errors
    static void initOpenSSL();

    friend TLSConnection;
};
//---------------------------------------------------------------------------
} // namespace ossblob::network
