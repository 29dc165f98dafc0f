#include "network/tls_context.hpp"
#include "cloud/error.hpp"
#include <netinet/in.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <sys/socket.h>
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
using namespace std;
//---------------------------------------------------------------------------
TLSContext::TLSContext(bool verifyPeer) : _ctx(nullptr), _sessionCache(), _mutex()
// Construct the TLS Context
{
    initOpenSSL();

    // Set up the context
    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx)
        throw cloud::Error(cloud::Error::Kind::Transport, "TLS context creation failed");
    SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION);

    // Trust the system store
    if (verifyPeer) {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            SSL_CTX_free(_ctx);
            throw cloud::Error(cloud::Error::Kind::Transport, "TLS trust store could not be loaded");
        }
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
    }

    // Enable session cache
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}
//---------------------------------------------------------------------------
TLSContext::~TLSContext()
// The desturctor
{
    // Remove all sessions
    for (auto& entry : _sessionCache)
        if (entry.first && entry.second)
            SSL_SESSION_free(entry.second);

    // Destroy context
    if (_ctx)
        SSL_CTX_free(_ctx);
}
//---------------------------------------------------------------------------
void TLSContext::initOpenSSL()
// Inits the openssl algos
{
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}
//---------------------------------------------------------------------------
bool TLSContext::cacheSession(int fd, SSL* ssl)
// Caches the SSL session
{
    // Is the session already cached?
    if (SSL_session_reused(ssl))
        return false;

    // Get the IP address for caching
    struct sockaddr_in addr;
    socklen_t addrLen = sizeof(struct sockaddr_in);
    if (!getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) && addr.sin_family == AF_INET) {
        unique_lock lock(_mutex);
        auto& entry = _sessionCache[addr.sin_addr.s_addr & cacheMask];
        if (entry.first)
            SSL_SESSION_free(entry.second);
        entry = pair<uint64_t, SSL_SESSION*>(addr.sin_addr.s_addr, SSL_get1_session(ssl));
        return true;
    }
    return false;
}
//---------------------------------------------------------------------------
bool TLSContext::dropSession(int fd)
// Drop the SSL session from cache
{
    struct sockaddr_in addr;
    socklen_t addrLen = sizeof(struct sockaddr_in);
    if (!getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) && addr.sin_family == AF_INET) {
        unique_lock lock(_mutex);
        auto& entry = _sessionCache[addr.sin_addr.s_addr & cacheMask];
        if (entry.first) {
            entry.first = 0;
            SSL_SESSION_free(entry.second);
            entry.second = nullptr;
        }
        return true;
    }
    return false;
}
//---------------------------------------------------------------------------
bool TLSContext::reuseSession(int fd, SSL* ssl)
// Reuses the SSL session
{
    struct sockaddr_in addr;
    socklen_t addrLen = sizeof(struct sockaddr_in);
    if (!getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) && addr.sin_family == AF_INET) {
        unique_lock lock(_mutex);
        auto& entry = _sessionCache[addr.sin_addr.s_addr & cacheMask];
        if (entry.first == addr.sin_addr.s_addr && entry.second) {
            SSL_set_session(ssl, entry.second);
            return true;
        }
    }
    return false;
}
//---------------------------------------------------------------------------
} // namespace ossblob::network
