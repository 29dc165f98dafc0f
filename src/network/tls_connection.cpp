#include "network/tls_connection.hpp"
#include "cloud/error.hpp"
#include "network/tls_context.hpp"
#include <openssl/err.h>
#include <openssl/ssl.h>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2023
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ossblob {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TLSConnection::TLSConnection(TLSContext& context, int fd) : _context(context), _ssl(nullptr), _fd(fd)
// The consturctor
{
    _ssl = SSL_new(_context._ctx);
    if (!_ssl)
        fail("TLS session creation failed");
    if (SSL_set_fd(_ssl, _fd) != 1) {
        SSL_free(_ssl);
        _ssl = nullptr;
        fail("TLS socket binding failed");
    }
    SSL_set_connect_state(_ssl);
}
//---------------------------------------------------------------------------
TLSConnection::~TLSConnection()
// The desturctor
{
    if (_ssl)
        SSL_free(_ssl);
}
//---------------------------------------------------------------------------
void TLSConnection::fail(const string& what)
// Collect the OpenSSL error queue
{
    string message = what;
    char buffer[256];
    while (auto code = ERR_get_error()) {
        ERR_error_string_n(code, buffer, sizeof(buffer));
        message += ": ";
        message += buffer;
    }
    throw cloud::Error(cloud::Error::Kind::Transport, message);
}
//---------------------------------------------------------------------------
void TLSConnection::connect(const string& hostname)
// SSL/TLS connect
{
    if (SSL_set_tlsext_host_name(_ssl, hostname.c_str()) != 1)
        fail("TLS server name indication failed");
    if (SSL_set1_host(_ssl, hostname.c_str()) != 1)
        fail("TLS host name verification setup failed");
    _context.reuseSession(_fd, _ssl);
    if (SSL_connect(_ssl) != 1) {
        _context.dropSession(_fd);
        auto verify = SSL_get_verify_result(_ssl);
        if (verify != X509_V_OK)
            fail(string("TLS handshake with ") + hostname + " failed: " + X509_verify_cert_error_string(verify));
        fail("TLS handshake with " + hostname + " failed");
    }
    _context.cacheSession(_fd, _ssl);
}
//---------------------------------------------------------------------------
void TLSConnection::send(const char* buffer, uint64_t length)
// Send a TLS encrypted message
{
    while (length) {
        size_t written = 0;
        if (SSL_write_ex(_ssl, buffer, length, &written) != 1)
            fail("TLS write failed");
        buffer += written;
        length -= written;
    }
}
//---------------------------------------------------------------------------
uint64_t TLSConnection::recv(char* buffer, uint64_t length)
// Recv a TLS encrypted message
{
    size_t read = 0;
    if (SSL_read_ex(_ssl, buffer, length, &read) == 1)
        return read;
    switch (SSL_get_error(_ssl, 0)) {
        case SSL_ERROR_ZERO_RETURN: return 0;
        case SSL_ERROR_SYSCALL:
            // Peers frequently close without close_notify after Connection: close
            if (!ERR_peek_error())
                return 0;
            [[fallthrough]];
        default: fail("TLS read failed");
    }
}
//---------------------------------------------------------------------------
void TLSConnection::shutdown()
// SSL/TLS shutdown
{
    if (SSL_shutdown(_ssl) < 0)
        ERR_clear_error();
}
//---------------------------------------------------------------------------
} // namespace network
//---------------------------------------------------------------------------
} // namespace ossblob
