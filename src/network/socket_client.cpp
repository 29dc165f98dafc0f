#include "network/socket_client.hpp"
#include "cloud/error.hpp"
#include "network/http_helper.hpp"
#include "network/tls_connection.hpp"
#include "utils/utils.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ossblob::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Closes the socket on scope exit
struct SocketGuard {
    int fd;
    ~SocketGuard() {
        if (fd >= 0)
            close(fd);
    }
};
//---------------------------------------------------------------------------
[[noreturn]] void transportError(const string& what)
// Throws a transport error with the errno text
{
    throw cloud::Error(cloud::Error::Kind::Transport, what + " " + strerror(errno));
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
SocketClient::SocketClient() : SocketClient(Config())
// The constructor with the default config
{
}
//---------------------------------------------------------------------------
SocketClient::SocketClient(Config config) : _config(config), _resolver(), _context()
// The constructor
{
}
//---------------------------------------------------------------------------
SocketClient::~SocketClient() noexcept = default;
//---------------------------------------------------------------------------
void SocketClient::setTimeOut(int fd) const
// Set the send and receive timeouts
{
    auto timeoutValue = static_cast<uint64_t>(_config.timeout.count());
    if (!timeoutValue)
        return;
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeoutValue / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutValue % 1000) * 1000);
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof tv))
        transportError("Socket creation error - recv timeout error!");
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&tv), sizeof tv))
        transportError("Socket creation error - send timeout error!");
    int noDelay = 1;
    if (setsockopt(fd, SOL_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)))
        transportError("Socket creation error - nodelay error!");
}
//---------------------------------------------------------------------------
int SocketClient::connect(const string& hostname, uint32_t port)
// Creates a new socket connection
{
    auto portString = to_string(port);
    for (int attempt = 0;; attempt++) {
        auto addr = _resolver.resolve(hostname, portString);
        for (auto entry = addr.get(); entry; entry = entry->ai_next) {
            auto fd = socket(entry->ai_family, entry->ai_socktype, entry->ai_protocol);
            if (fd < 0)
                continue;
            SocketGuard guard{fd};
            setTimeOut(fd);
            if (::connect(fd, entry->ai_addr, entry->ai_addrlen) == 0) {
                guard.fd = -1;
                return fd;
            }
        }
        _resolver.invalidate(hostname, portString);
        if (attempt >= _config.retryLimit)
            transportError("Socket connect error to " + hostname + ":" + portString + "!");
    }
}
//---------------------------------------------------------------------------
HttpResult SocketClient::execute(const HttpRequest& request, string_view body)
// Sends the request and receives the response
{
    // One request per connection
    auto wire = request;
    auto hasConnection = false;
    for (auto& h : wire.headers)
        hasConnection |= utils::iequals(h.first, "Connection");
    if (!hasConnection)
        wire.headers.emplace("Connection", "close");
    auto header = HttpRequest::serialize(wire);
    SocketGuard guard{connect(request.host, request.getPort())};

    unique_ptr<TLSConnection> tls;
    if (request.https) {
        {
            unique_lock lock(_contextMutex);
            if (!_context)
                _context = make_unique<TLSContext>(_config.verifyPeer);
        }
        tls = make_unique<TLSConnection>(*_context, guard.fd);
        tls->connect(request.host);
    }

    auto sendAll = [&](const char* data, uint64_t length) {
        if (tls) {
            tls->send(data, length);
            return;
        }
        while (length) {
            auto written = ::send(guard.fd, data, length, MSG_NOSIGNAL);
            if (written < 0) {
                if (errno == EINTR)
                    continue;
                transportError("Socket send error!");
            }
            data += written;
            length -= static_cast<uint64_t>(written);
        }
    };
    auto recvSome = [&](char* data, uint64_t length) -> uint64_t {
        if (tls)
            return tls->recv(data, length);
        while (true) {
            auto read = ::recv(guard.fd, data, length, 0);
            if (read >= 0)
                return static_cast<uint64_t>(read);
            if (errno != EINTR)
                transportError("Socket recv error!");
        }
    };

    sendAll(header.data(), header.size());
    if (!body.empty())
        sendAll(body.data(), body.size());

    // Receive until the framing says the response is complete or the peer closes
    auto withoutBody = request.method == HttpRequest::Method::HEAD;
    vector<uint8_t> buffer;
    unique_ptr<HttpHelper::Info> info;
    while (true) {
        auto offset = buffer.size();
        buffer.resize(offset + _config.chunkSize);
        auto read = recvSome(reinterpret_cast<char*>(buffer.data() + offset), _config.chunkSize);
        buffer.resize(offset + read);
        try {
            if (!read) {
                if (!HttpHelper::headerComplete(buffer.data(), buffer.size()))
                    throw cloud::Error(cloud::Error::Kind::Transport, "Connection closed before the response header was complete");
                break;
            }
            if (HttpHelper::finished(buffer.data(), buffer.size(), info, withoutBody))
                break;
        } catch (const cloud::Error&) {
            throw;
        } catch (const runtime_error& e) {
            throw cloud::Error(cloud::Error::Kind::Transport, e.what());
        }
    }
    if (tls)
        tls->shutdown();

    HttpResult result;
    try {
        result.content = HttpHelper::retrieveContent(buffer.data(), buffer.size(), info, withoutBody);
    } catch (const runtime_error& e) {
        throw cloud::Error(cloud::Error::Kind::Transport, e.what());
    }
    result.response = move(info->response);
    return result;
}
//---------------------------------------------------------------------------
} // namespace ossblob::network
