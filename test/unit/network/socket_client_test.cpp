#include "network/socket_client.hpp"
#include "cloud/error.hpp"
#include <catch2/catch.hpp>
#include <string>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2021
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ossblob::network::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
/// A one-shot loopback server that records the request and answers with a canned response
class LoopbackServer {
    /// The listening socket
    int _fd;
    /// The port
    uint16_t _port;
    /// The server thread
    thread _thread;
    /// The received request
    string _request;

    public:
    /// The constructor, starts to listen on an ephemeral port
    explicit LoopbackServer(string response) : _fd(socket(AF_INET, SOCK_STREAM, 0)), _port(0) {
        REQUIRE(_fd >= 0);
        sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(bind(_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(listen(_fd, 1) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(getsockname(_fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        _port = ntohs(addr.sin_port);

        _thread = thread([this, response = move(response)]() {
            auto client = accept(_fd, nullptr, nullptr);
            if (client < 0)
                return;
            char buffer[4096];
            while (_request.find("\r\n\r\n") == string::npos) {
                auto read = recv(client, buffer, sizeof(buffer), 0);
                if (read <= 0)
                    break;
                _request.append(buffer, static_cast<size_t>(read));
            }
            // Read a body announced by Content-Length
            auto pos = _request.find("Content-Length: ");
            if (pos != string::npos) {
                auto length = stoull(_request.substr(pos + 16));
                auto bodyStart = _request.find("\r\n\r\n") + 4;
                while (_request.size() < bodyStart + length) {
                    auto read = recv(client, buffer, sizeof(buffer), 0);
                    if (read <= 0)
                        break;
                    _request.append(buffer, static_cast<size_t>(read));
                }
            }
            auto sent = send(client, response.data(), response.size(), MSG_NOSIGNAL);
            static_cast<void>(sent);
            close(client);
        });
    }
    /// The destructor
    ~LoopbackServer() {
        if (_thread.joinable())
            _thread.join();
        close(_fd);
    }

    /// Get the port
    uint16_t port() const { return _port; }
    /// Waits for the exchange and returns the request
    const string& request() {
        if (_thread.joinable())
            _thread.join();
        return _request;
    }
};
//---------------------------------------------------------------------------
static HttpRequest makeRequest(HttpRequest::Method method, uint16_t port) {
    HttpRequest request;
    request.method = method;
    request.host = "127.0.0.1";
    request.port = port;
    request.path = "/object.txt";
    return request;
}
//---------------------------------------------------------------------------
TEST_CASE("socket_client_get") {
    LoopbackServer server("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nx-oss-meta-a: b\r\n\r\n5\r\nhello\r\n0\r\n\r\n");
    SocketClient client;
    auto result = client.execute(makeRequest(HttpRequest::Method::GET, server.port()), {});
    REQUIRE(result.response.code == 200);
    REQUIRE(result.content == "hello");
    REQUIRE(*result.response.findHeader("x-oss-meta-a") == "b");

    auto& request = server.request();
    REQUIRE(request.starts_with("GET /object.txt HTTP/1.1\r\n"));
    REQUIRE(request.find("Connection: close\r\n") != string::npos);
    REQUIRE(request.find("Host: 127.0.0.1:" + to_string(server.port()) + "\r\n") != string::npos);
}
//---------------------------------------------------------------------------
TEST_CASE("socket_client_put") {
    LoopbackServer server("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
    SocketClient client;
    auto request = makeRequest(HttpRequest::Method::PUT, server.port());
    request.headers.emplace("Content-Length", "7");
    auto result = client.execute(request, "payload");
    REQUIRE(result.response.code == 200);
    REQUIRE(result.content.empty());
    REQUIRE(server.request().ends_with("\r\n\r\npayload"));
}
//---------------------------------------------------------------------------
TEST_CASE("socket_client_head") {
    // The announced length must not make the client wait for a body
    LoopbackServer server("HTTP/1.1 200 OK\r\nContent-Length: 1024\r\nx-oss-meta-key: value\r\n\r\n");
    SocketClient client;
    auto result = client.execute(makeRequest(HttpRequest::Method::HEAD, server.port()), {});
    REQUIRE(result.response.code == 200);
    REQUIRE(result.content.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("socket_client_error_status") {
    LoopbackServer server("HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\n\r\nNoSuchKey");
    SocketClient client;
    auto result = client.execute(makeRequest(HttpRequest::Method::GET, server.port()), {});
    REQUIRE(result.response.code == 404);
    REQUIRE(result.content == "NoSuchKey");
}
//---------------------------------------------------------------------------
TEST_CASE("socket_client_closed_before_header") {
    LoopbackServer server("");
    SocketClient client;
    try {
        static_cast<void>(client.execute(makeRequest(HttpRequest::Method::GET, server.port()), {}));
        FAIL("expected a transport error");
    } catch (const cloud::Error& e) {
        REQUIRE(e.kind() == cloud::Error::Kind::Transport);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("socket_client_connection_refused") {
    // A bound socket that does not listen refuses connections
    auto fd = socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);
    sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);

    SocketClient::Config config;
    config.retryLimit = 0;
    SocketClient client(config);
    REQUIRE_THROWS_AS(static_cast<void>(client.execute(makeRequest(HttpRequest::Method::GET, ntohs(addr.sin_port)), {})), cloud::Error);
    close(fd);
}
//---------------------------------------------------------------------------
} // namespace ossblob::network::test
