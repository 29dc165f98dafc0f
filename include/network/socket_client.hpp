#pragma once
#include "network/http_client.hpp"
#include "network/resolver.hpp"
#include "network/tls_context.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
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
/// The blocking http client, every request uses a fresh connection that is closed after the response
class SocketClient : public HttpClient {
    public:
    /// The transport settings
    struct Config {
        /// The receive chunk size
        uint64_t chunkSize = 64u * 1024;
        /// The send and receive timeout
        std::chrono::milliseconds timeout{30000};
        /// Verify the server certificate and host name
        bool verifyPeer = true;
        /// Connect retries on other resolved addresses
        int retryLimit = 2;
    };

    private:
    /// The config
    Config _config;
    /// The dns resolver
    Resolver _resolver;
    /// The tls context, created on the first https request
    std::unique_ptr<TLSContext> _context;
    /// The mutex for the lazy tls context
    std::mutex _contextMutex;

    /// Opens a connected socket to host:port
    [[nodiscard]] int connect(const std::string& hostname, uint32_t port);
    /// Applies the timeouts on the socket
    void setTimeOut(int fd) const;

    public:
    /// The constructor with the default config
    SocketClient();
    /// The constructor
    explicit SocketClient(Config config);
    /// The destructor
    ~SocketClient() noexcept override;

    /// Get the config
    [[nodiscard]] const Config& getConfig() const { return _config; }
    /// Sends the request and receives the response
    [[nodiscard]] HttpResult execute(const HttpRequest& request, std::string_view body) override;
};
//---------------------------------------------------------------------------
} // namespace ossblob::network
