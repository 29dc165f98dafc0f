#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <netdb.h>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ossblob {
//---------------------------------------------------------------------------
namespace network {
//---------------------------------------------------------------------------
/// The addr resolver and cacher, a cached entry is reused for a fixed number of lookups
class Resolver {
    public:
    /// The shared addr info
    using AddrInfo = std::shared_ptr<addrinfo>;

    protected:
    /// The cache entry
    struct Entry {
        /// The addr info
        AddrInfo addr;
        /// The remaining reuses
        int cacheCtr;
    };
    /// The cache from "host:port" to addr
    std::unordered_map<std::string, Entry> _cache;
    /// The cache mutex
    std::mutex _mutex;
    /// The reuses of a cached entry
    int _reuses;

    public:
    /// The constructor
    explicit Resolver(int reuses = 12) : _cache(), _mutex(), _reuses(reuses) {}
    /// The address resolving, throws on failure
    [[nodiscard]] AddrInfo resolve(const std::string& hostname, const std::string& port);
    /// Drop a cached address, e.g., after connection failures
    void invalidate(const std::string& hostname, const std::string& port);
};
//---------------------------------------------------------------------------
}; // namespace network
//---------------------------------------------------------------------------
}; // namespace ossblob
