#include "network/resolver.hpp"
#include "cloud/error.hpp"
#include <cstring>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/types.h>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2021
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
Resolver::AddrInfo Resolver::resolve(const string& hostname, const string& port)
// Resolve the request
{
    auto hostString = hostname + ":" + port;
    unique_lock lock(_mutex);
    if (auto it = _cache.find(hostString); it != _cache.end() && it->second.cacheCtr-- > 0)
        return it->second.addr;

    struct addrinfo hints = {};
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* temp;
    if (auto status = getaddrinfo(hostname.c_str(), port.c_str(), &hints, &temp); status != 0)
        throw cloud::Error(cloud::Error::Kind::Transport, "hostname getaddrinfo error for " + hostString + ": " + gai_strerror(status));
    AddrInfo addr(temp, &freeaddrinfo);
    _cache[hostString] = Entry{addr, _reuses};
    return addr;
}
//---------------------------------------------------------------------------
void Resolver::invalidate(const string& hostname, const string& port)
// Drop the cached address
{
    unique_lock lock(_mutex);
    _cache.erase(hostname + ":" + port);
}
//---------------------------------------------------------------------------
}; // namespace network
//---------------------------------------------------------------------------
}; // namespace ossblob
