#pragma once
#include "network/http_request.hpp"
#include "network/http_response.hpp"
#include <string>
#include <string_view>
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
/// The outcome of a single round trip
struct HttpResult {
    /// The response header
    HttpResponse response;
    /// The decoded body
    std::string content;
};
//---------------------------------------------------------------------------
/// This is the interface for classes that send one request and wait for its response.
/// Connection handling, TLS and any retry policy belong to the implementation.
//---------------------------------------------------------------------------
class HttpClient {
    public:
    /// The destructor
    virtual ~HttpClient() noexcept = default;
    /// Sends the request with the body and returns the response, throws on transport failures
    [[nodiscard]] virtual HttpResult execute(const HttpRequest& request, std::string_view body) = 0;
};
//---------------------------------------------------------------------------
} // namespace ossblob::network
