#pragma once
#include <cstdint>
#include <map>
#include <optional>
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
/// Implements a fully addressed http request and its wire serialization
struct HttpRequest {
    /// The method class
    enum class Method : uint8_t {
        GET,
        PUT,
        POST,
        DELETE,
        HEAD
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The queries, a value-less query is a flag
    using Queries = std::map<std::string, std::optional<std::string>>;
    /// The headers - need to be without trailing and leading whitespaces
    using Headers = std::map<std::string, std::string>;

    /// The queries, raw values that are encoded during serialization
    Queries queries;
    /// The headers
    Headers headers;
    /// The method
    Method method = Method::GET;
    /// The type
    Type type = Type::HTTP_1_1;
    /// Use tls?
    bool https = false;
    /// The host
    std::string host;
    /// The port, 0 selects the scheme default
    uint32_t port = 0;
    /// The path - inserted as is, the caller is responsible for escaping
    std::string path = "/";

    /// Get the request method
    static constexpr auto getRequestMethod(const Method& method) {
        switch (method) {
            case Method::GET: return "GET";
            case Method::PUT: return "PUT";
            case Method::POST: return "POST";
            case Method::DELETE: return "DELETE";
            case Method::HEAD: return "HEAD";
            default: return "";
        }
    }
    /// Get the request type
    static constexpr auto getRequestType(const Type& type) {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "";
        }
    }

    /// Get the effective port
    [[nodiscard]] uint32_t getPort() const { return port ? port : (https ? 443 : 80); }
    /// Get the encoded query string without the leading ?
    [[nodiscard]] std::string getQueryString() const;
    /// Get the path including the query string
    [[nodiscard]] std::string getTarget() const;
    /// Get the full url
    [[nodiscard]] std::string getUrl() const;

    /// Is the header name a valid token
    [[nodiscard]] static bool validHeaderName(std::string_view name) noexcept;
    /// Is the header value free of control bytes
    [[nodiscard]] static bool validHeaderValue(std::string_view value) noexcept;
    /// Serialize the request header, adds Host if missing
    [[nodiscard]] static std::string serialize(const HttpRequest& request);
};
//---------------------------------------------------------------------------
} // namespace ossblob::network
