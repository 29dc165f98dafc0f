#pragma once
#include <cstdint>
#include <map>
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
/// Implements an helper to deserialize http responses
struct HttpResponse {
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The headers - need to be without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The status code
    uint64_t code = 0;
    /// The reason phrase
    std::string reason;
    /// The type
    Type type = Type::HTTP_1_1;

    /// Get the request type
    static constexpr auto getResponseType(const Type& type) noexcept {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "UNKNOWN";
        }
    }
    /// Check for successful operation 2xx operations
    static constexpr auto checkSuccess(uint64_t code) noexcept {
        return code >= 200 && code < 300;
    }
    /// Check if the result has no content
    static constexpr auto withoutContent(uint64_t code) noexcept {
        return (code >= 100 && code < 200) || code == 204 || code == 304;
    }
    /// Get the status line without the version, e.g., 404 Not Found
    [[nodiscard]] std::string getStatusLine() const;
    /// Find a header case-insensitively, nullptr if absent
    [[nodiscard]] const std::string* findHeader(std::string_view name) const;
    /// Deserialize the response header
    [[nodiscard]] static HttpResponse deserialize(std::string_view data);
};
//---------------------------------------------------------------------------
} // namespace ossblob::network
