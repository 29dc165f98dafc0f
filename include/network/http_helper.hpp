#pragma once
#include "network/http_response.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
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
/// Implements an helper to frame and decode http responses
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        Unknown,
        ContentLength,
        ChunkedEncoding,
        /// Body ends with the connection
        ConnectionClose,
        /// HEAD, 1xx, 204 and 304 responses
        NoContent
    };

    struct Info {
        /// The response header
        HttpResponse response;
        /// The maximum length
        uint64_t length = 0;
        /// The header length
        uint32_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::Unknown;
    };

    private:
    /// Detect the protocol
    [[nodiscard]] static Info detect(std::string_view s, bool withoutBody);
    /// Walks the chunks, returns the decoded body once the last chunk arrived
    [[nodiscard]] static bool walkChunks(std::string_view body, std::string* decoded);

    public:
    /// Is the response header complete
    [[nodiscard]] static bool headerComplete(const uint8_t* data, uint64_t length);
    /// Retrieve the content without http meta info
    [[nodiscard]] static std::string retrieveContent(const uint8_t* data, uint64_t length, std::unique_ptr<Info>& info, bool withoutBody = false);
    /// Detect end / content
    [[nodiscard]] static bool finished(const uint8_t* data, uint64_t length, std::unique_ptr<Info>& info, bool withoutBody = false);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace ossblob
