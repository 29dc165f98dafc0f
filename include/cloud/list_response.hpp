#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ossblob::cloud {
//---------------------------------------------------------------------------
/// One listed object, raw wire strings
struct ObjectSummary {
    /// The key
    std::string key;
    /// The last modification time
    std::string lastModified;
    /// The etag, quotes included
    std::string etag;
    /// The size
    std::string size;

    /// Parses the size, throws a decode error if it is not a number
    [[nodiscard]] uint64_t sizeValue() const;
};
//---------------------------------------------------------------------------
/// One page of a listing
struct ListPage {
    /// The objects in document order
    std::vector<ObjectSummary> objects;
    /// The common prefixes in document order
    std::vector<std::string> commonPrefixes;
    /// More results follow
    bool isTruncated = false;
    /// The continuation token of the next page, empty if not truncated
    std::string nextMarker;
};
//---------------------------------------------------------------------------
/// Decodes the ListBucketResult document of a list-type=2 request
class ListResponse {
    public:
    /// The decoder state
    enum class State : uint8_t {
        Idle,
        InContents,
        InCommonPrefixes
    };

    /// Decodes the keys of all objects
    [[nodiscard]] static std::vector<std::string> decodeKeys(std::string_view document);
    /// Decodes the full page
    [[nodiscard]] static ListPage decodeDetails(std::string_view document);

    private:
    /// The single event loop behind both decoders
    [[nodiscard]] static ListPage decode(std::string_view document, bool keysOnly);
    /// Parses the truncation flag
    [[nodiscard]] static bool parseBool(std::string_view value);
};
//---------------------------------------------------------------------------
} // namespace ossblob::cloud
