#pragma once
#include "network/http_request.hpp"
#include <array>
#include <chrono>
#include <cstdint>
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
namespace ossblob {
namespace cloud {
//---------------------------------------------------------------------------
/// Implements the OSS header and url signing logic (HMAC-SHA1 over the canonical request)
/// https://www.alibabacloud.com/help/en/oss/developer-reference/include-signatures-in-the-authorization-header
class OSSSigner {
    public:
    struct StringToSign {
        /// The verb
        std::string_view verb;
        /// The content md5
        std::string_view contentMd5;
        /// The content type
        std::string_view contentType;
        /// The date header or the expiry epoch
        std::string_view dateOrExpiry;
        /// The canonical headers
        std::string_view canonicalHeaders;
        /// The bucket
        std::string_view bucket;
        /// The object key
        std::string_view objectKey;
        /// The canonical resource
        std::string_view canonicalResource;
    };

    /// The header prefix of signed headers
    static constexpr std::string_view headerPrefix = "x-oss-";
    /// The query parameters that take part in the signature
    static constexpr std::array<std::string_view, 51> subResources = {
        "acl", "uploads", "location", "cors", "logging", "website", "referer", "lifecycle", "delete", "append",
        "tagging", "objectMeta", "uploadId", "partNumber", "security-token", "position", "img", "style", "styleName", "replication",
        "replicationProgress", "replicationLocation", "cname", "bucketInfo", "comp", "qos", "live", "status", "vod", "startTime",
        "endTime", "symlink", "x-oss-process", "response-content-type", "response-content-language", "response-expires", "response-cache-control", "response-content-disposition", "response-content-encoding", "udf",
        "udfName", "udfImage", "udfId", "udfImageDesc", "udfApplication", "comp", "udfApplicationLog", "restore", "callback", "callback-var",
        "continuation-token"};

    /// Is the query parameter part of the signature
    [[nodiscard]] static bool isSubResource(std::string_view name) noexcept;
    /// The allow-listed queries sorted by name, joined with &
    [[nodiscard]] static std::string canonicalResource(const network::HttpRequest::Queries& queries);
    /// The x-oss- headers lower-cased, sorted and merged as name:value\n
    [[nodiscard]] static std::string canonicalHeaders(const network::HttpRequest::Headers& headers);
    /// Creates the string to sign
    [[nodiscard]] static std::string createStringToSign(const StringToSign& stringToSign);
    /// Signs the string to sign, base64 of the HMAC-SHA1
    [[nodiscard]] static std::string sign(std::string_view keySecret, std::string_view stringToSign);
    /// The Authorization header value "OSS keyId:signature", throws an encoding error on invalid header bytes
    [[nodiscard]] static std::string sign(network::HttpRequest::Method verb, std::string_view keyId, std::string_view keySecret, std::string_view bucket, std::string_view objectKey, std::string_view canonicalResource, const network::HttpRequest::Headers& headers);
    /// The presigned url queries OSSAccessKeyId, Expires and Signature
    [[nodiscard]] static network::HttpRequest::Queries presign(network::HttpRequest::Method verb, std::string_view keyId, std::string_view keySecret, uint64_t expires, std::string_view bucket, std::string_view objectKey, std::string_view canonicalResource, const network::HttpRequest::Headers& headers);
    /// Formats the time as http date in GMT
    [[nodiscard]] static std::string formatDate(std::chrono::system_clock::time_point time);
    /// Validates the header names and values, throws an encoding error
    static void checkHeaders(const network::HttpRequest::Headers& headers);

    private:
    /// Finds a header case-insensitive, empty if missing
    [[nodiscard]] static std::string_view findHeader(const network::HttpRequest::Headers& headers, std::string_view name);
};
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace ossblob
