#pragma once
#include "cloud/error.hpp"
#include "cloud/list_response.hpp"
#include "network/http_client.hpp"
#include "network/http_request.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
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
namespace test {
class OSSTester;
}; // namespace test
//---------------------------------------------------------------------------
/// The user metadata without the x-oss-meta- prefix
using Meta = std::map<std::string, std::string>;
//---------------------------------------------------------------------------
/// The options of a listing request
struct ListOptions {
    /// Only keys starting with the prefix
    std::string prefix;
    /// The continuation token of the previous page
    std::string marker;
    /// Groups keys up to the delimiter into common prefixes
    std::string delimiter;
    /// The page size, the service default (1000) if absent
    std::optional<uint64_t> maxKeys;

    /// Set the prefix
    ListOptions& withPrefix(std::string value) {
        prefix = std::move(value);
        return *this;
    }
    /// Set the marker
    ListOptions& withMarker(std::string value) {
        marker = std::move(value);
        return *this;
    }
    /// Set the delimiter
    ListOptions& withDelimiter(std::string value) {
        delimiter = std::move(value);
        return *this;
    }
    /// Set the page size
    ListOptions& withMaxKeys(uint64_t value) {
        maxKeys = value;
        return *this;
    }
};
//---------------------------------------------------------------------------
/// The options of a single request
struct RequestOptions {
    /// The content type
    std::string contentType;
    /// The user metadata
    Meta meta;
    /// Additional headers
    network::HttpRequest::Headers headers;
    /// Additional query parameters
    network::HttpRequest::Queries queries;
    /// Send the Content-MD5 of the body
    bool contentMd5 = false;
};
//---------------------------------------------------------------------------
/// The options of put and copy
using PutOptions = RequestOptions;
//---------------------------------------------------------------------------
/// The downloaded object
struct GetObjectResult {
    /// The content
    std::string content;
    /// The requested metadata
    Meta meta;
    /// All response headers
    network::HttpRequest::Headers headers;
};
//---------------------------------------------------------------------------
/// Implements the OSS object logic on top of an http client
/// The client is immutable after construction and can be shared
class OSS {
    public:
    /// The settings for OSS requests
    struct Settings {
        /// The endpoint, e.g., https://oss-cn-hangzhou.aliyuncs.com
        std::string endpoint;
        /// The bucket name
        std::string bucket;
    };

    /// The credentials
    struct Credentials {
        /// The key id
        std::string keyId;
        /// The secret
        std::string keySecret;
    };

    /// The time source of the Date header and the presigned expiry
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// The user metadata header prefix
    static constexpr std::string_view metaPrefix = "x-oss-meta-";

    private:
    /// The parsed endpoint
    struct Endpoint {
        /// Use tls?
        bool https = false;
        /// The host without scheme and port
        std::string host;
        /// The port, 0 selects the scheme default
        uint32_t port = 0;
    };

    /// The settings
    Settings _settings;
    /// The credentials
    Credentials _credentials;
    /// The endpoint
    Endpoint _endpoint;
    /// The transport
    std::shared_ptr<network::HttpClient> _client;
    /// The clock
    Clock _clock;

    public:
    /// The constructor, throws if the endpoint or bucket is empty
    OSS(Settings settings, Credentials credentials, std::shared_ptr<network::HttpClient> client, Clock clock = {});
    /// Creates the client from OSS_ENDPOINT, OSS_BUCKET, OSS_ACCESS_KEY_ID and OSS_ACCESS_KEY_SECRET, a socket client is used if no client is given
    [[nodiscard]] static OSS makeFromEnvironment(std::shared_ptr<network::HttpClient> client = nullptr);

    /// Get the settings
    [[nodiscard]] const Settings& getSettings() const { return _settings; }
    /// Get the key id
    [[nodiscard]] const std::string& getKeyId() const { return _credentials.keyId; }
    /// A client for another bucket sharing the transport
    [[nodiscard]] OSS withBucket(std::string bucket) const;

    /// Builds the signed request
    [[nodiscard]] network::HttpRequest buildRequest(network::HttpRequest::Method method, std::string_view objectKey, const RequestOptions& options, std::string_view body = {}) const;

    /// Uploads the object
    void putObject(std::string_view body, std::string_view objectKey, const PutOptions& options = {}) const;
    /// Copies an object of the bucket
    void copyObject(std::string_view sourceKey, std::string_view targetKey, const PutOptions& options = {}) const;
    /// Downloads the object, only the metadata listed in metaKeys is extracted
    [[nodiscard]] GetObjectResult getObjectBuffer(std::string_view objectKey, const std::vector<std::string>& metaKeys = {}, const network::HttpRequest::Queries& queries = {}) const;
    /// Downloads the object as text, throws a conversion error if the content is not UTF-8
    [[nodiscard]] GetObjectResult getObject(std::string_view objectKey, const std::vector<std::string>& metaKeys = {}, const network::HttpRequest::Queries& queries = {}) const;
    /// Deletes the object
    void deleteObject(std::string_view objectKey) const;
    /// Deletes the objects one by one, stops at the first failure
    void deleteObjects(const std::vector<std::string>& objectKeys) const;
    /// Get the user metadata of the object
    [[nodiscard]] Meta headObject(std::string_view objectKey) const;
    /// Lists the keys of one page
    [[nodiscard]] std::vector<std::string> listObjects(const ListOptions& options = {}) const;
    /// Lists one page
    [[nodiscard]] ListPage listDetails(const ListOptions& options = {}) const;

    /// The presigned url valid for the duration
    [[nodiscard]] std::string signUrl(std::string_view objectKey, std::chrono::seconds validFor, network::HttpRequest::Method method = network::HttpRequest::Method::GET) const;
    /// The presigned url valid until the unix epoch second
    [[nodiscard]] std::string signUrlUntil(std::string_view objectKey, uint64_t expires, network::HttpRequest::Method method = network::HttpRequest::Method::GET) const;

    /// Prefixes the metadata keys
    [[nodiscard]] static network::HttpRequest::Headers toMetaHeaders(const Meta& meta);
    /// Extracts the metadata from headers, names lower-cased without prefix
    [[nodiscard]] static Meta fromMetaHeaders(const network::HttpRequest::Headers& headers);

    private:
    /// Splits the endpoint in scheme, host and port
    [[nodiscard]] static Endpoint parseEndpoint(std::string_view endpoint);
    /// The list request queries
    [[nodiscard]] static network::HttpRequest::Queries listQueries(const ListOptions& options);
    /// The request skeleton without headers
    [[nodiscard]] network::HttpRequest createRequest(network::HttpRequest::Method method, std::string_view objectKey) const;
    /// Sends the request, throws the classified error on failure
    network::HttpResult send(network::HttpRequest::Method method, std::string_view objectKey, const RequestOptions& options, std::string_view body, Error::Operation operation) const;

    friend test::OSSTester;
};
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace ossblob
