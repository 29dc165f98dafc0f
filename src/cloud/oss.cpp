#include "cloud/oss.hpp"
#include "cloud/oss_signer.hpp"
#include "network/http_response.hpp"
#include "network/socket_client.hpp"
#include "utils/utils.hpp"
#include <charconv>
#include <map>
#include <cstdlib>
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
static void setHeader(network::HttpRequest::Headers& headers, string_view name, string value)
// Replaces every spelling of the header name
{
    erase_if(headers, [&](const auto& header) { return utils::iequals(header.first, name); });
    headers.emplace(string(name), move(value));
}
//---------------------------------------------------------------------------
OSS::OSS(Settings settings, Credentials credentials, shared_ptr<network::HttpClient> client, Clock clock) : _settings(move(settings)), _credentials(move(credentials)), _endpoint(), _client(move(client)), _clock(move(clock))
// The constructor
{
    if (_settings.endpoint.empty())
        throw runtime_error("OSS requires an endpoint!");
    if (_settings.bucket.empty())
        throw runtime_error("OSS requires a bucket!");
    if (!_client)
        throw runtime_error("OSS requires an http client!");
    if (!_clock)
        _clock = [] { return chrono::system_clock::now(); };
    _endpoint = parseEndpoint(_settings.endpoint);
}
//---------------------------------------------------------------------------
OSS OSS::makeFromEnvironment(shared_ptr<network::HttpClient> client)
// Reads the settings and credentials from the environment
{
    auto env = [](const char* name) {
        auto value = getenv(name);
        if (!value || !*value)
            throw runtime_error(string("Missing environment variable ") + name + "!");
        return string(value);
    };
    Settings settings{env("OSS_ENDPOINT"), env("OSS_BUCKET")};
    Credentials credentials{env("OSS_ACCESS_KEY_ID"), env("OSS_ACCESS_KEY_SECRET")};
    if (!client)
        client = make_shared<network::SocketClient>();
    return OSS(move(settings), move(credentials), move(client));
}
//---------------------------------------------------------------------------
OSS OSS::withBucket(string bucket) const
// Copies the client with another bucket
{
    auto settings = _settings;
    settings.bucket = move(bucket);
    return OSS(move(settings), _credentials, _client, _clock);
}
//---------------------------------------------------------------------------
OSS::Endpoint OSS::parseEndpoint(string_view endpoint)
// Splits scheme://host:port
{
    static constexpr string_view httpsScheme = "https://";
    static constexpr string_view httpScheme = "http://";

    Endpoint result;
    if (utils::istartsWith(endpoint, httpsScheme)) {
        result.https = true;
        endpoint = endpoint.substr(httpsScheme.size());
    } else if (utils::istartsWith(endpoint, httpScheme)) {
        endpoint = endpoint.substr(httpScheme.size());
    }
    // Drop a trailing path
    endpoint = endpoint.substr(0, endpoint.find('/'));

    if (auto colon = endpoint.rfind(':'); colon != endpoint.npos) {
        auto portString = endpoint.substr(colon + 1);
        auto [ptr, ec] = from_chars(portString.data(), portString.data() + portString.size(), result.port);
        if (ec != errc() || ptr != portString.data() + portString.size() || !result.port || result.port > 65535)
            throw runtime_error("Invalid OSS endpoint port \"" + string(portString) + "\"!");
        endpoint = endpoint.substr(0, colon);
    }
    if (endpoint.empty())
        throw runtime_error("Invalid OSS endpoint!");
    result.host = endpoint;
    return result;
}
//---------------------------------------------------------------------------
network::HttpRequest OSS::createRequest(network::HttpRequest::Method method, string_view objectKey) const
// The request skeleton
{
    network::HttpRequest request;
    request.method = method;
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.https = _endpoint.https;
    request.host = _settings.bucket + "." + _endpoint.host;
    request.port = _endpoint.port;
    // Keys are inserted as given, escaping is up to the caller
    request.path = "/";
    request.path += objectKey;
    return request;
}
//---------------------------------------------------------------------------
network::HttpRequest OSS::buildRequest(network::HttpRequest::Method method, string_view objectKey, const RequestOptions& options, string_view body) const
// Creates the generic http request and signs it
{
    auto request = createRequest(method, objectKey);
    request.queries = options.queries;

    // Metadata first, explicit headers win, names compare case-insensitive
    request.headers = toMetaHeaders(options.meta);
    for (auto& header : options.headers)
        setHeader(request.headers, header.first, header.second);

    if (!options.contentType.empty())
        setHeader(request.headers, "Content-Type", options.contentType);
    if (!body.empty() || method == network::HttpRequest::Method::PUT)
        setHeader(request.headers, "Content-Length", to_string(body.size()));
    if (options.contentMd5) {
        auto md5 = utils::md5Encode(reinterpret_cast<const uint8_t*>(body.data()), body.size());
        setHeader(request.headers, "Content-MD5", utils::base64Encode(reinterpret_cast<const uint8_t*>(md5.data()), md5.size()));
    }
    setHeader(request.headers, "Date", OSSSigner::formatDate(_clock()));
    erase_if(request.headers, [](const auto& header) { return utils::iequals(header.first, "Authorization"); });

    auto resource = OSSSigner::canonicalResource(request.queries);
    request.headers["Authorization"] = OSSSigner::sign(method, _credentials.keyId, _credentials.keySecret, _settings.bucket, objectKey, resource, request.headers);
    return request;
}
//---------------------------------------------------------------------------
network::HttpResult OSS::send(network::HttpRequest::Method method, string_view objectKey, const RequestOptions& options, string_view body, Error::Operation operation) const
// Sends the request and classifies a failed status
{
    auto request = buildRequest(method, objectKey, options, body);
    auto result = _client->execute(request, body);
    if (!network::HttpResponse::checkSuccess(result.response.code))
        throw Error::classify(operation, result.response.code, result.response.getStatusLine());
    return result;
}
//---------------------------------------------------------------------------
void OSS::putObject(string_view body, string_view objectKey, const PutOptions& options) const
// Uploads the object
{
    send(network::HttpRequest::Method::PUT, objectKey, options, body, Error::Operation::Put);
}
//---------------------------------------------------------------------------
void OSS::copyObject(string_view sourceKey, string_view targetKey, const PutOptions& options) const
// Server side copy within the bucket
{
    auto copyOptions = options;
    string source = "/";
    source.append(_settings.bucket).append("/").append(sourceKey);
    copyOptions.headers["x-oss-copy-source"] = move(source);
    send(network::HttpRequest::Method::PUT, targetKey, copyOptions, {}, Error::Operation::Copy);
}
//---------------------------------------------------------------------------
GetObjectResult OSS::getObjectBuffer(string_view objectKey, const vector<string>& metaKeys, const network::HttpRequest::Queries& queries) const
// Downloads the object
{
    RequestOptions options;
    options.queries = queries;
    auto result = send(network::HttpRequest::Method::GET, objectKey, options, {}, Error::Operation::Get);

    GetObjectResult object;
    for (auto& key : metaKeys) {
        string name(metaPrefix);
        name += key;
        if (auto value = result.response.findHeader(name))
            object.meta.emplace(key, *value);
    }
    object.content = move(result.content);
    object.headers = move(result.response.headers);
    return object;
}
//---------------------------------------------------------------------------
GetObjectResult OSS::getObject(string_view objectKey, const vector<string>& metaKeys, const network::HttpRequest::Queries& queries) const
// Downloads the object as text
{
    auto object = getObjectBuffer(objectKey, metaKeys, queries);
    if (!utils::validUtf8(object.content))
        throw Error(Error::Kind::Conversion, string(Error::getKindName(Error::Kind::Conversion)) + ": content of \"" + string(objectKey) + "\" is not valid UTF-8");
    return object;
}
//---------------------------------------------------------------------------
void OSS::deleteObject(string_view objectKey) const
// Deletes the object
{
    send(network::HttpRequest::Method::DELETE, objectKey, {}, {}, Error::Operation::Delete);
}
//---------------------------------------------------------------------------
void OSS::deleteObjects(const vector<string>& objectKeys) const
// Deletes sequentially
{
    for (auto& objectKey : objectKeys)
        deleteObject(objectKey);
}
//---------------------------------------------------------------------------
Meta OSS::headObject(string_view objectKey) const
// Reads the user metadata
{
    auto result = send(network::HttpRequest::Method::HEAD, objectKey, {}, {}, Error::Operation::Head);
    return fromMetaHeaders(result.response.headers);
}
//---------------------------------------------------------------------------
network::HttpRequest::Queries OSS::listQueries(const ListOptions& options)
// The list-type=2 request shape, empty options are not sent
{
    network::HttpRequest::Queries queries;
    queries.emplace("list-type", "2");
    if (!options.marker.empty())
        queries.emplace("continuation-token", options.marker);
    if (!options.delimiter.empty())
        queries.emplace("delimiter", options.delimiter);
    if (options.maxKeys)
        queries.emplace("max-keys", to_string(*options.maxKeys));
    if (!options.prefix.empty())
        queries.emplace("prefix", options.prefix);
    return queries;
}
//---------------------------------------------------------------------------
vector<string> OSS::listObjects(const ListOptions& options) const
// Lists the keys
{
    RequestOptions requestOptions;
    requestOptions.queries = listQueries(options);
    auto result = send(network::HttpRequest::Method::GET, "", requestOptions, {}, Error::Operation::Get);
    return ListResponse::decodeKeys(result.content);
}
//---------------------------------------------------------------------------
ListPage OSS::listDetails(const ListOptions& options) const
// Lists the page
{
    RequestOptions requestOptions;
    requestOptions.queries = listQueries(options);
    auto result = send(network::HttpRequest::Method::GET, "", requestOptions, {}, Error::Operation::Get);
    return ListResponse::decodeDetails(result.content);
}
//---------------------------------------------------------------------------
string OSS::signUrl(string_view objectKey, chrono::seconds validFor, network::HttpRequest::Method method) const
// The presigned url relative to now
{
    auto expires = chrono::duration_cast<chrono::seconds>(_clock().time_since_epoch()) + validFor;
    return signUrlUntil(objectKey, static_cast<uint64_t>(expires.count()), method);
}
//---------------------------------------------------------------------------
string OSS::signUrlUntil(string_view objectKey, uint64_t expires, network::HttpRequest::Method method) const
// The presigned url
{
    auto request = createRequest(method, objectKey);
    request.queries = OSSSigner::presign(method, _credentials.keyId, _credentials.keySecret, expires, _settings.bucket, objectKey, "", {});
    return request.getUrl();
}
//---------------------------------------------------------------------------
network::HttpRequest::Headers OSS::toMetaHeaders(const Meta& meta)
// Prefixes the keys
{
    network::HttpRequest::Headers headers;
    for (auto& entry : meta) {
        string name(metaPrefix);
        name += utils::toLower(entry.first);
        headers[name] = entry.second;
    }
    return headers;
}
//---------------------------------------------------------------------------
Meta OSS::fromMetaHeaders(const network::HttpRequest::Headers& headers)
// Strips the prefix
{
    Meta meta;
    for (auto& header : headers)
        if (utils::istartsWith(header.first, metaPrefix) && header.first.size() > metaPrefix.size())
            meta[utils::toLower(string_view(header.first).substr(metaPrefix.size()))] = header.second;
    return meta;
}
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace ossblob
