#include "cloud/oss_signer.hpp"
#include "cloud/error.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
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
using namespace std;
//---------------------------------------------------------------------------
bool OSSSigner::isSubResource(string_view name) noexcept
// Is the query parameter part of the signature
{
    return find(subResources.begin(), subResources.end(), name) != subResources.end();
}
//---------------------------------------------------------------------------
string OSSSigner::canonicalResource(const network::HttpRequest::Queries& queries)
// The map is ordered byte-wise, so filtering keeps the sort order
{
    string result;
    for (auto& query : queries) {
        if (!isSubResource(query.first))
            continue;
        if (!result.empty())
            result += '&';
        result += query.first;
        if (query.second) {
            result += '=';
            result += *query.second;
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string OSSSigner::canonicalHeaders(const network::HttpRequest::Headers& headers)
// Creates the canonical headers
{
    vector<pair<string, string>> selected;
    for (auto& header : headers)
        if (utils::istartsWith(header.first, headerPrefix))
            selected.emplace_back(utils::toLower(header.first), header.second);
    // Stable to keep the source order of names that only differ in case
    stable_sort(selected.begin(), selected.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    string result;
    for (auto it = selected.begin(); it != selected.end();) {
        result += it->first;
        result += ':';
        result += it->second;
        auto next = it + 1;
        for (; next != selected.end() && next->first == it->first; ++next) {
            result += ',';
            result += next->second;
        }
        result += '\n';
        it = next;
    }
    return result;
}
//---------------------------------------------------------------------------
string OSSSigner::createStringToSign(const StringToSign& stringToSign)
// Creates the string to sign
{
    string result;
    result.reserve(64 + stringToSign.canonicalHeaders.size() + stringToSign.bucket.size() + stringToSign.objectKey.size() + stringToSign.canonicalResource.size());
    result.append(stringToSign.verb).append("\n");
    result.append(stringToSign.contentMd5).append("\n");
    result.append(stringToSign.contentType).append("\n");
    result.append(stringToSign.dateOrExpiry).append("\n");
    // Every header entry ends with its own line break, an empty block still takes one line
    if (stringToSign.canonicalHeaders.empty())
        result.append("\n");
    else
        result.append(stringToSign.canonicalHeaders);
    result.append("/").append(stringToSign.bucket).append("/").append(stringToSign.objectKey);
    if (!stringToSign.canonicalResource.empty())
        result.append("?").append(stringToSign.canonicalResource);
    return result;
}
//---------------------------------------------------------------------------
string OSSSigner::sign(string_view keySecret, string_view stringToSign)
// Calculates the signature
{
    auto hmac = utils::hmacSign("SHA1", reinterpret_cast<const uint8_t*>(keySecret.data()), keySecret.size(), reinterpret_cast<const uint8_t*>(stringToSign.data()), stringToSign.size());
    return utils::base64Encode(hmac.first.get(), hmac.second);
}
//---------------------------------------------------------------------------
string_view OSSSigner::findHeader(const network::HttpRequest::Headers& headers, string_view name)
// Finds a header case-insensitive
{
    for (auto& header : headers)
        if (utils::iequals(header.first, name))
            return header.second;
    return {};
}
//---------------------------------------------------------------------------
void OSSSigner::checkHeaders(const network::HttpRequest::Headers& headers)
// Validates the header bytes
{
    for (auto& header : headers) {
        if (!network::HttpRequest::validHeaderName(header.first))
            throw Error(Error::Kind::Encoding, string(Error::getKindName(Error::Kind::Encoding)) + ": invalid header name \"" + header.first + "\"");
        if (!network::HttpRequest::validHeaderValue(header.second))
            throw Error(Error::Kind::Encoding, string(Error::getKindName(Error::Kind::Encoding)) + ": invalid value of header \"" + header.first + "\"");
    }
}
//---------------------------------------------------------------------------
string OSSSigner::sign(network::HttpRequest::Method verb, string_view keyId, string_view keySecret, string_view bucket, string_view objectKey, string_view canonicalResource, const network::HttpRequest::Headers& headers)
// Header-based signing with the Date header
{
    checkHeaders(headers);
    auto headerString = canonicalHeaders(headers);
    StringToSign stringToSign = {.verb = network::HttpRequest::getRequestMethod(verb), .contentMd5 = findHeader(headers, "Content-MD5"), .contentType = findHeader(headers, "Content-Type"), .dateOrExpiry = findHeader(headers, "Date"), .canonicalHeaders = headerString, .bucket = bucket, .objectKey = objectKey, .canonicalResource = canonicalResource};

    string authorization = "OSS ";
    authorization.append(keyId).append(":").append(sign(keySecret, createStringToSign(stringToSign)));
    if (!network::HttpRequest::validHeaderValue(authorization))
        throw Error(Error::Kind::Encoding, string(Error::getKindName(Error::Kind::Encoding)) + ": invalid value of header \"Authorization\"");
    return authorization;
}
//---------------------------------------------------------------------------
network::HttpRequest::Queries OSSSigner::presign(network::HttpRequest::Method verb, string_view keyId, string_view keySecret, uint64_t expires, string_view bucket, string_view objectKey, string_view canonicalResource, const network::HttpRequest::Headers& headers)
// Url signing with the expiry epoch in the date field
{
    checkHeaders(headers);
    auto expiry = to_string(expires);
    auto headerString = canonicalHeaders(headers);
    StringToSign stringToSign = {.verb = network::HttpRequest::getRequestMethod(verb), .contentMd5 = findHeader(headers, "Content-MD5"), .contentType = findHeader(headers, "Content-Type"), .dateOrExpiry = expiry, .canonicalHeaders = headerString, .bucket = bucket, .objectKey = objectKey, .canonicalResource = canonicalResource};

    network::HttpRequest::Queries queries;
    queries.emplace("OSSAccessKeyId", string(keyId));
    queries.emplace("Expires", expiry);
    queries.emplace("Signature", sign(keySecret, createStringToSign(stringToSign)));
    return queries;
}
//---------------------------------------------------------------------------
string OSSSigner::formatDate(chrono::system_clock::time_point time)
// Formats the date, e.g. Mon, 01 Jan 2024 00:00:00 GMT
{
    auto t = chrono::system_clock::to_time_t(time);
    tm gmt;
    gmtime_r(&t, &gmt);
    stringstream dateStream;
    dateStream.imbue(locale::classic());
    dateStream << put_time(&gmt, "%a, %d %b %Y %H:%M:%S GMT");
    return dateStream.str();
}
//---------------------------------------------------------------------------
}; // namespace cloud
}; // namespace ossblob
