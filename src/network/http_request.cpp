#include "network/http_request.hpp"
#include "utils/utils.hpp"
#include <cctype>
#include <string>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2024
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
string HttpRequest::getQueryString() const
// Encodes the queries, flags without =
{
    string result;
    auto it = queries.begin();
    while (it != queries.end()) {
        result += utils::encodeUrlParameters(it->first);
        if (it->second.has_value())
            result += "=" + utils::encodeUrlParameters(*it->second);
        if (++it != queries.end())
            result += "&";
    }
    return result;
}
//---------------------------------------------------------------------------
string HttpRequest::getTarget() const
// The request target of the first line
{
    auto target = path.empty() ? string("/") : path;
    if (queries.size())
        target += "?" + getQueryString();
    return target;
}
//---------------------------------------------------------------------------
string HttpRequest::getUrl() const
// The full url
{
    string url = https ? "https://" : "http://";
    url += host;
    if (port && port != (https ? 443u : 80u))
        url += ":" + to_string(port);
    return url + getTarget();
}
//---------------------------------------------------------------------------
bool HttpRequest::validHeaderName(string_view name) noexcept
// RFC 7230 token characters
{
    static constexpr string_view specials = "!#$%&'*+-.^_`|~";
    if (name.empty())
        return false;
    for (unsigned char c : name) {
        if (!isalnum(c) && specials.find(static_cast<char>(c)) == specials.npos)
            return false;
    }
    return true;
}
//---------------------------------------------------------------------------
bool HttpRequest::validHeaderValue(string_view value) noexcept
// Visible bytes, space, tab and obs-text
{
    for (unsigned char c : value) {
        if ((c < 0x20 && c != '\t') || c == 0x7F)
            return false;
    }
    return true;
}
//---------------------------------------------------------------------------
string HttpRequest::serialize(const HttpRequest& request)
// Serialize an http header
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " " + request.getTarget();
    httpHeader += " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    auto hasHost = false;
    for (const auto& h : request.headers)
        hasHost |= utils::iequals(h.first, "Host");
    if (!hasHost) {
        httpHeader += "Host: " + request.host;
        if (request.port && request.port != (request.https ? 443u : 80u))
            httpHeader += ":" + to_string(request.port);
        httpHeader += "\r\n";
    }
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    return httpHeader;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace ossblob
