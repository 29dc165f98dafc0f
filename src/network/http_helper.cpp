#include "network/http_helper.hpp"
#include "utils/utils.hpp"
#include <charconv>
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
static constexpr string_view headerEnd = "\r\n\r\n";
static constexpr string_view lineEnd = "\r\n";
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header, bool withoutBody)
// Detect the protocol
{
    Info info;
    info.response = HttpResponse::deserialize(header);

    static constexpr string_view transferEncoding = "Transfer-Encoding";
    static constexpr string_view chunkedEncoding = "chunked";
    static constexpr string_view contentLength = "Content-Length";

    auto end = header.find(headerEnd);
    if (end == string_view::npos)
        throw runtime_error("Incomplete HTTP header");
    info.headerLength = static_cast<unsigned>(end) + static_cast<unsigned>(headerEnd.length());

    if (withoutBody || HttpResponse::withoutContent(info.response.code)) {
        info.encoding = Encoding::NoContent;
        return info;
    }

    info.encoding = Encoding::ConnectionClose;
    for (auto& keyValue : info.response.headers) {
        if (utils::iequals(transferEncoding, keyValue.first) && utils::toLower(keyValue.second).find(chunkedEncoding) != string::npos) {
            info.encoding = Encoding::ChunkedEncoding;
            break;
        } else if (utils::iequals(contentLength, keyValue.first)) {
            auto [ptr, ec] = from_chars(keyValue.second.data(), keyValue.second.data() + keyValue.second.size(), info.length);
            if (ec != errc() || ptr != keyValue.second.data() + keyValue.second.size())
                throw runtime_error("Invalid HTTP Content-Length");
            info.encoding = Encoding::ContentLength;
        }
    }
    return info;
}
//---------------------------------------------------------------------------
bool HttpHelper::walkChunks(string_view body, string* decoded)
// Walks over the chunks of a chunked body
{
    uint64_t pos = 0;
    while (true) {
        auto sizeEnd = body.find(lineEnd, pos);
        if (sizeEnd == body.npos)
            return false;
        auto sizeLine = body.substr(pos, sizeEnd - pos);
        // Ignore chunk extensions
        sizeLine = sizeLine.substr(0, sizeLine.find(';'));
        uint64_t chunkSize;
        auto [ptr, ec] = from_chars(sizeLine.data(), sizeLine.data() + sizeLine.size(), chunkSize, 16);
        if (ec != errc() || sizeLine.empty())
            throw runtime_error("Invalid HTTP chunk size");
        auto dataStart = sizeEnd + lineEnd.size();
        if (!chunkSize) {
            // The last chunk is followed by optional trailers and an empty line
            if (body.substr(dataStart).starts_with(lineEnd))
                return true;
            return body.find(headerEnd, sizeEnd) != body.npos;
        }
        if (dataStart + chunkSize + lineEnd.size() > body.size())
            return false;
        if (decoded)
            decoded->append(body.substr(dataStart, chunkSize));
        pos = dataStart + chunkSize + lineEnd.size();
    }
}
//---------------------------------------------------------------------------
bool HttpHelper::headerComplete(const uint8_t* data, uint64_t length)
// Is the header complete
{
    string_view sv(reinterpret_cast<const char*>(data), length);
    return sv.find(headerEnd) != sv.npos;
}
//---------------------------------------------------------------------------
string HttpHelper::retrieveContent(const uint8_t* data, uint64_t length, unique_ptr<Info>& info, bool withoutBody)
// Retrieve the content without http meta info
{
    string_view sv(reinterpret_cast<const char*>(data), length);
    if (!info)
        info = make_unique<Info>(detect(sv, withoutBody));
    auto body = sv.substr(info->headerLength);
    switch (info->encoding) {
        case Encoding::ContentLength: {
            if (body.size() < info->length)
                throw runtime_error("Truncated HTTP body");
            return string(body.substr(0, info->length));
        }
        case Encoding::ChunkedEncoding: {
            string decoded;
            if (!walkChunks(body, &decoded))
                throw runtime_error("Truncated HTTP chunked body");
            return decoded;
        }
        case Encoding::ConnectionClose:
            return string(body);
        default:
            return {};
    }
}
//---------------------------------------------------------------------------
bool HttpHelper::finished(const uint8_t* data, uint64_t length, unique_ptr<Info>& info, bool withoutBody)
// Detect end / content
{
    if (!info) {
        if (!headerComplete(data, length))
            return false;
        string_view sv(reinterpret_cast<const char*>(data), length);
        info = make_unique<Info>(detect(sv, withoutBody));
    }
    switch (info->encoding) {
        case Encoding::NoContent:
            return true;
        case Encoding::ContentLength:
            return length >= info->headerLength + info->length;
        case Encoding::ChunkedEncoding: {
            string_view sv(reinterpret_cast<const char*>(data), length);
            return walkChunks(sv.substr(info->headerLength), nullptr);
        }
        case Encoding::ConnectionClose:
            return false;
        default: {
            info = nullptr;
            throw runtime_error("Unsupported HTTP transfer protocol");
        }
    }
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace ossblob
