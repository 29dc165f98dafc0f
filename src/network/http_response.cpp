#include "network/http_response.hpp"
#include "utils/utils.hpp"
#include <charconv>
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
string HttpResponse::getStatusLine() const
// The status line without the version
{
    auto line = to_string(code);
    if (!reason.empty())
        line += " " + reason;
    return line;
}
//---------------------------------------------------------------------------
const string* HttpResponse::findHeader(string_view name) const
// Case-insensitive header lookup
{
    for (auto& keyValue : headers)
        if (utils::iequals(keyValue.first, name))
            return &keyValue.second;
    return nullptr;
}
//---------------------------------------------------------------------------
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ":";

    HttpResponse response;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpResponse: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpResponse: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // the http type
            if (line.starts_with(strHttp1_0)) {
                response.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                response.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");
            }

            string_view httpType = getResponseType(response.type);
            if (line.size() < httpType.size() + 4)
                throw runtime_error("Invalid HttpResponse: Missing status code!");
            line = line.substr(httpType.size() + 1);

            // the status code and the reason
            auto [ptr, ec] = from_chars(line.data(), line.data() + 3, response.code);
            if (ec != errc() || ptr != line.data() + 3)
                throw runtime_error("Invalid HttpResponse: Invalid status code!");
            if (line.size() > 4)
                response.reason = line.substr(4);
        } else {
            // headers
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpResponse: Headers need key and value!");
            auto key = line.substr(0, keyPos);
            auto value = line.substr(keyPos + strHeaderSeperator.size());
            auto begin = value.find_first_not_of(" \t");
            value = begin == value.npos ? string_view() : value.substr(begin, value.find_last_not_of(" \t") - begin + 1);
            // Repeated headers are combined as a list
            auto it = response.headers.find(string(key));
            if (it != response.headers.end())
                it->second += "," + string(value);
            else
                response.headers.emplace(key, value);
        }
    }

    return response;
}
//---------------------------------------------------------------------------
} // namespace ossblob::network
