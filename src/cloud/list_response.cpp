#include "cloud/list_response.hpp"
#include "cloud/error.hpp"
#include <charconv>
#include <memory>
#include <utility>
#include <libxml/parser.h>
#include <libxml/xmlreader.h>
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
using namespace std;
//---------------------------------------------------------------------------
static Error decodeError(const string& what)
// Creates the decode error
{
    return Error(Error::Kind::Decode, string(Error::getKindName(Error::Kind::Decode)) + ": " + what);
}
//---------------------------------------------------------------------------
static void collectError(void* arg, const char* msg, xmlParserSeverities severity, xmlTextReaderLocatorPtr /*locator*/)
// Keeps the first parser error
{
    auto& message = *static_cast<string*>(arg);
    if (!message.empty() || !msg || (severity != XML_PARSER_SEVERITY_ERROR && severity != XML_PARSER_SEVERITY_VALIDITY_ERROR))
        return;
    message = msg;
    while (!message.empty() && (message.back() == '\n' || message.back() == ' '))
        message.pop_back();
}
//---------------------------------------------------------------------------
uint64_t ObjectSummary::sizeValue() const
// Parses the size
{
    uint64_t value = 0;
    auto [ptr, ec] = from_chars(size.data(), size.data() + size.size(), value);
    if (ec != errc() || ptr != size.data() + size.size() || size.empty())
        throw decodeError("invalid size \"" + size + "\" of object \"" + key + "\"");
    return value;
}
//---------------------------------------------------------------------------
bool ListResponse::parseBool(string_view value)
// Only the literals are accepted
{
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    throw decodeError("invalid IsTruncated value \"" + string(value) + "\"");
}
//---------------------------------------------------------------------------
ListPage ListResponse::decode(string_view document, bool keysOnly)
// Drives the state machine over the reader nodes
{
    if (!in_range<int>(document.size()))
        throw decodeError("listing document too large");

    xmlInitParser();
    unique_ptr<xmlTextReader, decltype(&xmlFreeTextReader)> reader(xmlReaderForMemory(document.data(), static_cast<int>(document.size()), nullptr, nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING), xmlFreeTextReader);
    if (!reader)
        throw decodeError("can not create the xml reader");
    string parseError;
    xmlTextReaderSetErrorHandler(reader.get(), collectError, &parseError);

    ListPage page;
    ObjectSummary current;
    State state = State::Idle;
    // The field the text of the current element goes to
    string* capture = nullptr;
    // The depth of the element that opened the current state
    int stateDepth = 0;
    string truncated;
    bool sawTruncated = false;

    auto endElement = [&](int depth) {
        capture = nullptr;
        if (state != State::Idle && depth == stateDepth) {
            if (state == State::InContents)
                page.objects.push_back(move(current));
            current = ObjectSummary();
            state = State::Idle;
        }
    };

    int status;
    while ((status = xmlTextReaderRead(reader.get())) == 1) {
        auto depth = xmlTextReaderDepth(reader.get());
        switch (xmlTextReaderNodeType(reader.get())) {
            case XML_READER_TYPE_ELEMENT: {
                string_view name(reinterpret_cast<const char*>(xmlTextReaderConstLocalName(reader.get())));
                capture = nullptr;
                if (keysOnly) {
                    if (name == "Key") {
                        page.objects.emplace_back();
                        capture = &page.objects.back().key;
                    }
                } else {
                    switch (state) {
                        case State::Idle:
                            if (name == "Contents") {
                                state = State::InContents;
                                stateDepth = depth;
                                current = ObjectSummary();
                            } else if (name == "CommonPrefixes") {
                                state = State::InCommonPrefixes;
                                stateDepth = depth;
                            } else if (name == "IsTruncated") {
                                sawTruncated = true;
                                truncated.clear();
                                capture = &truncated;
                            } else if (name == "NextContinuationToken") {
                                page.nextMarker.clear();
                                capture = &page.nextMarker;
                            }
                            break;
                        case State::InContents:
                            if (depth != stateDepth + 1)
                                break;
                            if (name == "Key")
                                capture = &current.key;
                            else if (name == "LastModified")
                                capture = &current.lastModified;
                            else if (name == "ETag")
                                capture = &current.etag;
                            else if (name == "Size")
                                capture = &current.size;
                            if (capture)
                                capture->clear();
                            break;
                        case State::InCommonPrefixes:
                            if (depth == stateDepth + 1 && name == "Prefix") {
                                page.commonPrefixes.emplace_back();
                                capture = &page.commonPrefixes.back();
                            }
                            break;
                    }
                }
                // <Tag/> has no end node
                if (xmlTextReaderIsEmptyElement(reader.get()) == 1)
                    endElement(depth);
                break;
            }
            // Whitespace inside a captured element is content
            case XML_READER_TYPE_TEXT:
            case XML_READER_TYPE_CDATA:
            case XML_READER_TYPE_WHITESPACE:
            case XML_READER_TYPE_SIGNIFICANT_WHITESPACE: {
                if (capture)
                    if (auto value = xmlTextReaderConstValue(reader.get()))
                        capture->append(reinterpret_cast<const char*>(value));
                break;
            }
            case XML_READER_TYPE_END_ELEMENT: {
                endElement(depth);
                break;
            }
            default: break;
        }
    }
    if (status < 0)
        throw decodeError(parseError.empty() ? "malformed listing document" : parseError);

    if (sawTruncated)
        page.isTruncated = parseBool(truncated);
    if (!page.isTruncated)
        page.nextMarker.clear();
    return page;
}
//---------------------------------------------------------------------------
vector<string> ListResponse::decodeKeys(string_view document)
// Decodes the keys
{
    auto page = decode(document, true);
    vector<string> keys;
    keys.reserve(page.objects.size());
    for (auto& object : page.objects)
        keys.push_back(move(object.key));
    return keys;
}
//---------------------------------------------------------------------------
ListPage ListResponse::decodeDetails(string_view document)
// Decodes the page
{
    return decode(document, false);
}
//---------------------------------------------------------------------------
} // namespace ossblob::cloud
