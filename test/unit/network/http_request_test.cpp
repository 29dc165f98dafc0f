#include "network/http_request.hpp"
#include <catch2/catch.hpp>
#include <string>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ossblob {
namespace network {
namespace test {
//---------------------------------------------------------------------------
TEST_CASE("http_request") {
    network::HttpRequest request;

    request.method = network::HttpRequest::Method::GET;
    request.host = "bucket.example.com";
    request.path = "/test";
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.queries.emplace("key", "value");
    request.queries.emplace("key2", "a b");
    request.queries.emplace("acl", std::nullopt);
    request.headers.emplace("Authorization", "test");
    request.headers.emplace("Timestamp", "2024-02-18 00:00:00");

    REQUIRE(request.getQueryString() == "acl&key=value&key2=a%20b");
    REQUIRE(request.getTarget() == "/test?acl&key=value&key2=a%20b");
    REQUIRE(request.getUrl() == "http://bucket.example.com/test?acl&key=value&key2=a%20b");

    auto serialize = network::HttpRequest::serialize(request);
    REQUIRE(serialize == "GET /test?acl&key=value&key2=a%20b HTTP/1.1\r\nHost: bucket.example.com\r\nAuthorization: test\r\nTimestamp: 2024-02-18 00:00:00\r\n\r\n");
}
//---------------------------------------------------------------------------
TEST_CASE("http_request_url") {
    network::HttpRequest request;
    request.host = "bucket.example.com";
    request.path = "/a/b.txt";

    SECTION("no queries no question mark") {
        REQUIRE(request.getUrl() == "http://bucket.example.com/a/b.txt");
    }
    SECTION("https default port") {
        request.https = true;
        request.port = 443;
        REQUIRE(request.getPort() == 443);
        REQUIRE(request.getUrl() == "https://bucket.example.com/a/b.txt");
    }
    SECTION("custom port") {
        request.port = 9000;
        REQUIRE(request.getUrl() == "http://bucket.example.com:9000/a/b.txt");
        auto serialize = network::HttpRequest::serialize(request);
        REQUIRE(serialize == "GET /a/b.txt HTTP/1.1\r\nHost: bucket.example.com:9000\r\n\r\n");
    }
    SECTION("scheme default port") {
        REQUIRE(request.getPort() == 80);
        request.https = true;
        REQUIRE(request.getPort() == 443);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("http_request_header_validation") {
    REQUIRE(network::HttpRequest::validHeaderName("x-oss-meta-key"));
    REQUIRE(network::HttpRequest::validHeaderName("Content-MD5"));
    REQUIRE(!network::HttpRequest::validHeaderName(""));
    REQUIRE(!network::HttpRequest::validHeaderName("bad name"));
    REQUIRE(!network::HttpRequest::validHeaderName("bad:name"));
    REQUIRE(!network::HttpRequest::validHeaderName("bad\nname"));

    REQUIRE(network::HttpRequest::validHeaderValue(""));
    REQUIRE(network::HttpRequest::validHeaderValue("OSS id:sig+/="));
    REQUIRE(network::HttpRequest::validHeaderValue("tab\tseparated"));
    REQUIRE(!network::HttpRequest::validHeaderValue("line\r\nInjected: 1"));
    REQUIRE(!network::HttpRequest::validHeaderValue(std::string_view("nul\0byte", 8)));
    REQUIRE(!network::HttpRequest::validHeaderValue("del\x7f"));
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace network
} // namespace ossblob
