#include "cloud/oss_signer.hpp"
#include "cloud/error.hpp"
#include <catch2/catch.hpp>
#include <chrono>
#include <string>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ossblob::cloud::test {
//---------------------------------------------------------------------------
using namespace std;
using Method = network::HttpRequest::Method;
//---------------------------------------------------------------------------
static constexpr auto date = "Mon, 01 Jan 2024 00:00:00 GMT";
//---------------------------------------------------------------------------
TEST_CASE("oss_signer_canonical_resource") {
    SECTION("only allow-listed queries") {
        network::HttpRequest::Queries queries = {{"acl", nullopt}, {"foo", "bar"}};
        REQUIRE(OSSSigner::canonicalResource(queries) == "acl");
        queries = {{"uploadId", "7"}, {"max-keys", "2"}};
        REQUIRE(OSSSigner::canonicalResource(queries) == "uploadId=7");
    }
    SECTION("sorted by name") {
        network::HttpRequest::Queries queries = {{"uploadId", "1"}, {"partNumber", "2"}, {"acl", nullopt}, {"x-oss-process", "image/resize"}, {"continuation-token", "t"}};
        auto resource = OSSSigner::canonicalResource(queries);
        REQUIRE(resource == "acl&continuation-token=t&partNumber=2&uploadId=1&x-oss-process=image/resize");
        // Deterministic
        REQUIRE(OSSSigner::canonicalResource(queries) == resource);
    }
    SECTION("raw values") {
        network::HttpRequest::Queries queries = {{"response-content-type", "text/plain; charset=utf-8"}};
        REQUIRE(OSSSigner::canonicalResource(queries) == "response-content-type=text/plain; charset=utf-8");
    }
    SECTION("empty") {
        REQUIRE(OSSSigner::canonicalResource({}).empty());
        REQUIRE(OSSSigner::canonicalResource({{"list-type", "2"}, {"prefix", "a"}}).empty());
    }
    SECTION("allow list") {
        REQUIRE(OSSSigner::subResources.size() == 51);
        REQUIRE(OSSSigner::isSubResource("continuation-token"));
        REQUIRE(OSSSigner::isSubResource("callback-var"));
        REQUIRE(!OSSSigner::isSubResource("prefix"));
        REQUIRE(!OSSSigner::isSubResource("ACL"));
    }
}
//---------------------------------------------------------------------------
TEST_CASE("oss_signer_canonical_headers") {
    SECTION("selected lower-cased and sorted") {
        network::HttpRequest::Headers headers = {{"X-OSS-Meta-Zeta", "z"}, {"Content-Type", "text/plain"}, {"x-oss-date", "d"}, {"Date", date}, {"x-oss-meta-alpha", "a"}};
        REQUIRE(OSSSigner::canonicalHeaders(headers) == "x-oss-date:d\nx-oss-meta-alpha:a\nx-oss-meta-zeta:z\n");
    }
    SECTION("same name merged in source order") {
        network::HttpRequest::Headers headers = {{"X-OSS-Meta-A", "1"}, {"x-oss-meta-a", "2"}, {"x-oss-meta-b", "3"}};
        REQUIRE(OSSSigner::canonicalHeaders(headers) == "x-oss-meta-a:1,2\nx-oss-meta-b:3\n");
    }
    SECTION("nothing selected") {
        REQUIRE(OSSSigner::canonicalHeaders({{"Date", date}, {"Content-Length", "0"}}).empty());
    }
}
//---------------------------------------------------------------------------
TEST_CASE("oss_signer_string_to_sign") {
    OSSSigner::StringToSign stringToSign = {.verb = "PUT", .contentMd5 = "", .contentType = "", .dateOrExpiry = date, .canonicalHeaders = "", .bucket = "b", .objectKey = "o.txt", .canonicalResource = ""};
    REQUIRE(OSSSigner::createStringToSign(stringToSign) == "PUT\n\n\nMon, 01 Jan 2024 00:00:00 GMT\n\n/b/o.txt");

    stringToSign.contentMd5 = "md5";
    stringToSign.contentType = "text/plain";
    stringToSign.canonicalHeaders = "x-oss-meta-a:1\n";
    stringToSign.canonicalResource = "acl";
    REQUIRE(OSSSigner::createStringToSign(stringToSign) == "PUT\nmd5\ntext/plain\nMon, 01 Jan 2024 00:00:00 GMT\nx-oss-meta-a:1\n/b/o.txt?acl");

    // No blank line between the last header entry and the resource
    stringToSign = {.verb = "PUT", .contentMd5 = "", .contentType = "", .dateOrExpiry = date, .canonicalHeaders = "x-oss-copy-source:/b/src.txt\n", .bucket = "b", .objectKey = "o.txt", .canonicalResource = ""};
    REQUIRE(OSSSigner::createStringToSign(stringToSign) == "PUT\n\n\nMon, 01 Jan 2024 00:00:00 GMT\nx-oss-copy-source:/b/src.txt\n/b/o.txt");
}
//---------------------------------------------------------------------------
TEST_CASE("oss_signer_sign") {
    SECTION("scenario") {
        network::HttpRequest::Headers headers = {{"Date", date}};
        auto authorization = OSSSigner::sign(Method::PUT, "id", "secret", "b", "o.txt", "", headers);
        REQUIRE(authorization == "OSS id:hk4JByxqQ/RU7au/fC2ADrPEVgs=");
        REQUIRE(OSSSigner::sign("secret", "PUT\n\n\nMon, 01 Jan 2024 00:00:00 GMT\n\n/b/o.txt") == "hk4JByxqQ/RU7au/fC2ADrPEVgs=");
        // Deterministic
        for (int i = 0; i < 3; i++)
            REQUIRE(OSSSigner::sign(Method::PUT, "id", "secret", "b", "o.txt", "", headers) == authorization);
    }
    SECTION("headers and resource") {
        network::HttpRequest::Headers headers = {{"Date", date}, {"X-OSS-Meta-A", "1"}, {"x-oss-meta-a", "2"}, {"x-oss-meta-b", "3"}};
        network::HttpRequest::Queries queries = {{"acl", nullopt}, {"uploadId", "7"}, {"foo", "bar"}};
        auto authorization = OSSSigner::sign(Method::GET, "id", "secret", "b", "o.txt", OSSSigner::canonicalResource(queries), headers);
        REQUIRE(authorization == "OSS id:HCP9aLeaJ2jomunIJrHqxPSVV/0=");
        REQUIRE(OSSSigner::sign("secret", "GET\n\n\nMon, 01 Jan 2024 00:00:00 GMT\nx-oss-meta-a:1,2\nx-oss-meta-b:3\n/b/o.txt?acl&uploadId=7") == "HCP9aLeaJ2jomunIJrHqxPSVV/0=");
    }
    SECTION("header lookup is case-insensitive") {
        auto lower = OSSSigner::sign(Method::PUT, "id", "secret", "b", "o.txt", "", {{"date", date}, {"content-type", "text/plain"}});
        auto upper = OSSSigner::sign(Method::PUT, "id", "secret", "b", "o.txt", "", {{"Date", date}, {"Content-Type", "text/plain"}});
        REQUIRE(lower == upper);
        REQUIRE(lower != OSSSigner::sign(Method::PUT, "id", "secret", "b", "o.txt", "", {{"Date", date}}));
    }
    SECTION("invalid header bytes") {
        try {
            static_cast<void>(OSSSigner::sign(Method::PUT, "id", "secret", "b", "o.txt", "", {{"Date", date}, {"x-oss-meta-a", "bad\r\nvalue"}}));
            FAIL("expected an encoding error");
        } catch (const Error& e) {
            REQUIRE(e.kind() == Error::Kind::Encoding);
        }
        REQUIRE_THROWS_AS(OSSSigner::sign(Method::PUT, "id", "secret", "b", "o.txt", "", {{"x-oss-meta-bad key", "v"}}), Error);
        // The key id ends up in the Authorization value
        REQUIRE_THROWS_AS(OSSSigner::sign(Method::PUT, "id\n", "secret", "b", "o.txt", "", {{"Date", date}}), Error);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("oss_signer_presign") {
    auto queries = OSSSigner::presign(Method::GET, "id", "secret", 1704070800, "b", "o.txt", "", {});
    REQUIRE(queries.size() == 3);
    REQUIRE(queries["OSSAccessKeyId"] == "id");
    REQUIRE(queries["Expires"] == "1704070800");
    REQUIRE(queries["Signature"] == "IyMaEqGn5PXKiiEdDu0MwKIVPbg=");
    REQUIRE(*queries["Signature"] == OSSSigner::sign("secret", "GET\n\n\n1704070800\n\n/b/o.txt"));
}
//---------------------------------------------------------------------------
TEST_CASE("oss_signer_date") {
    auto time = chrono::system_clock::time_point(chrono::seconds(1704067200));
    REQUIRE(OSSSigner::formatDate(time) == date);
    REQUIRE(OSSSigner::formatDate(time + chrono::hours(24 * 45) + chrono::seconds(3661)) == "Thu, 15 Feb 2024 01:01:01 GMT");
}
//---------------------------------------------------------------------------
} // namespace ossblob::cloud::test
