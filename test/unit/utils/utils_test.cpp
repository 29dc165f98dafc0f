#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ossblob::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
static const uint8_t* bytes(string_view s) { return reinterpret_cast<const uint8_t*>(s.data()); }
//---------------------------------------------------------------------------
TEST_CASE("utils_encoding") {
    REQUIRE(base64Encode(bytes("OSSBlob"), 7) == "T1NTQmxvYg==");
    REQUIRE(base64Encode(bytes(""), 0).empty());
    // The length is checked before the input is read
    REQUIRE_THROWS_AS(base64Encode(bytes("a"), uint64_t(1) << 32), runtime_error);
    REQUIRE(hexEncode(bytes("\x01\xab"), 2) == "01ab");
    REQUIRE(hexEncode(bytes("\x01\xab"), 2, true) == "01AB");
    REQUIRE(encodeUrlParameters("a b/c+d=e~f") == "a%20b%2Fc%2Bd%3De~f");

    auto md5 = md5Encode(bytes("hello"), 5);
    REQUIRE(md5.size() == 16);
    REQUIRE(base64Encode(bytes(md5), md5.size()) == "XUFAKrxLKna5cZ2REBfFkg==");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_hmac") {
    // RFC 2202 test case 2
    string_view key = "Jefe";
    string_view msg = "what do ya want for nothing?";
    auto hmac = hmacSign("SHA1", bytes(key), key.size(), bytes(msg), msg.size());
    REQUIRE(hmac.second == 20);
    REQUIRE(hexEncode(hmac.first.get(), hmac.second) == "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79");
}
//---------------------------------------------------------------------------
TEST_CASE("utils_case") {
    REQUIRE(toLower("X-OSS-Meta-Key") == "x-oss-meta-key");
    REQUIRE(iequals("Content-Type", "content-type"));
    REQUIRE(!iequals("Content-Type", "content-typ"));
    REQUIRE(istartsWith("X-Oss-Meta-a", "x-oss-meta-"));
    REQUIRE(!istartsWith("x-oss", "x-oss-meta-"));
}
//---------------------------------------------------------------------------
TEST_CASE("utils_utf8") {
    REQUIRE(validUtf8(""));
    REQUIRE(validUtf8("plain ascii"));
    REQUIRE(validUtf8("gr\xc3\xbc\xc3\x9f \xe6\x97\xa5\xe6\x9c\xac \xf0\x9f\x98\x80"));
    // Truncated sequence
    REQUIRE(!validUtf8("\xc3"));
    REQUIRE(!validUtf8("ab\xe6\x97"));
    // Stray continuation byte
    REQUIRE(!validUtf8("\x80"));
    // Overlong encoding of '/'
    REQUIRE(!validUtf8("\xc0\xaf"));
    REQUIRE(!validUtf8("\xe0\x80\xaf"));
    // Surrogate
    REQUIRE(!validUtf8("\xed\xa0\x80"));
    // Above U+10FFFF
    REQUIRE(!validUtf8("\xf4\x90\x80\x80"));
    REQUIRE(!validUtf8("\xff"));
}
//---------------------------------------------------------------------------
} // namespace ossblob::utils::test
