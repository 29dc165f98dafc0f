#include "utils/utils.hpp"
#include <cctype>
#include <stdexcept>
#include <utility>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/md5.h>
#include <openssl/params.h>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace ossblob {
namespace utils {
//---------------------------------------------------------------------------
string base64Encode(const uint8_t* input, uint64_t length)
// Encodes a string as a base64 string
{
    if (!in_range<int>(length))
        throw runtime_error("Input too large for base64 encoding!");
    auto baseLength = 4 * ((length + 2) / 3);
    auto buffer = make_unique<char[]>(baseLength + 1);
    auto encodeLength = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(buffer.get()), input, static_cast<int>(length));
    if (encodeLength < 0 || static_cast<unsigned>(encodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    return string(buffer.get(), static_cast<unsigned>(encodeLength));
}
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char hex[] = "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (uint64_t i = 0; i < length; i++) {
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] >> 4])) : hex[input[i] >> 4]);
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] & 15])) : hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
string encodeUrlParameters(const string& encode)
// Encodes a string for url
{
    string result;
    for (auto c : encode) {
        if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~')
            result += c;
        else {
            result += "%";
            result += hexEncode(reinterpret_cast<uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string md5Encode(const uint8_t* data, uint64_t length)
// Encodes the data as md5 string
{
    unsigned char hash[MD5_DIGEST_LENGTH];
    unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestInit_ex(mdctx.get(), EVP_md5(), nullptr) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestUpdate(mdctx.get(), data, length) <= 0)
        throw runtime_error("OpenSSL Error!");

    unsigned digestLength = MD5_DIGEST_LENGTH;
    if (EVP_DigestFinal_ex(mdctx.get(), reinterpret_cast<unsigned char*>(hash), &digestLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    return string(reinterpret_cast<char*>(hash), digestLength);
}
//---------------------------------------------------------------------------
pair<unique_ptr<uint8_t[]>, uint64_t> hmacSign(string_view digest, const uint8_t* keyData, uint64_t keyLength, const uint8_t* msgData, uint64_t msgLength)
// Encodes the msg with the key with hmac and the requested digest
{
    unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)> mac(EVP_MAC_fetch(nullptr, "HMAC", nullptr), EVP_MAC_free);
    if (!mac)
        throw runtime_error("OpenSSL Error!");

    OSSL_PARAM params[2];
    auto* p = params;
    string digestName(digest);
    *p++ = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digestName.data(), digestName.size());
    *p = OSSL_PARAM_construct_end();

    unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)> mctx(EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free);
    if (!mctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_MAC_init(mctx.get(), keyData, keyLength, params) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_MAC_update(mctx.get(), msgData, msgLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    size_t len;
    if (EVP_MAC_final(mctx.get(), nullptr, &len, 0) <= 0)
        throw runtime_error("OpenSSL Error!");

    auto hash = make_unique<uint8_t[]>(len);

    if (EVP_MAC_final(mctx.get(), hash.get(), &len, len) <= 0)
        throw runtime_error("OpenSSL len!");

    return {move(hash), len};
}
//---------------------------------------------------------------------------
string toLower(string_view input)
// Lower-case ascii copy
{
    string result(input);
    for (auto& c : result)
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return result;
}
//---------------------------------------------------------------------------
bool iequals(string_view lhs, string_view rhs) noexcept
// Case-insensitive ascii comparison
{
    if (lhs.size() != rhs.size())
        return false;
    for (auto i = 0ull; i < lhs.size(); i++)
        if (tolower(static_cast<unsigned char>(lhs[i])) != tolower(static_cast<unsigned char>(rhs[i])))
            return false;
    return true;
}
//---------------------------------------------------------------------------
bool istartsWith(string_view input, string_view prefix) noexcept
// Case-insensitive ascii prefix check
{
    return input.size() >= prefix.size() && iequals(input.substr(0, prefix.size()), prefix);
}
//---------------------------------------------------------------------------
bool validUtf8(string_view input) noexcept
// Checks for well-formed UTF-8 (no overlongs, no surrogates, at most U+10FFFF)
{
    auto data = reinterpret_cast<const unsigned char*>(input.data());
    auto length = input.size();
    for (auto i = 0ull; i < length;) {
        auto c = data[i];
        if (c < 0x80) {
            i++;
            continue;
        }
        uint64_t follow;
        unsigned char low = 0x80, high = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            follow = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            follow = 2;
            if (c == 0xE0)
                low = 0xA0;
            else if (c == 0xED)
                high = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            follow = 3;
            if (c == 0xF0)
                low = 0x90;
            else if (c == 0xF4)
                high = 0x8F;
        } else {
            return false;
        }
        if (i + follow >= length)
            return false;
        // The first continuation byte carries the range restriction
        if (data[i + 1] < low || data[i + 1] > high)
            return false;
        for (auto j = 2ull; j <= follow; j++)
            if (data[i + j] < 0x80 || data[i + j] > 0xBF)
                return false;
        i += follow + 1;
    }
    return true;
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace ossblob
