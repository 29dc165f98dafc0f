#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
//---------------------------------------------------------------------------
// OSSBlob - Object Storage Service Client Library
// Dominik Durner, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace ossblob::utils {
//---------------------------------------------------------------------------
/// Encode url special characters in %HEX
std::string encodeUrlParameters(const std::string& encode);
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Encode everything from binary representation to base64
std::string base64Encode(const uint8_t* input, uint64_t length);
/// Build md5 of the data
std::string md5Encode(const uint8_t* data, uint64_t length);
/// Sign with hmac using the digest (OpenSSL name, e.g., SHA1) and return the raw signature
std::pair<std::unique_ptr<uint8_t[]>, uint64_t> hmacSign(std::string_view digest, const uint8_t* keyData, uint64_t keyLength, const uint8_t* msgData, uint64_t msgLength);
/// Lower-case ascii copy
std::string toLower(std::string_view input);
/// Case-insensitive ascii comparison
bool iequals(std::string_view lhs, std::string_view rhs) noexcept;
/// Case-insensitive ascii prefix check
bool istartsWith(std::string_view input, std::string_view prefix) noexcept;
/// Checks that the bytes form well-formed UTF-8
bool validUtf8(std::string_view input) noexcept;
//---------------------------------------------------------------------------
} // namespace ossblob::utils
