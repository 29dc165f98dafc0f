#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
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
/// The single error type of the client, a kind plus a context message
class Error : public std::runtime_error {
    public:
    /// The error kinds
    enum class Kind : uint8_t {
        /// Connection, DNS or TLS failure of the transport
        Transport,
        /// Invalid header bytes produced while assembling a request
        Encoding,
        /// Non-success status of an operation
        Put,
        Get,
        Copy,
        Delete,
        Head,
        /// Malformed listing document or unparsable truncation flag
        Decode,
        /// Response bytes are not valid UTF-8 text
        Conversion
    };

    /// The operations that can fail with a status
    enum class Operation : uint8_t {
        Put,
        Get,
        Copy,
        Delete,
        Head
    };

    private:
    /// The kind
    Kind _kind;
    /// The http status, 0 if not a status error
    uint64_t _status;

    public:
    /// The constructor
    Error(Kind kind, const std::string& message, uint64_t status = 0) : std::runtime_error(message), _kind(kind), _status(status) {}

    /// Get the kind
    [[nodiscard]] Kind kind() const noexcept { return _kind; }
    /// Get the http status
    [[nodiscard]] uint64_t status() const noexcept { return _status; }

    /// Get the kind name
    static constexpr auto getKindName(const Kind& kind) noexcept {
        switch (kind) {
            case Kind::Transport: return "TRANSPORT ERROR";
            case Kind::Encoding: return "ENCODING ERROR";
            case Kind::Put: return "PUT ERROR";
            case Kind::Get: return "GET ERROR";
            case Kind::Copy: return "COPY ERROR";
            case Kind::Delete: return "DELETE ERROR";
            case Kind::Head: return "HEAD ERROR";
            case Kind::Decode: return "DECODE ERROR";
            case Kind::Conversion: return "CONVERSION ERROR";
            default: return "UNKNOWN ERROR";
        }
    }

    /// Maps a non-success status of an operation to its typed error
    [[nodiscard]] static Error classify(Operation operation, uint64_t status, std::string_view statusLine);
};
//---------------------------------------------------------------------------
} // namespace ossblob::cloud
