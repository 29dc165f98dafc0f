#include "cloud/error.hpp"
#include <stdexcept>
#include <string>
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
Error Error::classify(Operation operation, uint64_t status, string_view statusLine)
// Maps the failed status to the error of the operation
{
    Kind kind = Kind::Transport;
    string_view action;
    switch (operation) {
        case Operation::Put:
            kind = Kind::Put;
            action = "put";
            break;
        case Operation::Get:
            kind = Kind::Get;
            action = "get";
            break;
        case Operation::Copy:
            kind = Kind::Copy;
            action = "copy";
            break;
        case Operation::Delete:
            kind = Kind::Delete;
            action = "delete";
            break;
        case Operation::Head:
            kind = Kind::Head;
            action = "head";
            break;
    }
    if (action.empty())
        throw logic_error("Unknown operation " + to_string(static_cast<unsigned>(operation)));

    string message = getKindName(kind);
    message += ": can not ";
    message += action;
    message += " object, status code: ";
    message += to_string(status);
    // The status line usually repeats the code, only keep its reason phrase
    auto reason = statusLine;
    auto code = to_string(status);
    if (reason.starts_with(code))
        reason = reason.substr(code.size());
    if (auto pos = reason.find_first_not_of(' '); pos != reason.npos) {
        message += " ";
        message += reason.substr(pos);
    }
    return Error(kind, message, status);
}
//---------------------------------------------------------------------------
} // namespace ossblob::cloud
