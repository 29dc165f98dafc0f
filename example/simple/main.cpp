#include "cloud/error.hpp"
#include "cloud/oss.hpp"
#include <chrono>
#include <exception>
#include <iostream>
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
int main(int argc, char** argv) {
    // The file to be uploaded and downloaded
    auto fileName = argc > 1 ? argv[1] : "ossblob/ossblob.txt";

    try {
        // Create the client from OSS_ENDPOINT, OSS_BUCKET, OSS_ACCESS_KEY_ID and OSS_ACCESS_KEY_SECRET
        auto oss = ossblob::cloud::OSS::makeFromEnvironment();

        // Upload with user metadata
        ossblob::cloud::PutOptions options;
        options.contentType = "text/plain";
        options.meta = {{"author", "ossblob"}};
        oss.putObject("Hello OSS!", fileName, options);
        cout << "Uploaded " << fileName << endl;

        // Download the object and the requested metadata
        auto object = oss.getObject(fileName, {"author"});
        cout << object.content << " (author: " << object.meta["author"] << ")" << endl;

        // List the first page below the directory
        auto page = oss.listDetails(ossblob::cloud::ListOptions().withPrefix("ossblob/").withMaxKeys(10));
        for (auto& summary : page.objects)
            cout << summary.key << " " << summary.size << endl;

        // Share the object for an hour
        cout << oss.signUrl(fileName, chrono::hours(1)) << endl;

        oss.deleteObject(fileName);
    } catch (const ossblob::cloud::Error& e) {
        cerr << e.what() << endl;
        return 1;
    } catch (const exception& e) {
        cerr << "Setup failed: " << e.what() << endl;
        return 1;
    }
    return 0;
}
//---------------------------------------------------------------------------
