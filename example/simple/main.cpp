#include "cache/file_cache.hpp"
#include "network/http_transport.hpp"
#include "stream/fulfillment_engine.hpp"
#include "utils/work_queue.hpp"
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
int main(int argc, char** argv) {
    if (argc < 2) {
        cerr << "Usage: " << argv[0] << " <url> [cache-dir]" << endl;
        return 1;
    }
    string url = argv[1];

    // The owner queue, every engine callback runs here
    playcache::utils::WorkQueue queue;
    playcache::network::HttpTransport transport;

    // Keep the bytes on disk if a cache directory is given
    unique_ptr<playcache::cache::FileCache> diskCache;
    if (argc > 2) {
        auto path = playcache::cache::FileCache::pathFor(argv[2], url);
        diskCache = make_unique<playcache::cache::FileCache>(path);
        cout << "Caching to " << path << endl;
    }

    auto resource = playcache::stream::Resource::fromLocation(url);
    playcache::stream::FulfillmentEngine engine(move(resource), playcache::stream::Config::defaults(), queue, &transport, diskCache.get());

    auto done = false;
    auto failed = false;
    playcache::stream::Delegate delegate;
    delegate.onReadyToPlay = []() { cout << "Ready to play" << endl; };
    delegate.onDownloadFinished = [&done](span<const uint8_t> payload) {
        cout << "Downloaded " << payload.size() << " bytes" << endl;
        done = true;
    };
    delegate.onCachingFinished = [&done](int64_t bytesCached) {
        cout << "Cached " << bytesCached << " bytes" << endl;
        done = true;
    };
    delegate.onDownloadFailed = [&done, &failed](const playcache::stream::Error& error) {
        cout << "Failed: " << playcache::stream::Error::getErrorKind(error.kind) << " " << error.message << endl;
        done = true;
        failed = true;
    };
    engine.setDelegate(move(delegate));

    // Read the whole resource like a player would
    uint64_t received = 0;
    playcache::stream::RangeCallbacks callbacks;
    callbacks.onMetadata = [](const playcache::stream::ContentMetadata& metadata) {
        cout << "Content type: " << (metadata.contentType.empty() ? "unknown" : metadata.contentType) << ", length: " << metadata.contentLength << endl;
    };
    callbacks.onData = [&received](span<const uint8_t> data) { received += data.size(); };
    callbacks.onFinished = [&received]() { cout << "Range finished after " << received << " bytes" << endl; };
    auto handle = engine.requestRange(0, numeric_limits<uint64_t>::max(), move(callbacks));
    if (!handle)
        return 1;

    while (!done)
        queue.runFor(chrono::milliseconds(100));
    // Deliver the last window
    queue.drain();

    return failed ? 1 : 0;
}
//---------------------------------------------------------------------------
