#include "cache/file_cache.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <fcntl.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::cache {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
FileCache::FileCache(string path, bool truncate) : _path(move(path)), _fd(-1), _written(0), _writer()
// The constructor
{
    auto flags = O_CREAT | O_RDWR | O_CLOEXEC;
    if (truncate)
        flags |= O_TRUNC;
    _fd = ::open(_path.c_str(), flags, 0644);
    if (_fd < 0)
        throw runtime_error("FileCache error! - cannot open " + _path + ": " + strerror(errno));
    if (!truncate) {
        auto size = ::lseek(_fd, 0, SEEK_END);
        if (size > 0)
            _written = static_cast<uint64_t>(size);
    }
    _writer.start();
}
//---------------------------------------------------------------------------
FileCache::~FileCache()
// The destructor
{
    _writer.stop();
    ::close(_fd);
}
//---------------------------------------------------------------------------
void FileCache::cache(shared_ptr<const utils::DataVector<uint8_t>> chunk, uint64_t bytesDownloadedSoFar, int64_t /*bytesExpected*/, CachedCallback onCached, FailedCallback onFailed)
// Store a chunk
{
    if (!chunk || chunk->size() > bytesDownloadedSoFar) {
        onFailed("invalid chunk position");
        return;
    }
    _writer.post([this, chunk = move(chunk), bytesDownloadedSoFar, onCached = move(onCached), onFailed = move(onFailed)]() {
        auto offset = bytesDownloadedSoFar - chunk->size();
        for (uint64_t written = 0; written < chunk->size();) {
            auto status = ::pwrite(_fd, chunk->cdata() + written, chunk->size() - written, static_cast<off_t>(offset + written));
            if (status < 0) {
                if (errno == EINTR)
                    continue;
                auto reason = "write of " + _path + " failed: " + strerror(errno);
                cerr << "FileCache: " << reason << endl;
                onFailed(reason);
                return;
            }
            written += static_cast<uint64_t>(status);
        }
        if (bytesDownloadedSoFar > _written.load())
            _written = bytesDownloadedSoFar;
        onCached();
    });
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> FileCache::read(uint64_t startByte, uint64_t endByte)
// Read [startByte, endByte)
{
    if (endByte < startByte || endByte > _written.load())
        return nullptr;
    auto data = make_unique<utils::DataVector<uint8_t>>(endByte - startByte);
    for (uint64_t done = 0; done < data->size();) {
        auto status = ::pread(_fd, data->data() + done, data->size() - done, static_cast<off_t>(startByte + done));
        if (status < 0 && errno == EINTR)
            continue;
        if (status <= 0) {
            cerr << "FileCache: read of " << _path << " failed: " << (status < 0 ? strerror(errno) : "unexpected end of file") << endl;
            return nullptr;
        }
        done += static_cast<uint64_t>(status);
    }
    return data;
}
//---------------------------------------------------------------------------
string FileCache::pathFor(const string& directory, const string& location)
// The cache file of a location
{
    auto name = utils::sha256Encode(reinterpret_cast<const uint8_t*>(location.data()), location.size()) + ".bin";
    if (directory.empty())
        return name;
    return directory.back() == '/' ? directory + name : directory + "/" + name;
}
//---------------------------------------------------------------------------
} // namespace playcache::cache
