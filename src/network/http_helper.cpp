#include "network/http_helper.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2021
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
HttpHelper::HttpHelper() : _info(), _header(), _line(), _phase(Phase::Header), _remaining(0), _bodyBytes(0)
// The constructor
{
}
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header)
// Detect the protocol
{
    Info info;
    info.response = HttpResponse::deserialize(header);

    static constexpr string_view transferEncoding = "Transfer-Encoding";
    static constexpr string_view chunkedEncoding = "chunked";
    static constexpr string_view contentLength = "Content-Length";
    static constexpr string_view headerEnd = "\r\n\r\n";

    auto end = header.find(headerEnd);
    if (end == string_view::npos)
        throw runtime_error("Invalid HttpResponse: Incomplete header!");
    info.headerLength = static_cast<uint32_t>(end + headerEnd.length());

    if (HttpResponse::withoutContent(info.response.status)) {
        info.encoding = Encoding::NoContent;
        return info;
    }

    if (auto encoding = info.response.findHeader(transferEncoding); encoding && utils::toLower(*encoding).find(chunkedEncoding) != string::npos) {
        info.encoding = Encoding::ChunkedEncoding;
    } else if (auto length = info.response.findHeader(contentLength); length) {
        auto result = from_chars(length->data(), length->data() + length->size(), info.length);
        if (result.ec != errc() || result.ptr != length->data() + length->size())
            throw runtime_error("Invalid HttpResponse: Invalid Content-Length!");
        info.encoding = Encoding::ContentLength;
    } else {
        // Body is delimited by the connection close
        info.encoding = Encoding::ConnectionClose;
    }
    return info;
}
//---------------------------------------------------------------------------
bool HttpHelper::readLine(const uint8_t* data, uint64_t length, uint64_t& pos)
// Collect a line
{
    while (pos < length) {
        auto c = static_cast<char>(data[pos++]);
        if (c == '\n' && !_line.empty() && _line.back() == '\r') {
            _line.pop_back();
            return true;
        }
        _line.push_back(c);
        if (_line.size() > maxHeaderSize)
            throw runtime_error("Invalid HttpResponse: Line too long!");
    }
    return false;
}
//---------------------------------------------------------------------------
uint64_t HttpHelper::consume(const uint8_t* data, uint64_t length, const BodyCallback& body)
// Consume received bytes
{
    static constexpr string_view headerEnd = "\r\n\r\n";

    uint64_t pos = 0;
    while (pos < length && _phase != Phase::Finished) {
        switch (_phase) {
            case Phase::Header: {
                auto oldSize = _header.size();
                _header.append(reinterpret_cast<const char*>(data) + pos, length - pos);
                auto end = _header.find(headerEnd, oldSize >= headerEnd.size() ? oldSize - (headerEnd.size() - 1) : 0);
                if (end == string::npos) {
                    if (_header.size() > maxHeaderSize)
                        throw runtime_error("Invalid HttpResponse: Header too long!");
                    return length;
                }
                auto headerLength = end + headerEnd.size();
                _info = make_unique<Info>(detect(string_view(_header).substr(0, headerLength)));
                pos += headerLength - oldSize;
                _header.clear();
                _header.shrink_to_fit();
                switch (_info->encoding) {
                    case Encoding::ContentLength:
                        _remaining = _info->length;
                        _phase = _remaining ? Phase::Body : Phase::Finished;
                        break;
                    case Encoding::ChunkedEncoding:
                        _phase = Phase::ChunkSize;
                        break;
                    case Encoding::ConnectionClose:
                        _phase = Phase::Body;
                        break;
                    default:
                        _phase = Phase::Finished;
                        break;
                }
                break;
            }
            case Phase::Body: {
                auto take = length - pos;
                if (_info->encoding == Encoding::ContentLength)
                    take = min(take, _remaining);
                body(data + pos, take);
                pos += take;
                _bodyBytes += take;
                if (_info->encoding == Encoding::ContentLength) {
                    _remaining -= take;
                    if (!_remaining)
                        _phase = Phase::Finished;
                }
                break;
            }
            case Phase::ChunkSize: {
                if (!readLine(data, length, pos))
                    return pos;
                // Chunk extensions are ignored
                string_view line = utils::trim(string_view(_line).substr(0, _line.find(';')));
                uint64_t chunkSize = 0;
                auto result = from_chars(line.data(), line.data() + line.size(), chunkSize, 16);
                if (line.empty() || result.ec != errc() || result.ptr != line.data() + line.size())
                    throw runtime_error("Invalid HttpResponse: Invalid chunk size!");
                _line.clear();
                if (chunkSize) {
                    _remaining = chunkSize;
                    _phase = Phase::ChunkData;
                } else {
                    _phase = Phase::Trailer;
                }
                break;
            }
            case Phase::ChunkData: {
                auto take = min(length - pos, _remaining);
                body(data + pos, take);
                pos += take;
                _bodyBytes += take;
                _remaining -= take;
                if (!_remaining)
                    _phase = Phase::ChunkDataEnd;
                break;
            }
            case Phase::ChunkDataEnd: {
                if (!readLine(data, length, pos))
                    return pos;
                if (!_line.empty())
                    throw runtime_error("Invalid HttpResponse: Missing chunk delimiter!");
                _phase = Phase::ChunkSize;
                break;
            }
            case Phase::Trailer: {
                if (!readLine(data, length, pos))
                    return pos;
                // Trailer headers are skipped until the empty line
                if (_line.empty())
                    _phase = Phase::Finished;
                _line.clear();
                break;
            }
            default:
                break;
        }
    }
    if (_phase == Phase::Finished && _info)
        _info->length = _bodyBytes;
    return pos;
}
//---------------------------------------------------------------------------
bool HttpHelper::finishOnClose()
// The peer closed the connection
{
    if (_phase == Phase::Body && _info && _info->encoding == Encoding::ConnectionClose) {
        _phase = Phase::Finished;
        _info->length = _bodyBytes;
    }
    return _phase == Phase::Finished;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace playcache
