#pragma once
#include "network/http_response.hpp"
#include <cstdint>
#include <functional>
#include <memory>
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
/// Incremental http response decoder, the received bytes are fed in
/// arbitrary pieces and the decoded body is emitted as it arrives
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        Unknown,
        ContentLength,
        ChunkedEncoding,
        ConnectionClose,
        NoContent
    };

    struct Info {
        /// The response header
        HttpResponse response;
        /// The body length, for chunked and connection close known once finished
        uint64_t length = 0;
        /// The header length
        uint32_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::Unknown;
    };

    /// The callback receiving decoded body bytes
    using BodyCallback = std::function<void(const uint8_t* data, uint64_t length)>;

    /// Upper bound for the header and a single chunk line
    static constexpr uint64_t maxHeaderSize = 64u * 1024;

    private:
    /// The decoding phase
    enum class Phase : uint8_t {
        Header,
        Body,
        ChunkSize,
        ChunkData,
        ChunkDataEnd,
        Trailer,
        Finished
    };

    /// The header info
    std::unique_ptr<Info> _info;
    /// The buffered header bytes
    std::string _header;
    /// The buffered partial line
    std::string _line;
    /// The phase
    Phase _phase;
    /// Remaining bytes of the content length body or the current chunk
    uint64_t _remaining;
    /// Decoded body bytes
    uint64_t _bodyBytes;

    public:
    /// The constructor
    HttpHelper();

    /// Consume received bytes, returns the number of bytes that belong to this response
    uint64_t consume(const uint8_t* data, uint64_t length, const BodyCallback& body);
    /// The peer closed the connection, returns true if this ends the response correctly
    [[nodiscard]] bool finishOnClose();

    /// Was the header fully received
    [[nodiscard]] bool hasHeader() const { return _info != nullptr; }
    /// Get the header info, nullptr before the header was received
    [[nodiscard]] const Info* getInfo() const { return _info.get(); }
    /// Is the response complete
    [[nodiscard]] bool finished() const { return _phase == Phase::Finished; }
    /// The decoded body bytes so far
    [[nodiscard]] uint64_t getBodyBytes() const { return _bodyBytes; }

    /// Detect the protocol
    [[nodiscard]] static Info detect(std::string_view header);

    private:
    /// Collect a line over several feeds, returns true once the line is complete
    bool readLine(const uint8_t* data, uint64_t length, uint64_t& pos);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace playcache
