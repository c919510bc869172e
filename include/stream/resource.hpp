#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache {
//---------------------------------------------------------------------------
namespace utils {
template <typename T>
class DataVector;
}
//---------------------------------------------------------------------------
namespace stream {
//---------------------------------------------------------------------------
/// The content metadata, filled once
struct ContentMetadata {
    /// The media type, empty if unknown
    std::string contentType;
    /// The length in bytes, -1 while unknown
    int64_t contentLength = -1;
    /// Byte ranges can be requested
    bool supportsRangeAccess = true;
};
//---------------------------------------------------------------------------
/// The played resource, either a remote location or an in-memory payload
class Resource {
    /// The location, empty for payloads
    std::string _location;
    /// The declared media type
    std::string _mimeType;
    /// The declared file extension
    std::string _fileExtension;
    /// The payload
    std::shared_ptr<const utils::DataVector<uint8_t>> _payload;

    /// The constructor
    Resource(std::string location, std::string mimeType, std::string fileExtension, std::shared_ptr<const utils::DataVector<uint8_t>> payload);

    public:
    /// A remote resource, throws invalid_argument on an empty location
    [[nodiscard]] static Resource fromLocation(std::string location, std::string mimeType = "");
    /// An in-memory payload
    [[nodiscard]] static Resource fromPayload(utils::DataVector<uint8_t> payload, std::string mimeType, std::string fileExtension);

    /// Is it a payload
    [[nodiscard]] bool isPayload() const { return _payload != nullptr; }
    /// Get the location
    [[nodiscard]] const std::string& getLocation() const { return _location; }
    /// Get the declared media type
    [[nodiscard]] const std::string& getMimeType() const { return _mimeType; }
    /// Get the declared file extension
    [[nodiscard]] const std::string& getFileExtension() const { return _fileExtension; }
    /// Get the payload, nullptr for remote resources
    [[nodiscard]] const std::shared_ptr<const utils::DataVector<uint8_t>>& getPayload() const { return _payload; }
    /// The metadata known without any transfer
    [[nodiscard]] std::optional<ContentMetadata> declaredMetadata() const;
};
//---------------------------------------------------------------------------
} // namespace stream
} // namespace playcache
