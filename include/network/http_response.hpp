#pragma once
#include <cstdint>
#include <map>
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
namespace playcache::network {
//---------------------------------------------------------------------------
/// Implements an helper to deserialize http responses
struct HttpResponse {
    /// Important status codes
    enum class Code : uint8_t {
        OK_200,
        NO_CONTENT_204,
        PARTIAL_CONTENT_206,
        MOVED_PERMANENTLY_301,
        FOUND_302,
        SEE_OTHER_303,
        NOT_MODIFIED_304,
        TEMPORARY_REDIRECT_307,
        PERMANENT_REDIRECT_308,
        BAD_REQUEST_400,
        FORBIDDEN_403,
        NOT_FOUND_404,
        RANGE_NOT_SATISFIABLE_416,
        INTERNAL_SERVER_ERROR_500,
        SERVICE_UNAVAILABLE_503,
        UNKNOWN = 255
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The headers - without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The code
    Code code = Code::UNKNOWN;
    /// The numeric status
    uint16_t status = 0;
    /// The type
    Type type = Type::HTTP_1_1;

    /// Get the response code text
    static constexpr auto getResponseCode(const Code& code) noexcept {
        switch (code) {
            case Code::OK_200: return "200 OK";
            case Code::NO_CONTENT_204: return "204 No Content";
            case Code::PARTIAL_CONTENT_206: return "206 Partial Content";
            case Code::MOVED_PERMANENTLY_301: return "301 Moved Permanently";
            case Code::FOUND_302: return "302 Found";
            case Code::SEE_OTHER_303: return "303 See Other";
            case Code::NOT_MODIFIED_304: return "304 Not Modified";
            case Code::TEMPORARY_REDIRECT_307: return "307 Temporary Redirect";
            case Code::PERMANENT_REDIRECT_308: return "308 Permanent Redirect";
            case Code::BAD_REQUEST_400: return "400 Bad Request";
            case Code::FORBIDDEN_403: return "403 Forbidden";
            case Code::NOT_FOUND_404: return "404 Not Found";
            case Code::RANGE_NOT_SATISFIABLE_416: return "416 Range Not Satisfiable";
            case Code::INTERNAL_SERVER_ERROR_500: return "500 Internal Server Error";
            case Code::SERVICE_UNAVAILABLE_503: return "503 Service Unavailable";
            default: return "UNKNOWN";
        }
    }
    /// Get the response type
    static constexpr auto getResponseType(const Type& type) noexcept {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "UNKNOWN";
        }
    }
    /// Map a numeric status to the code
    static constexpr Code getCode(uint16_t status) noexcept {
        switch (status) {
            case 200: return Code::OK_200;
            case 204: return Code::NO_CONTENT_204;
            case 206: return Code::PARTIAL_CONTENT_206;
            case 301: return Code::MOVED_PERMANENTLY_301;
            case 302: return Code::FOUND_302;
            case 303: return Code::SEE_OTHER_303;
            case 304: return Code::NOT_MODIFIED_304;
            case 307: return Code::TEMPORARY_REDIRECT_307;
            case 308: return Code::PERMANENT_REDIRECT_308;
            case 400: return Code::BAD_REQUEST_400;
            case 403: return Code::FORBIDDEN_403;
            case 404: return Code::NOT_FOUND_404;
            case 416: return Code::RANGE_NOT_SATISFIABLE_416;
            case 500: return Code::INTERNAL_SERVER_ERROR_500;
            case 503: return Code::SERVICE_UNAVAILABLE_503;
            default: return Code::UNKNOWN;
        }
    }
    /// Check for successful operation 2xx operations
    static constexpr bool checkSuccess(uint16_t status) {
        return status >= 200 && status < 300;
    }
    /// Check for a followed redirect
    static constexpr bool checkRedirect(uint16_t status) {
        return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
    }
    /// Check if the result has no content
    static constexpr bool withoutContent(uint16_t status) {
        return (status >= 100 && status < 200) || status == 204 || status == 304;
    }

    /// Find a header ignoring the case of the key, nullptr if missing
    [[nodiscard]] const std::string* findHeader(std::string_view key) const;
    /// The lower case media type without parameters, empty if missing
    [[nodiscard]] std::string mimeType() const;

    /// Deserialize the response
    [[nodiscard]] static HttpResponse deserialize(std::string_view data);
};
//---------------------------------------------------------------------------
} // namespace playcache::network
