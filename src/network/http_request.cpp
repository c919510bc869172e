#include "network/http_request.hpp"
#include "network/config.hpp"
#include "network/location.hpp"
#include "utils/data_vector.hpp"
#include <string>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2024
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
HttpRequest HttpRequest::buildGet(const Location& location, const TransportSettings& settings)
// Build the resource request
{
    HttpRequest request;
    request.method = Method::GET;
    request.type = Type::HTTP_1_1;
    request.path = location.path;
    request.headers.emplace("Host", location.hostHeader());
    request.headers.emplace("User-Agent", settings.userAgent);
    request.headers.emplace("Accept", "*/*");
    // The bytes need to be stored exactly as served
    request.headers.emplace("Accept-Encoding", "identity");
    request.headers.emplace("Cache-Control", "no-cache");
    request.headers.emplace("Pragma", "no-cache");
    request.headers.emplace("Connection", "close");
    return request;
}
//---------------------------------------------------------------------------
unique_ptr<utils::DataVector<uint8_t>> HttpRequest::serialize(const HttpRequest& request)
// Serialize an http header
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " " + request.path;
    httpHeader += " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    auto begin = reinterpret_cast<const uint8_t*>(httpHeader.data());
    return make_unique<utils::DataVector<uint8_t>>(begin, begin + httpHeader.size());
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace playcache
