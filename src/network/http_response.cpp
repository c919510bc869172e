#include "network/http_response.hpp"
#include "utils/utils.hpp"
#include <charconv>
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
const string* HttpResponse::findHeader(string_view key) const
// Find a header, keys are case insensitive
{
    for (auto& keyValue : headers)
        if (utils::equalsIgnoreCase(keyValue.first, key))
            return &keyValue.second;
    return nullptr;
}
//---------------------------------------------------------------------------
string HttpResponse::mimeType() const
// The media type
{
    auto contentType = findHeader("Content-Type");
    if (!contentType)
        return {};
    string_view type = *contentType;
    return utils::toLower(utils::trim(type.substr(0, type.find(';'))));
}
//---------------------------------------------------------------------------
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ":";

    HttpResponse response;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpResponse: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpResponse: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // the http type
            if (line.starts_with(strHttp1_0)) {
                response.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                response.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");
            }

            // the status, the reason phrase is optional
            string_view httpType = getResponseType(response.type);
            line = line.substr(httpType.size());
            if (line.size() < 4 || line.front() != ' ')
                throw runtime_error("Invalid HttpResponse: Missing status code!");
            auto statusView = line.substr(1, 3);
            auto result = from_chars(statusView.data(), statusView.data() + statusView.size(), response.status);
            if (result.ec != errc() || result.ptr != statusView.data() + statusView.size() || (line.size() > 4 && line[4] != ' '))
                throw runtime_error("Invalid HttpResponse: Invalid status code!");
            response.code = getCode(response.status);
        } else {
            // headers
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos || !keyPos)
                throw runtime_error("Invalid HttpResponse: Headers need key and value!");
            response.headers.emplace(utils::trim(line.substr(0, keyPos)), utils::trim(line.substr(keyPos + strHeaderSeperator.size())));
        }
    }

    return response;
}
//---------------------------------------------------------------------------
} // namespace playcache::network
