#include "network/location.hpp"
#include "utils/utils.hpp"
#include <charconv>
#include <stdexcept>
//---------------------------------------------------------------------------
// PlayCache - Progressive Media Resource Cache
// Dominik Durner, 2022
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace playcache::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
Location Location::parse(string_view url)
// Parse an absolute url
{
    static constexpr string_view strHttp = "http://";
    static constexpr string_view strHttps = "https://";

    Location location;
    url = utils::trim(url);
    if (url.size() >= strHttps.size() && utils::equalsIgnoreCase(url.substr(0, strHttps.size()), strHttps)) {
        location.scheme = Scheme::HTTPS;
        url = url.substr(strHttps.size());
    } else if (url.size() >= strHttp.size() && utils::equalsIgnoreCase(url.substr(0, strHttp.size()), strHttp)) {
        location.scheme = Scheme::HTTP;
        url = url.substr(strHttp.size());
    } else {
        throw runtime_error("Invalid location: Needs to be a http or https url!");
    }

    // Fragments are never sent
    if (auto hashPos = url.find('#'); hashPos != string_view::npos)
        url = url.substr(0, hashPos);

    auto pathPos = url.find_first_of("/?");
    auto authority = url.substr(0, pathPos);
    if (pathPos != string_view::npos) {
        location.path = string(url.substr(pathPos));
        if (location.path.front() == '?')
            location.path.insert(location.path.begin(), '/');
    }

    // Drop user info
    if (auto atPos = authority.rfind('@'); atPos != string_view::npos)
        authority = authority.substr(atPos + 1);

    string_view portView;
    if (authority.starts_with('[')) {
        auto closePos = authority.find(']');
        if (closePos == string_view::npos)
            throw runtime_error("Invalid location: Unterminated ipv6 address!");
        location.host = string(authority.substr(1, closePos - 1));
        auto rest = authority.substr(closePos + 1);
        if (!rest.empty()) {
            if (rest.front() != ':')
                throw runtime_error("Invalid location: Garbage after ipv6 address!");
            portView = rest.substr(1);
        }
    } else if (auto colonPos = authority.find(':'); colonPos != string_view::npos) {
        location.host = string(authority.substr(0, colonPos));
        portView = authority.substr(colonPos + 1);
    } else {
        location.host = string(authority);
    }

    if (location.host.empty())
        throw runtime_error("Invalid location: Missing host!");

    location.port = getDefaultPort(location.scheme);
    if (!portView.empty()) {
        uint32_t port = 0;
        auto result = from_chars(portView.data(), portView.data() + portView.size(), port);
        if (result.ec != errc() || result.ptr != portView.data() + portView.size() || !port || port > 65535)
            throw runtime_error("Invalid location: Port needs to be in [1, 65535]!");
        location.port = port;
    }
    return location;
}
//---------------------------------------------------------------------------
string Location::hostHeader() const
// The value of the host header
{
    string header = host.find(':') != string::npos ? "[" + host + "]" : host;
    if (port != getDefaultPort(scheme))
        header += ":" + to_string(port);
    return header;
}
//---------------------------------------------------------------------------
string Location::toString() const
// The full url
{
    string url = getScheme(scheme);
    url += "://";
    url += hostHeader();
    url += path;
    return url;
}
//---------------------------------------------------------------------------
Location Location::resolve(string_view reference) const
// Resolve a redirect target
{
    reference = utils::trim(reference);
    if (reference.empty())
        throw runtime_error("Invalid location: Empty redirect target!");

    // Absolute url
    if (reference.find("://") != string_view::npos)
        return parse(reference);

    // Scheme relative
    if (reference.starts_with("//"))
        return parse(string(getScheme(scheme)) + ":" + string(reference));

    Location target = *this;
    if (auto hashPos = reference.find('#'); hashPos != string_view::npos)
        reference = reference.substr(0, hashPos);
    if (reference.starts_with('/')) {
        target.path = string(reference);
    } else if (reference.starts_with('?')) {
        target.path = path.substr(0, path.find('?')) + string(reference);
    } else {
        // Relative to the directory of the current path
        auto directory = path.substr(0, path.find('?'));
        directory = directory.substr(0, directory.rfind('/') + 1);
        target.path = directory + string(reference);
    }
    return target;
}
//---------------------------------------------------------------------------
} // namespace playcache::network
