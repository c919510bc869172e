#include "utils/utils.hpp"
#include <cctype>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/sha.h>
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
namespace playcache {
namespace utils {
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char hex[] = "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] >> 4])) : hex[input[i] >> 4]);
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] & 15])) : hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
string sha256Encode(const uint8_t* data, uint64_t length)
// Encodes the data as sha256 hex string
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    auto mdctx = unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestUpdate(mdctx.get(), data, length) <= 0)
        throw runtime_error("OpenSSL Error!");

    unsigned digestLength = SHA256_DIGEST_LENGTH;
    if (EVP_DigestFinal_ex(mdctx.get(), hash, &digestLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    return hexEncode(hash, digestLength);
}
//---------------------------------------------------------------------------
bool equalsIgnoreCase(string_view lhs, string_view rhs)
// Compare two strings ignoring ASCII case
{
    if (lhs.size() != rhs.size())
        return false;
    for (auto i = 0ull; i < lhs.size(); i++)
        if (tolower(static_cast<unsigned char>(lhs[i])) != tolower(static_cast<unsigned char>(rhs[i])))
            return false;
    return true;
}
//---------------------------------------------------------------------------
string toLower(string_view input)
// Lower case copy
{
    string output(input);
    for (auto& c : output)
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    return output;
}
//---------------------------------------------------------------------------
string_view trim(string_view input)
// Remove surrounding whitespaces
{
    static constexpr string_view whitespaces = " \t\r\n";
    auto begin = input.find_first_not_of(whitespaces);
    if (begin == string_view::npos)
        return {};
    auto end = input.find_last_not_of(whitespaces);
    return input.substr(begin, end - begin + 1);
}
//---------------------------------------------------------------------------
} // namespace utils
} // namespace playcache
