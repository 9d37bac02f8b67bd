// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_UTIL_STRING_H
#define RUMBLE_UTIL_STRING_H

#include <boost/format.hpp>

#include <string>
#include <vector>

/**
 * strprintf - printf-style formatting into a std::string
 *
 * Arguments are type-safe; length modifiers (%lld, %u) are accepted and only
 * the conversion character matters.
 */
template <typename... Args>
std::string strprintf(const std::string& fmt, const Args&... args)
{
    boost::format f(fmt);
    using expander = int[];
    (void)expander{0, ((void)(f % args), 0)...};
    return f.str();
}

std::string FormatMoney(uint64_t n);

std::string HexStr(const unsigned char* pbegin, const unsigned char* pend);

bool IsHex(const std::string& str);

std::vector<unsigned char> ParseHex(const std::string& str);

#endif // RUMBLE_UTIL_STRING_H
