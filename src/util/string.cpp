// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/string.h"

#include "amount.h"

#include <cctype>

std::string FormatMoney(uint64_t n)
{
    uint64_t quotient = n / COIN;
    uint64_t remainder = n % COIN;
    std::string str = strprintf("%d.%08d", quotient, remainder);

    // Right-trim excess zeros before the decimal point
    int nTrim = 0;
    for (int i = str.size() - 1; (str[i] == '0' && std::isdigit(str[i - 2])); --i)
        ++nTrim;
    if (nTrim)
        str.erase(str.size() - nTrim, nTrim);

    return str;
}

std::string HexStr(const unsigned char* pbegin, const unsigned char* pend)
{
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string rv;
    rv.reserve((pend - pbegin) * 2);
    for (const unsigned char* it = pbegin; it < pend; ++it) {
        rv.push_back(hexmap[*it >> 4]);
        rv.push_back(hexmap[*it & 15]);
    }
    return rv;
}

static signed char HexDigit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool IsHex(const std::string& str)
{
    for (char c : str) {
        if (HexDigit(c) < 0)
            return false;
    }
    return (str.size() > 0) && (str.size() % 2 == 0);
}

std::vector<unsigned char> ParseHex(const std::string& str)
{
    std::vector<unsigned char> vch;
    size_t i = 0;
    while (i + 1 < str.size()) {
        signed char hi = HexDigit(str[i]);
        signed char lo = HexDigit(str[i + 1]);
        if (hi < 0 || lo < 0)
            break;
        vch.push_back((unsigned char)((hi << 4) | lo));
        i += 2;
    }
    return vch;
}
