// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "uint256.h"

#include "util/string.h"

#include <algorithm>
#include <cctype>

uint256::uint256(const std::vector<unsigned char>& vch)
{
    memset(data, 0, sizeof(data));
    if (vch.size() == sizeof(data)) {
        memcpy(data, vch.data(), sizeof(data));
    }
}

std::string uint256::GetHex() const
{
    uint8_t reversed[WIDTH];
    for (int i = 0; i < WIDTH; ++i) {
        reversed[i] = data[WIDTH - 1 - i];
    }
    return HexStr(reversed, reversed + WIDTH);
}

void uint256::SetHex(const std::string& str)
{
    memset(data, 0, sizeof(data));

    // skip leading spaces and optional 0x
    size_t pos = 0;
    while (pos < str.size() && isspace((unsigned char)str[pos]))
        pos++;
    if (str.size() - pos >= 2 && str[pos] == '0' && tolower((unsigned char)str[pos + 1]) == 'x')
        pos += 2;

    // hex digits, least significant byte last
    size_t digits = 0;
    while (pos + digits < str.size() && isxdigit((unsigned char)str[pos + digits]))
        digits++;

    std::string hex = str.substr(pos, digits);
    if (hex.size() % 2 != 0)
        hex = "0" + hex;
    std::vector<unsigned char> vch = ParseHex(hex);

    // vch is big-endian; data is stored little-endian
    size_t n = std::min<size_t>(vch.size(), WIDTH);
    for (size_t i = 0; i < n; ++i) {
        data[i] = vch[vch.size() - 1 - i];
    }
}

std::string uint256::ToString() const
{
    return GetHex();
}
