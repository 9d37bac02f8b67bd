// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random.h"

#include <openssl/rand.h>

#include <stdexcept>

void GetStrongRandBytes(unsigned char* buf, int num)
{
    if (RAND_bytes(buf, num) != 1) {
        throw std::runtime_error("GetStrongRandBytes: OpenSSL RAND_bytes failed");
    }
}

uint256 GetRandHash()
{
    uint256 hash;
    GetStrongRandBytes(hash.begin(), hash.size());
    return hash;
}
