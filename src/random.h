// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RANDOM_H
#define RUMBLE_RANDOM_H

#include "uint256.h"

#include <stdint.h>

/**
 * Fill buf with num cryptographically strong random bytes (OpenSSL RAND).
 * Throws std::runtime_error if the generator cannot be used.
 */
void GetStrongRandBytes(unsigned char* buf, int num);

/** Fresh random 256-bit value, used for new round ids and operator seeds */
uint256 GetRandHash();

#endif // RUMBLE_RANDOM_H
