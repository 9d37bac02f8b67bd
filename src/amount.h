// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_AMOUNT_H
#define RUMBLE_AMOUNT_H

#include <stdint.h>
#include <limits>

/**
 * Amount in base units. Unsigned: there are no negative amounts in a pool,
 * and every sum goes through rumble_amount's checked operations.
 */
typedef uint64_t CAmount;

static const CAmount COIN = 100000000;

/** Upper bound of the amount domain. Checked operations fail past this. */
static const CAmount MAX_MONEY = std::numeric_limits<CAmount>::max();

#endif // RUMBLE_AMOUNT_H
