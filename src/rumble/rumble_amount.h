// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_AMOUNT_H
#define RUMBLE_RUMBLE_AMOUNT_H

#include "amount.h"
#include "rumble/rumble_errors.h"

#include <stdint.h>

/**
 * Ledger arithmetic for deposits, pool totals and payout division.
 *
 * All operations work on CAmount (unsigned 64-bit base units). On failure
 * they return false, fill state with ARITHMETIC_OVERFLOW or DIVISION_BY_ZERO
 * and leave the output untouched.
 */
namespace rumble_amount {

/** nResult = a + b */
bool CheckedAdd(CAmount a, CAmount b, CAmount& nResult, CRumbleValidationState& state);

/** nResult = a - b (underflow below zero is reported as overflow) */
bool CheckedSub(CAmount a, CAmount b, CAmount& nResult, CRumbleValidationState& state);

/** nResult = floor(a * b / d) with a 128-bit intermediate product */
bool CheckedMulDiv(CAmount a, uint64_t b, uint64_t d, CAmount& nResult, CRumbleValidationState& state);

/** nResult = floor(a / d) */
bool CheckedDiv(CAmount a, uint64_t d, CAmount& nResult, CRumbleValidationState& state);

/** nResult = floor(amount * nPercent / 100) */
bool PercentOf(CAmount amount, uint32_t nPercent, CAmount& nResult, CRumbleValidationState& state);

} // namespace rumble_amount

#endif // RUMBLE_RUMBLE_AMOUNT_H
