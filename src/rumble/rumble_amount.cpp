// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_amount.h"

#include "logging.h"

#include <boost/multiprecision/cpp_int.hpp>
#include <limits>

using namespace boost::multiprecision;

namespace rumble_amount {

bool CheckedAdd(CAmount a, CAmount b, CAmount& nResult, CRumbleValidationState& state)
{
    if (a > MAX_MONEY - b) {
        LogPrint(BCLog::RUMBLE, "%s: overflow a=%u b=%u\n", __func__, a, b);
        return state.Invalid(RumbleError::ARITHMETIC_OVERFLOW, "rumble-arithmetic-overflow",
                             strprintf("%u + %u exceeds amount range", a, b));
    }
    nResult = a + b;
    return true;
}

bool CheckedSub(CAmount a, CAmount b, CAmount& nResult, CRumbleValidationState& state)
{
    if (b > a) {
        LogPrint(BCLog::RUMBLE, "%s: underflow a=%u b=%u\n", __func__, a, b);
        return state.Invalid(RumbleError::ARITHMETIC_OVERFLOW, "rumble-arithmetic-overflow",
                             strprintf("%u - %u is negative", a, b));
    }
    nResult = a - b;
    return true;
}

bool CheckedMulDiv(CAmount a, uint64_t b, uint64_t d, CAmount& nResult, CRumbleValidationState& state)
{
    if (d == 0) {
        return state.Invalid(RumbleError::DIVISION_BY_ZERO, "rumble-division-by-zero",
                             strprintf("%u * %u / 0", a, b));
    }

    // 128-bit product cannot overflow for 64-bit operands
    int128_t product = static_cast<int128_t>(a) * static_cast<int128_t>(b);
    int128_t quotient = product / static_cast<int128_t>(d);

    if (quotient > static_cast<int128_t>(MAX_MONEY)) {
        LogPrintf("ERROR: %s: overflow a=%u b=%u d=%u result=%s\n", __func__, a, b, d, quotient.str());
        return state.Invalid(RumbleError::ARITHMETIC_OVERFLOW, "rumble-arithmetic-overflow",
                             strprintf("%u * %u / %u exceeds amount range", a, b, d));
    }

    nResult = static_cast<CAmount>(quotient);
    return true;
}

bool CheckedDiv(CAmount a, uint64_t d, CAmount& nResult, CRumbleValidationState& state)
{
    if (d == 0) {
        return state.Invalid(RumbleError::DIVISION_BY_ZERO, "rumble-division-by-zero",
                             strprintf("%u / 0", a));
    }
    nResult = a / d;
    return true;
}

bool PercentOf(CAmount amount, uint32_t nPercent, CAmount& nResult, CRumbleValidationState& state)
{
    return CheckedMulDiv(amount, nPercent, 100, nResult, state);
}

} // namespace rumble_amount
