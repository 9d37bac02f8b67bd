// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_errors.h"

std::string RumbleErrorToString(RumbleError err)
{
    switch (err) {
    case RumbleError::NONE:                   return "None";
    case RumbleError::INVALID_DEPOSIT:        return "InvalidDeposit";
    case RumbleError::ROUND_NOT_OPEN:         return "RoundNotOpen";
    case RumbleError::ROUND_NOT_FOUND:        return "RoundNotFound";
    case RumbleError::ROUND_ALREADY_SETTLED:  return "RoundAlreadySettled";
    case RumbleError::ROUND_NOT_SETTLED:      return "RoundNotSettled";
    case RumbleError::NO_DEPOSITS:            return "NoDeposits";
    case RumbleError::ARITHMETIC_OVERFLOW:    return "ArithmeticOverflow";
    case RumbleError::DIVISION_BY_ZERO:       return "DivisionByZero";
    case RumbleError::WINNER_TRANSFER_FAILED: return "WinnerTransferFailed";
    case RumbleError::ROUND_ALREADY_OPEN:     return "RoundAlreadyOpen";
    case RumbleError::INVALID_SEED_REVEAL:    return "InvalidSeedReveal";
    case RumbleError::STORAGE_FAILURE:        return "StorageFailure";
    }
    return "Unknown";
}

std::string CRumbleValidationState::ToString() const
{
    if (IsValid())
        return "valid";
    if (strDebugMessage.empty())
        return strRejectReason;
    return strRejectReason + " (" + strDebugMessage + ")";
}
