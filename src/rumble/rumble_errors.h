// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_ERRORS_H
#define RUMBLE_RUMBLE_ERRORS_H

#include <string>

/**
 * RumbleError - Failure kinds reported by round operations
 *
 * Every rejected operation leaves the round unchanged and reports exactly one
 * of these through CRumbleValidationState.
 */
enum class RumbleError
{
    NONE = 0,
    INVALID_DEPOSIT,
    ROUND_NOT_OPEN,
    ROUND_NOT_FOUND,
    ROUND_ALREADY_SETTLED,
    ROUND_NOT_SETTLED,
    NO_DEPOSITS,
    ARITHMETIC_OVERFLOW,
    DIVISION_BY_ZERO,
    WINNER_TRANSFER_FAILED,
    ROUND_ALREADY_OPEN,
    INVALID_SEED_REVEAL,
    STORAGE_FAILURE,
};

/** Human readable name of an error kind ("InvalidDeposit", ...) */
std::string RumbleErrorToString(RumbleError err);

/** Capture information about the outcome of a round operation */
class CRumbleValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< operation rejected, round untouched
    } mode;
    RumbleError nError;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CRumbleValidationState() : mode(MODE_VALID), nError(RumbleError::NONE) {}

    bool Invalid(RumbleError err, const std::string& strRejectReasonIn, const std::string& strDebugMessageIn = "")
    {
        mode = MODE_INVALID;
        nError = err;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        return false;
    }

    bool IsValid() const { return mode == MODE_VALID; }
    bool IsInvalid() const { return mode == MODE_INVALID; }

    RumbleError GetError() const { return nError; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }

    /** "reject-reason (debug message)" for log lines and RPC errors */
    std::string ToString() const;
};

#endif // RUMBLE_RUMBLE_ERRORS_H
