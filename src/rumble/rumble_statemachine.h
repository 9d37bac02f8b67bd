// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_STATEMACHINE_H
#define RUMBLE_RUMBLE_STATEMACHINE_H

#include "amount.h"
#include "rumble/rumble_activity.h"
#include "rumble/rumble_errors.h"
#include "rumble/rumble_events.h"
#include "rumble/rumble_round.h"
#include "uint256.h"

#include <boost/optional.hpp>

#include <stdint.h>
#include <string>

class CRumbleParams;
class CValueTransfer;

/**
 * Round state machine
 *
 *   IDLE --initialize--> OPEN --deposit--> OPEN
 *   OPEN|EVALUATING --apply activity--> EVALUATING
 *   OPEN|EVALUATING --settle--> SETTLED --reset--> IDLE
 *
 * These are the only functions that change RumbleRound::phase. Each one
 * either succeeds and appends its events, or returns false with state set
 * and the round exactly as it was.
 */

/**
 * InitializeRound - Open a new deposit window
 *
 * Requires IDLE (else ROUND_ALREADY_OPEN) and a non-null seed commitment
 * (else INVALID_SEED_REVEAL). close_time = nTime + nWindowSeconds.
 */
bool InitializeRound(RumbleRound& round,
                     const uint256& seed_commitment,
                     uint32_t nWindowSeconds,
                     int64_t nTime,
                     CRumbleValidationState& state,
                     RumbleEvents& events);

/** Deposit into an OPEN round, see rumble_registry::RecordDeposit */
bool DepositToRound(RumbleRound& round,
                    const std::string& participant,
                    CAmount amount,
                    const boost::optional<CAmount>& holdings,
                    const CRumbleParams& params,
                    int64_t nTime,
                    CRumbleValidationState& state,
                    RumbleEvents& events);

/** Overwrite activity scores and move the round to EVALUATING */
bool ApplyRoundActivityScores(RumbleRound& round,
                              const ActivityScoreMap& scores,
                              const CRumbleParams& params,
                              int64_t nTime,
                              CRumbleValidationState& state,
                              RumbleEvents& events);

/** Query the activity source for all participants, then apply the result */
bool EvaluateRoundActivity(RumbleRound& round,
                           const ActivityScoreFn& source,
                           const CRumbleParams& params,
                           int64_t nTime,
                           CRumbleValidationState& state,
                           RumbleEvents& events);

/**
 * StageSettlement - Score, rank and stage the payout of the round
 *
 * RULES:
 * 1. IDLE -> ROUND_NOT_OPEN, SETTLED -> ROUND_ALREADY_SETTLED
 * 2. total_pool == 0 -> NO_DEPOSITS
 * 3. Hash(seed) must equal seed_commitment -> INVALID_SEED_REVEAL
 * 4. top ceil(10%) by composite score each get floor(payout_pool / count)
 * 5. transfers: one PayWinner per winner, one Burn of burn_amount + dust;
 *    any failure -> WINNER_TRANSFER_FAILED
 *
 * On success round holds the settled snapshot and the transfer is staged
 * but NOT committed: the caller either commits it or aborts it. On failure
 * round is untouched and nothing is left staged.
 */
bool StageSettlement(RumbleRound& round,
                     const uint256& seed,
                     CValueTransfer& transfer,
                     const CRumbleParams& params,
                     int64_t nTime,
                     CRumbleValidationState& state,
                     RumbleEvents& events);

/**
 * SettleRound - StageSettlement followed by Commit
 *
 * The round is replaced only after the transfers committed. Used where
 * the round is not persisted; ProcessSettleRound stores the settled round
 * before committing.
 */
bool SettleRound(RumbleRound& round,
                 const uint256& seed,
                 CValueTransfer& transfer,
                 const CRumbleParams& params,
                 int64_t nTime,
                 CRumbleValidationState& state,
                 RumbleEvents& events);

/** Write the settlement summary of a SETTLED round to the debug log */
void LogSettlement(const RumbleRound& round);

/** Clear a SETTLED round back to IDLE (else ROUND_NOT_SETTLED) */
bool ResetRound(RumbleRound& round,
                int64_t nTime,
                CRumbleValidationState& state,
                RumbleEvents& events);

#endif // RUMBLE_RUMBLE_STATEMACHINE_H
