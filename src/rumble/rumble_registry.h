// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_REGISTRY_H
#define RUMBLE_RUMBLE_REGISTRY_H

#include "amount.h"
#include "rumble/rumble_activity.h"
#include "rumble/rumble_errors.h"
#include "rumble/rumble_events.h"
#include "rumble/rumble_round.h"

#include <boost/optional.hpp>

#include <stdint.h>
#include <string>

class CRumbleParams;

/**
 * Participant registry
 *
 * Record-level mutations of a round. These functions never change the round
 * phase; they are reached through the state machine only.
 */
namespace rumble_registry {

/**
 * RecordDeposit - Add a deposit to the round ledger
 *
 * RULES:
 * 1. amount > 0 and id non-empty, else INVALID_DEPOSIT
 * 2. round must be OPEN, else ROUND_NOT_OPEN
 * 3. a new id gets join_time = nTime; the round may hold at most
 *    params.MaxParticipants() ids
 * 4. deposit and total_pool are increased with checked additions; on
 *    overflow neither changes
 *
 * @param holdings  balance for the holdings sub-score; when not given the
 *                  accumulated deposit is used
 */
bool RecordDeposit(RumbleRound& round,
                   const std::string& id,
                   CAmount amount,
                   const boost::optional<CAmount>& holdings,
                   const CRumbleParams& params,
                   int64_t nTime,
                   CRumbleValidationState& state,
                   RumbleEvents& events);

/**
 * ApplyActivityScores - Overwrite activity scores of known participants
 *
 * Unknown ids are ignored. Scores above params.MaxActivityScore() are
 * clamped; filtered evaluations store 0 and set activity_filtered.
 * Requires phase OPEN or EVALUATING, else ROUND_NOT_OPEN.
 */
bool ApplyActivityScores(RumbleRound& round,
                         const ActivityScoreMap& scores,
                         const CRumbleParams& params,
                         int64_t nTime,
                         CRumbleValidationState& state,
                         RumbleEvents& events);

} // namespace rumble_registry

#endif // RUMBLE_RUMBLE_REGISTRY_H
