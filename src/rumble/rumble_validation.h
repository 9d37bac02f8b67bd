// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_VALIDATION_H
#define RUMBLE_RUMBLE_VALIDATION_H

#include "amount.h"
#include "rumble/rumble_activity.h"
#include "rumble/rumble_errors.h"
#include "rumble/rumble_events.h"
#include "rumble/rumble_round.h"
#include "uint256.h"

#include <boost/optional.hpp>

#include <memory>
#include <stdint.h>
#include <string>
#include <vector>

class CRumbleRoundDB;
class CValueTransfer;

/**
 * Round processing
 *
 * Every entry point takes cs_rumble, loads the round snapshot from the
 * round database, runs one state machine operation on it, writes it back
 * and dispatches the resulting events to the installed notifier.
 * On failure nothing is written and state carries the error.
 */

/**
 * Initialize the round database (and a default balance ledger transfer
 * when none is installed).
 */
bool InitRumbleRoundDB(size_t nCacheSize, bool fMemory = false, bool fWipe = false);

/** Get round database (nullptr if not initialized) */
CRumbleRoundDB* GetRumbleRoundDB();

void ShutdownRumbleRoundDB();

/** Install the value transfer collaborator used by settlement */
void SetRumbleTransfer(std::shared_ptr<CValueTransfer> transfer);
std::shared_ptr<CValueTransfer> GetRumbleTransfer();

/** Install the notification sink (nullptr disables dispatch) */
void SetRumbleNotifier(std::shared_ptr<CRumbleNotifier> notifier);

/** Create a round with a fresh random id and open it */
bool ProcessCreateRound(const uint256& seed_commitment,
                        uint32_t nWindowSeconds,
                        RumbleRound& roundOut,
                        CRumbleValidationState& state,
                        RumbleEvents& events);

/** Open a round by id; an unknown id starts as a fresh IDLE round */
bool ProcessInitializeRound(const uint256& round_id,
                            const uint256& seed_commitment,
                            uint32_t nWindowSeconds,
                            RumbleRound& roundOut,
                            CRumbleValidationState& state,
                            RumbleEvents& events);

bool ProcessDeposit(const uint256& round_id,
                    const std::string& participant,
                    CAmount amount,
                    const boost::optional<CAmount>& holdings,
                    RumbleRound& roundOut,
                    CRumbleValidationState& state,
                    RumbleEvents& events);

bool ProcessApplyActivityScores(const uint256& round_id,
                                const ActivityScoreMap& scores,
                                RumbleRound& roundOut,
                                CRumbleValidationState& state,
                                RumbleEvents& events);

bool ProcessEvaluateActivity(const uint256& round_id,
                             const ActivityScoreFn& source,
                             RumbleRound& roundOut,
                             CRumbleValidationState& state,
                             RumbleEvents& events);

/**
 * Settle a stored round.
 *
 * The transfers are staged, the SETTLED snapshot is written, and only then
 * is the transfer committed. A failed commit writes the previous snapshot
 * back and reports WINNER_TRANSFER_FAILED, so a retry never pays twice.
 */
bool ProcessSettleRound(const uint256& round_id,
                        const uint256& seed,
                        RumbleRound& roundOut,
                        CRumbleValidationState& state,
                        RumbleEvents& events);

bool ProcessResetRound(const uint256& round_id,
                       RumbleRound& roundOut,
                       CRumbleValidationState& state,
                       RumbleEvents& events);

/** Load a round snapshot (ROUND_NOT_FOUND / STORAGE_FAILURE) */
bool GetRumbleRound(const uint256& round_id, RumbleRound& round, CRumbleValidationState& state);

bool ListRumbleRounds(std::vector<RumbleRound>& rounds, CRumbleValidationState& state);

#endif // RUMBLE_RUMBLE_VALIDATION_H
