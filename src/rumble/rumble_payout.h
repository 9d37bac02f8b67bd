// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_PAYOUT_H
#define RUMBLE_RUMBLE_PAYOUT_H

#include "amount.h"
#include "rumble/rumble_errors.h"
#include "rumble/rumble_round.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

/**
 * Ranking and payout splitting
 *
 * SPLIT:
 *   payout_pool = floor(pool * 90 / 100)
 *   burn_amount = floor(pool * 10 / 100) + residual
 *   residual    = pool - floor(pool * 90 / 100) - floor(pool * 10 / 100)
 *   per_winner  = floor(payout_pool / winner_count)
 *   payout_dust = payout_pool - per_winner * winner_count
 *
 * payout_dust never reaches a winner; it leaves with the burn transfer.
 */
namespace rumble_payout {

static const uint32_t PAYOUT_PERCENT = 90;
static const uint32_t BURN_PERCENT = 10;
static const uint32_t WINNER_RATIO_PERCENT = 10;

struct RankedParticipant
{
    std::string id;
    uint64_t composite_score;
};

/**
 * RankParticipants - Total order over participants
 *
 * Descending composite score, ties broken by ascending identity.
 */
std::vector<RankedParticipant> RankParticipants(const std::map<std::string, uint64_t>& scores);

/** ceil(n * 10 / 100), at least 1 when n > 0, 0 when n == 0 */
uint32_t GetWinnerCount(size_t nParticipants);

/**
 * ComputePayoutSplit - Split a pool between winners and burn
 *
 * Fills every amount field of summary (not settle_time).
 * Fails with DIVISION_BY_ZERO when nWinners is 0.
 */
bool ComputePayoutSplit(CAmount nPool, uint32_t nWinners, SettlementSummary& summary, CRumbleValidationState& state);

/** First summary.winner_count entries of ranked, each paid payout_per_winner */
std::vector<WinnerRecord> BuildWinnerRecords(const std::vector<RankedParticipant>& ranked, const SettlementSummary& summary);

} // namespace rumble_payout

#endif // RUMBLE_RUMBLE_PAYOUT_H
