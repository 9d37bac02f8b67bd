// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_SCORING_H
#define RUMBLE_RUMBLE_SCORING_H

#include "amount.h"
#include "rumble/rumble_round.h"
#include "uint256.h"

#include <functional>
#include <map>
#include <stdint.h>
#include <string>

/**
 * Composite scoring (policy version 1)
 *
 * All sub-scores are fixed-point in [0, SCORE_SCALE]:
 *
 *   composite = (40 * holdings + 30 * activity + 20 * speed + 10 * random) / 100
 *
 * RANDOM FACTOR (commit-reveal):
 * - initialize stores seed_commitment = Hash(seed)
 * - settle reveals seed; it must hash to the commitment
 * - random(p) = U64(Hash(seed || round_id || p.id)) mod (SCORE_SCALE + 1)
 * Neither participants nor the operator can steer it after the commitment,
 * and anyone holding the revealed seed can recompute it.
 */
namespace rumble_scoring {

static const uint64_t SCORE_SCALE = 1000000;

static const uint32_t WEIGHT_HOLDINGS = 40;
static const uint32_t WEIGHT_ACTIVITY = 30;
static const uint32_t WEIGHT_SPEED = 20;
static const uint32_t WEIGHT_RANDOM = 10;
static const uint32_t WEIGHT_TOTAL = 100;

static_assert(WEIGHT_HOLDINGS + WEIGHT_ACTIVITY + WEIGHT_SPEED + WEIGHT_RANDOM == WEIGHT_TOTAL,
              "scoring weights must sum to 100");

/** Per-participant random factor in [0, SCORE_SCALE] */
typedef std::function<uint64_t(const std::string&)> RandomFactorFn;

struct ScoreBreakdown
{
    uint64_t holdings;
    uint64_t activity;
    uint64_t speed;
    uint64_t random;
    uint64_t composite;

    ScoreBreakdown() : holdings(0), activity(0), speed(0), random(0), composite(0) {}
};

/** holdings * SCALE / nMaxHoldings, 0 when nMaxHoldings is 0 */
uint64_t HoldingsScore(CAmount holdings, CAmount nMaxHoldings);

/** activity_score * SCALE / nMaxScore, 0 when filtered */
uint64_t ActivityScore(const ParticipantRecord& record, uint32_t nMaxScore);

/**
 * SpeedScore - Earlier joins score higher
 *
 * SCALE * (close - join) / (close - open), clamped to [0, SCALE].
 * A degenerate window (close <= open) gives SCALE to everyone.
 */
uint64_t SpeedScore(int64_t nJoinTime, int64_t nOpenTime, int64_t nCloseTime);

/** Weighted combination of the four sub-scores */
uint64_t CombineScores(uint64_t holdings, uint64_t activity, uint64_t speed, uint64_t random);

/** Seed commitment stored by initialize: Hash(seed) */
uint256 ComputeSeedCommitment(const uint256& seed);

bool VerifySeedReveal(const uint256& seed_commitment, const uint256& seed);

/** U64(Hash(seed || round_id || participant_id)) mod (SCALE + 1) */
uint64_t RandomFactor(const uint256& seed, const uint256& round_id, const std::string& participant_id);

/** Random factor source derived from a revealed seed */
RandomFactorFn MakeSeededRandomFactor(const uint256& seed, const uint256& round_id);

/**
 * ComputeCompositeScores - Score every participant of the round
 *
 * Holdings are normalized to the largest holdings of the current
 * participant set. The result is a pure function of the round and fnRandom.
 */
std::map<std::string, ScoreBreakdown> ComputeCompositeScores(const RumbleRound& round,
                                                             uint32_t nMaxScore,
                                                             const RandomFactorFn& fnRandom);

} // namespace rumble_scoring

#endif // RUMBLE_RUMBLE_SCORING_H
