// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_scoring.h"

#include "hash.h"
#include "logging.h"

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>

using namespace boost::multiprecision;

namespace rumble_scoring {

uint64_t HoldingsScore(CAmount holdings, CAmount nMaxHoldings)
{
    if (nMaxHoldings == 0) {
        return 0;
    }
    holdings = std::min(holdings, nMaxHoldings);

    // holdings * SCALE does not fit 64 bits for large balances
    int128_t score = static_cast<int128_t>(holdings) * SCORE_SCALE / nMaxHoldings;
    return static_cast<uint64_t>(score);
}

uint64_t ActivityScore(const ParticipantRecord& record, uint32_t nMaxScore)
{
    if (record.activity_filtered || nMaxScore == 0) {
        return 0;
    }
    uint64_t score = std::min(record.activity_score, nMaxScore);
    return score * SCORE_SCALE / nMaxScore;
}

uint64_t SpeedScore(int64_t nJoinTime, int64_t nOpenTime, int64_t nCloseTime)
{
    if (nCloseTime <= nOpenTime) {
        return SCORE_SCALE;
    }
    if (nJoinTime <= nOpenTime) {
        return SCORE_SCALE;
    }
    if (nJoinTime >= nCloseTime) {
        return 0;
    }

    int128_t remaining = static_cast<int128_t>(nCloseTime) - nJoinTime;
    int128_t window = static_cast<int128_t>(nCloseTime) - nOpenTime;
    return static_cast<uint64_t>(remaining * SCORE_SCALE / window);
}

uint64_t CombineScores(uint64_t holdings, uint64_t activity, uint64_t speed, uint64_t random)
{
    // Each term is at most 100 * SCALE, well inside 64 bits
    uint64_t weighted = WEIGHT_HOLDINGS * holdings +
                        WEIGHT_ACTIVITY * activity +
                        WEIGHT_SPEED * speed +
                        WEIGHT_RANDOM * random;
    return weighted / WEIGHT_TOTAL;
}

uint256 ComputeSeedCommitment(const uint256& seed)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << seed;
    return ss.GetHash();
}

bool VerifySeedReveal(const uint256& seed_commitment, const uint256& seed)
{
    return !seed_commitment.IsNull() && ComputeSeedCommitment(seed) == seed_commitment;
}

uint64_t RandomFactor(const uint256& seed, const uint256& round_id, const std::string& participant_id)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << seed;
    ss << round_id;
    ss << participant_id;
    return ss.GetHash().GetUint64(0) % (SCORE_SCALE + 1);
}

RandomFactorFn MakeSeededRandomFactor(const uint256& seed, const uint256& round_id)
{
    return [seed, round_id](const std::string& participant_id) {
        return RandomFactor(seed, round_id, participant_id);
    };
}

std::map<std::string, ScoreBreakdown> ComputeCompositeScores(const RumbleRound& round,
                                                             uint32_t nMaxScore,
                                                             const RandomFactorFn& fnRandom)
{
    CAmount nMaxHoldings = 0;
    for (const auto& entry : round.participants) {
        nMaxHoldings = std::max(nMaxHoldings, entry.second.holdings);
    }

    std::map<std::string, ScoreBreakdown> scores;
    for (const auto& entry : round.participants) {
        const ParticipantRecord& record = entry.second;

        ScoreBreakdown b;
        b.holdings = HoldingsScore(record.holdings, nMaxHoldings);
        b.activity = ActivityScore(record, nMaxScore);
        b.speed = SpeedScore(record.join_time, round.open_time, round.close_time);
        b.random = std::min(fnRandom(record.id), SCORE_SCALE);
        b.composite = CombineScores(b.holdings, b.activity, b.speed, b.random);

        LogPrint(BCLog::RUMBLE, "ComputeCompositeScores: %s holdings=%u activity=%u speed=%u random=%u composite=%u\n",
                 record.id, b.holdings, b.activity, b.speed, b.random, b.composite);

        scores.emplace(entry.first, b);
    }

    return scores;
}

} // namespace rumble_scoring
