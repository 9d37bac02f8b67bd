// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_payout.h"

#include "logging.h"
#include "rumble/rumble_amount.h"

#include <algorithm>

namespace rumble_payout {

std::vector<RankedParticipant> RankParticipants(const std::map<std::string, uint64_t>& scores)
{
    std::vector<RankedParticipant> ranked;
    ranked.reserve(scores.size());
    for (const auto& entry : scores) {
        ranked.push_back({entry.first, entry.second});
    }

    std::sort(ranked.begin(), ranked.end(), [](const RankedParticipant& a, const RankedParticipant& b) {
        if (a.composite_score != b.composite_score)
            return a.composite_score > b.composite_score;
        return a.id < b.id;
    });

    return ranked;
}

uint32_t GetWinnerCount(size_t nParticipants)
{
    if (nParticipants == 0) {
        return 0;
    }
    uint64_t n = nParticipants;
    uint64_t count = (n * WINNER_RATIO_PERCENT + 99) / 100;
    return static_cast<uint32_t>(std::max<uint64_t>(count, 1));
}

bool ComputePayoutSplit(CAmount nPool, uint32_t nWinners, SettlementSummary& summary, CRumbleValidationState& state)
{
    CAmount nPayoutPool = 0;
    CAmount nBurn = 0;
    if (!rumble_amount::PercentOf(nPool, PAYOUT_PERCENT, nPayoutPool, state)) {
        return false;
    }
    if (!rumble_amount::PercentOf(nPool, BURN_PERCENT, nBurn, state)) {
        return false;
    }

    // Independent truncation may leave a few units unassigned
    CAmount nAssigned = 0;
    CAmount nResidual = 0;
    if (!rumble_amount::CheckedAdd(nPayoutPool, nBurn, nAssigned, state)) {
        return false;
    }
    if (!rumble_amount::CheckedSub(nPool, nAssigned, nResidual, state)) {
        return false;
    }

    CAmount nPerWinner = 0;
    if (!rumble_amount::CheckedDiv(nPayoutPool, nWinners, nPerWinner, state)) {
        return false;
    }

    CAmount nBurnTotal = 0;
    if (!rumble_amount::CheckedAdd(nBurn, nResidual, nBurnTotal, state)) {
        return false;
    }

    summary.pool_at_settlement = nPool;
    summary.payout_pool = nPayoutPool;
    summary.burn_amount = nBurnTotal;
    summary.residual = nResidual;
    summary.payout_per_winner = nPerWinner;
    summary.payout_dust = nPayoutPool - nPerWinner * nWinners;
    summary.winner_count = nWinners;

    LogPrint(BCLog::RUMBLE, "ComputePayoutSplit: pool=%u payout=%u burn=%u (residual=%u) winners=%u per_winner=%u dust=%u\n",
             nPool, nPayoutPool, nBurnTotal, nResidual, nWinners, nPerWinner, summary.payout_dust);

    return true;
}

std::vector<WinnerRecord> BuildWinnerRecords(const std::vector<RankedParticipant>& ranked, const SettlementSummary& summary)
{
    std::vector<WinnerRecord> winners;
    const size_t nCount = std::min<size_t>(summary.winner_count, ranked.size());
    winners.reserve(nCount);
    for (size_t i = 0; i < nCount; ++i) {
        WinnerRecord winner;
        winner.participant_id = ranked[i].id;
        winner.payout_amount = summary.payout_per_winner;
        winner.composite_score = ranked[i].composite_score;
        winner.rank = static_cast<uint32_t>(i + 1);
        winners.push_back(winner);
    }
    return winners;
}

} // namespace rumble_payout
