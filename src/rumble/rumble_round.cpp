// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_round.h"

#include "hash.h"
#include "logging.h"

#include <algorithm>

std::string RoundPhaseToString(RoundPhase phase)
{
    switch (phase) {
    case RoundPhase::IDLE:       return "idle";
    case RoundPhase::OPEN:       return "open";
    case RoundPhase::EVALUATING: return "evaluating";
    case RoundPhase::SETTLED:    return "settled";
    }
    return "unknown";
}

bool RumbleRound::CheckInvariants() const
{
    // Pool conservation, summed without wrapping
    CAmount nSum = 0;
    for (const auto& entry : participants) {
        if (entry.first != entry.second.id) {
            LogPrintf("RUMBLE INVARIANT VIOLATION: round=%s key=%s id=%s\n",
                      round_id.ToString(), entry.first, entry.second.id);
            return false;
        }
        if (nSum > MAX_MONEY - entry.second.deposit) {
            LogPrintf("RUMBLE INVARIANT VIOLATION: round=%s deposits overflow\n", round_id.ToString());
            return false;
        }
        nSum += entry.second.deposit;
    }

    // A settled round keeps its records for audit; the pool moved out
    bool pool_ok;
    if (phase == RoundPhase::SETTLED) {
        pool_ok = total_pool == 0 && settlement.pool_at_settlement == nSum;
    } else {
        pool_ok = (nSum == total_pool);
    }

    bool winners_ok = winners.empty() || phase == RoundPhase::SETTLED;
    bool idle_ok = phase != RoundPhase::IDLE || (participants.empty() && total_pool == 0);

    bool settlement_ok = true;
    if (phase == RoundPhase::SETTLED) {
        const SettlementSummary& s = settlement;
        settlement_ok = s.winner_count == winners.size() &&
                        s.payout_pool <= s.pool_at_settlement &&
                        s.payout_pool + s.burn_amount == s.pool_at_settlement &&
                        s.payout_dust < std::max<uint32_t>(s.winner_count, 1) &&
                        s.payout_per_winner <= s.payout_pool &&
                        s.payout_per_winner * s.winner_count + s.payout_dust == s.payout_pool;
    }

    if (!pool_ok || !winners_ok || !idle_ok || !settlement_ok) {
        LogPrintf("RUMBLE INVARIANT VIOLATION: round=%s phase=%s pool=%u sum=%u participants=%u winners=%u\n",
                  round_id.ToString(), RoundPhaseToString(phase), total_pool, nSum,
                  participants.size(), winners.size());
    }

    return pool_ok && winners_ok && idle_ok && settlement_ok;
}

uint256 RumbleRound::GetHash() const
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << *this;
    return ss.GetHash();
}

std::string RumbleRound::ToString() const
{
    return strprintf("RumbleRound(id=%s, phase=%s, round=%u, pool=%s, participants=%u, winners=%u)",
                     round_id.ToString(), RoundPhaseToString(phase), round_number,
                     FormatMoney(total_pool), participants.size(), winners.size());
}
