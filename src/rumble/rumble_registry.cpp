// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_registry.h"

#include "logging.h"
#include "rumble/rumble_amount.h"
#include "rumbleparams.h"

#include <algorithm>

namespace rumble_registry {

bool RecordDeposit(RumbleRound& round,
                   const std::string& id,
                   CAmount amount,
                   const boost::optional<CAmount>& holdings,
                   const CRumbleParams& params,
                   int64_t nTime,
                   CRumbleValidationState& state,
                   RumbleEvents& events)
{
    if (amount == 0) {
        return state.Invalid(RumbleError::INVALID_DEPOSIT, "rumble-invalid-deposit", "deposit amount must be positive");
    }
    if (id.empty()) {
        return state.Invalid(RumbleError::INVALID_DEPOSIT, "rumble-invalid-deposit", "participant id is empty");
    }
    if (round.phase != RoundPhase::OPEN) {
        return state.Invalid(RumbleError::ROUND_NOT_OPEN, "rumble-round-not-open",
                             strprintf("round is %s", RoundPhaseToString(round.phase)));
    }

    auto it = round.participants.find(id);
    const bool fNew = (it == round.participants.end());

    if (fNew && round.participants.size() >= params.MaxParticipants()) {
        return state.Invalid(RumbleError::INVALID_DEPOSIT, "rumble-round-full",
                             strprintf("round already has %u participants", round.participants.size()));
    }

    // Compute both new totals before touching anything
    CAmount nNewDeposit = 0;
    CAmount nNewPool = 0;
    if (!rumble_amount::CheckedAdd(fNew ? 0 : it->second.deposit, amount, nNewDeposit, state)) {
        return false;
    }
    if (!rumble_amount::CheckedAdd(round.total_pool, amount, nNewPool, state)) {
        return false;
    }

    if (fNew) {
        ParticipantRecord record;
        record.id = id;
        record.join_time = nTime;
        it = round.participants.emplace(id, record).first;
    }

    ParticipantRecord& record = it->second;
    record.deposit = nNewDeposit;
    record.holdings = holdings ? *holdings : nNewDeposit;
    round.total_pool = nNewPool;

    LogPrint(BCLog::RUMBLE, "RecordDeposit: round=%s participant=%s amount=%u deposit=%u pool=%s%s\n",
             round.round_id.ToString(), id, amount, record.deposit, FormatMoney(round.total_pool),
             fNew ? " (new)" : "");

    RumbleEvent event(RumbleEventType::DEPOSIT_MADE, round.round_id);
    event.participant = id;
    event.amount = amount;
    event.total_pool = round.total_pool;
    event.nTime = nTime;
    events.push_back(event);

    return true;
}

bool ApplyActivityScores(RumbleRound& round,
                         const ActivityScoreMap& scores,
                         const CRumbleParams& params,
                         int64_t nTime,
                         CRumbleValidationState& state,
                         RumbleEvents& events)
{
    if (round.phase != RoundPhase::OPEN && round.phase != RoundPhase::EVALUATING) {
        return state.Invalid(RumbleError::ROUND_NOT_OPEN, "rumble-round-not-open",
                             strprintf("cannot evaluate activity while %s", RoundPhaseToString(round.phase)));
    }

    uint32_t nUpdated = 0;
    uint32_t nFiltered = 0;
    for (const auto& entry : scores) {
        auto it = round.participants.find(entry.first);
        if (it == round.participants.end()) {
            LogPrint(BCLog::RUMBLE, "ApplyActivityScores: ignoring unknown participant %s\n", entry.first);
            continue;
        }

        ParticipantRecord& record = it->second;
        if (entry.second.fFiltered) {
            record.activity_score = 0;
            record.activity_filtered = true;
            ++nFiltered;
        } else {
            record.activity_score = std::min(entry.second.score, params.MaxActivityScore());
            record.activity_filtered = false;
        }
        record.last_evaluated = nTime;
        ++nUpdated;
    }

    LogPrint(BCLog::RUMBLE, "ApplyActivityScores: round=%s updated=%u filtered=%u ignored=%u\n",
             round.round_id.ToString(), nUpdated, nFiltered, scores.size() - nUpdated);

    RumbleEvent event(RumbleEventType::ACTIVITY_EVALUATED, round.round_id);
    event.count = nUpdated;
    event.filtered_count = nFiltered;
    event.nTime = nTime;
    events.push_back(event);

    return true;
}

} // namespace rumble_registry
