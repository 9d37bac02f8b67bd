// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_statemachine.h"

#include "logging.h"
#include "rumble/rumble_payout.h"
#include "rumble/rumble_registry.h"
#include "rumble/rumble_scoring.h"
#include "rumble/rumble_transfer.h"
#include "rumbleparams.h"

#include <vector>

bool InitializeRound(RumbleRound& round,
                     const uint256& seed_commitment,
                     uint32_t nWindowSeconds,
                     int64_t nTime,
                     CRumbleValidationState& state,
                     RumbleEvents& events)
{
    if (round.phase != RoundPhase::IDLE) {
        return state.Invalid(RumbleError::ROUND_ALREADY_OPEN, "rumble-round-already-open",
                             strprintf("round is %s", RoundPhaseToString(round.phase)));
    }
    if (seed_commitment.IsNull()) {
        return state.Invalid(RumbleError::INVALID_SEED_REVEAL, "rumble-missing-seed-commitment");
    }

    round.participants.clear();
    round.winners.clear();
    round.total_pool = 0;
    round.open_time = nTime;
    round.close_time = nTime + nWindowSeconds;
    round.seed_commitment = seed_commitment;
    round.seed_reveal.SetNull();
    round.settlement.SetNull();
    round.round_number++;
    round.phase = RoundPhase::OPEN;

    LogPrint(BCLog::RUMBLE, "InitializeRound: round=%s number=%u window=[%d, %d]\n",
             round.round_id.ToString(), round.round_number, round.open_time, round.close_time);

    RumbleEvent event(RumbleEventType::ROUND_INITIALIZED, round.round_id);
    event.round_number = round.round_number;
    event.close_time = round.close_time;
    event.nTime = nTime;
    events.push_back(event);
    return true;
}

bool DepositToRound(RumbleRound& round,
                    const std::string& participant,
                    CAmount amount,
                    const boost::optional<CAmount>& holdings,
                    const CRumbleParams& params,
                    int64_t nTime,
                    CRumbleValidationState& state,
                    RumbleEvents& events)
{
    return rumble_registry::RecordDeposit(round, participant, amount, holdings, params, nTime, state, events);
}

bool ApplyRoundActivityScores(RumbleRound& round,
                              const ActivityScoreMap& scores,
                              const CRumbleParams& params,
                              int64_t nTime,
                              CRumbleValidationState& state,
                              RumbleEvents& events)
{
    if (!rumble_registry::ApplyActivityScores(round, scores, params, nTime, state, events)) {
        return false;
    }
    round.phase = RoundPhase::EVALUATING;
    return true;
}

bool EvaluateRoundActivity(RumbleRound& round,
                           const ActivityScoreFn& source,
                           const CRumbleParams& params,
                           int64_t nTime,
                           CRumbleValidationState& state,
                           RumbleEvents& events)
{
    if (round.phase != RoundPhase::OPEN && round.phase != RoundPhase::EVALUATING) {
        return state.Invalid(RumbleError::ROUND_NOT_OPEN, "rumble-round-not-open",
                             strprintf("cannot evaluate activity while %s", RoundPhaseToString(round.phase)));
    }

    std::vector<std::string> ids;
    ids.reserve(round.participants.size());
    for (const auto& entry : round.participants) {
        ids.push_back(entry.first);
    }

    return ApplyRoundActivityScores(round, source(ids), params, nTime, state, events);
}

bool StageSettlement(RumbleRound& round,
                     const uint256& seed,
                     CValueTransfer& transfer,
                     const CRumbleParams& params,
                     int64_t nTime,
                     CRumbleValidationState& state,
                     RumbleEvents& events)
{
    // 1. Phase and pool guards
    if (round.phase == RoundPhase::IDLE) {
        return state.Invalid(RumbleError::ROUND_NOT_OPEN, "rumble-round-not-open", "round is idle");
    }
    if (round.phase == RoundPhase::SETTLED) {
        return state.Invalid(RumbleError::ROUND_ALREADY_SETTLED, "rumble-round-already-settled");
    }
    if (round.total_pool == 0) {
        return state.Invalid(RumbleError::NO_DEPOSITS, "rumble-no-deposits");
    }

    // 2. Seed reveal
    if (!rumble_scoring::VerifySeedReveal(round.seed_commitment, seed)) {
        return state.Invalid(RumbleError::INVALID_SEED_REVEAL, "rumble-seed-mismatch",
                             strprintf("seed does not match commitment %s", round.seed_commitment.ToString()));
    }

    RumbleRound next = round;

    // 3. Score and rank
    const auto breakdown = rumble_scoring::ComputeCompositeScores(
        next, params.MaxActivityScore(), rumble_scoring::MakeSeededRandomFactor(seed, next.round_id));

    std::map<std::string, uint64_t> composite;
    for (const auto& entry : breakdown) {
        composite.emplace(entry.first, entry.second.composite);
    }
    const std::vector<rumble_payout::RankedParticipant> ranked = rumble_payout::RankParticipants(composite);

    // 4. Split the pool
    const uint32_t nWinners = rumble_payout::GetWinnerCount(ranked.size());
    SettlementSummary summary;
    if (!rumble_payout::ComputePayoutSplit(next.total_pool, nWinners, summary, state)) {
        return false;
    }
    summary.settle_time = nTime;

    std::vector<WinnerRecord> winners = rumble_payout::BuildWinnerRecords(ranked, summary);

    CAmount nBurnTransfer = summary.burn_amount + summary.payout_dust;

    // 5. Stage the value movement
    if (!transfer.Begin(next.round_id)) {
        return state.Invalid(RumbleError::WINNER_TRANSFER_FAILED, "rumble-transfer-failed", "transfer could not begin");
    }
    for (const WinnerRecord& winner : winners) {
        if (!transfer.PayWinner(winner.participant_id, winner.payout_amount)) {
            transfer.Abort();
            return state.Invalid(RumbleError::WINNER_TRANSFER_FAILED, "rumble-transfer-failed",
                                 strprintf("payout of %u to %s failed", winner.payout_amount, winner.participant_id));
        }
    }
    if (!transfer.Burn(nBurnTransfer)) {
        transfer.Abort();
        return state.Invalid(RumbleError::WINNER_TRANSFER_FAILED, "rumble-transfer-failed",
                             strprintf("burn of %u failed", nBurnTransfer));
    }

    // 6. Build the settled round
    next.winners = winners;
    next.settlement = summary;
    next.seed_reveal = seed;
    next.total_pool = 0;
    next.phase = RoundPhase::SETTLED;

    round = next;

    RumbleEvent event(RumbleEventType::ROUND_SETTLED, round.round_id);
    event.payout_pool = summary.payout_pool;
    event.payout_per_winner = summary.payout_per_winner;
    event.payout_dust = summary.payout_dust;
    event.burn_amount = summary.burn_amount;
    event.count = summary.winner_count;
    event.winners = round.winners;
    event.nTime = nTime;
    events.push_back(event);
    return true;
}

bool SettleRound(RumbleRound& round,
                 const uint256& seed,
                 CValueTransfer& transfer,
                 const CRumbleParams& params,
                 int64_t nTime,
                 CRumbleValidationState& state,
                 RumbleEvents& events)
{
    RumbleRound next = round;
    RumbleEvents vNewEvents;
    if (!StageSettlement(next, seed, transfer, params, nTime, state, vNewEvents)) {
        return false;
    }
    if (!transfer.Commit()) {
        transfer.Abort();
        return state.Invalid(RumbleError::WINNER_TRANSFER_FAILED, "rumble-transfer-failed", "commit failed");
    }

    round = next;
    LogSettlement(round);
    events.insert(events.end(), vNewEvents.begin(), vNewEvents.end());
    return true;
}

void LogSettlement(const RumbleRound& round)
{
    const SettlementSummary& s = round.settlement;
    LogPrintf("SettleRound: round=%s settled, pool=%s payout=%s burn=%s winners=%u\n",
              round.round_id.ToString(), FormatMoney(s.pool_at_settlement),
              FormatMoney(s.payout_pool), FormatMoney(s.burn_amount + s.payout_dust), s.winner_count);
}

bool ResetRound(RumbleRound& round,
                int64_t nTime,
                CRumbleValidationState& state,
                RumbleEvents& events)
{
    if (round.phase != RoundPhase::SETTLED) {
        return state.Invalid(RumbleError::ROUND_NOT_SETTLED, "rumble-round-not-settled",
                             strprintf("round is %s", RoundPhaseToString(round.phase)));
    }

    round.participants.clear();
    round.winners.clear();
    round.total_pool = 0;
    round.phase = RoundPhase::IDLE;

    LogPrint(BCLog::RUMBLE, "ResetRound: round=%s back to idle after round %u\n",
             round.round_id.ToString(), round.round_number);

    RumbleEvent event(RumbleEventType::ROUND_RESET, round.round_id);
    event.round_number = round.round_number;
    event.nTime = nTime;
    events.push_back(event);
    return true;
}
