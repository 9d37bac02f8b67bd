// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_ROUND_H
#define RUMBLE_RUMBLE_ROUND_H

#include "amount.h"
#include "serialize.h"
#include "uint256.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

/** Lifecycle phase of a round. Only the state machine changes it. */
enum class RoundPhase : uint8_t
{
    IDLE = 0,
    OPEN = 1,
    EVALUATING = 2,
    SETTLED = 3,
};

std::string RoundPhaseToString(RoundPhase phase);

/**
 * ParticipantRecord - One identity's stake in a round
 *
 * join_time is set by the first deposit and never changes afterwards.
 * holdings is tracked separately from deposit: it is the balance used by the
 * holdings sub-score and defaults to the accumulated deposit.
 */
struct ParticipantRecord
{
    std::string id;
    CAmount deposit;
    uint32_t activity_score;   // [0, MaxActivityScore]
    int64_t join_time;
    CAmount holdings;
    bool activity_filtered;    // latest evaluation was rejected by the anomaly filter
    int64_t last_evaluated;    // 0 until the first activity evaluation

    ParticipantRecord()
    {
        SetNull();
    }

    void SetNull()
    {
        id.clear();
        deposit = 0;
        activity_score = 0;
        join_time = 0;
        holdings = 0;
        activity_filtered = false;
        last_evaluated = 0;
    }

    SERIALIZE_METHODS(ParticipantRecord, obj)
    {
        READWRITE(obj.id);
        READWRITE(obj.deposit);
        READWRITE(obj.activity_score);
        READWRITE(obj.join_time);
        READWRITE(obj.holdings);
        READWRITE(obj.activity_filtered);
        READWRITE(obj.last_evaluated);
    }
};

/** Paid participant of a settled round. Immutable once created. */
struct WinnerRecord
{
    std::string participant_id;
    CAmount payout_amount;
    uint64_t composite_score;
    uint32_t rank;             // 1-based

    WinnerRecord() : payout_amount(0), composite_score(0), rank(0) {}

    SERIALIZE_METHODS(WinnerRecord, obj)
    {
        READWRITE(obj.participant_id);
        READWRITE(obj.payout_amount);
        READWRITE(obj.composite_score);
        READWRITE(obj.rank);
    }
};

/**
 * SettlementSummary - Audit record of the last settlement
 *
 * pool_at_settlement == payout_pool + burn_amount
 * payout_pool == payout_per_winner * winner_count + payout_dust
 * residual is already included in burn_amount.
 */
struct SettlementSummary
{
    CAmount pool_at_settlement;
    CAmount payout_pool;
    CAmount burn_amount;
    CAmount residual;
    CAmount payout_per_winner;
    CAmount payout_dust;
    uint32_t winner_count;
    int64_t settle_time;

    SettlementSummary()
    {
        SetNull();
    }

    void SetNull()
    {
        pool_at_settlement = 0;
        payout_pool = 0;
        burn_amount = 0;
        residual = 0;
        payout_per_winner = 0;
        payout_dust = 0;
        winner_count = 0;
        settle_time = 0;
    }

    bool IsNull() const { return settle_time == 0 && winner_count == 0; }

    SERIALIZE_METHODS(SettlementSummary, obj)
    {
        READWRITE(obj.pool_at_settlement);
        READWRITE(obj.payout_pool);
        READWRITE(obj.burn_amount);
        READWRITE(obj.residual);
        READWRITE(obj.payout_per_winner);
        READWRITE(obj.payout_dust);
        READWRITE(obj.winner_count);
        READWRITE(obj.settle_time);
    }
};

/**
 * RumbleRound - Complete snapshot of one competition round
 *
 * The round exclusively owns its participant and winner records. It is
 * loaded whole, mutated by one state machine operation and saved whole.
 *
 * INVARIANTS:
 * - total_pool == sum(participants[i].deposit) while OPEN or EVALUATING
 * - once SETTLED, total_pool == 0 and the settlement summary accounts for
 *   the whole former pool
 * - winners is non-empty only while phase == SETTLED
 * - phase == IDLE implies no participants and an empty pool
 * - participants keys equal the record ids
 */
struct RumbleRound
{
    uint256 round_id;
    RoundPhase phase;
    CAmount total_pool;
    std::map<std::string, ParticipantRecord> participants;
    std::vector<WinnerRecord> winners;

    // Deposit window
    int64_t open_time;
    int64_t close_time;

    // Commit-reveal of the settlement seed
    uint256 seed_commitment;
    uint256 seed_reveal;

    // Last settlement, kept through reset for audit
    SettlementSummary settlement;

    uint32_t round_number;     // number of initialize calls on this id

    RumbleRound()
    {
        SetNull();
    }

    explicit RumbleRound(const uint256& id)
    {
        SetNull();
        round_id = id;
    }

    void SetNull()
    {
        round_id.SetNull();
        phase = RoundPhase::IDLE;
        total_pool = 0;
        participants.clear();
        winners.clear();
        open_time = 0;
        close_time = 0;
        seed_commitment.SetNull();
        seed_reveal.SetNull();
        settlement.SetNull();
        round_number = 0;
    }

    bool IsNull() const
    {
        return round_id.IsNull();
    }

    /**
     * CheckInvariants - Verify the round ledger invariants
     *
     * Violations are logged with the offending values.
     *
     * @return true if all invariants hold, false otherwise
     */
    bool CheckInvariants() const;

    /**
     * GetHash - Deterministic hash of the whole snapshot
     *
     * All fields are serialized in canonical order; participants iterate by
     * ascending identity.
     */
    uint256 GetHash() const;

    std::string ToString() const;

    SERIALIZE_METHODS(RumbleRound, obj)
    {
        READWRITE(obj.round_id);
        READWRITE(obj.phase);
        READWRITE(obj.total_pool);
        READWRITE(obj.participants);
        READWRITE(obj.winners);
        READWRITE(obj.open_time);
        READWRITE(obj.close_time);
        READWRITE(obj.seed_commitment);
        READWRITE(obj.seed_reveal);
        READWRITE(obj.settlement);
        READWRITE(obj.round_number);
    }
};

#endif // RUMBLE_RUMBLE_ROUND_H
