// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Round state machine tests
 *
 * Coverage:
 * - Full initialize/deposit/evaluate/settle/reset cycle against a ledger
 * - Phase guards for every transition
 * - Seed reveal mismatch and failing transfers leave the round untouched
 * - Value conservation across winners, dust and burn
 */

#include "test/test_rumble.h"

#include "rumble/rumble_scoring.h"
#include "rumble/rumble_statemachine.h"
#include "rumble/rumble_transfer.h"
#include "rumbleparams.h"
#include "util/string.h"

#include <boost/test/unit_test.hpp>

#include <stdexcept>

namespace {

/** Ledger that refuses one step of the transfer sequence */
class FailingTransfer : public CBalanceLedgerTransfer
{
public:
    enum class Step { PAY, BURN, COMMIT };

    explicit FailingTransfer(Step stepIn) : step(stepIn), nAborts(0) {}

    bool PayWinner(const std::string& participant, CAmount amount) override
    {
        if (step == Step::PAY) return false;
        return CBalanceLedgerTransfer::PayWinner(participant, amount);
    }
    bool Burn(CAmount amount) override
    {
        if (step == Step::BURN) return false;
        return CBalanceLedgerTransfer::Burn(amount);
    }
    bool Commit() override
    {
        if (step == Step::COMMIT) return false;
        return CBalanceLedgerTransfer::Commit();
    }
    void Abort() override
    {
        ++nAborts;
        CBalanceLedgerTransfer::Abort();
    }

    Step step;
    int nAborts;
};

RumbleRound MakeFundedRound(const uint256& seed, size_t nParticipants, CAmount nDeposit)
{
    RumbleRound round = MakeOpenRound(TestHash(1), seed, TEST_MOCK_TIME, 3600);
    CRumbleValidationState state;
    RumbleEvents events;
    for (size_t i = 0; i < nParticipants; ++i) {
        if (!DepositToRound(round, strprintf("p%02u", i), nDeposit + i, boost::none, Params(),
                            TEST_MOCK_TIME + 10 * i, state, events)) {
            throw std::runtime_error("MakeFundedRound: " + state.ToString());
        }
    }
    return round;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(rumble_statemachine_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(full_lifecycle)
{
    const uint256 seed = TestHash(100);
    RumbleRound round(TestHash(1));
    CRumbleValidationState state;
    RumbleEvents events;

    BOOST_CHECK(round.phase == RoundPhase::IDLE);
    BOOST_CHECK(InitializeRound(round, rumble_scoring::ComputeSeedCommitment(seed), 3600, TEST_MOCK_TIME, state, events));
    BOOST_CHECK(round.phase == RoundPhase::OPEN);
    BOOST_CHECK_EQUAL(round.round_number, 1U);
    BOOST_CHECK_EQUAL(round.open_time, TEST_MOCK_TIME);
    BOOST_CHECK_EQUAL(round.close_time, TEST_MOCK_TIME + 3600);
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK(events[0].type == RumbleEventType::ROUND_INITIALIZED);
    BOOST_CHECK_EQUAL(events[0].close_time, TEST_MOCK_TIME + 3600);
    BOOST_CHECK_EQUAL(events[0].nTime, TEST_MOCK_TIME);

    BOOST_CHECK(DepositToRound(round, "A", 1000, boost::none, Params(), TEST_MOCK_TIME + 1, state, events));
    BOOST_CHECK(DepositToRound(round, "B", 1000, boost::none, Params(), TEST_MOCK_TIME + 2, state, events));
    BOOST_CHECK(DepositToRound(round, "C", 1000, boost::none, Params(), TEST_MOCK_TIME + 3, state, events));
    BOOST_CHECK(DepositToRound(round, "D", 1000, boost::none, Params(), TEST_MOCK_TIME + 4, state, events));
    BOOST_CHECK_EQUAL(round.total_pool, 4000U);
    BOOST_CHECK(round.phase == RoundPhase::OPEN);

    std::map<std::string, uint32_t> scores{{"A", 150}, {"B", 200}, {"C", 100}, {"D", 180}};
    BOOST_CHECK(ApplyRoundActivityScores(round, MakeActivityScores(scores, {}), Params(), TEST_MOCK_TIME + 5, state, events));
    BOOST_CHECK(round.phase == RoundPhase::EVALUATING);
    BOOST_CHECK(round.CheckInvariants());

    CBalanceLedgerTransfer ledger;
    events.clear();
    BOOST_CHECK(SettleRound(round, seed, ledger, Params(), TEST_MOCK_TIME + 3600, state, events));
    BOOST_CHECK(state.IsValid());
    BOOST_CHECK(round.phase == RoundPhase::SETTLED);
    BOOST_CHECK_EQUAL(round.total_pool, 0U);
    BOOST_CHECK(round.seed_reveal == seed);
    BOOST_CHECK(round.CheckInvariants());

    const SettlementSummary& s = round.settlement;
    BOOST_CHECK_EQUAL(s.pool_at_settlement, 4000U);
    BOOST_CHECK_EQUAL(s.payout_pool, 3600U);
    BOOST_CHECK_EQUAL(s.burn_amount, 400U);
    BOOST_CHECK_EQUAL(s.winner_count, 1U);
    BOOST_CHECK_EQUAL(s.settle_time, TEST_MOCK_TIME + 3600);

    BOOST_REQUIRE_EQUAL(round.winners.size(), 1U);
    const WinnerRecord& winner = round.winners[0];
    BOOST_CHECK_EQUAL(winner.rank, 1U);
    BOOST_CHECK_EQUAL(winner.payout_amount, 3600U);
    BOOST_CHECK(round.participants.count(winner.participant_id));

    // Ledger matches the summary
    BOOST_CHECK_EQUAL(ledger.GetBalance(winner.participant_id), 3600U);
    BOOST_CHECK_EQUAL(ledger.GetBurned(), 400U);
    BOOST_CHECK_EQUAL(GetLedgerTotal(ledger), 4000U);

    // Participant records are kept for audit
    BOOST_CHECK_EQUAL(round.participants.size(), 4U);

    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK(events[0].type == RumbleEventType::ROUND_SETTLED);
    BOOST_CHECK_EQUAL(events[0].payout_pool, 3600U);
    BOOST_CHECK_EQUAL(events[0].payout_per_winner, 3600U);
    BOOST_CHECK_EQUAL(events[0].payout_dust, 0U);
    BOOST_CHECK_EQUAL(events[0].burn_amount, 400U);
    BOOST_CHECK_EQUAL(events[0].GetBurnedTotal(), 400U);
    BOOST_CHECK_EQUAL(events[0].amount, 0U);
    BOOST_CHECK_EQUAL(events[0].winners.size(), 1U);

    events.clear();
    BOOST_CHECK(ResetRound(round, TEST_MOCK_TIME + 4000, state, events));
    BOOST_CHECK(round.phase == RoundPhase::IDLE);
    BOOST_CHECK(round.participants.empty());
    BOOST_CHECK(round.winners.empty());
    BOOST_CHECK_EQUAL(round.total_pool, 0U);
    BOOST_CHECK_EQUAL(round.round_number, 1U);
    BOOST_CHECK_EQUAL(round.settlement.pool_at_settlement, 4000U);
    BOOST_CHECK(round.CheckInvariants());
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK(events[0].type == RumbleEventType::ROUND_RESET);
}

BOOST_AUTO_TEST_CASE(reinitialize_after_reset)
{
    const uint256 seed = TestHash(100);
    RumbleRound round = MakeFundedRound(seed, 3, 500);
    CRumbleValidationState state;
    RumbleEvents events;
    CBalanceLedgerTransfer ledger;

    BOOST_REQUIRE(SettleRound(round, seed, ledger, Params(), TEST_MOCK_TIME + 100, state, events));
    BOOST_REQUIRE(ResetRound(round, TEST_MOCK_TIME + 200, state, events));

    const uint256 seed2 = TestHash(101);
    BOOST_CHECK(InitializeRound(round, rumble_scoring::ComputeSeedCommitment(seed2), 60, TEST_MOCK_TIME + 300, state, events));
    BOOST_CHECK_EQUAL(round.round_number, 2U);
    BOOST_CHECK(round.settlement.IsNull());
    BOOST_CHECK(round.seed_reveal.IsNull());
    BOOST_CHECK(round.participants.empty());
    BOOST_CHECK_EQUAL(round.close_time, TEST_MOCK_TIME + 360);

    // The old seed no longer settles the new round
    BOOST_CHECK(DepositToRound(round, "p00", 10, boost::none, Params(), TEST_MOCK_TIME + 301, state, events));
    BOOST_CHECK(!SettleRound(round, seed, ledger, Params(), TEST_MOCK_TIME + 400, state, events));
    BOOST_CHECK(state.GetError() == RumbleError::INVALID_SEED_REVEAL);
}

BOOST_AUTO_TEST_CASE(initialize_guards)
{
    RumbleRound round(TestHash(1));
    CRumbleValidationState state;
    RumbleEvents events;

    BOOST_CHECK(!InitializeRound(round, uint256(), 60, TEST_MOCK_TIME, state, events));
    BOOST_CHECK(state.GetError() == RumbleError::INVALID_SEED_REVEAL);
    BOOST_CHECK(round.phase == RoundPhase::IDLE);
    BOOST_CHECK(events.empty());

    round = MakeOpenRound(TestHash(1), TestHash(100), TEST_MOCK_TIME, 60);
    CRumbleValidationState state2;
    BOOST_CHECK(!InitializeRound(round, TestHash(5), 60, TEST_MOCK_TIME, state2, events));
    BOOST_CHECK(state2.GetError() == RumbleError::ROUND_ALREADY_OPEN);
    BOOST_CHECK_EQUAL(round.round_number, 1U);
}

BOOST_AUTO_TEST_CASE(settle_guards)
{
    const uint256 seed = TestHash(100);
    CBalanceLedgerTransfer ledger;
    RumbleEvents events;

    {
        RumbleRound round(TestHash(1));
        CRumbleValidationState state;
        BOOST_CHECK(!SettleRound(round, seed, ledger, Params(), TEST_MOCK_TIME, state, events));
        BOOST_CHECK(state.GetError() == RumbleError::ROUND_NOT_OPEN);
    }
    {
        RumbleRound round = MakeOpenRound(TestHash(1), seed, TEST_MOCK_TIME, 60);
        CRumbleValidationState state;
        BOOST_CHECK(!SettleRound(round, seed, ledger, Params(), TEST_MOCK_TIME, state, events));
        BOOST_CHECK(state.GetError() == RumbleError::NO_DEPOSITS);
        BOOST_CHECK(round.phase == RoundPhase::OPEN);
    }
    {
        RumbleRound round = MakeFundedRound(seed, 2, 100);
        CRumbleValidationState state;
        BOOST_REQUIRE(SettleRound(round, seed, ledger, Params(), TEST_MOCK_TIME, state, events));
        const uint256 hashSettled = round.GetHash();

        BOOST_CHECK(!SettleRound(round, seed, ledger, Params(), TEST_MOCK_TIME, state, events));
        BOOST_CHECK(state.GetError() == RumbleError::ROUND_ALREADY_SETTLED);
        BOOST_CHECK(round.GetHash() == hashSettled);
    }
    BOOST_CHECK(events.size() == 1U);
}

BOOST_AUTO_TEST_CASE(settle_wrong_seed)
{
    const uint256 seed = TestHash(100);
    RumbleRound round = MakeFundedRound(seed, 5, 100);
    const uint256 hashBefore = round.GetHash();

    CBalanceLedgerTransfer ledger;
    CRumbleValidationState state;
    RumbleEvents events;
    BOOST_CHECK(!SettleRound(round, TestHash(101), ledger, Params(), TEST_MOCK_TIME, state, events));
    BOOST_CHECK(state.GetError() == RumbleError::INVALID_SEED_REVEAL);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "rumble-seed-mismatch");
    BOOST_CHECK(round.GetHash() == hashBefore);
    BOOST_CHECK(events.empty());
    BOOST_CHECK_EQUAL(GetLedgerTotal(ledger), 0U);
}

BOOST_AUTO_TEST_CASE(settle_transfer_failure)
{
    const uint256 seed = TestHash(100);

    for (FailingTransfer::Step step : {FailingTransfer::Step::PAY, FailingTransfer::Step::BURN, FailingTransfer::Step::COMMIT}) {
        RumbleRound round = MakeFundedRound(seed, 12, 100);
        const uint256 hashBefore = round.GetHash();

        FailingTransfer transfer(step);
        CRumbleValidationState state;
        RumbleEvents events;
        BOOST_CHECK(!SettleRound(round, seed, transfer, Params(), TEST_MOCK_TIME, state, events));
        BOOST_CHECK(state.GetError() == RumbleError::WINNER_TRANSFER_FAILED);
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "rumble-transfer-failed");
        BOOST_CHECK_EQUAL(transfer.nAborts, 1);

        // Nothing moved, nothing changed
        BOOST_CHECK(round.GetHash() == hashBefore);
        BOOST_CHECK(round.phase == RoundPhase::OPEN);
        BOOST_CHECK(round.winners.empty());
        BOOST_CHECK_EQUAL(GetLedgerTotal(transfer), 0U);
        BOOST_CHECK(events.empty());

        // The same round settles once the transfer works
        CBalanceLedgerTransfer ledger;
        BOOST_CHECK(SettleRound(round, seed, ledger, Params(), TEST_MOCK_TIME, state, events));
    }
}

BOOST_AUTO_TEST_CASE(settle_conserves_value)
{
    const uint256 seed = TestHash(100);
    RumbleRound round = MakeFundedRound(seed, 11, 1000);
    const CAmount nPool = round.total_pool;
    BOOST_CHECK_EQUAL(nPool, 11 * 1000U + 55U);

    CBalanceLedgerTransfer ledger;
    CRumbleValidationState state;
    RumbleEvents events;
    BOOST_REQUIRE(SettleRound(round, seed, ledger, Params(), TEST_MOCK_TIME + 3600, state, events));

    const SettlementSummary& s = round.settlement;
    BOOST_CHECK_EQUAL(s.winner_count, 2U);
    BOOST_REQUIRE_EQUAL(round.winners.size(), 2U);

    CAmount nPaid = 0;
    for (const WinnerRecord& winner : round.winners) {
        BOOST_CHECK_EQUAL(winner.payout_amount, s.payout_per_winner);
        BOOST_CHECK_EQUAL(ledger.GetBalance(winner.participant_id), s.payout_per_winner);
        nPaid += winner.payout_amount;
    }
    BOOST_CHECK(round.winners[0].participant_id != round.winners[1].participant_id);
    BOOST_CHECK(round.winners[0].composite_score >= round.winners[1].composite_score);

    BOOST_CHECK_EQUAL(nPaid + s.payout_dust + s.burn_amount, nPool);
    BOOST_CHECK_EQUAL(ledger.GetBurned(), s.burn_amount + s.payout_dust);
    BOOST_CHECK_EQUAL(GetLedgerTotal(ledger), nPool);

    // 11055: payout 9949 over 2 winners leaves 1 dust, burn 1105 plus residual 1
    BOOST_CHECK_EQUAL(s.payout_per_winner, 4974U);
    BOOST_CHECK_EQUAL(s.payout_dust, 1U);
    BOOST_CHECK_EQUAL(s.burn_amount, 1106U);

    // The settled event reports what the ledger moved
    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    const RumbleEvent& settled = events[0];
    BOOST_CHECK_EQUAL(settled.payout_pool, 9949U);
    BOOST_CHECK_EQUAL(settled.payout_per_winner, 4974U);
    BOOST_CHECK_EQUAL(settled.payout_dust, 1U);
    BOOST_CHECK_EQUAL(settled.burn_amount, 1106U);
    BOOST_CHECK_EQUAL(settled.GetBurnedTotal(), ledger.GetBurned());
    BOOST_CHECK_EQUAL(settled.GetBurnedTotal(), 1107U);
}

BOOST_AUTO_TEST_CASE(ledger_total_overflow)
{
    CBalanceLedgerTransfer ledger;
    BOOST_REQUIRE(ledger.Begin(TestHash(1)));
    BOOST_REQUIRE(ledger.PayWinner("alice", MAX_MONEY - 1));
    BOOST_REQUIRE(ledger.Commit());
    BOOST_CHECK_EQUAL(GetLedgerTotal(ledger), MAX_MONEY - 1);

    BOOST_REQUIRE(ledger.Begin(TestHash(2)));
    BOOST_REQUIRE(ledger.PayWinner("bob", 1));
    BOOST_REQUIRE(ledger.Burn(1));
    BOOST_REQUIRE(ledger.Commit());

    // Each balance is in range, the sum is not
    CAmount nTotal = 42;
    CRumbleValidationState state;
    BOOST_CHECK(!ledger.GetTotalMoved(nTotal, state));
    BOOST_CHECK(state.GetError() == RumbleError::ARITHMETIC_OVERFLOW);
    BOOST_CHECK_EQUAL(nTotal, 42U);
    BOOST_CHECK_THROW(GetLedgerTotal(ledger), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(settle_is_deterministic)
{
    const uint256 seed = TestHash(100);
    RumbleRound round1 = MakeFundedRound(seed, 30, 100);
    RumbleRound round2 = MakeFundedRound(seed, 30, 100);

    CBalanceLedgerTransfer ledger1, ledger2;
    CRumbleValidationState state;
    RumbleEvents events;
    BOOST_REQUIRE(SettleRound(round1, seed, ledger1, Params(), TEST_MOCK_TIME + 60, state, events));
    BOOST_REQUIRE(SettleRound(round2, seed, ledger2, Params(), TEST_MOCK_TIME + 60, state, events));

    BOOST_REQUIRE_EQUAL(round1.winners.size(), 3U);
    for (size_t i = 0; i < round1.winners.size(); ++i) {
        BOOST_CHECK_EQUAL(round1.winners[i].participant_id, round2.winners[i].participant_id);
    }
    BOOST_CHECK(round1.GetHash() == round2.GetHash());
}

BOOST_AUTO_TEST_CASE(deposit_and_activity_guards)
{
    const uint256 seed = TestHash(100);
    RumbleRound round = MakeFundedRound(seed, 2, 100);
    CBalanceLedgerTransfer ledger;
    CRumbleValidationState state;
    RumbleEvents events;

    // Reset only from SETTLED
    BOOST_CHECK(!ResetRound(round, TEST_MOCK_TIME, state, events));
    BOOST_CHECK(state.GetError() == RumbleError::ROUND_NOT_SETTLED);

    BOOST_REQUIRE(SettleRound(round, seed, ledger, Params(), TEST_MOCK_TIME, state, events));

    CRumbleValidationState stateDeposit;
    BOOST_CHECK(!DepositToRound(round, "late", 100, boost::none, Params(), TEST_MOCK_TIME, stateDeposit, events));
    BOOST_CHECK(stateDeposit.GetError() == RumbleError::ROUND_NOT_OPEN);

    CRumbleValidationState stateActivity;
    std::map<std::string, uint32_t> scores{{"p00", 10}};
    BOOST_CHECK(!ApplyRoundActivityScores(round, MakeActivityScores(scores, {}), Params(), TEST_MOCK_TIME, stateActivity, events));
    BOOST_CHECK(stateActivity.GetError() == RumbleError::ROUND_NOT_OPEN);
    BOOST_CHECK(round.phase == RoundPhase::SETTLED);

    // Deposits close once evaluation begins
    RumbleRound evaluating = MakeFundedRound(seed, 2, 100);
    BOOST_REQUIRE(ApplyRoundActivityScores(evaluating, MakeActivityScores(scores, {}), Params(), TEST_MOCK_TIME, state, events));
    CRumbleValidationState stateEval;
    BOOST_CHECK(!DepositToRound(evaluating, "late", 100, boost::none, Params(), TEST_MOCK_TIME, stateEval, events));
    BOOST_CHECK(stateEval.GetError() == RumbleError::ROUND_NOT_OPEN);
}

BOOST_AUTO_TEST_SUITE_END()
