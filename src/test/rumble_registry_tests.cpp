// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Participant registry tests
 *
 * Coverage:
 * - Deposit creates and accumulates records, join_time is immutable
 * - Deposit guards (amount, identity, phase, capacity)
 * - Overflow leaves pool and record unchanged
 * - Activity overwrite, unknown ids, clamping, anomaly filter flag
 */

#include "test/test_rumble.h"

#include "rumble/rumble_registry.h"
#include "rumbleparams.h"
#include "util/string.h"

#include <boost/test/unit_test.hpp>

using namespace rumble_registry;

BOOST_FIXTURE_TEST_SUITE(rumble_registry_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(deposit_creates_and_accumulates)
{
    RumbleRound round = MakeOpenRound(TestHash(1), TestHash(100), TEST_MOCK_TIME, 600);
    CRumbleValidationState state;
    RumbleEvents events;

    BOOST_CHECK(RecordDeposit(round, "alice", 1000, boost::none, Params(), TEST_MOCK_TIME + 10, state, events));
    BOOST_CHECK(RecordDeposit(round, "bob", 500, boost::none, Params(), TEST_MOCK_TIME + 20, state, events));
    BOOST_CHECK(RecordDeposit(round, "alice", 250, boost::none, Params(), TEST_MOCK_TIME + 30, state, events));

    BOOST_CHECK_EQUAL(round.participants.size(), 2U);
    BOOST_CHECK_EQUAL(round.total_pool, 1750U);

    const ParticipantRecord& alice = round.participants.at("alice");
    BOOST_CHECK_EQUAL(alice.deposit, 1250U);
    BOOST_CHECK_EQUAL(alice.join_time, TEST_MOCK_TIME + 10);
    BOOST_CHECK_EQUAL(alice.holdings, 1250U);
    BOOST_CHECK_EQUAL(alice.activity_score, 0U);

    BOOST_CHECK(round.CheckInvariants());

    BOOST_REQUIRE_EQUAL(events.size(), 3U);
    BOOST_CHECK(events[2].type == RumbleEventType::DEPOSIT_MADE);
    BOOST_CHECK_EQUAL(events[2].GetName(), "deposit.made");
    BOOST_CHECK_EQUAL(events[2].participant, "alice");
    BOOST_CHECK_EQUAL(events[2].amount, 250U);
    BOOST_CHECK_EQUAL(events[2].total_pool, 1750U);
}

BOOST_AUTO_TEST_CASE(deposit_holdings)
{
    RumbleRound round = MakeOpenRound(TestHash(1), TestHash(100), TEST_MOCK_TIME, 600);
    CRumbleValidationState state;
    RumbleEvents events;

    BOOST_CHECK(RecordDeposit(round, "alice", 1000, CAmount(5000), Params(), TEST_MOCK_TIME, state, events));
    BOOST_CHECK_EQUAL(round.participants.at("alice").holdings, 5000U);

    // Latest supplied value wins
    BOOST_CHECK(RecordDeposit(round, "alice", 100, CAmount(4000), Params(), TEST_MOCK_TIME, state, events));
    BOOST_CHECK_EQUAL(round.participants.at("alice").holdings, 4000U);

    // Not supplied: accumulated deposit
    BOOST_CHECK(RecordDeposit(round, "alice", 100, boost::none, Params(), TEST_MOCK_TIME, state, events));
    BOOST_CHECK_EQUAL(round.participants.at("alice").holdings, 1200U);
    BOOST_CHECK_EQUAL(round.total_pool, 1200U);
}

BOOST_AUTO_TEST_CASE(deposit_guards)
{
    RumbleRound round = MakeOpenRound(TestHash(1), TestHash(100), TEST_MOCK_TIME, 600);
    RumbleEvents events;

    {
        CRumbleValidationState state;
        BOOST_CHECK(!RecordDeposit(round, "alice", 0, boost::none, Params(), TEST_MOCK_TIME, state, events));
        BOOST_CHECK(state.GetError() == RumbleError::INVALID_DEPOSIT);
    }
    {
        CRumbleValidationState state;
        BOOST_CHECK(!RecordDeposit(round, "", 10, boost::none, Params(), TEST_MOCK_TIME, state, events));
        BOOST_CHECK(state.GetError() == RumbleError::INVALID_DEPOSIT);
    }
    BOOST_CHECK(round.participants.empty());
    BOOST_CHECK_EQUAL(round.total_pool, 0U);
    BOOST_CHECK(events.empty());

    RumbleRound idle(TestHash(2));
    {
        CRumbleValidationState state;
        BOOST_CHECK(!RecordDeposit(idle, "alice", 10, boost::none, Params(), TEST_MOCK_TIME, state, events));
        BOOST_CHECK(state.GetError() == RumbleError::ROUND_NOT_OPEN);
    }

    round.phase = RoundPhase::EVALUATING;
    {
        CRumbleValidationState state;
        BOOST_CHECK(!RecordDeposit(round, "alice", 10, boost::none, Params(), TEST_MOCK_TIME, state, events));
        BOOST_CHECK(state.GetError() == RumbleError::ROUND_NOT_OPEN);
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "rumble-round-not-open");
    }
}

BOOST_AUTO_TEST_CASE(deposit_overflow_leaves_round_unchanged)
{
    RumbleRound round = MakeOpenRound(TestHash(1), TestHash(100), TEST_MOCK_TIME, 600);
    CRumbleValidationState state;
    RumbleEvents events;

    BOOST_CHECK(RecordDeposit(round, "alice", MAX_MONEY - 10, boost::none, Params(), TEST_MOCK_TIME, state, events));
    const uint256 hashBefore = round.GetHash();

    // Pool overflow from a new participant: no record is created
    CRumbleValidationState state2;
    BOOST_CHECK(!RecordDeposit(round, "bob", 11, boost::none, Params(), TEST_MOCK_TIME, state2, events));
    BOOST_CHECK(state2.GetError() == RumbleError::ARITHMETIC_OVERFLOW);
    BOOST_CHECK(round.participants.count("bob") == 0);

    // Deposit overflow on an existing record
    CRumbleValidationState state3;
    BOOST_CHECK(!RecordDeposit(round, "alice", 11, boost::none, Params(), TEST_MOCK_TIME, state3, events));
    BOOST_CHECK(state3.GetError() == RumbleError::ARITHMETIC_OVERFLOW);

    BOOST_CHECK_EQUAL(round.total_pool, MAX_MONEY - 10);
    BOOST_CHECK_EQUAL(round.participants.at("alice").deposit, MAX_MONEY - 10);
    BOOST_CHECK(round.GetHash() == hashBefore);
    BOOST_CHECK_EQUAL(events.size(), 1U);

    // Exactly reaching the top of the range is fine
    CRumbleValidationState state4;
    BOOST_CHECK(RecordDeposit(round, "bob", 10, boost::none, Params(), TEST_MOCK_TIME, state4, events));
    BOOST_CHECK_EQUAL(round.total_pool, MAX_MONEY);
}

BOOST_AUTO_TEST_CASE(deposit_capacity)
{
    RumbleRound round = MakeOpenRound(TestHash(1), TestHash(100), TEST_MOCK_TIME, 600);
    RumbleEvents events;

    const uint32_t nMax = Params().MaxParticipants();
    for (uint32_t i = 0; i < nMax; ++i) {
        CRumbleValidationState state;
        BOOST_REQUIRE(RecordDeposit(round, strprintf("p%u", i), 1, boost::none, Params(), TEST_MOCK_TIME, state, events));
    }

    CRumbleValidationState state;
    BOOST_CHECK(!RecordDeposit(round, "late", 1, boost::none, Params(), TEST_MOCK_TIME, state, events));
    BOOST_CHECK(state.GetError() == RumbleError::INVALID_DEPOSIT);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "rumble-round-full");

    // Existing participants may still top up
    CRumbleValidationState state2;
    BOOST_CHECK(RecordDeposit(round, "p0", 1, boost::none, Params(), TEST_MOCK_TIME, state2, events));
    BOOST_CHECK_EQUAL(round.total_pool, nMax + 1U);
}

BOOST_AUTO_TEST_CASE(apply_activity_scores)
{
    RumbleRound round = MakeOpenRound(TestHash(1), TestHash(100), TEST_MOCK_TIME, 600);
    CRumbleValidationState state;
    RumbleEvents events;

    BOOST_CHECK(RecordDeposit(round, "alice", 100, boost::none, Params(), TEST_MOCK_TIME, state, events));
    BOOST_CHECK(RecordDeposit(round, "bob", 100, boost::none, Params(), TEST_MOCK_TIME, state, events));
    BOOST_CHECK(RecordDeposit(round, "carol", 100, boost::none, Params(), TEST_MOCK_TIME, state, events));
    events.clear();

    ActivityScoreMap scores;
    scores["alice"] = ActivityEvaluation(150, false);
    scores["bob"] = ActivityEvaluation(5000, false);    // above MaxActivityScore
    scores["carol"] = ActivityEvaluation(900, true);    // filtered
    scores["mallory"] = ActivityEvaluation(999, false); // unknown

    BOOST_CHECK(ApplyActivityScores(round, scores, Params(), TEST_MOCK_TIME + 5, state, events));

    BOOST_CHECK_EQUAL(round.participants.at("alice").activity_score, 150U);
    BOOST_CHECK_EQUAL(round.participants.at("bob").activity_score, Params().MaxActivityScore());
    BOOST_CHECK_EQUAL(round.participants.at("carol").activity_score, 0U);
    BOOST_CHECK(round.participants.at("carol").activity_filtered);
    BOOST_CHECK_EQUAL(round.participants.at("alice").last_evaluated, TEST_MOCK_TIME + 5);
    BOOST_CHECK(round.participants.count("mallory") == 0);
    BOOST_CHECK_EQUAL(round.total_pool, 300U);

    BOOST_REQUIRE_EQUAL(events.size(), 1U);
    BOOST_CHECK_EQUAL(events[0].GetName(), "activity.evaluated");
    BOOST_CHECK_EQUAL(events[0].count, 3U);
    BOOST_CHECK_EQUAL(events[0].filtered_count, 1U);

    // Overwrite, not accumulate; a later clean evaluation clears the filter flag
    ActivityScoreMap rescore;
    rescore["alice"] = ActivityEvaluation(20, false);
    rescore["carol"] = ActivityEvaluation(30, false);
    BOOST_CHECK(ApplyActivityScores(round, rescore, Params(), TEST_MOCK_TIME + 6, state, events));
    BOOST_CHECK_EQUAL(round.participants.at("alice").activity_score, 20U);
    BOOST_CHECK_EQUAL(round.participants.at("carol").activity_score, 30U);
    BOOST_CHECK(!round.participants.at("carol").activity_filtered);
    BOOST_CHECK_EQUAL(round.participants.at("bob").activity_score, Params().MaxActivityScore());

    // Empty map touches nothing but is accepted
    const uint256 hashBefore = round.GetHash();
    BOOST_CHECK(ApplyActivityScores(round, ActivityScoreMap(), Params(), TEST_MOCK_TIME + 7, state, events));
    BOOST_CHECK(round.GetHash() == hashBefore);
}

BOOST_AUTO_TEST_CASE(apply_activity_guards)
{
    RumbleRound idle(TestHash(3));
    CRumbleValidationState state;
    RumbleEvents events;

    BOOST_CHECK(!ApplyActivityScores(idle, ActivityScoreMap(), Params(), TEST_MOCK_TIME, state, events));
    BOOST_CHECK(state.GetError() == RumbleError::ROUND_NOT_OPEN);
    BOOST_CHECK(events.empty());
}

BOOST_AUTO_TEST_SUITE_END()
