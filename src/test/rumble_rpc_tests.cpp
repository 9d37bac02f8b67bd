// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_rumble.h"

#include "rpc/register.h"
#include "rpc/server.h"
#include "rumble/rumble_scoring.h"
#include "uint256.h"

#include <boost/test/unit_test.hpp>

#include <univalue.h>

#include <algorithm>

namespace {

UniValue CallRPC(const std::string& strMethod, const UniValue& params)
{
    JSONRPCRequest request;
    request.strMethod = strMethod;
    request.params = params;
    return tableRPC.execute(request);
}

UniValue MakeParams(std::initializer_list<UniValue> values)
{
    UniValue params(UniValue::VARR);
    for (const UniValue& v : values) {
        params.push_back(v);
    }
    return params;
}

/** Error code of a failed call, 0 when it succeeded */
int CallRPCErrorCode(const std::string& strMethod, const UniValue& params)
{
    try {
        CallRPC(strMethod, params);
    } catch (const UniValue& objError) {
        return find_value(objError, "code").get_int();
    }
    return 0;
}

struct RPCTestingSetup : public TestingSetup {
    RPCTestingSetup()
    {
        RegisterAllCoreRPCCommands(tableRPC);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(rumble_rpc_tests, RPCTestingSetup)

BOOST_AUTO_TEST_CASE(rpc_command_table)
{
    const std::vector<std::string> commands = tableRPC.listCommands();
    for (const char* name : {"createround", "initializeround", "deposit", "applyactivityscores",
                             "settleround", "resetround", "getroundinfo", "listrounds", "getseedcommitment"}) {
        BOOST_CHECK(tableRPC[name] != nullptr);
        BOOST_CHECK(std::find(commands.begin(), commands.end(), name) != commands.end());
    }

    BOOST_CHECK_EQUAL(CallRPCErrorCode("nosuchcommand", MakeParams({})), RPC_METHOD_NOT_FOUND);

    const std::string strHelp = CallRPC("help", MakeParams({"settleround"})).get_str();
    BOOST_CHECK(strHelp.find("settleround \"round_id\" \"seed\"") == 0);
}

BOOST_AUTO_TEST_CASE(rpc_round_lifecycle)
{
    UniValue r = CallRPC("createround", MakeParams({600}));
    const std::string strSeed = find_value(r, "seed").get_str();
    const UniValue& round = find_value(r, "round");
    const std::string strRoundId = find_value(round, "round_id").get_str();
    BOOST_CHECK_EQUAL(find_value(round, "state").get_str(), "open");
    BOOST_CHECK_EQUAL(find_value(round, "close_time").get_int64(), TEST_MOCK_TIME + 600);
    const UniValue& evInit = find_value(r, "events")[0];
    BOOST_CHECK_EQUAL(find_value(evInit, "event").get_str(), "round.initialized");
    BOOST_CHECK_EQUAL(find_value(evInit, "close_time").get_int64(), TEST_MOCK_TIME + 600);

    // Commitment returned with the round matches the generated seed
    const std::string strCommitment = CallRPC("getseedcommitment", MakeParams({strSeed})).get_str();
    BOOST_CHECK_EQUAL(find_value(round, "seed_commitment").get_str(), strCommitment);

    CallRPC("deposit", MakeParams({strRoundId, "A", 1000}));
    CallRPC("deposit", MakeParams({strRoundId, "B", "1000"}));
    CallRPC("deposit", MakeParams({strRoundId, "C", 1000, 2500}));
    r = CallRPC("deposit", MakeParams({strRoundId, "D", 1000}));
    BOOST_CHECK_EQUAL(find_value(find_value(r, "round"), "total_pool").get_int64(), 4000);
    const UniValue& ev = find_value(r, "events")[0];
    BOOST_CHECK_EQUAL(find_value(ev, "event").get_str(), "deposit.made");
    BOOST_CHECK_EQUAL(find_value(ev, "participant").get_str(), "D");
    BOOST_CHECK_EQUAL(find_value(ev, "total_pool").get_int64(), 4000);

    UniValue scores(UniValue::VOBJ);
    scores.pushKV("A", 150);
    scores.pushKV("B", 200);
    scores.pushKV("C", 100);
    scores.pushKV("D", 180);
    UniValue filtered(UniValue::VARR);
    filtered.push_back("C");
    r = CallRPC("applyactivityscores", MakeParams({strRoundId, scores, filtered}));
    BOOST_CHECK_EQUAL(find_value(find_value(r, "round"), "state").get_str(), "evaluating");
    const UniValue& evActivity = find_value(r, "events")[0];
    BOOST_CHECK_EQUAL(find_value(evActivity, "updated").get_int(), 4);
    BOOST_CHECK_EQUAL(find_value(evActivity, "filtered").get_int(), 1);

    r = CallRPC("settleround", MakeParams({strRoundId, strSeed}));
    const UniValue& settled = find_value(r, "round");
    BOOST_CHECK_EQUAL(find_value(settled, "state").get_str(), "settled");
    BOOST_CHECK_EQUAL(find_value(settled, "total_pool").get_int64(), 0);
    BOOST_CHECK(find_value(settled, "invariants_ok").get_bool());
    BOOST_CHECK_EQUAL(find_value(settled, "seed_reveal").get_str(), strSeed);

    const UniValue& settlement = find_value(settled, "settlement");
    BOOST_CHECK_EQUAL(find_value(settlement, "pool_at_settlement").get_int64(), 4000);
    BOOST_CHECK_EQUAL(find_value(settlement, "payout_pool").get_int64(), 3600);
    BOOST_CHECK_EQUAL(find_value(settlement, "burn_amount").get_int64(), 400);
    BOOST_CHECK_EQUAL(find_value(settlement, "winner_count").get_int(), 1);

    const UniValue& winners = find_value(settled, "winners");
    BOOST_REQUIRE_EQUAL(winners.size(), 1U);
    BOOST_CHECK_EQUAL(find_value(winners[0], "payout").get_int64(), 3600);
    BOOST_CHECK_EQUAL(find_value(winners[0], "rank").get_int(), 1);
    const UniValue& evSettled = find_value(r, "events")[0];
    BOOST_CHECK_EQUAL(find_value(evSettled, "event").get_str(), "round.settled");
    BOOST_CHECK_EQUAL(find_value(evSettled, "payout_pool").get_int64(), 3600);
    BOOST_CHECK_EQUAL(find_value(evSettled, "payout_per_winner").get_int64(), 3600);
    BOOST_CHECK_EQUAL(find_value(evSettled, "payout_dust").get_int64(), 0);
    BOOST_CHECK_EQUAL(find_value(evSettled, "burn_amount").get_int64(), 400);
    BOOST_CHECK_EQUAL(find_value(evSettled, "burned_total").get_int64(), 400);

    // Stored snapshot matches the returned one
    UniValue info = CallRPC("getroundinfo", MakeParams({strRoundId}));
    BOOST_CHECK_EQUAL(find_value(info, "hash").get_str(), find_value(settled, "hash").get_str());

    r = CallRPC("resetround", MakeParams({strRoundId}));
    BOOST_CHECK_EQUAL(find_value(find_value(r, "round"), "state").get_str(), "idle");
    BOOST_CHECK(find_value(find_value(r, "round"), "participants").empty());

    UniValue list = CallRPC("listrounds", MakeParams({}));
    BOOST_REQUIRE_EQUAL(list.size(), 1U);
    BOOST_CHECK_EQUAL(find_value(list[0], "round_id").get_str(), strRoundId);
    BOOST_CHECK_EQUAL(find_value(list[0], "state").get_str(), "idle");
}

BOOST_AUTO_TEST_CASE(rpc_named_arguments)
{
    const uint256 seed = TestHash(100);
    const std::string strRoundId = TestHash(1).GetHex();

    UniValue args(UniValue::VOBJ);
    args.pushKV("round_id", strRoundId);
    args.pushKV("seed_commitment", rumble_scoring::ComputeSeedCommitment(seed).GetHex());
    UniValue r = CallRPC("initializeround", args);
    BOOST_CHECK_EQUAL(find_value(find_value(r, "round"), "round_id").get_str(), strRoundId);
    // Default window on regtest
    BOOST_CHECK_EQUAL(find_value(find_value(r, "round"), "close_time").get_int64(), TEST_MOCK_TIME + 60);

    UniValue dep(UniValue::VOBJ);
    dep.pushKV("round_id", strRoundId);
    dep.pushKV("participant", "alice");
    dep.pushKV("amount", 250);
    r = CallRPC("deposit", dep);
    BOOST_CHECK_EQUAL(find_value(find_value(r, "round"), "total_pool").get_int64(), 250);

    UniValue bad(UniValue::VOBJ);
    bad.pushKV("round_id", strRoundId);
    bad.pushKV("colour", "blue");
    BOOST_CHECK_EQUAL(CallRPCErrorCode("getroundinfo", bad), RPC_INVALID_PARAMETER);
}

BOOST_AUTO_TEST_CASE(rpc_error_codes)
{
    const uint256 seed = TestHash(100);
    const std::string strRoundId = TestHash(1).GetHex();
    const std::string strUnknown = TestHash(2).GetHex();
    const std::string strCommitment = rumble_scoring::ComputeSeedCommitment(seed).GetHex();

    BOOST_CHECK_EQUAL(CallRPCErrorCode("getroundinfo", MakeParams({strUnknown})), RPC_RUMBLE_ROUND_NOT_FOUND);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("deposit", MakeParams({strUnknown, "alice", 10})), RPC_RUMBLE_ROUND_NOT_FOUND);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("getroundinfo", MakeParams({"xyz"})), RPC_INVALID_PARAMETER);

    BOOST_CHECK_EQUAL(CallRPCErrorCode("initializeround", MakeParams({strRoundId, strCommitment, 60})), 0);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("initializeround", MakeParams({strRoundId, strCommitment, 60})), RPC_RUMBLE_ROUND_ALREADY_OPEN);

    BOOST_CHECK_EQUAL(CallRPCErrorCode("settleround", MakeParams({strRoundId, seed.GetHex()})), RPC_RUMBLE_NO_DEPOSITS);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("deposit", MakeParams({strRoundId, "alice", 0})), RPC_RUMBLE_INVALID_DEPOSIT);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("deposit", MakeParams({strRoundId, "", 10})), RPC_RUMBLE_INVALID_DEPOSIT);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("deposit", MakeParams({strRoundId, "alice", -5})), RPC_TYPE_ERROR);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("deposit", MakeParams({strRoundId, "alice", "12x"})), RPC_TYPE_ERROR);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("deposit", MakeParams({strRoundId, "alice", "18446744073709551615"})), 0);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("deposit", MakeParams({strRoundId, "bob", 1})), RPC_RUMBLE_ARITHMETIC_OVERFLOW);

    BOOST_CHECK_EQUAL(CallRPCErrorCode("resetround", MakeParams({strRoundId})), RPC_RUMBLE_ROUND_NOT_SETTLED);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("settleround", MakeParams({strRoundId, TestHash(101).GetHex()})), RPC_RUMBLE_INVALID_SEED_REVEAL);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("settleround", MakeParams({strRoundId, seed.GetHex()})), 0);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("settleround", MakeParams({strRoundId, seed.GetHex()})), RPC_RUMBLE_ROUND_ALREADY_SETTLED);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("deposit", MakeParams({strRoundId, "alice", 10})), RPC_RUMBLE_ROUND_NOT_OPEN);

    UniValue scores(UniValue::VOBJ);
    scores.pushKV("alice", 10);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("applyactivityscores", MakeParams({strRoundId, scores})), RPC_RUMBLE_ROUND_NOT_OPEN);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("applyactivityscores", MakeParams({strRoundId, "notanobject"})), RPC_TYPE_ERROR);

    // Message carries the error name and reject reason
    try {
        CallRPC("deposit", MakeParams({strRoundId, "alice", 10}));
        BOOST_ERROR("deposit into a settled round succeeded");
    } catch (const UniValue& objError) {
        const std::string strMessage = find_value(objError, "message").get_str();
        BOOST_CHECK(strMessage.find("RoundNotOpen") == 0);
        BOOST_CHECK(strMessage.find("rumble-round-not-open") != std::string::npos);
    }

    // Wrong parameter count shows usage
    BOOST_CHECK_EQUAL(CallRPCErrorCode("settleround", MakeParams({strRoundId})), RPC_MISC_ERROR);
}

BOOST_AUTO_TEST_SUITE_END()
