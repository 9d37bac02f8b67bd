// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_validation.h"

#include "random.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "rumble/rumble_scoring.h"
#include "rumbleparams.h"
#include "util/system.h"
#include "util/string.h"

#include <univalue.h>

#include <algorithm>
#include <limits>
#include <set>

static int RPCErrorFromRumbleError(RumbleError err)
{
    switch (err) {
    case RumbleError::INVALID_DEPOSIT:        return RPC_RUMBLE_INVALID_DEPOSIT;
    case RumbleError::ROUND_NOT_OPEN:         return RPC_RUMBLE_ROUND_NOT_OPEN;
    case RumbleError::ROUND_NOT_FOUND:        return RPC_RUMBLE_ROUND_NOT_FOUND;
    case RumbleError::ROUND_ALREADY_SETTLED:  return RPC_RUMBLE_ROUND_ALREADY_SETTLED;
    case RumbleError::ROUND_NOT_SETTLED:      return RPC_RUMBLE_ROUND_NOT_SETTLED;
    case RumbleError::NO_DEPOSITS:            return RPC_RUMBLE_NO_DEPOSITS;
    case RumbleError::ARITHMETIC_OVERFLOW:    return RPC_RUMBLE_ARITHMETIC_OVERFLOW;
    case RumbleError::DIVISION_BY_ZERO:       return RPC_RUMBLE_DIVISION_BY_ZERO;
    case RumbleError::WINNER_TRANSFER_FAILED: return RPC_RUMBLE_TRANSFER_FAILED;
    case RumbleError::ROUND_ALREADY_OPEN:     return RPC_RUMBLE_ROUND_ALREADY_OPEN;
    case RumbleError::INVALID_SEED_REVEAL:    return RPC_RUMBLE_INVALID_SEED_REVEAL;
    case RumbleError::STORAGE_FAILURE:        return RPC_RUMBLE_STORAGE_FAILURE;
    case RumbleError::NONE:                   break;
    }
    return RPC_INTERNAL_ERROR;
}

static UniValue JSONRPCRumbleError(const CRumbleValidationState& state)
{
    return JSONRPCError(RPCErrorFromRumbleError(state.GetError()),
                        strprintf("%s: %s", RumbleErrorToString(state.GetError()), state.ToString()));
}

/** Amount in base units, given as a non-negative integer or a decimal string */
static CAmount AmountFromValue(const UniValue& value, const std::string& strName)
{
    if (value.isNum()) {
        int64_t n = value.get_int64();
        if (n < 0)
            throw JSONRPCError(RPC_TYPE_ERROR, strName + " must not be negative");
        return static_cast<CAmount>(n);
    }
    if (value.isStr()) {
        const std::string& str = value.get_str();
        if (str.empty() || str.size() > 20 || str.find_first_not_of("0123456789") != std::string::npos)
            throw JSONRPCError(RPC_TYPE_ERROR, strName + " must be a decimal integer string");
        CAmount n = 0;
        for (char c : str) {
            uint64_t digit = c - '0';
            if (n > (MAX_MONEY - digit) / 10)
                throw JSONRPCError(RPC_TYPE_ERROR, strName + " out of range");
            n = n * 10 + digit;
        }
        return n;
    }
    throw JSONRPCError(RPC_TYPE_ERROR, "Amount is not a number or string");
}

static uint32_t WindowFromValue(const UniValue& value)
{
    int64_t n = value.isNull() ? gArgs.GetArg("-window", Params().DefaultWindowSeconds()) : value.get_int64();
    if (n < 0 || n > std::numeric_limits<uint32_t>::max())
        throw JSONRPCError(RPC_INVALID_PARAMETER, "window_seconds out of range");
    return static_cast<uint32_t>(n);
}

static UniValue AmountToJSON(CAmount amount)
{
    return UniValue(static_cast<uint64_t>(amount));
}

static UniValue WinnersToJSON(const std::vector<WinnerRecord>& winners)
{
    UniValue arr(UniValue::VARR);
    for (const WinnerRecord& w : winners) {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("rank", (int64_t)w.rank);
        obj.pushKV("participant", w.participant_id);
        obj.pushKV("payout", AmountToJSON(w.payout_amount));
        obj.pushKV("composite_score", (uint64_t)w.composite_score);
        arr.push_back(obj);
    }
    return arr;
}

static UniValue RoundToJSON(const RumbleRound& round)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("round_id", round.round_id.GetHex());
    result.pushKV("state", RoundPhaseToString(round.phase));
    result.pushKV("round_number", (int64_t)round.round_number);
    result.pushKV("total_pool", AmountToJSON(round.total_pool));
    result.pushKV("open_time", round.open_time);
    result.pushKV("close_time", round.close_time);
    result.pushKV("seed_commitment", round.seed_commitment.GetHex());
    if (!round.seed_reveal.IsNull())
        result.pushKV("seed_reveal", round.seed_reveal.GetHex());

    UniValue participants(UniValue::VARR);
    for (const auto& entry : round.participants) {
        const ParticipantRecord& p = entry.second;
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("participant", p.id);
        obj.pushKV("deposit", AmountToJSON(p.deposit));
        obj.pushKV("holdings", AmountToJSON(p.holdings));
        obj.pushKV("activity_score", (int64_t)p.activity_score);
        obj.pushKV("activity_filtered", p.activity_filtered);
        obj.pushKV("join_time", p.join_time);
        obj.pushKV("last_evaluated", p.last_evaluated);
        participants.push_back(obj);
    }
    result.pushKV("participants", participants);
    result.pushKV("winners", WinnersToJSON(round.winners));

    if (!round.settlement.IsNull()) {
        const SettlementSummary& s = round.settlement;
        UniValue settlement(UniValue::VOBJ);
        settlement.pushKV("pool_at_settlement", AmountToJSON(s.pool_at_settlement));
        settlement.pushKV("payout_pool", AmountToJSON(s.payout_pool));
        settlement.pushKV("burn_amount", AmountToJSON(s.burn_amount));
        settlement.pushKV("residual", AmountToJSON(s.residual));
        settlement.pushKV("payout_per_winner", AmountToJSON(s.payout_per_winner));
        settlement.pushKV("payout_dust", AmountToJSON(s.payout_dust));
        settlement.pushKV("winner_count", (int64_t)s.winner_count);
        settlement.pushKV("settle_time", s.settle_time);
        result.pushKV("settlement", settlement);
    }

    result.pushKV("invariants_ok", round.CheckInvariants());
    result.pushKV("hash", round.GetHash().GetHex());
    return result;
}

static UniValue EventsToJSON(const RumbleEvents& events)
{
    UniValue arr(UniValue::VARR);
    for (const RumbleEvent& event : events) {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("event", event.GetName());
        obj.pushKV("round_id", event.round_id.GetHex());
        switch (event.type) {
        case RumbleEventType::ROUND_INITIALIZED:
            obj.pushKV("round_number", (int64_t)event.round_number);
            obj.pushKV("close_time", event.close_time);
            break;
        case RumbleEventType::DEPOSIT_MADE:
            obj.pushKV("participant", event.participant);
            obj.pushKV("amount", AmountToJSON(event.amount));
            obj.pushKV("total_pool", AmountToJSON(event.total_pool));
            break;
        case RumbleEventType::ACTIVITY_EVALUATED:
            obj.pushKV("updated", (int64_t)event.count);
            obj.pushKV("filtered", (int64_t)event.filtered_count);
            break;
        case RumbleEventType::ROUND_SETTLED:
            obj.pushKV("payout_pool", AmountToJSON(event.payout_pool));
            obj.pushKV("payout_per_winner", AmountToJSON(event.payout_per_winner));
            obj.pushKV("payout_dust", AmountToJSON(event.payout_dust));
            obj.pushKV("burn_amount", AmountToJSON(event.burn_amount));
            obj.pushKV("burned_total", AmountToJSON(event.GetBurnedTotal()));
            obj.pushKV("winners", WinnersToJSON(event.winners));
            break;
        case RumbleEventType::ROUND_RESET:
            obj.pushKV("round_number", (int64_t)event.round_number);
            break;
        }
        arr.push_back(obj);
    }
    return arr;
}

static UniValue OperationResult(const RumbleRound& round, const RumbleEvents& events)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("round", RoundToJSON(round));
    result.pushKV("events", EventsToJSON(events));
    return result;
}

/**
 * createround - Create and open a round with a fresh id
 *
 * When no seed commitment is given a seed is generated and returned; the
 * caller must keep it to settle the round.
 */
static UniValue createround(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 2) {
        throw std::runtime_error(
            "createround ( window_seconds \"seed_commitment\" )\n"
            "\nCreate a new round and open its deposit window.\n"
            "\nArguments:\n"
            "1. window_seconds      (numeric, optional) Deposit window length (default: -window or network default)\n"
            "2. \"seed_commitment\"   (string, optional) Hash of the settlement seed, see getseedcommitment.\n"
            "                       If omitted a seed is generated and returned.\n"
            "\nResult:\n"
            "{\n"
            "  \"round\": {...},      (object) The round, see getroundinfo\n"
            "  \"events\": [...],     (array) Emitted notifications\n"
            "  \"seed\": \"hex\"        (string, only without seed_commitment) Seed to reveal at settlement\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("createround", "")
            + HelpExampleCli("createround", "3600")
            + HelpExampleRpc("createround", "3600")
        );
    }

    const uint32_t nWindow = WindowFromValue(request.params.size() > 0 ? request.params[0] : NullUniValue);

    uint256 seed;
    uint256 commitment;
    const bool fGenerated = request.params.size() < 2 || request.params[1].isNull();
    if (fGenerated) {
        seed = GetRandHash();
        commitment = rumble_scoring::ComputeSeedCommitment(seed);
    } else {
        commitment = ParseHashV(request.params[1], "seed_commitment");
    }

    RumbleRound round;
    RumbleEvents events;
    CRumbleValidationState state;
    if (!ProcessCreateRound(commitment, nWindow, round, state, events)) {
        throw JSONRPCRumbleError(state);
    }

    UniValue result = OperationResult(round, events);
    if (fGenerated)
        result.pushKV("seed", seed.GetHex());
    return result;
}

static UniValue initializeround(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 2 || request.params.size() > 3) {
        throw std::runtime_error(
            "initializeround \"round_id\" \"seed_commitment\" ( window_seconds )\n"
            "\nOpen an idle round (or create one with the given id).\n"
            "\nArguments:\n"
            "1. \"round_id\"          (string, required) The round id\n"
            "2. \"seed_commitment\"   (string, required) Hash of the settlement seed\n"
            "3. window_seconds      (numeric, optional) Deposit window length\n"
            "\nResult:\n"
            "{ \"round\": {...}, \"events\": [...] }\n"
            "\nExamples:\n"
            + HelpExampleCli("initializeround", "\"roundid\" \"commitment\" 600")
            + HelpExampleRpc("initializeround", "\"roundid\", \"commitment\", 600")
        );
    }

    uint256 round_id = ParseHashV(request.params[0], "round_id");
    uint256 commitment = ParseHashV(request.params[1], "seed_commitment");
    const uint32_t nWindow = WindowFromValue(request.params.size() > 2 ? request.params[2] : NullUniValue);

    RumbleRound round;
    RumbleEvents events;
    CRumbleValidationState state;
    if (!ProcessInitializeRound(round_id, commitment, nWindow, round, state, events)) {
        throw JSONRPCRumbleError(state);
    }
    return OperationResult(round, events);
}

static UniValue deposit(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 3 || request.params.size() > 4) {
        throw std::runtime_error(
            "deposit \"round_id\" \"participant\" amount ( holdings )\n"
            "\nRecord a deposit into an open round.\n"
            "\nArguments:\n"
            "1. \"round_id\"      (string, required) The round id\n"
            "2. \"participant\"   (string, required) Participant identity\n"
            "3. amount          (numeric or string, required) Amount in base units, > 0\n"
            "4. holdings        (numeric or string, optional) Holdings balance for scoring (default: accumulated deposit)\n"
            "\nResult:\n"
            "{ \"round\": {...}, \"events\": [...] }\n"
            "\nExamples:\n"
            + HelpExampleCli("deposit", "\"roundid\" \"alice\" 1000")
            + HelpExampleRpc("deposit", "\"roundid\", \"alice\", 1000")
        );
    }

    uint256 round_id = ParseHashV(request.params[0], "round_id");
    const std::string participant = request.params[1].get_str();
    CAmount amount = AmountFromValue(request.params[2], "amount");
    boost::optional<CAmount> holdings;
    if (request.params.size() > 3 && !request.params[3].isNull())
        holdings = AmountFromValue(request.params[3], "holdings");

    RumbleRound round;
    RumbleEvents events;
    CRumbleValidationState state;
    if (!ProcessDeposit(round_id, participant, amount, holdings, round, state, events)) {
        throw JSONRPCRumbleError(state);
    }
    return OperationResult(round, events);
}

static UniValue applyactivityscores(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 2 || request.params.size() > 3) {
        throw std::runtime_error(
            "applyactivityscores \"round_id\" {\"participant\":score,...} ( [\"participant\",...] )\n"
            "\nOverwrite activity scores and move the round to evaluating.\n"
            "\nArguments:\n"
            "1. \"round_id\"    (string, required) The round id\n"
            "2. scores        (object, required) Participant -> activity score. Unknown participants are ignored.\n"
            "3. filtered      (array, optional) Participants rejected by the anomaly filter (scored 0)\n"
            "\nResult:\n"
            "{ \"round\": {...}, \"events\": [...] }\n"
            "\nExamples:\n"
            + HelpExampleCli("applyactivityscores", "\"roundid\" \"{\\\"alice\\\":150}\"")
            + HelpExampleRpc("applyactivityscores", "\"roundid\", {\"alice\":150}")
        );
    }

    RPCTypeCheck(request.params, {UniValue::VSTR, UniValue::VOBJ, UniValue::VARR}, true);

    uint256 round_id = ParseHashV(request.params[0], "round_id");

    std::map<std::string, uint32_t> scores;
    const UniValue& scoresObj = request.params[1].get_obj();
    for (const std::string& key : scoresObj.getKeys()) {
        int64_t n = find_value(scoresObj, key).get_int64();
        if (n < 0)
            throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("negative activity score for %s", key));
        scores[key] = static_cast<uint32_t>(std::min<int64_t>(n, std::numeric_limits<uint32_t>::max()));
    }

    std::set<std::string> setFiltered;
    if (request.params.size() > 2 && !request.params[2].isNull()) {
        const UniValue& filtered = request.params[2].get_array();
        for (size_t i = 0; i < filtered.size(); ++i) {
            setFiltered.insert(filtered[i].get_str());
        }
    }

    RumbleRound round;
    RumbleEvents events;
    CRumbleValidationState state;
    if (!ProcessApplyActivityScores(round_id, MakeActivityScores(scores, setFiltered), round, state, events)) {
        throw JSONRPCRumbleError(state);
    }
    return OperationResult(round, events);
}

static UniValue settleround(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "settleround \"round_id\" \"seed\"\n"
            "\nScore, rank and pay out the round. The seed must match the commitment given at initialization.\n"
            "\nArguments:\n"
            "1. \"round_id\"    (string, required) The round id\n"
            "2. \"seed\"        (string, required) The settlement seed (hex)\n"
            "\nResult:\n"
            "{ \"round\": {...}, \"events\": [...] }\n"
            "\nExamples:\n"
            + HelpExampleCli("settleround", "\"roundid\" \"seed\"")
            + HelpExampleRpc("settleround", "\"roundid\", \"seed\"")
        );
    }

    uint256 round_id = ParseHashV(request.params[0], "round_id");
    uint256 seed = ParseHashV(request.params[1], "seed");

    RumbleRound round;
    RumbleEvents events;
    CRumbleValidationState state;
    if (!ProcessSettleRound(round_id, seed, round, state, events)) {
        throw JSONRPCRumbleError(state);
    }
    return OperationResult(round, events);
}

static UniValue resetround(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "resetround \"round_id\"\n"
            "\nReturn a settled round to idle so it can be initialized again.\n"
            "\nArguments:\n"
            "1. \"round_id\"    (string, required) The round id\n"
            "\nResult:\n"
            "{ \"round\": {...}, \"events\": [...] }\n"
            "\nExamples:\n"
            + HelpExampleCli("resetround", "\"roundid\"")
            + HelpExampleRpc("resetround", "\"roundid\"")
        );
    }

    uint256 round_id = ParseHashV(request.params[0], "round_id");

    RumbleRound round;
    RumbleEvents events;
    CRumbleValidationState state;
    if (!ProcessResetRound(round_id, round, state, events)) {
        throw JSONRPCRumbleError(state);
    }
    return OperationResult(round, events);
}

/**
 * getroundinfo - Get a round snapshot
 *
 * Returns:
 * {
 *   "round_id": "hex",
 *   "state": "idle|open|evaluating|settled",
 *   "total_pool": n,
 *   "participants": [...],
 *   "winners": [...],
 *   "settlement": {...},     (only after a settlement)
 *   "invariants_ok": true|false,
 *   "hash": "hex"
 * }
 */
static UniValue getroundinfo(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getroundinfo \"round_id\"\n"
            "\nReturns the stored snapshot of a round.\n"
            "\nArguments:\n"
            "1. \"round_id\"    (string, required) The round id\n"
            "\nResult:\n"
            "{\n"
            "  \"round_id\": \"hex\",          (string) Round id\n"
            "  \"state\": \"xxx\",             (string) idle, open, evaluating or settled\n"
            "  \"round_number\": n,          (numeric) Number of times the round was opened\n"
            "  \"total_pool\": n,            (numeric) Pool in base units\n"
            "  \"open_time\": n,             (numeric) Window start\n"
            "  \"close_time\": n,            (numeric) Window end\n"
            "  \"seed_commitment\": \"hex\",   (string) Committed settlement seed hash\n"
            "  \"participants\": [...],      (array) Participant records\n"
            "  \"winners\": [...],           (array) Winner records (settled only)\n"
            "  \"settlement\": {...},        (object, optional) Last settlement summary\n"
            "  \"invariants_ok\": true|false,(boolean) Ledger invariants hold\n"
            "  \"hash\": \"hex\"               (string) Snapshot hash\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getroundinfo", "\"roundid\"")
            + HelpExampleRpc("getroundinfo", "\"roundid\"")
        );
    }

    uint256 round_id = ParseHashV(request.params[0], "round_id");

    RumbleRound round;
    CRumbleValidationState state;
    if (!GetRumbleRound(round_id, round, state)) {
        throw JSONRPCRumbleError(state);
    }
    return RoundToJSON(round);
}

static UniValue listrounds(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "listrounds\n"
            "\nList all stored rounds.\n"
            "\nResult:\n"
            "[\n"
            "  {\n"
            "    \"round_id\": \"hex\",    (string) Round id\n"
            "    \"state\": \"xxx\",       (string) Round state\n"
            "    \"round_number\": n,    (numeric) Number of times the round was opened\n"
            "    \"total_pool\": n,      (numeric) Pool in base units\n"
            "    \"participants\": n     (numeric) Number of participants\n"
            "  }\n"
            "  ,...\n"
            "]\n"
            "\nExamples:\n"
            + HelpExampleCli("listrounds", "")
            + HelpExampleRpc("listrounds", "")
        );
    }

    std::vector<RumbleRound> rounds;
    CRumbleValidationState state;
    if (!ListRumbleRounds(rounds, state)) {
        throw JSONRPCRumbleError(state);
    }

    UniValue result(UniValue::VARR);
    for (const RumbleRound& round : rounds) {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("round_id", round.round_id.GetHex());
        obj.pushKV("state", RoundPhaseToString(round.phase));
        obj.pushKV("round_number", (int64_t)round.round_number);
        obj.pushKV("total_pool", AmountToJSON(round.total_pool));
        obj.pushKV("participants", (int64_t)round.participants.size());
        result.push_back(obj);
    }
    return result;
}

static UniValue getseedcommitment(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getseedcommitment \"seed\"\n"
            "\nCompute the commitment for a settlement seed.\n"
            "\nArguments:\n"
            "1. \"seed\"    (string, required) 32-byte seed (hex)\n"
            "\nResult:\n"
            "\"hex\"      (string) The seed commitment\n"
            "\nExamples:\n"
            + HelpExampleCli("getseedcommitment", "\"seed\"")
            + HelpExampleRpc("getseedcommitment", "\"seed\"")
        );
    }

    uint256 seed = ParseHashV(request.params[0], "seed");
    return rumble_scoring::ComputeSeedCommitment(seed).GetHex();
}

static const CRPCCommand commands[] = {
    //  category    name                      actor (function)            okSafe  argNames
    //  ----------- ------------------------  ------------------------    ------  ----------
    { "rumble",     "createround",            &createround,               false,  {"window_seconds", "seed_commitment"} },
    { "rumble",     "initializeround",        &initializeround,           false,  {"round_id", "seed_commitment", "window_seconds"} },
    { "rumble",     "deposit",                &deposit,                   false,  {"round_id", "participant", "amount", "holdings"} },
    { "rumble",     "applyactivityscores",    &applyactivityscores,       false,  {"round_id", "scores", "filtered"} },
    { "rumble",     "settleround",            &settleround,               false,  {"round_id", "seed"} },
    { "rumble",     "resetround",             &resetround,                false,  {"round_id"} },
    { "rumble",     "getroundinfo",           &getroundinfo,              true,   {"round_id"} },
    { "rumble",     "listrounds",             &listrounds,                true,   {} },
    { "util",       "getseedcommitment",      &getseedcommitment,         true,   {"seed"} },
};

void RegisterRumbleRPCCommands(CRPCTable& t)
{
    for (unsigned int vcidx = 0; vcidx < ARRAYLEN(commands); vcidx++)
        t.appendCommand(commands[vcidx].name, &commands[vcidx]);
}
