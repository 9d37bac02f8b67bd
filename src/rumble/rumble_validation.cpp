// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_validation.h"

#include "logging.h"
#include "random.h"
#include "rumble/rumble_rounddb.h"
#include "rumble/rumble_statemachine.h"
#include "rumble/rumble_transfer.h"
#include "rumbleparams.h"
#include "sync.h"
#include "util/system.h"
#include "utiltime.h"

#include <functional>

// Global round database
static std::unique_ptr<CRumbleRoundDB> prumbleroundDB;

// Collaborators installed by the daemon or the tests
static std::shared_ptr<CValueTransfer> prumbletransfer;
static std::shared_ptr<CRumbleNotifier> prumblenotifier;

// Round lock (serializes every load-operate-save cycle)
static RecursiveMutex cs_rumble;

typedef std::function<bool(RumbleRound&, CRumbleValidationState&, RumbleEvents&)> RoundOperation;

bool InitRumbleRoundDB(size_t nCacheSize, bool fMemory, bool fWipe)
{
    LOCK(cs_rumble);

    try {
        prumbleroundDB.reset();
        prumbleroundDB = std::make_unique<CRumbleRoundDB>(nCacheSize, fMemory, fWipe);
        if (!prumbletransfer) {
            prumbletransfer = std::make_shared<CBalanceLedgerTransfer>();
        }
        LogPrint(BCLog::RUMBLE, "Rumble: Initialized round database (cache=%u memory=%d)\n", nCacheSize, fMemory);
        return true;
    } catch (const std::exception& e) {
        LogPrintf("ERROR: Failed to initialize Rumble round database: %s\n", e.what());
        return false;
    }
}

CRumbleRoundDB* GetRumbleRoundDB()
{
    return prumbleroundDB.get();
}

void ShutdownRumbleRoundDB()
{
    LOCK(cs_rumble);
    prumbleroundDB.reset();
}

void SetRumbleTransfer(std::shared_ptr<CValueTransfer> transfer)
{
    LOCK(cs_rumble);
    prumbletransfer = transfer;
}

std::shared_ptr<CValueTransfer> GetRumbleTransfer()
{
    LOCK(cs_rumble);
    return prumbletransfer;
}

void SetRumbleNotifier(std::shared_ptr<CRumbleNotifier> notifier)
{
    LOCK(cs_rumble);
    prumblenotifier = notifier;
}

static bool LoadRound(const uint256& round_id, RumbleRound& round, CRumbleValidationState& state)
{
    CRumbleRoundDB* db = GetRumbleRoundDB();
    if (!db) {
        return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-db-not-initialized");
    }

    try {
        if (!db->ExistsRound(round_id)) {
            return state.Invalid(RumbleError::ROUND_NOT_FOUND, "rumble-round-not-found", round_id.ToString());
        }
        if (!db->ReadRound(round_id, round)) {
            return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-round-corrupt", round_id.ToString());
        }
    } catch (const std::exception& e) {
        return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-db-read-failed", e.what());
    }
    return true;
}

static bool SaveRound(const RumbleRound& round, CRumbleValidationState& state)
{
    CRumbleRoundDB* db = GetRumbleRoundDB();
    if (!db) {
        return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-db-not-initialized");
    }

    try {
        if (!db->WriteRound(round)) {
            return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-db-write-failed", round.round_id.ToString());
        }
    } catch (const std::exception& e) {
        return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-db-write-failed", e.what());
    }
    return true;
}

/** Load round_id for an operation; caller holds cs_rumble */
static bool LoadRoundForOperation(const char* strOperation,
                                  const uint256& round_id,
                                  bool fCreate,
                                  RumbleRound& round,
                                  CRumbleValidationState& state)
{
    if (round_id.IsNull()) {
        return state.Invalid(RumbleError::ROUND_NOT_FOUND, "rumble-round-not-found", "null round id");
    }

    CRumbleValidationState loadState;
    if (!LoadRound(round_id, round, loadState)) {
        if (!fCreate || loadState.GetError() != RumbleError::ROUND_NOT_FOUND) {
            state = loadState;
            return false;
        }
        LogPrint(BCLog::RUMBLE, "%s: creating round %s\n", strOperation, round_id.ToString());
    }
    return true;
}

/** Notify and hand the stored round and its events back to the caller */
static void PublishRound(const RumbleRound& round,
                         const RumbleEvents& vNewEvents,
                         RumbleRound& roundOut,
                         RumbleEvents& events)
{
    if (prumblenotifier) {
        DispatchEvents(*prumblenotifier, vNewEvents);
    }

    events.insert(events.end(), vNewEvents.begin(), vNewEvents.end());
    roundOut = round;
}

/**
 * ProcessRoundOperation - Load, operate on a copy, save, dispatch
 *
 * @param fCreate  an unknown round_id starts as a fresh IDLE round instead
 *                 of failing with ROUND_NOT_FOUND
 */
static bool ProcessRoundOperation(const char* strOperation,
                                  const uint256& round_id,
                                  bool fCreate,
                                  const RoundOperation& op,
                                  RumbleRound& roundOut,
                                  CRumbleValidationState& state,
                                  RumbleEvents& events)
{
    LOCK(cs_rumble);

    RumbleRound round(round_id);
    if (!LoadRoundForOperation(strOperation, round_id, fCreate, round, state)) {
        return false;
    }

    RumbleEvents vNewEvents;
    if (!op(round, state, vNewEvents)) {
        LogPrint(BCLog::RUMBLE, "%s: round %s rejected: %s\n", strOperation, round_id.ToString(), state.ToString());
        return false;
    }

    if (!round.CheckInvariants()) {
        return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-invariant-violation",
                             strprintf("%s broke the ledger invariants", strOperation));
    }

    if (!SaveRound(round, state)) {
        LogPrintf("ERROR: %s: round %s could not be saved: %s\n", strOperation, round_id.ToString(), state.ToString());
        return false;
    }

    PublishRound(round, vNewEvents, roundOut, events);
    return true;
}

bool ProcessCreateRound(const uint256& seed_commitment,
                        uint32_t nWindowSeconds,
                        RumbleRound& roundOut,
                        CRumbleValidationState& state,
                        RumbleEvents& events)
{
    LOCK(cs_rumble);

    CRumbleRoundDB* db = GetRumbleRoundDB();
    if (!db) {
        return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-db-not-initialized");
    }

    uint256 round_id;
    try {
        do {
            round_id = GetRandHash();
        } while (db->ExistsRound(round_id));
    } catch (const std::exception& e) {
        return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-create-failed", e.what());
    }

    return ProcessInitializeRound(round_id, seed_commitment, nWindowSeconds, roundOut, state, events);
}

bool ProcessInitializeRound(const uint256& round_id,
                            const uint256& seed_commitment,
                            uint32_t nWindowSeconds,
                            RumbleRound& roundOut,
                            CRumbleValidationState& state,
                            RumbleEvents& events)
{
    const int64_t nTime = GetTime();
    return ProcessRoundOperation("ProcessInitializeRound", round_id, true,
        [&](RumbleRound& round, CRumbleValidationState& s, RumbleEvents& ev) {
            return InitializeRound(round, seed_commitment, nWindowSeconds, nTime, s, ev);
        },
        roundOut, state, events);
}

bool ProcessDeposit(const uint256& round_id,
                    const std::string& participant,
                    CAmount amount,
                    const boost::optional<CAmount>& holdings,
                    RumbleRound& roundOut,
                    CRumbleValidationState& state,
                    RumbleEvents& events)
{
    const int64_t nTime = GetTime();
    return ProcessRoundOperation("ProcessDeposit", round_id, false,
        [&](RumbleRound& round, CRumbleValidationState& s, RumbleEvents& ev) {
            return DepositToRound(round, participant, amount, holdings, Params(), nTime, s, ev);
        },
        roundOut, state, events);
}

bool ProcessApplyActivityScores(const uint256& round_id,
                                const ActivityScoreMap& scores,
                                RumbleRound& roundOut,
                                CRumbleValidationState& state,
                                RumbleEvents& events)
{
    const int64_t nTime = GetTime();
    return ProcessRoundOperation("ProcessApplyActivityScores", round_id, false,
        [&](RumbleRound& round, CRumbleValidationState& s, RumbleEvents& ev) {
            return ApplyRoundActivityScores(round, scores, Params(), nTime, s, ev);
        },
        roundOut, state, events);
}

bool ProcessEvaluateActivity(const uint256& round_id,
                             const ActivityScoreFn& source,
                             RumbleRound& roundOut,
                             CRumbleValidationState& state,
                             RumbleEvents& events)
{
    const int64_t nTime = GetTime();
    return ProcessRoundOperation("ProcessEvaluateActivity", round_id, false,
        [&](RumbleRound& round, CRumbleValidationState& s, RumbleEvents& ev) {
            return EvaluateRoundActivity(round, source, Params(), nTime, s, ev);
        },
        roundOut, state, events);
}

bool ProcessSettleRound(const uint256& round_id,
                        const uint256& seed,
                        RumbleRound& roundOut,
                        CRumbleValidationState& state,
                        RumbleEvents& events)
{
    LOCK(cs_rumble);

    std::shared_ptr<CValueTransfer> transfer = prumbletransfer;
    if (!transfer) {
        return state.Invalid(RumbleError::WINNER_TRANSFER_FAILED, "rumble-no-transfer", "no value transfer installed");
    }

    RumbleRound round(round_id);
    if (!LoadRoundForOperation("ProcessSettleRound", round_id, false, round, state)) {
        return false;
    }

    // Stage the transfers on a copy, nothing has moved yet
    RumbleRound settled = round;
    RumbleEvents vNewEvents;
    if (!StageSettlement(settled, seed, *transfer, Params(), GetTime(), state, vNewEvents)) {
        LogPrint(BCLog::RUMBLE, "ProcessSettleRound: round %s rejected: %s\n", round_id.ToString(), state.ToString());
        return false;
    }

    if (!settled.CheckInvariants()) {
        transfer->Abort();
        return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-invariant-violation",
                             "ProcessSettleRound broke the ledger invariants");
    }

    // Persist the settled round before any value moves: a retry after a
    // crash past this point sees SETTLED and cannot pay twice
    if (!SaveRound(settled, state)) {
        transfer->Abort();
        LogPrintf("ERROR: ProcessSettleRound: round %s could not be saved: %s\n", round_id.ToString(), state.ToString());
        return false;
    }

    if (!transfer->Commit()) {
        transfer->Abort();
        CRumbleValidationState restoreState;
        if (!SaveRound(round, restoreState)) {
            LogPrintf("ERROR: ProcessSettleRound: round %s stored as settled but no value moved: %s\n",
                      round_id.ToString(), restoreState.ToString());
            return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-settle-restore-failed", restoreState.ToString());
        }
        return state.Invalid(RumbleError::WINNER_TRANSFER_FAILED, "rumble-transfer-failed", "commit failed");
    }

    LogSettlement(settled);
    PublishRound(settled, vNewEvents, roundOut, events);
    return true;
}

bool ProcessResetRound(const uint256& round_id,
                       RumbleRound& roundOut,
                       CRumbleValidationState& state,
                       RumbleEvents& events)
{
    const int64_t nTime = GetTime();
    return ProcessRoundOperation("ProcessResetRound", round_id, false,
        [&](RumbleRound& round, CRumbleValidationState& s, RumbleEvents& ev) {
            return ResetRound(round, nTime, s, ev);
        },
        roundOut, state, events);
}

bool GetRumbleRound(const uint256& round_id, RumbleRound& round, CRumbleValidationState& state)
{
    LOCK(cs_rumble);
    return LoadRound(round_id, round, state);
}

bool ListRumbleRounds(std::vector<RumbleRound>& rounds, CRumbleValidationState& state)
{
    LOCK(cs_rumble);

    CRumbleRoundDB* db = GetRumbleRoundDB();
    if (!db) {
        return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-db-not-initialized");
    }

    std::vector<uint256> vRoundIds;
    try {
        db->ListRounds(vRoundIds);
    } catch (const std::exception& e) {
        return state.Invalid(RumbleError::STORAGE_FAILURE, "rumble-db-read-failed", e.what());
    }

    for (const uint256& round_id : vRoundIds) {
        RumbleRound round;
        if (!LoadRound(round_id, round, state)) {
            return false;
        }
        rounds.push_back(round);
    }
    return true;
}
