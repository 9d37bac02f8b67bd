// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_transfer.h"

#include "logging.h"
#include "rumble/rumble_amount.h"
#include "util/system.h"

bool CBalanceLedgerTransfer::Begin(const uint256& round_id)
{
    if (fInProgress) {
        return error("%s: transfer for round %s still in progress", __func__, pendingRound.ToString());
    }
    fInProgress = true;
    pendingRound = round_id;
    vPending.clear();
    return true;
}

bool CBalanceLedgerTransfer::PayWinner(const std::string& participant, CAmount amount)
{
    if (!fInProgress || participant.empty()) {
        return false;
    }
    vPending.push_back({participant, amount});
    return true;
}

bool CBalanceLedgerTransfer::Burn(CAmount amount)
{
    if (!fInProgress) {
        return false;
    }
    vPending.push_back({std::string(), amount});
    return true;
}

bool CBalanceLedgerTransfer::Commit()
{
    if (!fInProgress) {
        return false;
    }

    // Apply to copies so that an overflow leaves the ledger untouched
    std::map<std::string, CAmount> balances = mapBalances;
    CAmount burned = nBurned;
    for (const PendingTransfer& t : vPending) {
        CAmount& target = t.participant.empty() ? burned : balances[t.participant];
        if (target > MAX_MONEY - t.amount) {
            LogPrintf("ERROR: %s: balance overflow for %s in round %s\n", __func__,
                      t.participant.empty() ? "burn" : t.participant, pendingRound.ToString());
            Abort();
            return false;
        }
        target += t.amount;
    }

    mapBalances.swap(balances);
    nBurned = burned;

    LogPrint(BCLog::TRANSFER, "CBalanceLedgerTransfer: committed %u transfers for round %s (burned total %s)\n",
             vPending.size(), pendingRound.ToString(), FormatMoney(nBurned));

    vPending.clear();
    fInProgress = false;
    return true;
}

void CBalanceLedgerTransfer::Abort()
{
    if (fInProgress) {
        LogPrint(BCLog::TRANSFER, "CBalanceLedgerTransfer: aborted %u staged transfers for round %s\n",
                 vPending.size(), pendingRound.ToString());
    }
    vPending.clear();
    fInProgress = false;
}

CAmount CBalanceLedgerTransfer::GetBalance(const std::string& participant) const
{
    auto it = mapBalances.find(participant);
    return it == mapBalances.end() ? 0 : it->second;
}

bool CBalanceLedgerTransfer::GetTotalMoved(CAmount& nTotal, CRumbleValidationState& state) const
{
    CAmount nSum = nBurned;
    for (const auto& entry : mapBalances) {
        if (!rumble_amount::CheckedAdd(nSum, entry.second, nSum, state)) {
            return false;
        }
    }
    nTotal = nSum;
    return true;
}
