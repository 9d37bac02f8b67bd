// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_TRANSFER_H
#define RUMBLE_RUMBLE_TRANSFER_H

#include "amount.h"
#include "rumble/rumble_errors.h"
#include "uint256.h"

#include <map>
#include <string>
#include <vector>

/**
 * CValueTransfer - Value movement out of a settled pool
 *
 * Settlement stages one PayWinner per winner and one Burn, then commits.
 * Any false return makes the settlement abort the attempt and fail; no
 * staged transfer may take effect before Commit() returns true.
 */
class CValueTransfer
{
public:
    virtual ~CValueTransfer() {}

    virtual bool Begin(const uint256& round_id) = 0;
    virtual bool PayWinner(const std::string& participant, CAmount amount) = 0;
    virtual bool Burn(CAmount amount) = 0;
    virtual bool Commit() = 0;
    virtual void Abort() = 0;
};

/**
 * CBalanceLedgerTransfer - In-process balance ledger
 *
 * Keeps credited balances per participant and a burned total. Staged
 * transfers are applied all-or-nothing at Commit.
 */
class CBalanceLedgerTransfer : public CValueTransfer
{
private:
    struct PendingTransfer
    {
        std::string participant; // empty for burn
        CAmount amount;
    };

    std::map<std::string, CAmount> mapBalances;
    CAmount nBurned;

    bool fInProgress;
    uint256 pendingRound;
    std::vector<PendingTransfer> vPending;

public:
    CBalanceLedgerTransfer() : nBurned(0), fInProgress(false) {}

    bool Begin(const uint256& round_id) override;
    bool PayWinner(const std::string& participant, CAmount amount) override;
    bool Burn(CAmount amount) override;
    bool Commit() override;
    void Abort() override;

    CAmount GetBalance(const std::string& participant) const;
    CAmount GetBurned() const { return nBurned; }
    /** Sum of all credited balances plus burned (ARITHMETIC_OVERFLOW past MAX_MONEY) */
    bool GetTotalMoved(CAmount& nTotal, CRumbleValidationState& state) const;
};

#endif // RUMBLE_RUMBLE_TRANSFER_H
