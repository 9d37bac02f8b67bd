// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLE_ROUNDDB_H
#define RUMBLE_RUMBLE_ROUNDDB_H

#include "dbwrapper.h"
#include "rumble/rumble_round.h"
#include "uint256.h"

#include <stdint.h>
#include <vector>

/**
 * CRumbleRoundDB - LevelDB persistence layer for round snapshots
 *
 * Database keys:
 * - 'R' + round_id -> RumbleRound
 *
 * Each operation loads the whole snapshot, mutates it and writes it back.
 */
class CRumbleRoundDB : public CDBWrapper
{
public:
    explicit CRumbleRoundDB(size_t nCacheSize, bool fMemory = false, bool fWipe = false);

private:
    CRumbleRoundDB(const CRumbleRoundDB&);
    void operator=(const CRumbleRoundDB&);

public:
    /**
     * WriteRound - Persist a round snapshot under its round_id
     *
     * @param round Snapshot to write
     * @return true on success, false on failure
     */
    bool WriteRound(const RumbleRound& round);

    /**
     * ReadRound - Read the snapshot of a round
     *
     * A stored snapshot that fails CheckInvariants() is not returned.
     *
     * @param round_id Round identifier
     * @param round Output parameter for the snapshot
     * @return true if a valid snapshot exists
     */
    bool ReadRound(const uint256& round_id, RumbleRound& round) const;

    bool ExistsRound(const uint256& round_id) const;

    bool EraseRound(const uint256& round_id);

    /** Ids of all stored rounds, ascending */
    bool ListRounds(std::vector<uint256>& vRoundIds);
};

#endif // RUMBLE_RUMBLE_ROUNDDB_H
