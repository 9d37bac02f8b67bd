// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumble/rumble_rounddb.h"

#include "logging.h"
#include "util/system.h"

#include <memory>

static const char DB_RUMBLE_ROUND = 'R';

CRumbleRoundDB::CRumbleRoundDB(size_t nCacheSize, bool fMemory, bool fWipe) :
    CDBWrapper(GetDataDir() / "rumble" / "rounds", nCacheSize, fMemory, fWipe)
{
}

bool CRumbleRoundDB::WriteRound(const RumbleRound& round)
{
    LogPrint(BCLog::DB, "CRumbleRoundDB: write %s hash=%s\n", round.ToString(), round.GetHash().ToString());
    return Write(std::make_pair(DB_RUMBLE_ROUND, round.round_id), round, true);
}

bool CRumbleRoundDB::ReadRound(const uint256& round_id, RumbleRound& round) const
{
    RumbleRound loaded;
    if (!Read(std::make_pair(DB_RUMBLE_ROUND, round_id), loaded)) {
        return false;
    }
    if (loaded.round_id != round_id || !loaded.CheckInvariants()) {
        return error("%s: stored snapshot of round %s is inconsistent", __func__, round_id.ToString());
    }
    round = loaded;
    return true;
}

bool CRumbleRoundDB::ExistsRound(const uint256& round_id) const
{
    return Exists(std::make_pair(DB_RUMBLE_ROUND, round_id));
}

bool CRumbleRoundDB::EraseRound(const uint256& round_id)
{
    return Erase(std::make_pair(DB_RUMBLE_ROUND, round_id), true);
}

bool CRumbleRoundDB::ListRounds(std::vector<uint256>& vRoundIds)
{
    std::unique_ptr<CDBIterator> pcursor(NewIterator());

    pcursor->Seek(std::make_pair(DB_RUMBLE_ROUND, uint256()));

    while (pcursor->Valid()) {
        std::pair<char, uint256> key;
        if (pcursor->GetKey(key) && key.first == DB_RUMBLE_ROUND) {
            vRoundIds.push_back(key.second);
            pcursor->Next();
        } else {
            break;
        }
    }

    return true;
}
