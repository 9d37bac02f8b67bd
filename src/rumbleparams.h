// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RUMBLEPARAMS_H
#define RUMBLE_RUMBLEPARAMS_H

#include "amount.h"

#include <memory>
#include <stdint.h>
#include <string>

/**
 * Network names accepted by SelectParams().
 */
struct RumbleNetwork
{
    static const std::string MAIN;
    static const std::string TESTNET;
    static const std::string REGTEST;
};

/**
 * CRumbleParams - Per-network tunables of the round engine
 *
 * Settlement policy (weights, 90/10 split, winner decile) is NOT here: it is
 * fixed in rumble_scoring.h / rumble_payout.h and only changes with a new
 * policy version. What lives here are operational bounds that legitimately
 * differ between a production deployment and a regression-test setup.
 */
class CRumbleParams
{
public:
    const std::string& NetworkIDString() const { return strNetworkID; }
    const std::string& DataDir() const { return strDataDir; }
    bool IsRegTestNet() const { return strNetworkID == RumbleNetwork::REGTEST; }

    /** Upper bound of an externally supplied activity score */
    uint32_t MaxActivityScore() const { return nMaxActivityScore; }
    /** Length of the deposit window when initialize does not specify one */
    int64_t DefaultWindowSeconds() const { return nDefaultWindowSeconds; }
    /** Summed buy+sell volume above which the anomaly filter zeroes a score */
    uint64_t AnomalyVolumeThreshold() const { return nAnomalyVolumeThreshold; }
    /** Maximum number of distinct participants in one round */
    uint32_t MaxParticipants() const { return nMaxParticipants; }

protected:
    CRumbleParams() {}

    std::string strNetworkID;
    std::string strDataDir;
    uint32_t nMaxActivityScore;
    int64_t nDefaultWindowSeconds;
    uint64_t nAnomalyVolumeThreshold;
    uint32_t nMaxParticipants;
};

/**
 * Creates and returns a std::unique_ptr<CRumbleParams> of the chosen network.
 * @throws std::runtime_error when the network is not supported.
 */
std::unique_ptr<const CRumbleParams> CreateRumbleParams(const std::string& network);

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CRumbleParams& Params();

/**
 * Sets the params returned by Params() to those for the given network.
 * @throws std::runtime_error when the network is not supported.
 */
void SelectParams(const std::string& network);

/**
 * Looks for -regtest, -testnet and returns the appropriate network name.
 * @return RumbleNetwork::MAIN by default.
 * @throws std::runtime_error when both -regtest and -testnet are set.
 */
std::string NetworkNameFromCommandLine();

#endif // RUMBLE_RUMBLEPARAMS_H
