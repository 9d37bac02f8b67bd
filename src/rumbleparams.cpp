// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rumbleparams.h"

#include "util/system.h"

#include <stdexcept>

const std::string RumbleNetwork::MAIN = "main";
const std::string RumbleNetwork::TESTNET = "test";
const std::string RumbleNetwork::REGTEST = "regtest";

/**
 * Main network
 */
class CMainParams : public CRumbleParams
{
public:
    CMainParams()
    {
        strNetworkID = RumbleNetwork::MAIN;
        strDataDir = "";
        nMaxActivityScore = 1000;
        nDefaultWindowSeconds = 24 * 60 * 60;   // one day
        nAnomalyVolumeThreshold = 100000;
        nMaxParticipants = 100000;
    }
};

/**
 * Testnet
 */
class CTestNetParams : public CRumbleParams
{
public:
    CTestNetParams()
    {
        strNetworkID = RumbleNetwork::TESTNET;
        strDataDir = "testnet";
        nMaxActivityScore = 1000;
        nDefaultWindowSeconds = 60 * 60;        // one hour
        nAnomalyVolumeThreshold = 100000;
        nMaxParticipants = 100000;
    }
};

/**
 * Regression test
 */
class CRegTestParams : public CRumbleParams
{
public:
    CRegTestParams()
    {
        strNetworkID = RumbleNetwork::REGTEST;
        strDataDir = "regtest";
        nMaxActivityScore = 1000;
        nDefaultWindowSeconds = 60;
        nAnomalyVolumeThreshold = 100000;
        nMaxParticipants = 1000;
    }
};

static std::unique_ptr<const CRumbleParams> globalRumbleParams;

const CRumbleParams& Params()
{
    if (!globalRumbleParams) {
        throw std::runtime_error("Params() called before SelectParams()");
    }
    return *globalRumbleParams;
}

std::unique_ptr<const CRumbleParams> CreateRumbleParams(const std::string& network)
{
    if (network == RumbleNetwork::MAIN)
        return std::unique_ptr<const CRumbleParams>(new CMainParams());
    else if (network == RumbleNetwork::TESTNET)
        return std::unique_ptr<const CRumbleParams>(new CTestNetParams());
    else if (network == RumbleNetwork::REGTEST)
        return std::unique_ptr<const CRumbleParams>(new CRegTestParams());
    throw std::runtime_error(strprintf("%s: Unknown network %s.", __func__, network));
}

void SelectParams(const std::string& network)
{
    globalRumbleParams = CreateRumbleParams(network);
}

std::string NetworkNameFromCommandLine()
{
    bool fRegTest = gArgs.GetBoolArg("-regtest", false);
    bool fTestNet = gArgs.GetBoolArg("-testnet", false);

    if (fTestNet && fRegTest)
        throw std::runtime_error("Invalid combination of -regtest and -testnet.");
    if (fRegTest)
        return RumbleNetwork::REGTEST;
    if (fTestNet)
        return RumbleNetwork::TESTNET;
    return RumbleNetwork::MAIN;
}
