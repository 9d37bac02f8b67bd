// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "rumble/rumble_events.h"
#include "rumble/rumble_validation.h"
#include "rumbleparams.h"
#include "util/system.h"

#include <univalue.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

static const int64_t DEFAULT_DB_CACHE = 8; // MiB

static void PrintUsage()
{
    std::string strUsage =
        "Rumble round daemon\n"
        "\nUsage:  rumbled [options]\n"
        "\nReads one JSON-RPC request per line from stdin and writes one reply per line to stdout.\n"
        "\nOptions:\n"
        "  -?                     This help message\n"
        "  -conf=<file>           Specify configuration file (default: " + std::string(RUMBLE_CONF_FILENAME) + ")\n"
        "  -datadir=<dir>         Specify data directory\n"
        "  -testnet               Use the test network parameters\n"
        "  -regtest               Use the regression test parameters\n"
        "  -dbcache=<n>           Round database cache size in MiB (default: " + std::to_string(DEFAULT_DB_CACHE) + ")\n"
        "  -window=<n>            Default deposit window in seconds (default: network dependent)\n"
        "  -debug=<category>      Output debugging information (categories: " + ListLogCategories() + ")\n"
        "  -printtoconsole        Send trace/debug info to the console (stderr) instead of debug.log\n";
    fprintf(stdout, "%s", strUsage.c_str());
}

static bool AppInitLogging()
{
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    logger.m_print_to_file = gArgs.GetBoolArg("-debuglogfile", true);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    logger.m_file_path = GetDataDir() / DEFAULT_DEBUGLOGFILE;

    if (logger.m_print_to_file) {
        logger.ShrinkDebugFile();
        if (!logger.OpenDebugLog()) {
            fprintf(stderr, "Error: Could not open debug log file %s\n", logger.m_file_path.string().c_str());
            return false;
        }
    }

    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (!logger.EnableCategory(cat)) {
            LogPrintf("Unsupported logging category -debug=%s.\n", cat);
        }
    }
    return true;
}

static UniValue HandleRequestLine(const std::string& strLine)
{
    JSONRPCRequest jreq;
    try {
        UniValue valRequest;
        if (!valRequest.read(strLine))
            throw JSONRPCError(RPC_PARSE_ERROR, "Parse error");

        jreq.parse(valRequest);
        UniValue result = tableRPC.execute(jreq);
        return JSONRPCReplyObj(result, NullUniValue, jreq.id);
    } catch (const UniValue& objError) {
        return JSONRPCReplyObj(NullUniValue, objError, jreq.id);
    } catch (const std::exception& e) {
        return JSONRPCReplyObj(NullUniValue, JSONRPCError(RPC_PARSE_ERROR, e.what()), jreq.id);
    }
}

static bool AppInit(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return false;
    }

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        PrintUsage();
        return true;
    }

    if (gArgs.IsArgSet("-datadir") && !fs::is_directory(GetDataDir(false))) {
        fprintf(stderr, "Error: Specified data directory \"%s\" does not exist.\n", gArgs.GetArg("-datadir", "").c_str());
        return false;
    }

    if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", RUMBLE_CONF_FILENAME), error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return false;
    }

    // Check for -testnet or -regtest parameter (Params() calls are only valid after this clause)
    try {
        SelectParams(NetworkNameFromCommandLine());
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return false;
    }

    if (!AppInitLogging()) {
        return false;
    }

    LogPrintf("Rumble daemon starting, network=%s datadir=%s\n", Params().NetworkIDString(), GetDataDir().string());

    int64_t nDbCache = gArgs.GetArg("-dbcache", DEFAULT_DB_CACHE);
    if (nDbCache < 1)
        nDbCache = 1;
    if (!InitRumbleRoundDB(static_cast<size_t>(nDbCache) << 20)) {
        fprintf(stderr, "Error: could not open the round database, see debug.log\n");
        return false;
    }

    SetRumbleNotifier(std::make_shared<CLogNotifier>());
    RegisterAllCoreRPCCommands(tableRPC);

    std::string strLine;
    while (!ShutdownRequested() && std::getline(std::cin, strLine)) {
        if (strLine.empty())
            continue;
        std::cout << HandleRequestLine(strLine).write() << std::endl;
    }

    LogPrintf("Rumble daemon shutting down\n");
    ShutdownRumbleRoundDB();
    return true;
}

int main(int argc, char* argv[])
{
    return (AppInit(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE);
}
