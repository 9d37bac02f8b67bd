// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RPC_REGISTER_H
#define RUMBLE_RPC_REGISTER_H

/** These are in one header file to avoid creating tons of single-function
 * headers for everything under src/rpc/ */
class CRPCTable;

/** Register round RPC commands */
void RegisterRumbleRPCCommands(CRPCTable& tableRPC);

static inline void RegisterAllCoreRPCCommands(CRPCTable& t)
{
    RegisterRumbleRPCCommands(t);
}

#endif // RUMBLE_RPC_REGISTER_H
