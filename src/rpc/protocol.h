// Copyright (c) 2025 The Rumble Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RUMBLE_RPC_PROTOCOL_H
#define RUMBLE_RPC_PROTOCOL_H

#include <univalue.h>

#include <string>

//! Rumble RPC error codes
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST  = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS   = -32602,
    RPC_INTERNAL_ERROR   = -32603,
    RPC_PARSE_ERROR      = -32700,

    //! General application defined errors
    RPC_MISC_ERROR                  = -1,  //!< std::exception thrown in command handling
    RPC_TYPE_ERROR                  = -3,  //!< Unexpected type was passed as parameter
    RPC_INVALID_PARAMETER           = -8,  //!< Invalid, missing or duplicate parameter
    RPC_DATABASE_ERROR              = -20, //!< Database error

    //! Round operation errors, one per failure kind
    RPC_RUMBLE_INVALID_DEPOSIT        = -101,
    RPC_RUMBLE_ROUND_NOT_OPEN         = -102,
    RPC_RUMBLE_ROUND_NOT_FOUND        = -103,
    RPC_RUMBLE_ROUND_ALREADY_SETTLED  = -104,
    RPC_RUMBLE_ROUND_NOT_SETTLED      = -105,
    RPC_RUMBLE_NO_DEPOSITS            = -106,
    RPC_RUMBLE_ARITHMETIC_OVERFLOW    = -107,
    RPC_RUMBLE_DIVISION_BY_ZERO       = -108,
    RPC_RUMBLE_TRANSFER_FAILED        = -109,
    RPC_RUMBLE_ROUND_ALREADY_OPEN     = -110,
    RPC_RUMBLE_INVALID_SEED_REVEAL    = -111,
    RPC_RUMBLE_STORAGE_FAILURE        = -112,
};

UniValue JSONRPCRequestObj(const std::string& strMethod, const UniValue& params, const UniValue& id);
UniValue JSONRPCReplyObj(const UniValue& result, const UniValue& error, const UniValue& id);
std::string JSONRPCReply(const UniValue& result, const UniValue& error, const UniValue& id);
UniValue JSONRPCError(int code, const std::string& message);

#endif // RUMBLE_RPC_PROTOCOL_H
