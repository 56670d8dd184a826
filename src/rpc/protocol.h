// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_RPC_PROTOCOL_H
#define BOUNTY_RPC_PROTOCOL_H

#include <string>

#include <univalue.h>

//! Error codes carried in the "code" field of a JSON-RPC error object
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST  = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS   = -32602,
    RPC_INTERNAL_ERROR   = -32603,
    RPC_PARSE_ERROR      = -32700,

    //! General application defined errors
    RPC_MISC_ERROR             = -1,  //!< std::exception thrown in command handling
    RPC_TYPE_ERROR             = -3,  //!< Unexpected type was passed as parameter
    RPC_INVALID_PARAMETER      = -8,  //!< Invalid, missing or duplicate parameter
    RPC_DATABASE_ERROR         = -20, //!< Database error
    RPC_VERIFY_REJECTED        = -26, //!< Operation rejected by pool rules

    //! Pool errors
    RPC_POOL_NOT_FOUND         = -40, //!< No pool with this id
    RPC_POOL_UNAUTHORIZED      = -41, //!< Caller is not the required authority
    RPC_POOL_HALTED            = -42, //!< Pool halted on a custody inconsistency
    RPC_POOL_ANCHOR_UNAVAILABLE = -43, //!< Anchor header not produced yet, retry later
};

UniValue JSONRPCError(int code, const std::string& message);

#endif // BOUNTY_RPC_PROTOCOL_H
