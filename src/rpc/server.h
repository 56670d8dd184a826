// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_RPC_SERVER_H
#define BOUNTY_RPC_SERVER_H

#include "amount.h"
#include "rpc/protocol.h"
#include "uint256.h"

#include <list>
#include <map>
#include <stdint.h>
#include <string>
#include <vector>

#include <univalue.h>

class CValidationState;

class JSONRPCRequest
{
public:
    UniValue id;
    std::string strMethod;
    UniValue params;
    bool fHelp;

    JSONRPCRequest() : id(NullUniValue), params(NullUniValue), fHelp(false) {}
};

typedef UniValue (*rpcfn_type)(const JSONRPCRequest& jsonRequest);

class CRPCCommand
{
public:
    std::string category;
    std::string name;
    rpcfn_type actor;
    bool okSafeMode;
    std::vector<std::string> argNames;
};

/**
 * Bountyd RPC command dispatcher.
 */
class CRPCTable
{
private:
    std::map<std::string, const CRPCCommand*> mapCommands;

public:
    CRPCTable();
    const CRPCCommand* operator[](const std::string& name) const;
    std::string help(const std::string& name) const;

    /**
     * Execute a method.
     * @param request The JSONRPCRequest to execute
     * @returns Result of the call.
     * @throws an exception (UniValue) when an error happens.
     */
    UniValue execute(const JSONRPCRequest& request) const;

    /**
     * Returns a list of registered commands
     * @returns List of registered commands.
     */
    std::vector<std::string> listCommands() const;

    /**
     * Appends a CRPCCommand to the dispatch table.
     * Commands cannot be overwritten (returns false).
     */
    bool appendCommand(const std::string& name, const CRPCCommand* pcmd);
};

extern CRPCTable tableRPC;

/**
 * Utilities: convert hex-encoded values
 * (throws error if not 64 hex characters)
 */
uint256 ParseHashV(const UniValue& v, const std::string& strName);
uint256 ParseHashO(const UniValue& o, const std::string& strKey);

/** Non-negative integer amount from a JSON number or numeric string */
CAmount AmountFromValue(const UniValue& value);

/** Throws the JSON-RPC error matching a failed pool operation */
[[noreturn]] void ThrowStateError(const CValidationState& state);

std::string HelpExampleCli(const std::string& methodname, const std::string& args);

#endif // BOUNTY_RPC_SERVER_H
