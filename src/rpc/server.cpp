// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"

#include "consensus/validation.h"
#include "logging.h"
#include "rpc/register.h"
#include "utilmoneystr.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_map>

#include <boost/algorithm/string/case_conv.hpp>

UniValue JSONRPCError(int code, const std::string& message)
{
    UniValue error(UniValue::VOBJ);
    error.pushKV("code", code);
    error.pushKV("message", message);
    return error;
}

uint256 ParseHashV(const UniValue& v, const std::string& strName)
{
    std::string strHex;
    if (v.isStr())
        strHex = v.get_str();
    if (!IsHex256(strHex))
        throw JSONRPCError(RPC_INVALID_PARAMETER, strName + " must be a 64 character hexadecimal string (not '" + strHex + "')");
    return uint256S(strHex);
}

uint256 ParseHashO(const UniValue& o, const std::string& strKey)
{
    return ParseHashV(find_value(o, strKey), strKey);
}

CAmount AmountFromValue(const UniValue& value)
{
    if (!value.isNum() && !value.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount is not a number or string");
    CAmount amount;
    if (!ParseMoney(value.getValStr(), amount))
        throw JSONRPCError(RPC_TYPE_ERROR, "Invalid amount");
    if (!MoneyRange(amount))
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount out of range");
    return amount;
}

static int RPCErrorFromPoolError(PoolError code)
{
    switch (code) {
    case PoolError::UNKNOWN_POOL:
        return RPC_POOL_NOT_FOUND;
    case PoolError::UNAUTHORIZED:
        return RPC_POOL_UNAUTHORIZED;
    case PoolError::POOL_HALTED:
    case PoolError::INSUFFICIENT_CUSTODY:
        return RPC_POOL_HALTED;
    case PoolError::ANCHOR_UNAVAILABLE:
        return RPC_POOL_ANCHOR_UNAVAILABLE;
    case PoolError::DATABASE_ERROR:
        return RPC_DATABASE_ERROR;
    default:
        return RPC_VERIFY_REJECTED;
    }
}

void ThrowStateError(const CValidationState& state)
{
    UniValue error = JSONRPCError(RPCErrorFromPoolError(state.GetCode()), FormatStateMessage(state));
    error.pushKV("error", GetPoolErrorName(state.GetCode()));
    error.pushKV("reason", state.GetRejectReason());
    throw error;
}

std::string HelpExampleCli(const std::string& methodname, const std::string& args)
{
    return "> bountyd " + methodname + " " + args + "\n";
}

CRPCTable::CRPCTable()
{
}

const CRPCCommand* CRPCTable::operator[](const std::string& name) const
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it == mapCommands.end())
        return nullptr;
    return (*it).second;
}

bool CRPCTable::appendCommand(const std::string& name, const CRPCCommand* pcmd)
{
    std::map<std::string, const CRPCCommand*>::const_iterator it = mapCommands.find(name);
    if (it != mapCommands.end())
        return false;

    mapCommands[name] = pcmd;
    return true;
}

std::string CRPCTable::help(const std::string& strCommand) const
{
    std::string strRet;
    std::string category;
    std::set<rpcfn_type> setDone;
    std::vector<std::pair<std::string, const CRPCCommand*> > vCommands;

    for (const auto& entry : mapCommands)
        vCommands.emplace_back(entry.second->category + entry.first, entry.second);
    std::sort(vCommands.begin(), vCommands.end());

    JSONRPCRequest jreq;
    jreq.fHelp = true;
    jreq.params = UniValue();

    for (const auto& command : vCommands) {
        const CRPCCommand* pcmd = command.second;
        std::string strMethod = pcmd->name;
        if (strCommand != "" && strMethod != strCommand)
            continue;
        jreq.strMethod = strMethod;
        try {
            rpcfn_type pfn = pcmd->actor;
            if (setDone.insert(pfn).second)
                (*pfn)(jreq);
        } catch (const std::exception& e) {
            // Help text is returned in an exception
            std::string strHelp = std::string(e.what());
            if (strCommand == "") {
                if (strHelp.find('\n') != std::string::npos)
                    strHelp = strHelp.substr(0, strHelp.find('\n'));

                if (category != pcmd->category) {
                    if (!category.empty())
                        strRet += "\n";
                    category = pcmd->category;
                    std::string firstLetter = category.substr(0, 1);
                    boost::to_upper(firstLetter);
                    strRet += "== " + firstLetter + category.substr(1) + " ==\n";
                }
            }
            strRet += strHelp + "\n";
        }
    }
    if (strRet == "")
        strRet = strprintf("help: unknown command: %s\n", strCommand);
    strRet = strRet.substr(0, strRet.size() - 1);
    return strRet;
}

/**
 * Process named arguments into a vector of positional arguments, based on the
 * argument names registered for the RPC call.
 */
static inline JSONRPCRequest transformNamedArguments(const JSONRPCRequest& in, const std::vector<std::string>& argNames)
{
    JSONRPCRequest out = in;
    out.params = UniValue(UniValue::VARR);
    // Build a map of parameters, and remove ones that have been processed, so that we can throw a focused error if
    // there is an unknown one.
    const std::vector<std::string>& keys = in.params.getKeys();
    const std::vector<UniValue>& values = in.params.getValues();
    std::unordered_map<std::string, const UniValue*> argsIn;
    for (size_t i = 0; i < keys.size(); ++i) {
        argsIn[keys[i]] = &values[i];
    }
    // Process expected parameters.
    int hole = 0;
    for (const std::string& argName : argNames) {
        auto fr = argsIn.find(argName);
        if (fr != argsIn.end()) {
            for (int i = 0; i < hole; ++i) {
                // Fill hole between specified parameters with JSON nulls,
                // but not at the end (for backwards compatibility with calls
                // that act based on number of specified parameters).
                out.params.push_back(UniValue());
            }
            hole = 0;
            out.params.push_back(*fr->second);
            argsIn.erase(fr);
        } else {
            hole += 1;
        }
    }
    // If there are still arguments in the argsIn map, this is an error.
    if (!argsIn.empty()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Unknown named parameter " + argsIn.begin()->first);
    }
    // Return request with named arguments transformed to positional arguments
    return out;
}

UniValue CRPCTable::execute(const JSONRPCRequest& request) const
{
    // Find method
    const CRPCCommand* pcmd = tableRPC[request.strMethod];
    if (!pcmd)
        throw JSONRPCError(RPC_METHOD_NOT_FOUND, "Method not found");

    LogPrint(BCLog::RPC, "RPC method=%s\n", request.strMethod);

    try {
        // Execute, convert arguments to array if necessary
        if (request.params.isObject()) {
            return pcmd->actor(transformNamedArguments(request, pcmd->argNames));
        } else {
            return pcmd->actor(request);
        }
    } catch (const std::exception& e) {
        throw JSONRPCError(RPC_MISC_ERROR, e.what());
    }
}

std::vector<std::string> CRPCTable::listCommands() const
{
    std::vector<std::string> commandList;
    for (const auto& i : mapCommands)
        commandList.emplace_back(i.first);
    return commandList;
}

static UniValue help(const JSONRPCRequest& jsonRequest)
{
    if (jsonRequest.fHelp || jsonRequest.params.size() > 1)
        throw std::runtime_error(
            "help ( \"command\" )\n"
            "\nList all commands, or get help for a specified command.\n"
            "\nArguments:\n"
            "1. \"command\"     (string, optional) The command to get help on\n"
            "\nResult:\n"
            "\"text\"     (string) The help text\n");

    std::string strCommand;
    if (jsonRequest.params.size() > 0)
        strCommand = jsonRequest.params[0].get_str();

    return tableRPC.help(strCommand);
}

// clang-format off
static const CRPCCommand vRPCCommands[] =
{ //  category              name                      actor (function)         okSafe argNames
  //  --------------------- ------------------------  -----------------------  ------ ----------
    { "control",            "help",                   &help,                   true,  {"command"} },
};
// clang-format on

CRPCTable tableRPC;

void RegisterControlRPCCommands(CRPCTable& t)
{
    for (const auto& c : vRPCCommands) {
        t.appendCommand(c.name, &c);
    }
}
