// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Pool Admin RPCs - every call that changes the ledger
 *
 * Each RPC parses its arguments, hands them to the pool engine and maps a
 * rejected operation onto a JSON-RPC error (see ThrowStateError). Caller
 * identities are 32-byte hex ids authenticated by the hosting platform.
 */

#include "consensus/validation.h"
#include "core_io.h"
#include "pool/engine.h"
#include "rpc/pool.h"
#include "rpc/server.h"
#include "util/format.h"

#include <limits>
#include <stdexcept>

static std::string GetStrO(const UniValue& o, const std::string& strKey, const std::string& strDefault = "")
{
    const UniValue& v = find_value(o, strKey);
    if (v.isNull()) return strDefault;
    if (!v.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, strKey + " must be a string");
    return v.get_str();
}

static int64_t GetIntO(const UniValue& o, const std::string& strKey, int64_t nDefault)
{
    const UniValue& v = find_value(o, strKey);
    if (v.isNull()) return nDefault;
    if (!v.isNum())
        throw JSONRPCError(RPC_TYPE_ERROR, strKey + " must be a number");
    return v.get_int64();
}

static UniValue createpool(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "createpool {config}\n"
            "\nCreates a pool. The pool id is derived from the configuration.\n"
            "\nArguments:\n"
            "1. config                      (json object, required)\n"
            "  {\n"
            "    \"mode\": \"random\",           (string, optional, default=random) random or ai_decision\n"
            "    \"entry_fee\": n,              (numeric, required) Exact amount of every entry\n"
            "    \"floor\": n,                  (numeric, required) Custody that opens selection without entries\n"
            "    \"fee_split\": [               (array, required) 1 to 8 destinations, percentages sum to 100\n"
            "      { \"destination\": \"hex\", \"percent\": n, \"label\": \"str\" }, ...\n"
            "    ],\n"
            "    \"authority\": \"hex\",          (string, required) Pool authority id\n"
            "    \"decision_authority\": \"hex\", (string, ai_decision only) Decision authority id\n"
            "    \"recovery_cooldown\": n,      (numeric, optional, default=0) Seconds between recoveries\n"
            "    \"recovery_max_percent\": n,   (numeric, optional, default=0) Max share of custody per recovery\n"
            "    \"escape_timeout\": n,         (numeric, optional, default=0) Idle seconds before executeescapeplan, 0 disables\n"
            "    \"nonce\": n                   (numeric, optional, default=0) Distinguishes identical configs\n"
            "  }\n"
            "\nResult:\n"
            "{ ... }    (json object) The new pool, as getpoolinfo\n"
            "\nExamples:\n"
            + HelpExampleCli("createpool", "'{\"entry_fee\":10,\"floor\":10000,\"authority\":\"hex\",\"fee_split\":[{\"destination\":\"hex\",\"percent\":100,\"label\":\"research\"}]}'"));
    }

    const UniValue& obj = request.params[0].get_obj();

    PoolConfig config;
    const std::string strMode = GetStrO(obj, "mode", "random");
    if (!ParsePoolMode(strMode, config.mode))
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Unknown pool mode: " + strMode);
    config.entryFee = AmountFromValue(find_value(obj, "entry_fee"));
    config.floorAmount = AmountFromValue(find_value(obj, "floor"));
    config.authority = ParseHashO(obj, "authority");
    if (config.mode == PoolMode::AI_DECISION)
        config.decisionAuthority = ParseHashO(obj, "decision_authority");

    const UniValue& split = find_value(obj, "fee_split");
    if (!split.isArray())
        throw JSONRPCError(RPC_TYPE_ERROR, "fee_split must be an array");
    for (size_t i = 0; i < split.size(); i++) {
        const UniValue& s = split[i];
        if (!s.isObject())
            throw JSONRPCError(RPC_TYPE_ERROR, "fee_split entries must be objects");
        const int64_t nPercent = GetIntO(s, "percent", 0);
        if (nPercent < 0 || nPercent > 100)
            throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Invalid percent %d", nPercent));
        config.feeSplit.emplace_back(ParseHashO(s, "destination"), (uint8_t)nPercent, GetStrO(s, "label"));
    }

    config.recoveryCooldown = GetIntO(obj, "recovery_cooldown", 0);
    const int64_t nMaxPercent = GetIntO(obj, "recovery_max_percent", 0);
    if (nMaxPercent < 0 || nMaxPercent > MAX_RECOVERY_PERCENT)
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Invalid recovery_max_percent %d", nMaxPercent));
    config.recoveryMaxPercent = (uint8_t)nMaxPercent;
    config.escapeTimeout = GetIntO(obj, "escape_timeout", 0);
    const int64_t nNonce = GetIntO(obj, "nonce", 0);
    if (nNonce < 0)
        throw JSONRPCError(RPC_INVALID_PARAMETER, "nonce must be non-negative");
    config.nonce = (uint64_t)nNonce;

    PoolLedger pool;
    CValidationState state;
    if (!EnsurePoolEngine().CreatePool(config, pool, state))
        ThrowStateError(state);

    UniValue result(UniValue::VOBJ);
    PoolToUniv(pool, result);
    return result;
}

static UniValue submitentry(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "submitentry \"pool_id\" \"payer\" amount\n"
            "\nRecords a paid entry. The amount must equal the pool's entry fee.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "2. \"payer\"     (string, required) Payer id\n"
            "3. amount      (numeric or string, required) Amount paid\n"
            "\nResult:\n"
            "{\n"
            "  \"entry_id\": n,\n"
            "  \"round\": n,\n"
            "  \"payer\": \"hex\",\n"
            "  \"amount\": \"n\",\n"
            "  \"contribution_split\": [ \"n\", ... ],\n"
            "  \"custody\": \"n\"      (string) Pool custody after the entry\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("submitentry", "\"pool_id\" \"payer\" 10"));
    }

    const uint256 poolId = ParseHashV(request.params[0], "pool_id");
    const uint256 payer = ParseHashV(request.params[1], "payer");
    const CAmount amount = AmountFromValue(request.params[2]);

    CPoolEngine& engine = EnsurePoolEngine();
    PoolEntry entry;
    CValidationState state;
    if (!engine.AcceptEntry(poolId, payer, amount, entry, state))
        ThrowStateError(state);

    const PoolLedger pool = GetPoolOrThrow(poolId);

    UniValue result(UniValue::VOBJ);
    EntryToUniv(entry, result);
    result.pushKV("custody", FormatAmount(pool.custodyBalance));
    return result;
}

static UniValue beginselection(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "beginselection \"pool_id\"\n"
            "\nCloses the entry window of the current round. Fails with NoEntries\n"
            "while the round has no entries and custody is below the floor.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "\nResult:\n"
            "{ \"round\": n, \"status\": \"selecting\", \"selection_height\": n, \"anchor_height\": n }\n"
            "\nExamples:\n"
            + HelpExampleCli("beginselection", "\"pool_id\""));
    }

    const uint256 poolId = ParseHashV(request.params[0], "pool_id");

    CPoolEngine& engine = EnsurePoolEngine();
    CValidationState state;
    if (!engine.BeginSelection(poolId, state))
        ThrowStateError(state);

    const PoolLedger pool = GetPoolOrThrow(poolId);

    UniValue result(UniValue::VOBJ);
    result.pushKV("round", (int64_t)pool.roundNumber);
    result.pushKV("status", PoolStatusToString(pool.status));
    result.pushKV("selection_height", (int64_t)pool.selectionHeight);
    if (pool.mode == PoolMode::RANDOM_SELECTION)
        result.pushKV("anchor_height", (int64_t)pool.selectionHeight + engine.GetAnchorDepth());
    return result;
}

static UniValue selectoutcome(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "selectoutcome \"pool_id\"\n"
            "\nDerives and records the outcome of a random pool's current round.\n"
            "Fails with AnchorUnavailable until the anchor header is submitted.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "\nResult:\n"
            "{ ... }    (json object) The outcome, as getoutcome\n"
            "\nExamples:\n"
            + HelpExampleCli("selectoutcome", "\"pool_id\""));
    }

    const uint256 poolId = ParseHashV(request.params[0], "pool_id");

    PoolOutcome outcome;
    CValidationState state;
    if (!EnsurePoolEngine().SelectOutcome(poolId, outcome, state))
        ThrowStateError(state);

    UniValue result(UniValue::VOBJ);
    OutcomeToUniv(outcome, result);
    return result;
}

static UniValue submitdecision(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "submitdecision {decision}\n"
            "\nRecords the external decision for an ai_decision pool's current round.\n"
            "\nArguments:\n"
            "1. decision                    (json object, required)\n"
            "  {\n"
            "    \"pool_id\": \"hex\",            (string, required)\n"
            "    \"round\": n,                  (numeric, required)\n"
            "    \"verdict\": \"pass\"|\"fail\",    (string, required)\n"
            "    \"payout\": n,                 (numeric, required) 0 for fail\n"
            "    \"winner\": \"hex\",             (string, pass only) Payer id of the winning entrant\n"
            "    \"decision_authority\": \"hex\", (string, required)\n"
            "    \"session_id\": \"str\",         (string, required) [A-Za-z0-9_-], at most 100 characters\n"
            "    \"timestamp\": n,              (numeric, required)\n"
            "    \"decision_hash\": \"hex\"       (string, optional) Computed from the fields when omitted\n"
            "  }\n"
            "\nResult:\n"
            "{ ... }    (json object) The outcome, as getoutcome\n"
            "\nExamples:\n"
            + HelpExampleCli("submitdecision", "'{\"pool_id\":\"hex\",\"round\":1,\"verdict\":\"pass\",\"payout\":30,\"winner\":\"hex\",\"decision_authority\":\"hex\",\"session_id\":\"s-1\",\"timestamp\":1700000000}'"));
    }

    const UniValue& obj = request.params[0].get_obj();

    DecisionMessage decision;
    decision.poolId = ParseHashO(obj, "pool_id");
    decision.roundNumber = ParseRound(find_value(obj, "round"), 0);
    if (decision.roundNumber == 0)
        throw JSONRPCError(RPC_INVALID_PARAMETER, "round is required");
    const std::string strVerdict = GetStrO(obj, "verdict");
    if (!ParseDecisionVerdict(strVerdict, decision.verdict))
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Unknown verdict: " + strVerdict);
    decision.payoutAmount = AmountFromValue(find_value(obj, "payout"));
    if (decision.verdict == DecisionVerdict::PASS)
        decision.winner = ParseHashO(obj, "winner");
    decision.decisionAuthority = ParseHashO(obj, "decision_authority");
    decision.sessionId = GetStrO(obj, "session_id");
    decision.timestamp = GetIntO(obj, "timestamp", 0);
    if (find_value(obj, "decision_hash").isNull())
        decision.decisionHash = decision.ComputeHash();
    else
        decision.decisionHash = ParseHashO(obj, "decision_hash");

    PoolOutcome outcome;
    CValidationState state;
    if (!EnsurePoolEngine().SubmitDecision(decision, outcome, state))
        ThrowStateError(state);

    UniValue result(UniValue::VOBJ);
    OutcomeToUniv(outcome, result);
    return result;
}

static UniValue beginsettlement(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "beginsettlement \"pool_id\" ( round )\n"
            "\nMoves a pool with a recorded outcome from selecting to settling.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "2. round       (numeric, optional, default=current) Round of the outcome\n"
            "\nResult:\n"
            "{ \"round\": n, \"status\": \"settling\" }\n"
            "\nExamples:\n"
            + HelpExampleCli("beginsettlement", "\"pool_id\""));
    }

    const PoolLedger before = GetPoolOrThrow(ParseHashV(request.params[0], "pool_id"));
    const uint32_t nRound = ParseRound(request.params.size() > 1 ? request.params[1] : NullUniValue, before.roundNumber);

    CValidationState state;
    if (!EnsurePoolEngine().BeginSettlement(before.poolId, nRound, state))
        ThrowStateError(state);

    const PoolLedger pool = GetPoolOrThrow(before.poolId);

    UniValue result(UniValue::VOBJ);
    result.pushKV("round", (int64_t)pool.roundNumber);
    result.pushKV("status", PoolStatusToString(pool.status));
    return result;
}

static UniValue settle(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "settle \"pool_id\" ( round )\n"
            "\nExecutes the transfers of a settling round and opens the next round.\n"
            "A custody shortfall halts the pool (InsufficientCustody).\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "2. round       (numeric, optional, default=current) Round to settle\n"
            "\nResult:\n"
            "{ ... }    (json object) The receipt, as getreceipt\n"
            "\nExamples:\n"
            + HelpExampleCli("settle", "\"pool_id\""));
    }

    const PoolLedger pool = GetPoolOrThrow(ParseHashV(request.params[0], "pool_id"));
    const uint32_t nRound = ParseRound(request.params.size() > 1 ? request.params[1] : NullUniValue, pool.roundNumber);

    PoolReceipt receipt;
    CValidationState state;
    if (!EnsurePoolEngine().Settle(pool.poolId, nRound, receipt, state))
        ThrowStateError(state);

    UniValue result(UniValue::VOBJ);
    ReceiptToUniv(receipt, result);
    return result;
}

static UniValue executeescapeplan(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "executeescapeplan \"pool_id\"\n"
            "\nDistributes the pot of a round that has been idle for the pool's escape\n"
            "timeout: 20% to the last entrant, the rest shared equally by the entrants.\n"
            "Anyone may call it once the timeout has passed.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "\nResult:\n"
            "{ ... }    (json object) The receipt, as getreceipt, with kind escape_plan\n"
            "\nExamples:\n"
            + HelpExampleCli("executeescapeplan", "\"pool_id\""));
    }

    const uint256 poolId = ParseHashV(request.params[0], "pool_id");

    PoolReceipt receipt;
    CValidationState state;
    if (!EnsurePoolEngine().ExecuteEscapePlan(poolId, receipt, state))
        ThrowStateError(state);

    UniValue result(UniValue::VOBJ);
    ReceiptToUniv(receipt, result);
    return result;
}

static UniValue recover(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 5 || request.params.size() > 6) {
        throw std::runtime_error(
            "recover \"pool_id\" \"initiator\" amount \"destination\" \"reason_code\" ( close_pool )\n"
            "\nAuthority-only extraction of funds from custody. Every use is logged permanently.\n"
            "\nArguments:\n"
            "1. \"pool_id\"      (string, required) The pool id\n"
            "2. \"initiator\"    (string, required) Must be the pool authority\n"
            "3. amount         (numeric or string, required) Amount to recover, at most the custody\n"
            "                  not reserved by an outcome waiting to be settled\n"
            "4. \"destination\"  (string, required) Receiver id\n"
            "5. \"reason_code\"  (string, required) Short machine-readable reason\n"
            "6. close_pool     (boolean, optional, default=false) Close the pool in the same step\n"
            "\nResult:\n"
            "{ ... }    (json object) The recovery record, as listrecoveries\n"
            "\nExamples:\n"
            + HelpExampleCli("recover", "\"pool_id\" \"authority\" 5000 \"destination\" \"stuck-round\" true"));
    }

    const uint256 poolId = ParseHashV(request.params[0], "pool_id");

    RecoveryRequest req;
    req.initiator = ParseHashV(request.params[1], "initiator");
    req.amount = AmountFromValue(request.params[2]);
    req.destination = ParseHashV(request.params[3], "destination");
    req.reasonCode = request.params[4].get_str();
    if (request.params.size() > 5 && !request.params[5].isNull())
        req.fClosePool = request.params[5].get_bool();

    RecoveryAction action;
    CValidationState state;
    if (!EnsurePoolEngine().Recover(poolId, req, action, state))
        ThrowStateError(state);

    UniValue result(UniValue::VOBJ);
    RecoveryToUniv(action, result);
    return result;
}

static UniValue closepool(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "closepool \"pool_id\" \"caller\"\n"
            "\nCloses an active or settling pool for good. Remaining custody can\n"
            "still be recovered.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "2. \"caller\"    (string, required) Must be the pool authority\n"
            "\nResult:\n"
            "{ \"pool_id\": \"hex\", \"status\": \"closed\", \"custody\": \"n\" }\n"
            "\nExamples:\n"
            + HelpExampleCli("closepool", "\"pool_id\" \"authority\""));
    }

    const uint256 poolId = ParseHashV(request.params[0], "pool_id");
    const uint256 caller = ParseHashV(request.params[1], "caller");

    CValidationState state;
    if (!EnsurePoolEngine().ClosePool(poolId, caller, state))
        ThrowStateError(state);

    const PoolLedger pool = GetPoolOrThrow(poolId);

    UniValue result(UniValue::VOBJ);
    result.pushKV("pool_id", pool.poolId.GetHex());
    result.pushKV("status", PoolStatusToString(pool.status));
    result.pushKV("custody", FormatAmount(pool.custodyBalance));
    return result;
}

static UniValue rotateauthority(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "rotateauthority \"pool_id\" \"caller\" \"new_authority\"\n"
            "\nHands the pool authority over to a new id.\n"
            "\nArguments:\n"
            "1. \"pool_id\"         (string, required) The pool id\n"
            "2. \"caller\"          (string, required) Must be the current authority\n"
            "3. \"new_authority\"   (string, required) The new authority id\n"
            "\nResult:\n"
            "{ \"pool_id\": \"hex\", \"authority\": \"hex\" }\n"
            "\nExamples:\n"
            + HelpExampleCli("rotateauthority", "\"pool_id\" \"authority\" \"new_authority\""));
    }

    const uint256 poolId = ParseHashV(request.params[0], "pool_id");
    const uint256 caller = ParseHashV(request.params[1], "caller");
    const uint256 newAuthority = ParseHashV(request.params[2], "new_authority");

    CValidationState state;
    if (!EnsurePoolEngine().RotateAuthority(poolId, caller, newAuthority, state))
        ThrowStateError(state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("pool_id", poolId.GetHex());
    result.pushKV("authority", newAuthority.GetHex());
    return result;
}

static UniValue setdecisionauthority(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "setdecisionauthority \"pool_id\" \"caller\" \"decision_authority\"\n"
            "\nReplaces the decision authority of an ai_decision pool.\n"
            "\nArguments:\n"
            "1. \"pool_id\"              (string, required) The pool id\n"
            "2. \"caller\"               (string, required) Must be the pool authority\n"
            "3. \"decision_authority\"   (string, required) The new decision authority id\n"
            "\nResult:\n"
            "{ \"pool_id\": \"hex\", \"decision_authority\": \"hex\" }\n"
            "\nExamples:\n"
            + HelpExampleCli("setdecisionauthority", "\"pool_id\" \"authority\" \"decision_authority\""));
    }

    const uint256 poolId = ParseHashV(request.params[0], "pool_id");
    const uint256 caller = ParseHashV(request.params[1], "caller");
    const uint256 decisionAuthority = ParseHashV(request.params[2], "decision_authority");

    CValidationState state;
    if (!EnsurePoolEngine().SetDecisionAuthority(poolId, caller, decisionAuthority, state))
        ThrowStateError(state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("pool_id", poolId.GetHex());
    result.pushKV("decision_authority", decisionAuthority.GetHex());
    return result;
}

static UniValue submitanchor(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "submitanchor height \"hash\" time\n"
            "\nRecords the next platform block header used as randomness anchor.\n"
            "Heights must follow the current tip without gaps.\n"
            "\nArguments:\n"
            "1. height      (numeric, required) Header height, tip + 1\n"
            "2. \"hash\"      (string, required) Header hash\n"
            "3. time        (numeric, required) Header time\n"
            "\nResult:\n"
            "{ \"height\": n, \"hash\": \"hex\", \"time\": n }\n"
            "\nExamples:\n"
            + HelpExampleCli("submitanchor", "1 \"hash\" 1700000000"));
    }

    const int64_t nHeight = request.params[0].get_int64();
    if (nHeight < 1 || nHeight > std::numeric_limits<uint32_t>::max())
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Invalid height %d", nHeight));

    PlatformAnchor anchor;
    anchor.height = (uint32_t)nHeight;
    anchor.blockHash = ParseHashV(request.params[1], "hash");
    anchor.time = request.params[2].get_int64();

    CValidationState state;
    if (!EnsurePoolEngine().SubmitAnchor(anchor, state))
        ThrowStateError(state);

    UniValue result(UniValue::VOBJ);
    AnchorToUniv(anchor, result);
    return result;
}

// clang-format off
static const CRPCCommand commands[] =
{ //  category       name                     actor (function)        okSafe argNames
  //  -------------- ------------------------ ----------------------- ------ --------
    { "pooladmin",   "createpool",            &createpool,            false, {"config"} },
    { "pooladmin",   "submitentry",           &submitentry,           false, {"pool_id", "payer", "amount"} },
    { "pooladmin",   "beginselection",        &beginselection,        false, {"pool_id"} },
    { "pooladmin",   "selectoutcome",         &selectoutcome,         false, {"pool_id"} },
    { "pooladmin",   "submitdecision",        &submitdecision,        false, {"decision"} },
    { "pooladmin",   "beginsettlement",       &beginsettlement,       false, {"pool_id", "round"} },
    { "pooladmin",   "settle",                &settle,                false, {"pool_id", "round"} },
    { "pooladmin",   "executeescapeplan",     &executeescapeplan,     false, {"pool_id"} },
    { "pooladmin",   "recover",               &recover,               false, {"pool_id", "initiator", "amount", "destination", "reason_code", "close_pool"} },
    { "pooladmin",   "closepool",             &closepool,             false, {"pool_id", "caller"} },
    { "pooladmin",   "rotateauthority",       &rotateauthority,       false, {"pool_id", "caller", "new_authority"} },
    { "pooladmin",   "setdecisionauthority",  &setdecisionauthority,  false, {"pool_id", "caller", "decision_authority"} },
    { "pooladmin",   "submitanchor",          &submitanchor,          false, {"height", "hash", "time"} },
};
// clang-format on

void RegisterPoolAdminRPCCommands(CRPCTable& t)
{
    for (const auto& c : commands) {
        t.appendCommand(c.name, &c);
    }
}
