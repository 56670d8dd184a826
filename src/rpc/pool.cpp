// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Pool RPCs - read-only views of the pool ledger
 *
 * - getpoolinfo / listpools: ledger state, custody and conservation
 * - listentries: the entry register of one round, in selection order
 * - getoutcome / verifyoutcome: recorded outcome and its independent check
 * - getreceipt / listrecoveries: disbursement and recovery audit trail
 * - getanchortip, getpoolmetrics
 *
 * None of these writes to the database.
 */

#include "rpc/pool.h"

#include "consensus/validation.h"
#include "core_io.h"
#include "pool/engine.h"
#include "pool/killswitch.h"
#include "pool/metrics.h"
#include "pool/pooldb.h"
#include "rpc/server.h"
#include "util/format.h"

#include <limits>
#include <stdexcept>

CPoolEngine& EnsurePoolEngine()
{
    if (!g_pool_engine || !g_pooldb) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Pool engine not initialized");
    }
    return *g_pool_engine;
}

PoolLedger GetPoolOrThrow(const uint256& poolId)
{
    PoolLedger pool;
    if (!EnsurePoolEngine().GetPool(poolId, pool)) {
        throw JSONRPCError(RPC_POOL_NOT_FOUND, "Pool not found: " + poolId.GetHex());
    }
    return pool;
}

uint32_t ParseRound(const UniValue& v, uint32_t nDefault)
{
    if (v.isNull()) {
        return nDefault;
    }
    int64_t n = v.get_int64();
    if (n < FIRST_ROUND || n > std::numeric_limits<uint32_t>::max()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Invalid round %d", n));
    }
    return (uint32_t)n;
}

/** Latest round with a recorded outcome: the current one, else the one just settled */
static uint32_t GetLatestOutcomeRound(const PoolLedger& pool)
{
    if (g_pooldb->HaveOutcome(pool.poolId, pool.roundNumber) || pool.roundNumber == FIRST_ROUND) {
        return pool.roundNumber;
    }
    return pool.roundNumber - 1;
}

static UniValue getpoolinfo(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getpoolinfo \"pool_id\"\n"
            "\nReturns the ledger state of a pool.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "\nResult:\n"
            "{\n"
            "  \"pool_id\": \"hex\",\n"
            "  \"mode\": \"random\"|\"ai_decision\",\n"
            "  \"status\": \"active\"|\"selecting\"|\"settling\"|\"closed\",\n"
            "  \"halted\": true|false,\n"
            "  \"round\": n,\n"
            "  \"entry_fee\": \"n\",\n"
            "  \"floor\": \"n\",\n"
            "  \"fee_split\": [ { \"destination\": \"hex\", \"percent\": n, \"label\": \"str\" }, ... ],\n"
            "  \"custody\": {\n"
            "    \"balance\": \"n\",        (string) Funds held for the pool\n"
            "    \"carried\": \"n\",        (string) Rolled over from earlier rounds\n"
            "    \"round_contributions\": \"n\",\n"
            "    \"round_recovered\": \"n\",\n"
            "    \"round_pot\": \"n\",      (string) Payable to this round's outcome\n"
            "    \"conserved\": true      (boolean) balance == carried + contributions - recovered\n"
            "  },\n"
            "  ...\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getpoolinfo", "\"pool_id\""));
    }

    const PoolLedger pool = GetPoolOrThrow(ParseHashV(request.params[0], "pool_id"));

    UniValue result(UniValue::VOBJ);
    PoolToUniv(pool, result);
    return result;
}

static UniValue listpools(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 0) {
        throw std::runtime_error(
            "listpools\n"
            "\nLists every pool with its status and custody.\n"
            "\nResult:\n"
            "[\n"
            "  { \"pool_id\": \"hex\", \"mode\": \"str\", \"status\": \"str\", \"round\": n, \"custody\": \"n\", \"halted\": bool }, ...\n"
            "]\n"
            "\nExamples:\n"
            + HelpExampleCli("listpools", ""));
    }

    EnsurePoolEngine();

    UniValue result(UniValue::VARR);
    g_pooldb->ForEachPool([&result](const PoolLedger& pool) {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("pool_id", pool.poolId.GetHex());
        obj.pushKV("mode", PoolModeToString(pool.mode));
        obj.pushKV("status", PoolStatusToString(pool.status));
        obj.pushKV("round", (int64_t)pool.roundNumber);
        obj.pushKV("custody", FormatAmount(pool.custodyBalance));
        obj.pushKV("halted", pool.halted);
        result.push_back(obj);
        return true;
    });
    return result;
}

static UniValue listentries(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "listentries \"pool_id\" ( round )\n"
            "\nLists the entries of one round in insertion (selection) order.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "2. round       (numeric, optional, default=current) Round number\n"
            "\nResult:\n"
            "[\n"
            "  {\n"
            "    \"index\": n,              (numeric) Position used by winner selection\n"
            "    \"entry_id\": n,\n"
            "    \"payer\": \"hex\",\n"
            "    \"amount\": \"n\",\n"
            "    \"contribution_split\": [ \"n\", ... ],\n"
            "    \"processed\": true|false\n"
            "  }, ...\n"
            "]\n"
            "\nExamples:\n"
            + HelpExampleCli("listentries", "\"pool_id\" 1"));
    }

    const PoolLedger pool = GetPoolOrThrow(ParseHashV(request.params[0], "pool_id"));
    const uint32_t nRound = ParseRound(request.params.size() > 1 ? request.params[1] : NullUniValue, pool.roundNumber);

    UniValue result(UniValue::VARR);
    int64_t nIndex = 0;
    for (const PoolEntry& entry : EnsurePoolEngine().GetEntryRegister().EntriesForRound(pool.poolId, nRound)) {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("index", nIndex++);
        EntryToUniv(entry, obj);
        result.push_back(obj);
    }
    return result;
}

static UniValue getoutcome(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "getoutcome \"pool_id\" ( round )\n"
            "\nReturns the outcome recorded for a round.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "2. round       (numeric, optional) Round number, default the latest round with an outcome\n"
            "\nResult (random pools):\n"
            "{\n"
            "  \"outcome_hash\": \"hex\",\n"
            "  \"round\": n,\n"
            "  \"seed_inputs\": { \"anchor_height\": n, \"anchor_hash\": \"hex\", \"entries_count\": n, \"entries_digest\": \"hex\" },\n"
            "  \"seed\": \"hex\",\n"
            "  \"has_winner\": true|false,\n"
            "  \"winner_index\": n,\n"
            "  \"winner_entry_id\": n,\n"
            "  \"winner\": \"hex\",\n"
            "  \"payout\": \"n\"\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getoutcome", "\"pool_id\""));
    }

    const PoolLedger pool = GetPoolOrThrow(ParseHashV(request.params[0], "pool_id"));
    const uint32_t nRound = ParseRound(request.params.size() > 1 ? request.params[1] : NullUniValue,
                                       GetLatestOutcomeRound(pool));

    PoolOutcome outcome;
    if (!g_pooldb->ReadOutcome(pool.poolId, nRound, outcome)) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("No outcome recorded for round %u", nRound));
    }

    UniValue result(UniValue::VOBJ);
    OutcomeToUniv(outcome, result);
    return result;
}

static UniValue verifyoutcome(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "verifyoutcome \"pool_id\" ( round )\n"
            "\nRecomputes a random outcome from the entry register and the platform\n"
            "anchor, and compares it with the recorded one.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "2. round       (numeric, optional) Round number, default the latest round with an outcome\n"
            "\nResult:\n"
            "{\n"
            "  \"round\": n,\n"
            "  \"valid\": true|false,\n"
            "  \"error\": \"str\"     (string, only if invalid) Error name\n"
            "  \"reason\": \"str\"    (string, only if invalid) Reject reason\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("verifyoutcome", "\"pool_id\" 1"));
    }

    const PoolLedger pool = GetPoolOrThrow(ParseHashV(request.params[0], "pool_id"));
    const uint32_t nRound = ParseRound(request.params.size() > 1 ? request.params[1] : NullUniValue,
                                       GetLatestOutcomeRound(pool));

    CValidationState state;
    const bool fValid = EnsurePoolEngine().VerifyOutcome(pool.poolId, nRound, state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("round", (int64_t)nRound);
    result.pushKV("valid", fValid);
    if (!fValid) {
        result.pushKV("error", GetPoolErrorName(state.GetCode()));
        result.pushKV("reason", state.GetRejectReason());
        if (!state.GetDebugMessage().empty()) {
            result.pushKV("debug", state.GetDebugMessage());
        }
    }
    return result;
}

static UniValue getreceipt(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "getreceipt \"pool_id\" ( round )\n"
            "\nReturns the settlement receipt of a round.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "2. round       (numeric, optional) Round number, default the last settled round\n"
            "\nResult:\n"
            "{\n"
            "  \"round\": n,\n"
            "  \"kind\": \"str\",           (string) outcome, or escape_plan for an idle-round distribution\n"
            "  \"outcome_hash\": \"hex\",   (string) outcome receipts only\n"
            "  \"payout\": \"n\",\n"
            "  \"transfers\": [ { \"destination\": \"hex\", \"label\": \"str\", \"percent\": n, \"amount\": \"n\" }, ... ],\n"
            "  \"remainder\": \"n\",        (string) Rounding units given to the first destination\n"
            "  \"custody_after\": \"n\"     (string) Carried into the next round\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getreceipt", "\"pool_id\""));
    }

    const PoolLedger pool = GetPoolOrThrow(ParseHashV(request.params[0], "pool_id"));
    uint32_t nDefault = pool.roundNumber;
    if (!g_pooldb->HaveReceipt(pool.poolId, nDefault) && nDefault > FIRST_ROUND) {
        nDefault--;
    }
    const uint32_t nRound = ParseRound(request.params.size() > 1 ? request.params[1] : NullUniValue, nDefault);

    PoolReceipt receipt;
    if (!g_pooldb->ReadReceipt(pool.poolId, nRound, receipt)) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Round %u has not been settled", nRound));
    }

    UniValue result(UniValue::VOBJ);
    ReceiptToUniv(receipt, result);
    return result;
}

static UniValue listrecoveries(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "listrecoveries \"pool_id\"\n"
            "\nLists the permanent recovery log of a pool, oldest first.\n"
            "\nArguments:\n"
            "1. \"pool_id\"   (string, required) The pool id\n"
            "\nResult:\n"
            "[\n"
            "  { \"sequence\": n, \"initiator\": \"hex\", \"reason_code\": \"str\", \"amount\": \"n\",\n"
            "    \"destination\": \"hex\", \"round\": n, \"closed_pool\": bool, \"timestamp\": n }, ...\n"
            "]\n"
            "\nExamples:\n"
            + HelpExampleCli("listrecoveries", "\"pool_id\""));
    }

    const PoolLedger pool = GetPoolOrThrow(ParseHashV(request.params[0], "pool_id"));

    std::vector<RecoveryAction> actions;
    g_pooldb->GetRecoveries(pool.poolId, actions);

    UniValue result(UniValue::VARR);
    for (const RecoveryAction& action : actions) {
        UniValue obj(UniValue::VOBJ);
        RecoveryToUniv(action, obj);
        result.push_back(obj);
    }
    return result;
}

static UniValue getanchortip(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 0) {
        throw std::runtime_error(
            "getanchortip\n"
            "\nReturns the highest platform anchor known to the ledger.\n"
            "\nResult:\n"
            "{\n"
            "  \"height\": n,         (numeric) 0 if no anchor was submitted yet\n"
            "  \"hash\": \"hex\",\n"
            "  \"time\": n,\n"
            "  \"anchor_depth\": n    (numeric) Headers between selection and its anchor\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getanchortip", ""));
    }

    const CPoolEngine& engine = EnsurePoolEngine();
    const CAnchorView& anchors = engine.GetAnchorView();

    PlatformAnchor anchor;
    const uint32_t nTip = anchors.GetTipHeight();
    if (nTip > 0 && !anchors.GetAnchor(nTip, anchor))
        throw JSONRPCError(RPC_DATABASE_ERROR, strprintf("Anchor record missing at tip %u", nTip));

    UniValue result(UniValue::VOBJ);
    AnchorToUniv(anchor, result);
    result.pushKV("anchor_depth", (int64_t)engine.GetAnchorDepth());
    return result;
}

static UniValue getpoolmetrics(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 0) {
        throw std::runtime_error(
            "getpoolmetrics\n"
            "\nReturns the pool engine counters of this process and the entry kill switch.\n"
            "\nResult:\n"
            "{\n"
            "  \"pools\": { \"created\": n, \"closed\": n },\n"
            "  \"entries\": { \"accepted\": n, \"rejected\": n },\n"
            "  \"outcomes\": { ... },\n"
            "  \"settlement\": { ... },\n"
            "  \"recovery\": { ... },\n"
            "  \"killswitch\": { \"entries_enabled\": bool, \"config_default\": bool, \"last_changed\": n }\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getpoolmetrics", ""));
    }

    UniValue result = pool::g_pool_metrics.ToJSON();

    const KillSwitchStatus ks = GetKillSwitchStatus();
    UniValue killswitch(UniValue::VOBJ);
    killswitch.pushKV("entries_enabled", ks.enabled);
    killswitch.pushKV("config_default", ks.configDefault);
    killswitch.pushKV("last_changed", ks.lastChanged);
    result.pushKV("killswitch", killswitch);
    return result;
}

// clang-format off
static const CRPCCommand commands[] =
{ //  category       name                   actor (function)    okSafe argNames
  //  -------------- ---------------------- ------------------- ------ --------
    { "pool",        "getpoolinfo",         &getpoolinfo,       true,  {"pool_id"} },
    { "pool",        "listpools",           &listpools,         true,  {} },
    { "pool",        "listentries",         &listentries,       true,  {"pool_id", "round"} },
    { "pool",        "getoutcome",          &getoutcome,        true,  {"pool_id", "round"} },
    { "pool",        "verifyoutcome",       &verifyoutcome,     true,  {"pool_id", "round"} },
    { "pool",        "getreceipt",          &getreceipt,        true,  {"pool_id", "round"} },
    { "pool",        "listrecoveries",      &listrecoveries,    true,  {"pool_id"} },
    { "pool",        "getanchortip",        &getanchortip,      true,  {} },
    { "pool",        "getpoolmetrics",      &getpoolmetrics,    true,  {} },
};
// clang-format on

void RegisterPoolRPCCommands(CRPCTable& t)
{
    for (const auto& c : commands) {
        t.appendCommand(c.name, &c);
    }
}
