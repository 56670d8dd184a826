// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "pool/pool.h"
#include "util/format.h"

#include <univalue.h>

// Amounts are raw integer units; strings keep them exact in every JSON parser.
std::string FormatAmount(CAmount amount)
{
    return strprintf("%lld", (long long)amount);
}

UniValue FeeSplitToUniv(const FeeSplitEntry& split)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("destination", split.destination.GetHex());
    obj.pushKV("percent", (int)split.percent);
    obj.pushKV("label", split.label);
    return obj;
}

void PoolToUniv(const PoolLedger& pool, UniValue& entry)
{
    entry.pushKV("pool_id", pool.poolId.GetHex());
    entry.pushKV("mode", PoolModeToString(pool.mode));
    entry.pushKV("status", PoolStatusToString(pool.status));
    entry.pushKV("halted", pool.halted);
    entry.pushKV("round", (int64_t)pool.roundNumber);
    entry.pushKV("authority", pool.authority.GetHex());
    if (pool.mode == PoolMode::AI_DECISION) {
        entry.pushKV("decision_authority", pool.decisionAuthority.GetHex());
    }
    entry.pushKV("entry_fee", FormatAmount(pool.entryFee));
    entry.pushKV("floor", FormatAmount(pool.floorAmount));

    UniValue split(UniValue::VARR);
    for (const FeeSplitEntry& s : pool.feeSplit) {
        split.push_back(FeeSplitToUniv(s));
    }
    entry.pushKV("fee_split", split);

    UniValue custody(UniValue::VOBJ);
    custody.pushKV("balance", FormatAmount(pool.custodyBalance));
    custody.pushKV("carried", FormatAmount(pool.carriedRemainder));
    custody.pushKV("round_contributions", FormatAmount(pool.roundContributions));
    custody.pushKV("round_recovered", FormatAmount(pool.roundRecovered));
    custody.pushKV("round_pot", FormatAmount(pool.GetRoundPot()));
    custody.pushKV("conserved", pool.IsConserved());
    entry.pushKV("custody", custody);

    entry.pushKV("round_entries", (int64_t)pool.roundEntryCount);
    entry.pushKV("next_entry_id", (int64_t)pool.nextEntryId);
    if (pool.status == PoolStatus::SELECTING || pool.status == PoolStatus::SETTLING) {
        entry.pushKV("selection_height", (int64_t)pool.selectionHeight);
    }

    UniValue recovery(UniValue::VOBJ);
    recovery.pushKV("cooldown", pool.recoveryCooldown);
    recovery.pushKV("max_percent", (int)pool.recoveryMaxPercent);
    recovery.pushKV("count", (int64_t)pool.recoveryCount);
    recovery.pushKV("last_time", pool.lastRecoveryTime);
    entry.pushKV("recovery", recovery);

    if (pool.escapeTimeout > 0) {
        UniValue escape(UniValue::VOBJ);
        escape.pushKV("timeout", pool.escapeTimeout);
        escape.pushKV("ready_time", pool.lastActivityTime + pool.escapeTimeout);
        entry.pushKV("escape_plan", escape);
    }
    entry.pushKV("last_activity_time", pool.lastActivityTime);

    entry.pushKV("create_height", (int64_t)pool.createHeight);
    entry.pushKV("create_time", pool.createTime);
}

void EntryToUniv(const PoolEntry& poolEntry, UniValue& entry)
{
    entry.pushKV("entry_id", (int64_t)poolEntry.entryId);
    entry.pushKV("round", (int64_t)poolEntry.roundNumber);
    entry.pushKV("payer", poolEntry.payer.GetHex());
    entry.pushKV("amount", FormatAmount(poolEntry.amountPaid));

    UniValue split(UniValue::VARR);
    for (const CAmount share : poolEntry.contributionSplit) {
        split.push_back(FormatAmount(share));
    }
    entry.pushKV("contribution_split", split);
    entry.pushKV("recorded_height", (int64_t)poolEntry.recordedHeight);
    entry.pushKV("recorded_time", poolEntry.recordedTime);
    entry.pushKV("processed", poolEntry.processed);
}

void OutcomeToUniv(const PoolOutcome& outcome, UniValue& entry)
{
    entry.pushKV("outcome_hash", outcome.GetHash().GetHex());
    entry.pushKV("pool_id", outcome.poolId.GetHex());
    entry.pushKV("round", (int64_t)outcome.roundNumber);
    entry.pushKV("mode", PoolModeToString(outcome.mode));

    if (outcome.mode == PoolMode::RANDOM_SELECTION) {
        UniValue inputs(UniValue::VOBJ);
        inputs.pushKV("anchor_height", (int64_t)outcome.anchorHeight);
        inputs.pushKV("anchor_hash", outcome.anchorHash.GetHex());
        inputs.pushKV("entries_count", (int64_t)outcome.entriesCount);
        inputs.pushKV("entries_digest", outcome.entriesDigest.GetHex());
        entry.pushKV("seed_inputs", inputs);
        entry.pushKV("seed", outcome.seed.GetHex());
    } else {
        entry.pushKV("verdict", DecisionVerdictToString(outcome.verdict));
        entry.pushKV("decision_hash", outcome.decisionHash.GetHex());
    }

    entry.pushKV("has_winner", outcome.hasWinner);
    if (outcome.hasWinner) {
        entry.pushKV("winner_index", (int64_t)outcome.winnerIndex);
        entry.pushKV("winner_entry_id", (int64_t)outcome.winnerEntryId);
        entry.pushKV("winner", outcome.winner.GetHex());
    }
    entry.pushKV("payout", FormatAmount(outcome.payoutAmount));
    entry.pushKV("computed_height", (int64_t)outcome.computedHeight);
    entry.pushKV("computed_time", outcome.computedTime);
}

void ReceiptToUniv(const PoolReceipt& receipt, UniValue& entry)
{
    entry.pushKV("pool_id", receipt.poolId.GetHex());
    entry.pushKV("round", (int64_t)receipt.roundNumber);
    entry.pushKV("kind", ReceiptKindToString(receipt.kind));
    if (receipt.kind == ReceiptKind::OUTCOME) {
        entry.pushKV("outcome_hash", receipt.outcomeHash.GetHex());
    }
    entry.pushKV("has_winner", receipt.hasWinner);
    if (receipt.hasWinner) {
        entry.pushKV("winner_entry_id", (int64_t)receipt.winnerEntryId);
        entry.pushKV("winner", receipt.winner.GetHex());
    }
    entry.pushKV("payout", FormatAmount(receipt.payoutAmount));

    UniValue transfers(UniValue::VARR);
    for (const Transfer& t : receipt.transfers) {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("destination", t.destination.GetHex());
        obj.pushKV("label", t.label);
        obj.pushKV("percent", (int)t.percent);
        obj.pushKV("amount", FormatAmount(t.amount));
        transfers.push_back(obj);
    }
    entry.pushKV("transfers", transfers);
    entry.pushKV("total_transferred", FormatAmount(receipt.GetTotalTransferred()));
    entry.pushKV("remainder", FormatAmount(receipt.remainder));
    entry.pushKV("custody_after", FormatAmount(receipt.custodyAfter));
    entry.pushKV("settled_height", (int64_t)receipt.settledHeight);
    entry.pushKV("settled_time", receipt.settledTime);
}

void RecoveryToUniv(const RecoveryAction& action, UniValue& entry)
{
    entry.pushKV("sequence", (int64_t)action.sequence);
    entry.pushKV("pool_id", action.poolId.GetHex());
    entry.pushKV("initiator", action.initiator.GetHex());
    entry.pushKV("reason_code", action.reasonCode);
    entry.pushKV("amount", FormatAmount(action.amount));
    entry.pushKV("destination", action.destination.GetHex());
    entry.pushKV("round", (int64_t)action.roundNumber);
    entry.pushKV("closed_pool", action.closedPool);
    entry.pushKV("timestamp", action.timestamp);
}

void AnchorToUniv(const PlatformAnchor& anchor, UniValue& entry)
{
    entry.pushKV("height", (int64_t)anchor.height);
    entry.pushKV("hash", anchor.blockHash.GetHex());
    entry.pushKV("time", anchor.time);
}
