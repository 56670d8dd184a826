// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/disbursement.h"

#include "consensus/validation.h"
#include "logging.h"
#include "pool/pool_logic.h"

#include <map>

bool ComputeTransfers(const std::vector<FeeSplitEntry>& feeSplit,
                      CAmount amount,
                      std::vector<Transfer>& transfers,
                      CAmount& remainder)
{
    transfers.clear();
    remainder = 0;

    if (feeSplit.empty() || !MoneyRange(amount)) {
        return false;
    }

    // amount <= MAX_MONEY, so amount * 100 cannot overflow
    CAmount total = 0;
    for (const FeeSplitEntry& split : feeSplit) {
        Transfer t;
        t.destination = split.destination;
        t.label = split.label;
        t.percent = split.percent;
        t.amount = amount * split.percent / 100;
        total += t.amount;
        transfers.push_back(t);
    }

    remainder = amount - total;
    transfers[0].amount += remainder;
    return true;
}

std::vector<CAmount> ComputeContributionSplit(const std::vector<FeeSplitEntry>& feeSplit, CAmount amount)
{
    std::vector<Transfer> transfers;
    CAmount remainder;
    std::vector<CAmount> shares;
    if (!ComputeTransfers(feeSplit, amount, transfers, remainder)) {
        return shares;
    }
    for (const Transfer& t : transfers) {
        shares.push_back(t.amount);
    }
    return shares;
}

bool CheckSettle(const PoolLedger& pool,
                 const PoolOutcome& outcome,
                 const CPoolDB& db,
                 CValidationState& state)
{
    if (outcome.IsNull() || outcome.poolId != pool.poolId) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-settle-outcome-pool");
    }

    // Consumed exactly once
    if (db.HaveReceipt(pool.poolId, outcome.roundNumber)) {
        return state.Invalid(false, PoolError::OUTCOME_ALREADY_COMPUTED, "bad-settle-already-settled",
                             strprintf("round=%u", outcome.roundNumber));
    }

    if (pool.IsClosed()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-settle-pool-closed");
    }
    if (pool.halted) {
        return state.Invalid(false, PoolError::POOL_HALTED, "bad-settle-pool-halted");
    }
    if (outcome.roundNumber != pool.roundNumber) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-settle-round-mismatch",
                             strprintf("outcome=%u pool=%u", outcome.roundNumber, pool.roundNumber));
    }
    if (pool.status != PoolStatus::SETTLING) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-settle-not-settling",
                             PoolStatusToString(pool.status));
    }
    if (!MoneyRange(outcome.payoutAmount)) {
        return state.Invalid(false, PoolError::INVALID_AMOUNT, "bad-settle-payout-range");
    }

    std::vector<Transfer> transfers;
    CAmount remainder;
    if (!ComputeTransfers(pool.feeSplit, outcome.payoutAmount, transfers, remainder)) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-settle-split");
    }

    CAmount total = 0;
    for (const Transfer& t : transfers) {
        total += t.amount;
    }
    if (total > pool.custodyBalance) {
        return state.Invalid(false, PoolError::INSUFFICIENT_CUSTODY, "bad-settle-insufficient-custody",
                             strprintf("transfers=%d custody=%d", total, pool.custodyBalance));
    }

    return true;
}

bool ApplySettle(PoolLedger& pool,
                 const PoolOutcome& outcome,
                 const CEntryRegister& entries,
                 uint32_t nHeight,
                 int64_t nTime,
                 CPoolDB::Batch& batch,
                 PoolReceipt& receipt,
                 CValidationState& state)
{
    receipt = PoolReceipt();
    receipt.poolId = pool.poolId;
    receipt.roundNumber = outcome.roundNumber;
    receipt.kind = ReceiptKind::OUTCOME;
    receipt.outcomeHash = outcome.GetHash();
    receipt.hasWinner = outcome.hasWinner;
    receipt.winnerEntryId = outcome.winnerEntryId;
    receipt.winner = outcome.winner;
    receipt.payoutAmount = outcome.payoutAmount;
    receipt.settledHeight = nHeight;
    receipt.settledTime = nTime;

    if (!ComputeTransfers(pool.feeSplit, outcome.payoutAmount, receipt.transfers, receipt.remainder)) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-settle-split");
    }

    // Winner first, then the rest of the round: their stake stays in the pool
    if (outcome.hasWinner) {
        if (!entries.MarkProcessed(pool.poolId, outcome.winnerEntryId, batch, state)) {
            return false;
        }
    }
    for (const PoolEntry& entry : entries.EntriesForRound(pool.poolId, pool.roundNumber)) {
        if (outcome.hasWinner && entry.entryId == outcome.winnerEntryId) continue;
        if (!entries.MarkProcessed(pool.poolId, entry.entryId, batch, state)) {
            return false;
        }
    }

    pool.custodyBalance -= receipt.GetTotalTransferred();
    receipt.custodyAfter = pool.custodyBalance;
    batch.WriteReceipt(receipt);

    LogPrint(BCLog::SETTLE, "ApplySettle: pool=%s round=%u payout=%d transfers=%u remainder=%d custody=%d\n",
             pool.poolId.ToString().substr(0, 16), receipt.roundNumber, receipt.payoutAmount,
             (unsigned int)receipt.transfers.size(), receipt.remainder, pool.custodyBalance);

    if (!ApplyRollNextRound(pool, pool.custodyBalance, state)) {
        return false;
    }
    pool.lastActivityTime = nTime;
    return true;
}

CAmount GetReservedPayout(const PoolLedger& pool, const CPoolDB& db)
{
    if (pool.halted) {
        return 0;
    }
    PoolOutcome outcome;
    if (!db.ReadOutcome(pool.poolId, pool.roundNumber, outcome)) {
        return 0;
    }
    if (db.HaveReceipt(pool.poolId, pool.roundNumber)) {
        return 0;
    }
    return outcome.payoutAmount;
}

// =============================================================================
// Escape plan
// =============================================================================

bool ComputeEscapeTransfers(const std::vector<uint256>& payers,
                            CAmount pot,
                            std::vector<Transfer>& transfers,
                            CAmount& remainder)
{
    transfers.clear();
    remainder = 0;

    if (payers.empty() || !MoneyRange(pot)) {
        return false;
    }

    // Distinct payers in first-seen order
    std::map<uint256, size_t> mapIndex;
    for (const uint256& payer : payers) {
        if (mapIndex.count(payer)) continue;
        mapIndex[payer] = transfers.size();
        Transfer t;
        t.destination = payer;
        t.label = "entrant";
        transfers.push_back(t);
    }

    const CAmount lastShare = pot * ESCAPE_LAST_ENTRANT_PERCENT / 100;
    const CAmount community = pot - lastShare;
    const CAmount perEntrant = community / (CAmount)transfers.size();
    remainder = community - perEntrant * (CAmount)transfers.size();

    for (Transfer& t : transfers) {
        t.amount = perEntrant;
    }
    Transfer& last = transfers[mapIndex[payers.back()]];
    last.label = "last-entrant";
    last.percent = ESCAPE_LAST_ENTRANT_PERCENT;
    last.amount += lastShare + remainder;
    return true;
}

bool CheckEscapePlan(const PoolLedger& pool, int64_t nTime, CValidationState& state)
{
    if (pool.IsClosed()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-escape-pool-closed");
    }
    if (pool.halted) {
        return state.Invalid(false, PoolError::POOL_HALTED, "bad-escape-pool-halted");
    }
    if (pool.escapeTimeout <= 0) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-escape-disabled");
    }
    if (pool.status != PoolStatus::ACTIVE) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-escape-not-active",
                             PoolStatusToString(pool.status));
    }
    if (pool.roundEntryCount == 0) {
        return state.Invalid(false, PoolError::NO_ENTRIES, "bad-escape-no-entries");
    }
    if (nTime < pool.lastActivityTime + pool.escapeTimeout) {
        return state.Invalid(false, PoolError::ESCAPE_NOT_READY, "bad-escape-not-ready",
                             strprintf("ready=%d now=%d", pool.lastActivityTime + pool.escapeTimeout, nTime));
    }
    return true;
}

bool ApplyEscapePlan(PoolLedger& pool,
                     const CEntryRegister& entries,
                     uint32_t nHeight,
                     int64_t nTime,
                     CPoolDB::Batch& batch,
                     PoolReceipt& receipt,
                     CValidationState& state)
{
    std::vector<uint256> payers;
    std::vector<uint64_t> entryIds;
    for (const PoolEntry& entry : entries.EntriesForRound(pool.poolId, pool.roundNumber)) {
        payers.push_back(entry.payer);
        entryIds.push_back(entry.entryId);
    }

    receipt = PoolReceipt();
    receipt.poolId = pool.poolId;
    receipt.roundNumber = pool.roundNumber;
    receipt.kind = ReceiptKind::ESCAPE_PLAN;
    receipt.payoutAmount = pool.GetRoundPot();
    receipt.settledHeight = nHeight;
    receipt.settledTime = nTime;

    if (!ComputeEscapeTransfers(payers, receipt.payoutAmount, receipt.transfers, receipt.remainder)) {
        return state.Invalid(false, PoolError::NO_ENTRIES, "bad-escape-no-entries");
    }
    if (receipt.GetTotalTransferred() > pool.custodyBalance) {
        return state.Invalid(false, PoolError::INSUFFICIENT_CUSTODY, "bad-escape-insufficient-custody",
                             strprintf("transfers=%d custody=%d", receipt.GetTotalTransferred(), pool.custodyBalance));
    }

    for (uint64_t entryId : entryIds) {
        if (!entries.MarkProcessed(pool.poolId, entryId, batch, state)) {
            return false;
        }
    }

    pool.custodyBalance -= receipt.GetTotalTransferred();
    receipt.custodyAfter = pool.custodyBalance;
    batch.WriteReceipt(receipt);

    LogPrint(BCLog::SETTLE, "ApplyEscapePlan: pool=%s round=%u pot=%d entrants=%u idle_since=%d custody=%d\n",
             pool.poolId.ToString().substr(0, 16), receipt.roundNumber, receipt.payoutAmount,
             (unsigned int)receipt.transfers.size(), pool.lastActivityTime, pool.custodyBalance);

    if (!ApplyRollNextRound(pool, pool.custodyBalance, state)) {
        return false;
    }
    pool.lastActivityTime = nTime;
    return true;
}
