// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_logic.h"

#include "consensus/validation.h"
#include "logging.h"
#include "pool/disbursement.h"
#include "pool/killswitch.h"

#include <set>

// =============================================================================
// Creation
// =============================================================================

bool CheckPoolConfig(const PoolConfig& config, CValidationState& state)
{
    if (config.entryFee <= 0 || !MoneyRange(config.entryFee)) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-entry-fee");
    }
    if (config.floorAmount <= 0 || !MoneyRange(config.floorAmount)) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-floor-amount");
    }
    if (config.authority.IsNull()) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-null-authority");
    }

    // Fee split
    if (config.feeSplit.empty() || config.feeSplit.size() > MAX_FEE_SPLIT_DESTINATIONS) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-split-size",
                             strprintf("destinations=%u", (unsigned int)config.feeSplit.size()));
    }
    unsigned int nTotalPercent = 0;
    std::set<uint256> destinations;
    for (const FeeSplitEntry& split : config.feeSplit) {
        if (split.destination.IsNull()) {
            return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-split-null-destination");
        }
        if (!destinations.insert(split.destination).second) {
            return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-split-duplicate-destination");
        }
        if (split.percent == 0 || split.percent > 100) {
            return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-split-percent");
        }
        if (split.label.size() > MAX_FEE_SPLIT_LABEL_LENGTH) {
            return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-split-label");
        }
        nTotalPercent += split.percent;
    }
    if (nTotalPercent != 100) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-split-sum",
                             strprintf("sum=%u", nTotalPercent));
    }

    // Mode
    if (config.mode == PoolMode::AI_DECISION) {
        if (config.decisionAuthority.IsNull()) {
            return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-null-decision-authority");
        }
    } else if (config.mode == PoolMode::RANDOM_SELECTION) {
        if (!config.decisionAuthority.IsNull()) {
            return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-decision-authority-random");
        }
    } else {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-mode");
    }

    // Recovery limits
    if (config.recoveryCooldown < 0) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-recovery-cooldown");
    }
    if (config.recoveryMaxPercent > MAX_RECOVERY_PERCENT) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-recovery-percent");
    }
    if (config.escapeTimeout < 0) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-escape-timeout");
    }

    return true;
}

PoolLedger BuildPoolLedger(const PoolConfig& config, uint32_t nHeight, int64_t nTime)
{
    PoolLedger pool;
    pool.poolId = config.GetPoolId();
    pool.mode = config.mode;
    pool.authority = config.authority;
    pool.decisionAuthority = config.decisionAuthority;
    pool.entryFee = config.entryFee;
    pool.floorAmount = config.floorAmount;
    pool.feeSplit = config.feeSplit;
    pool.recoveryCooldown = config.recoveryCooldown;
    pool.recoveryMaxPercent = config.recoveryMaxPercent;
    pool.escapeTimeout = config.escapeTimeout;
    pool.lastActivityTime = nTime;
    pool.createHeight = nHeight;
    pool.createTime = nTime;
    return pool;
}

// =============================================================================
// Entries
// =============================================================================

bool CheckAcceptEntry(const PoolLedger& pool,
                      const uint256& payer,
                      CAmount amount,
                      CValidationState& state)
{
    if (!ArePoolEntriesEnabled()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-entry-entries-disabled");
    }
    if (pool.status != PoolStatus::ACTIVE) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-entry-pool-not-active",
                             PoolStatusToString(pool.status));
    }
    if (pool.halted) {
        return state.Invalid(false, PoolError::POOL_HALTED, "bad-entry-pool-halted");
    }
    if (payer.IsNull()) {
        return state.Invalid(false, PoolError::UNAUTHORIZED, "bad-entry-null-payer");
    }
    if (amount != pool.entryFee) {
        return state.Invalid(false, PoolError::AMOUNT_MISMATCH, "bad-entry-amount-mismatch",
                             strprintf("amount=%d fee=%d", amount, pool.entryFee));
    }
    if (!MoneyRange(pool.custodyBalance + amount)) {
        return state.Invalid(false, PoolError::INVALID_AMOUNT, "bad-entry-custody-overflow");
    }
    return true;
}

PoolEntry BuildEntry(const PoolLedger& pool,
                     const uint256& payer,
                     CAmount amount,
                     uint32_t nHeight,
                     int64_t nTime)
{
    PoolEntry entry;
    entry.poolId = pool.poolId;
    entry.entryId = pool.nextEntryId;
    entry.payer = payer;
    entry.amountPaid = amount;
    entry.contributionSplit = ComputeContributionSplit(pool.feeSplit, amount);
    entry.roundNumber = pool.roundNumber;
    entry.recordedHeight = nHeight;
    entry.recordedTime = nTime;
    entry.processed = false;
    return entry;
}

bool ApplyAcceptEntry(PoolLedger& pool,
                      const PoolEntry& entry,
                      const CEntryRegister& entries,
                      CPoolDB::Batch& batch,
                      CValidationState& state)
{
    if (!entries.Append(entry, batch, state)) {
        return false;
    }

    pool.custodyBalance += entry.amountPaid;
    pool.roundContributions += entry.amountPaid;
    pool.nextEntryId = entry.entryId + 1;
    pool.roundEntryCount++;
    pool.lastActivityTime = entry.recordedTime;

    LogPrint(BCLog::ENTRY, "ApplyAcceptEntry: pool=%s round=%u entry=%u custody=%d contributions=%d\n",
             pool.poolId.ToString().substr(0, 16), pool.roundNumber, entry.entryId,
             pool.custodyBalance, pool.roundContributions);
    return true;
}

// =============================================================================
// Round transitions
// =============================================================================

bool CheckBeginSelection(const PoolLedger& pool, CValidationState& state)
{
    if (pool.IsClosed()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-selection-pool-closed");
    }
    if (pool.halted) {
        return state.Invalid(false, PoolError::POOL_HALTED, "bad-selection-pool-halted");
    }
    if (!IsValidStatusTransition(pool.status, PoolStatus::SELECTING)) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-selection-not-active",
                             PoolStatusToString(pool.status));
    }
    if (pool.roundEntryCount == 0 && pool.custodyBalance < pool.floorAmount) {
        return state.Invalid(false, PoolError::NO_ENTRIES, "bad-selection-no-entries",
                             strprintf("custody=%d floor=%d", pool.custodyBalance, pool.floorAmount));
    }
    return true;
}

void ApplyBeginSelection(PoolLedger& pool, uint32_t nTipHeight)
{
    pool.status = PoolStatus::SELECTING;
    pool.selectionHeight = nTipHeight;

    LogPrint(BCLog::POOL, "ApplyBeginSelection: pool=%s round=%u entries=%u selection_height=%u\n",
             pool.poolId.ToString().substr(0, 16), pool.roundNumber,
             pool.roundEntryCount, pool.selectionHeight);
}

bool CheckBeginSettlement(const PoolLedger& pool, const PoolOutcome& outcome, CValidationState& state)
{
    if (pool.IsClosed()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-settlement-pool-closed");
    }
    if (pool.halted) {
        return state.Invalid(false, PoolError::POOL_HALTED, "bad-settlement-pool-halted");
    }
    if (outcome.poolId != pool.poolId || outcome.roundNumber != pool.roundNumber) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-settlement-round-mismatch",
                             strprintf("outcome=%u pool=%u", outcome.roundNumber, pool.roundNumber));
    }
    if (!IsValidStatusTransition(pool.status, PoolStatus::SETTLING)) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-settlement-not-selecting",
                             PoolStatusToString(pool.status));
    }
    return true;
}

void ApplyBeginSettlement(PoolLedger& pool)
{
    pool.status = PoolStatus::SETTLING;
}

bool ApplyRollNextRound(PoolLedger& pool, CAmount remainder, CValidationState& state)
{
    // Active only for an escape distribution, which never leaves Active
    if (pool.status != PoolStatus::ACTIVE && !IsValidStatusTransition(pool.status, PoolStatus::ACTIVE)) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-roll-not-settling",
                             PoolStatusToString(pool.status));
    }
    if (remainder != pool.custodyBalance) {
        return state.Invalid(false, PoolError::INVALID_AMOUNT, "bad-roll-remainder-mismatch",
                             strprintf("remainder=%d custody=%d", remainder, pool.custodyBalance));
    }

    pool.carriedRemainder = remainder;
    pool.roundContributions = 0;
    pool.roundRecovered = 0;
    pool.roundEntryCount = 0;
    pool.selectionHeight = 0;
    pool.roundNumber++;
    pool.status = PoolStatus::ACTIVE;

    LogPrint(BCLog::POOL, "ApplyRollNextRound: pool=%s round=%u carried=%d\n",
             pool.poolId.ToString().substr(0, 16), pool.roundNumber, pool.carriedRemainder);
    return true;
}

// =============================================================================
// Authority operations
// =============================================================================

bool CheckAuthority(const PoolLedger& pool, const uint256& caller, CValidationState& state)
{
    if (caller.IsNull() || caller != pool.authority) {
        return state.Invalid(false, PoolError::UNAUTHORIZED, "bad-pool-unauthorized",
                             strprintf("caller=%s", caller.ToString().substr(0, 16)));
    }
    return true;
}

bool CheckClosePool(const PoolLedger& pool, const uint256& caller, CValidationState& state)
{
    if (!CheckAuthority(pool, caller, state)) {
        return false;
    }
    if (pool.IsClosed()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-close-already-closed");
    }
    if (!IsValidStatusTransition(pool.status, PoolStatus::CLOSED)) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-close-while-selecting",
                             PoolStatusToString(pool.status));
    }
    return true;
}

void ApplyClosePool(PoolLedger& pool)
{
    pool.status = PoolStatus::CLOSED;
}

bool CheckRotateAuthority(const PoolLedger& pool,
                          const uint256& caller,
                          const uint256& newAuthority,
                          CValidationState& state)
{
    if (!CheckAuthority(pool, caller, state)) {
        return false;
    }
    if (pool.IsClosed()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-rotate-pool-closed");
    }
    if (pool.halted) {
        return state.Invalid(false, PoolError::POOL_HALTED, "bad-rotate-pool-halted");
    }
    if (newAuthority.IsNull()) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-rotate-null-authority");
    }
    return true;
}

bool CheckSetDecisionAuthority(const PoolLedger& pool,
                               const uint256& caller,
                               const uint256& decisionAuthority,
                               CValidationState& state)
{
    if (!CheckAuthority(pool, caller, state)) {
        return false;
    }
    if (pool.IsClosed()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-decision-authority-pool-closed");
    }
    if (pool.halted) {
        return state.Invalid(false, PoolError::POOL_HALTED, "bad-decision-authority-pool-halted");
    }
    if (pool.mode != PoolMode::AI_DECISION) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-decision-authority-random-pool");
    }
    if (decisionAuthority.IsNull()) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-decision-authority-null");
    }
    return true;
}
