// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_ENGINE_H
#define BOUNTY_POOL_ENGINE_H

/**
 * CPoolEngine - the transaction boundary of every pool operation
 *
 * Each call:
 *   LOCK(cs_pool)
 *   read the ledger into a local copy
 *   Check* (nothing written on failure)
 *   Apply* on the copy, staging records into one CPoolDB::Batch
 *   verify conservation, write the ledger, commit once
 *
 * So an operation either commits in full or leaves no trace. The one
 * exception is InsufficientCustody at settlement: the engine then commits
 * the ledger's `halted` flag alone before reporting the error.
 */

#include "pool/anchorview.h"
#include "pool/entryregister.h"
#include "pool/outcome.h"
#include "pool/pool.h"
#include "pool/pooldb.h"
#include "pool/recovery.h"
#include "sync.h"

#include <memory>

class CValidationState;

class CPoolEngine
{
private:
    CPoolDB& db;
    CAnchorView& anchors;
    CEntryRegister entries;
    uint32_t nAnchorDepth;
    int64_t nDecisionTolerance;

    mutable RecursiveMutex cs_pool;

    bool LoadPool(const uint256& poolId, PoolLedger& pool, CValidationState& state) const;

    /** Conservation check, ledger write and the single commit */
    bool CommitPool(const PoolLedger& pool, CPoolDB::Batch& batch, const char* strOp, CValidationState& state);

    uint32_t GetAuditHeight() const { return anchors.GetTipHeight(); }

public:
    CPoolEngine(CPoolDB& dbIn, CAnchorView& anchorsIn,
                uint32_t nAnchorDepthIn = DEFAULT_ANCHOR_DEPTH,
                int64_t nDecisionToleranceIn = DEFAULT_DECISION_TOLERANCE);

    // === Pool Ledger ===

    bool CreatePool(const PoolConfig& config, PoolLedger& poolOut, CValidationState& state);

    /** Only path by which money enters custody */
    bool AcceptEntry(const uint256& poolId,
                     const uint256& payer,
                     CAmount amount,
                     PoolEntry& entryOut,
                     CValidationState& state);

    bool BeginSelection(const uint256& poolId, CValidationState& state);

    /** Selecting -> Settling with the stored outcome of `roundNumber` */
    bool BeginSettlement(const uint256& poolId, uint32_t roundNumber, CValidationState& state);

    bool ClosePool(const uint256& poolId, const uint256& caller, CValidationState& state);
    bool RotateAuthority(const uint256& poolId, const uint256& caller, const uint256& newAuthority, CValidationState& state);
    bool SetDecisionAuthority(const uint256& poolId, const uint256& caller, const uint256& decisionAuthority, CValidationState& state);

    // === Outcome Selector ===

    /** Random pools: derive and record the round's outcome */
    bool SelectOutcome(const uint256& poolId, PoolOutcome& outcomeOut, CValidationState& state);

    /** AI pools: validate and record the external decision */
    bool SubmitDecision(const DecisionMessage& decision, PoolOutcome& outcomeOut, CValidationState& state);

    bool VerifyOutcome(const uint256& poolId, uint32_t roundNumber, CValidationState& state) const;

    // === Disbursement Engine ===

    bool Settle(const uint256& poolId, uint32_t roundNumber, PoolReceipt& receiptOut, CValidationState& state);

    /** Permissionless: distribute a round idle past the pool's escape timeout */
    bool ExecuteEscapePlan(const uint256& poolId, PoolReceipt& receiptOut, CValidationState& state);

    // === Recovery Gate ===

    bool Recover(const uint256& poolId, const RecoveryRequest& request, RecoveryAction& actionOut, CValidationState& state);

    // === Platform anchors ===

    /** Record the next platform header; heights must be contiguous */
    bool SubmitAnchor(const PlatformAnchor& anchor, CValidationState& state);

    // === Read access ===

    bool GetPool(const uint256& poolId, PoolLedger& pool) const;
    const CEntryRegister& GetEntryRegister() const { return entries; }
    const CAnchorView& GetAnchorView() const { return anchors; }
    uint32_t GetAnchorDepth() const { return nAnchorDepth; }
    int64_t GetDecisionTolerance() const { return nDecisionTolerance; }
};

// Global pool engine instance
extern std::unique_ptr<CPoolEngine> g_pool_engine;

#endif // BOUNTY_POOL_ENGINE_H
