// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/engine.h"

#include "consensus/validation.h"
#include "logging.h"
#include "pool/disbursement.h"
#include "pool/metrics.h"
#include "pool/pool_logic.h"
#include "utiltime.h"

std::unique_ptr<CPoolEngine> g_pool_engine;

CPoolEngine::CPoolEngine(CPoolDB& dbIn, CAnchorView& anchorsIn, uint32_t nAnchorDepthIn, int64_t nDecisionToleranceIn)
    : db(dbIn), anchors(anchorsIn), entries(dbIn), nAnchorDepth(nAnchorDepthIn), nDecisionTolerance(nDecisionToleranceIn)
{
}

bool CPoolEngine::LoadPool(const uint256& poolId, PoolLedger& pool, CValidationState& state) const
{
    if (!db.ReadPool(poolId, pool)) {
        return state.Invalid(false, PoolError::UNKNOWN_POOL, "bad-pool-unknown",
                             poolId.ToString().substr(0, 16));
    }
    return true;
}

bool CPoolEngine::CommitPool(const PoolLedger& pool, CPoolDB::Batch& batch, const char* strOp, CValidationState& state)
{
    if (!pool.IsConserved()) {
        LogPrintf("ERROR: %s: conservation violated pool=%s custody=%d carried=%d contributions=%d recovered=%d\n",
                  strOp, pool.poolId.ToString(), pool.custodyBalance, pool.carriedRemainder,
                  pool.roundContributions, pool.roundRecovered);
        return state.Error("pool-conservation-violated");
    }

    batch.WritePool(pool);
    try {
        if (!batch.Commit()) {
            return state.Error("pool-db-write-failed");
        }
    } catch (const dbwrapper_error& e) {
        LogPrintf("ERROR: %s: %s\n", strOp, e.what());
        return state.Error("pool-db-write-failed");
    }
    return true;
}

bool CPoolEngine::GetPool(const uint256& poolId, PoolLedger& pool) const
{
    return db.ReadPool(poolId, pool);
}

// =============================================================================
// Pool Ledger
// =============================================================================

bool CPoolEngine::CreatePool(const PoolConfig& config, PoolLedger& poolOut, CValidationState& state)
{
    LOCK(cs_pool);

    if (!CheckPoolConfig(config, state)) {
        return false;
    }

    PoolLedger pool = BuildPoolLedger(config, GetAuditHeight(), GetTime());
    if (db.HavePool(pool.poolId)) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-pool-exists",
                             pool.poolId.ToString().substr(0, 16));
    }

    CPoolDB::Batch batch = db.CreateBatch();
    if (!CommitPool(pool, batch, "CreatePool", state)) {
        return false;
    }

    pool::g_pool_metrics.poolsCreated++;
    LogPrint(BCLog::POOL, "CreatePool: pool=%s mode=%s fee=%d floor=%d destinations=%u\n",
             pool.poolId.ToString(), PoolModeToString(pool.mode), pool.entryFee,
             pool.floorAmount, (unsigned int)pool.feeSplit.size());
    poolOut = pool;
    return true;
}

bool CPoolEngine::AcceptEntry(const uint256& poolId,
                              const uint256& payer,
                              CAmount amount,
                              PoolEntry& entryOut,
                              CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(poolId, pool, state)) {
        return false;
    }
    if (!CheckAcceptEntry(pool, payer, amount, state)) {
        pool::g_pool_metrics.entriesRejected++;
        LogPrint(BCLog::ENTRY, "AcceptEntry: rejected pool=%s reason=%s\n",
                 poolId.ToString().substr(0, 16), FormatStateMessage(state));
        return false;
    }

    CPoolDB::Batch batch = db.CreateBatch();
    PoolEntry entry = BuildEntry(pool, payer, amount, GetAuditHeight(), GetTime());
    if (!ApplyAcceptEntry(pool, entry, entries, batch, state)) {
        pool::g_pool_metrics.entriesRejected++;
        return false;
    }
    if (!CommitPool(pool, batch, "AcceptEntry", state)) {
        return false;
    }

    pool::g_pool_metrics.entriesAccepted++;
    entryOut = entry;
    return true;
}

bool CPoolEngine::BeginSelection(const uint256& poolId, CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(poolId, pool, state)) {
        return false;
    }
    if (!CheckBeginSelection(pool, state)) {
        return false;
    }

    ApplyBeginSelection(pool, anchors.GetTipHeight());

    CPoolDB::Batch batch = db.CreateBatch();
    if (!CommitPool(pool, batch, "BeginSelection", state)) {
        return false;
    }
    pool::g_pool_metrics.selectionsStarted++;
    return true;
}

bool CPoolEngine::BeginSettlement(const uint256& poolId, uint32_t roundNumber, CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(poolId, pool, state)) {
        return false;
    }

    PoolOutcome outcome;
    if (!db.ReadOutcome(poolId, roundNumber, outcome)) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-settlement-no-outcome",
                             strprintf("round=%u", roundNumber));
    }
    if (!CheckBeginSettlement(pool, outcome, state)) {
        return false;
    }

    ApplyBeginSettlement(pool);

    CPoolDB::Batch batch = db.CreateBatch();
    if (!CommitPool(pool, batch, "BeginSettlement", state)) {
        return false;
    }
    LogPrint(BCLog::SETTLE, "BeginSettlement: pool=%s round=%u outcome=%s\n",
             poolId.ToString().substr(0, 16), roundNumber, outcome.GetHash().ToString().substr(0, 16));
    return true;
}

bool CPoolEngine::ClosePool(const uint256& poolId, const uint256& caller, CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(poolId, pool, state)) {
        return false;
    }
    if (!CheckClosePool(pool, caller, state)) {
        return false;
    }

    ApplyClosePool(pool);

    CPoolDB::Batch batch = db.CreateBatch();
    if (!CommitPool(pool, batch, "ClosePool", state)) {
        return false;
    }
    pool::g_pool_metrics.poolsClosed++;
    LogPrint(BCLog::POOL, "ClosePool: pool=%s round=%u custody=%d\n",
             poolId.ToString().substr(0, 16), pool.roundNumber, pool.custodyBalance);
    return true;
}

bool CPoolEngine::RotateAuthority(const uint256& poolId, const uint256& caller, const uint256& newAuthority, CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(poolId, pool, state)) {
        return false;
    }
    if (!CheckRotateAuthority(pool, caller, newAuthority, state)) {
        return false;
    }

    pool.authority = newAuthority;

    CPoolDB::Batch batch = db.CreateBatch();
    if (!CommitPool(pool, batch, "RotateAuthority", state)) {
        return false;
    }
    LogPrint(BCLog::POOL, "RotateAuthority: pool=%s authority=%s\n",
             poolId.ToString().substr(0, 16), newAuthority.ToString().substr(0, 16));
    return true;
}

bool CPoolEngine::SetDecisionAuthority(const uint256& poolId, const uint256& caller, const uint256& decisionAuthority, CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(poolId, pool, state)) {
        return false;
    }
    if (!CheckSetDecisionAuthority(pool, caller, decisionAuthority, state)) {
        return false;
    }

    pool.decisionAuthority = decisionAuthority;

    CPoolDB::Batch batch = db.CreateBatch();
    if (!CommitPool(pool, batch, "SetDecisionAuthority", state)) {
        return false;
    }
    LogPrint(BCLog::POOL, "SetDecisionAuthority: pool=%s decision_authority=%s\n",
             poolId.ToString().substr(0, 16), decisionAuthority.ToString().substr(0, 16));
    return true;
}

// =============================================================================
// Outcome Selector
// =============================================================================

bool CPoolEngine::SelectOutcome(const uint256& poolId, PoolOutcome& outcomeOut, CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(poolId, pool, state)) {
        return false;
    }
    if (!CheckSelectOutcome(pool, db, state)) {
        return false;
    }

    PoolOutcome outcome;
    if (!ComputeRandomOutcome(pool, entries, anchors, nAnchorDepth, GetAuditHeight(), GetTime(), outcome, state)) {
        if (state.GetCode() == PoolError::ANCHOR_UNAVAILABLE) {
            pool::g_pool_metrics.selectionsDeferred++;
        }
        return false;
    }

    CPoolDB::Batch batch = db.CreateBatch();
    batch.WriteOutcome(outcome);
    if (!CommitPool(pool, batch, "SelectOutcome", state)) {
        return false;
    }

    pool::g_pool_metrics.outcomesSelected++;
    outcomeOut = outcome;
    return true;
}

bool CPoolEngine::SubmitDecision(const DecisionMessage& decision, PoolOutcome& outcomeOut, CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(decision.poolId, pool, state)) {
        return false;
    }
    if (!CheckDecision(pool, decision, entries, db, GetTime(), nDecisionTolerance, state)) {
        pool::g_pool_metrics.decisionsRejected++;
        LogPrint(BCLog::OUTCOME, "SubmitDecision: rejected pool=%s reason=%s\n",
                 decision.poolId.ToString().substr(0, 16), FormatStateMessage(state));
        return false;
    }

    PoolOutcome outcome = BuildDecisionOutcome(pool, decision, entries, GetAuditHeight(), GetTime());

    CPoolDB::Batch batch = db.CreateBatch();
    batch.WriteOutcome(outcome);
    batch.WriteConsumedDecision(pool.poolId, decision.decisionHash, pool.roundNumber);
    if (!CommitPool(pool, batch, "SubmitDecision", state)) {
        return false;
    }

    pool::g_pool_metrics.decisionsAccepted++;
    outcomeOut = outcome;
    return true;
}

bool CPoolEngine::VerifyOutcome(const uint256& poolId, uint32_t roundNumber, CValidationState& state) const
{
    LOCK(cs_pool);

    PoolOutcome outcome;
    if (!db.ReadOutcome(poolId, roundNumber, outcome)) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-verify-no-outcome",
                             strprintf("round=%u", roundNumber));
    }
    return ::VerifyOutcome(outcome, entries, anchors, state);
}

// =============================================================================
// Disbursement Engine
// =============================================================================

bool CPoolEngine::Settle(const uint256& poolId, uint32_t roundNumber, PoolReceipt& receiptOut, CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(poolId, pool, state)) {
        return false;
    }

    PoolOutcome outcome;
    if (!db.ReadOutcome(poolId, roundNumber, outcome)) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-settle-no-outcome",
                             strprintf("round=%u", roundNumber));
    }

    if (!CheckSettle(pool, outcome, db, state)) {
        if (state.GetCode() == PoolError::INSUFFICIENT_CUSTODY) {
            // Books are inconsistent: stop settlement on this pool until
            // the authority intervenes through the recovery gate.
            pool.halted = true;
            CPoolDB::Batch batch = db.CreateBatch();
            CValidationState haltState;
            if (!CommitPool(pool, batch, "Settle", haltState)) {
                LogPrintf("ERROR: Settle: failed to persist halt pool=%s: %s\n",
                          poolId.ToString(), FormatStateMessage(haltState));
            }
            pool::g_pool_metrics.halts++;
            LogPrintf("POOL HALTED: pool=%s round=%u reason=%s\n",
                      poolId.ToString(), roundNumber, FormatStateMessage(state));
        }
        return false;
    }

    CPoolDB::Batch batch = db.CreateBatch();
    PoolReceipt receipt;
    if (!ApplySettle(pool, outcome, entries, GetAuditHeight(), GetTime(), batch, receipt, state)) {
        return false;
    }
    if (!CommitPool(pool, batch, "Settle", state)) {
        return false;
    }

    pool::g_pool_metrics.settlements++;
    pool::g_pool_metrics.totalDisbursed += receipt.GetTotalTransferred();
    receiptOut = receipt;
    return true;
}

bool CPoolEngine::ExecuteEscapePlan(const uint256& poolId, PoolReceipt& receiptOut, CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(poolId, pool, state)) {
        return false;
    }

    const int64_t nTime = GetTime();
    if (!CheckEscapePlan(pool, nTime, state)) {
        return false;
    }

    CPoolDB::Batch batch = db.CreateBatch();
    PoolReceipt receipt;
    if (!ApplyEscapePlan(pool, entries, GetAuditHeight(), nTime, batch, receipt, state)) {
        return false;
    }
    if (!CommitPool(pool, batch, "ExecuteEscapePlan", state)) {
        return false;
    }

    pool::g_pool_metrics.escapePlans++;
    pool::g_pool_metrics.totalDisbursed += receipt.GetTotalTransferred();
    receiptOut = receipt;
    return true;
}

bool CPoolEngine::SubmitAnchor(const PlatformAnchor& anchor, CValidationState& state)
{
    LOCK(cs_pool);

    if (!anchors.AddAnchor(anchor, state)) {
        return false;
    }
    LogPrint(BCLog::OUTCOME, "SubmitAnchor: height=%u hash=%s\n",
             anchor.height, anchor.blockHash.ToString().substr(0, 16));
    return true;
}

// =============================================================================
// Recovery Gate
// =============================================================================

bool CPoolEngine::Recover(const uint256& poolId, const RecoveryRequest& request, RecoveryAction& actionOut, CValidationState& state)
{
    LOCK(cs_pool);

    PoolLedger pool;
    if (!LoadPool(poolId, pool, state)) {
        return false;
    }

    const int64_t nTime = GetTime();
    if (!CheckRecover(pool, request, nTime, db, state)) {
        pool::g_pool_metrics.recoveriesRejected++;
        LogPrint(BCLog::RECOVERY, "Recover: rejected pool=%s initiator=%s reason=%s\n",
                 poolId.ToString().substr(0, 16), request.initiator.ToString().substr(0, 16),
                 FormatStateMessage(state));
        return false;
    }

    CPoolDB::Batch batch = db.CreateBatch();
    RecoveryAction action;
    ApplyRecover(pool, request, nTime, batch, action);
    if (!CommitPool(pool, batch, "Recover", state)) {
        return false;
    }

    pool::g_pool_metrics.recoveries++;
    pool::g_pool_metrics.totalRecovered += action.amount;
    if (action.closedPool) {
        pool::g_pool_metrics.poolsClosed++;
    }
    actionOut = action;
    return true;
}
