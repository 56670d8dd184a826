// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/recovery.h"

#include "consensus/validation.h"
#include "logging.h"
#include "pool/disbursement.h"
#include "pool/pool_logic.h"

bool CheckRecover(const PoolLedger& pool,
                  const RecoveryRequest& request,
                  int64_t nTime,
                  const CPoolDB& db,
                  CValidationState& state)
{
    if (!CheckAuthority(pool, request.initiator, state)) {
        return false;
    }
    if (pool.IsClosed()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-recover-pool-closed");
    }
    if (request.amount <= 0 || !MoneyRange(request.amount)) {
        return state.Invalid(false, PoolError::INVALID_AMOUNT, "bad-recover-amount");
    }
    if (request.destination.IsNull()) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-recover-null-destination");
    }
    if (request.reasonCode.empty() || request.reasonCode.size() > MAX_REASON_CODE_LENGTH) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-recover-reason-code");
    }
    if (request.amount > pool.custodyBalance) {
        return state.Invalid(false, PoolError::AMOUNT_EXCEEDS_CUSTODY, "bad-recover-exceeds-custody",
                             strprintf("amount=%d custody=%d", request.amount, pool.custodyBalance));
    }
    const CAmount nReserved = GetReservedPayout(pool, db);
    if (request.amount > pool.custodyBalance - nReserved) {
        return state.Invalid(false, PoolError::AMOUNT_EXCEEDS_CUSTODY, "bad-recover-reserved-payout",
                             strprintf("amount=%d custody=%d reserved=%d", request.amount, pool.custodyBalance, nReserved));
    }
    if (pool.recoveryCooldown > 0 && pool.recoveryCount > 0 &&
        nTime < pool.lastRecoveryTime + pool.recoveryCooldown) {
        return state.Invalid(false, PoolError::RECOVERY_COOLDOWN_ACTIVE, "bad-recover-cooldown",
                             strprintf("next=%d", pool.lastRecoveryTime + pool.recoveryCooldown));
    }
    // amount * 100 <= custody * maxPercent, both sides bounded by MAX_MONEY * 100
    if (pool.recoveryMaxPercent > 0 &&
        request.amount * 100 > pool.custodyBalance * pool.recoveryMaxPercent) {
        return state.Invalid(false, PoolError::RECOVERY_LIMIT_EXCEEDED, "bad-recover-limit",
                             strprintf("max_percent=%u", (unsigned int)pool.recoveryMaxPercent));
    }
    if (request.fClosePool && !IsValidStatusTransition(pool.status, PoolStatus::CLOSED)) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-recover-close-while-selecting",
                             PoolStatusToString(pool.status));
    }
    return true;
}

void ApplyRecover(PoolLedger& pool,
                  const RecoveryRequest& request,
                  int64_t nTime,
                  CPoolDB::Batch& batch,
                  RecoveryAction& action)
{
    pool.custodyBalance -= request.amount;
    pool.roundRecovered += request.amount;
    pool.recoveryCount++;
    pool.lastRecoveryTime = nTime;
    if (request.fClosePool) {
        ApplyClosePool(pool);
    }

    action = RecoveryAction();
    action.poolId = pool.poolId;
    action.sequence = pool.recoveryCount;
    action.initiator = request.initiator;
    action.reasonCode = request.reasonCode;
    action.amount = request.amount;
    action.destination = request.destination;
    action.roundNumber = pool.roundNumber;
    action.closedPool = request.fClosePool;
    action.timestamp = nTime;
    batch.WriteRecovery(action);

    LogPrint(BCLog::RECOVERY, "ApplyRecover: pool=%s seq=%u reason=%s amount=%d custody=%d closed=%d\n",
             pool.poolId.ToString().substr(0, 16), action.sequence, action.reasonCode,
             action.amount, pool.custodyBalance, action.closedPool);
}
