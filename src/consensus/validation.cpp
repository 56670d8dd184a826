// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"

#include "util/format.h"

const char* GetPoolErrorName(PoolError code)
{
    switch (code) {
    case PoolError::NONE: return "None";
    case PoolError::INVALID_CONFIG: return "InvalidConfig";
    case PoolError::POOL_CLOSED: return "PoolClosed";
    case PoolError::AMOUNT_MISMATCH: return "AmountMismatch";
    case PoolError::NO_ENTRIES: return "NoEntries";
    case PoolError::DUPLICATE_ENTRY: return "DuplicateEntry";
    case PoolError::UNKNOWN_ENTRY: return "UnknownEntry";
    case PoolError::OUTCOME_MISMATCH: return "OutcomeMismatch";
    case PoolError::OUTCOME_ALREADY_COMPUTED: return "OutcomeAlreadyComputed";
    case PoolError::DUPLICATE_OUTCOME: return "DuplicateOutcome";
    case PoolError::INSUFFICIENT_CUSTODY: return "InsufficientCustody";
    case PoolError::UNAUTHORIZED: return "Unauthorized";
    case PoolError::AMOUNT_EXCEEDS_CUSTODY: return "AmountExceedsCustody";
    case PoolError::INVALID_AMOUNT: return "InvalidAmount";
    case PoolError::INVALID_DECISION: return "InvalidDecision";
    case PoolError::ANCHOR_UNAVAILABLE: return "AnchorUnavailable";
    case PoolError::POOL_HALTED: return "PoolHalted";
    case PoolError::UNKNOWN_POOL: return "UnknownPool";
    case PoolError::RECOVERY_COOLDOWN_ACTIVE: return "RecoveryCooldownActive";
    case PoolError::RECOVERY_LIMIT_EXCEEDED: return "RecoveryLimitExceeded";
    case PoolError::INVALID_STATE: return "InvalidState";
    case PoolError::TIMESTAMP_OUT_OF_RANGE: return "TimestampOutOfRange";
    case PoolError::ESCAPE_NOT_READY: return "EscapeNotReady";
    case PoolError::DATABASE_ERROR: return "DatabaseError";
    } // no default case, so the compiler can warn about missing cases
    return "Unknown";
}

std::string FormatStateMessage(const CValidationState& state)
{
    return strprintf("%s%s (%s)",
        state.GetRejectReason(),
        state.GetDebugMessage().empty() ? "" : ", " + state.GetDebugMessage(),
        GetPoolErrorName(state.GetCode()));
}
