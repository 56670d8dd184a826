// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_CONSENSUS_VALIDATION_H
#define BOUNTY_CONSENSUS_VALIDATION_H

#include <string>

/**
 * PoolError - typed failure carried by CValidationState.
 *
 * Every pool operation either commits in full or fails with exactly one of
 * these codes. The reject reason string next to it is stable and is what the
 * RPC layer reports.
 */
enum class PoolError {
    NONE = 0,
    INVALID_CONFIG,
    POOL_CLOSED,
    AMOUNT_MISMATCH,
    NO_ENTRIES,
    DUPLICATE_ENTRY,
    UNKNOWN_ENTRY,
    OUTCOME_MISMATCH,
    OUTCOME_ALREADY_COMPUTED,
    DUPLICATE_OUTCOME,
    INSUFFICIENT_CUSTODY,   // bookkeeping defect, halts the pool
    UNAUTHORIZED,
    AMOUNT_EXCEEDS_CUSTODY,
    INVALID_AMOUNT,
    INVALID_DECISION,
    ANCHOR_UNAVAILABLE,
    POOL_HALTED,
    UNKNOWN_POOL,
    RECOVERY_COOLDOWN_ACTIVE,
    RECOVERY_LIMIT_EXCEEDED,
    INVALID_STATE,          // operation not allowed in the current round phase
    TIMESTAMP_OUT_OF_RANGE, // decision timestamp outside the accepted window
    ESCAPE_NOT_READY,       // pool has not been idle for its escape timeout
    DATABASE_ERROR,
};

/** CamelCase name of the error, e.g. "AmountMismatch" */
const char* GetPoolErrorName(PoolError code);

/** Capture information about pool operation validity */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< operation rejected, nothing committed
        MODE_ERROR,   //!< run-time error
    } mode;
    PoolError code;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), code(PoolError::NONE) {}

    bool Invalid(bool ret = false,
                 PoolError codeIn = PoolError::NONE,
                 const std::string& strRejectReasonIn = "",
                 const std::string& strDebugMessageIn = "")
    {
        code = codeIn;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }
    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        code = PoolError::DATABASE_ERROR;
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const
    {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const
    {
        return mode == MODE_INVALID;
    }
    bool IsError() const
    {
        return mode == MODE_ERROR;
    }
    PoolError GetCode() const { return code; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

/** Convert CValidationState to a human-readable message for logging */
std::string FormatStateMessage(const CValidationState& state);

#endif // BOUNTY_CONSENSUS_VALIDATION_H
