// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_RECOVERY_H
#define BOUNTY_POOL_RECOVERY_H

/**
 * Recovery Gate - authority-only extraction of stuck funds
 *
 * Structurally separate from settlement: it takes an explicit authority
 * identity and reason code, never an Outcome, and every use is appended to
 * the permanent recovery log ('X' records). It does not touch the round
 * number or the processed flags of outstanding entries.
 *
 * Optional per-pool limits (set at creation, 0 disables):
 * - recoveryCooldown: seconds between two recoveries
 * - recoveryMaxPercent: max share of custody per recovery
 */

#include "pool/pool.h"
#include "pool/pooldb.h"

class CValidationState;

struct RecoveryRequest
{
    uint256 initiator;
    CAmount amount{0};
    uint256 destination;
    std::string reasonCode;
    bool fClosePool{false};     // move the pool to Closed in the same commit
};

/**
 * CheckRecover
 *
 * Unauthorized is reported first, whatever the amount. Then PoolClosed,
 * InvalidAmount (zero or negative), AmountExceedsCustody,
 * RecoveryCooldownActive and RecoveryLimitExceeded.
 *
 * An outcome recorded for the current round and not yet settled keeps its
 * payout out of reach: amount may not exceed custody minus that payout
 * (AmountExceedsCustody). A halted pool reserves nothing.
 */
bool CheckRecover(const PoolLedger& pool,
                  const RecoveryRequest& request,
                  int64_t nTime,
                  const CPoolDB& db,
                  CValidationState& state);

/**
 * ApplyRecover - decrement custody and stage the log record
 *
 * The amount counts against the current round (roundRecovered) so the
 * conservation identity keeps holding.
 */
void ApplyRecover(PoolLedger& pool,
                  const RecoveryRequest& request,
                  int64_t nTime,
                  CPoolDB::Batch& batch,
                  RecoveryAction& action);

#endif // BOUNTY_POOL_RECOVERY_H
