// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_DISBURSEMENT_H
#define BOUNTY_POOL_DISBURSEMENT_H

/**
 * Disbursement Engine - executes the fund movement implied by an Outcome
 *
 * Split rule (used for settlement and for entry contribution splits):
 *   share_i = floor(amount * percent_i / 100)
 *   remainder = amount - sum(share_i)  (at most n-1 units)
 *   remainder goes to the first destination in feeSplit order
 *
 * The transfers always sum exactly to the amount.
 *
 * Escape plan: a pool with an escapeTimeout whose round sat idle that long
 * (no entry, no settlement) distributes the round's pot without an Outcome.
 * ESCAPE_LAST_ENTRANT_PERCENT goes to the last entrant, the rest is shared
 * equally by the distinct entrants, and the division remainder goes to the
 * last entrant as well.
 */

#include "pool/entryregister.h"
#include "pool/pool.h"
#include "pool/pooldb.h"

#include <vector>

class CValidationState;

/**
 * ComputeTransfers - Apply the split rule to an amount
 *
 * @param feeSplit Validated split (percentages sum to 100)
 * @param amount Amount to split, >= 0
 * @param transfers Output: one transfer per destination, in feeSplit order
 * @param remainder Output: units added to transfers[0] by the tie-break
 * @return false if the split is empty or the amount is out of range
 */
bool ComputeTransfers(const std::vector<FeeSplitEntry>& feeSplit,
                      CAmount amount,
                      std::vector<Transfer>& transfers,
                      CAmount& remainder);

/** Per-destination shares of one entry's payment (same rule) */
std::vector<CAmount> ComputeContributionSplit(const std::vector<FeeSplitEntry>& feeSplit, CAmount amount);

/**
 * CheckSettle - Validate that an outcome can be settled now
 *
 * Order matters: a round that already has a receipt reports
 * OutcomeAlreadyComputed even after the pool has moved on.
 * InsufficientCustody means the books are wrong; the caller must halt.
 */
bool CheckSettle(const PoolLedger& pool,
                 const PoolOutcome& outcome,
                 const CPoolDB& db,
                 CValidationState& state);

/**
 * ApplySettle - Disburse and roll the pool into its next round
 *
 * Marks every entry of the round processed, decrements custody by the
 * transferred total, stages the Receipt and rolls the remaining custody
 * over as the next round's carried remainder. The ledger itself is written
 * by the caller.
 */
bool ApplySettle(PoolLedger& pool,
                 const PoolOutcome& outcome,
                 const CEntryRegister& entries,
                 uint32_t nHeight,
                 int64_t nTime,
                 CPoolDB::Batch& batch,
                 PoolReceipt& receipt,
                 CValidationState& state);

/**
 * GetReservedPayout - payout of an outcome recorded but not yet settled
 *
 * Zero when the current round has no outcome, when it was already settled,
 * or when the pool is halted (its outcome can no longer settle).
 */
CAmount GetReservedPayout(const PoolLedger& pool, const CPoolDB& db);

// =============================================================================
// Escape plan
// =============================================================================

/**
 * ComputeEscapeTransfers - split an idle round's pot among its entrants
 *
 * @param payers Payers of the round in insertion order (repeats allowed)
 * @param pot Amount to distribute, >= 0
 * @param transfers Output: one transfer per distinct payer, first-seen order
 * @param remainder Output: units added to the last entrant by the tie-break
 * @return false if there are no payers or the pot is out of range
 */
bool ComputeEscapeTransfers(const std::vector<uint256>& payers,
                            CAmount pot,
                            std::vector<Transfer>& transfers,
                            CAmount& remainder);

/**
 * CheckEscapePlan
 *
 * PoolClosed, PoolHalted, InvalidConfig when the pool has no escape timeout,
 * InvalidState outside Active, NoEntries for an empty round, EscapeNotReady
 * until nTime reaches lastActivityTime + escapeTimeout. Anyone may trigger it.
 */
bool CheckEscapePlan(const PoolLedger& pool, int64_t nTime, CValidationState& state);

/** Distribute the round's pot, mark its entries processed, roll to the next round */
bool ApplyEscapePlan(PoolLedger& pool,
                     const CEntryRegister& entries,
                     uint32_t nHeight,
                     int64_t nTime,
                     CPoolDB::Batch& batch,
                     PoolReceipt& receipt,
                     CValidationState& state);

#endif // BOUNTY_POOL_DISBURSEMENT_H
