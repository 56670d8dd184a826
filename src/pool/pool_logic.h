// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_POOL_LOGIC_H
#define BOUNTY_POOL_POOL_LOGIC_H

/**
 * Pool Ledger Logic - lifecycle transitions of one pool
 *
 * Every operation is a Check/Apply pair:
 * - Check* reads only, and reports the typed failure in CValidationState
 * - Apply* mutates the caller's copy of the ledger and stages records in a
 *   batch; it runs only after the matching Check* passed
 *
 * Round lifecycle:
 *   Active -(BeginSelection)-> Selecting -(BeginSettlement)-> Settling
 *   Settling -(RollNextRound)-> Active (round + 1)
 *   Active -(ExecuteEscapePlan, idle past escapeTimeout)-> Active (round + 1)
 *   Active | Settling -(ClosePool)-> Closed
 */

#include "pool/entryregister.h"
#include "pool/pool.h"
#include "pool/pooldb.h"

class CValidationState;

// =============================================================================
// Creation
// =============================================================================

/**
 * CheckPoolConfig - Validate creation parameters
 *
 * InvalidConfig unless:
 * - entryFee and floorAmount are positive and in money range
 * - 1..MAX_FEE_SPLIT_DESTINATIONS destinations, unique and non-null,
 *   each percent in 1..100, percentages summing to exactly 100
 * - authority is non-null; AI_DECISION pools name a decision authority
 * - recovery limits and the escape timeout are sane
 */
bool CheckPoolConfig(const PoolConfig& config, CValidationState& state);

/** Fresh ledger for a validated config: custody zero, round 1, Active */
PoolLedger BuildPoolLedger(const PoolConfig& config, uint32_t nHeight, int64_t nTime);

// =============================================================================
// Entries
// =============================================================================

/**
 * CheckAcceptEntry
 *
 * PoolClosed if the pool is not Active (or entries are switched off),
 * AmountMismatch if amount != entryFee.
 */
bool CheckAcceptEntry(const PoolLedger& pool,
                      const uint256& payer,
                      CAmount amount,
                      CValidationState& state);

/** Entry with the next id, contribution split frozen from the pool's feeSplit */
PoolEntry BuildEntry(const PoolLedger& pool,
                     const uint256& payer,
                     CAmount amount,
                     uint32_t nHeight,
                     int64_t nTime);

/**
 * ApplyAcceptEntry - the only path by which money enters custody
 *
 * Appends the entry and increments custodyBalance / roundContributions in
 * the same batch.
 */
bool ApplyAcceptEntry(PoolLedger& pool,
                      const PoolEntry& entry,
                      const CEntryRegister& entries,
                      CPoolDB::Batch& batch,
                      CValidationState& state);

// =============================================================================
// Round transitions
// =============================================================================

/**
 * CheckBeginSelection
 *
 * NoEntries when the round has no entries and custody has not reached the
 * floor; the round simply stays open.
 */
bool CheckBeginSelection(const PoolLedger& pool, CValidationState& state);
void ApplyBeginSelection(PoolLedger& pool, uint32_t nTipHeight);

/** Selecting -> Settling; OutcomeMismatch unless the outcome is this round's */
bool CheckBeginSettlement(const PoolLedger& pool, const PoolOutcome& outcome, CValidationState& state);
void ApplyBeginSettlement(PoolLedger& pool);

/**
 * ApplyRollNextRound - Settling (or Active, after an escape plan) -> Active for round + 1
 *
 * remainder must equal the custody left after settlement; it becomes the
 * next round's carried remainder and the per-round counters reset.
 */
bool ApplyRollNextRound(PoolLedger& pool, CAmount remainder, CValidationState& state);

// =============================================================================
// Authority operations
// =============================================================================

/** Unauthorized unless caller is the pool authority */
bool CheckAuthority(const PoolLedger& pool, const uint256& caller, CValidationState& state);

bool CheckClosePool(const PoolLedger& pool, const uint256& caller, CValidationState& state);
void ApplyClosePool(PoolLedger& pool);

bool CheckRotateAuthority(const PoolLedger& pool,
                          const uint256& caller,
                          const uint256& newAuthority,
                          CValidationState& state);

bool CheckSetDecisionAuthority(const PoolLedger& pool,
                               const uint256& caller,
                               const uint256& decisionAuthority,
                               CValidationState& state);

#endif // BOUNTY_POOL_POOL_LOGIC_H
