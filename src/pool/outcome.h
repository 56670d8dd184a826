// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_OUTCOME_H
#define BOUNTY_POOL_OUTCOME_H

/**
 * Outcome Selector - exactly one Outcome per round
 *
 * RANDOM_SELECTION seed formula (v1):
 *
 *   d_0 = 0
 *   d_i = SHA256d(d_{i-1} || entryId || payer || amountPaid)   (insertion order)
 *   seed = SHA256d("bountyledger/seed/v1" || poolId || round ||
 *                  anchorHeight || anchorHash || entriesCount || d_n)
 *   winnerIndex = seed mod entriesCount     (seed read as big-endian integer)
 *
 * The anchor is the platform header at selectionHeight + anchorDepth. It
 * does not exist when the entry window closes, so nobody, the authority
 * included, can predict the seed while entries can still change. Selection
 * never falls back to anything else: no anchor, no outcome.
 *
 * AI_DECISION pools take an external decision message instead; the
 * selector only checks that it is authentic, well formed, for this round
 * and never used before.
 */

#include "pool/anchorview.h"
#include "pool/entryregister.h"
#include "pool/pool.h"
#include "pool/pooldb.h"

class CValidationState;

static const char* const SEED_DOMAIN_TAG = "bountyledger/seed/v1";
static const uint32_t DEFAULT_ANCHOR_DEPTH = 2;
/** Seconds a decision timestamp may lie from the ledger clock, either way */
static const int64_t DEFAULT_DECISION_TOLERANCE = 3600;

/** Hash chain over a round's entries; count receives the number of entries */
uint256 ComputeEntriesDigest(const CEntryRange& entries, uint64_t& count);

uint256 ComputeSeedMaterial(const uint256& poolId,
                            uint32_t roundNumber,
                            const PlatformAnchor& anchor,
                            uint64_t entriesCount,
                            const uint256& entriesDigest);

/** seed mod count; count must be non-zero */
uint64_t SelectWinnerIndex(const uint256& seed, uint64_t count);

// =============================================================================
// RANDOM_SELECTION
// =============================================================================

/**
 * CheckSelectOutcome - the round may receive a random outcome now
 *
 * OutcomeAlreadyComputed if one exists for the round; InvalidState unless
 * the pool is a RANDOM_SELECTION pool in Selecting.
 */
bool CheckSelectOutcome(const PoolLedger& pool, const CPoolDB& db, CValidationState& state);

/**
 * ComputeRandomOutcome - derive the round's outcome from committed data
 *
 * AnchorUnavailable if the anchor header has not been produced yet; the
 * round stays in Selecting and the call may simply be repeated later.
 * The payout is the round's own pot (GetRoundPot); a round without
 * entries selects no winner and pays nothing.
 */
bool ComputeRandomOutcome(const PoolLedger& pool,
                          const CEntryRegister& entries,
                          const CAnchorView& anchors,
                          uint32_t nAnchorDepth,
                          uint32_t nHeight,
                          int64_t nTime,
                          PoolOutcome& outcome,
                          CValidationState& state);

/**
 * VerifyOutcome - recompute a stored random outcome from public data
 *
 * OutcomeMismatch if any recorded seed input, the seed or the selected
 * index differs from what the entries and the anchor produce today.
 */
bool VerifyOutcome(const PoolOutcome& outcome,
                   const CEntryRegister& entries,
                   const CAnchorView& anchors,
                   CValidationState& state);

// =============================================================================
// AI_DECISION
// =============================================================================

/** At most MAX_SESSION_ID_LENGTH characters of [A-Za-z0-9_-], non-empty */
bool IsValidSessionId(const std::string& sessionId);

/**
 * CheckDecision - validate an external decision message
 *
 * - Unauthorized: not from the pool's decision authority
 * - InvalidDecision: hash, session id, payout or winner malformed
 * - TimestampOutOfRange: timestamp not positive or more than nTolerance
 *   seconds from nTime
 * - OutcomeMismatch: not for the pool's current round
 * - DuplicateOutcome: the round already has an outcome, or this decision
 *   hash was consumed before
 */
bool CheckDecision(const PoolLedger& pool,
                   const DecisionMessage& decision,
                   const CEntryRegister& entries,
                   const CPoolDB& db,
                   int64_t nTime,
                   int64_t nTolerance,
                   CValidationState& state);

/** Outcome for a validated decision (winner entry resolved in the round) */
PoolOutcome BuildDecisionOutcome(const PoolLedger& pool,
                                 const DecisionMessage& decision,
                                 const CEntryRegister& entries,
                                 uint32_t nHeight,
                                 int64_t nTime);

#endif // BOUNTY_POOL_OUTCOME_H
