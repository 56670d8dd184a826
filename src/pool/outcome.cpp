// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/outcome.h"

#include "consensus/validation.h"
#include "hash.h"
#include "logging.h"

#include <cstdlib>

namespace {

// First entry of the round paid by `payer`, with its insertion position
bool FindEntryByPayer(const CEntryRange& range, const uint256& payer, PoolEntry& entry, uint64_t& index)
{
    uint64_t pos = 0;
    for (const PoolEntry& e : range) {
        if (e.payer == payer) {
            entry = e;
            index = pos;
            return true;
        }
        pos++;
    }
    return false;
}

} // anonymous namespace

uint256 ComputeEntriesDigest(const CEntryRange& entries, uint64_t& count)
{
    uint256 digest;
    count = 0;
    for (const PoolEntry& entry : entries) {
        CHashWriter ss(SER_GETHASH, 0);
        ss << digest << entry.entryId << entry.payer << entry.amountPaid;
        digest = ss.GetHash();
        count++;
    }
    return digest;
}

uint256 ComputeSeedMaterial(const uint256& poolId,
                            uint32_t roundNumber,
                            const PlatformAnchor& anchor,
                            uint64_t entriesCount,
                            const uint256& entriesDigest)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << std::string(SEED_DOMAIN_TAG);
    ss << poolId << roundNumber;
    ss << anchor.height << anchor.blockHash;
    ss << entriesCount << entriesDigest;
    return ss.GetHash();
}

uint64_t SelectWinnerIndex(const uint256& seed, uint64_t count)
{
    return ReduceModulo(seed, count);
}

// =============================================================================
// RANDOM_SELECTION
// =============================================================================

bool CheckSelectOutcome(const PoolLedger& pool, const CPoolDB& db, CValidationState& state)
{
    if (pool.mode != PoolMode::RANDOM_SELECTION) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-select-not-random-pool");
    }
    if (db.HaveOutcome(pool.poolId, pool.roundNumber)) {
        return state.Invalid(false, PoolError::OUTCOME_ALREADY_COMPUTED, "bad-select-outcome-exists",
                             strprintf("round=%u", pool.roundNumber));
    }
    if (pool.IsClosed()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-select-pool-closed");
    }
    if (pool.halted) {
        return state.Invalid(false, PoolError::POOL_HALTED, "bad-select-pool-halted");
    }
    if (pool.status != PoolStatus::SELECTING) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-select-not-selecting",
                             PoolStatusToString(pool.status));
    }
    return true;
}

bool ComputeRandomOutcome(const PoolLedger& pool,
                          const CEntryRegister& entries,
                          const CAnchorView& anchors,
                          uint32_t nAnchorDepth,
                          uint32_t nHeight,
                          int64_t nTime,
                          PoolOutcome& outcome,
                          CValidationState& state)
{
    const uint32_t nAnchorHeight = pool.selectionHeight + nAnchorDepth;
    PlatformAnchor anchor;
    if (!anchors.GetAnchor(nAnchorHeight, anchor)) {
        return state.Invalid(false, PoolError::ANCHOR_UNAVAILABLE, "bad-select-anchor-unavailable",
                             strprintf("anchor_height=%u tip=%u", nAnchorHeight, anchors.GetTipHeight()));
    }

    CEntryRange range = entries.EntriesForRound(pool.poolId, pool.roundNumber);

    outcome = PoolOutcome();
    outcome.poolId = pool.poolId;
    outcome.roundNumber = pool.roundNumber;
    outcome.mode = PoolMode::RANDOM_SELECTION;
    outcome.anchorHeight = anchor.height;
    outcome.anchorHash = anchor.blockHash;
    outcome.entriesDigest = ComputeEntriesDigest(range, outcome.entriesCount);
    outcome.seed = ComputeSeedMaterial(pool.poolId, pool.roundNumber, anchor,
                                       outcome.entriesCount, outcome.entriesDigest);
    outcome.computedHeight = nHeight;
    outcome.computedTime = nTime;

    if (outcome.entriesCount > 0) {
        outcome.winnerIndex = SelectWinnerIndex(outcome.seed, outcome.entriesCount);
        PoolEntry winner;
        if (!entries.GetEntryAt(pool.poolId, pool.roundNumber, outcome.winnerIndex, winner)) {
            return state.Invalid(false, PoolError::UNKNOWN_ENTRY, "bad-select-winner-missing",
                                 strprintf("index=%u", outcome.winnerIndex));
        }
        outcome.hasWinner = true;
        outcome.winnerEntryId = winner.entryId;
        outcome.winner = winner.payer;
        outcome.payoutAmount = pool.GetRoundPot();
    }

    LogPrint(BCLog::OUTCOME, "ComputeRandomOutcome: pool=%s round=%u anchor=%u entries=%u seed=%s index=%u payout=%d\n",
             pool.poolId.ToString().substr(0, 16), pool.roundNumber, anchor.height,
             outcome.entriesCount, outcome.seed.ToString().substr(0, 16),
             outcome.winnerIndex, outcome.payoutAmount);
    return true;
}

bool VerifyOutcome(const PoolOutcome& outcome,
                   const CEntryRegister& entries,
                   const CAnchorView& anchors,
                   CValidationState& state)
{
    if (outcome.mode != PoolMode::RANDOM_SELECTION) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-verify-not-random-outcome");
    }

    PlatformAnchor anchor;
    if (!anchors.GetAnchor(outcome.anchorHeight, anchor)) {
        return state.Invalid(false, PoolError::ANCHOR_UNAVAILABLE, "bad-verify-anchor-unavailable");
    }
    if (anchor.blockHash != outcome.anchorHash) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-verify-anchor-hash");
    }

    uint64_t count = 0;
    uint256 digest = ComputeEntriesDigest(entries.EntriesForRound(outcome.poolId, outcome.roundNumber), count);
    if (count != outcome.entriesCount || digest != outcome.entriesDigest) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-verify-entries-digest");
    }

    uint256 seed = ComputeSeedMaterial(outcome.poolId, outcome.roundNumber, anchor, count, digest);
    if (seed != outcome.seed) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-verify-seed");
    }

    if (count == 0) {
        if (outcome.hasWinner) {
            return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-verify-winner-without-entries");
        }
        return true;
    }

    uint64_t index = SelectWinnerIndex(seed, count);
    PoolEntry winner;
    if (!outcome.hasWinner || index != outcome.winnerIndex ||
        !entries.GetEntryAt(outcome.poolId, outcome.roundNumber, index, winner) ||
        winner.entryId != outcome.winnerEntryId || winner.payer != outcome.winner) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-verify-winner");
    }
    return true;
}

// =============================================================================
// AI_DECISION
// =============================================================================

bool IsValidSessionId(const std::string& sessionId)
{
    if (sessionId.empty() || sessionId.size() > MAX_SESSION_ID_LENGTH) {
        return false;
    }
    for (char c : sessionId) {
        bool fAlnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (!fAlnum && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

bool CheckDecision(const PoolLedger& pool,
                   const DecisionMessage& decision,
                   const CEntryRegister& entries,
                   const CPoolDB& db,
                   int64_t nTime,
                   int64_t nTolerance,
                   CValidationState& state)
{
    if (pool.mode != PoolMode::AI_DECISION) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-decision-not-ai-pool");
    }
    if (decision.poolId != pool.poolId) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-decision-pool");
    }

    // Authenticity
    if (decision.decisionAuthority.IsNull() || decision.decisionAuthority != pool.decisionAuthority) {
        return state.Invalid(false, PoolError::UNAUTHORIZED, "bad-decision-authority");
    }
    if (decision.decisionHash != decision.ComputeHash()) {
        return state.Invalid(false, PoolError::INVALID_DECISION, "bad-decision-hash");
    }

    // Single use
    uint32_t consumedRound;
    if (db.ReadConsumedDecision(pool.poolId, decision.decisionHash, consumedRound)) {
        return state.Invalid(false, PoolError::DUPLICATE_OUTCOME, "bad-decision-replayed",
                             strprintf("consumed_round=%u", consumedRound));
    }
    if (db.HaveOutcome(pool.poolId, decision.roundNumber)) {
        return state.Invalid(false, PoolError::DUPLICATE_OUTCOME, "bad-decision-outcome-exists",
                             strprintf("round=%u", decision.roundNumber));
    }

    // Round correspondence
    if (decision.roundNumber != pool.roundNumber) {
        return state.Invalid(false, PoolError::OUTCOME_MISMATCH, "bad-decision-round-mismatch",
                             strprintf("decision=%u pool=%u", decision.roundNumber, pool.roundNumber));
    }
    if (pool.IsClosed()) {
        return state.Invalid(false, PoolError::POOL_CLOSED, "bad-decision-pool-closed");
    }
    if (pool.halted) {
        return state.Invalid(false, PoolError::POOL_HALTED, "bad-decision-pool-halted");
    }
    if (pool.status != PoolStatus::SELECTING) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-decision-not-selecting",
                             PoolStatusToString(pool.status));
    }

    // Well-formedness
    if (!IsValidSessionId(decision.sessionId)) {
        return state.Invalid(false, PoolError::INVALID_DECISION, "bad-decision-session-id");
    }
    if (decision.timestamp <= 0 || std::abs(nTime - decision.timestamp) > nTolerance) {
        return state.Invalid(false, PoolError::TIMESTAMP_OUT_OF_RANGE, "bad-decision-timestamp",
                             strprintf("timestamp=%d now=%d tolerance=%d", decision.timestamp, nTime, nTolerance));
    }
    if (!MoneyRange(decision.payoutAmount)) {
        return state.Invalid(false, PoolError::INVALID_DECISION, "bad-decision-payout-range");
    }
    if (decision.verdict == DecisionVerdict::FAIL) {
        if (decision.payoutAmount != 0) {
            return state.Invalid(false, PoolError::INVALID_DECISION, "bad-decision-fail-with-payout");
        }
    } else if (decision.verdict == DecisionVerdict::PASS) {
        if (decision.winner.IsNull()) {
            return state.Invalid(false, PoolError::INVALID_DECISION, "bad-decision-pass-without-winner");
        }
        if (decision.payoutAmount > pool.custodyBalance) {
            return state.Invalid(false, PoolError::INVALID_DECISION, "bad-decision-payout-exceeds-custody",
                                 strprintf("payout=%d custody=%d", decision.payoutAmount, pool.custodyBalance));
        }
        PoolEntry entry;
        uint64_t index;
        if (!FindEntryByPayer(entries.EntriesForRound(pool.poolId, pool.roundNumber), decision.winner, entry, index)) {
            return state.Invalid(false, PoolError::INVALID_DECISION, "bad-decision-winner-not-entrant");
        }
    } else {
        return state.Invalid(false, PoolError::INVALID_DECISION, "bad-decision-verdict");
    }

    return true;
}

PoolOutcome BuildDecisionOutcome(const PoolLedger& pool,
                                 const DecisionMessage& decision,
                                 const CEntryRegister& entries,
                                 uint32_t nHeight,
                                 int64_t nTime)
{
    PoolOutcome outcome;
    outcome.poolId = pool.poolId;
    outcome.roundNumber = pool.roundNumber;
    outcome.mode = PoolMode::AI_DECISION;
    outcome.verdict = decision.verdict;
    outcome.decisionHash = decision.decisionHash;
    outcome.payoutAmount = decision.payoutAmount;
    outcome.computedHeight = nHeight;
    outcome.computedTime = nTime;

    if (decision.verdict == DecisionVerdict::PASS) {
        PoolEntry entry;
        uint64_t index = 0;
        if (FindEntryByPayer(entries.EntriesForRound(pool.poolId, pool.roundNumber), decision.winner, entry, index)) {
            outcome.hasWinner = true;
            outcome.winnerIndex = index;
            outcome.winnerEntryId = entry.entryId;
            outcome.winner = entry.payer;
        }
    }

    LogPrint(BCLog::OUTCOME, "BuildDecisionOutcome: pool=%s round=%u verdict=%s payout=%d decision=%s\n",
             pool.poolId.ToString().substr(0, 16), pool.roundNumber,
             DecisionVerdictToString(decision.verdict), decision.payoutAmount,
             decision.decisionHash.ToString().substr(0, 16));
    return outcome;
}
