// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Outcome Selector Tests
 *
 * Tests:
 *   1. Winner index arithmetic over the 256-bit seed
 *   2. Seed material depends on every input, and only on them
 *   3. Random outcome waits for its anchor and is reproducible
 *   4. Decision messages: authenticity, round, replay, well-formedness
 */

#include "consensus/validation.h"
#include "pool/engine.h"
#include "pool/outcome.h"
#include "pool/pooldb.h"
#include "test/test_bounty.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(outcome_tests, PoolTestingSetup)

// =============================================================================
// Test 1: Winner index
// =============================================================================
BOOST_AUTO_TEST_CASE(winner_index_reads_seed_big_endian)
{
    uint256 seed;
    *(seed.end() - 1) = 4;
    BOOST_CHECK_EQUAL(SelectWinnerIndex(seed, 3), 1U);
    BOOST_CHECK_EQUAL(SelectWinnerIndex(seed, 4), 0U);
    BOOST_CHECK_EQUAL(SelectWinnerIndex(seed, 5), 4U);
    BOOST_CHECK_EQUAL(SelectWinnerIndex(seed, 1), 0U);

    // 256^1 = 256 = 3 * 85 + 1
    uint256 seed2;
    *(seed2.end() - 2) = 1;
    BOOST_CHECK_EQUAL(SelectWinnerIndex(seed2, 3), 1U);

    // All ones: 2^256 - 1 is divisible by 3, 5, 17 and 257
    uint256 ones;
    for (unsigned char* it = ones.begin(); it != ones.end(); ++it) *it = 0xff;
    BOOST_CHECK_EQUAL(SelectWinnerIndex(ones, 3), 0U);
    BOOST_CHECK_EQUAL(SelectWinnerIndex(ones, 257), 0U);
    BOOST_CHECK_EQUAL(SelectWinnerIndex(ones, 2), 1U);
}

// =============================================================================
// Test 2: Seed material
// =============================================================================
BOOST_AUTO_TEST_CASE(seed_material_binds_all_inputs)
{
    PlatformAnchor anchor;
    anchor.height = 12;
    anchor.blockHash = TestId(0xbeef);

    const uint256 poolId = TestId(0x77);
    const uint256 digest = TestId(0x55);
    const uint256 base = ComputeSeedMaterial(poolId, 1, anchor, 3, digest);
    BOOST_CHECK(base == ComputeSeedMaterial(poolId, 1, anchor, 3, digest));

    BOOST_CHECK(base != ComputeSeedMaterial(TestId(0x78), 1, anchor, 3, digest));
    BOOST_CHECK(base != ComputeSeedMaterial(poolId, 2, anchor, 3, digest));
    BOOST_CHECK(base != ComputeSeedMaterial(poolId, 1, anchor, 4, digest));
    BOOST_CHECK(base != ComputeSeedMaterial(poolId, 1, anchor, 3, TestId(0x56)));

    PlatformAnchor other = anchor;
    other.blockHash = TestId(0xbef0);
    BOOST_CHECK(base != ComputeSeedMaterial(poolId, 1, other, 3, digest));
    other = anchor;
    other.height = 13;
    BOOST_CHECK(base != ComputeSeedMaterial(poolId, 1, other, 3, digest));

    // Header time is not seed material
    other = anchor;
    other.time = 42;
    BOOST_CHECK(base == ComputeSeedMaterial(poolId, 1, other, 3, digest));
}

BOOST_AUTO_TEST_CASE(entries_digest_follows_insertion_order)
{
    const PoolLedger a = CreatePool();
    PoolConfig configB = MakeConfig();
    configB.nonce = 1;
    const PoolLedger b = CreatePool(configB);

    AddEntries(a.poolId, {TestId(0x100), TestId(0x101)});
    AddEntries(b.poolId, {TestId(0x101), TestId(0x100)});

    uint64_t countA = 0, countB = 0;
    const uint256 digestA = ComputeEntriesDigest(engine->GetEntryRegister().EntriesForRound(a.poolId, 1), countA);
    const uint256 digestB = ComputeEntriesDigest(engine->GetEntryRegister().EntriesForRound(b.poolId, 1), countB);
    BOOST_CHECK_EQUAL(countA, 2U);
    BOOST_CHECK_EQUAL(countB, 2U);
    BOOST_CHECK(digestA != digestB);

    uint64_t countEmpty = 7;
    BOOST_CHECK(ComputeEntriesDigest(engine->GetEntryRegister().EntriesForRound(a.poolId, 2), countEmpty).IsNull());
    BOOST_CHECK_EQUAL(countEmpty, 0U);
}

// =============================================================================
// Test 3: Random outcome
// =============================================================================
BOOST_AUTO_TEST_CASE(random_outcome_waits_for_anchor)
{
    MineAnchorsTo(10);
    const PoolLedger created = CreatePool();
    AddEntries(created.poolId, {TestId(0x100), TestId(0x101), TestId(0x102)});

    CValidationState state;
    BOOST_REQUIRE(engine->BeginSelection(created.poolId, state));
    PoolLedger pool = ReloadPool(created.poolId);
    BOOST_CHECK_EQUAL(pool.selectionHeight, 10U);

    // Anchor is selectionHeight + DEFAULT_ANCHOR_DEPTH = 12
    PoolOutcome outcome;
    BOOST_CHECK(!engine->SelectOutcome(pool.poolId, outcome, state));
    BOOST_CHECK(state.GetCode() == PoolError::ANCHOR_UNAVAILABLE);
    MineAnchorsTo(11);
    state = CValidationState();
    BOOST_CHECK(!engine->SelectOutcome(pool.poolId, outcome, state));
    BOOST_CHECK(state.GetCode() == PoolError::ANCHOR_UNAVAILABLE);
    BOOST_CHECK(ReloadPool(pool.poolId).status == PoolStatus::SELECTING);

    MineAnchorsTo(12);
    state = CValidationState();
    BOOST_REQUIRE_MESSAGE(engine->SelectOutcome(pool.poolId, outcome, state), FormatStateMessage(state));
    BOOST_CHECK_EQUAL(outcome.anchorHeight, 12U);
    BOOST_CHECK_EQUAL(outcome.entriesCount, 3U);
    BOOST_CHECK(outcome.hasWinner);
    BOOST_CHECK(outcome.winnerIndex < 3U);
    BOOST_CHECK_EQUAL(outcome.payoutAmount, 30);

    // Independent recomputation from public data
    PlatformAnchor anchor;
    BOOST_REQUIRE(anchors.GetAnchor(12, anchor));
    uint64_t count;
    const uint256 digest = ComputeEntriesDigest(engine->GetEntryRegister().EntriesForRound(pool.poolId, 1), count);
    const uint256 seed = ComputeSeedMaterial(pool.poolId, 1, anchor, count, digest);
    BOOST_CHECK(seed == outcome.seed);
    BOOST_CHECK_EQUAL(SelectWinnerIndex(seed, count), outcome.winnerIndex);

    PoolEntry winner;
    BOOST_REQUIRE(engine->GetEntryRegister().GetEntryAt(pool.poolId, 1, outcome.winnerIndex, winner));
    BOOST_CHECK_EQUAL(winner.entryId, outcome.winnerEntryId);
    BOOST_CHECK(winner.payer == outcome.winner);

    state = CValidationState();
    BOOST_CHECK(engine->VerifyOutcome(pool.poolId, 1, state));

    // One outcome per round
    PoolOutcome again;
    state = CValidationState();
    BOOST_CHECK(!engine->SelectOutcome(pool.poolId, again, state));
    BOOST_CHECK(state.GetCode() == PoolError::OUTCOME_ALREADY_COMPUTED);
}

BOOST_AUTO_TEST_CASE(verify_outcome_detects_tampering)
{
    MineAnchorsTo(1);
    const PoolLedger created = CreatePool();
    AddEntries(created.poolId, {TestId(0x100), TestId(0x101), TestId(0x102), TestId(0x103)});

    CValidationState state;
    BOOST_REQUIRE(engine->BeginSelection(created.poolId, state));
    MineAnchorsTo(3);
    PoolOutcome outcome;
    BOOST_REQUIRE(engine->SelectOutcome(created.poolId, outcome, state));

    PoolOutcome forged = outcome;
    forged.winnerIndex = (outcome.winnerIndex + 1) % 4;
    state = CValidationState();
    BOOST_CHECK(!VerifyOutcome(forged, engine->GetEntryRegister(), anchors, state));
    BOOST_CHECK(state.GetCode() == PoolError::OUTCOME_MISMATCH);

    forged = outcome;
    forged.anchorHash = TestId(0xdead);
    state = CValidationState();
    BOOST_CHECK(!VerifyOutcome(forged, engine->GetEntryRegister(), anchors, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-verify-anchor-hash");

    forged = outcome;
    forged.entriesCount = 3;
    state = CValidationState();
    BOOST_CHECK(!VerifyOutcome(forged, engine->GetEntryRegister(), anchors, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-verify-entries-digest");
}

BOOST_AUTO_TEST_CASE(selection_without_entries_at_floor)
{
    // Custody carried over to the floor with no entries: no winner, no payout
    const PoolLedger created = CreatePool();
    PoolLedger pool = ReloadPool(created.poolId);
    pool.carriedRemainder = pool.custodyBalance = pool.floorAmount;
    pool.status = PoolStatus::SELECTING;

    MineAnchorsTo(2);
    PoolOutcome outcome;
    CValidationState state;
    BOOST_REQUIRE(ComputeRandomOutcome(pool, engine->GetEntryRegister(), anchors, 2, 2, 1700000000, outcome, state));
    BOOST_CHECK(!outcome.hasWinner);
    BOOST_CHECK_EQUAL(outcome.entriesCount, 0U);
    BOOST_CHECK_EQUAL(outcome.payoutAmount, 0);
    BOOST_CHECK(VerifyOutcome(outcome, engine->GetEntryRegister(), anchors, state));
}

BOOST_AUTO_TEST_CASE(anchor_chain_is_contiguous)
{
    MineAnchorsTo(5);
    PlatformAnchor anchor;
    anchor.height = 7;
    anchor.blockHash = TestId(7);
    CValidationState state;
    BOOST_CHECK(!anchors.AddAnchor(anchor, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-anchor-height");

    anchor.height = 6;
    anchor.blockHash.SetNull();
    state = CValidationState();
    BOOST_CHECK(!anchors.AddAnchor(anchor, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-anchor-null-hash");

    anchor.blockHash = TestId(6);
    state = CValidationState();
    BOOST_CHECK(engine->SubmitAnchor(anchor, state));
    BOOST_CHECK_EQUAL(anchors.GetTipHeight(), 6U);
}

// =============================================================================
// Test 4: Decision messages
// =============================================================================
struct DecisionSetup : public PoolTestingSetup {
    PoolLedger pool;
    const uint256 decider{TestId(0xa1)};

    DecisionSetup()
    {
        pool = CreatePool(MakeConfig(PoolMode::AI_DECISION));
        AddEntries(pool.poolId, {TestId(0x100), TestId(0x101), TestId(0x102)});
        CValidationState state;
        BOOST_REQUIRE(engine->BeginSelection(pool.poolId, state));
        pool = ReloadPool(pool.poolId);
    }

    DecisionMessage MakeDecision(DecisionVerdict verdict, CAmount payout, const uint256& winner) const
    {
        DecisionMessage decision;
        decision.poolId = pool.poolId;
        decision.roundNumber = pool.roundNumber;
        decision.verdict = verdict;
        decision.payoutAmount = payout;
        decision.winner = winner;
        decision.decisionAuthority = decider;
        decision.sessionId = "session-42_a";
        decision.timestamp = 1700000050;
        decision.decisionHash = decision.ComputeHash();
        return decision;
    }

    std::string Reject(const DecisionMessage& decision, PoolError code)
    {
        CValidationState state;
        PoolOutcome outcome;
        BOOST_CHECK(!engine->SubmitDecision(decision, outcome, state));
        BOOST_CHECK_MESSAGE(state.GetCode() == code, FormatStateMessage(state));
        return state.GetRejectReason();
    }
};

BOOST_FIXTURE_TEST_CASE(decision_pass_records_outcome, DecisionSetup)
{
    const DecisionMessage decision = MakeDecision(DecisionVerdict::PASS, 25, TestId(0x101));
    PoolOutcome outcome;
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(engine->SubmitDecision(decision, outcome, state), FormatStateMessage(state));
    BOOST_CHECK(outcome.mode == PoolMode::AI_DECISION);
    BOOST_CHECK(outcome.hasWinner);
    BOOST_CHECK_EQUAL(outcome.winnerIndex, 1U);
    BOOST_CHECK_EQUAL(outcome.winnerEntryId, 2U);
    BOOST_CHECK_EQUAL(outcome.payoutAmount, 25);
    BOOST_CHECK(outcome.decisionHash == decision.decisionHash);

    // Replay of the same message
    BOOST_CHECK_EQUAL(Reject(decision, PoolError::DUPLICATE_OUTCOME), "bad-decision-replayed");

    // A different message for the same round
    DecisionMessage second = MakeDecision(DecisionVerdict::FAIL, 0, uint256());
    BOOST_CHECK_EQUAL(Reject(second, PoolError::DUPLICATE_OUTCOME), "bad-decision-outcome-exists");
}

BOOST_FIXTURE_TEST_CASE(decision_fail_pays_nothing, DecisionSetup)
{
    PoolOutcome outcome;
    CValidationState state;
    BOOST_REQUIRE(engine->SubmitDecision(MakeDecision(DecisionVerdict::FAIL, 0, uint256()), outcome, state));
    BOOST_CHECK(!outcome.hasWinner);
    BOOST_CHECK_EQUAL(outcome.payoutAmount, 0);
}

BOOST_FIXTURE_TEST_CASE(decision_rejections, DecisionSetup)
{
    // Wrong signer
    DecisionMessage decision = MakeDecision(DecisionVerdict::PASS, 10, TestId(0x100));
    decision.decisionAuthority = TestId(0xbad);
    decision.decisionHash = decision.ComputeHash();
    Reject(decision, PoolError::UNAUTHORIZED);

    // Hash does not cover the fields
    decision = MakeDecision(DecisionVerdict::PASS, 10, TestId(0x100));
    decision.payoutAmount = 11;
    BOOST_CHECK_EQUAL(Reject(decision, PoolError::INVALID_DECISION), "bad-decision-hash");

    // Other round
    decision = MakeDecision(DecisionVerdict::PASS, 10, TestId(0x100));
    decision.roundNumber = pool.roundNumber + 1;
    decision.decisionHash = decision.ComputeHash();
    Reject(decision, PoolError::OUTCOME_MISMATCH);

    decision = MakeDecision(DecisionVerdict::PASS, 10, TestId(0x100));
    decision.sessionId = "bad session!";
    decision.decisionHash = decision.ComputeHash();
    BOOST_CHECK_EQUAL(Reject(decision, PoolError::INVALID_DECISION), "bad-decision-session-id");

    decision = MakeDecision(DecisionVerdict::PASS, 10, TestId(0x100));
    decision.sessionId = std::string(MAX_SESSION_ID_LENGTH + 1, 'a');
    decision.decisionHash = decision.ComputeHash();
    BOOST_CHECK_EQUAL(Reject(decision, PoolError::INVALID_DECISION), "bad-decision-session-id");

    BOOST_CHECK_EQUAL(Reject(MakeDecision(DecisionVerdict::FAIL, 5, uint256()), PoolError::INVALID_DECISION),
                      "bad-decision-fail-with-payout");
    BOOST_CHECK_EQUAL(Reject(MakeDecision(DecisionVerdict::PASS, 10, uint256()), PoolError::INVALID_DECISION),
                      "bad-decision-pass-without-winner");
    BOOST_CHECK_EQUAL(Reject(MakeDecision(DecisionVerdict::PASS, 10, TestId(0x999)), PoolError::INVALID_DECISION),
                      "bad-decision-winner-not-entrant");
    BOOST_CHECK_EQUAL(Reject(MakeDecision(DecisionVerdict::PASS, 31, TestId(0x100)), PoolError::INVALID_DECISION),
                      "bad-decision-payout-exceeds-custody");

    // Nothing was recorded
    BOOST_CHECK(!g_pooldb->HaveOutcome(pool.poolId, pool.roundNumber));
}

BOOST_FIXTURE_TEST_CASE(decision_timestamp_window, DecisionSetup)
{
    // Clock is at 1700000000 with the default tolerance of one hour
    BOOST_CHECK_EQUAL(engine->GetDecisionTolerance(), DEFAULT_DECISION_TOLERANCE);

    DecisionMessage decision = MakeDecision(DecisionVerdict::PASS, 10, TestId(0x100));
    decision.timestamp = 1700000000 + DEFAULT_DECISION_TOLERANCE + 1;
    decision.decisionHash = decision.ComputeHash();
    BOOST_CHECK_EQUAL(Reject(decision, PoolError::TIMESTAMP_OUT_OF_RANGE), "bad-decision-timestamp");

    decision.timestamp = 1700000000 - DEFAULT_DECISION_TOLERANCE - 1;
    decision.decisionHash = decision.ComputeHash();
    BOOST_CHECK_EQUAL(Reject(decision, PoolError::TIMESTAMP_OUT_OF_RANGE), "bad-decision-timestamp");

    decision.timestamp = 0;
    decision.decisionHash = decision.ComputeHash();
    BOOST_CHECK_EQUAL(Reject(decision, PoolError::TIMESTAMP_OUT_OF_RANGE), "bad-decision-timestamp");
    BOOST_CHECK(!g_pooldb->HaveOutcome(pool.poolId, pool.roundNumber));

    // The edge of the window is accepted
    decision.timestamp = 1700000000 + DEFAULT_DECISION_TOLERANCE;
    decision.decisionHash = decision.ComputeHash();
    PoolOutcome outcome;
    CValidationState state;
    BOOST_CHECK_MESSAGE(engine->SubmitDecision(decision, outcome, state), FormatStateMessage(state));
    BOOST_CHECK(g_pooldb->HaveOutcome(pool.poolId, pool.roundNumber));
}

BOOST_AUTO_TEST_CASE(session_id_charset)
{
    BOOST_CHECK(IsValidSessionId("abc-DEF_123"));
    BOOST_CHECK(IsValidSessionId(std::string(MAX_SESSION_ID_LENGTH, 'z')));
    BOOST_CHECK(!IsValidSessionId(""));
    BOOST_CHECK(!IsValidSessionId("a b"));
    BOOST_CHECK(!IsValidSessionId("a/b"));
}

BOOST_AUTO_TEST_SUITE_END()
