// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "pool/disbursement.h"
#include "pool/engine.h"
#include "pool/pooldb.h"
#include "test/test_bounty.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(disbursement_tests, PoolTestingSetup)

static std::vector<FeeSplitEntry> Split(std::initializer_list<uint8_t> percents)
{
    std::vector<FeeSplitEntry> split;
    uint64_t n = 1;
    for (uint8_t p : percents) {
        split.emplace_back(TestId(n++), p, "");
    }
    return split;
}

static CAmount Sum(const std::vector<Transfer>& transfers)
{
    CAmount total = 0;
    for (const Transfer& t : transfers) total += t.amount;
    return total;
}

BOOST_AUTO_TEST_CASE(split_remainder_goes_to_first_destination)
{
    std::vector<Transfer> transfers;
    CAmount remainder;

    // 80/20 of 101: floor gives 80 + 20, the lost unit goes to the first
    BOOST_REQUIRE(ComputeTransfers(Split({80, 20}), 101, transfers, remainder));
    BOOST_REQUIRE_EQUAL(transfers.size(), 2U);
    BOOST_CHECK_EQUAL(transfers[0].amount, 81);
    BOOST_CHECK_EQUAL(transfers[1].amount, 20);
    BOOST_CHECK_EQUAL(remainder, 1);

    // 34/33/33 of 100 divides exactly
    BOOST_REQUIRE(ComputeTransfers(Split({34, 33, 33}), 100, transfers, remainder));
    BOOST_CHECK_EQUAL(transfers[0].amount, 34);
    BOOST_CHECK_EQUAL(transfers[1].amount, 33);
    BOOST_CHECK_EQUAL(transfers[2].amount, 33);
    BOOST_CHECK_EQUAL(remainder, 0);

    BOOST_REQUIRE(ComputeTransfers(Split({50, 25, 25}), 7, transfers, remainder));
    BOOST_CHECK_EQUAL(transfers[0].amount, 5);
    BOOST_CHECK_EQUAL(transfers[1].amount, 1);
    BOOST_CHECK_EQUAL(transfers[2].amount, 1);
    BOOST_CHECK_EQUAL(remainder, 2);
    BOOST_CHECK_EQUAL(Sum(transfers), 7);
}

BOOST_AUTO_TEST_CASE(split_always_sums_to_amount)
{
    const std::vector<FeeSplitEntry> split = Split({13, 17, 19, 23, 28});
    for (CAmount amount : {CAmount(0), CAmount(1), CAmount(4), CAmount(99), CAmount(12345), MAX_MONEY}) {
        std::vector<Transfer> transfers;
        CAmount remainder;
        BOOST_REQUIRE(ComputeTransfers(split, amount, transfers, remainder));
        BOOST_CHECK_EQUAL(Sum(transfers), amount);
        BOOST_CHECK(remainder >= 0);
        BOOST_CHECK(remainder < (CAmount)split.size());
    }

    std::vector<Transfer> transfers;
    CAmount remainder;
    BOOST_CHECK(!ComputeTransfers(split, -1, transfers, remainder));
    BOOST_CHECK(!ComputeTransfers(std::vector<FeeSplitEntry>(), 10, transfers, remainder));
}

BOOST_AUTO_TEST_CASE(contribution_split_matches_transfer_rule)
{
    const std::vector<CAmount> shares = ComputeContributionSplit(Split({80, 20}), 10);
    BOOST_REQUIRE_EQUAL(shares.size(), 2U);
    BOOST_CHECK_EQUAL(shares[0], 8);
    BOOST_CHECK_EQUAL(shares[1], 2);
}

BOOST_AUTO_TEST_CASE(check_settle_ordering)
{
    const PoolLedger pool = CreatePool();
    AddEntries(pool.poolId, {TestId(0x100), TestId(0x101), TestId(0x102)});

    PoolOutcome outcome;
    outcome.poolId = pool.poolId;
    outcome.roundNumber = pool.roundNumber;
    outcome.payoutAmount = 30;

    // Still Active: not settling
    PoolLedger current = ReloadPool(pool.poolId);
    CValidationState state;
    BOOST_CHECK(!CheckSettle(current, outcome, *g_pooldb, state));
    BOOST_CHECK(state.GetCode() == PoolError::INVALID_STATE);

    // Settling with a payout above custody
    current.status = PoolStatus::SETTLING;
    outcome.payoutAmount = 31;
    state = CValidationState();
    BOOST_CHECK(!CheckSettle(current, outcome, *g_pooldb, state));
    BOOST_CHECK(state.GetCode() == PoolError::INSUFFICIENT_CUSTODY);

    // Wrong round
    outcome.payoutAmount = 30;
    outcome.roundNumber = pool.roundNumber + 1;
    state = CValidationState();
    BOOST_CHECK(!CheckSettle(current, outcome, *g_pooldb, state));
    BOOST_CHECK(state.GetCode() == PoolError::OUTCOME_MISMATCH);

    // Halted is reported before the custody shortfall
    outcome.roundNumber = pool.roundNumber;
    outcome.payoutAmount = 31;
    current.halted = true;
    state = CValidationState();
    BOOST_CHECK(!CheckSettle(current, outcome, *g_pooldb, state));
    BOOST_CHECK(state.GetCode() == PoolError::POOL_HALTED);

    current.halted = false;
    outcome.payoutAmount = 30;
    state = CValidationState();
    BOOST_CHECK(CheckSettle(current, outcome, *g_pooldb, state));
}

BOOST_AUTO_TEST_CASE(apply_settle_marks_entries_and_rolls_round)
{
    const PoolLedger created = CreatePool();
    AddEntries(created.poolId, {TestId(0x100), TestId(0x101), TestId(0x102)});

    PoolLedger pool = ReloadPool(created.poolId);
    pool.status = PoolStatus::SETTLING;

    PoolOutcome outcome;
    outcome.poolId = pool.poolId;
    outcome.roundNumber = pool.roundNumber;
    outcome.hasWinner = true;
    outcome.winnerIndex = 1;
    outcome.winnerEntryId = 2;
    outcome.winner = TestId(0x101);
    outcome.payoutAmount = 25;

    CPoolDB::Batch batch = g_pooldb->CreateBatch();
    PoolReceipt receipt;
    CValidationState state;
    BOOST_REQUIRE(ApplySettle(pool, outcome, engine->GetEntryRegister(), 5, 1700000100, batch, receipt, state));
    BOOST_REQUIRE(batch.Commit());

    BOOST_CHECK_EQUAL(receipt.GetTotalTransferred(), 25);
    BOOST_CHECK_EQUAL(receipt.transfers[0].amount, 20);
    BOOST_CHECK_EQUAL(receipt.transfers[1].amount, 5);
    BOOST_CHECK_EQUAL(receipt.custodyAfter, 5);
    BOOST_CHECK(receipt.winner == TestId(0x101));

    BOOST_CHECK_EQUAL(pool.custodyBalance, 5);
    BOOST_CHECK_EQUAL(pool.carriedRemainder, 5);
    BOOST_CHECK_EQUAL(pool.roundContributions, 0);
    BOOST_CHECK_EQUAL(pool.roundNumber, created.roundNumber + 1);
    BOOST_CHECK(pool.status == PoolStatus::ACTIVE);
    BOOST_CHECK(pool.IsConserved());

    for (const PoolEntry& entry : engine->GetEntryRegister().EntriesForRound(pool.poolId, created.roundNumber)) {
        BOOST_CHECK(entry.processed);
    }
    BOOST_CHECK(g_pooldb->HaveReceipt(pool.poolId, created.roundNumber));
}

BOOST_AUTO_TEST_CASE(escape_split_favours_last_entrant)
{
    const uint256 a = TestId(0x100), b = TestId(0x101), c = TestId(0x102);
    std::vector<Transfer> transfers;
    CAmount remainder;

    // 20% of 30 to the last entrant, 24 shared by three
    BOOST_REQUIRE(ComputeEscapeTransfers({a, b, c}, 30, transfers, remainder));
    BOOST_REQUIRE_EQUAL(transfers.size(), 3U);
    BOOST_CHECK(transfers[0].destination == a);
    BOOST_CHECK_EQUAL(transfers[0].label, "entrant");
    BOOST_CHECK_EQUAL(transfers[0].amount, 8);
    BOOST_CHECK_EQUAL(transfers[1].amount, 8);
    BOOST_CHECK(transfers[2].destination == c);
    BOOST_CHECK_EQUAL(transfers[2].label, "last-entrant");
    BOOST_CHECK_EQUAL(transfers[2].percent, ESCAPE_LAST_ENTRANT_PERCENT);
    BOOST_CHECK_EQUAL(transfers[2].amount, 14);
    BOOST_CHECK_EQUAL(remainder, 0);

    // 31: last share 6, 25 over three leaves one unit for the last entrant
    BOOST_REQUIRE(ComputeEscapeTransfers({a, b, c}, 31, transfers, remainder));
    BOOST_CHECK_EQUAL(transfers[0].amount, 8);
    BOOST_CHECK_EQUAL(transfers[1].amount, 8);
    BOOST_CHECK_EQUAL(transfers[2].amount, 15);
    BOOST_CHECK_EQUAL(remainder, 1);
    BOOST_CHECK_EQUAL(Sum(transfers), 31);

    // A payer who entered twice is paid once, and last if they entered last
    BOOST_REQUIRE(ComputeEscapeTransfers({a, b, a}, 30, transfers, remainder));
    BOOST_REQUIRE_EQUAL(transfers.size(), 2U);
    BOOST_CHECK(transfers[0].destination == a);
    BOOST_CHECK_EQUAL(transfers[0].label, "last-entrant");
    BOOST_CHECK_EQUAL(transfers[0].amount, 18);
    BOOST_CHECK_EQUAL(transfers[1].amount, 12);

    BOOST_CHECK(!ComputeEscapeTransfers({}, 30, transfers, remainder));
    BOOST_CHECK(!ComputeEscapeTransfers({a}, -1, transfers, remainder));
}

BOOST_AUTO_TEST_SUITE_END()
