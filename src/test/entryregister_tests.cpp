// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "pool/entryregister.h"
#include "pool/pooldb.h"
#include "test/test_bounty.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(entryregister_tests, BasicTestingSetup)

static PoolEntry MakeEntry(const uint256& poolId, uint32_t round, uint64_t id, uint64_t payer)
{
    PoolEntry entry;
    entry.poolId = poolId;
    entry.roundNumber = round;
    entry.entryId = id;
    entry.payer = TestId(payer);
    entry.amountPaid = 10;
    entry.contributionSplit = {8, 2};
    return entry;
}

static void Append(CPoolDB& db, const CEntryRegister& reg, const PoolEntry& entry)
{
    CPoolDB::Batch batch = db.CreateBatch();
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(reg.Append(entry, batch, state), FormatStateMessage(state));
    BOOST_REQUIRE(batch.Commit());
}

BOOST_AUTO_TEST_CASE(append_and_lookup)
{
    CPoolDB db(1 << 20, true, true);
    CEntryRegister reg(db);
    const uint256 poolId = TestId(0x77);

    Append(db, reg, MakeEntry(poolId, 1, 1, 0x100));

    PoolEntry entry;
    BOOST_REQUIRE(reg.GetEntry(poolId, 1, entry));
    BOOST_CHECK(entry.payer == TestId(0x100));
    BOOST_CHECK_EQUAL(entry.roundNumber, 1U);
    BOOST_CHECK(!entry.processed);
    BOOST_CHECK(!reg.GetEntry(poolId, 2, entry));
    BOOST_CHECK(!reg.GetEntry(TestId(0x78), 1, entry));

    // Same id again, even in another round
    CPoolDB::Batch batch = db.CreateBatch();
    CValidationState state;
    BOOST_CHECK(!reg.Append(MakeEntry(poolId, 2, 1, 0x101), batch, state));
    BOOST_CHECK(state.GetCode() == PoolError::DUPLICATE_ENTRY);
    BOOST_CHECK_EQUAL(batch.GetWriteCount(), 0U);

    state = CValidationState();
    BOOST_CHECK(!reg.Append(MakeEntry(poolId, 1, 0, 0x101), batch, state));
    BOOST_CHECK(state.GetCode() == PoolError::UNKNOWN_ENTRY);
}

BOOST_AUTO_TEST_CASE(round_range_is_ordered_and_restartable)
{
    CPoolDB db(1 << 20, true, true);
    CEntryRegister reg(db);
    const uint256 poolId = TestId(0x77);

    // Ids crossing a byte boundary must still iterate numerically
    const std::vector<uint64_t> ids = {1, 2, 255, 256, 257, 70000};
    for (uint64_t id : ids) {
        Append(db, reg, MakeEntry(poolId, 3, id, 0x100 + id));
    }
    // Neighbouring rounds and pools stay out of the range
    Append(db, reg, MakeEntry(poolId, 2, 900, 0x1));
    Append(db, reg, MakeEntry(poolId, 4, 901, 0x2));
    Append(db, reg, MakeEntry(TestId(0x78), 3, 1, 0x3));

    CEntryRange range = reg.EntriesForRound(poolId, 3);
    for (int pass = 0; pass < 2; pass++) {
        std::vector<uint64_t> seen;
        for (const PoolEntry& entry : range) {
            seen.push_back(entry.entryId);
        }
        BOOST_CHECK(seen == ids);
    }

    PoolEntry entry;
    BOOST_REQUIRE(reg.GetEntryAt(poolId, 3, 3, entry));
    BOOST_CHECK_EQUAL(entry.entryId, 256U);
    BOOST_CHECK(!reg.GetEntryAt(poolId, 3, ids.size(), entry));

    BOOST_CHECK(reg.EntriesForRound(poolId, 5).begin() == reg.EntriesForRound(poolId, 5).end());
}

BOOST_AUTO_TEST_CASE(mark_processed_is_idempotent)
{
    CPoolDB db(1 << 20, true, true);
    CEntryRegister reg(db);
    const uint256 poolId = TestId(0x77);
    Append(db, reg, MakeEntry(poolId, 1, 1, 0x100));

    CValidationState state;
    CPoolDB::Batch batch = db.CreateBatch();
    BOOST_REQUIRE(reg.MarkProcessed(poolId, 1, batch, state));
    BOOST_CHECK_EQUAL(batch.GetWriteCount(), 1U);
    BOOST_REQUIRE(batch.Commit());

    PoolEntry entry;
    BOOST_REQUIRE(reg.GetEntry(poolId, 1, entry));
    BOOST_CHECK(entry.processed);
    BOOST_CHECK_EQUAL(entry.amountPaid, 10);
    BOOST_CHECK(entry.contributionSplit == std::vector<CAmount>({8, 2}));

    CPoolDB::Batch again = db.CreateBatch();
    BOOST_CHECK(reg.MarkProcessed(poolId, 1, again, state));
    BOOST_CHECK_EQUAL(again.GetWriteCount(), 0U);

    BOOST_CHECK(!reg.MarkProcessed(poolId, 42, again, state));
    BOOST_CHECK(state.GetCode() == PoolError::UNKNOWN_ENTRY);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-entry-unknown");
}

BOOST_AUTO_TEST_SUITE_END()
