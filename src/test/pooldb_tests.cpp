// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "pool/anchorview.h"
#include "pool/pooldb.h"
#include "test/test_bounty.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(pooldb_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(pool_records_persist_on_disk)
{
    PoolLedger pool;
    pool.poolId = TestId(0x77);
    pool.authority = TestId(0xa0);
    pool.entryFee = 10;
    pool.floorAmount = 100;
    pool.feeSplit.emplace_back(TestId(0xd1), 100, "research");
    pool.custodyBalance = pool.carriedRemainder = 42;
    pool.roundNumber = 3;

    RecoveryAction first;
    first.poolId = pool.poolId;
    first.sequence = 1;
    first.amount = 5;
    first.reasonCode = "a";
    RecoveryAction second = first;
    second.sequence = 2;
    second.reasonCode = "b";

    {
        CPoolDB db(1 << 20, false, true);
        CPoolDB::Batch batch = db.CreateBatch();
        batch.WritePool(pool);
        // Out of order on purpose: the log is keyed by sequence
        batch.WriteRecovery(second);
        batch.WriteRecovery(first);
        BOOST_CHECK_EQUAL(batch.GetWriteCount(), 3U);
        BOOST_REQUIRE(batch.Commit());
        BOOST_CHECK(db.Sync());
    }

    CPoolDB db(1 << 20, false, false);
    PoolLedger loaded;
    BOOST_REQUIRE(db.ReadPool(pool.poolId, loaded));
    BOOST_CHECK(loaded.authority == pool.authority);
    BOOST_CHECK_EQUAL(loaded.custodyBalance, 42);
    BOOST_CHECK_EQUAL(loaded.roundNumber, 3U);
    BOOST_REQUIRE_EQUAL(loaded.feeSplit.size(), 1U);
    BOOST_CHECK_EQUAL(loaded.feeSplit[0].label, "research");
    BOOST_CHECK(loaded.IsConserved());

    std::vector<RecoveryAction> actions;
    db.GetRecoveries(pool.poolId, actions);
    BOOST_REQUIRE_EQUAL(actions.size(), 2U);
    BOOST_CHECK_EQUAL(actions[0].reasonCode, "a");
    BOOST_CHECK_EQUAL(actions[1].reasonCode, "b");

    RecoveryAction action;
    BOOST_CHECK(db.ReadRecovery(pool.poolId, 2, action));
    BOOST_CHECK(!db.ReadRecovery(pool.poolId, 3, action));

    actions.clear();
    db.GetRecoveries(TestId(0x78), actions);
    BOOST_CHECK(actions.empty());
}

BOOST_AUTO_TEST_CASE(for_each_pool_stops_on_request)
{
    CPoolDB db(1 << 20, true, true);
    CPoolDB::Batch batch = db.CreateBatch();
    for (uint64_t n = 1; n <= 5; n++) {
        PoolLedger pool;
        pool.poolId = TestId(n);
        batch.WritePool(pool);
    }
    BOOST_REQUIRE(batch.Commit());

    int nSeen = 0;
    db.ForEachPool([&](const PoolLedger&) { nSeen++; return true; });
    BOOST_CHECK_EQUAL(nSeen, 5);

    nSeen = 0;
    db.ForEachPool([&](const PoolLedger&) { return ++nSeen < 2; });
    BOOST_CHECK_EQUAL(nSeen, 2);

    BOOST_CHECK(db.HavePool(TestId(3)));
    BOOST_CHECK(!db.HavePool(TestId(6)));
}

BOOST_AUTO_TEST_CASE(anchor_view_db_tracks_tip)
{
    CPoolDB db(1 << 20, true, true);
    CAnchorViewDB view(db);
    BOOST_CHECK_EQUAL(view.GetTipHeight(), 0U);

    // First anchor may start anywhere
    CValidationState state;
    BOOST_REQUIRE(view.AddAnchor(PlatformAnchor(500, TestId(500), 1700000000), state));
    BOOST_REQUIRE(view.AddAnchor(PlatformAnchor(501, TestId(501), 1700000060), state));
    BOOST_CHECK_EQUAL(view.GetTipHeight(), 501U);

    BOOST_CHECK(!view.AddAnchor(PlatformAnchor(501, TestId(0xff), 1700000060), state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-anchor-height");

    PlatformAnchor anchor;
    BOOST_REQUIRE(view.GetAnchor(500, anchor));
    BOOST_CHECK(anchor.blockHash == TestId(500));
    BOOST_CHECK_EQUAL(anchor.time, 1700000000);
    BOOST_CHECK(!view.GetAnchor(502, anchor));
    BOOST_CHECK(!view.GetAnchor(499, anchor));
}

BOOST_AUTO_TEST_SUITE_END()
