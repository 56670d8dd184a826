// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_bounty.h"

#include "consensus/validation.h"
#include "hash.h"
#include "logging.h"
#include "pool/engine.h"
#include "pool/killswitch.h"
#include "pool/metrics.h"
#include "pool/pooldb.h"
#include "util/system.h"
#include "utiltime.h"

#include <boost/test/unit_test.hpp>

uint256 TestId(uint64_t n)
{
    return uint256S(strprintf("%064x", n));
}

BasicTestingSetup::BasicTestingSetup()
{
    LogInstance().DisconnectTestLogger();
    pathTemp = fs::temp_directory_path() / fs::unique_path("test_bounty_%%%%%%%%");
    fs::create_directories(pathTemp);
    gArgs.ClearArgs();
    gArgs.ForceSetArg("-datadir", pathTemp.string());
    ClearDatadirCache();

    SetMockTime(1700000000);
    SetPoolEntriesEnabled(true);
    pool::g_pool_metrics.Reset();
}

BasicTestingSetup::~BasicTestingSetup()
{
    SetMockTime(0);
    ClearDatadirCache();
    gArgs.ClearArgs();
    fs::remove_all(pathTemp);
}

PoolTestingSetup::PoolTestingSetup()
    : authority(TestId(0xa0)), research(TestId(0xd1)), ops(TestId(0xd2))
{
    if (!InitPoolDB(1 << 20, true, true)) {
        throw std::runtime_error("PoolTestingSetup: could not open in-memory pool database");
    }
    g_pool_engine = std::make_unique<CPoolEngine>(*g_pooldb, anchors);
    engine = g_pool_engine.get();
}

PoolTestingSetup::~PoolTestingSetup()
{
    g_pool_engine.reset();
    g_pooldb.reset();
}

PoolConfig PoolTestingSetup::MakeConfig(PoolMode mode) const
{
    PoolConfig config;
    config.mode = mode;
    config.entryFee = 10;
    config.floorAmount = 10000;
    config.feeSplit.emplace_back(research, 80, "research");
    config.feeSplit.emplace_back(ops, 20, "ops");
    config.authority = authority;
    if (mode == PoolMode::AI_DECISION) {
        config.decisionAuthority = TestId(0xa1);
    }
    return config;
}

PoolLedger PoolTestingSetup::CreatePool(const PoolConfig& config)
{
    PoolLedger pool;
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(engine->CreatePool(config, pool, state), FormatStateMessage(state));
    return pool;
}

PoolLedger PoolTestingSetup::ReloadPool(const uint256& poolId) const
{
    PoolLedger pool;
    BOOST_REQUIRE(engine->GetPool(poolId, pool));
    return pool;
}

void PoolTestingSetup::AddEntries(const uint256& poolId, const std::vector<uint256>& payers)
{
    const PoolLedger pool = ReloadPool(poolId);
    for (const uint256& payer : payers) {
        PoolEntry entry;
        CValidationState state;
        BOOST_REQUIRE_MESSAGE(engine->AcceptEntry(poolId, payer, pool.entryFee, entry, state),
                              FormatStateMessage(state));
    }
}

void PoolTestingSetup::MineAnchorsTo(uint32_t height)
{
    uint32_t next = anchors.GetTipHeight() + 1;
    for (; next <= height; next++) {
        PlatformAnchor anchor;
        anchor.height = next;
        anchor.blockHash = SerializeHash(next);
        anchor.time = 1700000000 + next * 60;
        CValidationState state;
        BOOST_REQUIRE_MESSAGE(anchors.AddAnchor(anchor, state), FormatStateMessage(state));
    }
}
