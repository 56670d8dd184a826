// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_TEST_TEST_BOUNTY_H
#define BOUNTY_TEST_TEST_BOUNTY_H

#include "amount.h"
#include "fs.h"
#include "pool/anchorview.h"
#include "pool/pool.h"
#include "uint256.h"

#include <string>
#include <vector>

class CPoolEngine;

/** Id whose big-endian value is n (payers, authorities, destinations) */
uint256 TestId(uint64_t n);

/** Basic testing setup.
 * Points the data directory at a fresh temporary directory, enables pool
 * entries and clears the metrics.
 */
struct BasicTestingSetup {
    fs::path pathTemp;

    BasicTestingSetup();
    ~BasicTestingSetup();
};

/** Testing setup with an in-memory pool database, an in-memory anchor view
 * and a pool engine, installed as the process globals so RPC handlers can
 * reach them.
 */
struct PoolTestingSetup : public BasicTestingSetup {
    CAnchorViewMemory anchors;
    CPoolEngine* engine;

    const uint256 authority;
    const uint256 research;
    const uint256 ops;

    PoolTestingSetup();
    ~PoolTestingSetup();

    /** fee_split 80% research / 20% ops, fee 10, floor 10000 */
    PoolConfig MakeConfig(PoolMode mode = PoolMode::RANDOM_SELECTION) const;
    PoolLedger CreatePool(const PoolConfig& config);
    PoolLedger CreatePool() { return CreatePool(MakeConfig()); }
    PoolLedger ReloadPool(const uint256& poolId) const;

    /** Accept one entry per payer, paying the pool's fee */
    void AddEntries(const uint256& poolId, const std::vector<uint256>& payers);

    /** Extend the anchor chain up to and including `height` */
    void MineAnchorsTo(uint32_t height);
};

#endif // BOUNTY_TEST_TEST_BOUNTY_H
