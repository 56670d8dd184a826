// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_RPC_POOL_H
#define BOUNTY_RPC_POOL_H

#include "uint256.h"

#include <stdint.h>

#include <univalue.h>

class CPoolEngine;
struct PoolLedger;

/** The running engine, or RPC_INTERNAL_ERROR if it was never started */
CPoolEngine& EnsurePoolEngine();

/** Pool by id, or RPC_POOL_NOT_FOUND */
PoolLedger GetPoolOrThrow(const uint256& poolId);

/** Round number argument; null selects `nDefault` */
uint32_t ParseRound(const UniValue& v, uint32_t nDefault);

#endif // BOUNTY_RPC_POOL_H
