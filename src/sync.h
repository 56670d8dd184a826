// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_SYNC_H
#define BOUNTY_SYNC_H

#include <mutex>
#include <type_traits>

/**
 * Locking primitives.
 *
 * Every pool transition is serialized on cs_pool; LOCK() holds it for the
 * enclosing scope so that read-modify-write of a pool's records commits as
 * one unit.
 */

typedef std::recursive_mutex RecursiveMutex;
typedef std::mutex Mutex;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) std::unique_lock<typename std::decay<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)

#endif // BOUNTY_SYNC_H
