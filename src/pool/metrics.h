// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_METRICS_H
#define BOUNTY_POOL_METRICS_H

#include <atomic>
#include <univalue.h>

namespace pool {

/**
 * Pool Metrics - process-wide counters for the pool engine
 *
 * All counters are atomic for thread-safe updates.
 *
 * Usage:
 *   g_pool_metrics.entriesAccepted++;
 *
 * RPC:
 *   getpoolmetrics -> returns JSON with all metrics
 */
struct PoolMetrics {
    // Pools
    std::atomic<uint64_t> poolsCreated{0};
    std::atomic<uint64_t> poolsClosed{0};

    // Entries
    std::atomic<uint64_t> entriesAccepted{0};
    std::atomic<uint64_t> entriesRejected{0};

    // Outcomes
    std::atomic<uint64_t> selectionsStarted{0};
    std::atomic<uint64_t> outcomesSelected{0};      // random outcomes recorded
    std::atomic<uint64_t> selectionsDeferred{0};    // anchor not produced yet
    std::atomic<uint64_t> decisionsAccepted{0};
    std::atomic<uint64_t> decisionsRejected{0};

    // Settlement
    std::atomic<uint64_t> settlements{0};
    std::atomic<int64_t> totalDisbursed{0};
    std::atomic<uint64_t> halts{0};                 // InsufficientCustody events
    std::atomic<uint64_t> escapePlans{0};           // idle rounds distributed

    // Recovery
    std::atomic<uint64_t> recoveries{0};
    std::atomic<int64_t> totalRecovered{0};
    std::atomic<uint64_t> recoveriesRejected{0};

    /**
     * Convert metrics to JSON for RPC
     */
    UniValue ToJSON() const;

    /** Reset all counters (tests) */
    void Reset();
};

// Global metrics instance
extern PoolMetrics g_pool_metrics;

} // namespace pool

#endif // BOUNTY_POOL_METRICS_H
