// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/metrics.h"

namespace pool {

PoolMetrics g_pool_metrics;

UniValue PoolMetrics::ToJSON() const
{
    UniValue result(UniValue::VOBJ);

    UniValue pools(UniValue::VOBJ);
    pools.pushKV("created", (int64_t)poolsCreated.load());
    pools.pushKV("closed", (int64_t)poolsClosed.load());
    result.pushKV("pools", pools);

    UniValue entries(UniValue::VOBJ);
    entries.pushKV("accepted", (int64_t)entriesAccepted.load());
    entries.pushKV("rejected", (int64_t)entriesRejected.load());
    result.pushKV("entries", entries);

    UniValue outcomes(UniValue::VOBJ);
    outcomes.pushKV("selections_started", (int64_t)selectionsStarted.load());
    outcomes.pushKV("outcomes_selected", (int64_t)outcomesSelected.load());
    outcomes.pushKV("selections_deferred", (int64_t)selectionsDeferred.load());
    outcomes.pushKV("decisions_accepted", (int64_t)decisionsAccepted.load());
    outcomes.pushKV("decisions_rejected", (int64_t)decisionsRejected.load());
    result.pushKV("outcomes", outcomes);

    UniValue settlement(UniValue::VOBJ);
    settlement.pushKV("settlements", (int64_t)settlements.load());
    settlement.pushKV("total_disbursed", totalDisbursed.load());
    settlement.pushKV("halts", (int64_t)halts.load());
    settlement.pushKV("escape_plans", (int64_t)escapePlans.load());
    result.pushKV("settlement", settlement);

    UniValue recovery(UniValue::VOBJ);
    recovery.pushKV("recoveries", (int64_t)recoveries.load());
    recovery.pushKV("total_recovered", totalRecovered.load());
    recovery.pushKV("rejected", (int64_t)recoveriesRejected.load());
    result.pushKV("recovery", recovery);

    return result;
}

void PoolMetrics::Reset()
{
    poolsCreated = 0;
    poolsClosed = 0;
    entriesAccepted = 0;
    entriesRejected = 0;
    selectionsStarted = 0;
    outcomesSelected = 0;
    selectionsDeferred = 0;
    decisionsAccepted = 0;
    decisionsRejected = 0;
    settlements = 0;
    totalDisbursed = 0;
    halts = 0;
    escapePlans = 0;
    recoveries = 0;
    totalRecovered = 0;
    recoveriesRejected = 0;
}

} // namespace pool
