// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Recovery Gate Tests
 *
 * Tests:
 *   1. Only the authority may recover, whatever the amount
 *   2. Amount, destination and reason checks
 *   3. Cooldown and per-recovery percentage limits
 *   4. Recovery log, sequence numbers and conservation
 *   5. Recovery with close
 */

#include "consensus/validation.h"
#include "pool/engine.h"
#include "pool/metrics.h"
#include "pool/pooldb.h"
#include "pool/recovery.h"
#include "test/test_bounty.h"
#include "utiltime.h"

#include <boost/test/unit_test.hpp>

struct RecoveryTestingSetup : public PoolTestingSetup {
    PoolLedger pool;

    RecoveryTestingSetup()
    {
        PoolConfig config = MakeConfig();
        config.recoveryCooldown = 3600;
        config.recoveryMaxPercent = 50;
        pool = CreatePool(config);
        AddEntries(pool.poolId, {TestId(0x100), TestId(0x101), TestId(0x102), TestId(0x103)});
        pool = ReloadPool(pool.poolId);
    }

    RecoveryRequest MakeRequest(CAmount amount) const
    {
        RecoveryRequest request;
        request.initiator = authority;
        request.amount = amount;
        request.destination = TestId(0xe0);
        request.reasonCode = "stuck-funds";
        return request;
    }

    PoolError Reject(const RecoveryRequest& request)
    {
        RecoveryAction action;
        CValidationState state;
        BOOST_CHECK(!engine->Recover(pool.poolId, request, action, state));
        return state.GetCode();
    }
};

BOOST_FIXTURE_TEST_SUITE(recovery_tests, RecoveryTestingSetup)

// =============================================================================
// Test 1: Authorization
// =============================================================================
BOOST_AUTO_TEST_CASE(non_authority_rejected_first)
{
    RecoveryRequest request = MakeRequest(-5);
    request.initiator = TestId(0x100);
    BOOST_CHECK(Reject(request) == PoolError::UNAUTHORIZED);

    request = MakeRequest(1000000);
    request.initiator = uint256();
    BOOST_CHECK(Reject(request) == PoolError::UNAUTHORIZED);

    BOOST_CHECK_EQUAL(pool::g_pool_metrics.recoveriesRejected.load(), 2U);
    BOOST_CHECK_EQUAL(ReloadPool(pool.poolId).custodyBalance, 40);
}

// =============================================================================
// Test 2: Request well-formedness
// =============================================================================
BOOST_AUTO_TEST_CASE(request_checks)
{
    BOOST_CHECK(Reject(MakeRequest(0)) == PoolError::INVALID_AMOUNT);
    BOOST_CHECK(Reject(MakeRequest(-1)) == PoolError::INVALID_AMOUNT);
    BOOST_CHECK(Reject(MakeRequest(41)) == PoolError::AMOUNT_EXCEEDS_CUSTODY);

    RecoveryRequest request = MakeRequest(5);
    request.destination.SetNull();
    BOOST_CHECK(Reject(request) == PoolError::INVALID_CONFIG);

    request = MakeRequest(5);
    request.reasonCode = "";
    BOOST_CHECK(Reject(request) == PoolError::INVALID_CONFIG);
    request.reasonCode = std::string(MAX_REASON_CODE_LENGTH + 1, 'r');
    BOOST_CHECK(Reject(request) == PoolError::INVALID_CONFIG);

    std::vector<RecoveryAction> actions;
    g_pooldb->GetRecoveries(pool.poolId, actions);
    BOOST_CHECK(actions.empty());
}

// =============================================================================
// Test 3: Limits
// =============================================================================
BOOST_AUTO_TEST_CASE(percent_limit_and_cooldown)
{
    // 50% of 40
    BOOST_CHECK(Reject(MakeRequest(21)) == PoolError::RECOVERY_LIMIT_EXCEEDED);

    RecoveryAction action;
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(engine->Recover(pool.poolId, MakeRequest(20), action, state), FormatStateMessage(state));
    BOOST_CHECK_EQUAL(action.sequence, 1U);

    SetMockTime(1700000000 + 3599);
    BOOST_CHECK(Reject(MakeRequest(1)) == PoolError::RECOVERY_COOLDOWN_ACTIVE);

    SetMockTime(1700000000 + 3600);
    // Limit now applies to the reduced custody: 50% of 20
    BOOST_CHECK(Reject(MakeRequest(11)) == PoolError::RECOVERY_LIMIT_EXCEEDED);
    BOOST_REQUIRE(engine->Recover(pool.poolId, MakeRequest(10), action, state));
    BOOST_CHECK_EQUAL(action.sequence, 2U);
    BOOST_CHECK_EQUAL(action.timestamp, 1700000000 + 3600);
}

BOOST_AUTO_TEST_CASE(check_recover_without_limits)
{
    PoolLedger unlimited = pool;
    unlimited.recoveryCooldown = 0;
    unlimited.recoveryMaxPercent = 0;
    unlimited.recoveryCount = 3;
    unlimited.lastRecoveryTime = 1700000000;

    RecoveryRequest request = MakeRequest(40);
    CValidationState state;
    BOOST_CHECK(CheckRecover(unlimited, request, 1700000000, *g_pooldb, state));
}

// =============================================================================
// Test 4: Recovery log
// =============================================================================
BOOST_AUTO_TEST_CASE(recovery_log_and_conservation)
{
    RecoveryAction action;
    CValidationState state;
    BOOST_REQUIRE(engine->Recover(pool.poolId, MakeRequest(15), action, state));

    PoolLedger after = ReloadPool(pool.poolId);
    BOOST_CHECK_EQUAL(after.custodyBalance, 25);
    BOOST_CHECK_EQUAL(after.roundRecovered, 15);
    BOOST_CHECK_EQUAL(after.recoveryCount, 1U);
    BOOST_CHECK(after.IsConserved());
    BOOST_CHECK_EQUAL(after.roundNumber, pool.roundNumber);
    BOOST_CHECK(after.status == PoolStatus::ACTIVE);

    // Outstanding entries are untouched
    for (const PoolEntry& entry : engine->GetEntryRegister().EntriesForRound(pool.poolId, pool.roundNumber)) {
        BOOST_CHECK(!entry.processed);
    }

    std::vector<RecoveryAction> actions;
    g_pooldb->GetRecoveries(pool.poolId, actions);
    BOOST_REQUIRE_EQUAL(actions.size(), 1U);
    BOOST_CHECK(actions[0].initiator == authority);
    BOOST_CHECK(actions[0].destination == TestId(0xe0));
    BOOST_CHECK_EQUAL(actions[0].reasonCode, "stuck-funds");
    BOOST_CHECK_EQUAL(actions[0].amount, 15);
    BOOST_CHECK_EQUAL(actions[0].roundNumber, pool.roundNumber);
    BOOST_CHECK(!actions[0].closedPool);

    BOOST_CHECK_EQUAL(pool::g_pool_metrics.recoveries.load(), 1U);
    BOOST_CHECK_EQUAL(pool::g_pool_metrics.totalRecovered.load(), 15);

    // Random payout shrinks with the recovered amount
    BOOST_CHECK_EQUAL(after.GetRoundPot(), 25);
}

// =============================================================================
// Test 5: Recovery with close
// =============================================================================
BOOST_AUTO_TEST_CASE(recover_and_close)
{
    RecoveryRequest request = MakeRequest(20);
    request.fClosePool = true;

    RecoveryAction action;
    CValidationState state;
    BOOST_REQUIRE(engine->Recover(pool.poolId, request, action, state));
    BOOST_CHECK(action.closedPool);

    PoolLedger after = ReloadPool(pool.poolId);
    BOOST_CHECK(after.IsClosed());
    BOOST_CHECK_EQUAL(after.custodyBalance, 20);
    BOOST_CHECK_EQUAL(pool::g_pool_metrics.poolsClosed.load(), 1U);

    // Closed pools accept nothing more
    SetMockTime(1700000000 + 7200);
    BOOST_CHECK(Reject(MakeRequest(1)) == PoolError::POOL_CLOSED);

    PoolEntry entry;
    state = CValidationState();
    BOOST_CHECK(!engine->AcceptEntry(pool.poolId, TestId(0x104), 10, entry, state));
    BOOST_CHECK(state.GetCode() == PoolError::POOL_CLOSED);
}

BOOST_AUTO_TEST_CASE(close_refused_while_selecting)
{
    CValidationState state;
    BOOST_REQUIRE(engine->BeginSelection(pool.poolId, state));

    RecoveryRequest request = MakeRequest(5);
    request.fClosePool = true;
    BOOST_CHECK(Reject(request) == PoolError::INVALID_STATE);

    // Plain recovery is still possible
    RecoveryAction action;
    BOOST_CHECK(engine->Recover(pool.poolId, MakeRequest(5), action, state));
    BOOST_CHECK(ReloadPool(pool.poolId).status == PoolStatus::SELECTING);
}

BOOST_AUTO_TEST_SUITE_END()
