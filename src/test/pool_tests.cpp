// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Pool Ledger Tests - configuration rules, lifecycle table, ledger identity
 *
 * Tests:
 *   1. CheckPoolConfig accepts the reference config and rejects each bad field
 *   2. Pool id is a pure function of the configuration
 *   3. IsValidStatusTransition matches the round lifecycle
 *   4. CheckAcceptEntry ordering (closed, halted, amount)
 *   5. Ledger serialization and conservation helpers
 *   6. Amount parsing
 */

#include "consensus/validation.h"
#include "pool/killswitch.h"
#include "pool/pool.h"
#include "pool/pool_logic.h"
#include "streams.h"
#include "test/test_bounty.h"
#include "utilmoneystr.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(pool_tests, BasicTestingSetup)

static PoolConfig ReferenceConfig()
{
    PoolConfig config;
    config.mode = PoolMode::RANDOM_SELECTION;
    config.entryFee = 10;
    config.floorAmount = 10000;
    config.feeSplit.emplace_back(TestId(1), 80, "research");
    config.feeSplit.emplace_back(TestId(2), 20, "ops");
    config.authority = TestId(0xa0);
    return config;
}

static std::string ConfigRejectReason(const PoolConfig& config)
{
    CValidationState state;
    BOOST_CHECK(!CheckPoolConfig(config, state));
    BOOST_CHECK(state.GetCode() == PoolError::INVALID_CONFIG);
    return state.GetRejectReason();
}

// =============================================================================
// Test 1: CheckPoolConfig
// =============================================================================
BOOST_AUTO_TEST_CASE(pool_config_reference_accepted)
{
    CValidationState state;
    BOOST_CHECK(CheckPoolConfig(ReferenceConfig(), state));
    BOOST_CHECK(state.IsValid());
}

BOOST_AUTO_TEST_CASE(pool_config_rejects_bad_amounts)
{
    PoolConfig config = ReferenceConfig();
    config.entryFee = 0;
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-entry-fee");

    config = ReferenceConfig();
    config.entryFee = MAX_MONEY + 1;
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-entry-fee");

    config = ReferenceConfig();
    config.floorAmount = -1;
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-floor-amount");

    config = ReferenceConfig();
    config.escapeTimeout = -1;
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-escape-timeout");
}

BOOST_AUTO_TEST_CASE(pool_config_rejects_bad_split)
{
    PoolConfig config = ReferenceConfig();
    config.feeSplit.clear();
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-split-size");

    // 9 destinations
    config = ReferenceConfig();
    config.feeSplit.clear();
    for (int i = 0; i < 9; i++) {
        config.feeSplit.emplace_back(TestId(10 + i), i == 0 ? 92 : 1, "");
    }
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-split-size");

    // Sum 99
    config = ReferenceConfig();
    config.feeSplit[1].percent = 19;
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-split-sum");

    // Sum 101
    config = ReferenceConfig();
    config.feeSplit[1].percent = 21;
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-split-sum");

    config = ReferenceConfig();
    config.feeSplit[1].destination = config.feeSplit[0].destination;
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-split-duplicate-destination");

    config = ReferenceConfig();
    config.feeSplit[0].destination.SetNull();
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-split-null-destination");

    config = ReferenceConfig();
    config.feeSplit[0].percent = 0;
    config.feeSplit[1].percent = 100;
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-split-percent");

    config = ReferenceConfig();
    config.feeSplit[0].label = std::string(MAX_FEE_SPLIT_LABEL_LENGTH + 1, 'x');
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-split-label");
}

BOOST_AUTO_TEST_CASE(pool_config_rejects_bad_authorities)
{
    PoolConfig config = ReferenceConfig();
    config.authority.SetNull();
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-null-authority");

    config = ReferenceConfig();
    config.mode = PoolMode::AI_DECISION;
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-null-decision-authority");

    config = ReferenceConfig();
    config.decisionAuthority = TestId(0xa1);
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-decision-authority-random");

    config = ReferenceConfig();
    config.recoveryMaxPercent = MAX_RECOVERY_PERCENT + 1;
    BOOST_CHECK_EQUAL(ConfigRejectReason(config), "bad-pool-recovery-percent");
}

// =============================================================================
// Test 2: Pool id
// =============================================================================
BOOST_AUTO_TEST_CASE(pool_id_is_deterministic)
{
    const PoolConfig a = ReferenceConfig();
    PoolConfig b = ReferenceConfig();
    BOOST_CHECK(a.GetPoolId() == b.GetPoolId());
    BOOST_CHECK(!a.GetPoolId().IsNull());

    b.nonce = 1;
    BOOST_CHECK(a.GetPoolId() != b.GetPoolId());

    b = ReferenceConfig();
    b.entryFee = 11;
    BOOST_CHECK(a.GetPoolId() != b.GetPoolId());

    const PoolLedger pool = BuildPoolLedger(a, 7, 1700000000);
    BOOST_CHECK(pool.poolId == a.GetPoolId());
    BOOST_CHECK(pool.status == PoolStatus::ACTIVE);
    BOOST_CHECK_EQUAL(pool.roundNumber, FIRST_ROUND);
    BOOST_CHECK_EQUAL(pool.custodyBalance, 0);
    BOOST_CHECK_EQUAL(pool.createHeight, 7U);
}

// =============================================================================
// Test 3: Status transitions
// =============================================================================
BOOST_AUTO_TEST_CASE(status_transitions)
{
    BOOST_CHECK(IsValidStatusTransition(PoolStatus::ACTIVE, PoolStatus::SELECTING));
    BOOST_CHECK(IsValidStatusTransition(PoolStatus::ACTIVE, PoolStatus::CLOSED));
    BOOST_CHECK(IsValidStatusTransition(PoolStatus::SELECTING, PoolStatus::SETTLING));
    BOOST_CHECK(IsValidStatusTransition(PoolStatus::SETTLING, PoolStatus::ACTIVE));
    BOOST_CHECK(IsValidStatusTransition(PoolStatus::SETTLING, PoolStatus::CLOSED));

    BOOST_CHECK(!IsValidStatusTransition(PoolStatus::ACTIVE, PoolStatus::SETTLING));
    BOOST_CHECK(!IsValidStatusTransition(PoolStatus::SELECTING, PoolStatus::ACTIVE));
    BOOST_CHECK(!IsValidStatusTransition(PoolStatus::SELECTING, PoolStatus::CLOSED));
    BOOST_CHECK(!IsValidStatusTransition(PoolStatus::SETTLING, PoolStatus::SELECTING));
    for (PoolStatus to : {PoolStatus::ACTIVE, PoolStatus::SELECTING, PoolStatus::SETTLING, PoolStatus::CLOSED}) {
        BOOST_CHECK(!IsValidStatusTransition(PoolStatus::CLOSED, to));
    }
}

BOOST_AUTO_TEST_CASE(enum_strings)
{
    PoolMode mode;
    BOOST_CHECK(ParsePoolMode("ai_decision", mode));
    BOOST_CHECK(mode == PoolMode::AI_DECISION);
    BOOST_CHECK_EQUAL(PoolModeToString(PoolMode::RANDOM_SELECTION), "random");
    BOOST_CHECK(!ParsePoolMode("lottery", mode));

    DecisionVerdict verdict;
    BOOST_CHECK(ParseDecisionVerdict("pass", verdict));
    BOOST_CHECK(verdict == DecisionVerdict::PASS);
    BOOST_CHECK(!ParseDecisionVerdict("maybe", verdict));

    BOOST_CHECK_EQUAL(PoolStatusToString(PoolStatus::SETTLING), "settling");
    BOOST_CHECK_EQUAL(std::string(GetPoolErrorName(PoolError::AMOUNT_MISMATCH)), "AmountMismatch");
    BOOST_CHECK_EQUAL(std::string(GetPoolErrorName(PoolError::INSUFFICIENT_CUSTODY)), "InsufficientCustody");
}

// =============================================================================
// Test 4: CheckAcceptEntry
// =============================================================================
BOOST_AUTO_TEST_CASE(accept_entry_checks)
{
    PoolLedger pool = BuildPoolLedger(ReferenceConfig(), 1, 1700000000);
    const uint256 payer = TestId(0x100);
    CValidationState state;

    BOOST_CHECK(CheckAcceptEntry(pool, payer, 10, state));

    BOOST_CHECK(!CheckAcceptEntry(pool, payer, 11, state));
    BOOST_CHECK(state.GetCode() == PoolError::AMOUNT_MISMATCH);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-entry-amount-mismatch");

    state = CValidationState();
    BOOST_CHECK(!CheckAcceptEntry(pool, uint256(), 10, state));
    BOOST_CHECK(state.GetCode() == PoolError::UNAUTHORIZED);

    // Not Active is reported before the amount
    pool.status = PoolStatus::SELECTING;
    state = CValidationState();
    BOOST_CHECK(!CheckAcceptEntry(pool, payer, 11, state));
    BOOST_CHECK(state.GetCode() == PoolError::POOL_CLOSED);

    pool.status = PoolStatus::ACTIVE;
    pool.halted = true;
    state = CValidationState();
    BOOST_CHECK(!CheckAcceptEntry(pool, payer, 10, state));
    BOOST_CHECK(state.GetCode() == PoolError::POOL_HALTED);

    // Kill switch
    pool.halted = false;
    BOOST_CHECK(SetPoolEntriesEnabled(false));
    state = CValidationState();
    BOOST_CHECK(!CheckAcceptEntry(pool, payer, 10, state));
    BOOST_CHECK(state.GetCode() == PoolError::POOL_CLOSED);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-entry-entries-disabled");
    BOOST_CHECK(SetPoolEntriesEnabled(true));
}

BOOST_AUTO_TEST_CASE(begin_selection_floor_rule)
{
    PoolLedger pool = BuildPoolLedger(ReferenceConfig(), 1, 1700000000);
    CValidationState state;

    // No entries, custody below floor: the round stays open
    BOOST_CHECK(!CheckBeginSelection(pool, state));
    BOOST_CHECK(state.GetCode() == PoolError::NO_ENTRIES);

    // No entries, carried custody at the floor: selection proceeds
    pool.carriedRemainder = pool.custodyBalance = 10000;
    state = CValidationState();
    BOOST_CHECK(CheckBeginSelection(pool, state));

    // One entry, custody far below the floor: selection proceeds
    pool.carriedRemainder = 0;
    pool.custodyBalance = pool.roundContributions = 10;
    pool.roundEntryCount = 1;
    state = CValidationState();
    BOOST_CHECK(CheckBeginSelection(pool, state));

    pool.status = PoolStatus::SETTLING;
    state = CValidationState();
    BOOST_CHECK(!CheckBeginSelection(pool, state));
    BOOST_CHECK(state.GetCode() == PoolError::INVALID_STATE);
}

BOOST_AUTO_TEST_CASE(authority_operations)
{
    PoolLedger pool = BuildPoolLedger(ReferenceConfig(), 1, 1700000000);
    CValidationState state;

    BOOST_CHECK(!CheckClosePool(pool, TestId(0x999), state));
    BOOST_CHECK(state.GetCode() == PoolError::UNAUTHORIZED);

    state = CValidationState();
    BOOST_CHECK(CheckClosePool(pool, pool.authority, state));

    pool.status = PoolStatus::SELECTING;
    state = CValidationState();
    BOOST_CHECK(!CheckClosePool(pool, pool.authority, state));
    BOOST_CHECK(state.GetCode() == PoolError::INVALID_STATE);

    state = CValidationState();
    BOOST_CHECK(!CheckSetDecisionAuthority(pool, pool.authority, TestId(5), state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-decision-authority-random-pool");

    state = CValidationState();
    BOOST_CHECK(!CheckRotateAuthority(pool, pool.authority, uint256(), state));
    BOOST_CHECK(state.GetCode() == PoolError::INVALID_CONFIG);
}

// =============================================================================
// Test 5: Ledger record
// =============================================================================
BOOST_AUTO_TEST_CASE(ledger_serialization_and_pot)
{
    PoolLedger pool = BuildPoolLedger(ReferenceConfig(), 3, 1700000000);
    pool.carriedRemainder = 5;
    pool.roundContributions = 30;
    pool.roundRecovered = 8;
    pool.custodyBalance = 27;
    pool.status = PoolStatus::SETTLING;
    pool.roundNumber = 4;
    BOOST_CHECK(pool.IsConserved());
    BOOST_CHECK_EQUAL(pool.GetRoundPot(), 22);

    CDataStream ss(SER_DISK, 0);
    ss << pool;
    PoolLedger pool2;
    ss >> pool2;
    BOOST_CHECK(pool2.poolId == pool.poolId);
    BOOST_CHECK(pool2.status == PoolStatus::SETTLING);
    BOOST_CHECK_EQUAL(pool2.roundNumber, 4U);
    BOOST_CHECK_EQUAL(pool2.feeSplit.size(), 2U);
    BOOST_CHECK_EQUAL(pool2.feeSplit[0].label, "research");
    BOOST_CHECK(pool2.IsConserved());

    pool.custodyBalance = 26;
    BOOST_CHECK(!pool.IsConserved());

    // Recovered more than contributed: the round pot is empty, never negative
    pool.custodyBalance = 5;
    pool.roundRecovered = 30;
    BOOST_CHECK_EQUAL(pool.GetRoundPot(), 0);
}

// =============================================================================
// Test 6: Amount parsing
// =============================================================================
BOOST_AUTO_TEST_CASE(parse_money)
{
    CAmount amount = 0;
    BOOST_CHECK(ParseMoney(" 10000 ", amount));
    BOOST_CHECK_EQUAL(amount, 10000);
    BOOST_CHECK(!ParseMoney("", amount));
    BOOST_CHECK(!ParseMoney("-5", amount));
    BOOST_CHECK(!ParseMoney("1.5", amount));
    BOOST_CHECK(!ParseMoney("12 3", amount));
    BOOST_CHECK(!ParseMoney("999999999999999999", amount));

    // High-bit bytes are not digits or whitespace
    BOOST_CHECK(!ParseMoney("1\x80", amount));
    BOOST_CHECK(!ParseMoney("\xa0" "1", amount));
    BOOST_CHECK(!ParseMoney("1\xff", amount));
    BOOST_CHECK_EQUAL(amount, 10000);
}

BOOST_AUTO_TEST_SUITE_END()
