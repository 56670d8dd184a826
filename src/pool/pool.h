// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_POOL_H
#define BOUNTY_POOL_POOL_H

/**
 * Bounty Pool - custodied fund ledger records
 *
 * A pool custodies entry fees, runs rounds (Active -> Selecting -> Settling
 * -> Active) and disburses per an Outcome computed once per round. Funds
 * leave custody only through settlement or the authority-only recovery gate.
 *
 * Conservation (checked after every transition):
 *   custodyBalance == carriedRemainder + roundContributions - roundRecovered
 *
 * DB Keys:
 * 'P' + poolId -> PoolLedger
 * 'E' + (poolId, round, entryId) -> PoolEntry      (big-endian: insertion order)
 * 'I' + (poolId, entryId) -> round                 (entry id index)
 * 'O' + (poolId, round) -> PoolOutcome
 * 'D' + (poolId, decisionHash) -> round            (consumed decisions)
 * 'R' + (poolId, round) -> PoolReceipt
 * 'X' + (poolId, sequence) -> RecoveryAction
 * 'A' + height -> PlatformAnchor
 * 'T' -> anchor tip height
 */

#include "amount.h"
#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

// DB Key prefixes
static const char DB_POOL = 'P';
static const char DB_POOL_ENTRY = 'E';
static const char DB_POOL_ENTRY_INDEX = 'I';
static const char DB_POOL_OUTCOME = 'O';
static const char DB_POOL_DECISION = 'D';
static const char DB_POOL_RECEIPT = 'R';
static const char DB_POOL_RECOVERY = 'X';
static const char DB_ANCHOR = 'A';
static const char DB_ANCHOR_TIP = 'T';

// Constants
static const size_t MAX_FEE_SPLIT_DESTINATIONS = 8;
static const size_t MAX_FEE_SPLIT_LABEL_LENGTH = 32;
static const size_t MAX_SESSION_ID_LENGTH = 100;       // decision session ids
static const size_t MAX_REASON_CODE_LENGTH = 64;       // recovery reason codes
static const uint8_t MAX_RECOVERY_PERCENT = 100;
static const uint8_t ESCAPE_LAST_ENTRANT_PERCENT = 20;   // rest shared equally by the entrants
static const uint32_t FIRST_ROUND = 1;
static const uint64_t FIRST_ENTRY_ID = 1;
static const uint8_t POOL_RECORD_VERSION = 1;

/**
 * PoolStatus - round lifecycle
 *
 * Transitions (IsValidStatusTransition):
 *   ACTIVE    -> SELECTING, CLOSED
 *   SELECTING -> SETTLING
 *   SETTLING  -> ACTIVE (next round), CLOSED
 *   CLOSED    -> (terminal)
 */
enum class PoolStatus : uint8_t {
    ACTIVE = 0,
    SELECTING = 1,
    SETTLING = 2,
    CLOSED = 3
};

/**
 * PoolMode - how the round's outcome is produced, fixed at creation
 */
enum class PoolMode : uint8_t {
    RANDOM_SELECTION = 0,   // winner index derived from anchored seed material
    AI_DECISION = 1         // external pass/fail decision signal
};

enum class DecisionVerdict : uint8_t {
    FAIL = 0,
    PASS = 1
};

/** What a Receipt settled: the round's Outcome, or an idle-pool escape distribution */
enum class ReceiptKind : uint8_t {
    OUTCOME = 0,
    ESCAPE_PLAN = 1
};

std::string PoolStatusToString(PoolStatus status);
std::string PoolModeToString(PoolMode mode);
bool ParsePoolMode(const std::string& str, PoolMode& mode);
std::string DecisionVerdictToString(DecisionVerdict verdict);
std::string ReceiptKindToString(ReceiptKind kind);
bool ParseDecisionVerdict(const std::string& str, DecisionVerdict& verdict);

/** Explicit round lifecycle transition table */
bool IsValidStatusTransition(PoolStatus from, PoolStatus to);

/**
 * FeeSplitEntry - one destination of the disbursement split
 */
struct FeeSplitEntry
{
    uint256 destination;
    uint8_t percent{0};
    std::string label;          // "research", "ops", ... (display only)

    FeeSplitEntry() {}
    FeeSplitEntry(const uint256& destinationIn, uint8_t percentIn, const std::string& labelIn)
        : destination(destinationIn), percent(percentIn), label(labelIn) {}

    SERIALIZE_METHODS(FeeSplitEntry, obj)
    {
        READWRITE(obj.destination, obj.percent, obj.label);
    }
};

/**
 * PoolConfig - creation parameters
 *
 * poolId = SHA256d(config). The creation nonce lets one authority run
 * several pools with the same economics.
 */
struct PoolConfig
{
    PoolMode mode{PoolMode::RANDOM_SELECTION};
    CAmount entryFee{0};
    CAmount floorAmount{0};
    std::vector<FeeSplitEntry> feeSplit;
    uint256 authority;
    uint256 decisionAuthority;      // AI_DECISION only
    int64_t recoveryCooldown{0};    // seconds between recoveries, 0 = none
    uint8_t recoveryMaxPercent{0};  // of custody per recovery, 0 = unlimited
    int64_t escapeTimeout{0};       // idle seconds before the escape plan may run, 0 = never
    uint64_t nonce{0};

    SERIALIZE_METHODS(PoolConfig, obj)
    {
        uint8_t modeByte = static_cast<uint8_t>(obj.mode);
        READWRITE(modeByte);
        SER_READ(obj, obj.mode = static_cast<PoolMode>(modeByte));
        READWRITE(obj.entryFee, obj.floorAmount, obj.feeSplit);
        READWRITE(obj.authority, obj.decisionAuthority);
        READWRITE(obj.recoveryCooldown, obj.recoveryMaxPercent, obj.escapeTimeout, obj.nonce);
    }

    uint256 GetPoolId() const;
};

/**
 * PoolLedger - durable record of one bounty pool
 *
 * Stored at key 'P' + poolId. Every mutation is staged on a copy and
 * committed in one batch together with the records it touches.
 */
struct PoolLedger
{
    uint8_t nVersion{POOL_RECORD_VERSION};

    // === Identity / configuration ===
    uint256 poolId;
    PoolMode mode{PoolMode::RANDOM_SELECTION};
    uint256 authority;
    uint256 decisionAuthority;
    CAmount entryFee{0};
    CAmount floorAmount{0};
    std::vector<FeeSplitEntry> feeSplit;
    int64_t recoveryCooldown{0};
    uint8_t recoveryMaxPercent{0};
    int64_t escapeTimeout{0};

    // === Custody accounting ===
    CAmount custodyBalance{0};
    CAmount carriedRemainder{0};    // rolled over from earlier rounds
    CAmount roundContributions{0};  // accepted this round
    CAmount roundRecovered{0};      // recovered this round

    // === Round state ===
    uint32_t roundNumber{FIRST_ROUND};
    PoolStatus status{PoolStatus::ACTIVE};
    bool halted{false};             // set on InsufficientCustody
    uint64_t nextEntryId{FIRST_ENTRY_ID};
    uint64_t roundEntryCount{0};
    uint32_t selectionHeight{0};    // platform height when entries closed
    int64_t lastActivityTime{0};    // creation, last accepted entry or last settlement

    // === Recovery ===
    int64_t lastRecoveryTime{0};
    uint64_t recoveryCount{0};

    // === Audit ===
    uint32_t createHeight{0};
    int64_t createTime{0};

    PoolLedger() { SetNull(); }

    void SetNull()
    {
        nVersion = POOL_RECORD_VERSION;
        poolId.SetNull();
        mode = PoolMode::RANDOM_SELECTION;
        authority.SetNull();
        decisionAuthority.SetNull();
        entryFee = 0;
        floorAmount = 0;
        feeSplit.clear();
        recoveryCooldown = 0;
        recoveryMaxPercent = 0;
        escapeTimeout = 0;
        custodyBalance = 0;
        carriedRemainder = 0;
        roundContributions = 0;
        roundRecovered = 0;
        roundNumber = FIRST_ROUND;
        status = PoolStatus::ACTIVE;
        halted = false;
        nextEntryId = FIRST_ENTRY_ID;
        roundEntryCount = 0;
        selectionHeight = 0;
        lastActivityTime = 0;
        lastRecoveryTime = 0;
        recoveryCount = 0;
        createHeight = 0;
        createTime = 0;
    }

    bool IsNull() const { return poolId.IsNull(); }
    bool IsClosed() const { return status == PoolStatus::CLOSED; }

    /** custodyBalance == carriedRemainder + roundContributions - roundRecovered */
    bool IsConserved() const
    {
        return custodyBalance >= 0 &&
               custodyBalance == carriedRemainder + roundContributions - roundRecovered;
    }

    /** Pot the round's random-selection winner is paid from */
    CAmount GetRoundPot() const;

    SERIALIZE_METHODS(PoolLedger, obj)
    {
        READWRITE(obj.nVersion);
        READWRITE(obj.poolId);
        uint8_t modeByte = static_cast<uint8_t>(obj.mode);
        READWRITE(modeByte);
        SER_READ(obj, obj.mode = static_cast<PoolMode>(modeByte));
        READWRITE(obj.authority, obj.decisionAuthority);
        READWRITE(obj.entryFee, obj.floorAmount, obj.feeSplit);
        READWRITE(obj.recoveryCooldown, obj.recoveryMaxPercent, obj.escapeTimeout);
        READWRITE(obj.custodyBalance, obj.carriedRemainder, obj.roundContributions, obj.roundRecovered);
        READWRITE(obj.roundNumber);
        uint8_t statusByte = static_cast<uint8_t>(obj.status);
        READWRITE(statusByte);
        SER_READ(obj, obj.status = static_cast<PoolStatus>(statusByte));
        READWRITE(obj.halted, obj.nextEntryId, obj.roundEntryCount, obj.selectionHeight, obj.lastActivityTime);
        READWRITE(obj.lastRecoveryTime, obj.recoveryCount);
        READWRITE(obj.createHeight, obj.createTime);
    }
};

/**
 * PoolEntry - one accepted, fee-paying participation record
 *
 * Stored at key 'E' + (poolId, roundNumber, entryId). Payment fields are
 * frozen at acceptance; only `processed` may flip false -> true.
 */
struct PoolEntry
{
    uint256 poolId;
    uint64_t entryId{0};
    uint256 payer;
    CAmount amountPaid{0};
    std::vector<CAmount> contributionSplit;   // per feeSplit destination, sums to amountPaid
    uint32_t roundNumber{0};
    uint32_t recordedHeight{0};               // platform tip at acceptance
    int64_t recordedTime{0};                  // audit ordering only
    bool processed{false};

    PoolEntry() {}

    bool IsNull() const { return entryId == 0; }

    SERIALIZE_METHODS(PoolEntry, obj)
    {
        READWRITE(obj.poolId, obj.entryId, obj.payer, obj.amountPaid, obj.contributionSplit);
        READWRITE(obj.roundNumber, obj.recordedHeight, obj.recordedTime, obj.processed);
    }
};

/**
 * PlatformAnchor - externally produced ledger-platform block header
 *
 * Seed material for random selection is bound to the anchor that lies
 * anchorDepth blocks beyond the height at which entries closed.
 */
struct PlatformAnchor
{
    uint32_t height{0};
    uint256 blockHash;
    int64_t time{0};

    PlatformAnchor() {}
    PlatformAnchor(uint32_t heightIn, const uint256& hashIn, int64_t timeIn)
        : height(heightIn), blockHash(hashIn), time(timeIn) {}

    bool IsNull() const { return blockHash.IsNull(); }

    SERIALIZE_METHODS(PlatformAnchor, obj)
    {
        READWRITE(obj.height, obj.blockHash, obj.time);
    }
};

/**
 * DecisionMessage - external AI decision signal for one round
 *
 * decisionHash = SHA256d over every other field, in declaration order.
 */
struct DecisionMessage
{
    uint256 poolId;
    uint32_t roundNumber{0};
    DecisionVerdict verdict{DecisionVerdict::FAIL};
    CAmount payoutAmount{0};
    uint256 winner;
    uint256 decisionAuthority;
    std::string sessionId;
    int64_t timestamp{0};
    uint256 decisionHash;

    /** Hash of the signed fields (excludes decisionHash itself) */
    uint256 ComputeHash() const;

    SERIALIZE_METHODS(DecisionMessage, obj)
    {
        READWRITE(obj.poolId, obj.roundNumber);
        uint8_t verdictByte = static_cast<uint8_t>(obj.verdict);
        READWRITE(verdictByte);
        SER_READ(obj, obj.verdict = static_cast<DecisionVerdict>(verdictByte));
        READWRITE(obj.payoutAmount, obj.winner, obj.decisionAuthority, obj.sessionId, obj.timestamp);
        READWRITE(obj.decisionHash);
    }
};

/**
 * PoolOutcome - the result of one round, created once, consumed once
 *
 * Stored at key 'O' + (poolId, roundNumber). For RANDOM_SELECTION the seed
 * fields record exactly what was hashed so any observer can re-derive the
 * winner; for AI_DECISION they are null and decisionHash references the
 * consumed decision.
 */
struct PoolOutcome
{
    uint256 poolId;
    uint32_t roundNumber{0};
    PoolMode mode{PoolMode::RANDOM_SELECTION};

    // === Seed material (RANDOM_SELECTION) ===
    uint32_t anchorHeight{0};
    uint256 anchorHash;
    uint64_t entriesCount{0};
    uint256 entriesDigest;
    uint256 seed;

    // === Selection ===
    bool hasWinner{false};
    uint64_t winnerIndex{0};        // insertion position within the round
    uint64_t winnerEntryId{0};
    uint256 winner;

    // === Decision (AI_DECISION) ===
    DecisionVerdict verdict{DecisionVerdict::FAIL};
    uint256 decisionHash;

    CAmount payoutAmount{0};
    uint32_t computedHeight{0};
    int64_t computedTime{0};

    bool IsNull() const { return poolId.IsNull(); }
    uint256 GetHash() const;

    SERIALIZE_METHODS(PoolOutcome, obj)
    {
        READWRITE(obj.poolId, obj.roundNumber);
        uint8_t modeByte = static_cast<uint8_t>(obj.mode);
        READWRITE(modeByte);
        SER_READ(obj, obj.mode = static_cast<PoolMode>(modeByte));
        READWRITE(obj.anchorHeight, obj.anchorHash, obj.entriesCount, obj.entriesDigest, obj.seed);
        READWRITE(obj.hasWinner, obj.winnerIndex, obj.winnerEntryId, obj.winner);
        uint8_t verdictByte = static_cast<uint8_t>(obj.verdict);
        READWRITE(verdictByte);
        SER_READ(obj, obj.verdict = static_cast<DecisionVerdict>(verdictByte));
        READWRITE(obj.decisionHash);
        READWRITE(obj.payoutAmount, obj.computedHeight, obj.computedTime);
    }
};

/**
 * Transfer - one concrete fund movement out of custody
 */
struct Transfer
{
    uint256 destination;
    std::string label;
    uint8_t percent{0};
    CAmount amount{0};

    SERIALIZE_METHODS(Transfer, obj)
    {
        READWRITE(obj.destination, obj.label, obj.percent, obj.amount);
    }
};

/**
 * PoolReceipt - immutable settlement record
 *
 * Stored at key 'R' + (poolId, roundNumber). Its existence is what marks a
 * round's outcome as consumed. ESCAPE_PLAN receipts have no outcome: the
 * round's pot went to its entrants after the pool sat idle.
 */
struct PoolReceipt
{
    uint256 poolId;
    uint32_t roundNumber{0};
    ReceiptKind kind{ReceiptKind::OUTCOME};
    uint256 outcomeHash;
    bool hasWinner{false};
    uint64_t winnerEntryId{0};
    uint256 winner;
    CAmount payoutAmount{0};
    std::vector<Transfer> transfers;
    CAmount remainder{0};           // integer-division remainder (transfers[0], or the last entrant)
    CAmount custodyAfter{0};        // carried into the next round
    uint32_t settledHeight{0};
    int64_t settledTime{0};

    bool IsNull() const { return poolId.IsNull(); }

    CAmount GetTotalTransferred() const
    {
        CAmount total = 0;
        for (const Transfer& t : transfers) {
            total += t.amount;
        }
        return total;
    }

    SERIALIZE_METHODS(PoolReceipt, obj)
    {
        READWRITE(obj.poolId, obj.roundNumber);
        uint8_t kindByte = static_cast<uint8_t>(obj.kind);
        READWRITE(kindByte);
        SER_READ(obj, obj.kind = static_cast<ReceiptKind>(kindByte));
        READWRITE(obj.outcomeHash);
        READWRITE(obj.hasWinner, obj.winnerEntryId, obj.winner);
        READWRITE(obj.payoutAmount, obj.transfers, obj.remainder, obj.custodyAfter);
        READWRITE(obj.settledHeight, obj.settledTime);
    }
};

/**
 * RecoveryAction - permanent log of one authority recovery
 *
 * Stored at key 'X' + (poolId, sequence). Never erased.
 */
struct RecoveryAction
{
    uint256 poolId;
    uint64_t sequence{0};
    uint256 initiator;
    std::string reasonCode;
    CAmount amount{0};
    uint256 destination;
    uint32_t roundNumber{0};
    bool closedPool{false};
    int64_t timestamp{0};

    SERIALIZE_METHODS(RecoveryAction, obj)
    {
        READWRITE(obj.poolId, obj.sequence, obj.initiator, obj.reasonCode);
        READWRITE(obj.amount, obj.destination, obj.roundNumber, obj.closedPool, obj.timestamp);
    }
};

#endif // BOUNTY_POOL_POOL_H
