// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_POOLDB_H
#define BOUNTY_POOL_POOLDB_H

/**
 * Pool Database Layer
 *
 * Provides persistence for every pool record (see pool/pool.h for the key
 * layout). Records are append-only or monotonic: nothing is ever erased,
 * later rounds simply supersede earlier ones.
 *
 * All mutations of one pool operation go through a single Batch so that
 * they land atomically or not at all.
 */

#include "dbwrapper.h"
#include "pool/pool.h"

#include <functional>
#include <memory>
#include <vector>

/** Big-endian key of an entry: iteration order == insertion order */
struct EntryKey
{
    uint256 poolId;
    uint32_t roundNumber{0};
    uint64_t entryId{0};

    EntryKey() {}
    EntryKey(const uint256& poolIdIn, uint32_t roundIn, uint64_t entryIdIn)
        : poolId(poolIdIn), roundNumber(roundIn), entryId(entryIdIn) {}

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        s << poolId;
        ser_writedata32be(s, roundNumber);
        ser_writedata64be(s, entryId);
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        s >> poolId;
        roundNumber = ser_readdata32be(s);
        entryId = ser_readdata64be(s);
    }
};

/** (poolId, sequence-like counter) key used by the entry index and recoveries */
struct PoolSeqKey
{
    uint256 poolId;
    uint64_t seq{0};

    PoolSeqKey() {}
    PoolSeqKey(const uint256& poolIdIn, uint64_t seqIn) : poolId(poolIdIn), seq(seqIn) {}

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        s << poolId;
        ser_writedata64be(s, seq);
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        s >> poolId;
        seq = ser_readdata64be(s);
    }
};

class CPoolDB
{
private:
    std::unique_ptr<CDBWrapper> db;

public:
    CPoolDB(size_t nCacheSize, bool fMemory = false, bool fWipe = false);
    ~CPoolDB();

    // === Pool Ledger ===

    bool WritePool(const PoolLedger& pool);
    bool ReadPool(const uint256& poolId, PoolLedger& pool) const;
    bool HavePool(const uint256& poolId) const;

    /**
     * ForEachPool - Iterate over all pools
     * @param func Callback (return false to stop)
     */
    void ForEachPool(std::function<bool(const PoolLedger&)> func) const;

    // === Entries ===

    bool ReadEntry(const uint256& poolId, uint32_t roundNumber, uint64_t entryId, PoolEntry& entry) const;

    /**
     * ReadEntryRound - Resolve an entry id to the round it was recorded in
     * @return false if the entry id was never recorded for this pool
     */
    bool ReadEntryRound(const uint256& poolId, uint64_t entryId, uint32_t& roundNumber) const;
    bool HaveEntry(const uint256& poolId, uint64_t entryId) const;

    /** Iterator positioned at the first entry of (poolId, roundNumber) */
    std::unique_ptr<CDBIterator> SeekRoundEntries(const uint256& poolId, uint32_t roundNumber) const;

    // === Outcomes / Decisions / Receipts ===

    bool ReadOutcome(const uint256& poolId, uint32_t roundNumber, PoolOutcome& outcome) const;
    bool HaveOutcome(const uint256& poolId, uint32_t roundNumber) const;

    /** Round a decision hash was consumed in, if any */
    bool ReadConsumedDecision(const uint256& poolId, const uint256& decisionHash, uint32_t& roundNumber) const;

    bool ReadReceipt(const uint256& poolId, uint32_t roundNumber, PoolReceipt& receipt) const;
    bool HaveReceipt(const uint256& poolId, uint32_t roundNumber) const;

    // === Recovery log ===

    bool ReadRecovery(const uint256& poolId, uint64_t sequence, RecoveryAction& action) const;
    void GetRecoveries(const uint256& poolId, std::vector<RecoveryAction>& actions) const;

    // === Platform anchors ===

    bool ReadAnchor(uint32_t height, PlatformAnchor& anchor) const;
    bool ReadAnchorTip(uint32_t& height) const;

    // === Batch Operations ===

    class Batch
    {
    private:
        CDBBatch batch;
        CPoolDB& parent;
        size_t nWrites{0};

    public:
        explicit Batch(CPoolDB& db);

        void WritePool(const PoolLedger& pool);
        void WriteEntry(const PoolEntry& entry);
        void WriteEntryIndex(const uint256& poolId, uint64_t entryId, uint32_t roundNumber);
        void WriteOutcome(const PoolOutcome& outcome);
        void WriteConsumedDecision(const uint256& poolId, const uint256& decisionHash, uint32_t roundNumber);
        void WriteReceipt(const PoolReceipt& receipt);
        void WriteRecovery(const RecoveryAction& action);
        void WriteAnchor(const PlatformAnchor& anchor);

        size_t GetWriteCount() const { return nWrites; }

        bool Commit();
    };

    Batch CreateBatch() { return Batch(*this); }

    // Sync to disk
    bool Sync();
};

// Global pool DB instance
extern std::unique_ptr<CPoolDB> g_pooldb;

/**
 * InitPoolDB - Initialize the pool database under <datadir>/pools
 *
 * @param nCacheSize DB cache size in bytes
 * @param fMemory If true, use in-memory database (for tests)
 * @param fWipe If true, wipe and recreate DB
 * @return true on success
 */
bool InitPoolDB(size_t nCacheSize, bool fMemory = false, bool fWipe = false);

#endif // BOUNTY_POOL_POOLDB_H
