// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pooldb.h"

#include "clientversion.h"
#include "logging.h"
#include "util/system.h"

#include "fs.h"

// Global pool DB instance
std::unique_ptr<CPoolDB> g_pooldb;

// DB key helpers
namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

// Round-scoped key: 'O' / 'R' + poolId + round
struct RoundKey
{
    uint256 poolId;
    uint32_t roundNumber;

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        s << poolId;
        ser_writedata32be(s, roundNumber);
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        s >> poolId;
        roundNumber = ser_readdata32be(s);
    }
};

// Consumed decision key: 'D' + poolId + decisionHash
struct DecisionKey
{
    uint256 poolId;
    uint256 decisionHash;

    SERIALIZE_METHODS(DecisionKey, obj)
    {
        READWRITE(obj.poolId, obj.decisionHash);
    }
};

// Anchor key: 'A' + height (big-endian)
struct AnchorKey
{
    uint32_t height;

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        ser_writedata32be(s, height);
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        height = ser_readdata32be(s);
    }
};

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

CPoolDB::CPoolDB(size_t nCacheSize, bool fMemory, bool fWipe)
{
    fs::path path = GetDataDir() / "pools";
    db = std::make_unique<CDBWrapper>(path, nCacheSize, fMemory, fWipe);
}

CPoolDB::~CPoolDB() = default;

// =============================================================================
// Pool Ledger
// =============================================================================

bool CPoolDB::WritePool(const PoolLedger& pool)
{
    return db->Write(MakeKey(DB_POOL, pool.poolId), pool);
}

bool CPoolDB::ReadPool(const uint256& poolId, PoolLedger& pool) const
{
    return db->Read(MakeKey(DB_POOL, poolId), pool);
}

bool CPoolDB::HavePool(const uint256& poolId) const
{
    return db->Exists(MakeKey(DB_POOL, poolId));
}

void CPoolDB::ForEachPool(std::function<bool(const PoolLedger&)> func) const
{
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(MakeKey(DB_POOL, uint256()));

    while (it->Valid()) {
        std::pair<char, uint256> key;
        if (it->GetKey(key) && key.first == DB_POOL) {
            PoolLedger pool;
            if (it->GetValue(pool)) {
                if (!func(pool)) {
                    break;  // Callback returned false, stop iteration
                }
            }
            it->Next();
        } else {
            break;  // No more pool entries
        }
    }
}

// =============================================================================
// Entries
// =============================================================================

bool CPoolDB::ReadEntry(const uint256& poolId, uint32_t roundNumber, uint64_t entryId, PoolEntry& entry) const
{
    return db->Read(MakeKey(DB_POOL_ENTRY, EntryKey(poolId, roundNumber, entryId)), entry);
}

bool CPoolDB::ReadEntryRound(const uint256& poolId, uint64_t entryId, uint32_t& roundNumber) const
{
    return db->Read(MakeKey(DB_POOL_ENTRY_INDEX, PoolSeqKey(poolId, entryId)), roundNumber);
}

bool CPoolDB::HaveEntry(const uint256& poolId, uint64_t entryId) const
{
    return db->Exists(MakeKey(DB_POOL_ENTRY_INDEX, PoolSeqKey(poolId, entryId)));
}

std::unique_ptr<CDBIterator> CPoolDB::SeekRoundEntries(const uint256& poolId, uint32_t roundNumber) const
{
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(MakeKey(DB_POOL_ENTRY, EntryKey(poolId, roundNumber, 0)));
    return it;
}

// =============================================================================
// Outcomes / Decisions / Receipts
// =============================================================================

bool CPoolDB::ReadOutcome(const uint256& poolId, uint32_t roundNumber, PoolOutcome& outcome) const
{
    return db->Read(MakeKey(DB_POOL_OUTCOME, RoundKey{poolId, roundNumber}), outcome);
}

bool CPoolDB::HaveOutcome(const uint256& poolId, uint32_t roundNumber) const
{
    return db->Exists(MakeKey(DB_POOL_OUTCOME, RoundKey{poolId, roundNumber}));
}

bool CPoolDB::ReadConsumedDecision(const uint256& poolId, const uint256& decisionHash, uint32_t& roundNumber) const
{
    return db->Read(MakeKey(DB_POOL_DECISION, DecisionKey{poolId, decisionHash}), roundNumber);
}

bool CPoolDB::ReadReceipt(const uint256& poolId, uint32_t roundNumber, PoolReceipt& receipt) const
{
    return db->Read(MakeKey(DB_POOL_RECEIPT, RoundKey{poolId, roundNumber}), receipt);
}

bool CPoolDB::HaveReceipt(const uint256& poolId, uint32_t roundNumber) const
{
    return db->Exists(MakeKey(DB_POOL_RECEIPT, RoundKey{poolId, roundNumber}));
}

// =============================================================================
// Recovery log
// =============================================================================

bool CPoolDB::ReadRecovery(const uint256& poolId, uint64_t sequence, RecoveryAction& action) const
{
    return db->Read(MakeKey(DB_POOL_RECOVERY, PoolSeqKey(poolId, sequence)), action);
}

void CPoolDB::GetRecoveries(const uint256& poolId, std::vector<RecoveryAction>& actions) const
{
    actions.clear();

    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(MakeKey(DB_POOL_RECOVERY, PoolSeqKey(poolId, 0)));

    while (it->Valid()) {
        std::pair<char, PoolSeqKey> key;
        if (it->GetKey(key) && key.first == DB_POOL_RECOVERY && key.second.poolId == poolId) {
            RecoveryAction action;
            if (it->GetValue(action)) {
                actions.push_back(action);
            }
            it->Next();
        } else {
            break;  // No more recoveries for this pool
        }
    }
}

// =============================================================================
// Platform anchors
// =============================================================================

bool CPoolDB::ReadAnchor(uint32_t height, PlatformAnchor& anchor) const
{
    return db->Read(MakeKey(DB_ANCHOR, AnchorKey{height}), anchor);
}

bool CPoolDB::ReadAnchorTip(uint32_t& height) const
{
    return db->Read(DB_ANCHOR_TIP, height);
}

// =============================================================================
// Batch Operations
// =============================================================================

CPoolDB::Batch::Batch(CPoolDB& db) : batch(CLIENT_VERSION), parent(db) {}

void CPoolDB::Batch::WritePool(const PoolLedger& pool)
{
    batch.Write(MakeKey(DB_POOL, pool.poolId), pool);
    nWrites++;
}

void CPoolDB::Batch::WriteEntry(const PoolEntry& entry)
{
    batch.Write(MakeKey(DB_POOL_ENTRY, EntryKey(entry.poolId, entry.roundNumber, entry.entryId)), entry);
    nWrites++;
}

void CPoolDB::Batch::WriteEntryIndex(const uint256& poolId, uint64_t entryId, uint32_t roundNumber)
{
    batch.Write(MakeKey(DB_POOL_ENTRY_INDEX, PoolSeqKey(poolId, entryId)), roundNumber);
    nWrites++;
}

void CPoolDB::Batch::WriteOutcome(const PoolOutcome& outcome)
{
    batch.Write(MakeKey(DB_POOL_OUTCOME, RoundKey{outcome.poolId, outcome.roundNumber}), outcome);
    nWrites++;
}

void CPoolDB::Batch::WriteConsumedDecision(const uint256& poolId, const uint256& decisionHash, uint32_t roundNumber)
{
    batch.Write(MakeKey(DB_POOL_DECISION, DecisionKey{poolId, decisionHash}), roundNumber);
    nWrites++;
}

void CPoolDB::Batch::WriteReceipt(const PoolReceipt& receipt)
{
    batch.Write(MakeKey(DB_POOL_RECEIPT, RoundKey{receipt.poolId, receipt.roundNumber}), receipt);
    nWrites++;
}

void CPoolDB::Batch::WriteRecovery(const RecoveryAction& action)
{
    batch.Write(MakeKey(DB_POOL_RECOVERY, PoolSeqKey(action.poolId, action.sequence)), action);
    nWrites++;
}

void CPoolDB::Batch::WriteAnchor(const PlatformAnchor& anchor)
{
    batch.Write(MakeKey(DB_ANCHOR, AnchorKey{anchor.height}), anchor);
    batch.Write(DB_ANCHOR_TIP, anchor.height);
    nWrites += 2;
}

bool CPoolDB::Batch::Commit()
{
    LogPrint(BCLog::DB, "CPoolDB::Batch::Commit writes=%u size=%u\n",
             (unsigned int)nWrites, (unsigned int)batch.SizeEstimate());
    return parent.db->WriteBatch(batch);
}

bool CPoolDB::Sync()
{
    return db->Sync();
}

// =============================================================================
// InitPoolDB - Initialize the pool database
// =============================================================================

bool InitPoolDB(size_t nCacheSize, bool fMemory, bool fWipe)
{
    try {
        g_pooldb.reset();
        g_pooldb = std::make_unique<CPoolDB>(nCacheSize, fMemory, fWipe);
        LogPrint(BCLog::DB, "Pool: Initialized database (cache=%zu, memory=%d, wipe=%d)\n",
                 nCacheSize, fMemory, fWipe);
        return true;
    } catch (const std::exception& e) {
        LogPrintf("ERROR: Failed to initialize pool database: %s\n", e.what());
        return false;
    }
}
