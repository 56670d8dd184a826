// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/entryregister.h"

#include "consensus/validation.h"
#include "logging.h"

// =============================================================================
// CEntryRange
// =============================================================================

CEntryRange::const_iterator::const_iterator(std::shared_ptr<CDBIterator> itIn, const uint256& poolIdIn, uint32_t roundIn)
    : it(std::move(itIn)), poolId(poolIdIn), roundNumber(roundIn)
{
    Load();
}

void CEntryRange::const_iterator::Load()
{
    if (!it) return;

    if (it->Valid()) {
        std::pair<char, EntryKey> key;
        if (it->GetKey(key) && key.first == DB_POOL_ENTRY &&
            key.second.poolId == poolId && key.second.roundNumber == roundNumber) {
            if (it->GetValue(current)) {
                return;
            }
            throw dbwrapper_error("CEntryRange: unreadable entry record");
        }
    }
    // Past the last entry of the round
    it.reset();
    current = PoolEntry();
}

CEntryRange::const_iterator& CEntryRange::const_iterator::operator++()
{
    if (it) {
        it->Next();
        Load();
    }
    return *this;
}

CEntryRange::const_iterator CEntryRange::begin() const
{
    std::shared_ptr<CDBIterator> it(db.SeekRoundEntries(poolId, roundNumber));
    return const_iterator(it, poolId, roundNumber);
}

// =============================================================================
// CEntryRegister
// =============================================================================

bool CEntryRegister::Append(const PoolEntry& entry, CPoolDB::Batch& batch, CValidationState& state) const
{
    if (entry.IsNull()) {
        return state.Invalid(false, PoolError::UNKNOWN_ENTRY, "bad-entry-null-id");
    }
    if (db.HaveEntry(entry.poolId, entry.entryId)) {
        return state.Invalid(false, PoolError::DUPLICATE_ENTRY, "bad-entry-duplicate",
                             strprintf("entry=%u", entry.entryId));
    }

    batch.WriteEntry(entry);
    batch.WriteEntryIndex(entry.poolId, entry.entryId, entry.roundNumber);

    LogPrint(BCLog::ENTRY, "EntryRegister::Append pool=%s round=%u entry=%u payer=%s amount=%d\n",
             entry.poolId.ToString().substr(0, 16), entry.roundNumber, entry.entryId,
             entry.payer.ToString().substr(0, 16), entry.amountPaid);
    return true;
}

bool CEntryRegister::GetEntryAt(const uint256& poolId, uint32_t roundNumber, uint64_t index, PoolEntry& entry) const
{
    uint64_t pos = 0;
    for (const PoolEntry& e : EntriesForRound(poolId, roundNumber)) {
        if (pos == index) {
            entry = e;
            return true;
        }
        pos++;
    }
    return false;
}

bool CEntryRegister::GetEntry(const uint256& poolId, uint64_t entryId, PoolEntry& entry) const
{
    uint32_t roundNumber;
    if (!db.ReadEntryRound(poolId, entryId, roundNumber)) {
        return false;
    }
    return db.ReadEntry(poolId, roundNumber, entryId, entry);
}

bool CEntryRegister::MarkProcessed(const uint256& poolId, uint64_t entryId, CPoolDB::Batch& batch, CValidationState& state) const
{
    PoolEntry entry;
    if (!GetEntry(poolId, entryId, entry)) {
        return state.Invalid(false, PoolError::UNKNOWN_ENTRY, "bad-entry-unknown",
                             strprintf("entry=%u", entryId));
    }
    if (entry.processed) {
        return true;
    }

    entry.processed = true;
    batch.WriteEntry(entry);
    return true;
}
