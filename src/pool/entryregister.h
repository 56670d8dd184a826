// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_ENTRYREGISTER_H
#define BOUNTY_POOL_ENTRYREGISTER_H

/**
 * Entry Register - append-only log of accepted entries
 *
 * Keyed by (poolId, roundNumber, entryId). Insertion order is the selection
 * order: the winner index of a round addresses entries by their position in
 * EntriesForRound().
 */

#include "pool/pooldb.h"

#include <iterator>
#include <memory>

class CValidationState;

/**
 * CEntryRange - lazy, finite, restartable sequence of one round's entries
 *
 * Nothing is read until begin() is called; every begin() opens a fresh
 * database iterator, so the range can be walked any number of times.
 */
class CEntryRange
{
public:
    class const_iterator
    {
    public:
        typedef std::input_iterator_tag iterator_category;
        typedef PoolEntry value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const PoolEntry* pointer;
        typedef const PoolEntry& reference;

        const_iterator() {}
        const_iterator(std::shared_ptr<CDBIterator> itIn, const uint256& poolIdIn, uint32_t roundIn);

        reference operator*() const { return current; }
        pointer operator->() const { return &current; }
        const_iterator& operator++();

        friend bool operator==(const const_iterator& a, const const_iterator& b)
        {
            return a.AtEnd() == b.AtEnd() && (a.AtEnd() || a.current.entryId == b.current.entryId);
        }
        friend bool operator!=(const const_iterator& a, const const_iterator& b) { return !(a == b); }

    private:
        std::shared_ptr<CDBIterator> it;
        uint256 poolId;
        uint32_t roundNumber{0};
        PoolEntry current;

        bool AtEnd() const { return !it; }
        void Load();
    };

    CEntryRange(const CPoolDB& dbIn, const uint256& poolIdIn, uint32_t roundIn)
        : db(dbIn), poolId(poolIdIn), roundNumber(roundIn) {}

    const_iterator begin() const;
    const_iterator end() const { return const_iterator(); }

    const uint256& GetPoolId() const { return poolId; }
    uint32_t GetRoundNumber() const { return roundNumber; }

private:
    const CPoolDB& db;
    uint256 poolId;
    uint32_t roundNumber;
};

class CEntryRegister
{
private:
    CPoolDB& db;

public:
    explicit CEntryRegister(CPoolDB& dbIn) : db(dbIn) {}

    /**
     * Append - Stage a new entry
     *
     * Fails with DuplicateEntry if entry.entryId is already recorded for the
     * pool. Writes the entry and its id index into the batch.
     */
    bool Append(const PoolEntry& entry, CPoolDB::Batch& batch, CValidationState& state) const;

    /** EntriesForRound - entries of one round in insertion order */
    CEntryRange EntriesForRound(const uint256& poolId, uint32_t roundNumber) const
    {
        return CEntryRange(db, poolId, roundNumber);
    }

    /**
     * GetEntryAt - entry at a given insertion position of a round
     * @return false if the round has fewer entries
     */
    bool GetEntryAt(const uint256& poolId, uint32_t roundNumber, uint64_t index, PoolEntry& entry) const;

    /**
     * MarkProcessed - Flip processed false -> true
     *
     * Idempotent: an entry that is already processed is left untouched and
     * the call succeeds. Fails with UnknownEntry if the id was never recorded.
     */
    bool MarkProcessed(const uint256& poolId, uint64_t entryId, CPoolDB::Batch& batch, CValidationState& state) const;

    bool GetEntry(const uint256& poolId, uint64_t entryId, PoolEntry& entry) const;
};

#endif // BOUNTY_POOL_ENTRYREGISTER_H
