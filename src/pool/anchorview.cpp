// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/anchorview.h"

#include "consensus/validation.h"
#include "logging.h"
#include "pool/pooldb.h"

bool CheckAnchor(const PlatformAnchor& anchor, bool fHaveTip, uint32_t tipHeight, CValidationState& state)
{
    if (anchor.blockHash.IsNull()) {
        return state.Invalid(false, PoolError::INVALID_CONFIG, "bad-anchor-null-hash");
    }
    if (fHaveTip && anchor.height != tipHeight + 1) {
        return state.Invalid(false, PoolError::INVALID_STATE, "bad-anchor-height",
                             strprintf("expected=%u got=%u", tipHeight + 1, anchor.height));
    }
    return true;
}

// =============================================================================
// CAnchorViewDB
// =============================================================================

bool CAnchorViewDB::GetAnchor(uint32_t height, PlatformAnchor& anchor) const
{
    return db.ReadAnchor(height, anchor);
}

uint32_t CAnchorViewDB::GetTipHeight() const
{
    uint32_t height = 0;
    if (!db.ReadAnchorTip(height)) {
        return 0;
    }
    return height;
}

bool CAnchorViewDB::AddAnchor(const PlatformAnchor& anchor, CValidationState& state)
{
    uint32_t tipHeight = 0;
    bool fHaveTip = db.ReadAnchorTip(tipHeight);
    if (!CheckAnchor(anchor, fHaveTip, tipHeight, state)) {
        return false;
    }

    CPoolDB::Batch batch = db.CreateBatch();
    batch.WriteAnchor(anchor);
    if (!batch.Commit()) {
        return state.Error("anchor-db-write-failed");
    }

    LogPrint(BCLog::OUTCOME, "AnchorView: anchor height=%u hash=%s\n",
             anchor.height, anchor.blockHash.ToString().substr(0, 16));
    return true;
}

// =============================================================================
// CAnchorViewMemory
// =============================================================================

bool CAnchorViewMemory::GetAnchor(uint32_t height, PlatformAnchor& anchor) const
{
    auto it = mapAnchors.find(height);
    if (it == mapAnchors.end()) {
        return false;
    }
    anchor = it->second;
    return true;
}

uint32_t CAnchorViewMemory::GetTipHeight() const
{
    if (mapAnchors.empty()) {
        return 0;
    }
    return mapAnchors.rbegin()->first;
}

bool CAnchorViewMemory::AddAnchor(const PlatformAnchor& anchor, CValidationState& state)
{
    if (!CheckAnchor(anchor, !mapAnchors.empty(), GetTipHeight(), state)) {
        return false;
    }
    mapAnchors[anchor.height] = anchor;
    return true;
}
