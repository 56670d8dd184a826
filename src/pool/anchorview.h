// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_ANCHORVIEW_H
#define BOUNTY_POOL_ANCHORVIEW_H

/**
 * Anchor View - read access to externally produced platform headers
 *
 * The outcome selector only ever sees anchors through this interface. The
 * platform glue appends headers (submitanchor); nothing in the pool layer
 * can choose or alter them.
 */

#include "pool/pool.h"

#include <map>

class CPoolDB;
class CValidationState;

class CAnchorView
{
public:
    virtual ~CAnchorView() {}

    /** Retrieve the anchor at a given height */
    virtual bool GetAnchor(uint32_t height, PlatformAnchor& anchor) const = 0;

    /** Height of the most recent anchor, 0 if none */
    virtual uint32_t GetTipHeight() const = 0;

    /**
     * Append the next anchor. Heights must be contiguous (tip + 1, or any
     * height for the first anchor) and the hash non-null.
     */
    virtual bool AddAnchor(const PlatformAnchor& anchor, CValidationState& state) = 0;
};

/** Checks shared by every view before an anchor is appended */
bool CheckAnchor(const PlatformAnchor& anchor, bool fHaveTip, uint32_t tipHeight, CValidationState& state);

/** Anchors persisted in the pool database */
class CAnchorViewDB : public CAnchorView
{
private:
    CPoolDB& db;

public:
    explicit CAnchorViewDB(CPoolDB& dbIn) : db(dbIn) {}

    bool GetAnchor(uint32_t height, PlatformAnchor& anchor) const override;
    uint32_t GetTipHeight() const override;
    bool AddAnchor(const PlatformAnchor& anchor, CValidationState& state) override;
};

/** Volatile anchors, for tests and tools replaying a known header chain */
class CAnchorViewMemory : public CAnchorView
{
private:
    std::map<uint32_t, PlatformAnchor> mapAnchors;

public:
    bool GetAnchor(uint32_t height, PlatformAnchor& anchor) const override;
    uint32_t GetTipHeight() const override;
    bool AddAnchor(const PlatformAnchor& anchor, CValidationState& state) override;
};

#endif // BOUNTY_POOL_ANCHORVIEW_H
