// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_POOL_KILLSWITCH_H
#define BOUNTY_POOL_KILLSWITCH_H

#include <atomic>
#include <cstdint>

/**
 * Pool entries emergency control (kill switch)
 *
 * When the kill switch is OFF, every pool refuses new entries with
 * PoolClosed. Controlled via config: poolsenabled=0/1 (default: 1).
 *
 * This does NOT affect anything else:
 * - selection, settlement and recovery still work
 * - custody already accepted stays where it is
 */

// Global kill switch state (atomic for thread safety)
extern std::atomic<bool> g_pool_entries_enabled;

/**
 * Initialize kill switch from config.
 * Called at startup.
 */
void InitKillSwitch();

/**
 * Check if pool entries are currently accepted.
 *
 * Used in CheckAcceptEntry().
 *
 * @return true if entries are enabled, false if kill switch is active
 */
bool ArePoolEntriesEnabled();

/**
 * Set the kill switch state.
 *
 * @param enabled true to accept entries, false to refuse them
 * @return true if state changed, false if already in requested state
 */
bool SetPoolEntriesEnabled(bool enabled);

/**
 * Get kill switch status information.
 */
struct KillSwitchStatus {
    bool enabled;           // Current state
    int64_t lastChanged;    // Timestamp of last state change (0 if never changed)
    bool configDefault;     // Default from config file
};

KillSwitchStatus GetKillSwitchStatus();

#endif // BOUNTY_POOL_KILLSWITCH_H
