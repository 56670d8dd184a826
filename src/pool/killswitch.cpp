// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/killswitch.h"
#include "logging.h"
#include "util/system.h"
#include "utiltime.h"

// Global atomic flag - default to enabled
std::atomic<bool> g_pool_entries_enabled{true};

// Track last change timestamp
static std::atomic<int64_t> g_last_change_timestamp{0};

// Store config default for status reporting
static bool g_config_default = true;

void InitKillSwitch()
{
    g_config_default = gArgs.GetBoolArg("-poolsenabled", true);
    g_pool_entries_enabled.store(g_config_default);
    g_last_change_timestamp.store(0);

    if (!g_config_default) {
        LogPrintf("KILLSWITCH: pool entries DISABLED by config (-poolsenabled=0)\n");
    } else {
        LogPrint(BCLog::POOL, "KILLSWITCH: pool entries enabled (default)\n");
    }
}

bool ArePoolEntriesEnabled()
{
    return g_pool_entries_enabled.load();
}

bool SetPoolEntriesEnabled(bool enabled)
{
    bool expected = !enabled;
    if (g_pool_entries_enabled.compare_exchange_strong(expected, enabled)) {
        g_last_change_timestamp.store(GetTime());

        if (enabled) {
            LogPrintf("KILLSWITCH: pool entries ENABLED (kill switch deactivated)\n");
        } else {
            LogPrintf("KILLSWITCH: pool entries DISABLED (kill switch activated)\n");
        }
        return true;
    }
    // Already in requested state
    return false;
}

KillSwitchStatus GetKillSwitchStatus()
{
    KillSwitchStatus status;
    status.enabled = g_pool_entries_enabled.load();
    status.lastChanged = g_last_change_timestamp.load();
    status.configDefault = g_config_default;
    return status;
}
