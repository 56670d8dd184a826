// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "clientversion.h"
#include "logging.h"
#include "pool/anchorview.h"
#include "pool/engine.h"
#include "pool/killswitch.h"
#include "pool/pooldb.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "util/system.h"

#include <memory>

static std::unique_ptr<CAnchorView> g_anchor_view;

static std::string HelpMessageOpt(const std::string& option, const std::string& message)
{
    return "  " + option + "\n      " + message + "\n";
}

std::string HelpMessage()
{
    std::string strUsage = "Options:\n";
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-version", "Print version and exit");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", BOUNTY_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");
    strUsage += HelpMessageOpt("-dbcache=<n>", strprintf("Database cache size in MiB (%d to %d, default: %d)",
                                                       MIN_DB_CACHE, MAX_DB_CACHE, DEFAULT_DB_CACHE));
    strUsage += HelpMessageOpt("-anchordepth=<n>", strprintf("Platform headers between the close of entries and the randomness anchor (default: %u)",
                                                           DEFAULT_ANCHOR_DEPTH));
    strUsage += HelpMessageOpt("-decisiontolerance=<n>", strprintf("Seconds an AI decision timestamp may differ from the local clock (default: %d)",
                                                                 DEFAULT_DECISION_TOLERANCE));
    strUsage += HelpMessageOpt("-poolsenabled", "Accept new pool entries (default: 1)");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0). Categories: " + ListLogCategories());
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console instead of debug.log file");
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    return strUsage;
}

void InitLogging()
{
    LogInstance().m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    LogInstance().m_print_to_file = gArgs.GetBoolArg("-debuglogfile", true) && !LogInstance().m_print_to_console;
    LogInstance().m_file_path = GetDataDir() / DEFAULT_DEBUGLOGFILE;
    LogInstance().m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (cat == "0" || cat == "none") {
            continue;
        }
        if (!LogInstance().EnableCategory(cat)) {
            LogPrintf("Unsupported logging category -debug=%s.\n", cat);
        }
    }
}

bool AppInitParameterInteraction(std::string& strError)
{
    const int64_t nCache = gArgs.GetArg("-dbcache", DEFAULT_DB_CACHE);
    if (nCache < MIN_DB_CACHE || nCache > MAX_DB_CACHE) {
        strError = strprintf("Invalid -dbcache=%d (must be %d to %d)", nCache, MIN_DB_CACHE, MAX_DB_CACHE);
        return false;
    }

    const int64_t nDepth = gArgs.GetArg("-anchordepth", (int64_t)DEFAULT_ANCHOR_DEPTH);
    if (nDepth < 1 || nDepth > 1000) {
        strError = strprintf("Invalid -anchordepth=%d (must be 1 to 1000)", nDepth);
        return false;
    }

    const int64_t nTolerance = gArgs.GetArg("-decisiontolerance", DEFAULT_DECISION_TOLERANCE);
    if (nTolerance < 0 || nTolerance > 7 * 24 * 60 * 60) {
        strError = strprintf("Invalid -decisiontolerance=%d (must be 0 to 604800)", nTolerance);
        return false;
    }
    return true;
}

bool AppInitMain(std::string& strError)
{
    if (LogInstance().m_print_to_file) {
        if (!LogInstance().OpenDebugLog()) {
            strError = strprintf("Could not open debug log file %s", LogInstance().m_file_path.string());
            return false;
        }
    }

    LogPrintf("%s\n", FormatFullVersion());
    LogPrintf("Using data directory %s\n", GetDataDir().string());

    const size_t nCacheSize = (size_t)gArgs.GetArg("-dbcache", DEFAULT_DB_CACHE) << 20;
    if (!InitPoolDB(nCacheSize)) {
        strError = "Error opening pool database";
        return false;
    }

    InitKillSwitch();

    g_anchor_view = std::make_unique<CAnchorViewDB>(*g_pooldb);
    const uint32_t nDepth = (uint32_t)gArgs.GetArg("-anchordepth", (int64_t)DEFAULT_ANCHOR_DEPTH);
    const int64_t nTolerance = gArgs.GetArg("-decisiontolerance", DEFAULT_DECISION_TOLERANCE);
    g_pool_engine = std::make_unique<CPoolEngine>(*g_pooldb, *g_anchor_view, nDepth, nTolerance);

    RegisterAllCoreRPCCommands(tableRPC);

    LogPrintf("Pool engine started (anchor depth %u, decision tolerance %ds, anchor tip %u)\n",
              nDepth, nTolerance, g_anchor_view->GetTipHeight());
    return true;
}

void Shutdown()
{
    g_pool_engine.reset();
    g_anchor_view.reset();
    if (g_pooldb) {
        g_pooldb->Sync();
        g_pooldb.reset();
    }
    LogPrint(BCLog::DB, "Shutdown: done\n");
}
