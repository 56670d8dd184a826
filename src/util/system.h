// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory resolution.
 */
#ifndef BOUNTY_UTIL_SYSTEM_H
#define BOUNTY_UTIL_SYSTEM_H

#include "fs.h"
#include "sync.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const BOUNTY_CONF_FILENAME;

const fs::path& GetDataDir();
/** Drop the cached data dir so the next GetDataDir() re-reads -datadir (tests). */
void ClearDatadirCache();
fs::path GetDefaultDataDir();
fs::path GetConfigFile(const std::string& confPath);

class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;
    std::vector<std::string> m_positional_args;

public:
    /**
     * Parse "-name=value" options; everything from the first argument not
     * starting with '-' on is kept as positional (command and its params).
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);
    bool ReadConfigFile(const std::string& confPath, std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    /** Positional arguments (the command and its parameters). */
    std::vector<std::string> GetPositionalArgs() const;

    void ClearArgs();
};

extern ArgsManager gArgs;

#endif // BOUNTY_UTIL_SYSTEM_H
