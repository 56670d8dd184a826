// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "logging.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>

const char * const BOUNTY_CONF_FILENAME = "bountyledger.conf";

ArgsManager gArgs;

static fs::path pathCached;
static RecursiveMutex csPathCached;

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue.c_str()) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length() > 3 && strKey[0] == '-' && strKey[1] == 'n' && strKey[2] == 'o') {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

static std::string TrimString(const std::string& str)
{
    const std::string pattern = " \f\n\r\t\v";
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    m_override_args.clear();
    m_positional_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        if (key.empty() || key[0] != '-') {
            for (; i < argc; i++) {
                m_positional_args.emplace_back(argv[i]);
            }
            break;
        }

        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        if (key.length() <= 1) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        InterpretNegativeSetting(key, val);
        m_override_args[key].push_back(val);
    }

    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& confPath, std::string& error)
{
    {
        LOCK(cs_args);
        m_config_args.clear();
    }

    fs::path path = GetConfigFile(confPath);
    std::ifstream stream(path.string());
    if (!stream.good()) {
        // No config file is OK
        return true;
    }

    std::string str;
    int linenr = 0;
    while (std::getline(stream, str)) {
        ++linenr;
        size_t pos;
        if ((pos = str.find('#')) != std::string::npos) {
            str = str.substr(0, pos);
        }
        str = TrimString(str);
        if (str.empty()) continue;

        if ((pos = str.find('=')) == std::string::npos) {
            error = strprintf("parse error on line %i: %s", linenr, str);
            return false;
        }
        std::string key = "-" + TrimString(str.substr(0, pos));
        std::string value = TrimString(str.substr(pos + 1));
        InterpretNegativeSetting(key, value);

        LOCK(cs_args);
        m_config_args[key].push_back(value);
    }

    // If datadir is changed in .conf file:
    ClearDatadirCache();
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) return it->second;
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return m_override_args.count(strArg) || m_config_args.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    // Command line overrides the config file; the last occurrence wins.
    std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return strDefault;
    return values.back();
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return nDefault;
    return strtoll(values.back().c_str(), nullptr, 10);
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return fDefault;
    return InterpretBool(values.back());
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    m_override_args[strArg] = {strValue};
}

std::vector<std::string> ArgsManager::GetPositionalArgs() const
{
    LOCK(cs_args);
    return m_positional_args;
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    m_override_args.clear();
    m_config_args.clear();
    m_positional_args.clear();
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.bountyledger
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".bountyledger";
}

const fs::path& GetDataDir()
{
    LOCK(csPathCached);

    if (!pathCached.empty())
        return pathCached;

    std::string datadir = gArgs.GetArg("-datadir", "");
    if (!datadir.empty()) {
        pathCached = fs::absolute(datadir);
    } else {
        pathCached = GetDefaultDataDir();
    }

    fs::create_directories(pathCached);
    return pathCached;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    pathCached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_absolute())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}
