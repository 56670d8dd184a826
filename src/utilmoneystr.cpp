// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "utilmoneystr.h"

#include <cctype>
#include <cstdlib>

bool ParseMoney(const std::string& str, CAmount& nRet)
{
    return ParseMoney(str.c_str(), nRet);
}

bool ParseMoney(const char* pszIn, CAmount& nRet)
{
    std::string strValue;
    const char* p = pszIn;

    // Skip leading whitespace
    while (isspace((unsigned char)*p))
        p++;

    // Parse digits
    for (; *p; p++) {
        if (isspace((unsigned char)*p))
            break;
        if (!isdigit((unsigned char)*p))
            return false;
        strValue.insert(strValue.end(), *p);
    }

    // Skip trailing whitespace
    for (; *p; p++)
        if (!isspace((unsigned char)*p))
            return false;

    if (strValue.empty() || strValue.size() > 17) // MAX_MONEY has 17 digits
        return false;

    CAmount nValue = strtoll(strValue.c_str(), nullptr, 10);
    if (!MoneyRange(nValue))
        return false;

    nRet = nValue;
    return true;
}
