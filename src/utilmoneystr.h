// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Parsing of amounts given in smallest units.
 */
#ifndef BOUNTY_UTILMONEYSTR_H
#define BOUNTY_UTILMONEYSTR_H

#include "amount.h"

#include <string>

bool ParseMoney(const std::string& str, CAmount& nRet);
bool ParseMoney(const char* pszIn, CAmount& nRet);

#endif // BOUNTY_UTILMONEYSTR_H
