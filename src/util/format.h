// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_UTIL_FORMAT_H
#define BOUNTY_UTIL_FORMAT_H

#include <tinyformat.h>

/** Format arguments and return the string (printf semantics, type safe). */
#define strprintf tfm::format

#endif // BOUNTY_UTIL_FORMAT_H
