// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_AMOUNT_H
#define BOUNTY_AMOUNT_H

#include <stdint.h>

/** Amount in smallest currency units (1:1, no COIN scaling) */
typedef int64_t CAmount;

/**
 * No single custody balance may exceed this. Chosen so that
 * amount * 100 (percent arithmetic) never overflows int64_t.
 */
static const CAmount MAX_MONEY = 90000000000000000LL;

inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // BOUNTY_AMOUNT_H
