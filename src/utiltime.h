// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_UTILTIME_H
#define BOUNTY_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime - Current unix time in seconds (mockable for tests).
 *
 * Only used for audit timestamps and the recovery cooldown, never as an
 * input to outcome selection.
 */
int64_t GetTime();

/** For testing. Set e.g. with the setmocktime rpc, or -mocktime argument */
void SetMockTime(int64_t nMockTimeIn);
int64_t GetMockTime();

/**
 * ISO 8601 formatting is preferred. Use the FormatISO8601{DateTime,Date}
 * helper functions if possible.
 */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // BOUNTY_UTILTIME_H
