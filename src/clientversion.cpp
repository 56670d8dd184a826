// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "clientversion.h"

#include "util/format.h"

/**
 * Name of client reported in the log and in `bountyd -version`.
 */
const std::string CLIENT_NAME("BountyLedger");

static std::string FormatVersion(int nVersion)
{
    return strprintf("%d.%d.%d", nVersion / 1000000, (nVersion / 10000) % 100, (nVersion / 100) % 100);
}

std::string FormatFullVersion()
{
    return CLIENT_NAME + " v" + FormatVersion(CLIENT_VERSION);
}
