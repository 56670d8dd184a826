// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_INIT_H
#define BOUNTY_INIT_H

#include <cstdint>
#include <string>

//! Default for -dbcache (MiB)
static const int64_t DEFAULT_DB_CACHE = 8;
//! -dbcache bounds (MiB)
static const int64_t MIN_DB_CACHE = 1;
static const int64_t MAX_DB_CACHE = 1024;

/** Help text for the command line options */
std::string HelpMessage();

/** Logging flags (-debug, -printtoconsole, -logtimestamps) */
void InitLogging();

/**
 * Validate option values that do not depend on the database.
 * @return false with the reason in strError
 */
bool AppInitParameterInteraction(std::string& strError);

/**
 * Open the pool database and start the engine.
 * @pre Parameters are parsed and the config file is read.
 */
bool AppInitMain(std::string& strError);

/** Flush and release the engine, the anchor view and the database */
void Shutdown();

#endif // BOUNTY_INIT_H
