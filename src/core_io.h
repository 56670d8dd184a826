// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_CORE_IO_H
#define BOUNTY_CORE_IO_H

#include "amount.h"

#include <string>

class UniValue;
struct FeeSplitEntry;
struct PoolEntry;
struct PoolLedger;
struct PoolOutcome;
struct PoolReceipt;
struct PlatformAnchor;
struct RecoveryAction;

// core_write.cpp
std::string FormatAmount(CAmount amount);
UniValue FeeSplitToUniv(const FeeSplitEntry& split);
void PoolToUniv(const PoolLedger& pool, UniValue& entry);
void EntryToUniv(const PoolEntry& poolEntry, UniValue& entry);
void OutcomeToUniv(const PoolOutcome& outcome, UniValue& entry);
void ReceiptToUniv(const PoolReceipt& receipt, UniValue& entry);
void RecoveryToUniv(const RecoveryAction& action, UniValue& entry);
void AnchorToUniv(const PlatformAnchor& anchor, UniValue& entry);

#endif // BOUNTY_CORE_IO_H
