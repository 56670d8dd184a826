// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool.h"

#include "hash.h"

#include <algorithm>

std::string PoolStatusToString(PoolStatus status)
{
    switch (status) {
    case PoolStatus::ACTIVE: return "active";
    case PoolStatus::SELECTING: return "selecting";
    case PoolStatus::SETTLING: return "settling";
    case PoolStatus::CLOSED: return "closed";
    }
    return "unknown";
}

std::string PoolModeToString(PoolMode mode)
{
    switch (mode) {
    case PoolMode::RANDOM_SELECTION: return "random";
    case PoolMode::AI_DECISION: return "ai_decision";
    }
    return "unknown";
}

bool ParsePoolMode(const std::string& str, PoolMode& mode)
{
    if (str == "random") {
        mode = PoolMode::RANDOM_SELECTION;
        return true;
    }
    if (str == "ai_decision") {
        mode = PoolMode::AI_DECISION;
        return true;
    }
    return false;
}

std::string DecisionVerdictToString(DecisionVerdict verdict)
{
    return verdict == DecisionVerdict::PASS ? "pass" : "fail";
}

std::string ReceiptKindToString(ReceiptKind kind)
{
    return kind == ReceiptKind::ESCAPE_PLAN ? "escape_plan" : "outcome";
}

bool ParseDecisionVerdict(const std::string& str, DecisionVerdict& verdict)
{
    if (str == "pass") {
        verdict = DecisionVerdict::PASS;
        return true;
    }
    if (str == "fail") {
        verdict = DecisionVerdict::FAIL;
        return true;
    }
    return false;
}

bool IsValidStatusTransition(PoolStatus from, PoolStatus to)
{
    switch (from) {
    case PoolStatus::ACTIVE:
        return to == PoolStatus::SELECTING || to == PoolStatus::CLOSED;
    case PoolStatus::SELECTING:
        return to == PoolStatus::SETTLING;
    case PoolStatus::SETTLING:
        return to == PoolStatus::ACTIVE || to == PoolStatus::CLOSED;
    case PoolStatus::CLOSED:
        return false;
    }
    return false;
}

uint256 PoolConfig::GetPoolId() const
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << std::string("bountyledger/pool/v1") << *this;
    return ss.GetHash();
}

CAmount PoolLedger::GetRoundPot() const
{
    CAmount pot = roundContributions - roundRecovered;
    if (pot < 0) pot = 0;
    return std::min(pot, custodyBalance);
}

uint256 DecisionMessage::ComputeHash() const
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << poolId << roundNumber << static_cast<uint8_t>(verdict) << payoutAmount
       << winner << decisionAuthority << sessionId << timestamp;
    return ss.GetHash();
}

uint256 PoolOutcome::GetHash() const
{
    return SerializeHash(*this);
}
