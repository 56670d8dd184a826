// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BOUNTY_RPC_REGISTER_H
#define BOUNTY_RPC_REGISTER_H

/** These are in one header file to avoid creating tons of single-function
 * headers for everything under src/rpc/ */
class CRPCTable;

/** Register help */
void RegisterControlRPCCommands(CRPCTable& tableRPC);
/** Register pool read-only RPC commands (getpoolinfo, listentries, getoutcome, ...) */
void RegisterPoolRPCCommands(CRPCTable& tableRPC);
/** Register pool mutating RPC commands (createpool, submitentry, settle, recover, ...) */
void RegisterPoolAdminRPCCommands(CRPCTable& tableRPC);

static inline void RegisterAllCoreRPCCommands(CRPCTable& tableRPC)
{
    RegisterControlRPCCommands(tableRPC);
    RegisterPoolRPCCommands(tableRPC);
    RegisterPoolAdminRPCCommands(tableRPC);
}

#endif // BOUNTY_RPC_REGISTER_H
