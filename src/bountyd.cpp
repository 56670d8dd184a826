// Copyright (c) 2026 The BountyLedger developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "clientversion.h"
#include "init.h"
#include "logging.h"
#include "rpc/client.h"
#include "rpc/server.h"
#include "util/system.h"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include <univalue.h>

static const int CONTINUE_EXECUTION = -1;

static int AppInitRPC(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    if (argc < 2 || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help") || gArgs.IsArgSet("-version")) {
        std::string strUsage = FormatFullVersion() + "\n";
        if (!gArgs.IsArgSet("-version")) {
            strUsage += "\nUsage:  bountyd [options] <command> [params]  Run one pool command against the ledger\n"
                        "  bountyd [options] help                       List commands\n"
                        "  bountyd [options] help <command>             Get help for a command\n\n";
            strUsage += HelpMessage();
        }
        fprintf(stdout, "%s", strUsage.c_str());
        return EXIT_SUCCESS;
    }
    if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", BOUNTY_CONF_FILENAME), error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    return CONTINUE_EXECUTION;
}

static int CommandLineRPC()
{
    std::vector<std::string> args = gArgs.GetPositionalArgs();
    if (args.empty()) {
        fprintf(stderr, "error: too few parameters (need at least command)\n");
        return EXIT_FAILURE;
    }

    std::string strPrint;
    int nRet = 0;
    try {
        JSONRPCRequest request;
        request.strMethod = args[0];
        request.params = RPCConvertValues(request.strMethod, std::vector<std::string>(args.begin() + 1, args.end()));
        request.id = 1;

        const UniValue result = tableRPC.execute(request);
        if (result.isNull())
            strPrint = "";
        else if (result.isStr())
            strPrint = result.get_str();
        else
            strPrint = result.write(2);
    } catch (const UniValue& objError) {
        // Pool rejections and parameter errors arrive as a JSON-RPC error object
        const UniValue& errCode = find_value(objError, "code");
        const UniValue& errMsg = find_value(objError, "message");
        if (errCode.isNum()) {
            strPrint = strprintf("error code: %d\n", errCode.get_int());
        }
        if (errMsg.isStr()) {
            strPrint += "error message:\n" + errMsg.get_str() + "\n";
        }
        strPrint += objError.write(2);
        nRet = abs(errCode.isNum() ? errCode.get_int() : 1);
        LogPrint(BCLog::RPC, "%s failed: %s\n", args[0], errMsg.isStr() ? errMsg.get_str() : objError.write());
    } catch (const std::exception& e) {
        strPrint = std::string("error: ") + e.what();
        nRet = EXIT_FAILURE;
    }

    if (strPrint != "") {
        fprintf((nRet == 0 ? stdout : stderr), "%s\n", strPrint.c_str());
    }
    return nRet > 255 ? EXIT_FAILURE : nRet;
}

int main(int argc, char* argv[])
{
    int ret = AppInitRPC(argc, argv);
    if (ret != CONTINUE_EXECUTION)
        return ret;

    std::string strError;
    try {
        InitLogging();
        if (!AppInitParameterInteraction(strError) || !AppInitMain(strError)) {
            fprintf(stderr, "Error: %s\n", strError.c_str());
            Shutdown();
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        Shutdown();
        return EXIT_FAILURE;
    }

    ret = CommandLineRPC();
    Shutdown();
    return ret;
}
