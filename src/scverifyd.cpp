// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <init.h>
#include <util.h>
#include <utiltime.h>

#include <stdio.h>
#include <stdlib.h>

/* Introduction text for doxygen: */

/*! \mainpage Developer documentation
 *
 * \section intro_sec Introduction
 *
 * scverify checks that published contract source code, compiled with a given
 * compiler version, reproduces the bytecode deployed on chain. It downloads
 * and caches compiler releases and serves verification requests over HTTP.
 */

static void WaitForShutdown()
{
    while (!ShutdownRequested())
    {
        MilliSleep(200);
    }
    Interrupt();
}

//////////////////////////////////////////////////////////////////////////////
//
// Start
//
static bool AppInit(int argc, char* argv[])
{
    bool fRet = false;

    //
    // Parameters
    //
    gArgs.ParseParameters(argc, argv);

    // Process help and version before taking care about configuration
    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help") || gArgs.IsArgSet("-version"))
    {
        std::string strUsage = strprintf("scverify daemon version %s\n", PACKAGE_VERSION);

        if (gArgs.IsArgSet("-version"))
        {
            strUsage += LicenseInfo();
        }
        else
        {
            strUsage += "\nUsage:\n  scverifyd [options]                     Start scverify daemon\n";
            strUsage += "\n" + HelpMessage();
        }

        fprintf(stdout, "%s", strUsage.c_str());
        return true;
    }

    try
    {
        std::string confPath = gArgs.GetArg("-conf", "");
        if (confPath.empty()) {
            const char* env = getenv(SCVERIFY_CONF_ENV);
            confPath = env ? env : SCVERIFY_CONF_FILENAME;
        }
        gArgs.ReadConfigFile(confPath);
    } catch (const std::exception& e) {
        fprintf(stderr,"Error reading configuration file: %s\n", e.what());
        return false;
    }

    // Positional arguments are not supported
    for (int i = 1; i < argc; i++) {
        if (argv[i][0] != '-') {
            fprintf(stderr, "Error: Unexpected argument '%s'. scverifyd takes only options.\n", argv[i]);
            return false;
        }
    }

    try
    {
        InitLogging();
        if (!AppInitBasicSetup())
        {
            // InitError will have been called with detailed error, which ends up on console
            return false;
        }
        if (!AppInitParameterInteraction())
        {
            // InitError will have been called with detailed error, which ends up on console
            return false;
        }
        fRet = AppInitMain();
    }
    catch (const std::exception& e) {
        PrintExceptionContinue(&e, "AppInit()");
    }

    if (!fRet)
    {
        Interrupt();
    } else {
        WaitForShutdown();
    }
    Shutdown();

    return fRet;
}

int main(int argc, char* argv[])
{
    return (AppInit(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE);
}
