// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <init.h>

#include <compiler/fetcher.h>
#include <compiler/manager.h>
#include <compiler/runner.h>
#include <httpclient.h>
#include <httpserver.h>
#include <httpserver/verification_handlers.h>
#include <settings.h>
#include <threadinterrupt.h>
#include <util.h>
#include <verifier/client.h>
#include <verifier/webhook_middleware.h>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <memory>
#include <optional>
#include <signal.h>
#include <vector>

std::atomic<bool> fRequestShutdown(false);

//! Cancels running compilations and retry waits on shutdown
static CThreadInterrupt g_shutdown_interrupt;
static std::optional<scverify::VerificationSettings> g_settings;
static std::vector<std::shared_ptr<scverify::CompilerManager>> g_managers;
static std::vector<std::shared_ptr<scverify::Client>> g_clients;

void StartShutdown()
{
    fRequestShutdown = true;
}
bool ShutdownRequested()
{
    return fRequestShutdown;
}

static void HandleSIGTERM(int)
{
    fRequestShutdown = true;
}

static bool InitError(const std::string& str)
{
    LogPrintf("Error: %s\n", str);
    fprintf(stderr, "Error: %s\n", str.c_str());
    return false;
}

void Interrupt()
{
    g_shutdown_interrupt();
    InterruptHTTPServer();
}

void Shutdown()
{
    LogPrintf("%s: In progress...\n", __func__);
    scverify::UnregisterVerificationHandlers();
    StopHTTPServer();
    for (const auto& manager : g_managers) {
        manager->Stop();
    }
    g_clients.clear();
    g_managers.clear();
    LogPrintf("%s: done\n", __func__);
    CloseDebugLog();
}

std::string HelpMessage()
{
    std::string strUsage = HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-version", "Print version and exit");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s, or $%s)", SCVERIFY_CONF_FILENAME, SCVERIFY_CONF_ENV));

    strUsage += HelpMessageGroup("Logging options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0, supplying <category> is optional). "
        "If <category> is not supplied or if <category> = 1, output all debugging information. <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-debugexclude=<category>", "Exclude debugging information for a category.");
    strUsage += HelpMessageOpt("-debuglogfile=<file>", "Also append log output to <file>");
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console (default: 1)");

    strUsage += scverify::SettingsHelpMessage();
    return strUsage;
}

std::string LicenseInfo()
{
    return "Copyright (C) 2026 The scverify developers\n\n"
           "This is experimental software.\n"
           "Distributed under the MIT software license, see the accompanying file COPYING\n"
           "or <https://opensource.org/licenses/MIT>.\n";
}

void InitLogging()
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", true);
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    std::string logFile = gArgs.GetArg("-debuglogfile", "");
    if (!logFile.empty() && !OpenDebugLog(fs::path(logFile))) {
        fprintf(stderr, "Could not open debug log file %s\n", logFile.c_str());
    }
    LogPrintf("scverify version %s\n", PACKAGE_VERSION);
}

bool AppInitBasicSetup()
{
    // Clean shutdown on SIGTERM
    struct sigaction sa;
    sa.sa_handler = HandleSIGTERM;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    // Ignore SIGPIPE, otherwise it will bring the daemon down if the client closes unexpectedly
    signal(SIGPIPE, SIG_IGN);
    return true;
}

bool AppInitParameterInteraction()
{
    // ********************************************************* Step 1: logging categories

    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");

        if (std::none_of(categories.begin(), categories.end(),
            [](std::string cat){return cat == "0" || cat == "none";})) {
            for (const auto& cat : categories) {
                uint32_t flag = 0;
                if (!GetLogCategory(&flag, &cat)) {
                    LogPrintf("Unsupported logging category %s=%s.\n", "-debug", cat);
                    continue;
                }
                logCategories |= flag;
            }
        }
    }

    // Now remove the logging categories which were explicitly excluded
    for (const std::string& cat : gArgs.GetArgs("-debugexclude")) {
        uint32_t flag = 0;
        if (!GetLogCategory(&flag, &cat)) {
            LogPrintf("Unsupported logging category %s=%s.\n", "-debugexclude", cat);
            continue;
        }
        logCategories &= ~flag;
    }

    // ********************************************************* Step 2: verification settings

    try {
        g_settings = scverify::VerificationSettings::FromArgs(gArgs);
    } catch (const std::runtime_error& e) {
        return InitError(e.what());
    }
    return true;
}

static std::shared_ptr<scverify::Client> MakeClient(const scverify::LanguageSettings& language,
                                                    const scverify::VerificationSettings& settings,
                                                    const std::shared_ptr<HTTPClient>& http)
{
    const std::string name = scverify::LanguageToString(language.language);
    std::shared_ptr<scverify::Fetcher> fetcher = scverify::MakeFetcher(
        language.fetcher, scverify::CompilerBinaryName(language.language), http);

    scverify::CompilerManagerOptions options(language.refresh_schedule);
    options.retry = settings.retry;
    std::shared_ptr<scverify::CompilerManager> manager = std::make_shared<scverify::CompilerManager>(
        name, language.compilers_dir, scverify::CompilerBinaryName(language.language), fetcher, options);
    g_managers.push_back(manager);

    std::shared_ptr<scverify::Middleware> middleware;
    if (settings.middleware_url) {
        middleware = std::make_shared<scverify::WebhookMiddleware>(*settings.middleware_url, http);
    }
    std::shared_ptr<scverify::CompilerRunner> runner = std::make_shared<scverify::LocalCompilerRunner>(settings.compiler_timeout);
    return std::make_shared<scverify::Client>(language.language, manager, runner, middleware, settings.middleware_policy);
}

bool AppInitMain()
{
    assert(g_settings);
    const scverify::VerificationSettings& settings = *g_settings;

    // ********************************************************* Step 3: compilers

    std::shared_ptr<HTTPClient> http;
    try {
        http = std::make_shared<EventHTTPClient>();
        for (const auto& language : {settings.solidity, settings.vyper}) {
            if (language) {
                g_clients.push_back(MakeClient(*language, settings, http));
            }
        }
    } catch (const std::exception& e) {
        return InitError(strprintf("Unable to start compiler managers: %s", e.what()));
    }

    // ********************************************************* Step 4: HTTP server

    if (!InitHTTPServer(settings.server)) {
        return InitError("Unable to start HTTP server. See debug log for details.");
    }
    scverify::RegisterHealthHandler();
    for (const auto& client : g_clients) {
        scverify::RegisterVerificationHandlers(client, &g_shutdown_interrupt);
    }
    if (!StartHTTPServer()) {
        return InitError("Unable to start HTTP server. See debug log for details.");
    }

    LogPrintf("Listening on %s:%d\n", settings.server.bind, settings.server.port);
    return true;
}
