// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_SETTINGS_H
#define SCVERIFY_SETTINGS_H

#include <compiler/cron.h>
#include <compiler/fetcher.h>
#include <compiler/input.h>
#include <compiler/manager.h>
#include <fs.h>
#include <verifier/client.h>

#include <chrono>
#include <optional>
#include <string>

class ArgsManager;

namespace scverify {

static const char* const DEFAULT_BIND = "0.0.0.0";
static const int DEFAULT_PORT = 8043;
static const char* const DEFAULT_SOLIDITY_LIST_URL = "https://solc-bin.ethereum.org/linux-amd64/list.json";
static const char* const DEFAULT_VYPER_LIST_URL = "https://raw.githubusercontent.com/blockscout/solc-bin/main/vyper.list.json";
static const bool DEFAULT_MIDDLEWARE_FAIL_CLOSED = false;

struct ServerSettings
{
    std::string bind;
    int port;
    int threads;
    int timeout;
};

/** Everything needed to run verification for one language */
struct LanguageSettings
{
    Language language;
    fs::path compilers_dir;
    CronSchedule refresh_schedule;
    FetcherSettings fetcher;
};

/** Typed and validated daemon configuration */
struct VerificationSettings
{
    ServerSettings server;
    //! unset when the language is disabled
    std::optional<LanguageSettings> solidity;
    std::optional<LanguageSettings> vyper;
    RetryPolicy retry;
    std::chrono::seconds compiler_timeout;
    std::optional<std::string> middleware_url;
    MiddlewarePolicy middleware_policy;

    /**
     * Read and validate the configuration.
     * @throws std::runtime_error naming the offending option
     */
    static VerificationSettings FromArgs(const ArgsManager& args);
};

/** Binary file name inside a version directory */
std::string CompilerBinaryName(Language language);

/** Help text for the options read by VerificationSettings::FromArgs */
std::string SettingsHelpMessage();

} // namespace scverify

#endif // SCVERIFY_SETTINGS_H
