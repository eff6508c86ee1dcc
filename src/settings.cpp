// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <settings.h>

#include <compiler/runner.h>
#include <httpclient.h>
#include <httpserver.h>
#include <util.h>

namespace scverify {

std::string CompilerBinaryName(Language language)
{
    return language == Language::VYPER ? "vyper" : "solc";
}

static std::optional<std::string> GetOptionalArg(const ArgsManager& args, const std::string& name)
{
    std::string value = args.GetArg(name, "");
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

static int GetIntArg(const ArgsManager& args, const std::string& name, int64_t def, int64_t min, int64_t max)
{
    std::string str = args.GetArg(name, std::to_string(def));
    int64_t value;
    if (!ParseInt64(str, &value) || value < min || value > max) {
        throw std::runtime_error(strprintf("Invalid -%s=%s: expected an integer between %d and %d", name.substr(1), str, min, max));
    }
    return (int)value;
}

static FetcherSettings ReadFetcherSettings(const ArgsManager& args, const std::string& lang, const std::string& defaultListURL)
{
    const std::string kind = args.GetArg("-" + lang + "fetcher", "list");
    FetcherSettings fetcher;
    if (kind == "list") {
        ListFetcherSettings list;
        list.list_url = args.GetArg("-" + lang + "listurl", defaultListURL);
        fetcher = list;
    } else if (kind == "s3") {
        S3FetcherSettings s3;
        s3.access_key = GetOptionalArg(args, "-" + lang + "s3accesskey");
        s3.secret_key = GetOptionalArg(args, "-" + lang + "s3secretkey");
        s3.region = GetOptionalArg(args, "-" + lang + "s3region");
        s3.endpoint = GetOptionalArg(args, "-" + lang + "s3endpoint");
        s3.bucket = args.GetArg("-" + lang + "s3bucket", "");
        fetcher = s3;
    } else {
        throw std::runtime_error(strprintf("Invalid -%sfetcher=%s: expected list or s3", lang, kind));
    }

    try {
        ValidateFetcherSettings(fetcher);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(strprintf("Invalid %s fetcher configuration: %s", lang, e.what()));
    }
    return fetcher;
}

static std::optional<LanguageSettings> ReadLanguageSettings(const ArgsManager& args, Language language, bool enabledByDefault,
                                                            const std::string& defaultDir, const std::string& defaultListURL)
{
    const std::string lang = LanguageName(language);
    if (!args.GetBoolArg("-" + lang, enabledByDefault)) {
        return std::nullopt;
    }

    std::string strError;
    std::string expr = args.GetArg("-" + lang + "refreshschedule", DEFAULT_REFRESH_SCHEDULE);
    std::optional<CronSchedule> schedule = CronSchedule::Parse(expr, &strError);
    if (!schedule) {
        throw std::runtime_error(strprintf("Invalid -%srefreshschedule: %s", lang, strError));
    }

    std::string dir = args.GetArg("-" + lang + "compilersdir", "");
    fs::path compilersDir = dir.empty() ? fs::temp_directory_path() / defaultDir : fs::path(dir);

    LanguageSettings settings{language, compilersDir, *schedule, ReadFetcherSettings(args, lang, defaultListURL)};
    LogPrint(BCLog::CONFIG, "%s enabled: compilers in %s, refresh '%s'\n", lang, compilersDir.string(), expr);
    return settings;
}

VerificationSettings VerificationSettings::FromArgs(const ArgsManager& args)
{
    VerificationSettings settings;
    settings.server.bind = args.GetArg("-bind", DEFAULT_BIND);
    settings.server.port = GetIntArg(args, "-port", DEFAULT_PORT, 1, 65535);
    settings.server.threads = GetIntArg(args, "-httpthreads", DEFAULT_HTTP_THREADS, 1, 1024);
    settings.server.timeout = GetIntArg(args, "-httptimeout", DEFAULT_HTTP_SERVER_TIMEOUT, 1, 3600);

    settings.solidity = ReadLanguageSettings(args, Language::SOLIDITY, true, "compilers", DEFAULT_SOLIDITY_LIST_URL);
    settings.vyper = ReadLanguageSettings(args, Language::VYPER, false, "vyper-compilers", DEFAULT_VYPER_LIST_URL);
    if (!settings.solidity && !settings.vyper) {
        throw std::runtime_error("At least one of -solidity and -vyper must be enabled");
    }

    settings.retry.max_retries = GetIntArg(args, "-fetchretries", DEFAULT_FETCH_RETRIES, 0, 100);
    settings.retry.backoff = std::chrono::milliseconds(GetIntArg(args, "-fetchbackoff", DEFAULT_FETCH_BACKOFF_MS, 0, 3600 * 1000));
    settings.compiler_timeout = std::chrono::seconds(GetIntArg(args, "-compilertimeout", DEFAULT_COMPILER_TIMEOUT, 0, 24 * 3600));

    settings.middleware_url = GetOptionalArg(args, "-middlewareurl");
    if (settings.middleware_url) {
        URLParts parts;
        if (!ParseURL(*settings.middleware_url, parts)) {
            throw std::runtime_error(strprintf("Invalid -middlewareurl=%s", *settings.middleware_url));
        }
    }
    settings.middleware_policy = args.GetBoolArg("-middlewarefailclosed", DEFAULT_MIDDLEWARE_FAIL_CLOSED)
        ? MiddlewarePolicy::FAIL_CLOSED : MiddlewarePolicy::FAIL_OPEN;
    return settings;
}

std::string SettingsHelpMessage()
{
    std::string strUsage = HelpMessageGroup("Server options:");
    strUsage += HelpMessageOpt("-bind=<addr>", strprintf("Bind to given address (default: %s)", DEFAULT_BIND));
    strUsage += HelpMessageOpt("-port=<port>", strprintf("Listen for HTTP requests on <port> (default: %u)", DEFAULT_PORT));
    strUsage += HelpMessageOpt("-httpthreads=<n>", strprintf("Number of threads serving HTTP requests (default: %d)", DEFAULT_HTTP_THREADS));
    strUsage += HelpMessageOpt("-httptimeout=<n>", strprintf("Timeout in seconds for HTTP requests (default: %d)", DEFAULT_HTTP_SERVER_TIMEOUT));

    for (Language language : {Language::SOLIDITY, Language::VYPER}) {
        const std::string lang = LanguageName(language);
        strUsage += HelpMessageGroup(LanguageToString(language) + " options:");
        strUsage += HelpMessageOpt("-" + lang, strprintf("Enable %s verification (default: %u)", LanguageToString(language), language == Language::SOLIDITY));
        strUsage += HelpMessageOpt("-" + lang + "compilersdir=<dir>", "Directory compilers are downloaded to (default: a directory under the system temporary directory)");
        strUsage += HelpMessageOpt("-" + lang + "refreshschedule=<cron>", strprintf("Schedule of compiler list refreshes, with seconds field (default: %s)", DEFAULT_REFRESH_SCHEDULE));
        strUsage += HelpMessageOpt("-" + lang + "fetcher=<list|s3>", "Where compilers come from (default: list)");
        strUsage += HelpMessageOpt("-" + lang + "listurl=<url>", strprintf("Compiler list URL (default: %s)",
            language == Language::SOLIDITY ? DEFAULT_SOLIDITY_LIST_URL : DEFAULT_VYPER_LIST_URL));
        strUsage += HelpMessageOpt("-" + lang + "s3bucket=<name>", "S3 bucket holding the compilers");
        strUsage += HelpMessageOpt("-" + lang + "s3region=<region>", "S3 region");
        strUsage += HelpMessageOpt("-" + lang + "s3endpoint=<url>", "S3 endpoint URL, for S3 compatible storage");
        strUsage += HelpMessageOpt("-" + lang + "s3accesskey=<key>", "S3 access key (anonymous access if unset)");
        strUsage += HelpMessageOpt("-" + lang + "s3secretkey=<key>", "S3 secret key");
    }

    strUsage += HelpMessageGroup("Verification options:");
    strUsage += HelpMessageOpt("-fetchretries=<n>", strprintf("Retries of a compiler download that failed for network reasons (default: %d)", DEFAULT_FETCH_RETRIES));
    strUsage += HelpMessageOpt("-fetchbackoff=<ms>", strprintf("Delay before the first download retry, doubled for each further one (default: %d)", DEFAULT_FETCH_BACKOFF_MS));
    strUsage += HelpMessageOpt("-compilertimeout=<n>", strprintf("Kill compilers running longer than <n> seconds, 0 to disable (default: %d)", DEFAULT_COMPILER_TIMEOUT));
    strUsage += HelpMessageOpt("-middlewareurl=<url>", "POST every verification success as JSON to <url>");
    strUsage += HelpMessageOpt("-middlewarefailclosed", strprintf("Fail verification requests when the middleware fails (default: %u)", DEFAULT_MIDDLEWARE_FAIL_CLOSED));
    return strUsage;
}

} // namespace scverify
