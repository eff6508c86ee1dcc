// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_COMPILER_MANAGER_H
#define SCVERIFY_COMPILER_MANAGER_H

/**
 * @file manager.h
 * @brief Per-language compiler management
 *
 * Ties a cache to its refresher and applies the retry policy to transient
 * download failures.
 */

#include <compiler/cache.h>
#include <compiler/cron.h>
#include <compiler/fetcher.h>
#include <compiler/refresher.h>
#include <threadinterrupt.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace scverify {

static const int DEFAULT_FETCH_RETRIES = 0;
static const int64_t DEFAULT_FETCH_BACKOFF_MS = 1000;

/** How often a FETCH_UNAVAILABLE download is retried before giving up */
struct RetryPolicy
{
    int max_retries;
    //! wait before the first retry, doubled for each further one
    std::chrono::milliseconds backoff;

    RetryPolicy() : max_retries(DEFAULT_FETCH_RETRIES), backoff(DEFAULT_FETCH_BACKOFF_MS) {}
};

struct CompilerManagerOptions
{
    CronSchedule schedule;
    RetryPolicy retry;
    //! list versions once before the schedule takes over
    bool refresh_on_start;

    explicit CompilerManagerOptions(CronSchedule scheduleIn)
        : schedule(std::move(scheduleIn)), refresh_on_start(true) {}
};

/**
 * Compiler cache plus its version refresher for one language. The refresher
 * runs from construction until Stop() or destruction.
 */
class CompilerManager
{
public:
    CompilerManager(const std::string& name, const fs::path& dir, const std::string& binaryName,
                    std::shared_ptr<Fetcher> fetcher, const CompilerManagerOptions& options);
    ~CompilerManager();

    CompilerManager(const CompilerManager&) = delete;
    CompilerManager& operator=(const CompilerManager&) = delete;

    /**
     * Installed compiler for a version, fetched on first use.
     * @throws FetchError, after the retry policy is exhausted for FETCH_UNAVAILABLE
     */
    Compiler GetCompiler(const CompilerVersion& version);

    /** Known versions, newest first */
    std::vector<CompilerVersion> AllVersions() const;

    void Stop();

private:
    const std::string name_;
    const RetryPolicy retry_;
    CompilerCache cache_;
    VersionRefresher refresher_;
    //! aborts retry backoff waits on shutdown
    CThreadInterrupt shutdown_;
};

} // namespace scverify

#endif // SCVERIFY_COMPILER_MANAGER_H
