// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_COMPILER_REFRESHER_H
#define SCVERIFY_COMPILER_REFRESHER_H

/**
 * @file refresher.h
 * @brief Background refresh of the known compiler versions
 */

#include <compiler/cache.h>
#include <compiler/cron.h>
#include <compiler/fetcher.h>
#include <threadinterrupt.h>

#include <memory>
#include <string>
#include <thread>

namespace scverify {

/**
 * Background thread re-listing the fetcher's versions on a cron schedule and
 * adding new ones to the cache index. Versions are never removed. A failing
 * tick is logged and the next tick tries again.
 */
class VersionRefresher
{
public:
    VersionRefresher(std::string name, std::shared_ptr<Fetcher> fetcher, CompilerCache& cache, CronSchedule schedule);
    ~VersionRefresher();

    VersionRefresher(const VersionRefresher&) = delete;
    VersionRefresher& operator=(const VersionRefresher&) = delete;

    void Start();
    /** Interrupt the schedule wait and join the thread */
    void Stop();

    /**
     * Run one refresh right away.
     * @param[out] added number of versions that were new, if non-null
     * @return false if listing failed (the error is logged)
     */
    bool RefreshOnce(size_t* added = nullptr);

private:
    void ThreadRefresh();

    const std::string name_;
    std::shared_ptr<Fetcher> fetcher_;
    CompilerCache& cache_;
    const CronSchedule schedule_;
    const std::string threadName_;

    CThreadInterrupt interrupt_;
    std::thread thread_;
};

} // namespace scverify

#endif // SCVERIFY_COMPILER_REFRESHER_H
