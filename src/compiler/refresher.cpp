// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/refresher.h>

#include <util.h>

#include <functional>

namespace scverify {

VersionRefresher::VersionRefresher(std::string name, std::shared_ptr<Fetcher> fetcher, CompilerCache& cache, CronSchedule schedule)
    : name_(std::move(name)),
      fetcher_(std::move(fetcher)),
      cache_(cache),
      schedule_(std::move(schedule)),
      threadName_("refresh-" + name_)
{
}

VersionRefresher::~VersionRefresher()
{
    Stop();
}

void VersionRefresher::Start()
{
    if (thread_.joinable()) {
        return;
    }
    interrupt_.reset();
    thread_ = std::thread(&TraceThread<std::function<void()>>, threadName_.c_str(),
                          std::function<void()>(std::bind(&VersionRefresher::ThreadRefresh, this)));
}

void VersionRefresher::Stop()
{
    interrupt_();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool VersionRefresher::RefreshOnce(size_t* added)
{
    std::set<CompilerVersion> versions;
    try {
        versions = fetcher_->ListAvailable();
    } catch (const std::exception& e) {
        return error("%s: %s version refresh failed: %s", __func__, name_, e.what());
    }
    size_t nNew = cache_.AddKnownVersions(versions);
    if (added) *added = nNew;
    LogPrint(BCLog::REFRESH, "%s versions refreshed: %u listed, %u new\n", name_, versions.size(), nNew);
    return true;
}

void VersionRefresher::ThreadRefresh()
{
    LogPrint(BCLog::REFRESH, "%s refresher started, schedule '%s'\n", name_, schedule_.ToString());
    while (!interrupt_) {
        std::optional<CronSchedule::time_point> next = schedule_.Next(std::chrono::system_clock::now());
        if (!next) {
            LogPrintf("%s refresher: schedule '%s' has no future run\n", name_, schedule_.ToString());
            break;
        }
        if (!interrupt_.sleep_until(*next)) {
            break;
        }
        RefreshOnce();
    }
    LogPrint(BCLog::REFRESH, "%s refresher stopped\n", name_);
}

} // namespace scverify
