// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/manager.h>

#include <util.h>

namespace scverify {

CompilerManager::CompilerManager(const std::string& name, const fs::path& dir, const std::string& binaryName,
                                 std::shared_ptr<Fetcher> fetcher, const CompilerManagerOptions& options)
    : name_(name),
      retry_(options.retry),
      cache_(dir, binaryName, fetcher),
      refresher_(name, fetcher, cache_, options.schedule)
{
    cache_.LoadFromDisk();
    if (options.refresh_on_start) {
        if (refresher_.RefreshOnce()) {
            LogPrintf("%s: %u compiler versions available\n", name_, cache_.KnownVersions().size());
        }
    }
    refresher_.Start();
}

CompilerManager::~CompilerManager()
{
    Stop();
}

void CompilerManager::Stop()
{
    shutdown_();
    refresher_.Stop();
}

Compiler CompilerManager::GetCompiler(const CompilerVersion& version)
{
    std::chrono::milliseconds backoff = retry_.backoff;
    for (int attempt = 0; ; ++attempt) {
        try {
            return cache_.GetOrFetch(version);
        } catch (const FetchError& e) {
            if (e.Kind() != FetchErrorKind::FETCH_UNAVAILABLE || attempt >= retry_.max_retries) {
                throw;
            }
            LogPrint(BCLog::FETCH, "%s: fetching %s unavailable (%s), retry %d/%d in %d ms\n",
                     name_, version.ToString(), e.what(), attempt + 1, retry_.max_retries, backoff.count());
            if (!shutdown_.sleep_for(backoff)) {
                throw;
            }
            backoff *= 2;
        }
    }
}

std::vector<CompilerVersion> CompilerManager::AllVersions() const
{
    std::set<CompilerVersion> known = cache_.KnownVersions();
    return std::vector<CompilerVersion>(known.rbegin(), known.rend());
}

} // namespace scverify
