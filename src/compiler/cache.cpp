// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/cache.h>

#include <crypto/sha256.h>
#include <util.h>

namespace scverify {

static const char* const TEMP_MARKER = ".download-";

CompilerCache::CompilerCache(const fs::path& dir, const std::string& binaryName, std::shared_ptr<Fetcher> fetcher)
    : dir_(dir),
      binaryName_(binaryName),
      fetcher_(std::move(fetcher)),
      index_(std::make_shared<const CompilerIndex>())
{
}

std::shared_ptr<const CompilerIndex> CompilerCache::Snapshot() const
{
    return std::atomic_load(&index_);
}

size_t CompilerCache::LoadFromDisk()
{
    fs::create_directories(dir_);

    std::map<CompilerVersion, fs::path> found;
    for (fs::directory_iterator it(dir_); it != fs::directory_iterator(); ++it) {
        if (!fs::is_directory(it->status())) continue;

        for (fs::directory_iterator file(it->path()); file != fs::directory_iterator(); ++file) {
            if (file->path().filename().string().find(TEMP_MARKER) != std::string::npos) {
                boost::system::error_code ec;
                fs::remove(file->path(), ec);
                LogPrint(BCLog::CACHE, "Removed leftover download %s\n", file->path().string());
            }
        }

        std::optional<CompilerVersion> version = CompilerVersion::Parse(it->path().filename().string());
        fs::path binary = it->path() / binaryName_;
        if (version && fs::is_regular_file(binary)) {
            found[*version] = binary;
        }
    }

    LOCK(cs_index);
    std::shared_ptr<CompilerIndex> next = std::make_shared<CompilerIndex>(*Snapshot());
    for (const auto& entry : found) {
        next->installed[entry.first] = entry.second;
        next->known.insert(entry.first);
    }
    std::atomic_store(&index_, std::shared_ptr<const CompilerIndex>(std::move(next)));

    LogPrintf("Compiler cache %s: %u installed versions\n", dir_.string(), found.size());
    return found.size();
}

size_t CompilerCache::AddKnownVersions(const std::set<CompilerVersion>& versions)
{
    LOCK(cs_index);
    std::shared_ptr<const CompilerIndex> current = Snapshot();
    size_t added = 0;
    for (const CompilerVersion& version : versions) {
        if (!current->known.count(version)) ++added;
    }
    if (added == 0) {
        return 0;
    }
    std::shared_ptr<CompilerIndex> next = std::make_shared<CompilerIndex>(*current);
    next->known.insert(versions.begin(), versions.end());
    std::atomic_store(&index_, std::shared_ptr<const CompilerIndex>(std::move(next)));
    return added;
}

std::set<CompilerVersion> CompilerCache::KnownVersions() const
{
    std::shared_ptr<const CompilerIndex> index = Snapshot();
    std::set<CompilerVersion> versions = index->known;
    for (const auto& entry : index->installed) {
        versions.insert(entry.first);
    }
    return versions;
}

void CompilerCache::Publish(const CompilerVersion& version, const fs::path& path)
{
    LOCK(cs_index);
    std::shared_ptr<CompilerIndex> next = std::make_shared<CompilerIndex>(*Snapshot());
    next->installed[version] = path;
    next->known.insert(version);
    std::atomic_store(&index_, std::shared_ptr<const CompilerIndex>(std::move(next)));
}

fs::path CompilerCache::Fetch(const CompilerVersion& version)
{
    LogPrint(BCLog::CACHE, "Fetching compiler %s\n", version.ToString());
    FetchLocation location = fetcher_->Resolve(version);
    std::string binary = fetcher_->Download(version, location);

    if (location.sha256) {
        std::string actual = SHA256Hex(binary);
        if (actual != *location.sha256) {
            throw FetchError(FetchErrorKind::CORRUPT_ARTIFACT,
                strprintf("checksum mismatch for compiler %s: expected %s, got %s", version.ToString(), *location.sha256, actual));
        }
    }

    const fs::path versionDir = dir_ / version.ToString();
    const fs::path target = versionDir / binaryName_;
    const fs::path temp = versionDir / fs::unique_path(binaryName_ + TEMP_MARKER + "%%%%-%%%%-%%%%");
    try {
        fs::create_directories(versionDir);
        FILE* file = fsbridge::fopen(temp, "wb");
        if (!file) {
            throw std::runtime_error("cannot open " + temp.string());
        }
        size_t written = fwrite(binary.data(), 1, binary.size(), file);
        bool ok = (written == binary.size()) && fflush(file) == 0;
        ok = (fclose(file) == 0) && ok;
        if (!ok) {
            throw std::runtime_error("cannot write " + temp.string());
        }
        fs::permissions(temp, fs::owner_all | fs::group_read | fs::group_exe | fs::others_read | fs::others_exe);
        fs::rename(temp, target);
    } catch (const std::exception& e) {
        boost::system::error_code ec;
        fs::remove(temp, ec);
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, strprintf("cannot store compiler %s: %s", version.ToString(), e.what()));
    }

    LogPrintf("Installed compiler %s at %s\n", version.ToString(), target.string());
    return target;
}

Compiler CompilerCache::GetOrFetch(const CompilerVersion& version)
{
    {
        std::shared_ptr<const CompilerIndex> index = Snapshot();
        auto it = index->installed.find(version);
        if (it != index->installed.end()) {
            return Compiler{version, it->second};
        }
    }

    std::promise<fs::path> promise;
    std::shared_future<fs::path> future;
    {
        LOCK(cs_inflight);
        // A download may have finished between the lookup above and taking the lock
        std::shared_ptr<const CompilerIndex> index = Snapshot();
        auto installed = index->installed.find(version);
        if (installed != index->installed.end()) {
            return Compiler{version, installed->second};
        }
        auto it = inflight_.find(version);
        if (it != inflight_.end()) {
            future = it->second;
        } else {
            inflight_.emplace(version, promise.get_future().share());
        }
    }

    if (future.valid()) {
        LogPrint(BCLog::CACHE, "Waiting for download of compiler %s in progress\n", version.ToString());
        return Compiler{version, future.get()};
    }

    fs::path path;
    try {
        path = Fetch(version);
    } catch (const std::exception& e) {
        {
            LOCK(cs_inflight);
            inflight_.erase(version);
        }
        promise.set_exception(std::current_exception());
        LogPrint(BCLog::CACHE, "Fetching compiler %s failed: %s\n", version.ToString(), e.what());
        throw;
    }

    Publish(version, path);
    {
        LOCK(cs_inflight);
        inflight_.erase(version);
    }
    promise.set_value(path);
    return Compiler{version, path};
}

} // namespace scverify
