// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_COMPILER_CACHE_H
#define SCVERIFY_COMPILER_CACHE_H

/**
 * @file cache.h
 * @brief Local compiler cache
 *
 * Installed compilers live under <dir>/<version>/<binary>. The index of known
 * and installed versions is an immutable snapshot replaced on every change, so
 * readers never take a lock. Concurrent requests for a version that is not yet
 * installed share a single download.
 */

#include <compiler/fetcher.h>
#include <compiler/version.h>
#include <fs.h>
#include <sync.h>

#include <future>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace scverify {

/**
 * Handle to an installed compiler binary. Handles are plain values: the file
 * they point to is never removed while the process runs.
 */
struct Compiler
{
    CompilerVersion version;
    fs::path path;
};

/**
 * Immutable view of the cache. A new snapshot replaces the old one as a
 * whole, so readers never see a half-applied update.
 */
struct CompilerIndex
{
    //! versions the fetcher offers, not necessarily downloaded
    std::set<CompilerVersion> known;
    //! downloaded and verified binaries
    std::map<CompilerVersion, fs::path> installed;
};

/**
 * Materializes compiler binaries under
 *
 *     <dir>/<version>/<binary>
 *
 * Downloads go to a temporary file in the version directory which is renamed
 * into place only after its checksum matched. Concurrent requests for the
 * same missing version wait on a single download.
 */
class CompilerCache
{
public:
    CompilerCache(const fs::path& dir, const std::string& binaryName, std::shared_ptr<Fetcher> fetcher);

    CompilerCache(const CompilerCache&) = delete;
    CompilerCache& operator=(const CompilerCache&) = delete;

    /**
     * Register the binaries already present in the directory and remove the
     * temporary files of interrupted downloads.
     * @return number of installed versions found
     */
    size_t LoadFromDisk();

    /**
     * Return the installed compiler for a version, downloading it first if
     * needed.
     * @throws FetchError
     */
    Compiler GetOrFetch(const CompilerVersion& version);

    /** Record versions offered by the fetcher; returns how many were new */
    size_t AddKnownVersions(const std::set<CompilerVersion>& versions);

    /** Known and installed versions */
    std::set<CompilerVersion> KnownVersions() const;

    std::shared_ptr<const CompilerIndex> Snapshot() const;

private:
    fs::path Fetch(const CompilerVersion& version);
    void Publish(const CompilerVersion& version, const fs::path& path);

    const fs::path dir_;
    const std::string binaryName_;
    std::shared_ptr<Fetcher> fetcher_;

    //! current snapshot, read with std::atomic_load
    std::shared_ptr<const CompilerIndex> index_;
    //! serializes writers of index_
    CCriticalSection cs_index;

    CCriticalSection cs_inflight;
    std::map<CompilerVersion, std::shared_future<fs::path>> inflight_;
};

} // namespace scverify

#endif // SCVERIFY_COMPILER_CACHE_H
