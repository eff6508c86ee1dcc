// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_COMPILER_LIST_FETCHER_H
#define SCVERIFY_COMPILER_LIST_FETCHER_H

/**
 * @file list_fetcher.h
 * @brief Fetcher for list.json compiler manifests
 */

#include <compiler/fetcher.h>
#include <sync.h>

#include <map>
#include <memory>
#include <string>

namespace scverify {

typedef std::map<CompilerVersion, FetchLocation> CompilerList;

/**
 * Parse a compiler manifest:
 *
 *     {"builds": [{"path": "solc-v0.8.7", "longVersion": "0.8.7+commit.e28d00a7",
 *                  "sha256": "0x..."}, ...]}
 *
 * Relative paths are resolved against listUrl. Entries whose version does not
 * parse are skipped.
 * @throws FetchError(FETCH_UNAVAILABLE) if the document is not a manifest
 */
CompilerList ParseCompilerList(const std::string& json, const std::string& listUrl);

/** Fetcher backed by a remote manifest file */
class ListFetcher : public Fetcher
{
public:
    ListFetcher(const std::string& listUrl, std::shared_ptr<HTTPClient> http);

    std::set<CompilerVersion> ListAvailable() override;
    FetchLocation Resolve(const CompilerVersion& version) override;
    std::string Download(const CompilerVersion& version, const FetchLocation& location) override;

private:
    CompilerList FetchList();

    const std::string listUrl_;
    std::shared_ptr<HTTPClient> http_;

    CCriticalSection cs_list;
    //! last manifest seen, used to resolve without another round trip
    CompilerList cachedList_;
};

} // namespace scverify

#endif // SCVERIFY_COMPILER_LIST_FETCHER_H
