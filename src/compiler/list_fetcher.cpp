// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/list_fetcher.h>

#include <httpclient.h>
#include <util.h>
#include <utilstrencodings.h>

#include <univalue.h>

namespace scverify {

CompilerList ParseCompilerList(const std::string& json, const std::string& listUrl)
{
    UniValue manifest;
    if (!manifest.read(json) || !manifest.isObject()) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, "compiler list is not a JSON object");
    }
    const UniValue& builds = find_value(manifest, "builds");
    if (!builds.isArray()) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, "compiler list has no builds array");
    }

    CompilerList list;
    for (size_t i = 0; i < builds.size(); ++i) {
        const UniValue& build = builds[i];
        if (!build.isObject()) continue;
        const UniValue& path = find_value(build, "path");
        const UniValue& longVersion = find_value(build, "longVersion");
        const UniValue& sha256 = find_value(build, "sha256");
        if (!path.isStr() || !longVersion.isStr()) {
            continue;
        }
        std::optional<CompilerVersion> version = CompilerVersion::Parse(longVersion.get_str());
        if (!version) {
            LogPrint(BCLog::FETCH, "%s: skipping unparsable version '%s'\n", __func__, longVersion.get_str());
            continue;
        }
        FetchLocation location;
        location.url = ResolveURL(listUrl, path.get_str());
        if (sha256.isStr()) {
            std::string hash = ToLower(StripHexPrefix(sha256.get_str()));
            if (hash.size() != 64 || !IsHex(hash)) {
                LogPrint(BCLog::FETCH, "%s: ignoring malformed checksum for %s\n", __func__, version->ToString());
            } else {
                location.sha256 = hash;
            }
        }
        list[*version] = location;
    }
    return list;
}

ListFetcher::ListFetcher(const std::string& listUrl, std::shared_ptr<HTTPClient> http)
    : listUrl_(listUrl), http_(std::move(http))
{
}

CompilerList ListFetcher::FetchList()
{
    HTTPClientResponse response;
    try {
        response = http_->Perform(HTTPClientRequest("GET", listUrl_));
    } catch (const CConnectionFailed& e) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, strprintf("compiler list %s unreachable: %s", listUrl_, e.what()));
    }
    if (!response.IsSuccess()) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, strprintf("compiler list %s answered HTTP %d", listUrl_, response.status));
    }
    CompilerList list = ParseCompilerList(response.body, listUrl_);
    LogPrint(BCLog::FETCH, "Fetched compiler list %s: %u versions\n", listUrl_, list.size());

    LOCK(cs_list);
    cachedList_ = list;
    return list;
}

std::set<CompilerVersion> ListFetcher::ListAvailable()
{
    std::set<CompilerVersion> versions;
    for (const auto& entry : FetchList()) {
        versions.insert(entry.first);
    }
    return versions;
}

FetchLocation ListFetcher::Resolve(const CompilerVersion& version)
{
    {
        LOCK(cs_list);
        auto it = cachedList_.find(version);
        if (it != cachedList_.end()) {
            return it->second;
        }
    }
    // The version may have been published since the last listing
    CompilerList list = FetchList();
    auto it = list.find(version);
    if (it == list.end()) {
        throw FetchError(FetchErrorKind::VERSION_NOT_FOUND, strprintf("compiler version %s not found", version.ToString()));
    }
    return it->second;
}

std::string ListFetcher::Download(const CompilerVersion& version, const FetchLocation& location)
{
    HTTPClientResponse response;
    try {
        response = http_->Perform(HTTPClientRequest("GET", location.url));
    } catch (const CConnectionFailed& e) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, strprintf("download of %s failed: %s", version.ToString(), e.what()));
    }
    if (response.status == 404) {
        throw FetchError(FetchErrorKind::VERSION_NOT_FOUND, strprintf("compiler binary %s not found at %s", version.ToString(), location.url));
    }
    if (!response.IsSuccess()) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, strprintf("download of %s answered HTTP %d", version.ToString(), response.status));
    }
    return std::move(response.body);
}

} // namespace scverify
