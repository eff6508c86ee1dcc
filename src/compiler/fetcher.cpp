// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/fetcher.h>

#include <compiler/list_fetcher.h>
#include <compiler/s3_fetcher.h>
#include <httpclient.h>

#include <type_traits>

namespace scverify {

std::string FetchErrorKindToString(FetchErrorKind kind)
{
    switch (kind) {
    case FetchErrorKind::VERSION_NOT_FOUND: return "VersionNotFound";
    case FetchErrorKind::FETCH_UNAVAILABLE: return "FetchUnavailable";
    case FetchErrorKind::CORRUPT_ARTIFACT: return "CorruptArtifact";
    }
    return "Unknown";
}

static void ValidateURL(const std::string& url, const char* what)
{
    URLParts parts;
    if (!ParseURL(url, parts)) {
        throw std::runtime_error(std::string(what) + " is not a valid http(s) URL: '" + url + "'");
    }
}

void ValidateFetcherSettings(const FetcherSettings& settings)
{
    if (const ListFetcherSettings* list = std::get_if<ListFetcherSettings>(&settings)) {
        ValidateURL(list->list_url, "compiler list URL");
        return;
    }

    const S3FetcherSettings& s3 = std::get<S3FetcherSettings>(settings);
    if (!s3.region && !s3.endpoint) {
        throw std::runtime_error("S3 fetcher: at least one of region or endpoint must be set");
    }
    if (s3.bucket.empty()) {
        throw std::runtime_error("S3 fetcher: bucket must be set");
    }
    if (s3.access_key.has_value() != s3.secret_key.has_value()) {
        throw std::runtime_error("S3 fetcher: access key and secret key must be given together");
    }
    if (s3.endpoint) {
        ValidateURL(*s3.endpoint, "S3 endpoint");
    }
}

std::unique_ptr<Fetcher> MakeFetcher(const FetcherSettings& settings, const std::string& binaryName,
                                     std::shared_ptr<HTTPClient> http)
{
    ValidateFetcherSettings(settings);
    return std::visit([&](const auto& s) -> std::unique_ptr<Fetcher> {
        typedef std::decay_t<decltype(s)> T;
        if constexpr (std::is_same<T, ListFetcherSettings>::value) {
            return std::unique_ptr<Fetcher>(new ListFetcher(s.list_url, http));
        } else {
            return std::unique_ptr<Fetcher>(new S3Fetcher(s, binaryName, http));
        }
    }, settings);
}

} // namespace scverify
