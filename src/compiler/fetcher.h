// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_COMPILER_FETCHER_H
#define SCVERIFY_COMPILER_FETCHER_H

/**
 * @file fetcher.h
 * @brief Compiler fetcher interface and source selection
 *
 * A fetcher lists the compiler versions a source offers and downloads one
 * binary at a time. The source is either a solc-bin style list.json manifest or
 * an S3 bucket.
 */

#include <compiler/version.h>

#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>

class HTTPClient;

namespace scverify {

enum class FetchErrorKind {
    VERSION_NOT_FOUND,
    //! transient: network failure or unusable server answer, the caller may retry
    FETCH_UNAVAILABLE,
    CORRUPT_ARTIFACT,
};

std::string FetchErrorKindToString(FetchErrorKind kind);

class FetchError : public std::runtime_error
{
public:
    FetchError(FetchErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    FetchErrorKind Kind() const { return kind_; }

private:
    FetchErrorKind kind_;
};

/** Where a compiler binary can be downloaded from */
struct FetchLocation
{
    std::string url;
    //! expected SHA-256 of the binary, lowercase hex without 0x
    std::optional<std::string> sha256;
};

/** Remote manifest in the solc-bin list.json format */
struct ListFetcherSettings
{
    std::string list_url;
};

/** Object storage bucket laid out as {version}/{binary} and {version}/sha256.hash */
struct S3FetcherSettings
{
    std::optional<std::string> access_key;
    std::optional<std::string> secret_key;
    std::optional<std::string> region;
    std::optional<std::string> endpoint;
    std::string bucket;
};

/** Exactly one fetch strategy is configured per compiler manager */
typedef std::variant<ListFetcherSettings, S3FetcherSettings> FetcherSettings;

/**
 * Check fetcher settings before anything is started.
 * @throws std::runtime_error describing the first problem found
 */
void ValidateFetcherSettings(const FetcherSettings& settings);

/**
 * Compiler release source. Implementations only do network I/O; checksum
 * verification and storage are left to the cache.
 * All methods throw FetchError.
 */
class Fetcher
{
public:
    virtual ~Fetcher() {}

    /** Every version the source currently offers */
    virtual std::set<CompilerVersion> ListAvailable() = 0;

    /** Locate the binary for a version; VERSION_NOT_FOUND if it is not offered */
    virtual FetchLocation Resolve(const CompilerVersion& version) = 0;

    /** Download the bytes of a resolved binary */
    virtual std::string Download(const CompilerVersion& version, const FetchLocation& location) = 0;
};

/**
 * Construct the fetcher described by settings.
 * @param binaryName file name of the compiler binary inside a version directory
 */
std::unique_ptr<Fetcher> MakeFetcher(const FetcherSettings& settings, const std::string& binaryName,
                                     std::shared_ptr<HTTPClient> http);

} // namespace scverify

#endif // SCVERIFY_COMPILER_FETCHER_H
