// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_COMPILER_S3_FETCHER_H
#define SCVERIFY_COMPILER_S3_FETCHER_H

/**
 * @file s3_fetcher.h
 * @brief Fetcher for compilers stored in an S3 bucket
 *
 * Each version is a prefix holding the binary and a sha256.hash file.
 * Requests are signed with AWS Signature Version 4 when credentials are set.
 */

#include <compiler/fetcher.h>
#include <httpclient.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace scverify {

static const char* const DEFAULT_S3_REGION = "us-east-1";
static const char* const S3_HASH_FILE = "sha256.hash";

/** Percent-encode per RFC 3986 as S3 expects; '/' is kept when encodeSlash is false */
std::string UriEncode(const std::string& str, bool encodeSlash);

/** One page of a ListObjectsV2 answer */
struct ListObjectsPage
{
    //! CommonPrefixes with the trailing delimiter removed
    std::vector<std::string> prefixes;
    //! set when the listing is truncated
    std::string nextToken;
};

/**
 * Parse a ListObjectsV2 XML document.
 * @throws FetchError(FETCH_UNAVAILABLE) on malformed XML
 */
ListObjectsPage ParseListObjectsResponse(const std::string& xml);

/**
 * Add AWS Signature Version 4 headers (x-amz-date, x-amz-content-sha256,
 * Authorization) to a request with an empty body.
 * @param nTime seconds since epoch the signature is made for
 */
void SignRequestV4(HTTPClientRequest& request, const std::string& region, const std::string& accessKey,
                   const std::string& secretKey, int64_t nTime);

/**
 * Fetcher backed by an S3 compatible bucket. Versions are the top level
 * "directories" of the bucket; each holds the binary and a sha256.hash file.
 * Path-style addressing is used when an endpoint is configured, virtual
 * hosted style on AWS otherwise. Requests are anonymous without credentials.
 */
class S3Fetcher : public Fetcher
{
public:
    S3Fetcher(const S3FetcherSettings& settings, const std::string& binaryName, std::shared_ptr<HTTPClient> http);

    std::set<CompilerVersion> ListAvailable() override;
    FetchLocation Resolve(const CompilerVersion& version) override;
    std::string Download(const CompilerVersion& version, const FetchLocation& location) override;

    /** URL of an object key */
    std::string ObjectURL(const std::string& key) const;

private:
    HTTPClientResponse Get(const std::string& url);

    S3FetcherSettings settings_;
    std::string binaryName_;
    std::string bucketURL_;
    std::string region_;
    std::shared_ptr<HTTPClient> http_;
};

} // namespace scverify

#endif // SCVERIFY_COMPILER_S3_FETCHER_H
