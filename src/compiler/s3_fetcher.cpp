// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/s3_fetcher.h>

#include <crypto/hmac_sha256.h>
#include <crypto/sha256.h>
#include <httpclient.h>
#include <util.h>
#include <utilstrencodings.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <sstream>
#include <time.h>

namespace scverify {

namespace {

const char* const SIGNING_ALGORITHM = "AWS4-HMAC-SHA256";

std::string FormatAmzTime(int64_t nTime, const char* fmt)
{
    time_t t = nTime;
    struct tm ts;
    if (!gmtime_r(&t, &ts)) {
        return std::string();
    }
    char buf[32];
    strftime(buf, sizeof(buf), fmt, &ts);
    return buf;
}

std::string BuildQuery(const std::map<std::string, std::string>& params)
{
    std::string query;
    for (const auto& param : params) {
        if (!query.empty()) query += "&";
        query += UriEncode(param.first, true) + "=" + UriEncode(param.second, true);
    }
    return query;
}

} // anonymous namespace

std::string UriEncode(const std::string& str, bool encodeSlash)
{
    static const char* const hexmap = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : str) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encodeSlash)) {
            out += (char)c;
        } else {
            out += '%';
            out += hexmap[c >> 4];
            out += hexmap[c & 15];
        }
    }
    return out;
}

ListObjectsPage ParseListObjectsResponse(const std::string& xml)
{
    namespace pt = boost::property_tree;

    ListObjectsPage page;
    pt::ptree tree;
    try {
        std::istringstream stream(xml);
        pt::read_xml(stream, tree);
    } catch (const pt::xml_parser_error& e) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, std::string("malformed bucket listing: ") + e.what());
    }

    boost::optional<pt::ptree&> result = tree.get_child_optional("ListBucketResult");
    if (!result) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, "bucket listing has no ListBucketResult");
    }
    for (const auto& child : *result) {
        if (child.first != "CommonPrefixes") continue;
        std::string prefix = child.second.get<std::string>("Prefix", "");
        if (!prefix.empty() && prefix.back() == '/') {
            prefix.pop_back();
        }
        if (!prefix.empty()) {
            page.prefixes.push_back(prefix);
        }
    }
    if (result->get<std::string>("IsTruncated", "false") == "true") {
        page.nextToken = result->get<std::string>("NextContinuationToken", "");
    }
    return page;
}

void SignRequestV4(HTTPClientRequest& request, const std::string& region, const std::string& accessKey,
                   const std::string& secretKey, int64_t nTime)
{
    URLParts url;
    if (!ParseURL(request.url, url)) {
        throw std::runtime_error("cannot sign invalid URL " + request.url);
    }
    const std::string amzDate = FormatAmzTime(nTime, "%Y%m%dT%H%M%SZ");
    const std::string date = amzDate.substr(0, 8);
    const std::string payloadHash = SHA256Hex(request.body);

    std::string path = url.target;
    std::string query;
    std::string::size_type q = path.find('?');
    if (q != std::string::npos) {
        query = path.substr(q + 1);
        path = path.substr(0, q);
    }

    // Headers in canonical (sorted) order
    const std::string signedHeaders = "host;x-amz-content-sha256;x-amz-date";
    std::string canonicalRequest = request.method + "\n" +
        path + "\n" +
        query + "\n" +
        "host:" + url.Authority() + "\n" +
        "x-amz-content-sha256:" + payloadHash + "\n" +
        "x-amz-date:" + amzDate + "\n" +
        "\n" +
        signedHeaders + "\n" +
        payloadHash;

    const std::string scope = date + "/" + region + "/s3/aws4_request";
    std::string stringToSign = std::string(SIGNING_ALGORITHM) + "\n" + amzDate + "\n" + scope + "\n" + SHA256Hex(canonicalRequest);

    std::string key = HMACSHA256("AWS4" + secretKey, date);
    key = HMACSHA256(key, region);
    key = HMACSHA256(key, "s3");
    key = HMACSHA256(key, "aws4_request");
    std::string signature = HexStr(HMACSHA256(key, stringToSign));

    request.headers.emplace_back("x-amz-date", amzDate);
    request.headers.emplace_back("x-amz-content-sha256", payloadHash);
    request.headers.emplace_back("Authorization", strprintf("%s Credential=%s/%s, SignedHeaders=%s, Signature=%s",
        SIGNING_ALGORITHM, accessKey, scope, signedHeaders, signature));
}

S3Fetcher::S3Fetcher(const S3FetcherSettings& settings, const std::string& binaryName, std::shared_ptr<HTTPClient> http)
    : settings_(settings),
      binaryName_(binaryName),
      region_(settings.region.value_or(DEFAULT_S3_REGION)),
      http_(std::move(http))
{
    if (settings_.endpoint) {
        std::string endpoint = *settings_.endpoint;
        while (!endpoint.empty() && endpoint.back() == '/') {
            endpoint.pop_back();
        }
        bucketURL_ = endpoint + "/" + UriEncode(settings_.bucket, true);
    } else {
        bucketURL_ = strprintf("https://%s.s3.%s.amazonaws.com", settings_.bucket, region_);
    }
}

std::string S3Fetcher::ObjectURL(const std::string& key) const
{
    return bucketURL_ + "/" + UriEncode(key, false);
}

HTTPClientResponse S3Fetcher::Get(const std::string& url)
{
    HTTPClientRequest request("GET", url);
    if (settings_.access_key && settings_.secret_key) {
        SignRequestV4(request, region_, *settings_.access_key, *settings_.secret_key, GetTime());
    }
    try {
        return http_->Perform(request);
    } catch (const CConnectionFailed& e) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, strprintf("bucket %s unreachable: %s", settings_.bucket, e.what()));
    }
}

std::set<CompilerVersion> S3Fetcher::ListAvailable()
{
    std::set<CompilerVersion> versions;
    std::string token;
    do {
        std::map<std::string, std::string> params;
        params["list-type"] = "2";
        params["delimiter"] = "/";
        if (!token.empty()) {
            params["continuation-token"] = token;
        }
        HTTPClientResponse response = Get(bucketURL_ + "/?" + BuildQuery(params));
        if (!response.IsSuccess()) {
            throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, strprintf("listing bucket %s answered HTTP %d", settings_.bucket, response.status));
        }
        ListObjectsPage page = ParseListObjectsResponse(response.body);
        for (const std::string& prefix : page.prefixes) {
            std::optional<CompilerVersion> version = CompilerVersion::Parse(prefix);
            if (version) {
                versions.insert(*version);
            } else {
                LogPrint(BCLog::FETCH, "%s: ignoring bucket prefix '%s'\n", __func__, prefix);
            }
        }
        token = page.nextToken;
    } while (!token.empty());

    LogPrint(BCLog::FETCH, "Listed bucket %s: %u versions\n", settings_.bucket, versions.size());
    return versions;
}

FetchLocation S3Fetcher::Resolve(const CompilerVersion& version)
{
    const std::string dir = version.ToString() + "/";
    HTTPClientResponse response = Get(ObjectURL(dir + S3_HASH_FILE));
    if (response.status == 404) {
        throw FetchError(FetchErrorKind::VERSION_NOT_FOUND, strprintf("compiler version %s not found in bucket %s", version.ToString(), settings_.bucket));
    }
    if (!response.IsSuccess()) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, strprintf("fetching checksum of %s answered HTTP %d", version.ToString(), response.status));
    }

    FetchLocation location;
    location.url = ObjectURL(dir + binaryName_);
    std::string hash = ToLower(StripHexPrefix(TrimString(response.body)));
    if (hash.size() != 64 || !IsHex(hash)) {
        throw FetchError(FetchErrorKind::CORRUPT_ARTIFACT, strprintf("malformed checksum file for %s", version.ToString()));
    }
    location.sha256 = hash;
    return location;
}

std::string S3Fetcher::Download(const CompilerVersion& version, const FetchLocation& location)
{
    HTTPClientResponse response = Get(location.url);
    if (response.status == 404) {
        throw FetchError(FetchErrorKind::VERSION_NOT_FOUND, strprintf("compiler binary %s not found in bucket %s", version.ToString(), settings_.bucket));
    }
    if (!response.IsSuccess()) {
        throw FetchError(FetchErrorKind::FETCH_UNAVAILABLE, strprintf("download of %s answered HTTP %d", version.ToString(), response.status));
    }
    return std::move(response.body);
}

} // namespace scverify
