// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/fetcher.h>
#include <compiler/list_fetcher.h>
#include <compiler/s3_fetcher.h>
#include <test/test_scverify.h>

#include <boost/test/unit_test.hpp>

using namespace scverify;

namespace {

const char* const LIST_URL = "https://binaries.example.org/linux-amd64/list.json";

const char* const MANIFEST = R"({
  "builds": [
    {
      "path": "solc-linux-amd64-v0.8.7+commit.e28d00a7",
      "version": "0.8.7",
      "longVersion": "0.8.7+commit.e28d00a7",
      "sha256": "0xAB8B7A0E36EBAF6E5D7A0EF6D17A4C3B8B7E1F5A0A5F8E2B2E1D0C9C8B7A6F5E"
    },
    {
      "path": "https://mirror.example.org/solc-v0.4.26",
      "longVersion": "0.4.26+commit.4563c3fc"
    },
    {
      "path": "solc-broken",
      "longVersion": "not-a-version"
    }
  ],
  "releases": {"0.8.7": "solc-linux-amd64-v0.8.7+commit.e28d00a7"}
})";

FetchErrorKind KindOf(const std::function<void()>& f)
{
    try {
        f();
    } catch (const FetchError& e) {
        return e.Kind();
    }
    BOOST_FAIL("expected a FetchError");
    return FetchErrorKind::FETCH_UNAVAILABLE;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(fetcher_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(s3_settings_need_region_or_endpoint)
{
    S3FetcherSettings s3;
    s3.bucket = "compilers";
    BOOST_CHECK_THROW(ValidateFetcherSettings(s3), std::runtime_error);

    S3FetcherSettings withRegion = s3;
    withRegion.region = "eu-central-1";
    BOOST_CHECK_NO_THROW(ValidateFetcherSettings(withRegion));

    S3FetcherSettings withEndpoint = s3;
    withEndpoint.endpoint = "http://127.0.0.1:9000";
    BOOST_CHECK_NO_THROW(ValidateFetcherSettings(withEndpoint));
}

BOOST_AUTO_TEST_CASE(s3_settings_other_checks)
{
    S3FetcherSettings s3;
    s3.region = "us-east-1";
    // no bucket
    BOOST_CHECK_THROW(ValidateFetcherSettings(s3), std::runtime_error);

    s3.bucket = "compilers";
    s3.access_key = "AKIDEXAMPLE";
    // secret key missing
    BOOST_CHECK_THROW(ValidateFetcherSettings(s3), std::runtime_error);

    s3.secret_key = "secret";
    BOOST_CHECK_NO_THROW(ValidateFetcherSettings(s3));

    s3.endpoint = "not a url";
    BOOST_CHECK_THROW(ValidateFetcherSettings(s3), std::runtime_error);

    ListFetcherSettings list;
    list.list_url = "ftp://example.org/list.json";
    BOOST_CHECK_THROW(ValidateFetcherSettings(list), std::runtime_error);
    list.list_url = LIST_URL;
    BOOST_CHECK_NO_THROW(ValidateFetcherSettings(list));
}

BOOST_AUTO_TEST_CASE(parse_manifest)
{
    CompilerList list = ParseCompilerList(MANIFEST, LIST_URL);
    BOOST_REQUIRE_EQUAL(list.size(), 2U);

    const FetchLocation& latest = list.at(Version("0.8.7+commit.e28d00a7"));
    BOOST_CHECK_EQUAL(latest.url, "https://binaries.example.org/linux-amd64/solc-linux-amd64-v0.8.7+commit.e28d00a7");
    BOOST_REQUIRE(latest.sha256);
    BOOST_CHECK_EQUAL(*latest.sha256, "ab8b7a0e36ebaf6e5d7a0ef6d17a4c3b8b7e1f5a0a5f8e2b2e1d0c9c8b7a6f5e");

    const FetchLocation& old = list.at(Version("0.4.26+commit.4563c3fc"));
    BOOST_CHECK_EQUAL(old.url, "https://mirror.example.org/solc-v0.4.26");
    BOOST_CHECK(!old.sha256);
}

BOOST_AUTO_TEST_CASE(malformed_manifest_is_unavailable)
{
    BOOST_CHECK(KindOf([] { ParseCompilerList("<html>", LIST_URL); }) == FetchErrorKind::FETCH_UNAVAILABLE);
    BOOST_CHECK(KindOf([] { ParseCompilerList("{\"releases\":{}}", LIST_URL); }) == FetchErrorKind::FETCH_UNAVAILABLE);
}

BOOST_AUTO_TEST_CASE(list_fetcher_resolves_and_downloads)
{
    std::shared_ptr<FakeHTTPClient> http = std::make_shared<FakeHTTPClient>();
    http->SetResponse(LIST_URL, 200, MANIFEST);
    http->SetResponse("https://mirror.example.org/solc-v0.4.26", 200, "binary");

    ListFetcher fetcher(LIST_URL, http);
    std::set<CompilerVersion> versions = fetcher.ListAvailable();
    BOOST_CHECK_EQUAL(versions.size(), 2U);

    FetchLocation location = fetcher.Resolve(Version("0.4.26+commit.4563c3fc"));
    BOOST_CHECK_EQUAL(fetcher.Download(Version("0.4.26+commit.4563c3fc"), location), "binary");

    BOOST_CHECK(KindOf([&] { fetcher.Resolve(Version("0.5.0+commit.1d4f565a")); }) == FetchErrorKind::VERSION_NOT_FOUND);

    // the binary disappeared from the server
    FetchLocation gone = fetcher.Resolve(Version("0.8.7+commit.e28d00a7"));
    BOOST_CHECK(KindOf([&] { fetcher.Download(Version("0.8.7+commit.e28d00a7"), gone); }) == FetchErrorKind::VERSION_NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(unreachable_manifest_is_not_version_not_found)
{
    std::shared_ptr<FakeHTTPClient> http = std::make_shared<FakeHTTPClient>();
    http->unreachable.insert(LIST_URL);
    ListFetcher fetcher(LIST_URL, http);

    BOOST_CHECK(KindOf([&] { fetcher.ListAvailable(); }) == FetchErrorKind::FETCH_UNAVAILABLE);
    BOOST_CHECK(KindOf([&] { fetcher.Resolve(Version("0.8.7+commit.e28d00a7")); }) == FetchErrorKind::FETCH_UNAVAILABLE);

    http->unreachable.clear();
    http->SetResponse(LIST_URL, 503, "");
    BOOST_CHECK(KindOf([&] { fetcher.ListAvailable(); }) == FetchErrorKind::FETCH_UNAVAILABLE);
}

BOOST_AUTO_TEST_CASE(uri_encode)
{
    BOOST_CHECK_EQUAL(UriEncode("0.8.7+commit.e28d00a7/solc", false), "0.8.7%2Bcommit.e28d00a7/solc");
    BOOST_CHECK_EQUAL(UriEncode("a b/c~d", true), "a%20b%2Fc~d");
}

BOOST_AUTO_TEST_CASE(parse_bucket_listing)
{
    const std::string xml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<ListBucketResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
        "<Name>compilers</Name><Prefix></Prefix><KeyCount>2</KeyCount>"
        "<IsTruncated>true</IsTruncated><NextContinuationToken>token/1=</NextContinuationToken>"
        "<CommonPrefixes><Prefix>0.8.7+commit.e28d00a7/</Prefix></CommonPrefixes>"
        "<CommonPrefixes><Prefix>0.8.8+commit.dddeac2f/</Prefix></CommonPrefixes>"
        "</ListBucketResult>";
    ListObjectsPage page = ParseListObjectsResponse(xml);
    BOOST_REQUIRE_EQUAL(page.prefixes.size(), 2U);
    BOOST_CHECK_EQUAL(page.prefixes[0], "0.8.7+commit.e28d00a7");
    BOOST_CHECK_EQUAL(page.prefixes[1], "0.8.8+commit.dddeac2f");
    BOOST_CHECK_EQUAL(page.nextToken, "token/1=");

    BOOST_CHECK_THROW(ParseListObjectsResponse("<Error><Code>AccessDenied</Code></Error>"), FetchError);
    BOOST_CHECK_THROW(ParseListObjectsResponse("not xml <"), FetchError);
}

BOOST_AUTO_TEST_CASE(sigv4_headers)
{
    HTTPClientRequest request("GET", "https://compilers.s3.eu-central-1.amazonaws.com/0.8.7%2Bcommit.e28d00a7/solc");
    // 2013-05-24T00:00:00Z
    SignRequestV4(request, "eu-central-1", "AKIDEXAMPLE", "secret", 1369353600);

    std::map<std::string, std::string> headers(request.headers.begin(), request.headers.end());
    BOOST_CHECK_EQUAL(headers["x-amz-date"], "20130524T000000Z");
    BOOST_CHECK_EQUAL(headers["x-amz-content-sha256"], "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    const std::string& auth = headers["Authorization"];
    BOOST_CHECK(auth.find("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20130524/eu-central-1/s3/aws4_request, ") == 0);
    BOOST_CHECK(auth.find("SignedHeaders=host;x-amz-content-sha256;x-amz-date, ") != std::string::npos);
    std::string::size_type sig = auth.find("Signature=");
    BOOST_REQUIRE(sig != std::string::npos);
    BOOST_CHECK_EQUAL(auth.size() - sig - 10, 64U);

    // signing is deterministic and depends on the secret
    HTTPClientRequest again("GET", request.url);
    SignRequestV4(again, "eu-central-1", "AKIDEXAMPLE", "secret", 1369353600);
    HTTPClientRequest other("GET", request.url);
    SignRequestV4(other, "eu-central-1", "AKIDEXAMPLE", "other", 1369353600);
    BOOST_CHECK_EQUAL(again.headers.back().second, auth);
    BOOST_CHECK(other.headers.back().second != auth);
}

BOOST_AUTO_TEST_CASE(s3_fetcher_layout)
{
    std::shared_ptr<FakeHTTPClient> http = std::make_shared<FakeHTTPClient>();
    S3FetcherSettings settings;
    settings.endpoint = "http://127.0.0.1:9000/";
    settings.bucket = "compilers";
    S3Fetcher fetcher(settings, "solc", http);

    const std::string hashURL = "http://127.0.0.1:9000/compilers/0.8.7%2Bcommit.e28d00a7/sha256.hash";
    const std::string binURL = "http://127.0.0.1:9000/compilers/0.8.7%2Bcommit.e28d00a7/solc";
    BOOST_CHECK_EQUAL(fetcher.ObjectURL("0.8.7+commit.e28d00a7/solc"), binURL);

    http->SetResponse("http://127.0.0.1:9000/compilers/?delimiter=%2F&list-type=2", 200,
        "<ListBucketResult><IsTruncated>false</IsTruncated>"
        "<CommonPrefixes><Prefix>0.8.7+commit.e28d00a7/</Prefix></CommonPrefixes>"
        "<CommonPrefixes><Prefix>scratch/</Prefix></CommonPrefixes>"
        "</ListBucketResult>");
    http->SetResponse(hashURL, 200, "AB8B7A0E36EBAF6E5D7A0EF6D17A4C3B8B7E1F5A0A5F8E2B2E1D0C9C8B7A6F5E\n");
    http->SetResponse(binURL, 200, "binary");

    std::set<CompilerVersion> versions = fetcher.ListAvailable();
    BOOST_REQUIRE_EQUAL(versions.size(), 1U);
    BOOST_CHECK(*versions.begin() == Version("0.8.7+commit.e28d00a7"));

    FetchLocation location = fetcher.Resolve(Version("0.8.7+commit.e28d00a7"));
    BOOST_CHECK_EQUAL(location.url, binURL);
    BOOST_REQUIRE(location.sha256);
    BOOST_CHECK_EQUAL(*location.sha256, "ab8b7a0e36ebaf6e5d7a0ef6d17a4c3b8b7e1f5a0a5f8e2b2e1d0c9c8b7a6f5e");
    BOOST_CHECK_EQUAL(fetcher.Download(Version("0.8.7+commit.e28d00a7"), location), "binary");

    // no credentials: anonymous requests
    for (const HTTPClientRequest& request : http->requests) {
        BOOST_CHECK(request.headers.empty());
    }

    // a missing checksum file means the version does not exist
    BOOST_CHECK(KindOf([&] { fetcher.Resolve(Version("0.8.9+commit.e5eed63a")); }) == FetchErrorKind::VERSION_NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(make_fetcher_validates)
{
    std::shared_ptr<FakeHTTPClient> http = std::make_shared<FakeHTTPClient>();
    S3FetcherSettings s3;
    s3.bucket = "compilers";
    BOOST_CHECK_THROW(MakeFetcher(s3, "solc", http), std::runtime_error);

    ListFetcherSettings list;
    list.list_url = LIST_URL;
    std::unique_ptr<Fetcher> fetcher = MakeFetcher(list, "solc", http);
    BOOST_CHECK(dynamic_cast<ListFetcher*>(fetcher.get()) != nullptr);
}

BOOST_AUTO_TEST_SUITE_END()
