// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/cache.h>
#include <test/test_scverify.h>
#include <util.h>

#include <iterator>
#include <thread>

#include <boost/test/unit_test.hpp>

using namespace scverify;

namespace {

std::string ReadFile(const fs::path& path)
{
    fs::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void WriteFile(const fs::path& path, const std::string& content)
{
    fs::create_directories(path.parent_path());
    fs::ofstream file(path, std::ios::binary);
    file << content;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(compiler_cache_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(fetch_installs_binary)
{
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    fetcher->AddBinary(Version("0.8.7+commit.e28d00a7"), "#!/bin/sh\necho solc\n");
    CompilerCache cache(GetTempPath() / "solc", "solc", fetcher);
    BOOST_CHECK_EQUAL(cache.LoadFromDisk(), 0U);

    Compiler compiler = cache.GetOrFetch(Version("0.8.7+commit.e28d00a7"));
    BOOST_CHECK(compiler.path == GetTempPath() / "solc" / "0.8.7+commit.e28d00a7" / "solc");
    BOOST_CHECK_EQUAL(ReadFile(compiler.path), "#!/bin/sh\necho solc\n");
    BOOST_CHECK((fs::status(compiler.path).permissions() & fs::owner_exe) != fs::no_perms);
    BOOST_CHECK_EQUAL(cache.Snapshot()->installed.size(), 1U);

    // second lookup is served from the index
    cache.GetOrFetch(Version("0.8.7+commit.e28d00a7"));
    BOOST_CHECK_EQUAL(fetcher->downloads, 1);
}

BOOST_AUTO_TEST_CASE(concurrent_requests_share_one_download)
{
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    fetcher->AddBinary(Version("0.8.7+commit.e28d00a7"), "binary");
    fetcher->download_delay = std::chrono::milliseconds(200);
    CompilerCache cache(GetTempPath() / "solc", "solc", fetcher);

    std::vector<std::thread> threads;
    std::vector<fs::path> paths(8);
    for (size_t i = 0; i < paths.size(); ++i) {
        threads.emplace_back([&cache, &paths, i] {
            paths[i] = cache.GetOrFetch(Version("0.8.7+commit.e28d00a7")).path;
        });
    }
    for (std::thread& t : threads) {
        t.join();
    }

    BOOST_CHECK_EQUAL(fetcher->downloads, 1);
    for (const fs::path& path : paths) {
        BOOST_CHECK(path == paths[0]);
    }
}

BOOST_AUTO_TEST_CASE(checksum_mismatch_is_not_cached)
{
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    fetcher->AddBinary(Version("0.8.7+commit.e28d00a7"), "tampered");
    fetcher->checksums[Version("0.8.7+commit.e28d00a7")] = std::string(64, '0');
    CompilerCache cache(GetTempPath() / "solc", "solc", fetcher);

    try {
        cache.GetOrFetch(Version("0.8.7+commit.e28d00a7"));
        BOOST_FAIL("corrupt binary was accepted");
    } catch (const FetchError& e) {
        BOOST_CHECK(e.Kind() == FetchErrorKind::CORRUPT_ARTIFACT);
    }
    BOOST_CHECK(cache.Snapshot()->installed.empty());
    BOOST_CHECK(!fs::exists(GetTempPath() / "solc" / "0.8.7+commit.e28d00a7" / "solc"));

    // next request downloads again
    fetcher->checksums.clear();
    cache.GetOrFetch(Version("0.8.7+commit.e28d00a7"));
    BOOST_CHECK_EQUAL(fetcher->downloads, 2);
}

BOOST_AUTO_TEST_CASE(unknown_version)
{
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    CompilerCache cache(GetTempPath() / "solc", "solc", fetcher);
    try {
        cache.GetOrFetch(Version("0.1.0+commit.00000000"));
        BOOST_FAIL("missing version was found");
    } catch (const FetchError& e) {
        BOOST_CHECK(e.Kind() == FetchErrorKind::VERSION_NOT_FOUND);
    }
}

BOOST_AUTO_TEST_CASE(warm_start)
{
    const fs::path dir = GetTempPath() / "vyper";
    WriteFile(dir / "0.3.7+commit.6020b8bb" / "vyper", "cached");
    WriteFile(dir / "0.3.9+commit.66b96705" / "vyper.download-1234-abcd-ef00", "partial");
    WriteFile(dir / "scratch" / "vyper", "not a version directory");

    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    CompilerCache cache(dir, "vyper", fetcher);
    BOOST_CHECK_EQUAL(cache.LoadFromDisk(), 1U);
    BOOST_CHECK(!fs::exists(dir / "0.3.9+commit.66b96705" / "vyper.download-1234-abcd-ef00"));

    Compiler compiler = cache.GetOrFetch(Version("0.3.7+commit.6020b8bb"));
    BOOST_CHECK_EQUAL(ReadFile(compiler.path), "cached");
    BOOST_CHECK_EQUAL(fetcher->downloads, 0);
    BOOST_CHECK(cache.KnownVersions().count(Version("0.3.7+commit.6020b8bb")));
}

BOOST_AUTO_TEST_CASE(known_versions_only_grow)
{
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    CompilerCache cache(GetTempPath() / "solc", "solc", fetcher);

    std::set<CompilerVersion> versions{Version("0.8.7+commit.e28d00a7"), Version("0.8.8+commit.dddeac2f")};
    std::shared_ptr<const CompilerIndex> before = cache.Snapshot();
    BOOST_CHECK_EQUAL(cache.AddKnownVersions(versions), 2U);
    BOOST_CHECK_EQUAL(cache.AddKnownVersions(versions), 0U);
    BOOST_CHECK_EQUAL(cache.AddKnownVersions({Version("0.8.7+commit.e28d00a7")}), 0U);
    BOOST_CHECK_EQUAL(cache.KnownVersions().size(), 2U);

    // snapshots are immutable
    BOOST_CHECK(before->known.empty());
}

BOOST_AUTO_TEST_SUITE_END()
