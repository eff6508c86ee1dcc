// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/manager.h>
#include <test/test_scverify.h>

#include <boost/test/unit_test.hpp>

using namespace scverify;

namespace {

CompilerManagerOptions Options(int retries)
{
    CompilerManagerOptions options(*CronSchedule::Parse(DEFAULT_REFRESH_SCHEDULE));
    options.retry.max_retries = retries;
    options.retry.backoff = std::chrono::milliseconds(10);
    return options;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(compiler_manager_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(initial_refresh)
{
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    fetcher->AddBinary(Version("0.8.7+commit.e28d00a7"), "a");
    fetcher->AddBinary(Version("0.8.19+commit.7dd6d404"), "b");
    fetcher->AddBinary(Version("0.4.26+commit.4563c3fc"), "c");
    fetcher->AddBinary(Version("0.8.20-nightly.2023.4.14+commit.e1a9446f"), "d");

    CompilerManager manager("solidity", GetTempPath() / "solc", "solc", fetcher, Options(0));
    BOOST_CHECK_EQUAL(fetcher->listings, 1);

    std::vector<CompilerVersion> versions = manager.AllVersions();
    BOOST_REQUIRE_EQUAL(versions.size(), 4U);
    BOOST_CHECK_EQUAL(versions[0].ToString(), "0.8.20-nightly.2023.4.14+commit.e1a9446f");
    BOOST_CHECK_EQUAL(versions[1].ToString(), "0.8.19+commit.7dd6d404");
    BOOST_CHECK_EQUAL(versions[2].ToString(), "0.8.7+commit.e28d00a7");
    BOOST_CHECK_EQUAL(versions[3].ToString(), "0.4.26+commit.4563c3fc");
}

BOOST_AUTO_TEST_CASE(failed_initial_refresh_is_not_fatal)
{
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    fetcher->AddBinary(Version("0.8.7+commit.e28d00a7"), "a");
    fetcher->fail_listing = true;

    CompilerManager manager("solidity", GetTempPath() / "solc", "solc", fetcher, Options(0));
    BOOST_CHECK(manager.AllVersions().empty());
    // versions can still be fetched on demand
    BOOST_CHECK_NO_THROW(manager.GetCompiler(Version("0.8.7+commit.e28d00a7")));
    BOOST_CHECK_EQUAL(manager.AllVersions().size(), 1U);
}

BOOST_AUTO_TEST_CASE(retry_unavailable_downloads)
{
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    fetcher->AddBinary(Version("0.8.7+commit.e28d00a7"), "a");
    fetcher->unavailable_downloads = 2;

    CompilerManager manager("solidity", GetTempPath() / "solc", "solc", fetcher, Options(2));
    Compiler compiler = manager.GetCompiler(Version("0.8.7+commit.e28d00a7"));
    BOOST_CHECK(fs::exists(compiler.path));
    BOOST_CHECK_EQUAL(fetcher->downloads, 3);
}

BOOST_AUTO_TEST_CASE(retries_exhausted)
{
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    fetcher->AddBinary(Version("0.8.7+commit.e28d00a7"), "a");
    fetcher->unavailable_downloads = 5;

    CompilerManager manager("solidity", GetTempPath() / "solc", "solc", fetcher, Options(1));
    try {
        manager.GetCompiler(Version("0.8.7+commit.e28d00a7"));
        BOOST_FAIL("download succeeded");
    } catch (const FetchError& e) {
        BOOST_CHECK(e.Kind() == FetchErrorKind::FETCH_UNAVAILABLE);
    }
    BOOST_CHECK_EQUAL(fetcher->downloads, 2);
}

BOOST_AUTO_TEST_CASE(version_not_found_is_not_retried)
{
    std::shared_ptr<FakeFetcher> fetcher = std::make_shared<FakeFetcher>();
    CompilerManager manager("vyper", GetTempPath() / "vyper", "vyper", fetcher, Options(3));
    try {
        manager.GetCompiler(Version("0.3.7+commit.6020b8bb"));
        BOOST_FAIL("missing version was found");
    } catch (const FetchError& e) {
        BOOST_CHECK(e.Kind() == FetchErrorKind::VERSION_NOT_FOUND);
    }
    BOOST_CHECK_EQUAL(fetcher->downloads, 0);
}

BOOST_AUTO_TEST_SUITE_END()
