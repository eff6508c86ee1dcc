// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/version.h>
#include <test/test_scverify.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <vector>

using scverify::CompilerVersion;

BOOST_AUTO_TEST_SUITE(compiler_version_tests)

BOOST_AUTO_TEST_CASE(parse_release_with_commit)
{
    std::optional<CompilerVersion> version = CompilerVersion::Parse("v0.8.7+commit.e28d00a7");
    BOOST_REQUIRE(version);
    BOOST_CHECK_EQUAL(version->Major(), 0U);
    BOOST_CHECK_EQUAL(version->Minor(), 8U);
    BOOST_CHECK_EQUAL(version->Patch(), 7U);
    BOOST_CHECK(version->Prerelease().empty());
    BOOST_CHECK_EQUAL(version->Build(), "commit.e28d00a7");
    BOOST_CHECK(version->IsRelease());
    // the leading 'v' is dropped
    BOOST_CHECK_EQUAL(version->ToString(), "0.8.7+commit.e28d00a7");
}

BOOST_AUTO_TEST_CASE(parse_nightly)
{
    std::optional<CompilerVersion> version = CompilerVersion::Parse("0.8.8-nightly.2021.9.9+commit.dea1b9ec");
    BOOST_REQUIRE(version);
    BOOST_CHECK_EQUAL(version->Prerelease(), "nightly.2021.9.9");
    BOOST_CHECK(!version->IsRelease());
    BOOST_CHECK_EQUAL(version->ToString(), "0.8.8-nightly.2021.9.9+commit.dea1b9ec");
}

BOOST_AUTO_TEST_CASE(reject_malformed)
{
    BOOST_CHECK(!CompilerVersion::Parse(""));
    BOOST_CHECK(!CompilerVersion::Parse("v"));
    BOOST_CHECK(!CompilerVersion::Parse("0.8"));
    BOOST_CHECK(!CompilerVersion::Parse("0.8.7.1"));
    BOOST_CHECK(!CompilerVersion::Parse("0.08.7"));
    BOOST_CHECK(!CompilerVersion::Parse("0.8.x"));
    BOOST_CHECK(!CompilerVersion::Parse("0.8.7+"));
    BOOST_CHECK(!CompilerVersion::Parse("0.8.7-"));
    BOOST_CHECK(!CompilerVersion::Parse("0.8.7+commit..a"));
    BOOST_CHECK(!CompilerVersion::Parse("solc-0.8.7"));
}

BOOST_AUTO_TEST_CASE(total_order)
{
    std::vector<CompilerVersion> versions = {
        Version("0.8.7+commit.e28d00a7"),
        Version("0.4.26+commit.4563c3fc"),
        Version("0.8.8-nightly.2021.9.9+commit.dea1b9ec"),
        Version("0.8.10+commit.fc410830"),
        Version("0.8.8+commit.dddeac2f"),
        Version("0.8.8-nightly.2021.9.10+commit.aaaaaaaa"),
    };
    std::sort(versions.begin(), versions.end());

    std::vector<std::string> expected = {
        "0.4.26+commit.4563c3fc",
        "0.8.7+commit.e28d00a7",
        "0.8.8-nightly.2021.9.9+commit.dea1b9ec",
        "0.8.8-nightly.2021.9.10+commit.aaaaaaaa",
        "0.8.8+commit.dddeac2f",
        "0.8.10+commit.fc410830",
    };
    BOOST_REQUIRE_EQUAL(versions.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        BOOST_CHECK_EQUAL(versions[i].ToString(), expected[i]);
    }
}

BOOST_AUTO_TEST_CASE(build_metadata_breaks_ties)
{
    CompilerVersion a = Version("0.8.7+commit.aaaaaaaa");
    CompilerVersion b = Version("0.8.7+commit.bbbbbbbb");
    BOOST_CHECK(a != b);
    BOOST_CHECK(a < b || b < a);
    BOOST_CHECK(Version("v0.8.7+commit.aaaaaaaa") == a);
}

BOOST_AUTO_TEST_SUITE_END()
