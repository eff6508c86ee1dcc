// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <httpclient.h>

#include <test/test_scverify.h>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(httpclient_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(parse_url)
{
    URLParts parts;
    BOOST_REQUIRE(ParseURL("https://solc-bin.ethereum.org/linux-amd64/list.json", parts));
    BOOST_CHECK_EQUAL(parts.scheme, "https");
    BOOST_CHECK_EQUAL(parts.host, "solc-bin.ethereum.org");
    BOOST_CHECK_EQUAL(parts.port, 443);
    BOOST_CHECK_EQUAL(parts.target, "/linux-amd64/list.json");
    BOOST_CHECK_EQUAL(parts.Authority(), "solc-bin.ethereum.org");

    BOOST_REQUIRE(ParseURL("HTTP://127.0.0.1:9000/bucket/?list-type=2", parts));
    BOOST_CHECK_EQUAL(parts.scheme, "http");
    BOOST_CHECK_EQUAL(parts.port, 9000);
    BOOST_CHECK_EQUAL(parts.target, "/bucket/?list-type=2");
    BOOST_CHECK_EQUAL(parts.Authority(), "127.0.0.1:9000");

    BOOST_REQUIRE(ParseURL("http://example.org", parts));
    BOOST_CHECK_EQUAL(parts.target, "/");

    BOOST_CHECK(!ParseURL("ftp://example.org/file", parts));
    BOOST_CHECK(!ParseURL("list.json", parts));
    BOOST_CHECK(!ParseURL("", parts));
}

BOOST_AUTO_TEST_CASE(resolve_url)
{
    const std::string base = "https://binaries.example.org/linux-amd64/list.json?v=1";
    BOOST_CHECK_EQUAL(ResolveURL(base, "solc-v0.8.7"), "https://binaries.example.org/linux-amd64/solc-v0.8.7");
    BOOST_CHECK_EQUAL(ResolveURL(base, "/other/solc"), "https://binaries.example.org/other/solc");
    BOOST_CHECK_EQUAL(ResolveURL(base, "http://mirror.example.org/solc"), "http://mirror.example.org/solc");
}

BOOST_AUTO_TEST_SUITE_END()
