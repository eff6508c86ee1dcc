// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <test/test_scverify.h>
#include <utilstrencodings.h>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(util_ParseHex)
{
    std::vector<unsigned char> result = ParseHex("60806040");
    BOOST_REQUIRE_EQUAL(result.size(), 4U);
    BOOST_CHECK_EQUAL(result[0], 0x60);
    BOOST_CHECK_EQUAL(result[3], 0x40);

    // spaces between bytes are allowed
    result = ParseHex("12 34 56 78");
    BOOST_CHECK_EQUAL(result.size(), 4U);

    // stop at invalid character
    result = ParseHex("1234 invalid 1234");
    BOOST_CHECK_EQUAL(result.size(), 2U);
}

BOOST_AUTO_TEST_CASE(util_DecodeHexBytes)
{
    std::vector<unsigned char> out;
    BOOST_CHECK(DecodeHexBytes("0x6080", out));
    BOOST_CHECK_EQUAL(HexStr(out), "6080");
    BOOST_CHECK(DecodeHexBytes("6080", out));
    BOOST_CHECK_EQUAL(out.size(), 2U);
    BOOST_CHECK(DecodeHexBytes("0x", out));
    BOOST_CHECK(out.empty());

    BOOST_CHECK(!DecodeHexBytes("0x608", out));
    BOOST_CHECK(!DecodeHexBytes("0xzz", out));
    // unlinked library placeholder
    BOOST_CHECK(!DecodeHexBytes("6080__$a1b2c3$__6040", out));
}

BOOST_AUTO_TEST_CASE(util_TrimString)
{
    BOOST_CHECK_EQUAL(TrimString("  value \t\n"), "value");
    BOOST_CHECK_EQUAL(TrimString("   "), "");
    BOOST_CHECK_EQUAL(ToLower("0xABcd"), "0xabcd");
    BOOST_CHECK_EQUAL(StripHexPrefix("0Xff"), "ff");
}

BOOST_AUTO_TEST_CASE(util_ParseParameters)
{
    const char* argv[] = {"scverifyd", "-port=9000", "--vyper", "-nosolidity", "-debug=fetch", "-debug=cache", "ignored", "-after"};
    ArgsManager args;
    args.ParseParameters(8, argv);

    BOOST_CHECK_EQUAL(args.GetArg("-port", 8043), 9000);
    BOOST_CHECK(args.GetBoolArg("-vyper", false));
    BOOST_CHECK(!args.GetBoolArg("-solidity", true));
    BOOST_CHECK_EQUAL(args.GetArgs("-debug").size(), 2U);
    // parsing stops at the first non option
    BOOST_CHECK(!args.IsArgSet("-after"));
}

BOOST_AUTO_TEST_CASE(util_ReadConfigFile)
{
    const fs::path conf = GetTempPath() / "scverify.conf";
    {
        fs::ofstream file(conf);
        file << "# compiler sources\n"
             << "solidityfetcher = s3\n"
             << "solidityrefreshschedule=\"0 */10 * * * *\"\n"
             << "soliditys3bucket=compilers # trailing comment\n"
             << "port=1234\n"
             << "\n";
    }

    const char* argv[] = {"scverifyd", "-port=9000"};
    ArgsManager args;
    args.ParseParameters(2, argv);
    BOOST_CHECK(args.ReadConfigFile(conf.string()));

    BOOST_CHECK_EQUAL(args.GetArg("-solidityfetcher", ""), "s3");
    BOOST_CHECK_EQUAL(args.GetArg("-solidityrefreshschedule", ""), "0 */10 * * * *");
    BOOST_CHECK_EQUAL(args.GetArg("-soliditys3bucket", ""), "compilers");
    // command line wins
    BOOST_CHECK_EQUAL(args.GetArg("-port", ""), "9000");

    // a missing file is not an error
    BOOST_CHECK(!args.ReadConfigFile((GetTempPath() / "missing.conf").string()));
}

BOOST_AUTO_TEST_CASE(util_ReadConfigFile_malformed)
{
    const fs::path conf = GetTempPath() / "bad.conf";
    {
        fs::ofstream file(conf);
        file << "port=1234\nthis line has no value\n";
    }
    ArgsManager args;
    BOOST_CHECK_THROW(args.ReadConfigFile(conf.string()), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(util_SoftSetArg)
{
    ArgsManager args;
    BOOST_CHECK(args.SoftSetArg("-bind", "127.0.0.1"));
    BOOST_CHECK(!args.SoftSetArg("-bind", "0.0.0.0"));
    BOOST_CHECK_EQUAL(args.GetArg("-bind", ""), "127.0.0.1");
    args.ForceSetArg("-bind", "::1");
    BOOST_CHECK_EQUAL(args.GetArg("-bind", ""), "::1");
}

BOOST_AUTO_TEST_CASE(util_LogCategories)
{
    uint32_t flag = 0;
    std::string name = "fetch";
    BOOST_CHECK(GetLogCategory(&flag, &name));
    BOOST_CHECK_EQUAL(flag, (uint32_t)BCLog::FETCH);
    name = "";
    BOOST_CHECK(GetLogCategory(&flag, &name));
    BOOST_CHECK_EQUAL(flag, (uint32_t)BCLog::ALL);
    name = "mempool";
    BOOST_CHECK(!GetLogCategory(&flag, &name));
    BOOST_CHECK(ListLogCategories().find("refresh") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
