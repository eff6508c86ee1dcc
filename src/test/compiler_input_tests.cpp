// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/input.h>

#include <test/test_scverify.h>

#include <boost/test/unit_test.hpp>

using namespace scverify;

BOOST_FIXTURE_TEST_SUITE(compiler_input_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(from_sources)
{
    CompilerInput input = CompilerInput::FromSources(Language::VYPER,
        {{"b.vy", "x: uint256"}, {"a.vy", "y: uint256"}}, std::string("paris"));
    BOOST_CHECK(input.GetLanguage() == Language::VYPER);
    std::vector<std::string> paths = input.SourcePaths();
    BOOST_REQUIRE_EQUAL(paths.size(), 2U);
    BOOST_CHECK_EQUAL(paths[0], "a.vy");

    const UniValue& doc = input.Document();
    BOOST_CHECK_EQUAL(find_value(doc, "language").get_str(), "Vyper");
    const UniValue& settings = find_value(doc, "settings");
    BOOST_CHECK_EQUAL(find_value(settings, "evmVersion").get_str(), "paris");
    BOOST_CHECK(find_value(settings, "optimizer").isNull());
    // vyper selects outputs per file
    BOOST_CHECK(find_value(find_value(settings, "outputSelection"), "*").isArray());
}

BOOST_AUTO_TEST_CASE(from_standard_json)
{
    CompilerInput input = CompilerInput::FromStandardJson(
        R"({"language":"Solidity","sources":{"A.sol":{"content":"contract A {}"}},)"
        R"("settings":{"remappings":["@oz/=lib/oz/"],"outputSelection":{"A.sol":{"A":["ir"]}}}})");
    BOOST_CHECK(input.GetLanguage() == Language::SOLIDITY);
    const UniValue& settings = find_value(input.Document(), "settings");
    BOOST_CHECK_EQUAL(find_value(settings, "remappings").size(), 1U);
    const UniValue& selection = find_value(find_value(settings, "outputSelection"), "*");
    BOOST_REQUIRE(selection.isObject());
    BOOST_CHECK_EQUAL(find_value(selection, "*").size(), 4U);
    BOOST_CHECK(!find_value(settings, "outputSelection").exists("A.sol"));
}

BOOST_AUTO_TEST_CASE(invalid_standard_json)
{
    BOOST_CHECK_THROW(CompilerInput::FromStandardJson("[]"), InvalidCompilerInput);
    BOOST_CHECK_THROW(CompilerInput::FromStandardJson(R"({"sources":{"A.sol":{}}})"), InvalidCompilerInput);
    BOOST_CHECK_THROW(CompilerInput::FromStandardJson(R"({"language":"Yul","sources":{"A.yul":{}}})"), InvalidCompilerInput);
    BOOST_CHECK_THROW(CompilerInput::FromStandardJson(R"({"language":"Solidity","sources":{}})"), InvalidCompilerInput);
    BOOST_CHECK_THROW(CompilerInput::FromStandardJson(R"({"language":"Solidity","sources":{"A.sol":{}},"settings":1})"), InvalidCompilerInput);
}

BOOST_AUTO_TEST_CASE(parse_output)
{
    CompilerOutput output = CompilerOutput::Parse(R"({
        "errors": [{"severity": "warning", "type": "Warning", "message": "shadowed"}],
        "contracts": {
            "b.sol": {"B": {"abi": [], "evm": {"bytecode": {"object": "6080"}, "deployedBytecode": {"object": "6040"}}}},
            "a.sol": {
                "Lib": {"abi": [], "evm": {"bytecode": {"object": "60__$1234$__"}, "deployedBytecode": {"object": "60"}}},
                "I": {"abi": []},
                "A": {"abi": [{"type": "constructor"}], "evm": {"bytecode": {"object": "0x6001"}, "deployedBytecode": {"object": "6002"}}}
            }
        }
    })");
    BOOST_CHECK(!output.HasErrors());
    BOOST_REQUIRE_EQUAL(output.contracts.size(), 2U);
    BOOST_CHECK_EQUAL(output.contracts[0].file_path, "a.sol");
    BOOST_CHECK_EQUAL(output.contracts[0].name, "A");
    BOOST_CHECK_EQUAL(output.contracts[0].creation_code.size(), 2U);
    BOOST_CHECK_EQUAL(output.contracts[1].name, "B");

    CompilerOutput failed = CompilerOutput::Parse(
        R"({"errors":[{"severity":"error","type":"TypeError","message":"bad","formattedMessage":"TypeError: bad"},)"
        R"({"severity":"error","type":"DeclarationError","message":"undeclared"}]})");
    BOOST_CHECK(failed.HasErrors());
    BOOST_CHECK_EQUAL(failed.ErrorText(), "TypeError: bad\nundeclared");

    BOOST_CHECK_THROW(CompilerOutput::Parse("Error: no input"), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
