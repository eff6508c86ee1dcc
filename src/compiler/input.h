// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_COMPILER_INPUT_H
#define SCVERIFY_COMPILER_INPUT_H

/**
 * @file input.h
 * @brief Standard JSON compiler input and output
 */

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <univalue.h>

namespace scverify {

enum class Language {
    SOLIDITY,
    VYPER,
};

/** "Solidity" or "Vyper", as used in the standard JSON "language" field */
std::string LanguageToString(Language language);
/** Lower-case name used for configuration and URLs */
std::string LanguageName(Language language);

/** A standard JSON document that cannot be used as compiler input */
class InvalidCompilerInput : public std::runtime_error
{
public:
    explicit InvalidCompilerInput(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Compiler input in the standard JSON format, ready to be piped to
 * `<compiler> --standard-json`. The optimizer is left unset and the output
 * selection is always the one bytecode matching needs.
 */
class CompilerInput
{
public:
    /** Input for a set of source files; iteration follows path order */
    static CompilerInput FromSources(Language language, const std::map<std::string, std::string>& sources,
                                     const std::optional<std::string>& evmVersion);

    /**
     * Take a complete standard JSON input as submitted, replacing its output
     * selection.
     * @throws InvalidCompilerInput if it is not an object with language and sources
     */
    static CompilerInput FromStandardJson(const std::string& json);

    Language GetLanguage() const { return language_; }

    /** Source paths in the order the compiler sees them */
    std::vector<std::string> SourcePaths() const;

    const UniValue& Document() const { return doc_; }
    std::string ToJSON() const { return doc_.write(); }

private:
    CompilerInput(Language language, UniValue doc) : language_(language), doc_(std::move(doc)) {}

    static UniValue OutputSelection(Language language);

    Language language_;
    UniValue doc_;
};

struct CompilerDiagnostic
{
    std::string severity;
    std::string type;
    std::string message;
    std::string formatted;
};

struct CompiledContract
{
    std::string file_path;
    std::string name;
    UniValue abi;
    std::vector<unsigned char> creation_code;
    std::vector<unsigned char> runtime_code;
};

/** Parsed standard JSON output */
struct CompilerOutput
{
    std::vector<CompilerDiagnostic> diagnostics;
    //! ordered by (file path, contract name)
    std::vector<CompiledContract> contracts;

    bool HasErrors() const;

    /** formattedMessage (or message) of every error, joined by newlines */
    std::string ErrorText() const;

    /**
     * @throws std::runtime_error if json is not a standard JSON output document
     */
    static CompilerOutput Parse(const std::string& json);
};

} // namespace scverify

#endif // SCVERIFY_COMPILER_INPUT_H
