// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_VERIFIER_VERIFIER_H
#define SCVERIFY_VERIFIER_VERIFIER_H

/**
 * @file verifier.h
 * @brief Contract verification
 *
 * Compiles the submitted sources with the requested compiler version and
 * searches the output for a contract matching the deployed bytecode.
 */

#include <compiler/input.h>
#include <compiler/version.h>
#include <verifier/bytecode.h>

#include <optional>
#include <stdexcept>
#include <string>

#include <univalue.h>

class CThreadInterrupt;

namespace scverify {

class CompilerManager;
class CompilerRunner;

enum class ErrorKind {
    VERSION_NOT_FOUND,
    FETCH_UNAVAILABLE,
    CORRUPT_ARTIFACT,
    COMPILATION_FAILED,
    NO_MATCHING_CONTRACTS,
    INVALID_REQUEST,
    CANCELLED,
};

std::string ErrorKindToString(ErrorKind kind);

/** Typed failure of a verification request */
class VerificationError : public std::runtime_error
{
public:
    VerificationError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/** Outcome of a successful verification. Never modified once built. */
struct VerificationSuccess
{
    std::string file_path;
    std::string contract_name;
    UniValue abi;
    std::string compiler_version;
    MatchType match_type;
    //! compiled runtime code of the matched contract
    Bytecode local_runtime_code;
    //! compiled creation code of the matched contract
    Bytecode local_creation_code;
    //! set only when creation bytecode was submitted
    std::optional<Bytecode> constructor_args;
    //! the standard JSON input the compiler was run with
    UniValue compiler_input;
    std::optional<std::string> chain_id;

    UniValue ToJSON() const;
};

/**
 * Compiles a source submission with one compiler version and looks for the
 * contract whose bytecode matches the deployed one.
 *
 * When several contracts match, full matches win over partial ones; among
 * equals the first in (source path, contract name) order is returned.
 */
class ContractVerifier
{
public:
    /**
     * @throws VerificationError(INVALID_REQUEST) on an unparsable version or
     *         empty deployed bytecode
     */
    ContractVerifier(CompilerManager& manager, CompilerRunner& runner, const std::string& compilerVersion,
                     std::optional<Bytecode> creationBytecode, Bytecode deployedBytecode,
                     std::optional<std::string> chainId);

    /**
     * @param interrupt cancels the compiler run, may be null
     * @throws VerificationError
     */
    VerificationSuccess Verify(const CompilerInput& input, const CThreadInterrupt* interrupt = nullptr) const;

private:
    CompilerManager& manager_;
    CompilerRunner& runner_;
    const CompilerVersion version_;
    const std::optional<Bytecode> creationBytecode_;
    const Bytecode deployedBytecode_;
    const std::optional<std::string> chainId_;
};

} // namespace scverify

#endif // SCVERIFY_VERIFIER_VERIFIER_H
