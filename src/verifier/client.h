// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_VERIFIER_CLIENT_H
#define SCVERIFY_VERIFIER_CLIENT_H

/**
 * @file client.h
 * @brief Per-language verification entry points
 */

#include <compiler/input.h>
#include <verifier/verifier.h>

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

class CThreadInterrupt;

namespace scverify {

class CompilerManager;
class CompilerRunner;

/** Hook run after every successful verification */
class Middleware
{
public:
    virtual ~Middleware() {}

    /** @throws std::exception on failure */
    virtual void OnSuccess(const VerificationSuccess& success) = 0;
};

enum class MiddlewarePolicy {
    //! log middleware failures and return the success anyway
    FAIL_OPEN,
    //! report middleware failures to the caller
    FAIL_CLOSED,
};

/** Middleware failed under MiddlewarePolicy::FAIL_CLOSED */
class MiddlewareError : public std::runtime_error
{
public:
    explicit MiddlewareError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Source files keyed by path, with an optional EVM target */
struct MultiFileContent
{
    std::map<std::string, std::string> sources;
    std::optional<std::string> evm_version;
};

/** A complete standard JSON compiler input document */
struct StandardJsonContent
{
    std::string input;
};

struct VerificationRequest
{
    Bytecode deployed_bytecode;
    std::optional<Bytecode> creation_bytecode;
    std::string compiler_version;
    std::variant<MultiFileContent, StandardJsonContent> content;
    std::optional<std::string> chain_id;
};

/** Verification entry point for one language */
class Client
{
public:
    Client(Language language, std::shared_ptr<CompilerManager> compilers, std::shared_ptr<CompilerRunner> runner,
           std::shared_ptr<Middleware> middleware = nullptr,
           MiddlewarePolicy policy = MiddlewarePolicy::FAIL_OPEN);

    /**
     * Compile and match a request, then hand the success to the middleware.
     * @throws VerificationError, or MiddlewareError with FAIL_CLOSED
     */
    VerificationSuccess Verify(const VerificationRequest& request, const CThreadInterrupt* interrupt = nullptr);

    Language GetLanguage() const { return language_; }
    CompilerManager& Compilers() { return *compilers_; }

private:
    CompilerInput BuildInput(const VerificationRequest& request) const;

    const Language language_;
    std::shared_ptr<CompilerManager> compilers_;
    std::shared_ptr<CompilerRunner> runner_;
    std::shared_ptr<Middleware> middleware_;
    const MiddlewarePolicy policy_;
};

} // namespace scverify

#endif // SCVERIFY_VERIFIER_CLIENT_H
