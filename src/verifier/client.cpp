// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verifier/client.h>

#include <compiler/manager.h>
#include <compiler/runner.h>
#include <util.h>

namespace scverify {

Client::Client(Language language, std::shared_ptr<CompilerManager> compilers, std::shared_ptr<CompilerRunner> runner,
               std::shared_ptr<Middleware> middleware, MiddlewarePolicy policy)
    : language_(language),
      compilers_(std::move(compilers)),
      runner_(std::move(runner)),
      middleware_(std::move(middleware)),
      policy_(policy)
{
}

CompilerInput Client::BuildInput(const VerificationRequest& request) const
{
    if (const MultiFileContent* files = std::get_if<MultiFileContent>(&request.content)) {
        if (files->sources.empty()) {
            throw VerificationError(ErrorKind::INVALID_REQUEST, "no source files");
        }
        return CompilerInput::FromSources(language_, files->sources, files->evm_version);
    }

    const StandardJsonContent& standard = std::get<StandardJsonContent>(request.content);
    try {
        CompilerInput input = CompilerInput::FromStandardJson(standard.input);
        if (input.GetLanguage() != language_) {
            throw VerificationError(ErrorKind::INVALID_REQUEST,
                strprintf("expected %s input, got %s", LanguageToString(language_), LanguageToString(input.GetLanguage())));
        }
        return input;
    } catch (const InvalidCompilerInput& e) {
        throw VerificationError(ErrorKind::INVALID_REQUEST, e.what());
    }
}

VerificationSuccess Client::Verify(const VerificationRequest& request, const CThreadInterrupt* interrupt)
{
    CompilerInput input = BuildInput(request);
    ContractVerifier verifier(*compilers_, *runner_, request.compiler_version, request.creation_bytecode,
                              request.deployed_bytecode, request.chain_id);
    VerificationSuccess success = verifier.Verify(input, interrupt);

    if (middleware_) {
        try {
            middleware_->OnSuccess(success);
        } catch (const std::exception& e) {
            if (policy_ == MiddlewarePolicy::FAIL_CLOSED) {
                throw MiddlewareError(strprintf("middleware failed: %s", e.what()));
            }
            LogPrintf("%s: middleware failed for %s:%s: %s\n", __func__, success.file_path, success.contract_name, e.what());
        }
    }
    return success;
}

} // namespace scverify
