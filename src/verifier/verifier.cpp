// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verifier/verifier.h>

#include <compiler/manager.h>
#include <compiler/runner.h>
#include <util.h>
#include <utilstrencodings.h>

namespace scverify {

std::string ErrorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::VERSION_NOT_FOUND: return "VersionNotFound";
    case ErrorKind::FETCH_UNAVAILABLE: return "FetchUnavailable";
    case ErrorKind::CORRUPT_ARTIFACT: return "CorruptArtifact";
    case ErrorKind::COMPILATION_FAILED: return "CompilationFailed";
    case ErrorKind::NO_MATCHING_CONTRACTS: return "NoMatchingContracts";
    case ErrorKind::INVALID_REQUEST: return "InvalidRequest";
    case ErrorKind::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

static ErrorKind FromFetchErrorKind(FetchErrorKind kind)
{
    switch (kind) {
    case FetchErrorKind::VERSION_NOT_FOUND: return ErrorKind::VERSION_NOT_FOUND;
    case FetchErrorKind::FETCH_UNAVAILABLE: return ErrorKind::FETCH_UNAVAILABLE;
    case FetchErrorKind::CORRUPT_ARTIFACT: return ErrorKind::CORRUPT_ARTIFACT;
    }
    return ErrorKind::FETCH_UNAVAILABLE;
}

static std::string HexWithPrefix(const Bytecode& code)
{
    return "0x" + HexStr(code);
}

UniValue VerificationSuccess::ToJSON() const
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("fileName", file_path);
    result.pushKV("contractName", contract_name);
    result.pushKV("compilerVersion", compiler_version);
    result.pushKV("matchType", MatchTypeToString(match_type));
    result.pushKV("abi", abi.isNull() ? UniValue(UniValue::VNULL) : UniValue(abi.write()));
    if (constructor_args) {
        result.pushKV("constructorArguments", HexWithPrefix(*constructor_args));
    } else {
        result.pushKV("constructorArguments", NullUniValue);
    }
    result.pushKV("localCreationInput", HexWithPrefix(local_creation_code));
    result.pushKV("localDeployedBytecode", HexWithPrefix(local_runtime_code));
    result.pushKV("compilerInput", compiler_input);
    if (chain_id) {
        result.pushKV("chainId", *chain_id);
    }
    return result;
}

static CompilerVersion ParseRequestedVersion(const std::string& str)
{
    std::optional<CompilerVersion> version = CompilerVersion::Parse(str);
    if (!version) {
        throw VerificationError(ErrorKind::INVALID_REQUEST, strprintf("invalid compiler version '%s'", str));
    }
    return *version;
}

ContractVerifier::ContractVerifier(CompilerManager& manager, CompilerRunner& runner, const std::string& compilerVersion,
                                   std::optional<Bytecode> creationBytecode, Bytecode deployedBytecode,
                                   std::optional<std::string> chainId)
    : manager_(manager),
      runner_(runner),
      version_(ParseRequestedVersion(compilerVersion)),
      creationBytecode_(std::move(creationBytecode)),
      deployedBytecode_(std::move(deployedBytecode)),
      chainId_(std::move(chainId))
{
    if (deployedBytecode_.empty()) {
        throw VerificationError(ErrorKind::INVALID_REQUEST, "deployed bytecode is empty");
    }
    if (creationBytecode_ && creationBytecode_->empty()) {
        throw VerificationError(ErrorKind::INVALID_REQUEST, "creation bytecode is empty");
    }
}

VerificationSuccess ContractVerifier::Verify(const CompilerInput& input, const CThreadInterrupt* interrupt) const
{
    Compiler compiler = [&]() {
        try {
            return manager_.GetCompiler(version_);
        } catch (const FetchError& e) {
            throw VerificationError(FromFetchErrorKind(e.Kind()), e.what());
        }
    }();

    std::string rawOutput;
    try {
        rawOutput = runner_.Run(compiler, input, interrupt);
    } catch (const CompilerRunError& e) {
        ErrorKind kind = e.GetKind() == CompilerRunError::CANCELLED ? ErrorKind::CANCELLED : ErrorKind::COMPILATION_FAILED;
        throw VerificationError(kind, e.what());
    }

    CompilerOutput output;
    try {
        output = CompilerOutput::Parse(rawOutput);
    } catch (const std::runtime_error& e) {
        throw VerificationError(ErrorKind::COMPILATION_FAILED, strprintf("%s: %s", e.what(), rawOutput));
    }
    if (output.HasErrors()) {
        throw VerificationError(ErrorKind::COMPILATION_FAILED, output.ErrorText());
    }

    const CompiledContract* best = nullptr;
    MatchType bestType = MatchType::PARTIAL;
    std::optional<Bytecode> bestArgs;
    for (const CompiledContract& contract : output.contracts) {
        std::optional<MatchType> runtime = CompareRuntime(deployedBytecode_, contract.runtime_code);
        if (!runtime) continue;

        MatchType type = *runtime;
        std::optional<Bytecode> args;
        if (creationBytecode_) {
            std::optional<CreationMatch> creation = CompareCreation(*creationBytecode_, contract.creation_code,
                                                                    contract.runtime_code, deployedBytecode_);
            if (!creation) continue;
            if (creation->type == MatchType::PARTIAL) type = MatchType::PARTIAL;
            args = creation->constructor_args;
        }

        LogPrint(BCLog::VERIFY, "%s:%s matches as %s\n", contract.file_path, contract.name, MatchTypeToString(type));
        // Contracts arrive in (path, name) order, so the first of a grade wins
        if (!best || (type == MatchType::FULL && bestType == MatchType::PARTIAL)) {
            best = &contract;
            bestType = type;
            bestArgs = args;
        }
        if (bestType == MatchType::FULL) break;
    }

    if (!best) {
        throw VerificationError(ErrorKind::NO_MATCHING_CONTRACTS, "No contract could be verified with provided data");
    }

    VerificationSuccess success;
    success.file_path = best->file_path;
    success.contract_name = best->name;
    success.abi = best->abi;
    success.compiler_version = version_.ToString();
    success.match_type = bestType;
    success.local_runtime_code = best->runtime_code;
    success.local_creation_code = best->creation_code;
    success.constructor_args = bestArgs;
    success.compiler_input = input.Document();
    success.chain_id = chainId_;

    LogPrint(BCLog::VERIFY, "Verified %s:%s with %s (%s match)\n", success.file_path, success.contract_name,
             success.compiler_version, MatchTypeToString(success.match_type));
    return success;
}

} // namespace scverify
