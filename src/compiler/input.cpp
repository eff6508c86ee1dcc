// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/input.h>

#include <util.h>
#include <utilstrencodings.h>

namespace scverify {

std::string LanguageToString(Language language)
{
    switch (language) {
    case Language::SOLIDITY: return "Solidity";
    case Language::VYPER: return "Vyper";
    }
    return "";
}

std::string LanguageName(Language language)
{
    return ToLower(LanguageToString(language));
}

UniValue CompilerInput::OutputSelection(Language language)
{
    UniValue outputs(UniValue::VARR);
    outputs.push_back("abi");
    outputs.push_back("evm.bytecode");
    outputs.push_back("evm.deployedBytecode");

    UniValue selection(UniValue::VOBJ);
    if (language == Language::VYPER) {
        selection.pushKV("*", outputs);
    } else {
        outputs.push_back("evm.methodIdentifiers");
        UniValue perContract(UniValue::VOBJ);
        perContract.pushKV("*", outputs);
        selection.pushKV("*", perContract);
    }
    return selection;
}

CompilerInput CompilerInput::FromSources(Language language, const std::map<std::string, std::string>& sources,
                                         const std::optional<std::string>& evmVersion)
{
    UniValue sourcesObj(UniValue::VOBJ);
    for (const auto& source : sources) {
        UniValue content(UniValue::VOBJ);
        content.pushKV("content", source.second);
        sourcesObj.pushKV(source.first, content);
    }

    UniValue settings(UniValue::VOBJ);
    if (evmVersion) {
        settings.pushKV("evmVersion", *evmVersion);
    }
    settings.pushKV("outputSelection", OutputSelection(language));

    UniValue doc(UniValue::VOBJ);
    doc.pushKV("language", LanguageToString(language));
    doc.pushKV("sources", sourcesObj);
    doc.pushKV("settings", settings);
    return CompilerInput(language, doc);
}

CompilerInput CompilerInput::FromStandardJson(const std::string& json)
{
    UniValue input;
    if (!input.read(json) || !input.isObject()) {
        throw InvalidCompilerInput("compiler input is not a JSON object");
    }
    const UniValue& language = find_value(input, "language");
    if (!language.isStr()) {
        throw InvalidCompilerInput("compiler input has no language");
    }
    Language lang;
    if (language.get_str() == "Solidity") {
        lang = Language::SOLIDITY;
    } else if (language.get_str() == "Vyper") {
        lang = Language::VYPER;
    } else {
        throw InvalidCompilerInput("unsupported language " + language.get_str());
    }
    const UniValue& sources = find_value(input, "sources");
    if (!sources.isObject() || sources.empty()) {
        throw InvalidCompilerInput("compiler input has no sources");
    }
    const UniValue& settingsIn = find_value(input, "settings");
    if (!settingsIn.isNull() && !settingsIn.isObject()) {
        throw InvalidCompilerInput("compiler input settings must be an object");
    }

    // Copy settings but force the output selection
    UniValue settings(UniValue::VOBJ);
    if (settingsIn.isObject()) {
        const std::vector<std::string>& keys = settingsIn.getKeys();
        const std::vector<UniValue>& values = settingsIn.getValues();
        for (size_t i = 0; i < keys.size(); ++i) {
            if (keys[i] != "outputSelection") {
                settings.pushKV(keys[i], values[i]);
            }
        }
    }
    settings.pushKV("outputSelection", OutputSelection(lang));

    UniValue doc(UniValue::VOBJ);
    doc.pushKV("language", language);
    doc.pushKV("sources", sources);
    doc.pushKV("settings", settings);
    return CompilerInput(lang, doc);
}

std::vector<std::string> CompilerInput::SourcePaths() const
{
    return find_value(doc_, "sources").getKeys();
}

bool CompilerOutput::HasErrors() const
{
    for (const CompilerDiagnostic& diagnostic : diagnostics) {
        if (diagnostic.severity == "error") return true;
    }
    return false;
}

std::string CompilerOutput::ErrorText() const
{
    std::string text;
    for (const CompilerDiagnostic& diagnostic : diagnostics) {
        if (diagnostic.severity != "error") continue;
        if (!text.empty()) text += "\n";
        text += diagnostic.formatted.empty() ? diagnostic.message : diagnostic.formatted;
    }
    return text;
}

static std::string GetStr(const UniValue& obj, const std::string& key)
{
    const UniValue& value = find_value(obj, key);
    return value.isStr() ? value.get_str() : std::string();
}

/** Bytecode object of an "evm.bytecode" style entry; false if absent or unlinked */
static bool GetBytecode(const UniValue& evm, const std::string& key, std::vector<unsigned char>& out)
{
    const UniValue& bytecode = find_value(evm, key);
    if (!bytecode.isObject()) {
        return false;
    }
    const UniValue& object = find_value(bytecode, "object");
    if (!object.isStr()) {
        return false;
    }
    return DecodeHexBytes(object.get_str(), out);
}

CompilerOutput CompilerOutput::Parse(const std::string& json)
{
    UniValue doc;
    if (!doc.read(json) || !doc.isObject()) {
        throw std::runtime_error("compiler output is not a JSON object");
    }

    CompilerOutput output;
    const UniValue& errors = find_value(doc, "errors");
    if (errors.isArray()) {
        for (size_t i = 0; i < errors.size(); ++i) {
            const UniValue& error = errors[i];
            if (!error.isObject()) continue;
            CompilerDiagnostic diagnostic;
            diagnostic.severity = GetStr(error, "severity");
            diagnostic.type = GetStr(error, "type");
            diagnostic.message = GetStr(error, "message");
            diagnostic.formatted = GetStr(error, "formattedMessage");
            output.diagnostics.push_back(diagnostic);
        }
    }

    const UniValue& contracts = find_value(doc, "contracts");
    if (!contracts.isNull() && !contracts.isObject()) {
        throw std::runtime_error("compiler output contracts must be an object");
    }
    std::map<std::pair<std::string, std::string>, CompiledContract> sorted;
    if (contracts.isObject()) {
        const std::vector<std::string>& files = contracts.getKeys();
        for (size_t i = 0; i < files.size(); ++i) {
            const UniValue& fileContracts = contracts.getValues()[i];
            if (!fileContracts.isObject()) continue;
            const std::vector<std::string>& names = fileContracts.getKeys();
            for (size_t j = 0; j < names.size(); ++j) {
                const UniValue& artifact = fileContracts.getValues()[j];
                const UniValue& evm = find_value(artifact, "evm");
                CompiledContract contract;
                contract.file_path = files[i];
                contract.name = names[j];
                contract.abi = find_value(artifact, "abi");
                if (!evm.isObject() ||
                    !GetBytecode(evm, "bytecode", contract.creation_code) ||
                    !GetBytecode(evm, "deployedBytecode", contract.runtime_code)) {
                    LogPrint(BCLog::COMPILER, "Skipping %s:%s without usable bytecode\n", files[i], names[j]);
                    continue;
                }
                sorted[std::make_pair(contract.file_path, contract.name)] = std::move(contract);
            }
        }
    }
    for (auto& entry : sorted) {
        output.contracts.push_back(std::move(entry.second));
    }
    return output;
}

} // namespace scverify
