// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verifier/bytecode.h>

#include <algorithm>

namespace scverify {

std::string MatchTypeToString(MatchType type)
{
    switch (type) {
    case MatchType::FULL: return "FULL";
    case MatchType::PARTIAL: return "PARTIAL";
    }
    return "";
}

std::optional<MetadataRegion> FindMetadata(const Bytecode& code)
{
    if (code.size() < 3) {
        return std::nullopt;
    }
    size_t length = ((size_t)code[code.size() - 2] << 8) | code[code.size() - 1];
    if (length == 0 || length + 2 > code.size()) {
        return std::nullopt;
    }
    MetadataRegion region;
    region.offset = code.size() - 2 - length;
    region.size = length + 2;
    // CBOR major type 5 (map)
    unsigned char header = code[region.offset];
    if (header < 0xa0 || header > 0xbf) {
        return std::nullopt;
    }
    return region;
}

std::optional<MatchType> CompareRuntime(const Bytecode& deployed, const Bytecode& compiled)
{
    if (deployed.empty() || compiled.empty()) {
        return std::nullopt;
    }
    if (deployed == compiled) {
        return MatchType::FULL;
    }
    std::optional<MetadataRegion> deployedMeta = FindMetadata(deployed);
    std::optional<MetadataRegion> compiledMeta = FindMetadata(compiled);
    if (!deployedMeta || !compiledMeta || deployedMeta->offset != compiledMeta->offset) {
        return std::nullopt;
    }
    if (std::equal(deployed.begin(), deployed.begin() + deployedMeta->offset, compiled.begin())) {
        return MatchType::PARTIAL;
    }
    return std::nullopt;
}

static bool StartsWith(const Bytecode& data, const Bytecode& prefix)
{
    return data.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), data.begin());
}

std::optional<CreationMatch> CompareCreation(const Bytecode& creationInput, const Bytecode& compiledCreation,
                                             const Bytecode& compiledRuntime, const Bytecode& deployedRuntime)
{
    if (compiledCreation.empty()) {
        return std::nullopt;
    }
    if (StartsWith(creationInput, compiledCreation)) {
        CreationMatch match;
        match.type = MatchType::FULL;
        match.constructor_args.assign(creationInput.begin() + compiledCreation.size(), creationInput.end());
        return match;
    }

    std::optional<MetadataRegion> runtimeMeta = FindMetadata(compiledRuntime);
    std::optional<MetadataRegion> deployedMeta = FindMetadata(deployedRuntime);
    if (!runtimeMeta || !deployedMeta || runtimeMeta->size != deployedMeta->size) {
        return std::nullopt;
    }

    // The runtime code, and with it its metadata, is embedded in the creation code
    const Bytecode::const_iterator metaBegin = compiledRuntime.begin() + runtimeMeta->offset;
    const Bytecode::const_iterator metaEnd = metaBegin + runtimeMeta->size;
    Bytecode::const_iterator found = std::find_end(compiledCreation.begin(), compiledCreation.end(), metaBegin, metaEnd);
    if (found == compiledCreation.end()) {
        return std::nullopt;
    }

    Bytecode substituted(compiledCreation);
    std::copy(deployedRuntime.begin() + deployedMeta->offset, deployedRuntime.end(),
              substituted.begin() + (found - compiledCreation.begin()));
    if (!StartsWith(creationInput, substituted)) {
        return std::nullopt;
    }
    CreationMatch match;
    match.type = MatchType::PARTIAL;
    match.constructor_args.assign(creationInput.begin() + substituted.size(), creationInput.end());
    return match;
}

} // namespace scverify
