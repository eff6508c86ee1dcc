// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_VERIFIER_BYTECODE_H
#define SCVERIFY_VERIFIER_BYTECODE_H

/**
 * @file bytecode.h
 * @brief Bytecode comparison
 *
 * Compares compiled creation and runtime code with on-chain bytecode. A match
 * is Full when the code is identical and Partial when only the metadata region
 * appended by the compiler differs. Anything following the compiled creation
 * code is returned as constructor arguments.
 */

#include <optional>
#include <string>
#include <vector>

namespace scverify {

typedef std::vector<unsigned char> Bytecode;

enum class MatchType {
    //! byte for byte identical
    FULL,
    //! identical apart from the metadata hash
    PARTIAL,
};

std::string MatchTypeToString(MatchType type);

/** Position of the CBOR metadata suffix compilers append to runtime code */
struct MetadataRegion
{
    size_t offset;
    size_t size;
};

/**
 * Locate the metadata suffix: a CBOR map followed by its two byte big-endian
 * length, at the very end of the code. std::nullopt if the code has none.
 */
std::optional<MetadataRegion> FindMetadata(const Bytecode& code);

/** Grade a deployed runtime bytecode against a compiled one */
std::optional<MatchType> CompareRuntime(const Bytecode& deployed, const Bytecode& compiled);

struct CreationMatch
{
    MatchType type;
    //! bytes following the compiled creation code
    Bytecode constructor_args;
};

/**
 * Grade creation input against compiled creation code. The compiled runtime
 * and the deployed runtime are used to find and substitute the metadata hash
 * embedded in the creation code.
 */
std::optional<CreationMatch> CompareCreation(const Bytecode& creationInput, const Bytecode& compiledCreation,
                                             const Bytecode& compiledRuntime, const Bytecode& deployedRuntime);

} // namespace scverify

#endif // SCVERIFY_VERIFIER_BYTECODE_H
