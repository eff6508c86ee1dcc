// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_COMPILER_VERSION_H
#define SCVERIFY_COMPILER_VERSION_H

/**
 * @file version.h
 * @brief Compiler versions and their ordering
 */

#include <stdint.h>
#include <optional>
#include <string>

namespace scverify {

/**
 * Compiler release identifier, e.g. "0.8.7+commit.e28d00a7" or
 * "0.8.8-nightly.2021.9.9+commit.dea1b9ec". A leading 'v' is accepted on
 * input and dropped.
 *
 * Ordering follows semantic versioning for the numeric and pre-release parts;
 * build metadata breaks the remaining ties lexicographically so the order is
 * total and agrees with equality.
 */
class CompilerVersion
{
public:
    /** Parse a version string; std::nullopt if it is not well formed */
    static std::optional<CompilerVersion> Parse(const std::string& str);

    uint64_t Major() const { return major_; }
    uint64_t Minor() const { return minor_; }
    uint64_t Patch() const { return patch_; }
    const std::string& Prerelease() const { return prerelease_; }
    const std::string& Build() const { return build_; }

    /** True for versions without a pre-release tag (no nightlies) */
    bool IsRelease() const { return prerelease_.empty(); }

    /** Canonical form, also used as the cache directory name */
    std::string ToString() const;

    friend bool operator==(const CompilerVersion& a, const CompilerVersion& b);
    friend bool operator<(const CompilerVersion& a, const CompilerVersion& b);

private:
    CompilerVersion() : major_(0), minor_(0), patch_(0) {}

    uint64_t major_;
    uint64_t minor_;
    uint64_t patch_;
    std::string prerelease_;
    std::string build_;
};

inline bool operator!=(const CompilerVersion& a, const CompilerVersion& b) { return !(a == b); }
inline bool operator>(const CompilerVersion& a, const CompilerVersion& b) { return b < a; }
inline bool operator<=(const CompilerVersion& a, const CompilerVersion& b) { return !(b < a); }
inline bool operator>=(const CompilerVersion& a, const CompilerVersion& b) { return !(a < b); }

} // namespace scverify

#endif // SCVERIFY_COMPILER_VERSION_H
