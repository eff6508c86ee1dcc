// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/version.h>

#include <utilstrencodings.h>

#include <tuple>
#include <vector>

namespace scverify {

namespace {

bool ParseNumber(const std::string& str, uint64_t& out)
{
    if (str.empty() || str.size() > 18) {
        return false;
    }
    // no leading zeroes except for "0" itself
    if (str.size() > 1 && str[0] == '0') {
        return false;
    }
    uint64_t n = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        n = n * 10 + (c - '0');
    }
    out = n;
    return true;
}

bool IsIdentifierChar(char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
}

/** dot separated, non-empty identifiers of [0-9A-Za-z-] */
bool IsValidDotted(const std::string& str)
{
    if (str.empty()) {
        return false;
    }
    for (const std::string& part : SplitString(str, '.')) {
        if (part.empty()) {
            return false;
        }
        for (char c : part) {
            if (!IsIdentifierChar(c)) {
                return false;
            }
        }
    }
    return true;
}

bool IsNumeric(const std::string& str)
{
    if (str.empty()) return false;
    for (char c : str) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

/** Semver 2.0 pre-release precedence; an empty pre-release ranks highest */
int ComparePrerelease(const std::string& a, const std::string& b)
{
    if (a == b) return 0;
    if (a.empty()) return 1;
    if (b.empty()) return -1;

    std::vector<std::string> pa = SplitString(a, '.');
    std::vector<std::string> pb = SplitString(b, '.');
    for (size_t i = 0; i < pa.size() && i < pb.size(); ++i) {
        const std::string& x = pa[i];
        const std::string& y = pb[i];
        if (x == y) continue;
        bool xn = IsNumeric(x), yn = IsNumeric(y);
        if (xn && yn) {
            if (x.size() != y.size()) return x.size() < y.size() ? -1 : 1;
            return x < y ? -1 : 1;
        }
        if (xn) return -1;
        if (yn) return 1;
        return x < y ? -1 : 1;
    }
    if (pa.size() == pb.size()) return 0;
    return pa.size() < pb.size() ? -1 : 1;
}

} // anonymous namespace

std::optional<CompilerVersion> CompilerVersion::Parse(const std::string& strIn)
{
    std::string str = TrimString(strIn);
    if (!str.empty() && (str[0] == 'v' || str[0] == 'V')) {
        str = str.substr(1);
    }

    CompilerVersion version;

    std::string::size_type plus = str.find('+');
    if (plus != std::string::npos) {
        version.build_ = str.substr(plus + 1);
        str = str.substr(0, plus);
        if (!IsValidDotted(version.build_)) {
            return std::nullopt;
        }
    }

    std::string::size_type dash = str.find('-');
    if (dash != std::string::npos) {
        version.prerelease_ = str.substr(dash + 1);
        str = str.substr(0, dash);
        if (!IsValidDotted(version.prerelease_)) {
            return std::nullopt;
        }
    }

    std::vector<std::string> numbers = SplitString(str, '.');
    if (numbers.size() != 3) {
        return std::nullopt;
    }
    if (!ParseNumber(numbers[0], version.major_) ||
        !ParseNumber(numbers[1], version.minor_) ||
        !ParseNumber(numbers[2], version.patch_)) {
        return std::nullopt;
    }
    return version;
}

std::string CompilerVersion::ToString() const
{
    std::string str = std::to_string(major_) + "." + std::to_string(minor_) + "." + std::to_string(patch_);
    if (!prerelease_.empty()) {
        str += "-" + prerelease_;
    }
    if (!build_.empty()) {
        str += "+" + build_;
    }
    return str;
}

bool operator==(const CompilerVersion& a, const CompilerVersion& b)
{
    return std::tie(a.major_, a.minor_, a.patch_, a.prerelease_, a.build_) ==
           std::tie(b.major_, b.minor_, b.patch_, b.prerelease_, b.build_);
}

bool operator<(const CompilerVersion& a, const CompilerVersion& b)
{
    if (std::tie(a.major_, a.minor_, a.patch_) != std::tie(b.major_, b.minor_, b.patch_)) {
        return std::tie(a.major_, a.minor_, a.patch_) < std::tie(b.major_, b.minor_, b.patch_);
    }
    int pre = ComparePrerelease(a.prerelease_, b.prerelease_);
    if (pre != 0) {
        return pre < 0;
    }
    return a.build_ < b.build_;
}

} // namespace scverify
