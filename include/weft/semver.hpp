#pragma once

#include <weft/result.hpp>
#include <optional>
#include <string>

namespace weft {

// Semantic version: [v]major.minor.patch[-prerelease][+build]
struct SemVer {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;  // e.g. "alpha.1", empty for a release
    std::string build;       // metadata, ignored for ordering

    static Result<SemVer> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const { return !prerelease.empty(); }

    // <0, 0 or >0 by semver precedence
    int compare(const SemVer& o) const;

    bool operator==(const SemVer& o) const;
    bool operator!=(const SemVer& o) const;
    bool operator<(const SemVer& o) const;
    bool operator<=(const SemVer& o) const;
    bool operator>(const SemVer& o) const;
    bool operator>=(const SemVer& o) const;
};

// Range operand: "1", "1.2", "1.2.3", "1.x", "*". Unset or wildcard
// components are -1.
struct PartialVersion {
    int major = -1;
    int minor = -1;
    int patch = -1;
    std::string prerelease;

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;

    bool is_wildcard() const { return major < 0; }
    bool is_full() const { return patch >= 0; }

    // First version of the block named by this partial (missing parts are 0)
    SemVer floor() const;

    // First version after the block; nullopt for a wildcard or when no
    // version lies above it. Only meaningful for partials.
    std::optional<SemVer> block_end() const;
};

// Release that follows every version sharing the first `depth` components
// (1..3) of `v`. A component already at INT_MAX carries into the one before
// it; nullopt once the major component is exhausted too.
std::optional<SemVer> next_release(const SemVer& v, int depth);

} // namespace weft
