#include <weft/semver.hpp>
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <vector>

namespace weft {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static bool parse_component(const std::string& s, int& out) {
    if (!all_digits(s)) return false;
    try {
        out = std::stoi(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

static bool valid_identifiers(const std::string& s) {
    for (const auto& ident : split(s, '.')) {
        if (ident.empty()) return false;
        for (char c : ident) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
                return false;
            }
        }
    }
    return true;
}

static std::string strip_v(const std::string& s) {
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) return s.substr(1);
    return s;
}

// Splits "core-pre+build" into its three parts. Returns whether a '-'
// separator was present, so "1.0.0-" can be told apart from "1.0.0".
static bool split_suffixes(const std::string& s, std::string& core,
                           std::string& pre, std::string& build) {
    size_t plus = s.find('+');
    std::string head = s.substr(0, plus);
    if (plus != std::string::npos) build = s.substr(plus + 1);

    size_t dash = head.find('-');
    core = head.substr(0, dash);
    if (dash == std::string::npos) return false;
    pre = head.substr(dash + 1);
    return true;
}

// Prerelease precedence (semver 2.0, section 11)
static int compare_prerelease(const std::string& a, const std::string& b) {
    if (a == b) return 0;
    // a release outranks any prerelease of the same core
    if (a.empty()) return 1;
    if (b.empty()) return -1;

    auto ia = split(a, '.');
    auto ib = split(b, '.');
    size_t n = std::min(ia.size(), ib.size());
    for (size_t i = 0; i < n; ++i) {
        bool na = all_digits(ia[i]);
        bool nb = all_digits(ib[i]);
        if (na && nb) {
            if (ia[i].size() != ib[i].size()) {
                return ia[i].size() < ib[i].size() ? -1 : 1;
            }
            int c = ia[i].compare(ib[i]);
            if (c != 0) return c < 0 ? -1 : 1;
        } else if (na != nb) {
            return na ? -1 : 1;
        } else {
            int c = ia[i].compare(ib[i]);
            if (c != 0) return c < 0 ? -1 : 1;
        }
    }
    if (ia.size() == ib.size()) return 0;
    return ia.size() < ib.size() ? -1 : 1;
}

// ---------------------------------------------------------------------------
// SemVer
// ---------------------------------------------------------------------------

Result<SemVer> SemVer::parse(const std::string& s) {
    if (s.empty()) {
        return WeftError{WeftError::Version, "empty version string"};
    }

    std::string core, pre, build;
    bool has_pre = split_suffixes(strip_v(s), core, pre, build);

    auto parts = split(core, '.');
    if (parts.size() != 3) {
        return WeftError{WeftError::Version,
            "invalid version '" + s + "'",
            "expected format: major.minor.patch[-prerelease][+build]"};
    }

    SemVer v;
    if (!parse_component(parts[0], v.major)) {
        return WeftError{WeftError::Version,
            "invalid major version in '" + s + "'"};
    }
    if (!parse_component(parts[1], v.minor)) {
        return WeftError{WeftError::Version,
            "invalid minor version in '" + s + "'"};
    }
    if (!parse_component(parts[2], v.patch)) {
        return WeftError{WeftError::Version,
            "invalid patch version in '" + s + "'"};
    }

    if (has_pre && pre.empty()) {
        return WeftError{WeftError::Version,
            "empty prerelease after '-' in '" + s + "'"};
    }
    if (!pre.empty() && !valid_identifiers(pre)) {
        return WeftError{WeftError::Version,
            "invalid prerelease '" + pre + "' in '" + s + "'"};
    }
    if (s.find('+') != std::string::npos && !valid_identifiers(build)) {
        return WeftError{WeftError::Version,
            "invalid build metadata in '" + s + "'"};
    }

    v.prerelease = std::move(pre);
    v.build = std::move(build);
    return Result<SemVer>::ok(std::move(v));
}

std::string SemVer::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (!prerelease.empty()) {
        s += "-" + prerelease;
    }
    if (!build.empty()) {
        s += "+" + build;
    }
    return s;
}

int SemVer::compare(const SemVer& o) const {
    if (major != o.major) return major < o.major ? -1 : 1;
    if (minor != o.minor) return minor < o.minor ? -1 : 1;
    if (patch != o.patch) return patch < o.patch ? -1 : 1;
    return compare_prerelease(prerelease, o.prerelease);
}

bool SemVer::operator==(const SemVer& o) const { return compare(o) == 0; }
bool SemVer::operator!=(const SemVer& o) const { return compare(o) != 0; }
bool SemVer::operator<(const SemVer& o) const { return compare(o) < 0; }
bool SemVer::operator<=(const SemVer& o) const { return compare(o) <= 0; }
bool SemVer::operator>(const SemVer& o) const { return compare(o) > 0; }
bool SemVer::operator>=(const SemVer& o) const { return compare(o) >= 0; }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

static bool is_wildcard_token(const std::string& s) {
    return s == "*" || s == "x" || s == "X";
}

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    if (s.empty()) {
        return WeftError{WeftError::Range, "empty partial version string"};
    }

    std::string core, pre, build;
    bool has_pre = split_suffixes(strip_v(s), core, pre, build);

    auto parts = split(core, '.');
    if (parts.size() > 3) {
        return WeftError{WeftError::Range,
            "too many components in '" + s + "'"};
    }

    PartialVersion pv;
    int* slots[] = {&pv.major, &pv.minor, &pv.patch};
    bool wildcard_seen = false;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (is_wildcard_token(parts[i])) {
            wildcard_seen = true;
            continue;
        }
        if (wildcard_seen) {
            return WeftError{WeftError::Range,
                "number after wildcard in '" + s + "'"};
        }
        if (!parse_component(parts[i], *slots[i])) {
            return WeftError{WeftError::Range,
                "invalid partial version '" + s + "'"};
        }
    }

    if (has_pre) {
        if (!pv.is_full()) {
            return WeftError{WeftError::Range,
                "prerelease requires a full version in '" + s + "'"};
        }
        if (!valid_identifiers(pre)) {
            return WeftError{WeftError::Range,
                "invalid prerelease in '" + s + "'"};
        }
        pv.prerelease = std::move(pre);
    }

    return Result<PartialVersion>::ok(std::move(pv));
}

std::string PartialVersion::to_string() const {
    if (major < 0) return "*";
    std::string s = std::to_string(major);
    if (minor >= 0) {
        s += "." + std::to_string(minor);
        if (patch >= 0) {
            s += "." + std::to_string(patch);
            if (!prerelease.empty()) s += "-" + prerelease;
        }
    }
    return s;
}

SemVer PartialVersion::floor() const {
    SemVer v;
    v.major = major >= 0 ? major : 0;
    v.minor = minor >= 0 ? minor : 0;
    v.patch = patch >= 0 ? patch : 0;
    v.prerelease = prerelease;
    return v;
}

std::optional<SemVer> PartialVersion::block_end() const {
    if (major < 0) return std::nullopt;
    int depth = minor < 0 ? 1 : patch < 0 ? 2 : 3;
    return next_release(floor(), depth);
}

std::optional<SemVer> next_release(const SemVer& v, int depth) {
    int parts[3] = {v.major, v.minor, v.patch};
    for (int i = std::min(depth, 3) - 1; i >= 0; --i) {
        if (parts[i] == std::numeric_limits<int>::max()) continue;
        SemVer next;
        next.major = i == 0 ? parts[0] + 1 : parts[0];
        next.minor = i == 1 ? parts[1] + 1 : (i > 1 ? parts[1] : 0);
        next.patch = i == 2 ? parts[2] + 1 : 0;
        return next;
    }
    return std::nullopt;
}

} // namespace weft
