#pragma once

#include <weft/result.hpp>
#include <weft/semver.hpp>
#include <optional>
#include <string>
#include <vector>

namespace weft {

struct Bound {
    SemVer version;
    bool inclusive = true;

    bool operator==(const Bound& o) const {
        return version == o.version && inclusive == o.inclusive;
    }
    bool operator!=(const Bound& o) const { return !(*this == o); }
};

// A contiguous span of versions. A missing bound is unbounded on that side.
struct Interval {
    std::optional<Bound> lower;
    std::optional<Bound> upper;

    static Interval at_least(SemVer v);
    static Interval greater_than(SemVer v);
    static Interval at_most(SemVer v);
    static Interval less_than(SemVer v);
    static Interval between(SemVer low, SemVer high);  // [low, high)
    static Interval point(SemVer v);                   // [v, v]

    bool contains(const SemVer& v) const;
    bool is_empty() const;

    // nullopt when the two spans share no version
    std::optional<Interval> intersect(const Interval& other) const;

    std::string to_string() const;

    bool operator==(const Interval& o) const {
        return lower == o.lower && upper == o.upper;
    }
    bool operator!=(const Interval& o) const { return !(*this == o); }
};

// Union of disjoint intervals, kept sorted and merged so that two sets
// admitting the same versions compare equal. Prereleases get no special
// treatment: membership is plain semver precedence, so "<2.0.0" admits
// "2.0.0-rc.1" and ">=1.2.0" admits "1.3.0-beta".
class RangeSet {
public:
    RangeSet() = default;  // admits nothing

    static RangeSet everything();
    static RangeSet exactly(const SemVer& v);
    static RangeSet from_intervals(std::vector<Interval> intervals);

    // Range expression, e.g. ">=1.0.0, <2.0.0 || ^3.1"
    static Result<RangeSet> parse(const std::string& s);

    bool contains(const SemVer& v) const;
    bool is_empty() const { return intervals_.empty(); }
    bool is_everything() const;

    RangeSet intersect(const RangeSet& other) const;
    RangeSet unite(const RangeSet& other) const;

    const std::vector<Interval>& intervals() const { return intervals_; }

    // Canonical form, accepted back by parse()
    std::string to_string() const;

    bool operator==(const RangeSet& o) const { return intervals_ == o.intervals_; }
    bool operator!=(const RangeSet& o) const { return !(*this == o); }

private:
    std::vector<Interval> intervals_;
};

} // namespace weft
