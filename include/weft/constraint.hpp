#pragma once

#include <weft/result.hpp>
#include <weft/range.hpp>
#include <weft/version.hpp>
#include <string>
#include <variant>
#include <vector>

namespace weft {

// Matches every version. Identity element of intersect().
struct AnyConstraint {
    bool operator==(const AnyConstraint&) const { return true; }
};

// Matches no version. Absorbing element of intersect().
struct NoneConstraint {
    bool operator==(const NoneConstraint&) const { return true; }
};

// Semantic version range; never empty (an empty range is NoneConstraint)
struct RangeConstraint {
    RangeSet range;
    bool operator==(const RangeConstraint& o) const { return range == o.range; }
};

// Pin to one commit
struct RevisionConstraint {
    std::string id;
    bool operator==(const RevisionConstraint& o) const { return id == o.id; }
};

// Pin to a floating branch or tag name
struct BranchConstraint {
    std::string name;
    bool operator==(const BranchConstraint& o) const { return name == o.name; }
};

// Unparseable version requirement, matched by exact text
struct LiteralConstraint {
    std::string text;
    bool operator==(const LiteralConstraint& o) const { return text == o.text; }
};

// How a manifest declares a requirement
enum class ConstraintType { Branch, Revision, Version };

Result<ConstraintType> parse_constraint_type(const std::string& name);
const char* constraint_type_name(ConstraintType type);

// The set of versions acceptable for one dependency. Constraints are
// immutable values; every operation returns a new constraint.
class Constraint {
public:
    enum Kind { Any, None, Range, Revision, Branch, Literal };

    using Data = std::variant<AnyConstraint, NoneConstraint, RangeConstraint,
                              RevisionConstraint, BranchConstraint,
                              LiteralConstraint>;

    static Constraint any();
    static Constraint none();
    static Constraint range(RangeSet set);  // empty set collapses to none()
    static Constraint revision(std::string id);
    static Constraint branch(std::string name);
    static Constraint literal(std::string text);

    // Version requirements that fail to parse as a range fall back to a
    // literal constraint; only an unknown type is an error.
    static Result<Constraint> build(ConstraintType type, const std::string& text);
    static Result<Constraint> build(const std::string& type_name, const std::string& text);

    // The constraint admitting exactly `v`. A pair pins the version it shadows.
    static Constraint from_version(const Version& v);

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    bool is_any() const { return kind() == Any; }
    bool is_none() const { return kind() == None; }
    const Data& data() const { return data_; }

    bool matches(const Version& v) const;

    // Would intersect(other) admit any version at all?
    bool matches_any(const Constraint& other) const;

    Constraint intersect(const Constraint& other) const;

    // "*" for any, "" for none, canonical range syntax, or the pinned key
    std::string to_string() const;

    bool operator==(const Constraint& o) const { return data_ == o.data_; }
    bool operator!=(const Constraint& o) const { return !(*this == o); }

    static const char* kind_name(Kind k);

private:
    explicit Constraint(Data data) : data_(std::move(data)) {}

    Data data_;
};

// Fold requirements into one constraint, starting from any()
Constraint intersect_all(const std::vector<Constraint>& constraints);

} // namespace weft
