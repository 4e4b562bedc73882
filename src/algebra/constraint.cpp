#include <weft/constraint.hpp>
#include <weft/factory.hpp>

namespace weft {

namespace {

// Membership of a single version. Each pinning variant reads the one facet
// it understands; a version without that facet does not match.
struct MatchVisitor {
    const Version& v;

    bool operator()(const AnyConstraint&) const { return true; }
    bool operator()(const NoneConstraint&) const { return false; }

    bool operator()(const RangeConstraint& c) const {
        const SemVer* sv = v.semver();
        return sv && c.range.contains(*sv);
    }

    bool operator()(const RevisionConstraint& c) const {
        const std::string* id = v.revision_id();
        return id && *id == c.id;
    }

    bool operator()(const BranchConstraint& c) const {
        const std::string* name = v.branch_name();
        return name && *name == c.name;
    }

    bool operator()(const LiteralConstraint& c) const {
        const std::string* text = v.literal_text();
        return text && *text == c.text;
    }
};

// Intersection of `self` with a non-sentinel `other`. Constraints of
// different kinds never share a representable refinement.
struct IntersectVisitor {
    const Constraint& self;
    const Constraint& other;

    Constraint operator()(const AnyConstraint&) const { return other; }
    Constraint operator()(const NoneConstraint&) const { return Constraint::none(); }

    Constraint operator()(const RangeConstraint& c) const {
        auto* o = std::get_if<RangeConstraint>(&other.data());
        if (!o) return Constraint::none();
        return Constraint::range(c.range.intersect(o->range));
    }

    Constraint operator()(const RevisionConstraint& c) const {
        return same_key(c);
    }

    Constraint operator()(const BranchConstraint& c) const {
        return same_key(c);
    }

    Constraint operator()(const LiteralConstraint& c) const {
        return same_key(c);
    }

    template<typename Pin>
    Constraint same_key(const Pin& c) const {
        auto* o = std::get_if<Pin>(&other.data());
        if (o && *o == c) return self;
        return Constraint::none();
    }
};

struct DisplayVisitor {
    std::string operator()(const AnyConstraint&) const { return "*"; }
    std::string operator()(const NoneConstraint&) const { return ""; }
    std::string operator()(const RangeConstraint& c) const { return c.range.to_string(); }
    std::string operator()(const RevisionConstraint& c) const { return c.id; }
    std::string operator()(const BranchConstraint& c) const { return c.name; }
    std::string operator()(const LiteralConstraint& c) const { return c.text; }
};

} // namespace

// ---------------------------------------------------------------------------
// ConstraintType
// ---------------------------------------------------------------------------

Result<ConstraintType> parse_constraint_type(const std::string& name) {
    if (name == "branch") return Result<ConstraintType>::ok(ConstraintType::Branch);
    if (name == "revision") return Result<ConstraintType>::ok(ConstraintType::Revision);
    if (name == "version") return Result<ConstraintType>::ok(ConstraintType::Version);

    return WeftError{WeftError::Constraint,
        "unknown constraint kind '" + name + "'",
        "expected one of: branch, revision, version"};
}

const char* constraint_type_name(ConstraintType type) {
    switch (type) {
        case ConstraintType::Branch:   return "branch";
        case ConstraintType::Revision: return "revision";
        case ConstraintType::Version:  return "version";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Constraint
// ---------------------------------------------------------------------------

Constraint Constraint::any() {
    return Constraint(AnyConstraint{});
}

Constraint Constraint::none() {
    return Constraint(NoneConstraint{});
}

Constraint Constraint::range(RangeSet set) {
    if (set.is_empty()) return none();
    return Constraint(RangeConstraint{std::move(set)});
}

Constraint Constraint::revision(std::string id) {
    return Constraint(RevisionConstraint{std::move(id)});
}

Constraint Constraint::branch(std::string name) {
    return Constraint(BranchConstraint{std::move(name)});
}

Constraint Constraint::literal(std::string text) {
    return Constraint(LiteralConstraint{std::move(text)});
}

Result<Constraint> Constraint::build(ConstraintType type, const std::string& text) {
    return ConstraintFactory().build(type, text);
}

Result<Constraint> Constraint::build(const std::string& type_name,
                                     const std::string& text) {
    return ConstraintFactory().build(type_name, text);
}

Constraint Constraint::from_version(const Version& v) {
    switch (v.underlying().kind()) {
        case Version::Semantic: return range(RangeSet::exactly(*v.semver()));
        case Version::Plain:    return literal(*v.literal_text());
        case Version::Branch:   return branch(*v.branch_name());
        case Version::Revision: return revision(*v.revision_id());
        case Version::Paired:   break;
    }
    // underlying() is never Paired
    return none();
}

bool Constraint::matches(const Version& v) const {
    return std::visit(MatchVisitor{v}, data_);
}

bool Constraint::matches_any(const Constraint& other) const {
    return !intersect(other).is_none();
}

Constraint Constraint::intersect(const Constraint& other) const {
    if (other.is_any()) return *this;
    if (other.is_none()) return none();
    return std::visit(IntersectVisitor{*this, other}, data_);
}

std::string Constraint::to_string() const {
    return std::visit(DisplayVisitor{}, data_);
}

const char* Constraint::kind_name(Kind k) {
    switch (k) {
        case Any:      return "any";
        case None:     return "none";
        case Range:    return "range";
        case Revision: return "revision";
        case Branch:   return "branch";
        case Literal:  return "literal";
    }
    return "unknown";
}

Constraint intersect_all(const std::vector<Constraint>& constraints) {
    Constraint acc = Constraint::any();
    for (const auto& c : constraints) {
        acc = acc.intersect(c);
        if (acc.is_none()) break;
    }
    return acc;
}

} // namespace weft
