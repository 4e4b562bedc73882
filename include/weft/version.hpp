#pragma once

#include <weft/result.hpp>
#include <weft/semver.hpp>
#include <string>

namespace weft {

// A version of a dependency as seen by the resolver. Values are immutable;
// build them through the named constructors.
class Version {
public:
    enum Kind {
        Semantic,   // parsed semantic version (e.g. a "v1.2.0" tag)
        Plain,      // tag with no semver structure
        Revision,   // commit id, compared by equality only
        Branch,     // floating reference, compared by name only
        Paired      // a revision known to back a Semantic/Plain/Branch version
    };

    static Version semantic(SemVer v);
    static Result<Version> parse_semantic(const std::string& s);
    static Version plain(std::string text);
    static Version revision(std::string id);
    static Version branch(std::string name);

    // Fails if `unpaired` is already a revision or a pair
    static Result<Version> pair(const Version& unpaired, std::string rev);

    // Classify a repository tag: semantic if it parses as one, else plain
    static Version from_tag(const std::string& tag);

    Kind kind() const { return kind_; }
    bool is_paired() const { return kind_ == Paired; }

    // Facets; nullptr when this version does not carry one.
    // A pair answers for its revision and for the version it shadows.
    const SemVer* semver() const;
    const std::string* revision_id() const;
    const std::string* branch_name() const;
    const std::string* literal_text() const;

    // The unpaired version; *this when not paired
    Version underlying() const;

    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;

    static const char* kind_name(Kind k);

private:
    Version() = default;

    Kind kind_ = Plain;
    Kind shadowed_ = Plain;  // kind of the unpaired facet; equals kind_ unless Paired
    std::string text_;       // plain text, branch name, or revision id
    SemVer semver_;          // valid when the unpaired facet is Semantic
    std::string rev_;        // valid when Paired
};

} // namespace weft
