#include <weft/version.hpp>

namespace weft {

Version Version::semantic(SemVer v) {
    Version out;
    out.kind_ = out.shadowed_ = Semantic;
    out.text_ = v.to_string();
    out.semver_ = std::move(v);
    return out;
}

Result<Version> Version::parse_semantic(const std::string& s) {
    auto sv = SemVer::parse(s);
    if (sv.is_err()) return std::move(sv).error();

    Version out = semantic(std::move(sv).value());
    out.text_ = s;  // keep the tag as written, e.g. "v1.2.0"
    return Result<Version>::ok(std::move(out));
}

Version Version::plain(std::string text) {
    Version out;
    out.kind_ = out.shadowed_ = Plain;
    out.text_ = std::move(text);
    return out;
}

Version Version::revision(std::string id) {
    Version out;
    out.kind_ = out.shadowed_ = Revision;
    out.text_ = std::move(id);
    return out;
}

Version Version::branch(std::string name) {
    Version out;
    out.kind_ = out.shadowed_ = Branch;
    out.text_ = std::move(name);
    return out;
}

Result<Version> Version::pair(const Version& unpaired, std::string rev) {
    if (unpaired.kind_ == Revision || unpaired.kind_ == Paired) {
        return WeftError{WeftError::Version,
            "cannot pair " + std::string(kind_name(unpaired.kind_)) +
            " version '" + unpaired.to_string() + "' with a revision",
            "only semantic, plain and branch versions can be paired"};
    }
    if (rev.empty()) {
        return WeftError{WeftError::Version,
            "empty revision for paired version '" + unpaired.to_string() + "'"};
    }

    Version out = unpaired;
    out.kind_ = Paired;
    out.rev_ = std::move(rev);
    return Result<Version>::ok(std::move(out));
}

Version Version::from_tag(const std::string& tag) {
    auto sv = parse_semantic(tag);
    if (sv.is_ok()) return std::move(sv).value();
    return plain(tag);
}

const SemVer* Version::semver() const {
    return shadowed_ == Semantic ? &semver_ : nullptr;
}

const std::string* Version::revision_id() const {
    if (kind_ == Paired) return &rev_;
    return kind_ == Revision ? &text_ : nullptr;
}

const std::string* Version::branch_name() const {
    return shadowed_ == Branch ? &text_ : nullptr;
}

const std::string* Version::literal_text() const {
    return shadowed_ == Plain ? &text_ : nullptr;
}

Version Version::underlying() const {
    Version out = *this;
    out.kind_ = shadowed_;
    out.rev_.clear();
    return out;
}

std::string Version::to_string() const {
    return text_;
}

bool Version::operator==(const Version& o) const {
    if (kind_ != o.kind_ || shadowed_ != o.shadowed_) return false;
    if (kind_ == Paired && rev_ != o.rev_) return false;
    if (shadowed_ == Semantic) return semver_ == o.semver_;
    return text_ == o.text_;
}

bool Version::operator!=(const Version& o) const {
    return !(*this == o);
}

const char* Version::kind_name(Kind k) {
    switch (k) {
        case Semantic: return "semantic";
        case Plain:    return "plain";
        case Revision: return "revision";
        case Branch:   return "branch";
        case Paired:   return "paired";
    }
    return "unknown";
}

} // namespace weft
