#include <weft/factory.hpp>
#include <weft/config.hpp>
#include <weft/log.hpp>

namespace weft {

ConstraintFactory::ConstraintFactory(FallbackHook hook)
    : on_fallback_(std::move(hook)) {}

ConstraintFactory ConstraintFactory::from_config(const Config& config) {
    if (config.literal_fallback == FallbackPolicy::Silent) {
        return ConstraintFactory();
    }

    log::Level lvl = config.literal_fallback == FallbackPolicy::Warn
        ? log::Warn : log::Debug;
    return ConstraintFactory([lvl](const std::string& text, const WeftError& reason) {
        log::write(lvl, "treating version requirement '%s' as a literal tag (%s)",
                   text.c_str(), reason.message.c_str());
    });
}

Result<Constraint> ConstraintFactory::build(ConstraintType type,
                                            const std::string& text) const {
    switch (type) {
        case ConstraintType::Branch:
            return Result<Constraint>::ok(Constraint::branch(text));
        case ConstraintType::Revision:
            return Result<Constraint>::ok(Constraint::revision(text));
        case ConstraintType::Version:
            return Result<Constraint>::ok(build_version(text));
    }

    return WeftError{WeftError::Constraint,
        "unknown constraint kind " + std::to_string(static_cast<int>(type)),
        "expected one of: branch, revision, version"};
}

Result<Constraint> ConstraintFactory::build(const std::string& type_name,
                                            const std::string& text) const {
    auto type = parse_constraint_type(type_name);
    if (type.is_err()) return std::move(type).error();
    return build(type.value(), text);
}

Constraint ConstraintFactory::build_version(const std::string& text) const {
    auto parsed = RangeSet::parse(text);
    if (parsed.is_ok()) {
        return Constraint::range(std::move(parsed).value());
    }

    if (on_fallback_) {
        on_fallback_(text, parsed.error());
    }
    return Constraint::literal(text);
}

} // namespace weft
