#pragma once

#include <weft/constraint.hpp>
#include <weft/result.hpp>
#include <functional>
#include <string>

namespace weft {

struct Config;

// Builds constraints from manifest requirements.
//
// A version requirement that is not a valid range expression becomes a
// literal constraint (manifests may pin non-semver tags). The optional
// fallback hook observes each such downgrade, e.g. to flag typos; it never
// changes the constraint that is produced.
class ConstraintFactory {
public:
    using FallbackHook = std::function<void(const std::string& text,
                                            const WeftError& reason)>;

    ConstraintFactory() = default;
    explicit ConstraintFactory(FallbackHook hook);

    // Factory whose hook logs fallbacks as configured in [constraints]
    static ConstraintFactory from_config(const Config& config);

    Result<Constraint> build(ConstraintType type, const std::string& text) const;
    Result<Constraint> build(const std::string& type_name, const std::string& text) const;

private:
    Constraint build_version(const std::string& text) const;

    FallbackHook on_fallback_;
};

} // namespace weft
