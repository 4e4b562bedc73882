// demo_fold.cpp
//
// Folds a list of requirements on one dependency into a single constraint,
// the way a resolver does while walking the graph, and checks candidate
// versions against the result.
//
//     ./demo_fold version:">=1.0.0, <2.0.0" version:^1.4 --check 1.3.9 v1.5.2
//     ./demo_fold branch:main branch:develop          # conflicting pins
//     ./demo_fold version:nightly-2024 --check nightly-2024
//     ./demo_fold --config weft.toml revision:abc123 --check abc123@v1.0.0
//
// A candidate written "rev@tag" is a revision paired with the version the
// tag names. Errors are printed with WeftError::format().

#include <weft/config.hpp>
#include <weft/constraint.hpp>
#include <weft/factory.hpp>
#include <weft/log.hpp>
#include <weft/result.hpp>
#include <weft/version.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace weft;

struct Invocation {
    std::string config_path;
    std::vector<std::string> requirements;  // "kind:text"
    std::vector<std::string> candidates;
};

static Result<Invocation> parse_args(int argc, char** argv) {
    Invocation inv;
    bool checking = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return WeftError{WeftError::InvalidArg,
                    "--config needs a file argument"};
            }
            inv.config_path = argv[++i];
        } else if (arg == "--check") {
            checking = true;
        } else if (checking) {
            inv.candidates.push_back(arg);
        } else {
            inv.requirements.push_back(arg);
        }
    }

    if (inv.requirements.empty()) {
        return WeftError{WeftError::InvalidArg,
            "no requirements given",
            "usage: demo_fold [--config FILE] KIND:TEXT... [--check VERSION...]"};
    }
    return Result<Invocation>::ok(std::move(inv));
}

static Result<Constraint> build_requirement(const ConstraintFactory& factory,
                                            const std::string& req) {
    size_t colon = req.find(':');
    if (colon == std::string::npos) {
        return WeftError{WeftError::InvalidArg,
            "requirement '" + req + "' is not KIND:TEXT",
            "KIND is one of: branch, revision, version"};
    }
    return factory.build(req.substr(0, colon), req.substr(colon + 1));
}

static Result<Version> parse_candidate(const std::string& text) {
    size_t at = text.find('@');
    if (at == std::string::npos) {
        return Result<Version>::ok(Version::from_tag(text));
    }
    return Version::pair(Version::from_tag(text.substr(at + 1)),
                         text.substr(0, at));
}

static std::string show(const Constraint& c) {
    return std::string(Constraint::kind_name(c.kind())) + " \"" + c.to_string() + "\"";
}

static Status run(int argc, char** argv) {
    auto inv = parse_args(argc, argv);
    WEFT_TRY(inv);

    Config config;
    if (!inv.value().config_path.empty()) {
        auto loaded = Config::load(inv.value().config_path);
        WEFT_TRY(loaded);
        config.merge(loaded.value());
    }
    config.apply();

    auto factory = ConstraintFactory::from_config(config);

    std::vector<Constraint> constraints;
    for (const auto& req : inv.value().requirements) {
        auto c = build_requirement(factory, req);
        WEFT_TRY(c);
        log::debug("built %s from '%s'", show(c.value()).c_str(), req.c_str());
        constraints.push_back(std::move(c).value());
    }

    Constraint acc = Constraint::any();
    for (size_t i = 0; i < constraints.size(); ++i) {
        acc = acc.intersect(constraints[i]);
        std::cout << "after " << inv.value().requirements[i] << ": "
                  << show(acc) << "\n";
    }

    for (size_t i = 0; i < constraints.size(); ++i) {
        for (size_t j = i + 1; j < constraints.size(); ++j) {
            if (!constraints[i].matches_any(constraints[j])) {
                std::cout << "conflict: " << inv.value().requirements[i]
                          << " vs " << inv.value().requirements[j] << "\n";
            }
        }
    }

    for (const auto& text : inv.value().candidates) {
        auto v = parse_candidate(text);
        WEFT_TRY(v);
        std::cout << (acc.matches(v.value()) ? "admits " : "rejects ")
                  << Version::kind_name(v.value().kind()) << " " << text << "\n";
    }

    if (acc.is_none()) {
        log::warn("requirements admit no version");
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto status = run(argc, argv);
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
