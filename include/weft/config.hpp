#pragma once

#include <weft/result.hpp>
#include <weft/log.hpp>
#include <optional>
#include <string>

namespace weft {

// What the factory does when a version requirement degrades to a literal
enum class FallbackPolicy { Silent, Debug, Warn };

Result<FallbackPolicy> parse_fallback_policy(const std::string& name);
const char* fallback_policy_name(FallbackPolicy policy);

// weft.toml:
//
//   [log]
//   level = "info"
//   color = true
//
//   [constraints]
//   literal-fallback = "debug"
struct Config {
    log::Level log_level = log::Info;
    std::optional<bool> color;  // unset: detect from the log stream
    FallbackPolicy literal_fallback = FallbackPolicy::Debug;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool literal_fallback_set = false;

    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::string& path);

    // Merge another config on top (other's explicit values win)
    void merge(const Config& other);

    // Push log settings into weft::log
    void apply() const;
};

} // namespace weft
