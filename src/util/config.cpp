#include <weft/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace weft {

Result<FallbackPolicy> parse_fallback_policy(const std::string& name) {
    if (name == "silent") return Result<FallbackPolicy>::ok(FallbackPolicy::Silent);
    if (name == "debug") return Result<FallbackPolicy>::ok(FallbackPolicy::Debug);
    if (name == "warn") return Result<FallbackPolicy>::ok(FallbackPolicy::Warn);

    return WeftError{WeftError::Config,
        "unknown literal-fallback policy '" + name + "'",
        "expected one of: silent, debug, warn"};
}

const char* fallback_policy_name(FallbackPolicy policy) {
    switch (policy) {
        case FallbackPolicy::Silent: return "silent";
        case FallbackPolicy::Debug:  return "debug";
        case FallbackPolicy::Warn:   return "warn";
    }
    return "unknown";
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return WeftError{WeftError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto section = doc["log"].as_table()) {
        if (auto v = (*section)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*section)["color"].value<bool>()) {
            cfg.color = *v;
        }
    }

    // [constraints] section
    if (auto section = doc["constraints"].as_table()) {
        if (auto v = (*section)["literal-fallback"].value<std::string>()) {
            auto policy = parse_fallback_policy(*v);
            if (policy.is_err()) return std::move(policy).error();
            cfg.literal_fallback = policy.value();
            cfg.literal_fallback_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return WeftError{WeftError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color.has_value()) {
        color = other.color;
    }
    if (other.literal_fallback_set) {
        literal_fallback = other.literal_fallback;
        literal_fallback_set = true;
    }
}

void Config::apply() const {
    log::set_level(log_level);
    if (color.has_value()) {
        log::set_color_enabled(*color);
    }
}

} // namespace weft
