#include <ulidkit/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ulidkit {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UlidError{UlidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto section = doc["log"].as_table()) {
        if (auto v = (*section)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            ULIDKIT_TRY(lvl);
            cfg.logging.level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*section)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    // [generator] section
    if (auto section = doc["generator"].as_table()) {
        if (auto v = (*section)["clock-regression"].value<std::string>()) {
            auto policy = parse_clock_policy(*v);
            ULIDKIT_TRY(policy);
            cfg.generator.clock_policy = policy.value();
            cfg.clock_policy_set = true;
        }
        if (auto v = (*section)["seed"].value<int64_t>()) {
            if (*v < 0) {
                return UlidError{UlidError::InvalidArg,
                    "generator seed must be non-negative, got " + std::to_string(*v)};
            }
            cfg.generator.seed = static_cast<uint64_t>(*v);
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UlidError{UlidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
    if (other.clock_policy_set) {
        generator.clock_policy = other.generator.clock_policy;
        clock_policy_set = true;
    }
    if (other.generator.seed.has_value()) {
        generator.seed = other.generator.seed;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    if (log_level_set) log::set_level(logging.level);
    if (log_color_set) log::set_color_enabled(logging.color);
}

GeneratorOptions Config::generator_options() const {
    return generator;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.ulidkit/config.toml";
}

} // namespace ulidkit
