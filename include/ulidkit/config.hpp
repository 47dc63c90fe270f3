#pragma once

#include <ulidkit/generator.hpp>
#include <ulidkit/log.hpp>
#include <ulidkit/result.hpp>
#include <optional>
#include <string>

namespace ulidkit {

struct LoggingConfig {
    log::Level level = log::Info;
    bool color = false;
};

// Layered configuration: global (~/.ulidkit/config.toml) then local.
// Later layers override only the fields they set.
struct Config {
    LoggingConfig logging;
    GeneratorOptions generator;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool clock_policy_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push [log] settings into ulidkit::log. Unset fields are left alone.
    void apply_logging() const;

    // [generator] settings, ready for Generator(const GeneratorOptions&)
    GeneratorOptions generator_options() const;
};

// ~/.ulidkit/config.toml, or "" when HOME is unset
std::string global_config_path();

} // namespace ulidkit
