// demo_ulid.cpp
//
// Small standalone program that exercises the generator, codec, config and
// logging together.  Run it with:
//
//     ./demo_ulid                      # defaults, plus ~/.ulidkit/config.toml if present
//     ./demo_ulid ulidkit.toml         # layer a local config on top
//     ./demo_ulid missing.toml         # bad path -> IO error
//
// Watch stderr for log output and formatted error messages.

#include <ulidkit/config.hpp>
#include <ulidkit/log.hpp>
#include <ulidkit/ulidkit.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace ulidkit;

// Global config is optional; a local config named on the command line is not.
Result<Config> load_config(int argc, char** argv) {
    std::optional<Config> global;
    auto global_path = global_config_path();
    if (!global_path.empty() && std::filesystem::exists(global_path)) {
        auto g = Config::load(global_path);
        ULIDKIT_TRY(g);
        global = g.value();
    }

    std::optional<Config> local;
    if (argc >= 2) {
        auto l = Config::load(argv[1]);
        ULIDKIT_TRY(l);
        local = l.value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

Status run(int argc, char** argv) {
    auto cfg = load_config(argc, argv);
    ULIDKIT_TRY(cfg);
    cfg.value().apply_logging();

    auto options = cfg.value().generator_options();
    log::debug("clock-regression policy: %s", clock_policy_name(options.clock_policy));

    Generator gen(options);
    for (int i = 0; i < 5; ++i) {
        auto id = Ulid::generate(gen);
        ULIDKIT_TRY(id);
        std::cout << id.value().to_string() << "  " << id.value().to_uuid_string()
                  << "  ts=" << id.value().timestamp_ms()
                  << "  rnd=" << id.value().randomness().to_string() << "\n";
    }

    auto fixed = generate_with_timestamp(1547942611000ULL);
    ULIDKIT_TRY(fixed);
    std::cout << "fixed timestamp: " << fixed.value() << "\n";

    // Lowercase input parses; the bad string reports a typed error
    auto parsed = Ulid::parse("01arz3ndektsv4rrffq69g5fav");
    ULIDKIT_TRY(parsed);
    std::cout << "parsed: " << parsed.value().to_string() << "\n";

    auto bad = Ulid::parse("01ARZ3NDEKTSVILLEGAL12345");
    if (bad.is_err()) {
        std::cerr << bad.error().format() << "\n";
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        log::error("demo failed");
        std::cerr << "\n" << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
