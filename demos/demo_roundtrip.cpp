// demo_roundtrip.cpp
//
// Prints a few fresh identifiers in both textual forms, then parses every
// command-line argument as a Base64 UUID:
//
//     ./demo_roundtrip                            # generate only
//     ./demo_roundtrip sMHuhm9GTxuNi3hJ51287g     # parses -> hex form
//     ./demo_roundtrip b0c1ee86-6f46-4f1b-8d8b-7849e75dbcee   # Parse error
//
// Settings come from ~/.uuidb64/config.toml and UUIDB64_LOG.

#include <uuidb64/config.hpp>
#include <uuidb64/log.hpp>
#include <uuidb64/uuid_b64.hpp>

#include <filesystem>
#include <iostream>
#include <optional>

using namespace uuidb64;

static Result<Config> load_config() {
    std::optional<Config> global;
    auto path = global_config_path();
    if (!path.empty() && std::filesystem::exists(path)) {
        auto cfg = Config::load(path);
        UUIDB64_TRY(cfg);
        global = cfg.value();
    }

    auto env = Config::from_env();
    UUIDB64_TRY(env);

    return Result<Config>::ok(Config::effective(global, std::nullopt, env.value()));
}

int main(int argc, char** argv) {
    auto cfg = load_config();
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 2;
    }
    cfg.value().apply();

    log::info("generating 3 identifiers");
    for (int i = 0; i < 3; ++i) {
        auto id = UuidB64::generate();
        std::cout << id.to_istring() << "  " << id.uuid().to_string() << "\n";
    }

    int failures = 0;
    for (int i = 1; i < argc; ++i) {
        auto parsed = UuidB64::parse(argv[i], cfg.value().decode_options());
        if (parsed.is_err()) {
            std::cerr << parsed.error().format() << "\n";
            ++failures;
            continue;
        }
        std::cout << parsed.value().debug_string() << " = "
                  << parsed.value().uuid().to_string() << "\n";
    }

    if (failures > 0) {
        log::warn("%d of %d argument(s) failed to parse", failures, argc - 1);
        return 1;
    }
    return 0;
}
