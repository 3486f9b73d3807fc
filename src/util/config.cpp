#include <uuidb64/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace uuidb64 {

Result<base64::TrailingBits> parse_trailing_bits(const std::string& s) {
    if (s == "reject") return Result<base64::TrailingBits>::ok(base64::TrailingBits::Reject);
    if (s == "mask") return Result<base64::TrailingBits>::ok(base64::TrailingBits::Mask);
    return UuidB64Error(UuidB64Error::Config,
        "unknown trailing-bits policy: '" + s + "'",
        "expected \"reject\" or \"mask\"");
}

const char* trailing_bits_name(base64::TrailingBits t) {
    switch (t) {
        case base64::TrailingBits::Reject: return "reject";
        case base64::TrailingBits::Mask:   return "mask";
    }
    return "unknown";
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UuidB64Error(UuidB64Error::Config,
            std::string("config TOML parse error: ") + e.what());
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) {
                return UuidB64Error(UuidB64Error::Config,
                    "log.level: " + lvl.error().message, lvl.error().hint);
            }
            cfg.log_level = lvl.value();
        } else if ((*lg).contains("level")) {
            return UuidB64Error(UuidB64Error::Config, "log.level must be a string");
        }
        if (auto v = (*lg)["color"].as_boolean()) {
            cfg.log_color = v->get();
        } else if ((*lg).contains("color")) {
            return UuidB64Error(UuidB64Error::Config, "log.color must be a boolean");
        }
    }

    // [codec] section
    if (auto codec = doc["codec"].as_table()) {
        if (auto v = (*codec)["trailing-bits"].value<std::string>()) {
            auto tb = parse_trailing_bits(*v);
            if (tb.is_err()) {
                return UuidB64Error(UuidB64Error::Config,
                    "codec.trailing-bits: " + tb.error().message, tb.error().hint);
            }
            cfg.trailing_bits = tb.value();
        } else if ((*codec).contains("trailing-bits")) {
            return UuidB64Error(UuidB64Error::Config,
                "codec.trailing-bits must be a string",
                "expected \"reject\" or \"mask\"");
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UuidB64Error(UuidB64Error::IO,
            "cannot open config file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_ok()) {
        log::debug("loaded config from %s", path.c_str());
    }
    return cfg;
}

Result<Config> Config::from_env() {
    Config cfg;
    const char* lvl = std::getenv("UUIDB64_LOG");
    if (lvl && *lvl) {
        auto parsed = log::parse_level(lvl);
        if (parsed.is_err()) {
            return UuidB64Error(UuidB64Error::Config,
                "UUIDB64_LOG: " + parsed.error().message, parsed.error().hint);
        }
        cfg.log_level = parsed.value();
    }
    return Result<Config>::ok(cfg);
}

void Config::merge(const Config& other) {
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
    if (other.trailing_bits) trailing_bits = other.trailing_bits;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local,
                         const std::optional<Config>& env) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    if (env.has_value()) result.merge(env.value());
    return result;
}

base64::DecodeOptions Config::decode_options() const {
    base64::DecodeOptions opts;
    if (trailing_bits) opts.trailing_bits = *trailing_bits;
    return opts;
}

void Config::apply() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.uuidb64/config.toml";
}

} // namespace uuidb64
