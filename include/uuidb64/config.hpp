#pragma once

#include <uuidb64/base64.hpp>
#include <uuidb64/log.hpp>
#include <uuidb64/result.hpp>
#include <optional>
#include <string>

namespace uuidb64 {

// Layered configuration: global > local > environment
// Later layers override earlier ones, field by field.
//
//   [log]
//   level = "debug"
//   color = false
//
//   [codec]
//   trailing-bits = "reject"   # or "mask"
struct Config {
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;
    std::optional<base64::TrailingBits> trailing_bits;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Reads UUIDB64_LOG (a level name). Unset yields an empty Config.
    static Result<Config> from_env();

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local,
                            const std::optional<Config>& env);

    // Options for UuidB64::parse() and base64::decode()
    base64::DecodeOptions decode_options() const;

    // Pushes the log settings into uuidb64::log
    void apply() const;
};

// ~/.uuidb64/config.toml, or "" when no home directory is known
std::string global_config_path();

Result<base64::TrailingBits> parse_trailing_bits(const std::string& s);
const char* trailing_bits_name(base64::TrailingBits t);

} // namespace uuidb64
