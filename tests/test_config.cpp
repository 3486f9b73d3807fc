#include <catch2/catch.hpp>
#include <uuidb64/config.hpp>
#include <uuidb64/uuid_b64.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace uuidb64;

// ===== Parsing =====

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_color == false);
    REQUIRE_FALSE(r.value().trailing_bits.has_value());
}

TEST_CASE("parse config with codec section", "[config]") {
    auto r = Config::parse(R"(
[codec]
trailing-bits = "mask"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().trailing_bits == base64::TrailingBits::Mask);
    REQUIRE(r.value().decode_options().trailing_bits == base64::TrailingBits::Mask);
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().log_level.has_value());
    REQUIRE(r.value().decode_options().trailing_bits == base64::TrailingBits::Reject);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidB64Error::Config);
}

TEST_CASE("parse rejects unknown values", "[config]") {
    auto lvl = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(lvl.is_err());
    REQUIRE(lvl.error().code == UuidB64Error::Config);
    REQUIRE(lvl.error().message.find("log.level") != std::string::npos);

    auto typed = Config::parse("[log]\nlevel = 3\n");
    REQUIRE(typed.is_err());

    auto color = Config::parse("[log]\ncolor = \"yes\"\n");
    REQUIRE(color.is_err());
    REQUIRE(color.error().code == UuidB64Error::Config);
    REQUIRE(color.error().message == "log.color must be a boolean");

    auto tb_type = Config::parse("[codec]\ntrailing-bits = true\n");
    REQUIRE(tb_type.is_err());
    REQUIRE(tb_type.error().code == UuidB64Error::Config);
    REQUIRE(tb_type.error().message == "codec.trailing-bits must be a string");

    auto tb = Config::parse("[codec]\ntrailing-bits = \"ignore\"\n");
    REQUIRE(tb.is_err());
    REQUIRE(tb.error().message.find("codec.trailing-bits") != std::string::npos);
}

TEST_CASE("trailing bits names", "[config]") {
    REQUIRE(parse_trailing_bits("reject").value() == base64::TrailingBits::Reject);
    REQUIRE(std::string(trailing_bits_name(base64::TrailingBits::Mask)) == "mask");
    REQUIRE(parse_trailing_bits("Reject").is_err());
}

// ===== Layers =====

TEST_CASE("merge overrides only set fields", "[config]") {
    auto base = Config::parse(R"(
[log]
level = "warn"
color = true
[codec]
trailing-bits = "mask"
)").value();
    auto overlay = Config::parse("[log]\nlevel = \"trace\"\n").value();

    base.merge(overlay);
    REQUIRE(base.log_level == log::Trace);
    REQUIRE(base.log_color == true);
    REQUIRE(base.trailing_bits == base64::TrailingBits::Mask);
}

TEST_CASE("effective config layers global, local, env", "[config]") {
    auto global = Config::parse("[log]\nlevel = \"error\"\n[codec]\ntrailing-bits = \"mask\"\n").value();
    auto local = Config::parse("[codec]\ntrailing-bits = \"reject\"\n").value();
    Config env;
    env.log_level = log::Debug;

    auto eff = Config::effective(global, local, env);
    REQUIRE(eff.log_level == log::Debug);
    REQUIRE(eff.trailing_bits == base64::TrailingBits::Reject);

    auto none = Config::effective(std::nullopt, std::nullopt, std::nullopt);
    REQUIRE_FALSE(none.log_level.has_value());
}

TEST_CASE("from_env reads UUIDB64_LOG", "[config]") {
    setenv("UUIDB64_LOG", "trace", 1);
    auto r = Config::from_env();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Trace);

    setenv("UUIDB64_LOG", "shout", 1);
    REQUIRE(Config::from_env().is_err());

    unsetenv("UUIDB64_LOG");
    REQUIRE_FALSE(Config::from_env().value().log_level.has_value());
}

TEST_CASE("apply pushes log settings", "[config]") {
    Config cfg;
    cfg.log_level = log::Error;
    cfg.log_color = false;
    cfg.apply();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE_FALSE(log::is_color_enabled());
    log::set_level(log::Info);
}

TEST_CASE("decode options from config reach UuidB64::parse", "[config]") {
    auto cfg = Config::parse("[codec]\ntrailing-bits = \"mask\"\n").value();
    REQUIRE(UuidB64::parse("sMHuhm9GTxuNi3hJ51287h", cfg.decode_options()).is_ok());
    REQUIRE(UuidB64::parse("sMHuhm9GTxuNi3hJ51287h", Config().decode_options()).is_err());
}

// ===== Files =====

TEST_CASE("load config from file", "[config]") {
    auto path = fs::temp_directory_path()
        / ("uuidb64_test_config_" + std::to_string(getpid()) + ".toml");
    {
        std::ofstream f(path);
        f << "[log]\nlevel = \"warn\"\n";
    }
    auto r = Config::load(path.string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Warn);
    fs::remove(path);
}

TEST_CASE("load missing config file", "[config]") {
    auto r = Config::load("/nonexistent/uuidb64/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidB64Error::IO);
}

TEST_CASE("global_config_path uses HOME", "[config]") {
    const char* old = std::getenv("HOME");
    std::string saved = old ? old : "";
    setenv("HOME", "/home/tester", 1);
    REQUIRE(global_config_path() == "/home/tester/.uuidb64/config.toml");
    if (old) setenv("HOME", saved.c_str(), 1); else unsetenv("HOME");
}
