#include <catch2/catch.hpp>
#include <packmeta/config.hpp>
#include <packmeta/workspace.hpp>
#include "test_support.hpp"
#include <cstdlib>

using namespace packmeta;
using packmeta::testing::TempDir;

TEST_CASE("parse config with log and manifest sections", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = false

[manifest]
name = "Pack.toml"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_color == false);
    REQUIRE(r.value().manifest_file() == "Pack.toml");
}

TEST_CASE("parse empty config leaves everything unset", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().log_level.has_value());
    REQUIRE_FALSE(r.value().log_color.has_value());
    REQUIRE(r.value().manifest_file() == kDefaultManifestName);
}

TEST_CASE("invalid TOML config is a Config error", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::Config);
}

TEST_CASE("unknown log level is rejected", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"chatty\"\n", "config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::Config);
    REQUIRE(r.error().message.find("chatty") != std::string::npos);
}

TEST_CASE("wrong value type in config is rejected", "[config]") {
    auto r = Config::parse("[log]\ncolor = \"yes\"\n", "config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::Config);
    REQUIRE(r.error().message == "expected boolean at 'log.color', found string");
    REQUIRE(r.error().file == "config.toml");
}

TEST_CASE("merge overrides only set fields", "[config]") {
    auto base = Config::parse("[log]\nlevel = \"info\"\ncolor = true\n").value();
    auto overlay = Config::parse("[log]\nlevel = \"error\"\n").value();

    base.merge(overlay);
    REQUIRE(base.log_level == log::Error);
    REQUIRE(base.log_color == true);
}

TEST_CASE("effective config layers global under env", "[config]") {
    Config global;
    global.log_level = log::Info;
    global.manifest_name = std::string("Global.toml");

    Config env;
    env.log_level = log::Trace;

    auto eff = Config::effective(global, env);
    REQUIRE(eff.log_level == log::Trace);
    REQUIRE(eff.manifest_file() == "Global.toml");

    auto none = Config::effective(std::nullopt, std::nullopt);
    REQUIRE_FALSE(none.log_level.has_value());
}

TEST_CASE("from_env reads PACKMETA variables", "[config]") {
    setenv("PACKMETA_LOG", "error", 1);
    setenv("PACKMETA_MANIFEST", "Other.toml", 1);
    auto r = Config::from_env();
    unsetenv("PACKMETA_LOG");
    unsetenv("PACKMETA_MANIFEST");

    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Error);
    REQUIRE(r.value().manifest_file() == "Other.toml");
}

TEST_CASE("load reads a config file from disk", "[config]") {
    TempDir td;
    auto path = td.write_file("config.toml", "[manifest]\nname = \"X.toml\"\n");
    auto r = Config::load(path.string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().manifest_file() == "X.toml");

    auto missing = Config::load((td.path / "nope.toml").string());
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == PackError::Config);
}

TEST_CASE("apply_logging sets the logger", "[config]") {
    Config cfg;
    cfg.log_level = log::Error;
    cfg.apply_logging();
    REQUIRE(log::get_level() == log::Error);
    log::set_level(log::Warn);
}

TEST_CASE("unknown PACKMETA_LOG level in the environment is rejected", "[config]") {
    setenv("PACKMETA_LOG", "loud", 1);
    auto r = Config::from_env();
    unsetenv("PACKMETA_LOG");

    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PackError::Config);
}

TEST_CASE("PACKMETA_LOG reaches the logger through from_env and apply_logging", "[config]") {
    log::set_level(log::Warn);
    setenv("PACKMETA_LOG", "trace", 1);
    auto r = Config::from_env();
    unsetenv("PACKMETA_LOG");

    REQUIRE(r.is_ok());
    r.value().apply_logging();
    REQUIRE(log::get_level() == log::Trace);
    log::set_level(log::Warn);
}
