#include <catch2/catch.hpp>
#include <kuid/config.hpp>

using namespace kuid;

// ===== Parsing =====

TEST_CASE("parse empty config yields defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Info);
    REQUIRE_FALSE(r.value().log_color.has_value());
    REQUIRE(r.value().format == OutputFormat::Compact);
    REQUIRE_FALSE(r.value().log_level_set);
    REQUIRE_FALSE(r.value().format_set);
}

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_level_set);
    REQUIRE(r.value().log_color.has_value());
    REQUIRE(*r.value().log_color == false);
}

TEST_CASE("parse config with output section", "[config]") {
    auto r = Config::parse(R"(
[output]
format = "uuid"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().format == OutputFormat::Uuid);
    REQUIRE(r.value().format_set);
}

TEST_CASE("parse rejects unknown log level with location", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "loud"
)", "kuid.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KuidError::Config);
    REQUIRE(r.error().file == "kuid.toml");
    REQUIRE(r.error().line == 3);
}

TEST_CASE("parse rejects unknown output format", "[config]") {
    auto r = Config::parse(R"(
[output]
format = "base64"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KuidError::Config);
}

TEST_CASE("parse rejects non-string format", "[config]") {
    auto r = Config::parse(R"(
[output]
format = 3
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KuidError::Config);
}

TEST_CASE("parse reports TOML syntax errors", "[config]") {
    auto r = Config::parse("[log\nlevel = ", "broken.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KuidError::Parse);
    REQUIRE(r.error().file == "broken.toml");
    REQUIRE(r.error().line >= 1);
}

TEST_CASE("load missing file is an IO error", "[config]") {
    auto r = Config::load("/nonexistent/kuid/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KuidError::IO);
}

// ===== Formats =====

TEST_CASE("format_name and parse_format agree", "[config]") {
    for (auto f : {OutputFormat::Compact, OutputFormat::Uuid,
                   OutputFormat::Bytes, OutputFormat::All}) {
        auto r = parse_format(format_name(f));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == f);
    }
}

// ===== Layering =====

TEST_CASE("merge overrides only keys the layer sets", "[config]") {
    auto global = Config::parse(R"(
[log]
level = "warn"
color = true
[output]
format = "all"
)");
    auto local = Config::parse(R"(
[output]
format = "uuid"
)");
    REQUIRE(global.is_ok());
    REQUIRE(local.is_ok());

    auto eff = Config::effective(global.value(), local.value());
    REQUIRE(eff.log_level == log::Warn);
    REQUIRE(eff.log_color.has_value());
    REQUIRE(*eff.log_color == true);
    REQUIRE(eff.format == OutputFormat::Uuid);
}

TEST_CASE("effective with no layers is the default config", "[config]") {
    auto eff = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(eff.log_level == log::Info);
    REQUIRE(eff.format == OutputFormat::Compact);
}

TEST_CASE("global_config_path ends in .kuid/config.toml", "[config]") {
    auto p = global_config_path();
    if (!p.empty()) {
        REQUIRE(p.size() > 17);
        REQUIRE(p.substr(p.size() - 17) == ".kuid/config.toml");
    }
}
