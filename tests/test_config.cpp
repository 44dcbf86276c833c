#include <catch2/catch.hpp>
#include <rosid/config.hpp>
#include "test_helpers.hpp"

using namespace rosid;

// ===== Parsing =====

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = true
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log.level == log::Debug);
    REQUIRE(r.value().log.color == true);
    REQUIRE(r.value().log_level_set);
    REQUIRE(r.value().log_color_set);
}

TEST_CASE("parse config with identification section", "[config]") {
    auto r = Config::parse(R"(
[identification]
ignore-markers = ["SKIP_ME"]
legacy-manifest = "stack.xml"
python-executable = "/usr/bin/python3.11"
)");
    REQUIRE(r.is_ok());
    const auto& ident = r.value().identification;
    REQUIRE(ident.ignore_markers == std::vector<std::string>{"SKIP_ME"});
    REQUIRE(ident.legacy_manifest == "stack.xml");
    REQUIRE(ident.python_executable == "/usr/bin/python3.11");
}

TEST_CASE("parse config with package overrides", "[config]") {
    auto r = Config::parse(R"(
[packages."src/driver"]
name = "driver_renamed"

[packages."src/other"]
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().packages.size() == 2);
    REQUIRE(r.value().packages.at("src/driver").name.value() == "driver_renamed");
    REQUIRE_FALSE(r.value().packages.at("src/other").name.has_value());
}

TEST_CASE("parse empty config keeps defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.log.level == log::Info);
    REQUIRE(cfg.identification.ignore_markers ==
            std::vector<std::string>{"CATKIN_IGNORE", "AMENT_IGNORE"});
    REQUIRE(cfg.identification.legacy_manifest == "manifest.xml");
    REQUIRE(cfg.identification.python_executable == "python3");
    REQUIRE(cfg.packages.empty());
    REQUIRE_FALSE(cfg.log_level_set);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RosidError::Parse);
}

TEST_CASE("parse rejects bad values", "[config]") {
    SECTION("unknown log level") {
        auto r = Config::parse("[log]\nlevel = \"chatty\"\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == RosidError::Config);
    }
    SECTION("ignore-markers not an array") {
        auto r = Config::parse("[identification]\nignore-markers = \"X\"\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == RosidError::Config);
    }
    SECTION("ignore-markers with a non-string") {
        auto r = Config::parse("[identification]\nignore-markers = [\"X\", 3]\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == RosidError::Config);
    }
    SECTION("package entry not a table") {
        auto r = Config::parse("[packages]\n\"src/a\" = \"a\"\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == RosidError::Config);
    }
}

// ===== Loading =====

TEST_CASE("load config from file", "[config]") {
    TempDir td;
    td.write_file(WORKSPACE_CONFIG_FILENAME, "[log]\nlevel = \"warn\"\n");
    auto r = Config::load((td.path / WORKSPACE_CONFIG_FILENAME).string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log.level == log::Warn);
}

TEST_CASE("load missing config file", "[config]") {
    TempDir td;
    auto r = Config::load((td.path / "absent.toml").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RosidError::IO);
}

TEST_CASE("load reports the file of a broken config", "[config]") {
    TempDir td;
    td.write_file("bad.toml", "[log\n");
    std::string path = (td.path / "bad.toml").string();
    auto r = Config::load(path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().file == path);
}

// ===== Layering =====

TEST_CASE("merge overrides only fields that were set", "[config]") {
    Config base;
    base.identification.python_executable = "python3.10";
    base.python_executable_set = true;

    auto over = Config::parse("[log]\nlevel = \"error\"\n");
    REQUIRE(over.is_ok());
    base.merge(over.value());

    REQUIRE(base.log.level == log::Error);
    REQUIRE(base.identification.python_executable == "python3.10");
}

TEST_CASE("merge combines package overrides per path", "[config]") {
    auto a = Config::parse(R"(
[packages."a"]
name = "alpha"
[packages."b"]
name = "beta"
)");
    auto b = Config::parse(R"(
[packages."b"]
name = "bravo"
)");
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());

    Config merged = a.value();
    merged.merge(b.value());
    REQUIRE(merged.packages.at("a").name.value() == "alpha");
    REQUIRE(merged.packages.at("b").name.value() == "bravo");
}

TEST_CASE("effective config layering", "[config]") {
    auto global = Config::parse(R"(
[log]
level = "debug"
color = true
[identification]
ignore-markers = ["CATKIN_IGNORE"]
)");
    auto workspace = Config::parse(R"(
[log]
level = "warn"
)");
    REQUIRE(global.is_ok());
    REQUIRE(workspace.is_ok());

    auto eff = Config::effective(global.value(), workspace.value());
    REQUIRE(eff.log.level == log::Warn);
    REQUIRE(eff.log.color == true);
    REQUIRE(eff.identification.ignore_markers == std::vector<std::string>{"CATKIN_IGNORE"});
}

TEST_CASE("effective with no layers", "[config]") {
    auto eff = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(eff.log.level == log::Info);
    REQUIRE(eff.identification.ignore_markers.size() == 2);
}

TEST_CASE("apply_logging sets the log level", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"trace\"\ncolor = false\n");
    REQUIRE(r.is_ok());
    r.value().apply_logging();
    REQUIRE(log::get_level() == log::Trace);
    REQUIRE_FALSE(log::is_color_enabled());
    log::set_level(log::Info);
}

TEST_CASE("global config path contains .rosid", "[config]") {
    auto path = global_config_path();
    if (!path.empty()) {
        REQUIRE(path.find(".rosid/config.toml") != std::string::npos);
    }
}
