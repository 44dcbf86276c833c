#include <catch2/catch.hpp>
#include <rosid/log.hpp>
#include "test_helpers.hpp"
#include <string>

using namespace rosid::log;

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level() accepts names case-insensitively", "[log]") {
    REQUIRE(parse_level("trace").value() == Trace);
    REQUIRE(parse_level("DEBUG").value() == Debug);
    REQUIRE(parse_level("Info").value() == Info);
    REQUIRE(parse_level("warn").value() == Warn);
    REQUIRE(parse_level("warning").value() == Warn);
    REQUIRE(parse_level("error").value() == Error);
}

TEST_CASE("parse_level() rejects unknown names", "[log]") {
    auto r = parse_level("verbose");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == rosid::RosidError::InvalidArg);
    REQUIRE(r.error().message.find("verbose") != std::string::npos);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at and above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("warn: this is a warning\n") != std::string::npos);
    REQUIRE(output.find("error: this is an error\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("logf() uses the given level", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        logf(Error, "code %d", 3);
        logf(Debug, "hidden");
    });
    REQUIRE(output == "error: code 3\n");
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("value: %d, name: %s", 42, "test");
    });
    REQUIRE(output.find("info:") != std::string::npos);
    REQUIRE(output.find("value: 42") != std::string::npos);
    REQUIRE(output.find("name: test") != std::string::npos);
}

TEST_CASE("Colored output wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] {
        warn("colored");
    });
    REQUIRE(output.find("\033[33mwarn\033[0m: colored") != std::string::npos);

    set_color_enabled(false);
}
