#include <catch2/catch.hpp>
#include <rosid/condition.hpp>

using namespace rosid;

// ===== Parsing =====

TEST_CASE("parse simple comparison", "[condition]") {
    auto r = Condition::parse("$ROS_VERSION == 2");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind() == Condition::Compare);
    REQUIRE(r.value().to_string() == "$ROS_VERSION == 2");
}

TEST_CASE("parse all operators", "[condition]") {
    for (const char* op : {"==", "!=", ">=", ">", "<=", "<"}) {
        auto r = Condition::parse(std::string("$A ") + op + " b");
        REQUIRE(r.is_ok());
        REQUIRE(r.value().to_string() == std::string("$A ") + op + " b");
    }
}

TEST_CASE("parse and / or precedence", "[condition]") {
    auto r = Condition::parse("$A == 1 or $B == 2 and $C == 3");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind() == Condition::Or);
    REQUIRE(r.value().to_string() == "$A == 1 or $B == 2 and $C == 3");
}

TEST_CASE("parse parentheses", "[condition]") {
    auto r = Condition::parse("($A == 1 or $B == 2) and $C == 3");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind() == Condition::And);
    REQUIRE(r.value().to_string() == "($A == 1 or $B == 2) and $C == 3");
}

TEST_CASE("parse tolerates missing whitespace", "[condition]") {
    auto r = Condition::parse("$ROS_DISTRO!=foxy");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "$ROS_DISTRO != foxy");
}

TEST_CASE("keyword prefixes are values, not operators", "[condition]") {
    auto r = Condition::parse("$X == android");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind() == Condition::Compare);
    REQUIRE(r.value().evaluate({{"X", "android"}}));
}

// ===== Parse errors =====

TEST_CASE("parse error on empty condition", "[condition]") {
    auto r = Condition::parse("   ");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RosidError::InvalidArg);
}

TEST_CASE("parse error on missing operand", "[condition]") {
    auto r = Condition::parse("$A ==");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RosidError::Condition);
}

TEST_CASE("parse error on bare term", "[condition]") {
    auto r = Condition::parse("$A");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RosidError::Condition);
}

TEST_CASE("parse error on unclosed parenthesis", "[condition]") {
    auto r = Condition::parse("($A == 1");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RosidError::Condition);
}

TEST_CASE("parse error on lone dollar", "[condition]") {
    auto r = Condition::parse("$ == 1");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RosidError::Condition);
}

TEST_CASE("parse error on trailing garbage", "[condition]") {
    auto r = Condition::parse("$A == 1 $B");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RosidError::Condition);
}

// ===== Evaluation =====

TEST_CASE("evaluate substitutes environment variables", "[condition]") {
    auto r = Condition::parse("$ROS_VERSION == 2");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().evaluate({{"ROS_VERSION", "2"}}));
    REQUIRE_FALSE(r.value().evaluate({{"ROS_VERSION", "1"}}));
}

TEST_CASE("unset variables compare as empty strings", "[condition]") {
    auto r = Condition::parse("$UNSET == ''");
    REQUIRE(r.is_err());  // quotes are not part of the grammar

    auto ne = Condition::parse("$UNSET != x");
    REQUIRE(ne.is_ok());
    REQUIRE(ne.value().evaluate({}));

    auto lt = Condition::parse("$UNSET < a");
    REQUIRE(lt.is_ok());
    REQUIRE(lt.value().evaluate({}));
}

TEST_CASE("comparisons are lexicographic", "[condition]") {
    auto r = Condition::parse("$ROS_DISTRO >= humble");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().evaluate({{"ROS_DISTRO", "iron"}}));
    REQUIRE_FALSE(r.value().evaluate({{"ROS_DISTRO", "foxy"}}));
}

TEST_CASE("evaluate and / or", "[condition]") {
    auto r = Condition::parse("$A == 1 and ($B == 2 or $C == 3)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().evaluate({{"A", "1"}, {"C", "3"}}));
    REQUIRE_FALSE(r.value().evaluate({{"A", "1"}}));
    REQUIRE_FALSE(r.value().evaluate({{"B", "2"}, {"C", "3"}}));
}

TEST_CASE("evaluate_condition treats empty as true", "[condition]") {
    auto r = evaluate_condition("", {});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == true);
}

TEST_CASE("evaluate_condition reports parse errors", "[condition]") {
    auto r = evaluate_condition("and", {});
    REQUIRE(r.is_err());
}
