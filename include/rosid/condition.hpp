#pragma once

#include <rosid/result.hpp>
#include <rosid/environment.hpp>
#include <string>
#include <vector>

namespace rosid {

// Boolean expression attached to manifest elements, e.g.
//   $ROS_VERSION == 2 and ($ROS_DISTRO != foxy or $USE_X == 1)
// Terms starting with '$' are substituted from the environment (empty if
// unset); all comparisons are string comparisons.
class Condition {
public:
    enum Kind { Compare, And, Or };
    enum Op { Eq, Ne, Ge, Gt, Le, Lt };

    static Condition compare(std::string lhs, Op op, std::string rhs);
    static Condition all(std::vector<Condition> children);
    static Condition any(std::vector<Condition> children);

    static Result<Condition> parse(const std::string& input);

    bool evaluate(const Environment& env) const;

    // Canonical form: single spaces, parentheses only where needed
    std::string to_string() const;

    Kind kind() const;

private:
    Kind kind_ = Compare;
    Op op_ = Eq;
    std::string lhs_;
    std::string rhs_;
    std::vector<Condition> children_;  // for And, Or
};

const char* op_symbol(Condition::Op op);

// Parse and evaluate in one step. An empty condition is true.
Result<bool> evaluate_condition(const std::string& condition,
                                const Environment& env);

} // namespace rosid
