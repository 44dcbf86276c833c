#include <rosid/condition.hpp>
#include <algorithm>
#include <cctype>

namespace rosid {

// ---------------------------------------------------------------------------
// Static constructors
// ---------------------------------------------------------------------------

Condition Condition::compare(std::string lhs, Op op, std::string rhs) {
    Condition c;
    c.kind_ = Compare;
    c.op_ = op;
    c.lhs_ = std::move(lhs);
    c.rhs_ = std::move(rhs);
    return c;
}

Condition Condition::all(std::vector<Condition> children) {
    Condition c;
    c.kind_ = And;
    c.children_ = std::move(children);
    return c;
}

Condition Condition::any(std::vector<Condition> children) {
    Condition c;
    c.kind_ = Or;
    c.children_ = std::move(children);
    return c;
}

Condition::Kind Condition::kind() const {
    return kind_;
}

const char* op_symbol(Condition::Op op) {
    switch (op) {
    case Condition::Eq: return "==";
    case Condition::Ne: return "!=";
    case Condition::Ge: return ">=";
    case Condition::Gt: return ">";
    case Condition::Le: return "<=";
    case Condition::Lt: return "<";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// Evaluator
// ---------------------------------------------------------------------------

static std::string resolve_term(const std::string& term, const Environment& env) {
    if (!term.empty() && term[0] == '$') {
        auto it = env.find(term.substr(1));
        return it != env.end() ? it->second : std::string();
    }
    return term;
}

bool Condition::evaluate(const Environment& env) const {
    switch (kind_) {
    case Compare: {
        std::string l = resolve_term(lhs_, env);
        std::string r = resolve_term(rhs_, env);
        switch (op_) {
        case Eq: return l == r;
        case Ne: return l != r;
        case Ge: return l >= r;
        case Gt: return l > r;
        case Le: return l <= r;
        case Lt: return l < r;
        }
        return false;
    }
    case And:
        return std::all_of(children_.begin(), children_.end(),
            [&](const Condition& c) { return c.evaluate(env); });
    case Or:
        return std::any_of(children_.begin(), children_.end(),
            [&](const Condition& c) { return c.evaluate(env); });
    }
    return false; // unreachable
}

// ---------------------------------------------------------------------------
// to_string
// ---------------------------------------------------------------------------

std::string Condition::to_string() const {
    if (kind_ == Compare) {
        return lhs_ + " " + op_symbol(op_) + " " + rhs_;
    }

    const char* sep = kind_ == And ? " and " : " or ";
    std::string s;
    for (size_t i = 0; i < children_.size(); ++i) {
        if (i > 0) s += sep;
        const Condition& child = children_[i];
        // 'and' binds tighter than 'or'
        bool wrap = child.kind_ != Compare && child.kind_ != kind_;
        if (wrap) s += "(";
        s += child.to_string();
        if (wrap) s += ")";
    }
    return s;
}

// ---------------------------------------------------------------------------
// Recursive descent parser
// ---------------------------------------------------------------------------

namespace {

bool is_term_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

struct Parser {
    const std::string& input;
    size_t pos;

    explicit Parser(const std::string& s) : input(s), pos(0) {}

    void skip_ws() {
        while (pos < input.size() &&
               std::isspace(static_cast<unsigned char>(input[pos]))) {
            ++pos;
        }
    }

    bool at_end() const {
        return pos >= input.size();
    }

    char peek() const {
        return input[pos];
    }

    // Consume a keyword only when it is not the prefix of a longer word
    bool try_keyword(const std::string& keyword) {
        if (input.compare(pos, keyword.size(), keyword) != 0) return false;
        size_t after = pos + keyword.size();
        if (after < input.size() && is_term_char(input[after])) return false;
        pos = after;
        return true;
    }

    RosidError error_here(const std::string& msg) const {
        return RosidError{RosidError::Condition, msg,
            "at position " + std::to_string(pos) + " in '" + input + "'"};
    }

    Result<Condition> parse_or() {
        std::vector<Condition> children;
        auto first = parse_and();
        if (first.is_err()) return first;
        children.push_back(std::move(first).value());

        skip_ws();
        while (try_keyword("or")) {
            auto next = parse_and();
            if (next.is_err()) return next;
            children.push_back(std::move(next).value());
            skip_ws();
        }

        if (children.size() == 1) {
            return Result<Condition>::ok(std::move(children[0]));
        }
        return Result<Condition>::ok(Condition::any(std::move(children)));
    }

    Result<Condition> parse_and() {
        std::vector<Condition> children;
        auto first = parse_primary();
        if (first.is_err()) return first;
        children.push_back(std::move(first).value());

        skip_ws();
        while (try_keyword("and")) {
            auto next = parse_primary();
            if (next.is_err()) return next;
            children.push_back(std::move(next).value());
            skip_ws();
        }

        if (children.size() == 1) {
            return Result<Condition>::ok(std::move(children[0]));
        }
        return Result<Condition>::ok(Condition::all(std::move(children)));
    }

    Result<Condition> parse_primary() {
        skip_ws();
        if (at_end()) {
            return error_here("unexpected end of condition");
        }

        if (peek() == '(') {
            ++pos;
            auto inner = parse_or();
            if (inner.is_err()) return inner;
            skip_ws();
            if (at_end() || peek() != ')') {
                return error_here("expected ')'");
            }
            ++pos;
            return inner;
        }

        return parse_comparison();
    }

    Result<Condition> parse_comparison() {
        auto lhs = parse_term();
        if (lhs.is_err()) return std::move(lhs).error();

        skip_ws();
        Condition::Op op;
        if (input.compare(pos, 2, "==") == 0) {
            op = Condition::Eq; pos += 2;
        } else if (input.compare(pos, 2, "!=") == 0) {
            op = Condition::Ne; pos += 2;
        } else if (input.compare(pos, 2, ">=") == 0) {
            op = Condition::Ge; pos += 2;
        } else if (input.compare(pos, 2, "<=") == 0) {
            op = Condition::Le; pos += 2;
        } else if (!at_end() && peek() == '>') {
            op = Condition::Gt; ++pos;
        } else if (!at_end() && peek() == '<') {
            op = Condition::Lt; ++pos;
        } else {
            return error_here("expected comparison operator");
        }

        auto rhs = parse_term();
        if (rhs.is_err()) return std::move(rhs).error();

        return Result<Condition>::ok(Condition::compare(
            std::move(lhs).value(), op, std::move(rhs).value()));
    }

    Result<std::string> parse_term() {
        skip_ws();
        if (at_end()) {
            return error_here("expected variable or value");
        }

        size_t start = pos;
        if (peek() == '$') {
            ++pos;
            while (pos < input.size() &&
                   (std::isalnum(static_cast<unsigned char>(input[pos])) ||
                    input[pos] == '_')) {
                ++pos;
            }
            if (pos == start + 1) {
                return error_here("expected variable name after '$'");
            }
        } else {
            while (pos < input.size() && is_term_char(input[pos])) {
                ++pos;
            }
            if (pos == start) {
                return error_here(std::string("unexpected character '") +
                                  input[pos] + "'");
            }
        }
        return Result<std::string>::ok(input.substr(start, pos - start));
    }
};

} // anonymous namespace

Result<Condition> Condition::parse(const std::string& input) {
    Parser parser(input);
    parser.skip_ws();
    if (parser.at_end()) {
        return RosidError{RosidError::InvalidArg, "empty condition"};
    }

    auto result = parser.parse_or();
    if (result.is_err()) return result;

    parser.skip_ws();
    if (!parser.at_end()) {
        return parser.error_here("unexpected characters after condition");
    }

    return result;
}

Result<bool> evaluate_condition(const std::string& condition,
                                const Environment& env) {
    if (condition.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<bool>::ok(true);
    }
    auto parsed = Condition::parse(condition);
    if (parsed.is_err()) return std::move(parsed).error();
    return Result<bool>::ok(parsed.value().evaluate(env));
}

} // namespace rosid
