#include "ExpressionEvaluator.hpp"

#include <array>
#include <cstdlib>

#include "../Runtime/StringFunctions.hpp"

namespace minibasic {

namespace {

struct ComparisonToken {
    const char* text;
    Comparison op;
};

// Scan order is observable: "x>=5" splits at '=' because '=' is tried first.
constexpr std::array<ComparisonToken, 5> kComparisons = {{
    {"=", Comparison::Equal},
    {">", Comparison::Greater},
    {"<", Comparison::Less},
    {">=", Comparison::GreaterEqual},
    {"<=", Comparison::LessEqual},
}};

} // namespace

ExpressionEvaluator::ExpressionEvaluator(const VariableTable& variables)
    : vars(variables) {}

NumberResult ExpressionEvaluator::evaluate(const std::string& text) const {
    size_t pos = 0;
    return parseExpression(text, pos);
}

bool ExpressionEvaluator::isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}
bool ExpressionEvaluator::isAsciiDigit(char c) { return c >= '0' && c <= '9'; }
bool ExpressionEvaluator::isAsciiAlpha(char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }

void ExpressionEvaluator::skipSpaces(const std::string& e, size_t& pos) {
    while (pos < e.size() && isAsciiSpace(e[pos])) pos++;
}

NumberResult ExpressionEvaluator::parseExpression(const std::string& e, size_t& pos) const {
    auto result = parseTerm(e, pos);
    if (!result) return result;
    while (pos < e.size()) {
        char ch = e[pos];
        if (ch != '+' && ch != '-') break;
        ++pos;
        auto rhs = parseTerm(e, pos);
        if (!rhs) return rhs;
        if (ch == '+') result.value += rhs.value;
        else result.value -= rhs.value;
    }
    return result;
}

NumberResult ExpressionEvaluator::parseTerm(const std::string& e, size_t& pos) const {
    auto result = parseFactor(e, pos);
    if (!result) return result;
    while (pos < e.size()) {
        char ch = e[pos];
        if (ch != '*' && ch != '/') break;
        ++pos;
        auto rhs = parseFactor(e, pos);
        if (!rhs) return rhs;
        if (ch == '*') result.value *= rhs.value;
        else result.value /= rhs.value;
    }
    return result;
}

NumberResult ExpressionEvaluator::parseFactor(const std::string& e, size_t& pos) const {
    skipSpaces(e, pos);
    if (pos >= e.size()) {
        return NumberResult::fail(ErrorKind::InvalidFactor,
                                  "Invalid factor at position: " + std::to_string(pos), pos);
    }

    char ch = e[pos];
    if (ch == '(') {
        ++pos;
        auto inner = parseExpression(e, pos);
        if (!inner) return inner;
        // A missing ')' is tolerated
        if (pos < e.size() && e[pos] == ')') ++pos;
        return inner;
    }
    if (isAsciiDigit(ch) || ch == '.') return parseNumber(e, pos);
    if (isAsciiAlpha(ch)) return parseVariable(e, pos);

    return NumberResult::fail(ErrorKind::InvalidFactor,
                              "Invalid factor at position: " + std::to_string(pos), pos);
}

NumberResult ExpressionEvaluator::parseNumber(const std::string& e, size_t& pos) const {
    size_t start = pos;
    while (pos < e.size() && (isAsciiDigit(e[pos]) || e[pos] == '.')) ++pos;
    std::string literal = e.substr(start, pos - start);

    char* end = nullptr;
    double v = std::strtod(literal.c_str(), &end);
    if (end == literal.c_str() || *end != '\0') {
        return NumberResult::fail(ErrorKind::InvalidNumber, "Invalid number: " + literal, start);
    }
    return NumberResult::ok(v);
}

NumberResult ExpressionEvaluator::parseVariable(const std::string& e, size_t& pos) const {
    size_t start = pos;
    while (pos < e.size() && isAsciiAlpha(e[pos])) ++pos;
    std::string name = e.substr(start, pos - start);
    if (const double* v = vars.tryGet(name)) return NumberResult::ok(*v);
    return NumberResult::fail(ErrorKind::UndefinedVariable, "Undefined variable: " + name, start);
}

NumberResult ExpressionEvaluator::resolveOperand(const std::string& operand) const {
    if (const double* v = vars.tryGet(operand)) return NumberResult::ok(*v);
    return evaluate(operand);
}

ConditionResult ExpressionEvaluator::evaluateCondition(const std::string& condition) const {
    for (const auto& token : kComparisons) {
        size_t opIndex = condition.find(token.text);
        if (opIndex == std::string::npos) continue;

        std::string left = trim(condition.substr(0, opIndex));
        std::string right = trim(condition.substr(opIndex + std::char_traits<char>::length(token.text)));

        auto lhs = resolveOperand(left);
        if (!lhs) return ConditionResult::from(lhs);
        auto rhs = resolveOperand(right);
        if (!rhs) return ConditionResult::from(rhs);

        return ConditionResult::ok(compare(token.op, lhs.value, rhs.value));
    }
    return ConditionResult::fail(ErrorKind::InvalidCondition, "Invalid condition: " + condition);
}

bool ExpressionEvaluator::compare(Comparison op, double left, double right) {
    switch (op) {
        case Comparison::Equal: return left == right;
        case Comparison::Greater: return left > right;
        case Comparison::Less: return left < right;
        case Comparison::GreaterEqual: return left >= right;
        case Comparison::LessEqual: return left <= right;
    }
    return false;
}

} // namespace minibasic
