#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "../Runtime/BasicError.hpp"
#include "../Runtime/VariableTable.hpp"

namespace minibasic {

// Evaluation result: a value, or the kind and text of the failure.
template<typename T>
struct EvalResult {
    T value{};
    ErrorKind error{ErrorKind::None};
    std::string message;
    size_t position{0};

    explicit operator bool() const { return error == ErrorKind::None; }

    static EvalResult ok(T v) {
        EvalResult r;
        r.value = v;
        return r;
    }

    static EvalResult fail(ErrorKind kind, std::string msg, size_t pos = 0) {
        EvalResult r;
        r.error = kind;
        r.message = std::move(msg);
        r.position = pos;
        return r;
    }

    // Re-type a failure (e.g. a numeric failure inside a condition)
    template<typename U>
    static EvalResult from(const EvalResult<U>& other) {
        return fail(other.error, other.message, other.position);
    }
};

using NumberResult = EvalResult<double>;
using ConditionResult = EvalResult<bool>;

// Comparison operators recognised in an IF condition
enum class Comparison { Equal, Greater, Less, GreaterEqual, LessEqual };

/**
 * ExpressionEvaluator
 *
 * Recursive-descent evaluator over plain text:
 *   expression := term (('+' | '-') term)*
 *   term       := factor (('*' | '/') factor)*
 *   factor     := '(' expression [')'] | number | identifier
 *
 * Whitespace is skipped only in front of a factor, and parsing stops at the
 * first character that does not continue the grammar; the rest of the text
 * is ignored. Division follows IEEE rules (no error on zero divisors).
 * Variables are read from the VariableTable given at construction.
 */
class ExpressionEvaluator {
public:
    explicit ExpressionEvaluator(const VariableTable& variables);

    NumberResult evaluate(const std::string& text) const;

    // Relational test used by IF. The operator scan order is fixed:
    // "=", ">", "<", ">=", "<=" and the first one found anywhere wins.
    ConditionResult evaluateCondition(const std::string& condition) const;

    static bool compare(Comparison op, double left, double right);

private:
    const VariableTable& vars;

    NumberResult parseExpression(const std::string& e, size_t& pos) const;
    NumberResult parseTerm(const std::string& e, size_t& pos) const;
    NumberResult parseFactor(const std::string& e, size_t& pos) const;
    NumberResult parseNumber(const std::string& e, size_t& pos) const;
    NumberResult parseVariable(const std::string& e, size_t& pos) const;

    // A condition operand: a known variable's value, else an expression
    NumberResult resolveOperand(const std::string& operand) const;

    static void skipSpaces(const std::string& e, size_t& pos);
    static bool isAsciiSpace(char c);
    static bool isAsciiDigit(char c);
    static bool isAsciiAlpha(char c);
};

} // namespace minibasic
