#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../ProgramStore/ProgramStore.hpp"
#include "../ExpressionEvaluator/ExpressionEvaluator.hpp"
#include "../NumericEngine/NumberFormat.hpp"
#include "../Runtime/BasicError.hpp"
#include "../Runtime/StringFunctions.hpp"
#include "../Runtime/VariableTable.hpp"

namespace minibasic {

// What the loop does after a statement ran
struct Directive {
    enum class Kind {
        Continue,   // Fall through to the next line
        Jump,       // Continue at `target`
        Halt        // Stop the program (END)
    };

    Kind kind{Kind::Continue};
    size_t target{0};

    static Directive next() { return Directive{}; }
    static Directive jumpTo(size_t index) { return Directive{Kind::Jump, index}; }
    static Directive halt() { return Directive{Kind::Halt, 0}; }
};

enum class StatementKind { Print, Assignment, If, Goto, End, Unsupported };

// Statement handlers for the supported subset:
// - print <expr>
// - <name>=<expr>
// - if [(]<condition>[)] goto <label>
// - goto <label>
// - end
// Input is one statement with the comment and line-number label already
// removed. A failing statement throws BasicError carrying its output record;
// the interpreter loop writes it and moves on to the next line.
class BasicDispatcher {
public:
    using PrintCallback = std::function<void(const std::string&)>;

    static constexpr const char* KW_PRINT = "print";
    static constexpr const char* KW_IF = "if";
    static constexpr const char* KW_GOTO = "goto";
    static constexpr const char* KW_END = "end";

    explicit BasicDispatcher(std::shared_ptr<ProgramStore> p, PrintCallback printCb = nullptr)
        : prog(std::move(p)), vars(), ev(vars), printCallback(std::move(printCb)) {}

    // The evaluator keeps a reference into this object
    BasicDispatcher(const BasicDispatcher&) = delete;
    BasicDispatcher& operator=(const BasicDispatcher&) = delete;

    Directive operator()(const std::string& statement) {
        return operator()(statement, 0);
    }

    Directive operator()(const std::string& statement, size_t currentIndex) {
        currentLine = currentIndex;
        if (statement.empty()) return Directive::next();

        switch (classify(statement)) {
            case StatementKind::Print: return doPRINT(statement);
            case StatementKind::Assignment: return doLET(statement);
            case StatementKind::If: return doIF(statement);
            case StatementKind::Goto: return doGOTO(statement);
            case StatementKind::End: return Directive::halt();
            case StatementKind::Unsupported: break;
        }
        fail(ErrorKind::UnsupportedStatement, "Error: Unsupported statement: " + statement);
    }

    // Priority order matters: "print x=1" is a print, "if a=b goto 10"
    // is an if (it mentions goto), "if a=b" alone is an assignment.
    static StatementKind classify(const std::string& statement) {
        if (startsWith(statement, KW_PRINT)) return StatementKind::Print;
        if (contains(statement, "=") && !contains(statement, KW_GOTO)) return StatementKind::Assignment;
        if (startsWith(statement, KW_IF)) return StatementKind::If;
        if (startsWith(statement, KW_GOTO)) return StatementKind::Goto;
        if (statement == KW_END) return StatementKind::End;
        return StatementKind::Unsupported;
    }

    VariableTable& getVariables() { return vars; }
    const VariableTable& getVariables() const { return vars; }

    void clearVariables() { vars.clear(); }

    void setPrintCallback(PrintCallback cb) { printCallback = std::move(cb); }

private:
    std::shared_ptr<ProgramStore> prog;
    VariableTable vars;
    ExpressionEvaluator ev;
    PrintCallback printCallback;
    size_t currentLine = 0; // Index of the line being executed

    void emit(const std::string& record) {
        if (printCallback) printCallback(record + "\n");
    }

    [[noreturn]] void fail(ErrorKind kind, const std::string& record) const {
        throw BasicError(kind, record, currentLine);
    }

    // Evaluation failures keep the evaluator's kind behind a statement-specific prefix
    template<typename T>
    [[noreturn]] void fail(const std::string& context, const EvalResult<T>& failed) const {
        fail(failed.error, context + failed.message);
    }

    std::optional<size_t> resolveTarget(const std::string& target) const {
        if (!prog) return std::nullopt;
        return prog->findLine(target);
    }

    Directive doPRINT(const std::string& statement) {
        std::string expression = trim(statement.substr(std::char_traits<char>::length(KW_PRINT)));
        auto res = ev.evaluate(expression);
        if (!res) fail("Error evaluating print expression: ", res);
        emit(NumberFormat::format(res.value));
        return Directive::next();
    }

    // Implied LET: name=expr, whitespace removed, split at the first '='
    Directive doLET(const std::string& statement) {
        std::string compact = removeWhitespace(statement);
        size_t eq = compact.find('='); // classify() guarantees one
        std::string name = compact.substr(0, eq);
        std::string expression = compact.substr(eq + 1);

        auto res = ev.evaluate(expression);
        if (!res) fail("Error evaluating expression for " + name + ": ", res);
        vars.set(name, res.value);
        emit(name + " = " + NumberFormat::format(res.value));
        return Directive::next();
    }

    Directive doIF(const std::string& statement) {
        std::string rest = trim(statement.substr(std::char_traits<char>::length(KW_IF)));

        // "(cond) goto n" -> "cond goto n"
        if (startsWith(rest, "(") && contains(rest, ")")) {
            size_t close = rest.find(')');
            std::string conditionPart = trim(rest.substr(1, close - 1));
            std::string remaining = trim(rest.substr(close + 1));
            if (startsWith(remaining, KW_GOTO)) {
                rest = conditionPart + " " + remaining;
            }
        }

        size_t gotoIndex = rest.find(KW_GOTO);
        if (gotoIndex == std::string::npos) {
            fail(ErrorKind::MissingGoto, "Error: 'if' statement missing 'goto'");
        }

        std::string condition = trim(rest.substr(0, gotoIndex));
        std::string target = trim(rest.substr(gotoIndex + std::char_traits<char>::length(KW_GOTO)));

        auto cond = ev.evaluateCondition(condition);
        if (!cond) fail("Error evaluating 'if' condition: ", cond);
        if (!cond.value) return Directive::next();

        // An unresolved target is not reported here, unlike plain GOTO
        if (auto idx = resolveTarget(target)) return Directive::jumpTo(*idx);
        return Directive::next();
    }

    Directive doGOTO(const std::string& statement) {
        std::string target = trim(statement.substr(std::char_traits<char>::length(KW_GOTO)));
        if (auto idx = resolveTarget(target)) return Directive::jumpTo(*idx);
        fail(ErrorKind::LineNotFound, "Error: 'goto' target line not found: " + target);
    }
};

} // namespace minibasic
