#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "BasicDispatcher.hpp"
#include "../Runtime/BasicError.hpp"

namespace minibasic {

class ProgramStore;

/**
 * InterpreterLoop
 *
 * Drives execution over the lines held by a ProgramStore. Each step strips
 * the comment and line-number label from the current line, hands the rest
 * to a pluggable statement handler and applies the returned Directive.
 * A step budget bounds every run: when it is used up the loop writes the
 * infinite-loop error through the print callback and halts.
 *
 * Failed statements arrive as BasicError; the loop prints the record,
 * counts it and continues with the next line.
 */
class InterpreterLoop {
public:
    // Execution result for a single step
    enum class StepResult {
        Continued,   // Proceed to next line
        Jumped,      // Control transferred to another line
        Halted,      // Program ended (END or past the last line)
        StepLimit    // Step budget exhausted
    };

    static constexpr size_t DEFAULT_MAX_STEPS = 100;
    static constexpr const char* STEP_LIMIT_MESSAGE =
        "Error: Program stopped due to potential infinite loop";

    // Diagnostic / trace callback: (lineIndex, rawLine)
    using TraceCallback = std::function<void(size_t, const std::string&)>;

    // Statement handler: (statement, lineIndex) -> what to do next.
    // May throw; a BasicError's text is printed as is, any other
    // std::exception as "Error: <what>".
    using StatementHandler = std::function<Directive(const std::string& statement, size_t lineIndex)>;

    // Receives loop-level messages, newline-terminated
    using PrintCallback = std::function<void(const std::string&)>;

    // Sees every recorded failure, step limit included
    using ErrorCallback = std::function<void(const BasicError&)>;

    explicit InterpreterLoop(std::shared_ptr<ProgramStore> program);
    ~InterpreterLoop();

    // Configuration
    void setTrace(bool enabled) { traceEnabled = enabled; }
    void setTraceCallback(TraceCallback cb) { trace = std::move(cb); }
    void setStatementHandler(StatementHandler cb) { handler = std::move(cb); }
    void setPrintCallback(PrintCallback cb) { printCallback = std::move(cb); }
    void setErrorCallback(ErrorCallback cb) { errorCallback = std::move(cb); }
    void setMaxSteps(size_t steps) { maxSteps = steps; }
    size_t getMaxSteps() const { return maxSteps; }

    // Program control
    void reset();             // Rewind cursor, step counter and error record
    void run();               // Run from the current cursor until halted
    void stop();              // Halt after the current step

    // Single-step execution (useful for debugger and tests)
    StepResult step();

    size_t getCursor() const { return cursor; }
    size_t getStepCount() const { return stepCount; }
    bool isHalted() const { return halted; }
    ErrorKind getLastError() const { return lastError; }
    size_t getErrorCount() const { return errorCount; }

    // Line text as the handler sees it: comment and leading label removed
    static std::string prepareLine(const std::string& rawLine);

private:
    std::shared_ptr<ProgramStore> prog;
    bool halted{false};
    bool traceEnabled{false};
    TraceCallback trace{};
    StatementHandler handler{};
    PrintCallback printCallback{};
    ErrorCallback errorCallback{};

    size_t cursor{0};
    size_t stepCount{0};
    size_t maxSteps{DEFAULT_MAX_STEPS};

    ErrorKind lastError{ErrorKind::None};
    size_t errorCount{0};

    // Helpers
    void traceLine(size_t lineIndex, const std::string& rawLine);
    void report(const std::string& message);
    void recordError(const BasicError& error);
};

} // namespace minibasic
