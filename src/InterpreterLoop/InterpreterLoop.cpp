#include "InterpreterLoop.hpp"

#include <stdexcept>
#include <utility>

#include "../ProgramStore/ProgramStore.hpp"
#include "../Runtime/StringFunctions.hpp"

namespace minibasic {

constexpr size_t InterpreterLoop::DEFAULT_MAX_STEPS;
constexpr const char* InterpreterLoop::STEP_LIMIT_MESSAGE;

InterpreterLoop::InterpreterLoop(std::shared_ptr<ProgramStore> program)
    : prog(std::move(program)) {}

InterpreterLoop::~InterpreterLoop() = default;

void InterpreterLoop::reset() {
    halted = false;
    cursor = 0;
    stepCount = 0;
    lastError = ErrorKind::None;
    errorCount = 0;
}

void InterpreterLoop::run() {
    if (!prog) return;
    halted = false;
    while (!halted) {
        auto res = step();
        if (res == StepResult::Halted || res == StepResult::StepLimit) break;
    }
}

void InterpreterLoop::stop() { halted = true; }

std::string InterpreterLoop::prepareLine(const std::string& rawLine) {
    return stripLabel(stripComment(rawLine));
}

InterpreterLoop::StepResult InterpreterLoop::step() {
    if (!prog) return StepResult::Halted;

    if (cursor >= prog->size()) {
        // No more lines
        halted = true;
        return StepResult::Halted;
    }

    if (stepCount >= maxSteps) {
        recordError(BasicError(ErrorKind::StepLimit, STEP_LIMIT_MESSAGE, cursor));
        halted = true;
        return StepResult::StepLimit;
    }

    const std::string& raw = prog->getLine(cursor);
    if (traceEnabled) traceLine(cursor, raw);

    std::string statement = prepareLine(raw);
    Directive next = Directive::next();
    if (!statement.empty() && handler) {
        try {
            next = handler(statement, cursor);
        } catch (const BasicError& e) {
            recordError(e);
        } catch (const std::exception& e) {
            recordError(BasicError(ErrorKind::Internal, std::string("Error: ") + e.what(), cursor));
        }
    }

    // Empty lines still use a step
    ++stepCount;

    switch (next.kind) {
        case Directive::Kind::Halt:
            cursor = prog->size();
            halted = true;
            return StepResult::Halted;
        case Directive::Kind::Jump:
            cursor = next.target < prog->size() ? next.target : prog->size();
            return StepResult::Jumped;
        case Directive::Kind::Continue:
            break;
    }

    ++cursor;
    return StepResult::Continued;
}

void InterpreterLoop::traceLine(size_t lineIndex, const std::string& rawLine) {
    if (trace) trace(lineIndex, rawLine);
}

void InterpreterLoop::report(const std::string& message) {
    if (printCallback) printCallback(message + "\n");
}

void InterpreterLoop::recordError(const BasicError& error) {
    report(error.what());
    lastError = error.getKind();
    ++errorCount;
    if (errorCallback) errorCallback(error);
}

} // namespace minibasic
