#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace minibasic {

// Categories of failure a running program can produce.
enum class ErrorKind {
    None = 0,
    UndefinedVariable,
    InvalidFactor,
    InvalidNumber,
    InvalidCondition,
    MissingGoto,
    UnsupportedStatement,
    LineNotFound,
    StepLimit,
    Internal
};

/**
 * BasicError - a failed statement
 *
 * what() is the complete output record for the failure (for example
 * "Error: Unsupported statement: input x"). Statement handlers throw it;
 * InterpreterLoop writes the record, remembers the kind and carries on
 * with the next line, so it never leaves run().
 */
class BasicError : public std::runtime_error {
public:
    BasicError(ErrorKind kind, const std::string& record, size_t lineIndex = 0)
        : std::runtime_error(record), kind_(kind), lineIndex_(lineIndex) {}

    ErrorKind getKind() const { return kind_; }
    size_t getLineIndex() const { return lineIndex_; }

private:
    ErrorKind kind_;
    size_t lineIndex_;
};

} // namespace minibasic
