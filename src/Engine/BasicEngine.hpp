#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "../InterpreterLoop/BasicDispatcher.hpp"
#include "../InterpreterLoop/InterpreterLoop.hpp"
#include "../ProgramStore/ProgramStore.hpp"
#include "../Runtime/BasicError.hpp"
#include "../Runtime/OutputBuffer.hpp"
#include "../Runtime/VariableTable.hpp"

namespace minibasic {

// Engine configuration, filled in by the front end from its command line
struct EngineOptions {
    size_t maxSteps{InterpreterLoop::DEFAULT_MAX_STEPS};
    bool trace{false};
    ProgramStore::LineMatcher labelMatcher{}; // empty: prefix matching
};

/**
 * BasicEngine
 *
 * One interpreter session: program, cursor, variables and output all live
 * here, so independent engines never share state. Front ends talk to it
 * through load/run/getOutput/clearVariables and display the output text
 * verbatim. run() never throws; program errors are part of the output.
 */
class BasicEngine {
public:
    // Diagnostic sink: (component, message)
    using LogCallback = std::function<void(const std::string&, const std::string&)>;

    BasicEngine();
    explicit BasicEngine(EngineOptions opts);
    ~BasicEngine();

    BasicEngine(const BasicEngine&) = delete;
    BasicEngine& operator=(const BasicEngine&) = delete;

    // Replace the program and rewind; variables are kept
    void load(const std::string& sourceText);

    // Execute from the current cursor to END, the last line or the step ceiling
    void run();

    std::string getOutput() const { return output.str(); }

    // Empty the variables and the output; the program stays loaded
    void clearVariables();

    const ProgramStore& getProgram() const { return *program; }
    const VariableTable& getVariables() const { return dispatcher->getVariables(); }
    size_t getStepCount() const { return loop->getStepCount(); }
    size_t getCursor() const { return loop->getCursor(); }
    ErrorKind getLastError() const { return loop->getLastError(); }
    size_t getErrorCount() const { return loop->getErrorCount(); }
    const EngineOptions& getOptions() const { return options; }

    void setLogCallback(LogCallback cb) { log = std::move(cb); }
    void setOutputEcho(OutputBuffer::EchoCallback cb) { output.setEchoCallback(std::move(cb)); }

private:
    EngineOptions options;
    std::shared_ptr<ProgramStore> program;
    OutputBuffer output;
    std::unique_ptr<BasicDispatcher> dispatcher;
    std::unique_ptr<InterpreterLoop> loop;
    LogCallback log;

    void logMessage(const std::string& component, const std::string& message) const;
};

} // namespace minibasic
