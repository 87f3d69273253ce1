#include "BasicEngine.hpp"

#include <exception>
#include <utility>

namespace minibasic {

BasicEngine::BasicEngine() : BasicEngine(EngineOptions{}) {}

BasicEngine::BasicEngine(EngineOptions opts)
    : options(std::move(opts)), program(std::make_shared<ProgramStore>()) {
    if (options.labelMatcher) program->setLineMatcher(options.labelMatcher);

    auto print = [this](const std::string& text) { output.append(text); };
    dispatcher = std::make_unique<BasicDispatcher>(program, print);

    loop = std::make_unique<InterpreterLoop>(program);
    loop->setMaxSteps(options.maxSteps);
    loop->setPrintCallback(print);
    loop->setStatementHandler([this](const std::string& statement, size_t lineIndex) {
        return (*dispatcher)(statement, lineIndex);
    });
    loop->setTrace(options.trace);
    loop->setTraceCallback([this](size_t lineIndex, const std::string& rawLine) {
        logMessage("InterpreterLoop", std::to_string(lineIndex + 1) + ": " + rawLine);
    });
    loop->setErrorCallback([this](const BasicError& error) {
        logMessage("InterpreterLoop", "error on line " + std::to_string(error.getLineIndex() + 1) +
                                          ": " + error.what());
    });
}

BasicEngine::~BasicEngine() = default;

void BasicEngine::load(const std::string& sourceText) {
    size_t count = program->load(sourceText);
    loop->reset();
    output.clear();
    logMessage("ProgramStore", "loaded " + std::to_string(count) + " lines");
}

void BasicEngine::run() {
    try {
        loop->run();
    } catch (const std::exception& e) {
        output.appendLine(std::string("Error: ") + e.what());
    }
    logMessage("BasicEngine", "run finished after " + std::to_string(loop->getStepCount()) + " steps, " +
                                  std::to_string(output.lineCount()) + " output lines, " +
                                  std::to_string(loop->getErrorCount()) + " errors");
}

void BasicEngine::clearVariables() {
    dispatcher->clearVariables();
    output.clear();
}

void BasicEngine::logMessage(const std::string& component, const std::string& message) const {
    if (options.trace && log) log(component, message);
}

} // namespace minibasic
