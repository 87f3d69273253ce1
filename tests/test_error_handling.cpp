#include <catch2/catch.hpp>
#include <string>

#include "../src/Engine/BasicEngine.hpp"
#include "../src/Runtime/BasicError.hpp"

using namespace minibasic;

static std::string runProgram(const std::string& source) {
    BasicEngine engine;
    engine.load(source);
    REQUIRE_NOTHROW(engine.run());
    return engine.getOutput();
}

TEST_CASE("Error Handling - unsupported statements are reported and skipped") {
    auto out = runProgram("10 input x\n20 PRINT 1\n30 print 2");
    REQUIRE(out ==
        "Error: Unsupported statement: input x\n"
        "Error: Unsupported statement: PRINT 1\n"
        "2.0\n");
}

TEST_CASE("Error Handling - goto to a missing label is reported, if-goto is not") {
    auto out = runProgram("goto 500\nif 1<2 goto 600\nprint 3");
    REQUIRE(out == "Error: 'goto' target line not found: 500\n3.0\n");
}

TEST_CASE("Error Handling - if without goto") {
    auto out = runProgram("if (1<2) print 5\nprint 6");
    REQUIRE(out == "Error: 'if' statement missing 'goto'\n6.0\n");
}

TEST_CASE("Error Handling - condition failures") {
    auto out = runProgram("if q>1 goto 10\nif 5 goto 10\n10 print 1");
    REQUIRE(out ==
        "Error evaluating 'if' condition: Undefined variable: q\n"
        "Error evaluating 'if' condition: Invalid condition: 5\n"
        "1.0\n");
}

TEST_CASE("Error Handling - assignment failures name the variable") {
    auto out = runProgram("a=b*2\nc=\nd=1.2.3");
    REQUIRE(out ==
        "Error evaluating expression for a: Undefined variable: b\n"
        "Error evaluating expression for c: Invalid factor at position: 0\n"
        "Error evaluating expression for d: Invalid number: 1.2.3\n");
}

TEST_CASE("Error Handling - print failures") {
    auto out = runProgram("print\nprint 3+#");
    REQUIRE(out ==
        "Error evaluating print expression: Invalid factor at position: 0\n"
        "Error evaluating print expression: Invalid factor at position: 2\n");
}

TEST_CASE("Error Handling - division by zero is not an error") {
    auto out = runProgram("print 1/0\nprint 0-1/0\nprint 0/0\nz=4/0");
    REQUIRE(out == "Infinity\n-Infinity\nNaN\nz = Infinity\n");
}

TEST_CASE("Error Handling - step limit is fatal to the run only") {
    BasicEngine engine;
    engine.load("10 x=1\n20 goto 10\n30 print 9");
    engine.run();
    auto out = engine.getOutput();
    REQUIRE(out.size() > 0);
    // 50 assignments, then the limit message, and line 30 never runs
    REQUIRE(out.find("9.0") == std::string::npos);
    REQUIRE(out.rfind("Error: Program stopped due to potential infinite loop\n") ==
            out.size() - std::string("Error: Program stopped due to potential infinite loop\n").size());
    REQUIRE(engine.getStepCount() == 100);

    // The engine stays usable
    engine.load("print 1");
    engine.run();
    REQUIRE(engine.getOutput() == "1.0\n");
}

TEST_CASE("Error Handling - the engine remembers the kind of the last failure") {
    BasicEngine engine;
    engine.load("print 1");
    engine.run();
    REQUIRE(engine.getLastError() == ErrorKind::None);
    REQUIRE(engine.getErrorCount() == 0);

    engine.load("a=b\nif 1<2\nprint 2\ngoto 99");
    engine.run();
    REQUIRE(engine.getErrorCount() == 3);
    REQUIRE(engine.getLastError() == ErrorKind::LineNotFound);

    engine.load("10 goto 10");
    engine.run();
    REQUIRE(engine.getErrorCount() == 1);
    REQUIRE(engine.getLastError() == ErrorKind::StepLimit);
}

TEST_CASE("BasicError carries kind, record and line") {
    BasicError err(ErrorKind::InvalidFactor, "Error evaluating print expression: Invalid factor at position: 3", 7);
    REQUIRE(std::string(err.what()) == "Error evaluating print expression: Invalid factor at position: 3");
    REQUIRE(err.getKind() == ErrorKind::InvalidFactor);
    REQUIRE(err.getLineIndex() == 7);
}
