#include <catch2/catch.hpp>
#include <memory>
#include <string>

#include "BasicDispatcher.hpp"
#include "../Runtime/BasicError.hpp"

using namespace minibasic;

// Run one statement that must fail and hand back the error it raised
static BasicError failureOf(BasicDispatcher& disp, const std::string& statement, size_t line = 0) {
    try {
        disp(statement, line);
    } catch (const BasicError& e) {
        return e;
    }
    FAIL("statement did not fail: " << statement);
    return BasicError(ErrorKind::None, "");
}

static std::shared_ptr<ProgramStore> storeWith(const std::string& source) {
    auto store = std::make_shared<ProgramStore>();
    store->load(source);
    return store;
}

TEST_CASE("BasicDispatcher classifies statements in priority order", "[dispatcher]") {
    REQUIRE(BasicDispatcher::classify("print 1") == StatementKind::Print);
    REQUIRE(BasicDispatcher::classify("print x=1") == StatementKind::Print);
    REQUIRE(BasicDispatcher::classify("x=1") == StatementKind::Assignment);
    REQUIRE(BasicDispatcher::classify("if x=1 goto 10") == StatementKind::If);
    REQUIRE(BasicDispatcher::classify("if x<1 goto 10") == StatementKind::If);
    // Mentions '=' but not goto, so it is an assignment to "ifx"
    REQUIRE(BasicDispatcher::classify("if x=1") == StatementKind::Assignment);
    REQUIRE(BasicDispatcher::classify("goto 10") == StatementKind::Goto);
    REQUIRE(BasicDispatcher::classify("end") == StatementKind::End);
    REQUIRE(BasicDispatcher::classify("ending") == StatementKind::Unsupported);
    REQUIRE(BasicDispatcher::classify("PRINT 1") == StatementKind::Unsupported);
}

TEST_CASE("BasicDispatcher PRINT evaluates and formats", "[dispatcher]") {
    std::string captured;
    BasicDispatcher disp(nullptr, [&](const std::string& s) { captured += s; });

    auto r = disp("print 2+3*4");
    REQUIRE(r.kind == Directive::Kind::Continue);
    REQUIRE(captured == "14.0\n");
}

TEST_CASE("BasicDispatcher PRINT reports evaluation errors", "[dispatcher]") {
    std::string captured;
    BasicDispatcher disp(nullptr, [&](const std::string& s) { captured += s; });

    auto err = failureOf(disp, "print y", 4);
    REQUIRE(err.getKind() == ErrorKind::UndefinedVariable);
    REQUIRE(err.getLineIndex() == 4);
    REQUIRE(std::string(err.what()) == "Error evaluating print expression: Undefined variable: y");
    REQUIRE(captured.empty());

    REQUIRE(failureOf(disp, "print 3+#").getKind() == ErrorKind::InvalidFactor);
    REQUIRE(failureOf(disp, "print 1..2").getKind() == ErrorKind::InvalidNumber);
}

TEST_CASE("BasicDispatcher assignment stores and echoes", "[dispatcher]") {
    std::string captured;
    BasicDispatcher disp(nullptr, [&](const std::string& s) { captured += s; });

    disp("x = 2 * 3");
    REQUIRE(captured == "x = 6.0\n");
    const double* x = disp.getVariables().tryGet("x");
    REQUIRE(x != nullptr);
    REQUIRE(*x == 6.0);

    captured.clear();
    auto err = failureOf(disp, "z=q+1");
    REQUIRE(err.getKind() == ErrorKind::UndefinedVariable);
    REQUIRE(std::string(err.what()) == "Error evaluating expression for z: Undefined variable: q");
    REQUIRE(captured.empty());
    REQUIRE_FALSE(disp.getVariables().contains("z"));
}

TEST_CASE("BasicDispatcher GOTO resolves labels", "[dispatcher]") {
    std::string captured;
    auto store = storeWith("10 print 1\n20 print 2\n30 end");
    BasicDispatcher disp(store, [&](const std::string& s) { captured += s; });

    auto r = disp("goto 20");
    REQUIRE(r.kind == Directive::Kind::Jump);
    REQUIRE(r.target == 1);
    REQUIRE(captured.empty());

    auto missing = failureOf(disp, "goto 99", 2);
    REQUIRE(missing.getKind() == ErrorKind::LineNotFound);
    REQUIRE(missing.getLineIndex() == 2);
    REQUIRE(std::string(missing.what()) == "Error: 'goto' target line not found: 99");
    REQUIRE(captured.empty());
}

TEST_CASE("BasicDispatcher IF with and without parentheses", "[dispatcher]") {
    std::string captured;
    auto store = storeWith("if (1<2) goto 30\nprint 99\n30 print 1");
    BasicDispatcher disp(store, [&](const std::string& s) { captured += s; });

    auto paren = disp("if (1<2) goto 30");
    REQUIRE(paren.kind == Directive::Kind::Jump);
    REQUIRE(paren.target == 2);

    auto bare = disp("if 1<2 goto 30");
    REQUIRE(bare.kind == Directive::Kind::Jump);
    REQUIRE(bare.target == 2);

    auto falseCond = disp("if 2<1 goto 30");
    REQUIRE(falseCond.kind == Directive::Kind::Continue);
    REQUIRE(captured.empty());
}

TEST_CASE("BasicDispatcher IF silently ignores an unknown target", "[dispatcher]") {
    std::string captured;
    auto store = storeWith("10 print 1");
    BasicDispatcher disp(store, [&](const std::string& s) { captured += s; });

    auto r = disp("if 1<2 goto 99");
    REQUIRE(r.kind == Directive::Kind::Continue);
    REQUIRE(captured.empty());
}

TEST_CASE("BasicDispatcher IF error messages", "[dispatcher]") {
    std::string captured;
    BasicDispatcher disp(nullptr, [&](const std::string& s) { captured += s; });

    auto noGoto = failureOf(disp, "if x<1");
    REQUIRE(noGoto.getKind() == ErrorKind::MissingGoto);
    REQUIRE(std::string(noGoto.what()) == "Error: 'if' statement missing 'goto'");

    auto undefined = failureOf(disp, "if x<1 goto 10");
    REQUIRE(undefined.getKind() == ErrorKind::UndefinedVariable);
    REQUIRE(std::string(undefined.what()) == "Error evaluating 'if' condition: Undefined variable: x");

    auto noOperator = failureOf(disp, "if 1 goto 10");
    REQUIRE(noOperator.getKind() == ErrorKind::InvalidCondition);
    REQUIRE(std::string(noOperator.what()) == "Error evaluating 'if' condition: Invalid condition: 1");
    REQUIRE(captured.empty());
}

TEST_CASE("BasicDispatcher END halts and unknown statements are reported", "[dispatcher]") {
    std::string captured;
    BasicDispatcher disp(nullptr, [&](const std::string& s) { captured += s; });

    REQUIRE(disp("end").kind == Directive::Kind::Halt);

    auto err = failureOf(disp, "input x");
    REQUIRE(err.getKind() == ErrorKind::UnsupportedStatement);
    REQUIRE(std::string(err.what()) == "Error: Unsupported statement: input x");
    REQUIRE(captured.empty());
}

TEST_CASE("BasicDispatcher clearVariables empties the table", "[dispatcher]") {
    BasicDispatcher disp(nullptr);
    disp("a=1");
    disp("b=2");
    REQUIRE(disp.getVariables().size() == 2);
    disp.clearVariables();
    REQUIRE(disp.getVariables().empty());
}
