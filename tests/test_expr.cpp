#include <gtest/gtest.h>
#include <hexcalc/lexer.hpp>
#include <hexcalc/parser.hpp>
#include <hexcalc/validator.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace {

using hexcalc::ErrorKind;
using hexcalc::TokKind;
using hexcalc::Value;

std::string validation_error(const std::string& src) {
    auto err = hexcalc::validate(hexcalc::tokenize(src));
    return err ? err->message : std::string();
}

hexcalc::EvalResult eval(const std::string& src, const hexcalc::Variables& vars = {}) {
    return hexcalc::evaluate(hexcalc::tokenize(src), vars);
}

Value value_of(const std::string& src, const hexcalc::Variables& vars = {}) {
    auto r = eval(src, vars);
    if (const auto* err = std::get_if<hexcalc::Error>(&r)) {
        ADD_FAILURE() << src << ": " << err->message;
        return 0;
    }
    return std::get<Value>(r);
}

hexcalc::Error error_of(const std::string& src, const hexcalc::Variables& vars = {}) {
    auto r = eval(src, vars);
    if (!std::holds_alternative<hexcalc::Error>(r)) {
        ADD_FAILURE() << src << " evaluated to " << std::get<Value>(r);
        return {};
    }
    return std::get<hexcalc::Error>(r);
}

// ---- validator ----

TEST(Validator, AcceptsWellFormedExpressions) {
    EXPECT_FALSE(hexcalc::validate(hexcalc::tokenize("1a5 + 2f")));
    EXPECT_FALSE(hexcalc::validate(hexcalc::tokenize("(a - 1) * ((b / 2))")));
    EXPECT_FALSE(hexcalc::validate(hexcalc::tokenize("x")));
}

TEST(Validator, IncompleteExpressions) {
    EXPECT_EQ(validation_error(""), "Expression is incomplete");
    EXPECT_EQ(validation_error("5 +"), "Expression is incomplete");
    EXPECT_EQ(validation_error("("), "Missing closing parenthesis");
}

TEST(Validator, ParenthesisBalance) {
    EXPECT_EQ(validation_error("(1 + 2"), "Missing closing parenthesis");
    EXPECT_EQ(validation_error("1 + 2)"), "Missing opening parenthesis");
    EXPECT_EQ(validation_error("()"), "Unexpected token ')'");
}

TEST(Validator, OperandOperatorAlternation) {
    EXPECT_EQ(validation_error("1 2"), "Unexpected token '2'");
    EXPECT_EQ(validation_error("+ 1"), "Unexpected token '+'");
    EXPECT_EQ(validation_error("a := 1"), "Unexpected token ':='");
}

TEST(Validator, ForeignTokensAreRejectedFirst) {
    EXPECT_EQ(validation_error("1 + : 2"), "Unknown token ':'");
    EXPECT_EQ(validation_error("1 // note"), "Comment inside expression is not allowed");
    // reported even where the structure breaks earlier
    EXPECT_EQ(validation_error("+ #"), "Unknown token '#'");
}

TEST(Validator, RechecksLexemesTheScannerCannotRuleOut) {
    std::vector<hexcalc::Token> bad_hex = {{TokKind::HexNumber, "1g", 0}};
    auto err = hexcalc::validate(bad_hex);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->kind, ErrorKind::Syntax);
    EXPECT_EQ(err->message, "Invalid hex literal '1g'");

    std::vector<hexcalc::Token> bad_ident = {{TokKind::Identifier, "Abc", 0}};
    err = hexcalc::validate(bad_ident);
    ASSERT_TRUE(err);
    EXPECT_EQ(err->message, "Identifier 'Abc' cannot start with uppercase letter");
}

// ---- compiler / evaluator ----

TEST(Expr, HexArithmetic) {
    EXPECT_EQ(value_of("1a5 + 2f"), 0x1c4);
    EXPECT_EQ(value_of("0ff"), 255);
}

TEST(Expr, MulDivBindTighterThanAddSub) {
    EXPECT_EQ(value_of("2 + 3 * 4"), 0xe);
    EXPECT_EQ(value_of("(2 + 3) * 4"), 0x14);
    EXPECT_EQ(value_of("2 * 3 + 4"), 0xa);
}

TEST(Expr, LeftAssociative) {
    EXPECT_EQ(value_of("10 - 4 - 2"), 0xa);
    EXPECT_EQ(value_of("40 / 4 / 2"), 0x8);
}

TEST(Expr, FloorDivision) {
    EXPECT_EQ(value_of("10 / 3"), 5);
    EXPECT_EQ(value_of("(0 - 1) / 2"), -1);
    EXPECT_EQ(value_of("(0 - 7) / 2"), -4);
    EXPECT_EQ(value_of("7 / (0 - 2)"), -4);
    EXPECT_EQ(value_of("(0 - 7) / (0 - 2)"), 3);
    EXPECT_EQ(value_of("(0 - 8) / 2"), -4);

    EXPECT_EQ(hexcalc::floor_div(7, 2), 3);
    EXPECT_EQ(hexcalc::floor_div(-7, 2), -4);
    EXPECT_EQ(hexcalc::floor_div(7, -2), -4);
    EXPECT_EQ(hexcalc::floor_div(-6, 3), -2);
}

TEST(Expr, Variables) {
    hexcalc::Variables vars{{"x", 0x10}, {"_y1", -2}};
    EXPECT_EQ(value_of("x * x", vars), 256);
    EXPECT_EQ(value_of("(x + _y1) / _y1", vars), -7);
}

TEST(Expr, UndefinedVariableIsSemantic) {
    auto err = error_of("0ff * (x - 1b)");
    EXPECT_EQ(err.kind, ErrorKind::Semantic);
    EXPECT_EQ(err.message, "Undefined variable 'x'");
}

TEST(Expr, FirstUndefinedVariableInSourceOrder) {
    EXPECT_EQ(error_of("a + b * 2").message, "Undefined variable 'a'");
    EXPECT_EQ(error_of("b * 2 + a").message, "Undefined variable 'b'");
}

TEST(Expr, DivisionByZeroIsSemantic) {
    auto err = error_of("1 / (2 - 2)");
    EXPECT_EQ(err.kind, ErrorKind::Semantic);
    EXPECT_EQ(err.message, "Division by zero");
}

TEST(Expr, SyntaxErrors) {
    struct Case { const char* src; const char* message; };
    const Case cases[] = {
        {"5 +", "Expression is incomplete"},
        {"", "Expression is incomplete"},
        {"1 2", "Unexpected token '2'"},
        {"(1", "Missing closing parenthesis"},
        {"(1 2)", "Unexpected token '2'"},
        {"1)", "Missing opening parenthesis"},
        {"* 1", "Unexpected token '*'"},
        {"1 + :", "Unknown token ':'"},
        {"1 + // c", "Comment inside expression is not allowed"},
    };
    for (const auto& c : cases) {
        auto err = error_of(c.src);
        EXPECT_EQ(err.kind, ErrorKind::Syntax) << c.src;
        EXPECT_EQ(err.message, c.message) << c.src;
    }
}

TEST(Expr, SyntaxIsCheckedBeforeAnythingEvaluates) {
    // `a` is undefined, but the expression is malformed
    auto err = error_of("a + (");
    EXPECT_EQ(err.kind, ErrorKind::Syntax);
    err = error_of("1 / 0 1");
    EXPECT_EQ(err.kind, ErrorKind::Syntax);
}

TEST(Expr, RangeAndOverflow) {
    EXPECT_EQ(value_of("7fffffffffffffff"), INT64_MAX);

    auto err = error_of("10000000000000000");
    EXPECT_EQ(err.kind, ErrorKind::Semantic);
    EXPECT_EQ(err.message, "Hex literal '10000000000000000' is out of range");

    EXPECT_EQ(error_of("7fffffffffffffff + 1").message, "Integer overflow");
    EXPECT_EQ(error_of("7fffffffffffffff * 2").message, "Integer overflow");
    EXPECT_EQ(error_of("0 - 7fffffffffffffff - 2").message, "Integer overflow");
    EXPECT_EQ(error_of("(0 - 7fffffffffffffff - 1) / (0 - 1)").message, "Integer overflow");
}

TEST(Expr, DeepNestingDoesNotCrash) {
    const std::size_t n = 1000000;
    EXPECT_EQ(value_of(std::string(n, '(') + "1" + std::string(n, ')')), 1);
    EXPECT_EQ(value_of(std::string(n, '(') + "2 * (3" + std::string(n + 1, ')') + " - 1"), 5);

    auto err = error_of(std::string(n, '(') + "1" + std::string(n - 1, ')'));
    EXPECT_EQ(err.kind, ErrorKind::Syntax);
    EXPECT_EQ(err.message, "Missing closing parenthesis");
}

TEST(Expr, CompileEmitsPostfixInSourceOrder) {
    auto p = hexcalc::compile(hexcalc::tokenize("a + b * 2"));
    ASSERT_EQ(p.code.size(), 5u);
    EXPECT_EQ(p.code[0].op, hexcalc::Op::PushVar);
    EXPECT_EQ(p.code[0].text, "a");
    EXPECT_EQ(p.code[1].op, hexcalc::Op::PushVar);
    EXPECT_EQ(p.code[1].text, "b");
    EXPECT_EQ(p.code[2].op, hexcalc::Op::PushNum);
    EXPECT_EQ(p.code[2].text, "2");
    EXPECT_EQ(p.code[3].op, hexcalc::Op::Mul);
    EXPECT_EQ(p.code[4].op, hexcalc::Op::Add);
}

TEST(Expr, CompileThrowsSyntaxError) {
    EXPECT_THROW(hexcalc::compile(hexcalc::tokenize("1 +")), hexcalc::SyntaxError);
    hexcalc::Program p = hexcalc::compile(hexcalc::tokenize("q"));
    EXPECT_THROW(p.execute({}), hexcalc::SemanticError);
}

} // namespace
