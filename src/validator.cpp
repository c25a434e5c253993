#include "hexcalc/validator.hpp"
#include "hexcalc/lexemes.hpp"

namespace hexcalc {

namespace {

Error syntax(std::string message) {
    return Error{ErrorKind::Syntax, std::move(message)};
}

bool is_arith_op(const Token& t) {
    return t.text == "+" || t.text == "-" || t.text == "*" || t.text == "/";
}

} // namespace

std::optional<Error> find_foreign_token(const std::vector<Token>& tokens) {
    for (const auto& t : tokens) {
        if (t.kind == TokKind::Unknown) return syntax("Unknown token '" + t.text + "'");
        if (t.kind == TokKind::Comment) return syntax("Comment inside expression is not allowed");
    }
    return std::nullopt;
}

std::optional<Error> validate(const std::vector<Token>& tokens) {
    if (auto err = find_foreign_token(tokens)) return err;
    if (tokens.empty()) return syntax("Expression is incomplete");

    bool expect_operand = true;
    int depth = 0;

    for (const auto& t : tokens) {
        if (expect_operand) {
            switch (t.kind) {
                case TokKind::HexNumber:
                    if (!is_hex_literal(t.text)) return syntax("Invalid hex literal '" + t.text + "'");
                    expect_operand = false;
                    continue;
                case TokKind::Identifier:
                    if (starts_with_upper(t.text))
                        return syntax("Identifier '" + t.text + "' cannot start with uppercase letter");
                    expect_operand = false;
                    continue;
                case TokKind::LParen:
                    ++depth;
                    continue;
                default:
                    return syntax("Unexpected token '" + t.text + "'");
            }
        }

        if (t.kind == TokKind::Operator && is_arith_op(t)) {
            expect_operand = true;
            continue;
        }
        if (t.kind == TokKind::RParen) {
            if (depth == 0) return syntax("Missing opening parenthesis");
            --depth;
            continue;
        }
        return syntax("Unexpected token '" + t.text + "'");
    }

    if (depth != 0) return syntax("Missing closing parenthesis");
    if (expect_operand) return syntax("Expression is incomplete");
    return std::nullopt;
}

} // namespace hexcalc
