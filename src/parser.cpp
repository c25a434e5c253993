#include "hexcalc/parser.hpp"
#include "hexcalc/lexemes.hpp"

namespace hexcalc {

namespace {

int precedence(char op) {
    return (op == '*' || op == '/') ? 2 : 1;
}

Op to_op(char op) {
    switch (op) {
        case '+': return Op::Add;
        case '-': return Op::Sub;
        case '*': return Op::Mul;
        default:  return Op::Div;
    }
}

SyntaxError unexpected(const Token& t) {
    switch (t.kind) {
        case TokKind::Unknown: return SyntaxError("Unknown token '" + t.text + "'");
        case TokKind::Comment: return SyntaxError("Comment inside expression is not allowed");
        default:               return SyntaxError("Unexpected token '" + t.text + "'");
    }
}

} // namespace

// Shunting-yard over the AddSub/MulDiv/Factor grammar. Pending operators and
// open parentheses live on an explicit stack, so nesting depth is bounded by
// memory only. Operands are emitted in source order, so execution meets them
// left to right.
Program compile(const std::vector<Token>& tokens) {
    Program p;
    p.code.reserve(tokens.size());
    std::vector<char> opstack; // '(' or one of + - * /

    auto emit_top = [&]() {
        p.code.push_back(Instr{to_op(opstack.back())});
        opstack.pop_back();
    };

    bool expect_operand = true;

    for (const auto& t : tokens) {
        if (expect_operand) {
            switch (t.kind) {
                case TokKind::HexNumber:
                    if (!is_hex_literal(t.text)) throw SyntaxError("Invalid hex literal '" + t.text + "'");
                    p.code.push_back(Instr{Op::PushNum, t.text});
                    expect_operand = false;
                    continue;

                case TokKind::Identifier:
                    if (starts_with_upper(t.text))
                        throw SyntaxError("Identifier '" + t.text + "' cannot start with uppercase letter");
                    p.code.push_back(Instr{Op::PushVar, t.text});
                    expect_operand = false;
                    continue;

                case TokKind::LParen:
                    opstack.push_back('(');
                    continue;

                default:
                    throw unexpected(t);
            }
        }

        if (t.kind == TokKind::Operator) {
            char op = t.text[0];
            // left-associative: pop equal precedence too
            while (!opstack.empty() && opstack.back() != '(' && precedence(opstack.back()) >= precedence(op))
                emit_top();
            opstack.push_back(op);
            expect_operand = true;
            continue;
        }

        if (t.kind == TokKind::RParen) {
            while (!opstack.empty() && opstack.back() != '(') emit_top();
            if (opstack.empty()) throw SyntaxError("Missing opening parenthesis");
            opstack.pop_back();
            continue;
        }

        throw unexpected(t);
    }

    if (expect_operand) throw SyntaxError("Expression is incomplete");
    while (!opstack.empty()) {
        if (opstack.back() == '(') throw SyntaxError("Missing closing parenthesis");
        emit_top();
    }
    return p;
}

EvalResult evaluate(const std::vector<Token>& tokens, const Variables& vars) {
    try {
        Program p = compile(tokens);
        return p.execute(vars);
    } catch (const ExprError& e) {
        return Error{e.kind, e.what()};
    }
}

} // namespace hexcalc
