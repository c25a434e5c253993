#include "hexcalc/statement.hpp"
#include "hexcalc/lexemes.hpp"
#include "hexcalc/lexer.hpp"
#include "hexcalc/parser.hpp"
#include "hexcalc/validator.hpp"

namespace hexcalc {

namespace {

StatementOutcome accepted(std::string_view text, std::vector<Token> tokens = {}) {
    return StatementOutcome{std::string(text), Status::Accepted, std::nullopt, std::move(tokens)};
}

StatementOutcome rejected(std::string_view text, std::string message, std::vector<Token> tokens = {}) {
    return StatementOutcome{std::string(text), Status::Rejected, std::move(message), std::move(tokens)};
}

// Shared tail of the assignment and expression paths. On success the value is
// handed to `assign`; a semantic failure keeps the statement but skips it.
template <class Assign>
StatementOutcome check_expression(std::string_view text, std::vector<Token> tokens,
                                  const Variables& vars, Mode mode, Assign&& assign) {
    if (mode == Mode::Validate) {
        if (auto err = validate(tokens)) return rejected(text, std::move(err->message), std::move(tokens));
        return accepted(text, std::move(tokens));
    }

    EvalResult r = evaluate(tokens, vars);
    if (const auto* err = std::get_if<Error>(&r)) {
        if (err->kind == ErrorKind::Syntax) return rejected(text, err->message, std::move(tokens));
        StatementOutcome out = accepted(text, std::move(tokens));
        out.message = err->message;
        return out;
    }
    assign(std::get<Value>(r));
    return accepted(text, std::move(tokens));
}

} // namespace

StatementOutcome process_statement(std::string_view text, Variables& vars, Mode mode) {
    std::string_view stmt = trim(text);

    // comments are always well-formed
    if (stmt.substr(0, kCommentMarker.size()) == kCommentMarker) return accepted(stmt);

    std::size_t assign_at = stmt.find(kAssignMarker);
    if (assign_at != std::string_view::npos) {
        std::string_view lhs = trim(stmt.substr(0, assign_at));
        std::string_view rhs = trim(stmt.substr(assign_at + kAssignMarker.size()));

        if (!is_identifier(lhs))
            return rejected(stmt, "Left side of := must be identifier (got '" + std::string(lhs) + "')");
        if (starts_with_upper(lhs))
            return rejected(stmt, "Identifier '" + std::string(lhs) + "' cannot start with uppercase letter");

        std::vector<Token> tokens = tokenize(rhs);
        if (auto err = find_foreign_token(tokens)) return rejected(stmt, std::move(err->message), std::move(tokens));

        std::string target(lhs);
        return check_expression(stmt, std::move(tokens), vars, mode,
                                [&](Value v) { vars[target] = v; });
    }

    std::vector<Token> tokens = tokenize(stmt);
    if (tokens.empty()) return accepted(stmt);
    if (auto err = find_foreign_token(tokens)) return rejected(stmt, std::move(err->message), std::move(tokens));

    // A lone operand is checked lexically only; the table is not consulted.
    if (tokens.size() == 1) {
        const Token& t = tokens.front();
        if (t.kind == TokKind::HexNumber) {
            if (!is_hex_literal(t.text))
                return rejected(stmt, "Invalid hex literal '" + t.text + "'", std::move(tokens));
            return accepted(stmt, std::move(tokens));
        }
        if (t.kind == TokKind::Identifier) {
            if (starts_with_upper(t.text))
                return rejected(stmt, "Identifier '" + t.text + "' cannot start with uppercase letter",
                                std::move(tokens));
            return accepted(stmt, std::move(tokens));
        }
    }

    return check_expression(stmt, std::move(tokens), vars, mode, [](Value) {});
}

} // namespace hexcalc
