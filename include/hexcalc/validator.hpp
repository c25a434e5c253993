#pragma once
#include <optional>
#include <vector>
#include "hexcalc/error.hpp"
#include "hexcalc/token.hpp"

namespace hexcalc {

/// Structural check of an expression: operand/operator alternation and
/// parenthesis balance. Nothing is evaluated. Returns the first syntax error,
/// or nothing when the tokens form a well-formed expression.
std::optional<Error> validate(const std::vector<Token>& tokens);

/// Unknown and Comment tokens are never allowed inside an expression.
std::optional<Error> find_foreign_token(const std::vector<Token>& tokens);

} // namespace hexcalc
