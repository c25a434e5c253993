#pragma once
#include <variant>
#include <vector>
#include "hexcalc/error.hpp"
#include "hexcalc/program.hpp"
#include "hexcalc/token.hpp"

namespace hexcalc {

using EvalResult = std::variant<Value, Error>;

// Compile an expression:
//   Expr   := AddSub
//   AddSub := MulDiv (("+"|"-") MulDiv)*
//   MulDiv := Factor (("*"|"/") Factor)*
//   Factor := HexNumber | Identifier | "(" AddSub ")"
// Throws SyntaxError on malformed input.
Program compile(const std::vector<Token>& tokens);

/// Compile + execute. Syntax and semantic failures come back as Error.
EvalResult evaluate(const std::vector<Token>& tokens, const Variables& vars);

} // namespace hexcalc
