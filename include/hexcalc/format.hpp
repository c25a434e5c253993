#pragma once
#include <string>
#include "hexcalc/program.hpp"
#include "hexcalc/statement.hpp"
#include "hexcalc/token.hpp"

namespace hexcalc {

/// Lowercase hex without prefix; negative values get a leading '-'.
std::string to_hex(Value v);

const char* to_string(TokKind kind);
const char* to_string(Status status);

} // namespace hexcalc
