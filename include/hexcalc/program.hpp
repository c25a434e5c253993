#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hexcalc {

using Value = std::int64_t;
using Variables = std::map<std::string, Value>;

enum class Op {
    PushVar,  // variable name
    PushNum,  // hex literal text
    Add,
    Sub,
    Mul,
    Div,      // floor division
};

struct Instr {
    Op op{Op::PushNum};
    std::string text{}; // var name / literal text
};

// Postfix code for one expression, operands in source order.
struct Program {
    std::vector<Instr> code;

    /// Run against a variable table. Throws SemanticError on undefined
    /// variables, division by zero, out-of-range literals and overflow.
    Value execute(const Variables& vars) const;
};

/// Base-16 value of a literal matching ^[0-9][0-9a-f]*$.
/// Throws SemanticError when it does not fit in a Value.
Value parse_hex(std::string_view literal);

/// a / b rounded toward negative infinity. b must be non-zero.
Value floor_div(Value a, Value b);

} // namespace hexcalc
