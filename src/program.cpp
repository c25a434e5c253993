#include "hexcalc/program.hpp"
#include "hexcalc/error.hpp"

#include <limits>
#include <stdexcept>

namespace hexcalc {

namespace {

constexpr Value kMax = std::numeric_limits<Value>::max();
constexpr Value kMin = std::numeric_limits<Value>::min();

[[noreturn]] void overflow() { throw SemanticError("Integer overflow"); }

Value checked_add(Value a, Value b) {
    if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) overflow();
    return a + b;
}

Value checked_sub(Value a, Value b) {
    if ((b < 0 && a > kMax + b) || (b > 0 && a < kMin + b)) overflow();
    return a - b;
}

Value checked_mul(Value a, Value b) {
    if (a > 0) {
        if (b > 0 ? a > kMax / b : b < kMin / a) overflow();
    } else if (a < 0) {
        if (b > 0 ? a < kMin / b : (b != 0 && b < kMax / a)) overflow();
    }
    return a * b;
}

Value checked_div(Value a, Value b) {
    if (b == 0) throw SemanticError("Division by zero");
    if (a == kMin && b == -1) overflow();
    return floor_div(a, b);
}

int hex_digit_value(char c) {
    return c <= '9' ? c - '0' : c - 'a' + 10;
}

} // namespace

Value parse_hex(std::string_view literal) {
    Value v = 0;
    for (char c : literal) {
        int d = hex_digit_value(c);
        if (v > (kMax - d) / 16)
            throw SemanticError("Hex literal '" + std::string(literal) + "' is out of range");
        v = v * 16 + d;
    }
    return v;
}

Value floor_div(Value a, Value b) {
    Value q = a / b;
    Value r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) --q;
    return q;
}

Value Program::execute(const Variables& vars) const {
    std::vector<Value> st;
    st.reserve(code.size());

    auto pop = [&]() -> Value {
        if (st.empty()) throw std::logic_error("Stack underflow (bad program)");
        Value v = st.back();
        st.pop_back();
        return v;
    };

    for (const auto& ins : code) {
        switch (ins.op) {
            case Op::PushVar: {
                auto it = vars.find(ins.text);
                if (it == vars.end()) throw SemanticError("Undefined variable '" + ins.text + "'");
                st.push_back(it->second);
            } break;

            case Op::PushNum:
                st.push_back(parse_hex(ins.text));
                break;

            case Op::Add:
            case Op::Sub:
            case Op::Mul:
            case Op::Div: {
                Value b = pop();
                Value a = pop();
                switch (ins.op) {
                    case Op::Add: st.push_back(checked_add(a, b)); break;
                    case Op::Sub: st.push_back(checked_sub(a, b)); break;
                    case Op::Mul: st.push_back(checked_mul(a, b)); break;
                    default:      st.push_back(checked_div(a, b)); break;
                }
            } break;
        }
    }

    if (st.size() != 1) throw std::logic_error("Program left " + std::to_string(st.size()) + " values on the stack");
    return st.back();
}

} // namespace hexcalc
