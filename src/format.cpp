#include "hexcalc/format.hpp"

#include <cstdint>

namespace hexcalc {

std::string to_hex(Value v) {
    static const char digits[] = "0123456789abcdef";
    // magnitude as unsigned so the minimum value survives negation
    std::uint64_t m = v < 0 ? 0 - static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(v);

    std::string out;
    do {
        out.insert(out.begin(), digits[m % 16]);
        m /= 16;
    } while (m != 0);

    if (v < 0) out.insert(out.begin(), '-');
    return out;
}

const char* to_string(TokKind kind) {
    switch (kind) {
        case TokKind::Identifier: return "identifier";
        case TokKind::HexNumber:  return "hex";
        case TokKind::Operator:   return "op";
        case TokKind::Assign:     return "assign";
        case TokKind::LParen:     return "lparen";
        case TokKind::RParen:     return "rparen";
        case TokKind::Comment:    return "comment";
        case TokKind::Unknown:    return "unknown";
        case TokKind::End:        return "end";
    }
    return "unknown";
}

const char* to_string(Status status) {
    return status == Status::Accepted ? "accepted" : "rejected";
}

} // namespace hexcalc
