#pragma once
#include <cstddef>
#include <string>

namespace hexcalc {

enum class TokKind {
    Identifier,
    HexNumber,
    Operator,   // + - * /
    Assign,     // :=
    LParen,
    RParen,
    Comment,    // "//" up to the end of the statement
    Unknown,    // exactly one unrecognised character

    // internal
    End,        // Lexer::next() sentinel, never part of tokenize() output
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{};     // exact source substring
    std::size_t offset{0};  // 0-based index into the statement text
};

inline bool operator==(const Token& a, const Token& b) {
    return a.kind == b.kind && a.text == b.text && a.offset == b.offset;
}
inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

} // namespace hexcalc
