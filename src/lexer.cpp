#include "hexcalc/lexer.hpp"
#include "hexcalc/lexemes.hpp"

namespace hexcalc {

void Lexer::skip_ws() {
    while (!is_end() && is_space(s_[i_])) ++i_;
}

Token Lexer::take(TokKind kind, std::size_t start) {
    return {kind, std::string(s_.substr(start, i_ - start)), start};
}

Token Lexer::next() {
    skip_ws();
    if (is_end()) return {TokKind::End, {}, i_};

    std::size_t start = i_;
    char c = s_[i_];

    // comment runs to the end of the statement
    if (s_.substr(i_, kCommentMarker.size()) == kCommentMarker) {
        i_ = s_.size();
        return take(TokKind::Comment, start);
    }

    if (s_.substr(i_, kAssignMarker.size()) == kAssignMarker) {
        i_ += kAssignMarker.size();
        return take(TokKind::Assign, start);
    }

    switch (c) {
        case '+':
        case '-':
        case '*':
        case '/': ++i_; return take(TokKind::Operator, start);
        case '(': ++i_; return take(TokKind::LParen, start);
        case ')': ++i_; return take(TokKind::RParen, start);
        default: break;
    }

    if (is_ident_start(c)) {
        ++i_;
        while (!is_end() && is_ident_char(s_[i_])) ++i_;
        return take(TokKind::Identifier, start);
    }

    // the literal alphabet is re-checked by the validator and the parser
    if (is_digit(c)) {
        ++i_;
        while (!is_end() && is_hex_digit(s_[i_])) ++i_;
        return take(TokKind::HexNumber, start);
    }

    ++i_;
    return take(TokKind::Unknown, start);
}

std::vector<Token> tokenize(std::string_view text) {
    Lexer lex(text);
    std::vector<Token> out;
    for (Token t = lex.next(); t.kind != TokKind::End; t = lex.next()) {
        out.push_back(std::move(t));
    }
    return out;
}

} // namespace hexcalc
