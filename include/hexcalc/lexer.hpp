#pragma once
#include <string_view>
#include <vector>
#include "hexcalc/token.hpp"

namespace hexcalc {

// Pull lexer over one statement. Never fails: characters outside every token
// family come back as one-character Unknown tokens.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}
    Token next();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    Token take(TokKind kind, std::size_t start);

    std::string_view s_;
    std::size_t i_{0};
};

/// Scan a whole statement. The result never contains TokKind::End.
std::vector<Token> tokenize(std::string_view text);

} // namespace hexcalc
