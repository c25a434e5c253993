#pragma once
#include <stdexcept>
#include <string>

namespace hexcalc {

// Syntax errors reject a statement. Semantic errors leave it accepted but
// produce no value.
enum class ErrorKind {
    Syntax,
    Semantic,
};

struct Error {
    ErrorKind kind{ErrorKind::Syntax};
    std::string message{};
};

struct ExprError : std::runtime_error {
    ExprError(ErrorKind k, const std::string& what) : std::runtime_error(what), kind(k) {}
    ErrorKind kind;
};

struct SyntaxError : ExprError {
    explicit SyntaxError(const std::string& what) : ExprError(ErrorKind::Syntax, what) {}
};

struct SemanticError : ExprError {
    explicit SemanticError(const std::string& what) : ExprError(ErrorKind::Semantic, what) {}
};

} // namespace hexcalc
