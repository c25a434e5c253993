#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "hexcalc/program.hpp"
#include "hexcalc/token.hpp"

namespace hexcalc {

enum class Status {
    Accepted,
    Rejected,
};

enum class Mode {
    Evaluate,  // parse, evaluate and assign
    Validate,  // structural check only, variables untouched
};

struct StatementOutcome {
    std::string raw_text{};
    Status status{Status::Accepted};
    std::optional<std::string> message{}; // error, or warning when Accepted
    std::vector<Token> tokens{};          // tokens of the analysed expression
};

/// Classify and process one statement (without its terminator).
/// `vars` is only modified by an assignment that evaluated successfully.
StatementOutcome process_statement(std::string_view text, Variables& vars, Mode mode = Mode::Evaluate);

} // namespace hexcalc
