#pragma once
#include <string_view>
#include <vector>
#include "hexcalc/program.hpp"
#include "hexcalc/statement.hpp"

namespace hexcalc {

struct RunOptions {
    Mode mode{Mode::Evaluate};
};

struct RunResult {
    std::vector<StatementOutcome> outcomes;
    Variables variables;
};

/// Split source text on ';' and process every non-empty statement in order
/// against a fresh variable table.
RunResult run(std::string_view source, const RunOptions& options = {});

} // namespace hexcalc
