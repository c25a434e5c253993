#include "hexcalc/driver.hpp"
#include "hexcalc/lexemes.hpp"

namespace hexcalc {

RunResult run(std::string_view source, const RunOptions& options) {
    RunResult result;

    std::size_t start = 0;
    while (start <= source.size()) {
        std::size_t end = source.find(kTerminator, start);
        bool terminated = end != std::string_view::npos;
        std::string_view segment = source.substr(start, (terminated ? end : source.size()) - start);

        if (!trim(segment).empty()) {
            StatementOutcome out = process_statement(segment, result.variables, options.mode);
            // an unterminated tail only gets its ';' back when it was accepted
            if (terminated || out.status == Status::Accepted) out.raw_text += kTerminator;
            result.outcomes.push_back(std::move(out));
        }

        if (!terminated) break;
        start = end + 1;
    }

    return result;
}

} // namespace hexcalc
