#include "hexcalc/lexemes.hpp"

namespace hexcalc {

bool is_hex_literal(std::string_view s) {
    if (s.empty() || !is_digit(s.front())) return false;
    for (char c : s.substr(1)) {
        if (!is_hex_digit(c)) return false;
    }
    return true;
}

bool is_identifier(std::string_view s) {
    if (s.empty() || !is_ident_start(s.front())) return false;
    for (char c : s.substr(1)) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

bool starts_with_upper(std::string_view s) {
    return !s.empty() && is_upper(s.front());
}

std::string_view trim(std::string_view s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

} // namespace hexcalc
