#pragma once
#include <string_view>

namespace hexcalc {

// Language markers.
inline constexpr char kTerminator = ';';
inline constexpr std::string_view kCommentMarker = "//";
inline constexpr std::string_view kAssignMarker = ":=";

inline bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
inline bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
inline bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
inline bool is_hex_digit(char c) { return is_digit(c) || (c >= 'a' && c <= 'f'); }
inline bool is_ident_start(char c) { return c == '_' || is_lower(c); }
inline bool is_ident_char(char c) { return is_lower(c) || is_upper(c) || is_digit(c) || c == '_'; }

/// ^[0-9][0-9a-f]*$
bool is_hex_literal(std::string_view s);

/// ^[a-z_][A-Za-z0-9_]*$
bool is_identifier(std::string_view s);

bool starts_with_upper(std::string_view s);

/// Strip the whitespace accepted between tokens from both ends.
std::string_view trim(std::string_view s);

} // namespace hexcalc
