#pragma once

#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace shelf {

// Consumes whitespace up to, but not including, the next non-whitespace char
void skip_whitespace(std::istream& in);

// Skips whitespace, then reads up to the next whitespace char.
// Empty result means end of input.
std::string read_word(std::istream& in);

// Skips whitespace, then reads an optional sign followed by digits.
// nullopt if no integer could be read or it does not fit in an int.
std::optional<int> read_int(std::istream& in);

// Reads up to the next newline (consumed, not returned) or end of input
std::string read_line(std::istream& in);

// Trims both ends and collapses interior whitespace runs to one space.
// Text is UTF-8; any Unicode white space separates words.
std::string normalize_title(std::string_view text);

// Decodes UTF-8 and lowercases each code point, for case-insensitive
// comparison. Malformed bytes become U+FFFD.
std::u32string fold_utf8(std::string_view text);

} // namespace shelf
