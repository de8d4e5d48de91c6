#pragma once

#include <string>
#include <string_view>

namespace processing
{

constexpr char32_t REPLACEMENT_CHAR = 0xFFFDu;

/// UTF-8 to UTF-32 conversion. Undecodable bytes become U+FFFD; encoded
/// surrogates are kept as surrogate code points.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Unicode White_Space, including the C0 separators U+001C..U+001F
bool isWhitespace(char32_t cp);

/// Letters, numbers and the underscore (regex \w over Unicode)
bool isWordChar(char32_t cp);

/// Any Unicode letter category
bool isLetter(char32_t cp);

/// Literal, non-overlapping, left-to-right replacement of every occurrence.
/// Returns the number of replacements made.
std::size_t replaceAll(std::string& text, std::string_view from, std::string_view to);

} // namespace processing
