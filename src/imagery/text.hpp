#pragma once
// imagery/text.hpp - Small case-insensitive text helpers for query matching

#include <string>
#include <string_view>
#include <vector>

namespace almanac::imagery {

/// ASCII lower-case copy.
std::string toLower(std::string_view text);

/// Lower-case words split on whitespace; empty tokens dropped.
std::vector<std::string> splitWords(std::string_view text);

/// Tokens split on any of @p delimiters; empty tokens dropped, case kept.
std::vector<std::string> splitOn(std::string_view text, std::string_view delimiters);

/// Case-insensitive substring test (@p needle inside @p haystack).
bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

/// True for an empty or all-whitespace string.
bool isBlank(std::string_view text);

/// Either string contains the other, case-insensitively. Blank strings overlap nothing.
bool overlapsIgnoreCase(std::string_view a, std::string_view b);

/// Words joined with single spaces.
std::string joinWords(const std::vector<std::string>& words);

} // namespace almanac::imagery
