// imagery/text.cpp
#include "imagery/text.hpp"

#include <algorithm>
#include <cctype>

namespace almanac::imagery {

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string> splitOn(std::string_view text, std::string_view delimiters) {
    std::vector<std::string> tokens;
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t end = text.find_first_of(delimiters, start);
        const std::size_t stop = (end == std::string_view::npos) ? text.size() : end;
        if (stop > start) tokens.emplace_back(text.substr(start, stop - start));
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return tokens;
}

std::vector<std::string> splitWords(std::string_view text) {
    return splitOn(toLower(text), " \t\n\r\f\v");
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool overlapsIgnoreCase(std::string_view a, std::string_view b) {
    if (isBlank(a) || isBlank(b)) return false;
    return containsIgnoreCase(a, b) || containsIgnoreCase(b, a);
}

std::string joinWords(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += w;
    }
    return out;
}

} // namespace almanac::imagery
