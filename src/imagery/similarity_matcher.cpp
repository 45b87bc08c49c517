// imagery/similarity_matcher.cpp
#include "imagery/similarity_matcher.hpp"

#include "imagery/text.hpp"

#include <algorithm>
#include <utility>

namespace almanac::imagery {

// -----------------------------------------------------------------------
// titleScore
// -----------------------------------------------------------------------
double SimilarityMatcher::titleScore(const std::string& stored_query,
                                     const std::vector<std::string>& title_words,
                                     const MatchProfile& profile) {
    const std::string query = toLower(stored_query);

    if (profile.title_rule == TitleRule::PerWord) {
        double s = 0.0;
        for (const auto& word : title_words) {
            if (query.find(word) != std::string::npos) s += profile.per_word;
        }
        return s;
    }

    const std::string title = joinWords(title_words);
    if (query == title) return profile.exact_title;
    if (query.find(title) != std::string::npos ||
        title.find(query) != std::string::npos) {
        return profile.contained_title;
    }

    const auto query_words = splitWords(query);
    const auto shared = std::count_if(
        title_words.begin(), title_words.end(), [&](const std::string& w) {
            return std::find(query_words.begin(), query_words.end(), w) != query_words.end();
        });
    return static_cast<double>(shared) * profile.per_word;
}

// -----------------------------------------------------------------------
// score
// -----------------------------------------------------------------------
double SimilarityMatcher::score(const ImageRecord& record,
                                const std::vector<std::string>& title_words,
                                const std::optional<std::string>& location,
                                const MatchProfile& profile) {
    double total = 0.0;

    // An empty title (on either side) says nothing about the other
    if (record.title_query && !isBlank(*record.title_query) && !title_words.empty()) {
        total += titleScore(*record.title_query, title_words, profile);
    }

    for (const auto& tag : record.tags) {
        if (isBlank(tag)) continue;
        const std::string tag_lower = toLower(tag);
        for (const auto& word : title_words) {
            if (tag_lower.find(word) != std::string::npos ||
                word.find(tag_lower) != std::string::npos) {
                total += profile.per_tag;
            }
        }
    }

    if (location && record.location_query &&
        overlapsIgnoreCase(*location, *record.location_query)) {
        total += profile.location;
    }

    return total;
}

double SimilarityMatcher::score(const ImageRecord& record,
                                std::string_view title,
                                const std::optional<std::string>& location,
                                const MatchProfile& profile) {
    return score(record, splitWords(title), location, profile);
}

// -----------------------------------------------------------------------
// rank
// -----------------------------------------------------------------------
std::vector<ImageRecord> SimilarityMatcher::rank(std::vector<ImageRecord> records,
                                                 std::string_view title,
                                                 const std::optional<std::string>& location,
                                                 const MatchProfile& profile,
                                                 std::size_t limit) {
    const auto words = splitWords(title);

    std::vector<std::pair<double, ImageRecord>> scored;
    scored.reserve(records.size());
    for (auto& r : records) {
        const double s = score(r, words, location, profile);
        scored.emplace_back(s, std::move(r));
    }

    // Stable so equal scores keep the caller's order
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<ImageRecord> result;
    const std::size_t n = std::min(limit, scored.size());
    result.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        result.push_back(std::move(scored[i].second));
    }
    return result;
}

} // namespace almanac::imagery
