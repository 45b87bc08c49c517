#pragma once
// imagery/similarity_matcher.hpp - Scores cached images against an event
//
// A score is a sum of independent contributions (title query, tags,
// location), so the result never depends on the order of tags or words.
// Resolution and browsing use separate weight profiles.

#include "imagery/image_record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace almanac::imagery {

// -----------------------------------------------------------------------
// MatchProfile
// -----------------------------------------------------------------------
enum class TitleRule {
    Graded,   ///< exact / containment / per shared word
    PerWord,  ///< fixed weight per title word found in the stored query
};

struct MatchProfile {
    const char* name;
    TitleRule   title_rule;
    double      exact_title;      ///< Graded: normalized title equals the stored query
    double      contained_title;  ///< Graded: one contains the other
    double      per_word;         ///< Graded: shared word; PerWord: word found in query
    double      per_tag;          ///< per (tag, word) pair that overlaps
    double      location;         ///< stored location and target overlap
};

/// Event resolution: auto-accept needs a strong title match.
inline constexpr MatchProfile kResolutionProfile{
    "resolution", TitleRule::Graded, 3.0, 2.0, 0.5, 0.3, 1.0};

/// "Similar images" browsing: looser, location-heavy.
inline constexpr MatchProfile kBrowsingProfile{
    "browsing", TitleRule::PerWord, 0.0, 0.0, 1.0, 0.5, 2.0};

// -----------------------------------------------------------------------
// SimilarityMatcher
// -----------------------------------------------------------------------
class SimilarityMatcher {
public:
    /// Score at or above which the resolver accepts a cached image outright.
    static constexpr double kAutoAcceptScore = 1.5;
    /// Score above which a cached image is good enough to reuse.
    static constexpr double kGoodEnoughScore = 0.5;

    /// Score a record against lower-case title words and an optional location.
    static double score(const ImageRecord& record,
                        const std::vector<std::string>& title_words,
                        const std::optional<std::string>& location,
                        const MatchProfile& profile = kResolutionProfile);

    /// Convenience overload splitting a raw title.
    static double score(const ImageRecord& record,
                        std::string_view title,
                        const std::optional<std::string>& location,
                        const MatchProfile& profile = kResolutionProfile);

    /// Records sorted by descending score, truncated to @p limit.
    static std::vector<ImageRecord> rank(std::vector<ImageRecord> records,
                                         std::string_view title,
                                         const std::optional<std::string>& location,
                                         const MatchProfile& profile,
                                         std::size_t limit);

private:
    static double titleScore(const std::string& stored_query,
                             const std::vector<std::string>& title_words,
                             const MatchProfile& profile);
};

} // namespace almanac::imagery
