/// @file image_resolver.cpp
/// @brief Cache-first image resolution with queued provider fetches.

#include "imagery/image_resolver.hpp"

#include "core/logger.hpp"
#include "core/uuid.hpp"
#include "imagery/similarity_matcher.hpp"
#include "imagery/text.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <functional>
#include <utility>

namespace almanac::imagery
{

namespace
{
    constexpr std::size_t kMaxTitleKeywords = 3;
    constexpr std::size_t kMaxLocationParts = 2;
    constexpr std::size_t kMinKeywordLength = 3;

    struct ThemeRule
    {
        std::array<const char*, 2> triggers;
        const char* keyword;
    };

    // First matching rule wins
    constexpr std::array<ThemeRule, 4> kThemeRules{{
        {{"meeting", "conference"}, "business"},
        {{"birthday", "party"}, "celebration"},
        {{"vacation", "travel"}, "travel"},
        {{"workout", "exercise"}, "fitness"},
    }};

    std::future<Resolution> ready(Resolution resolution)
    {
        std::promise<Resolution> promise;
        promise.set_value(std::move(resolution));
        return promise.get_future();
    }

    Resolution accept(const CalendarEvent& event, const std::string& image_id, ResolutionSource source)
    {
        Resolution r{.image_id = image_id, .updated_event = event, .source = source};
        r.updated_event.assigned_image_id = image_id;
        return r;
    }

    bool is_exact_match(const ImageRecord& record, const CalendarEvent& event)
    {
        return record.title_query
            && toLower(*record.title_query) == toLower(event.title)
            && record.location_query == event.location;
    }
}

const char* resolution_source_name(ResolutionSource source)
{
    switch (source)
    {
        case ResolutionSource::Assigned:     return "assigned";
        case ResolutionSource::AutoAccepted: return "auto-accepted";
        case ResolutionSource::ExactMatch:   return "exact match";
        case ResolutionSource::GoodEnough:   return "good enough";
        case ResolutionSource::Fetched:      return "fetched";
        case ResolutionSource::Unresolved:   return "unresolved";
    }
    return "unknown";
}

ImageResolver::ImageResolver(ImageMetadataStore& store, queue::RequestQueue& queue, PhotoProvider& provider)
    : m_store(store)
    , m_queue(queue)
    , m_provider(provider)
{
    core::Logger::ensure_initialized();
}

// -----------------------------------------------------------------
// Resolution
// -----------------------------------------------------------------

std::future<Resolution> ImageResolver::resolve(const CalendarEvent& event)
{
    CalendarEvent working = event;

    if (working.assigned_image_id)
    {
        if (m_store.has_image(*working.assigned_image_id))
        {
            return ready(Resolution{
                .image_id = working.assigned_image_id,
                .updated_event = working,
                .source = ResolutionSource::Assigned,
            });
        }

        ALM_CORE_WARN("ImageResolver: Event {} references missing image {}, clearing",
                      working.id, *working.assigned_image_id);
        working.assigned_image_id.reset();
    }

    if (auto cached = resolve_from_cache(working))
    {
        ALM_CORE_DEBUG("ImageResolver: Event {} -> {} ({})", working.id, *cached->image_id,
                       resolution_source_name(cached->source));
        return ready(std::move(*cached));
    }

    return fetch(std::move(working));
}

std::optional<Resolution> ImageResolver::resolve_from_cache(const CalendarEvent& event) const
{
    const auto candidates = m_store.find_candidates(event.title, event.location);
    if (candidates.empty())
    {
        return std::nullopt;
    }

    const auto words = splitWords(event.title);

    const ImageRecord* best = nullptr;
    f64 best_score = 0.0;
    for (const auto& record : candidates)
    {
        const f64 s = SimilarityMatcher::score(record, words, event.location);
        if (!best || s > best_score)
        {
            best = &record;
            best_score = s;
        }
    }

    if (best_score >= SimilarityMatcher::kAutoAcceptScore)
    {
        return accept(event, best->id, ResolutionSource::AutoAccepted);
    }

    const auto exact = std::find_if(candidates.begin(), candidates.end(),
                                    [&](const ImageRecord& r) { return is_exact_match(r, event); });
    if (exact != candidates.end())
    {
        return accept(event, exact->id, ResolutionSource::ExactMatch);
    }

    if (best_score > SimilarityMatcher::kGoodEnoughScore)
    {
        return accept(event, best->id, ResolutionSource::GoodEnough);
    }
    return std::nullopt;
}

std::future<Resolution> ImageResolver::fetch(CalendarEvent event)
{
    const std::string request_id = fmt::format("fetch_{}_{}", event.id, core::generate_uuid());
    const std::string query = build_search_query(event);

    ALM_CORE_INFO("ImageResolver: Queueing fetch {} for '{}' (query '{}')", request_id, event.title, query);

    auto& store = m_store;
    auto& provider = m_provider;
    auto pending = m_queue.enqueue<std::string>(
        request_id,
        [&store, &provider, event, query]() -> std::optional<std::string> {
            const auto photo = provider.fetch_random_photo(query);
            if (!photo)
            {
                ALM_CORE_WARN("ImageResolver: No photo returned for '{}'", query);
                return std::nullopt;
            }

            const auto bytes = provider.download_bytes(photo->regular_url);
            if (!bytes || bytes->empty())
            {
                ALM_CORE_WARN("ImageResolver: Download failed for photo {}", photo->id);
                return std::nullopt;
            }

            provider.track_download(photo->id);

            const ImageRecord record = make_record(*photo, core::generate_uuid(), store.now(),
                                                   event.title, event.location);
            if (!store.put(record, *bytes))
            {
                return std::nullopt;
            }

            ALM_CORE_INFO("ImageResolver: Cached photo {} by {} as {}", photo->id, record.author, record.id);
            return record.id;
        });

    return std::async(std::launch::deferred, [pending, event = std::move(event)]() {
        Resolution r{.image_id = pending.get(), .updated_event = event, .source = ResolutionSource::Unresolved};
        if (r.image_id)
        {
            r.updated_event.assigned_image_id = r.image_id;
            r.source = ResolutionSource::Fetched;
        }
        return r;
    });
}

// -----------------------------------------------------------------
// Queries
// -----------------------------------------------------------------

std::string ImageResolver::build_search_query(const CalendarEvent& event)
{
    std::vector<std::string> parts;

    for (const auto& word : splitOn(event.title, " \t\n\r\f\v"))
    {
        if (parts.size() == kMaxTitleKeywords)
        {
            break;
        }
        if (word.size() >= kMinKeywordLength)
        {
            parts.push_back(word);
        }
    }

    if (event.location)
    {
        auto location_parts = splitOn(*event.location, ", ");
        if (location_parts.size() > kMaxLocationParts)
        {
            location_parts.resize(kMaxLocationParts);
        }
        parts.insert(parts.end(), location_parts.begin(), location_parts.end());
    }

    const std::string title = toLower(event.title);
    for (const auto& rule : kThemeRules)
    {
        const bool hit = std::any_of(rule.triggers.begin(), rule.triggers.end(),
                                     [&](const char* t) { return title.find(t) != std::string::npos; });
        if (hit)
        {
            parts.emplace_back(rule.keyword);
            break;
        }
    }

    return toLower(joinWords(parts));
}

std::vector<ImageRecord> ImageResolver::similar_images(
    std::string_view title,
    const std::optional<std::string>& location,
    std::size_t limit) const
{
    return SimilarityMatcher::rank(m_store.live_records(), title, location, kBrowsingProfile, limit);
}

std::future<std::vector<ImageRecord>> ImageResolver::search(const std::string& query)
{
    const std::string request_id = fmt::format("search_{}_{}", std::hash<std::string>{}(query),
                                               core::generate_uuid());

    auto& store = m_store;
    auto& provider = m_provider;
    auto pending = m_queue.enqueue<std::vector<ImageRecord>>(
        request_id,
        [&store, &provider, query]() -> std::optional<std::vector<ImageRecord>> {
            const auto photos = provider.search_photos(query);
            if (!photos)
            {
                ALM_CORE_WARN("ImageResolver: Search failed for '{}'", query);
                return std::nullopt;
            }

            std::vector<ImageRecord> results;
            results.reserve(photos->size());
            for (const auto& photo : *photos)
            {
                const auto thumb = provider.download_bytes(photo.thumb_url);
                if (!thumb || thumb->empty())
                {
                    continue;
                }
                results.push_back(make_record(photo, core::generate_uuid(), store.now(), query, std::nullopt));
            }

            ALM_CORE_DEBUG("ImageResolver: Search '{}' returned {}/{} usable photos",
                           query, results.size(), photos->size());
            return results;
        });

    return std::async(std::launch::deferred, [pending]() {
        auto results = pending.get();
        return results ? std::move(*results) : std::vector<ImageRecord>{};
    });
}

std::optional<CalendarEvent> ImageResolver::reassign(const CalendarEvent& event, const std::string& image_id) const
{
    if (!m_store.get(image_id))
    {
        ALM_CORE_WARN("ImageResolver: Cannot assign unknown image {} to event {}", image_id, event.id);
        return std::nullopt;
    }

    CalendarEvent updated = event;
    updated.assigned_image_id = image_id;
    return updated;
}

std::string ImageResolver::queue_status() const
{
    return m_queue.status();
}

} // namespace almanac::imagery
