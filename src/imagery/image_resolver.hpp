#pragma once

/// @file image_resolver.hpp
/// @brief Picks (or fetches) the photograph shown for a calendar event.

#include "imagery/image_record.hpp"
#include "imagery/image_store.hpp"
#include "imagery/photo_provider.hpp"
#include "queue/request_queue.hpp"

#include <cstddef>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace almanac::imagery
{
    /// @brief Which step of the resolution produced the image id.
    enum class ResolutionSource
    {
        Assigned,       ///< The event's existing assignment is still valid
        AutoAccepted,   ///< Cached record scored at least kAutoAcceptScore
        ExactMatch,     ///< Cached record fetched for the same title and location
        GoodEnough,     ///< Cached record scored above kGoodEnoughScore
        Fetched,        ///< Newly fetched from the provider
        Unresolved      ///< Provider failed; show a placeholder
    };

    [[nodiscard]] const char* resolution_source_name(ResolutionSource source);

    /// @brief Outcome of one resolution request.
    ///
    /// The caller's event is never modified; `updated_event` is a copy with
    /// `assigned_image_id` set to `image_id` (or cleared when it was dangling
    /// and nothing replaced it).
    struct Resolution
    {
        std::optional<std::string> image_id;
        CalendarEvent updated_event;
        ResolutionSource source = ResolutionSource::Unresolved;
    };

    /// @brief Six-step resolution of an event against the cache and the provider.
    ///
    /// 1. A valid existing assignment is returned as is; a dangling one is cleared.
    /// 2. Candidates come from ImageMetadataStore::find_candidates().
    /// 3. The best candidate is accepted if it scores >= 1.5.
    /// 4. Otherwise a candidate fetched for the same title and location is accepted.
    /// 5. Otherwise the best candidate is accepted if it scores > 0.5.
    /// 6. Otherwise a fetch is queued and the new record is persisted.
    ///
    /// The store, queue and provider must outlive every queued job, i.e.
    /// destroy the queue first.
    class ImageResolver
    {
    public:
        static constexpr std::size_t kSimilarImageLimit = 10;

        ImageResolver(ImageMetadataStore& store, queue::RequestQueue& queue, PhotoProvider& provider);

        /// @brief Resolve an image for @p event.
        ///
        /// Steps 1 to 5 complete before returning (the future is ready).
        /// Step 6 completes when the queued fetch does.
        [[nodiscard]] std::future<Resolution> resolve(const CalendarEvent& event);

        /// @brief Provider query for an event: title keywords, place names and a theme word.
        [[nodiscard]] static std::string build_search_query(const CalendarEvent& event);

        /// @brief Live records ranked with the browsing profile.
        [[nodiscard]] std::vector<ImageRecord> similar_images(
            std::string_view title,
            const std::optional<std::string>& location,
            std::size_t limit = kSimilarImageLimit
        ) const;

        /// @brief Queued free-text search. Results are not saved to the store.
        ///
        /// Only photos whose thumbnail downloads are returned; each carries a
        /// fresh id and `title_query = query`. Empty on provider failure.
        [[nodiscard]] std::future<std::vector<ImageRecord>> search(const std::string& query);

        /// @brief Explicitly assign a stored image to an event.
        /// @return The updated event, or nullopt if @p image_id is not in the store.
        [[nodiscard]] std::optional<CalendarEvent> reassign(const CalendarEvent& event,
                                                            const std::string& image_id) const;

        [[nodiscard]] std::string queue_status() const;

    private:
        [[nodiscard]] std::optional<Resolution> resolve_from_cache(const CalendarEvent& event) const;
        [[nodiscard]] std::future<Resolution> fetch(CalendarEvent event);

        ImageMetadataStore& m_store;
        queue::RequestQueue& m_queue;
        PhotoProvider& m_provider;
    };

} // namespace almanac::imagery
