#pragma once

/// @file image_record.hpp
/// @brief Cached photograph metadata and the calendar event it can be attached to.

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace almanac::imagery
{
    /// @brief Fixed time-to-live of a cached image.
    inline constexpr std::chrono::hours kImageTtl{24 * 7};

    /// @brief Metadata of one cached photograph.
    ///
    /// The bytes live next to the metadata file as `<id>.jpg`; both are owned
    /// by ImageMetadataStore.
    struct ImageRecord
    {
        std::string id;                         ///< Local identifier (UUID)
        std::optional<std::string> source_id;   ///< Provider photo id
        std::string full_url;
        std::string thumbnail_url;
        std::string author;
        std::optional<std::string> author_url;
        std::string download_tracking_url;
        Timestamp cached_at{};
        std::vector<std::string> tags;
        std::optional<std::string> location_query;
        std::optional<std::string> title_query;

        /// @brief True once more than seven days have passed since caching.
        [[nodiscard]] bool is_expired(Timestamp now) const
        {
            return now > cached_at + kImageTtl;
        }

        friend bool operator==(const ImageRecord&, const ImageRecord&) = default;
    };

    /// @brief Provider-side description of a photograph.
    struct PhotoMetadata
    {
        std::string id;
        std::string regular_url;
        std::string thumb_url;
        std::string author_name;
        std::optional<std::string> author_url;
        std::string download_location;
        std::vector<std::string> tags;
    };

    /// @brief Build a record for a freshly fetched photo.
    /// @param photo Provider metadata.
    /// @param id Local identifier to assign.
    /// @param cached_at Caching instant.
    /// @param title_query Query text the photo was fetched for.
    /// @param location_query Event location the photo was fetched for.
    [[nodiscard]] ImageRecord make_record(
        const PhotoMetadata& photo,
        std::string id,
        Timestamp cached_at,
        std::optional<std::string> title_query,
        std::optional<std::string> location_query
    );

    /// @brief Calendar event as seen by the resolver.
    ///
    /// Only `assigned_image_id` is ever changed, and only on a copy returned
    /// inside a Resolution.
    struct CalendarEvent
    {
        std::string id;
        std::string title;
        std::optional<std::string> location;
        std::optional<std::string> assigned_image_id;

        friend bool operator==(const CalendarEvent&, const CalendarEvent&) = default;
    };

} // namespace almanac::imagery
