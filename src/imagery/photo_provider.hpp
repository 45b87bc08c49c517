#pragma once

/// @file photo_provider.hpp
/// @brief Interface to an external stock-photo service.

#include "core/types.hpp"
#include "imagery/image_record.hpp"

#include <optional>
#include <string>
#include <vector>

namespace almanac::imagery
{
    /// @brief Blocking client of a stock-photo API (Unsplash-style).
    ///
    /// Implementations perform network I/O; the resolver only calls them from
    /// RequestQueue workers. Every failure is reported as an empty result.
    class PhotoProvider
    {
    public:
        virtual ~PhotoProvider() = default;

        /// @brief One random photo matching a free-text query.
        [[nodiscard]] virtual std::optional<PhotoMetadata> fetch_random_photo(const std::string& query) = 0;

        /// @brief A page of photos matching a query; empty optional on failure.
        [[nodiscard]] virtual std::optional<std::vector<PhotoMetadata>> search_photos(const std::string& query) = 0;

        /// @brief Raw bytes at a URL.
        [[nodiscard]] virtual std::optional<std::vector<u8>> download_bytes(const std::string& url) = 0;

        /// @brief Report a download to the provider (required by its terms). Fire and forget.
        virtual void track_download(const std::string& photo_id) = 0;
    };

} // namespace almanac::imagery
