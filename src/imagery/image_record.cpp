/// @file image_record.cpp
/// @brief Provider metadata → cached record mapping.

#include "imagery/image_record.hpp"

#include <utility>

namespace almanac::imagery
{

ImageRecord make_record(
    const PhotoMetadata& photo,
    std::string id,
    Timestamp cached_at,
    std::optional<std::string> title_query,
    std::optional<std::string> location_query)
{
    return ImageRecord{
        .id                    = std::move(id),
        .source_id             = photo.id,
        .full_url              = photo.regular_url,
        .thumbnail_url         = photo.thumb_url,
        .author                = photo.author_name,
        .author_url            = photo.author_url,
        .download_tracking_url = photo.download_location,
        .cached_at             = cached_at,
        .tags                  = photo.tags,
        .location_query        = std::move(location_query),
        .title_query           = std::move(title_query),
    };
}

} // namespace almanac::imagery
