#pragma once

/// @file config.hpp
/// @brief Application configuration: cache location, queue limits, default observer.

#include "core/types.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace almanac::core
{
    /// @brief Where the image repository keeps its metadata and image bytes.
    struct CacheConfig
    {
        std::filesystem::path root = std::filesystem::temp_directory_path() / "almanac";
        bool purge_on_start = true;     ///< Run the expiry sweep in the background at start-up
    };

    /// @brief Limits for outbound provider requests.
    struct QueueConfig
    {
        u32 max_concurrent = 1;
        std::chrono::milliseconds min_interval{5000};   ///< Minimum gap between request starts
        u32 max_per_minute = 3;                         ///< 0 disables the per-minute window
    };

    /// @brief Observer used when an event or command line gives no location.
    struct LocationConfig
    {
        f64 latitude_deg = 40.7128;
        f64 longitude_deg = -74.0060;
        f64 utc_offset_hours = -5.0;
    };

    struct AppConfig
    {
        CacheConfig cache;
        QueueConfig queue;
        LocationConfig location;
    };

    /// @brief Raised when a configuration file cannot be read or holds invalid values.
    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief Load an AppConfig from a YAML file.
    ///
    /// Missing keys keep their defaults. Expected layout:
    /// @code
    /// cache:    { root: /var/cache/almanac, purge_on_start: true }
    /// queue:    { max_concurrent: 2, min_interval_ms: 5000, max_per_minute: 3 }
    /// location: { latitude: 51.5, longitude: -0.12, utc_offset: 0 }
    /// @endcode
    /// @throws ConfigError on unreadable files, malformed YAML or out-of-range values.
    [[nodiscard]] AppConfig load_config(const std::filesystem::path& path);

    /// @brief Parse an AppConfig from YAML text (same layout as load_config).
    [[nodiscard]] AppConfig parse_config(const std::string& yaml_text);

} // namespace almanac::core
