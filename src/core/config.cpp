/// @file config.cpp
/// @brief YAML configuration loading.

#include "core/config.hpp"

#include "core/logger.hpp"

#include <yaml-cpp/yaml.h>

namespace almanac::core
{

namespace
{
    template <typename T>
    void read_optional(const YAML::Node& node, const char* key, T& out)
    {
        if (node[key])
        {
            out = node[key].as<T>();
        }
    }

    AppConfig from_node(const YAML::Node& root)
    {
        AppConfig config;

        if (const auto cache = root["cache"])
        {
            if (cache["root"])
            {
                config.cache.root = cache["root"].as<std::string>();
            }
            read_optional(cache, "purge_on_start", config.cache.purge_on_start);
        }

        if (const auto queue = root["queue"])
        {
            read_optional(queue, "max_concurrent", config.queue.max_concurrent);
            read_optional(queue, "max_per_minute", config.queue.max_per_minute);
            if (queue["min_interval_ms"])
            {
                const auto ms = queue["min_interval_ms"].as<i64>();
                if (ms < 0)
                {
                    throw ConfigError("queue.min_interval_ms must not be negative");
                }
                config.queue.min_interval = std::chrono::milliseconds(ms);
            }
        }

        if (const auto location = root["location"])
        {
            read_optional(location, "latitude", config.location.latitude_deg);
            read_optional(location, "longitude", config.location.longitude_deg);
            read_optional(location, "utc_offset", config.location.utc_offset_hours);
        }

        if (config.queue.max_concurrent == 0)
        {
            throw ConfigError("queue.max_concurrent must be at least 1");
        }
        if (config.location.latitude_deg < -90.0 || config.location.latitude_deg > 90.0)
        {
            throw ConfigError("location.latitude must lie in [-90, 90]");
        }
        if (config.location.longitude_deg < -180.0 || config.location.longitude_deg > 180.0)
        {
            throw ConfigError("location.longitude must lie in [-180, 180]");
        }

        return config;
    }
}

AppConfig parse_config(const std::string& yaml_text)
{
    try
    {
        return from_node(YAML::Load(yaml_text));
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
}

AppConfig load_config(const std::filesystem::path& path)
{
    Logger::ensure_initialized();

    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path.string());
    }
    catch (const YAML::Exception& e)
    {
        ALM_CORE_ERROR("Config: Failed to load {}: {}", path.string(), e.what());
        throw ConfigError("Error loading config file " + path.string() + ": " + e.what());
    }

    try
    {
        auto config = from_node(root);
        ALM_CORE_INFO("Config: Loaded {}", path.string());
        return config;
    }
    catch (const YAML::Exception& e)
    {
        ALM_CORE_ERROR("Config: Invalid value in {}: {}", path.string(), e.what());
        throw ConfigError("Invalid value in " + path.string() + ": " + e.what());
    }
}

} // namespace almanac::core
