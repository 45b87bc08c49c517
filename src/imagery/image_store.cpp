/// @file image_store.cpp
/// @brief Image repository: YAML metadata map + one file per image.

#include "imagery/image_store.hpp"

#include "core/logger.hpp"
#include "imagery/text.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace almanac::imagery
{

namespace
{
    i64 to_nanoseconds(Timestamp ts)
    {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch()).count();
    }

    Timestamp from_nanoseconds(i64 ns)
    {
        return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(ns))};
    }

    void emit_optional(YAML::Emitter& out, const char* key, const std::optional<std::string>& value)
    {
        if (value)
        {
            out << YAML::Key << key << YAML::Value << *value;
        }
    }

    std::optional<std::string> read_optional(const YAML::Node& node, const char* key)
    {
        if (const auto child = node[key]; child && !child.IsNull())
        {
            return child.as<std::string>();
        }
        return std::nullopt;
    }

    // Throws YAML::Exception on missing or mistyped required fields
    ImageRecord decode_record(const std::string& key, const YAML::Node& node)
    {
        ImageRecord record;
        record.id                    = node["id"] ? node["id"].as<std::string>() : key;
        record.source_id             = read_optional(node, "source_id");
        record.full_url              = node["full_url"].as<std::string>();
        record.thumbnail_url         = node["thumbnail_url"].as<std::string>();
        record.author                = node["author"].as<std::string>();
        record.author_url            = read_optional(node, "author_url");
        record.download_tracking_url = node["download_tracking_url"].as<std::string>();
        record.cached_at             = from_nanoseconds(node["cached_at_ns"].as<i64>());
        record.location_query        = read_optional(node, "location_query");
        record.title_query           = read_optional(node, "title_query");

        if (const auto tags = node["tags"])
        {
            record.tags = tags.as<std::vector<std::string>>();
        }
        return record;
    }

    // Any title word or the location relates the record to the query
    bool relates_to(const ImageRecord& record,
                    const std::vector<std::string>& words,
                    std::string_view title,
                    const std::optional<std::string>& location)
    {
        if (record.title_query && !title.empty() && overlapsIgnoreCase(*record.title_query, title))
        {
            return true;
        }

        for (const auto& word : words)
        {
            if (record.title_query && containsIgnoreCase(*record.title_query, word))
            {
                return true;
            }
            for (const auto& tag : record.tags)
            {
                if (overlapsIgnoreCase(tag, word))
                {
                    return true;
                }
            }
        }

        return location && record.location_query && overlapsIgnoreCase(*location, *record.location_query);
    }
}

// -----------------------------------------------------------------
// Construction
// -----------------------------------------------------------------

ImageMetadataStore::ImageMetadataStore(std::filesystem::path directory, Clock clock)
    : m_directory(std::move(directory))
    , m_metadata_file(m_directory / kMetadataFileName)
    , m_clock(clock ? std::move(clock) : Clock{[] { return std::chrono::system_clock::now(); }})
    , m_rng(std::random_device{}())
{
    core::Logger::ensure_initialized();

    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);
    if (ec)
    {
        ALM_CORE_ERROR("ImageStore: Cannot create cache directory {}: {}", m_directory.string(), ec.message());
    }

    load_metadata();
}

ImageMetadataStore::~ImageMetadataStore()
{
    wait_for_purge();
}

// -----------------------------------------------------------------
// Queries
// -----------------------------------------------------------------

std::optional<ImageRecord> ImageMetadataStore::get(const std::string& id) const
{
    std::lock_guard lock(m_mutex);
    const auto it = m_records.find(id);
    if (it == m_records.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ImageRecord> ImageMetadataStore::find_candidates(
    std::string_view title,
    const std::optional<std::string>& location) const
{
    const auto words = splitWords(title);
    const bool unconstrained = words.empty() && !location;
    const Timestamp now = m_clock();

    std::lock_guard lock(m_mutex);
    std::vector<ImageRecord> candidates;
    for (const auto& [id, record] : m_records)
    {
        if (record.is_expired(now))
        {
            continue;
        }
        if (unconstrained || relates_to(record, words, title, location))
        {
            candidates.push_back(record);
        }
    }
    return candidates;
}

std::vector<ImageRecord> ImageMetadataStore::live_records() const
{
    const Timestamp now = m_clock();

    std::lock_guard lock(m_mutex);
    std::vector<ImageRecord> live;
    live.reserve(m_records.size());
    for (const auto& [id, record] : m_records)
    {
        if (!record.is_expired(now))
        {
            live.push_back(record);
        }
    }
    return live;
}

std::optional<ImageRecord> ImageMetadataStore::random_record() const
{
    auto live = live_records();
    if (live.empty())
    {
        return std::nullopt;
    }

    std::lock_guard lock(m_mutex);
    std::uniform_int_distribution<std::size_t> pick(0, live.size() - 1);
    return live[pick(m_rng)];
}

std::optional<std::vector<u8>> ImageMetadataStore::image_bytes(const std::string& id) const
{
    std::lock_guard lock(m_mutex);
    if (!m_records.contains(id))
    {
        return std::nullopt;
    }

    std::ifstream file(image_path(id), std::ios::binary);
    if (!file.is_open())
    {
        return std::nullopt;
    }
    return std::vector<u8>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

bool ImageMetadataStore::has_image(const std::string& id) const
{
    std::lock_guard lock(m_mutex);
    std::error_code ec;
    return m_records.contains(id) && std::filesystem::exists(image_path(id), ec);
}

std::size_t ImageMetadataStore::size() const
{
    std::lock_guard lock(m_mutex);
    return m_records.size();
}

StoreStats ImageMetadataStore::stats() const
{
    const Timestamp now = m_clock();

    std::lock_guard lock(m_mutex);
    StoreStats stats;
    stats.records = m_records.size();
    for (const auto& [id, record] : m_records)
    {
        if (record.is_expired(now))
        {
            ++stats.expired;
        }
        std::error_code ec;
        const auto bytes = std::filesystem::file_size(image_path(id), ec);
        if (!ec)
        {
            stats.bytes_on_disk += bytes;
        }
    }
    return stats;
}

// -----------------------------------------------------------------
// Mutations
// -----------------------------------------------------------------

bool ImageMetadataStore::put(const ImageRecord& record)
{
    std::lock_guard lock(m_mutex);
    m_records.insert_or_assign(record.id, record);
    return save_metadata_locked();
}

bool ImageMetadataStore::put(const ImageRecord& record, const std::vector<u8>& bytes)
{
    std::lock_guard lock(m_mutex);

    const auto path = image_path(record.id);
    bool ok = true;
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            ALM_CORE_ERROR("ImageStore: Failed to open image file for {}", record.id);
            ok = false;
        }
        else
        {
            file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            file.flush();
            if (!file)
            {
                ALM_CORE_ERROR("ImageStore: Failed to write {} bytes for {}", bytes.size(), record.id);
                ok = false;
            }
        }
    }

    // A record is only kept together with its image
    if (!ok)
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec))
        {
            std::filesystem::remove(path, ec);
            if (ec)
            {
                ALM_CORE_WARN("ImageStore: Could not remove partial image {}: {}", record.id, ec.message());
            }
        }
        // The previous image for this id was truncated along with it
        if (m_records.erase(record.id) > 0 && !save_metadata_locked())
        {
            ALM_CORE_WARN("ImageStore: Removal of {} not persisted", record.id);
        }
        return false;
    }

    m_records.insert_or_assign(record.id, record);
    return save_metadata_locked();
}

std::size_t ImageMetadataStore::purge_expired()
{
    const Timestamp now = m_clock();

    std::lock_guard lock(m_mutex);
    std::size_t removed = 0;
    for (auto it = m_records.begin(); it != m_records.end();)
    {
        if (!it->second.is_expired(now))
        {
            ++it;
            continue;
        }

        std::error_code ec;
        std::filesystem::remove(image_path(it->first), ec);
        if (ec)
        {
            ALM_CORE_WARN("ImageStore: Could not delete image {}: {}", it->first, ec.message());
        }
        it = m_records.erase(it);
        ++removed;
    }

    if (removed > 0)
    {
        if (!save_metadata_locked())
        {
            ALM_CORE_WARN("ImageStore: Purge not persisted, {} records will reappear on reload", removed);
        }
        ALM_CORE_INFO("ImageStore: Purged {} expired images", removed);
    }
    return removed;
}

void ImageMetadataStore::purge_expired_async()
{
    std::lock_guard lock(m_purge_mutex);

    bool expected = false;
    if (!m_purge_running.compare_exchange_strong(expected, true))
    {
        ALM_CORE_DEBUG("ImageStore: Expiry sweep already running");
        return;
    }

    // A finished previous sweep still needs joining
    if (m_purge_thread.joinable())
    {
        m_purge_thread.join();
    }

    m_purge_thread = std::thread([this] {
        purge_expired();
        m_purge_running.store(false);
    });
}

void ImageMetadataStore::wait_for_purge()
{
    std::lock_guard lock(m_purge_mutex);
    if (m_purge_thread.joinable())
    {
        m_purge_thread.join();
    }
}

// -----------------------------------------------------------------
// Persistence
// -----------------------------------------------------------------

std::filesystem::path ImageMetadataStore::image_path(const std::string& id) const
{
    return m_directory / (id + kImageExtension);
}

void ImageMetadataStore::load_metadata()
{
    std::error_code ec;
    if (!std::filesystem::exists(m_metadata_file, ec))
    {
        ALM_CORE_INFO("ImageStore: No metadata at {}, starting empty", m_metadata_file.string());
        return;
    }

    std::unordered_map<std::string, ImageRecord> loaded;
    try
    {
        const YAML::Node root = YAML::LoadFile(m_metadata_file.string());
        if (root.IsNull())
        {
            return;
        }
        if (!root.IsMap())
        {
            ALM_CORE_WARN("ImageStore: Metadata root is not a map in {}, starting empty",
                          m_metadata_file.string());
            return;
        }

        for (const auto& entry : root)
        {
            const auto key = entry.first.as<std::string>();
            loaded.insert_or_assign(key, decode_record(key, entry.second));
        }
    }
    catch (const YAML::Exception& e)
    {
        ALM_CORE_WARN("ImageStore: Corrupt metadata in {} ({}), starting empty",
                      m_metadata_file.string(), e.what());
        return;
    }

    std::lock_guard lock(m_mutex);
    m_records = std::move(loaded);
    ALM_CORE_INFO("ImageStore: Loaded {} records from {}", m_records.size(), m_metadata_file.string());
}

bool ImageMetadataStore::save_metadata_locked() const
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [id, record] : m_records)
    {
        out << YAML::Key << id << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << record.id;
        emit_optional(out, "source_id", record.source_id);
        out << YAML::Key << "full_url" << YAML::Value << record.full_url;
        out << YAML::Key << "thumbnail_url" << YAML::Value << record.thumbnail_url;
        out << YAML::Key << "author" << YAML::Value << record.author;
        emit_optional(out, "author_url", record.author_url);
        out << YAML::Key << "download_tracking_url" << YAML::Value << record.download_tracking_url;
        out << YAML::Key << "cached_at_ns" << YAML::Value << to_nanoseconds(record.cached_at);
        out << YAML::Key << "tags" << YAML::Value << YAML::Flow << record.tags;
        emit_optional(out, "location_query", record.location_query);
        emit_optional(out, "title_query", record.title_query);
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    if (!out.good())
    {
        ALM_CORE_ERROR("ImageStore: Failed to encode metadata: {}", out.GetLastError());
        return false;
    }

    // Write beside the target and rename so readers never see a torn file
    const auto temp_file = m_metadata_file.string() + ".tmp";
    {
        std::ofstream file(temp_file, std::ios::trunc);
        if (!file.is_open())
        {
            ALM_CORE_ERROR("ImageStore: Failed to open {} for writing", temp_file);
            return false;
        }
        file << out.c_str() << '\n';
        if (!file)
        {
            ALM_CORE_ERROR("ImageStore: Failed to write {}", temp_file);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_file, m_metadata_file, ec);
    if (ec)
    {
        ALM_CORE_ERROR("ImageStore: Failed to replace {}: {}", m_metadata_file.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace almanac::imagery
