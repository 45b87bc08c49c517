#pragma once

/// @file image_store.hpp
/// @brief Persistent, expiring repository of cached photographs.

#include "core/types.hpp"
#include "imagery/image_record.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace almanac::imagery
{
    /// @brief Snapshot counters for diagnostics.
    struct StoreStats
    {
        std::size_t records = 0;
        std::size_t expired = 0;
        u64 bytes_on_disk = 0;
    };

    /// @brief Owns the record map and the image files of one cache directory.
    ///
    /// Layout: `<directory>/metadata.yaml` holds the id → record map,
    /// `<directory>/<id>.jpg` holds each image. The map is loaded once at
    /// construction and rewritten after every mutation. A missing, unreadable
    /// or corrupt metadata file yields an empty store.
    ///
    /// All public members are safe to call from several threads; a single
    /// mutex serializes access to the map and its on-disk mirror, and a second
    /// one guards the background sweep's thread handle.
    class ImageMetadataStore
    {
    public:
        using Clock = std::function<Timestamp()>;

        static constexpr const char* kMetadataFileName = "metadata.yaml";
        static constexpr const char* kImageExtension = ".jpg";

        /// @brief Open (creating if needed) a cache directory.
        /// @param directory Cache directory, e.g. `<cache_root>/CalendarImages`.
        /// @param clock Time source for expiry checks; defaults to the system clock.
        explicit ImageMetadataStore(std::filesystem::path directory, Clock clock = {});

        /// @brief Waits for a running background sweep.
        ~ImageMetadataStore();

        ImageMetadataStore(const ImageMetadataStore&) = delete;
        ImageMetadataStore& operator=(const ImageMetadataStore&) = delete;
        ImageMetadataStore(ImageMetadataStore&&) = delete;
        ImageMetadataStore& operator=(ImageMetadataStore&&) = delete;

        /// @brief Record by id, expired or not.
        [[nodiscard]] std::optional<ImageRecord> get(const std::string& id) const;

        /// @brief Insert or replace a record and flush the map.
        /// @return false when the metadata file could not be written.
        bool put(const ImageRecord& record);

        /// @brief Insert or replace a record together with its image bytes.
        /// @return false when either file could not be written. When the image
        ///         cannot be written nothing is stored and any previous record
        ///         under the same id is dropped.
        bool put(const ImageRecord& record, const std::vector<u8>& bytes);

        /// @brief Non-expired records that could relate to a title/location. Unordered.
        ///
        /// A cheap textual pre-filter: a record is kept when a title word
        /// overlaps its title query or a tag, or when the locations overlap.
        /// With neither words nor location every live record is returned.
        [[nodiscard]] std::vector<ImageRecord> find_candidates(
            std::string_view title,
            const std::optional<std::string>& location
        ) const;

        /// @brief Every non-expired record. Unordered.
        [[nodiscard]] std::vector<ImageRecord> live_records() const;

        /// @brief Remove expired records and their image files.
        /// @return Number of records removed.
        std::size_t purge_expired();

        /// @brief Run purge_expired() on a background thread (at most one at a time).
        void purge_expired_async();

        /// @brief Block until a background sweep (if any) has finished.
        void wait_for_purge();

        /// @brief Uniformly random non-expired record.
        [[nodiscard]] std::optional<ImageRecord> random_record() const;

        /// @brief Image bytes of a record.
        [[nodiscard]] std::optional<std::vector<u8>> image_bytes(const std::string& id) const;

        /// @brief Record present and its image file exists.
        [[nodiscard]] bool has_image(const std::string& id) const;

        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] StoreStats stats() const;

        [[nodiscard]] Timestamp now() const { return m_clock(); }
        [[nodiscard]] const std::filesystem::path& directory() const { return m_directory; }

    private:
        void load_metadata();
        bool save_metadata_locked() const;
        [[nodiscard]] std::filesystem::path image_path(const std::string& id) const;

        std::filesystem::path m_directory;
        std::filesystem::path m_metadata_file;
        Clock m_clock;

        mutable std::mutex m_mutex;
        std::unordered_map<std::string, ImageRecord> m_records;
        mutable std::mt19937 m_rng;

        std::mutex m_purge_mutex;           ///< Guards m_purge_thread (join and replace)
        std::thread m_purge_thread;
        std::atomic<bool> m_purge_running{false};
    };

} // namespace almanac::imagery
