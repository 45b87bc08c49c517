/// @file test_image_resolver.cpp
/// @brief Unit tests for almanac::imagery::ImageResolver.
///
/// A scripted provider stands in for the stock-photo service so every
/// resolution step can be driven and the network calls counted.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "core/types.hpp"
#include "imagery/image_resolver.hpp"
#include "imagery/image_store.hpp"
#include "imagery/photo_provider.hpp"
#include "queue/request_queue.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

using namespace almanac;
using namespace almanac::imagery;
using namespace std::chrono_literals;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    almanac::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    almanac::core::Logger::shutdown();
    return result;
}

// =================================================================
// Test doubles
// =================================================================

class ScriptedProvider final : public PhotoProvider
{
public:
    std::optional<PhotoMetadata> random_photo;
    std::optional<std::vector<PhotoMetadata>> search_result;
    std::map<std::string, std::vector<u8>> downloads;   ///< URL → bytes; absent URLs fail

    std::atomic<int> fetch_calls{0};
    std::atomic<int> search_calls{0};

    std::optional<PhotoMetadata> fetch_random_photo(const std::string& query) override
    {
        ++fetch_calls;
        std::lock_guard lock(m_mutex);
        m_queries.push_back(query);
        return random_photo;
    }

    std::optional<std::vector<PhotoMetadata>> search_photos(const std::string& query) override
    {
        ++search_calls;
        std::lock_guard lock(m_mutex);
        m_queries.push_back(query);
        return search_result;
    }

    std::optional<std::vector<u8>> download_bytes(const std::string& url) override
    {
        const auto it = downloads.find(url);
        if (it == downloads.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void track_download(const std::string& photo_id) override
    {
        std::lock_guard lock(m_mutex);
        m_tracked.push_back(photo_id);
    }

    std::vector<std::string> queries() const
    {
        std::lock_guard lock(m_mutex);
        return m_queries;
    }

    std::vector<std::string> tracked() const
    {
        std::lock_guard lock(m_mutex);
        return m_tracked;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_queries;
    std::vector<std::string> m_tracked;
};

static PhotoMetadata make_photo(const std::string& id, std::vector<std::string> tags = {})
{
    return PhotoMetadata{
        .id                = id,
        .regular_url       = "https://images.example/" + id + "/regular",
        .thumb_url         = "https://images.example/" + id + "/thumb",
        .author_name       = "Grace Hopper",
        .author_url        = std::nullopt,
        .download_location = "https://api.example/photos/" + id + "/download",
        .tags              = std::move(tags),
    };
}

static const std::vector<u8> kImageBytes = {0xFF, 0xD8, 0x01, 0x02, 0xFF, 0xD9};

/// Store, queue, provider and resolver wired together over a scratch directory.
struct Fixture
{
    std::filesystem::path dir;
    ImageMetadataStore store;
    ScriptedProvider provider;
    queue::RequestQueue queue;
    ImageResolver resolver;

    explicit Fixture(const std::string& name)
        : dir(clean_dir(name))
        , store(dir)
        , queue()
        , resolver(store, queue, provider)
    {
    }

    ~Fixture()
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    Fixture(const Fixture&) = delete;
    Fixture& operator=(const Fixture&) = delete;

    /// Cache a record (with bytes) as if fetched earlier for title/location.
    std::string seed(const std::string& id,
                     const std::string& title_query,
                     std::optional<std::string> location = std::nullopt,
                     std::vector<std::string> tags = {})
    {
        const auto record = make_record(make_photo("src-" + id, std::move(tags)), id, store.now(),
                                        title_query, std::move(location));
        REQUIRE(store.put(record, kImageBytes));
        return id;
    }

    static std::filesystem::path clean_dir(const std::string& name)
    {
        auto path = std::filesystem::temp_directory_path() / ("almanac_resolver_" + name);
        std::filesystem::remove_all(path);
        return path;
    }
};

static CalendarEvent make_event(std::string title, std::optional<std::string> location = std::nullopt,
                                std::optional<std::string> assigned = std::nullopt)
{
    return CalendarEvent{
        .id                = "evt-1",
        .title             = std::move(title),
        .location          = std::move(location),
        .assigned_image_id = std::move(assigned),
    };
}

// =================================================================
// Cache-only resolution
// =================================================================

TEST_CASE("A valid assignment is returned without searching")
{
    Fixture f("assigned");
    f.seed("img-1", "Yoga class");

    auto future = f.resolver.resolve(make_event("Quarterly review", std::nullopt, "img-1"));
    REQUIRE(future.wait_for(0s) == std::future_status::ready);

    const auto r = future.get();
    CHECK(r.source == ResolutionSource::Assigned);
    CHECK(r.image_id == std::optional<std::string>("img-1"));
    CHECK(r.updated_event.assigned_image_id == std::optional<std::string>("img-1"));
    CHECK(f.provider.fetch_calls.load() == 0);
}

TEST_CASE("A strong title match is accepted without touching the provider")
{
    Fixture f("auto_accept");
    f.seed("img-team", "Team Meeting");
    f.seed("img-other", "Garden party");

    const auto event = make_event("team meeting");
    auto future = f.resolver.resolve(event);
    REQUIRE(future.wait_for(0s) == std::future_status::ready);

    const auto r = future.get();
    CHECK(r.source == ResolutionSource::AutoAccepted);
    CHECK(r.image_id == std::optional<std::string>("img-team"));
    CHECK(r.updated_event.assigned_image_id == r.image_id);
    CHECK(f.provider.fetch_calls.load() == 0);

    // The caller's event is untouched
    CHECK_FALSE(event.assigned_image_id.has_value());
}

TEST_CASE("A contained title scoring 2.0 is accepted without a fetch")
{
    Fixture f("contained");
    f.seed("img-weekly", "team meeting");

    const auto r = f.resolver.resolve(make_event("Weekly team meeting")).get();
    CHECK(r.source == ResolutionSource::AutoAccepted);
    CHECK(r.image_id == std::optional<std::string>("img-weekly"));
    CHECK(f.provider.fetch_calls.load() == 0);
    CHECK(f.provider.queries().empty());
}

TEST_CASE("An exact title and location match is accepted below the auto-accept score")
{
    Fixture f("exact");
    // Empty title: only the location contributes (1.0)
    f.seed("img-rome", "", "Rome");

    const auto r = f.resolver.resolve(make_event("", std::string("Rome"))).get();
    CHECK(r.source == ResolutionSource::ExactMatch);
    CHECK(r.image_id == std::optional<std::string>("img-rome"));
    CHECK(f.provider.fetch_calls.load() == 0);
}

TEST_CASE("A blank event location does not promote an unrelated record")
{
    Fixture f("blank_location");
    f.seed("img-paris", "team lunch", std::string("Paris"));
    f.seed("img-blank-tag", "physio", std::nullopt, {""});

    const auto r = f.resolver.resolve(make_event("team meeting", std::string(""))).get();
    CHECK(r.source == ResolutionSource::Unresolved);
    CHECK_FALSE(r.image_id.has_value());
    CHECK(f.provider.fetch_calls.load() == 1);
}

TEST_CASE("A good-enough match is reused")
{
    Fixture f("good_enough");
    // One shared word (0.5) plus one overlapping tag (0.3)
    f.seed("img-lunch", "team lunch", std::nullopt, {"meeting"});

    const auto r = f.resolver.resolve(make_event("team meeting")).get();
    CHECK(r.source == ResolutionSource::GoodEnough);
    CHECK(r.image_id == std::optional<std::string>("img-lunch"));
    CHECK(f.provider.fetch_calls.load() == 0);
}

// =================================================================
// Fetching
// =================================================================

TEST_CASE("A weak match falls through to a fetch that persists the photo")
{
    Fixture f("fetch");
    f.seed("img-weak", "team lunch");   // 0.5 is not good enough

    f.provider.random_photo = make_photo("unsplash-42", {"desk", "laptop"});
    f.provider.downloads["https://images.example/unsplash-42/regular"] = kImageBytes;

    const auto event = make_event("Team Meeting at HQ", std::string("San Francisco, CA"));
    const auto r = f.resolver.resolve(event).get();

    REQUIRE(r.source == ResolutionSource::Fetched);
    REQUIRE(r.image_id.has_value());
    CHECK(*r.image_id != "img-weak");
    CHECK(r.updated_event.assigned_image_id == r.image_id);

    CHECK(f.provider.fetch_calls.load() == 1);
    REQUIRE(f.provider.queries().size() == 1);
    CHECK(f.provider.queries()[0] == ImageResolver::build_search_query(event));
    CHECK(f.provider.tracked() == std::vector<std::string>{"unsplash-42"});

    const auto stored = f.store.get(*r.image_id);
    REQUIRE(stored.has_value());
    CHECK(stored->source_id == std::optional<std::string>("unsplash-42"));
    CHECK(stored->title_query == std::optional<std::string>("Team Meeting at HQ"));
    CHECK(stored->location_query == std::optional<std::string>("San Francisco, CA"));
    CHECK(f.store.image_bytes(*r.image_id) == std::optional<std::vector<u8>>(kImageBytes));

    // The next resolution of the same event is served from the cache
    const auto again = f.resolver.resolve(event).get();
    CHECK(again.source == ResolutionSource::AutoAccepted);
    CHECK(again.image_id == r.image_id);
    CHECK(f.provider.fetch_calls.load() == 1);
}

TEST_CASE("A dangling assignment is cleared before resolving")
{
    Fixture f("dangling");
    f.provider.random_photo = make_photo("p1");
    f.provider.downloads["https://images.example/p1/regular"] = kImageBytes;

    const auto r = f.resolver.resolve(make_event("Hiking", std::nullopt, "deleted-image")).get();
    CHECK(r.source == ResolutionSource::Fetched);
    REQUIRE(r.image_id.has_value());
    CHECK(*r.image_id != "deleted-image");
    CHECK(r.updated_event.assigned_image_id == r.image_id);
}

TEST_CASE("Provider failure resolves to no image")
{
    Fixture f("provider_failure");

    const auto r = f.resolver.resolve(make_event("Dentist", std::nullopt, "gone")).get();
    CHECK(r.source == ResolutionSource::Unresolved);
    CHECK_FALSE(r.image_id.has_value());
    CHECK_FALSE(r.updated_event.assigned_image_id.has_value());
    CHECK(f.provider.fetch_calls.load() == 1);
    CHECK(f.store.size() == 0);
}

TEST_CASE("Download failure stores nothing and skips tracking")
{
    Fixture f("download_failure");
    f.provider.random_photo = make_photo("no-bytes");

    const auto r = f.resolver.resolve(make_event("Concert")).get();
    CHECK(r.source == ResolutionSource::Unresolved);
    CHECK(f.store.size() == 0);
    CHECK(f.provider.tracked().empty());
}

// =================================================================
// Search query construction
// =================================================================

TEST_CASE("Search query keeps long title words, two place names and a theme")
{
    CHECK(ImageResolver::build_search_query(make_event("Team Meeting at HQ", std::string("San Francisco, CA")))
          == "team meeting san francisco business");
    CHECK(ImageResolver::build_search_query(make_event("Birthday party for Mom"))
          == "birthday party for celebration");
    CHECK(ImageResolver::build_search_query(make_event("Beach vacation"))
          == "beach vacation travel");
    CHECK(ImageResolver::build_search_query(make_event("Morning WORKOUT"))
          == "morning workout fitness");
    CHECK(ImageResolver::build_search_query(make_event("Dentist")) == "dentist");
}

TEST_CASE("Only the first matching theme is added")
{
    CHECK(ImageResolver::build_search_query(make_event("Conference travel"))
          == "conference travel business");
}

// =================================================================
// Browsing, search and reassignment
// =================================================================

TEST_CASE("similar_images ranks with the browsing profile and honours the limit")
{
    Fixture f("similar");
    f.seed("loc", "Dinner", "Lisbon");
    f.seed("word", "Team dinner");
    f.seed("none", "Yoga");

    const auto ranked = f.resolver.similar_images("team dinner", std::string("Lisbon"));
    REQUIRE(ranked.size() == 3);
    // loc: 1 word + location 2.0 = 3.0; word: 2 words = 2.0
    CHECK(ranked[0].id == "loc");
    CHECK(ranked[1].id == "word");
    CHECK(ranked[2].id == "none");

    CHECK(f.resolver.similar_images("team dinner", std::nullopt, 1).size() == 1);
}

TEST_CASE("search returns unsaved records whose thumbnails download")
{
    Fixture f("search");
    f.provider.search_result = std::vector<PhotoMetadata>{make_photo("s1"), make_photo("s2"), make_photo("s3")};
    f.provider.downloads["https://images.example/s1/thumb"] = kImageBytes;
    f.provider.downloads["https://images.example/s3/thumb"] = kImageBytes;

    const auto results = f.resolver.search("mountain lake").get();
    REQUIRE(results.size() == 2);
    CHECK(results[0].source_id == std::optional<std::string>("s1"));
    CHECK(results[1].source_id == std::optional<std::string>("s3"));
    for (const auto& r : results)
    {
        CHECK(r.title_query == std::optional<std::string>("mountain lake"));
        CHECK_FALSE(r.location_query.has_value());
        CHECK_FALSE(r.id.empty());
    }
    CHECK(results[0].id != results[1].id);
    CHECK(f.store.size() == 0);
}

TEST_CASE("search failure yields an empty list")
{
    Fixture f("search_failure");
    CHECK(f.resolver.search("anything").get().empty());
    CHECK(f.provider.search_calls.load() == 1);
}

TEST_CASE("reassign only accepts stored images")
{
    Fixture f("reassign");
    f.seed("img-a", "Anything");

    const auto event = make_event("Standup", std::nullopt, "img-old");
    const auto updated = f.resolver.reassign(event, "img-a");
    REQUIRE(updated.has_value());
    CHECK(updated->assigned_image_id == std::optional<std::string>("img-a"));
    CHECK(updated->title == "Standup");

    CHECK_FALSE(f.resolver.reassign(event, "img-missing").has_value());
}

TEST_CASE("queue_status reports the queue")
{
    Fixture f("status");
    CHECK(f.resolver.queue_status().find("Queue Status:") != std::string::npos);
}
