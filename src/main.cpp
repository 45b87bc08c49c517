// src/main.cpp - Almanac command-line front end
//
//  1. Load configuration (optional YAML file, then command-line overrides)
//  2. Compute the day partition and the daily progression
//  3. Render the gradient bar and panels to the terminal
//  4. Optionally resolve an image for one event through the cache

#include "astro/daily_almanac.hpp"
#include "astro/solar_calculator.hpp"
#include "astro/time_system.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "daylight/daylight_model.hpp"
#include "imagery/image_resolver.hpp"
#include "imagery/image_store.hpp"
#include "imagery/photo_provider.hpp"
#include "queue/request_queue.hpp"
#include "rendering/renderer.hpp"

#include <unistd.h>

#include <cstdio>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace almanac;

namespace {

// -----------------------------------------------------------------------
// OfflinePhotoProvider - no network client is bundled
// -----------------------------------------------------------------------
class OfflinePhotoProvider final : public imagery::PhotoProvider {
public:
    std::optional<imagery::PhotoMetadata> fetch_random_photo(const std::string& query) override {
        ALM_WARN("Offline: no photo provider configured (query '{}')", query);
        return std::nullopt;
    }
    std::optional<std::vector<imagery::PhotoMetadata>> search_photos(const std::string&) override {
        return std::nullopt;
    }
    std::optional<std::vector<u8>> download_bytes(const std::string&) override {
        return std::nullopt;
    }
    void track_download(const std::string&) override {}
};

struct Options {
    std::optional<std::string>      config_path;
    std::optional<astro::CivilDate> date;
    std::optional<f64>              latitude;
    std::optional<f64>              longitude;
    std::optional<f64>              utc_offset;
    std::optional<std::string>      event_title;
    std::optional<std::string>      event_location;
    bool                            color{true};
    bool                            help{false};
};

void printUsage(std::ostream& out) {
    out << "Usage: almanac_cli [options]\n"
        << "  --config FILE        YAML configuration file\n"
        << "  --date YYYY-MM-DD    Day to display (default: today)\n"
        << "  --lat DEG            Observer latitude\n"
        << "  --lon DEG            Observer longitude (east positive)\n"
        << "  --utc-offset HOURS   Wall-clock offset from UTC\n"
        << "  --event TITLE        Resolve an image for an event with this title\n"
        << "  --location TEXT      Location of that event\n"
        << "  --no-color           Plain-text gradient bar\n"
        << "  --help               Show this text\n";
}

std::optional<astro::CivilDate> parseDate(const std::string& text) {
    astro::CivilDate d{};
    char tail = 0;
    if (std::sscanf(text.c_str(), "%d-%d-%d%c", &d.year, &d.month, &d.day, &tail) != 3) {
        return std::nullopt;
    }
    if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > 31) return std::nullopt;
    return d;
}

f64 parseNumber(std::string_view flag, const std::string& text) {
    std::size_t used = 0;
    const f64 value = std::stod(text, &used);
    if (used != text.size()) {
        throw std::invalid_argument(std::string(flag) + ": not a number: " + text);
    }
    return value;
}

// Throws std::invalid_argument or std::out_of_range on malformed input
Options parseArgs(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(std::string(arg) + " needs a value");
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opt.help = true;
        } else if (arg == "--config") {
            opt.config_path = value();
        } else if (arg == "--date") {
            const std::string text = value();
            opt.date = parseDate(text);
            if (!opt.date) throw std::invalid_argument("--date: expected YYYY-MM-DD, got " + text);
        } else if (arg == "--lat") {
            opt.latitude = parseNumber(arg, value());
        } else if (arg == "--lon") {
            opt.longitude = parseNumber(arg, value());
        } else if (arg == "--utc-offset") {
            opt.utc_offset = parseNumber(arg, value());
        } else if (arg == "--event") {
            opt.event_title = value();
        } else if (arg == "--location") {
            opt.event_location = value();
        } else if (arg == "--no-color") {
            opt.color = false;
        } else {
            throw std::invalid_argument("unknown option " + std::string(arg));
        }
    }
    return opt;
}

} // namespace

int main(int argc, char** argv) {
    core::Logger::init();

    Options opt;
    core::AppConfig config;
    try {
        opt = parseArgs(argc, argv);
        if (opt.config_path) config = core::load_config(*opt.config_path);
    } catch (const core::ConfigError& e) {
        ALM_ERROR("Configuration error: {}", e.what());
        core::Logger::shutdown();
        return 1;
    } catch (const std::logic_error& e) {
        ALM_ERROR("{}", e.what());
        printUsage(std::cerr);
        core::Logger::shutdown();
        return 2;
    }

    if (opt.help) {
        printUsage(std::cout);
        core::Logger::shutdown();
        return 0;
    }

    // -----------------------------------------------------------------------
    // 1. Observer and day
    // -----------------------------------------------------------------------
    const astro::GeoCoordinate observer{
        .latitude_deg  = opt.latitude.value_or(config.location.latitude_deg),
        .longitude_deg = opt.longitude.value_or(config.location.longitude_deg),
    };
    if (!observer.is_valid()) {
        ALM_ERROR("Invalid observer coordinate {:.4f}, {:.4f}",
                  observer.latitude_deg, observer.longitude_deg);
        core::Logger::shutdown();
        return 2;
    }
    const f64 utc_offset = opt.utc_offset.value_or(config.location.utc_offset_hours);
    const astro::CivilDate date = opt.date.value_or(astro::TimeSystem::today(utc_offset));

    ALM_INFO("Almanac for {:04d}-{:02d}-{:02d} at {:.4f}, {:.4f} (UTC{:+.1f})",
             date.year, date.month, date.day,
             observer.latitude_deg, observer.longitude_deg, utc_offset);

    // -----------------------------------------------------------------------
    // 2. Daylight gradient and progression
    // -----------------------------------------------------------------------
    rendering::DaylightRenderer renderer;
    renderer.use_color = opt.color && isatty(STDOUT_FILENO) != 0;

    const auto periods  = daylight::DaylightColorModel::periodsForDay(date, observer);
    const auto gradient = daylight::DaylightColorModel::gradient(date, observer);
    const auto progress = astro::DailyAlmanac::compute(date, observer, utc_offset);

    renderer.renderGradientBar(std::cout, gradient, "Daylight (local solar hours)");
    std::cout << '\n';
    renderer.renderPeriodTable(std::cout, periods);
    std::cout << '\n';
    renderer.renderProgressionPanel(std::cout, progress);
    std::cout << '\n';

    // -----------------------------------------------------------------------
    // 3. Image cache and optional event resolution
    // -----------------------------------------------------------------------
    {
        imagery::ImageMetadataStore store(config.cache.root / "CalendarImages");
        if (config.cache.purge_on_start) store.purge_expired_async();

        OfflinePhotoProvider provider;
        queue::RequestQueue requests({
            .max_concurrent = config.queue.max_concurrent,
            .min_interval   = config.queue.min_interval,
            .max_per_minute = config.queue.max_per_minute,
        });
        imagery::ImageResolver resolver(store, requests, provider);

        if (opt.event_title) {
            const imagery::CalendarEvent event{
                .id                = "cli",
                .title             = *opt.event_title,
                .location          = opt.event_location,
                .assigned_image_id = std::nullopt,
            };
            auto resolution = resolver.resolve(event).get();
            renderer.renderResolution(std::cout, resolution, store);
            std::cout << '\n';
            ALM_INFO("{}", resolver.queue_status());
        }

        store.wait_for_purge();
        renderer.renderStoreStats(std::cout, store.stats(), store.directory().string());
    }

    core::Logger::shutdown();
    return 0;
}
