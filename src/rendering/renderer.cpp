// rendering/renderer.cpp
#include "rendering/renderer.hpp"

#include "astro/time_system.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <iomanip>

namespace almanac::rendering {

namespace {

constexpr astro::SolarEvent kProgressionOrder[] = {
    astro::SolarEvent::AstronomicalTwilightStart,
    astro::SolarEvent::NauticalTwilightStart,
    astro::SolarEvent::CivilTwilightStart,
    astro::SolarEvent::Sunrise,
    astro::SolarEvent::Sunset,
    astro::SolarEvent::CivilTwilightEnd,
    astro::SolarEvent::NauticalTwilightEnd,
    astro::SolarEvent::AstronomicalTwilightEnd,
};

std::string rgbText(const daylight::DaylightColor& c) {
    return fmt::format("({:3.0f}, {:3.0f}, {:3.0f})", c.red, c.green, c.blue);
}

} // namespace

// -----------------------------------------------------------------------
// Glyph table: ' ' . : + * # @  (index 0 = darkest)
// -----------------------------------------------------------------------
char DaylightRenderer::brightnessGlyph(f64 brightness) {
    if (brightness < 0.02) return ' ';
    if (brightness < 0.10) return '.';
    if (brightness < 0.25) return ':';
    if (brightness < 0.45) return '+';
    if (brightness < 0.65) return '*';
    if (brightness < 0.85) return '#';
    return '@';
}

void DaylightRenderer::hline(std::ostream& out, int w, char c) {
    out << '+';
    for (int i = 0; i < w - 2; ++i) out << c;
    out << '+' << '\n';
}

void DaylightRenderer::header(std::ostream& out, const std::string& title) const {
    hline(out, viewport_w, '=');
    out << "| " << std::left << std::setw(viewport_w - 4) << title << " |\n";
    hline(out, viewport_w, '-');
}

void DaylightRenderer::row(std::ostream& out, const std::string& label,
                           const std::string& value) const {
    out << "| " << std::left << std::setw(22) << label
        << " : " << std::left << std::setw(viewport_w - 29) << value
        << "|\n";
}

std::string DaylightRenderer::formatHour(f64 hour) {
    const int total = std::clamp(static_cast<int>(std::lround(hour * 60.0)), 0, 24 * 60);
    return fmt::format("{:02d}:{:02d}", total / 60, total % 60);
}

// -----------------------------------------------------------------------
// renderGradientBar
// -----------------------------------------------------------------------
void DaylightRenderer::renderGradientBar(std::ostream& out,
                                         const std::vector<daylight::DaylightColor>& samples,
                                         const std::string& title) const {
    if (!title.empty()) out << title << '\n';

    for (const auto& c : samples) {
        if (use_color) {
            out << fmt::format("\x1b[48;2;{};{};{}m ",
                               static_cast<int>(std::lround(c.red)),
                               static_cast<int>(std::lround(c.green)),
                               static_cast<int>(std::lround(c.blue)));
        } else {
            const f64 luma = (0.2126 * c.red + 0.7152 * c.green + 0.0722 * c.blue) / 255.0;
            out << brightnessGlyph(luma);
        }
    }
    if (use_color) out << "\x1b[0m";
    out << '\n';

    // Hour ruler: a tick every 6 hours
    const std::size_t n = samples.size();
    std::string ruler(n, ' ');
    for (int h = 0; h < 24; h += 6) {
        const std::string label = fmt::format("{:02d}", h);
        const std::size_t pos = n * static_cast<std::size_t>(h) / 24;
        for (std::size_t i = 0; i < label.size() && pos + i < n; ++i) {
            ruler[pos + i] = label[i];
        }
    }
    out << ruler << '\n';
}

// -----------------------------------------------------------------------
// renderPeriodTable
// -----------------------------------------------------------------------
void DaylightRenderer::renderPeriodTable(std::ostream& out,
                                         const std::vector<daylight::DaylightPeriod>& periods) const {
    header(out, "DAYLIGHT PERIODS");
    for (const auto& p : periods) {
        row(out, std::string(daylight::daylightPhaseName(p.phase)),
            formatHour(p.start_hour) + " - " + formatHour(p.end_hour) + "  " + rgbText(p.color));
    }
    hline(out, viewport_w, '=');
}

// -----------------------------------------------------------------------
// renderProgressionPanel
// -----------------------------------------------------------------------
void DaylightRenderer::renderProgressionPanel(std::ostream& out,
                                              const astro::DailyAlmanac& almanac) const {
    header(out, fmt::format("DAILY PROGRESSION  {:04d}-{:02d}-{:02d}",
                            almanac.date.year, almanac.date.month, almanac.date.day));

    row(out, "Location", fmt::format("{:.4f}, {:.4f}",
                                     almanac.coordinate.latitude_deg,
                                     almanac.coordinate.longitude_deg));
    row(out, "UTC offset", fmt::format("{:+.1f} h", almanac.utcOffsetHours));
    hline(out, viewport_w, '-');

    for (const auto e : kProgressionOrder) {
        row(out, std::string(astro::solar_event_name(e)), almanac.formatEvent(e));
    }
    hline(out, viewport_w, '-');

    row(out, "Daylight", astro::formatDuration(almanac.daylightHours));
    row(out, "Night", astro::formatDuration(almanac.nightHours));
    row(out, "Moon phase", fmt::format("{} ({:.0f}%)",
                                       astro::moonPhaseName(almanac.moonPhase),
                                       almanac.moonPhase * 100.0));
    hline(out, viewport_w, '=');
}

// -----------------------------------------------------------------------
// renderStoreStats
// -----------------------------------------------------------------------
void DaylightRenderer::renderStoreStats(std::ostream& out,
                                        const imagery::StoreStats& stats,
                                        const std::string& directory) const {
    header(out, "IMAGE CACHE");
    row(out, "Directory", directory);
    row(out, "Records", std::to_string(stats.records));
    row(out, "Expired", std::to_string(stats.expired));
    row(out, "On disk", fmt::format("{:.1f} KiB", static_cast<f64>(stats.bytes_on_disk) / 1024.0));
    hline(out, viewport_w, '=');
}

// -----------------------------------------------------------------------
// renderResolution
// -----------------------------------------------------------------------
void DaylightRenderer::renderResolution(std::ostream& out,
                                        const imagery::Resolution& resolution,
                                        const imagery::ImageMetadataStore& store) const {
    const auto& event = resolution.updated_event;

    header(out, "EVENT IMAGE");
    row(out, "Event", event.title);
    row(out, "Location", event.location.value_or("(none)"));
    row(out, "Source", imagery::resolution_source_name(resolution.source));

    if (!resolution.image_id) {
        row(out, "Image", "(placeholder)");
        hline(out, viewport_w, '=');
        return;
    }

    row(out, "Image", *resolution.image_id);
    if (const auto record = store.get(*resolution.image_id)) {
        row(out, "Author", record->author);
        row(out, "Query", record->title_query.value_or(""));
        if (!record->tags.empty()) {
            row(out, "Tags", fmt::format("{}", fmt::join(record->tags, ", ")));
        }
    }
    hline(out, viewport_w, '=');
}

} // namespace almanac::rendering
