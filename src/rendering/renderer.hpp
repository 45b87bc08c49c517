#pragma once
// rendering/renderer.hpp - Terminal renderer for the daylight almanac
//
// Draws the day's colour gradient as a 24-bit ANSI bar, followed by boxed
// text panels (period table, daily progression, cache state).  Works on any
// POSIX terminal; colour can be switched off for pipes and tests.

#include "astro/daily_almanac.hpp"
#include "daylight/daylight_model.hpp"
#include "imagery/image_resolver.hpp"
#include "imagery/image_store.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace almanac::rendering {

// -----------------------------------------------------------------------
// DaylightRenderer
// -----------------------------------------------------------------------
class DaylightRenderer {
public:
    /// Width of the boxed panels (characters)
    int viewport_w{72};
    /// Emit ANSI 24-bit colour escapes
    bool use_color{true};

    // -----------------------------------------------------------------------
    // Gradient bar
    // -----------------------------------------------------------------------

    /// One cell per sample, with an hour ruler underneath.
    /// Without colour each cell is a shade glyph by brightness.
    void renderGradientBar(std::ostream& out,
                           const std::vector<daylight::DaylightColor>& samples,
                           const std::string& title = "") const;

    // -----------------------------------------------------------------------
    // Panels
    // -----------------------------------------------------------------------

    /// Phase name, start/end wall-clock and RGB of every period.
    void renderPeriodTable(std::ostream& out,
                           const std::vector<daylight::DaylightPeriod>& periods) const;

    /// Sun events (N/A when unreachable), durations and moon phase.
    void renderProgressionPanel(std::ostream& out,
                                const astro::DailyAlmanac& almanac) const;

    /// Image cache counters.
    void renderStoreStats(std::ostream& out,
                          const imagery::StoreStats& stats,
                          const std::string& directory) const;

    /// Outcome of resolving an event's image.
    void renderResolution(std::ostream& out,
                          const imagery::Resolution& resolution,
                          const imagery::ImageMetadataStore& store) const;

    /// "HH:MM" for a fractional hour of day.
    static std::string formatHour(f64 hour);

private:
    /// Map brightness [0..1] to a shade glyph.
    static char brightnessGlyph(f64 brightness);

    /// Draw a horizontal separator line.
    static void hline(std::ostream& out, int w, char c = '-');

    void header(std::ostream& out, const std::string& title) const;
    void row(std::ostream& out, const std::string& label, const std::string& value) const;
};

} // namespace almanac::rendering
