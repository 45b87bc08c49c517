#pragma once
// daylight/daylight_model.hpp - Day partition into coloured phases
//
// Splits a calendar day into 13 contiguous periods (night is split into a
// pre-dawn and a post-dusk segment around the 11 twilight/day phases) and
// maps any hour to a smoothly blended colour for gradient bars.
//
// The partition uses the approximate sunrise profile with fixed band
// widths, not the precise twilight crossings used by DailyAlmanac.

#include "astro/solar_calculator.hpp"
#include "astro/time_system.hpp"
#include "daylight/daylight_color.hpp"

#include <string_view>
#include <vector>

namespace almanac::daylight {

// -----------------------------------------------------------------------
// DaylightPhase
// -----------------------------------------------------------------------
enum class DaylightPhase {
    Night,
    AstronomicalTwilight,
    NauticalTwilight,
    CivilTwilight,
    Sunrise,
    GoldenHour,
    Daylight,
    Sunset,
    GoldenHourEvening,
    CivilTwilightEvening,
    NauticalTwilightEvening,
    AstronomicalTwilightEvening,
};

std::string_view daylightPhaseName(DaylightPhase phase);

// -----------------------------------------------------------------------
// DaylightPeriod
// -----------------------------------------------------------------------
struct DaylightPeriod {
    DaylightPhase phase{DaylightPhase::Night};
    f64           start_hour{0.0};  ///< [0,24)
    f64           end_hour{0.0};    ///< (0,24]
    DaylightColor color{};

    f64 duration() const { return end_hour - start_hour; }

    /// Half-open containment [start, end).
    bool contains(f64 hour) const { return hour >= start_hour && hour < end_hour; }
};

// -----------------------------------------------------------------------
// DaylightColorModel
// -----------------------------------------------------------------------
class DaylightColorModel {
public:
    /// Number of periods in a day partition.
    static constexpr std::size_t kPeriodCount = 13;
    /// Fraction of a period blended toward each neighbour.
    static constexpr f64 kBlendFraction = 0.2;
    /// Samples in a visualisation bar (15-minute resolution).
    static constexpr int kDefaultSegments = 96;

    /// Ordered, contiguous periods covering [0, 24].
    static std::vector<DaylightPeriod> periodsForDay(
        const astro::CivilDate& date,
        const astro::GeoCoordinate& coordinate = astro::kDefaultCoordinate);

    /// Blended colour at an hour of the day. Pure; safe at high call rates.
    /// Hours outside [0,24) return the night colour.
    static DaylightColor colorForHour(
        f64 hour,
        const astro::CivilDate& date,
        const astro::GeoCoordinate& coordinate = astro::kDefaultCoordinate);

    /// Colour of the period containing @p hour within a precomputed partition.
    static DaylightColor colorForHour(f64 hour,
                                      const std::vector<DaylightPeriod>& periods);

    /// Evenly spaced samples starting at 00:00 (segment i at hour 24*i/n).
    static std::vector<DaylightColor> gradient(
        const astro::CivilDate& date,
        const astro::GeoCoordinate& coordinate = astro::kDefaultCoordinate,
        int segments = kDefaultSegments);

private:
    static DaylightColor daylightColor(f64 progress);
    static DaylightColor boundaryColor(const DaylightPeriod& before, const DaylightPeriod& after);
};

} // namespace almanac::daylight
