#pragma once
// astro/daily_almanac.hpp - One day's sun and moon summary ("Daily Progression")
//
// Collects the eight solar events, daylight and night durations and the
// moon phase for one observer and calendar day.

#include "astro/solar_calculator.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace almanac::astro {

/// Synodic month length [days].
inline constexpr f64 kSynodicMonthDays = 29.530588;

/// Reference new moon: 2000-01-06 18:14 UTC.
inline constexpr DateTime kReferenceNewMoon{
    .year = 2000, .month = 1, .day = 6, .hour = 18, .minute = 14, .second = 0.0,
};

// -----------------------------------------------------------------------
// DailyAlmanac
// -----------------------------------------------------------------------
struct DailyAlmanac {
    CivilDate     date{};
    GeoCoordinate coordinate{};
    f64           utcOffsetHours{0.0};

    /// Indexed by static_cast<size_t>(SolarEvent).
    std::array<std::optional<Timestamp>, 8> events{};

    std::optional<f64> daylightHours;  ///< Sunrise → sunset
    std::optional<f64> nightHours;     ///< Sunset → next sunrise
    f64                moonPhase{0.0}; ///< Fraction of the synodic cycle [0, 1)

    /// Compute every event and duration for one calendar day.
    static DailyAlmanac compute(const CivilDate& date,
                                const GeoCoordinate& coordinate,
                                f64 utcOffsetHours);

    const std::optional<Timestamp>& event(SolarEvent e) const {
        return events[static_cast<std::size_t>(e)];
    }

    /// Wall-clock "HH:MM" in this almanac's UTC offset, or "N/A".
    std::string formatEvent(SolarEvent e) const;
};

/// "HH:MM" for an instant in a fixed UTC offset; "N/A" when absent.
std::string formatTime(const std::optional<Timestamp>& ts, f64 utcOffsetHours);

/// "Xh Ym" for a duration in hours; "N/A" when absent.
std::string formatDuration(const std::optional<f64>& hours);

/// Hours between two instants (negative when @p to precedes @p from).
f64 durationInHours(Timestamp from, Timestamp to);

/// Fraction of the lunar cycle at an instant, 0 = new moon, 0.5 = full.
f64 moonPhaseFraction(Timestamp ts);

/// Human-readable phase ("Waxing Crescent", "Full Moon", ...).
std::string_view moonPhaseName(f64 phaseFraction);

} // namespace almanac::astro
