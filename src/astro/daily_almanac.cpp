// astro/daily_almanac.cpp
#include "astro/daily_almanac.hpp"

#include <chrono>
#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace almanac::astro {

// -----------------------------------------------------------------------
// compute
// -----------------------------------------------------------------------
DailyAlmanac DailyAlmanac::compute(const CivilDate& date,
                                   const GeoCoordinate& coordinate,
                                   f64 utcOffsetHours) {
    DailyAlmanac almanac;
    almanac.date             = date;
    almanac.coordinate       = coordinate;
    almanac.utcOffsetHours = utcOffsetHours;

    static constexpr SolarEvent kAllEvents[] = {
        SolarEvent::Sunrise,
        SolarEvent::Sunset,
        SolarEvent::CivilTwilightStart,
        SolarEvent::CivilTwilightEnd,
        SolarEvent::NauticalTwilightStart,
        SolarEvent::NauticalTwilightEnd,
        SolarEvent::AstronomicalTwilightStart,
        SolarEvent::AstronomicalTwilightEnd,
    };
    for (SolarEvent e : kAllEvents) {
        almanac.events[static_cast<std::size_t>(e)] =
            SolarCalculator::event_time(date, coordinate, e);
    }

    const auto& sunrise = almanac.event(SolarEvent::Sunrise);
    const auto& sunset  = almanac.event(SolarEvent::Sunset);

    if (sunrise && sunset) {
        almanac.daylightHours = durationInHours(*sunrise, *sunset);
    }

    if (sunset) {
        // Polar transitions: no sunrise tomorrow collapses the night to zero
        const auto nextSunrise = SolarCalculator::event_time(
            TimeSystem::add_days(date, 1), coordinate, SolarEvent::Sunrise);
        almanac.nightHours = durationInHours(*sunset, nextSunrise.value_or(*sunset));
    }

    // Moon phase at local noon
    const auto localNoon = TimeSystem::midnight_utc(date)
        + std::chrono::duration_cast<Timestamp::duration>(
              std::chrono::duration<f64, std::ratio<3600>>(12.0 - utcOffsetHours));
    almanac.moonPhase = moonPhaseFraction(localNoon);

    return almanac;
}

std::string DailyAlmanac::formatEvent(SolarEvent e) const {
    return formatTime(event(e), utcOffsetHours);
}

// -----------------------------------------------------------------------
// Formatting
// -----------------------------------------------------------------------
std::string formatTime(const std::optional<Timestamp>& ts, f64 utcOffsetHours) {
    if (!ts) return "N/A";
    const DateTime local = TimeSystem::to_local(*ts, utcOffsetHours);
    return fmt::format("{:02d}:{:02d}", local.hour, local.minute);
}

std::string formatDuration(const std::optional<f64>& hours) {
    if (!hours) return "N/A";
    const auto totalMinutes = static_cast<i64>(std::llround(*hours * 60.0));
    return fmt::format("{}h {}m", totalMinutes / 60, totalMinutes % 60);
}

f64 durationInHours(Timestamp from, Timestamp to) {
    return std::chrono::duration<f64, std::ratio<3600>>(to - from).count();
}

// -----------------------------------------------------------------------
// Moon phase (mean synodic cycle from a known new moon)
// -----------------------------------------------------------------------
f64 moonPhaseFraction(Timestamp ts) {
    const f64 days = TimeSystem::to_julian_date(ts)
                   - TimeSystem::to_julian_date(kReferenceNewMoon);
    f64 position = std::fmod(days, kSynodicMonthDays);
    if (position < 0.0) position += kSynodicMonthDays;
    return position / kSynodicMonthDays;
}

std::string_view moonPhaseName(f64 phaseFraction) {
    static constexpr std::string_view kNames[] = {
        "New Moon",
        "Waxing Crescent",
        "First Quarter",
        "Waxing Gibbous",
        "Full Moon",
        "Waning Gibbous",
        "Last Quarter",
        "Waning Crescent",
    };
    const auto index = static_cast<int>(std::floor(phaseFraction * 8.0 + 0.5)) % 8;
    return kNames[index < 0 ? index + 8 : index];
}

} // namespace almanac::astro
