/// @file time_system.cpp
/// @brief Implementation of calendar and time utilities.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <chrono>
#include <cmath>

namespace almanac::astro
{

// -----------------------------------------------------------------
// Julian Date: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    // Day fraction from hours, minutes, seconds
    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    const f64 jd = std::floor(365.25 * static_cast<f64>(y + 4716))
                 + std::floor(30.6001 * static_cast<f64>(m + 1))
                 + static_cast<f64>(dt.day)
                 + day_fraction
                 + static_cast<f64>(b)
                 - 1524.5;

    return jd;
}

// -----------------------------------------------------------------
// Julian Date → civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor(
        (static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(
        365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(
        static_cast<f64>(b - d) / 30.6001));

    // Day (with fractional part)
    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    // Time from day fraction
    const f64 hours_total = day_frac * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));

    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    const f64 second = (minutes_total - static_cast<f64>(minute)) * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

// -----------------------------------------------------------------
// Ordinal days
// -----------------------------------------------------------------

bool TimeSystem::is_leap_year(i32 year)
{
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

i32 TimeSystem::day_of_year(const CivilDate& date)
{
    static constexpr i32 kDaysBeforeMonth[12] = {
        0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334,
    };

    const i32 month_index = date.month - 1;
    i32 ordinal = kDaysBeforeMonth[month_index] + date.day;
    if (date.month > 2 && is_leap_year(date.year))
    {
        ++ordinal;
    }
    return ordinal;
}

CivilDate TimeSystem::add_days(const CivilDate& date, i32 days)
{
    // Work at noon so the day fraction never rounds across a boundary
    const f64 jd = to_julian_date(DateTime{
        .year   = date.year,
        .month  = date.month,
        .day    = date.day,
        .hour   = 12,
        .minute = 0,
        .second = 0.0,
    }) + static_cast<f64>(days);

    const DateTime shifted = from_julian_date(jd);
    return CivilDate{.year = shifted.year, .month = shifted.month, .day = shifted.day};
}

// -----------------------------------------------------------------
// Julian Date ↔ system clock
// -----------------------------------------------------------------

Timestamp TimeSystem::midnight_utc(const CivilDate& date)
{
    return to_timestamp(to_julian_date(DateTime{
        .year   = date.year,
        .month  = date.month,
        .day    = date.day,
        .hour   = 0,
        .minute = 0,
        .second = 0.0,
    }));
}

Timestamp TimeSystem::to_timestamp(f64 jd)
{
    using namespace std::chrono;

    const f64 seconds = (jd - astro_constants::kUnixEpochJd) * astro_constants::kSecondsPerDay;

    // Millisecond resolution is ample for rise/set times and cache stamps
    const auto millis = static_cast<i64>(std::llround(seconds * 1000.0));
    return Timestamp{duration_cast<system_clock::duration>(milliseconds(millis))};
}

f64 TimeSystem::to_julian_date(Timestamp ts)
{
    using namespace std::chrono;

    const auto since_epoch = duration_cast<duration<f64>>(ts.time_since_epoch()).count();
    return astro_constants::kUnixEpochJd + since_epoch / astro_constants::kSecondsPerDay;
}

DateTime TimeSystem::to_local(Timestamp ts, f64 utc_offset_hours)
{
    using namespace std::chrono;

    // Whole seconds avoid 05:59:59.999 style artefacts of the floating JD path
    const i64 offset_s = static_cast<i64>(std::llround(utc_offset_hours * 3600.0));
    const i64 total_s = duration_cast<seconds>(ts.time_since_epoch()).count() + offset_s;

    const i64 seconds_per_day = static_cast<i64>(astro_constants::kSecondsPerDay);
    i64 days = total_s / seconds_per_day;
    i64 rem = total_s % seconds_per_day;
    if (rem < 0)
    {
        rem += seconds_per_day;
        --days;
    }

    const CivilDate date = add_days(CivilDate{.year = 1970, .month = 1, .day = 1},
                                    static_cast<i32>(days));

    return DateTime{
        .year   = date.year,
        .month  = date.month,
        .day    = date.day,
        .hour   = static_cast<i32>(rem / 3600),
        .minute = static_cast<i32>((rem % 3600) / 60),
        .second = static_cast<f64>(rem % 60),
    };
}

// -----------------------------------------------------------------
// Current system time
// -----------------------------------------------------------------

f64 TimeSystem::now_as_jd()
{
    return to_julian_date(std::chrono::system_clock::now());
}

CivilDate TimeSystem::today(f64 utc_offset_hours)
{
    const DateTime local = to_local(std::chrono::system_clock::now(), utc_offset_hours);
    return CivilDate{.year = local.year, .month = local.month, .day = local.day};
}

} // namespace almanac::astro
