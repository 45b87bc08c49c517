#pragma once

/// @file time_system.hpp
/// @brief Calendar and time utilities: civil dates, day of year, Julian Date, time points.

#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Calendar day without a time zone.
    struct CivilDate
    {
        i32 year;
        i32 month;
        i32 day;

        friend bool operator==(const CivilDate&, const CivilDate&) = default;
    };

    /// @brief Civil date/time representation (UTC unless stated otherwise).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for calendar and time computations.
    ///
    /// Provides Julian Date conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// ordinal day numbers and conversions between Julian Dates and system-clock
    /// time points.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Date as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Gregorian leap-year rule.
        [[nodiscard]] static bool is_leap_year(i32 year);

        /// @brief Ordinal day of the year, 1 for January 1st (1..366).
        [[nodiscard]] static i32 day_of_year(const CivilDate& date);

        /// @brief Calendar day offset by a whole number of days (may be negative).
        [[nodiscard]] static CivilDate add_days(const CivilDate& date, i32 days);

        /// @brief Instant of 00:00 UTC on the given calendar day.
        [[nodiscard]] static Timestamp midnight_utc(const CivilDate& date);

        /// @brief Julian Date → system-clock time point.
        [[nodiscard]] static Timestamp to_timestamp(f64 jd);

        /// @brief System-clock time point → Julian Date.
        [[nodiscard]] static f64 to_julian_date(Timestamp ts);

        /// @brief Wall-clock date/time of an instant in a fixed UTC offset.
        /// @param ts Instant.
        /// @param utc_offset_hours Offset of the wall clock from UTC (east positive).
        [[nodiscard]] static DateTime to_local(Timestamp ts, f64 utc_offset_hours);

        /// @brief Get current system time as a Julian Date.
        [[nodiscard]] static f64 now_as_jd();

        /// @brief Today's calendar day in the given UTC offset.
        [[nodiscard]] static CivilDate today(f64 utc_offset_hours);
    };

} // namespace almanac::astro
