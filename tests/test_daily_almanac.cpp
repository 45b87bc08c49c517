/// @file test_daily_almanac.cpp
/// @brief Unit tests for almanac::astro::DailyAlmanac and its formatting helpers.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/daily_almanac.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <chrono>

using namespace almanac;
using namespace almanac::astro;

namespace
{
    constexpr CivilDate kMidsummer{.year = 2024, .month = 6, .day = 20};
    constexpr CivilDate kMidwinter{.year = 2024, .month = 12, .day = 21};
    constexpr GeoCoordinate kHighArctic{.latitude_deg = 85.0, .longitude_deg = 15.0};
}

// =================================================================
// Formatting helpers
// =================================================================

TEST_CASE("formatTime renders HH:MM in the requested offset")
{
    using namespace std::chrono;
    const Timestamp ts = TimeSystem::midnight_utc({.year = 2024, .month = 1, .day = 1}) + hours(13) + minutes(30);

    CHECK(formatTime(ts, 0.0) == "13:30");
    CHECK(formatTime(ts, -5.0) == "08:30");
    CHECK(formatTime(ts, 11.0) == "00:30");
}

TEST_CASE("Absent values render as N/A")
{
    CHECK(formatTime(std::nullopt, 0.0) == "N/A");
    CHECK(formatDuration(std::nullopt) == "N/A");
}

TEST_CASE("formatDuration rounds to whole minutes")
{
    CHECK(formatDuration(1.5) == "1h 30m");
    CHECK(formatDuration(0.0) == "0h 0m");
    CHECK(formatDuration(15.0 + 5.0 / 60.0) == "15h 5m");
}

// =================================================================
// Daily progression
// =================================================================

TEST_CASE("Midsummer in New York has every event and a long day")
{
    const auto day = DailyAlmanac::compute(kMidsummer, kDefaultCoordinate, -4.0);

    for (const auto& e : day.events)
    {
        CHECK(e.has_value());
    }

    const DateTime sunrise = TimeSystem::to_local(*day.event(SolarEvent::Sunrise), -4.0);
    CHECK(sunrise.hour == 5);

    REQUIRE(day.daylightHours.has_value());
    CHECK(*day.daylightHours > 14.9);
    CHECK(*day.daylightHours < 15.3);

    REQUIRE(day.nightHours.has_value());
    CHECK(*day.nightHours == doctest::Approx(24.0 - *day.daylightHours).epsilon(0.01));

    CHECK(day.formatEvent(SolarEvent::Sunrise).substr(0, 2) == "05");
}

TEST_CASE("Polar night yields N/A events and no durations")
{
    const auto day = DailyAlmanac::compute(kMidwinter, kHighArctic, 1.0);

    CHECK_FALSE(day.event(SolarEvent::Sunrise).has_value());
    CHECK_FALSE(day.event(SolarEvent::Sunset).has_value());
    CHECK(day.formatEvent(SolarEvent::Sunrise) == "N/A");
    CHECK_FALSE(day.daylightHours.has_value());
    CHECK_FALSE(day.nightHours.has_value());
}

TEST_CASE("Polar day has no sunset and therefore no night length")
{
    const auto day = DailyAlmanac::compute(kMidsummer, kHighArctic, 1.0);

    CHECK_FALSE(day.event(SolarEvent::Sunset).has_value());
    CHECK(day.formatEvent(SolarEvent::Sunset) == "N/A");
    CHECK_FALSE(day.nightHours.has_value());
}

// =================================================================
// Moon phase
// =================================================================

TEST_CASE("Moon phase is new at the reference epoch and full half a cycle later")
{
    using namespace std::chrono;

    const Timestamp reference = TimeSystem::to_timestamp(TimeSystem::to_julian_date(kReferenceNewMoon));

    const f64 just_after = moonPhaseFraction(reference + hours(1));
    CHECK(just_after == doctest::Approx(1.0 / 24.0 / kSynodicMonthDays).epsilon(1e-4));
    CHECK(moonPhaseName(just_after) == "New Moon");

    const auto half_cycle = duration_cast<Timestamp::duration>(
        duration<f64, std::ratio<86400>>(kSynodicMonthDays / 2.0));
    const f64 full = moonPhaseFraction(reference + half_cycle);
    CHECK(full == doctest::Approx(0.5).epsilon(1e-4));
    CHECK(moonPhaseName(full) == "Full Moon");

    // Dates before the reference wrap into [0, 1)
    const f64 before = moonPhaseFraction(reference - hours(24));
    CHECK(before > 0.9);
    CHECK(before < 1.0);
}

TEST_CASE("Moon phase names cover the cycle in eighths")
{
    CHECK(moonPhaseName(0.0) == "New Moon");
    CHECK(moonPhaseName(0.125) == "Waxing Crescent");
    CHECK(moonPhaseName(0.25) == "First Quarter");
    CHECK(moonPhaseName(0.75) == "Last Quarter");
    CHECK(moonPhaseName(0.97) == "New Moon");
}
