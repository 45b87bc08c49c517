/// @file test_daylight_model.cpp
/// @brief Unit tests for almanac::daylight::DaylightColorModel.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "daylight/daylight_model.hpp"

#include <cmath>

using namespace almanac;
using namespace almanac::daylight;

namespace
{
    constexpr astro::CivilDate kEquinox{.year = 2023, .month = 3, .day = 22};
    constexpr astro::GeoCoordinate kEquator{.latitude_deg = 0.0, .longitude_deg = 0.0};

    bool same_color(const DaylightColor& a, const DaylightColor& b)
    {
        return std::abs(a.red - b.red) < 1e-9 && std::abs(a.green - b.green) < 1e-9
            && std::abs(a.blue - b.blue) < 1e-9 && std::abs(a.alpha - b.alpha) < 1e-9;
    }
}

// =================================================================
// Partition
// =================================================================

TEST_CASE("Partition has 13 contiguous periods covering the day")
{
    const astro::CivilDate dates[] = {
        {.year = 2024, .month = 1, .day = 15},
        {.year = 2024, .month = 3, .day = 20},
        {.year = 2024, .month = 6, .day = 21},
        {.year = 2024, .month = 12, .day = 21},
    };

    for (const auto& date : dates)
    {
        for (f64 lat = -60.0; lat <= 60.0; lat += 10.0)
        {
            const auto periods = DaylightColorModel::periodsForDay(date, {.latitude_deg = lat, .longitude_deg = 0.0});
            REQUIRE(periods.size() == DaylightColorModel::kPeriodCount);

            CHECK(periods.front().start_hour == doctest::Approx(0.0));
            CHECK(periods.back().end_hour == doctest::Approx(24.0));
            for (std::size_t i = 0; i < periods.size(); ++i)
            {
                CHECK(periods[i].duration() > 0.0);
                if (i > 0)
                {
                    CHECK(periods[i].start_hour == doctest::Approx(periods[i - 1].end_hour));
                }
            }
        }
    }
}

TEST_CASE("Phases appear in day order with night at both ends")
{
    const auto periods = DaylightColorModel::periodsForDay(kEquinox, kEquator);
    REQUIRE(periods.size() == 13);

    CHECK(periods[0].phase == DaylightPhase::Night);
    CHECK(periods[4].phase == DaylightPhase::Sunrise);
    CHECK(periods[6].phase == DaylightPhase::Daylight);
    CHECK(periods[7].phase == DaylightPhase::GoldenHourEvening);
    CHECK(periods[8].phase == DaylightPhase::Sunset);
    CHECK(periods[12].phase == DaylightPhase::Night);

    // Equator on the equinox: sunrise band centred on 06:00, sunset on 18:00
    CHECK(periods[4].start_hour == doctest::Approx(5.5));
    CHECK(periods[8].end_hour == doctest::Approx(18.5));
}

// =================================================================
// Colours
// =================================================================

TEST_CASE("Midnight and out-of-range hours are night")
{
    CHECK(same_color(DaylightColorModel::colorForHour(0.0, kEquinox, kEquator), palette::kNight));
    CHECK(same_color(DaylightColorModel::colorForHour(-1.0, kEquinox, kEquator), palette::kNight));
    CHECK(same_color(DaylightColorModel::colorForHour(24.0, kEquinox, kEquator), palette::kNight));
}

TEST_CASE("Period interiors use the period colour")
{
    const auto periods = DaylightColorModel::periodsForDay(kEquinox, kEquator);

    // Sunrise band 05:30-06:30, midpoint well outside both blend edges
    CHECK(same_color(DaylightColorModel::colorForHour(6.0, periods), palette::kSunrise));
    CHECK(same_color(DaylightColorModel::colorForHour(1.0, periods), palette::kNight));
}

TEST_CASE("Daylight peaks at midday and is rich blue at its edges")
{
    const auto periods = DaylightColorModel::periodsForDay(kEquinox, kEquator);
    const auto& daylight = periods[6];
    const f64 mid = (daylight.start_hour + daylight.end_hour) / 2.0;

    CHECK(same_color(DaylightColorModel::colorForHour(mid, periods), palette::kDaylightPeak));
    CHECK(same_color(DaylightColorModel::colorForHour(daylight.start_hour, periods), palette::kDaylightRich));
}

TEST_CASE("Leading edge blends from the previous period")
{
    const auto periods = DaylightColorModel::periodsForDay(kEquinox, kEquator);
    const auto& sunrise = periods[4];

    // 10% into the sunrise band: halfway from the shared edge colour to sunrise
    const f64 hour = sunrise.start_hour + 0.1 * sunrise.duration();
    const auto c = DaylightColorModel::colorForHour(hour, periods);
    const auto edge = DaylightColor::interpolate(palette::kCivilTwilight, palette::kSunrise, 0.5);
    const auto expected = DaylightColor::interpolate(edge, palette::kSunrise, 0.5);

    CHECK(same_color(c, expected));
    CHECK(c.red > palette::kCivilTwilight.red);
    CHECK(c.red < palette::kSunrise.red);
}

TEST_CASE("Colour is continuous across period boundaries")
{
    for (const auto& coord : {kEquator, astro::GeoCoordinate{.latitude_deg = 52.5, .longitude_deg = 13.4}})
    {
        const auto periods = DaylightColorModel::periodsForDay(kEquinox, coord);
        for (std::size_t i = 0; i + 1 < periods.size(); ++i)
        {
            const f64 edge = periods[i].end_hour;
            const auto left = DaylightColorModel::colorForHour(edge - 1e-7, periods);
            const auto right = DaylightColorModel::colorForHour(edge + 1e-7, periods);
            CAPTURE(i);
            CHECK(left.red == doctest::Approx(right.red).epsilon(1e-3));
            CHECK(left.green == doctest::Approx(right.green).epsilon(1e-3));
            CHECK(left.blue == doctest::Approx(right.blue).epsilon(1e-3));
        }
    }
}

TEST_CASE("Interpolation clamps its factor")
{
    const auto below = DaylightColor::interpolate(palette::kNight, palette::kSunrise, -0.5);
    const auto above = DaylightColor::interpolate(palette::kNight, palette::kSunrise, 1.5);
    CHECK(same_color(below, palette::kNight));
    CHECK(same_color(above, palette::kSunrise));
}

TEST_CASE("Gradient samples every 15 minutes from midnight")
{
    const auto samples = DaylightColorModel::gradient(kEquinox, kEquator);
    REQUIRE(samples.size() == 96);

    CHECK(same_color(samples[0], palette::kNight));
    // Sample 48 is 12:00, the middle of the daylight band
    CHECK(same_color(samples[48], palette::kDaylightPeak));
    for (const auto& c : samples)
    {
        CHECK_FALSE(std::isnan(c.red));
        CHECK(c.alpha == doctest::Approx(1.0));
    }

    CHECK(DaylightColorModel::gradient(kEquinox, kEquator, 0).empty());
}
