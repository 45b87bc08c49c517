/// @file solar_calculator.cpp
/// @brief Implementation of the solar rise/set and twilight calculator.

#include "astro/solar_calculator.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace almanac::astro
{

// -----------------------------------------------------------------
// Event table
// -----------------------------------------------------------------

std::string_view solar_event_name(SolarEvent event)
{
    switch (event)
    {
        case SolarEvent::Sunrise:                   return "Sunrise";
        case SolarEvent::Sunset:                    return "Sunset";
        case SolarEvent::CivilTwilightStart:        return "Civil Twilight Start";
        case SolarEvent::CivilTwilightEnd:          return "Civil Twilight End";
        case SolarEvent::NauticalTwilightStart:     return "Nautical Twilight Start";
        case SolarEvent::NauticalTwilightEnd:       return "Nautical Twilight End";
        case SolarEvent::AstronomicalTwilightStart: return "Astronomical Twilight Start";
        case SolarEvent::AstronomicalTwilightEnd:   return "Astronomical Twilight End";
    }
    return "Unknown";
}

f64 elevation_for_event(SolarEvent event)
{
    switch (event)
    {
        case SolarEvent::Sunrise:
        case SolarEvent::Sunset:
            return kSunriseElevationDeg;
        case SolarEvent::CivilTwilightStart:
        case SolarEvent::CivilTwilightEnd:
            return kCivilElevationDeg;
        case SolarEvent::NauticalTwilightStart:
        case SolarEvent::NauticalTwilightEnd:
            return kNauticalElevationDeg;
        case SolarEvent::AstronomicalTwilightStart:
        case SolarEvent::AstronomicalTwilightEnd:
            return kAstronomicalElevationDeg;
    }
    return kSunriseElevationDeg;
}

bool is_rising_event(SolarEvent event)
{
    switch (event)
    {
        case SolarEvent::Sunrise:
        case SolarEvent::CivilTwilightStart:
        case SolarEvent::NauticalTwilightStart:
        case SolarEvent::AstronomicalTwilightStart:
            return true;
        default:
            return false;
    }
}

// -----------------------------------------------------------------
// Declination and equation of time (Cooper / Spencer approximations)
// -----------------------------------------------------------------

namespace
{
    f64 day_angle(i32 day_of_year)
    {
        return astro_constants::kTwoPi * static_cast<f64>(day_of_year - 81) / 365.0;
    }
}

f64 SolarCalculator::solar_declination(i32 day_of_year)
{
    return glm::radians(23.45 * std::sin(day_angle(day_of_year)));
}

f64 SolarCalculator::equation_of_time_minutes(i32 day_of_year)
{
    const f64 b = day_angle(day_of_year);
    return 9.87 * std::sin(2.0 * b) - 7.53 * std::cos(b) - 1.5 * std::sin(b);
}

// -----------------------------------------------------------------
// Hour angle of an elevation crossing
//
// cos(HA) = (sin(h) − sin(φ) sin(δ)) / (cos(φ) cos(δ))
// -----------------------------------------------------------------

std::optional<f64> SolarCalculator::hour_angle_for_elevation(
    f64 latitude_deg,
    f64 declination_rad,
    f64 target_elevation_deg)
{
    const f64 lat = glm::radians(latitude_deg);
    const f64 elev = glm::radians(target_elevation_deg);

    const f64 denominator = std::cos(lat) * std::cos(declination_rad);
    if (denominator == 0.0)
    {
        // Exactly at a pole the sun circles at constant elevation
        return std::nullopt;
    }

    const f64 cos_ha = (std::sin(elev) - std::sin(lat) * std::sin(declination_rad)) / denominator;
    if (cos_ha < -1.0 || cos_ha > 1.0)
    {
        return std::nullopt;
    }

    return glm::degrees(std::acos(cos_ha));
}

std::optional<f64> SolarCalculator::time_for_elevation(
    f64 latitude_deg,
    f64 declination_rad,
    f64 elevation_deg,
    bool is_rising)
{
    const auto hour_angle = hour_angle_for_elevation(latitude_deg, declination_rad, elevation_deg);
    if (!hour_angle)
    {
        return std::nullopt;
    }

    const f64 delta_hours = *hour_angle / 15.0;
    return is_rising ? 12.0 - delta_hours : 12.0 + delta_hours;
}

// -----------------------------------------------------------------
// Absolute event instants
// -----------------------------------------------------------------

std::optional<Timestamp> SolarCalculator::event_time(
    const CivilDate& date,
    const GeoCoordinate& coordinate,
    f64 elevation_deg,
    bool is_rising)
{
    const i32 day = TimeSystem::day_of_year(date);
    const f64 declination = solar_declination(day);

    const auto solar_hour = time_for_elevation(coordinate.latitude_deg, declination, elevation_deg, is_rising);
    if (!solar_hour)
    {
        return std::nullopt;
    }

    // Apparent solar time → UTC: subtract the equation of time and the longitude offset
    const f64 utc_hour = *solar_hour
                       - equation_of_time_minutes(day) / 60.0
                       - coordinate.longitude_deg / 15.0;

    const auto offset = std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::duration<f64, std::ratio<3600>>(utc_hour));

    return TimeSystem::midnight_utc(date) + offset;
}

std::optional<Timestamp> SolarCalculator::event_time(
    const CivilDate& date,
    const GeoCoordinate& coordinate,
    SolarEvent event)
{
    return event_time(date, coordinate, elevation_for_event(event), is_rising_event(event));
}

// -----------------------------------------------------------------
// Legacy approximate sunrise (colour model fast path)
// -----------------------------------------------------------------

f64 SolarCalculator::sunrise_hour_approx(f64 latitude_deg, f64 declination_rad)
{
    const f64 lat = glm::radians(latitude_deg);

    // Clamp so polar inputs saturate instead of producing NaN
    const f64 cos_ha = std::clamp(-std::tan(lat) * std::tan(declination_rad), -1.0, 1.0);
    const f64 hour_angle_deg = glm::degrees(std::acos(cos_ha));

    const f64 sunrise = 12.0 - hour_angle_deg / 15.0;
    return std::clamp(sunrise, 5.0, 9.0);
}

std::optional<f64> SolarCalculator::sunrise_hour(
    const CivilDate& date,
    const GeoCoordinate& coordinate,
    CalculationProfile profile)
{
    const f64 declination = solar_declination(TimeSystem::day_of_year(date));

    switch (profile)
    {
        case CalculationProfile::Approximate:
            return sunrise_hour_approx(coordinate.latitude_deg, declination);
        case CalculationProfile::Precise:
            return time_for_elevation(coordinate.latitude_deg, declination, kSunriseElevationDeg, true);
    }
    return std::nullopt;
}

std::optional<f64> SolarCalculator::sunset_hour(
    const CivilDate& date,
    const GeoCoordinate& coordinate,
    CalculationProfile profile)
{
    const f64 declination = solar_declination(TimeSystem::day_of_year(date));

    switch (profile)
    {
        case CalculationProfile::Approximate:
            return 24.0 - sunrise_hour_approx(coordinate.latitude_deg, declination);
        case CalculationProfile::Precise:
            return time_for_elevation(coordinate.latitude_deg, declination, kSunriseElevationDeg, false);
    }
    return std::nullopt;
}

} // namespace almanac::astro
