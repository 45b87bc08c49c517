#pragma once

/// @file solar_calculator.hpp
/// @brief Solar declination, equation of time and elevation-crossing times.

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace almanac::astro
{
    /// @brief Observer geographic location (degrees, east-positive longitude).
    struct GeoCoordinate
    {
        f64 latitude_deg;   ///< [-90, 90]
        f64 longitude_deg;  ///< [-180, 180]

        [[nodiscard]] bool is_valid() const
        {
            return latitude_deg >= -90.0 && latitude_deg <= 90.0
                && longitude_deg >= -180.0 && longitude_deg <= 180.0;
        }

        friend bool operator==(const GeoCoordinate&, const GeoCoordinate&) = default;
    };

    /// @brief New York City, used when a caller has no location of its own.
    inline constexpr GeoCoordinate kDefaultCoordinate{.latitude_deg = 40.7128, .longitude_deg = -74.0060};

    /// @brief Named solar elevation crossings.
    enum class SolarEvent
    {
        Sunrise,
        Sunset,
        CivilTwilightStart,
        CivilTwilightEnd,
        NauticalTwilightStart,
        NauticalTwilightEnd,
        AstronomicalTwilightStart,
        AstronomicalTwilightEnd,
    };

    /// @brief Which of the two daylight calculations a caller wants.
    ///
    /// `Approximate` is the clamped legacy estimate driving the colour bar;
    /// `Precise` solves the hour angle per coordinate and may be absent.
    enum class CalculationProfile
    {
        Approximate,
        Precise,
    };

    // Elevation thresholds (degrees)
    inline constexpr f64 kSunriseElevationDeg      = -0.83;   // refraction + solar radius
    inline constexpr f64 kCivilElevationDeg        = -6.0;
    inline constexpr f64 kNauticalElevationDeg     = -12.0;
    inline constexpr f64 kAstronomicalElevationDeg = -18.0;

    /// @brief Display name of a solar event ("Civil Twilight Start").
    [[nodiscard]] std::string_view solar_event_name(SolarEvent event);

    /// @brief Target elevation (degrees) for a named event.
    [[nodiscard]] f64 elevation_for_event(SolarEvent event);

    /// @brief True for the morning member of each event pair.
    [[nodiscard]] bool is_rising_event(SolarEvent event);

    /// @brief Static utility class for sun rise/set and twilight times.
    ///
    /// Everything here is a pure function of its arguments. When the sun never
    /// reaches the requested elevation (polar day or night) the result is
    /// std::nullopt; nothing is thrown and no default time is substituted.
    class SolarCalculator
    {
    public:
        SolarCalculator() = delete;

        /// @brief Solar declination (radians) for an ordinal day.
        ///
        /// δ = 23.45° × sin(2π (d − 81) / 365)
        [[nodiscard]] static f64 solar_declination(i32 day_of_year);

        /// @brief Equation of time (minutes, sundial minus mean clock).
        ///
        /// EoT = 9.87 sin 2B − 7.53 cos B − 1.5 sin B,  B = 2π (d − 81) / 365
        [[nodiscard]] static f64 equation_of_time_minutes(i32 day_of_year);

        /// @brief Hour angle (degrees) at which the sun crosses an elevation.
        /// @param latitude_deg Observer latitude.
        /// @param declination_rad Solar declination.
        /// @param target_elevation_deg Elevation to reach.
        /// @return Hour angle in [0, 180], or std::nullopt when unreachable.
        [[nodiscard]] static std::optional<f64> hour_angle_for_elevation(
            f64 latitude_deg,
            f64 declination_rad,
            f64 target_elevation_deg
        );

        /// @brief Local solar hour of the crossing (12 ∓ HA/15).
        [[nodiscard]] static std::optional<f64> time_for_elevation(
            f64 latitude_deg,
            f64 declination_rad,
            f64 elevation_deg,
            bool is_rising
        );

        /// @brief Absolute instant of an elevation crossing on a calendar day.
        ///
        /// Applies the equation of time and the longitude correction
        /// (longitude / 15 hours) to the solar hour and adds the result to
        /// 00:00 UTC of @p date.
        [[nodiscard]] static std::optional<Timestamp> event_time(
            const CivilDate& date,
            const GeoCoordinate& coordinate,
            f64 elevation_deg,
            bool is_rising
        );

        /// @brief Absolute instant of a named event (fixed elevation thresholds).
        [[nodiscard]] static std::optional<Timestamp> event_time(
            const CivilDate& date,
            const GeoCoordinate& coordinate,
            SolarEvent event
        );

        /// @brief Legacy fast sunrise estimate, clamped to [5, 9] hours.
        ///
        /// 12 − acos(−tan φ · tan δ) / 15. Ignores refraction, longitude and
        /// the equation of time. Only the colour model should use it.
        [[nodiscard]] static f64 sunrise_hour_approx(f64 latitude_deg, f64 declination_rad);

        /// @brief Sunrise hour under the chosen profile.
        ///
        /// Approximate: always present, local solar time, clamped.
        /// Precise: local solar time of the −0.83° crossing, or std::nullopt.
        [[nodiscard]] static std::optional<f64> sunrise_hour(
            const CivilDate& date,
            const GeoCoordinate& coordinate,
            CalculationProfile profile
        );

        /// @brief Sunset hour under the chosen profile (24 − sunrise for Approximate).
        [[nodiscard]] static std::optional<f64> sunset_hour(
            const CivilDate& date,
            const GeoCoordinate& coordinate,
            CalculationProfile profile
        );
    };

} // namespace almanac::astro
