// daylight/daylight_model.cpp
#include "daylight/daylight_model.hpp"

namespace almanac::daylight {

using astro::CalculationProfile;
using astro::SolarCalculator;

std::string_view daylightPhaseName(DaylightPhase phase) {
    switch (phase) {
        case DaylightPhase::Night:                       return "Night";
        case DaylightPhase::AstronomicalTwilight:        return "Astronomical Twilight";
        case DaylightPhase::NauticalTwilight:            return "Nautical Twilight";
        case DaylightPhase::CivilTwilight:               return "Civil Twilight";
        case DaylightPhase::Sunrise:                     return "Sunrise";
        case DaylightPhase::GoldenHour:                  return "Golden Hour";
        case DaylightPhase::Daylight:                    return "Daylight";
        case DaylightPhase::Sunset:                      return "Sunset";
        case DaylightPhase::GoldenHourEvening:           return "Golden Hour (Evening)";
        case DaylightPhase::CivilTwilightEvening:        return "Civil Twilight (Evening)";
        case DaylightPhase::NauticalTwilightEvening:     return "Nautical Twilight (Evening)";
        case DaylightPhase::AstronomicalTwilightEvening: return "Astronomical Twilight (Evening)";
        default:                                         return "Unknown";
    }
}

// -----------------------------------------------------------------------
// periodsForDay
// -----------------------------------------------------------------------
std::vector<DaylightPeriod> DaylightColorModel::periodsForDay(
    const astro::CivilDate& date,
    const astro::GeoCoordinate& coordinate) {
    // Approximate profile always yields a value in [5,9]
    const f64 rise = SolarCalculator::sunrise_hour(date, coordinate, CalculationProfile::Approximate).value_or(6.0);
    const f64 set  = 24.0 - rise;

    using P = DaylightPhase;
    namespace c = palette;

    return {
        {P::Night,                       0.0,        rise - 2.5, c::kNight},
        {P::AstronomicalTwilight,        rise - 2.5, rise - 2.0, c::kAstronomicalTwilight},
        {P::NauticalTwilight,            rise - 2.0, rise - 1.5, c::kNauticalTwilight},
        {P::CivilTwilight,               rise - 1.5, rise - 0.5, c::kCivilTwilight},
        {P::Sunrise,                     rise - 0.5, rise + 0.5, c::kSunrise},
        {P::GoldenHour,                  rise + 0.5, rise + 1.5, c::kGoldenHour},
        {P::Daylight,                    rise + 1.5, set - 1.5,  c::kDaylightRich},
        {P::GoldenHourEvening,           set - 1.5,  set - 0.5,  c::kGoldenHour},
        {P::Sunset,                      set - 0.5,  set + 0.5,  c::kSunrise},
        {P::CivilTwilightEvening,        set + 0.5,  set + 1.5,  c::kCivilTwilight},
        {P::NauticalTwilightEvening,     set + 1.5,  set + 2.0,  c::kNauticalTwilight},
        {P::AstronomicalTwilightEvening, set + 2.0,  set + 2.5,  c::kAstronomicalTwilight},
        {P::Night,                       set + 2.5,  24.0,       c::kNight},
    };
}

// -----------------------------------------------------------------------
// colorForHour
// -----------------------------------------------------------------------
DaylightColor DaylightColorModel::colorForHour(f64 hour,
                                               const astro::CivilDate& date,
                                               const astro::GeoCoordinate& coordinate) {
    return colorForHour(hour, periodsForDay(date, coordinate));
}

DaylightColor DaylightColorModel::colorForHour(f64 hour,
                                               const std::vector<DaylightPeriod>& periods) {
    for (std::size_t i = 0; i < periods.size(); ++i) {
        const DaylightPeriod& period = periods[i];
        if (!period.contains(hour)) continue;

        const f64 progress = (hour - period.start_hour) / period.duration();

        if (period.phase == DaylightPhase::Daylight) {
            return daylightColor(progress);
        }

        // Leading edge: fade in from the shared boundary colour (none before 00:00)
        if (progress < kBlendFraction && i > 0) {
            return DaylightColor::interpolate(boundaryColor(periods[i - 1], period), period.color,
                                              progress / kBlendFraction);
        }
        // Trailing edge: fade out toward the shared boundary colour (none after 24:00)
        if (progress > 1.0 - kBlendFraction && i + 1 < periods.size()) {
            return DaylightColor::interpolate(period.color, boundaryColor(period, periods[i + 1]),
                                              (progress - (1.0 - kBlendFraction)) / kBlendFraction);
        }
        return period.color;
    }

    return palette::kNight;
}

// Colour both neighbours reach at their common edge. Daylight does not
// cross-fade, so its edge colour is kept.
DaylightColor DaylightColorModel::boundaryColor(const DaylightPeriod& before,
                                                const DaylightPeriod& after) {
    if (before.phase == DaylightPhase::Daylight) return daylightColor(1.0);
    if (after.phase == DaylightPhase::Daylight) return daylightColor(0.0);
    return DaylightColor::interpolate(before.color, after.color, 0.5);
}

// Triangular blend: rich blue -> lighter blue at midday -> rich blue
DaylightColor DaylightColorModel::daylightColor(f64 progress) {
    constexpr f64 kMidPoint = 0.5;
    if (progress < kMidPoint) {
        return DaylightColor::interpolate(palette::kDaylightRich, palette::kDaylightPeak,
                                          progress / kMidPoint);
    }
    return DaylightColor::interpolate(palette::kDaylightPeak, palette::kDaylightRich,
                                      (progress - kMidPoint) / kMidPoint);
}

// -----------------------------------------------------------------------
// gradient
// -----------------------------------------------------------------------
std::vector<DaylightColor> DaylightColorModel::gradient(const astro::CivilDate& date,
                                                        const astro::GeoCoordinate& coordinate,
                                                        int segments) {
    std::vector<DaylightColor> colors;
    if (segments <= 0) return colors;

    // One partition for all samples
    const auto periods = periodsForDay(date, coordinate);
    colors.reserve(static_cast<std::size_t>(segments));
    for (int i = 0; i < segments; ++i) {
        const f64 hour = 24.0 * static_cast<f64>(i) / static_cast<f64>(segments);
        colors.push_back(colorForHour(hour, periods));
    }
    return colors;
}

} // namespace almanac::daylight
