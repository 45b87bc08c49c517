#pragma once
// daylight/daylight_color.hpp - RGBA colour value and daylight palette
//
// Channels red/green/blue are on a 0-255 scale, alpha on 0-1, matching the
// values the visualisation layer expects.

#include "core/types.hpp"

#include <glm/common.hpp>

namespace almanac::daylight {

// -----------------------------------------------------------------------
// DaylightColor
// -----------------------------------------------------------------------
struct DaylightColor {
    f64 red{0.0};
    f64 green{0.0};
    f64 blue{0.0};
    f64 alpha{1.0};

    Vec4d toVec() const { return {red, green, blue, alpha}; }

    static DaylightColor fromVec(const Vec4d& v) {
        return {v.r, v.g, v.b, v.a};
    }

    /// Per-channel linear interpolation, factor clamped to [0,1].
    static DaylightColor interpolate(const DaylightColor& from,
                                     const DaylightColor& to,
                                     f64 factor) {
        const f64 t = glm::clamp(factor, 0.0, 1.0);
        return fromVec(glm::mix(from.toVec(), to.toVec(), t));
    }

    friend bool operator==(const DaylightColor&, const DaylightColor&) = default;
};

// -----------------------------------------------------------------------
// Palette
// -----------------------------------------------------------------------
namespace palette {
    inline constexpr DaylightColor kNight                {  0,   0,   0, 1.0};
    inline constexpr DaylightColor kAstronomicalTwilight { 10,   0,  20, 1.0};  // very dark purple
    inline constexpr DaylightColor kNauticalTwilight     { 20,   0,  40, 1.0};  // dark purple
    inline constexpr DaylightColor kCivilTwilight        { 40,  20,  80, 1.0};  // purple-blue
    inline constexpr DaylightColor kSunrise              {255, 100,  50, 1.0};  // red-orange
    inline constexpr DaylightColor kGoldenHour           {255, 200, 100, 1.0};
    inline constexpr DaylightColor kDaylightLight        {135, 206, 250, 1.0};
    inline constexpr DaylightColor kDaylightRich         { 25,  25, 112, 1.0};
    inline constexpr DaylightColor kDaylightPeak         {100, 180, 255, 1.0};  // midday highlight
} // namespace palette

} // namespace almanac::daylight
