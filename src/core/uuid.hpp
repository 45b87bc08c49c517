#pragma once

/// @file uuid.hpp
/// @brief Random identifier generation (libuuid).

#include <string>

namespace almanac::core
{
    /// @brief Generate a random (version 4) UUID in upper-case canonical form.
    [[nodiscard]] std::string generate_uuid();

} // namespace almanac::core
