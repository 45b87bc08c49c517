/// @file uuid.cpp
/// @brief libuuid wrapper.

#include "core/uuid.hpp"

#include <uuid/uuid.h>

namespace almanac::core
{

std::string generate_uuid()
{
    uuid_t raw;
    uuid_generate_random(raw);

    // 36 characters plus terminator
    char text[37];
    uuid_unparse_upper(raw, text);
    return std::string(text);
}

} // namespace almanac::core
