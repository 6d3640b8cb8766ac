/**
 * @file time.cpp
 * @brief UTC timestamps for generated documents
 */

#include "depimpact/common.hpp"

#include <chrono>
#include <format>

namespace depimpact::common {

std::string current_time_utc()
{
    const auto now = std::chrono::system_clock::now();
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(now));
}

}  // namespace depimpact::common
