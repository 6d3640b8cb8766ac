#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error/result types, timestamps
 */

#include <expected>
#include <string>
#include <utility>

namespace depimpact {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace depimpact

namespace depimpact::common {

/**
 * Current wall-clock time as an RFC 3339 UTC timestamp, second precision
 * (e.g. "2024-01-01T00:00:00Z").
 */
[[nodiscard]] std::string current_time_utc();

}  // namespace depimpact::common
