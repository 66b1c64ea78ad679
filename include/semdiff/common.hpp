#pragma once

/**
 * @file common.hpp
 * @brief Common types: error reporting and JSON text helpers
 */

#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace semdiff {

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

}  // namespace semdiff

namespace semdiff::common {

/**
 * Textual form of a JSON value.
 * - Strings are returned without quotes
 * - Booleans, numbers and null as printed by nlohmann::json::dump()
 * - Containers as their compact dump
 */
[[nodiscard]] std::string as_text(const nlohmann::json& value);

/**
 * Check whether a string contains only whitespace (or nothing at all)
 */
[[nodiscard]] bool is_blank(std::string_view value);

}  // namespace semdiff::common
