#pragma once

/**
 * @file timestamp.hpp
 * @brief ISO-8601 date-time parsing for the time-based equivalences
 */

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace semdiff::equivalence::detail {

struct Timestamp
{
    /// Wall-clock date-time as written, before applying the offset
    std::chrono::sys_time<std::chrono::nanoseconds> local;
    std::chrono::minutes offset;
    /// Bracketed region id ("UTC", "Europe/Paris"), empty when absent
    std::string zone_id;

    [[nodiscard]] std::chrono::sys_time<std::chrono::nanoseconds> instant() const
    {
        return local - offset;
    }

    /// Zone identity: the bracketed id when present, otherwise the offset
    [[nodiscard]] std::string zone() const;
};

/**
 * Parse "YYYY-MM-DDTHH:MM[:SS[.fraction]](Z|+HH:MM|-HH:MM)[[zone]]"
 * @return std::nullopt on any syntax or range error
 */
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

}  // namespace semdiff::equivalence::detail
