#pragma once

/**
 * @file equivalence.hpp
 * @brief Equivalence predicates: values that compare equal despite literal inequality
 *
 * A predicate receives both sides of a comparison. A side is nullptr when
 * the value is absent (missing object field, array element past the end,
 * identity key not present on that side). The JSON value null is passed
 * as a pointer to a null node.
 *
 * Built-in predicates never throw: values they cannot interpret (wrong
 * type, unparsable timestamp) are reported as "not equivalent".
 */

#include <chrono>
#include <functional>

#include <nlohmann/json.hpp>

namespace semdiff {

using Equivalence = std::function<bool(const nlohmann::json* left, const nlohmann::json* right)>;

}  // namespace semdiff

namespace semdiff::equivalence {

/**
 * Truncation unit for zoned_date_time_truncated_to()
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class TimeUnit {
    kMillis,
    kSeconds,
    kMinutes,
    kHours,
    kDays
};

/**
 * Numbers within an absolute tolerance: |left - right| <= epsilon
 */
[[nodiscard]] Equivalence numeric_within(double epsilon);

/**
 * Textual forms equal ignoring ASCII case
 */
[[nodiscard]] Equivalence case_insensitive();

/**
 * Strings equal after punctuation is treated as whitespace.
 * "hello, world?" is equivalent to "hello world!".
 */
[[nodiscard]] Equivalence punctuation_insensitive();

/**
 * ISO-8601 instants ("2024-01-01T12:00:00.5Z") within a tolerance
 */
[[nodiscard]] Equivalence instant_within(std::chrono::milliseconds tolerance);

/**
 * ISO-8601 date-times with explicit offset ("2024-01-01T12:00:00+02:00")
 * within a tolerance, compared on the UTC time line
 */
[[nodiscard]] Equivalence offset_date_time_within(std::chrono::milliseconds tolerance);

/**
 * ISO-8601 zoned date-times ("2024-01-01T12:00:00.123Z[UTC]") equal after
 * truncating the local date-time to the given unit. Offset and zone must match.
 */
[[nodiscard]] Equivalence zoned_date_time_truncated_to(TimeUnit unit);

}  // namespace semdiff::equivalence
