#pragma once

/**
 * @file glob.hpp
 * @brief Compiled path patterns (RE2) and the glob-to-regex compiler
 *
 * Glob grammar:
 *   **  any sequence of characters, including '/'
 *   *   any sequence of characters within one segment
 *   ?   exactly one character other than '/'
 * Every other character is matched literally.
 */

#include "semdiff/common.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace re2 {
class RE2;
}  // namespace re2

namespace semdiff::glob {

/**
 * @brief A compiled, immutable, shareable regular expression
 *
 * RE2 objects are thread-safe for matching, so one Pattern may be used
 * by any number of concurrent comparisons.
 */
using Pattern = std::shared_ptr<const re2::RE2>;

/**
 * Compile a regular expression (RE2 syntax)
 * @return Compiled pattern or InvalidPattern error
 */
[[nodiscard]] semdiff::Result<Pattern> compile_pattern(std::string_view regex);

/**
 * Translate a glob into an RE2 regular expression
 */
[[nodiscard]] std::string glob_to_regex(std::string_view glob);

/**
 * Compile a glob into a pattern
 */
[[nodiscard]] semdiff::Result<Pattern> compile_glob(std::string_view glob);

/**
 * Check whether a pattern matches the entire path
 */
[[nodiscard]] bool full_match(const Pattern& pattern, const std::string& path);

/**
 * Source text of a compiled pattern
 */
[[nodiscard]] std::string pattern_source(const Pattern& pattern);

}  // namespace semdiff::glob
