#pragma once

/**
 * @file pointer.hpp
 * @brief JSON Pointer (RFC 6901) path utilities
 *
 * Paths produced by the diff engine are JSON Pointers rooted at the
 * configured root path. Array elements are addressed either by position
 * ("/items/0") or by identity ("/items/{key}"). Rule lookups that must
 * apply to every instance of an array shape use the normalized form,
 * in which both kinds of element segments are dropped.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace semdiff::pointer {

/// Root of every pointer
inline constexpr std::string_view kRoot = "/";

/**
 * Escape a raw segment: '~' becomes "~0" and '/' becomes "~1"
 */
[[nodiscard]] std::string escape(std::string_view raw);

/**
 * Reverse of escape(). Unknown escape sequences are kept verbatim.
 */
[[nodiscard]] std::string unescape(std::string_view segment);

/**
 * Append an escaped segment to a base pointer
 * @param base Base pointer ("/" or "/a/b")
 * @param key Raw (unescaped) segment
 */
[[nodiscard]] std::string child(std::string_view base, std::string_view key);

/**
 * Append an array position to a base pointer
 */
[[nodiscard]] std::string child(std::string_view base, std::size_t index);

/**
 * Split a pointer into its raw (still escaped) segments. Empty segments
 * are dropped, so "/" yields no segments.
 */
[[nodiscard]] std::vector<std::string> split(std::string_view path);

/**
 * Ensure a prefix ends with '/'
 */
[[nodiscard]] std::string normalize_prefix(std::string_view prefix);

/**
 * Check a path against a prefix produced by normalize_prefix().
 * "/meta/" matches "/meta" and "/meta/x" but not "/metadata".
 */
[[nodiscard]] bool matches_prefix(std::string_view path, std::string_view normalized_prefix);

/**
 * Normalize a path for rule lookup by removing array positions
 * and identity segments.
 *
 * Examples:
 *   /items/0/name       -> /items/name
 *   /items/{a1}/name    -> /items/name
 *   /matrix/0/1/data    -> /matrix/data
 *   /0                  -> /
 *
 * An empty input yields "/".
 */
[[nodiscard]] std::string normalize_for_rules(std::string_view path);

/**
 * True for a segment made only of decimal digits
 */
[[nodiscard]] bool is_index_segment(std::string_view segment);

/**
 * True for a synthetic identity segment ("{...}")
 */
[[nodiscard]] bool is_identity_segment(std::string_view segment);

/**
 * Resolve a pointer inside a node
 * @return Pointer to the addressed node, nullptr when it does not exist
 */
[[nodiscard]] const nlohmann::json* resolve(const nlohmann::json& node,
                                            const nlohmann::json::json_pointer& target);

}  // namespace semdiff::pointer
