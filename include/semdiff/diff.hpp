#pragma once

/**
 * @file diff.hpp
 * @brief Semantic comparison of two JSON trees
 *
 * Output order is deterministic: object fields and array identity keys are
 * visited in lexicographic order, positional array elements in index order.
 */

#include "semdiff/common.hpp"
#include "semdiff/config.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace semdiff {

/**
 * Kind of a difference
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class DiffKind {
    kAdded,    ///< Array element present only on the right
    kRemoved,  ///< Array element present only on the left
    kChanged   ///< Value differs (an absent side is recorded as null)
};

struct DiffEntry
{
    std::string path;
    DiffKind kind;
    std::optional<nlohmann::json> old_value;  ///< std::nullopt for kAdded
    std::optional<nlohmann::json> new_value;  ///< std::nullopt for kRemoved

    [[nodiscard]] bool operator==(const DiffEntry&) const = default;
};

/**
 * Compare two trees
 * @param left Tree before the change
 * @param right Tree after the change
 * @param config Rules for ignoring, equivalence and array pairing
 * @return Differences in deterministic order
 */
[[nodiscard]] std::vector<DiffEntry> compare(const nlohmann::json& left,
                                             const nlohmann::json& right,
                                             const Configuration& config);

/**
 * @brief Comparison facade bound to one configuration
 *
 * Example:
 *   semdiff::Differ differ(builder.build());
 *   auto diffs = differ.compare(before, after);
 */
class Differ
{
public:
    Differ() = default;
    explicit Differ(Configuration config);

    [[nodiscard]] std::vector<DiffEntry> compare(const nlohmann::json& left,
                                                 const nlohmann::json& right) const;

    /**
     * Parse both documents, then compare them
     * @return Differences, or ParseError when either side is not valid JSON
     */
    [[nodiscard]] semdiff::Result<std::vector<DiffEntry>> compare_text(std::string_view left,
                                                                       std::string_view right) const;

    [[nodiscard]] const Configuration& config() const noexcept { return m_config; }

private:
    Configuration m_config;
};

}  // namespace semdiff
