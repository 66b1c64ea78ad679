#pragma once

/**
 * @file report.hpp
 * @brief JSON and text renderings of a diff
 */

#include "semdiff/diff.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace semdiff::report {

/// Value of "schema_version" in every JSON report
inline constexpr std::string_view kReportSchemaVersion = "semdiff.report.v1";

struct Summary
{
    std::size_t added = 0;
    std::size_t removed = 0;
    std::size_t changed = 0;

    [[nodiscard]] std::size_t total() const noexcept { return added + removed + changed; }
};

/**
 * "ADDED", "REMOVED" or "CHANGED"
 */
[[nodiscard]] std::string_view to_string(DiffKind kind) noexcept;

[[nodiscard]] Summary summarize(const std::vector<DiffEntry>& entries);

/**
 * One change: {"path", "kind", "old"?, "new"?}
 */
[[nodiscard]] nlohmann::json to_json(const DiffEntry& entry);

/**
 * Full report, entries kept in engine order
 */
[[nodiscard]] nlohmann::json build_report(const std::vector<DiffEntry>& entries);

/**
 * One line per entry:
 *   ADDED /items/{3}: {"id":"3"}
 *   REMOVED /items/{1}: {"id":"1"}
 *   CHANGED /price: 10.0 -> 12.5
 */
[[nodiscard]] std::vector<std::string> render_text(const std::vector<DiffEntry>& entries);

}  // namespace semdiff::report
