/**
 * @file report.cpp
 * @brief JSON and text renderings of a diff
 */

#include "semdiff/report.hpp"

#include <format>

namespace semdiff::report {

namespace {

[[nodiscard]] std::string compact(const std::optional<nlohmann::json>& value)
{
    if (!value) {
        return "null";
    }
    return value->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

std::string_view to_string(DiffKind kind) noexcept
{
    switch (kind) {
        case DiffKind::kAdded:
            return "ADDED";
        case DiffKind::kRemoved:
            return "REMOVED";
        case DiffKind::kChanged:
            return "CHANGED";
    }
    return "CHANGED";
}

Summary summarize(const std::vector<DiffEntry>& entries)
{
    Summary summary;
    for (const auto& entry : entries) {
        switch (entry.kind) {
            case DiffKind::kAdded:
                ++summary.added;
                break;
            case DiffKind::kRemoved:
                ++summary.removed;
                break;
            case DiffKind::kChanged:
                ++summary.changed;
                break;
        }
    }
    return summary;
}

nlohmann::json to_json(const DiffEntry& entry)
{
    nlohmann::json change = {
        {"path", entry.path},
        {"kind", std::string(to_string(entry.kind))}
    };
    if (entry.old_value) {
        change["old"] = *entry.old_value;
    }
    if (entry.new_value) {
        change["new"] = *entry.new_value;
    }
    return change;
}

nlohmann::json build_report(const std::vector<DiffEntry>& entries)
{
    const Summary summary = summarize(entries);

    nlohmann::json changes = nlohmann::json::array();
    for (const auto& entry : entries) {
        changes.push_back(to_json(entry));
    }

    return nlohmann::json{
        {"schema_version", std::string(kReportSchemaVersion)},
        {"summary",
         {{"added", summary.added},
          {"removed", summary.removed},
          {"changed", summary.changed},
          {"total", summary.total()}}},
        {"changes", std::move(changes)}
    };
}

std::vector<std::string> render_text(const std::vector<DiffEntry>& entries)
{
    std::vector<std::string> lines;
    lines.reserve(entries.size());
    for (const auto& entry : entries) {
        switch (entry.kind) {
            case DiffKind::kAdded:
                lines.push_back(std::format("ADDED {}: {}", entry.path, compact(entry.new_value)));
                break;
            case DiffKind::kRemoved:
                lines.push_back(
                    std::format("REMOVED {}: {}", entry.path, compact(entry.old_value)));
                break;
            case DiffKind::kChanged:
                lines.push_back(std::format("CHANGED {}: {} -> {}",
                                            entry.path,
                                            compact(entry.old_value),
                                            compact(entry.new_value)));
                break;
        }
    }
    return lines;
}

}  // namespace semdiff::report
