#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of rules files and reports
 *
 * Schemas live in one directory as "<name>.schema.json" and may refer to
 * each other through "semdiff:schema/<name>" URIs.
 */

#include "semdiff/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace semdiff::common {

/// Schema describing a rules file
inline constexpr std::string_view kRulesSchema = "rules";
/// Schema describing a JSON report
inline constexpr std::string_view kReportSchema = "report";

/**
 * Location of a named schema inside a schema directory
 */
[[nodiscard]] std::filesystem::path schema_file(const std::filesystem::path& schema_dir,
                                                std::string_view name);

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param document JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success; SchemaFileOpenFailed, SchemaParseFailed,
 *         SchemaBuildFailed or SchemaValidationFailed otherwise
 */
[[nodiscard]] semdiff::VoidResult validate_json(const nlohmann::json& document,
                                                const std::filesystem::path& schema_path);

/**
 * Validate JSON against the schema `name` found in `schema_dir`
 */
[[nodiscard]] semdiff::VoidResult validate_json(const nlohmann::json& document,
                                                const std::filesystem::path& schema_dir,
                                                std::string_view name);

}  // namespace semdiff::common
