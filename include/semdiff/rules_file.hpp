#pragma once

/**
 * @file rules_file.hpp
 * @brief Loading a comparison configuration from a JSON rules file
 *
 * Example rules file:
 *   {
 *     "root": "/",
 *     "lists": {"/items": "id", "/tags": null},
 *     "ignore": {"prefixes": ["/meta"], "globs": ["/audit/**"]},
 *     "equivalences": [
 *       {"at": "/price", "predicate": "numeric_within", "epsilon": 0.01},
 *       {"fallback": true, "predicate": "case_insensitive"}
 *     ],
 *     "type_hints": {"/price": "Money"}
 *   }
 *
 * The document is validated against "rules.schema.json" before it is
 * interpreted. The result is a builder, so callers may add registrations
 * of their own before calling build().
 */

#include "semdiff/common.hpp"
#include "semdiff/config.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace semdiff {

/**
 * Interpret a rules document
 * @param document Parsed rules file
 * @param schema_dir Directory holding rules.schema.json
 * @return Populated builder, or the first schema, rule or registration error
 */
[[nodiscard]] semdiff::Result<ConfigurationBuilder>
load_rules(const nlohmann::json& document, const std::filesystem::path& schema_dir);

/**
 * Read, validate and interpret a rules file
 */
[[nodiscard]] semdiff::Result<ConfigurationBuilder>
load_rules_file(const std::filesystem::path& path, const std::filesystem::path& schema_dir);

}  // namespace semdiff
