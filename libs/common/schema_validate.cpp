/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "semdiff/schema_validate.hpp"

#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace semdiff::common {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kSchemaUriPrefix = "semdiff:schema/";
constexpr std::string_view kDefsPointer = "#/$defs/";
constexpr std::string_view kDefinitionsPointer = "#/definitions/";

/**
 * valijson resolves "#/definitions/..." only, so "$defs" is mirrored there
 * and every local reference is rewritten accordingly.
 */
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }

    if (auto defs = schema.find("$defs"); defs != schema.end() && !schema.contains("definitions")) {
        schema["definitions"] = *defs;
    }
    for (auto it = schema.begin(); it != schema.end(); ++it) {
        if (it.key() != "$ref") {
            rewrite_defs(it.value());
            continue;
        }
        if (it->is_string()) {
            const auto& ref = it->get_ref<const std::string&>();
            if (ref.starts_with(kDefsPointer)) {
                *it = std::string(kDefinitionsPointer) + ref.substr(kDefsPointer.size());
            }
        }
    }
}

[[nodiscard]] std::optional<nlohmann::json> try_read_schema(const fs::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    try {
        auto schema = nlohmann::json::parse(in);
        rewrite_defs(schema);
        return schema;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string where;
        for (const auto& part : error.context) {
            where += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", where.empty() ? "/" : where, error.description);
    }
    return text;
}

}  // namespace

fs::path schema_file(const fs::path& schema_dir, std::string_view name)
{
    return schema_dir / std::format("{}.schema.json", name);
}

semdiff::VoidResult validate_json(const nlohmann::json& document, const fs::path& schema_path)
{
    std::ifstream schema_stream(schema_path);
    if (!schema_stream) {
        return std::unexpected(Error::make("SchemaFileOpenFailed",
                                           "Failed to open schema file: " + schema_path.string()));
    }

    nlohmann::json schema_json;
    try {
        schema_json = nlohmann::json::parse(schema_stream);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed", std::string("Failed to parse schema JSON: ") + ex.what()));
    }
    rewrite_defs(schema_json);

    // Documents fetched through "semdiff:schema/<name>" stay alive until validation ends
    const fs::path schema_dir = schema_path.parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> fetched;
    const auto fetch_doc = [&schema_dir, &fetched](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto schema = try_read_schema(schema_file(schema_dir, uri.substr(kSchemaUriPrefix.size())));
        if (!schema) {
            return nullptr;
        }
        fetched.push_back(std::make_unique<nlohmann::json>(std::move(*schema)));
        return fetched.back().get();
    };
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(document);
    if (!validator.validate(schema, target_adapter, &results)) {
        std::string message = describe_errors(results);
        if (message.empty()) {
            message = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(message)));
    }
    return {};
}

semdiff::VoidResult validate_json(const nlohmann::json& document,
                                  const fs::path& schema_dir,
                                  std::string_view name)
{
    return validate_json(document, schema_file(schema_dir, name));
}

}  // namespace semdiff::common
