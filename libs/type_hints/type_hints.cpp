/**
 * @file type_hints.cpp
 * @brief Map-backed type hints and JSON Schema inference
 */

#include "semdiff/type_hints.hpp"

#include "semdiff/pointer.hpp"

#include <format>
#include <limits>
#include <utility>

namespace semdiff {

namespace {

[[nodiscard]] semdiff::VoidResult validate_depth(int depth)
{
    if (depth < 0) {
        return std::unexpected(
            Error::make("InvalidDepth", std::format("depth cannot be negative: {}", depth)));
    }
    return {};
}

/**
 * Label of a leaf schema without a definition name
 */
[[nodiscard]] std::string leaf_label(const nlohmann::json& schema)
{
    if (auto it = schema.find("title"); it != schema.end() && it->is_string()) {
        return it->get<std::string>();
    }

    std::string type;
    if (auto it = schema.find("type"); it != schema.end()) {
        if (it->is_string()) {
            type = it->get<std::string>();
        } else if (it->is_array()) {
            for (const auto& entry : *it) {
                if (entry.is_string() && entry.get<std::string>() != "null") {
                    type = entry.get<std::string>();
                    break;
                }
            }
        }
    }
    if (type.empty()) {
        return type;
    }
    if (auto it = schema.find("format"); it != schema.end() && it->is_string()) {
        return type + ":" + it->get<std::string>();
    }
    return type;
}

/**
 * @brief Depth-limited walk over one schema document
 */
class SchemaWalker
{
public:
    SchemaWalker(const nlohmann::json& document, const InferenceDepth& depth)
        : m_document(document)
        , m_depth(depth)
    {}

    [[nodiscard]] semdiff::VoidResult walk(const nlohmann::json& schema,
                                           const std::string& path,
                                           const std::string& definition)
    {
        if (!schema.is_object()) {
            return {};
        }

        if (auto ref = schema.find("$ref"); ref != schema.end()) {
            return follow_reference(*ref, path);
        }

        bool expanded = false;
        if (auto all_of = schema.find("allOf"); all_of != schema.end() && all_of->is_array()) {
            for (const auto& part : *all_of) {
                if (auto result = walk(part, path, definition); !result) {
                    return result;
                }
            }
            expanded = true;
        }

        if (auto properties = schema.find("properties");
            properties != schema.end() && properties->is_object()) {
            for (const auto& [name, property] : properties->items()) {
                if (auto result = walk(property, pointer::child(path, name), ""); !result) {
                    return result;
                }
            }
            expanded = true;
        }

        if (auto items = schema.find("items"); items != schema.end()) {
            if (items->is_array()) {
                for (const auto& item : *items) {
                    if (auto result = walk(item, path, ""); !result) {
                        return result;
                    }
                }
            } else if (auto result = walk(*items, path, ""); !result) {
                return result;
            }
            expanded = true;
        }

        if (!expanded) {
            label(path, definition.empty() ? leaf_label(schema) : definition);
        }
        return {};
    }

    [[nodiscard]] std::map<std::string, std::string> take() { return std::move(m_hints); }

private:
    [[nodiscard]] semdiff::VoidResult follow_reference(const nlohmann::json& ref,
                                                       const std::string& path)
    {
        if (!ref.is_string()) {
            return std::unexpected(Error::make("InvalidSchema", "$ref must be a string"));
        }
        const auto& target = ref.get_ref<const std::string&>();
        if (target == "#") {
            return enter(target, m_document, leaf_label(m_document), path);
        }
        if (!target.starts_with("#/")) {
            return std::unexpected(
                Error::make("InvalidSchema", "Only local $ref targets are supported: " + target));
        }

        const nlohmann::json* definition = nullptr;
        try {
            definition = pointer::resolve(m_document,
                                          nlohmann::json::json_pointer(target.substr(1)));
        } catch (const nlohmann::json::exception& ex) {
            return std::unexpected(
                Error::make("InvalidSchema", "Malformed $ref " + target + ": " + ex.what()));
        }
        if (definition == nullptr) {
            return std::unexpected(Error::make("InvalidSchema", "Unresolvable $ref: " + target));
        }

        return enter(target,
                     *definition,
                     pointer::unescape(target.substr(target.rfind('/') + 1)),
                     path);
    }

    /**
     * Expand a referenced definition unless it is already active on the
     * stack more often than the depth limit of `path` allows
     */
    [[nodiscard]] semdiff::VoidResult enter(const std::string& target,
                                            const nlohmann::json& definition,
                                            const std::string& name,
                                            const std::string& path)
    {
        int& active = m_active[target];
        if (active > m_depth.max_depth_for(path)) {
            label(path, name);
            return {};
        }

        ++active;
        auto result = walk(definition, path, name);
        --active;
        return result;
    }

    void label(const std::string& path, const std::string& value)
    {
        if (!value.empty()) {
            m_hints.try_emplace(path, value);
        }
    }

    const nlohmann::json& m_document;
    const InferenceDepth& m_depth;
    std::map<std::string, int> m_active;
    std::map<std::string, std::string> m_hints;
};

}  // namespace

// ============================================================================
// MapTypeHints
// ============================================================================

MapTypeHints::MapTypeHints(std::map<std::string, std::string> hints)
    : m_hints(std::move(hints))
{}

std::optional<std::string> MapTypeHints::resolve(std::string_view pointer) const
{
    auto it = m_hints.find(std::string(pointer));
    if (it == m_hints.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// InferenceDepth
// ============================================================================

InferenceDepth InferenceDepth::stop_at_first_reference()
{
    InferenceDepth depth;
    depth.m_default_max_depth = 0;
    return depth;
}

InferenceDepth InferenceDepth::unlimited()
{
    InferenceDepth depth;
    depth.m_default_max_depth = std::numeric_limits<int>::max();
    return depth;
}

int InferenceDepth::max_depth_for(std::string_view path) const
{
    // Longest prefix first
    std::size_t best_length = 0;
    const int* best = nullptr;
    for (const auto& [prefix, depth] : m_prefix_depths) {
        if (pointer::matches_prefix(path, prefix)
            && (best == nullptr || prefix.size() > best_length)) {
            best_length = prefix.size();
            best = &depth;
        }
    }
    if (best != nullptr) {
        return *best;
    }

    const std::string target(path);
    for (const auto& [pattern, depth] : m_pattern_depths) {
        if (glob::full_match(pattern, target)) {
            return depth;
        }
    }
    return m_default_max_depth;
}

// ============================================================================
// InferenceDepthBuilder
// ============================================================================

semdiff::VoidResult InferenceDepthBuilder::default_max_depth(int depth)
{
    if (auto result = validate_depth(depth); !result) {
        return result;
    }
    m_depth.m_default_max_depth = depth;
    return {};
}

semdiff::VoidResult InferenceDepthBuilder::max_depth_for_prefix(std::string prefix, int depth)
{
    if (prefix.empty()) {
        return std::unexpected(Error::make("InvalidPath", "prefix cannot be empty"));
    }
    if (auto result = validate_depth(depth); !result) {
        return result;
    }
    m_depth.m_prefix_depths.insert_or_assign(pointer::normalize_prefix(prefix), depth);
    return {};
}

semdiff::VoidResult InferenceDepthBuilder::max_depth_for_pattern(glob::Pattern pattern, int depth)
{
    if (pattern == nullptr) {
        return std::unexpected(Error::make("InvalidPattern", "pattern cannot be null"));
    }
    if (auto result = validate_depth(depth); !result) {
        return result;
    }
    m_depth.m_pattern_depths.emplace_back(std::move(pattern), depth);
    return {};
}

InferenceDepth InferenceDepthBuilder::build() const
{
    return m_depth;
}

// ============================================================================
// Inference
// ============================================================================

semdiff::Result<MapTypeHints> infer_type_hints(const nlohmann::json& schema,
                                               const InferenceDepth& depth)
{
    if (!schema.is_object()) {
        return std::unexpected(Error::make("InvalidSchema", "schema must be a JSON object"));
    }

    SchemaWalker walker(schema, depth);
    if (auto result = walker.walk(schema, std::string(pointer::kRoot), ""); !result) {
        return std::unexpected(result.error());
    }
    return MapTypeHints(walker.take());
}

}  // namespace semdiff
