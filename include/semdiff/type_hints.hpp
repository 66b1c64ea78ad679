#pragma once

/**
 * @file type_hints.hpp
 * @brief Type labels for normalized paths, and their inference from JSON Schema
 *
 * Type labels select equivalence predicates registered with
 * ConfigurationBuilder::equivalent_for_type(). A label is attached to a
 * normalized path ("/items/price", never "/items/0/price").
 */

#include "semdiff/common.hpp"
#include "semdiff/glob.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace semdiff {

/**
 * @brief Source of type labels keyed by normalized path
 */
class TypeHints
{
public:
    virtual ~TypeHints() = default;

    [[nodiscard]] virtual std::optional<std::string> resolve(std::string_view pointer) const = 0;

    /**
     * All known labels, ordered by path
     */
    [[nodiscard]] virtual const std::map<std::string, std::string>& entries() const = 0;
};

/**
 * @brief TypeHints backed by an ordered map
 */
class MapTypeHints final : public TypeHints
{
public:
    MapTypeHints() = default;
    explicit MapTypeHints(std::map<std::string, std::string> hints);

    [[nodiscard]] std::optional<std::string> resolve(std::string_view pointer) const override;
    [[nodiscard]] const std::map<std::string, std::string>& entries() const override
    {
        return m_hints;
    }

private:
    std::map<std::string, std::string> m_hints;
};

/**
 * @brief Recursion limits for self-referential schemas
 *
 * The depth of a path is the number of times a definition may be re-entered
 * while it is already being expanded: 0 stops at the first self-reference,
 * 1 allows one nested level, and so on.
 *
 * Lookup order: longest matching prefix, then first matching pattern,
 * then the default.
 */
class InferenceDepth
{
public:
    static constexpr int kDefaultMaxDepth = 1;

    InferenceDepth() = default;

    [[nodiscard]] static InferenceDepth stop_at_first_reference();
    [[nodiscard]] static InferenceDepth unlimited();

    [[nodiscard]] int max_depth_for(std::string_view path) const;
    [[nodiscard]] int default_max_depth() const noexcept { return m_default_max_depth; }

private:
    friend class InferenceDepthBuilder;

    int m_default_max_depth = kDefaultMaxDepth;
    std::map<std::string, int> m_prefix_depths;
    std::vector<std::pair<glob::Pattern, int>> m_pattern_depths;
};

class InferenceDepthBuilder
{
public:
    [[nodiscard]] semdiff::VoidResult default_max_depth(int depth);
    [[nodiscard]] semdiff::VoidResult max_depth_for_prefix(std::string prefix, int depth);
    [[nodiscard]] semdiff::VoidResult max_depth_for_pattern(glob::Pattern pattern, int depth);

    [[nodiscard]] InferenceDepth build() const;

private:
    InferenceDepth m_depth;
};

/**
 * Infer type labels from a JSON Schema document.
 *
 * Walks "properties", "items" (without adding a path segment), "allOf"
 * wrappers and local "$ref"s ("#/$defs/Name", "#/definitions/Name").
 * Leaves are labelled with the definition name they were reached through,
 * else their "title", else their "type" ("string:date-time" when a format
 * is present).
 *
 * @param schema JSON Schema document
 * @param depth Recursion limits for self-referential definitions
 * @return Labels keyed by normalized path, or InvalidSchema error
 */
[[nodiscard]] semdiff::Result<MapTypeHints>
infer_type_hints(const nlohmann::json& schema, const InferenceDepth& depth = InferenceDepth{});

}  // namespace semdiff
