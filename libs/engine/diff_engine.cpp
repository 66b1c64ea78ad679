/**
 * @file diff_engine.cpp
 * @brief Recursive lock-step walk over two JSON trees
 */

#include "semdiff/diff.hpp"

#include "array_indexer.hpp"
#include "semdiff/pointer.hpp"
#include "semdiff/tree.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace semdiff {

namespace {

[[nodiscard]] bool is_leaf(const nlohmann::json* node)
{
    return node == nullptr || !node->is_structured();
}

[[nodiscard]] nlohmann::json value_or_null(const nlohmann::json* node)
{
    return node != nullptr ? *node : nlohmann::json(nullptr);
}

/**
 * @brief Accumulator for one compare() call
 */
class DiffContext
{
public:
    explicit DiffContext(const Configuration& config)
        : m_config(config)
    {}

    void walk(const std::string& path, const nlohmann::json* left, const nlohmann::json* right)
    {
        if (should_skip(path, left, right)) {
            return;
        }
        if (is_leaf(left) || is_leaf(right)) {
            emit_changed(path, left, right);
            return;
        }
        if (left->is_object() && right->is_object()) {
            compare_objects(path, *left, *right);
            return;
        }
        if (left->is_array() && right->is_array()) {
            compare_arrays(path, *left, *right);
            return;
        }
        emit_changed(path, left, right);
    }

    [[nodiscard]] std::vector<DiffEntry> take() { return std::move(m_entries); }

private:
    [[nodiscard]] bool should_skip(const std::string& path,
                                   const nlohmann::json* left,
                                   const nlohmann::json* right) const
    {
        if (m_config.is_ignored(path)) {
            return true;
        }
        if (left == right) {
            return true;
        }
        if (left != nullptr && right != nullptr && !left->is_structured()
            && !right->is_structured() && *left == *right) {
            return true;
        }
        const Equivalence* equivalence = m_config.equivalence_at(path);
        return equivalence != nullptr && (*equivalence)(left, right);
    }

    void compare_objects(const std::string& path,
                         const nlohmann::json& left,
                         const nlohmann::json& right)
    {
        std::set<std::string> names;
        for (const auto& item : left.items()) {
            names.insert(item.key());
        }
        for (const auto& item : right.items()) {
            names.insert(item.key());
        }

        for (const auto& name : names) {
            auto left_it = left.find(name);
            auto right_it = right.find(name);
            walk(pointer::child(path, name),
                 left_it != left.end() ? &*left_it : nullptr,
                 right_it != right.end() ? &*right_it : nullptr);
        }
    }

    void compare_arrays(const std::string& path,
                        const nlohmann::json& left,
                        const nlohmann::json& right)
    {
        const ListRule* rule = m_config.list_rule_for(path);
        if (rule == nullptr || rule->is_none()) {
            compare_by_position(path, left, right);
        } else {
            compare_by_identity(path, left, right, *rule);
        }
    }

    void compare_by_position(const std::string& path,
                             const nlohmann::json& left,
                             const nlohmann::json& right)
    {
        const std::size_t count = std::max(left.size(), right.size());
        for (std::size_t i = 0; i < count; ++i) {
            pair(pointer::child(path, i),
                 i < left.size() ? &left[i] : nullptr,
                 i < right.size() ? &right[i] : nullptr);
        }
    }

    void compare_by_identity(const std::string& path,
                             const nlohmann::json& left,
                             const nlohmann::json& right,
                             const ListRule& rule)
    {
        const engine::ElementIndex left_index = engine::build_index(left, rule);
        const engine::ElementIndex right_index = engine::build_index(right, rule);

        std::set<std::string> keys(left_index.keys().begin(), left_index.keys().end());
        keys.insert(right_index.keys().begin(), right_index.keys().end());

        for (const auto& key : keys) {
            pair(pointer::child(path, "{" + key + "}"), left_index.find(key), right_index.find(key));
        }
    }

    void pair(const std::string& path, const nlohmann::json* left, const nlohmann::json* right)
    {
        if (left == nullptr) {
            m_entries.push_back(DiffEntry{.path = path,
                                          .kind = DiffKind::kAdded,
                                          .old_value = std::nullopt,
                                          .new_value = *right});
            return;
        }
        if (right == nullptr) {
            m_entries.push_back(DiffEntry{.path = path,
                                          .kind = DiffKind::kRemoved,
                                          .old_value = *left,
                                          .new_value = std::nullopt});
            return;
        }
        walk(path, left, right);
    }

    void emit_changed(const std::string& path,
                      const nlohmann::json* left,
                      const nlohmann::json* right)
    {
        m_entries.push_back(DiffEntry{.path = path,
                                      .kind = DiffKind::kChanged,
                                      .old_value = value_or_null(left),
                                      .new_value = value_or_null(right)});
    }

    const Configuration& m_config;
    std::vector<DiffEntry> m_entries;
};

}  // namespace

std::vector<DiffEntry> compare(const nlohmann::json& left,
                               const nlohmann::json& right,
                               const Configuration& config)
{
    DiffContext context(config);
    context.walk(config.root_path(), &left, &right);
    return context.take();
}

// ============================================================================
// Differ
// ============================================================================

Differ::Differ(Configuration config)
    : m_config(std::move(config))
{}

std::vector<DiffEntry> Differ::compare(const nlohmann::json& left,
                                       const nlohmann::json& right) const
{
    return semdiff::compare(left, right, m_config);
}

semdiff::Result<std::vector<DiffEntry>> Differ::compare_text(std::string_view left,
                                                             std::string_view right) const
{
    auto left_tree = parse_tree(left);
    if (!left_tree) {
        return std::unexpected(left_tree.error());
    }
    auto right_tree = parse_tree(right);
    if (!right_tree) {
        return std::unexpected(right_tree.error());
    }
    return compare(*left_tree, *right_tree);
}

}  // namespace semdiff
