#pragma once

/**
 * @file registries.hpp
 * @brief Immutable rule registries consulted by the diff engine
 *
 * All registries copy their inputs on construction and are never modified
 * afterwards, so a registry can be shared by concurrent comparisons.
 */

#include "semdiff/equivalence.hpp"
#include "semdiff/glob.hpp"
#include "semdiff/list_rule.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semdiff {

/**
 * @brief Suppresses differences at matching paths
 *
 * A path is ignored when any of the following holds:
 * - it is in the exact set
 * - it lies under a registered prefix
 * - a registered pattern matches the whole path
 */
class IgnoreFilter
{
public:
    IgnoreFilter() = default;
    IgnoreFilter(std::set<std::string> exact,
                 const std::vector<std::string>& prefixes,
                 std::vector<glob::Pattern> patterns);

    [[nodiscard]] bool should_ignore(const std::string& path) const;

    [[nodiscard]] bool empty() const noexcept
    {
        return m_exact.empty() && m_prefixes.empty() && m_patterns.empty();
    }

private:
    std::set<std::string> m_exact;
    std::vector<std::string> m_prefixes;  ///< normalized, ending with '/'
    std::vector<glob::Pattern> m_patterns;
};

/**
 * @brief Pattern paired with the predicate it selects
 */
struct PatternEquivalence
{
    glob::Pattern pattern;
    Equivalence equivalence;
};

/**
 * @brief Resolves the custom equality predicate for a path
 *
 * Precedence (first match wins):
 *   1. exact path
 *   2. first matching pattern, in declaration order
 *   3. longest matching prefix
 *   4. type label of the path
 *   5. fallback
 */
class EquivalenceRegistry
{
public:
    EquivalenceRegistry() = default;
    EquivalenceRegistry(std::map<std::string, Equivalence> exact,
                        std::vector<PatternEquivalence> patterns,
                        const std::map<std::string, Equivalence>& prefixes,
                        std::map<std::string, Equivalence> by_type,
                        Equivalence fallback);

    /**
     * @param path Path being compared (not normalized)
     * @param type_label Label of the normalized path, if any
     * @return Predicate to apply, nullptr when literal equality applies
     */
    [[nodiscard]] const Equivalence* resolve(const std::string& path,
                                             const std::string* type_label) const;

private:
    [[nodiscard]] const Equivalence* resolve_exact(const std::string& path) const;
    [[nodiscard]] const Equivalence* resolve_pattern(const std::string& path) const;
    [[nodiscard]] const Equivalence* resolve_prefix(const std::string& path) const;
    [[nodiscard]] const Equivalence* resolve_type(const std::string* type_label) const;
    [[nodiscard]] const Equivalence* resolve_fallback() const;

    std::map<std::string, Equivalence> m_exact;
    std::vector<PatternEquivalence> m_patterns;
    /// normalized prefix -> predicate, longest prefix first
    std::vector<std::pair<std::string, Equivalence>> m_prefixes;
    std::map<std::string, Equivalence> m_by_type;
    Equivalence m_fallback;
};

/**
 * @brief Maps normalized array paths to their pairing rule
 */
class ListRuleRegistry
{
public:
    ListRuleRegistry() = default;
    explicit ListRuleRegistry(std::map<std::string, ListRule> by_path);

    /**
     * @param normalized_path Path already passed through pointer::normalize_for_rules()
     */
    [[nodiscard]] const ListRule* rule_for(const std::string& normalized_path) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_by_path.size(); }

private:
    std::map<std::string, ListRule> m_by_path;
};

}  // namespace semdiff
