#pragma once

/**
 * @file config.hpp
 * @brief Comparison configuration and its builder
 *
 * A Configuration is assembled with a ConfigurationBuilder. Every
 * registration is validated when it is made and reported through the
 * returned VoidResult, so a misconfigured comparison never runs.
 * build() copies all collections into an immutable Configuration that
 * may be shared by concurrent comparisons.
 *
 * Example:
 *   semdiff::ConfigurationBuilder builder;
 *   auto rule = semdiff::ListRule::id("id");
 *   if (!rule || !builder.list("/items", *rule)) { ... }
 *   if (!builder.equivalent_at("/price", semdiff::equivalence::numeric_within(0.01))) { ... }
 *   semdiff::Configuration config = builder.build();
 */

#include "semdiff/common.hpp"
#include "semdiff/equivalence.hpp"
#include "semdiff/glob.hpp"
#include "semdiff/list_rule.hpp"
#include "semdiff/registries.hpp"
#include "semdiff/type_hints.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace semdiff {

class Configuration
{
public:
    /// Root path used when none is configured
    static constexpr std::string_view kDefaultRootPath = "/";

    /**
     * Empty configuration: positional arrays, nothing ignored,
     * literal equality everywhere, rooted at "/"
     */
    Configuration();

    /**
     * Pairing rule for the array at `path` (normalized before lookup)
     * @return nullptr when the array pairs by position
     */
    [[nodiscard]] const ListRule* list_rule_for(const std::string& path) const;

    [[nodiscard]] bool is_ignored(const std::string& path) const;

    /**
     * Custom equality predicate for `path`
     * @return nullptr when literal equality applies
     */
    [[nodiscard]] const Equivalence* equivalence_at(const std::string& path) const;

    [[nodiscard]] const std::string& root_path() const noexcept { return m_root_path; }

    [[nodiscard]] const std::map<std::string, std::string>& type_hints() const noexcept
    {
        return m_type_hints;
    }

private:
    friend class ConfigurationBuilder;

    ListRuleRegistry m_list_rules;
    IgnoreFilter m_ignores;
    EquivalenceRegistry m_equivalences;
    std::map<std::string, std::string> m_type_hints;
    std::string m_root_path;
};

class ConfigurationBuilder
{
public:
    // List rules
    [[nodiscard]] semdiff::VoidResult list(const std::string& path, ListRule rule);

    // Ignores
    [[nodiscard]] semdiff::VoidResult ignore(const std::string& path);
    [[nodiscard]] semdiff::VoidResult ignore_prefix(const std::string& prefix);
    [[nodiscard]] semdiff::VoidResult ignore_pattern(glob::Pattern pattern);
    [[nodiscard]] semdiff::VoidResult ignore_glob(std::string_view expression);

    // Equivalences
    [[nodiscard]] semdiff::VoidResult equivalent_at(const std::string& path, Equivalence eq);
    [[nodiscard]] semdiff::VoidResult equivalent_under(const std::string& prefix, Equivalence eq);
    [[nodiscard]] semdiff::VoidResult equivalent_pattern(glob::Pattern pattern, Equivalence eq);
    [[nodiscard]] semdiff::VoidResult equivalent_for_type(const std::string& label,
                                                          Equivalence eq);
    [[nodiscard]] semdiff::VoidResult equivalent_fallback(Equivalence eq);

    // Types
    [[nodiscard]] semdiff::VoidResult type_hint(const std::string& path, const std::string& label);
    [[nodiscard]] semdiff::VoidResult type_hints(const TypeHints& hints);

    // Other
    [[nodiscard]] semdiff::VoidResult root_path(const std::string& path);

    /**
     * Freeze the registrations made so far. The builder stays usable.
     */
    [[nodiscard]] Configuration build() const;

private:
    std::map<std::string, ListRule> m_list_rules;
    std::set<std::string> m_ignore_exact;
    std::vector<std::string> m_ignore_prefixes;
    std::vector<glob::Pattern> m_ignore_patterns;
    std::map<std::string, Equivalence> m_equivalence_exact;
    std::vector<PatternEquivalence> m_equivalence_patterns;
    std::map<std::string, Equivalence> m_equivalence_prefixes;
    std::map<std::string, Equivalence> m_equivalence_by_type;
    Equivalence m_equivalence_fallback;
    std::map<std::string, std::string> m_type_hints;
    std::string m_root_path{Configuration::kDefaultRootPath};
};

}  // namespace semdiff
