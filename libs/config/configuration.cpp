/**
 * @file configuration.cpp
 * @brief Configuration lookups and builder validation
 */

#include "semdiff/config.hpp"

#include "semdiff/pointer.hpp"

#include <format>
#include <utility>

namespace semdiff {

namespace {

[[nodiscard]] semdiff::VoidResult validate_path(const std::string& path, std::string_view name)
{
    if (path.empty()) {
        return std::unexpected(
            Error::make("InvalidPath", std::format("{} cannot be empty", name)));
    }
    return {};
}

[[nodiscard]] semdiff::VoidResult validate_label(const std::string& label, std::string_view name)
{
    if (common::is_blank(label)) {
        return std::unexpected(
            Error::make("InvalidLabel", std::format("{} cannot be blank", name)));
    }
    return {};
}

[[nodiscard]] semdiff::VoidResult validate_predicate(const Equivalence& eq)
{
    if (!eq) {
        return std::unexpected(
            Error::make("InvalidPredicate", "equivalence predicate cannot be empty"));
    }
    return {};
}

[[nodiscard]] semdiff::VoidResult validate_pattern(const glob::Pattern& pattern)
{
    if (pattern == nullptr) {
        return std::unexpected(Error::make("InvalidPattern", "pattern cannot be null"));
    }
    return {};
}

}  // namespace

// ============================================================================
// Configuration
// ============================================================================

Configuration::Configuration()
    : m_root_path(kDefaultRootPath)
{}

const ListRule* Configuration::list_rule_for(const std::string& path) const
{
    return m_list_rules.rule_for(pointer::normalize_for_rules(path));
}

bool Configuration::is_ignored(const std::string& path) const
{
    return m_ignores.should_ignore(path);
}

const Equivalence* Configuration::equivalence_at(const std::string& path) const
{
    const std::string* label = nullptr;
    if (!m_type_hints.empty()) {
        auto it = m_type_hints.find(pointer::normalize_for_rules(path));
        if (it != m_type_hints.end()) {
            label = &it->second;
        }
    }
    return m_equivalences.resolve(path, label);
}

// ============================================================================
// ConfigurationBuilder
// ============================================================================

semdiff::VoidResult ConfigurationBuilder::list(const std::string& path, ListRule rule)
{
    if (auto result = validate_path(path, "path"); !result) {
        return result;
    }
    m_list_rules.insert_or_assign(path, std::move(rule));
    return {};
}

semdiff::VoidResult ConfigurationBuilder::ignore(const std::string& path)
{
    if (auto result = validate_path(path, "path"); !result) {
        return result;
    }
    m_ignore_exact.insert(path);
    return {};
}

semdiff::VoidResult ConfigurationBuilder::ignore_prefix(const std::string& prefix)
{
    if (auto result = validate_path(prefix, "prefix"); !result) {
        return result;
    }
    m_ignore_prefixes.push_back(prefix);
    return {};
}

semdiff::VoidResult ConfigurationBuilder::ignore_pattern(glob::Pattern pattern)
{
    if (auto result = validate_pattern(pattern); !result) {
        return result;
    }
    m_ignore_patterns.push_back(std::move(pattern));
    return {};
}

semdiff::VoidResult ConfigurationBuilder::ignore_glob(std::string_view expression)
{
    auto pattern = glob::compile_glob(expression);
    if (!pattern) {
        return std::unexpected(pattern.error());
    }
    m_ignore_patterns.push_back(std::move(*pattern));
    return {};
}

semdiff::VoidResult ConfigurationBuilder::equivalent_at(const std::string& path, Equivalence eq)
{
    if (auto result = validate_path(path, "path"); !result) {
        return result;
    }
    if (auto result = validate_predicate(eq); !result) {
        return result;
    }
    m_equivalence_exact.insert_or_assign(path, std::move(eq));
    return {};
}

semdiff::VoidResult ConfigurationBuilder::equivalent_under(const std::string& prefix,
                                                           Equivalence eq)
{
    if (auto result = validate_path(prefix, "prefix"); !result) {
        return result;
    }
    if (auto result = validate_predicate(eq); !result) {
        return result;
    }
    m_equivalence_prefixes.insert_or_assign(prefix, std::move(eq));
    return {};
}

semdiff::VoidResult ConfigurationBuilder::equivalent_pattern(glob::Pattern pattern, Equivalence eq)
{
    if (auto result = validate_pattern(pattern); !result) {
        return result;
    }
    if (auto result = validate_predicate(eq); !result) {
        return result;
    }
    m_equivalence_patterns.push_back(
        PatternEquivalence{.pattern = std::move(pattern), .equivalence = std::move(eq)});
    return {};
}

semdiff::VoidResult ConfigurationBuilder::equivalent_for_type(const std::string& label,
                                                              Equivalence eq)
{
    if (auto result = validate_label(label, "type label"); !result) {
        return result;
    }
    if (auto result = validate_predicate(eq); !result) {
        return result;
    }
    m_equivalence_by_type.insert_or_assign(label, std::move(eq));
    return {};
}

semdiff::VoidResult ConfigurationBuilder::equivalent_fallback(Equivalence eq)
{
    if (auto result = validate_predicate(eq); !result) {
        return result;
    }
    m_equivalence_fallback = std::move(eq);
    return {};
}

semdiff::VoidResult ConfigurationBuilder::type_hint(const std::string& path,
                                                    const std::string& label)
{
    if (auto result = validate_path(path, "path"); !result) {
        return result;
    }
    if (auto result = validate_label(label, "type label"); !result) {
        return result;
    }
    m_type_hints.insert_or_assign(path, label);
    return {};
}

semdiff::VoidResult ConfigurationBuilder::type_hints(const TypeHints& hints)
{
    for (const auto& [path, label] : hints.entries()) {
        if (auto result = type_hint(path, label); !result) {
            return result;
        }
    }
    return {};
}

semdiff::VoidResult ConfigurationBuilder::root_path(const std::string& path)
{
    if (common::is_blank(path)) {
        return std::unexpected(Error::make("InvalidPath", "root path cannot be blank"));
    }
    m_root_path = path;
    return {};
}

Configuration ConfigurationBuilder::build() const
{
    Configuration config;
    config.m_list_rules = ListRuleRegistry(m_list_rules);
    config.m_ignores = IgnoreFilter(m_ignore_exact, m_ignore_prefixes, m_ignore_patterns);
    config.m_equivalences = EquivalenceRegistry(m_equivalence_exact,
                                                m_equivalence_patterns,
                                                m_equivalence_prefixes,
                                                m_equivalence_by_type,
                                                m_equivalence_fallback);
    config.m_type_hints = m_type_hints;
    config.m_root_path = m_root_path;
    return config;
}

}  // namespace semdiff
