/**
 * @file equivalence_registry.cpp
 * @brief Precedence-ordered resolution of equivalence predicates
 */

#include "semdiff/pointer.hpp"
#include "semdiff/registries.hpp"

#include <algorithm>

namespace semdiff {

EquivalenceRegistry::EquivalenceRegistry(std::map<std::string, Equivalence> exact,
                                         std::vector<PatternEquivalence> patterns,
                                         const std::map<std::string, Equivalence>& prefixes,
                                         std::map<std::string, Equivalence> by_type,
                                         Equivalence fallback)
    : m_exact(std::move(exact))
    , m_patterns(std::move(patterns))
    , m_by_type(std::move(by_type))
    , m_fallback(std::move(fallback))
{
    m_prefixes.reserve(prefixes.size());
    for (const auto& [prefix, equivalence] : prefixes) {
        m_prefixes.emplace_back(pointer::normalize_prefix(prefix), equivalence);
    }
    // Longest prefix first, ties in lexicographic order
    std::ranges::stable_sort(m_prefixes, [](const auto& lhs, const auto& rhs) {
        return lhs.first.size() > rhs.first.size();
    });
}

const Equivalence* EquivalenceRegistry::resolve(const std::string& path,
                                                const std::string* type_label) const
{
    if (const auto* found = resolve_exact(path)) {
        return found;
    }
    if (const auto* found = resolve_pattern(path)) {
        return found;
    }
    if (const auto* found = resolve_prefix(path)) {
        return found;
    }
    if (const auto* found = resolve_type(type_label)) {
        return found;
    }
    return resolve_fallback();
}

const Equivalence* EquivalenceRegistry::resolve_exact(const std::string& path) const
{
    auto it = m_exact.find(path);
    return it != m_exact.end() ? &it->second : nullptr;
}

const Equivalence* EquivalenceRegistry::resolve_pattern(const std::string& path) const
{
    auto it = std::ranges::find_if(m_patterns, [&path](const PatternEquivalence& entry) {
        return glob::full_match(entry.pattern, path);
    });
    return it != m_patterns.end() ? &it->equivalence : nullptr;
}

const Equivalence* EquivalenceRegistry::resolve_prefix(const std::string& path) const
{
    auto it = std::ranges::find_if(m_prefixes, [&path](const auto& entry) {
        return pointer::matches_prefix(path, entry.first);
    });
    return it != m_prefixes.end() ? &it->second : nullptr;
}

const Equivalence* EquivalenceRegistry::resolve_type(const std::string* type_label) const
{
    if (type_label == nullptr) {
        return nullptr;
    }
    auto it = m_by_type.find(*type_label);
    return it != m_by_type.end() ? &it->second : nullptr;
}

const Equivalence* EquivalenceRegistry::resolve_fallback() const
{
    return m_fallback ? &m_fallback : nullptr;
}

}  // namespace semdiff
