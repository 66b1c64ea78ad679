/**
 * @file list_rule_registry.cpp
 * @brief Normalized array path to pairing rule lookup
 */

#include "semdiff/registries.hpp"

namespace semdiff {

ListRuleRegistry::ListRuleRegistry(std::map<std::string, ListRule> by_path)
    : m_by_path(std::move(by_path))
{}

const ListRule* ListRuleRegistry::rule_for(const std::string& normalized_path) const
{
    auto it = m_by_path.find(normalized_path);
    return it != m_by_path.end() ? &it->second : nullptr;
}

}  // namespace semdiff
