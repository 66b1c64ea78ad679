/**
 * @file array_indexer.cpp
 * @brief Identity index over array elements
 */

#include "array_indexer.hpp"

#include "semdiff/common.hpp"
#include "semdiff/pointer.hpp"

#include <utility>

namespace semdiff::engine {

void ElementIndex::insert(std::string key, const nlohmann::json& element)
{
    if (m_elements.insert_or_assign(key, &element).second) {
        m_keys.push_back(std::move(key));
    }
}

const nlohmann::json* ElementIndex::find(const std::string& key) const
{
    auto it = m_elements.find(key);
    return it != m_elements.end() ? it->second : nullptr;
}

std::string identity_of(const nlohmann::json& element, const ListRule& rule)
{
    const nlohmann::json* value = nullptr;
    if (rule.is_pointer()) {
        value = pointer::resolve(element, rule.identifier_pointer());
    } else {
        auto it = element.find(rule.identifier_path());
        if (it != element.end()) {
            value = &*it;
        }
    }
    if (value == nullptr || value->is_null()) {
        return std::string(kNullIdentity);
    }
    return common::as_text(*value);
}

ElementIndex build_index(const nlohmann::json& array, const ListRule& rule)
{
    ElementIndex index;
    for (const auto& element : array) {
        if (!element.is_object()) {
            continue;
        }
        index.insert(identity_of(element, rule), element);
    }
    return index;
}

}  // namespace semdiff::engine
