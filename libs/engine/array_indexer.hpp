#pragma once

/**
 * @file array_indexer.hpp
 * @brief Identity index over the elements of a JSON array
 */

#include "semdiff/list_rule.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace semdiff::engine {

/// Key of elements whose identity is missing or null
inline constexpr std::string_view kNullIdentity = "<null>";

/**
 * @brief Insertion-ordered map from identity text to element
 *
 * Keys are the raw identity text; escaping happens when a key is turned
 * into a path segment. A repeated key keeps its first position and refers
 * to the last element carrying it.
 */
class ElementIndex
{
public:
    void insert(std::string key, const nlohmann::json& element);

    /**
     * @return Element for `key`, nullptr when absent
     */
    [[nodiscard]] const nlohmann::json* find(const std::string& key) const;

    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return m_keys; }
    [[nodiscard]] std::size_t size() const noexcept { return m_keys.size(); }

private:
    std::vector<std::string> m_keys;
    std::unordered_map<std::string, const nlohmann::json*> m_elements;
};

/**
 * Index the object elements of an array by the identity `rule` extracts.
 * Non-object elements carry no identity and are skipped.
 * @pre array.is_array() and !rule.is_none()
 */
[[nodiscard]] ElementIndex build_index(const nlohmann::json& array, const ListRule& rule);

/**
 * Identity text of one object element
 */
[[nodiscard]] std::string identity_of(const nlohmann::json& element, const ListRule& rule);

}  // namespace semdiff::engine
