#pragma once

/**
 * @file list_rule.hpp
 * @brief Array pairing strategy for one array shape
 */

#include "semdiff/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace semdiff {

/**
 * @brief How the elements of an array are paired across the two trees
 *
 * - none(): positional pairing
 * - id("id"): pair by the value of a direct field
 * - id("/meta/id"): pair by the value addressed by a JSON Pointer
 */
class ListRule
{
public:
    [[nodiscard]] static ListRule none();

    /**
     * Identity rule. A leading '/' selects the JSON Pointer form.
     * @return InvalidRule error for an empty path or a malformed pointer
     */
    [[nodiscard]] static semdiff::Result<ListRule> id(std::string_view path);

    [[nodiscard]] bool is_none() const noexcept { return m_identifier_path.empty(); }
    [[nodiscard]] bool is_pointer() const noexcept { return m_pointer; }
    [[nodiscard]] const std::string& identifier_path() const noexcept { return m_identifier_path; }

    /**
     * Compiled pointer, meaningful only when is_pointer()
     */
    [[nodiscard]] const nlohmann::json::json_pointer& identifier_pointer() const noexcept
    {
        return m_identifier_pointer;
    }

    [[nodiscard]] bool operator==(const ListRule& other) const
    {
        return m_identifier_path == other.m_identifier_path && m_pointer == other.m_pointer;
    }

private:
    ListRule(std::string identifier_path, bool pointer, nlohmann::json::json_pointer compiled);

    std::string m_identifier_path;
    bool m_pointer;
    nlohmann::json::json_pointer m_identifier_pointer;
};

}  // namespace semdiff
