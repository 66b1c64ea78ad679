/**
 * @file list_rule.cpp
 * @brief Array pairing strategy
 */

#include "semdiff/list_rule.hpp"

#include <format>
#include <utility>

namespace semdiff {

ListRule::ListRule(std::string identifier_path, bool pointer, nlohmann::json::json_pointer compiled)
    : m_identifier_path(std::move(identifier_path))
    , m_pointer(pointer)
    , m_identifier_pointer(std::move(compiled))
{}

ListRule ListRule::none()
{
    return ListRule(std::string{}, false, nlohmann::json::json_pointer{});
}

semdiff::Result<ListRule> ListRule::id(std::string_view path)
{
    if (path.empty()) {
        return std::unexpected(
            Error::make("InvalidRule", "identifier path must not be empty"));
    }
    if (!path.starts_with('/')) {
        return ListRule(std::string(path), false, nlohmann::json::json_pointer{});
    }

    try {
        nlohmann::json::json_pointer compiled{std::string(path)};
        return ListRule(std::string(path), true, std::move(compiled));
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "InvalidRule",
            std::format("Invalid identifier pointer '{}': {}", path, ex.what())));
    }
}

}  // namespace semdiff
