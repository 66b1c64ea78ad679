/**
 * @file json_text.cpp
 * @brief Textual rendering of JSON scalars
 */

#include "semdiff/common.hpp"

#include <algorithm>
#include <cctype>

namespace semdiff::common {

std::string as_text(const nlohmann::json& value)
{
    if (value.is_string()) {
        return value.get_ref<const std::string&>();
    }
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool is_blank(std::string_view value)
{
    return std::ranges::all_of(value,
                               [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace semdiff::common
