#pragma once

/**
 * @file tree.hpp
 * @brief Tree factory: turning JSON text and files into comparable trees
 */

#include "semdiff/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace semdiff {

/**
 * @brief Source of trees for the diff engine
 *
 * The engine only ever sees nlohmann::json values. Callers holding data in
 * another form provide their own factory.
 */
class TreeFactory
{
public:
    virtual ~TreeFactory() = default;

    [[nodiscard]] virtual semdiff::Result<nlohmann::json> from_text(std::string_view text) const = 0;
    [[nodiscard]] virtual semdiff::Result<nlohmann::json>
    from_file(const std::filesystem::path& path) const = 0;
};

/**
 * @brief Factory for RFC 8259 JSON text
 */
class JsonTreeFactory final : public TreeFactory
{
public:
    [[nodiscard]] semdiff::Result<nlohmann::json> from_text(std::string_view text) const override;
    [[nodiscard]] semdiff::Result<nlohmann::json>
    from_file(const std::filesystem::path& path) const override;
};

/**
 * Parse JSON text
 * @return Tree or ParseError
 */
[[nodiscard]] semdiff::Result<nlohmann::json> parse_tree(std::string_view text);

/**
 * Read and parse a JSON file
 * @return Tree, IOError when the file cannot be read, ParseError when it is not JSON
 */
[[nodiscard]] semdiff::Result<nlohmann::json> read_tree_file(const std::filesystem::path& path);

/**
 * Write text to a file, creating parent directories as needed
 * @return IOError when the file cannot be written
 */
[[nodiscard]] semdiff::VoidResult write_text_file(const std::filesystem::path& path,
                                                  std::string_view content);

}  // namespace semdiff
