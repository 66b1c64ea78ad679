/**
 * @file tree.cpp
 * @brief JSON tree factory and file helpers
 */

#include "semdiff/tree.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace semdiff {

namespace fs = std::filesystem;

semdiff::Result<nlohmann::json> JsonTreeFactory::from_text(std::string_view text) const
{
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(
            Error::make("ParseError", std::string("Failed to parse JSON: ") + ex.what()));
    }
}

semdiff::Result<nlohmann::json> JsonTreeFactory::from_file(const fs::path& path) const
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(
            Error::make("IOError", "Failed to open file for read: " + path.string()));
    }

    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(Error::make("IOError", "Failed to read file: " + path.string()));
    }

    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(Error::make(
            "ParseError", "Failed to parse JSON from " + path.string() + ": " + ex.what()));
    }
}

semdiff::Result<nlohmann::json> parse_tree(std::string_view text)
{
    return JsonTreeFactory{}.from_text(text);
}

semdiff::Result<nlohmann::json> read_tree_file(const fs::path& path)
{
    return JsonTreeFactory{}.from_file(path);
}

semdiff::VoidResult write_text_file(const fs::path& path, std::string_view content)
{
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error::make("IOError",
                                               "Failed to create directory: "
                                                   + path.parent_path().string() + ": "
                                                   + ec.message()));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(
            Error::make("IOError", "Failed to open file for write: " + path.string()));
    }
    out << content;
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write file: " + path.string()));
    }
    return {};
}

}  // namespace semdiff
