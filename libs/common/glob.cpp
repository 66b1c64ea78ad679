/**
 * @file glob.cpp
 * @brief Glob-to-regex translation and RE2 pattern helpers
 */

#include "semdiff/glob.hpp"

#include <format>

#include <re2/re2.h>

namespace semdiff::glob {

namespace {

[[nodiscard]] bool is_regex_meta(char c)
{
    switch (c) {
        case '.':
        case '(':
        case ')':
        case '+':
        case '|':
        case '^':
        case '$':
        case '\\':
        case '{':
        case '}':
        case '[':
        case ']':
            return true;
        default:
            return false;
    }
}

}  // namespace

semdiff::Result<Pattern> compile_pattern(std::string_view regex)
{
    RE2::Options options;
    options.set_log_errors(false);
    auto compiled = std::make_shared<const RE2>(std::string(regex), options);
    if (!compiled->ok()) {
        return std::unexpected(
            Error::make("InvalidPattern",
                        std::format("Invalid pattern '{}': {}", regex, compiled->error())));
    }
    return Pattern{std::move(compiled)};
}

std::string glob_to_regex(std::string_view glob)
{
    std::string regex;
    regex.reserve(glob.size() * 2);
    for (std::size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                regex += ".*";
                ++i;
            } else {
                regex += "[^/]*";
            }
            continue;
        }
        if (c == '?') {
            regex += "[^/]";
            continue;
        }
        if (is_regex_meta(c)) {
            regex += '\\';
        }
        regex += c;
    }
    return regex;
}

semdiff::Result<Pattern> compile_glob(std::string_view glob)
{
    return compile_pattern(glob_to_regex(glob));
}

bool full_match(const Pattern& pattern, const std::string& path)
{
    return pattern != nullptr && RE2::FullMatch(path, *pattern);
}

std::string pattern_source(const Pattern& pattern)
{
    return pattern != nullptr ? pattern->pattern() : std::string{};
}

}  // namespace semdiff::glob
