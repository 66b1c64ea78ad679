/**
 * @file pointer.cpp
 * @brief JSON Pointer path utilities
 *
 * C++23 modernization:
 * - Using std::ranges::views::split for segment iteration
 * - Using std::string::starts_with / ends_with
 */

#include "semdiff/pointer.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>

namespace semdiff::pointer {

namespace {

/**
 * @brief Join segments into a pointer ("/" for no segments)
 */
[[nodiscard]] std::string join_segments(const std::vector<std::string>& segments)
{
    if (segments.empty()) {
        return std::string(kRoot);
    }

    std::size_t total_size = segments.size();  // separators
    for (const auto& s : segments) {
        total_size += s.size();
    }

    std::string result;
    result.reserve(total_size);
    for (const auto& s : segments) {
        result += '/';
        result += s;
    }
    return result;
}

}  // namespace

std::string escape(std::string_view raw)
{
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

std::string unescape(std::string_view segment)
{
    std::string out;
    out.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '0') {
                out += '~';
                ++i;
                continue;
            }
            if (segment[i + 1] == '1') {
                out += '/';
                ++i;
                continue;
            }
        }
        out += segment[i];
    }
    return out;
}

std::string child(std::string_view base, std::string_view key)
{
    std::string path(base);
    if (!path.ends_with('/')) {
        path += '/';
    }
    path += escape(key);
    return path;
}

std::string child(std::string_view base, std::size_t index)
{
    return child(base, std::to_string(index));
}

std::vector<std::string> split(std::string_view path)
{
    std::vector<std::string> segments;
    for (auto part : path | std::views::split('/')) {
        std::string_view sv(part.begin(), part.end());
        if (!sv.empty()) {
            segments.emplace_back(sv);
        }
    }
    return segments;
}

std::string normalize_prefix(std::string_view prefix)
{
    std::string normalized(prefix);
    if (!normalized.ends_with('/')) {
        normalized += '/';
    }
    return normalized;
}

bool matches_prefix(std::string_view path, std::string_view normalized_prefix)
{
    if (path.starts_with(normalized_prefix)) {
        return true;
    }
    // The prefix itself, without its trailing separator
    return normalized_prefix.size() > 1
           && path == normalized_prefix.substr(0, normalized_prefix.size() - 1);
}

bool is_index_segment(std::string_view segment)
{
    return !segment.empty()
           && std::ranges::all_of(segment,
                                  [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool is_identity_segment(std::string_view segment)
{
    return segment.size() >= 2 && segment.front() == '{' && segment.back() == '}';
}

std::string normalize_for_rules(std::string_view path)
{
    if (path.empty() || path == kRoot) {
        return std::string(kRoot);
    }

    std::vector<std::string> structural;
    for (auto& segment : split(path)) {
        if (is_index_segment(segment) || is_identity_segment(segment)) {
            continue;
        }
        structural.push_back(std::move(segment));
    }
    return join_segments(structural);
}

const nlohmann::json* resolve(const nlohmann::json& node,
                              const nlohmann::json::json_pointer& target)
{
    // Array tokens too large for size_t throw instead of reporting a miss
    try {
        if (!node.contains(target)) {
            return nullptr;
        }
        return &node.at(target);
    } catch (const nlohmann::json::out_of_range&) {
        return nullptr;
    }
}

}  // namespace semdiff::pointer
