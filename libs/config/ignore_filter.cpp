/**
 * @file ignore_filter.cpp
 * @brief Path suppression by exact path, prefix and pattern
 */

#include "semdiff/pointer.hpp"
#include "semdiff/registries.hpp"

#include <algorithm>

namespace semdiff {

IgnoreFilter::IgnoreFilter(std::set<std::string> exact,
                           const std::vector<std::string>& prefixes,
                           std::vector<glob::Pattern> patterns)
    : m_exact(std::move(exact))
    , m_patterns(std::move(patterns))
{
    m_prefixes.reserve(prefixes.size());
    for (const auto& prefix : prefixes) {
        m_prefixes.push_back(pointer::normalize_prefix(prefix));
    }
}

bool IgnoreFilter::should_ignore(const std::string& path) const
{
    if (m_exact.contains(path)) {
        return true;
    }
    if (std::ranges::any_of(m_prefixes, [&path](const std::string& prefix) {
            return pointer::matches_prefix(path, prefix);
        })) {
        return true;
    }
    return std::ranges::any_of(m_patterns, [&path](const glob::Pattern& pattern) {
        return glob::full_match(pattern, path);
    });
}

}  // namespace semdiff
