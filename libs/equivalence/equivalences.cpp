/**
 * @file equivalences.cpp
 * @brief Built-in equivalence predicates
 */

#include "semdiff/equivalence.hpp"

#include "semdiff/common.hpp"
#include "timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace semdiff::equivalence {

namespace {

[[nodiscard]] bool both_present(const nlohmann::json* left, const nlohmann::json* right)
{
    return left != nullptr && right != nullptr;
}

[[nodiscard]] bool both_strings(const nlohmann::json* left, const nlohmann::json* right)
{
    return both_present(left, right) && left->is_string() && right->is_string();
}

[[nodiscard]] bool equals_ignore_case(std::string_view lhs, std::string_view rhs)
{
    return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

/**
 * @brief Keep alphanumeric runs separated by single spaces
 *
 * Bytes outside ASCII are kept as word characters so UTF-8 text survives.
 */
[[nodiscard]] std::string normalize_punctuation(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    bool last_was_space = false;
    for (unsigned char c : text) {
        if (std::isalnum(c) != 0 || c >= 0x80) {
            out += static_cast<char>(c);
            last_was_space = false;
            continue;
        }
        if (!last_was_space && !out.empty()) {
            out += ' ';
            last_was_space = true;
        }
    }
    if (out.ends_with(' ')) {
        out.pop_back();
    }
    return out;
}

[[nodiscard]] bool within(const detail::Timestamp& a,
                          const detail::Timestamp& b,
                          std::chrono::milliseconds tolerance)
{
    auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(a.instant() - b.instant());
    if (diff.count() < 0) {
        diff = -diff;
    }
    return diff <= tolerance;
}

[[nodiscard]] std::chrono::sys_time<std::chrono::nanoseconds>
truncate(std::chrono::sys_time<std::chrono::nanoseconds> tp, TimeUnit unit)
{
    using namespace std::chrono;
    switch (unit) {
        case TimeUnit::kMillis:
            return floor<milliseconds>(tp);
        case TimeUnit::kSeconds:
            return floor<seconds>(tp);
        case TimeUnit::kMinutes:
            return floor<minutes>(tp);
        case TimeUnit::kHours:
            return floor<hours>(tp);
        case TimeUnit::kDays:
            return floor<days>(tp);
    }
    return tp;
}

/**
 * @brief Both sides are offset date-times at most `tolerance` apart on the UTC time line
 */
[[nodiscard]] Equivalence time_line_within(std::chrono::milliseconds tolerance)
{
    return [tolerance](const nlohmann::json* left, const nlohmann::json* right) {
        if (!both_strings(left, right)) {
            return false;
        }
        auto a = detail::parse_timestamp(left->get_ref<const std::string&>());
        auto b = detail::parse_timestamp(right->get_ref<const std::string&>());
        if (!a || !b || !a->zone_id.empty() || !b->zone_id.empty()) {
            return false;
        }
        return within(*a, *b, tolerance);
    };
}

}  // namespace

Equivalence numeric_within(double epsilon)
{
    return [epsilon](const nlohmann::json* left, const nlohmann::json* right) {
        if (!both_present(left, right) || !left->is_number() || !right->is_number()) {
            return false;
        }
        return std::fabs(left->get<double>() - right->get<double>()) <= epsilon;
    };
}

Equivalence case_insensitive()
{
    return [](const nlohmann::json* left, const nlohmann::json* right) {
        return both_present(left, right)
               && equals_ignore_case(common::as_text(*left), common::as_text(*right));
    };
}

Equivalence punctuation_insensitive()
{
    return [](const nlohmann::json* left, const nlohmann::json* right) {
        if (!both_strings(left, right)) {
            return false;
        }
        return normalize_punctuation(left->get_ref<const std::string&>())
               == normalize_punctuation(right->get_ref<const std::string&>());
    };
}

Equivalence instant_within(std::chrono::milliseconds tolerance)
{
    return time_line_within(tolerance);
}

Equivalence offset_date_time_within(std::chrono::milliseconds tolerance)
{
    return time_line_within(tolerance);
}

Equivalence zoned_date_time_truncated_to(TimeUnit unit)
{
    return [unit](const nlohmann::json* left, const nlohmann::json* right) {
        if (!both_strings(left, right)) {
            return false;
        }
        auto a = detail::parse_timestamp(left->get_ref<const std::string&>());
        auto b = detail::parse_timestamp(right->get_ref<const std::string&>());
        if (!a || !b) {
            return false;
        }
        return truncate(a->local, unit) == truncate(b->local, unit) && a->offset == b->offset
               && a->zone() == b->zone();
    };
}

}  // namespace semdiff::equivalence
