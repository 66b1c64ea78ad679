/**
 * @file timestamp.cpp
 * @brief ISO-8601 date-time parsing
 */

#include "timestamp.hpp"

#include <charconv>
#include <cstdint>
#include <format>
#include <system_error>

namespace semdiff::equivalence::detail {

namespace {

class Cursor
{
public:
    explicit Cursor(std::string_view text)
        : m_text(text)
    {}

    [[nodiscard]] bool at_end() const noexcept { return m_pos >= m_text.size(); }

    [[nodiscard]] char peek() const noexcept { return at_end() ? '\0' : m_text[m_pos]; }

    [[nodiscard]] bool consume(char expected)
    {
        if (peek() != expected) {
            return false;
        }
        ++m_pos;
        return true;
    }

    /**
     * @brief Read exactly `width` decimal digits
     */
    [[nodiscard]] std::optional<int> digits(std::size_t width)
    {
        if (m_pos + width > m_text.size()) {
            return std::nullopt;
        }
        int value = 0;
        const char* begin = m_text.data() + m_pos;
        const char* end = begin + width;
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr != end || *begin == '-' || *begin == '+') {
            return std::nullopt;
        }
        m_pos += width;
        return value;
    }

    /**
     * @brief Read a fraction of a second (1-9 digits) as nanoseconds
     */
    [[nodiscard]] std::optional<std::chrono::nanoseconds> fraction()
    {
        std::int64_t nanos = 0;
        std::size_t count = 0;
        while (!at_end() && peek() >= '0' && peek() <= '9') {
            if (count == 9) {
                return std::nullopt;
            }
            nanos = nanos * 10 + (peek() - '0');
            ++count;
            ++m_pos;
        }
        if (count == 0) {
            return std::nullopt;
        }
        for (std::size_t i = count; i < 9; ++i) {
            nanos *= 10;
        }
        return std::chrono::nanoseconds{nanos};
    }

    [[nodiscard]] std::string_view rest() const { return m_text.substr(m_pos); }

    void skip(std::size_t count) noexcept { m_pos += count; }

private:
    std::string_view m_text;
    std::size_t m_pos = 0;
};

[[nodiscard]] std::optional<std::chrono::sys_days> parse_date(Cursor& cursor)
{
    auto year = cursor.digits(4);
    if (!year || !cursor.consume('-')) {
        return std::nullopt;
    }
    auto month = cursor.digits(2);
    if (!month || !cursor.consume('-')) {
        return std::nullopt;
    }
    auto day = cursor.digits(2);
    if (!day) {
        return std::nullopt;
    }
    const std::chrono::year_month_day ymd{std::chrono::year{*year},
                                          std::chrono::month{static_cast<unsigned>(*month)},
                                          std::chrono::day{static_cast<unsigned>(*day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return std::chrono::sys_days{ymd};
}

[[nodiscard]] std::optional<std::chrono::nanoseconds> parse_time(Cursor& cursor)
{
    auto hour = cursor.digits(2);
    if (!hour || *hour > 23 || !cursor.consume(':')) {
        return std::nullopt;
    }
    auto minute = cursor.digits(2);
    if (!minute || *minute > 59) {
        return std::nullopt;
    }
    std::chrono::nanoseconds time = std::chrono::hours{*hour} + std::chrono::minutes{*minute};
    if (!cursor.consume(':')) {
        return time;
    }
    auto second = cursor.digits(2);
    if (!second || *second > 59) {
        return std::nullopt;
    }
    time += std::chrono::seconds{*second};
    if (cursor.consume('.')) {
        auto nanos = cursor.fraction();
        if (!nanos) {
            return std::nullopt;
        }
        time += *nanos;
    }
    return time;
}

[[nodiscard]] std::optional<std::chrono::minutes> parse_offset(Cursor& cursor)
{
    if (cursor.consume('Z')) {
        return std::chrono::minutes{0};
    }
    int sign = 0;
    if (cursor.consume('+')) {
        sign = 1;
    } else if (cursor.consume('-')) {
        sign = -1;
    } else {
        return std::nullopt;
    }
    auto hours = cursor.digits(2);
    if (!hours || *hours > 18) {
        return std::nullopt;
    }
    int minutes = 0;
    if (cursor.consume(':')) {
        auto parsed = cursor.digits(2);
        if (!parsed || *parsed > 59) {
            return std::nullopt;
        }
        minutes = *parsed;
    }
    if (*hours * 60 + minutes > 18 * 60) {
        return std::nullopt;
    }
    return std::chrono::minutes{sign * (*hours * 60 + minutes)};
}

[[nodiscard]] std::optional<std::string> parse_zone_id(Cursor& cursor)
{
    if (!cursor.consume('[')) {
        return std::string{};
    }
    auto rest = cursor.rest();
    auto close = rest.find(']');
    if (close == std::string_view::npos || close == 0) {
        return std::nullopt;
    }
    std::string zone(rest.substr(0, close));
    cursor.skip(close + 1);
    return zone;
}

}  // namespace

std::string Timestamp::zone() const
{
    if (!zone_id.empty()) {
        return zone_id;
    }
    if (offset.count() == 0) {
        return "Z";
    }
    const auto total = offset.count();
    const auto magnitude = total < 0 ? -total : total;
    return std::format("{}{:02}:{:02}", total < 0 ? '-' : '+', magnitude / 60, magnitude % 60);
}

std::optional<Timestamp> parse_timestamp(std::string_view text)
{
    Cursor cursor(text);
    auto date = parse_date(cursor);
    if (!date || !cursor.consume('T')) {
        return std::nullopt;
    }
    auto time = parse_time(cursor);
    if (!time) {
        return std::nullopt;
    }
    auto offset = parse_offset(cursor);
    if (!offset) {
        return std::nullopt;
    }
    auto zone_id = parse_zone_id(cursor);
    if (!zone_id || !cursor.at_end()) {
        return std::nullopt;
    }
    return Timestamp{.local = std::chrono::sys_time<std::chrono::nanoseconds>{*date} + *time,
                     .offset = *offset,
                     .zone_id = std::move(*zone_id)};
}

}  // namespace semdiff::equivalence::detail
