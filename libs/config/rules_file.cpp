/**
 * @file rules_file.cpp
 * @brief Rules file interpretation
 */

#include "semdiff/rules_file.hpp"

#include "semdiff/equivalence.hpp"
#include "semdiff/glob.hpp"
#include "semdiff/schema_validate.hpp"
#include "semdiff/tree.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

namespace semdiff {

namespace {

[[nodiscard]] Error rules_error(std::string message)
{
    return Error::make("InvalidRulesFile", std::move(message));
}

[[nodiscard]] semdiff::Result<equivalence::TimeUnit> parse_time_unit(const std::string& unit)
{
    if (unit == "millis") {
        return equivalence::TimeUnit::kMillis;
    }
    if (unit == "seconds") {
        return equivalence::TimeUnit::kSeconds;
    }
    if (unit == "minutes") {
        return equivalence::TimeUnit::kMinutes;
    }
    if (unit == "hours") {
        return equivalence::TimeUnit::kHours;
    }
    if (unit == "days") {
        return equivalence::TimeUnit::kDays;
    }
    return std::unexpected(rules_error("unknown time unit: " + unit));
}

[[nodiscard]] semdiff::Result<std::chrono::milliseconds> tolerance_of(const nlohmann::json& entry)
{
    auto it = entry.find("tolerance_ms");
    if (it == entry.end() || !it->is_number_integer() || it->get<std::int64_t>() < 0) {
        return std::unexpected(
            rules_error("predicate " + entry.value("predicate", std::string{})
                        + " needs a non-negative integer \"tolerance_ms\""));
    }
    return std::chrono::milliseconds(it->get<std::int64_t>());
}

[[nodiscard]] semdiff::Result<Equivalence> make_predicate(const nlohmann::json& entry)
{
    const std::string name = entry.value("predicate", std::string{});
    if (name == "numeric_within") {
        auto it = entry.find("epsilon");
        if (it == entry.end() || !it->is_number() || it->get<double>() < 0.0) {
            return std::unexpected(
                rules_error("predicate numeric_within needs a non-negative \"epsilon\""));
        }
        return equivalence::numeric_within(it->get<double>());
    }
    if (name == "case_insensitive") {
        return equivalence::case_insensitive();
    }
    if (name == "punctuation_insensitive") {
        return equivalence::punctuation_insensitive();
    }
    if (name == "instant_within" || name == "offset_date_time_within") {
        auto tolerance = tolerance_of(entry);
        if (!tolerance) {
            return std::unexpected(tolerance.error());
        }
        return name == "instant_within" ? equivalence::instant_within(*tolerance)
                                        : equivalence::offset_date_time_within(*tolerance);
    }
    if (name == "zoned_date_time_truncated_to") {
        auto it = entry.find("unit");
        if (it == entry.end() || !it->is_string()) {
            return std::unexpected(
                rules_error("predicate zoned_date_time_truncated_to needs a \"unit\""));
        }
        auto unit = parse_time_unit(it->get<std::string>());
        if (!unit) {
            return std::unexpected(unit.error());
        }
        return equivalence::zoned_date_time_truncated_to(*unit);
    }
    return std::unexpected(rules_error("unknown predicate: " + name));
}

[[nodiscard]] semdiff::VoidResult register_equivalence(ConfigurationBuilder& builder,
                                                       const nlohmann::json& entry)
{
    auto predicate = make_predicate(entry);
    if (!predicate) {
        return std::unexpected(predicate.error());
    }

    if (auto at = entry.find("at"); at != entry.end()) {
        return builder.equivalent_at(at->get<std::string>(), std::move(*predicate));
    }
    if (auto under = entry.find("under"); under != entry.end()) {
        return builder.equivalent_under(under->get<std::string>(), std::move(*predicate));
    }
    if (auto regex = entry.find("pattern"); regex != entry.end()) {
        auto pattern = glob::compile_pattern(regex->get<std::string>());
        if (!pattern) {
            return std::unexpected(pattern.error());
        }
        return builder.equivalent_pattern(std::move(*pattern), std::move(*predicate));
    }
    if (auto expression = entry.find("glob"); expression != entry.end()) {
        auto pattern = glob::compile_glob(expression->get<std::string>());
        if (!pattern) {
            return std::unexpected(pattern.error());
        }
        return builder.equivalent_pattern(std::move(*pattern), std::move(*predicate));
    }
    if (auto label = entry.find("type"); label != entry.end()) {
        return builder.equivalent_for_type(label->get<std::string>(), std::move(*predicate));
    }
    if (entry.contains("fallback")) {
        return builder.equivalent_fallback(std::move(*predicate));
    }
    return std::unexpected(rules_error("equivalence entry has no selector"));
}

[[nodiscard]] semdiff::VoidResult load_lists(ConfigurationBuilder& builder,
                                             const nlohmann::json& lists)
{
    for (const auto& [path, identity] : lists.items()) {
        if (identity.is_null()) {
            if (auto result = builder.list(path, ListRule::none()); !result) {
                return result;
            }
            continue;
        }
        auto rule = ListRule::id(identity.get<std::string>());
        if (!rule) {
            return std::unexpected(rule.error());
        }
        if (auto result = builder.list(path, std::move(*rule)); !result) {
            return result;
        }
    }
    return {};
}

[[nodiscard]] semdiff::VoidResult load_ignores(ConfigurationBuilder& builder,
                                               const nlohmann::json& ignore)
{
    for (const auto& path : ignore.value("exact", nlohmann::json::array())) {
        if (auto result = builder.ignore(path.get<std::string>()); !result) {
            return result;
        }
    }
    for (const auto& prefix : ignore.value("prefixes", nlohmann::json::array())) {
        if (auto result = builder.ignore_prefix(prefix.get<std::string>()); !result) {
            return result;
        }
    }
    for (const auto& expression : ignore.value("globs", nlohmann::json::array())) {
        if (auto result = builder.ignore_glob(expression.get<std::string>()); !result) {
            return result;
        }
    }
    for (const auto& regex : ignore.value("patterns", nlohmann::json::array())) {
        auto pattern = glob::compile_pattern(regex.get<std::string>());
        if (!pattern) {
            return std::unexpected(pattern.error());
        }
        if (auto result = builder.ignore_pattern(std::move(*pattern)); !result) {
            return result;
        }
    }
    return {};
}

}  // namespace

semdiff::Result<ConfigurationBuilder> load_rules(const nlohmann::json& document,
                                                 const std::filesystem::path& schema_dir)
{
    if (auto result = common::validate_json(document, schema_dir, common::kRulesSchema);
        !result) {
        return std::unexpected(result.error());
    }

    ConfigurationBuilder builder;
    if (auto root = document.find("root"); root != document.end()) {
        if (auto result = builder.root_path(root->get<std::string>()); !result) {
            return std::unexpected(result.error());
        }
    }
    if (auto lists = document.find("lists"); lists != document.end()) {
        if (auto result = load_lists(builder, *lists); !result) {
            return std::unexpected(result.error());
        }
    }
    if (auto ignore = document.find("ignore"); ignore != document.end()) {
        if (auto result = load_ignores(builder, *ignore); !result) {
            return std::unexpected(result.error());
        }
    }
    if (auto equivalences = document.find("equivalences"); equivalences != document.end()) {
        for (std::size_t index = 0; index < equivalences->size(); ++index) {
            if (auto result = register_equivalence(builder, (*equivalences)[index]); !result) {
                return std::unexpected(Error::make(
                    result.error().code,
                    std::format("equivalences[{}]: {}", index, result.error().message)));
            }
        }
    }
    if (auto hints = document.find("type_hints"); hints != document.end()) {
        for (const auto& [path, label] : hints->items()) {
            if (auto result = builder.type_hint(path, label.get<std::string>()); !result) {
                return std::unexpected(result.error());
            }
        }
    }
    return builder;
}

semdiff::Result<ConfigurationBuilder> load_rules_file(const std::filesystem::path& path,
                                                      const std::filesystem::path& schema_dir)
{
    auto document = read_tree_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    return load_rules(*document, schema_dir);
}

}  // namespace semdiff
