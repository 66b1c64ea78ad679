#include "semdiff/schema_validate.hpp"

#include <filesystem>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace semdiff::common::test {

namespace {

std::filesystem::path schema_dir()
{
    return std::filesystem::path(SEMDIFF_SCHEMA_DIR);
}

nlohmann::json make_valid_rules_json()
{
    return nlohmann::json{
        {        "root",                                                      "/"},
        {       "lists",     {{"/items", "id"}, {"/tasks", "/meta/taskId"}, {"/tags", nullptr}}},
        {      "ignore", {{"exact", {"/version"}}, {"prefixes", {"/meta"}}, {"globs", {"/**/ts"}}}},
        {"equivalences",
         nlohmann::json::array(
         {{{"at", "/price"}, {"predicate", "numeric_within"}, {"epsilon", 0.01}},
         {{"fallback", true}, {"predicate", "case_insensitive"}}})                              },
        {  "type_hints",                                               {{"/price", "Money"}}}
    };
}

nlohmann::json make_valid_report_json()
{
    return nlohmann::json{
        {"schema_version",                                            "semdiff.report.v1"},
        {       "summary", {{"added", 1}, {"removed", 0}, {"changed", 1}, {"total", 2}}},
        {       "changes",
         nlohmann::json::array({{{"path", "/items/{2}"}, {"kind", "ADDED"}, {"new", {{"id", "2"}}}},
         {{"path", "/name"}, {"kind", "CHANGED"}, {"old", "a"}, {"new", nullptr}}})}
    };
}

}  // namespace

TEST(SchemaValidate, RulesAcceptsValidDocument)
{
    auto result = validate_json(make_valid_rules_json(), schema_dir(), kRulesSchema);
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(SchemaValidate, RulesRejectsUnknownPredicate)
{
    auto rules = make_valid_rules_json();
    rules["equivalences"][0]["predicate"] = "fuzzy";
    auto result = validate_json(rules, schema_dir(), kRulesSchema);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidate, RulesRejectsUnknownTopLevelKey)
{
    auto rules = make_valid_rules_json();
    rules["merge"] = true;
    auto result = validate_json(rules, schema_dir(), kRulesSchema);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidate, RulesRejectsEntryWithoutSelector)
{
    auto rules = make_valid_rules_json();
    rules["equivalences"].push_back({{"predicate", "case_insensitive"}});
    auto result = validate_json(rules, schema_dir(), kRulesSchema);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidate, ReportAcceptsValidDocument)
{
    auto result = validate_json(make_valid_report_json(), schema_dir(), kReportSchema);
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(SchemaValidate, ReportRejectsChangedWithoutNewValue)
{
    auto report = make_valid_report_json();
    report["changes"][1].erase("new");
    auto result = validate_json(report, schema_dir(), kReportSchema);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidate, MissingSchemaFile)
{
    auto result = validate_json(nlohmann::json::object(), schema_dir(), "does_not_exist");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

TEST(SchemaValidate, SchemaFileLocation)
{
    EXPECT_EQ(schema_file("/opt/schemas", "rules"),
              std::filesystem::path("/opt/schemas/rules.schema.json"));
}

}  // namespace semdiff::common::test
