/**
 * @file test_report.cpp
 * @brief Tests for report rendering (JSON and text)
 */

#include "semdiff/report.hpp"

#include "semdiff/schema_validate.hpp"

#include <gtest/gtest.h>

namespace {

using semdiff::DiffEntry;
using semdiff::DiffKind;

std::vector<DiffEntry> make_entries()
{
    return {
        DiffEntry{.path = "/items/{1}/v",
                  .kind = DiffKind::kChanged,
                  .old_value = 1,
                  .new_value = 2},
        DiffEntry{.path = "/items/{2}",
                  .kind = DiffKind::kRemoved,
                  .old_value = nlohmann::json{{"id", "2"}},
                  .new_value = std::nullopt},
        DiffEntry{.path = "/items/{3}",
                  .kind = DiffKind::kAdded,
                  .old_value = std::nullopt,
                  .new_value = nlohmann::json{{"id", "3"}}},
        DiffEntry{.path = "/name",
                  .kind = DiffKind::kChanged,
                  .old_value = "Alice",
                  .new_value = nullptr}
    };
}

TEST(ReportKind, Names)
{
    EXPECT_EQ(semdiff::report::to_string(DiffKind::kAdded), "ADDED");
    EXPECT_EQ(semdiff::report::to_string(DiffKind::kRemoved), "REMOVED");
    EXPECT_EQ(semdiff::report::to_string(DiffKind::kChanged), "CHANGED");
}

TEST(ReportJson, EntryOmitsAbsentSides)
{
    const auto entries = make_entries();

    const auto changed = semdiff::report::to_json(entries[0]);
    EXPECT_EQ(changed.at("kind"), "CHANGED");
    EXPECT_EQ(changed.at("old"), 1);
    EXPECT_EQ(changed.at("new"), 2);

    const auto removed = semdiff::report::to_json(entries[1]);
    EXPECT_TRUE(removed.contains("old"));
    EXPECT_FALSE(removed.contains("new"));

    const auto added = semdiff::report::to_json(entries[2]);
    EXPECT_FALSE(added.contains("old"));
    EXPECT_EQ(added.at("new").at("id"), "3");

    const auto to_null = semdiff::report::to_json(entries[3]);
    ASSERT_TRUE(to_null.contains("new"));
    EXPECT_TRUE(to_null.at("new").is_null());
}

TEST(ReportJson, SummaryAndOrder)
{
    const auto report = semdiff::report::build_report(make_entries());
    EXPECT_EQ(report.at("schema_version"), "semdiff.report.v1");
    EXPECT_EQ(report.at("summary").at("added"), 1);
    EXPECT_EQ(report.at("summary").at("removed"), 1);
    EXPECT_EQ(report.at("summary").at("changed"), 2);
    EXPECT_EQ(report.at("summary").at("total"), 4);
    ASSERT_EQ(report.at("changes").size(), 4U);
    EXPECT_EQ(report.at("changes").at(0).at("path"), "/items/{1}/v");
    EXPECT_EQ(report.at("changes").at(3).at("path"), "/name");
}

TEST(ReportJson, MatchesSchema)
{
    const auto report = semdiff::report::build_report(make_entries());
    auto result = semdiff::common::validate_json(report,
                                                 std::filesystem::path(SEMDIFF_SCHEMA_DIR),
                                                 semdiff::common::kReportSchema);
    EXPECT_TRUE(result.has_value()) << result.error().message;

    const auto empty = semdiff::report::build_report({});
    EXPECT_TRUE(empty.at("changes").is_array());
    EXPECT_EQ(empty.at("summary").at("total"), 0);
    EXPECT_TRUE(semdiff::common::validate_json(empty,
                                               std::filesystem::path(SEMDIFF_SCHEMA_DIR),
                                               semdiff::common::kReportSchema)
                    .has_value());
}

TEST(ReportText, OneLinePerEntry)
{
    const auto lines = semdiff::report::render_text(make_entries());
    ASSERT_EQ(lines.size(), 4U);
    EXPECT_EQ(lines[0], "CHANGED /items/{1}/v: 1 -> 2");
    EXPECT_EQ(lines[1], R"(REMOVED /items/{2}: {"id":"2"})");
    EXPECT_EQ(lines[2], R"(ADDED /items/{3}: {"id":"3"})");
    EXPECT_EQ(lines[3], R"(CHANGED /name: "Alice" -> null)");
}

}  // namespace
