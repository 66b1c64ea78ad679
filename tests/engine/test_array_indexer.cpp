/**
 * @file test_array_indexer.cpp
 * @brief Identity extraction and indexing of array elements
 */

#include "engine/array_indexer.hpp"

#include <gtest/gtest.h>

namespace {

using semdiff::engine::build_index;
using semdiff::engine::identity_of;

TEST(ArrayIndexer, FieldIdentityTextualForms)
{
    const auto rule = *semdiff::ListRule::id("id");
    EXPECT_EQ(identity_of({{"id", "abc"}}, rule), "abc");
    EXPECT_EQ(identity_of({{"id", 42}}, rule), "42");
    EXPECT_EQ(identity_of({{"id", true}}, rule), "true");
    EXPECT_EQ(identity_of({{"id", 1.5}}, rule), "1.5");
    EXPECT_EQ(identity_of({{"id", {1, 2}}}, rule), "[1,2]");
    EXPECT_EQ(identity_of({{"id", {{"k", "v"}}}}, rule), R"({"k":"v"})");
}

TEST(ArrayIndexer, MissingOrNullIdentityUsesSentinel)
{
    const auto rule = *semdiff::ListRule::id("id");
    EXPECT_EQ(identity_of({{"name", "x"}}, rule), "<null>");
    EXPECT_EQ(identity_of({{"id", nullptr}}, rule), "<null>");
}

TEST(ArrayIndexer, PointerIdentity)
{
    const auto rule = *semdiff::ListRule::id("/meta/taskId");
    EXPECT_EQ(identity_of({{"meta", {{"taskId", "t-1"}}}}, rule), "t-1");
    EXPECT_EQ(identity_of({{"meta", nlohmann::json::object()}}, rule), "<null>");
    EXPECT_EQ(identity_of({{"meta", "flat"}}, rule), "<null>");
}

TEST(ArrayIndexer, SkipsNonObjectsAndKeepsInsertionOrder)
{
    const auto rule = *semdiff::ListRule::id("id");
    const nlohmann::json array = nlohmann::json::parse(R"([
        {"id": "b", "v": 1},
        "scalar",
        {"id": "a", "v": 2},
        [1, 2],
        {"v": 3}
    ])");

    const auto index = build_index(array, rule);
    ASSERT_EQ(index.size(), 3U);
    EXPECT_EQ(index.keys(), (std::vector<std::string>{"b", "a", "<null>"}));
    ASSERT_NE(index.find("a"), nullptr);
    EXPECT_EQ(index.find("a")->at("v"), 2);
    EXPECT_EQ(index.find("zzz"), nullptr);
}

TEST(ArrayIndexer, LastDuplicateWinsAtFirstPosition)
{
    const auto rule = *semdiff::ListRule::id("id");
    const nlohmann::json array = nlohmann::json::parse(R"([
        {"id": "x", "v": 1},
        {"id": "y", "v": 2},
        {"id": "x", "v": 3}
    ])");

    const auto index = build_index(array, rule);
    EXPECT_EQ(index.keys(), (std::vector<std::string>{"x", "y"}));
    ASSERT_NE(index.find("x"), nullptr);
    EXPECT_EQ(index.find("x")->at("v"), 3);
}

TEST(ArrayIndexer, KeysAreNotEscaped)
{
    const auto rule = *semdiff::ListRule::id("id");
    const nlohmann::json array = nlohmann::json::parse(R"([{"id": "a/b~c"}])");
    const auto index = build_index(array, rule);
    EXPECT_EQ(index.keys(), (std::vector<std::string>{"a/b~c"}));
}

}  // namespace
