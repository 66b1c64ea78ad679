/**
 * @file test_tree.cpp
 * @brief Tree factory and file helpers
 */

#include "semdiff/tree.hpp"

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

namespace {

class TreeFileTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_dir = std::filesystem::temp_directory_path() / "semdiff_tree_test";
        std::filesystem::remove_all(m_dir);
    }

    void TearDown() override { std::filesystem::remove_all(m_dir); }

    std::filesystem::path m_dir;
};

TEST(TreeFactory, ParsesText)
{
    auto tree = semdiff::parse_tree(R"({"a": [1, "x", null]})");
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->at("a").size(), 3U);
}

TEST(TreeFactory, RejectsMalformedText)
{
    auto tree = semdiff::parse_tree(R"({"a": )");
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, "ParseError");

    auto trailing = semdiff::parse_tree("{} {}");
    ASSERT_FALSE(trailing.has_value());
    EXPECT_EQ(trailing.error().code, "ParseError");
}

TEST(TreeFactory, UsableThroughInterface)
{
    const semdiff::JsonTreeFactory json_factory;
    const semdiff::TreeFactory& factory = json_factory;
    auto tree = factory.from_text("[true]");
    ASSERT_TRUE(tree.has_value());
    EXPECT_TRUE(tree->at(0).get<bool>());
}

TEST_F(TreeFileTest, WritesAndReadsBack)
{
    const auto path = m_dir / "nested" / "doc.json";
    ASSERT_TRUE(semdiff::write_text_file(path, R"({"k": "v"})").has_value());

    auto tree = semdiff::read_tree_file(path);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->at("k"), "v");
}

TEST_F(TreeFileTest, MissingFileIsIOError)
{
    auto tree = semdiff::read_tree_file(m_dir / "absent.json");
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, "IOError");
}

TEST_F(TreeFileTest, MalformedFileIsParseError)
{
    const auto path = m_dir / "broken.json";
    ASSERT_TRUE(semdiff::write_text_file(path, "[1, 2").has_value());

    auto tree = semdiff::read_tree_file(path);
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, "ParseError");
    EXPECT_NE(tree.error().message.find("broken.json"), std::string::npos);
}

}  // namespace
