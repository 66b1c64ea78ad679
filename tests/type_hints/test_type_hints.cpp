/**
 * @file test_type_hints.cpp
 * @brief Type hint providers, inference depth and schema inference
 */

#include "semdiff/type_hints.hpp"

#include <map>
#include <string>

#include <gtest/gtest.h>

namespace {

using nlohmann::json;

TEST(MapTypeHints, Resolve)
{
    const semdiff::MapTypeHints hints(std::map<std::string, std::string>{
        {"/price", "Money"}
    });
    EXPECT_EQ(hints.resolve("/price"), "Money");
    EXPECT_EQ(hints.resolve("/other"), std::nullopt);
    EXPECT_EQ(hints.entries().size(), 1U);
}

TEST(InferenceDepth, Defaults)
{
    EXPECT_EQ(semdiff::InferenceDepth{}.max_depth_for("/any"), 1);
    EXPECT_EQ(semdiff::InferenceDepth::stop_at_first_reference().max_depth_for("/any"), 0);
    EXPECT_GT(semdiff::InferenceDepth::unlimited().max_depth_for("/any"), 1000);
}

TEST(InferenceDepth, LongestPrefixThenPatternThenDefault)
{
    semdiff::InferenceDepthBuilder builder;
    ASSERT_TRUE(builder.default_max_depth(2).has_value());
    ASSERT_TRUE(builder.max_depth_for_prefix("/tree", 3).has_value());
    ASSERT_TRUE(builder.max_depth_for_prefix("/tree/left", 5).has_value());
    auto pattern = semdiff::glob::compile_glob("/**/children");
    ASSERT_TRUE(pattern.has_value());
    ASSERT_TRUE(builder.max_depth_for_pattern(*pattern, 0).has_value());
    const auto depth = builder.build();

    EXPECT_EQ(depth.max_depth_for("/tree/left/x"), 5);
    EXPECT_EQ(depth.max_depth_for("/tree/right"), 3);
    EXPECT_EQ(depth.max_depth_for("/tree"), 3);
    EXPECT_EQ(depth.max_depth_for("/org/children"), 0);
    EXPECT_EQ(depth.max_depth_for("/org"), 2);
    EXPECT_EQ(depth.default_max_depth(), 2);
}

TEST(InferenceDepth, NegativeDepthRejected)
{
    semdiff::InferenceDepthBuilder builder;
    EXPECT_EQ(builder.default_max_depth(-1).error().code, "InvalidDepth");
    EXPECT_EQ(builder.max_depth_for_prefix("/a", -2).error().code, "InvalidDepth");
    EXPECT_EQ(builder.max_depth_for_prefix("", 1).error().code, "InvalidPath");
    EXPECT_EQ(builder.max_depth_for_pattern(nullptr, 1).error().code, "InvalidPattern");
}

TEST(InferTypeHints, LeavesLabelledByRefTitleOrType)
{
    const json schema = json::parse(R"({
        "type": "object",
        "properties": {
            "price": {"$ref": "#/$defs/Money"},
            "created": {"type": "string", "format": "date-time"},
            "name": {"type": "string", "title": "PersonName"},
            "count": {"type": ["integer", "null"]},
            "items": {
                "type": "array",
                "items": {
                    "type": "object",
                    "properties": {
                        "cost": {"$ref": "#/definitions/Money"},
                        "tag": {"allOf": [{"$ref": "#/$defs/Tag"}]}
                    }
                }
            }
        },
        "$defs": {
            "Money": {"type": "number"},
            "Tag": {"type": "string"}
        },
        "definitions": {
            "Money": {"type": "number"}
        }
    })");

    auto hints = semdiff::infer_type_hints(schema);
    ASSERT_TRUE(hints.has_value()) << hints.error().message;
    const auto& entries = hints->entries();
    EXPECT_EQ(entries.at("/price"), "Money");
    EXPECT_EQ(entries.at("/created"), "string:date-time");
    EXPECT_EQ(entries.at("/name"), "PersonName");
    EXPECT_EQ(entries.at("/count"), "integer");
    EXPECT_EQ(entries.at("/items/cost"), "Money");
    EXPECT_EQ(entries.at("/items/tag"), "Tag");
    EXPECT_FALSE(entries.contains("/items"));
}

[[nodiscard]] json make_recursive_schema()
{
    return json::parse(R"({
        "$ref": "#/$defs/Node",
        "$defs": {
            "Node": {
                "type": "object",
                "properties": {
                    "value": {"type": "integer"},
                    "child": {"$ref": "#/$defs/Node"}
                }
            }
        }
    })");
}

TEST(InferTypeHints, SelfReferenceStopsAtDepth)
{
    auto zero = semdiff::infer_type_hints(make_recursive_schema(),
                                          semdiff::InferenceDepth::stop_at_first_reference());
    ASSERT_TRUE(zero.has_value());
    EXPECT_EQ(zero->entries().at("/value"), "integer");
    EXPECT_EQ(zero->entries().at("/child"), "Node");
    EXPECT_FALSE(zero->entries().contains("/child/value"));

    auto one = semdiff::infer_type_hints(make_recursive_schema());
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one->entries().at("/child/value"), "integer");
    EXPECT_EQ(one->entries().at("/child/child"), "Node");
    EXPECT_FALSE(one->entries().contains("/child/child/value"));
}

TEST(InferTypeHints, PerPrefixDepth)
{
    semdiff::InferenceDepthBuilder builder;
    ASSERT_TRUE(builder.default_max_depth(0).has_value());
    ASSERT_TRUE(builder.max_depth_for_prefix("/child", 2).has_value());

    auto hints = semdiff::infer_type_hints(make_recursive_schema(), builder.build());
    ASSERT_TRUE(hints.has_value());
    EXPECT_EQ(hints->entries().at("/child/child/value"), "integer");
    EXPECT_EQ(hints->entries().at("/child/child/child"), "Node");
}

TEST(InferTypeHints, RootSelfReference)
{
    const json schema = json::parse(R"({
        "title": "Tree",
        "type": "object",
        "properties": {
            "label": {"type": "string"},
            "kids": {"type": "array", "items": {"$ref": "#"}}
        }
    })");

    auto hints = semdiff::infer_type_hints(schema, semdiff::InferenceDepth::stop_at_first_reference());
    ASSERT_TRUE(hints.has_value());
    EXPECT_EQ(hints->entries().at("/label"), "string");
    EXPECT_EQ(hints->entries().at("/kids/label"), "string");
    EXPECT_EQ(hints->entries().at("/kids/kids"), "Tree");
}

TEST(InferTypeHints, InvalidReferences)
{
    auto missing = semdiff::infer_type_hints(json::parse(R"({"$ref": "#/$defs/Nope"})"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, "InvalidSchema");

    auto remote = semdiff::infer_type_hints(json::parse(R"({"$ref": "http://x/y.json"})"));
    ASSERT_FALSE(remote.has_value());
    EXPECT_EQ(remote.error().code, "InvalidSchema");

    auto not_object = semdiff::infer_type_hints(json::parse("[]"));
    ASSERT_FALSE(not_object.has_value());
    EXPECT_EQ(not_object.error().code, "InvalidSchema");
}

}  // namespace
