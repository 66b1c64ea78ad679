/**
 * @file test_determinism.cpp
 * @brief Output order does not depend on input order or repetition
 */

#include "semdiff/diff.hpp"
#include "semdiff/report.hpp"

#include <algorithm>
#include <format>
#include <random>

#include <gtest/gtest.h>

namespace {

using nlohmann::json;

[[nodiscard]] semdiff::Configuration make_config()
{
    semdiff::ConfigurationBuilder builder;
    EXPECT_TRUE(builder.list("/orders", *semdiff::ListRule::id("orderId")).has_value());
    EXPECT_TRUE(builder.list("/orders/lines", *semdiff::ListRule::id("/sku/code")).has_value());
    EXPECT_TRUE(builder.ignore_glob("/orders/*/audit").has_value());
    return builder.build();
}

[[nodiscard]] json make_orders(int count, int variant)
{
    json orders = json::array();
    for (int i = 0; i < count; ++i) {
        json lines = json::array();
        for (int j = 0; j < 4; ++j) {
            lines.push_back({
                {"sku", {{"code", std::format("S{}-{}", i, j)}}},
                {"qty", (i + j + variant) % 3}
            });
        }
        orders.push_back({
            {"orderId", std::format("O{}", i)},
            {"lines", lines},
            {"audit", variant},
            {"status", i % 2 == 0 ? "open" : (variant == 0 ? "open" : "closed")}
        });
    }
    return json{
        {"orders", orders}
    };
}

void shuffle_arrays(json& node, std::mt19937& rng)
{
    if (node.is_array()) {
        std::shuffle(node.begin(), node.end(), rng);
    }
    if (node.is_structured()) {
        for (auto& child : node) {
            shuffle_arrays(child, rng);
        }
    }
}

TEST(Determinism, RepeatedComparisonsAreIdentical)
{
    const auto config = make_config();
    const json left = make_orders(12, 0);
    const json right = make_orders(10, 1);

    const auto first = semdiff::compare(left, right, config);
    ASSERT_FALSE(first.empty());
    for (int run = 0; run < 5; ++run) {
        EXPECT_EQ(semdiff::compare(left, right, config), first);
    }
}

TEST(Determinism, IdentityArraysAreOrderInsensitive)
{
    const auto config = make_config();
    const json left = make_orders(8, 0);
    const json right = make_orders(9, 2);
    const auto expected = semdiff::compare(left, right, config);

    std::mt19937 rng(20240601U);
    for (int run = 0; run < 5; ++run) {
        json shuffled_left = left;
        json shuffled_right = right;
        shuffle_arrays(shuffled_left, rng);
        shuffle_arrays(shuffled_right, rng);
        EXPECT_EQ(semdiff::compare(shuffled_left, shuffled_right, config), expected);
    }
}

TEST(Determinism, FieldOrderInSourceTextIsIrrelevant)
{
    const auto a = json::parse(R"({"z": 1, "a": {"y": 1, "b": 2}})");
    const auto b = json::parse(R"({"a": {"b": 3, "y": 1}, "z": 2})");
    const auto reordered = json::parse(R"({"a": {"y": 1, "b": 3}, "z": 2})");

    EXPECT_EQ(semdiff::compare(a, b, {}), semdiff::compare(a, reordered, {}));
}

TEST(Determinism, ReportTextIsStable)
{
    const auto config = make_config();
    const auto entries = semdiff::compare(make_orders(3, 0), make_orders(4, 1), config);
    const auto lines = semdiff::report::render_text(entries);
    EXPECT_EQ(lines, semdiff::report::render_text(semdiff::compare(make_orders(3, 0),
                                                                   make_orders(4, 1),
                                                                   config)));
}

}  // namespace
