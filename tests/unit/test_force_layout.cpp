/**
 * @file test_force_layout.cpp
 * @brief Unit tests for force-field membership and position seeding
 */

#include <gtest/gtest.h>
#include <layout/force_layout.hpp>

using namespace Databrain;

TEST(ForceLayoutTest, DefaultFieldsAreSeeded) {
    auto fields = ForceLayout::default_fields();
    ASSERT_EQ(fields.size(), 5u);
    for (const auto& f : fields) {
        EXPECT_FALSE(f.id.empty());
        EXPECT_FALSE(f.keywords.empty());
        EXPECT_GT(f.cluster_id, 0);
    }
}

TEST(ForceLayoutTest, KeywordMatchIsCaseInsensitiveSubstring) {
    auto fields = ForceLayout::default_fields();

    auto risk = ForceLayout::match_field("Card FRAUD signals", fields);
    ASSERT_TRUE(risk.has_value());
    EXPECT_EQ(risk->id, "risk");

    EXPECT_FALSE(ForceLayout::match_field("Quarterly offsite", fields).has_value());
}

TEST(ForceLayoutTest, FirstFieldByIdWins) {
    auto fields = ForceLayout::default_fields();

    // "customer" and "risk" both match; ids sort customer < risk
    auto match = ForceLayout::match_field("Customer risk scoring", fields);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->id, "customer");

    // "compliance" (policy) sorts before "finance" (budget)
    match = ForceLayout::match_field("Budget policy", fields);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->id, "compliance");
}

TEST(ForceLayoutTest, PlacementInsideMatchedField) {
    ForceLayout layout;
    auto fields = ForceLayout::default_fields();

    for (const char* key : {"n_1", "n_2", "n_3", "n_4", "n_5", "n_6"}) {
        Placement p = layout.place("Revenue forecast", key, fields);
        ASSERT_TRUE(p.field_id.has_value());
        EXPECT_EQ(*p.field_id, "finance");
        EXPECT_EQ(p.cluster_id, 4);

        Eigen::Vector2d center(240.0, 200.0);
        EXPECT_LE((p.position - center).norm(), 150.0 * 0.9 + 1e-9);
    }
}

TEST(ForceLayoutTest, UnmatchedNodesSitOnTheRing) {
    ForceLayout layout;
    Placement p = layout.place("Quarterly offsite", "n_abc", ForceLayout::default_fields());

    EXPECT_FALSE(p.field_id.has_value());
    EXPECT_EQ(p.cluster_id, 0);
    EXPECT_GE(p.position.norm(), 500.0 - 1e-9);
    EXPECT_LE(p.position.norm(), 500.0 * 1.25 + 1e-9);
}

TEST(ForceLayoutTest, PlacementIsDeterministicPerKey) {
    ForceLayout layout;
    auto fields = ForceLayout::default_fields();

    Placement a = layout.place("Payment retries", "n_same", fields);
    Placement b = layout.place("Payment retries", "n_same", fields);
    Placement c = layout.place("Payment retries", "n_other", fields);

    EXPECT_EQ(a.position, b.position);
    EXPECT_NE(a.position, c.position);
}

TEST(ForceLayoutTest, WeightedCentroid) {
    auto c = ForceLayout::weighted_centroid(Eigen::Vector2d(0.0, 0.0), 1.0, Eigen::Vector2d(10.0, 0.0), 3.0);
    EXPECT_DOUBLE_EQ(c.x(), 7.5);
    EXPECT_DOUBLE_EQ(c.y(), 0.0);

    auto degenerate = ForceLayout::weighted_centroid(Eigen::Vector2d(1.0, 2.0), 0.0, Eigen::Vector2d(5.0, 5.0), 0.0);
    EXPECT_DOUBLE_EQ(degenerate.x(), 1.0);
}
