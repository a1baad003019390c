/**
 * @file test_result_set.cpp
 * @brief Unit tests for the k-NN, radius and filtered result collectors
 */

#include <gtest/gtest.h>
#include <index/result_set.hpp>
#include <limits>
#include <vector>

using namespace Annex;

TEST(KNNResultSetTest, KeepsClosestInOrder) {
    KNNResultSet<float> result(3);
    EXPECT_FALSE(result.full());
    EXPECT_EQ(result.worst_dist(), std::numeric_limits<float>::max());

    result.add_point(5.0f, 0);
    result.add_point(1.0f, 1);
    result.add_point(3.0f, 2);
    result.add_point(4.0f, 3);
    result.add_point(0.5f, 4);

    ASSERT_TRUE(result.full());
    const auto& items = result.items();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].index, 4u);
    EXPECT_EQ(items[1].index, 1u);
    EXPECT_EQ(items[2].index, 2u);
    EXPECT_FLOAT_EQ(result.worst_dist(), 3.0f);
}

TEST(KNNResultSetTest, TiesBreakByIndex) {
    KNNResultSet<double> result(2);
    result.add_point(1.0, 9);
    result.add_point(1.0, 3);
    result.add_point(1.0, 5);

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result.items()[0].index, 3u);
    EXPECT_EQ(result.items()[1].index, 5u);
}

TEST(KNNResultSetTest, CollapsesDuplicateIds) {
    KNNResultSet<float> result(3);
    result.add_point(2.0f, 7);
    result.add_point(2.0f, 7);
    result.add_point(1.0f, 8);

    EXPECT_EQ(result.size(), 2u);
    EXPECT_FALSE(result.full());
}

TEST(KNNResultSetTest, ZeroCapacityIgnoresEverything) {
    KNNResultSet<float> result(0);
    result.add_point(1.0f, 0);
    EXPECT_EQ(result.size(), 0u);
}

TEST(RadiusResultSetTest, CollectsWithinRadius) {
    RadiusResultSet<float> result(2.0f);
    EXPECT_TRUE(result.full());

    result.add_point(3.0f, 0);
    result.add_point(2.0f, 1);
    result.add_point(0.5f, 2);
    result.add_point(0.5f, 2);
    result.add_point(1.0f, 3);

    const auto hits = result.take(true);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].index, 2u);
    EXPECT_EQ(hits[1].index, 3u);
    EXPECT_EQ(hits[2].index, 1u);
}

TEST(RadiusResultSetTest, UnsortedOrdersById) {
    RadiusResultSet<float> result(10.0f);
    result.add_point(1.0f, 5);
    result.add_point(2.0f, 1);

    const auto hits = result.take(false);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].index, 1u);
    EXPECT_EQ(hits[1].index, 5u);
}

TEST(FilteredResultSetTest, DropsRemovedIds) {
    KNNResultSet<float> inner(5);
    std::vector<uint8_t> removed = {0, 1, 0};
    FilteredResultSet<float> filtered(inner, removed);

    filtered.add_point(1.0f, 0);
    filtered.add_point(0.1f, 1);
    filtered.add_point(2.0f, 2);

    ASSERT_EQ(inner.size(), 2u);
    EXPECT_EQ(inner.items()[0].index, 0u);
    EXPECT_EQ(inner.items()[1].index, 2u);
}
