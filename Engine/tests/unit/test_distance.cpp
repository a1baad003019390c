/**
 * @file test_distance.cpp
 * @brief Unit tests for the metric functors
 */

#include <gtest/gtest.h>
#include <distance/distance.hpp>
#include "../test_helpers.hpp"
#include <cmath>
#include <vector>

using namespace Annex;

TEST(DistanceTest, EuclideanIsSquared) {
    const float a[] = {0, 0, 0};
    const float b[] = {1, 2, 2};
    EXPECT_FLOAT_EQ((Distance(DistanceType::Euclidean).evaluate<float>(a, b, 3)), 9.0f);
}

TEST(DistanceTest, ManhattanMaxMinkowski) {
    const float a[] = {0, 0, 0};
    const float b[] = {1, -2, 2};

    EXPECT_FLOAT_EQ((Distance(DistanceType::Manhattan).evaluate<float>(a, b, 3)), 5.0f);
    EXPECT_FLOAT_EQ((Distance(DistanceType::Max).evaluate<float>(a, b, 3)), 2.0f);
    EXPECT_FLOAT_EQ((Distance(DistanceType::Minkowski, 3).evaluate<float>(a, b, 3)), 17.0f);
}

TEST(DistanceTest, HistogramMetrics) {
    const float a[] = {0.25f, 0.75f};
    const float b[] = {0.5f, 0.5f};

    EXPECT_FLOAT_EQ((Distance(DistanceType::HistIntersect).evaluate<float>(a, b, 2)), 0.75f);

    const float hellinger = Distance(DistanceType::Hellinger).evaluate<float>(a, b, 2);
    const float expected = std::pow(0.5f - std::sqrt(0.5f), 2.0f) + std::pow(std::sqrt(0.75f) - std::sqrt(0.5f), 2.0f);
    EXPECT_NEAR(hellinger, expected, 1e-6);

    const float chi = Distance(DistanceType::ChiSquare).evaluate<float>(a, b, 2);
    EXPECT_NEAR(chi, 0.0625f / 0.75f + 0.0625f / 1.25f, 1e-6);

    // KL of identical histograms vanishes
    EXPECT_NEAR((Distance(DistanceType::KullbackLeibler).evaluate<float>(a, a, 2)), 0.0f, 1e-7);
}

TEST(DistanceTest, HammingCountsDifferingBits) {
    const uint8_t a[] = {0xFF, 0x00, 0xAA};
    const uint8_t b[] = {0x0F, 0x00, 0x55};
    EXPECT_FLOAT_EQ((Distance(DistanceType::Hamming).evaluate<float>(a, b, 3)), 12.0f);

    const int32_t x[] = {0, -1};
    const int32_t y[] = {1, -1};
    EXPECT_FLOAT_EQ((Distance(DistanceType::Hamming).evaluate<float>(x, y, 2)), 1.0f);
}

TEST(DistanceTest, HammingRejectsFloatingPoint) {
    const float a[] = {1.0f};
    EXPECT_THROW((Distance(DistanceType::Hamming).evaluate<float>(a, a, 1)), ConfigError);
}

TEST(DistanceTest, EarlyAbandonExceedsBound) {
    std::vector<float> a(16, 0.0f);
    std::vector<float> b(16, 1.0f);
    const Distance l2(DistanceType::Euclidean);

    EXPECT_FLOAT_EQ(l2.evaluate<float>(a.data(), b.data(), 16), 16.0f);
    EXPECT_GT(l2.evaluate<float>(a.data(), b.data(), 16, 2.0f), 2.0f);
}

TEST(DistanceTest, VectorizedMatchesScalarReference) {
    auto data = test::random_dataset<float>(2, 37, 7);
    double expected = 0;
    for (size_t i = 0; i < 37; ++i) {
        const double d = static_cast<double>(data[0][i]) - static_cast<double>(data[1][i]);
        expected += d * d;
    }
    EXPECT_NEAR((Distance().evaluate<float>(data[0], data[1], 37)), expected, 1e-4);
}

TEST(DistanceTest, AccumDistSumsToFullDistance) {
    const float a[] = {1, 4, -2, 0.5f};
    const float b[] = {3, 1, 2, 0.5f};

    for (DistanceType type : {DistanceType::Euclidean, DistanceType::Manhattan}) {
        const Distance metric(type);
        float sum = 0;
        for (size_t i = 0; i < 4; ++i) sum += metric.accum_dist<float>(a[i], b[i]);
        EXPECT_FLOAT_EQ(sum, metric.evaluate<float>(a, b, 4));
    }
}

TEST(DistanceTest, MixedOperandTypes) {
    const double pivot[] = {0.5, 0.5};
    const uint8_t row[] = {1, 2};
    EXPECT_DOUBLE_EQ((Distance().evaluate<double>(pivot, row, 2)), 0.25 + 2.25);
}

TEST(DistanceTest, FamilyCompatibility) {
    EXPECT_TRUE(Distance(DistanceType::Euclidean).is_kdtree_compatible());
    EXPECT_FALSE(Distance(DistanceType::Max).is_kdtree_compatible());
    EXPECT_FALSE(Distance(DistanceType::Hamming).is_kdtree_compatible());
    EXPECT_TRUE(Distance(DistanceType::Max).is_vector_space());
    EXPECT_FALSE(Distance(DistanceType::Hamming).is_vector_space());
}

TEST(DistanceTest, HellingerDomainExcludesNegativeValues) {
    const Distance hellinger(DistanceType::Hellinger);
    const int32_t signed_rows[] = {4, 0, -1};
    const float floats[] = {0.25f, 0.0f};
    const uint8_t bytes[] = {0, 255};

    EXPECT_THROW(hellinger.check_domain(signed_rows, 3), ConfigError);
    EXPECT_NO_THROW(hellinger.check_domain(signed_rows, 2));
    EXPECT_NO_THROW(hellinger.check_domain(floats, 2));
    EXPECT_NO_THROW(hellinger.check_domain(bytes, 2));

    // Other metrics accept any sign
    EXPECT_NO_THROW(Distance(DistanceType::Manhattan).check_domain(signed_rows, 3));
}
