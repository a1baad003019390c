/**
 * @file test_clustering_indexes.cpp
 * @brief k-means tree cluster centers and LSH hashing behavior
 */

#include <gtest/gtest.h>
#include <index/kmeans_index.hpp>
#include <index/lsh_index.hpp>
#include <index/result_set.hpp>
#include "../test_helpers.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>

using namespace Annex;

namespace {

IndexParameters kmeans_params(int branching) {
    IndexParameters p;
    p.algorithm = Algorithm::KMeans;
    p.branching = branching;
    p.iterations = -1;
    p.random_seed = 99;
    p.log_level = LogLevel::None;
    return p;
}

} // namespace

// =============================================================================
//  k-means tree
// =============================================================================

TEST(KMeansIndexTest, ClusterCentersLandOnBlobMeans) {
    const size_t blobs = 4;
    const auto data = test::clustered_dataset(blobs, 60, 3, 21);

    IndexParameters p = kmeans_params(4);
    p.centers_init = CentersInit::Gonzales;
    KMeansIndex<float> index(p);
    index.build(std::make_shared<Dataset<float>>(data));

    const Dataset<float> centers = index.cluster_centers(blobs);
    ASSERT_EQ(centers.rows(), blobs);
    ASSERT_EQ(centers.cols(), 3u);

    // Each blob mean has a center within the noise scale
    for (size_t b = 0; b < blobs; ++b) {
        float mean[3] = {0, 0, 0};
        for (size_t i = 0; i < 60; ++i) {
            for (size_t d = 0; d < 3; ++d) mean[d] += data[b * 60 + i][d] / 60.0f;
        }
        float best = std::numeric_limits<float>::max();
        for (size_t c = 0; c < centers.rows(); ++c) {
            best = std::min(best, Distance().evaluate<float>(mean, centers[c], 3));
        }
        EXPECT_LT(best, 1.0f) << "blob " << b;
    }
}

TEST(KMeansIndexTest, ClusterCentersNeverExceedRequest) {
    const auto data = test::random_dataset<float>(500, 4, 22);
    KMeansIndex<float> index(kmeans_params(8));
    index.build(std::make_shared<Dataset<float>>(data));

    // A cut can only grow by a whole node's children at a time
    const auto centers = index.cluster_centers(12);
    EXPECT_GE(centers.rows(), 1u);
    EXPECT_LE(centers.rows(), 12u);

    EXPECT_EQ(index.cluster_centers(1).rows(), 1u);
    EXPECT_EQ(index.cluster_centers(0).rows(), 0u);
}

TEST(KMeansIndexTest, SmallDatasetIsOneLeaf) {
    const auto data = test::random_dataset<double>(5, 2, 23);
    KMeansIndex<double> index(kmeans_params(8));
    index.build(std::make_shared<Dataset<double>>(data));

    const auto centers = index.cluster_centers(3);
    ASSERT_EQ(centers.rows(), 1u);

    double mean = 0;
    for (size_t i = 0; i < 5; ++i) mean += data[i][0] / 5.0;
    EXPECT_NEAR(centers[0][0], mean, 1e-9);
}

TEST(KMeansIndexTest, CheckBudgetLimitsApproximateSearch) {
    const auto data = test::random_dataset<float>(2000, 8, 24);
    KMeansIndex<float> index(kmeans_params(16));
    index.build(std::make_shared<Dataset<float>>(data));

    SearchParameters search;
    search.checks = 1;
    KNNResultSet<float> result(3);
    index.find_neighbors(result, data[0], search);
    EXPECT_EQ(result.size(), 3u);
}

TEST(KMeansIndexTest, UnlimitedChecksAreExactForEveryMetricWithBallPruning) {
    const auto data = test::random_dataset<double>(600, 5, 25, 10.0);
    const auto queries = test::random_dataset<double>(15, 5, 26, 10.0);

    for (DistanceType type : {DistanceType::Euclidean, DistanceType::Manhattan,
                              DistanceType::Max, DistanceType::Minkowski}) {
        IndexParameters p = kmeans_params(4);
        p.distance = type;
        p.distance_order = 3;
        KMeansIndex<double> index(p);
        index.build(std::make_shared<Dataset<double>>(data));

        const Distance metric(type, 3);
        SearchParameters search;
        search.checks = CHECKS_UNLIMITED;
        for (size_t q = 0; q < queries.rows(); ++q) {
            KNNResultSet<double> result(5);
            index.find_neighbors(result, queries[q], search);
            const auto truth = test::brute_force(data, queries[q], 5, metric);
            ASSERT_EQ(result.size(), truth.size());
            for (size_t i = 0; i < truth.size(); ++i) {
                EXPECT_NEAR(result.items()[i].distance, truth[i].distance, 1e-9)
                    << to_string(type) << " query " << q;
            }
        }
    }
}

// =============================================================================
//  LSH
// =============================================================================

TEST(LSHIndexTest, HammingBitSamplingFindsSelf) {
    const auto data = test::random_dataset<uint8_t>(500, 16, 31, 256.0);

    IndexParameters p;
    p.algorithm = Algorithm::LSH;
    p.distance = DistanceType::Hamming;
    p.table_number = 6;
    p.key_size = 16;
    p.random_seed = 5;
    p.log_level = LogLevel::None;

    LSHIndex<uint8_t> index(p);
    index.build(std::make_shared<Dataset<uint8_t>>(data));
    EXPECT_EQ(index.table_count(), 6u);

    const Distance hamming(DistanceType::Hamming);
    for (size_t row = 0; row < data.rows(); row += 13) {
        KNNResultSet<float> result(4);
        index.find_neighbors(result, data[row], SearchParameters{});
        ASSERT_FALSE(result.items().empty());
        EXPECT_EQ(result.items()[0].index, row);
        EXPECT_EQ(result.items()[0].distance, 0.0f);

        // Every returned distance is the true one
        for (const auto& n : result.items()) {
            EXPECT_EQ(n.distance, hamming.evaluate<float>(data[row], data[n.index], 16));
        }
    }
}

TEST(LSHIndexTest, HyperplaneHashingFindsSelfAndNewPoints) {
    const auto data = test::clustered_dataset(8, 50, 6, 32);
    const auto extra = test::clustered_dataset(2, 10, 6, 33);

    IndexParameters p;
    p.algorithm = Algorithm::LSH;
    p.table_number = 4;
    p.key_size = 10;
    p.multi_probe_level = 0;
    p.random_seed = 6;
    p.log_level = LogLevel::None;

    LSHIndex<float> index(p);
    index.build(std::make_shared<Dataset<float>>(data));
    index.add_points(extra.view(), 0.0f);
    ASSERT_EQ(index.size(), 420u);

    for (size_t row = 0; row < 420; row += 11) {
        const float* q = row < 400 ? data[row] : extra[row - 400];
        KNNResultSet<float> result(1);
        index.find_neighbors(result, q, SearchParameters{});
        ASSERT_EQ(result.size(), 1u);
        EXPECT_EQ(result.items()[0].index, row);
    }
}

TEST(LSHIndexTest, MultiProbeNeverLosesCandidates) {
    const auto data = test::clustered_dataset(10, 40, 8, 34);
    const auto queries = test::random_dataset<float>(20, 8, 35, 100.0);

    IndexParameters p;
    p.algorithm = Algorithm::LSH;
    p.table_number = 3;
    p.key_size = 8;
    p.random_seed = 7;
    p.log_level = LogLevel::None;

    p.multi_probe_level = 0;
    LSHIndex<float> narrow(p);
    narrow.build(std::make_shared<Dataset<float>>(data));
    p.multi_probe_level = 2;
    LSHIndex<float> wide(p);
    wide.build(std::make_shared<Dataset<float>>(data));

    // Same seed, same tables: probing more buckets can only improve the answer
    for (size_t q = 0; q < queries.rows(); ++q) {
        KNNResultSet<float> a(1);
        KNNResultSet<float> b(1);
        narrow.find_neighbors(a, queries[q], SearchParameters{});
        wide.find_neighbors(b, queries[q], SearchParameters{});
        if (a.size() == 0) continue;
        ASSERT_EQ(b.size(), 1u);
        EXPECT_LE(b.items()[0].distance, a.items()[0].distance);
    }
}

TEST(LSHIndexTest, BuildRejectsProbeLevelBeyondLimit) {
    const auto data = test::random_dataset<float>(50, 4, 36);

    IndexParameters p;
    p.algorithm = Algorithm::LSH;
    p.table_number = 1;
    p.key_size = 32;
    p.multi_probe_level = 32;
    p.log_level = LogLevel::None;

    LSHIndex<float> index(p);
    EXPECT_THROW(index.build(std::make_shared<Dataset<float>>(data)), ConfigError);
}
