/**
 * @file test_interop_api.cpp
 * @brief Functional tests for the C API: typed entry points, status codes and last-error reporting
 *
 * These tests use the exact call patterns a foreign caller would: flat
 * buffers, int shapes and a NULL-or-filled AnnexParameters struct.
 */

#include <gtest/gtest.h>
#include <interop_api.h>
#include "../test_helpers.hpp"
#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace {

AnnexParameters quiet_defaults() {
    AnnexParameters p;
    annex_default_parameters(&p);
    p.log_level = 0;
    p.random_seed = 11;
    return p;
}

} // namespace

class InteropApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        annex_log_verbosity(0);
        const auto data = Annex::test::random_dataset<float>(rows_, cols_, 100);
        data_.assign(data.data(), data.data() + rows_ * cols_);
    }

    void TearDown() override { std::remove(path_.c_str()); }

    const int rows_ = 400;
    const int cols_ = 6;
    std::vector<float> data_;
    std::string path_ = Annex::test::temp_path("interop.idx");
};

TEST_F(InteropApiTest, DefaultParametersMatchDocumentedValues) {
    AnnexParameters p;
    std::memset(&p, 0xFF, sizeof(p));
    ASSERT_EQ(annex_default_parameters(&p), ANNEX_OK);

    EXPECT_EQ(p.algorithm, 1);       // kdtree
    EXPECT_EQ(p.checks, 32);
    EXPECT_EQ(p.trees, 1);
    EXPECT_EQ(p.branching, 32);
    EXPECT_EQ(p.table_number_, 12u);
    EXPECT_EQ(p.key_size_, 20u);
    EXPECT_EQ(p.multi_probe_level_, 2u);
    EXPECT_EQ(p.distance, 1);        // euclidean
    EXPECT_EQ(p.random_seed, -1);

    EXPECT_EQ(annex_default_parameters(nullptr), ANNEX_ERROR_CONFIG);
    EXPECT_STRNE(annex_get_last_error(), "");
}

TEST_F(InteropApiTest, BuildSearchFreeLifecycle) {
    AnnexParameters p = quiet_defaults();
    p.trees = 4;
    float speedup = 0;

    const annex_index_t index = annex_build_index_float(data_.data(), rows_, cols_, &speedup, &p);
    ASSERT_NE(index, 0u) << annex_get_last_error();
    EXPECT_FLOAT_EQ(speedup, 1.0f);
    EXPECT_GT(annex_used_memory_float(index), 0);

    const int k = 3;
    std::vector<int> indices(static_cast<size_t>(10 * k));
    std::vector<float> dists(static_cast<size_t>(10 * k));
    p.checks = -1;
    ASSERT_EQ(annex_find_nearest_neighbors_index_float(index, data_.data(), 10, cols_, indices.data(), dists.data(),
                                                       k, &p),
              ANNEX_OK);
    for (int q = 0; q < 10; ++q) {
        EXPECT_EQ(indices[static_cast<size_t>(q * k)], q);
        EXPECT_EQ(dists[static_cast<size_t>(q * k)], 0.0f);
    }

    ASSERT_EQ(annex_free_index_float(index, nullptr), ANNEX_OK);
    EXPECT_EQ(annex_free_index_float(index, nullptr), ANNEX_ERROR_HANDLE);
    EXPECT_EQ(annex_get_last_error_kind(), ANNEX_ERROR_HANDLE);
    EXPECT_EQ(annex_used_memory_float(index), ANNEX_ERROR_HANDLE);
}

TEST_F(InteropApiTest, FailuresReportStatusAndMessage) {
    AnnexParameters p = quiet_defaults();

    p.algorithm = 42;
    EXPECT_EQ(annex_build_index_float(data_.data(), rows_, cols_, nullptr, &p), 0u);
    EXPECT_EQ(annex_get_last_error_kind(), ANNEX_ERROR_CONFIG);

    // k-d trees cannot use Hamming distance
    p = quiet_defaults();
    p.distance = 9;
    EXPECT_EQ(annex_build_index_float(data_.data(), rows_, cols_, nullptr, &p), 0u);
    EXPECT_EQ(annex_get_last_error_kind(), ANNEX_ERROR_CONFIG);

    p = quiet_defaults();
    EXPECT_EQ(annex_build_index_float(data_.data(), 0, cols_, nullptr, &p), 0u);
    EXPECT_EQ(annex_get_last_error_kind(), ANNEX_ERROR_DIMENSION);
    EXPECT_EQ(annex_build_index_float(nullptr, rows_, cols_, nullptr, &p), 0u);
    EXPECT_EQ(annex_get_last_error_kind(), ANNEX_ERROR_DIMENSION);

    EXPECT_EQ(annex_remove_point_float(0, 1), ANNEX_ERROR_HANDLE);
    EXPECT_NE(std::string(annex_get_last_error()).find("handle"), std::string::npos);
}

TEST_F(InteropApiTest, WrongElementTypeAndDimension) {
    AnnexParameters p = quiet_defaults();
    const annex_index_t index = annex_build_index_float(data_.data(), rows_, cols_, nullptr, &p);
    ASSERT_NE(index, 0u);

    std::vector<int> indices(1);
    std::vector<double> ddists(1);
    std::vector<double> query(static_cast<size_t>(cols_), 0.5);
    EXPECT_EQ(annex_find_nearest_neighbors_index_double(index, query.data(), 1, cols_, indices.data(), ddists.data(),
                                                        1, nullptr),
              ANNEX_ERROR_DIMENSION);

    std::vector<float> fdists(1);
    EXPECT_EQ(annex_find_nearest_neighbors_index_float(index, data_.data(), 1, cols_ - 1, indices.data(),
                                                       fdists.data(), 1, nullptr),
              ANNEX_ERROR_DIMENSION);
    EXPECT_EQ(annex_remove_point_float(index, static_cast<unsigned>(rows_)), ANNEX_ERROR_DIMENSION);

    EXPECT_EQ(annex_free_index_double(index, nullptr), ANNEX_ERROR_DIMENSION);
    EXPECT_EQ(annex_free_index_float(index, nullptr), ANNEX_OK);
}

TEST_F(InteropApiTest, AddRemoveAndRadius) {
    AnnexParameters p = quiet_defaults();
    p.algorithm = 0;  // linear
    const annex_index_t index = annex_build_index_float(data_.data(), rows_, cols_, nullptr, &p);
    ASSERT_NE(index, 0u);

    std::vector<float> point(static_cast<size_t>(cols_), 7.0f);
    ASSERT_EQ(annex_add_points_float(index, point.data(), 1, cols_, 2.0f), ANNEX_OK);

    std::vector<int> indices(4);
    std::vector<float> dists(4);
    EXPECT_EQ(annex_radius_search_float(index, point.data(), cols_, indices.data(), dists.data(), 4, 0.01f,
                                        nullptr, &p),
              1);
    EXPECT_EQ(indices[0], rows_);

    ASSERT_EQ(annex_remove_point_float(index, static_cast<unsigned>(rows_)), ANNEX_OK);
    EXPECT_EQ(annex_radius_search_float(index, point.data(), cols_, indices.data(), dists.data(), 4, 0.01f,
                                        nullptr, &p),
              0);

    // The return value counts filled slots; `found` counts every hit
    int found = -1;
    const int returned = annex_radius_search_float(index, data_.data(), cols_, indices.data(), dists.data(), 1,
                                                   0.5f, &found, &p);
    EXPECT_EQ(returned, 1);
    EXPECT_GE(found, returned);
    EXPECT_EQ(indices[0], 0);

    EXPECT_EQ(annex_free_index_float(index, &p), ANNEX_OK);
}

TEST_F(InteropApiTest, RadiusSearchReportsTruncationByMaxNeighbors) {
    // Points 0..9 on a line; radius 4.5 around 0 holds 0..4
    std::vector<float> line(10);
    for (int i = 0; i < 10; ++i) line[static_cast<size_t>(i)] = static_cast<float>(i);

    AnnexParameters p = quiet_defaults();
    p.algorithm = 0;
    p.sorted = 1;
    const annex_index_t index = annex_build_index_float(line.data(), 10, 1, nullptr, &p);
    ASSERT_NE(index, 0u) << annex_get_last_error();

    const float query = 0.0f;
    std::vector<int> indices(10, -777);
    std::vector<float> dists(10, -777.0f);
    int found = -1;

    p.max_neighbors = 2;
    const int returned = annex_radius_search_float(index, &query, 1, indices.data(), dists.data(), 10,
                                                   4.5f * 4.5f, &found, &p);
    EXPECT_EQ(returned, 2);
    EXPECT_EQ(found, 5);
    EXPECT_EQ(indices[0], 0);
    EXPECT_EQ(indices[1], 1);
    for (size_t j = 2; j < indices.size(); ++j) EXPECT_EQ(indices[j], -777) << "slot " << j;

    // Without the cap every hit fits
    p.max_neighbors = -1;
    EXPECT_EQ(annex_radius_search_float(index, &query, 1, indices.data(), dists.data(), 10, 4.5f * 4.5f,
                                        &found, &p),
              5);
    EXPECT_EQ(found, 5);

    EXPECT_EQ(annex_free_index_float(index, nullptr), ANNEX_OK);
}

TEST_F(InteropApiTest, HellingerRejectsNegativeData) {
    const std::vector<int> rows = {1, 4, 9, 16, 0, 2};
    AnnexParameters p = quiet_defaults();
    p.algorithm = 0;
    p.distance = 6;  // hellinger

    const annex_index_t index = annex_build_index_int(rows.data(), 3, 2, nullptr, &p);
    ASSERT_NE(index, 0u) << annex_get_last_error();

    const std::vector<int> negative = {-1, 4};
    EXPECT_EQ(annex_add_points_int(index, negative.data(), 1, 2, 2.0f), ANNEX_ERROR_CONFIG);
    int idx = 0;
    float dist = 0;
    EXPECT_EQ(annex_find_nearest_neighbors_index_int(index, negative.data(), 1, 2, &idx, &dist, 1, &p),
              ANNEX_ERROR_CONFIG);
    EXPECT_NE(std::string(annex_get_last_error()).find("non-negative"), std::string::npos);

    EXPECT_EQ(annex_find_nearest_neighbors_index_int(index, rows.data() + 2, 1, 2, &idx, &dist, 1, &p), ANNEX_OK);
    EXPECT_EQ(idx, 1);
    EXPECT_EQ(annex_free_index_int(index, nullptr), ANNEX_OK);

    const std::vector<int> mixed = {1, -4, 9, 16};
    EXPECT_EQ(annex_build_index_int(mixed.data(), 2, 2, nullptr, &p), 0u);
    EXPECT_EQ(annex_get_last_error_kind(), ANNEX_ERROR_CONFIG);
}

TEST_F(InteropApiTest, SaveAndLoadAgainstSameData) {
    AnnexParameters p = quiet_defaults();
    p.algorithm = 2;  // kmeans
    p.branching = 8;
    const annex_index_t index = annex_build_index_float(data_.data(), rows_, cols_, nullptr, &p);
    ASSERT_NE(index, 0u);
    ASSERT_EQ(annex_save_index_float(index, path_.c_str()), ANNEX_OK);

    const annex_index_t loaded = annex_load_index_float(path_.c_str(), data_.data(), rows_, cols_);
    ASSERT_NE(loaded, 0u) << annex_get_last_error();
    EXPECT_NE(loaded, index);

    std::vector<int> a(5), b(5);
    std::vector<float> da(5), db(5);
    ASSERT_EQ(annex_find_nearest_neighbors_index_float(index, data_.data() + 6 * cols_, 1, cols_, a.data(),
                                                       da.data(), 5, &p),
              ANNEX_OK);
    ASSERT_EQ(annex_find_nearest_neighbors_index_float(loaded, data_.data() + 6 * cols_, 1, cols_, b.data(),
                                                       db.data(), 5, &p),
              ANNEX_OK);
    EXPECT_EQ(a, b);
    EXPECT_EQ(da, db);

    // Different data under the same shape fails the digest check
    std::vector<float> other = data_;
    other[3] += 1.0f;
    EXPECT_EQ(annex_load_index_float(path_.c_str(), other.data(), rows_, cols_), 0u);
    EXPECT_EQ(annex_get_last_error_kind(), ANNEX_ERROR_IO);

    EXPECT_EQ(annex_save_index_float(index, nullptr), ANNEX_ERROR_IO);

    annex_free_index_float(index, nullptr);
    annex_free_index_float(loaded, nullptr);
}

TEST_F(InteropApiTest, AutotunedBuildWritesChosenParameters) {
    const auto clustered = Annex::test::clustered_dataset(10, 100, 4, 101);
    AnnexParameters p = quiet_defaults();
    p.algorithm = 255;
    p.target_precision = 0.9f;
    p.sample_fraction = 0.3f;

    float speedup = 0;
    const annex_index_t index =
        annex_build_index_float(clustered.data(), 1000, 4, &speedup, &p);
    ASSERT_NE(index, 0u) << annex_get_last_error();

    EXPECT_NE(p.algorithm, 255);
    EXPECT_NE(p.checks, 0);
    EXPECT_GT(speedup, 0.0f);
    EXPECT_EQ(annex_free_index_float(index, nullptr), ANNEX_OK);
}

TEST_F(InteropApiTest, OneShotSearchMatchesBruteForce) {
    AnnexParameters p = quiet_defaults();
    p.algorithm = 0;
    const int k = 4;
    std::vector<int> indices(static_cast<size_t>(5 * k));
    std::vector<float> dists(static_cast<size_t>(5 * k));
    const auto queries = Annex::test::random_dataset<float>(5, 6, 102);

    ASSERT_EQ(annex_find_nearest_neighbors_float(data_.data(), rows_, cols_, queries.data(), 5, indices.data(),
                                                 dists.data(), k, &p),
              ANNEX_OK);

    const Annex::Dataset<float> data(data_.data(), static_cast<size_t>(rows_), static_cast<size_t>(cols_));
    for (size_t q = 0; q < 5; ++q) {
        const auto truth = Annex::test::brute_force(data, queries[q], k);
        for (size_t j = 0; j < static_cast<size_t>(k); ++j) {
            EXPECT_EQ(indices[q * k + j], static_cast<int>(truth[j].index));
        }
    }
}

TEST_F(InteropApiTest, ByteAndIntEntryPoints) {
    const auto bytes = Annex::test::random_dataset<uint8_t>(200, 8, 103, 256.0);
    AnnexParameters p = quiet_defaults();
    p.algorithm = 5;  // hierarchical
    p.distance = 9;   // hamming
    p.checks = -1;

    const annex_index_t byte_index = annex_build_index_byte(bytes.data(), 200, 8, nullptr, &p);
    ASSERT_NE(byte_index, 0u) << annex_get_last_error();
    std::vector<int> idx(1);
    std::vector<float> dist(1);
    ASSERT_EQ(annex_find_nearest_neighbors_index_byte(byte_index, bytes[17], 1, 8, idx.data(), dist.data(), 1, &p),
              ANNEX_OK);
    EXPECT_EQ(idx[0], 17);
    EXPECT_EQ(dist[0], 0.0f);
    EXPECT_EQ(annex_free_index_byte(byte_index, nullptr), ANNEX_OK);

    const auto ints = Annex::test::random_dataset<int32_t>(150, 3, 104, 1000.0);
    p = quiet_defaults();
    p.checks = -1;
    const annex_index_t int_index = annex_build_index_int(ints.data(), 150, 3, nullptr, &p);
    ASSERT_NE(int_index, 0u) << annex_get_last_error();
    ASSERT_EQ(annex_find_nearest_neighbors_index_int(int_index, ints[42], 1, 3, idx.data(), dist.data(), 1, &p),
              ANNEX_OK);
    EXPECT_EQ(dist[0], 0.0f);
    EXPECT_EQ(annex_free_index_int(int_index, nullptr), ANNEX_OK);
}

TEST_F(InteropApiTest, ClusterCentersThroughDoubleApi) {
    const auto clustered = Annex::test::clustered_dataset(4, 50, 2, 105);
    std::vector<double> data(clustered.data(), clustered.data() + 200 * 2);

    AnnexParameters p = quiet_defaults();
    p.branching = 4;
    p.iterations = -1;
    p.centers_init = 1;  // gonzales

    std::vector<double> centers(4 * 2);
    const int count = annex_compute_cluster_centers_double(data.data(), 200, 2, 4, centers.data(), &p);
    EXPECT_EQ(count, 4);

    EXPECT_EQ(annex_compute_cluster_centers_double(data.data(), 200, 2, 0, centers.data(), &p), ANNEX_ERROR_CONFIG);
}

// =============================================================================
//  Freed handles
// =============================================================================

namespace {

struct HandleCall {
    const char* name;
    int (*call)(annex_index_t index, const float* row, int cols, const char* path);
};

const HandleCall k_handle_calls[] = {
    {"knn_search", [](annex_index_t index, const float* row, int cols, const char*) {
         int idx = 0;
         float dist = 0;
         return annex_find_nearest_neighbors_index_float(index, row, 1, cols, &idx, &dist, 1, nullptr);
     }},
    {"radius_search", [](annex_index_t index, const float* row, int cols, const char*) {
         int idx = 0;
         float dist = 0;
         return annex_radius_search_float(index, row, cols, &idx, &dist, 1, 1.0f, nullptr, nullptr);
     }},
    {"add_points", [](annex_index_t index, const float* row, int cols, const char*) {
         return annex_add_points_float(index, row, 1, cols, 2.0f);
     }},
    {"remove_point", [](annex_index_t index, const float*, int, const char*) {
         return annex_remove_point_float(index, 0);
     }},
    {"save_index", [](annex_index_t index, const float*, int, const char* path) {
         return annex_save_index_float(index, path);
     }},
    {"used_memory", [](annex_index_t index, const float*, int, const char*) {
         return static_cast<int>(annex_used_memory_float(index));
     }},
    {"free_index", [](annex_index_t index, const float*, int, const char*) {
         return annex_free_index_float(index, nullptr);
     }},
};

} // namespace

class InteropFreedHandleTest : public InteropApiTest, public ::testing::WithParamInterface<HandleCall> {};

TEST_P(InteropFreedHandleTest, FreedHandleFailsWithHandleError) {
    AnnexParameters p = quiet_defaults();
    p.algorithm = 0;
    const annex_index_t index = annex_build_index_float(data_.data(), rows_, cols_, nullptr, &p);
    ASSERT_NE(index, 0u) << annex_get_last_error();
    ASSERT_EQ(annex_free_index_float(index, nullptr), ANNEX_OK);

    EXPECT_EQ(GetParam().call(index, data_.data(), cols_, path_.c_str()), ANNEX_ERROR_HANDLE);
    EXPECT_EQ(annex_get_last_error_kind(), ANNEX_ERROR_HANDLE);
    EXPECT_NE(std::string(annex_get_last_error()).find("handle"), std::string::npos);
}

TEST_P(InteropFreedHandleTest, NeverIssuedHandleFailsWithHandleError) {
    EXPECT_EQ(GetParam().call(0, data_.data(), cols_, path_.c_str()), ANNEX_ERROR_HANDLE);
    EXPECT_EQ(annex_get_last_error_kind(), ANNEX_ERROR_HANDLE);
}

INSTANTIATE_TEST_SUITE_P(EveryHandleOperation, InteropFreedHandleTest, ::testing::ValuesIn(k_handle_calls),
                         [](const ::testing::TestParamInfo<HandleCall>& info) {
                             return std::string(info.param.name);
                         });
