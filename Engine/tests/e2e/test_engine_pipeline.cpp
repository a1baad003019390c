/**
 * @file test_engine_pipeline.cpp
 * @brief End-to-end runs through the typed Engine: vecs file -> build -> search -> mutate -> persist -> reload
 */

#include <gtest/gtest.h>
#include <engine/engine.hpp>
#include <io/index_io.hpp>
#include <io/vecs_file.hpp>
#include <search/cancellation.hpp>
#include <utils/logger.hpp>
#include "../test_helpers.hpp"
#include <cstdio>
#include <limits>
#include <string>
#include <vector>

using namespace Annex;

class EnginePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_threshold(LogLevel::None);
        base_ = test::clustered_dataset(25, 80, 12, 500);
        std::vector<size_t> picks;
        for (size_t row = 5; row < base_.rows(); row += 40) picks.push_back(row);
        queries_ = base_.select(picks);
    }

    void TearDown() override {
        std::remove(vecs_path_.c_str());
        std::remove(index_path_.c_str());
    }

    double recall(const std::vector<int>& indices, size_t k, const Dataset<float>& data) const {
        size_t hits = 0;
        for (size_t q = 0; q < queries_.rows(); ++q) {
            const auto truth = test::brute_force(data, queries_[q], k);
            for (size_t j = 0; j < k; ++j) {
                for (size_t t = 0; t < k; ++t) {
                    if (indices[q * k + j] == static_cast<int>(truth[t].index)) {
                        ++hits;
                        break;
                    }
                }
            }
        }
        return static_cast<double>(hits) / static_cast<double>(queries_.rows() * k);
    }

    IndexRegistry registry_;
    Dataset<float> base_;
    Dataset<float> queries_;
    std::string vecs_path_ = test::temp_path("pipeline_base.fvecs");
    std::string index_path_ = test::temp_path("pipeline.idx");
};

TEST_F(EnginePipelineTest, FullLifecycle) {
    // Dataset arrives through a vecs file
    write_vecs(vecs_path_, base_.view());
    const Dataset<float> data = read_vecs<float>(vecs_path_);
    ASSERT_EQ(data.rows(), base_.rows());

    Engine<float> engine(registry_);
    IndexParameters params;
    params.algorithm = Algorithm::KDTree;
    params.trees = 4;
    params.checks = 128;
    params.random_seed = 3;
    params.log_level = LogLevel::None;

    const auto built = engine.build_index(data.view(), params);
    ASSERT_NE(built.handle, 0u);
    EXPECT_EQ(built.chosen.algorithm, Algorithm::KDTree);

    const size_t k = 5;
    std::vector<int> indices(queries_.rows() * k);
    std::vector<float> dists(queries_.rows() * k);
    engine.knn_search(built.handle, queries_.view(), Matrix<int>(indices.data(), queries_.rows(), k),
                      Matrix<float>(dists.data(), queries_.rows(), k), k, params.search_parameters());
    EXPECT_GE(recall(indices, k, data), 0.8);

    // Grow, then shrink
    const auto extra = test::clustered_dataset(5, 20, 12, 501);
    engine.add_points(built.handle, extra.view(), 2.0f);
    engine.remove_point(built.handle, 0);

    Dataset<float> grown = data;
    grown.append(extra.view());

    SearchParameters exact;
    exact.checks = CHECKS_UNLIMITED;
    std::vector<int> one(1);
    std::vector<float> one_d(1);
    engine.knn_search(built.handle, Matrix<const float>(extra[3], 1, 12), Matrix<int>(one.data(), 1, 1),
                      Matrix<float>(one_d.data(), 1, 1), 1, exact);
    EXPECT_EQ(one[0], static_cast<int>(data.rows() + 3));

    engine.knn_search(built.handle, Matrix<const float>(data[0], 1, 12), Matrix<int>(one.data(), 1, 1),
                      Matrix<float>(one_d.data(), 1, 1), 1, exact);
    EXPECT_NE(one[0], 0);

    // Persist and reload against the grown data
    engine.save_index(built.handle, index_path_);
    const IndexFileHeader header = read_index_header(index_path_);
    EXPECT_EQ(header.rows, grown.rows());

    const auto reloaded = engine.load_index(index_path_, grown.view());
    EXPECT_GT(engine.used_memory(reloaded), 0u);

    std::vector<int> after(queries_.rows() * k);
    std::vector<float> after_d(queries_.rows() * k);
    engine.knn_search(built.handle, queries_.view(), Matrix<int>(indices.data(), queries_.rows(), k),
                      Matrix<float>(dists.data(), queries_.rows(), k), k, params.search_parameters());
    engine.knn_search(reloaded, queries_.view(), Matrix<int>(after.data(), queries_.rows(), k),
                      Matrix<float>(after_d.data(), queries_.rows(), k), k, params.search_parameters());
    EXPECT_EQ(indices, after);
    EXPECT_EQ(dists, after_d);

    engine.free_index(built.handle);
    engine.free_index(reloaded);
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_THROW(engine.used_memory(built.handle), HandleError);
}

TEST_F(EnginePipelineTest, RadiusSearchThroughEngine) {
    Engine<float> engine(registry_);
    IndexParameters params;
    params.algorithm = Algorithm::KMeans;
    params.branching = 16;
    params.random_seed = 4;
    params.log_level = LogLevel::None;
    const auto built = engine.build_index(base_.view(), params);

    SearchParameters exact;
    exact.checks = CHECKS_UNLIMITED;
    std::vector<int> indices(base_.rows());
    std::vector<float> dists(base_.rows());

    // Blob noise is 0.5 per axis; 25 squared units holds the blob but not its neighbors
    const RadiusResult r = engine.radius_search(built.handle, base_[0], 12, 25.0f, indices.data(), dists.data(),
                                                indices.size(), exact);
    EXPECT_GE(r.found, 1u);
    EXPECT_FALSE(r.truncated);
    EXPECT_EQ(indices[0], 0);

    size_t expected = 0;
    for (size_t i = 0; i < base_.rows(); ++i) {
        if (Distance().evaluate<float>(base_[0], base_[i], 12) <= 25.0f) ++expected;
    }
    EXPECT_EQ(r.found, expected);

    EXPECT_THROW(engine.radius_search(built.handle, base_[0], 11, 1.0f, indices.data(), dists.data(), 1, exact),
                 DimensionError);
    EXPECT_THROW(engine.radius_search(built.handle, base_[0], 12, -1.0f, indices.data(), dists.data(), 1, exact),
                 ConfigError);
    engine.free_index(built.handle);
}

TEST_F(EnginePipelineTest, CancelledBatchThrows) {
    Engine<float> engine(registry_);
    IndexParameters params;
    params.algorithm = Algorithm::Linear;
    params.log_level = LogLevel::None;
    const auto built = engine.build_index(base_.view(), params);

    CancellationToken token;
    token.cancel();
    SearchParameters search;
    search.cancel = &token;

    std::vector<int> indices(queries_.rows());
    std::vector<float> dists(queries_.rows());
    EXPECT_THROW(engine.knn_search(built.handle, queries_.view(), Matrix<int>(indices.data(), queries_.rows(), 1),
                                   Matrix<float>(dists.data(), queries_.rows(), 1), 1, search),
                 CancelledError);
    engine.free_index(built.handle);
}

TEST_F(EnginePipelineTest, SearchParameterValidation) {
    Engine<float> engine(registry_);
    IndexParameters params;
    params.algorithm = Algorithm::Linear;
    params.log_level = LogLevel::None;
    const auto built = engine.build_index(base_.view(), params);

    std::vector<int> indices(queries_.rows());
    std::vector<float> dists(queries_.rows());
    const Matrix<int> idx(indices.data(), queries_.rows(), 1);
    const Matrix<float> dst(dists.data(), queries_.rows(), 1);

    SearchParameters bad;
    bad.checks = 0;
    EXPECT_THROW(engine.knn_search(built.handle, queries_.view(), idx, dst, 1, bad), ConfigError);
    bad.checks = -3;
    EXPECT_THROW(engine.knn_search(built.handle, queries_.view(), idx, dst, 1, bad), ConfigError);
    bad = SearchParameters{};
    bad.eps = -0.5f;
    EXPECT_THROW(engine.knn_search(built.handle, queries_.view(), idx, dst, 1, bad), ConfigError);
    EXPECT_THROW(engine.knn_search(built.handle, queries_.view(), idx, dst, 0, SearchParameters{}), ConfigError);

    engine.free_index(built.handle);
}

TEST_F(EnginePipelineTest, OneShotAndClusterCenters) {
    IndexParameters params;
    params.algorithm = Algorithm::KDTreeSingle;
    params.checks = CHECKS_UNLIMITED;
    params.log_level = LogLevel::None;

    const size_t k = 3;
    std::vector<int> indices(queries_.rows() * k);
    std::vector<float> dists(queries_.rows() * k);
    Engine<float>::find_nearest_neighbors(base_.view(), queries_.view(),
                                          Matrix<int>(indices.data(), queries_.rows(), k),
                                          Matrix<float>(dists.data(), queries_.rows(), k), k, params);
    EXPECT_DOUBLE_EQ(recall(indices, k, base_), 1.0);

    IndexParameters kmeans;
    kmeans.branching = 5;
    kmeans.iterations = -1;
    kmeans.centers_init = CentersInit::Gonzales;
    kmeans.random_seed = 8;
    kmeans.log_level = LogLevel::None;
    std::vector<float> centers(25 * 12);
    const size_t count = Engine<float>::compute_cluster_centers(base_.view(), Matrix<float>(centers.data(), 25, 12),
                                                                kmeans);
    EXPECT_GE(count, 1u);
    EXPECT_LE(count, 25u);

    EXPECT_THROW(Engine<float>::compute_cluster_centers(base_.view(), Matrix<float>(centers.data(), 25, 11), kmeans),
                 DimensionError);
}

TEST_F(EnginePipelineTest, AutotunedIndexSurvivesSaveAndLoad) {
    Engine<float> engine(registry_);
    IndexParameters params;
    params.algorithm = Algorithm::Autotuned;
    params.target_precision = 0.85f;
    params.sample_fraction = 0.2f;
    params.random_seed = 9;
    params.log_level = LogLevel::None;

    const auto built = engine.build_index(base_.view(), params);
    EXPECT_NE(built.chosen.algorithm, Algorithm::Autotuned);
    EXPECT_GT(built.speedup, 0.0f);

    engine.save_index(built.handle, index_path_);
    EXPECT_EQ(read_index_header(index_path_).algorithm, Algorithm::Autotuned);
    const auto reloaded = engine.load_index(index_path_, base_.view());

    SearchParameters tuned;
    tuned.checks = CHECKS_AUTOTUNED;
    const size_t k = 2;
    std::vector<int> a(queries_.rows() * k), b(queries_.rows() * k);
    std::vector<float> da(queries_.rows() * k), db(queries_.rows() * k);
    engine.knn_search(built.handle, queries_.view(), Matrix<int>(a.data(), queries_.rows(), k),
                      Matrix<float>(da.data(), queries_.rows(), k), k, tuned);
    engine.knn_search(reloaded, queries_.view(), Matrix<int>(b.data(), queries_.rows(), k),
                      Matrix<float>(db.data(), queries_.rows(), k), k, tuned);
    EXPECT_EQ(a, b);

    engine.free_index(built.handle);
    engine.free_index(reloaded);
}

// =============================================================================
//  Freed handles
// =============================================================================

struct EngineHandleCall {
    const char* name;
    void (*call)(Engine<float>& engine, Engine<float>::Handle handle, const Dataset<float>& rows,
                 const std::string& path);
};

class FreedHandleTest : public EnginePipelineTest, public ::testing::WithParamInterface<EngineHandleCall> {};

TEST_P(FreedHandleTest, EveryOperationRejectsFreedHandle) {
    Engine<float> engine(registry_);
    IndexParameters params;
    params.algorithm = Algorithm::Linear;
    params.log_level = LogLevel::None;

    const auto built = engine.build_index(base_.view(), params);
    engine.free_index(built.handle);

    EXPECT_THROW(GetParam().call(engine, built.handle, queries_, index_path_), HandleError);

    // The slot stays free for a new index without reviving the old handle
    const auto next = engine.build_index(base_.view(), params);
    EXPECT_NE(next.handle, built.handle);
    EXPECT_THROW(GetParam().call(engine, built.handle, queries_, index_path_), HandleError);
    engine.free_index(next.handle);
}

const EngineHandleCall k_engine_handle_calls[] = {
    {"knn_search", [](Engine<float>& engine, Engine<float>::Handle handle, const Dataset<float>& rows,
                      const std::string&) {
         std::vector<int> indices(rows.rows());
         std::vector<float> dists(rows.rows());
         engine.knn_search(handle, rows.view(), Matrix<int>(indices.data(), rows.rows(), 1),
                           Matrix<float>(dists.data(), rows.rows(), 1), 1, SearchParameters{});
     }},
    {"radius_search", [](Engine<float>& engine, Engine<float>::Handle handle, const Dataset<float>& rows,
                         const std::string&) {
         int index = 0;
         float dist = 0;
         engine.radius_search(handle, rows[0], rows.cols(), 1.0f, &index, &dist, 1, SearchParameters{});
     }},
    {"add_points", [](Engine<float>& engine, Engine<float>::Handle handle, const Dataset<float>& rows,
                      const std::string&) { engine.add_points(handle, rows.view(), 2.0f); }},
    {"remove_point", [](Engine<float>& engine, Engine<float>::Handle handle, const Dataset<float>&,
                        const std::string&) { engine.remove_point(handle, 0); }},
    {"save_index", [](Engine<float>& engine, Engine<float>::Handle handle, const Dataset<float>&,
                      const std::string& path) { engine.save_index(handle, path); }},
    {"used_memory", [](Engine<float>& engine, Engine<float>::Handle handle, const Dataset<float>&,
                       const std::string&) { (void)engine.used_memory(handle); }},
    {"free_index", [](Engine<float>& engine, Engine<float>::Handle handle, const Dataset<float>&,
                      const std::string&) { engine.free_index(handle); }},
};

INSTANTIATE_TEST_SUITE_P(EveryHandleOperation, FreedHandleTest, ::testing::ValuesIn(k_engine_handle_calls),
                         [](const ::testing::TestParamInfo<EngineHandleCall>& info) {
                             return std::string(info.param.name);
                         });
