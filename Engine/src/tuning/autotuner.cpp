/**
 * @file autotuner.cpp
 * @brief Sample-based configuration search and checks calibration
 */

#include <tuning/autotuner.hpp>
#include <index/index_factory.hpp>
#include <index/result_set.hpp>
#include <utils/logger.hpp>
#include <utils/random.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <limits>
#include <sstream>

namespace Annex {

namespace {

constexpr size_t MAX_TEST_QUERIES = 1000;
constexpr size_t MIN_TEST_QUERIES = 10;
constexpr size_t NO_SKIP = std::numeric_limits<size_t>::max();
constexpr double MIN_TIME_MS = 1e-6;

constexpr int KMEANS_ITERATIONS[] = {1, 5, 10, 15};
constexpr int KMEANS_BRANCHING[] = {16, 32, 64, 128, 256};
constexpr int KDTREE_TREES[] = {1, 4, 8, 16, 32};

std::string describe(const IndexParameters& p) {
    std::ostringstream out;
    out << to_string(p.algorithm);
    if (p.algorithm == Algorithm::KMeans) out << " branching=" << p.branching << " iterations=" << p.iterations;
    if (p.algorithm == Algorithm::KDTree) out << " trees=" << p.trees;
    return out.str();
}

} // namespace

template <typename T>
Autotuner<T>::Autotuner(const IndexParameters& params, const Dataset<T>& dataset, std::vector<size_t> rows)
    : params_(params), dataset_(dataset), rows_(std::move(rows)), rng_(make_rng(params.random_seed)) {}

// =============================================================================
//  Measurement
// =============================================================================

template <typename T>
typename Autotuner<T>::GroundTruth
Autotuner<T>::compute_ground_truth(const Dataset<T>& data, const std::vector<size_t>& candidates,
                                   std::vector<const T*> queries, std::vector<size_t> skip,
                                   double& elapsed_ms) const {
    const Distance metric = params_.metric();
    GroundTruth truth;
    truth.queries = std::move(queries);
    truth.skip = std::move(skip);
    truth.nearest.assign(truth.queries.size(), max_distance<DistanceType>());

    Timer timer;
    for (size_t q = 0; q < truth.queries.size(); ++q) {
        DistanceType best = max_distance<DistanceType>();
        for (size_t row : candidates) {
            if (row == truth.skip[q]) continue;
            const DistanceType d = metric.template evaluate<DistanceType>(truth.queries[q], data[row], data.cols(), best);
            if (d < best) best = d;
        }
        truth.nearest[q] = best;
    }
    elapsed_ms = timer.elapsed_ms();
    return truth;
}

template <typename T>
float Autotuner<T>::measure_precision(const NNIndex<T>& index, const GroundTruth& truth, int checks,
                                      double& elapsed_ms) const {
    SearchParameters search;
    search.checks = checks;
    search.eps = params_.eps;

    size_t hits = 0;
    Timer timer;
    for (size_t q = 0; q < truth.queries.size(); ++q) {
        const bool skipping = truth.skip[q] != NO_SKIP;
        KNNResultSet<DistanceType> result(skipping ? 2 : 1);
        index.find_neighbors(result, truth.queries[q], search);

        for (const auto& item : result.items()) {
            if (item.index == truth.skip[q]) continue;
            if (item.distance <= truth.nearest[q]) ++hits;
            break;
        }
    }
    elapsed_ms = timer.elapsed_ms();

    return truth.queries.empty() ? 1.0f
                                 : static_cast<float>(hits) / static_cast<float>(truth.queries.size());
}

template <typename T>
int Autotuner<T>::find_checks(const NNIndex<T>& index, const GroundTruth& truth, float& precision,
                              double& elapsed_ms) const {
    const float target = params_.target_precision;

    if (index.algorithm() == Algorithm::Linear) {
        precision = measure_precision(index, truth, CHECKS_UNLIMITED, elapsed_ms);
        return CHECKS_UNLIMITED;
    }

    // Past twice the point count every leaf has been visited
    const int limit = static_cast<int>(std::min<size_t>(2 * std::max<size_t>(index.size(), 1),
                                                        static_cast<size_t>(std::numeric_limits<int>::max() / 2)));

    int lo = 0;
    int hi = 1;
    double hi_time = 0;
    float hi_precision = measure_precision(index, truth, hi, hi_time);
    while (hi_precision < target && hi < limit) {
        lo = hi;
        hi *= 2;
        hi_precision = measure_precision(index, truth, hi, hi_time);
    }

    if (hi_precision < target) {
        double exact_time = 0;
        const float exact_precision = measure_precision(index, truth, CHECKS_UNLIMITED, exact_time);
        if (exact_precision > hi_precision) {
            precision = exact_precision;
            elapsed_ms = exact_time;
            return CHECKS_UNLIMITED;
        }
        precision = hi_precision;
        elapsed_ms = hi_time;
        return hi;
    }

    while (hi - lo > std::max(1, hi / 16)) {
        const int mid = lo + (hi - lo) / 2;
        double mid_time = 0;
        const float mid_precision = measure_precision(index, truth, mid, mid_time);
        if (mid_precision >= target) {
            hi = mid;
            hi_precision = mid_precision;
            hi_time = mid_time;
        } else {
            lo = mid;
        }
    }

    precision = hi_precision;
    elapsed_ms = hi_time;
    return hi;
}

// =============================================================================
//  Build tuning
// =============================================================================

template <typename T>
std::vector<IndexParameters> Autotuner<T>::candidate_grid() const {
    const Distance metric = params_.metric();
    std::vector<IndexParameters> grid;

    if (metric.is_vector_space()) {
        for (int iterations : KMEANS_ITERATIONS) {
            for (int branching : KMEANS_BRANCHING) {
                IndexParameters p = params_;
                p.algorithm = Algorithm::KMeans;
                p.iterations = iterations;
                p.branching = branching;
                grid.push_back(p);
            }
        }
    }
    if (metric.is_kdtree_compatible()) {
        for (int trees : KDTREE_TREES) {
            IndexParameters p = params_;
            p.algorithm = Algorithm::KDTree;
            p.trees = trees;
            grid.push_back(p);
        }
    }

    IndexParameters linear = params_;
    linear.algorithm = Algorithm::Linear;
    grid.push_back(linear);
    return grid;
}

template <typename T>
TuningTrial Autotuner<T>::evaluate(const IndexParameters& candidate, const std::shared_ptr<Dataset<T>>& sample,
                                   const GroundTruth& truth) const {
    TuningTrial trial;
    trial.params = candidate;

    auto index = create_index<T>(candidate);
    Timer timer;
    index->build(sample);
    trial.build_time_ms = timer.elapsed_ms();

    trial.params.checks = find_checks(*index, truth, trial.precision, trial.search_time_ms);
    trial.memory_bytes = index->used_memory();

    Logger::info("Autotune trial " + describe(candidate) + ": checks=" + std::to_string(trial.params.checks) +
                 " precision=" + std::to_string(trial.precision) +
                 " build=" + std::to_string(trial.build_time_ms) + "ms search=" +
                 std::to_string(trial.search_time_ms) + "ms");
    return trial;
}

template <typename T>
AutotuneReport Autotuner<T>::tune_build() {
    AutotuneReport report;
    report.chosen = params_;

    const size_t sample_size = static_cast<size_t>(params_.sample_fraction * static_cast<double>(rows_.size()));
    const size_t test_size = std::min(sample_size / 10, MAX_TEST_QUERIES);

    if (test_size < MIN_TEST_QUERIES) {
        Logger::info("Dataset too small to autotune, choosing linear search");
        report.chosen.algorithm = Algorithm::Linear;
        report.chosen.checks = CHECKS_UNLIMITED;
        report.achieved_precision = 1.0f;
        report.target_met = true;
        return report;
    }

    Logger::step("Autotuning on a sample of " + std::to_string(sample_size) + " points with " +
                 std::to_string(test_size) + " test queries");

    // Test rows are drawn from the sample and removed from it
    const std::vector<size_t> drawn = random_sample(rows_, sample_size, rng_);
    const std::vector<size_t> test_rows(drawn.begin(), drawn.begin() + static_cast<std::ptrdiff_t>(test_size));
    const std::vector<size_t> sample_rows(drawn.begin() + static_cast<std::ptrdiff_t>(test_size), drawn.end());

    auto sample = std::make_shared<Dataset<T>>(dataset_.select(sample_rows));

    std::vector<const T*> queries;
    queries.reserve(test_rows.size());
    for (size_t row : test_rows) queries.push_back(dataset_[row]);

    std::vector<size_t> candidates(sample->rows());
    for (size_t i = 0; i < candidates.size(); ++i) candidates[i] = i;

    double linear_ms = 0;
    const GroundTruth truth = compute_ground_truth(*sample, candidates, std::move(queries),
                                                   std::vector<size_t>(test_size, NO_SKIP), linear_ms);

    for (const auto& candidate : candidate_grid()) {
        report.trials.push_back(evaluate(candidate, sample, truth));
    }

    double best_time = std::numeric_limits<double>::max();
    for (const auto& trial : report.trials) {
        best_time = std::min(best_time, trial.build_time_ms * params_.build_weight + trial.search_time_ms);
    }
    best_time = std::max(best_time, MIN_TIME_MS);

    const double dataset_bytes = static_cast<double>(std::max<size_t>(sample->byte_size(), 1));
    for (auto& trial : report.trials) {
        const double time_cost = trial.build_time_ms * params_.build_weight + trial.search_time_ms;
        const double memory_cost = (static_cast<double>(trial.memory_bytes) + dataset_bytes) / dataset_bytes;
        trial.cost = time_cost / best_time + params_.memory_weight * memory_cost;
    }

    const TuningTrial* winner = nullptr;
    for (const auto& trial : report.trials) {
        if (trial.precision < params_.target_precision) continue;
        if (!winner || trial.cost < winner->cost) winner = &trial;
    }

    report.target_met = winner != nullptr;
    if (!winner) {
        for (const auto& trial : report.trials) {
            if (!winner || trial.precision > winner->precision ||
                (trial.precision == winner->precision && trial.cost < winner->cost)) {
                winner = &trial;
            }
        }
        Logger::warn("No configuration reached target precision " + std::to_string(params_.target_precision) +
                     " on the sample; best was " + std::to_string(winner->precision));
    }

    report.chosen = winner->params;
    report.achieved_precision = winner->precision;

    Logger::info("Autotune selected " + describe(report.chosen) + " (cost " + std::to_string(winner->cost) + ")");
    return report;
}

// =============================================================================
//  Search tuning
// =============================================================================

template <typename T>
void Autotuner<T>::tune_search(const NNIndex<T>& index, AutotuneReport& report) {
    if (index.algorithm() == Algorithm::Linear) {
        report.chosen.checks = CHECKS_UNLIMITED;
        report.speedup = 1.0f;
        return;
    }

    const size_t samples = std::min(rows_.size() / 10, MAX_TEST_QUERIES);
    if (samples == 0) return;

    const std::vector<size_t> query_rows = random_sample(rows_, samples, rng_);
    std::vector<const T*> queries;
    queries.reserve(query_rows.size());
    for (size_t row : query_rows) queries.push_back(index.dataset()[row]);

    double linear_ms = 0;
    const GroundTruth truth = compute_ground_truth(index.dataset(), rows_, std::move(queries), query_rows, linear_ms);

    float precision = 0;
    double search_ms = 0;
    const int checks = find_checks(index, truth, precision, search_ms);

    report.chosen.checks = checks;
    report.achieved_precision = precision;
    report.target_met = precision >= params_.target_precision;
    report.speedup = static_cast<float>(linear_ms / std::max(search_ms, MIN_TIME_MS));

    if (!report.target_met) {
        Logger::warn("Tuned index reaches precision " + std::to_string(precision) + " below target " +
                     std::to_string(params_.target_precision));
    }
    Logger::info("Autotuned checks=" + std::to_string(checks) + " speedup=" + std::to_string(report.speedup));
}

template class Autotuner<float>;
template class Autotuner<double>;
template class Autotuner<uint8_t>;
template class Autotuner<int32_t>;

} // namespace Annex
