/**
 * @file autotuner.hpp
 * @brief Picks an algorithm, build parameters and search budget for a precision target
 *
 * Tuning runs in two phases. tune_build() evaluates a grid of k-means,
 * k-d forest and linear configurations on a random sample of the dataset
 * and keeps the cheapest one that reaches the target precision.
 * tune_search() then finds the smallest checks value that reaches the
 * target on the index built over the full dataset, and measures the
 * speedup over a linear scan.
 */

#pragma once

#include <core/matrix.hpp>
#include <core/parameters.hpp>
#include <index/nn_index.hpp>
#include <random>
#include <vector>

namespace Annex {

struct TuningTrial {
    IndexParameters params;
    double build_time_ms = 0;
    double search_time_ms = 0;
    size_t memory_bytes = 0;
    float precision = 0;
    double cost = 0;
};

struct AutotuneReport {
    IndexParameters chosen;
    float achieved_precision = 0;
    bool target_met = false;
    float speedup = 1.0f;
    std::vector<TuningTrial> trials;
};

template <typename T>
class Autotuner {
public:
    using DistanceType = ResultType<T>;

    /**
     * @param params  Build parameters carrying the targets and cost weights
     * @param dataset Full dataset; only `rows` are sampled
     */
    Autotuner(const IndexParameters& params, const Dataset<T>& dataset, std::vector<size_t> rows);

    AutotuneReport tune_build();

    void tune_search(const NNIndex<T>& index, AutotuneReport& report);

private:
    struct GroundTruth {
        std::vector<const T*> queries;
        std::vector<size_t> skip;           // Row excluded from the answer (self match)
        std::vector<DistanceType> nearest;
    };

    /**
     * @brief Exact 1-NN distance of each query among `candidates` rows of `data`
     * @param elapsed_ms Serial scan time, the baseline for the reported speedup
     */
    GroundTruth compute_ground_truth(const Dataset<T>& data, const std::vector<size_t>& candidates,
                                     std::vector<const T*> queries, std::vector<size_t> skip,
                                     double& elapsed_ms) const;

    float measure_precision(const NNIndex<T>& index, const GroundTruth& truth, int checks,
                            double& elapsed_ms) const;

    /**
     * @brief Smallest checks reaching the target (doubling, then bisection)
     */
    int find_checks(const NNIndex<T>& index, const GroundTruth& truth, float& precision,
                    double& elapsed_ms) const;

    TuningTrial evaluate(const IndexParameters& candidate, const std::shared_ptr<Dataset<T>>& sample,
                         const GroundTruth& truth) const;

    std::vector<IndexParameters> candidate_grid() const;

    IndexParameters params_;
    const Dataset<T>& dataset_;
    std::vector<size_t> rows_;
    std::mt19937 rng_;
};

} // namespace Annex
