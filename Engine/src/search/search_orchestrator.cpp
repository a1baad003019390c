/**
 * @file search_orchestrator.cpp
 * @brief Row-parallel k-NN and per-query radius search
 */

#include <search/search_orchestrator.hpp>
#include <index/result_set.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <limits>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Annex {

int search_threads(int cores) {
    if (cores > 0) return cores;
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

namespace {

size_t effective_k(size_t knn, const SearchParameters& params) {
    if (params.max_neighbors > 0) return std::min(knn, static_cast<size_t>(params.max_neighbors));
    return knn;
}

void check_cancelled(const SearchParameters& params) {
    if (params.cancel != nullptr && params.cancel->is_cancelled()) {
        throw CancelledError("Search cancelled");
    }
}

// Result ids travel as int
void check_id_range(size_t rows) {
    if (rows > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw DimensionError("Index holds " + std::to_string(rows) + " rows; result ids must fit in an int");
    }
}

} // namespace

template <typename T>
void knn_search(const NNIndex<T>& index, const Matrix<const T>& queries,
                const Matrix<int>& indices, const Matrix<ResultType<T>>& dists,
                size_t knn, const SearchParameters& params) {
    using D = ResultType<T>;

    if (queries.cols() != index.veclen()) {
        throw DimensionError("Query dimension " + std::to_string(queries.cols()) +
                             " does not match index dimension " + std::to_string(index.veclen()));
    }
    index.distance().check_domain(queries.data(), queries.rows() * queries.cols());
    check_id_range(index.rows());
    if (indices.rows() < queries.rows() || dists.rows() < queries.rows() ||
        indices.cols() != knn || dists.cols() != knn) {
        throw DimensionError("Result buffers must hold " + std::to_string(queries.rows()) + " x " +
                             std::to_string(knn) + " entries");
    }

    const size_t k = effective_k(knn, params);
    const auto rows = static_cast<long>(queries.rows());
    const int threads = search_threads(params.cores);

    std::exception_ptr error;
    std::atomic<bool> stop{false};

    #pragma omp parallel for num_threads(threads) schedule(dynamic, 16)
    for (long i = 0; i < rows; ++i) {
        if (stop.load(std::memory_order_relaxed)) continue;
        if (params.cancel != nullptr && params.cancel->is_cancelled()) {
            stop.store(true, std::memory_order_relaxed);
            continue;
        }

        try {
            KNNResultSet<D> result(k);
            index.find_neighbors(result, queries[static_cast<size_t>(i)], params);

            int* row_indices = indices[static_cast<size_t>(i)];
            D* row_dists = dists[static_cast<size_t>(i)];
            const auto& items = result.items();
            for (size_t j = 0; j < knn; ++j) {
                if (j < items.size()) {
                    row_indices[j] = static_cast<int>(items[j].index);
                    row_dists[j] = items[j].distance;
                } else {
                    row_indices[j] = -1;
                    row_dists[j] = std::numeric_limits<D>::infinity();
                }
            }
        } catch (...) {
            #pragma omp critical(annex_search_error)
            {
                if (!error) error = std::current_exception();
            }
            stop.store(true, std::memory_order_relaxed);
        }
    }

    if (error) std::rethrow_exception(error);
    check_cancelled(params);
}

template <typename T>
RadiusResult radius_search(const NNIndex<T>& index, const T* query, ResultType<T> radius,
                           int* indices, ResultType<T>* dists, size_t capacity,
                           const SearchParameters& params) {
    using D = ResultType<T>;

    if (capacity > 0 && (indices == nullptr || dists == nullptr)) {
        throw DimensionError("Radius search output buffers are null");
    }
    index.distance().check_domain(query, index.veclen());
    check_id_range(index.rows());
    check_cancelled(params);

    RadiusResultSet<D> result(radius);
    index.find_neighbors(result, query, params);
    check_cancelled(params);

    std::vector<Neighbor<D>> hits = result.take(params.sorted);

    size_t limit = capacity;
    if (params.max_neighbors > 0) limit = std::min(limit, static_cast<size_t>(params.max_neighbors));

    // A truncated unsorted answer still keeps the closest hits
    if (!params.sorted && hits.size() > limit) {
        std::sort(hits.begin(), hits.end());
        std::sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(limit),
                  [](const auto& a, const auto& b) { return a.index < b.index; });
    }

    RadiusResult out;
    out.found = hits.size();
    out.returned = std::min(hits.size(), limit);
    out.truncated = out.found > out.returned;

    for (size_t j = 0; j < out.returned; ++j) {
        indices[j] = static_cast<int>(hits[j].index);
        dists[j] = hits[j].distance;
    }
    return out;
}

#define ANNEX_INSTANTIATE_SEARCH(T)                                                                  \
    template void knn_search<T>(const NNIndex<T>&, const Matrix<const T>&, const Matrix<int>&,       \
                                const Matrix<ResultType<T>>&, size_t, const SearchParameters&);      \
    template RadiusResult radius_search<T>(const NNIndex<T>&, const T*, ResultType<T>, int*,         \
                                           ResultType<T>*, size_t, const SearchParameters&);

ANNEX_INSTANTIATE_SEARCH(float)
ANNEX_INSTANTIATE_SEARCH(double)
ANNEX_INSTANTIATE_SEARCH(uint8_t)
ANNEX_INSTANTIATE_SEARCH(int32_t)

#undef ANNEX_INSTANTIATE_SEARCH

} // namespace Annex
