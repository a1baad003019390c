/**
 * @file search_orchestrator.hpp
 * @brief Batch k-NN and radius search over any index
 *
 * k-NN rows run in parallel (OpenMP) with `cores` threads. Output buffers
 * are caller-owned, row-major, `knn` slots per query; slots without a hit
 * hold index -1 and distance +inf.
 */

#pragma once

#include <core/matrix.hpp>
#include <core/parameters.hpp>
#include <export.hpp>
#include <index/nn_index.hpp>
#include <vector>

namespace Annex {

struct RadiusResult {
    size_t found = 0;        // Points within the radius
    size_t returned = 0;     // Points written to the output buffers
    bool truncated = false;  // found > returned
};

/**
 * @brief Resolve `cores` to a thread count (0 = every hardware thread)
 */
ANNEX_API int search_threads(int cores);

/**
 * @param indices Query count x knn
 * @param dists   Query count x knn
 * @throws CancelledError when params.cancel trips before every row completes
 */
template <typename T>
void knn_search(const NNIndex<T>& index, const Matrix<const T>& queries,
                const Matrix<int>& indices, const Matrix<ResultType<T>>& dists,
                size_t knn, const SearchParameters& params);

/**
 * @brief Every point with distance <= radius (metric units, squared for Euclidean)
 *
 * At most min(capacity, max_neighbors) hits are written, closest first when
 * params.sorted is set.
 */
template <typename T>
RadiusResult radius_search(const NNIndex<T>& index, const T* query, ResultType<T> radius,
                           int* indices, ResultType<T>* dists, size_t capacity,
                           const SearchParameters& params);

} // namespace Annex
