/**
 * @file engine.hpp
 * @brief Typed entry points: boundary validation, then registry + orchestrator
 *
 * Every operation copies caller buffers it needs to keep, so callers may
 * release them as soon as a call returns.
 */

#pragma once

#include <core/matrix.hpp>
#include <core/parameters.hpp>
#include <export.hpp>
#include <registry/index_registry.hpp>
#include <search/search_orchestrator.hpp>
#include <string>

namespace Annex {

template <typename T>
class Engine {
public:
    using DistanceType = ResultType<T>;
    using Handle = IndexRegistry::Handle;

    struct BuildResult {
        Handle handle = 0;
        float speedup = 1.0f;
        IndexParameters chosen;      // Equals the request unless the build was autotuned
    };

    explicit Engine(IndexRegistry& registry = IndexRegistry::global()) : registry_(registry) {}

    /**
     * @throws ConfigError for invalid parameters or metric/algorithm mismatches
     * @throws DimensionError for an empty dataset
     */
    BuildResult build_index(const Matrix<const T>& dataset, const IndexParameters& params);

    void add_points(Handle handle, const Matrix<const T>& points, float rebuild_threshold);
    void remove_point(Handle handle, size_t id);

    void save_index(Handle handle, const std::string& path);
    Handle load_index(const std::string& path, const Matrix<const T>& dataset);

    void knn_search(Handle handle, const Matrix<const T>& queries, const Matrix<int>& indices,
                    const Matrix<DistanceType>& dists, size_t knn, const SearchParameters& params) const;

    RadiusResult radius_search(Handle handle, const T* query, size_t cols, DistanceType radius,
                               int* indices, DistanceType* dists, size_t capacity,
                               const SearchParameters& params) const;

    size_t used_memory(Handle handle) const;
    void free_index(Handle handle);

    /**
     * @brief Build, search and discard an index in one call
     */
    static void find_nearest_neighbors(const Matrix<const T>& dataset, const Matrix<const T>& queries,
                                       const Matrix<int>& indices, const Matrix<DistanceType>& dists,
                                       size_t knn, const IndexParameters& params);

    /**
     * @brief Cluster centers from a k-means tree over `dataset`
     * @return Number of rows written to `centers` (may be below centers.rows())
     */
    static size_t compute_cluster_centers(const Matrix<const T>& dataset, const Matrix<DistanceType>& centers,
                                          const IndexParameters& params);

private:
    IndexRegistry& registry_;
};

} // namespace Annex
