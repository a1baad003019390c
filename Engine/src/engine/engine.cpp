/**
 * @file engine.cpp
 * @brief Typed facade over the index registry
 */

#include <engine/engine.hpp>
#include <index/autotuned_index.hpp>
#include <index/index_factory.hpp>
#include <index/kmeans_index.hpp>
#include <io/index_io.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <memory>

namespace Annex {

namespace {

template <typename T>
void require_dataset(const Matrix<const T>& dataset, const char* what) {
    if (dataset.data() == nullptr || dataset.rows() == 0 || dataset.cols() == 0) {
        throw DimensionError(std::string(what) + " must have at least one row and one column");
    }
}

template <typename T>
void require_cols(const NNIndex<T>& index, size_t cols, const char* what) {
    if (cols != index.veclen()) {
        throw DimensionError(std::string(what) + " dimension " + std::to_string(cols) +
                             " does not match index dimension " + std::to_string(index.veclen()));
    }
}

void require_search(const SearchParameters& params) {
    if (params.checks == 0 || params.checks < CHECKS_AUTOTUNED) {
        throw ConfigError("checks must be positive, -1 (unlimited) or -2 (autotuned)");
    }
    if (params.eps < 0.0f) throw ConfigError("eps must be non-negative");
    if (params.cores < 0) throw ConfigError("cores must be non-negative");
}

template <typename T>
std::unique_ptr<NNIndex<T>> build_owned(const Matrix<const T>& dataset, const IndexParameters& params) {
    params.validate(ElementTraits<T>::type);
    require_dataset(dataset, "Dataset");
    Logger::set_threshold(params.log_level);

    auto index = create_index<T>(params);

    Timer timer;
    index->build(std::make_shared<Dataset<T>>(dataset));
    Logger::info("Built " + std::string(to_string(params.algorithm)) + " index over " +
                 std::to_string(dataset.rows()) + " x " + std::to_string(dataset.cols()) + " " +
                 ElementTraits<T>::name + " points in " + std::to_string(timer.elapsed_ms()) + "ms");
    return index;
}

} // namespace

template <typename T>
typename Engine<T>::BuildResult Engine<T>::build_index(const Matrix<const T>& dataset, const IndexParameters& params) {
    auto index = build_owned(dataset, params);

    BuildResult result;
    result.chosen = params;
    if (const auto* tuned = dynamic_cast<const AutotunedIndex<T>*>(index.get())) {
        result.chosen = tuned->chosen_parameters();
        result.speedup = tuned->speedup();
    }

    result.handle = registry_.insert(std::move(index));
    return result;
}

template <typename T>
void Engine<T>::add_points(Handle handle, const Matrix<const T>& points, float rebuild_threshold) {
    registry_.with_exclusive<T>(handle, [&](NNIndex<T>& index) {
        if (points.rows() == 0) return;
        if (points.data() == nullptr) throw DimensionError("Points buffer is null");
        require_cols(index, points.cols(), "Point");
        index.add_points(points, rebuild_threshold);
    });
}

template <typename T>
void Engine<T>::remove_point(Handle handle, size_t id) {
    registry_.with_exclusive<T>(handle, [&](NNIndex<T>& index) { index.remove_point(id); });
}

template <typename T>
void Engine<T>::save_index(Handle handle, const std::string& path) {
    if (path.empty()) throw IoError("Index file name is empty");
    registry_.with_exclusive<T>(handle, [&](NNIndex<T>& index) { Annex::save_index(index, path); });
}

template <typename T>
typename Engine<T>::Handle Engine<T>::load_index(const std::string& path, const Matrix<const T>& dataset) {
    if (path.empty()) throw IoError("Index file name is empty");
    require_dataset(dataset, "Dataset");
    return registry_.insert(Annex::load_index(path, std::make_shared<Dataset<T>>(dataset)));
}

template <typename T>
void Engine<T>::knn_search(Handle handle, const Matrix<const T>& queries, const Matrix<int>& indices,
                           const Matrix<DistanceType>& dists, size_t knn, const SearchParameters& params) const {
    require_search(params);
    if (knn == 0) throw ConfigError("Number of neighbors must be at least 1");
    if (queries.rows() == 0) return;
    if (queries.data() == nullptr || indices.data() == nullptr || dists.data() == nullptr) {
        throw DimensionError("Search buffers are null");
    }

    registry_.with_shared<T>(handle, [&](const NNIndex<T>& index) {
        Annex::knn_search(index, queries, indices, dists, knn, params);
    });
}

template <typename T>
RadiusResult Engine<T>::radius_search(Handle handle, const T* query, size_t cols, DistanceType radius,
                                      int* indices, DistanceType* dists, size_t capacity,
                                      const SearchParameters& params) const {
    require_search(params);
    if (query == nullptr) throw DimensionError("Query buffer is null");
    if (radius < 0) throw ConfigError("Radius must be non-negative");

    return registry_.with_shared<T>(handle, [&](const NNIndex<T>& index) {
        require_cols(index, cols, "Query");
        return Annex::radius_search(index, query, radius, indices, dists, capacity, params);
    });
}

template <typename T>
size_t Engine<T>::used_memory(Handle handle) const {
    return registry_.with_shared<T>(handle, [](const NNIndex<T>& index) { return index.used_memory(); });
}

template <typename T>
void Engine<T>::free_index(Handle handle) {
    // Type check before the handle is invalidated
    registry_.with_shared<T>(handle, [](const NNIndex<T>&) {});
    registry_.erase(handle);
}

template <typename T>
void Engine<T>::find_nearest_neighbors(const Matrix<const T>& dataset, const Matrix<const T>& queries,
                                       const Matrix<int>& indices, const Matrix<DistanceType>& dists,
                                       size_t knn, const IndexParameters& params) {
    const SearchParameters search = params.search_parameters();
    require_search(search);
    if (knn == 0) throw ConfigError("Number of neighbors must be at least 1");

    auto index = build_owned(dataset, params);
    if (queries.rows() == 0) return;
    if (queries.data() == nullptr || indices.data() == nullptr || dists.data() == nullptr) {
        throw DimensionError("Search buffers are null");
    }
    Annex::knn_search(*index, queries, indices, dists, knn, search);
}

template <typename T>
size_t Engine<T>::compute_cluster_centers(const Matrix<const T>& dataset, const Matrix<DistanceType>& centers,
                                          const IndexParameters& params) {
    IndexParameters kmeans = params;
    kmeans.algorithm = Algorithm::KMeans;
    kmeans.validate(ElementTraits<T>::type);
    require_dataset(dataset, "Dataset");
    if (centers.rows() == 0 || centers.data() == nullptr) throw ConfigError("Number of clusters must be at least 1");
    if (centers.cols() != dataset.cols()) {
        throw DimensionError("Cluster center buffer has " + std::to_string(centers.cols()) +
                             " columns, dataset has " + std::to_string(dataset.cols()));
    }
    Logger::set_threshold(kmeans.log_level);

    KMeansIndex<T> index(kmeans);
    index.build(std::make_shared<Dataset<T>>(dataset));

    const Dataset<DistanceType> found = index.cluster_centers(centers.rows());
    std::copy(found.data(), found.data() + found.rows() * found.cols(), centers.data());
    return found.rows();
}

template class Engine<float>;
template class Engine<double>;
template class Engine<uint8_t>;
template class Engine<int32_t>;

} // namespace Annex
