#include <interop_api.h>
#include <engine/engine.hpp>
#include <core/error.hpp>
#include <core/parameters.hpp>
#include <utils/logger.hpp>
#include <limits>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>

using Annex::Engine;
using Annex::ErrorKind;
using Annex::IndexParameters;
using Annex::Matrix;

// Thread-local error storage
thread_local std::string g_last_error;
thread_local int g_last_error_kind = ANNEX_OK;

const char* annex_get_last_error(void) {
    return g_last_error.c_str();
}

int annex_get_last_error_kind(void) {
    return g_last_error_kind;
}

const char* annex_get_version(void) {
    return "1.0.0";
}

static int set_error(ErrorKind kind, const char* message) {
    g_last_error = message;
    g_last_error_kind = -static_cast<int>(kind);
    return g_last_error_kind;
}

// Status codes are the negated ErrorKind values
static_assert(ANNEX_ERROR_CONFIG == -static_cast<int>(ErrorKind::Config));
static_assert(ANNEX_ERROR_INTERNAL == -static_cast<int>(ErrorKind::Internal));

#define INTEROP_CATCH(failure) \
    catch (const Annex::Error& e) { \
        set_error(e.kind(), e.what()); \
        return failure; \
    } catch (const std::bad_alloc& e) { \
        set_error(ErrorKind::Resource, e.what()); \
        return failure; \
    } catch (const std::exception& e) { \
        set_error(ErrorKind::Internal, e.what()); \
        return failure; \
    }

#define INTEROP_TRY_CATCH(...) \
    try { \
        __VA_ARGS__ \
    } INTEROP_CATCH(g_last_error_kind)

#define INTEROP_TRY_CATCH_HANDLE(...) \
    try { \
        __VA_ARGS__ \
    } INTEROP_CATCH(annex_index_t{0})

// =============================================================================
//  Parameters
// =============================================================================

namespace {

IndexParameters from_c(const AnnexParameters* p) {
    IndexParameters out;
    if (p == nullptr) return out;

    out.algorithm = Annex::algorithm_from_int(p->algorithm);
    out.checks = p->checks;
    out.eps = p->eps;
    out.sorted = p->sorted != 0;
    out.max_neighbors = p->max_neighbors;
    out.cores = p->cores;
    out.trees = p->trees;
    out.leaf_max_size = p->leaf_max_size;
    out.branching = p->branching;
    out.iterations = p->iterations;
    out.centers_init = Annex::centers_init_from_int(p->centers_init);
    out.cb_index = p->cb_index;
    out.target_precision = p->target_precision;
    out.build_weight = p->build_weight;
    out.memory_weight = p->memory_weight;
    out.sample_fraction = p->sample_fraction;
    out.table_number = p->table_number_;
    out.key_size = p->key_size_;
    out.multi_probe_level = p->multi_probe_level_;
    out.log_level = Annex::log_level_from_int(p->log_level);
    out.random_seed = p->random_seed;
    out.distance = Annex::distance_from_int(p->distance);
    out.distance_order = p->distance_order;
    return out;
}

void to_c(const IndexParameters& p, AnnexParameters* out) {
    out->algorithm = static_cast<int>(p.algorithm);
    out->checks = p.checks;
    out->eps = p.eps;
    out->sorted = p.sorted ? 1 : 0;
    out->max_neighbors = p.max_neighbors;
    out->cores = p.cores;
    out->trees = p.trees;
    out->leaf_max_size = p.leaf_max_size;
    out->branching = p.branching;
    out->iterations = p.iterations;
    out->centers_init = static_cast<int>(p.centers_init);
    out->cb_index = p.cb_index;
    out->target_precision = p.target_precision;
    out->build_weight = p.build_weight;
    out->memory_weight = p.memory_weight;
    out->sample_fraction = p.sample_fraction;
    out->table_number_ = p.table_number;
    out->key_size_ = p.key_size;
    out->multi_probe_level_ = p.multi_probe_level;
    out->log_level = static_cast<int>(p.log_level);
    out->random_seed = p.random_seed;
    out->distance = static_cast<int>(p.distance);
    out->distance_order = p.distance_order;
}

size_t checked_count(int value, const char* what) {
    if (value < 0) throw Annex::DimensionError(std::string(what) + " must be non-negative, got " + std::to_string(value));
    return static_cast<size_t>(value);
}

int to_int(size_t value, const char* what) {
    if (value > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw Annex::DimensionError(std::string(what) + " " + std::to_string(value) + " does not fit in an int");
    }
    return static_cast<int>(value);
}

template <typename T>
Matrix<const T> view(const T* data, int rows, int cols, const char* what) {
    const size_t r = checked_count(rows, what);
    const size_t c = checked_count(cols, what);
    if (data == nullptr && r > 0) throw Annex::DimensionError(std::string(what) + " buffer is null");
    return Matrix<const T>(data, r, c);
}

// Searches accept NULL params as "use the defaults"
Annex::SearchParameters search_parameters(const AnnexParameters* params) {
    const IndexParameters p = from_c(params);
    if (params != nullptr) Annex::Logger::set_threshold(p.log_level);
    return p.search_parameters();
}

// =============================================================================
//  Typed implementations
// =============================================================================

template <typename T>
annex_index_t build_index(const T* dataset, int rows, int cols, float* speedup, AnnexParameters* params) {
    const IndexParameters request = from_c(params);
    const auto built = Engine<T>().build_index(view(dataset, rows, cols, "Dataset"), request);

    if (speedup != nullptr) *speedup = built.speedup;
    if (params != nullptr && request.algorithm == Annex::Algorithm::Autotuned) to_c(built.chosen, params);
    return built.handle;
}

template <typename T>
int add_points(annex_index_t index, const T* points, int rows, int cols, float rebuild_threshold) {
    Engine<T>().add_points(index, view(points, rows, cols, "Points"), rebuild_threshold);
    return ANNEX_OK;
}

template <typename T>
int remove_point(annex_index_t index, unsigned int point_id) {
    Engine<T>().remove_point(index, point_id);
    return ANNEX_OK;
}

template <typename T>
int save_index(annex_index_t index, const char* filename) {
    if (filename == nullptr) throw Annex::IoError("Index file name is null");
    Engine<T>().save_index(index, filename);
    return ANNEX_OK;
}

template <typename T>
annex_index_t load_index(const char* filename, const T* dataset, int rows, int cols) {
    if (filename == nullptr) throw Annex::IoError("Index file name is null");
    return Engine<T>().load_index(filename, view(dataset, rows, cols, "Dataset"));
}

template <typename T, typename D = Annex::ResultType<T>>
int find_nearest_neighbors(const T* dataset, int rows, int cols, const T* testset, int tcount,
                           int* result, D* dists, int nn, const AnnexParameters* params) {
    const IndexParameters p = from_c(params);
    const size_t k = checked_count(nn, "Neighbor count");
    const auto queries = view(testset, tcount, cols, "Testset");

    Engine<T>::find_nearest_neighbors(view(dataset, rows, cols, "Dataset"), queries,
                                      Matrix<int>(result, queries.rows(), k),
                                      Matrix<D>(dists, queries.rows(), k), k, p);
    return ANNEX_OK;
}

template <typename T, typename D = Annex::ResultType<T>>
int find_nearest_neighbors_index(annex_index_t index, const T* testset, int tcount, int cols,
                                 int* result, D* dists, int nn, const AnnexParameters* params) {
    const size_t k = checked_count(nn, "Neighbor count");
    const auto queries = view(testset, tcount, cols, "Testset");

    Engine<T>().knn_search(index, queries, Matrix<int>(result, queries.rows(), k),
                           Matrix<D>(dists, queries.rows(), k), k, search_parameters(params));
    return ANNEX_OK;
}

template <typename T, typename D = Annex::ResultType<T>>
int radius_search(annex_index_t index, const T* query, int cols, int* indices, D* dists,
                  int max_nn, float radius, int* found, const AnnexParameters* params) {
    const auto hits = Engine<T>().radius_search(index, query, checked_count(cols, "Query"), static_cast<D>(radius),
                                                indices, dists, checked_count(max_nn, "max_nn"),
                                                search_parameters(params));
    if (found != nullptr) *found = to_int(hits.found, "Radius hit count");
    return to_int(hits.returned, "Radius hit count");
}

template <typename T, typename D = Annex::ResultType<T>>
int compute_cluster_centers(const T* dataset, int rows, int cols, int clusters, D* result,
                            const AnnexParameters* params) {
    const auto data = view(dataset, rows, cols, "Dataset");
    if (clusters < 1) throw Annex::ConfigError("Number of clusters must be at least 1");
    if (result == nullptr) throw Annex::DimensionError("Cluster center buffer is null");

    const size_t count = Engine<T>::compute_cluster_centers(
        data, Matrix<D>(result, static_cast<size_t>(clusters), data.cols()), from_c(params));
    return to_int(count, "Cluster count");
}

template <typename T>
int64_t used_memory(annex_index_t index) {
    return static_cast<int64_t>(Engine<T>().used_memory(index));
}

template <typename T>
int free_index(annex_index_t index, const AnnexParameters* params) {
    if (params != nullptr) Annex::Logger::set_threshold(from_c(params).log_level);
    Engine<T>().free_index(index);
    return ANNEX_OK;
}

} // namespace

// =============================================================================
//  Global Entry Points
// =============================================================================

int annex_default_parameters(AnnexParameters* out_params) {
    INTEROP_TRY_CATCH({
        if (out_params == nullptr) throw Annex::ConfigError("Parameter struct is null");
        to_c(IndexParameters{}, out_params);
        return ANNEX_OK;
    })
}

int annex_log_verbosity(int level) {
    INTEROP_TRY_CATCH({
        Annex::Logger::set_threshold(Annex::log_level_from_int(level));
        return ANNEX_OK;
    })
}

// =============================================================================
//  Typed Entry Points
// =============================================================================

#define ANNEX_DEFINE_TYPED_API(SUFFIX, ELEM, DIST)                                                    \
    static_assert(std::is_same_v<DIST, Annex::ResultType<ELEM>>);                                     \
                                                                                                      \
    annex_index_t annex_build_index_##SUFFIX(                                                         \
        const ELEM* dataset, int rows, int cols, float* speedup, AnnexParameters* params) {           \
        INTEROP_TRY_CATCH_HANDLE({ return build_index<ELEM>(dataset, rows, cols, speedup, params); }) \
    }                                                                                                 \
    int annex_add_points_##SUFFIX(                                                                    \
        annex_index_t index, const ELEM* points, int rows, int cols, float rebuild_threshold) {       \
        INTEROP_TRY_CATCH({ return add_points<ELEM>(index, points, rows, cols, rebuild_threshold); }) \
    }                                                                                                 \
    int annex_remove_point_##SUFFIX(annex_index_t index, unsigned int point_id) {                     \
        INTEROP_TRY_CATCH({ return remove_point<ELEM>(index, point_id); })                            \
    }                                                                                                 \
    int annex_save_index_##SUFFIX(annex_index_t index, const char* filename) {                        \
        INTEROP_TRY_CATCH({ return save_index<ELEM>(index, filename); })                              \
    }                                                                                                 \
    annex_index_t annex_load_index_##SUFFIX(                                                          \
        const char* filename, const ELEM* dataset, int rows, int cols) {                              \
        INTEROP_TRY_CATCH_HANDLE({ return load_index<ELEM>(filename, dataset, rows, cols); })         \
    }                                                                                                 \
    int annex_find_nearest_neighbors_##SUFFIX(                                                        \
        const ELEM* dataset, int rows, int cols, const ELEM* testset, int tcount,                     \
        int* result, DIST* dists, int nn, const AnnexParameters* params) {                            \
        INTEROP_TRY_CATCH({                                                                           \
            return find_nearest_neighbors<ELEM>(dataset, rows, cols, testset, tcount,                 \
                                                result, dists, nn, params);                           \
        })                                                                                            \
    }                                                                                                 \
    int annex_find_nearest_neighbors_index_##SUFFIX(                                                  \
        annex_index_t index, const ELEM* testset, int tcount, int cols,                               \
        int* result, DIST* dists, int nn, const AnnexParameters* params) {                            \
        INTEROP_TRY_CATCH({                                                                           \
            return find_nearest_neighbors_index<ELEM>(index, testset, tcount, cols,                   \
                                                      result, dists, nn, params);                     \
        })                                                                                            \
    }                                                                                                 \
    int annex_radius_search_##SUFFIX(                                                                 \
        annex_index_t index, const ELEM* query, int cols, int* indices, DIST* dists,                  \
        int max_nn, float radius, int* found, const AnnexParameters* params) {                        \
        INTEROP_TRY_CATCH({                                                                           \
            return radius_search<ELEM>(index, query, cols, indices, dists, max_nn, radius,            \
                                       found, params);                                                \
        })                                                                                            \
    }                                                                                                 \
    int annex_compute_cluster_centers_##SUFFIX(                                                       \
        const ELEM* dataset, int rows, int cols, int clusters, DIST* result,                          \
        const AnnexParameters* params) {                                                              \
        INTEROP_TRY_CATCH({                                                                           \
            return compute_cluster_centers<ELEM>(dataset, rows, cols, clusters, result, params);      \
        })                                                                                            \
    }                                                                                                 \
    int64_t annex_used_memory_##SUFFIX(annex_index_t index) {                                         \
        INTEROP_TRY_CATCH({ return used_memory<ELEM>(index); })                                       \
    }                                                                                                 \
    int annex_free_index_##SUFFIX(annex_index_t index, const AnnexParameters* params) {               \
        INTEROP_TRY_CATCH({ return free_index<ELEM>(index, params); })                                \
    }

ANNEX_DEFINE_TYPED_API(float, float, float)
ANNEX_DEFINE_TYPED_API(double, double, double)
ANNEX_DEFINE_TYPED_API(byte, unsigned char, float)
ANNEX_DEFINE_TYPED_API(int, int, float)
