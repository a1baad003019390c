#pragma once

#include <export.hpp>

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

typedef enum {
    ANNEX_OK                 = 0,
    ANNEX_ERROR_CONFIG       = -1,
    ANNEX_ERROR_RESOURCE     = -2,
    ANNEX_ERROR_HANDLE       = -3,
    ANNEX_ERROR_DIMENSION    = -4,
    ANNEX_ERROR_IO           = -5,
    ANNEX_ERROR_CANCELLED    = -6,
    ANNEX_ERROR_INTERNAL     = -7
} annex_status_t;

// Thread-local: describe the most recent failure on the calling thread
ANNEX_API const char* annex_get_last_error(void);
ANNEX_API int annex_get_last_error_kind(void);
ANNEX_API const char* annex_get_version(void);

// =============================================================================
//  Parameters
// =============================================================================

/*
 * Field order and defaults match Annex::IndexParameters. Enum fields take
 * the integer codes of the translation tables (algorithm 0..6/254/255,
 * centers_init 0..2, log_level 0..4, distance 1..9).
 */
typedef struct AnnexParameters {
    int algorithm;
    int checks;
    float eps;
    int sorted;
    int max_neighbors;
    int cores;

    int trees;
    int leaf_max_size;
    int branching;
    int iterations;
    int centers_init;
    float cb_index;

    float target_precision;
    float build_weight;
    float memory_weight;
    float sample_fraction;

    unsigned int table_number_;
    unsigned int key_size_;
    unsigned int multi_probe_level_;

    int log_level;
    long random_seed;

    int distance;
    int distance_order;
} AnnexParameters;

typedef uint64_t annex_index_t;

ANNEX_API int annex_default_parameters(AnnexParameters* out_params);
ANNEX_API int annex_log_verbosity(int level);

// =============================================================================
//  Typed Entry Points
// =============================================================================

/*
 * One set per element type: _float, _double, _byte (uint8) and _int (int32).
 * Distances are reported as double for double data and float otherwise.
 *
 * Functions returning int yield >= 0 on success and a negative
 * annex_status_t on failure; build/load return 0 on failure. A NULL params
 * pointer means the defaults.
 *
 * Radius search returns the number of hits written to indices/dists. When
 * `found` is non-NULL it receives every hit within the radius; a value above
 * the return value means the answer was truncated by max_nn or max_neighbors.
 */
#define ANNEX_DECLARE_TYPED_API(SUFFIX, ELEM, DIST)                                                   \
    ANNEX_API annex_index_t annex_build_index_##SUFFIX(                                               \
        const ELEM* dataset, int rows, int cols, float* speedup, AnnexParameters* params);            \
    ANNEX_API int annex_add_points_##SUFFIX(                                                          \
        annex_index_t index, const ELEM* points, int rows, int cols, float rebuild_threshold);        \
    ANNEX_API int annex_remove_point_##SUFFIX(annex_index_t index, unsigned int point_id);            \
    ANNEX_API int annex_save_index_##SUFFIX(annex_index_t index, const char* filename);               \
    ANNEX_API annex_index_t annex_load_index_##SUFFIX(                                                \
        const char* filename, const ELEM* dataset, int rows, int cols);                               \
    ANNEX_API int annex_find_nearest_neighbors_##SUFFIX(                                              \
        const ELEM* dataset, int rows, int cols, const ELEM* testset, int tcount,                     \
        int* result, DIST* dists, int nn, const AnnexParameters* params);                             \
    ANNEX_API int annex_find_nearest_neighbors_index_##SUFFIX(                                        \
        annex_index_t index, const ELEM* testset, int tcount, int cols,                               \
        int* result, DIST* dists, int nn, const AnnexParameters* params);                             \
    ANNEX_API int annex_radius_search_##SUFFIX(                                                       \
        annex_index_t index, const ELEM* query, int cols, int* indices, DIST* dists,                  \
        int max_nn, float radius, int* found, const AnnexParameters* params);                         \
    ANNEX_API int annex_compute_cluster_centers_##SUFFIX(                                             \
        const ELEM* dataset, int rows, int cols, int clusters, DIST* result,                          \
        const AnnexParameters* params);                                                               \
    ANNEX_API int64_t annex_used_memory_##SUFFIX(annex_index_t index);                                \
    ANNEX_API int annex_free_index_##SUFFIX(annex_index_t index, const AnnexParameters* params);

ANNEX_DECLARE_TYPED_API(float, float, float)
ANNEX_DECLARE_TYPED_API(double, double, double)
ANNEX_DECLARE_TYPED_API(byte, unsigned char, float)
ANNEX_DECLARE_TYPED_API(int, int, float)

#ifdef __cplusplus
}
#endif
