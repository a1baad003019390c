/**
 * @file parameters.hpp
 * @brief Build/search configuration record and its symbolic translation tables
 *
 * IndexParameters is the flat record every build call carries. Field order
 * and defaults mirror the C struct AnnexParameters in interop_api.h; the
 * symbolic names ("kdtree", "gonzales", "warning", ...) are accepted by the
 * JSON loader and the string converters below.
 */

#pragma once

#include <core/types.hpp>
#include <distance/distance.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace Annex {

class CancellationToken;

/**
 * @brief Search-time options extracted from IndexParameters
 */
struct SearchParameters {
    int checks = 32;                 // Leaf/point visits; CHECKS_UNLIMITED for exact
    float eps = 0.0f;                // Pruning relaxation: prune when mindist*(1+eps) > worst
    bool sorted = true;              // Order results by ascending distance
    int max_neighbors = -1;          // <= 0 means no cap beyond k / buffer capacity
    int cores = 0;                   // 0 = all hardware threads, 1 = serial
    const CancellationToken* cancel = nullptr;
};

struct IndexParameters {
    Algorithm algorithm = Algorithm::KDTree;

    // Search
    int checks = 32;
    float eps = 0.0f;
    bool sorted = true;
    int max_neighbors = -1;
    int cores = 0;

    // Tree / clustering
    int trees = 1;
    int leaf_max_size = 4;
    int branching = 32;
    int iterations = 5;              // -1 = iterate until convergence
    CentersInit centers_init = CentersInit::Random;
    float cb_index = 0.5f;

    // Autotuning
    float target_precision = 0.9f;
    float build_weight = 0.01f;
    float memory_weight = 0.0f;
    float sample_fraction = 0.1f;

    // LSH
    unsigned table_number = 12;
    unsigned key_size = 20;
    unsigned multi_probe_level = 2;

    LogLevel log_level = LogLevel::Warning;
    long random_seed = -1;           // < 0 = seed from std::random_device

    DistanceType distance = DistanceType::Euclidean;
    int distance_order = 2;          // Minkowski order

    SearchParameters search_parameters() const;

    Distance metric() const { return Distance(distance, distance_order); }

    /**
     * @brief Range and compatibility checks for a build over element type `element`
     * @throws ConfigError
     */
    void validate(ElementType element) const;

    /**
     * @brief Set one field from its symbolic or numeric JSON value
     * @throws ConfigError on unknown field or invalid enum name
     */
    void update(const std::string& field, const nlohmann::json& value);
};

// =============================================================================
//  Symbolic translation
// =============================================================================

ANNEX_API std::string_view to_string(Algorithm algorithm);
ANNEX_API std::string_view to_string(CentersInit init);
ANNEX_API std::string_view to_string(LogLevel level);
ANNEX_API std::string_view to_string(DistanceType type);
ANNEX_API std::string_view to_string(ElementType type);

ANNEX_API Algorithm algorithm_from_string(std::string_view name);
ANNEX_API CentersInit centers_init_from_string(std::string_view name);
ANNEX_API LogLevel log_level_from_string(std::string_view name);
ANNEX_API DistanceType distance_from_string(std::string_view name);

// Integer -> enum with range checking (used by the C layer and file loader)
ANNEX_API Algorithm algorithm_from_int(int value);
ANNEX_API CentersInit centers_init_from_int(int value);
ANNEX_API LogLevel log_level_from_int(int value);
ANNEX_API DistanceType distance_from_int(int value);

// =============================================================================
//  JSON
// =============================================================================

/**
 * @brief Build parameters from a JSON object, starting from defaults
 *
 * Keys are the field names above; the LSH fields also accept the
 * trailing-underscore spelling used by the C struct ("table_number_").
 */
ANNEX_API IndexParameters parameters_from_json(const nlohmann::json& json);
ANNEX_API nlohmann::json parameters_to_json(const IndexParameters& params);

ANNEX_API IndexParameters load_parameters_file(const std::string& path);

} // namespace Annex
