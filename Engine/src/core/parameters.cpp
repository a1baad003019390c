/**
 * @file parameters.cpp
 * @brief Parameter validation, symbolic translation and JSON conversion
 */

#include <core/parameters.hpp>
#include <core/error.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <array>
#include <type_traits>
#include <utility>

namespace Annex {

namespace {

template <typename E, size_t N>
using NameTable = std::array<std::pair<std::string_view, E>, N>;

// First entry per value is the canonical name; the rest are aliases.
constexpr NameTable<Algorithm, 10> k_algorithm_names = {{
    {"linear", Algorithm::Linear},
    {"kdtree", Algorithm::KDTree},
    {"kmeans", Algorithm::KMeans},
    {"composite", Algorithm::Composite},
    {"kdtree_single", Algorithm::KDTreeSingle},
    {"hierarchical", Algorithm::Hierarchical},
    {"lsh", Algorithm::LSH},
    {"saved", Algorithm::Saved},
    {"autotuned", Algorithm::Autotuned},
    {"default", Algorithm::KDTree},
}};

constexpr NameTable<CentersInit, 4> k_centers_names = {{
    {"random", CentersInit::Random},
    {"gonzales", CentersInit::Gonzales},
    {"kmeanspp", CentersInit::KMeansPP},
    {"default", CentersInit::Random},
}};

constexpr NameTable<LogLevel, 6> k_log_level_names = {{
    {"none", LogLevel::None},
    {"fatal", LogLevel::Fatal},
    {"error", LogLevel::Error},
    {"warning", LogLevel::Warning},
    {"info", LogLevel::Info},
    {"default", LogLevel::Error},
}};

constexpr NameTable<DistanceType, 13> k_distance_names = {{
    {"euclidean", DistanceType::Euclidean},
    {"manhattan", DistanceType::Manhattan},
    {"minkowski", DistanceType::Minkowski},
    {"max", DistanceType::Max},
    {"hist_intersect", DistanceType::HistIntersect},
    {"hellinger", DistanceType::Hellinger},
    {"chi_square", DistanceType::ChiSquare},
    {"kullback_leibler", DistanceType::KullbackLeibler},
    {"hamming", DistanceType::Hamming},
    {"l2", DistanceType::Euclidean},
    {"l1", DistanceType::Manhattan},
    {"cs", DistanceType::ChiSquare},
    {"kl", DistanceType::KullbackLeibler},
}};

template <typename E, size_t N>
std::string_view name_of(const NameTable<E, N>& table, E value) {
    for (const auto& [name, v] : table) {
        if (v == value) return name;
    }
    return "unknown";
}

template <typename E, size_t N>
E value_of(const NameTable<E, N>& table, std::string_view name, const char* what) {
    for (const auto& [n, v] : table) {
        if (n == name) return v;
    }
    throw ConfigError("Invalid " + std::string(what) + " value: '" + std::string(name) + "'");
}

template <typename E, size_t N>
E value_of_int(const NameTable<E, N>& table, int value, const char* what) {
    for (const auto& entry : table) {
        if (static_cast<int>(entry.second) == value) return entry.second;
    }
    throw ConfigError("Invalid " + std::string(what) + " value: " + std::to_string(value));
}

template <typename E, size_t N>
E enum_from_json(const NameTable<E, N>& table, const nlohmann::json& value, const char* what) {
    if (value.is_string()) return value_of(table, value.get<std::string>(), what);
    if (value.is_number_integer()) return value_of_int(table, value.get<int>(), what);
    throw ConfigError(std::string(what) + " must be a name or an integer");
}

template <typename V>
V number_from_json(const nlohmann::json& value, const std::string& field) {
    if (!value.is_number()) {
        throw ConfigError("Field '" + field + "' must be numeric");
    }
    if constexpr (std::is_integral_v<V>) {
        using Limits = std::numeric_limits<V>;
        const std::string out_of_range = "Field '" + field + "' is out of range";
        if (value.is_number_unsigned()) {
            if (value.get<unsigned long long>() > static_cast<unsigned long long>(Limits::max())) {
                throw ConfigError(out_of_range);
            }
        } else if (value.is_number_integer()) {
            const long long v = value.get<long long>();
            if (std::is_unsigned_v<V> && v < 0) {
                throw ConfigError("Field '" + field + "' must be non-negative");
            }
            if (v < static_cast<long long>(Limits::lowest()) ||
                (v > 0 && static_cast<unsigned long long>(v) > static_cast<unsigned long long>(Limits::max()))) {
                throw ConfigError(out_of_range);
            }
        } else {
            const double v = value.get<double>();
            if (std::trunc(v) != v) throw ConfigError("Field '" + field + "' must be an integer");
            if (v < static_cast<double>(Limits::lowest()) || v > static_cast<double>(Limits::max())) {
                throw ConfigError(out_of_range);
            }
        }
    }
    return value.get<V>();
}

void require(bool condition, const std::string& message) {
    if (!condition) throw ConfigError(message);
}

bool is_kdtree_family(Algorithm algorithm) {
    return algorithm == Algorithm::KDTree || algorithm == Algorithm::KDTreeSingle ||
           algorithm == Algorithm::Composite;
}

} // namespace

std::string_view to_string(Algorithm algorithm) { return name_of(k_algorithm_names, algorithm); }
std::string_view to_string(CentersInit init) { return name_of(k_centers_names, init); }
std::string_view to_string(LogLevel level) { return name_of(k_log_level_names, level); }
std::string_view to_string(DistanceType type) { return name_of(k_distance_names, type); }

std::string_view to_string(ElementType type) {
    switch (type) {
        case ElementType::Float32: return "float";
        case ElementType::Float64: return "double";
        case ElementType::UInt8:   return "byte";
        case ElementType::Int32:   return "int";
    }
    return "unknown";
}

Algorithm algorithm_from_string(std::string_view name) { return value_of(k_algorithm_names, name, "algorithm"); }
CentersInit centers_init_from_string(std::string_view name) { return value_of(k_centers_names, name, "centers_init"); }
LogLevel log_level_from_string(std::string_view name) { return value_of(k_log_level_names, name, "log_level"); }
DistanceType distance_from_string(std::string_view name) { return value_of(k_distance_names, name, "distance"); }

Algorithm algorithm_from_int(int value) { return value_of_int(k_algorithm_names, value, "algorithm"); }
CentersInit centers_init_from_int(int value) { return value_of_int(k_centers_names, value, "centers_init"); }
LogLevel log_level_from_int(int value) { return value_of_int(k_log_level_names, value, "log_level"); }
DistanceType distance_from_int(int value) { return value_of_int(k_distance_names, value, "distance"); }

// =============================================================================
//  IndexParameters
// =============================================================================

SearchParameters IndexParameters::search_parameters() const {
    SearchParameters p;
    p.checks = checks;
    p.eps = eps;
    p.sorted = sorted;
    p.max_neighbors = max_neighbors;
    p.cores = cores;
    return p;
}

void IndexParameters::validate(ElementType element) const {
    require(algorithm != Algorithm::Saved,
            "Algorithm 'saved' cannot be built; use load_index with the saved file");
    require(checks >= CHECKS_AUTOTUNED && checks != 0, "checks must be positive, -1 (unlimited) or -2 (autotuned)");
    require(eps >= 0.0f, "eps must be non-negative");
    require(cores >= 0, "cores must be non-negative");
    require(trees >= 1, "trees must be at least 1");
    require(leaf_max_size >= 1, "leaf_max_size must be at least 1");
    require(branching >= 2, "branching must be at least 2");
    require(iterations == -1 || iterations >= 1, "iterations must be -1 or at least 1");
    require(cb_index >= 0.0f, "cb_index must be non-negative");
    require(target_precision > 0.0f && target_precision <= 1.0f, "target_precision must be in (0, 1]");
    require(build_weight >= 0.0f, "build_weight must be non-negative");
    require(memory_weight >= 0.0f, "memory_weight must be non-negative");
    require(sample_fraction > 0.0f && sample_fraction <= 1.0f, "sample_fraction must be in (0, 1]");
    require(table_number >= 1, "table_number must be at least 1");
    require(key_size >= 1 && key_size <= 32, "key_size must be in [1, 32]");
    require(multi_probe_level <= key_size, "multi_probe_level cannot exceed key_size");
    require(multi_probe_level <= LSH_MAX_MULTI_PROBE_LEVEL,
            "multi_probe_level must be at most " + std::to_string(LSH_MAX_MULTI_PROBE_LEVEL));
    require(distance_order >= 1, "distance_order must be at least 1");

    if (distance == DistanceType::Hamming) {
        require(element == ElementType::UInt8 || element == ElementType::Int32,
                "Hamming distance requires byte or int elements");
        require(!is_kdtree_family(algorithm) && algorithm != Algorithm::KMeans,
                "Hamming distance is not supported by algorithm '" + std::string(to_string(algorithm)) + "'");
    }
    if (distance == DistanceType::Max) {
        require(!is_kdtree_family(algorithm),
                "Max distance is not supported by algorithm '" + std::string(to_string(algorithm)) + "'");
    }
}

void IndexParameters::update(const std::string& field, const nlohmann::json& value) {
    if (field == "algorithm") algorithm = enum_from_json(k_algorithm_names, value, "algorithm");
    else if (field == "checks") checks = number_from_json<int>(value, field);
    else if (field == "eps") eps = number_from_json<float>(value, field);
    else if (field == "sorted") sorted = value.is_boolean() ? value.get<bool>() : number_from_json<int>(value, field) != 0;
    else if (field == "max_neighbors") max_neighbors = number_from_json<int>(value, field);
    else if (field == "cores") cores = number_from_json<int>(value, field);
    else if (field == "trees") trees = number_from_json<int>(value, field);
    else if (field == "leaf_max_size") leaf_max_size = number_from_json<int>(value, field);
    else if (field == "branching") branching = number_from_json<int>(value, field);
    else if (field == "iterations") iterations = number_from_json<int>(value, field);
    else if (field == "centers_init") centers_init = enum_from_json(k_centers_names, value, "centers_init");
    else if (field == "cb_index") cb_index = number_from_json<float>(value, field);
    else if (field == "target_precision") target_precision = number_from_json<float>(value, field);
    else if (field == "build_weight") build_weight = number_from_json<float>(value, field);
    else if (field == "memory_weight") memory_weight = number_from_json<float>(value, field);
    else if (field == "sample_fraction") sample_fraction = number_from_json<float>(value, field);
    else if (field == "table_number" || field == "table_number_") table_number = number_from_json<unsigned>(value, field);
    else if (field == "key_size" || field == "key_size_") key_size = number_from_json<unsigned>(value, field);
    else if (field == "multi_probe_level" || field == "multi_probe_level_") multi_probe_level = number_from_json<unsigned>(value, field);
    else if (field == "log_level") log_level = enum_from_json(k_log_level_names, value, "log_level");
    else if (field == "random_seed") random_seed = number_from_json<long>(value, field);
    else if (field == "distance") distance = enum_from_json(k_distance_names, value, "distance");
    else if (field == "distance_order") distance_order = number_from_json<int>(value, field);
    else throw ConfigError("No such member: " + field);
}

// =============================================================================
//  JSON
// =============================================================================

IndexParameters parameters_from_json(const nlohmann::json& json) {
    if (!json.is_object()) throw ConfigError("Parameters must be a JSON object");

    IndexParameters params;
    for (const auto& [key, value] : json.items()) {
        params.update(key, value);
    }
    return params;
}

nlohmann::json parameters_to_json(const IndexParameters& p) {
    return nlohmann::json{
        {"algorithm", to_string(p.algorithm)},
        {"checks", p.checks},
        {"eps", p.eps},
        {"sorted", p.sorted},
        {"max_neighbors", p.max_neighbors},
        {"cores", p.cores},
        {"trees", p.trees},
        {"leaf_max_size", p.leaf_max_size},
        {"branching", p.branching},
        {"iterations", p.iterations},
        {"centers_init", to_string(p.centers_init)},
        {"cb_index", p.cb_index},
        {"target_precision", p.target_precision},
        {"build_weight", p.build_weight},
        {"memory_weight", p.memory_weight},
        {"sample_fraction", p.sample_fraction},
        {"table_number", p.table_number},
        {"key_size", p.key_size},
        {"multi_probe_level", p.multi_probe_level},
        {"log_level", to_string(p.log_level)},
        {"random_seed", p.random_seed},
        {"distance", to_string(p.distance)},
        {"distance_order", p.distance_order},
    };
}

IndexParameters load_parameters_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw IoError("Cannot open parameter file: " + path);

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed parameter file " + path + ": " + e.what());
    }
    return parameters_from_json(json);
}

} // namespace Annex
