/**
 * @file types.hpp
 * @brief Element types, enumerations and per-type traits shared by every module
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace Annex {

// =============================================================================
//  Enumerations (integer values match the C API and the index file format)
// =============================================================================

enum class ElementType : int32_t {
    Float32 = 0,
    Float64 = 1,
    UInt8   = 2,
    Int32   = 3
};

enum class Algorithm : int32_t {
    Linear       = 0,
    KDTree       = 1,
    KMeans       = 2,
    Composite    = 3,
    KDTreeSingle = 4,
    Hierarchical = 5,
    LSH          = 6,
    Saved        = 254,
    Autotuned    = 255
};

enum class CentersInit : int32_t {
    Random   = 0,
    Gonzales = 1,
    KMeansPP = 2
};

enum class LogLevel : int32_t {
    None    = 0,
    Fatal   = 1,
    Error   = 2,
    Warning = 3,
    Info    = 4
};

enum class DistanceType : int32_t {
    Euclidean       = 1,
    Manhattan       = 2,
    Minkowski       = 3,
    Max             = 4,
    HistIntersect   = 5,
    Hellinger       = 6,
    ChiSquare       = 7,
    KullbackLeibler = 8,
    Hamming         = 9
};

// Search budget sentinels for SearchParameters::checks
inline constexpr int CHECKS_UNLIMITED = -1;
inline constexpr int CHECKS_AUTOTUNED = -2;

// Probe masks grow as sum C(key_size, l) for l <= level
inline constexpr unsigned LSH_MAX_MULTI_PROBE_LEVEL = 4;

// =============================================================================
//  Element traits
// =============================================================================

/**
 * @brief Maps an element type to its tag and distance accumulator type.
 *
 * Distances over double data accumulate in double; every other element type
 * accumulates in float.
 */
template <typename T>
struct ElementTraits;

template <>
struct ElementTraits<float> {
    using ResultType = float;
    static constexpr ElementType type = ElementType::Float32;
    static constexpr const char* name = "float";
};

template <>
struct ElementTraits<double> {
    using ResultType = double;
    static constexpr ElementType type = ElementType::Float64;
    static constexpr const char* name = "double";
};

template <>
struct ElementTraits<uint8_t> {
    using ResultType = float;
    static constexpr ElementType type = ElementType::UInt8;
    static constexpr const char* name = "byte";
};

template <>
struct ElementTraits<int32_t> {
    using ResultType = float;
    static constexpr ElementType type = ElementType::Int32;
    static constexpr const char* name = "int";
};

template <typename T>
using ResultType = typename ElementTraits<T>::ResultType;

/**
 * @brief One search hit: dataset row id and its distance to the query
 */
template <typename DistanceT>
struct Neighbor {
    size_t index;
    DistanceT distance;

    bool operator<(const Neighbor& other) const {
        if (distance != other.distance) return distance < other.distance;
        return index < other.index;
    }
};

template <typename DistanceT>
constexpr DistanceT max_distance() {
    return std::numeric_limits<DistanceT>::max();
}

} // namespace Annex
