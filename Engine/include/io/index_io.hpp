/**
 * @file index_io.hpp
 * @brief Index file persistence
 *
 * Layout (little-endian):
 *   "ANNEXIDX" | u32 version | i32 element | i32 algorithm | i32 distance |
 *   i32 distance order | u64 rows | u64 cols | u64 n + n bytes parameter JSON |
 *   16-byte BLAKE3 digest of the dataset | index payload
 *
 * Point data is never written; loading needs the dataset the index was
 * built over and verifies it against the stored shape and digest.
 */

#pragma once

#include <core/matrix.hpp>
#include <core/parameters.hpp>
#include <export.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <index/nn_index.hpp>
#include <memory>
#include <string>

namespace Annex {

inline constexpr char INDEX_FILE_MAGIC[8] = {'A', 'N', 'N', 'E', 'X', 'I', 'D', 'X'};
inline constexpr uint32_t INDEX_FILE_VERSION = 1;

struct IndexFileHeader {
    uint32_t version = INDEX_FILE_VERSION;
    ElementType element = ElementType::Float32;
    Algorithm algorithm = Algorithm::Linear;
    DistanceType distance = DistanceType::Euclidean;
    int32_t distance_order = 2;
    uint64_t rows = 0;
    uint64_t cols = 0;
    IndexParameters params;
    BLAKE3Pipeline::Hash digest{};
};

/**
 * @brief Fingerprint of a dataset's shape, element type and contents
 */
template <typename T>
BLAKE3Pipeline::Hash dataset_digest(const Dataset<T>& dataset);

/**
 * @throws IoError when the file cannot be written
 */
template <typename T>
void save_index(const NNIndex<T>& index, const std::string& path);

/**
 * @throws IoError on unreadable/corrupt files or a digest mismatch
 * @throws DimensionError when the element type or shape differs from the file
 */
template <typename T>
std::unique_ptr<NNIndex<T>> load_index(const std::string& path, std::shared_ptr<Dataset<T>> dataset);

ANNEX_API IndexFileHeader read_index_header(const std::string& path);

} // namespace Annex
