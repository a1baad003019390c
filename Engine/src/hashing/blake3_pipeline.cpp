/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <iomanip>
#include <sstream>

namespace Annex {

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    return hash_parts({{data, len}});
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_parts(std::initializer_list<std::pair<const void*, size_t>> parts) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    for (const auto& [data, len] : parts) {
        if (len > 0) blake3_hasher_update(&hasher, data, len);
    }
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

} // namespace Annex
