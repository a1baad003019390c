/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 fingerprints for datasets bound to persisted indexes
 */

#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

extern "C" {
#include <blake3.h>
}

namespace Annex {

/**
 * @brief BLAKE3 hashing truncated to 128 bits
 *
 * An index file stores the digest of the dataset it was built over; loading
 * against different data is rejected by comparing digests.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     */
    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Hash several buffers as one stream, in order
     */
    static Hash hash_parts(std::initializer_list<std::pair<const void*, size_t>> parts);

    /**
     * @brief Convert hash to hex string
     */
    static std::string to_hex(const Hash& hash);

    static bool equal(const Hash& a, const Hash& b) {
        return a == b;
    }
};

} // namespace Annex
