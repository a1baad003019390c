#pragma once

#include <algorithm>
#include <numeric>
#include <random>
#include <vector>

namespace Annex {

/**
 * @brief Seeded generator; a negative seed draws one from std::random_device
 */
inline std::mt19937 make_rng(long seed) {
    if (seed < 0) {
        std::random_device device;
        return std::mt19937(device());
    }
    return std::mt19937(static_cast<std::mt19937::result_type>(seed));
}

inline std::vector<size_t> random_permutation(size_t n, std::mt19937& rng) {
    std::vector<size_t> ids(n);
    std::iota(ids.begin(), ids.end(), size_t{0});
    std::shuffle(ids.begin(), ids.end(), rng);
    return ids;
}

/**
 * @brief `count` distinct values from `pool`, in random order
 */
inline std::vector<size_t> random_sample(const std::vector<size_t>& pool, size_t count, std::mt19937& rng) {
    std::vector<size_t> out(pool);
    count = std::min(count, out.size());
    for (size_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<size_t> pick(i, out.size() - 1);
        std::swap(out[i], out[pick(rng)]);
    }
    out.resize(count);
    return out;
}

inline size_t random_index(size_t n, std::mt19937& rng) {
    std::uniform_int_distribution<size_t> pick(0, n - 1);
    return pick(rng);
}

} // namespace Annex
