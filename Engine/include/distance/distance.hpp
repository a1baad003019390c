/**
 * @file distance.hpp
 * @brief Metric functors used by every index structure
 *
 * A Distance is a small value (metric + Minkowski order) stored in each
 * index at build time. Evaluation is templated over both operand element
 * types so that tree pivots (accumulator type) can be compared against raw
 * dataset rows (element type).
 *
 * Euclidean is the *squared* L2 distance; Minkowski returns sum |a-b|^p
 * without the final root. Both are monotonic in the true metric, which is
 * all that ranking and pruning need.
 */

#pragma once

#include <core/types.hpp>
#include <core/error.hpp>
#include <export.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <type_traits>

#if defined(__AVX__)
#include <immintrin.h>
#endif

namespace Annex {

namespace detail {

template <typename R, typename A, typename B>
inline R l2(const A* a, const B* b, size_t n, R worst) {
    R result = 0;
    size_t i = 0;

#if defined(__AVX__)
    if constexpr (std::is_same_v<A, float> && std::is_same_v<B, float>) {
        __m256 sum = _mm256_setzero_ps();
        for (; i + 8 <= n; i += 8) {
            __m256 diff = _mm256_sub_ps(_mm256_loadu_ps(a + i), _mm256_loadu_ps(b + i));
            sum = _mm256_add_ps(sum, _mm256_mul_ps(diff, diff));
        }
        float lanes[8];
        _mm256_storeu_ps(lanes, sum);
        for (float lane : lanes) result += lane;
    }
#endif

    // Blocks of 4 with an early exit once the bound is exceeded
    for (; i + 4 <= n; i += 4) {
        const R d0 = static_cast<R>(a[i]) - static_cast<R>(b[i]);
        const R d1 = static_cast<R>(a[i + 1]) - static_cast<R>(b[i + 1]);
        const R d2 = static_cast<R>(a[i + 2]) - static_cast<R>(b[i + 2]);
        const R d3 = static_cast<R>(a[i + 3]) - static_cast<R>(b[i + 3]);
        result += d0 * d0 + d1 * d1 + d2 * d2 + d3 * d3;
        if (worst > 0 && result > worst) return result;
    }
    for (; i < n; ++i) {
        const R d = static_cast<R>(a[i]) - static_cast<R>(b[i]);
        result += d * d;
    }
    return result;
}

template <typename R, typename A, typename B>
inline R l1(const A* a, const B* b, size_t n, R worst) {
    R result = 0;
    size_t i = 0;
    for (; i + 4 <= n; i += 4) {
        result += std::abs(static_cast<R>(a[i]) - static_cast<R>(b[i])) +
                  std::abs(static_cast<R>(a[i + 1]) - static_cast<R>(b[i + 1])) +
                  std::abs(static_cast<R>(a[i + 2]) - static_cast<R>(b[i + 2])) +
                  std::abs(static_cast<R>(a[i + 3]) - static_cast<R>(b[i + 3]));
        if (worst > 0 && result > worst) return result;
    }
    for (; i < n; ++i) {
        result += std::abs(static_cast<R>(a[i]) - static_cast<R>(b[i]));
    }
    return result;
}

template <typename R, typename A, typename B>
inline R minkowski(const A* a, const B* b, size_t n, int order, R worst) {
    R result = 0;
    for (size_t i = 0; i < n; ++i) {
        result += static_cast<R>(std::pow(std::abs(static_cast<R>(a[i]) - static_cast<R>(b[i])), order));
        if (worst > 0 && (i & 3) == 3 && result > worst) return result;
    }
    return result;
}

template <typename R, typename A, typename B>
inline R max_abs(const A* a, const B* b, size_t n) {
    R result = 0;
    for (size_t i = 0; i < n; ++i) {
        result = std::max(result, static_cast<R>(std::abs(static_cast<R>(a[i]) - static_cast<R>(b[i]))));
    }
    return result;
}

template <typename R, typename A, typename B>
inline R hist_intersect(const A* a, const B* b, size_t n) {
    R result = 0;
    for (size_t i = 0; i < n; ++i) {
        result += std::min(static_cast<R>(a[i]), static_cast<R>(b[i]));
    }
    return result;
}

template <typename R, typename U, typename V>
inline R hellinger_term(U a, V b) {
    const R d = static_cast<R>(std::sqrt(static_cast<R>(a))) - static_cast<R>(std::sqrt(static_cast<R>(b)));
    return d * d;
}

template <typename R, typename U, typename V>
inline R chi_square_term(U a, V b) {
    const R sum = static_cast<R>(a) + static_cast<R>(b);
    if (sum <= 0) return 0;
    const R diff = static_cast<R>(a) - static_cast<R>(b);
    return diff * diff / sum;
}

template <typename R, typename U, typename V>
inline R kl_term(U a, V b) {
    const R ra = static_cast<R>(a);
    const R rb = static_cast<R>(b);
    if (ra == 0 || rb == 0) return 0;
    const R ratio = ra / rb;
    if (ratio <= 0) return 0;
    return ra * static_cast<R>(std::log(ratio));
}

template <typename R, typename A, typename B>
inline R hamming(const A* a, const B* b, size_t n) {
    if constexpr (std::is_same_v<A, B> && std::is_integral_v<A>) {
        const auto* pa = reinterpret_cast<const uint8_t*>(a);
        const auto* pb = reinterpret_cast<const uint8_t*>(b);
        const size_t bytes = n * sizeof(A);
        size_t bits = 0;
        size_t i = 0;
        for (; i + 8 <= bytes; i += 8) {
            uint64_t wa, wb;
            std::memcpy(&wa, pa + i, 8);
            std::memcpy(&wb, pb + i, 8);
            bits += static_cast<size_t>(__builtin_popcountll(wa ^ wb));
        }
        for (; i < bytes; ++i) {
            bits += static_cast<size_t>(__builtin_popcount(static_cast<unsigned>(pa[i] ^ pb[i])));
        }
        return static_cast<R>(bits);
    } else {
        throw ConfigError("Hamming distance is only defined between integer rows of the same type");
    }
}

} // namespace detail

/**
 * @brief Runtime-selected metric
 */
struct Distance {
    DistanceType type = DistanceType::Euclidean;
    int order = 2;

    Distance() = default;
    Distance(DistanceType t, int o = 2) : type(t), order(o) {}

    /**
     * @brief Full distance between two n-vectors
     * @param worst If positive, L1/L2/Minkowski may stop early once the
     *              partial sum exceeds it (the returned value is then only
     *              guaranteed to be greater than `worst`).
     */
    template <typename R, typename A, typename B>
    R evaluate(const A* a, const B* b, size_t n, R worst = R(-1)) const {
        switch (type) {
            case DistanceType::Euclidean:       return detail::l2<R>(a, b, n, worst);
            case DistanceType::Manhattan:       return detail::l1<R>(a, b, n, worst);
            case DistanceType::Minkowski:       return detail::minkowski<R>(a, b, n, order, worst);
            case DistanceType::Max:             return detail::max_abs<R>(a, b, n);
            case DistanceType::HistIntersect:   return detail::hist_intersect<R>(a, b, n);
            case DistanceType::Hellinger: {
                R result = 0;
                for (size_t i = 0; i < n; ++i) result += detail::hellinger_term<R>(a[i], b[i]);
                return result;
            }
            case DistanceType::ChiSquare: {
                R result = 0;
                for (size_t i = 0; i < n; ++i) result += detail::chi_square_term<R>(a[i], b[i]);
                return result;
            }
            case DistanceType::KullbackLeibler: {
                R result = 0;
                for (size_t i = 0; i < n; ++i) result += detail::kl_term<R>(a[i], b[i]);
                return result;
            }
            case DistanceType::Hamming:         return detail::hamming<R>(a, b, n);
        }
        return R(0);
    }

    /**
     * @brief Contribution of a single dimension (k-d tree pruning bounds)
     */
    template <typename R, typename U, typename V>
    R accum_dist(U a, V b) const {
        const R diff = static_cast<R>(a) - static_cast<R>(b);
        switch (type) {
            case DistanceType::Euclidean:       return diff * diff;
            case DistanceType::Manhattan:       return std::abs(diff);
            case DistanceType::Minkowski:       return static_cast<R>(std::pow(std::abs(diff), order));
            case DistanceType::Max:             return std::abs(diff);
            case DistanceType::HistIntersect:   return std::min(static_cast<R>(a), static_cast<R>(b));
            case DistanceType::Hellinger:       return detail::hellinger_term<R>(a, b);
            case DistanceType::ChiSquare:       return detail::chi_square_term<R>(a, b);
            case DistanceType::KullbackLeibler: return detail::kl_term<R>(a, b);
            case DistanceType::Hamming:         return R(0);
        }
        return R(0);
    }

    /**
     * @brief Metric decomposes into per-dimension sums (k-d tree family)
     */
    bool is_kdtree_compatible() const {
        return type != DistanceType::Max && type != DistanceType::Hamming;
    }

    /**
     * @brief Centroids are meaningful under this metric (k-means family)
     */
    bool is_vector_space() const {
        return type != DistanceType::Hamming;
    }

    /**
     * @throws ConfigError if a value lies outside the metric's domain
     *
     * Hellinger takes square roots of the operands, so it is undefined for
     * negative values.
     */
    template <typename T>
    void check_domain(const T* values, size_t count) const {
        if constexpr (std::is_signed_v<T>) {
            if (type != DistanceType::Hellinger) return;
            for (size_t i = 0; i < count; ++i) {
                if (values[i] < T(0)) throw ConfigError("Hellinger distance requires non-negative values");
            }
        } else {
            (void)values;
            (void)count;
        }
    }

    bool operator==(const Distance& other) const {
        return type == other.type && (type != DistanceType::Minkowski || order == other.order);
    }
};

} // namespace Annex
