#include <index/center_chooser.hpp>
#include <utils/random.hpp>
#include <algorithm>

namespace Annex {

namespace {

template <typename T>
ResultType<T> row_distance(const Dataset<T>& data, const Distance& distance, size_t a, size_t b) {
    return distance.template evaluate<ResultType<T>>(data[a], data[b], data.cols());
}

template <typename T>
std::vector<size_t> random_centers(const Dataset<T>& data,
                                   const std::vector<size_t>& ids, size_t k, std::mt19937& rng) {
    std::vector<size_t> centers;
    const std::vector<size_t> order = random_sample(ids, ids.size(), rng);

    for (size_t candidate : order) {
        if (centers.size() == k) break;
        bool duplicate = false;
        for (size_t c : centers) {
            if (std::equal(data[candidate], data[candidate] + data.cols(), data[c])) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) centers.push_back(candidate);
    }
    return centers;
}

template <typename T>
std::vector<size_t> gonzales_centers(const Dataset<T>& data, const Distance& distance,
                                     const std::vector<size_t>& ids, size_t k, std::mt19937& rng) {
    using D = ResultType<T>;
    std::vector<size_t> centers;
    centers.push_back(ids[random_index(ids.size(), rng)]);

    std::vector<D> closest(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) closest[i] = row_distance(data, distance, ids[i], centers[0]);

    while (centers.size() < k) {
        size_t best = 0;
        D best_dist = D(0);
        for (size_t i = 0; i < ids.size(); ++i) {
            if (closest[i] > best_dist) {
                best_dist = closest[i];
                best = i;
            }
        }
        if (best_dist <= D(0)) break;

        centers.push_back(ids[best]);
        for (size_t i = 0; i < ids.size(); ++i) {
            closest[i] = std::min(closest[i], row_distance(data, distance, ids[i], ids[best]));
        }
    }
    return centers;
}

template <typename T>
std::vector<size_t> kmeanspp_centers(const Dataset<T>& data, const Distance& distance,
                                     const std::vector<size_t>& ids, size_t k, std::mt19937& rng) {
    std::vector<size_t> centers;
    centers.push_back(ids[random_index(ids.size(), rng)]);

    std::vector<double> closest(ids.size());
    double potential = 0;
    for (size_t i = 0; i < ids.size(); ++i) {
        closest[i] = static_cast<double>(row_distance(data, distance, ids[i], centers[0]));
        potential += closest[i];
    }

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    while (centers.size() < k && potential > 0) {
        double target = unit(rng) * potential;
        size_t pick = 0;
        for (; pick + 1 < ids.size(); ++pick) {
            if (target <= closest[pick]) break;
            target -= closest[pick];
        }
        if (closest[pick] <= 0) {
            // Rounding landed on an already covered point: fall back to the farthest one
            pick = static_cast<size_t>(std::max_element(closest.begin(), closest.end()) - closest.begin());
        }

        centers.push_back(ids[pick]);
        potential = 0;
        for (size_t i = 0; i < ids.size(); ++i) {
            const auto d = static_cast<double>(row_distance(data, distance, ids[i], ids[pick]));
            closest[i] = std::min(closest[i], d);
            potential += closest[i];
        }
    }
    return centers;
}

} // namespace

template <typename T>
std::vector<size_t> choose_centers(CentersInit init, const Dataset<T>& data, const Distance& distance,
                                   const std::vector<size_t>& ids, size_t k, std::mt19937& rng) {
    if (ids.empty() || k == 0) return {};

    switch (init) {
        case CentersInit::Random:   return random_centers(data, ids, k, rng);
        case CentersInit::Gonzales: return gonzales_centers(data, distance, ids, k, rng);
        case CentersInit::KMeansPP: return kmeanspp_centers(data, distance, ids, k, rng);
    }
    throw ConfigError("Unknown centers_init value");
}

#define ANNEX_INSTANTIATE_CHOOSER(T)                                                          \
    template std::vector<size_t> choose_centers<T>(CentersInit, const Dataset<T>&,            \
                                                   const Distance&, const std::vector<size_t>&, \
                                                   size_t, std::mt19937&);

ANNEX_INSTANTIATE_CHOOSER(float)
ANNEX_INSTANTIATE_CHOOSER(double)
ANNEX_INSTANTIATE_CHOOSER(uint8_t)
ANNEX_INSTANTIATE_CHOOSER(int32_t)

#undef ANNEX_INSTANTIATE_CHOOSER

} // namespace Annex
