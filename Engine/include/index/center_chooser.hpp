/**
 * @file center_chooser.hpp
 * @brief Initial cluster center selection for the clustering indexes
 */

#pragma once

#include <core/matrix.hpp>
#include <core/types.hpp>
#include <distance/distance.hpp>
#include <random>
#include <vector>

namespace Annex {

/**
 * @brief Pick up to `k` distinct centers among the rows `ids`
 *
 * Returns dataset row ids. Fewer than `k` centers come back when the
 * candidate rows do not contain `k` distinct points.
 *
 *  - Random:   uniform draws, duplicates of an already chosen point rejected
 *  - Gonzales: first center random, then repeatedly the farthest point
 *  - KMeansPP: first center random, then draws weighted by distance to the
 *              closest chosen center
 */
template <typename T>
std::vector<size_t> choose_centers(CentersInit init, const Dataset<T>& data, const Distance& distance,
                                   const std::vector<size_t>& ids, size_t k, std::mt19937& rng);

} // namespace Annex
