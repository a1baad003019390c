/**
 * @file index_factory.hpp
 * @brief Creates an (unbuilt) index for the algorithm named in the parameters
 */

#pragma once

#include <index/nn_index.hpp>
#include <memory>

namespace Annex {

/**
 * @throws ConfigError for Algorithm::Saved, which only load_index produces
 */
template <typename T>
std::unique_ptr<NNIndex<T>> create_index(const IndexParameters& params);

} // namespace Annex
