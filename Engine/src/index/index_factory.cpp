/**
 * @file index_factory.cpp
 * @brief Algorithm id to index structure dispatch
 */

#include <index/index_factory.hpp>
#include <index/autotuned_index.hpp>
#include <index/composite_index.hpp>
#include <index/hierarchical_index.hpp>
#include <index/kdtree_index.hpp>
#include <index/kdtree_single_index.hpp>
#include <index/kmeans_index.hpp>
#include <index/linear_index.hpp>
#include <index/lsh_index.hpp>

namespace Annex {

template <typename T>
std::unique_ptr<NNIndex<T>> create_index(const IndexParameters& params) {
    switch (params.algorithm) {
        case Algorithm::Linear:       return std::make_unique<LinearIndex<T>>(params);
        case Algorithm::KDTree:       return std::make_unique<KDTreeIndex<T>>(params);
        case Algorithm::KMeans:       return std::make_unique<KMeansIndex<T>>(params);
        case Algorithm::Composite:    return std::make_unique<CompositeIndex<T>>(params);
        case Algorithm::KDTreeSingle: return std::make_unique<KDTreeSingleIndex<T>>(params);
        case Algorithm::Hierarchical: return std::make_unique<HierarchicalIndex<T>>(params);
        case Algorithm::LSH:          return std::make_unique<LSHIndex<T>>(params);
        case Algorithm::Autotuned:    return std::make_unique<AutotunedIndex<T>>(params);
        case Algorithm::Saved:
            throw ConfigError("Algorithm 'saved' is only produced by load_index");
    }
    throw ConfigError("Unknown algorithm: " + std::to_string(static_cast<int>(params.algorithm)));
}

template std::unique_ptr<NNIndex<float>> create_index<float>(const IndexParameters&);
template std::unique_ptr<NNIndex<double>> create_index<double>(const IndexParameters&);
template std::unique_ptr<NNIndex<uint8_t>> create_index<uint8_t>(const IndexParameters&);
template std::unique_ptr<NNIndex<int32_t>> create_index<int32_t>(const IndexParameters&);

} // namespace Annex
