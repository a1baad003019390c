/**
 * @file hierarchical_index.hpp
 * @brief Forest of hierarchical clustering trees with dataset-point pivots
 *
 * Pivots are actual dataset rows rather than means, so the structure works
 * with every metric, including Hamming over binary descriptors.
 */

#pragma once

#include <index/nn_index.hpp>
#include <random>
#include <vector>

namespace Annex {

template <typename T>
class HierarchicalIndex : public NNIndex<T> {
public:
    using typename NNIndex<T>::DistanceType;

    explicit HierarchicalIndex(const IndexParameters& params) : NNIndex<T>(params) {}

    Algorithm algorithm() const override { return Algorithm::Hierarchical; }

protected:
    void build_index() override;
    bool insert_points(size_t first_row) override;

    void search(ResultSet<DistanceType>& result, const T* query,
                const SearchParameters& params) const override;

    void save_structure(BinaryWriter& writer) const override;
    void load_structure(BinaryReader& reader) override;
    size_t structure_memory() const override;

private:
    struct Node {
        uint64_t pivot = 0;
        std::vector<int32_t> children;
        std::vector<uint64_t> points;

        bool is_leaf() const { return children.empty(); }
    };

    using Tree = std::vector<Node>;

    struct SearchState;

    void compute_clustering(Tree& tree, int32_t node, const std::vector<size_t>& ids, std::mt19937& rng) const;
    void find_nn(SearchState& state, int32_t tree, int32_t node) const;

    std::vector<Tree> trees_;
};

} // namespace Annex
