/**
 * @file kdtree_index.hpp
 * @brief Forest of randomized k-d trees searched best-bin-first
 *
 * Every tree holds every active point in single-point leaves. Each split
 * picks at random among the highest-variance dimensions of a small sample
 * and cuts at the sample mean, so the trees differ and their union covers
 * the near neighborhood of a query with few leaf checks.
 */

#pragma once

#include <index/nn_index.hpp>
#include <random>
#include <vector>

namespace Annex {

template <typename T>
class KDTreeIndex : public NNIndex<T> {
public:
    using typename NNIndex<T>::DistanceType;

    explicit KDTreeIndex(const IndexParameters& params);

    Algorithm algorithm() const override { return Algorithm::KDTree; }

    size_t tree_count() const { return trees_.size(); }

protected:
    void build_index() override;
    bool insert_points(size_t first_row) override;

    void search(ResultSet<DistanceType>& result, const T* query,
                const SearchParameters& params) const override;

    void save_structure(BinaryWriter& writer) const override;
    void load_structure(BinaryReader& reader) override;
    size_t structure_memory() const override;

private:
    // Leaves have child1 == child2 == -1 and carry a row id in `point`
    struct Node {
        int32_t child1 = -1;
        int32_t child2 = -1;
        int32_t divfeat = 0;
        DistanceType divval = 0;
        size_t point = 0;

        bool is_leaf() const { return child1 < 0; }
    };

    using Tree = std::vector<Node>;

    struct SearchState;

    int32_t divide_tree(Tree& tree, size_t* ind, size_t count, std::mt19937& rng) const;
    void mean_split(size_t* ind, size_t count, size_t& index, int32_t& cutfeat,
                    DistanceType& cutval, std::mt19937& rng) const;
    void add_point_to_tree(Tree& tree, size_t row) const;

    void search_level(SearchState& state, int32_t tree, int32_t node, DistanceType mindist) const;
    void search_level_exact(SearchState& state, int32_t node, DistanceType mindist) const;

    static constexpr size_t SAMPLE_MEAN = 100;
    static constexpr size_t RAND_DIM = 5;

    std::vector<Tree> trees_;
};

} // namespace Annex
