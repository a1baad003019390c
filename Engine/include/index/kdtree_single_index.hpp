/**
 * @file kdtree_single_index.hpp
 * @brief Single k-d tree with bucket leaves for exact (eps-relaxed) search
 *
 * Suited to low-dimensional data. Each node records the extent of its two
 * children along the split dimension, and search maintains an incremental
 * per-dimension lower bound to prune subtrees.
 */

#pragma once

#include <index/nn_index.hpp>
#include <vector>

namespace Annex {

template <typename T>
class KDTreeSingleIndex : public NNIndex<T> {
public:
    using typename NNIndex<T>::DistanceType;

    explicit KDTreeSingleIndex(const IndexParameters& params) : NNIndex<T>(params) {}

    Algorithm algorithm() const override { return Algorithm::KDTreeSingle; }

protected:
    void build_index() override;

    void search(ResultSet<DistanceType>& result, const T* query,
                const SearchParameters& params) const override;

    void save_structure(BinaryWriter& writer) const override;
    void load_structure(BinaryReader& reader) override;
    size_t structure_memory() const override;

private:
    struct Interval {
        DistanceType low;
        DistanceType high;
    };

    using BoundingBox = std::vector<Interval>;

    // Leaves (child1 < 0) cover vind_[begin, end)
    struct Node {
        int32_t child1 = -1;
        int32_t child2 = -1;
        int32_t divfeat = 0;
        DistanceType divlow = 0;
        DistanceType divhigh = 0;
        uint64_t begin = 0;
        uint64_t end = 0;
    };

    int32_t divide_tree(size_t begin, size_t end, BoundingBox& bbox);
    void middle_split(size_t* ind, size_t count, size_t& index, int32_t& cutfeat,
                      DistanceType& cutval, const BoundingBox& bbox) const;
    BoundingBox compute_bounding_box(size_t begin, size_t end) const;

    bool search_level(ResultSet<DistanceType>& result, const T* query, int32_t node,
                      DistanceType mindist, std::vector<DistanceType>& dists,
                      DistanceType eps_error, const SearchParameters& params, size_t& visits) const;

    std::vector<size_t> vind_;
    std::vector<Node> nodes_;
    BoundingBox root_bbox_;
};

} // namespace Annex
