/**
 * @file kmeans_index.hpp
 * @brief Hierarchical k-means tree
 *
 * Every internal node splits its points into `branching` clusters by
 * k-means. Nodes keep the cluster mean (pivot), the covering radius and the
 * mean distance to the pivot (variance), which drive both best-bin-first
 * ordering and ball pruning during search.
 */

#pragma once

#include <index/nn_index.hpp>
#include <random>
#include <vector>

namespace Annex {

template <typename T>
class KMeansIndex : public NNIndex<T> {
public:
    using typename NNIndex<T>::DistanceType;

    explicit KMeansIndex(const IndexParameters& params) : NNIndex<T>(params) {}

    Algorithm algorithm() const override { return Algorithm::KMeans; }

    /**
     * @brief Pivots of the minimum-variance cut of the tree with at most `count` nodes
     *
     * May return fewer rows than requested when the tree is too shallow.
     */
    Dataset<DistanceType> cluster_centers(size_t count) const;

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
        std::vector<DistanceType> pivot;
        DistanceType radius = 0;
        DistanceType variance = 0;
        uint64_t size = 0;
        std::vector<int32_t> children;
        std::vector<uint64_t> points;     // Row ids, leaves only

        bool is_leaf() const { return children.empty(); }
    };

    struct SearchState;

    int32_t new_node();
    void compute_node_statistics(int32_t node, const std::vector<size_t>& ids);
    void compute_clustering(int32_t node, const std::vector<size_t>& ids, std::mt19937& rng);
    void add_point_to_tree(int32_t node, size_t row, std::mt19937& rng);

    DistanceType pivot_distance(const T* point, int32_t node) const;
    bool ball_excluded(DistanceType center_dist, DistanceType radius, DistanceType worst) const;

    void find_nn(SearchState& state, int32_t node) const;
    void find_exact_nn(SearchState& state, int32_t node) const;

    std::vector<Node> nodes_;
};

} // namespace Annex
