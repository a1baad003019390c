/**
 * @file composite_index.hpp
 * @brief Randomized k-d forest and hierarchical k-means tree over one shared dataset
 */

#pragma once

#include <index/kdtree_index.hpp>
#include <index/kmeans_index.hpp>
#include <memory>

namespace Annex {

template <typename T>
class CompositeIndex : public NNIndex<T> {
public:
    using typename NNIndex<T>::DistanceType;

    explicit CompositeIndex(const IndexParameters& params) : NNIndex<T>(params) {}

    Algorithm algorithm() const override { return Algorithm::Composite; }

protected:
    void build_index() override;
    bool insert_points(size_t first_row) override;
    void on_removed(size_t id) override;

    void search(ResultSet<DistanceType>& result, const T* query,
                const SearchParameters& params) const override;

    void save_structure(BinaryWriter& writer) const override;
    void load_structure(BinaryReader& reader) override;
    size_t structure_memory() const override;

private:
    void create_children();

    std::unique_ptr<KDTreeIndex<T>> kdtree_;
    std::unique_ptr<KMeansIndex<T>> kmeans_;
};

} // namespace Annex
