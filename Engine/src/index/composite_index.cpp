/**
 * @file composite_index.cpp
 * @brief Both children share the dataset and the removal state of the parent
 */

#include <index/composite_index.hpp>

namespace Annex {

template <typename T>
void CompositeIndex<T>::create_children() {
    IndexParameters kd_params = this->params_;
    kd_params.algorithm = Algorithm::KDTree;
    IndexParameters km_params = this->params_;
    km_params.algorithm = Algorithm::KMeans;

    kdtree_ = std::make_unique<KDTreeIndex<T>>(kd_params);
    kmeans_ = std::make_unique<KMeansIndex<T>>(km_params);
}

template <typename T>
void CompositeIndex<T>::build_index() {
    create_children();
    kdtree_->build(this->dataset_);
    kmeans_->build(this->dataset_);

    // Children start from an empty removal bitmap
    for (size_t id = 0; id < this->rows(); ++id) {
        if (this->is_removed(id)) {
            kdtree_->remove_point(id);
            kmeans_->remove_point(id);
        }
    }
}

template <typename T>
bool CompositeIndex<T>::insert_points(size_t first_row) {
    if (!kdtree_ || !kmeans_) return false;
    kdtree_->index_appended_rows(first_row, 0.0f);
    kmeans_->index_appended_rows(first_row, 0.0f);
    return true;
}

template <typename T>
void CompositeIndex<T>::on_removed(size_t id) {
    if (kdtree_) kdtree_->remove_point(id);
    if (kmeans_) kmeans_->remove_point(id);
}

template <typename T>
void CompositeIndex<T>::search(ResultSet<DistanceType>& result, const T* query,
                               const SearchParameters& params) const {
    if (!kdtree_ || !kmeans_) return;
    kmeans_->find_neighbors(result, query, params);
    kdtree_->find_neighbors(result, query, params);
}

template <typename T>
void CompositeIndex<T>::save_structure(BinaryWriter& writer) const {
    kdtree_->save(writer);
    kmeans_->save(writer);
}

template <typename T>
void CompositeIndex<T>::load_structure(BinaryReader& reader) {
    create_children();
    kdtree_->load(reader, this->dataset_);
    kmeans_->load(reader, this->dataset_);
}

template <typename T>
size_t CompositeIndex<T>::structure_memory() const {
    return (kdtree_ ? kdtree_->used_memory() : 0) + (kmeans_ ? kmeans_->used_memory() : 0);
}

template class CompositeIndex<float>;
template class CompositeIndex<double>;
template class CompositeIndex<uint8_t>;
template class CompositeIndex<int32_t>;

} // namespace Annex
