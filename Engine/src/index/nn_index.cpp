/**
 * @file nn_index.cpp
 * @brief Shared bookkeeping for all index structures: removal bitmap,
 *        add/rebuild policy and the persisted header of the structure payload
 */

#include <index/nn_index.hpp>
#include <utils/logger.hpp>
#include <string>

namespace Annex {

template <typename T>
NNIndex<T>::NNIndex(const IndexParameters& params)
    : params_(params), distance_(params.metric()) {}

template <typename T>
void NNIndex<T>::build(std::shared_ptr<Dataset<T>> dataset) {
    if (!dataset) throw DimensionError("Cannot build an index without a dataset");
    distance_.check_domain(dataset->data(), dataset->rows() * dataset->cols());

    dataset_ = std::move(dataset);
    removed_.resize(dataset_->rows(), 0);
    size_at_build_ = size();
    build_index();
}

template <typename T>
void NNIndex<T>::add_points(const Matrix<const T>& points, float rebuild_threshold) {
    if (points.rows() == 0) return;
    distance_.check_domain(points.data(), points.rows() * points.cols());
    const size_t first_row = rows();
    dataset_->append(points);
    index_appended_rows(first_row, rebuild_threshold);
}

template <typename T>
void NNIndex<T>::index_appended_rows(size_t first_row, float rebuild_threshold) {
    removed_.resize(rows(), 0);

    const bool over_threshold = rebuild_threshold > 1.0f &&
        static_cast<double>(size()) > static_cast<double>(size_at_build_) * rebuild_threshold;

    if (over_threshold || !insert_points(first_row)) {
        Logger::info("Rebuilding " + std::string(to_string(algorithm())) + " index over " +
                     std::to_string(size()) + " points");
        size_at_build_ = size();
        build_index();
    }
}

template <typename T>
void NNIndex<T>::remove_point(size_t id) {
    if (id >= rows()) {
        throw DimensionError("Point id " + std::to_string(id) + " out of range (index holds " +
                             std::to_string(rows()) + " rows)");
    }
    if (removed_[id]) return;
    removed_[id] = 1;
    ++removed_count_;
    on_removed(id);
}

template <typename T>
void NNIndex<T>::find_neighbors(ResultSet<DistanceType>& result, const T* query,
                                const SearchParameters& params) const {
    SearchParameters resolved = params;
    if (resolved.checks == CHECKS_AUTOTUNED) resolved.checks = autotuned_checks();

    if (removed_count_ == 0) {
        search(result, query, resolved);
        return;
    }
    FilteredResultSet<DistanceType> filtered(result, removed_);
    search(filtered, query, resolved);
}

template <typename T>
void NNIndex<T>::save(BinaryWriter& writer) const {
    writer.write_vector(removed_);
    writer.write(static_cast<uint64_t>(size_at_build_));
    save_structure(writer);
}

template <typename T>
void NNIndex<T>::load(BinaryReader& reader, std::shared_ptr<Dataset<T>> dataset) {
    if (!dataset) throw DimensionError("Cannot load an index without a dataset");
    dataset_ = std::move(dataset);

    removed_ = reader.read_vector<uint8_t>(dataset_->rows());
    if (removed_.size() != dataset_->rows()) {
        throw IoError("Corrupt index data: removal bitmap covers " + std::to_string(removed_.size()) +
                      " rows, dataset has " + std::to_string(dataset_->rows()));
    }
    removed_count_ = 0;
    for (uint8_t flag : removed_) {
        if (flag) ++removed_count_;
    }
    size_at_build_ = static_cast<size_t>(reader.read<uint64_t>());
    load_structure(reader);
}

template <typename T>
size_t NNIndex<T>::used_memory() const {
    return structure_memory() + removed_.capacity();
}

template <typename T>
std::vector<size_t> NNIndex<T>::active_rows() const {
    std::vector<size_t> ids;
    ids.reserve(size());
    for (size_t i = 0; i < rows(); ++i) {
        if (!removed_[i]) ids.push_back(i);
    }
    return ids;
}

template class NNIndex<float>;
template class NNIndex<double>;
template class NNIndex<uint8_t>;
template class NNIndex<int32_t>;

} // namespace Annex
