#include <index/linear_index.hpp>

namespace Annex {

template <typename T>
void LinearIndex<T>::search(ResultSet<DistanceType>& result, const T* query,
                            const SearchParameters& params) const {
    const size_t n = this->rows();
    for (size_t i = 0; i < n; ++i) {
        if (this->stop_requested(params, i)) return;
        if (this->is_removed(i)) continue;
        result.add_point(this->distance_to(query, i, result.worst_dist()), i);
    }
}

template class LinearIndex<float>;
template class LinearIndex<double>;
template class LinearIndex<uint8_t>;
template class LinearIndex<int32_t>;

} // namespace Annex
