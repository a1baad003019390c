/**
 * @file kdtree_single_index.cpp
 * @brief Bucketed k-d tree: middle split build and bounded exact search
 */

#include <index/kdtree_single_index.hpp>
#include <utils/logger.hpp>
#include <algorithm>

namespace Annex {

// =============================================================================
//  Build
// =============================================================================

template <typename T>
void KDTreeSingleIndex<T>::build_index() {
    vind_ = this->active_rows();
    nodes_.clear();
    root_bbox_.clear();
    if (vind_.empty()) return;

    nodes_.reserve(2 * vind_.size() / static_cast<size_t>(std::max(this->params_.leaf_max_size, 1)) + 1);
    root_bbox_ = compute_bounding_box(0, vind_.size());
    divide_tree(0, vind_.size(), root_bbox_);

    Logger::info("Built single k-d tree: " + std::to_string(nodes_.size()) + " nodes over " +
                 std::to_string(vind_.size()) + " points");
}

template <typename T>
typename KDTreeSingleIndex<T>::BoundingBox
KDTreeSingleIndex<T>::compute_bounding_box(size_t begin, size_t end) const {
    const auto& data = this->dataset();
    const size_t dim = this->veclen();

    BoundingBox bbox(dim);
    const T* first = data[vind_[begin]];
    for (size_t k = 0; k < dim; ++k) {
        bbox[k].low = bbox[k].high = static_cast<DistanceType>(first[k]);
    }
    for (size_t i = begin + 1; i < end; ++i) {
        const T* row = data[vind_[i]];
        for (size_t k = 0; k < dim; ++k) {
            const auto v = static_cast<DistanceType>(row[k]);
            bbox[k].low = std::min(bbox[k].low, v);
            bbox[k].high = std::max(bbox[k].high, v);
        }
    }
    return bbox;
}

template <typename T>
int32_t KDTreeSingleIndex<T>::divide_tree(size_t begin, size_t end, BoundingBox& bbox) {
    const auto node = static_cast<int32_t>(nodes_.size());
    nodes_.emplace_back();

    const size_t count = end - begin;
    if (count <= static_cast<size_t>(this->params_.leaf_max_size)) {
        nodes_[node].begin = begin;
        nodes_[node].end = end;
        bbox = compute_bounding_box(begin, end);
        return node;
    }

    size_t split = 0;
    int32_t cutfeat = 0;
    DistanceType cutval = 0;
    middle_split(vind_.data() + begin, count, split, cutfeat, cutval, bbox);

    BoundingBox left_bbox(bbox);
    left_bbox[cutfeat].high = cutval;
    const int32_t left = divide_tree(begin, begin + split, left_bbox);

    BoundingBox right_bbox(bbox);
    right_bbox[cutfeat].low = cutval;
    const int32_t right = divide_tree(begin + split, end, right_bbox);

    Node& n = nodes_[node];
    n.child1 = left;
    n.child2 = right;
    n.divfeat = cutfeat;
    n.divlow = left_bbox[cutfeat].high;
    n.divhigh = right_bbox[cutfeat].low;

    for (size_t k = 0; k < bbox.size(); ++k) {
        bbox[k].low = std::min(left_bbox[k].low, right_bbox[k].low);
        bbox[k].high = std::max(left_bbox[k].high, right_bbox[k].high);
    }
    return node;
}

template <typename T>
void KDTreeSingleIndex<T>::middle_split(size_t* ind, size_t count, size_t& index, int32_t& cutfeat,
                                        DistanceType& cutval, const BoundingBox& bbox) const {
    const auto& data = this->dataset();

    // Widest dimension of the node's bounding box
    size_t widest = 0;
    DistanceType max_span = bbox[0].high - bbox[0].low;
    for (size_t k = 1; k < bbox.size(); ++k) {
        const DistanceType span = bbox[k].high - bbox[k].low;
        if (span > max_span) {
            max_span = span;
            widest = k;
        }
    }
    cutfeat = static_cast<int32_t>(widest);

    DistanceType min_elem = static_cast<DistanceType>(data[ind[0]][widest]);
    DistanceType max_elem = min_elem;
    for (size_t i = 1; i < count; ++i) {
        const auto v = static_cast<DistanceType>(data[ind[i]][widest]);
        min_elem = std::min(min_elem, v);
        max_elem = std::max(max_elem, v);
    }
    cutval = std::clamp((bbox[widest].low + bbox[widest].high) / 2, min_elem, max_elem);

    auto value = [&](size_t row) { return static_cast<DistanceType>(data[row][widest]); };
    size_t* mid1 = std::partition(ind, ind + count, [&](size_t row) { return value(row) < cutval; });
    size_t* mid2 = std::partition(mid1, ind + count, [&](size_t row) { return value(row) <= cutval; });
    const size_t lim1 = static_cast<size_t>(mid1 - ind);
    const size_t lim2 = static_cast<size_t>(mid2 - ind);

    if (lim1 > count / 2) index = lim1;
    else if (lim2 < count / 2) index = lim2;
    else index = count / 2;
}

// =============================================================================
//  Search
// =============================================================================

template <typename T>
void KDTreeSingleIndex<T>::search(ResultSet<DistanceType>& result, const T* query,
                                  const SearchParameters& params) const {
    if (nodes_.empty()) return;

    const size_t dim = this->veclen();
    std::vector<DistanceType> dists(dim, 0);
    DistanceType distsq = 0;
    for (size_t k = 0; k < dim; ++k) {
        const auto v = static_cast<DistanceType>(query[k]);
        if (v < root_bbox_[k].low) {
            dists[k] = this->distance_.template accum_dist<DistanceType>(v, root_bbox_[k].low);
        } else if (v > root_bbox_[k].high) {
            dists[k] = this->distance_.template accum_dist<DistanceType>(v, root_bbox_[k].high);
        }
        distsq += dists[k];
    }

    size_t visits = 0;
    search_level(result, query, 0, distsq, dists, static_cast<DistanceType>(1.0 + params.eps), params, visits);
}

template <typename T>
bool KDTreeSingleIndex<T>::search_level(ResultSet<DistanceType>& result, const T* query, int32_t node_id,
                                        DistanceType mindist, std::vector<DistanceType>& dists,
                                        DistanceType eps_error, const SearchParameters& params,
                                        size_t& visits) const {
    const Node& node = nodes_[static_cast<size_t>(node_id)];

    if (node.child1 < 0) {
        if (this->stop_requested(params, ++visits)) return false;
        const DistanceType worst = result.worst_dist();
        for (uint64_t i = node.begin; i < node.end; ++i) {
            const size_t row = vind_[static_cast<size_t>(i)];
            const DistanceType dist = this->distance_to(query, row, worst);
            if (dist <= worst) result.add_point(dist, row);
        }
        return true;
    }

    const size_t idx = static_cast<size_t>(node.divfeat);
    const auto val = static_cast<DistanceType>(query[idx]);
    const DistanceType diff1 = val - node.divlow;
    const DistanceType diff2 = val - node.divhigh;

    int32_t best;
    int32_t other;
    DistanceType cut_dist;
    if (diff1 + diff2 < 0) {
        best = node.child1;
        other = node.child2;
        cut_dist = this->distance_.template accum_dist<DistanceType>(val, node.divhigh);
    } else {
        best = node.child2;
        other = node.child1;
        cut_dist = this->distance_.template accum_dist<DistanceType>(val, node.divlow);
    }

    if (!search_level(result, query, best, mindist, dists, eps_error, params, visits)) return false;

    const DistanceType saved = dists[idx];
    mindist = mindist + cut_dist - saved;
    dists[idx] = cut_dist;
    if (mindist * eps_error <= result.worst_dist()) {
        if (!search_level(result, query, other, mindist, dists, eps_error, params, visits)) return false;
    }
    dists[idx] = saved;
    return true;
}

// =============================================================================
//  Persistence
// =============================================================================

template <typename T>
void KDTreeSingleIndex<T>::save_structure(BinaryWriter& writer) const {
    writer.write_vector(std::vector<uint64_t>(vind_.begin(), vind_.end()));
    writer.write(static_cast<uint64_t>(nodes_.size()));
    for (const auto& node : nodes_) {
        writer.write(node.child1);
        writer.write(node.child2);
        writer.write(node.divfeat);
        writer.write(node.divlow);
        writer.write(node.divhigh);
        writer.write(node.begin);
        writer.write(node.end);
    }
    writer.write(static_cast<uint64_t>(root_bbox_.size()));
    for (const auto& interval : root_bbox_) {
        writer.write(interval.low);
        writer.write(interval.high);
    }
}

template <typename T>
void KDTreeSingleIndex<T>::load_structure(BinaryReader& reader) {
    const size_t rows = this->rows();
    const auto ids = reader.read_vector<uint64_t>(rows);
    vind_.assign(ids.begin(), ids.end());
    for (size_t id : vind_) {
        if (id >= rows) throw IoError("Corrupt index data: point id out of range");
    }

    const auto node_count = reader.read<uint64_t>();
    if (node_count > 2 * static_cast<uint64_t>(vind_.size()) + 1) {
        throw IoError("Corrupt index data: k-d tree larger than dataset");
    }
    nodes_.resize(static_cast<size_t>(node_count));
    for (auto& node : nodes_) {
        node.child1 = reader.read<int32_t>();
        node.child2 = reader.read<int32_t>();
        node.divfeat = reader.read<int32_t>();
        node.divlow = reader.read<DistanceType>();
        node.divhigh = reader.read<DistanceType>();
        node.begin = reader.read<uint64_t>();
        node.end = reader.read<uint64_t>();
        if (node.child1 >= static_cast<int64_t>(node_count) || node.child2 >= static_cast<int64_t>(node_count) ||
            node.begin > node.end || node.end > vind_.size() ||
            node.divfeat < 0 || static_cast<size_t>(node.divfeat) >= this->veclen()) {
            throw IoError("Corrupt index data: invalid k-d tree node");
        }
    }

    const auto bbox_size = reader.read<uint64_t>();
    if (bbox_size != (nodes_.empty() ? 0 : this->veclen())) {
        throw IoError("Corrupt index data: bounding box dimension mismatch");
    }
    root_bbox_.resize(static_cast<size_t>(bbox_size));
    for (auto& interval : root_bbox_) {
        interval.low = reader.read<DistanceType>();
        interval.high = reader.read<DistanceType>();
    }
}

template <typename T>
size_t KDTreeSingleIndex<T>::structure_memory() const {
    return vind_.capacity() * sizeof(size_t) + nodes_.capacity() * sizeof(Node) +
           root_bbox_.capacity() * sizeof(Interval);
}

template class KDTreeSingleIndex<float>;
template class KDTreeSingleIndex<double>;
template class KDTreeSingleIndex<uint8_t>;
template class KDTreeSingleIndex<int32_t>;

} // namespace Annex
