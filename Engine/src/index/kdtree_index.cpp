/**
 * @file kdtree_index.cpp
 * @brief Randomized k-d forest: parallel build, incremental insert, best-bin-first search
 */

#include <index/kdtree_index.hpp>
#include <utils/logger.hpp>
#include <utils/random.hpp>
#include <algorithm>
#include <queue>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Annex {

template <typename T>
struct KDTreeIndex<T>::SearchState {
    struct Branch {
        DistanceType mindist;
        int32_t tree;
        int32_t node;

        bool operator>(const Branch& other) const { return mindist > other.mindist; }
    };

    ResultSet<DistanceType>& result;
    const T* query;
    const SearchParameters& params;
    size_t max_checks;
    DistanceType eps_error;
    size_t checks = 0;
    size_t visits = 0;
    bool stopped = false;
    std::priority_queue<Branch, std::vector<Branch>, std::greater<Branch>> heap;
    std::vector<uint8_t> checked;
    std::vector<DistanceType> offsets;   // Exact search: per-dimension distance to the current cell
};

template <typename T>
KDTreeIndex<T>::KDTreeIndex(const IndexParameters& params) : NNIndex<T>(params) {}

// =============================================================================
//  Build
// =============================================================================

template <typename T>
void KDTreeIndex<T>::build_index() {
    const int tree_count = this->params_.trees;
    trees_.assign(static_cast<size_t>(tree_count), Tree{});

    const std::vector<size_t> ids = this->active_rows();
    if (ids.empty()) return;

    // One seed per tree, drawn serially so the forest is reproducible for any thread count
    auto rng = make_rng(this->params_.random_seed);
    std::vector<uint32_t> seeds(static_cast<size_t>(tree_count));
    for (auto& seed : seeds) seed = rng();

    #pragma omp parallel for schedule(dynamic, 1)
    for (int t = 0; t < tree_count; ++t) {
        std::mt19937 tree_rng(seeds[static_cast<size_t>(t)]);
        std::vector<size_t> ind(ids);
        std::shuffle(ind.begin(), ind.end(), tree_rng);

        Tree& tree = trees_[static_cast<size_t>(t)];
        tree.reserve(2 * ind.size());
        divide_tree(tree, ind.data(), ind.size(), tree_rng);
    }

    Logger::info("Built k-d forest: " + std::to_string(tree_count) + " trees over " +
                 std::to_string(ids.size()) + " points");
}

template <typename T>
int32_t KDTreeIndex<T>::divide_tree(Tree& tree, size_t* ind, size_t count, std::mt19937& rng) const {
    const auto node = static_cast<int32_t>(tree.size());
    tree.emplace_back();

    if (count == 1) {
        tree[node].point = ind[0];
        return node;
    }

    size_t split = 0;
    int32_t cutfeat = 0;
    DistanceType cutval = 0;
    mean_split(ind, count, split, cutfeat, cutval, rng);

    const int32_t left = divide_tree(tree, ind, split, rng);
    const int32_t right = divide_tree(tree, ind + split, count - split, rng);

    tree[node].child1 = left;
    tree[node].child2 = right;
    tree[node].divfeat = cutfeat;
    tree[node].divval = cutval;
    return node;
}

template <typename T>
void KDTreeIndex<T>::mean_split(size_t* ind, size_t count, size_t& index, int32_t& cutfeat,
                                DistanceType& cutval, std::mt19937& rng) const {
    const auto& data = this->dataset();
    const size_t dim = this->veclen();
    const size_t sample = std::min(SAMPLE_MEAN + 1, count);

    std::vector<DistanceType> mean(dim, 0);
    std::vector<DistanceType> var(dim, 0);
    for (size_t j = 0; j < sample; ++j) {
        const T* row = data[ind[j]];
        for (size_t k = 0; k < dim; ++k) mean[k] += static_cast<DistanceType>(row[k]);
    }
    for (size_t k = 0; k < dim; ++k) mean[k] /= static_cast<DistanceType>(sample);

    for (size_t j = 0; j < sample; ++j) {
        const T* row = data[ind[j]];
        for (size_t k = 0; k < dim; ++k) {
            const DistanceType d = static_cast<DistanceType>(row[k]) - mean[k];
            var[k] += d * d;
        }
    }

    // Random choice among the top RAND_DIM variance dimensions
    std::vector<size_t> dims(dim);
    for (size_t k = 0; k < dim; ++k) dims[k] = k;
    const size_t top = std::min(RAND_DIM, dim);
    std::partial_sort(dims.begin(), dims.begin() + static_cast<std::ptrdiff_t>(top), dims.end(),
                      [&](size_t a, size_t b) { return var[a] > var[b] || (var[a] == var[b] && a < b); });
    cutfeat = static_cast<int32_t>(dims[random_index(top, rng)]);
    cutval = mean[static_cast<size_t>(cutfeat)];

    // Three-way partition: [< cutval | == cutval | > cutval]
    auto value = [&](size_t row) { return static_cast<DistanceType>(data[row][cutfeat]); };
    size_t* mid1 = std::partition(ind, ind + count, [&](size_t row) { return value(row) < cutval; });
    size_t* mid2 = std::partition(mid1, ind + count, [&](size_t row) { return value(row) <= cutval; });
    const size_t lim1 = static_cast<size_t>(mid1 - ind);
    const size_t lim2 = static_cast<size_t>(mid2 - ind);

    if (lim1 > count / 2) index = lim1;
    else if (lim2 < count / 2) index = lim2;
    else index = count / 2;

    // Both halves must be non-empty
    if (index == 0) index = 1;
    if (index == count) index = count - 1;
}

template <typename T>
bool KDTreeIndex<T>::insert_points(size_t first_row) {
    if (trees_.empty() || trees_.front().empty()) return false;

    for (size_t row = first_row; row < this->rows(); ++row) {
        if (this->is_removed(row)) continue;
        for (auto& tree : trees_) add_point_to_tree(tree, row);
    }
    return true;
}

template <typename T>
void KDTreeIndex<T>::add_point_to_tree(Tree& tree, size_t row) const {
    const auto& data = this->dataset();
    const T* point = data[row];

    int32_t node = 0;
    while (!tree[static_cast<size_t>(node)].is_leaf()) {
        const Node& n = tree[static_cast<size_t>(node)];
        node = static_cast<DistanceType>(point[n.divfeat]) < n.divval ? n.child1 : n.child2;
    }

    // Split the reached leaf on the dimension where the two points differ most
    const size_t existing = tree[static_cast<size_t>(node)].point;
    const T* leaf_point = data[existing];
    size_t divfeat = 0;
    DistanceType span = -1;
    for (size_t k = 0; k < this->veclen(); ++k) {
        const DistanceType d = std::abs(static_cast<DistanceType>(point[k]) - static_cast<DistanceType>(leaf_point[k]));
        if (d > span) {
            span = d;
            divfeat = k;
        }
    }
    const DistanceType divval = (static_cast<DistanceType>(point[divfeat]) +
                                 static_cast<DistanceType>(leaf_point[divfeat])) / 2;

    Node left;
    Node right;
    if (static_cast<DistanceType>(point[divfeat]) < divval) {
        left.point = row;
        right.point = existing;
    } else {
        left.point = existing;
        right.point = row;
    }

    const auto left_id = static_cast<int32_t>(tree.size());
    tree.push_back(left);
    tree.push_back(right);

    Node& parent = tree[static_cast<size_t>(node)];
    parent.child1 = left_id;
    parent.child2 = left_id + 1;
    parent.divfeat = static_cast<int32_t>(divfeat);
    parent.divval = divval;
}

// =============================================================================
//  Search
// =============================================================================

template <typename T>
void KDTreeIndex<T>::search(ResultSet<DistanceType>& result, const T* query,
                            const SearchParameters& params) const {
    if (trees_.empty() || trees_.front().empty()) return;

    SearchState state{result, query, params, 0, static_cast<DistanceType>(1.0 + params.eps)};

    if (params.checks == CHECKS_UNLIMITED) {
        state.offsets.assign(this->veclen(), 0);
        search_level_exact(state, 0, 0);
        return;
    }

    state.max_checks = static_cast<size_t>(std::max(params.checks, 1));
    state.checked.assign(this->rows(), 0);

    for (size_t t = 0; t < trees_.size() && !state.stopped; ++t) {
        search_level(state, static_cast<int32_t>(t), 0, 0);
    }

    while (!state.stopped && !state.heap.empty() &&
           (state.checks < state.max_checks || !result.full())) {
        const auto branch = state.heap.top();
        state.heap.pop();
        search_level(state, branch.tree, branch.node, branch.mindist);
    }
}

template <typename T>
void KDTreeIndex<T>::search_level(SearchState& state, int32_t tree_id, int32_t node_id,
                                  DistanceType mindist) const {
    const Tree& tree = trees_[static_cast<size_t>(tree_id)];

    for (;;) {
        if (state.stopped || state.result.worst_dist() < mindist) return;

        const Node& node = tree[static_cast<size_t>(node_id)];
        if (node.is_leaf()) {
            const size_t row = node.point;
            if (state.checked[row] || (state.checks >= state.max_checks && state.result.full())) return;
            state.checked[row] = 1;
            ++state.checks;
            if (this->stop_requested(state.params, ++state.visits)) {
                state.stopped = true;
                return;
            }
            state.result.add_point(this->distance_to(state.query, row, state.result.worst_dist()), row);
            return;
        }

        const T val = state.query[node.divfeat];
        const DistanceType diff = static_cast<DistanceType>(val) - node.divval;
        const int32_t best = diff < 0 ? node.child1 : node.child2;
        const int32_t other = diff < 0 ? node.child2 : node.child1;

        const DistanceType new_distsq =
            mindist + this->distance_.template accum_dist<DistanceType>(val, node.divval);
        if (new_distsq * state.eps_error < state.result.worst_dist() || !state.result.full()) {
            state.heap.push({new_distsq, tree_id, other});
        }
        node_id = best;
    }
}

template <typename T>
void KDTreeIndex<T>::search_level_exact(SearchState& state, int32_t node_id, DistanceType mindist) const {
    const Tree& tree = trees_.front();
    const Node& node = tree[static_cast<size_t>(node_id)];

    if (state.stopped) return;

    if (node.is_leaf()) {
        if (this->stop_requested(state.params, ++state.visits)) {
            state.stopped = true;
            return;
        }
        state.result.add_point(this->distance_to(state.query, node.point, state.result.worst_dist()), node.point);
        return;
    }

    const T val = state.query[node.divfeat];
    const DistanceType diff = static_cast<DistanceType>(val) - node.divval;
    const int32_t best = diff < 0 ? node.child1 : node.child2;
    const int32_t other = diff < 0 ? node.child2 : node.child1;

    // The far cell's bound along divfeat replaces the one inherited from earlier cuts
    auto& offset = state.offsets[static_cast<size_t>(node.divfeat)];
    const DistanceType saved = offset;
    const DistanceType cut = this->distance_.template accum_dist<DistanceType>(val, node.divval);
    const DistanceType new_dist = mindist + cut - saved;

    search_level_exact(state, best, mindist);
    if (new_dist * state.eps_error <= state.result.worst_dist()) {
        offset = cut;
        search_level_exact(state, other, new_dist);
        offset = saved;
    }
}

// =============================================================================
//  Persistence
// =============================================================================

template <typename T>
void KDTreeIndex<T>::save_structure(BinaryWriter& writer) const {
    writer.write(static_cast<uint32_t>(trees_.size()));
    for (const auto& tree : trees_) {
        writer.write(static_cast<uint64_t>(tree.size()));
        for (const auto& node : tree) {
            writer.write(node.child1);
            writer.write(node.child2);
            writer.write(node.divfeat);
            writer.write(node.divval);
            writer.write(static_cast<uint64_t>(node.point));
        }
    }
}

template <typename T>
void KDTreeIndex<T>::load_structure(BinaryReader& reader) {
    const auto tree_count = reader.read<uint32_t>();
    if (tree_count > 1024) throw IoError("Corrupt index data: implausible tree count");

    const size_t rows = this->rows();
    const uint64_t max_nodes = 2 * static_cast<uint64_t>(rows) + 1;

    trees_.assign(tree_count, Tree{});
    for (auto& tree : trees_) {
        const auto node_count = reader.read<uint64_t>();
        if (node_count > max_nodes) throw IoError("Corrupt index data: k-d tree larger than dataset");
        tree.resize(static_cast<size_t>(node_count));
        for (auto& node : tree) {
            node.child1 = reader.read<int32_t>();
            node.child2 = reader.read<int32_t>();
            node.divfeat = reader.read<int32_t>();
            node.divval = reader.read<DistanceType>();
            node.point = static_cast<size_t>(reader.read<uint64_t>());

            const bool bad_children = node.child1 >= static_cast<int64_t>(node_count) ||
                                      node.child2 >= static_cast<int64_t>(node_count) ||
                                      (node.child1 < 0) != (node.child2 < 0);
            if (bad_children || node.point >= std::max<size_t>(rows, 1) ||
                node.divfeat < 0 || static_cast<size_t>(node.divfeat) >= std::max<size_t>(this->veclen(), 1)) {
                throw IoError("Corrupt index data: invalid k-d tree node");
            }
        }
    }
}

template <typename T>
size_t KDTreeIndex<T>::structure_memory() const {
    size_t bytes = trees_.capacity() * sizeof(Tree);
    for (const auto& tree : trees_) bytes += tree.capacity() * sizeof(Node);
    return bytes;
}

template class KDTreeIndex<float>;
template class KDTreeIndex<double>;
template class KDTreeIndex<uint8_t>;
template class KDTreeIndex<int32_t>;

} // namespace Annex
