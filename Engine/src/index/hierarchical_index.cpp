/**
 * @file hierarchical_index.cpp
 * @brief Hierarchical clustering forest: build, insert, shared-heap search
 */

#include <index/hierarchical_index.hpp>
#include <index/center_chooser.hpp>
#include <utils/logger.hpp>
#include <utils/random.hpp>
#include <algorithm>
#include <limits>
#include <queue>

namespace Annex {

template <typename T>
struct HierarchicalIndex<T>::SearchState {
    struct Branch {
        DistanceType priority;
        int32_t tree;
        int32_t node;

        bool operator>(const Branch& other) const { return priority > other.priority; }
    };

    ResultSet<DistanceType>& result;
    const T* query;
    const SearchParameters& params;
    size_t max_checks = 0;
    size_t checks = 0;
    size_t visits = 0;
    bool stopped = false;
    std::priority_queue<Branch, std::vector<Branch>, std::greater<Branch>> heap;
    std::vector<uint8_t> checked;
};

template <typename T>
void HierarchicalIndex<T>::build_index() {
    const int tree_count = this->params_.trees;
    trees_.assign(static_cast<size_t>(tree_count), Tree{});

    const std::vector<size_t> ids = this->active_rows();
    if (ids.empty()) return;

    auto rng = make_rng(this->params_.random_seed);
    std::vector<uint32_t> seeds(static_cast<size_t>(tree_count));
    for (auto& seed : seeds) seed = rng();

    #pragma omp parallel for schedule(dynamic, 1)
    for (int t = 0; t < tree_count; ++t) {
        std::mt19937 tree_rng(seeds[static_cast<size_t>(t)]);
        Tree& tree = trees_[static_cast<size_t>(t)];
        tree.emplace_back();
        compute_clustering(tree, 0, ids, tree_rng);
    }

    Logger::info("Built hierarchical clustering forest: " + std::to_string(tree_count) + " trees over " +
                 std::to_string(ids.size()) + " points");
}

template <typename T>
void HierarchicalIndex<T>::compute_clustering(Tree& tree, int32_t node, const std::vector<size_t>& ids,
                                              std::mt19937& rng) const {
    const auto branching = static_cast<size_t>(this->params_.branching);

    auto make_leaf = [&]() {
        Node& n = tree[static_cast<size_t>(node)];
        n.children.clear();
        n.points.assign(ids.begin(), ids.end());
    };

    if (ids.size() <= static_cast<size_t>(this->params_.leaf_max_size) || ids.size() < branching) {
        make_leaf();
        return;
    }

    const std::vector<size_t> centers =
        choose_centers(this->params_.centers_init, this->dataset(), this->distance_, ids, branching, rng);
    if (centers.size() < branching) {
        make_leaf();
        return;
    }

    std::vector<std::vector<size_t>> groups(centers.size());
    for (size_t id : ids) {
        size_t best = 0;
        DistanceType best_dist = this->distance_to(this->dataset()[id], centers[0]);
        for (size_t c = 1; c < centers.size(); ++c) {
            const DistanceType d = this->distance_to(this->dataset()[id], centers[c], best_dist);
            if (d < best_dist) {
                best_dist = d;
                best = c;
            }
        }
        groups[best].push_back(id);
    }

    // A metric without identity of indiscernibles can pull every point to one pivot
    for (const auto& group : groups) {
        if (group.size() == ids.size()) {
            make_leaf();
            return;
        }
    }

    std::vector<int32_t> children;
    children.reserve(centers.size());
    for (size_t c = 0; c < centers.size(); ++c) {
        const auto child = static_cast<int32_t>(tree.size());
        tree.emplace_back();
        tree.back().pivot = centers[c];
        compute_clustering(tree, child, groups[c], rng);
        children.push_back(child);
    }

    Node& n = tree[static_cast<size_t>(node)];
    n.points.clear();
    n.children = std::move(children);
}

template <typename T>
bool HierarchicalIndex<T>::insert_points(size_t first_row) {
    if (trees_.empty() || trees_.front().empty()) return false;

    auto rng = make_rng(this->params_.random_seed);
    const auto branching = static_cast<size_t>(this->params_.branching);

    for (size_t row = first_row; row < this->rows(); ++row) {
        if (this->is_removed(row)) continue;
        const T* point = this->dataset()[row];

        for (auto& tree : trees_) {
            int32_t node = 0;
            while (!tree[static_cast<size_t>(node)].is_leaf()) {
                const auto& children = tree[static_cast<size_t>(node)].children;
                int32_t closest = children.front();
                DistanceType closest_dist = this->distance_to(point, tree[static_cast<size_t>(closest)].pivot);
                for (size_t c = 1; c < children.size(); ++c) {
                    const DistanceType d = this->distance_to(point, tree[static_cast<size_t>(children[c])].pivot, closest_dist);
                    if (d < closest_dist) {
                        closest_dist = d;
                        closest = children[c];
                    }
                }
                node = closest;
            }

            Node& leaf = tree[static_cast<size_t>(node)];
            leaf.points.push_back(row);
            if (leaf.points.size() >= branching) {
                const std::vector<size_t> ids(leaf.points.begin(), leaf.points.end());
                compute_clustering(tree, node, ids, rng);
            }
        }
    }
    return true;
}

template <typename T>
void HierarchicalIndex<T>::search(ResultSet<DistanceType>& result, const T* query,
                                  const SearchParameters& params) const {
    if (trees_.empty() || trees_.front().empty()) return;

    SearchState state{result, query, params};
    state.max_checks = params.checks == CHECKS_UNLIMITED ? std::numeric_limits<size_t>::max()
                                                         : static_cast<size_t>(std::max(params.checks, 1));
    state.checked.assign(this->rows(), 0);

    for (size_t t = 0; t < trees_.size() && !state.stopped; ++t) {
        find_nn(state, static_cast<int32_t>(t), 0);
    }
    while (!state.stopped && !state.heap.empty() &&
           (state.checks < state.max_checks || !result.full())) {
        const auto branch = state.heap.top();
        state.heap.pop();
        find_nn(state, branch.tree, branch.node);
    }
}

template <typename T>
void HierarchicalIndex<T>::find_nn(SearchState& state, int32_t tree_id, int32_t node_id) const {
    const Tree& tree = trees_[static_cast<size_t>(tree_id)];

    for (;;) {
        if (state.stopped) return;
        const Node& node = tree[static_cast<size_t>(node_id)];

        if (node.is_leaf()) {
            if (state.checks >= state.max_checks && state.result.full()) return;
            if (this->stop_requested(state.params, ++state.visits)) {
                state.stopped = true;
                return;
            }
            for (uint64_t p : node.points) {
                const auto row = static_cast<size_t>(p);
                if (state.checked[row]) continue;
                state.checked[row] = 1;
                ++state.checks;
                state.result.add_point(this->distance_to(state.query, row, state.result.worst_dist()), row);
            }
            return;
        }

        size_t best = 0;
        std::vector<DistanceType> domain(node.children.size());
        for (size_t c = 0; c < node.children.size(); ++c) {
            domain[c] = this->distance_to(state.query, tree[static_cast<size_t>(node.children[c])].pivot);
            if (domain[c] < domain[best]) best = c;
        }
        for (size_t c = 0; c < node.children.size(); ++c) {
            if (c != best) state.heap.push({domain[c], tree_id, node.children[c]});
        }
        node_id = node.children[best];
    }
}

template <typename T>
void HierarchicalIndex<T>::save_structure(BinaryWriter& writer) const {
    writer.write(static_cast<uint32_t>(trees_.size()));
    for (const auto& tree : trees_) {
        writer.write(static_cast<uint64_t>(tree.size()));
        for (const auto& node : tree) {
            writer.write(node.pivot);
            writer.write_vector(node.children);
            writer.write_vector(node.points);
        }
    }
}

template <typename T>
void HierarchicalIndex<T>::load_structure(BinaryReader& reader) {
    const auto tree_count = reader.read<uint32_t>();
    if (tree_count > 1024) throw IoError("Corrupt index data: implausible tree count");

    const size_t rows = this->rows();
    trees_.assign(tree_count, Tree{});
    for (auto& tree : trees_) {
        const auto node_count = reader.read<uint64_t>();
        if (node_count > static_cast<uint64_t>(rows) * static_cast<uint64_t>(this->params_.branching) + 1) {
            throw IoError("Corrupt index data: clustering tree larger than dataset");
        }
        tree.resize(static_cast<size_t>(node_count));
        for (auto& node : tree) {
            node.pivot = reader.read<uint64_t>();
            node.children = reader.read_vector<int32_t>(node_count);
            node.points = reader.read_vector<uint64_t>(rows);

            if (node.pivot >= std::max<uint64_t>(rows, 1)) throw IoError("Corrupt index data: pivot out of range");
            for (int32_t child : node.children) {
                if (child <= 0 || static_cast<uint64_t>(child) >= node_count) {
                    throw IoError("Corrupt index data: invalid clustering child");
                }
            }
            for (uint64_t p : node.points) {
                if (p >= rows) throw IoError("Corrupt index data: point id out of range");
            }
        }
    }
}

template <typename T>
size_t HierarchicalIndex<T>::structure_memory() const {
    size_t bytes = trees_.capacity() * sizeof(Tree);
    for (const auto& tree : trees_) {
        bytes += tree.capacity() * sizeof(Node);
        for (const auto& node : tree) {
            bytes += node.children.capacity() * sizeof(int32_t) + node.points.capacity() * sizeof(uint64_t);
        }
    }
    return bytes;
}

template class HierarchicalIndex<float>;
template class HierarchicalIndex<double>;
template class HierarchicalIndex<uint8_t>;
template class HierarchicalIndex<int32_t>;

} // namespace Annex
