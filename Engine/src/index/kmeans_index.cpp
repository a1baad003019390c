/**
 * @file kmeans_index.cpp
 * @brief Hierarchical k-means tree: recursive clustering, incremental insert,
 *        best-bin-first and ball-pruned exact search
 */

#include <index/kmeans_index.hpp>
#include <index/center_chooser.hpp>
#include <utils/logger.hpp>
#include <utils/random.hpp>
#include <Eigen/Dense>
#include <algorithm>
#include <climits>
#include <limits>
#include <cmath>
#include <queue>

namespace Annex {

template <typename T>
struct KMeansIndex<T>::SearchState {
    struct Branch {
        DistanceType priority;
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
};

// =============================================================================
//  Build
// =============================================================================

template <typename T>
void KMeansIndex<T>::build_index() {
    nodes_.clear();

    const std::vector<size_t> ids = this->active_rows();
    if (ids.empty()) return;

    auto rng = make_rng(this->params_.random_seed);
    const int32_t root = new_node();
    compute_clustering(root, ids, rng);

    Logger::info("Built k-means tree: branching " + std::to_string(this->params_.branching) + ", " +
                 std::to_string(nodes_.size()) + " nodes over " + std::to_string(ids.size()) + " points");
}

template <typename T>
int32_t KMeansIndex<T>::new_node() {
    nodes_.emplace_back();
    return static_cast<int32_t>(nodes_.size() - 1);
}

template <typename T>
void KMeansIndex<T>::compute_node_statistics(int32_t node, const std::vector<size_t>& ids) {
    using RowVector = Eigen::Matrix<DistanceType, 1, Eigen::Dynamic>;
    using PointMap = Eigen::Map<const Eigen::Matrix<T, 1, Eigen::Dynamic>>;

    const auto& data = this->dataset();
    const auto dim = static_cast<Eigen::Index>(this->veclen());

    RowVector mean = RowVector::Zero(dim);
    for (size_t id : ids) {
        mean += PointMap(data[id], dim).template cast<DistanceType>();
    }
    mean /= static_cast<DistanceType>(ids.size());

    Node& n = nodes_[static_cast<size_t>(node)];
    n.pivot.assign(mean.data(), mean.data() + dim);
    n.size = ids.size();

    DistanceType radius = 0;
    DistanceType variance = 0;
    for (size_t id : ids) {
        const DistanceType d = pivot_distance(data[id], node);
        radius = std::max(radius, d);
        variance += d;
    }
    n.radius = radius;
    n.variance = variance / static_cast<DistanceType>(ids.size());
}

template <typename T>
void KMeansIndex<T>::compute_clustering(int32_t node, const std::vector<size_t>& ids, std::mt19937& rng) {
    using RowMatrix = Eigen::Matrix<DistanceType, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    using PointMap = Eigen::Map<const Eigen::Matrix<T, 1, Eigen::Dynamic>>;

    compute_node_statistics(node, ids);

    const auto& data = this->dataset();
    const size_t dim = this->veclen();
    const auto branching = static_cast<size_t>(this->params_.branching);

    auto make_leaf = [&]() {
        Node& n = nodes_[static_cast<size_t>(node)];
        n.children.clear();
        n.points.assign(ids.begin(), ids.end());
    };

    if (ids.size() < branching || ids.size() <= static_cast<size_t>(this->params_.leaf_max_size)) {
        make_leaf();
        return;
    }

    const std::vector<size_t> initial =
        choose_centers(this->params_.centers_init, data, this->distance_, ids, branching, rng);
    if (initial.size() < branching) {
        make_leaf();
        return;
    }

    RowMatrix centers(static_cast<Eigen::Index>(branching), static_cast<Eigen::Index>(dim));
    for (size_t c = 0; c < branching; ++c) {
        centers.row(static_cast<Eigen::Index>(c)) =
            PointMap(data[initial[c]], static_cast<Eigen::Index>(dim)).template cast<DistanceType>();
    }

    std::vector<size_t> belongs_to(ids.size(), 0);
    std::vector<size_t> count(branching, 0);

    // Returns true when any assignment changed
    auto assign = [&]() {
        bool changed = false;
        std::fill(count.begin(), count.end(), 0);
        for (size_t i = 0; i < ids.size(); ++i) {
            const T* point = data[ids[i]];
            size_t best = 0;
            DistanceType best_dist = this->distance_.template evaluate<DistanceType>(point, centers.row(0).data(), dim);
            for (size_t c = 1; c < branching; ++c) {
                const DistanceType d = this->distance_.template evaluate<DistanceType>(
                    point, centers.row(static_cast<Eigen::Index>(c)).data(), dim, best_dist);
                if (d < best_dist) {
                    best_dist = d;
                    best = c;
                }
            }
            if (best != belongs_to[i]) changed = true;
            belongs_to[i] = best;
            ++count[best];
        }

        // Every cluster keeps at least one point
        for (size_t c = 0; c < branching; ++c) {
            if (count[c] != 0) continue;
            for (size_t i = 0; i < ids.size(); ++i) {
                if (count[belongs_to[i]] > 1) {
                    --count[belongs_to[i]];
                    belongs_to[i] = c;
                    ++count[c];
                    changed = true;
                    break;
                }
            }
        }
        return changed;
    };

    assign();

    const int max_iterations = this->params_.iterations < 0 ? INT_MAX : this->params_.iterations;
    for (int iteration = 0; iteration < max_iterations; ++iteration) {
        centers.setZero();
        for (size_t i = 0; i < ids.size(); ++i) {
            centers.row(static_cast<Eigen::Index>(belongs_to[i])) +=
                PointMap(data[ids[i]], static_cast<Eigen::Index>(dim)).template cast<DistanceType>();
        }
        for (size_t c = 0; c < branching; ++c) {
            centers.row(static_cast<Eigen::Index>(c)) /= static_cast<DistanceType>(count[c]);
        }
        if (!assign()) break;
    }

    std::vector<std::vector<size_t>> groups(branching);
    for (size_t i = 0; i < ids.size(); ++i) groups[belongs_to[i]].push_back(ids[i]);

    std::vector<int32_t> children;
    children.reserve(branching);
    for (auto& group : groups) {
        const int32_t child = new_node();
        compute_clustering(child, group, rng);
        children.push_back(child);
    }

    Node& n = nodes_[static_cast<size_t>(node)];
    n.points.clear();
    n.children = std::move(children);
}

template <typename T>
bool KMeansIndex<T>::insert_points(size_t first_row) {
    if (nodes_.empty()) return false;

    auto rng = make_rng(this->params_.random_seed);
    for (size_t row = first_row; row < this->rows(); ++row) {
        if (!this->is_removed(row)) add_point_to_tree(0, row, rng);
    }
    return true;
}

template <typename T>
void KMeansIndex<T>::add_point_to_tree(int32_t node, size_t row, std::mt19937& rng) {
    const T* point = this->dataset()[row];

    for (;;) {
        const DistanceType d = pivot_distance(point, node);
        Node& n = nodes_[static_cast<size_t>(node)];
        n.radius = std::max(n.radius, d);
        n.variance = (n.variance * static_cast<DistanceType>(n.size) + d) / static_cast<DistanceType>(n.size + 1);
        ++n.size;

        if (n.is_leaf()) {
            n.points.push_back(row);
            if (n.points.size() >= static_cast<size_t>(this->params_.branching)) {
                const std::vector<size_t> ids(n.points.begin(), n.points.end());
                compute_clustering(node, ids, rng);
            }
            return;
        }

        int32_t closest = n.children.front();
        DistanceType closest_dist = pivot_distance(point, closest);
        for (size_t c = 1; c < n.children.size(); ++c) {
            const DistanceType cd = pivot_distance(point, n.children[c]);
            if (cd < closest_dist) {
                closest_dist = cd;
                closest = n.children[c];
            }
        }
        node = closest;
    }
}

// =============================================================================
//  Search
// =============================================================================

template <typename T>
typename KMeansIndex<T>::DistanceType KMeansIndex<T>::pivot_distance(const T* point, int32_t node) const {
    return this->distance_.template evaluate<DistanceType>(
        point, nodes_[static_cast<size_t>(node)].pivot.data(), this->veclen());
}

template <typename T>
bool KMeansIndex<T>::ball_excluded(DistanceType center_dist, DistanceType radius, DistanceType worst) const {
    if (worst >= max_distance<DistanceType>()) return false;

    switch (this->distance_.type) {
        case Annex::DistanceType::Euclidean:
            return std::sqrt(center_dist) - std::sqrt(radius) > std::sqrt(worst);
        case Annex::DistanceType::Manhattan:
        case Annex::DistanceType::Max:
            return center_dist - radius > worst;
        case Annex::DistanceType::Minkowski: {
            const DistanceType inv = DistanceType(1) / static_cast<DistanceType>(this->distance_.order);
            return std::pow(center_dist, inv) - std::pow(radius, inv) > std::pow(worst, inv);
        }
        default:
            // No triangle inequality to rely on
            return false;
    }
}

template <typename T>
void KMeansIndex<T>::search(ResultSet<DistanceType>& result, const T* query,
                            const SearchParameters& params) const {
    if (nodes_.empty()) return;

    SearchState state{result, query, params};

    if (params.checks == CHECKS_UNLIMITED) {
        find_exact_nn(state, 0);
        return;
    }

    state.max_checks = static_cast<size_t>(std::max(params.checks, 1));
    find_nn(state, 0);
    while (!state.stopped && !state.heap.empty() &&
           (state.checks < state.max_checks || !result.full())) {
        const auto branch = state.heap.top();
        state.heap.pop();
        find_nn(state, branch.node);
    }
}

template <typename T>
void KMeansIndex<T>::find_nn(SearchState& state, int32_t node_id) const {
    for (;;) {
        if (state.stopped) return;
        const Node& node = nodes_[static_cast<size_t>(node_id)];

        if (ball_excluded(pivot_distance(state.query, node_id), node.radius, state.result.worst_dist())) return;

        if (node.is_leaf()) {
            if (state.checks >= state.max_checks && state.result.full()) return;
            if (this->stop_requested(state.params, ++state.visits)) {
                state.stopped = true;
                return;
            }
            state.checks += node.points.size();
            for (uint64_t p : node.points) {
                const auto row = static_cast<size_t>(p);
                state.result.add_point(this->distance_to(state.query, row, state.result.worst_dist()), row);
            }
            return;
        }

        // Descend into the closest child, queue the rest by variance-adjusted distance
        const float cb_index = this->params_.cb_index;
        size_t best = 0;
        std::vector<DistanceType> domain(node.children.size());
        for (size_t c = 0; c < node.children.size(); ++c) {
            domain[c] = pivot_distance(state.query, node.children[c]);
            if (domain[c] < domain[best]) best = c;
        }
        for (size_t c = 0; c < node.children.size(); ++c) {
            if (c == best) continue;
            const Node& child = nodes_[static_cast<size_t>(node.children[c])];
            state.heap.push({domain[c] - static_cast<DistanceType>(cb_index) * child.variance, node.children[c]});
        }
        node_id = node.children[best];
    }
}

template <typename T>
void KMeansIndex<T>::find_exact_nn(SearchState& state, int32_t node_id) const {
    if (state.stopped) return;
    const Node& node = nodes_[static_cast<size_t>(node_id)];

    if (ball_excluded(pivot_distance(state.query, node_id), node.radius, state.result.worst_dist())) return;

    if (node.is_leaf()) {
        if (this->stop_requested(state.params, ++state.visits)) {
            state.stopped = true;
            return;
        }
        for (uint64_t p : node.points) {
            const auto row = static_cast<size_t>(p);
            state.result.add_point(this->distance_to(state.query, row, state.result.worst_dist()), row);
        }
        return;
    }

    std::vector<std::pair<DistanceType, int32_t>> order;
    order.reserve(node.children.size());
    for (int32_t child : node.children) order.emplace_back(pivot_distance(state.query, child), child);
    std::sort(order.begin(), order.end());

    for (const auto& entry : order) find_exact_nn(state, entry.second);
}

// =============================================================================
//  Cluster centers
// =============================================================================

template <typename T>
Dataset<typename KMeansIndex<T>::DistanceType> KMeansIndex<T>::cluster_centers(size_t count) const {
    Dataset<DistanceType> centers(this->veclen());
    if (nodes_.empty() || count == 0) return centers;

    const auto branching = static_cast<size_t>(this->params_.branching);
    std::vector<int32_t> clusters{0};
    const Node& root = nodes_.front();
    double mean_variance = static_cast<double>(root.variance) * static_cast<double>(root.size);

    while (clusters.size() < count) {
        double min_variance = std::numeric_limits<double>::max();
        int split = -1;

        for (size_t i = 0; i < clusters.size(); ++i) {
            const Node& candidate = nodes_[static_cast<size_t>(clusters[i])];
            if (candidate.is_leaf()) continue;

            double variance = mean_variance - static_cast<double>(candidate.variance) * static_cast<double>(candidate.size);
            for (int32_t child : candidate.children) {
                const Node& c = nodes_[static_cast<size_t>(child)];
                variance += static_cast<double>(c.variance) * static_cast<double>(c.size);
            }
            if (variance < min_variance) {
                min_variance = variance;
                split = static_cast<int>(i);
            }
        }

        if (split < 0) break;
        const Node& chosen = nodes_[static_cast<size_t>(clusters[static_cast<size_t>(split)])];
        if (clusters.size() - 1 + chosen.children.size() > count) break;

        mean_variance = min_variance;
        const std::vector<int32_t> children = chosen.children;
        clusters.erase(clusters.begin() + split);
        clusters.insert(clusters.end(), children.begin(), children.end());
    }

    Logger::info("Selected " + std::to_string(clusters.size()) + " cluster centers (requested " +
                 std::to_string(count) + ", branching " + std::to_string(branching) + ")");

    for (int32_t id : clusters) {
        const auto& pivot = nodes_[static_cast<size_t>(id)].pivot;
        centers.append(Matrix<const DistanceType>(pivot.data(), 1, pivot.size()));
    }
    return centers;
}

// =============================================================================
//  Persistence
// =============================================================================

template <typename T>
void KMeansIndex<T>::save_structure(BinaryWriter& writer) const {
    writer.write(static_cast<uint64_t>(nodes_.size()));
    for (const auto& node : nodes_) {
        writer.write_vector(node.pivot);
        writer.write(node.radius);
        writer.write(node.variance);
        writer.write(node.size);
        writer.write_vector(node.children);
        writer.write_vector(node.points);
    }
}

template <typename T>
void KMeansIndex<T>::load_structure(BinaryReader& reader) {
    const size_t rows = this->rows();
    const auto node_count = reader.read<uint64_t>();
    if (node_count > 2 * static_cast<uint64_t>(rows) + 1) {
        throw IoError("Corrupt index data: k-means tree larger than dataset");
    }

    nodes_.assign(static_cast<size_t>(node_count), Node{});
    for (auto& node : nodes_) {
        node.pivot = reader.read_vector<DistanceType>(this->veclen());
        node.radius = reader.read<DistanceType>();
        node.variance = reader.read<DistanceType>();
        node.size = reader.read<uint64_t>();
        node.children = reader.read_vector<int32_t>(node_count);
        node.points = reader.read_vector<uint64_t>(rows);

        if (node.pivot.size() != this->veclen()) throw IoError("Corrupt index data: pivot dimension mismatch");
        for (int32_t child : node.children) {
            if (child <= 0 || static_cast<uint64_t>(child) >= node_count) {
                throw IoError("Corrupt index data: invalid k-means child");
            }
        }
        for (uint64_t p : node.points) {
            if (p >= rows) throw IoError("Corrupt index data: point id out of range");
        }
    }
}

template <typename T>
size_t KMeansIndex<T>::structure_memory() const {
    size_t bytes = nodes_.capacity() * sizeof(Node);
    for (const auto& node : nodes_) {
        bytes += node.pivot.capacity() * sizeof(DistanceType) +
                 node.children.capacity() * sizeof(int32_t) +
                 node.points.capacity() * sizeof(uint64_t);
    }
    return bytes;
}

template class KMeansIndex<float>;
template class KMeansIndex<double>;
template class KMeansIndex<uint8_t>;
template class KMeansIndex<int32_t>;

} // namespace Annex
