/**
 * @file result_set.hpp
 * @brief Bounded collectors that index traversals feed candidates into
 *
 * Candidates are ranked by (distance, index), so equal distances always
 * resolve the same way regardless of traversal order or thread count.
 */

#pragma once

#include <core/types.hpp>
#include <algorithm>
#include <vector>

namespace Annex {

template <typename DistanceT>
class ResultSet {
public:
    virtual ~ResultSet() = default;

    /**
     * @brief True once the set holds enough candidates for pruning to apply
     */
    virtual bool full() const = 0;

    virtual void add_point(DistanceT dist, size_t index) = 0;

    /**
     * @brief Current pruning bound: branches farther than this are skipped
     */
    virtual DistanceT worst_dist() const = 0;
};

/**
 * @brief Keeps the k best candidates in ascending (distance, index) order
 *
 * Duplicate ids (reachable through several trees of a forest or through
 * both halves of a composite index) are collapsed.
 */
template <typename DistanceT>
class KNNResultSet : public ResultSet<DistanceT> {
public:
    explicit KNNResultSet(size_t capacity) : capacity_(capacity) {
        items_.reserve(capacity);
    }

    bool full() const override { return items_.size() >= capacity_; }

    void add_point(DistanceT dist, size_t index) override {
        if (capacity_ == 0) return;
        Neighbor<DistanceT> candidate{index, dist};
        if (full() && !(candidate < items_.back())) return;

        for (const auto& item : items_) {
            if (item.index == index) return;
        }

        auto pos = std::upper_bound(items_.begin(), items_.end(), candidate);
        items_.insert(pos, candidate);
        if (items_.size() > capacity_) items_.pop_back();
    }

    DistanceT worst_dist() const override {
        return full() ? items_.back().distance : max_distance<DistanceT>();
    }

    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }
    const std::vector<Neighbor<DistanceT>>& items() const { return items_; }

    void clear() { items_.clear(); }

private:
    size_t capacity_;
    std::vector<Neighbor<DistanceT>> items_;
};

/**
 * @brief Collects every candidate with distance <= radius
 *
 * Reports full() from the start so that approximate traversals honour their
 * checks budget exactly as they do for k-NN queries.
 */
template <typename DistanceT>
class RadiusResultSet : public ResultSet<DistanceT> {
public:
    explicit RadiusResultSet(DistanceT radius) : radius_(radius) {}

    bool full() const override { return true; }

    void add_point(DistanceT dist, size_t index) override {
        if (dist <= radius_) items_.push_back({index, dist});
    }

    DistanceT worst_dist() const override { return radius_; }

    /**
     * @brief Unique hits; ascending (distance, index) when `sorted`, else by index
     */
    std::vector<Neighbor<DistanceT>> take(bool sorted) {
        std::sort(items_.begin(), items_.end(),
                  [](const auto& a, const auto& b) { return a.index < b.index; });
        items_.erase(std::unique(items_.begin(), items_.end(),
                                 [](const auto& a, const auto& b) { return a.index == b.index; }),
                     items_.end());
        if (sorted) std::sort(items_.begin(), items_.end());
        return std::move(items_);
    }

private:
    DistanceT radius_;
    std::vector<Neighbor<DistanceT>> items_;
};

/**
 * @brief Drops candidates whose ids are marked in a removal bitmap
 */
template <typename DistanceT>
class FilteredResultSet : public ResultSet<DistanceT> {
public:
    FilteredResultSet(ResultSet<DistanceT>& inner, const std::vector<uint8_t>& removed)
        : inner_(inner), removed_(removed) {}

    bool full() const override { return inner_.full(); }

    void add_point(DistanceT dist, size_t index) override {
        if (index < removed_.size() && removed_[index]) return;
        inner_.add_point(dist, index);
    }

    DistanceT worst_dist() const override { return inner_.worst_dist(); }

private:
    ResultSet<DistanceT>& inner_;
    const std::vector<uint8_t>& removed_;
};

} // namespace Annex
