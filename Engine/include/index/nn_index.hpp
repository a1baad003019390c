/**
 * @file nn_index.hpp
 * @brief Common base for every nearest-neighbor index structure
 *
 * An index owns its structure and shares ownership of the dataset it was
 * built over. Point ids are dataset row positions; they stay stable across
 * add_points() and remove_point(). Removed ids are filtered out of every
 * search and skipped on rebuild.
 */

#pragma once

#include <core/matrix.hpp>
#include <core/parameters.hpp>
#include <distance/distance.hpp>
#include <index/result_set.hpp>
#include <io/serialization.hpp>
#include <search/cancellation.hpp>
#include <memory>
#include <vector>

namespace Annex {

template <typename T>
class NNIndex {
public:
    using ElementType = T;
    using DistanceType = ResultType<T>;

    explicit NNIndex(const IndexParameters& params);
    virtual ~NNIndex() = default;

    NNIndex(const NNIndex&) = delete;
    NNIndex& operator=(const NNIndex&) = delete;

    virtual Algorithm algorithm() const = 0;

    /**
     * @brief Build the structure over `dataset` (ownership is shared)
     */
    void build(std::shared_ptr<Dataset<T>> dataset);

    /**
     * @brief Append rows and index them
     *
     * When the active size exceeds size_at_build * rebuild_threshold
     * (threshold > 1), or the structure cannot insert incrementally, the
     * whole structure is rebuilt.
     */
    void add_points(const Matrix<const T>& points, float rebuild_threshold);

    /**
     * @brief Index rows [first_row, rows()) already appended to the shared dataset
     */
    void index_appended_rows(size_t first_row, float rebuild_threshold);

    /**
     * @throws DimensionError if `id` is not a row of the dataset
     */
    void remove_point(size_t id);

    /**
     * @brief Feed candidates for `query` into `result`, skipping removed ids
     */
    void find_neighbors(ResultSet<DistanceType>& result, const T* query,
                        const SearchParameters& params) const;

    void save(BinaryWriter& writer) const;
    void load(BinaryReader& reader, std::shared_ptr<Dataset<T>> dataset);

    /**
     * @brief Bytes owned by the structure (the dataset itself is excluded)
     */
    size_t used_memory() const;

    size_t size() const { return rows() - removed_count_; }
    size_t rows() const { return dataset_ ? dataset_->rows() : 0; }
    size_t veclen() const { return dataset_ ? dataset_->cols() : 0; }
    size_t removed_count() const { return removed_count_; }
    bool is_removed(size_t id) const { return id < removed_.size() && removed_[id] != 0; }

    const Dataset<T>& dataset() const { return *dataset_; }
    const std::shared_ptr<Dataset<T>>& shared_dataset() const { return dataset_; }
    const IndexParameters& parameters() const { return params_; }
    const Distance& distance() const { return distance_; }

protected:
    virtual void build_index() = 0;

    /**
     * @brief Insert rows [first_row, rows()) into the existing structure
     * @return false when the structure only supports rebuild-on-add
     */
    virtual bool insert_points(size_t first_row) {
        (void)first_row;
        return false;
    }

    virtual void on_removed(size_t id) { (void)id; }

    /**
     * @brief Budget used when a search asks for CHECKS_AUTOTUNED
     */
    virtual int autotuned_checks() const { return SearchParameters{}.checks; }

    virtual void search(ResultSet<DistanceType>& result, const T* query,
                        const SearchParameters& params) const = 0;

    virtual void save_structure(BinaryWriter& writer) const = 0;
    virtual void load_structure(BinaryReader& reader) = 0;
    virtual size_t structure_memory() const = 0;

    /**
     * @brief Non-removed row ids in ascending order
     */
    std::vector<size_t> active_rows() const;

    DistanceType distance_to(const T* query, size_t row, DistanceType worst = DistanceType(-1)) const {
        return distance_.template evaluate<DistanceType>(query, (*dataset_)[row], veclen(), worst);
    }

    /**
     * @brief Polled every few hundred visits by the tree traversals
     */
    static bool stop_requested(const SearchParameters& params, size_t visits) {
        return params.cancel != nullptr && (visits & 255) == 0 && params.cancel->is_cancelled();
    }

    IndexParameters params_;
    Distance distance_;
    std::shared_ptr<Dataset<T>> dataset_;
    std::vector<uint8_t> removed_;
    size_t removed_count_ = 0;
    size_t size_at_build_ = 0;
};

} // namespace Annex
