/**
 * @file lsh_index.hpp
 * @brief Multi-table locality-sensitive hashing with multi-probe lookup
 *
 * Hamming indexes hash by sampling raw bits of each row. Every other metric
 * hashes by the signs of random hyperplane projections taken about the
 * dataset mean. Candidates from every probed bucket are re-ranked by the
 * true distance.
 */

#pragma once

#include <index/nn_index.hpp>
#include <Eigen/Dense>
#include <unordered_map>
#include <vector>

namespace Annex {

template <typename T>
class LSHIndex : public NNIndex<T> {
public:
    using typename NNIndex<T>::DistanceType;

    explicit LSHIndex(const IndexParameters& params) : NNIndex<T>(params) {}

    Algorithm algorithm() const override { return Algorithm::LSH; }

    size_t table_count() const { return tables_.size(); }

protected:
    void build_index() override;
    bool insert_points(size_t first_row) override;

    void search(ResultSet<DistanceType>& result, const T* query,
                const SearchParameters& params) const override;

    void save_structure(BinaryWriter& writer) const override;
    void load_structure(BinaryReader& reader) override;
    size_t structure_memory() const override;

private:
    using Hyperplanes = Eigen::Matrix<DistanceType, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    using Bucket = std::vector<uint64_t>;

    struct Table {
        std::vector<uint32_t> bits;        // Bit sampling (Hamming)
        Hyperplanes planes;                // Random projections (other metrics)
        std::unordered_map<uint32_t, Bucket> buckets;
    };

    bool bit_sampling() const { return this->distance_.type == Annex::DistanceType::Hamming; }

    uint32_t hash(const Table& table, const T* point) const;
    void populate_tables(size_t first_row);
    void fill_xor_masks();

    std::vector<Table> tables_;
    std::vector<DistanceType> mean_;
    std::vector<uint32_t> xor_masks_;
};

} // namespace Annex
