/**
 * @file linear_index.hpp
 * @brief Exact brute-force scan
 */

#pragma once

#include <index/nn_index.hpp>

namespace Annex {

template <typename T>
class LinearIndex : public NNIndex<T> {
public:
    using typename NNIndex<T>::DistanceType;

    explicit LinearIndex(const IndexParameters& params) : NNIndex<T>(params) {}

    Algorithm algorithm() const override { return Algorithm::Linear; }

protected:
    void build_index() override {}
    bool insert_points(size_t) override { return true; }

    void search(ResultSet<DistanceType>& result, const T* query,
                const SearchParameters& params) const override;

    void save_structure(BinaryWriter&) const override {}
    void load_structure(BinaryReader&) override {}
    size_t structure_memory() const override { return 0; }
};

} // namespace Annex
