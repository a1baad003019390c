/**
 * @file autotuned_index.hpp
 * @brief Index that tunes its own configuration at build time and delegates to it
 */

#pragma once

#include <index/nn_index.hpp>
#include <tuning/autotuner.hpp>
#include <memory>

namespace Annex {

template <typename T>
class AutotunedIndex : public NNIndex<T> {
public:
    using typename NNIndex<T>::DistanceType;

    explicit AutotunedIndex(const IndexParameters& params) : NNIndex<T>(params) {}

    Algorithm algorithm() const override { return Algorithm::Autotuned; }

    /**
     * @brief Concrete configuration chosen by tuning, including the tuned checks
     */
    const IndexParameters& chosen_parameters() const { return report_.chosen; }

    const AutotuneReport& report() const { return report_; }

    float speedup() const { return report_.speedup; }

protected:
    void build_index() override;
    bool insert_points(size_t first_row) override;
    void on_removed(size_t id) override;
    int autotuned_checks() const override;

    void search(ResultSet<DistanceType>& result, const T* query,
                const SearchParameters& params) const override;

    void save_structure(BinaryWriter& writer) const override;
    void load_structure(BinaryReader& reader) override;
    size_t structure_memory() const override;

private:
    void build_inner();

    AutotuneReport report_;
    std::unique_ptr<NNIndex<T>> inner_;
};

} // namespace Annex
