/**
 * @file autotuned_index.cpp
 * @brief Tuning at build time and delegation to the chosen index
 */

#include <index/autotuned_index.hpp>
#include <index/index_factory.hpp>
#include <utils/logger.hpp>
#include <string>

namespace Annex {

template <typename T>
void AutotunedIndex<T>::build_index() {
    if (inner_) {
        // Threshold-triggered rebuild keeps the tuned configuration
        build_inner();
        return;
    }

    Autotuner<T> tuner(this->params_, *this->dataset_, this->active_rows());
    report_ = tuner.tune_build();
    build_inner();
    tuner.tune_search(*inner_, report_);
}

template <typename T>
void AutotunedIndex<T>::build_inner() {
    inner_ = create_index<T>(report_.chosen);
    inner_->build(this->dataset_);
    for (size_t id = 0; id < this->rows(); ++id) {
        if (this->is_removed(id)) inner_->remove_point(id);
    }
}

template <typename T>
bool AutotunedIndex<T>::insert_points(size_t first_row) {
    if (!inner_) return false;
    inner_->index_appended_rows(first_row, 0.0f);
    return true;
}

template <typename T>
void AutotunedIndex<T>::on_removed(size_t id) {
    if (inner_) inner_->remove_point(id);
}

template <typename T>
int AutotunedIndex<T>::autotuned_checks() const {
    return report_.chosen.checks;
}

template <typename T>
void AutotunedIndex<T>::search(ResultSet<DistanceType>& result, const T* query,
                               const SearchParameters& params) const {
    if (inner_) inner_->find_neighbors(result, query, params);
}

template <typename T>
void AutotunedIndex<T>::save_structure(BinaryWriter& writer) const {
    const std::string chosen = parameters_to_json(report_.chosen).dump();
    writer.write(static_cast<uint64_t>(chosen.size()));
    writer.write_bytes(chosen.data(), chosen.size());
    writer.write(report_.achieved_precision);
    writer.write(static_cast<uint8_t>(report_.target_met ? 1 : 0));
    writer.write(report_.speedup);
    inner_->save(writer);
}

template <typename T>
void AutotunedIndex<T>::load_structure(BinaryReader& reader) {
    const auto length = reader.read<uint64_t>();
    if (length > (1u << 20)) throw IoError("Corrupt index data: tuned parameter block too large");

    std::string chosen(static_cast<size_t>(length), '\0');
    reader.read_bytes(chosen.data(), chosen.size());

    try {
        report_ = AutotuneReport{};
        report_.chosen = parameters_from_json(nlohmann::json::parse(chosen));
    } catch (const nlohmann::json::exception& e) {
        throw IoError(std::string("Corrupt index data: tuned parameters: ") + e.what());
    } catch (const ConfigError& e) {
        throw IoError(std::string("Corrupt index data: tuned parameters: ") + e.what());
    }
    if (report_.chosen.algorithm == Algorithm::Autotuned || report_.chosen.algorithm == Algorithm::Saved) {
        throw IoError("Corrupt index data: tuned algorithm must be concrete");
    }

    report_.achieved_precision = reader.read<float>();
    report_.target_met = reader.read<uint8_t>() != 0;
    report_.speedup = reader.read<float>();

    inner_ = create_index<T>(report_.chosen);
    inner_->load(reader, this->dataset_);
}

template <typename T>
size_t AutotunedIndex<T>::structure_memory() const {
    return inner_ ? inner_->used_memory() : 0;
}

template class AutotunedIndex<float>;
template class AutotunedIndex<double>;
template class AutotunedIndex<uint8_t>;
template class AutotunedIndex<int32_t>;

} // namespace Annex
