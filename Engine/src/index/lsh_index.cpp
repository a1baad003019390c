/**
 * @file lsh_index.cpp
 * @brief LSH tables: hash function generation, parallel population, multi-probe search
 */

#include <index/lsh_index.hpp>
#include <core/error.hpp>
#include <utils/logger.hpp>
#include <utils/random.hpp>
#include <algorithm>

namespace Annex {

template <typename T>
void LSHIndex<T>::build_index() {
    const auto key_size = static_cast<size_t>(this->params_.key_size);
    const size_t dim = this->veclen();
    auto rng = make_rng(this->params_.random_seed);

    tables_.assign(this->params_.table_number, Table{});

    if (bit_sampling()) {
        const auto total_bits = static_cast<uint32_t>(dim * sizeof(T) * 8);
        std::vector<size_t> pool(total_bits);
        for (size_t b = 0; b < pool.size(); ++b) pool[b] = b;

        for (auto& table : tables_) {
            // Sample with replacement only when the rows are narrower than the key
            if (key_size <= pool.size()) {
                for (size_t b : random_sample(pool, key_size, rng)) table.bits.push_back(static_cast<uint32_t>(b));
            } else {
                for (size_t i = 0; i < key_size; ++i) table.bits.push_back(static_cast<uint32_t>(random_index(pool.size(), rng)));
            }
        }
    } else {
        mean_.assign(dim, 0);
        const std::vector<size_t> ids = this->active_rows();
        for (size_t id : ids) {
            const T* row = this->dataset()[id];
            for (size_t k = 0; k < dim; ++k) mean_[k] += static_cast<DistanceType>(row[k]);
        }
        if (!ids.empty()) {
            for (auto& m : mean_) m /= static_cast<DistanceType>(ids.size());
        }

        std::normal_distribution<double> gaussian(0.0, 1.0);
        for (auto& table : tables_) {
            table.planes.resize(static_cast<Eigen::Index>(key_size), static_cast<Eigen::Index>(dim));
            for (Eigen::Index r = 0; r < table.planes.rows(); ++r) {
                for (Eigen::Index c = 0; c < table.planes.cols(); ++c) {
                    table.planes(r, c) = static_cast<DistanceType>(gaussian(rng));
                }
            }
        }
    }

    fill_xor_masks();
    populate_tables(0);

    Logger::info("Built LSH index: " + std::to_string(tables_.size()) + " tables, " +
                 std::to_string(key_size) + "-bit keys over " + std::to_string(this->size()) + " points");
}

template <typename T>
void LSHIndex<T>::fill_xor_masks() {
    const auto key_size = this->params_.key_size;
    const auto level = this->params_.multi_probe_level;
    if (level > LSH_MAX_MULTI_PROBE_LEVEL || level > key_size) {
        throw ConfigError("multi_probe_level " + std::to_string(level) + " exceeds the probe limit of " +
                          std::to_string(std::min(LSH_MAX_MULTI_PROBE_LEVEL, key_size)));
    }

    // Every mask of at most `level` set bits within the key, in order of bit count
    xor_masks_.clear();
    xor_masks_.push_back(0);
    std::vector<uint32_t> frontier{0};
    for (unsigned l = 1; l <= level; ++l) {
        std::vector<uint32_t> next;
        for (uint32_t mask : frontier) {
            const unsigned lowest = mask == 0 ? key_size : static_cast<unsigned>(__builtin_ctz(mask));
            for (unsigned bit = 0; bit < lowest; ++bit) next.push_back(mask | (1u << bit));
        }
        std::sort(next.begin(), next.end());
        xor_masks_.insert(xor_masks_.end(), next.begin(), next.end());
        frontier = std::move(next);
    }
}

template <typename T>
uint32_t LSHIndex<T>::hash(const Table& table, const T* point) const {
    uint32_t key = 0;

    if (bit_sampling()) {
        const auto* bytes = reinterpret_cast<const uint8_t*>(point);
        for (size_t i = 0; i < table.bits.size(); ++i) {
            const uint32_t b = table.bits[i];
            if ((bytes[b >> 3] >> (b & 7)) & 1u) key |= 1u << i;
        }
        return key;
    }

    using Vector = Eigen::Matrix<DistanceType, Eigen::Dynamic, 1>;
    const auto dim = static_cast<Eigen::Index>(this->veclen());
    Vector centered(dim);
    for (Eigen::Index k = 0; k < dim; ++k) {
        centered(k) = static_cast<DistanceType>(point[k]) - mean_[static_cast<size_t>(k)];
    }
    const Vector projection = table.planes * centered;
    for (Eigen::Index i = 0; i < projection.size(); ++i) {
        if (projection(i) > 0) key |= 1u << i;
    }
    return key;
}

template <typename T>
void LSHIndex<T>::populate_tables(size_t first_row) {
    const size_t rows = this->rows();
    const int table_count = static_cast<int>(tables_.size());

    #pragma omp parallel for schedule(static)
    for (int t = 0; t < table_count; ++t) {
        Table& table = tables_[static_cast<size_t>(t)];
        for (size_t row = first_row; row < rows; ++row) {
            if (this->is_removed(row)) continue;
            table.buckets[hash(table, this->dataset()[row])].push_back(row);
        }
    }
}

template <typename T>
bool LSHIndex<T>::insert_points(size_t first_row) {
    if (tables_.empty()) return false;
    populate_tables(first_row);
    return true;
}

template <typename T>
void LSHIndex<T>::search(ResultSet<DistanceType>& result, const T* query,
                         const SearchParameters& params) const {
    std::vector<uint8_t> seen(this->rows(), 0);
    size_t visits = 0;

    for (const auto& table : tables_) {
        const uint32_t key = hash(table, query);
        for (uint32_t mask : xor_masks_) {
            const auto bucket = table.buckets.find(key ^ mask);
            if (bucket == table.buckets.end()) continue;

            for (uint64_t p : bucket->second) {
                const auto row = static_cast<size_t>(p);
                if (seen[row]) continue;
                seen[row] = 1;
                if (this->stop_requested(params, ++visits)) return;
                result.add_point(this->distance_to(query, row, result.worst_dist()), row);
            }
        }
    }
}

template <typename T>
void LSHIndex<T>::save_structure(BinaryWriter& writer) const {
    writer.write_vector(mean_);
    writer.write(static_cast<uint32_t>(tables_.size()));
    for (const auto& table : tables_) {
        writer.write_vector(table.bits);
        writer.write(static_cast<uint64_t>(table.planes.rows()));
        writer.write(static_cast<uint64_t>(table.planes.cols()));
        for (Eigen::Index i = 0; i < table.planes.size(); ++i) writer.write(table.planes.data()[i]);
    }
}

template <typename T>
void LSHIndex<T>::load_structure(BinaryReader& reader) {
    const size_t dim = this->veclen();
    const auto key_size = static_cast<uint64_t>(this->params_.key_size);

    mean_ = reader.read_vector<DistanceType>(dim);
    const auto table_count = reader.read<uint32_t>();
    if (table_count != this->params_.table_number) {
        throw IoError("Corrupt index data: LSH table count does not match parameters");
    }

    tables_.assign(table_count, Table{});
    for (auto& table : tables_) {
        table.bits = reader.read_vector<uint32_t>(key_size);
        const auto plane_rows = reader.read<uint64_t>();
        const auto plane_cols = reader.read<uint64_t>();
        if (plane_rows > key_size || (plane_rows != 0 && plane_cols != dim)) {
            throw IoError("Corrupt index data: LSH hyperplane shape mismatch");
        }
        table.planes.resize(static_cast<Eigen::Index>(plane_rows), static_cast<Eigen::Index>(plane_cols));
        for (Eigen::Index i = 0; i < table.planes.size(); ++i) table.planes.data()[i] = reader.read<DistanceType>();

        const uint64_t total_bits = static_cast<uint64_t>(dim) * sizeof(T) * 8;
        for (uint32_t b : table.bits) {
            if (b >= total_bits) throw IoError("Corrupt index data: LSH bit position out of range");
        }
        if (bit_sampling() ? table.bits.size() != key_size : plane_rows != key_size) {
            throw IoError("Corrupt index data: LSH key size mismatch");
        }
    }
    if (!bit_sampling() && mean_.size() != dim) {
        throw IoError("Corrupt index data: LSH mean dimension mismatch");
    }

    fill_xor_masks();
    populate_tables(0);
}

template <typename T>
size_t LSHIndex<T>::structure_memory() const {
    size_t bytes = mean_.capacity() * sizeof(DistanceType) + xor_masks_.capacity() * sizeof(uint32_t);
    for (const auto& table : tables_) {
        bytes += sizeof(Table) + table.bits.capacity() * sizeof(uint32_t) +
                 static_cast<size_t>(table.planes.size()) * sizeof(DistanceType);
        for (const auto& [key, bucket] : table.buckets) {
            bytes += sizeof(key) + sizeof(Bucket) + bucket.capacity() * sizeof(uint64_t);
        }
    }
    return bytes;
}

template class LSHIndex<float>;
template class LSHIndex<double>;
template class LSHIndex<uint8_t>;
template class LSHIndex<int32_t>;

} // namespace Annex
