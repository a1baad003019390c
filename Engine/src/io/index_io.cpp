/**
 * @file index_io.cpp
 * @brief Index file header, digest verification and payload dispatch
 */

#include <io/index_io.hpp>
#include <index/index_factory.hpp>
#include <io/serialization.hpp>
#include <utils/logger.hpp>
#include <endian.h>
#include <cstring>
#include <fstream>

namespace Annex {

namespace {

constexpr uint64_t MAX_PARAMETER_BLOCK = 1u << 20;

void write_header(BinaryWriter& writer, const IndexFileHeader& header) {
    writer.write_bytes(INDEX_FILE_MAGIC, sizeof(INDEX_FILE_MAGIC));
    writer.write(header.version);
    writer.write(header.element);
    writer.write(header.algorithm);
    writer.write(header.distance);
    writer.write(header.distance_order);
    writer.write(header.rows);
    writer.write(header.cols);

    const std::string params = parameters_to_json(header.params).dump();
    writer.write(static_cast<uint64_t>(params.size()));
    writer.write_bytes(params.data(), params.size());
    writer.write_bytes(header.digest.data(), header.digest.size());
}

IndexFileHeader parse_header(BinaryReader& reader, const std::string& path) {
    char magic[sizeof(INDEX_FILE_MAGIC)];
    reader.read_bytes(magic, sizeof(magic));
    if (std::memcmp(magic, INDEX_FILE_MAGIC, sizeof(magic)) != 0) {
        throw IoError("Not an index file: " + path);
    }

    IndexFileHeader header;
    header.version = reader.read<uint32_t>();
    if (header.version != INDEX_FILE_VERSION) {
        throw IoError("Unsupported index file version " + std::to_string(header.version) + " in " + path);
    }

    const auto element = reader.read<int32_t>();
    if (element < 0 || element > static_cast<int32_t>(ElementType::Int32)) {
        throw IoError("Corrupt index file " + path + ": unknown element type");
    }
    header.element = static_cast<ElementType>(element);

    try {
        header.algorithm = algorithm_from_int(reader.read<int32_t>());
        header.distance = distance_from_int(reader.read<int32_t>());
    } catch (const ConfigError& e) {
        throw IoError("Corrupt index file " + path + ": " + e.what());
    }
    header.distance_order = reader.read<int32_t>();
    header.rows = reader.read<uint64_t>();
    header.cols = reader.read<uint64_t>();

    const auto length = reader.read<uint64_t>();
    if (length > MAX_PARAMETER_BLOCK) throw IoError("Corrupt index file " + path + ": parameter block too large");
    std::string params(static_cast<size_t>(length), '\0');
    reader.read_bytes(params.data(), params.size());
    try {
        header.params = parameters_from_json(nlohmann::json::parse(params));
    } catch (const nlohmann::json::exception& e) {
        throw IoError("Corrupt index file " + path + ": " + e.what());
    } catch (const ConfigError& e) {
        throw IoError("Corrupt index file " + path + ": " + e.what());
    }

    reader.read_bytes(header.digest.data(), header.digest.size());
    return header;
}

} // namespace

template <typename T>
BLAKE3Pipeline::Hash dataset_digest(const Dataset<T>& dataset) {
    const uint64_t rows = htole64(static_cast<uint64_t>(dataset.rows()));
    const uint64_t cols = htole64(static_cast<uint64_t>(dataset.cols()));
    const auto element = static_cast<uint8_t>(ElementTraits<T>::type);
    return BLAKE3Pipeline::hash_parts({
        {&element, sizeof(element)},
        {&rows, sizeof(rows)},
        {&cols, sizeof(cols)},
        {dataset.data(), dataset.byte_size()},
    });
}

template <typename T>
void save_index(const NNIndex<T>& index, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw IoError("Cannot open index file for writing: " + path);

    IndexFileHeader header;
    header.element = ElementTraits<T>::type;
    header.algorithm = index.algorithm();
    header.distance = index.distance().type;
    header.distance_order = index.distance().order;
    header.rows = index.rows();
    header.cols = index.veclen();
    header.params = index.parameters();
    header.digest = dataset_digest(index.dataset());

    BinaryWriter writer(out);
    write_header(writer, header);
    index.save(writer);

    out.flush();
    if (!out) throw IoError("Failed to write index file: " + path);

    Logger::info("Saved " + std::string(to_string(header.algorithm)) + " index (" +
                 std::to_string(header.rows) + " x " + std::to_string(header.cols) + ") to " + path);
}

template <typename T>
std::unique_ptr<NNIndex<T>> load_index(const std::string& path, std::shared_ptr<Dataset<T>> dataset) {
    if (!dataset) throw DimensionError("Cannot load an index without a dataset");
    std::ifstream in(path, std::ios::binary);
    if (!in) throw IoError("Cannot open index file: " + path);

    BinaryReader reader(in);
    const IndexFileHeader header = parse_header(reader, path);

    if (header.element != ElementTraits<T>::type) {
        throw DimensionError("Index file " + path + " holds " + std::string(to_string(header.element)) +
                             " data, not " + ElementTraits<T>::name);
    }
    if (header.rows != dataset->rows() || header.cols != dataset->cols()) {
        throw DimensionError("Index file " + path + " was built over " + std::to_string(header.rows) + " x " +
                             std::to_string(header.cols) + " data, got " + std::to_string(dataset->rows()) +
                             " x " + std::to_string(dataset->cols()));
    }
    if (!BLAKE3Pipeline::equal(header.digest, dataset_digest(*dataset))) {
        throw IoError("Dataset does not match the one index file " + path + " was built over (digest " +
                      BLAKE3Pipeline::to_hex(header.digest) + ")");
    }

    IndexParameters params = header.params;
    params.algorithm = header.algorithm;
    params.distance = header.distance;
    params.distance_order = header.distance_order;

    auto index = create_index<T>(params);
    index->load(reader, std::move(dataset));

    Logger::info("Loaded " + std::string(to_string(header.algorithm)) + " index from " + path);
    return index;
}

IndexFileHeader read_index_header(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw IoError("Cannot open index file: " + path);
    BinaryReader reader(in);
    return parse_header(reader, path);
}

#define ANNEX_INSTANTIATE_INDEX_IO(T)                                                               \
    template BLAKE3Pipeline::Hash dataset_digest<T>(const Dataset<T>&);                             \
    template void save_index<T>(const NNIndex<T>&, const std::string&);                             \
    template std::unique_ptr<NNIndex<T>> load_index<T>(const std::string&, std::shared_ptr<Dataset<T>>);

ANNEX_INSTANTIATE_INDEX_IO(float)
ANNEX_INSTANTIATE_INDEX_IO(double)
ANNEX_INSTANTIATE_INDEX_IO(uint8_t)
ANNEX_INSTANTIATE_INDEX_IO(int32_t)

#undef ANNEX_INSTANTIATE_INDEX_IO

} // namespace Annex
