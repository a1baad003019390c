/**
 * @file vecs_file.cpp
 * @brief mmap-backed vecs reader and stream writer
 */

#include <io/vecs_file.hpp>
#include <io/serialization.hpp>
#include <utils/logger.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/mman.h>
#include <sys/stat.h>
#include <type_traits>
#include <unistd.h>
#include <vector>

namespace Annex {

// =============================================================================
//  MappedFile
// =============================================================================

MappedFile::MappedFile(const std::string& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ == -1) {
        throw IoError("Cannot open " + path + ": " + std::strerror(errno));
    }

    struct stat sb;
    if (::fstat(fd_, &sb) == -1) {
        const int err = errno;
        ::close(fd_);
        throw IoError("Cannot stat " + path + ": " + std::strerror(err));
    }
    size_ = static_cast<size_t>(sb.st_size);

    // mmap rejects zero-length mappings; an empty file maps to nothing
    if (size_ == 0) return;

    void* mapped = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (mapped == MAP_FAILED) {
        const int err = errno;
        ::close(fd_);
        throw IoError("Cannot map " + path + ": " + std::strerror(err));
    }
    data_ = static_cast<const unsigned char*>(mapped);
}

MappedFile::~MappedFile() {
    if (data_) ::munmap(const_cast<unsigned char*>(data_), size_);
    if (fd_ != -1) ::close(fd_);
}

// =============================================================================
//  Records
// =============================================================================

namespace {

template <typename T>
constexpr bool vecs_supported() {
    return std::is_same_v<T, float> || std::is_same_v<T, uint8_t> || std::is_same_v<T, int32_t>;
}

int32_t read_dimension(const unsigned char* at) {
    int32_t dim;
    std::memcpy(&dim, at, sizeof(dim));
    return detail::from_little_endian(dim);
}

} // namespace

template <typename T>
Dataset<T> read_vecs(const std::string& path, size_t max_rows) {
    static_assert(vecs_supported<T>(), "vecs files hold float, uint8 or int32 components");

    MappedFile file(path);
    if (file.size() < sizeof(int32_t)) throw IoError("Empty or truncated vecs file: " + path);

    const int32_t dim = read_dimension(file.data());
    if (dim <= 0) throw IoError("Invalid dimension " + std::to_string(dim) + " in " + path);

    const size_t record = sizeof(int32_t) + static_cast<size_t>(dim) * sizeof(T);
    if (file.size() % record != 0) {
        throw IoError("Size of " + path + " is not a multiple of its record size " + std::to_string(record));
    }

    size_t rows = file.size() / record;
    if (max_rows > 0 && max_rows < rows) rows = max_rows;

    Dataset<T> out(static_cast<size_t>(dim));
    std::vector<T> row(static_cast<size_t>(dim));
    for (size_t i = 0; i < rows; ++i) {
        const unsigned char* at = file.data() + i * record;
        if (read_dimension(at) != dim) {
            throw IoError("Record " + std::to_string(i) + " of " + path + " has dimension " +
                          std::to_string(read_dimension(at)) + ", expected " + std::to_string(dim));
        }
        std::memcpy(row.data(), at + sizeof(int32_t), row.size() * sizeof(T));
        for (auto& v : row) v = detail::from_little_endian(v);
        out.append(Matrix<const T>(row.data(), 1, row.size()));
    }

    Logger::info("Read " + std::to_string(rows) + " x " + std::to_string(dim) + " vectors from " + path);
    return out;
}

template <typename T>
void write_vecs(const std::string& path, const Matrix<const T>& data) {
    static_assert(vecs_supported<T>(), "vecs files hold float, uint8 or int32 components");

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw IoError("Cannot open " + path + " for writing");

    BinaryWriter writer(out);
    const auto dim = static_cast<int32_t>(data.cols());
    for (size_t i = 0; i < data.rows(); ++i) {
        writer.write(dim);
        for (size_t j = 0; j < data.cols(); ++j) writer.write(data[i][j]);
    }
    out.flush();
    if (!out) throw IoError("Failed to write " + path);
}

template Dataset<float> read_vecs<float>(const std::string&, size_t);
template Dataset<uint8_t> read_vecs<uint8_t>(const std::string&, size_t);
template Dataset<int32_t> read_vecs<int32_t>(const std::string&, size_t);

template void write_vecs<float>(const std::string&, const Matrix<const float>&);
template void write_vecs<uint8_t>(const std::string&, const Matrix<const uint8_t>&);
template void write_vecs<int32_t>(const std::string&, const Matrix<const int32_t>&);

} // namespace Annex
