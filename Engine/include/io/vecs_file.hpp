/**
 * @file vecs_file.hpp
 * @brief Reader/writer for the .fvecs / .bvecs / .ivecs benchmark formats
 *
 * Each record is a little-endian int32 dimension followed by that many
 * components (float32, uint8 or int32). All records in a file share one
 * dimension.
 */

#pragma once

#include <core/matrix.hpp>
#include <export.hpp>
#include <cstddef>
#include <string>

namespace Annex {

/**
 * @brief Read-only memory mapping of a whole file
 */
class ANNEX_API MappedFile {
public:
    explicit MappedFile(const std::string& path);
    ~MappedFile();

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    const unsigned char* data() const { return data_; }
    size_t size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
    const unsigned char* data_ = nullptr;
    size_t size_ = 0;
};

/**
 * @brief Load up to `max_rows` records (0 = all)
 *
 * Supported element types: float (.fvecs), uint8_t (.bvecs), int32_t (.ivecs).
 *
 * @throws IoError on a missing, truncated or inconsistent file
 */
template <typename T>
Dataset<T> read_vecs(const std::string& path, size_t max_rows = 0);

template <typename T>
void write_vecs(const std::string& path, const Matrix<const T>& data);

} // namespace Annex
