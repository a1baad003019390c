/**
 * @file matrix.hpp
 * @brief Row-major point collections: non-owning Matrix view and owning Dataset
 */

#pragma once

#include <core/error.hpp>
#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

namespace Annex {

/**
 * @brief Non-owning row-major view over caller memory
 *
 * Used at API boundaries (query batches, caller datasets, output buffers).
 * The viewed memory must outlive the view.
 */
template <typename T>
class Matrix {
public:
    Matrix() = default;

    Matrix(T* data, size_t rows, size_t cols)
        : data_(data), rows_(rows), cols_(cols) {}

    // Allow Matrix<T> -> Matrix<const T>
    template <typename U, typename = std::enable_if_t<std::is_same_v<const U, T>>>
    Matrix(const Matrix<U>& other)
        : data_(other.data()), rows_(other.rows()), cols_(other.cols()) {}

    T* operator[](size_t row) const { return data_ + row * cols_; }

    T* data() const { return data_; }
    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    bool empty() const { return data_ == nullptr || rows_ == 0 || cols_ == 0; }

private:
    T* data_ = nullptr;
    size_t rows_ = 0;
    size_t cols_ = 0;
};

/**
 * @brief Owning, growable row-major storage
 *
 * Indexes copy caller data into a Dataset at build/load time. The column
 * count is fixed at construction; rows only grow through append().
 */
template <typename T>
class Dataset {
public:
    Dataset() = default;

    explicit Dataset(size_t cols) : cols_(cols) {}

    Dataset(const T* data, size_t rows, size_t cols)
        : values_(data, data + rows * cols), rows_(rows), cols_(cols) {}

    explicit Dataset(const Matrix<const T>& view)
        : Dataset(view.data(), view.rows(), view.cols()) {}

    const T* operator[](size_t row) const { return values_.data() + row * cols_; }
    T* operator[](size_t row) { return values_.data() + row * cols_; }

    const T* data() const { return values_.data(); }
    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    bool empty() const { return rows_ == 0; }

    size_t byte_size() const { return values_.size() * sizeof(T); }

    Matrix<const T> view() const { return Matrix<const T>(values_.data(), rows_, cols_); }

    /**
     * @brief Append rows; the column count must match
     */
    void append(const Matrix<const T>& rows) {
        if (rows.rows() == 0) return;
        if (rows.cols() != cols_) {
            throw DimensionError("Cannot append rows of dimension " + std::to_string(rows.cols()) +
                                 " to a dataset of dimension " + std::to_string(cols_));
        }
        values_.insert(values_.end(), rows.data(), rows.data() + rows.rows() * rows.cols());
        rows_ += rows.rows();
    }

    /**
     * @brief Copy a subset of rows into a new dataset
     */
    Dataset select(const std::vector<size_t>& row_ids) const {
        Dataset out(cols_);
        out.values_.reserve(row_ids.size() * cols_);
        for (size_t id : row_ids) {
            const T* row = (*this)[id];
            out.values_.insert(out.values_.end(), row, row + cols_);
        }
        out.rows_ = row_ids.size();
        return out;
    }

private:
    std::vector<T> values_;
    size_t rows_ = 0;
    size_t cols_ = 0;
};

} // namespace Annex
