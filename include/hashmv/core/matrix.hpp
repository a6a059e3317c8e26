#pragma once

#include "errors.hpp"
#include "memory.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <initializer_list>
#include <string>
#include <vector>

namespace hashmv {

// ============================================================================
// Matrix: Row-major dense storage
// ============================================================================

/**
 * Matrix: Dense row-major float matrix with 64-byte aligned storage.
 *
 * Used for weights W (out_dim x in_dim), projections P (k x in_dim),
 * input batches x (batch x in_dim), outputs and gradients. A vector is a
 * 1 x n matrix. Copying a Matrix copies its storage.
 */
class Matrix {
public:
    Matrix() = default;

    Matrix(size_t rows, size_t cols, Float fill = 0.0f)
        : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

    /// Build from nested initializer lists; all rows must have equal length
    static Matrix from_rows(std::initializer_list<std::initializer_list<Float>> rows) {
        size_t cols = rows.size() == 0 ? 0 : rows.begin()->size();
        Matrix m(rows.size(), cols);
        size_t r = 0;
        for (const auto& row : rows) {
            if (row.size() != cols) {
                throw ShapeMismatchError("Matrix::from_rows: ragged rows");
            }
            std::copy(row.begin(), row.end(), m.row(r));
            ++r;
        }
        return m;
    }

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    Float* data() { return data_.data(); }
    const Float* data() const { return data_.data(); }

    Float* row(size_t r) { return data_.data() + r * cols_; }
    const Float* row(size_t r) const { return data_.data() + r * cols_; }

    Float& operator()(size_t r, size_t c) { return data_[r * cols_ + c]; }
    Float operator()(size_t r, size_t c) const { return data_[r * cols_ + c]; }

    void fill(Float value) { std::fill(data_.begin(), data_.end(), value); }

    bool same_shape(const Matrix& other) const {
        return rows_ == other.rows_ && cols_ == other.cols_;
    }

    /// Bitwise equality of shape and contents
    bool operator==(const Matrix& other) const {
        return same_shape(other) &&
               std::memcmp(data_.data(), other.data_.data(), data_.size() * sizeof(Float)) == 0;
    }

    bool operator!=(const Matrix& other) const { return !(*this == other); }

    std::string shape_string() const { return detail::shape_str(rows_, cols_); }

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    AlignedVector<Float> data_;
};

// ============================================================================
// Vector Helpers
// ============================================================================

inline Float dot(const Float* a, const Float* b, size_t n) {
    Float sum = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

/// Squared norm accumulated in double, so float components near the
/// denormal or overflow range still give a finite, non-zero result.
inline double squared_norm_wide(const Float* v, size_t n) {
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double x = v[i];
        sum += x * x;
    }
    return sum;
}

inline Float l2_norm(const Float* v, size_t n) {
    return static_cast<Float>(std::sqrt(squared_norm_wide(v, n)));
}

}  // namespace hashmv
