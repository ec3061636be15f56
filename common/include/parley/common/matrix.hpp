#pragma once
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace parley {

  // Row-major dense matrix. Row i occupies data()[i * cols(), (i + 1) * cols()).
  template <typename T> class Matrix {
  public:
    using value_type = T;
    using Scalar = T;

    Matrix() = default;

    Matrix(size_t rows, size_t cols) : rows_(rows), cols_(cols), data_(rows * cols) {}

    Matrix(size_t rows, size_t cols, const T* src)
        : rows_(rows), cols_(cols), data_(src, src + rows * cols) {}

    // Builds a matrix from an array of equal-length rows.
    [[nodiscard]] static Matrix from_rows(const std::vector<std::vector<T>>& rows) {
      if (rows.empty()) return Matrix();

      Matrix m(rows.size(), rows.front().size());
      for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != m.cols_) [[unlikely]] {
          throw std::invalid_argument("row " + std::to_string(i) + " has "
                                      + std::to_string(rows[i].size()) + " columns, expected "
                                      + std::to_string(m.cols_));
        }
        std::copy(rows[i].begin(), rows[i].end(), m.row(i));
      }
      return m;
    }

    [[nodiscard]] size_t rows() const noexcept { return rows_; }
    [[nodiscard]] size_t cols() const noexcept { return cols_; }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    [[nodiscard]] T* data() noexcept { return data_.data(); }
    [[nodiscard]] const T* data() const noexcept { return data_.data(); }

    [[nodiscard]] T* row(size_t i) noexcept { return data_.data() + i * cols_; }
    [[nodiscard]] const T* row(size_t i) const noexcept { return data_.data() + i * cols_; }

    T& operator()(size_t row, size_t col) { return data_[row * cols_ + col]; }
    const T& operator()(size_t row, size_t col) const { return data_[row * cols_ + col]; }

    [[nodiscard]] std::vector<std::vector<T>> to_rows() const {
      std::vector<std::vector<T>> out;
      out.reserve(rows_);
      for (size_t i = 0; i < rows_; ++i) {
        out.emplace_back(row(i), row(i) + cols_);
      }
      return out;
    }

    void resize(size_t rows, size_t cols) {
      rows_ = rows;
      cols_ = cols;
      data_.resize(rows * cols);
    }

    bool operator==(const Matrix&) const = default;

  private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<T> data_;
  };

  template <typename Scalar> using EmbeddingMatrix = Matrix<Scalar>;

}  // namespace parley
