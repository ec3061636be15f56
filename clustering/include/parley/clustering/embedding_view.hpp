#pragma once
#include <cstddef>
#include <parley/common/matrix.hpp>

namespace parley::clustering {

  // Non-owning view of a single embedding.
  template <typename Scalar> struct EmbeddingView {
    const Scalar* data = nullptr;
    size_t dim = 0;
  };

  // Non-owning view of `count` embeddings stored row-major, `dim` values each.
  template <typename Scalar> struct EmbeddingBatchView {
    const Scalar* data = nullptr;
    size_t count = 0;
    size_t dim = 0;

    [[nodiscard]] const Scalar* row(size_t i) const noexcept { return data + i * dim; }
    [[nodiscard]] EmbeddingView<Scalar> at(size_t i) const noexcept { return {row(i), dim}; }
    [[nodiscard]] bool empty() const noexcept { return count == 0; }
  };

  template <typename Scalar>
  [[nodiscard]] EmbeddingBatchView<Scalar> make_view(const Matrix<Scalar>& m) noexcept {
    return {m.data(), m.rows(), m.cols()};
  }

}  // namespace parley::clustering
