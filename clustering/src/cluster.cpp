#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <parley/clustering/cluster.hpp>
#include <parley/common/tracy.hpp>
#include <stdexcept>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace parley::clustering {

  template <typename Scalar>
  void ClusterEngine<Scalar>::load_centroids(const Scalar* data, size_t n_clusters, size_t dim) {
    PARLEY_ZONE;
    if (n_clusters == 0 || dim == 0) [[unlikely]] {
      throw std::invalid_argument("n_clusters and dim must be positive");
    }
    if (data == nullptr) [[unlikely]] {
      throw std::invalid_argument("centroid data must not be null");
    }
    if (n_clusters > SIZE_MAX / dim) [[unlikely]] {
      throw std::invalid_argument("n_clusters * dim would overflow");
    }

    size_t total_size = n_clusters * dim;
    if (total_size > SIZE_MAX / sizeof(Scalar)) [[unlikely]] {
      throw std::invalid_argument("allocation size would overflow");
    }

    n_clusters_ = n_clusters;
    dim_ = dim;
    metric_ = SquaredL2<Scalar>(dim);

    centroids_.resize(total_size);
    std::memcpy(centroids_.data(), data, total_size * sizeof(Scalar));
  }

  template <typename Scalar>
  std::pair<int, Scalar> ClusterEngine<Scalar>::assign(EmbeddingView<Scalar> view) const {
    if (n_clusters_ == 0) return {-1, Scalar(0)};
    if (view.dim != dim_) [[unlikely]] {
      throw std::invalid_argument(
          fmt::format("dimension mismatch in assign: expected {}, got {}", dim_, view.dim));
    }

    int best_idx = -1;
    Scalar best_dist_sq = std::numeric_limits<Scalar>::max();

    for (size_t i = 0; i < n_clusters_; ++i) {
      Scalar dist_sq = metric_(view.data, centroids_.data() + i * dim_);
      if (dist_sq < best_dist_sq) {
        best_dist_sq = dist_sq;
        best_idx = static_cast<int>(i);
      }
    }

    return {best_idx, std::sqrt(best_dist_sq)};
  }

  template <typename Scalar>
  std::vector<std::pair<int, Scalar>> ClusterEngine<Scalar>::assign_batch(
      EmbeddingBatchView<Scalar> view) const {
    PARLEY_ZONE;
    if (n_clusters_ > 0 && view.dim != dim_) [[unlikely]] {
      throw std::invalid_argument(
          fmt::format("dimension mismatch in assign_batch: expected {}, got {}", dim_, view.dim));
    }

    std::vector<std::pair<int, Scalar>> results(view.count);

#ifdef _OPENMP
#  pragma omp parallel for schedule(static)
#endif
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(view.count); ++i) {
      auto idx = static_cast<size_t>(i);
      results[idx] = assign(view.at(idx));
    }

    return results;
  }

  template class ClusterEngine<float>;
  template class ClusterEngine<double>;

}  // namespace parley::clustering
