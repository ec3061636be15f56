#pragma once
#include <cstddef>
#include <parley/clustering/embedding_view.hpp>
#include <parley/clustering/metric.hpp>
#include <parley/common/matrix.hpp>
#include <utility>
#include <vector>

namespace parley::clustering {

  // Assigns embeddings to the nearest of a fixed set of centroids, e.g. the centroids of a
  // finished partition. Safe to call assign() concurrently once centroids are loaded.
  template <typename Scalar> class ClusterEngine {
  public:
    ClusterEngine() = default;
    ~ClusterEngine() = default;

    ClusterEngine(ClusterEngine&&) noexcept = default;
    ClusterEngine& operator=(ClusterEngine&&) noexcept = default;
    ClusterEngine(const ClusterEngine&) = delete;
    ClusterEngine& operator=(const ClusterEngine&) = delete;

    // Load cluster centroids (n_clusters x dim matrix in row-major order)
    void load_centroids(const Scalar* data, size_t n_clusters, size_t dim);

    void load_centroids(const Matrix<Scalar>& centers) {
      load_centroids(centers.data(), centers.rows(), centers.cols());
    }

    // Returns (cluster_id, distance); (-1, 0) when no centroids are loaded.
    [[nodiscard]] std::pair<int, Scalar> assign(EmbeddingView<Scalar> view) const;

    [[nodiscard]] std::pair<int, Scalar> assign(const Scalar* embedding, size_t dim) const {
      return assign(EmbeddingView<Scalar>{embedding, dim});
    }

    [[nodiscard]] std::vector<std::pair<int, Scalar>> assign_batch(
        EmbeddingBatchView<Scalar> view) const;

    [[nodiscard]] size_t n_clusters() const noexcept { return n_clusters_; }
    [[nodiscard]] size_t dim() const noexcept { return dim_; }

  private:
    std::vector<Scalar> centroids_;
    SquaredL2<Scalar> metric_;
    size_t n_clusters_ = 0;
    size_t dim_ = 0;
  };

  extern template class ClusterEngine<float>;
  extern template class ClusterEngine<double>;

}  // namespace parley::clustering
