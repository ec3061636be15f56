#pragma once
#include <cstdint>
#include <parley/clustering/embedding_view.hpp>
#include <parley/common/matrix.hpp>
#include <parley/common/random.hpp>
#include <vector>

namespace parley::clustering {

  inline constexpr int DEFAULT_MAX_ITERATIONS = 100;
  inline constexpr std::uint64_t DEFAULT_SEED = 42;

  // Centroids are considered unchanged when every coordinate satisfies
  // |new - old| <= atol + rtol * |old|.
  struct Tolerance {
    double rtol = 1e-5;
    double atol = 1e-8;
  };

  struct PartitionOptions {
    int max_iterations = DEFAULT_MAX_ITERATIONS;
    std::uint64_t seed = DEFAULT_SEED;
    Tolerance tolerance;
  };

  template <typename Scalar> struct PartitionResult {
    std::vector<int> labels;          // One cluster index per input vector
    Matrix<Scalar> centroids;         // effective_k x dim
    std::vector<int> cluster_sizes;   // Vectors carrying each label
    double inertia = 0.0;             // Sum of squared distances to the returned centroids
    int n_iter = 0;                   // Completed assign/update passes
    bool converged = false;

    [[nodiscard]] size_t n_clusters() const noexcept { return centroids.rows(); }
  };

  /**
   * Lloyd's k-means over `vectors`.
   *
   * Initial centroids are `min(k, n)` distinct input vectors drawn from `random`. Each pass
   * assigns every vector to its nearest centroid (lowest index on ties), recomputes each
   * centroid as the mean of its members, and reseeds a cluster that lost all members to a
   * vector drawn uniformly from the whole input. Iteration stops once the centroids stop
   * moving (see Tolerance) or after `max_iterations` passes; neither case is an error.
   *
   * Empty input yields empty labels and a 0 x dim centroid matrix. A `k` larger than the
   * number of vectors is reduced to it.
   *
   * @throws std::invalid_argument if k <= 0
   */
  template <typename Scalar>
  [[nodiscard]] PartitionResult<Scalar> partition(EmbeddingBatchView<Scalar> vectors, int k,
                                                  int max_iterations, IRandomSource& random,
                                                  const Tolerance& tolerance = {});

  template <typename Scalar>
  [[nodiscard]] PartitionResult<Scalar> partition(EmbeddingBatchView<Scalar> vectors, int k,
                                                  const PartitionOptions& options = {});

  template <typename Scalar>
  [[nodiscard]] PartitionResult<Scalar> partition(const Matrix<Scalar>& vectors, int k,
                                                  const PartitionOptions& options = {}) {
    return partition(make_view(vectors), k, options);
  }

  extern template PartitionResult<float> partition<float>(EmbeddingBatchView<float>, int, int,
                                                          IRandomSource&, const Tolerance&);
  extern template PartitionResult<double> partition<double>(EmbeddingBatchView<double>, int, int,
                                                            IRandomSource&, const Tolerance&);
  extern template PartitionResult<float> partition<float>(EmbeddingBatchView<float>, int,
                                                          const PartitionOptions&);
  extern template PartitionResult<double> partition<double>(EmbeddingBatchView<double>, int,
                                                            const PartitionOptions&);

}  // namespace parley::clustering
