#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <parley/clustering/metric.hpp>
#include <parley/clustering/partition.hpp>
#include <parley/common/logging.hpp>
#include <parley/common/tracy.hpp>
#include <stdexcept>
#include <utility>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace parley::clustering {

  namespace {

    // Below this many distance evaluations per pass the thread fork costs more than it saves.
    constexpr std::size_t PARALLEL_ASSIGN_THRESHOLD = 1 << 14;

    template <typename Scalar>
    void copy_row(EmbeddingBatchView<Scalar> vectors, size_t from, Matrix<Scalar>& dst,
                  size_t to) {
      std::copy_n(vectors.row(from), vectors.dim, dst.row(to));
    }

    // Nearest centroid per vector. The strict comparison keeps the lowest index on ties, and
    // each label depends only on its own vector, so the parallel loop matches the serial one.
    template <typename Scalar>
    void assign_labels(EmbeddingBatchView<Scalar> vectors, const Matrix<Scalar>& centroids,
                       const SquaredL2<Scalar>& metric, std::vector<int>& labels) {
      PARLEY_ZONE;
      const auto n = static_cast<std::ptrdiff_t>(vectors.count);
      const auto k = static_cast<int>(centroids.rows());
      [[maybe_unused]] const bool parallel
          = vectors.count * centroids.rows() >= PARALLEL_ASSIGN_THRESHOLD;

#ifdef _OPENMP
#  pragma omp parallel for schedule(static) if (parallel)
#endif
      for (std::ptrdiff_t i = 0; i < n; ++i) {
        const Scalar* point = vectors.row(static_cast<size_t>(i));
        int best_idx = 0;
        Scalar best_dist_sq = std::numeric_limits<Scalar>::max();

        for (int c = 0; c < k; ++c) {
          Scalar dist_sq = metric(point, centroids.row(static_cast<size_t>(c)));
          if (dist_sq < best_dist_sq) {
            best_dist_sq = dist_sq;
            best_idx = c;
          }
        }

        labels[static_cast<size_t>(i)] = best_idx;
      }
    }

    // Writes member means into `centroids` and member counts into `sizes`. Rows of clusters
    // without members are left untouched; their indices are returned in ascending order.
    template <typename Scalar>
    std::vector<size_t> update_centroids(EmbeddingBatchView<Scalar> vectors,
                                         const std::vector<int>& labels,
                                         Matrix<Scalar>& centroids, std::vector<int>& sizes) {
      PARLEY_ZONE;
      const size_t k = centroids.rows();
      const size_t dim = vectors.dim;

      std::vector<double> sums(k * dim, 0.0);
      std::fill(sizes.begin(), sizes.end(), 0);

      for (size_t i = 0; i < vectors.count; ++i) {
        const auto label = static_cast<size_t>(labels[i]);
        ++sizes[label];

        const Scalar* point = vectors.row(i);
        double* sum = sums.data() + label * dim;
        for (size_t d = 0; d < dim; ++d) {
          sum[d] += static_cast<double>(point[d]);
        }
      }

      std::vector<size_t> empty;
      for (size_t c = 0; c < k; ++c) {
        if (sizes[c] == 0) {
          empty.push_back(c);
          continue;
        }

        const double* sum = sums.data() + c * dim;
        const double inv_count = 1.0 / static_cast<double>(sizes[c]);
        Scalar* centroid = centroids.row(c);
        for (size_t d = 0; d < dim; ++d) {
          centroid[d] = static_cast<Scalar>(sum[d] * inv_count);
        }
      }

      return empty;
    }

    template <typename Scalar>
    bool all_close(const Matrix<Scalar>& current, const Matrix<Scalar>& previous,
                   const Tolerance& tolerance) {
      const Scalar* a = current.data();
      const Scalar* b = previous.data();
      for (size_t i = 0; i < current.size(); ++i) {
        const auto x = static_cast<double>(a[i]);
        const auto y = static_cast<double>(b[i]);
        if (!(std::abs(x - y) <= tolerance.atol + tolerance.rtol * std::abs(y))) {
          return false;
        }
      }
      return true;
    }

    template <typename Scalar>
    double compute_inertia(EmbeddingBatchView<Scalar> vectors, const std::vector<int>& labels,
                           const Matrix<Scalar>& centroids) {
      double total = 0.0;
      for (size_t i = 0; i < vectors.count; ++i) {
        const Scalar* point = vectors.row(i);
        const Scalar* centroid = centroids.row(static_cast<size_t>(labels[i]));
        for (size_t d = 0; d < vectors.dim; ++d) {
          double diff = static_cast<double>(point[d]) - static_cast<double>(centroid[d]);
          total += diff * diff;
        }
      }
      return total;
    }

  }  // namespace

  template <typename Scalar>
  PartitionResult<Scalar> partition(EmbeddingBatchView<Scalar> vectors, int k,
                                    int max_iterations, IRandomSource& random,
                                    const Tolerance& tolerance) {
    PARLEY_ZONE;
    if (k <= 0) [[unlikely]] {
      throw std::invalid_argument(fmt::format("k must be positive, got {}", k));
    }

    PartitionResult<Scalar> result;
    const size_t n = vectors.count;
    const size_t dim = vectors.dim;

    if (n == 0) {
      result.centroids.resize(0, dim);
      return result;
    }

    auto log = logger();
    const size_t n_clusters = std::min(static_cast<size_t>(k), n);
    if (n_clusters < static_cast<size_t>(k)) {
      log->debug("requested {} clusters for {} vectors; using {}", k, n, n_clusters);
    }

    const int pass_limit = std::max(max_iterations, 1);
    const SquaredL2<Scalar> metric(dim);

    Matrix<Scalar> centroids(n_clusters, dim);
    const auto seeds = random.sample_without_replacement(n, n_clusters);
    for (size_t c = 0; c < n_clusters; ++c) {
      copy_row(vectors, seeds[c], centroids, c);
    }

    Matrix<Scalar> updated(n_clusters, dim);
    std::vector<int> labels(n, 0);
    std::vector<int> sizes(n_clusters, 0);

    for (int iter = 1; iter <= pass_limit; ++iter) {
      assign_labels(vectors, centroids, metric, labels);

      for (size_t c : update_centroids(vectors, labels, updated, sizes)) {
        const size_t pick = random.uniform_index(n);
        copy_row(vectors, pick, updated, c);
        log->debug("cluster {} empty at iteration {}, reseeded from vector {}", c, iter, pick);
      }

      const bool stable = all_close(updated, centroids, tolerance);
      std::swap(centroids, updated);
      result.n_iter = iter;

      if (stable) {
        result.converged = true;
        break;
      }
    }

    if (result.converged) {
      log->debug("k-means converged after {} iterations (n={}, k={}, dim={})", result.n_iter, n,
                 n_clusters, dim);
    } else {
      log->debug("k-means stopped at the {} iteration cap without converging", pass_limit);
    }

    result.inertia = compute_inertia(vectors, labels, centroids);
    result.labels = std::move(labels);
    result.cluster_sizes = std::move(sizes);
    result.centroids = std::move(centroids);
    return result;
  }

  template <typename Scalar>
  PartitionResult<Scalar> partition(EmbeddingBatchView<Scalar> vectors, int k,
                                    const PartitionOptions& options) {
    SeededRandomSource random(options.seed);
    return partition(vectors, k, options.max_iterations, random, options.tolerance);
  }

  template PartitionResult<float> partition<float>(EmbeddingBatchView<float>, int, int,
                                                   IRandomSource&, const Tolerance&);
  template PartitionResult<double> partition<double>(EmbeddingBatchView<double>, int, int,
                                                     IRandomSource&, const Tolerance&);
  template PartitionResult<float> partition<float>(EmbeddingBatchView<float>, int,
                                                   const PartitionOptions&);
  template PartitionResult<double> partition<double>(EmbeddingBatchView<double>, int,
                                                     const PartitionOptions&);

}  // namespace parley::clustering
