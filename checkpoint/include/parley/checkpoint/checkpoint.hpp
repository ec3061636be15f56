#pragma once
#include <algorithm>
#include <cstdint>
#include <expected>
#include <optional>
#include <parley/clustering/cluster.hpp>
#include <parley/clustering/partition.hpp>
#include <parley/common/matrix.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace parley {

  // Version for format evolution
  inline constexpr const char* CHECKPOINT_VERSION = "1.0";

  // Fit statistics (all fields optional for partial state)
  struct TrainingMetrics {
    std::optional<int> n_samples;
    std::optional<std::vector<int>> cluster_sizes;
    std::optional<double> inertia;
    std::optional<int> n_iter;
    std::optional<bool> converged;
  };

  // Embedding configuration
  struct EmbeddingConfig {
    std::string model;                // e.g., "text-embedding-3-small"
    std::string dtype = "float32";    // "float32" or "float64" (single source of truth)
  };

  // Partitioning hyperparameters (full config for reproducibility)
  struct ClusteringConfig {
    int n_clusters = 0;
    std::uint64_t random_state = clustering::DEFAULT_SEED;
    int max_iter = clustering::DEFAULT_MAX_ITERATIONS;
    std::string algorithm = "lloyd";
    double rtol = 1e-5;
    double atol = 1e-8;

    [[nodiscard]] clustering::PartitionOptions to_options() const {
      return {.max_iterations = max_iter,
              .seed = random_state,
              .tolerance = {.rtol = rtol, .atol = atol}};
    }

    // Standalone config documents hold the fields of the "clustering" object.
    [[nodiscard]] static ClusteringConfig from_json_file(const std::string& path);
    [[nodiscard]] static ClusteringConfig from_json_string(const std::string& json_str);
  };

  // Cluster centers (one variant per supported precision)
  using ClusterCenters = std::variant<Matrix<float>, Matrix<double>>;

  struct ClusteringCheckpoint {
    std::string version = CHECKPOINT_VERSION;

    ClusterCenters cluster_centers;           // Shape: (n_clusters, feature_dim)
    std::optional<std::vector<int>> labels;   // One per fitted sample, when kept

    EmbeddingConfig embedding;
    ClusteringConfig clustering;
    TrainingMetrics metrics;

    [[nodiscard]] static ClusteringCheckpoint from_json(const std::string& path);
    [[nodiscard]] static ClusteringCheckpoint from_json_string(const std::string& json_str);
    [[nodiscard]] static ClusteringCheckpoint from_msgpack(const std::string& path);
    [[nodiscard]] static ClusteringCheckpoint from_msgpack_string(const std::string& data);

    void to_json(const std::string& path) const;
    [[nodiscard]] std::string to_json_string() const;
    void to_msgpack(const std::string& path) const;
    [[nodiscard]] std::string to_msgpack_string() const;

    void validate() const;

    // Snapshot of a finished partition. n_clusters is taken from the result, which may be
    // smaller than the k that was requested, and max_iter is stored as the pass limit the
    // partition actually ran with (at least 1).
    // Throws std::invalid_argument for a partition of empty input, which has no centers.
    template <typename Scalar>
    [[nodiscard]] static ClusteringCheckpoint from_result(
        const clustering::PartitionResult<Scalar>& result, ClusteringConfig config,
        EmbeddingConfig embedding = {}) {
      if (result.n_clusters() == 0) [[unlikely]] {
        throw std::invalid_argument("cannot checkpoint a partition without clusters");
      }

      ClusteringCheckpoint checkpoint;
      checkpoint.cluster_centers = result.centroids;
      checkpoint.labels = result.labels;

      embedding.dtype = std::is_same_v<Scalar, double> ? "float64" : "float32";
      checkpoint.embedding = std::move(embedding);

      config.n_clusters = static_cast<int>(result.n_clusters());
      config.max_iter = std::max(config.max_iter, 1);
      checkpoint.clustering = std::move(config);

      checkpoint.metrics.n_samples = static_cast<int>(result.labels.size());
      checkpoint.metrics.cluster_sizes = result.cluster_sizes;
      checkpoint.metrics.inertia = result.inertia;
      checkpoint.metrics.n_iter = result.n_iter;
      checkpoint.metrics.converged = result.converged;
      return checkpoint;
    }

    [[nodiscard]] int n_clusters() const {
      return std::visit([](const auto& centers) { return static_cast<int>(centers.rows()); },
                        cluster_centers);
    }

    [[nodiscard]] int feature_dim() const {
      return std::visit([](const auto& centers) { return static_cast<int>(centers.cols()); },
                        cluster_centers);
    }

    [[nodiscard]] bool is_float32() const noexcept {
      return std::holds_alternative<Matrix<float>>(cluster_centers);
    }
    [[nodiscard]] bool is_float64() const noexcept {
      return std::holds_alternative<Matrix<double>>(cluster_centers);
    }

    [[nodiscard]] const std::string& dtype() const { return embedding.dtype; }
    [[nodiscard]] std::uint64_t random_state() const { return clustering.random_state; }
  };

  // Nearest-centroid engine over a checkpoint's centers. Fails when the checkpoint precision
  // differs from Scalar or holds no centers.
  template <typename Scalar>
  [[nodiscard]] std::expected<clustering::ClusterEngine<Scalar>, std::string> load_engine(
      const ClusteringCheckpoint& checkpoint) {
    const auto* centers = std::get_if<Matrix<Scalar>>(&checkpoint.cluster_centers);
    if (centers == nullptr) {
      return std::unexpected("checkpoint dtype '" + checkpoint.dtype() + "' does not match "
                             + (std::is_same_v<Scalar, double> ? "float64" : "float32"));
    }

    clustering::ClusterEngine<Scalar> engine;
    try {
      engine.load_centroids(*centers);
    } catch (const std::invalid_argument& e) {
      return std::unexpected(std::string(e.what()));
    }
    return engine;
  }

}  // namespace parley
