#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <parley/checkpoint/checkpoint.hpp>
#include <parley/clustering/cluster.hpp>
#include <parley/clustering/partition.hpp>

namespace nb = nanobind;
using namespace nb::literals;
using namespace parley;
using namespace parley::clustering;

namespace {

  template <typename Scalar>
  void bind_result(nb::module_& m, const char* name, const char* doc) {
    nb::class_<PartitionResult<Scalar>>(m, name, doc)
        .def_ro("labels", &PartitionResult<Scalar>::labels,
            "Cluster index of each input vector")
        .def_prop_ro("centroids", [](const PartitionResult<Scalar>& r) {
            return r.centroids.to_rows();
        }, "Centroids as a list of rows, shape (n_clusters, dim)")
        .def_ro("cluster_sizes", &PartitionResult<Scalar>::cluster_sizes,
            "Number of vectors assigned to each cluster")
        .def_ro("inertia", &PartitionResult<Scalar>::inertia,
            "Sum of squared distances to the assigned centroids")
        .def_ro("n_iter", &PartitionResult<Scalar>::n_iter,
            "Completed assign/update passes")
        .def_ro("converged", &PartitionResult<Scalar>::converged,
            "True if the centroids stopped moving before the iteration cap")
        .def_prop_ro("n_clusters", &PartitionResult<Scalar>::n_clusters,
            "Effective cluster count, min(k, n_samples)")
        .def("__repr__", [](const PartitionResult<Scalar>& r) {
            return "<PartitionResult n_clusters=" + std::to_string(r.n_clusters()) +
                   " n_iter=" + std::to_string(r.n_iter) +
                   " converged=" + (r.converged ? "True" : "False") + ">";
        });
  }

  template <typename Scalar>
  void bind_engine(nb::module_& m, const char* name, const char* doc) {
    nb::class_<ClusterEngine<Scalar>>(m, name, doc)
        .def_static("from_checkpoint",
            [](const ClusteringCheckpoint& checkpoint) {
                auto result = load_engine<Scalar>(checkpoint);
                if (!result) {
                    throw nb::value_error(result.error().c_str());
                }
                return std::move(result.value());
            },
            "checkpoint"_a,
            "Build an engine over the checkpoint's cluster centers\n\n"
            "Raises:\n"
            "    ValueError: If the checkpoint dtype doesn't match this engine")
        .def("assign",
            [](const ClusterEngine<Scalar>& self,
               nb::ndarray<const Scalar, nb::ndim<1>, nb::c_contig> embedding) {
                return self.assign(embedding.data(), embedding.shape(0));
            },
            "embedding"_a,
            "Nearest cluster for one embedding\n\n"
            "Returns:\n"
            "    (cluster_id, distance)")
        .def("assign_batch",
            [](const ClusterEngine<Scalar>& self,
               nb::ndarray<const Scalar, nb::ndim<2>, nb::c_contig> embeddings) {
                EmbeddingBatchView<Scalar> view{embeddings.data(), embeddings.shape(0),
                                                embeddings.shape(1)};
                return self.assign_batch(view);
            },
            "embeddings"_a,
            "Nearest cluster for each row of a 2D array")
        .def_prop_ro("n_clusters", &ClusterEngine<Scalar>::n_clusters,
            "Number of loaded centroids")
        .def_prop_ro("dim", &ClusterEngine<Scalar>::dim,
            "Expected embedding dimensionality");
  }

  template <typename Scalar>
  PartitionResult<Scalar> partition_array(
      nb::ndarray<const Scalar, nb::ndim<2>, nb::c_contig> vectors, int k, int max_iterations,
      std::uint64_t seed) {
    EmbeddingBatchView<Scalar> view{vectors.data(), vectors.shape(0), vectors.shape(1)};
    nb::gil_scoped_release release;
    return partition(view, k, {.max_iterations = max_iterations, .seed = seed});
  }

}  // namespace

NB_MODULE(parley_ext, m) {
  m.doc() = "parley - deterministic k-means partitioning of embedding vectors";

  bind_result<float>(m, "PartitionResult32", "Partition of float32 vectors");
  bind_result<double>(m, "PartitionResult64", "Partition of float64 vectors");

  m.def("partition", &partition_array<float>,
      "vectors"_a, "k"_a, "max_iterations"_a = DEFAULT_MAX_ITERATIONS, "seed"_a = DEFAULT_SEED,
      "Partition vectors with k-means\n\n"
      "Args:\n"
      "    vectors: 2D numpy array of float32, shape (n_samples, dim)\n"
      "    k: Requested cluster count; reduced to n_samples when larger\n"
      "    max_iterations: Upper bound on refinement passes\n"
      "    seed: Seed for initialization and empty-cluster reseeding\n\n"
      "Returns:\n"
      "    PartitionResult32\n\n"
      "Raises:\n"
      "    ValueError: If k is not positive");
  m.def("partition", &partition_array<double>,
      "vectors"_a, "k"_a, "max_iterations"_a = DEFAULT_MAX_ITERATIONS, "seed"_a = DEFAULT_SEED,
      "Partition float64 vectors with k-means (see the float32 overload)");

  // Configuration
  nb::class_<ClusteringConfig>(m, "ClusteringConfig", "Partitioning hyperparameters")
      .def(nb::init<>())
      .def_rw("n_clusters", &ClusteringConfig::n_clusters)
      .def_rw("random_state", &ClusteringConfig::random_state)
      .def_rw("max_iter", &ClusteringConfig::max_iter)
      .def_rw("algorithm", &ClusteringConfig::algorithm)
      .def_rw("rtol", &ClusteringConfig::rtol)
      .def_rw("atol", &ClusteringConfig::atol)
      .def_static("from_json_file", &ClusteringConfig::from_json_file, "path"_a,
          "Load a standalone clustering config from a JSON file");

  nb::class_<EmbeddingConfig>(m, "EmbeddingConfig", "Embedding model description")
      .def(nb::init<>())
      .def_rw("model", &EmbeddingConfig::model)
      .def_rw("dtype", &EmbeddingConfig::dtype);

  // Checkpoint
  nb::class_<ClusteringCheckpoint>(m, "ClusteringCheckpoint",
      "Serialized partition: cluster centers, labels, configuration and fit metrics")
      .def_static("from_json_file", &ClusteringCheckpoint::from_json,
          "path"_a,
          "Load checkpoint from JSON file")
      .def_static("from_json_string", &ClusteringCheckpoint::from_json_string,
          "json_str"_a,
          "Load checkpoint from JSON string")
      .def_static("from_msgpack_file", &ClusteringCheckpoint::from_msgpack,
          "path"_a,
          "Load checkpoint from MessagePack file")
      .def_static("from_msgpack_bytes", [](nb::bytes data) {
          return ClusteringCheckpoint::from_msgpack_string(std::string(data.c_str(), data.size()));
      }, "data"_a,
         "Load checkpoint from MessagePack bytes")
      .def_static("from_result", [](const PartitionResult<float>& result,
                                    const ClusteringConfig& config,
                                    const EmbeddingConfig& embedding) {
          return ClusteringCheckpoint::from_result(result, config, embedding);
      }, "result"_a, "config"_a, "embedding"_a = EmbeddingConfig{},
         "Snapshot a float32 partition")
      .def_static("from_result", [](const PartitionResult<double>& result,
                                    const ClusteringConfig& config,
                                    const EmbeddingConfig& embedding) {
          return ClusteringCheckpoint::from_result(result, config, embedding);
      }, "result"_a, "config"_a, "embedding"_a = EmbeddingConfig{},
         "Snapshot a float64 partition")
      .def("to_json_string", &ClusteringCheckpoint::to_json_string,
          "Serialize checkpoint to JSON string")
      .def("to_json_file", &ClusteringCheckpoint::to_json,
          "path"_a,
          "Write checkpoint to JSON file")
      .def("to_msgpack_bytes", [](const ClusteringCheckpoint& c) {
          std::string data = c.to_msgpack_string();
          return nb::bytes(data.data(), data.size());
      }, "Serialize checkpoint to MessagePack bytes")
      .def("to_msgpack_file", &ClusteringCheckpoint::to_msgpack,
          "path"_a,
          "Write checkpoint to MessagePack file")
      .def("validate", &ClusteringCheckpoint::validate,
          "Validate checkpoint data integrity")
      .def_prop_ro("n_clusters", &ClusteringCheckpoint::n_clusters, "Number of clusters")
      .def_prop_ro("feature_dim", &ClusteringCheckpoint::feature_dim, "Embedding dimension")
      .def_prop_ro("dtype", [](const ClusteringCheckpoint& c) { return c.dtype(); },
          "Data type ('float32' or 'float64')")
      .def_ro("labels", &ClusteringCheckpoint::labels, "Labels of the fitted samples, if kept")
      .def_prop_ro("is_float32", &ClusteringCheckpoint::is_float32,
          "True if checkpoint uses float32 precision")
      .def_prop_ro("is_float64", &ClusteringCheckpoint::is_float64,
          "True if checkpoint uses float64 precision");

  bind_engine<float>(m, "ClusterEngine32", "Nearest-centroid assignment with float32 precision");
  bind_engine<double>(m, "ClusterEngine64", "Nearest-centroid assignment with float64 precision");

  m.attr("__version__") = PARLEY_VERSION;
}
