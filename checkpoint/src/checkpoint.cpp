#include <fcntl.h>
#include <fmt/format.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <map>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>
#include <numeric>
#include <parley/checkpoint/checkpoint.hpp>
#include <parley/common/tracy.hpp>
#include <sstream>
#include <stdexcept>

namespace parley {

  using json = nlohmann::json;

  // ============================================================================
  // JSON Serialization - TrainingMetrics
  // ============================================================================

  void to_json(json& j, const TrainingMetrics& m) {
    j = json::object();
    if (m.n_samples) j["n_samples"] = *m.n_samples;
    if (m.cluster_sizes) j["cluster_sizes"] = *m.cluster_sizes;
    if (m.inertia) j["inertia"] = *m.inertia;
    if (m.n_iter) j["n_iter"] = *m.n_iter;
    if (m.converged) j["converged"] = *m.converged;
  }

  void from_json(const json& j, TrainingMetrics& m) {
    if (j.contains("n_samples")) m.n_samples = j["n_samples"].get<int>();
    if (j.contains("cluster_sizes")) m.cluster_sizes = j["cluster_sizes"].get<std::vector<int>>();
    if (j.contains("inertia")) m.inertia = j["inertia"].get<double>();
    if (j.contains("n_iter")) m.n_iter = j["n_iter"].get<int>();
    if (j.contains("converged")) m.converged = j["converged"].get<bool>();
  }

  // ============================================================================
  // JSON Serialization - EmbeddingConfig
  // ============================================================================

  void to_json(json& j, const EmbeddingConfig& c) {
    j = {{"model", c.model}, {"dtype", c.dtype}};
  }

  void from_json(const json& j, EmbeddingConfig& c) {
    c.model = j.value("model", "");
    c.dtype = j.value("dtype", "float32");
  }

  // ============================================================================
  // JSON Serialization - ClusteringConfig
  // ============================================================================

  void to_json(json& j, const ClusteringConfig& c) {
    j = {{"n_clusters", c.n_clusters}, {"random_state", c.random_state},
         {"max_iter", c.max_iter},     {"algorithm", c.algorithm},
         {"rtol", c.rtol},             {"atol", c.atol}};
  }

  void from_json(const json& j, ClusteringConfig& c) {
    c.n_clusters = j.value("n_clusters", 0);
    c.random_state = j.value("random_state", clustering::DEFAULT_SEED);
    c.max_iter = j.value("max_iter", clustering::DEFAULT_MAX_ITERATIONS);
    c.algorithm = j.value("algorithm", "lloyd");
    c.rtol = j.value("rtol", 1e-5);
    c.atol = j.value("atol", 1e-8);
  }

  namespace {

    std::string read_file(const std::string& path, const char* what) {
      std::ifstream file(path);
      if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Failed to open {} file: {}", what, path));
      }

      std::stringstream buffer;
      buffer << file.rdbuf();
      return buffer.str();
    }

    template <typename Scalar> Matrix<Scalar> centers_from_json(const json& centers_json) {
      if (!centers_json.is_array() || centers_json.empty()) {
        throw std::invalid_argument("cluster_centers must be a non-empty 2D array");
      }

      size_t n_clusters = centers_json.size();
      size_t feature_dim = centers_json[0].size();

      Matrix<Scalar> centers(n_clusters, feature_dim);
      for (size_t i = 0; i < n_clusters; ++i) {
        const auto& row = centers_json[i];
        if (!row.is_array() || row.size() != feature_dim) {
          throw std::invalid_argument(fmt::format(
              "cluster_centers row {} has {} values, expected {}", i, row.size(), feature_dim));
        }
        for (size_t col = 0; col < feature_dim; ++col) {
          centers(i, col) = row[col].get<Scalar>();
        }
      }
      return centers;
    }

    template <typename T>
    T value_or(const std::map<std::string, msgpack::object>& map, const std::string& key,
               T fallback) {
      auto it = map.find(key);
      return it != map.end() ? it->second.as<T>() : fallback;
    }

  }  // namespace

  // ============================================================================
  // ClusteringConfig documents
  // ============================================================================

  ClusteringConfig ClusteringConfig::from_json_file(const std::string& path) {
    return from_json_string(read_file(path, "config"));
  }

  ClusteringConfig ClusteringConfig::from_json_string(const std::string& json_str) {
    return json::parse(json_str).get<ClusteringConfig>();
  }

  // ============================================================================
  // JSON File I/O
  // ============================================================================

  ClusteringCheckpoint ClusteringCheckpoint::from_json(const std::string& path) {
    PARLEY_ZONE;
    return from_json_string(read_file(path, "checkpoint"));
  }

  ClusteringCheckpoint ClusteringCheckpoint::from_json_string(const std::string& json_str) {
    PARLEY_ZONE;
    json j = json::parse(json_str);

    ClusteringCheckpoint checkpoint;

    checkpoint.version = j.value("version", CHECKPOINT_VERSION);

    // Configuration
    checkpoint.embedding = j.at("embedding").get<EmbeddingConfig>();
    checkpoint.clustering = j.at("clustering").get<ClusteringConfig>();

    if (j.contains("metrics")) {
      checkpoint.metrics = j.at("metrics").get<TrainingMetrics>();
    }
    if (j.contains("labels")) {
      checkpoint.labels = j.at("labels").get<std::vector<int>>();
    }

    // Cluster centers
    const auto& centers_json = j.at("cluster_centers");
    if (checkpoint.embedding.dtype == "float64") {
      checkpoint.cluster_centers = centers_from_json<double>(centers_json);
    } else {
      checkpoint.cluster_centers = centers_from_json<float>(centers_json);
    }

    return checkpoint;
  }

  std::string ClusteringCheckpoint::to_json_string() const {
    json j;

    j["version"] = version;
    j["embedding"] = embedding;
    j["clustering"] = clustering;
    j["metrics"] = metrics;
    if (labels) j["labels"] = *labels;

    // Cluster centers as 2D array
    std::visit(
        [&](const auto& centers) {
          json centers_array = json::array();
          for (size_t i = 0; i < centers.rows(); ++i) {
            json row = json::array();
            for (size_t col = 0; col < centers.cols(); ++col) {
              row.push_back(centers(i, col));
            }
            centers_array.push_back(row);
          }
          j["cluster_centers"] = centers_array;
        },
        cluster_centers);

    return j.dump(2);
  }

  void ClusteringCheckpoint::to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(
          fmt::format("Failed to open checkpoint file for writing: {}", path));
    }
    file << to_json_string();
  }

  // ============================================================================
  // MessagePack File I/O (with mmap)
  // ============================================================================

  ClusteringCheckpoint ClusteringCheckpoint::from_msgpack(const std::string& path) {
    PARLEY_ZONE;

    int fd = open(path.c_str(), O_RDONLY);
    if (fd == -1) {
      throw std::runtime_error(fmt::format("Failed to open msgpack file: {}", path));
    }

    struct stat sb;
    if (fstat(fd, &sb) == -1) {
      close(fd);
      throw std::runtime_error(fmt::format("Failed to stat msgpack file: {}", path));
    }
    auto file_size = static_cast<size_t>(sb.st_size);
    if (file_size == 0) {
      close(fd);
      throw std::invalid_argument(fmt::format("msgpack file is empty: {}", path));
    }

    void* mapped = mmap(nullptr, file_size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (mapped == MAP_FAILED) {
      close(fd);
      throw std::runtime_error(fmt::format("Failed to mmap msgpack file: {}", path));
    }

    try {
      auto result = from_msgpack_string(std::string(static_cast<const char*>(mapped), file_size));
      munmap(mapped, file_size);
      close(fd);
      return result;
    } catch (...) {
      munmap(mapped, file_size);
      close(fd);
      throw;
    }
  }

  ClusteringCheckpoint ClusteringCheckpoint::from_msgpack_string(const std::string& data) {
    PARLEY_ZONE;

    msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
    auto map = handle.get().as<std::map<std::string, msgpack::object>>();

    ClusteringCheckpoint checkpoint;

    checkpoint.version = value_or<std::string>(map, "version", CHECKPOINT_VERSION);

    // Embedding config
    auto emb = map.at("embedding").as<std::map<std::string, msgpack::object>>();
    checkpoint.embedding.model = value_or<std::string>(emb, "model", "");
    checkpoint.embedding.dtype = value_or<std::string>(emb, "dtype", "float32");

    // Clustering config
    auto clust = map.at("clustering").as<std::map<std::string, msgpack::object>>();
    checkpoint.clustering.n_clusters = value_or<int>(clust, "n_clusters", 0);
    checkpoint.clustering.random_state
        = value_or<std::uint64_t>(clust, "random_state", clustering::DEFAULT_SEED);
    checkpoint.clustering.max_iter
        = value_or<int>(clust, "max_iter", clustering::DEFAULT_MAX_ITERATIONS);
    checkpoint.clustering.algorithm = value_or<std::string>(clust, "algorithm", "lloyd");
    checkpoint.clustering.rtol = value_or<double>(clust, "rtol", 1e-5);
    checkpoint.clustering.atol = value_or<double>(clust, "atol", 1e-8);

    // Training metrics (optional)
    if (map.contains("metrics")) {
      auto met = map.at("metrics").as<std::map<std::string, msgpack::object>>();
      if (met.contains("n_samples")) checkpoint.metrics.n_samples = met.at("n_samples").as<int>();
      if (met.contains("cluster_sizes"))
        checkpoint.metrics.cluster_sizes = met.at("cluster_sizes").as<std::vector<int>>();
      if (met.contains("inertia")) checkpoint.metrics.inertia = met.at("inertia").as<double>();
      if (met.contains("n_iter")) checkpoint.metrics.n_iter = met.at("n_iter").as<int>();
      if (met.contains("converged"))
        checkpoint.metrics.converged = met.at("converged").as<bool>();
    }

    if (map.contains("labels")) {
      checkpoint.labels = map.at("labels").as<std::vector<int>>();
    }

    // Cluster centers (binary blob)
    auto centers_map = map.at("cluster_centers").as<std::map<std::string, msgpack::object>>();
    auto n_clusters = centers_map.at("rows").as<std::uint64_t>();
    auto feature_dim = centers_map.at("cols").as<std::uint64_t>();
    const msgpack::object& blob = centers_map.at("data");
    if (blob.type != msgpack::type::BIN) {
      throw std::invalid_argument("cluster_centers data must be a binary blob");
    }

    std::uint64_t total_elements = n_clusters * feature_dim;

    auto load_centers = [&](auto tag) {
      using Scalar = decltype(tag);
      size_t expected_size = total_elements * sizeof(Scalar);
      if (blob.via.bin.size != expected_size) {
        throw std::invalid_argument(
            fmt::format("cluster_centers data size mismatch: expected {} bytes, got {}",
                        expected_size, blob.via.bin.size));
      }
      Matrix<Scalar> centers(n_clusters, feature_dim);
      std::memcpy(centers.data(), blob.via.bin.ptr, expected_size);
      checkpoint.cluster_centers = std::move(centers);
    };

    if (checkpoint.embedding.dtype == "float64") {
      load_centers(double{});
    } else {
      load_centers(float{});
    }

    return checkpoint;
  }

  std::string ClusteringCheckpoint::to_msgpack_string() const {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    pk.pack_map(labels ? 6 : 5);

    pk.pack("version");
    pk.pack(version);

    // Embedding config
    pk.pack("embedding");
    pk.pack_map(2);
    pk.pack("model");
    pk.pack(embedding.model);
    pk.pack("dtype");
    pk.pack(embedding.dtype);

    // Clustering config
    pk.pack("clustering");
    pk.pack_map(6);
    pk.pack("n_clusters");
    pk.pack(clustering.n_clusters);
    pk.pack("random_state");
    pk.pack(clustering.random_state);
    pk.pack("max_iter");
    pk.pack(clustering.max_iter);
    pk.pack("algorithm");
    pk.pack(clustering.algorithm);
    pk.pack("rtol");
    pk.pack(clustering.rtol);
    pk.pack("atol");
    pk.pack(clustering.atol);

    // Cluster centers (binary blob)
    pk.pack("cluster_centers");
    pk.pack_map(3);
    std::visit(
        [&](const auto& centers) {
          using Scalar = typename std::decay_t<decltype(centers)>::Scalar;
          pk.pack("rows");
          pk.pack(static_cast<std::uint64_t>(centers.rows()));
          pk.pack("cols");
          pk.pack(static_cast<std::uint64_t>(centers.cols()));
          pk.pack("data");
          size_t data_size = centers.size() * sizeof(Scalar);
          pk.pack_bin(static_cast<uint32_t>(data_size));
          pk.pack_bin_body(reinterpret_cast<const char*>(centers.data()),
                           static_cast<uint32_t>(data_size));
        },
        cluster_centers);

    // Training metrics (count non-null fields)
    pk.pack("metrics");
    uint32_t metrics_count = 0;
    if (metrics.n_samples) ++metrics_count;
    if (metrics.cluster_sizes) ++metrics_count;
    if (metrics.inertia) ++metrics_count;
    if (metrics.n_iter) ++metrics_count;
    if (metrics.converged) ++metrics_count;

    pk.pack_map(metrics_count);
    if (metrics.n_samples) {
      pk.pack("n_samples");
      pk.pack(*metrics.n_samples);
    }
    if (metrics.cluster_sizes) {
      pk.pack("cluster_sizes");
      pk.pack(*metrics.cluster_sizes);
    }
    if (metrics.inertia) {
      pk.pack("inertia");
      pk.pack(*metrics.inertia);
    }
    if (metrics.n_iter) {
      pk.pack("n_iter");
      pk.pack(*metrics.n_iter);
    }
    if (metrics.converged) {
      pk.pack("converged");
      pk.pack(*metrics.converged);
    }

    if (labels) {
      pk.pack("labels");
      pk.pack(*labels);
    }

    return std::string(buffer.data(), buffer.size());
  }

  void ClusteringCheckpoint::to_msgpack(const std::string& path) const {
    std::string binary_data = to_msgpack_string();
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
      throw std::runtime_error(fmt::format("Failed to open msgpack file for writing: {}", path));
    }
    file.write(binary_data.data(), static_cast<std::streamsize>(binary_data.size()));
  }

  // ============================================================================
  // Validation
  // ============================================================================

  void ClusteringCheckpoint::validate() const {
    if (clustering.n_clusters <= 0) {
      throw std::invalid_argument(
          fmt::format("n_clusters must be positive, got {}", clustering.n_clusters));
    }

    if (clustering.max_iter <= 0) {
      throw std::invalid_argument(
          fmt::format("max_iter must be positive, got {}", clustering.max_iter));
    }

    if (clustering.algorithm != "lloyd") {
      throw std::invalid_argument(
          fmt::format("unsupported algorithm '{}', expected 'lloyd'", clustering.algorithm));
    }

    if (embedding.dtype != "float32" && embedding.dtype != "float64") {
      throw std::invalid_argument(
          fmt::format("dtype must be 'float32' or 'float64', got '{}'", embedding.dtype));
    }

    std::visit(
        [&](const auto& centers) {
          using Scalar = typename std::decay_t<decltype(centers)>::Scalar;
          bool is_double = std::is_same_v<Scalar, double>;

          if (is_double && embedding.dtype != "float64") {
            throw std::invalid_argument("Cluster centers are float64 but dtype is not 'float64'");
          }
          if (!is_double && embedding.dtype != "float32") {
            throw std::invalid_argument("Cluster centers are float32 but dtype is not 'float32'");
          }

          if (centers.rows() != static_cast<size_t>(clustering.n_clusters)) {
            throw std::invalid_argument(
                fmt::format("Cluster centers rows ({}) does not match n_clusters ({})",
                            centers.rows(), clustering.n_clusters));
          }

          if (centers.cols() == 0) {
            throw std::invalid_argument("feature_dim must be positive, got 0");
          }
        },
        cluster_centers);

    if (metrics.cluster_sizes) {
      const auto& sizes = *metrics.cluster_sizes;
      if (sizes.size() != static_cast<size_t>(clustering.n_clusters)) {
        throw std::invalid_argument(
            fmt::format("cluster_sizes length ({}) does not match n_clusters ({})", sizes.size(),
                        clustering.n_clusters));
      }
      if (metrics.n_samples
          && std::accumulate(sizes.begin(), sizes.end(), 0) != *metrics.n_samples) {
        throw std::invalid_argument(
            fmt::format("cluster_sizes do not sum to n_samples ({})", *metrics.n_samples));
      }
    }

    if (labels) {
      if (metrics.n_samples && labels->size() != static_cast<size_t>(*metrics.n_samples)) {
        throw std::invalid_argument(fmt::format("labels length ({}) does not match n_samples ({})",
                                                labels->size(), *metrics.n_samples));
      }
      auto out_of_range = std::ranges::find_if(
          *labels, [&](int label) { return label < 0 || label >= clustering.n_clusters; });
      if (out_of_range != labels->end()) {
        throw std::invalid_argument(
            fmt::format("label {} at position {} is outside [0, {})", *out_of_range,
                        std::distance(labels->begin(), out_of_range), clustering.n_clusters));
      }
    }
  }

}  // namespace parley
