#pragma once
#include <cstddef>
#include <span>
#include <vector>

namespace parley::clustering {

  // Member indices of each cluster, in input order. Clusters without members are empty.
  // Throws std::invalid_argument for a label outside [0, n_clusters).
  [[nodiscard]] std::vector<std::vector<size_t>> group_by_label(std::span<const int> labels,
                                                                size_t n_clusters);

  [[nodiscard]] std::vector<int> cluster_sizes(std::span<const int> labels, size_t n_clusters);

}  // namespace parley::clustering
