#include <fmt/format.h>

#include <parley/clustering/grouping.hpp>
#include <stdexcept>

namespace parley::clustering {

  namespace {

    size_t checked_label(int label, size_t position, size_t n_clusters) {
      if (label < 0 || static_cast<size_t>(label) >= n_clusters) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "label {} at position {} is outside [0, {})", label, position, n_clusters));
      }
      return static_cast<size_t>(label);
    }

  }  // namespace

  std::vector<std::vector<size_t>> group_by_label(std::span<const int> labels,
                                                  size_t n_clusters) {
    std::vector<std::vector<size_t>> groups(n_clusters);
    for (size_t i = 0; i < labels.size(); ++i) {
      groups[checked_label(labels[i], i, n_clusters)].push_back(i);
    }
    return groups;
  }

  std::vector<int> cluster_sizes(std::span<const int> labels, size_t n_clusters) {
    std::vector<int> sizes(n_clusters, 0);
    for (size_t i = 0; i < labels.size(); ++i) {
      ++sizes[checked_label(labels[i], i, n_clusters)];
    }
    return sizes;
  }

}  // namespace parley::clustering
