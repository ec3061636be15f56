#include <fmt/format.h>

#include <numeric>
#include <parley/common/random.hpp>
#include <stdexcept>
#include <utility>

namespace parley {

  std::vector<size_t> IRandomSource::sample_without_replacement(size_t n, size_t k) {
    if (k > n) [[unlikely]] {
      throw std::invalid_argument(
          fmt::format("cannot sample {} distinct indices from a population of {}", k, n));
    }

    // Partial Fisher-Yates: the first k slots hold the sample.
    std::vector<size_t> pool(n);
    std::iota(pool.begin(), pool.end(), size_t{0});
    for (size_t i = 0; i < k; ++i) {
      size_t j = i + uniform_index(n - i);
      std::swap(pool[i], pool[j]);
    }
    pool.resize(k);
    return pool;
  }

  size_t SeededRandomSource::uniform_index(size_t n) {
    if (n == 0) [[unlikely]] {
      throw std::invalid_argument("uniform_index requires a non-empty range");
    }
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(engine_);
  }

}  // namespace parley
