#include <benchmark/benchmark.h>

#include <parley/clustering/partition.hpp>
#include <parley/common/matrix.hpp>
#include <random>
#include <string>

using namespace parley::clustering;
using parley::Matrix;

namespace {

template <typename Scalar> Matrix<Scalar> generate_vectors(int n, int dim, uint32_t seed = 42) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<Scalar> dist(Scalar(-1), Scalar(1));
  Matrix<Scalar> vectors(n, dim);
  for (size_t i = 0; i < vectors.size(); ++i) {
    vectors.data()[i] = dist(rng);
  }
  return vectors;
}

}  // namespace

template <typename Scalar> static void BM_Partition(benchmark::State& state) {
  const int n = state.range(0);
  const int k = state.range(1);
  const int dim = state.range(2);

  auto vectors = generate_vectors<Scalar>(n, dim);

  int n_iter = 0;
  for (auto _ : state) {
    auto result = partition(vectors, k);
    n_iter = result.n_iter;
    benchmark::DoNotOptimize(result.labels.data());
  }

  state.counters["n_iter"] = n_iter;
  state.SetItemsProcessed(state.iterations() * n);
  state.SetLabel(std::to_string(n) + "n/" + std::to_string(k) + "k/" + std::to_string(dim)
                 + "d");
}

// Fixed pass count, so the time per pass is comparable across shapes.
static void BM_PartitionSinglePass(benchmark::State& state) {
  const int n = state.range(0);
  const int k = state.range(1);
  const int dim = state.range(2);

  auto vectors = generate_vectors<float>(n, dim);

  for (auto _ : state) {
    auto result = partition(vectors, k, {.max_iterations = 1});
    benchmark::DoNotOptimize(result.labels.data());
  }

  state.SetItemsProcessed(state.iterations() * n);
}

static void PartitionArgs(benchmark::internal::Benchmark* b) {
  for (int n : {1000, 10000}) {
    for (int k : {8, 64}) {
      for (int dim : {16, 128}) {
        b->Args({n, k, dim});
      }
    }
  }
  b->Unit(benchmark::kMillisecond);
}

BENCHMARK_TEMPLATE(BM_Partition, float)->Apply(PartitionArgs);
BENCHMARK_TEMPLATE(BM_Partition, double)->Apply(PartitionArgs);
BENCHMARK(BM_PartitionSinglePass)->Apply(PartitionArgs);
