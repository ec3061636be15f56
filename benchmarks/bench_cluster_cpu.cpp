#include <benchmark/benchmark.h>

#include <parley/clustering/cluster.hpp>
#include <parley/clustering/embedding_view.hpp>
#include <random>
#include <string>
#include <vector>

using namespace parley::clustering;

namespace {

void setup_engine(ClusterEngine<float>& engine, int n_clusters, int dim, uint32_t seed = 42) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<float> centroids(n_clusters * dim);
  for (auto& v : centroids) {
    v = dist(rng);
  }
  engine.load_centroids(centroids.data(), n_clusters, dim);
}

std::vector<float> generate_embeddings(int count, int dim, uint32_t seed = 42) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<float> emb(count * dim);
  for (auto& v : emb) {
    v = dist(rng);
  }
  return emb;
}

}  // namespace

static void BM_ClusterAssign(benchmark::State& state) {
  const int n_clusters = state.range(0);
  const int dim = state.range(1);

  ClusterEngine<float> engine;
  setup_engine(engine, n_clusters, dim);

  auto query = generate_embeddings(1, dim);
  EmbeddingView<float> view{query.data(), static_cast<size_t>(dim)};

  for (auto _ : state) {
    auto [cluster_id, distance] = engine.assign(view);
    benchmark::DoNotOptimize(cluster_id);
    benchmark::DoNotOptimize(distance);
  }

  state.SetLabel(std::to_string(n_clusters) + "c/" + std::to_string(dim) + "d");
}

static void BM_ClusterBatchAssign(benchmark::State& state) {
  const int batch_size = state.range(0);
  const int n_clusters = state.range(1);
  const int dim = state.range(2);

  ClusterEngine<float> engine;
  setup_engine(engine, n_clusters, dim);

  auto queries = generate_embeddings(batch_size, dim);
  EmbeddingBatchView<float> view{queries.data(), static_cast<size_t>(batch_size),
                                 static_cast<size_t>(dim)};

  for (auto _ : state) {
    auto results = engine.assign_batch(view);
    benchmark::DoNotOptimize(results);
  }

  state.SetItemsProcessed(state.iterations() * batch_size);
  state.SetLabel(std::to_string(batch_size) + "b/" + std::to_string(n_clusters) + "c/"
                 + std::to_string(dim) + "d");
}

static void SingleArgs(benchmark::internal::Benchmark* b) {
  for (int clusters : {10, 100, 1000}) {
    for (int dim : {128, 768, 1536}) {
      b->Args({clusters, dim});
    }
  }
  b->Unit(benchmark::kMicrosecond);
}

static void BatchArgs(benchmark::internal::Benchmark* b) {
  for (int batch : {1, 16, 128, 1024}) {
    b->Args({batch, 100, 768});
  }
  b->Unit(benchmark::kMicrosecond);
}

BENCHMARK(BM_ClusterAssign)->Apply(SingleArgs);
BENCHMARK(BM_ClusterBatchAssign)->Apply(BatchArgs);
