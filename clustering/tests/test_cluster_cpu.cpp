#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <parley/clustering/cluster.hpp>
#include <parley/clustering/embedding_view.hpp>
#include <parley/clustering/metric.hpp>
#include <parley/clustering/partition.hpp>
#include <parley/common/matrix.hpp>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace parley::clustering;
using parley::EmbeddingMatrix;

// =============================================================================
// SECTION 1: Basic Functionality
// =============================================================================

template <typename Scalar> class ClusterEngineTestT : public ::testing::Test {
protected:
  ClusterEngine<Scalar> engine;

  static void fill_matrix(EmbeddingMatrix<Scalar>& m, std::initializer_list<Scalar> values) {
    auto it = values.begin();
    for (size_t i = 0; i < m.rows(); ++i) {
      for (size_t j = 0; j < m.cols(); ++j) {
        m(i, j) = (it != values.end()) ? *it++ : Scalar(0);
      }
    }
  }

  static void random_matrix(EmbeddingMatrix<Scalar>& m, std::mt19937& gen) {
    std::uniform_real_distribution<Scalar> dist(Scalar(-1), Scalar(1));
    for (size_t i = 0; i < m.rows(); ++i) {
      for (size_t j = 0; j < m.cols(); ++j) {
        m(i, j) = dist(gen);
      }
    }
  }

  void load_axes() {
    EmbeddingMatrix<Scalar> centers(3, 4);
    fill_matrix(centers, {1, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1, 0});
    engine.load_centroids(centers);
  }
};

using ScalarTypes = ::testing::Types<float, double>;
TYPED_TEST_SUITE(ClusterEngineTestT, ScalarTypes);

TYPED_TEST(ClusterEngineTestT, EmptyEngine) {
  EXPECT_EQ(this->engine.n_clusters(), 0u);
  EXPECT_EQ(this->engine.dim(), 0u);
}

TYPED_TEST(ClusterEngineTestT, LoadCentroids) {
  this->load_axes();
  EXPECT_EQ(this->engine.n_clusters(), 3u);
  EXPECT_EQ(this->engine.dim(), 4u);
}

TYPED_TEST(ClusterEngineTestT, AssignToNearestCluster) {
  this->load_axes();

  TypeParam vec[] = {TypeParam(0.9), TypeParam(0.1), 0, 0};
  auto [cluster_id, distance] = this->engine.assign(EmbeddingView<TypeParam>{vec, 4});
  EXPECT_EQ(cluster_id, 0);
  EXPECT_GT(distance, TypeParam(0));
}

TYPED_TEST(ClusterEngineTestT, AssignToThirdCluster) {
  this->load_axes();

  TypeParam vec[] = {0, 0, 1, 0};
  auto [cluster_id, distance] = this->engine.assign(vec, 4);
  EXPECT_EQ(cluster_id, 2);
  EXPECT_NEAR(distance, 0.0, 1e-6);
}

TYPED_TEST(ClusterEngineTestT, DistanceIsEuclidean) {
  this->load_axes();

  TypeParam vec[] = {4, 0, 0, 3};
  auto [cluster_id, distance] = this->engine.assign(vec, 4);
  EXPECT_EQ(cluster_id, 0);
  EXPECT_NEAR(distance, std::sqrt(18.0), 1e-5);
}

TYPED_TEST(ClusterEngineTestT, TiesGoToLowestIndex) {
  this->load_axes();

  TypeParam vec[] = {0, 0, 0, 0};
  auto [cluster_id, distance] = this->engine.assign(vec, 4);
  EXPECT_EQ(cluster_id, 0);
  EXPECT_NEAR(distance, 1.0, 1e-6);
}

TYPED_TEST(ClusterEngineTestT, AssignBeforeLoadReturnsNoCluster) {
  std::vector<TypeParam> query(4, TypeParam(1));
  auto [cluster_id, distance] = this->engine.assign(query.data(), 4);
  EXPECT_EQ(cluster_id, -1);
  EXPECT_EQ(distance, TypeParam(0));
}

TYPED_TEST(ClusterEngineTestT, DimensionMismatchThrows) {
  this->load_axes();
  std::vector<TypeParam> query(3, TypeParam(1));
  EXPECT_THROW((void)this->engine.assign(query.data(), 3), std::invalid_argument);
}

TYPED_TEST(ClusterEngineTestT, LoadRejectsInvalidShapes) {
  std::vector<TypeParam> data(4, TypeParam(0));
  EXPECT_THROW(this->engine.load_centroids(data.data(), 0, 4), std::invalid_argument);
  EXPECT_THROW(this->engine.load_centroids(data.data(), 1, 0), std::invalid_argument);
  EXPECT_THROW(this->engine.load_centroids(nullptr, 1, 4), std::invalid_argument);
}

TYPED_TEST(ClusterEngineTestT, ManyClusterAssignment) {
  constexpr size_t N_CLUSTERS = 100;
  constexpr size_t DIM = 128;
  constexpr int N_QUERIES = 50;

  std::mt19937 gen(42);
  EmbeddingMatrix<TypeParam> centers(N_CLUSTERS, DIM);
  this->random_matrix(centers, gen);
  this->engine.load_centroids(centers);

  std::uniform_real_distribution<TypeParam> dist(TypeParam(-1), TypeParam(1));
  for (int q = 0; q < N_QUERIES; ++q) {
    std::vector<TypeParam> query(DIM);
    for (size_t d = 0; d < DIM; ++d) {
      query[d] = dist(gen);
    }

    auto [cluster_id, distance] = this->engine.assign(query.data(), DIM);
    EXPECT_GE(cluster_id, 0);
    EXPECT_LT(cluster_id, static_cast<int>(N_CLUSTERS));
    EXPECT_GE(distance, TypeParam(0));
  }
}

TYPED_TEST(ClusterEngineTestT, HighDimensionalEmbeddings) {
  constexpr size_t N_CLUSTERS = 10;
  constexpr size_t DIM = 2048;

  std::mt19937 gen(42);
  EmbeddingMatrix<TypeParam> centers(N_CLUSTERS, DIM);
  this->random_matrix(centers, gen);
  this->engine.load_centroids(centers);

  // A centroid is its own nearest neighbour.
  auto [cluster_id, distance] = this->engine.assign(centers.row(7), DIM);
  EXPECT_EQ(cluster_id, 7);
  EXPECT_NEAR(distance, 0.0, 1e-3);
}

TYPED_TEST(ClusterEngineTestT, AgreesWithPartitionLabels) {
  std::mt19937 gen(3);
  EmbeddingMatrix<TypeParam> vectors(300, 8);
  this->random_matrix(vectors, gen);

  auto result = partition(vectors, 6);
  ASSERT_TRUE(result.converged);
  this->engine.load_centroids(result.centroids);

  // At convergence the labels are the nearest centroids.
  auto assigned = this->engine.assign_batch(make_view(vectors));
  for (size_t i = 0; i < vectors.rows(); ++i) {
    EXPECT_EQ(assigned[i].first, result.labels[i]) << "vector " << i;
  }
}

TYPED_TEST(ClusterEngineTestT, MoveTransfersCentroids) {
  this->load_axes();
  ClusterEngine<TypeParam> moved = std::move(this->engine);
  EXPECT_EQ(moved.n_clusters(), 3u);

  TypeParam vec[] = {0, 1, 0, 0};
  EXPECT_EQ(moved.assign(vec, 4).first, 1);
}

// =============================================================================
// SECTION 2: Thread Safety
// =============================================================================

class ClusterThreadSafetyTest : public ::testing::Test {
protected:
  static constexpr size_t N_THREADS = 16;
  static constexpr int N_QUERIES_PER_THREAD = 1000;
  static constexpr size_t N_CLUSTERS = 100;
  static constexpr size_t DIM = 128;

  void SetUp() override {
    std::mt19937 gen(42);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

    EmbeddingMatrix<float> centers(N_CLUSTERS, DIM);
    for (size_t i = 0; i < N_CLUSTERS; ++i) {
      for (size_t j = 0; j < DIM; ++j) {
        centers(i, j) = dist(gen);
      }
    }

    engine_.load_centroids(centers);
  }

  ClusterEngine<float> engine_;
};

TEST_F(ClusterThreadSafetyTest, ConcurrentAssign) {
  std::atomic<int> error_count{0};
  std::atomic<int> success_count{0};
  std::vector<std::thread> threads;

  for (size_t t = 0; t < this->N_THREADS; ++t) {
    threads.emplace_back([&, t]() {
      std::mt19937 gen(static_cast<unsigned>(42 + t));
      std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

      for (int q = 0; q < this->N_QUERIES_PER_THREAD; ++q) {
        std::vector<float> query(this->DIM);
        for (size_t d = 0; d < this->DIM; ++d) {
          query[d] = dist(gen);
        }

        auto [cluster_id, distance] = this->engine_.assign(query.data(), this->DIM);

        if (cluster_id >= 0 && cluster_id < static_cast<int>(this->N_CLUSTERS) && distance >= 0
            && !std::isnan(distance) && !std::isinf(distance)) {
          success_count.fetch_add(1, std::memory_order_relaxed);
        } else {
          error_count.fetch_add(1, std::memory_order_relaxed);
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(error_count.load(), 0) << "Thread safety violations detected in ClusterEngine";
  EXPECT_EQ(success_count.load(), static_cast<int>(this->N_THREADS) * this->N_QUERIES_PER_THREAD);
}

// =============================================================================
// SECTION 3: Batch Operations
// =============================================================================

class ClusterBatchTest : public ::testing::Test {
protected:
  static constexpr size_t N_CLUSTERS = 10;
  static constexpr size_t DIM = 64;

  void SetUp() override {
    std::mt19937 gen(42);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

    EmbeddingMatrix<float> centers(N_CLUSTERS, DIM);
    for (size_t i = 0; i < N_CLUSTERS; ++i) {
      for (size_t j = 0; j < DIM; ++j) {
        centers(i, j) = dist(gen);
      }
    }

    engine.load_centroids(centers);
  }

  static std::vector<float> random_embeddings(size_t count, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> embeddings(count * DIM);
    for (auto& x : embeddings) {
      x = dist(gen);
    }
    return embeddings;
  }

  ClusterEngine<float> engine;
};

TEST_F(ClusterBatchTest, AssignBatchMatchesSingleAssign) {
  constexpr size_t BATCH_SIZE = 50;
  auto embeddings = random_embeddings(BATCH_SIZE, 456);

  EmbeddingBatchView<float> batch_view{embeddings.data(), BATCH_SIZE, this->DIM};
  auto batch_results = this->engine.assign_batch(batch_view);

  ASSERT_EQ(batch_results.size(), BATCH_SIZE);
  for (size_t i = 0; i < BATCH_SIZE; ++i) {
    auto single_result = this->engine.assign(batch_view.at(i));
    EXPECT_EQ(batch_results[i].first, single_result.first);
    EXPECT_NEAR(batch_results[i].second, single_result.second, 1e-5f);
  }
}

TEST_F(ClusterBatchTest, AssignBatchLargeBatch) {
  constexpr size_t BATCH_SIZE = 10000;
  auto embeddings = random_embeddings(BATCH_SIZE, 789);

  EmbeddingBatchView<float> batch_view{embeddings.data(), BATCH_SIZE, this->DIM};
  auto results = this->engine.assign_batch(batch_view);

  ASSERT_EQ(results.size(), BATCH_SIZE);
  for (const auto& [cluster_id, distance] : results) {
    EXPECT_GE(cluster_id, 0);
    EXPECT_LT(cluster_id, static_cast<int>(this->N_CLUSTERS));
  }
}

TEST_F(ClusterBatchTest, AssignBatchEmpty) {
  EmbeddingBatchView<float> batch_view{nullptr, 0, this->DIM};
  EXPECT_TRUE(this->engine.assign_batch(batch_view).empty());
}

TEST_F(ClusterBatchTest, AssignBatchDimensionMismatchThrows) {
  std::vector<float> embeddings(2 * 3, 0.5f);
  EmbeddingBatchView<float> batch_view{embeddings.data(), 2, 3};
  EXPECT_THROW((void)this->engine.assign_batch(batch_view), std::invalid_argument);
}

// =============================================================================
// SECTION 4: Double precision
// =============================================================================

TEST(ClusterEngineDoubleTest, NearestCentroidBelowFloatResolution) {
  ClusterEngine<double> engine;
  double centers[] = {1.0 + 2e-8, 1.0 + 1e-8};
  engine.load_centroids(centers, 2, 1);

  double origin[] = {0.0};
  auto [cluster_id, distance] = engine.assign(origin, 1);
  EXPECT_EQ(cluster_id, 1);
  EXPECT_DOUBLE_EQ(distance, 1.0 + 1e-8);
}

TEST(ClusterEngineDoubleTest, SquaredL2MatchesExactSum) {
  SquaredL2<double> metric(3);
  double a[] = {0.0, 1.0, 2.0};
  double b[] = {1.0 + 1e-9, 1.0, 0.0};
  EXPECT_DOUBLE_EQ(metric(a, b), (1.0 + 1e-9) * (1.0 + 1e-9) + 4.0);
}
