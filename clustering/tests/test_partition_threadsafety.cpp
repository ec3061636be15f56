#include <gtest/gtest.h>

#include <atomic>
#include <parley/clustering/partition.hpp>
#include <parley/common/matrix.hpp>
#include <random>
#include <thread>
#include <vector>

#ifdef _OPENMP
#  include <omp.h>
#endif

using namespace parley::clustering;
using parley::Matrix;

template <typename Scalar> class PartitionThreadSafetyTestT : public ::testing::Test {
protected:
  static constexpr int N_THREADS = 8;
  static constexpr int RUNS_PER_THREAD = 10;
  static constexpr int K = 10;

  void SetUp() override {
    std::mt19937 gen(42);
    std::uniform_real_distribution<Scalar> dist(Scalar(-1), Scalar(1));
    vectors_ = Matrix<Scalar>(2000, 16);
    for (size_t i = 0; i < vectors_.size(); ++i) {
      vectors_.data()[i] = dist(gen);
    }
  }

  Matrix<Scalar> vectors_;
};

using ScalarTypes = ::testing::Types<float, double>;
TYPED_TEST_SUITE(PartitionThreadSafetyTestT, ScalarTypes);

TYPED_TEST(PartitionThreadSafetyTestT, ConcurrentCallsMatchSequential) {
  const auto expected = partition(this->vectors_, this->K, {.seed = 7});

  std::atomic<int> mismatch_count{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < this->N_THREADS; ++t) {
    threads.emplace_back([&]() {
      for (int r = 0; r < this->RUNS_PER_THREAD; ++r) {
        auto result = partition(this->vectors_, this->K, {.seed = 7});
        if (result.labels != expected.labels || result.centroids != expected.centroids) {
          mismatch_count.fetch_add(1, std::memory_order_relaxed);
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(mismatch_count.load(), 0) << "Concurrent partitions diverged from the sequential one";
}

TYPED_TEST(PartitionThreadSafetyTestT, ThreadCountDoesNotChangeResult) {
#ifdef _OPENMP
  const int saved = omp_get_max_threads();

  omp_set_num_threads(1);
  auto serial = partition(this->vectors_, this->K);
  omp_set_num_threads(4);
  auto parallel = partition(this->vectors_, this->K);
  omp_set_num_threads(saved);

  EXPECT_EQ(serial.labels, parallel.labels);
  EXPECT_EQ(serial.centroids, parallel.centroids);
  EXPECT_EQ(serial.n_iter, parallel.n_iter);
  EXPECT_EQ(serial.inertia, parallel.inertia);
#else
  GTEST_SKIP() << "Built without OpenMP";
#endif
}
