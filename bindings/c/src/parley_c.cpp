#include <algorithm>
#include <cstdlib>
#include <exception>
#include <new>
#include <parley/clustering/partition.hpp>
#include <parley/common/logging.hpp>
#include <stdexcept>

#include "parley.h"

namespace {

  void set_error(ParleyErrorCode* error_out, ParleyErrorCode code) {
    if (error_out) *error_out = code;
  }

  template <typename T> T* allocate_array(size_t count) {
    if (count == 0) return nullptr;
    auto* ptr = static_cast<T*>(malloc(count * sizeof(T)));
    if (!ptr) throw std::bad_alloc();
    return ptr;
  }

  // Internal helper to clean up result contents (but not the struct itself)
  void cleanup_result_contents(ParleyPartitionResult* result) {
    free(result->labels);
    free(result->centroids);
    free(result->cluster_sizes);
    result->labels = nullptr;
    result->centroids = nullptr;
    result->cluster_sizes = nullptr;
  }

  template <typename Scalar>
  ParleyPartitionResult* partition_impl(const Scalar* vectors, size_t n, size_t dim, int k,
                                        int max_iterations, uint64_t seed,
                                        ParleyErrorCode* error_out) {
    set_error(error_out, PARLEY_OK);
    if (!vectors && n > 0) {
      set_error(error_out, PARLEY_ERROR_NULL_INPUT);
      return nullptr;
    }

    ParleyPartitionResult* result = nullptr;
    try {
      parley::clustering::EmbeddingBatchView<Scalar> view{vectors, n, dim};
      auto fitted = parley::clustering::partition(
          view, k, {.max_iterations = max_iterations, .seed = seed});

      result = static_cast<ParleyPartitionResult*>(calloc(1, sizeof(ParleyPartitionResult)));
      if (!result) throw std::bad_alloc();

      result->n_samples = n;
      result->n_clusters = fitted.n_clusters();
      result->dim = dim;
      result->inertia = fitted.inertia;
      result->n_iter = fitted.n_iter;
      result->converged = fitted.converged ? 1 : 0;

      result->labels = allocate_array<int>(fitted.labels.size());
      std::ranges::copy(fitted.labels, result->labels);

      result->cluster_sizes = allocate_array<int>(fitted.cluster_sizes.size());
      std::ranges::copy(fitted.cluster_sizes, result->cluster_sizes);

      result->centroids = allocate_array<double>(fitted.centroids.size());
      std::copy_n(fitted.centroids.data(), fitted.centroids.size(), result->centroids);

      return result;
    } catch (const std::invalid_argument& e) {
      parley::logger()->debug("parley_partition rejected input: {}", e.what());
      set_error(error_out, PARLEY_ERROR_INVALID_ARGUMENT);
    } catch (const std::bad_alloc&) {
      set_error(error_out, PARLEY_ERROR_ALLOCATION_FAILED);
    } catch (const std::exception& e) {
      parley::logger()->error("parley_partition failed: {}", e.what());
      set_error(error_out, PARLEY_ERROR_INTERNAL);
    }

    if (result) {
      cleanup_result_contents(result);
      free(result);
    }
    return nullptr;
  }

}  // namespace

// C API implementation
extern "C" {

ParleyPartitionResult* parley_partition_f32(const float* vectors, size_t n, size_t dim, int k,
                                            int max_iterations, uint64_t seed,
                                            ParleyErrorCode* error_out) {
  return partition_impl(vectors, n, dim, k, max_iterations, seed, error_out);
}

ParleyPartitionResult* parley_partition_f64(const double* vectors, size_t n, size_t dim, int k,
                                            int max_iterations, uint64_t seed,
                                            ParleyErrorCode* error_out) {
  return partition_impl(vectors, n, dim, k, max_iterations, seed, error_out);
}

void parley_partition_result_free(ParleyPartitionResult* result) {
  if (!result) return;
  cleanup_result_contents(result);
  free(result);
}

const char* parley_error_message(ParleyErrorCode code) {
  switch (code) {
    case PARLEY_OK:
      return "ok";
    case PARLEY_ERROR_INVALID_ARGUMENT:
      return "invalid argument: cluster count must be positive";
    case PARLEY_ERROR_NULL_INPUT:
      return "vectors must not be NULL when n is non-zero";
    case PARLEY_ERROR_ALLOCATION_FAILED:
      return "allocation failed";
    case PARLEY_ERROR_INTERNAL:
      return "internal error";
  }
  return "unknown error";
}

}  // extern "C"
