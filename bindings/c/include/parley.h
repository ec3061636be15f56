#ifndef PARLEY_H
#define PARLEY_H

#include <stddef.h>
#include <stdint.h>

/* Cross-platform DLL export/import macros */
#if defined(_WIN32) || defined(_WIN64)
#  ifdef PARLEY_C_EXPORTS
#    define PARLEY_API __declspec(dllexport)
#  else
#    define PARLEY_API __declspec(dllimport)
#  endif
#else
#  if __GNUC__ >= 4
#    define PARLEY_API __attribute__((visibility("default")))
#  else
#    define PARLEY_API
#  endif
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Error codes for parley operations
 */
typedef enum {
  PARLEY_OK = 0,
  PARLEY_ERROR_INVALID_ARGUMENT, /**< Non-positive cluster count */
  PARLEY_ERROR_NULL_INPUT,       /**< NULL vectors with a non-zero count */
  PARLEY_ERROR_ALLOCATION_FAILED,
  PARLEY_ERROR_INTERNAL
} ParleyErrorCode;

/**
 * Partition result. All arrays are owned by the result; release it with
 * parley_partition_result_free. Arrays are NULL when their length is zero.
 */
typedef struct {
  int* labels;          /**< n_samples cluster indices */
  size_t n_samples;     /**< Number of input vectors */
  double* centroids;    /**< n_clusters x dim, row-major */
  size_t n_clusters;    /**< Effective cluster count, min(k, n_samples) */
  size_t dim;           /**< Vector dimension */
  int* cluster_sizes;   /**< n_clusters member counts */
  double inertia;       /**< Sum of squared distances to the assigned centroids */
  int n_iter;           /**< Completed assign/update passes */
  int converged;        /**< Non-zero if centroids stopped moving before the cap */
} ParleyPartitionResult;

/**
 * Partition float32 vectors with k-means
 * @param vectors Row-major n x dim array (may be NULL when n is 0)
 * @param n Number of vectors
 * @param dim Dimension of each vector
 * @param k Requested cluster count (must be positive)
 * @param max_iterations Upper bound on refinement passes
 * @param seed Seed for initialization and empty-cluster reseeding
 * @param error_out Optional error code output (can be NULL)
 * @return Result (caller must free with parley_partition_result_free), or NULL on error
 */
PARLEY_API ParleyPartitionResult* parley_partition_f32(const float* vectors, size_t n, size_t dim,
                                                       int k, int max_iterations, uint64_t seed,
                                                       ParleyErrorCode* error_out);

/**
 * Partition float64 vectors with k-means (see parley_partition_f32)
 */
PARLEY_API ParleyPartitionResult* parley_partition_f64(const double* vectors, size_t n,
                                                       size_t dim, int k, int max_iterations,
                                                       uint64_t seed, ParleyErrorCode* error_out);

/**
 * Free a partition result
 * @param result Result to free (NULL is ignored)
 */
PARLEY_API void parley_partition_result_free(ParleyPartitionResult* result);

/**
 * Static description of an error code
 */
PARLEY_API const char* parley_error_message(ParleyErrorCode code);

#ifdef __cplusplus
}
#endif

#endif /* PARLEY_H */
