/*!
  \file gpr_kernel_matrix.cpp
  \rst
  OpenMP implementations of the kernel matrix builders.  The parallel loops run over output columns; each iteration
  writes only its own column, and CovarianceInterface::Covariance() is const and noexcept, so no locking or exception
  capture is needed inside the parallel region.
\endrst*/

#include "gpr_kernel_matrix.hpp"

#include <omp.h>  // NOLINT(build/include_order)

#include <vector>

#include "gpr_common.hpp"
#include "gpr_covariance.hpp"
#include "gpr_exception.hpp"
#include "gpr_linear_algebra.hpp"
#include "gpr_logging.hpp"
#include "gpr_model_parameters.hpp"

namespace gp_regression {

namespace {

/*!\rst
  Number of threads to use for a matrix with ``num_entries`` entries.
\endrst*/
int NumThreadsForMatrix(const ThreadSchedule& thread_schedule, long num_entries) noexcept {
  return num_entries < kMinimumEntriesForThreading ? 1 : thread_schedule.NumThreads();
}

}  // end unnamed namespace

void BuildCovarianceMatrix(const CovarianceInterface& covariance, double const * restrict points, int dim,
                           int num_points, const ThreadSchedule& thread_schedule,
                           double * restrict cov_matrix) noexcept {
  const int num_threads = NumThreadsForMatrix(thread_schedule, static_cast<long>(num_points)*num_points);
  GPR_DEBUG_PRINTF("%s: %d x %d covariance matrix on %d threads\n", covariance.name(), num_points, num_points,
                   num_threads);

  // column j: rows j..num_points-1, i.e., the lower triangle
  omp_set_schedule(thread_schedule.schedule, thread_schedule.chunk_size);
#pragma omp parallel for num_threads(num_threads) schedule(runtime)
  for (int j = 0; j < num_points; ++j) {
    double const * restrict point_j = points + j*dim;
    double * restrict column_j = cov_matrix + j*num_points;
    for (int i = j; i < num_points; ++i) {
      column_j[i] = covariance.Covariance(points + i*dim, point_j);
    }
  }

  SymmetrizeFromLowerTriangle(num_points, cov_matrix);
}

void BuildCrossCovarianceMatrix(const CovarianceInterface& covariance, double const * restrict points_one,
                                int num_points_one, double const * restrict points_two, int num_points_two,
                                int dim, const ThreadSchedule& thread_schedule,
                                double * restrict cov_matrix) noexcept {
  const int num_threads = NumThreadsForMatrix(thread_schedule, static_cast<long>(num_points_one)*num_points_two);
  GPR_DEBUG_PRINTF("%s: %d x %d cross-covariance matrix on %d threads\n", covariance.name(), num_points_one,
                   num_points_two, num_threads);

  omp_set_schedule(thread_schedule.schedule, thread_schedule.chunk_size);
#pragma omp parallel for num_threads(num_threads) schedule(runtime)
  for (int j = 0; j < num_points_two; ++j) {
    double const * restrict point_two_j = points_two + j*dim;
    double * restrict column_j = cov_matrix + j*num_points_one;
    for (int i = 0; i < num_points_one; ++i) {
      column_j[i] = covariance.Covariance(points_one + i*dim, point_two_j);
    }
  }
}

std::vector<double> FlattenPointList(const std::vector<std::vector<double> >& points, int dim) {
  std::vector<double> flat_points;
  flat_points.reserve(points.size()*(dim > 0 ? dim : 0));
  for (const auto& point : points) {
    if (unlikely(point.size() != static_cast<unsigned>(dim))) {
      GPR_THROW_EXCEPTION(DimensionMismatchException, "Point has the wrong number of coordinates.",
                          static_cast<int>(point.size()), dim);
    }
    flat_points.insert(flat_points.end(), point.begin(), point.end());
  }
  return flat_points;
}

}  // end namespace gp_regression
