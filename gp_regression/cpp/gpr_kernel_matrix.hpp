/*!
  \file gpr_kernel_matrix.hpp
  \rst
  Builders for dense covariance (kernel) matrices: the symmetric matrix ``K(X, X)`` of one point set and the
  cross-covariance ``K(X, Xs)`` between two point sets.

  Notation (as used throughout gp_regression): ``X`` is the list of training points, ``Xs`` a list of test points;
  ``K = K(X, X)``, ``Ks = K(X, Xs)``, ``Kss = K(Xs, Xs)``.  ``K(Xs, X)`` is the transpose of ``Ks`` and is never formed.

  Each matrix entry is an independent covariance evaluation, so columns are filled in parallel with OpenMP
  (controlled by ThreadSchedule).  Every entry is written by exactly one thread and the covariance is read-only, so the
  output does not depend on the number of threads or the schedule.

  Cost is ``O(p*q*dim)`` for a ``p x q`` matrix; for large prediction grids this dominates the ``O(n^2 m)`` solves.
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_KERNEL_MATRIX_HPP_
#define GP_REGRESSION_CPP_GPR_KERNEL_MATRIX_HPP_

#include <vector>

#include "gpr_common.hpp"
#include "gpr_covariance.hpp"
#include "gpr_model_parameters.hpp"

namespace gp_regression {

/*!\rst
  Matrices with fewer entries than this are built on a single thread; thread startup would cost more than the work.
\endrst*/
static constexpr int kMinimumEntriesForThreading = 4096;

/*!\rst
  Compute the covariance matrix, ``K``, of a list of points, ``X``: ``K_{ij} = covariance(X_i, X_j)``.

  Only the lower triangle (including the diagonal) is evaluated; it is then copied into the upper triangle, so the
  result is EXACTLY symmetric (bitwise), whatever floating point asymmetry ``covariance`` may have.

  The result is SPD when the points are distinct and the covariance is positive definite (e.g., the stationary
  kernels).  Duplicate points make it singular.

  \param
    :covariance: the covariance function; ``covariance.dim()`` must equal ``dim``
    :points[dim][num_points]: list of points, ``X``
    :dim: spatial dimension of a point
    :num_points: number of points
    :thread_schedule: OpenMP settings for the column loop
  \output
    :cov_matrix[num_points][num_points]: the covariance matrix, stored in full
\endrst*/
void BuildCovarianceMatrix(const CovarianceInterface& covariance, double const * restrict points, int dim,
                           int num_points, const ThreadSchedule& thread_schedule,
                           double * restrict cov_matrix) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  Compute the cross-covariance matrix, ``Ks``, of two point lists ``X`` (``points_one``) and ``Xs`` (``points_two``):
  ``Ks_{ij} = covariance(X_i, Xs_j)``.  ``Ks`` need not be square and is not symmetric in general.

  \param
    :covariance: the covariance function; ``covariance.dim()`` must equal ``dim``
    :points_one[dim][num_points_one]: list of points, ``X``
    :num_points_one: number of points in ``X``; number of rows of the output
    :points_two[dim][num_points_two]: list of points, ``Xs``
    :num_points_two: number of points in ``Xs``; number of columns of the output
    :dim: spatial dimension of a point
    :thread_schedule: OpenMP settings for the column loop
  \output
    :cov_matrix[num_points_two][num_points_one]: the cross-covariance matrix
\endrst*/
void BuildCrossCovarianceMatrix(const CovarianceInterface& covariance, double const * restrict points_one,
                                int num_points_one, double const * restrict points_two, int num_points_two,
                                int dim, const ThreadSchedule& thread_schedule,
                                double * restrict cov_matrix) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  Flattens a nested list of points into the ``points[dim][num_points]`` layout used by the builders.

  \param
    :points: list of points, each of length ``dim``
    :dim: required spatial dimension
  \return
    the flattened points, ``dim * points.size()`` entries
  \raise
    DimensionMismatchException if any point does not have ``dim`` coordinates
\endrst*/
std::vector<double> FlattenPointList(const std::vector<std::vector<double> >& points, int dim) GPR_WARN_UNUSED_RESULT;

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_KERNEL_MATRIX_HPP_
