/*!
  \file gpr_test_utils.hpp
  \rst
  Functions that are useful for unit testing: absolute/relative precision checks, a residual norm, and a few helpers
  that set up Gaussian Process inputs shared by several test suites.

  Every Check* function logs the offending values through GPR_ERROR_PRINTF when it fails, so a failing test shows
  what it saw without extra printing at the call site.
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_TEST_UTILS_HPP_
#define GP_REGRESSION_CPP_GPR_TEST_UTILS_HPP_

#include <cstdint>

#include <vector>

#include "gpr_common.hpp"

namespace gp_regression {

struct UniformRandomGenerator;

//! ``value == truth``
bool CheckIntEquals(int64_t value, int64_t truth) noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT;

/*!\rst
  ``||b - A*x||_2``, the residual of ``x`` as a solution of the SPD or general system ``A*x = b``.  Used to check
  CholeskySolver::Solve() independently of the factorization.
\endrst*/
double ResidualNorm(double const * restrict A, double const * restrict x, double const * restrict b, int size) noexcept GPR_PURE_FUNCTION GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT;

//! ``|value - truth| <= tolerance``
bool CheckDoubleWithin(double value, double truth, double tolerance) noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT;

//! ``|value - truth| <= tolerance * |truth|``; compares the absolute difference when ``truth`` is 0 or denormal.
bool CheckDoubleWithinRelative(double value, double truth, double tolerance) noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT;

/*!\rst
  Relative check as in CheckDoubleWithinRelative(), except that for ``|truth| < threshold`` the ABSOLUTE difference is
  compared to ``tolerance``.
\endrst*/
bool CheckDoubleWithinRelativeWithThreshold(double value, double truth, double tolerance, double threshold) noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT;

/*!\rst
  Checks that ``||A - B||_F <= tolerance``

  \param
    :matrix1[size_m][size_n]: matrix A
    :matrix2[size_m][size_n]: matrix B
    :size_m: rows of A, B
    :size_n: columns of A, B
    :tolerance: largest permissible norm of the difference A - B
  \return
    true if A - B are "close"
\endrst*/
bool CheckMatrixNormWithin(double const * restrict matrix1, double const * restrict matrix2, int size_m, int size_n, double tolerance) noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT;

/*!\rst
  Determinant by cofactor (Laplace) expansion along the first column.  ``O(n!)``: only for tiny matrices (``n <= 6``).
  Independent of any factorization, so it can check log determinants computed from a Cholesky factor.

  \param
    :matrix[size][size]: square matrix
    :size: dimension of matrix
  \return
    ``\det(matrix)``
\endrst*/
double ComputeDeterminantByCofactors(double const * restrict matrix, int size) GPR_WARN_UNUSED_RESULT;

/*!\rst
  Draws ``num_points`` latin hypercube points in ``[lower, upper]^dim`` and observes ``f(x) = \sum_i \sin(x_i)`` at each.

  \param
    :dim: spatial dimension
    :num_points: number of points
    :lower: lower bound of each coordinate
    :upper: upper bound of each coordinate
    :uniform_generator[1]: source of randomness
  \output
    :uniform_generator[1]: state advanced
    :points[dim][num_points]: resized and filled with the points
    :values[num_points]: resized and filled with ``f`` at each point
\endrst*/
void BuildSineTrainingData(int dim, int num_points, double lower, double upper,
                           UniformRandomGenerator * uniform_generator, std::vector<double> * points,
                           std::vector<double> * values) GPR_NONNULL_POINTERS;

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_TEST_UTILS_HPP_
