/*!
  \file gpr_test_utils.cpp
  \rst
  Implementations of utilities useful for unit testing.
\endrst*/

#include "gpr_test_utils.hpp"

#include <cinttypes>
#include <cmath>

#include <limits>
#include <vector>

#include "gpr_common.hpp"
#include "gpr_linear_algebra.hpp"
#include "gpr_logging.hpp"
#include "gpr_random.hpp"

namespace gp_regression {

bool CheckIntEquals(int64_t value, int64_t truth) noexcept {
  bool passed = value == truth;

  if (passed == false) {
    GPR_ERROR_PRINTF("value = %" PRId64 ", truth = %" PRId64 ", diff = %" PRId64 "\n", value, truth, truth - value);
  }
  return passed;
}

/*!\rst
  ``\|b - A*x\|_2``

  A small residual is a *NECESSARY* but *NOT SUFFICIENT* indicator of accuracy in ``x``:

  ``\|\delta x\| / \|x\| \le cond(A) * \|r\| / (\|A\| * \|x\|)``

  However, a backward stable algorithm (e.g., Cholesky followed by triangular solves) computes solutions with small
  relative residual norms *regardless* of conditioning, so the residual is a good correctness check for those solvers.
\endrst*/
double ResidualNorm(double const * restrict A, double const * restrict x, double const * restrict b, int size) noexcept {
  std::vector<double> y(b, b + size);  // y = b
  GeneralMatrixVectorMultiply(A, 'N', x, -1.0, 1.0, size, size, size, y.data());  // y -= A * x

  double norm = VectorNorm(y.data(), size);
  return norm;
}

bool CheckDoubleWithin(double value, double truth, double tolerance) noexcept {
  double diff = std::fabs(value - truth);
  bool passed = diff <= tolerance;

  if (passed != true) {
    GPR_ERROR_PRINTF("value = %.18E, truth = %.18E, diff = %.18E, tol = %.18E\n", value, truth, diff, tolerance);
  }
  return passed;
}

bool CheckDoubleWithinRelativeWithThreshold(double value, double truth, double tolerance, double threshold) noexcept {
  double denom = std::fabs(truth);
  if (denom < threshold) {
    denom = 1.0;  // don't divide by 0
  }
  double diff = std::fabs((value - truth)/denom);
  bool passed = diff <= tolerance;
  if (passed != true) {
    GPR_ERROR_PRINTF("value = %.18E, truth = %.18E, diff = %.18E, tol = %.18E\n", value, truth, diff, tolerance);
  }
  return passed;
}

bool CheckDoubleWithinRelative(double value, double truth, double tolerance) noexcept {
  return CheckDoubleWithinRelativeWithThreshold(value, truth, tolerance, std::numeric_limits<double>::min());
}

/*!\rst
  Uses the Frobenius Norm for convenience; matrix 2-norms are expensive to compute.
\endrst*/
bool CheckMatrixNormWithin(double const * restrict matrix1, double const * restrict matrix2, int size_m, int size_n, double tolerance) noexcept {
  if (size_m*size_n == 0) {
    return true;
  }
  std::vector<double> difference_matrix(matrix1, matrix1 + size_m*size_n);

  VectorAXPY(size_m*size_n, -1.0, matrix2, difference_matrix.data());
  double norm = VectorNorm(difference_matrix.data(), size_m*size_n);  // Frobenius norm
  bool passed = norm <= tolerance;
  if (passed != true) {
    GPR_ERROR_PRINTF("||A - B||_F = %.18E, tol = %.18E\n", norm, tolerance);
  }
  return passed;
}

/*!\rst
  ``\det(A) = \sum_i (-1)^i A(i, 0) \det(M_{i0})`` where the minor ``M_{i0}`` drops row ``i`` and column 0.
\endrst*/
double ComputeDeterminantByCofactors(double const * restrict matrix, int size) {
  if (size == 0) {
    return 1.0;
  }
  if (size == 1) {
    return matrix[0];
  }

  const int minor_size = size - 1;
  std::vector<double> minor(minor_size*minor_size);
  double determinant = 0.0;
  double sign = 1.0;
  for (int i = 0; i < size; ++i) {
    // minor column j is matrix column j + 1, without row i
    for (int j = 0; j < minor_size; ++j) {
      double const * restrict column = matrix + (j + 1)*size;
      int minor_row = 0;
      for (int k = 0; k < size; ++k) {
        if (k != i) {
          minor[j*minor_size + minor_row] = column[k];
          ++minor_row;
        }
      }
    }
    determinant += sign*matrix[i]*ComputeDeterminantByCofactors(minor.data(), minor_size);
    sign = -sign;
  }
  return determinant;
}

void BuildSineTrainingData(int dim, int num_points, double lower, double upper,
                           UniformRandomGenerator * uniform_generator, std::vector<double> * points,
                           std::vector<double> * values) {
  std::vector<double> lower_bounds(dim, lower);
  std::vector<double> upper_bounds(dim, upper);
  points->resize(dim*num_points);
  values->resize(num_points);
  if (num_points == 0) {
    return;
  }

  ComputeLatinHypercubePointsInBox(lower_bounds.data(), upper_bounds.data(), dim, num_points, uniform_generator,
                                   points->data());
  for (int i = 0; i < num_points; ++i) {
    double value = 0.0;
    for (int d = 0; d < dim; ++d) {
      value += std::sin((*points)[i*dim + d]);
    }
    (*values)[i] = value;
  }
}

}  // end namespace gp_regression
