/*!
  \file gpr_linear_algebra.cpp
  \rst
  Implementations of the dense linear algebra kernels in gpr_linear_algebra.hpp.

  Loops walk matrices column by column so that the innermost loop has unit stride (column-major storage, see
  gpr_common.hpp, item 2).  Most routines are therefore written in "axpy" form (a column scaled and added to a
  vector) or "dot" form (a column dotted with a vector), reusing VectorAXPY() and DotProduct().
\endrst*/

#include "gpr_linear_algebra.hpp"

#include <cmath>

#include <algorithm>
#include <vector>

#include "gpr_common.hpp"
#include "gpr_logging.hpp"

namespace gp_regression {

/*!\rst
  Scaled sum of squares (LAPACK ``dnrm2``): track the largest magnitude seen so far and accumulate squares of the
  entries divided by it, so no square can overflow.
\endrst*/
double VectorNorm(double const * restrict vector, int size) noexcept {
  double scale = 0.0;
  double scaled_sum_of_squares = 1.0;
  for (int i = 0; i < size; ++i) {
    if (vector[i] == 0.0) {
      continue;
    }
    const double magnitude = std::fabs(vector[i]);
    if (magnitude > scale) {
      scaled_sum_of_squares = 1.0 + scaled_sum_of_squares*Square(scale/magnitude);
      scale = magnitude;
    } else {
      scaled_sum_of_squares += Square(magnitude/scale);
    }
  }
  return scale*std::sqrt(scaled_sum_of_squares);
}

void MatrixTranspose(double const * restrict matrix, int num_rows, int num_cols, double * restrict transpose) noexcept {
  // read matrix contiguously (column j), scatter into row j of the transpose
  for (int j = 0; j < num_cols; ++j) {
    for (int i = 0; i < num_rows; ++i) {
      transpose[i*num_cols + j] = matrix[i];
    }
    matrix += num_rows;
  }
}

void ZeroUpperTriangle(int size, double * restrict matrix) noexcept {
  for (int j = 1; j < size; ++j) {
    std::fill(matrix + j*size, matrix + j*size + j, 0.0);
  }
}

void SymmetrizeFromLowerTriangle(int size, double * restrict matrix) noexcept {
  // A(i, j) = A(j, i) for i < j
  for (int j = 1; j < size; ++j) {
    for (int i = 0; i < j; ++i) {
      matrix[j*size + i] = matrix[i*size + j];
    }
  }
}

/*!\rst
  Left-looking ("gaxpy") Cholesky, Golub & Van Loan, Matrix Computations, Algorithm 4.2.1.
  Column ``j`` of ``L`` is produced from column ``j`` of ``A`` by subtracting ``L(j, k) * L(j:n, k)`` for every earlier
  column ``k``, then dividing by the square root of the resulting pivot::

    for j = 0..n-1:
      v(j:n) = A(j:n, j) - sum_{k < j} L(j, k) * L(j:n, k)
      L(j:n, j) = v(j:n) / sqrt(v(j))

  Every update is a unit-stride VectorAXPY() on the trailing part of a column, and each column of ``A`` is read
  only once it is needed.  Columns ``> j`` are untouched when pivot ``j`` fails.
\endrst*/
int ComputeCholeskyFactorL(int size_m, double * restrict chol) noexcept {
  for (int j = 0; j < size_m; ++j) {
    double * restrict column_j = chol + j*size_m;
    const int trailing_size = size_m - j;

    for (int k = 0; k < j; ++k) {
      double const * restrict column_k = chol + k*size_m;
      VectorAXPY(trailing_size, -column_k[j], column_k + j, column_j + j);
    }

    // !(x > 0.0) also rejects NaN pivots
    if (unlikely(!(column_j[j] > 0.0))) {
      GPR_VERBOSE_PRINTF("Cholesky pivot %d of %d is not positive: %.18E\n", j + 1, size_m, column_j[j]);
      return j + 1;
    }

    const double pivot = std::sqrt(column_j[j]);
    column_j[j] = pivot;
    VectorScale(trailing_size - 1, 1.0/pivot, column_j + j + 1);
  }
  return 0;
}

/*!\rst
  'N': column-oriented forward substitution; once ``x_j`` is known, column ``j`` of ``A`` (below the diagonal) is
  eliminated from the remaining right hand side.  Columns whose ``x_j`` is 0 are skipped, which makes solves against
  unit vectors (TriangularMatrixInverse()) cheap.

  'T': row ``j`` of ``A^T`` is column ``j`` of ``A``, so back substitution is a sequence of dot products with the
  already-solved tail of ``x``.
\endrst*/
void TriangularMatrixVectorSolve(double const * restrict A, char trans, int size_m, int lda, double * restrict x) noexcept {
  if (trans == 'N') {
    for (int j = 0; j < size_m; ++j) {
      double const * restrict column_j = A + j*lda;
      if (x[j] != 0.0) {
        x[j] /= column_j[j];
        VectorAXPY(size_m - j - 1, -x[j], column_j + j + 1, x + j + 1);
      }
    }
  } else {
    for (int j = size_m - 1; j >= 0; --j) {
      double const * restrict column_j = A + j*lda;
      x[j] = (x[j] - DotProduct(column_j + j + 1, x + j + 1, size_m - j - 1))/column_j[j];
    }
  }
}

void TriangularMatrixMatrixSolve(double const * restrict A, char trans, int size_m, int size_n, int lda, double * restrict X) noexcept {
  for (int k = 0; k < size_n; ++k) {
    TriangularMatrixVectorSolve(A, trans, size_m, lda, X + k*size_m);
  }
}

/*!\rst
  'N' runs from the last column to the first so that each ``x_j`` is still the input value when its column is
  scattered into the rows below it.  'T' runs forward, each output a dot product of a column with the unmodified tail.
\endrst*/
void TriangularMatrixVectorMultiply(double const * restrict A, char trans, int size_m, double * restrict x) noexcept {
  if (trans == 'N') {
    for (int j = size_m - 1; j >= 0; --j) {
      double const * restrict column_j = A + j*size_m;
      VectorAXPY(size_m - j - 1, x[j], column_j + j + 1, x + j + 1);
      x[j] *= column_j[j];
    }
  } else {
    for (int j = 0; j < size_m; ++j) {
      double const * restrict column_j = A + j*size_m;
      x[j] = DotProduct(column_j + j, x + j, size_m - j);
    }
  }
}

/*!\rst
  'N' forms ``y`` as a weighted sum of the columns of ``A`` (weights ``alpha*x``); 'T' forms each ``y_i`` as the dot
  product of column ``i`` with ``x``.  Both read ``A`` with unit stride.
\endrst*/
void GeneralMatrixVectorMultiply(double const * restrict A, char trans, double const * restrict x, double alpha, double beta, int size_m, int size_n, int lda, double * restrict y) noexcept {
  const int size_y = (trans == 'N') ? size_m : size_n;
  if (beta == 0.0) {
    std::fill(y, y + size_y, 0.0);
  } else if (beta != 1.0) {
    VectorScale(size_y, beta, y);
  }

  if (trans == 'N') {
    for (int j = 0; j < size_n; ++j) {
      VectorAXPY(size_m, alpha*x[j], A + j*lda, y);
    }
  } else {
    for (int j = 0; j < size_n; ++j) {
      y[j] += alpha*DotProduct(A + j*lda, x, size_m);
    }
  }
}

void GeneralMatrixMatrixMultiply(double const * restrict A, char transA, double const * restrict B, double alpha, double beta, int size_m, int size_k, int size_n, double * restrict C) noexcept {
  // op(A) is size_m x size_k; in storage A is size_m x size_k ('N') or size_k x size_m ('T')
  const int rows_of_A = (transA == 'N') ? size_m : size_k;
  const int cols_of_A = (transA == 'N') ? size_k : size_m;
  for (int j = 0; j < size_n; ++j) {
    GeneralMatrixVectorMultiply(A, transA, B + j*size_k, alpha, beta, rows_of_A, cols_of_A, rows_of_A, C + j*size_m);
  }
}

/*!\rst
  Column ``i`` of ``L^{-1}`` solves ``L x = e_i``.  Its first ``i`` entries are 0, so only the trailing
  ``(size_m - i) x (size_m - i)`` block of ``L`` (which starts at ``L(i, i)``) takes part in the solve.
\endrst*/
void TriangularMatrixInverse(double const * restrict L, int size_m, double * restrict inv_matrix) noexcept {
  std::fill(inv_matrix, inv_matrix + size_m*size_m, 0.0);
  for (int i = 0; i < size_m; ++i) {
    double * restrict column_i = inv_matrix + i*size_m;
    column_i[i] = 1.0;
    TriangularMatrixVectorSolve(L + i*(size_m + 1), 'N', size_m - i, size_m, column_i + i);
  }
}

void SPDMatrixInverse(double const * restrict L, int size_m, double * restrict inv_matrix) noexcept {
  std::vector<double> L_inverse(size_m*size_m);
  TriangularMatrixInverse(L, size_m, L_inverse.data());
  GeneralMatrixMatrixMultiply(L_inverse.data(), 'T', L_inverse.data(), 1.0, 0.0, size_m, size_m, size_m, inv_matrix);
}

}  // end namespace gp_regression
