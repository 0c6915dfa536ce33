/*!
  \file gpr_linear_algebra.hpp
  \rst
  Dense linear algebra kernels used by the Cholesky solver and the Gaussian Process: Cholesky factorization,
  triangular solves, matrix-vector/matrix-matrix products, and a few level-1 vector utilities.

  The functions follow BLAS/LAPACK conventions (and name the equivalent BLAS/LAPACK call) so that they can be swapped
  for a vendor library when problem sizes grow.  At the sizes we handle (hundreds to a few thousand points) the
  hand-written loops are competitive and avoid a link-time dependency.

  Storage is always column-major (gpr_common.hpp, item 2).  Triangular matrices are *lower* triangular and stored in the
  lower triangle; the strict upper triangle is never read and may hold anything, even NaN.

  All functions here are ``noexcept``.  Failure (e.g., a non-SPD matrix passed to ComputeCholeskyFactorL) is reported
  through the return value; gpr_cholesky.hpp turns it into an exception.
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_LINEAR_ALGEBRA_HPP_
#define GP_REGRESSION_CPP_GPR_LINEAR_ALGEBRA_HPP_

#include "gpr_common.hpp"

namespace gp_regression {

/*!\rst
  Computes ``\|x\|_2`` with scaling to avoid overflow/underflow in the squares.

  \param
    :vector[size]: the vector x
    :size: number of elements in x
  \return
    the Euclidean norm of x
\endrst*/
double VectorNorm(double const * restrict vector, int size) noexcept GPR_PURE_FUNCTION GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT;

/*!\rst
  Transposes a 2D matrix.  ``O(num_rows*num_cols)``.

  \param
    :matrix[num_cols][num_rows]: matrix to be transposed
    :num_rows: number of rows in matrix
    :num_cols: number of columns in matrix
  \output
    :transpose[num_rows][num_cols]: transpose of matrix
\endrst*/
void MatrixTranspose(double const * restrict matrix, int num_rows, int num_cols, double * restrict transpose) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  Sets the strict upper triangle of a square matrix to 0.

  \param
    :size: dimension of matrix
    :matrix[size][size]: matrix whose upper triangle is to be zeroed
  \output
    :matrix[size][size]: lower triangle of the input; zeros above the diagonal
\endrst*/
void ZeroUpperTriangle(int size, double * restrict matrix) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  Copies the lower triangle of a square matrix into its strict upper triangle, making it exactly symmetric.

  \param
    :size: dimension of matrix
    :matrix[size][size]: matrix with a valid lower triangle
  \output
    :matrix[size][size]: symmetric matrix
\endrst*/
void SymmetrizeFromLowerTriangle(int size, double * restrict matrix) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  ``A_{ii} += alpha`` for ``i = 0..size-1``; e.g., forming ``K + \sigma^2 I``.

  \param
    :size: dimension of matrix
    :alpha: value to add to each diagonal entry
    :matrix[size][size]: square matrix
  \output
    :matrix[size][size]: input with ``alpha`` added along the diagonal
\endrst*/
inline GPR_NONNULL_POINTERS void AddToDiagonal(int size, double alpha, double * restrict matrix) noexcept {
  for (int i = 0; i < size; ++i) {
    matrix[i*(size + 1)] += alpha;
  }
}

/*!\rst
  ``vector := alpha*vector``.  Equivalent BLAS call: ``dscal(size, alpha, vector, 1);``

  \param
    :size: number of elements in vector
    :alpha: scale factor
    :vector[size]: vector to scale
  \output
    :vector[size]: scaled vector
\endrst*/
inline GPR_NONNULL_POINTERS void VectorScale(int size, double alpha, double * restrict vector) noexcept {
  for (int i = 0; i < size; ++i) {
    vector[i] *= alpha;
  }
}

/*!\rst
  ``y := alpha*x + y``.  Equivalent BLAS call: ``daxpy(size, alpha, x, 1, y, 1);``

  \param
    :size: number of elements in ``x, y``
    :alpha: scale factor on ``x``
    :x[size]: vector to scale and add
    :y[size]: vector to add to
  \output
    :y[size]: ``alpha*x + y``
\endrst*/
inline GPR_NONNULL_POINTERS void VectorAXPY(int size, double alpha, double const * restrict x, double * restrict y) noexcept {
  for (int i = 0; i < size; ++i) {
    y[i] += alpha*x[i];
  }
}

/*!\rst
  Equivalent BLAS call: ``ddot(size, vector1, 1, vector2, 1);``

  \return
    ``<vector1, vector2>``
\endrst*/
inline GPR_PURE_FUNCTION GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT double DotProduct(double const * restrict vector1, double const * restrict vector2, int size) noexcept {
  double sum = 0.0;
  for (int i = 0; i < size; ++i) {
    sum += vector1[i]*vector2[i];
  }
  return sum;
}

/*!\rst
  Cholesky factorization of a symmetric positive definite matrix, ``A = L * L^T`` with ``L`` lower triangular.
  ``O(n^3/3)`` operations.  Only the lower triangle of ``A`` is read; the strict upper triangle is untouched.

  Fails (without finishing the factorization) when the pivot of some leading minor is ``<= 0`` or NaN.
  In that case the contents of ``chol`` are partially overwritten and must not be used.  There is no absolute floor
  on the pivots, so small-scale SPD matrices (e.g., ``10^{-18} I``) factor like their rescaled counterparts.

  Equivalent LAPACK call: ``dpotrf('L', size_m, A, size_m, &info);``

  \param
    :size_m: dimension of the matrix
    :chol[size_m][size_m]: the SPD matrix ``A`` (on entry)
  \output
    :chol[size_m][size_m]: ``L`` in the lower triangle (on exit)
  \return
    0 on success; otherwise ``i``, the 1-based index of the first leading minor that is not positive definite
\endrst*/
int ComputeCholeskyFactorL(int size_m, double * restrict chol) noexcept GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT;

/*!\rst
  Solves ``A * x = b`` ('N', forward substitution) or ``A^T * x = b`` ('T', back substitution) for lower triangular,
  nonsingular ``A``.  ``O(n^2)``; does not form ``A^{-1}``.

  Equivalent BLAS call: ``dtrsv('L', trans, 'N', size_m, A, lda, x, 1);``

  \param
    :A[size_m][lda]: lower triangular matrix
    :trans: 'N' to solve ``A * x = b``, 'T' to solve ``A^T * x = b``
    :size_m: dimension of ``A``
    :lda: leading dimension of ``A`` as allocated by the caller; ``lda >= size_m``
    :x[size_m]: the right hand side ``b``
  \output
    :x[size_m]: the solution
\endrst*/
void TriangularMatrixVectorSolve(double const * restrict A, char trans, int size_m, int lda, double * restrict x) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  Multi-RHS version of TriangularMatrixVectorSolve(): solves ``A * X = B`` or ``A^T * X = B`` column by column.

  Equivalent BLAS call: ``dtrsm('L', 'L', trans, 'N', size_m, size_n, 1.0, A, lda, X, size_m);``

  \param
    :A[size_m][lda]: lower triangular matrix
    :trans: 'N' or 'T'
    :size_m: dimension of ``A``; rows of ``X``
    :size_n: columns of ``X``
    :lda: leading dimension of ``A``
    :X[size_n][size_m]: the right hand sides ``B``
  \output
    :X[size_n][size_m]: the solutions
\endrst*/
void TriangularMatrixMatrixSolve(double const * restrict A, char trans, int size_m, int size_n, int lda, double * restrict X) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  Solves ``A * x = b`` in place given the Cholesky factor ``L`` of ``A`` (``A = L * L^T``):
  ``x = L^{-T} (L^{-1} b)``.

  Equivalent LAPACK call: ``dpotrs('L', size_m, 1, L, size_m, x, size_m, &info);``

  \param
    :L[size_m][size_m]: Cholesky factor in the lower triangle
    :size_m: dimension of ``L``
    :x[size_m]: the right hand side ``b``
  \output
    :x[size_m]: the solution ``A^{-1} b``
\endrst*/
inline GPR_NONNULL_POINTERS void CholeskyFactorLMatrixVectorSolve(double const * restrict L, int size_m, double * restrict x) noexcept {
  TriangularMatrixVectorSolve(L, 'N', size_m, size_m, x);
  TriangularMatrixVectorSolve(L, 'T', size_m, size_m, x);
}

/*!\rst
  Multi-RHS version of CholeskyFactorLMatrixVectorSolve().

  Equivalent LAPACK call: ``dpotrs('L', size_m, size_n, L, size_m, X, size_m, &info);``
\endrst*/
inline GPR_NONNULL_POINTERS void CholeskyFactorLMatrixMatrixSolve(double const * restrict L, int size_m, int size_n, double * restrict X) noexcept {
  TriangularMatrixMatrixSolve(L, 'N', size_m, size_n, size_m, X);
  TriangularMatrixMatrixSolve(L, 'T', size_m, size_n, size_m, X);
}

/*!\rst
  In-place ``x := A * x`` or ``x := A^T * x`` for lower triangular ``A``.  The strict upper triangle is not read.

  Equivalent BLAS call: ``dtrmv('L', trans, 'N', size_m, A, size_m, x, 1);``

  \param
    :A[size_m][size_m]: lower triangular matrix
    :trans: 'N' for ``A * x``, 'T' for ``A^T * x``
    :size_m: dimension of ``A, x``
    :x[size_m]: vector to multiply
  \output
    :x[size_m]: the product
\endrst*/
void TriangularMatrixVectorMultiply(double const * restrict A, char trans, int size_m, double * restrict x) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  ``y := alpha * op(A) * x + beta * y`` with ``op(A) = A`` ('N') or ``A^T`` ('T'), ``A`` a general matrix.
  When ``beta == 0``, ``y`` is not read on input.

  Equivalent BLAS call: ``dgemv(trans, size_m, size_n, alpha, A, lda, x, 1, beta, y, 1);``

  \param
    :A[size_n][lda]: matrix with ``size_m`` rows and ``size_n`` columns
    :trans: 'N' or 'T'
    :x[size_n OR size_m]: ``size_n`` entries for 'N', ``size_m`` for 'T'
    :alpha: scale factor on ``op(A) * x``
    :beta: scale factor on ``y``
    :size_m: rows of ``A``
    :size_n: columns of ``A``
    :lda: leading dimension of ``A``; ``lda >= size_m``
  \output
    :y[size_m OR size_n]: ``size_m`` entries for 'N', ``size_n`` for 'T'
\endrst*/
void GeneralMatrixVectorMultiply(double const * restrict A, char trans, double const * restrict x, double alpha, double beta, int size_m, int size_n, int lda, double * restrict y) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  ``C := alpha * op(A) * B + beta * C`` with ``op(A) = A`` ('N') or ``A^T`` ('T'); one GeneralMatrixVectorMultiply()
  per column of ``B``.

  Equivalent BLAS call: ``dgemm(transA, 'N', size_m, size_n, size_k, alpha, A, lda, B, size_k, beta, C, size_m);``

  \param
    :A[size_k][size_m] ('N') or A[size_m][size_k] ('T'): left multiplicand
    :transA: 'N' or 'T'
    :B[size_n][size_k]: right multiplicand
    :alpha: scale factor on ``op(A) * B``
    :beta: scale factor on ``C``
    :size_m: rows of ``op(A)`` and ``C``
    :size_k: columns of ``op(A)``, rows of ``B``
    :size_n: columns of ``B`` and ``C``
  \output
    :C[size_n][size_m]: the result
\endrst*/
void GeneralMatrixMatrixMultiply(double const * restrict A, char transA, double const * restrict B, double alpha, double beta, int size_m, int size_k, int size_n, double * restrict C) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  ``L^{-1}`` for lower triangular, nonsingular ``L``; the result is lower triangular with zeros above the diagonal.

  Explicit inverses amplify round-off for ill-conditioned ``L``; prefer the triangular solves whenever the inverse is
  only applied to vectors.

  \param
    :L[size_m][size_m]: lower triangular matrix
    :size_m: dimension of ``L``
  \output
    :inv_matrix[size_m][size_m]: ``L^{-1}``
\endrst*/
void TriangularMatrixInverse(double const * restrict L, int size_m, double * restrict inv_matrix) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  ``A^{-1} = L^{-T} L^{-1}`` given the Cholesky factor ``L`` of an SPD matrix ``A``.  Same caveats as
  TriangularMatrixInverse().

  \param
    :L[size_m][size_m]: Cholesky factor of ``A`` in the lower triangle
    :size_m: dimension of ``A``
  \output
    :inv_matrix[size_m][size_m]: ``A^{-1}``, stored in full
\endrst*/
void SPDMatrixInverse(double const * restrict L, int size_m, double * restrict inv_matrix) noexcept GPR_NONNULL_POINTERS;

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_LINEAR_ALGEBRA_HPP_
