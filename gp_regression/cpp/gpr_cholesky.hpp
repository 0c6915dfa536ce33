/*!
  \file gpr_cholesky.hpp
  \rst
  CholeskySolver factors a symmetric positive definite matrix, ``M = R * R^T`` (``R`` lower triangular), and exposes
  the operations the Gaussian Process needs from that factor: triangular solves, full solves, the log determinant and
  (on request only) the explicit inverse.

  The solver never adds noise or regularization on its own.  Callers form ``K + \sigma^2 I`` themselves before
  factoring.  If the factorization hits a non-positive pivot, the ctor throws NotPositiveDefiniteException.
  FactorWithJitter() is the single opt-in exception to "no silent regularization": it retries with a growing
  diagonal shift, as configured by JitterParameters.

  Solves cost ``O(n^2)`` per right hand side; the factorization costs ``O(n^3/3)``.
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_CHOLESKY_HPP_
#define GP_REGRESSION_CPP_GPR_CHOLESKY_HPP_

#include <string>
#include <vector>

#include "gpr_common.hpp"
#include "gpr_model_parameters.hpp"

namespace gp_regression {

/*!\rst
  Immutable Cholesky factorization of an SPD matrix ``M``.

  Only the lower triangle of the input matrix is read.  Solve functions are const and may be called concurrently.
\endrst*/
class CholeskySolver {
 public:
  /*!\rst
    Factor ``M``.

    \param
      :matrix[size][size]: the SPD matrix ``M`` (only the lower triangle is read)
      :size: dimension of ``M``
      :matrix_name[]: description of ``M`` used in error messages (e.g., "K + noise_variance * I")
    \raise
      NotPositiveDefiniteException if ``M`` is not (numerically) positive definite
  \endrst*/
  CholeskySolver(double const * restrict matrix, int size, char const * matrix_name);

  /*!\rst
    Factor ``M + jitter * I``.  ``matrix`` is not modified.

    \param
      :jitter: value added to the diagonal of ``M`` before factoring (>= 0)
  \endrst*/
  CholeskySolver(double const * restrict matrix, int size, char const * matrix_name, double jitter);

  CholeskySolver(CholeskySolver&& other) = default;

  int size() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return size_;
  }

  //! the diagonal shift that was added before factoring; 0.0 unless built with jitter
  double jitter() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return jitter_;
  }

  const std::string& matrix_name() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return matrix_name_;
  }

  /*!\rst
    \return
      ``R``, column-major ``[size][size]``, with zeros in the strict upper triangle
  \endrst*/
  const std::vector<double>& factor() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return factor_;
  }

  /*!\rst
    ``b := R^{-1} b`` (forward substitution).

    \param
      :b[size]: right hand side
    \output
      :b[size]: ``R^{-1} b``
  \endrst*/
  void SolveLower(double * restrict b) const noexcept GPR_NONNULL_POINTERS;

  /*!\rst
    ``b := R^{-T} b`` (back substitution).
  \endrst*/
  void SolveUpper(double * restrict b) const noexcept GPR_NONNULL_POINTERS;

  /*!\rst
    ``b := M^{-1} b = R^{-T} R^{-1} b``, two triangular solves.
  \endrst*/
  void Solve(double * restrict b) const noexcept GPR_NONNULL_POINTERS;

  /*!\rst
    SolveLower() applied to each column of ``B``.

    \param
      :num_rhs: number of columns of ``B``
      :B[num_rhs][size]: right hand sides
    \output
      :B[num_rhs][size]: ``R^{-1} B``
  \endrst*/
  void SolveLowerMatrix(int num_rhs, double * restrict B) const noexcept GPR_NONNULL_POINTERS;

  //! SolveUpper() applied to each column of ``B``
  void SolveUpperMatrix(int num_rhs, double * restrict B) const noexcept GPR_NONNULL_POINTERS;

  //! Solve() applied to each column of ``B``
  void SolveMatrix(int num_rhs, double * restrict B) const noexcept GPR_NONNULL_POINTERS;

  /*!\rst
    ``\log\det M = 2 \sum_i \log R_{ii}``; computed once at construction.  Never overflows the way ``\det M`` would.
  \endrst*/
  double LogDeterminant() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return log_determinant_;
  }

  /*!\rst
    Explicit ``M^{-1} = R^{-T} R^{-1}``, via the triangular inverse ``R^{-1}``.  ``O(n^3)``.

    Solves are cheaper and more accurate; only form the inverse when the dense matrix itself is required.

    \return
      ``M^{-1}``, column-major ``[size][size]``, stored in full
  \endrst*/
  std::vector<double> Inverse() const GPR_WARN_UNUSED_RESULT;

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(CholeskySolver);

 private:
  //! dimension of the factored matrix
  int size_;
  //! diagonal shift added before factoring
  double jitter_;
  //! description of the factored matrix, for error messages
  std::string matrix_name_;
  //! the Cholesky factor ``R`` (strict upper triangle zeroed)
  std::vector<double> factor_;
  //! ``\log\det(M + jitter * I)``
  double log_determinant_;
};

/*!\rst
  Factor ``M``; if that fails and jitter is enabled, retry with ``M + jitter_k * I`` where
  ``jitter_k = initial_jitter * growth_factor^k``, ``k = 0, ..., max_num_attempts - 1``.  Each retry is logged as a
  warning.  The returned solver's ``jitter()`` reports the shift that succeeded.

  With jitter disabled (the JitterParameters default) this is exactly ``CholeskySolver(matrix, size, matrix_name)``.

  \param
    :matrix[size][size]: the SPD matrix ``M`` (only the lower triangle is read)
    :size: dimension of ``M``
    :matrix_name[]: description of ``M`` for error messages
    :jitter_parameters: retry policy
  \return
    the factorization
  \raise
    ConfigurationException if enabled jitter settings are invalid
    NotPositiveDefiniteException from the last attempt if every attempt fails
\endrst*/
CholeskySolver FactorWithJitter(double const * restrict matrix, int size, char const * matrix_name,
                                const JitterParameters& jitter_parameters) GPR_WARN_UNUSED_RESULT;

/*!\rst
  Throws ConfigurationException if ``jitter_parameters`` is enabled but its initial jitter is not positive or its growth
  factor is below 1.  Negative ``max_num_attempts`` is also rejected.
\endrst*/
void ValidateJitterParameters(const JitterParameters& jitter_parameters);

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_CHOLESKY_HPP_
