/*!
  \file gpr_cholesky.cpp
  \rst
  Implementation of CholeskySolver and the jittered factorization retry loop.
\endrst*/

#include "gpr_cholesky.hpp"

#include <cmath>

#include <limits>
#include <string>
#include <vector>

#include "gpr_common.hpp"
#include "gpr_exception.hpp"
#include "gpr_linear_algebra.hpp"
#include "gpr_logging.hpp"
#include "gpr_model_parameters.hpp"

namespace gp_regression {

CholeskySolver::CholeskySolver(double const * restrict matrix, int size, char const * matrix_name)
    : CholeskySolver(matrix, size, matrix_name, 0.0) {
}

CholeskySolver::CholeskySolver(double const * restrict matrix, int size, char const * matrix_name, double jitter)
    : size_(size),
      jitter_(jitter),
      matrix_name_(matrix_name),
      factor_(matrix, matrix + size*size),
      log_determinant_(0.0) {
  if (jitter_ != 0.0) {
    AddToDiagonal(size_, jitter_, factor_.data());
  }

  const int leading_minor_index = ComputeCholeskyFactorL(size_, factor_.data());
  if (unlikely(leading_minor_index != 0)) {
    // factor_ was partially overwritten; report the matrix that was actually passed to the factorization
    std::vector<double> attempted_matrix(matrix, matrix + size*size);
    AddToDiagonal(size_, jitter_, attempted_matrix.data());
    GPR_THROW_EXCEPTION(NotPositiveDefiniteException, "Cholesky factorization failed.", matrix_name,
                        attempted_matrix.data(), size_, leading_minor_index);
  }
  ZeroUpperTriangle(size_, factor_.data());

  for (int i = 0; i < size_; ++i) {
    log_determinant_ += std::log(factor_[i*(size_ + 1)]);
  }
  log_determinant_ *= 2.0;
}

void CholeskySolver::SolveLower(double * restrict b) const noexcept {
  TriangularMatrixVectorSolve(factor_.data(), 'N', size_, size_, b);
}

void CholeskySolver::SolveUpper(double * restrict b) const noexcept {
  TriangularMatrixVectorSolve(factor_.data(), 'T', size_, size_, b);
}

void CholeskySolver::Solve(double * restrict b) const noexcept {
  CholeskyFactorLMatrixVectorSolve(factor_.data(), size_, b);
}

void CholeskySolver::SolveLowerMatrix(int num_rhs, double * restrict B) const noexcept {
  TriangularMatrixMatrixSolve(factor_.data(), 'N', size_, num_rhs, size_, B);
}

void CholeskySolver::SolveUpperMatrix(int num_rhs, double * restrict B) const noexcept {
  TriangularMatrixMatrixSolve(factor_.data(), 'T', size_, num_rhs, size_, B);
}

void CholeskySolver::SolveMatrix(int num_rhs, double * restrict B) const noexcept {
  CholeskyFactorLMatrixMatrixSolve(factor_.data(), size_, num_rhs, B);
}

std::vector<double> CholeskySolver::Inverse() const {
  std::vector<double> inverse(size_*size_);
  if (size_ > 0) {
    SPDMatrixInverse(factor_.data(), size_, inverse.data());
  }
  return inverse;
}

void ValidateJitterParameters(const JitterParameters& jitter_parameters) {
  if (unlikely(jitter_parameters.max_num_attempts < 0)) {
    GPR_THROW_EXCEPTION(ConfigurationException, "Number of jitter attempts cannot be negative.", "max_num_attempts",
                        static_cast<double>(jitter_parameters.max_num_attempts), 0.0,
                        static_cast<double>(std::numeric_limits<int>::max()));
  }
  if (!jitter_parameters.enabled()) {
    return;
  }
  if (unlikely(!(jitter_parameters.initial_jitter > 0.0))) {
    GPR_THROW_EXCEPTION(ConfigurationException, "Initial jitter must be positive.", "initial_jitter",
                        jitter_parameters.initial_jitter, std::numeric_limits<double>::min(),
                        std::numeric_limits<double>::max());
  }
  if (unlikely(!(jitter_parameters.growth_factor >= 1.0))) {
    GPR_THROW_EXCEPTION(ConfigurationException, "Jitter growth factor must be at least 1.", "growth_factor",
                        jitter_parameters.growth_factor, 1.0, std::numeric_limits<double>::max());
  }
}

CholeskySolver FactorWithJitter(double const * restrict matrix, int size, char const * matrix_name,
                                const JitterParameters& jitter_parameters) {
  ValidateJitterParameters(jitter_parameters);

  double jitter = 0.0;
  for (int attempt = 0; ; ++attempt) {
    try {
      return CholeskySolver(matrix, size, matrix_name, jitter);
    } catch (const NotPositiveDefiniteException& exception) {
      if (attempt >= jitter_parameters.max_num_attempts) {
        throw;
      }
      GPR_VERBOSE_PRINTF("%s\n", exception.what());
    }

    jitter = (attempt == 0) ? jitter_parameters.initial_jitter : jitter*jitter_parameters.growth_factor;
    GPR_WARNING_PRINTF("%d x %d matrix (%s) is not positive definite; retrying with jitter %.6E (attempt %d of %d)\n",
                       size, size, matrix_name, jitter, attempt + 1, jitter_parameters.max_num_attempts);
  }
}

}  // end namespace gp_regression
