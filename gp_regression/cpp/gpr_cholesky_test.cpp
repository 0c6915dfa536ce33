/*!
  \file gpr_cholesky_test.cpp
  \rst
  Routines to test the functions in gpr_cholesky.cpp.

  Well-conditioned inputs are random SPD matrices with ``size`` added to the diagonal; for these, backward stable
  factorizations and solves have residuals bounded by a small multiple of ``size * \epsilon * \|A\|``.
\endrst*/

#include "gpr_cholesky_test.hpp"

#include <cmath>

#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "gpr_cholesky.hpp"
#include "gpr_common.hpp"
#include "gpr_exception.hpp"
#include "gpr_linear_algebra.hpp"
#include "gpr_linear_algebra_test.hpp"
#include "gpr_logging.hpp"
#include "gpr_model_parameters.hpp"
#include "gpr_random.hpp"
#include "gpr_test_utils.hpp"

namespace gp_regression {

namespace {

void BuildWellConditionedSPDMatrix(int size, UniformRandomGenerator * uniform_generator, double * restrict matrix) noexcept {
  BuildRandomSPDMatrix(size, uniform_generator, matrix);
  AddToDiagonal(size, static_cast<double>(size), matrix);
}

/*!\rst
  Checks ``\|R R^T - A\|_F`` and the solves ``A x = b`` (one and several right hand sides) for random SPD ``A``.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestFactorAndSolve() {
  int total_errors = 0;
  const double epsilon = std::numeric_limits<double>::epsilon();
  const int num_rhs = 3;
  UniformRandomGenerator uniform_generator(12345);

  const int sizes[] = {1, 2, 5, 13, 32};
  for (const int size : sizes) {
    std::vector<double> matrix(size*size);
    BuildWellConditionedSPDMatrix(size, &uniform_generator, matrix.data());
    const double matrix_norm = VectorNorm(matrix.data(), size*size);

    CholeskySolver solver(matrix.data(), size, "random SPD");
    if (!CheckIntEquals(solver.size(), size) || solver.jitter() != 0.0 || solver.matrix_name() != "random SPD") {
      ++total_errors;
    }

    // R * R^T
    std::vector<double> factor_transpose(size*size);
    std::vector<double> reconstruction(size*size);
    MatrixTranspose(solver.factor().data(), size, size, factor_transpose.data());
    GeneralMatrixMatrixMultiply(solver.factor().data(), 'N', factor_transpose.data(), 1.0, 0.0, size, size, size,
                                reconstruction.data());
    if (!CheckMatrixNormWithin(reconstruction.data(), matrix.data(), size, size, 10.0*size*epsilon*matrix_norm)) {
      GPR_ERROR_PRINTF("size %d: R * R^T != A\n", size);
      ++total_errors;
    }

    std::vector<double> rhs(size*num_rhs);
    BuildRandomVector(size*num_rhs, -1.0, 1.0, &uniform_generator, rhs.data());

    std::vector<double> solution(rhs);
    solver.SolveMatrix(num_rhs, solution.data());
    for (int k = 0; k < num_rhs; ++k) {
      double const * x = solution.data() + k*size;
      const double residual = ResidualNorm(matrix.data(), x, rhs.data() + k*size, size);
      if (residual > 10.0*size*epsilon*matrix_norm*VectorNorm(x, size)) {
        GPR_ERROR_PRINTF("size %d, rhs %d: residual %.18E too large\n", size, k, residual);
        ++total_errors;
      }

      // single right hand side solves agree with the multi-rhs solve
      std::vector<double> single_solution(rhs.begin() + k*size, rhs.begin() + (k + 1)*size);
      solver.Solve(single_solution.data());
      if (!CheckMatrixNormWithin(single_solution.data(), x, size, 1, 10.0*size*epsilon*VectorNorm(x, size))) {
        ++total_errors;
      }

      // Solve = SolveUpper(SolveLower())
      std::vector<double> two_step_solution(rhs.begin() + k*size, rhs.begin() + (k + 1)*size);
      solver.SolveLower(two_step_solution.data());
      solver.SolveUpper(two_step_solution.data());
      if (two_step_solution != single_solution) {
        ++total_errors;
      }
    }

    // SolveMatrix = SolveUpperMatrix(SolveLowerMatrix())
    std::vector<double> two_step_solution(rhs);
    solver.SolveLowerMatrix(num_rhs, two_step_solution.data());
    solver.SolveUpperMatrix(num_rhs, two_step_solution.data());
    if (two_step_solution != solution) {
      ++total_errors;
    }
  }

  return total_errors;
}

/*!\rst
  ``\log\det A`` from the factor must match the log of a cofactor expansion determinant on small matrices, and
  ``A * A^{-1}`` must be the identity.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestLogDeterminantAndInverse() {
  int total_errors = 0;
  const double epsilon = std::numeric_limits<double>::epsilon();
  UniformRandomGenerator uniform_generator(271828);

  for (int size = 1; size <= 5; ++size) {
    std::vector<double> matrix(size*size);
    BuildWellConditionedSPDMatrix(size, &uniform_generator, matrix.data());
    CholeskySolver solver(matrix.data(), size, "random SPD");

    const double determinant = ComputeDeterminantByCofactors(matrix.data(), size);
    if (!CheckDoubleWithinRelative(solver.LogDeterminant(), std::log(determinant), 1.0e-12)) {
      GPR_ERROR_PRINTF("size %d: log determinant mismatch\n", size);
      ++total_errors;
    }
  }

  {
    // diag(2, 3, 4): log(24)
    const std::vector<double> matrix = {2.0, 0.0, 0.0,
                                        0.0, 3.0, 0.0,
                                        0.0, 0.0, 4.0};
    CholeskySolver solver(matrix.data(), 3, "diagonal");
    if (!CheckDoubleWithinRelative(solver.LogDeterminant(), std::log(24.0), 4.0*epsilon)) {
      ++total_errors;
    }
  }

  const int sizes[] = {1, 4, 20};
  for (const int size : sizes) {
    std::vector<double> matrix(size*size);
    BuildWellConditionedSPDMatrix(size, &uniform_generator, matrix.data());
    CholeskySolver solver(matrix.data(), size, "random SPD");

    std::vector<double> inverse(solver.Inverse());
    if (!CheckMatrixIsSymmetric(inverse.data(), size, 10.0*size*epsilon*VectorNorm(inverse.data(), size*size))) {
      ++total_errors;
    }

    std::vector<double> product(size*size);
    std::vector<double> identity(size*size);
    GeneralMatrixMatrixMultiply(matrix.data(), 'N', inverse.data(), 1.0, 0.0, size, size, size, product.data());
    BuildIdentityMatrix(size, identity.data());
    if (!CheckMatrixNormWithin(product.data(), identity.data(), size, size, 100.0*size*epsilon)) {
      GPR_ERROR_PRINTF("size %d: A * A^-1 != I\n", size);
      ++total_errors;
    }
  }

  return total_errors;
}

/*!\rst
  Non-SPD input must raise NotPositiveDefiniteException carrying the matrix name, its size, the failing leading
  minor, and a copy of the matrix that was factored.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestNotPositiveDefinite() {
  int total_errors = 0;

  // eigenvalues 3, -1
  const std::vector<double> indefinite_matrix = {1.0, 2.0,
                                                 2.0, 1.0};
  ++total_errors;
  try {
    CholeskySolver solver(indefinite_matrix.data(), 2, "indefinite");
    GPR_ERROR_PRINTF("indefinite matrix factored; log det = %.18E\n", solver.LogDeterminant());
  } catch (const NotPositiveDefiniteException& exception) {
    if (exception.matrix_name() == "indefinite" && CheckIntEquals(exception.num_rows(), 2) &&
        CheckIntEquals(exception.leading_minor_index(), 2) && exception.matrix() == indefinite_matrix) {
      --total_errors;
    }
  }

  // the reported matrix includes the jitter
  ++total_errors;
  try {
    CholeskySolver solver(indefinite_matrix.data(), 2, "indefinite", 0.5);
    GPR_ERROR_PRINTF("indefinite matrix factored; log det = %.18E\n", solver.LogDeterminant());
  } catch (const NotPositiveDefiniteException& exception) {
    const std::vector<double> shifted_matrix = {1.5, 2.0,
                                                2.0, 1.5};
    if (exception.matrix() == shifted_matrix) {
      --total_errors;
    }
  }

  // rank 1: the second pivot is exactly 0
  const int size = 3;
  const std::vector<double> ones_matrix(size*size, 1.0);
  ++total_errors;
  try {
    CholeskySolver solver(ones_matrix.data(), size, "ones");
    GPR_ERROR_PRINTF("singular matrix factored; log det = %.18E\n", solver.LogDeterminant());
  } catch (const NotPositiveDefiniteException& exception) {
    const std::string message(exception.what());
    if (CheckIntEquals(exception.leading_minor_index(), 2) &&
        message.find("3 x 3 matrix (ones)") != std::string::npos &&
        message.find("; 2-th leading minor") != std::string::npos) {
      --total_errors;
    }
  }

  return total_errors;
}

/*!\rst
  Positive definiteness does not depend on scale: ``c * A`` must factor for tiny ``c > 0`` whenever ``A`` does, with
  ``\log\det(c A) = n \log c + \log\det A``.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestSmallScaleMatrices() {
  int total_errors = 0;
  const double epsilon = std::numeric_limits<double>::epsilon();

  // 1e-18 * I: every pivot is 1e-18
  {
    const int size = 3;
    const double scale = 1.0e-18;
    std::vector<double> matrix(size*size, 0.0);
    AddToDiagonal(size, scale, matrix.data());
    try {
      // the solver owns a copy of the name
      CholeskySolver solver(matrix.data(), size, std::string("tiny identity").c_str());
      if (solver.matrix_name() != "tiny identity") {
        ++total_errors;
      }
      for (int i = 0; i < size; ++i) {
        if (!CheckDoubleWithinRelative(solver.factor()[i*size + i], 1.0e-9, 4.0*epsilon)) {
          ++total_errors;
        }
      }
      if (!CheckDoubleWithinRelative(solver.LogDeterminant(), size*std::log(scale), 4.0*epsilon)) {
        ++total_errors;
      }
      std::vector<double> rhs = {1.0e-18, -2.0e-18, 3.0e-18};
      solver.Solve(rhs.data());
      if (!CheckDoubleWithinRelative(rhs[0], 1.0, 8.0*epsilon) ||
          !CheckDoubleWithinRelative(rhs[1], -2.0, 8.0*epsilon) ||
          !CheckDoubleWithinRelative(rhs[2], 3.0, 8.0*epsilon)) {
        ++total_errors;
      }
    } catch (const NotPositiveDefiniteException& exception) {
      GPR_ERROR_PRINTF("%s\n", exception.what());
      ++total_errors;
    }
  }

  // scaled random SPD matrices agree with their unscaled originals
  UniformRandomGenerator uniform_generator(2718);
  const double scale = 1.0e-20;
  const int sizes[] = {1, 4, 9};
  for (const int size : sizes) {
    std::vector<double> matrix(size*size);
    BuildWellConditionedSPDMatrix(size, &uniform_generator, matrix.data());
    std::vector<double> scaled_matrix(matrix);
    VectorScale(size*size, scale, scaled_matrix.data());

    try {
      CholeskySolver solver(matrix.data(), size, "random SPD");
      CholeskySolver scaled_solver(scaled_matrix.data(), size, "scaled random SPD");
      const double log_scale = static_cast<double>(size)*std::log(scale);
      if (!CheckDoubleWithin(scaled_solver.LogDeterminant(), solver.LogDeterminant() + log_scale,
                             100.0*size*epsilon*std::fabs(log_scale))) {
        ++total_errors;
      }

      // (c A)^{-1} b = c^{-1} A^{-1} b
      std::vector<double> rhs(size);
      BuildRandomVector(size, -1.0, 1.0, &uniform_generator, rhs.data());
      std::vector<double> solution(rhs);
      solver.Solve(solution.data());
      std::vector<double> scaled_solution(rhs);
      scaled_solver.Solve(scaled_solution.data());
      VectorScale(size, scale, scaled_solution.data());
      if (!CheckMatrixNormWithin(scaled_solution.data(), solution.data(), size, 1,
                                 100.0*size*epsilon*VectorNorm(solution.data(), size))) {
        ++total_errors;
      }
    } catch (const NotPositiveDefiniteException& exception) {
      GPR_ERROR_PRINTF("size %d: %s\n", size, exception.what());
      ++total_errors;
    }
  }

  return total_errors;
}

/*!\rst
  Checks the retry policy of FactorWithJitter(): no shift for SPD input, the smallest sufficient shift for singular
  input, rethrow when jitter is disabled or exhausted.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestFactorWithJitter() {
  int total_errors = 0;
  const int size = 3;
  const std::vector<double> ones_matrix(size*size, 1.0);
  const JitterParameters jitter_parameters(5, 1.0e-8, 10.0);

  {
    UniformRandomGenerator uniform_generator(1729);
    std::vector<double> matrix(size*size);
    BuildWellConditionedSPDMatrix(size, &uniform_generator, matrix.data());
    CholeskySolver solver(FactorWithJitter(matrix.data(), size, "random SPD", jitter_parameters));
    if (solver.jitter() != 0.0) {
      GPR_ERROR_PRINTF("SPD matrix was jittered by %.18E\n", solver.jitter());
      ++total_errors;
    }
  }

  {
    CholeskySolver solver(FactorWithJitter(ones_matrix.data(), size, "ones", jitter_parameters));
    if (!CheckDoubleWithinRelative(solver.jitter(), 1.0e-8, 0.0)) {
      ++total_errors;
    }
    // eigenvalues 3 + jitter, jitter, jitter
    if (!CheckDoubleWithinRelative(solver.LogDeterminant(), std::log(3.0 + 1.0e-8) + 2.0*std::log(1.0e-8), 1.0e-6)) {
      ++total_errors;
    }
    CholeskySolver moved_solver(std::move(solver));
    if (!CheckIntEquals(moved_solver.size(), size) || moved_solver.jitter() <= 0.0) {
      ++total_errors;
    }
  }

  // disabled: a plain factorization
  ++total_errors;
  try {
    CholeskySolver solver(FactorWithJitter(ones_matrix.data(), size, "ones", JitterParameters()));
    GPR_ERROR_PRINTF("singular matrix factored without jitter; jitter = %.18E\n", solver.jitter());
  } catch (const NotPositiveDefiniteException& exception) {
    if (CheckIntEquals(exception.leading_minor_index(), 2)) {
      --total_errors;
    }
  }

  // exhausted: jitter 1e-6 then 1e-5 cannot fix eigenvalue -1; the last attempt is reported
  const std::vector<double> indefinite_matrix = {1.0, 2.0,
                                                 2.0, 1.0};
  ++total_errors;
  try {
    CholeskySolver solver(FactorWithJitter(indefinite_matrix.data(), 2, "indefinite", JitterParameters(2, 1.0e-6, 10.0)));
    GPR_ERROR_PRINTF("indefinite matrix factored; jitter = %.18E\n", solver.jitter());
  } catch (const NotPositiveDefiniteException& exception) {
    if (CheckDoubleWithin(exception.matrix()[0], 1.0 + 1.0e-5, 1.0e-15) &&
        CheckDoubleWithin(exception.matrix()[1], 2.0, 0.0)) {
      --total_errors;
    }
  }

  return total_errors;
}

/*!\rst
  Checks that ``jitter_parameters`` is rejected with ConfigurationException naming ``parameter_name``, both by
  ValidateJitterParameters() and by FactorWithJitter().

  \return
    number of checks that did not throw the expected exception
\endrst*/
GPR_WARN_UNUSED_RESULT int CheckJitterParametersRejected(const JitterParameters& jitter_parameters, char const * parameter_name) {
  int total_errors = 2;
  try {
    ValidateJitterParameters(jitter_parameters);
    GPR_ERROR_PRINTF("invalid %s accepted\n", parameter_name);
  } catch (const ConfigurationException& exception) {
    if (exception.parameter_name() == parameter_name) {
      --total_errors;
    }
  }

  const std::vector<double> identity = {1.0, 0.0,
                                        0.0, 1.0};
  try {
    CholeskySolver solver(FactorWithJitter(identity.data(), 2, "identity", jitter_parameters));
    GPR_ERROR_PRINTF("invalid %s accepted; jitter = %.18E\n", parameter_name, solver.jitter());
  } catch (const ConfigurationException& exception) {
    if (exception.parameter_name() == parameter_name) {
      --total_errors;
    }
  }
  return total_errors;
}

GPR_WARN_UNUSED_RESULT int TestJitterParameterValidation() {
  int total_errors = 0;

  total_errors += CheckJitterParametersRejected(JitterParameters(-1, 1.0e-8, 10.0), "max_num_attempts");
  total_errors += CheckJitterParametersRejected(JitterParameters(3, 0.0, 10.0), "initial_jitter");
  total_errors += CheckJitterParametersRejected(JitterParameters(3, std::numeric_limits<double>::quiet_NaN(), 10.0), "initial_jitter");
  total_errors += CheckJitterParametersRejected(JitterParameters(3, 1.0e-8, 0.5), "growth_factor");

  // disabled settings are never inspected
  try {
    ValidateJitterParameters(JitterParameters());
    ValidateJitterParameters(JitterParameters(0, -1.0, 0.0));
  } catch (const ConfigurationException& exception) {
    GPR_ERROR_PRINTF("disabled jitter rejected: %s\n", exception.what());
    ++total_errors;
  }

  return total_errors;
}

}  // end unnamed namespace

int RunCholeskyTests() {
  int total_errors = 0;
  int current_errors = 0;

  current_errors = TestFactorAndSolve();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("CholeskySolver factor/solve failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestLogDeterminantAndInverse();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("CholeskySolver log determinant/inverse failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestNotPositiveDefinite();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("CholeskySolver failure reporting failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestSmallScaleMatrices();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("CholeskySolver on small-scale SPD matrices failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestFactorWithJitter();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("FactorWithJitter failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestJitterParameterValidation();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("jitter parameter validation failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  return total_errors;
}

}  // end namespace gp_regression
