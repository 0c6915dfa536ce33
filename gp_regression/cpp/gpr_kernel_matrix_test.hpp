/*!
  \file gpr_kernel_matrix_test.hpp
  \rst
  Tests for BuildCovarianceMatrix(), BuildCrossCovarianceMatrix() and FlattenPointList().
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_KERNEL_MATRIX_TEST_HPP_
#define GP_REGRESSION_CPP_GPR_KERNEL_MATRIX_TEST_HPP_

#include "gpr_common.hpp"

namespace gp_regression {

/*!\rst
  Checks that kernel matrices are exactly symmetric, match direct covariance evaluations entry by entry, have the
  expected shape/orientation, and do not depend on the number of threads used to build them.

  \return
    number of test failures: 0 if kernel matrix construction is working properly
\endrst*/
int RunKernelMatrixTests() GPR_WARN_UNUSED_RESULT;

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_KERNEL_MATRIX_TEST_HPP_
