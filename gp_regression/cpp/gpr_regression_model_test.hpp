/*!
  \file gpr_regression_model_test.hpp
  \rst
  Tests for GaussianProcessModel (gpr_regression_model.hpp): the lifecycle state machine, snapshot retention across
  failed updates, and concurrent queries during updates.
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_REGRESSION_MODEL_TEST_HPP_
#define GP_REGRESSION_CPP_GPR_REGRESSION_MODEL_TEST_HPP_

#include "gpr_common.hpp"

namespace gp_regression {

/*!\rst
  Walks GaussianProcessModel through every state transition and checks which operations are allowed in each.

  \return
    number of test failures: 0 if GaussianProcessModel is working properly
\endrst*/
int RunRegressionModelTests() GPR_WARN_UNUSED_RESULT;

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_REGRESSION_MODEL_TEST_HPP_
