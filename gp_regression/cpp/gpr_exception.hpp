/*!
  \file gpr_exception.hpp
  \rst
  Exception types used by gp_regression, plus helpers for throwing them.  Library code never writes ``throw``
  directly; it goes through gp_regression::ThrowException(), almost always via the macro::

    GPR_THROW_EXCEPTION(ConfigurationException, "Invalid lengthscale.", "lengthscale", value, min, max);

  which prepends file/line and function name information (the analogue of BOOST_THROW_EXCEPTION).
  Every exception type here derives publicly from std::exception through RegressionException, and the first
  two ctor arguments of each are ``char const *`` (line info, function info) so that the macro works.

  Exception map:

  * ConfigurationException: a kernel parameter, the noise variance, or another setting is outside its allowed range.
    Thrown before any computation starts.
  * DimensionMismatchException: inputs of inconsistent dimensionality or an observation vector whose length does
    not match the number of training points.
  * NotPositiveDefiniteException: Cholesky factorization hit a non-positive pivot.  Carries enough context (matrix
    name, size, failing leading minor, matrix data) to diagnose degenerate kernel/noise combinations.
  * ModelNotReadyException: a query was made against a model with no valid fit.
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_EXCEPTION_HPP_
#define GP_REGRESSION_CPP_GPR_EXCEPTION_HPP_

#include <exception>
#include <string>
#include <type_traits>
#include <vector>

#include "gpr_common.hpp"

namespace gp_regression {

/*!\rst
  Stringify the expansion of a macro: ``GPR_STRINGIFY_EXPANSION(__LINE__) --> "53"``.
  The inner macro is needed so that the argument is expanded before ``#`` is applied.
\endrst*/
#define GPR_STRINGIFY_EXPANSION_INNER(x) #x
#define GPR_STRINGIFY_EXPANSION(x) GPR_STRINGIFY_EXPANSION_INNER(x)

/*!\rst
  Compile-time string ``(gpr_foo.cpp: 893)`` for the current file and line.
\endrst*/
#define GPR_STRINGIFY_FILE_AND_LINE "(" __FILE__ ": " GPR_STRINGIFY_EXPANSION(__LINE__) ")"

/*!\rst
  Wrapper around ``throw``.  Checks (at compile time) that the argument derives from std::exception.

  \param
    :except: exception object to throw
  \return
    **NEVER RETURNS**
\endrst*/
template <typename ExceptionType>
GPR_NORETURN inline void ThrowException(const ExceptionType& except) {
  static_assert(std::is_base_of<std::exception, ExceptionType>::value, "ExceptionType must be derived from std::exception.");

  throw except;
}

/*!\rst
  Throw ``ExceptionType`` with file/line and function name filled in.  ``ExceptionType``'s ctor must start with
  two ``char const *`` (line info, function info) followed by ``Args...``.
\endrst*/
#define GPR_THROW_EXCEPTION(ExceptionType, Args...) ThrowException(ExceptionType(GPR_STRINGIFY_FILE_AND_LINE, GPR_CURRENT_FUNCTION_NAME, Args))

/*!\rst
  **Overview**

  Base class of all exceptions thrown by gp_regression.  Essentially std::runtime_error with some formatting logic;
  the only data is the ``what()`` message.

  **Message Format**

  ::

    RegressionException: CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO

  Subclasses replace the leading name and add their own details before the custom message.
\endrst*/
class RegressionException : public std::exception {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "RegressionException";

  /*!\rst
    \param
      :line_info[]: file and line; e.g., from GPR_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional function name; e.g., from GPR_CURRENT_FUNCTION_NAME
      :custom_message[]: optional additional text
  \endrst*/
  RegressionException(char const * line_info, char const * func_info, char const * custom_message);

  virtual const char* what() const noexcept override GPR_WARN_UNUSED_RESULT {
    return message_.c_str();
  }

  RegressionException() = delete;

 protected:
  /*!\rst
    Starts the message with ``name``; subclasses then append their details and call
    AppendCustomMessageAndDebugInfo().
  \endrst*/
  explicit RegressionException(char const * name);

  /*!\rst
    Append ``custom_message``, ``func_info`` and ``line_info`` (in that order, skipping null pointers) to ``message_``.
  \endrst*/
  void AppendCustomMessageAndDebugInfo(char const * line_info, char const * func_info,
                                       char const * custom_message);

  //! the message produced by ``what()``
  std::string message_;
};

/*!\rst
  **Overview**

  Exception to capture ``value < min`` OR ``value > max``.  Stores value, min and max.

  **Message Format**

  ::

    BoundsException: value: VALUE is not in range [MIN, MAX]
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
\endrst*/
template <typename ValueType>
class BoundsException : public RegressionException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "BoundsException";

  /*!\rst
    \param
      :line_info[]: file and line; e.g., from GPR_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional function name; e.g., from GPR_CURRENT_FUNCTION_NAME
      :custom_message[]: optional additional text
      :value: the value that violates its bounds
      :min: the minimum bound for value
      :max: the maximum bound for value
  \endrst*/
  BoundsException(char const * line_info, char const * func_info, char const * custom_message,
                  ValueType value_in, ValueType min_in, ValueType max_in);

  ValueType value() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return value_;
  }

  ValueType min() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return min_;
  }

  ValueType max() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return max_;
  }

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(BoundsException);

 protected:
  BoundsException(char const * name_in, char const * line_info, char const * func_info,
                  char const * custom_message, ValueType value_in, ValueType min_in, ValueType max_in);

 private:
  //! the offending value and the ``[min_, max_]`` range it should lie in
  ValueType value_, min_, max_;
};

// explicit instantiation declaration, see gpr_common.hpp, item 6
extern template class BoundsException<double>;

/*!\rst
  **Overview**

  A configuration value (kernel parameter, noise variance, jitter setting, spatial dimension) is outside its valid
  range.  Raised when a model or kernel is constructed, before any numerical work.

  Open intervals (e.g., ``variance > 0``) are reported with ``min = std::numeric_limits<double>::min()``.

  **Message Format**

  ::

    ConfigurationException: value: VALUE is not in range [MIN, MAX]
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO (parameter: NAME)
\endrst*/
class ConfigurationException : public BoundsException<double> {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "ConfigurationException";

  /*!\rst
    \param
      :line_info[]: file and line; e.g., from GPR_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional function name; e.g., from GPR_CURRENT_FUNCTION_NAME
      :custom_message[]: optional additional text
      :parameter_name[]: name of the offending parameter (e.g., "lengthscale")
      :value: the invalid value
      :min: smallest allowed value
      :max: largest allowed value
  \endrst*/
  ConfigurationException(char const * line_info, char const * func_info, char const * custom_message,
                         char const * parameter_name_in, double value_in, double min_in, double max_in);

  const std::string& parameter_name() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return parameter_name_;
  }

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(ConfigurationException);

 private:
  //! name of the parameter that failed validation
  std::string parameter_name_;
};

/*!\rst
  **Overview**

  A size or dimensionality does not match what the call requires; e.g., a point with 2 coordinates in a 3-dimensional
  input set, or 4 observations for 5 training points.

  **Message Format**

  ::

    DimensionMismatchException: size VALUE does not match expected size EXPECTED
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
\endrst*/
class DimensionMismatchException : public RegressionException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "DimensionMismatchException";

  /*!\rst
    \param
      :line_info[]: file and line; e.g., from GPR_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional function name; e.g., from GPR_CURRENT_FUNCTION_NAME
      :custom_message[]: optional additional text
      :value: the size that was provided
      :expected: the size that was required
  \endrst*/
  DimensionMismatchException(char const * line_info, char const * func_info, char const * custom_message,
                             int value_in, int expected_in);

  int value() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return value_;
  }

  int expected() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return expected_;
  }

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(DimensionMismatchException);

 private:
  //! the provided size and the size it should have been
  int value_, expected_;
};

/*!\rst
  **Overview**

  Cholesky factorization of a *square* matrix ``A`` (``\in R^{m x m}``) met a non-positive pivot, so ``A`` is not
  (numerically) positive definite.  For covariance matrices this usually means duplicate or nearly duplicate inputs
  combined with too little noise, or extreme kernel parameters.

  Stores the matrix name, a copy of the matrix as it was passed to the factorization, its size, and the 1-based index of
  the first leading minor that is not positive definite.

  **Message Format**

  ::

    NotPositiveDefiniteException: M x M matrix (NAME) is not positive definite; i-th leading minor is not SPD.
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO

  .. Note:: the matrix itself is not printed.  Catch the exception and call PrintMatrix() (gpr_logging.hpp) on
    ``matrix()`` if needed.
\endrst*/
class NotPositiveDefiniteException : public RegressionException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "NotPositiveDefiniteException";

  /*!\rst
    \param
      :line_info[]: file and line; e.g., from GPR_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional function name; e.g., from GPR_CURRENT_FUNCTION_NAME
      :custom_message[]: optional additional text
      :matrix_name[]: what the matrix is; e.g., "K + noise_variance * I"
      :matrix[num_rows][num_rows]: the matrix that failed to factor
      :num_rows: number of rows (= number of columns)
      :leading_minor_index: 1-based index of the first non-SPD leading minor
  \endrst*/
  NotPositiveDefiniteException(char const * line_info, char const * func_info, char const * custom_message,
                               char const * matrix_name_in, double const * matrix_in, int num_rows_in,
                               int leading_minor_index_in);

  const std::string& matrix_name() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return matrix_name_;
  }

  int num_rows() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return num_rows_;
  }

  int leading_minor_index() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return leading_minor_index_;
  }

  const std::vector<double>& matrix() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return matrix_;
  }

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(NotPositiveDefiniteException);

 private:
  //! description of the matrix that failed to factor
  std::string matrix_name_;
  //! number of rows (= number of columns)
  int num_rows_;
  //! 1-based index of the first non-SPD leading minor
  int leading_minor_index_;
  //! the matrix data, column-major
  std::vector<double> matrix_;
};

/*!\rst
  **Overview**

  Likelihood or prediction was requested from a model that has no valid fit: it was never fit, or its most recent
  update failed.

  **Message Format**

  ::

    ModelNotReadyException: model state is STATE
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
\endrst*/
class ModelNotReadyException : public RegressionException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "ModelNotReadyException";

  /*!\rst
    \param
      :line_info[]: file and line; e.g., from GPR_STRINGIFY_FILE_AND_LINE
      :func_info[]: optional function name; e.g., from GPR_CURRENT_FUNCTION_NAME
      :custom_message[]: optional additional text
      :state_name[]: name of the state the model is in
  \endrst*/
  ModelNotReadyException(char const * line_info, char const * func_info, char const * custom_message,
                         char const * state_name_in);

  const std::string& state_name() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return state_name_;
  }

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(ModelNotReadyException);

 private:
  //! the state the model was in when queried
  std::string state_name_;
};

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_EXCEPTION_HPP_
