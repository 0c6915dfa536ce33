/*!
  \file gpr_exception.cpp
  \rst
  Ctors for the exception classes in gpr_exception.hpp.  Each ctor builds ``message_`` from its fields plus the
  file/line and function information.

  Numbers are converted with boost::lexical_cast<std::string>; floating point values get enough digits to round-trip.
\endrst*/

// no locale-dependent number formatting is needed
#define BOOST_LEXICAL_CAST_ASSUME_C_LOCALE

#include "gpr_exception.hpp"

#include <string>

#include <boost/lexical_cast.hpp>  // NOLINT(build/include_order)

#include "gpr_common.hpp"

namespace gp_regression {

void RegressionException::AppendCustomMessageAndDebugInfo(char const * line_info, char const * func_info,
                                                          char const * custom_message) {
  if (custom_message) {
    message_ += custom_message;
    message_ += " ";
  }
  if (func_info) {
    message_ += func_info;
    message_ += " ";
  }
  message_ += line_info;
}

RegressionException::RegressionException(char const * line_info, char const * func_info,
                                         char const * custom_message) : message_(kName) {
  message_ += ": ";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

RegressionException::RegressionException(char const * name) : message_(name) {
}

template <typename ValueType>
BoundsException<ValueType>::BoundsException(char const * name_in, char const * line_info,
                                            char const * func_info, char const * custom_message,
                                            ValueType value_in, ValueType min_in, ValueType max_in)
    : RegressionException(name_in), value_(value_in), min_(min_in), max_(max_in) {
  message_ += ": value: " + boost::lexical_cast<std::string>(value_) + " is not in range [" +
      boost::lexical_cast<std::string>(min_) + ", " + boost::lexical_cast<std::string>(max_) + "]\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

template <typename ValueType>
BoundsException<ValueType>::BoundsException(char const * line_info, char const * func_info,
                                            char const * custom_message, ValueType value_in,
                                            ValueType min_in, ValueType max_in)
    : BoundsException(kName, line_info, func_info, custom_message, value_in, min_in, max_in) {
}

// explicit instantiation definition, see gpr_common.hpp, item 6
template class BoundsException<double>;

ConfigurationException::ConfigurationException(char const * line_info, char const * func_info,
                                               char const * custom_message, char const * parameter_name_in,
                                               double value_in, double min_in, double max_in)
    : BoundsException<double>(kName, line_info, func_info, custom_message, value_in, min_in, max_in),
      parameter_name_(parameter_name_in) {
  message_ += " (parameter: " + parameter_name_ + ")";
}

DimensionMismatchException::DimensionMismatchException(char const * line_info, char const * func_info,
                                                       char const * custom_message, int value_in, int expected_in)
    : RegressionException(kName), value_(value_in), expected_(expected_in) {
  message_ += ": size " + boost::lexical_cast<std::string>(value_) + " does not match expected size " +
      boost::lexical_cast<std::string>(expected_) + "\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

NotPositiveDefiniteException::NotPositiveDefiniteException(char const * line_info, char const * func_info,
                                                           char const * custom_message, char const * matrix_name_in,
                                                           double const * matrix_in, int num_rows_in,
                                                           int leading_minor_index_in)
    : RegressionException(kName), matrix_name_(matrix_name_in), num_rows_(num_rows_in),
      leading_minor_index_(leading_minor_index_in), matrix_(matrix_in, matrix_in + Square(num_rows_)) {
  const std::string num_rows_string(boost::lexical_cast<std::string>(num_rows_));
  message_ += ": " + num_rows_string + " x " + num_rows_string + " matrix (" + matrix_name_ +
      ") is not positive definite; " + boost::lexical_cast<std::string>(leading_minor_index_) +
      "-th leading minor is not SPD.\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

ModelNotReadyException::ModelNotReadyException(char const * line_info, char const * func_info,
                                               char const * custom_message, char const * state_name_in)
    : RegressionException(kName), state_name_(state_name_in) {
  message_ += ": model state is " + state_name_ + "\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

}  // end namespace gp_regression
