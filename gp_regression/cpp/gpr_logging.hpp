/*!
  \file gpr_logging.hpp
  \rst
  printf-based logging macros.  The "log" is stdout and verbosity is fixed at compile time through the
  ``GPR_DEBUG_PRINT``, ``GPR_VERBOSE_PRINT``, ``GPR_WARNING_PRINT`` and ``GPR_ERROR_PRINT`` defines.  Enabling a
  level enables every more severe level as well.

  Also contains printers for column-major matrices (see gpr_common.hpp, item 2).
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_LOGGING_HPP_
#define GP_REGRESSION_CPP_GPR_LOGGING_HPP_

#include <cstdio>

#include "gpr_common.hpp"

namespace gp_regression {

/*!\rst
  Details about internal state; e.g., intermediate values of a factorization.
\endrst*/
#ifdef GPR_DEBUG_PRINT
#define GPR_DEBUG_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define GPR_DEBUG_PRINTF(...) (void)0
#endif

/*!\rst
  Extra information about what the engine is doing; e.g., retries and matrix sizes.
\endrst*/
#ifdef GPR_VERBOSE_PRINT
#define GPR_VERBOSE_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define GPR_VERBOSE_PRINTF(...) (void)0
#endif

#if defined(GPR_VERBOSE_PRINT) || defined(GPR_DEBUG_PRINT)
#ifndef GPR_WARNING_PRINT
#define GPR_WARNING_PRINT
#endif
#endif

/*!\rst
  Something went wrong but the computation continues; e.g., a covariance matrix needed jitter.
\endrst*/
#ifdef GPR_WARNING_PRINT
#define GPR_WARNING_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define GPR_WARNING_PRINTF(...) (void)0
#endif

#ifdef GPR_WARNING_PRINT
#ifndef GPR_ERROR_PRINT
#define GPR_ERROR_PRINT
#endif
#endif

/*!\rst
  Something failed; typically printed just before an exception is thrown or a test check fails.
\endrst*/
#ifdef GPR_ERROR_PRINT
#define GPR_ERROR_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define GPR_ERROR_PRINTF(...) (void)0
#endif

/*!\rst
  ANSI escape codes for colored printf output.  Insert before a string literal; the color persists until
  ``GPR_ANSI_COLOR_RESET``::

    std::printf(GPR_ANSI_COLOR_GREEN "passed %d" GPR_ANSI_COLOR_RESET " of %d\n", 2, 3);
\endrst*/
#define GPR_ANSI_COLOR_RESET   "\x1b[0m"
#define GPR_ANSI_COLOR_RED     "\x1b[31m"
#define GPR_ANSI_COLOR_GREEN   "\x1b[32m"
#define GPR_ANSI_COLOR_YELLOW  "\x1b[33m"
#define GPR_ANSI_COLOR_BLUE    "\x1b[34m"
#define GPR_ANSI_COLOR_BOLDRED     "\033[1m\033[31m"
#define GPR_ANSI_COLOR_BOLDGREEN   "\033[1m\033[32m"
#define GPR_ANSI_COLOR_BOLDYELLOW  "\033[1m\033[33m"

// for top-level test suites
#define GPR_SUCCESS_PRINTF(...) std::printf(GPR_ANSI_COLOR_BOLDGREEN "SUCCESS: " GPR_ANSI_COLOR_RESET __VA_ARGS__)
#define GPR_FAILURE_PRINTF(...) std::printf(GPR_ANSI_COLOR_BOLDRED "FAILURE: " GPR_ANSI_COLOR_RESET __VA_ARGS__)
// for individual tests inside a suite
#define GPR_PARTIAL_SUCCESS_PRINTF(...) std::printf(GPR_ANSI_COLOR_GREEN "ok: " GPR_ANSI_COLOR_RESET __VA_ARGS__)
#define GPR_PARTIAL_FAILURE_PRINTF(...) std::printf(GPR_ANSI_COLOR_RED "fail: " GPR_ANSI_COLOR_RESET __VA_ARGS__)

/*!\rst
  Print a column-major matrix to stdout, one row per line, using ``%.18E``.

  For example, ``A_flat[6] = [4 53 32 12 5 8]`` with 2 rows and 3 columns prints (decimals dropped)::

    4  32 5
    53 12 8

  \param
    :matrix[num_cols][num_rows]: matrix to print
    :num_rows: number of rows
    :num_cols: number of columns
\endrst*/
void PrintMatrix(double const * restrict matrix, int num_rows, int num_cols) noexcept GPR_NONNULL_POINTERS;

/*!\rst
  Print the TRANSPOSE of a column-major matrix; i.e., each stored column is printed as a line.
  Handy for point lists: ``PrintMatrixTrans(points, num_points, dim)`` prints one point per line.

  \param
    :matrix[num_rows][num_cols]: matrix whose transpose is printed
    :num_rows: number of rows of the printed output
    :num_cols: number of columns of the printed output
\endrst*/
void PrintMatrixTrans(double const * restrict matrix, int num_rows, int num_cols) noexcept GPR_NONNULL_POINTERS;

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_LOGGING_HPP_
