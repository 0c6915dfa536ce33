/*!
  \file gpr_logging.cpp
  \rst
  Matrix printers; kept out of the header so that ``std::printf`` calls live in one place.
\endrst*/

#include "gpr_logging.hpp"

#include <cstdio>

#include "gpr_common.hpp"

namespace gp_regression {

void PrintMatrix(double const * restrict matrix, int num_rows, int num_cols) noexcept {
  // screen order is row-by-row, storage is column-by-column: stride through the columns
  for (int i = 0; i < num_rows; ++i) {
    for (int j = 0; j < num_cols; ++j) {
      std::printf("%.18E ", matrix[j*num_rows + i]);
    }
    std::printf("\n");
  }
}

void PrintMatrixTrans(double const * restrict matrix, int num_rows, int num_cols) noexcept {
  for (int i = 0; i < num_rows; ++i) {
    for (int j = 0; j < num_cols; ++j) {
      std::printf("%.18E ", matrix[i*num_cols + j]);
    }
    std::printf("\n");
  }
}

}  // end namespace gp_regression
