/*!
  \file gpr_covariance.cpp
  \rst
  Definitions of the covariance functions declared in gpr_covariance.hpp, their parameter validation, and
  MakeCovariance().
\endrst*/

#include "gpr_covariance.hpp"

#include <cmath>

#include <limits>
#include <memory>
#include <vector>

#include "gpr_common.hpp"
#include "gpr_exception.hpp"
#include "gpr_model_parameters.hpp"

namespace gp_regression {

namespace {

// largest allowed value for parameters with no upper bound
constexpr double kNoUpperBound = std::numeric_limits<double>::max();

/*!\rst
  Computes ``\sum_{i=0}^{dim} (p1_i - p2_i)^2 / W_i``, ``p1, p2 = point 1 & 2``; ``W = weight``.
  Equivalent to ``\|p1 - p2\|_2^2`` if all entries of W are 1.0.

  \param
    :point_one[size]: the vector p1
    :point_two[size]: the vector p2
    :weights[size]: the vector W, i.e., the scaling to apply to each term of the norm
    :size: number of dimensions in point
  \return
    the weighted, squared ``L_2``-norm of the vector difference ``p1 - p2``.
\endrst*/
GPR_PURE_FUNCTION GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT double
NormSquaredWithInverseWeights(double const * restrict point_one, double const * restrict point_two,
                              double const * restrict weights, int size) noexcept {
  double norm = 0.0;
  for (int i = 0; i < size; ++i) {
    norm += Square(point_one[i] - point_two[i])/weights[i];
  }
  return norm;
}

void ValidateDimension(int dim) {
  if (unlikely(dim <= 0)) {
    GPR_THROW_EXCEPTION(ConfigurationException, "Spatial dimension must be positive.", "dim",
                        static_cast<double>(dim), 1.0, static_cast<double>(std::numeric_limits<int>::max()));
  }
}

/*!\rst
  Throws ConfigurationException unless ``value > 0``.
\endrst*/
void ValidatePositive(double value, char const * parameter_name) {
  // !(value > 0) also rejects NaN
  if (unlikely(!(value > 0.0))) {
    GPR_THROW_EXCEPTION(ConfigurationException, "Kernel parameter must be positive.", parameter_name, value,
                        std::numeric_limits<double>::min(), kNoUpperBound);
  }
}

/*!\rst
  Validate stationary covariance data (dimension, signal variance, length scales) and compute the squared length
  scales.

  \param
    :dim: the number of spatial dimensions
    :variance: the signal variance, ``\sigma_f^2``
    :lengths: the length scales, one per spatial dimension
  \output
    :lengths_sq[dim]: squares of the entries of lengths
\endrst*/
void InitializeStationaryCovariance(int dim, double variance, const std::vector<double>& lengths,
                                    std::vector<double> * lengths_sq) {
  ValidateDimension(dim);
  if (static_cast<unsigned>(dim) != lengths.size()) {
    GPR_THROW_EXCEPTION(DimensionMismatchException, "Number of length scales does not match dim.",
                        static_cast<int>(lengths.size()), dim);
  }
  ValidatePositive(variance, "variance");

  lengths_sq->resize(dim);
  for (int i = 0; i < dim; ++i) {
    ValidatePositive(lengths[i], "lengthscale");
    (*lengths_sq)[i] = Square(lengths[i]);
  }
}

}  // end unnamed namespace

SquareExponential::SquareExponential(int dim, double variance, std::vector<double> lengths)
    : dim_(dim), variance_(variance), lengths_(lengths), lengths_sq_() {
  InitializeStationaryCovariance(dim_, variance_, lengths_, &lengths_sq_);
}

SquareExponential::SquareExponential(int dim, double variance, double length)
    : SquareExponential(dim, variance, std::vector<double>(dim > 0 ? dim : 0, length)) {
}

SquareExponential::SquareExponential(const SquareExponential& GPR_UNUSED(source)) = default;

/*
  Square Exponential: ``cov(x_1, x_2) = \sigma_f^2 * \exp(-1/2 * ((x_1 - x_2)^T * L * (x_1 - x_2)) )``
*/
double SquareExponential::Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept {
  const double norm_val = NormSquaredWithInverseWeights(point_one, point_two, lengths_sq_.data(), dim_);
  return variance_*std::exp(-0.5*norm_val);
}

void SquareExponential::GetHyperparameters(double * restrict hyperparameters) const noexcept {
  hyperparameters[0] = variance_;
  for (int i = 0; i < dim_; ++i) {
    hyperparameters[i + 1] = lengths_[i];
  }
}

CovarianceInterface * SquareExponential::Clone() const {
  return new SquareExponential(*this);
}

MaternNu1p5::MaternNu1p5(int dim, double variance, std::vector<double> lengths)
    : dim_(dim), variance_(variance), lengths_(lengths), lengths_sq_() {
  InitializeStationaryCovariance(dim_, variance_, lengths_, &lengths_sq_);
}

MaternNu1p5::MaternNu1p5(int dim, double variance, double length)
    : MaternNu1p5(dim, variance, std::vector<double>(dim > 0 ? dim : 0, length)) {
}

MaternNu1p5::MaternNu1p5(const MaternNu1p5& GPR_UNUSED(source)) = default;

/*
  Matern, \nu = 3/2: ``cov(r) = \sigma_f^2 * (1 + \sqrt{3}*r) * \exp(-\sqrt{3}*r)``
*/
double MaternNu1p5::Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept {
  const double norm_val = std::sqrt(3.0*NormSquaredWithInverseWeights(point_one, point_two, lengths_sq_.data(), dim_));
  return variance_*(1.0 + norm_val)*std::exp(-norm_val);
}

void MaternNu1p5::GetHyperparameters(double * restrict hyperparameters) const noexcept {
  hyperparameters[0] = variance_;
  for (int i = 0; i < dim_; ++i) {
    hyperparameters[i + 1] = lengths_[i];
  }
}

CovarianceInterface * MaternNu1p5::Clone() const {
  return new MaternNu1p5(*this);
}

MaternNu2p5::MaternNu2p5(int dim, double variance, std::vector<double> lengths)
    : dim_(dim), variance_(variance), lengths_(lengths), lengths_sq_() {
  InitializeStationaryCovariance(dim_, variance_, lengths_, &lengths_sq_);
}

MaternNu2p5::MaternNu2p5(int dim, double variance, double length)
    : MaternNu2p5(dim, variance, std::vector<double>(dim > 0 ? dim : 0, length)) {
}

MaternNu2p5::MaternNu2p5(const MaternNu2p5& GPR_UNUSED(source)) = default;

/*
  Matern, \nu = 5/2: ``cov(r) = \sigma_f^2 * (1 + \sqrt{5}*r + 5/3*r^2) * \exp(-\sqrt{5}*r)``
  with ``\sqrt{5}*r`` computed first, ``5/3*r^2 = (\sqrt{5}*r)^2/3``.
*/
double MaternNu2p5::Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept {
  const double norm_sq = 5.0*NormSquaredWithInverseWeights(point_one, point_two, lengths_sq_.data(), dim_);
  const double norm_val = std::sqrt(norm_sq);
  return variance_*(1.0 + norm_val + norm_sq/3.0)*std::exp(-norm_val);
}

void MaternNu2p5::GetHyperparameters(double * restrict hyperparameters) const noexcept {
  hyperparameters[0] = variance_;
  for (int i = 0; i < dim_; ++i) {
    hyperparameters[i + 1] = lengths_[i];
  }
}

CovarianceInterface * MaternNu2p5::Clone() const {
  return new MaternNu2p5(*this);
}

LinearKernel::LinearKernel(int dim, double variance, double bias) : dim_(dim), variance_(variance), bias_(bias) {
  ValidateDimension(dim_);
  ValidatePositive(variance_, "variance");
  if (unlikely(!(bias_ >= 0.0))) {
    GPR_THROW_EXCEPTION(ConfigurationException, "Kernel bias must be non-negative.", "bias", bias_, 0.0,
                        kNoUpperBound);
  }
}

LinearKernel::LinearKernel(const LinearKernel& GPR_UNUSED(source)) = default;

double LinearKernel::Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept {
  double inner_product = 0.0;
  for (int i = 0; i < dim_; ++i) {
    inner_product += point_one[i]*point_two[i];
  }
  return bias_ + variance_*inner_product;
}

CovarianceInterface * LinearKernel::Clone() const {
  return new LinearKernel(*this);
}

PeriodicKernel::PeriodicKernel(int dim, double variance, double length, double period)
    : dim_(dim), variance_(variance), length_(length), period_(period) {
  ValidateDimension(dim_);
  ValidatePositive(variance_, "variance");
  ValidatePositive(length_, "lengthscale");
  ValidatePositive(period_, "period");
}

PeriodicKernel::PeriodicKernel(const PeriodicKernel& GPR_UNUSED(source)) = default;

/*
  Periodic: ``cov(x_1, x_2) = \sigma_f^2 * \exp(-2/l^2 * \sum_i \sin^2(\pi (x_{1,i} - x_{2,i}) / p))``
  (the absolute value drops out under the square)
*/
double PeriodicKernel::Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept {
  double sum_sin_sq = 0.0;
  for (int i = 0; i < dim_; ++i) {
    sum_sin_sq += Square(std::sin(kPi*(point_one[i] - point_two[i])/period_));
  }
  return variance_*std::exp(-2.0*sum_sin_sq/Square(length_));
}

CovarianceInterface * PeriodicKernel::Clone() const {
  return new PeriodicKernel(*this);
}

std::unique_ptr<CovarianceInterface> MakeCovariance(const KernelParameters& kernel_parameters, int dim) {
  switch (kernel_parameters.kernel_type) {
    case KernelType::kSquareExponential: {
      return std::unique_ptr<CovarianceInterface>(new SquareExponential(dim, kernel_parameters.variance,
                                                                        kernel_parameters.lengthscale));
    }
    case KernelType::kMaternNu1p5: {
      return std::unique_ptr<CovarianceInterface>(new MaternNu1p5(dim, kernel_parameters.variance,
                                                                  kernel_parameters.lengthscale));
    }
    case KernelType::kMaternNu2p5: {
      return std::unique_ptr<CovarianceInterface>(new MaternNu2p5(dim, kernel_parameters.variance,
                                                                  kernel_parameters.lengthscale));
    }
    case KernelType::kLinear: {
      return std::unique_ptr<CovarianceInterface>(new LinearKernel(dim, kernel_parameters.variance,
                                                                   kernel_parameters.bias));
    }
    case KernelType::kPeriodic: {
      return std::unique_ptr<CovarianceInterface>(new PeriodicKernel(dim, kernel_parameters.variance,
                                                                     kernel_parameters.lengthscale,
                                                                     kernel_parameters.period));
    }
  }
  GPR_THROW_EXCEPTION(ConfigurationException, "Unknown kernel type.", "kernel_type",
                      static_cast<double>(static_cast<int>(kernel_parameters.kernel_type)), 0.0,
                      static_cast<double>(static_cast<int>(KernelType::kPeriodic)));
}

}  // end namespace gp_regression
