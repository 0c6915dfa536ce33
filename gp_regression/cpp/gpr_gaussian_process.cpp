/*!
  \file gpr_gaussian_process.cpp
  \rst
  Implementation of GaussianProcess and PosteriorPrediction.  See gpr_gaussian_process.hpp for the math.

  Every routine here follows the same pattern: build covariance matrices (gpr_kernel_matrix.hpp), then reduce them
  with triangular solves against the cached Cholesky factor.  Empty training sets and empty test sets are legal, so
  each routine short-circuits before handing a zero-length buffer to the linear algebra kernels.
\endrst*/

#include "gpr_gaussian_process.hpp"

#include <cmath>

#include <algorithm>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

#include "gpr_cholesky.hpp"
#include "gpr_common.hpp"
#include "gpr_covariance.hpp"
#include "gpr_exception.hpp"
#include "gpr_kernel_matrix.hpp"
#include "gpr_linear_algebra.hpp"
#include "gpr_logging.hpp"
#include "gpr_model_parameters.hpp"
#include "gpr_random.hpp"

namespace gp_regression {

namespace {

//! name of the training matrix in NotPositiveDefiniteException messages
constexpr char const * kTrainingMatrixName = "K + noise_variance * I";
//! name of the posterior covariance in NotPositiveDefiniteException messages
constexpr char const * kPosteriorMatrixName = "posterior covariance";

}  // end unnamed namespace

double PosteriorPrediction::MarginalVariance(int i) const noexcept {
  return std::max(0.0, covariance[i*(num_to_sample + 1)]);
}

double PosteriorPrediction::MarginalStdDev(int i) const noexcept {
  return std::sqrt(MarginalVariance(i));
}

GaussianProcess::GaussianProcess(const CovarianceInterface& covariance, std::vector<double> points_sampled,
                                 std::vector<double> points_sampled_value, int dim, double noise_variance,
                                 const JitterParameters& jitter_parameters, const ThreadSchedule& thread_schedule)
    : dim_(dim),
      num_sampled_(static_cast<int>(points_sampled_value.size())),
      covariance_ptr_(covariance.Clone()),
      points_sampled_(std::move(points_sampled)),
      points_sampled_value_(std::move(points_sampled_value)),
      noise_variance_(noise_variance),
      jitter_parameters_(jitter_parameters),
      thread_schedule_(thread_schedule),
      K_chol_(FactorTrainingCovariance()),
      K_inv_y_(points_sampled_value_),
      data_fit_(0.0) {
  if (num_sampled_ > 0) {
    // w = R^{-1} y; data_fit = ||w||^2; alpha = R^{-T} w
    K_chol_.SolveLower(K_inv_y_.data());
    data_fit_ = DotProduct(K_inv_y_.data(), K_inv_y_.data(), num_sampled_);
    K_chol_.SolveUpper(K_inv_y_.data());
  }
}

GaussianProcess::GaussianProcess(const CovarianceInterface& covariance, std::vector<double> points_sampled,
                                 std::vector<double> points_sampled_value, int dim, double noise_variance)
    : GaussianProcess(covariance, std::move(points_sampled), std::move(points_sampled_value), dim, noise_variance,
                      JitterParameters(), ThreadSchedule()) {
}

GaussianProcess::GaussianProcess(const KernelParameters& kernel_parameters, std::vector<double> points_sampled,
                                 std::vector<double> points_sampled_value, int dim, double noise_variance,
                                 const JitterParameters& jitter_parameters, const ThreadSchedule& thread_schedule)
    : GaussianProcess(*MakeCovariance(kernel_parameters, dim), std::move(points_sampled),
                      std::move(points_sampled_value), dim, noise_variance, jitter_parameters, thread_schedule) {
}

GaussianProcess::GaussianProcess(const CovarianceInterface& covariance,
                                 const std::vector<std::vector<double> >& points_sampled,
                                 std::vector<double> points_sampled_value, double noise_variance,
                                 const JitterParameters& jitter_parameters, const ThreadSchedule& thread_schedule)
    : GaussianProcess(covariance, FlattenPointList(points_sampled, covariance.dim()), std::move(points_sampled_value),
                      covariance.dim(), noise_variance, jitter_parameters, thread_schedule) {
}

CholeskySolver GaussianProcess::FactorTrainingCovariance() const {
  if (unlikely(covariance_ptr_->dim() != dim_)) {
    GPR_THROW_EXCEPTION(DimensionMismatchException, "Covariance dimension does not match point dimension.",
                        covariance_ptr_->dim(), dim_);
  }
  if (unlikely(static_cast<int>(points_sampled_.size()) != dim_*num_sampled_)) {
    GPR_THROW_EXCEPTION(DimensionMismatchException,
                        "Number of training coordinates does not match dim * number of observations.",
                        static_cast<int>(points_sampled_.size()), dim_*num_sampled_);
  }
  // written so that NaN also fails
  if (unlikely(!(noise_variance_ >= 0.0))) {
    GPR_THROW_EXCEPTION(ConfigurationException, "Noise variance must be non-negative.", "noise_variance",
                        noise_variance_, 0.0, std::numeric_limits<double>::max());
  }

  std::vector<double> covariance_matrix(num_sampled_*num_sampled_);
  if (num_sampled_ > 0) {
    BuildCovarianceMatrix(*covariance_ptr_, points_sampled_.data(), dim_, num_sampled_, thread_schedule_,
                          covariance_matrix.data());
    AddToDiagonal(num_sampled_, noise_variance_, covariance_matrix.data());
  }

  CholeskySolver cholesky(FactorWithJitter(covariance_matrix.data(), num_sampled_, kTrainingMatrixName,
                                           jitter_parameters_));
  GPR_DEBUG_PRINTF("factored %d x %d training covariance (%s), jitter %.6E\n", num_sampled_, num_sampled_,
                   covariance_ptr_->name(), cholesky.jitter());
  return cholesky;
}

double GaussianProcess::LogLikelihood() const noexcept {
  return -0.5*(static_cast<double>(num_sampled_)*kLog2Pi + K_chol_.LogDeterminant() + data_fit_);
}

std::unique_ptr<GaussianProcess> GaussianProcess::UpdateNoiseVariance(double noise_variance) const {
  return std::unique_ptr<GaussianProcess>(new GaussianProcess(*covariance_ptr_, points_sampled_,
                                                              points_sampled_value_, dim_, noise_variance,
                                                              jitter_parameters_, thread_schedule_));
}

std::unique_ptr<GaussianProcess> GaussianProcess::UpdateCovariance(const CovarianceInterface& covariance) const {
  return std::unique_ptr<GaussianProcess>(new GaussianProcess(covariance, points_sampled_, points_sampled_value_,
                                                              dim_, noise_variance_, jitter_parameters_,
                                                              thread_schedule_));
}

std::unique_ptr<GaussianProcess> GaussianProcess::UpdateKernelParameters(const KernelParameters& kernel_parameters) const {
  return UpdateCovariance(*MakeCovariance(kernel_parameters, dim_));
}

std::unique_ptr<GaussianProcess> GaussianProcess::AddTrainingPoints(const std::vector<double>& new_points,
                                                                    const std::vector<double>& new_points_value) const {
  const int num_new_points = static_cast<int>(new_points_value.size());
  if (unlikely(static_cast<int>(new_points.size()) != dim_*num_new_points)) {
    GPR_THROW_EXCEPTION(DimensionMismatchException,
                        "Number of new coordinates does not match dim * number of new observations.",
                        static_cast<int>(new_points.size()), dim_*num_new_points);
  }

  std::vector<double> points_sampled(points_sampled_);
  points_sampled.insert(points_sampled.end(), new_points.begin(), new_points.end());
  std::vector<double> points_sampled_value(points_sampled_value_);
  points_sampled_value.insert(points_sampled_value.end(), new_points_value.begin(), new_points_value.end());

  return std::unique_ptr<GaussianProcess>(new GaussianProcess(*covariance_ptr_, std::move(points_sampled),
                                                              std::move(points_sampled_value), dim_,
                                                              noise_variance_, jitter_parameters_,
                                                              thread_schedule_));
}

int GaussianProcess::NumPointsInList(const std::vector<double>& points_to_sample) const {
  const int num_coordinates = static_cast<int>(points_to_sample.size());
  if (unlikely(num_coordinates % dim_ != 0)) {
    // the trailing point is the one that is short
    GPR_THROW_EXCEPTION(DimensionMismatchException,
                        "Number of test coordinates is not a multiple of dim; size is that of the last test point.",
                        num_coordinates % dim_, dim_);
  }
  return num_coordinates/dim_;
}

std::vector<double> GaussianProcess::BuildCrossCovariance(double const * restrict points_to_sample,
                                                          int num_to_sample) const {
  std::vector<double> cross_covariance(num_sampled_*num_to_sample);
  BuildCrossCovarianceMatrix(*covariance_ptr_, points_sampled_.data(), num_sampled_, points_to_sample,
                             num_to_sample, dim_, thread_schedule_, cross_covariance.data());
  return cross_covariance;
}

PosteriorPrediction GaussianProcess::PosteriorPredict(const std::vector<double>& points_to_sample) const {
  const int num_to_sample = NumPointsInList(points_to_sample);
  std::vector<double> mean(num_to_sample, 0.0);
  std::vector<double> covariance(num_to_sample*num_to_sample);
  if (num_to_sample == 0) {
    return PosteriorPrediction(num_to_sample, std::move(mean), std::move(covariance));
  }

  BuildCovarianceMatrix(*covariance_ptr_, points_to_sample.data(), dim_, num_to_sample, thread_schedule_,
                        covariance.data());
  if (num_sampled_ > 0) {
    // Ks is shared by the mean and the variance; it becomes V = R^{-1} Ks after the mean is read off
    std::vector<double> cross_covariance(BuildCrossCovariance(points_to_sample.data(), num_to_sample));
    GeneralMatrixVectorMultiply(cross_covariance.data(), 'T', K_inv_y_.data(), 1.0, 0.0, num_sampled_, num_to_sample,
                                num_sampled_, mean.data());

    K_chol_.SolveLowerMatrix(num_to_sample, cross_covariance.data());
    GeneralMatrixMatrixMultiply(cross_covariance.data(), 'T', cross_covariance.data(), -1.0, 1.0, num_to_sample,
                                num_sampled_, num_to_sample, covariance.data());
  }
  return PosteriorPrediction(num_to_sample, std::move(mean), std::move(covariance));
}

PosteriorPrediction GaussianProcess::PosteriorPredict(const std::vector<std::vector<double> >& points_to_sample) const {
  return PosteriorPredict(FlattenPointList(points_to_sample, dim_));
}

void GaussianProcess::ComputeMeanOfPoints(double const * restrict points_to_sample, int num_to_sample,
                                          double * restrict mean_of_points) const noexcept {
  if (num_sampled_ == 0) {
    std::fill(mean_of_points, mean_of_points + num_to_sample, 0.0);
    return;
  }
  std::vector<double> cross_covariance(BuildCrossCovariance(points_to_sample, num_to_sample));
  GeneralMatrixVectorMultiply(cross_covariance.data(), 'T', K_inv_y_.data(), 1.0, 0.0, num_sampled_, num_to_sample,
                              num_sampled_, mean_of_points);
}

void GaussianProcess::ComputeVarianceOfPoints(double const * restrict points_to_sample, int num_to_sample,
                                              double * restrict var_star) const noexcept {
  BuildCovarianceMatrix(*covariance_ptr_, points_to_sample, dim_, num_to_sample, thread_schedule_, var_star);
  if (num_sampled_ == 0) {
    return;
  }
  std::vector<double> cross_covariance(BuildCrossCovariance(points_to_sample, num_to_sample));
  K_chol_.SolveLowerMatrix(num_to_sample, cross_covariance.data());
  GeneralMatrixMatrixMultiply(cross_covariance.data(), 'T', cross_covariance.data(), -1.0, 1.0, num_to_sample,
                              num_sampled_, num_to_sample, var_star);
}

void GaussianProcess::ComputeMarginalStdDevOfPoints(double const * restrict points_to_sample, int num_to_sample,
                                                    double * restrict std_dev) const noexcept {
  for (int i = 0; i < num_to_sample; ++i) {
    std_dev[i] = covariance_ptr_->Covariance(points_to_sample + i*dim_, points_to_sample + i*dim_);
  }
  if (num_sampled_ > 0) {
    std::vector<double> cross_covariance(BuildCrossCovariance(points_to_sample, num_to_sample));
    K_chol_.SolveLowerMatrix(num_to_sample, cross_covariance.data());
    for (int i = 0; i < num_to_sample; ++i) {
      double const * restrict v_column = cross_covariance.data() + i*num_sampled_;
      std_dev[i] -= DotProduct(v_column, v_column, num_sampled_);
    }
  }
  for (int i = 0; i < num_to_sample; ++i) {
    std_dev[i] = std::sqrt(std::max(0.0, std_dev[i]));
  }
}

std::vector<double> GaussianProcess::ComputeInverseCovariance() const {
  return K_chol_.Inverse();
}

std::vector<double> GaussianProcess::SamplePosterior(const std::vector<double>& points_to_sample, int num_samples,
                                                     const JitterParameters& jitter_parameters,
                                                     NormalRNGInterface * normal_rng) const {
  if (unlikely(num_samples < 0)) {
    GPR_THROW_EXCEPTION(ConfigurationException, "Number of samples cannot be negative.", "num_samples",
                        static_cast<double>(num_samples), 0.0, static_cast<double>(std::numeric_limits<int>::max()));
  }
  PosteriorPrediction prediction(PosteriorPredict(points_to_sample));
  const int num_to_sample = prediction.num_to_sample;
  std::vector<double> samples(num_samples*num_to_sample);
  if (num_to_sample == 0 || num_samples == 0) {
    return samples;
  }

  const CholeskySolver posterior_cholesky(FactorWithJitter(prediction.covariance.data(), num_to_sample,
                                                           kPosteriorMatrixName, jitter_parameters));
  for (int s = 0; s < num_samples; ++s) {
    double * restrict sample = samples.data() + s*num_to_sample;
    for (int i = 0; i < num_to_sample; ++i) {
      sample[i] = (*normal_rng)();
    }
    // sample = mus + L_V * z
    TriangularMatrixVectorMultiply(posterior_cholesky.factor().data(), 'N', num_to_sample, sample);
    VectorAXPY(num_to_sample, 1.0, prediction.mean.data(), sample);
  }
  return samples;
}

}  // end namespace gp_regression
