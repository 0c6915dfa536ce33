/*!
  \file gpr_gaussian_process_test.cpp
  \rst
  Routines to test the functions in gpr_gaussian_process.cpp.

  The posterior is checked in its two limits: at training inputs with (almost) no noise it interpolates the data with
  (almost) zero variance, and far from all training inputs it reverts to the prior (mean 0, variance ``\sigma_f^2``).
  Likelihoods are checked against closed forms on 1 and 2 points.
\endrst*/

#include "gpr_gaussian_process_test.hpp"

#include <cmath>

#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "gpr_cholesky.hpp"
#include "gpr_common.hpp"
#include "gpr_covariance.hpp"
#include "gpr_exception.hpp"
#include "gpr_gaussian_process.hpp"
#include "gpr_kernel_matrix.hpp"
#include "gpr_linear_algebra.hpp"
#include "gpr_linear_algebra_test.hpp"
#include "gpr_logging.hpp"
#include "gpr_model_parameters.hpp"
#include "gpr_random.hpp"
#include "gpr_test_utils.hpp"

namespace gp_regression {

namespace {

/*!\rst
  Three noisy points of a bump, ``X = {0, 1, 2}``, ``y = {0, 1, 0}``, unit squared exponential, ``\sigma^2 = 0.01``.
  Fitting must succeed, the likelihood must be finite, and the posterior mean at ``X`` must be near ``y``.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestThreePointBump() {
  int total_errors = 0;
  const std::vector<std::vector<double> > points = {{0.0}, {1.0}, {2.0}};
  const std::vector<double> values = {0.0, 1.0, 0.0};
  SquareExponential covariance(1, 1.0, 1.0);

  try {
    GaussianProcess gaussian_process(covariance, points, values, 0.01, JitterParameters(), ThreadSchedule());
    if (!CheckIntEquals(gaussian_process.dim(), 1) || !CheckIntEquals(gaussian_process.num_sampled(), 3)) {
      ++total_errors;
    }
    if (!std::isfinite(gaussian_process.LogLikelihood())) {
      GPR_ERROR_PRINTF("log likelihood = %.18E is not finite\n", gaussian_process.LogLikelihood());
      ++total_errors;
    }

    PosteriorPrediction prediction(gaussian_process.PosteriorPredict(points));
    if (!CheckIntEquals(prediction.num_to_sample, 3)) {
      ++total_errors;
    }
    for (int i = 0; i < 3; ++i) {
      if (!CheckDoubleWithin(prediction.mean[i], values[i], 0.05)) {
        ++total_errors;
      }
      if (!(prediction.MarginalVariance(i) < 0.01)) {
        GPR_ERROR_PRINTF("variance %.18E at training point %d exceeds the noise\n", prediction.MarginalVariance(i), i);
        ++total_errors;
      }
    }
  } catch (const RegressionException& exception) {
    GPR_ERROR_PRINTF("%s\n", exception.what());
    ++total_errors;
  }

  return total_errors;
}

/*!\rst
  Compares LogLikelihood() to ``-1/2 (y^T K_y^{-1} y + \log\det K_y + n \log 2\pi)`` written out for ``n = 1, 2``.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestLogLikelihoodHandValues() {
  int total_errors = 0;
  const double tolerance = 1.0e-14;

  {
    const double variance = 1.7;
    const double noise_variance = 0.2;
    const double value = 0.8;
    GaussianProcess gaussian_process(SquareExponential(1, variance, 0.5), {0.3}, {value}, 1, noise_variance);
    const double k_y = variance + noise_variance;
    const double truth = -0.5*(value*value/k_y + std::log(k_y) + kLog2Pi);
    if (!CheckDoubleWithinRelative(gaussian_process.LogLikelihood(), truth, tolerance)) {
      ++total_errors;
    }
    if (!CheckDoubleWithinRelative(gaussian_process.data_fit(), value*value/k_y, tolerance)) {
      ++total_errors;
    }
  }

  {
    const double variance = 1.3;
    const double length = 0.7;
    const double noise_variance = 0.1;
    const std::vector<double> values = {0.5, -0.3};
    GaussianProcess gaussian_process(SquareExponential(1, variance, length), {0.0, 1.0}, values, 1, noise_variance);

    // K_y = [a b; b a]
    const double a = variance + noise_variance;
    const double b = variance*std::exp(-0.5/(length*length));
    const double determinant = a*a - b*b;
    const double data_fit = (a*values[0]*values[0] - 2.0*b*values[0]*values[1] + a*values[1]*values[1])/determinant;
    const double truth = -0.5*(data_fit + std::log(determinant) + 2.0*kLog2Pi);
    if (!CheckDoubleWithinRelative(gaussian_process.LogLikelihood(), truth, tolerance)) {
      ++total_errors;
    }
    if (!CheckDoubleWithinRelative(gaussian_process.log_determinant(), std::log(determinant), tolerance)) {
      ++total_errors;
    }

    // K_inv_y = K_y^{-1} y
    const double alpha_0 = (a*values[0] - b*values[1])/determinant;
    const double alpha_1 = (a*values[1] - b*values[0])/determinant;
    if (!CheckDoubleWithinRelative(gaussian_process.K_inv_y()[0], alpha_0, tolerance) ||
        !CheckDoubleWithinRelative(gaussian_process.K_inv_y()[1], alpha_1, tolerance)) {
      ++total_errors;
    }
  }

  {
    // log det K_y against cofactors, n = 5, dim = 2
    UniformRandomGenerator uniform_generator(4242);
    std::vector<double> points;
    std::vector<double> values;
    BuildSineTrainingData(2, 5, -2.0, 2.0, &uniform_generator, &points, &values);
    MaternNu2p5 covariance(2, 0.9, 0.6);
    GaussianProcess gaussian_process(covariance, points, values, 2, 0.05);

    std::vector<double> k_y(5*5);
    BuildCovarianceMatrix(covariance, points.data(), 2, 5, ThreadSchedule(1), k_y.data());
    AddToDiagonal(5, 0.05, k_y.data());
    const double determinant = ComputeDeterminantByCofactors(k_y.data(), 5);
    if (!CheckDoubleWithinRelative(gaussian_process.log_determinant(), std::log(determinant), 1.0e-12)) {
      ++total_errors;
    }

    // (K + sigma^2 I)^{-1} (K + sigma^2 I) = I
    std::vector<double> inverse(gaussian_process.ComputeInverseCovariance());
    std::vector<double> product(5*5);
    std::vector<double> identity(5*5);
    GeneralMatrixMatrixMultiply(k_y.data(), 'N', inverse.data(), 1.0, 0.0, 5, 5, 5, product.data());
    BuildIdentityMatrix(5, identity.data());
    if (!CheckMatrixNormWithin(product.data(), identity.data(), 5, 5, 1.0e-12)) {
      ++total_errors;
    }
  }

  return total_errors;
}

/*!\rst
  With ``\sigma^2 \approx 0`` the posterior interpolates: mean equals ``y`` and variance is ~0 at ``X``.  Far from
  ``X`` the kernel underflows to 0 and the posterior is exactly the prior.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestInterpolationAndPriorReversion() {
  int total_errors = 0;
  const double variance = 2.5;
  const std::vector<double> points = {-2.0, -1.0, 0.0, 1.0, 2.0};
  std::vector<double> values(points.size());
  for (int i = 0; i < static_cast<int>(points.size()); ++i) {
    values[i] = std::sin(points[i]);
  }

  const KernelType kernel_types[] = {KernelType::kSquareExponential, KernelType::kMaternNu1p5,
                                     KernelType::kMaternNu2p5};
  for (const KernelType kernel_type : kernel_types) {
    GaussianProcess gaussian_process(KernelParameters(kernel_type, variance, 1.0), points, values, 1, 1.0e-10,
                                     JitterParameters(), ThreadSchedule(1));

    PosteriorPrediction prediction(gaussian_process.PosteriorPredict(points));
    for (int i = 0; i < prediction.num_to_sample; ++i) {
      if (!CheckDoubleWithin(prediction.mean[i], values[i], 1.0e-6)) {
        GPR_ERROR_PRINTF("%s does not interpolate point %d\n", KernelTypeName(kernel_type), i);
        ++total_errors;
      }
      if (!CheckDoubleWithin(prediction.MarginalVariance(i), 0.0, 1.0e-6)) {
        ++total_errors;
      }
    }

    const std::vector<double> far_points = {100.0, -250.0};
    PosteriorPrediction far_prediction(gaussian_process.PosteriorPredict(far_points));
    for (int i = 0; i < far_prediction.num_to_sample; ++i) {
      if (!CheckDoubleWithin(far_prediction.mean[i], 0.0, 1.0e-12) ||
          !CheckDoubleWithinRelative(far_prediction.MarginalVariance(i), variance, 1.0e-12) ||
          !CheckDoubleWithinRelative(far_prediction.MarginalStdDev(i), std::sqrt(variance), 1.0e-12)) {
        GPR_ERROR_PRINTF("%s does not revert to the prior at %.18E\n", KernelTypeName(kernel_type), far_points[i]);
        ++total_errors;
      }
    }
  }

  return total_errors;
}

/*!\rst
  The posterior covariance must be exactly symmetric with a non-negative diagonal; PosteriorPredict() must agree with
  the Compute*OfPoints() building blocks; and the result must not depend on the thread count.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestPosteriorConsistency() {
  int total_errors = 0;
  const int dim = 3;
  const int num_sampled = 80;
  const int num_to_sample = 60;
  UniformRandomGenerator uniform_generator(90210);
  std::vector<double> points;
  std::vector<double> values;
  BuildSineTrainingData(dim, num_sampled, -3.0, 3.0, &uniform_generator, &points, &values);
  // test points extend past the training box, further along the longest lengthscale
  const double lower_bounds[dim] = {-3.5, -5.0, -3.5};
  const double upper_bounds[dim] = {3.5, 5.0, 3.5};
  std::vector<double> points_to_sample(dim*num_to_sample);
  ComputeUniformPointsInBox(lower_bounds, upper_bounds, dim, num_to_sample, &uniform_generator,
                            points_to_sample.data());
  const SquareExponential covariance(dim, 1.2, std::vector<double>({0.9, 1.4, 1.1}));

  GaussianProcess gaussian_process(covariance, points, values, dim, 0.02, JitterParameters(), ThreadSchedule(1));
  PosteriorPrediction prediction(gaussian_process.PosteriorPredict(points_to_sample));

  if (!CheckMatrixIsSymmetric(prediction.covariance.data(), num_to_sample, 0.0)) {
    ++total_errors;
  }

  std::vector<double> mean(num_to_sample);
  std::vector<double> variance(num_to_sample*num_to_sample);
  std::vector<double> std_dev(num_to_sample);
  gaussian_process.ComputeMeanOfPoints(points_to_sample.data(), num_to_sample, mean.data());
  gaussian_process.ComputeVarianceOfPoints(points_to_sample.data(), num_to_sample, variance.data());
  gaussian_process.ComputeMarginalStdDevOfPoints(points_to_sample.data(), num_to_sample, std_dev.data());
  if (mean != prediction.mean || variance != prediction.covariance) {
    ++total_errors;
  }
  for (int i = 0; i < num_to_sample; ++i) {
    if (!(prediction.MarginalVariance(i) >= 0.0)) {
      ++total_errors;
    }
    if (!CheckDoubleWithinRelative(prediction.MarginalStdDev(i), std_dev[i], 0.0)) {
      ++total_errors;
    }
  }

  GaussianProcess threaded_gaussian_process(covariance, points, values, dim, 0.02, JitterParameters(),
                                            ThreadSchedule(4, omp_sched_guided, 0));
  PosteriorPrediction threaded_prediction(threaded_gaussian_process.PosteriorPredict(points_to_sample));
  if (threaded_gaussian_process.LogLikelihood() != gaussian_process.LogLikelihood() ||
      threaded_prediction.mean != prediction.mean || threaded_prediction.covariance != prediction.covariance) {
    GPR_ERROR_PRINTF("posterior depends on the thread count\n");
    ++total_errors;
  }

  // MarginalVariance clamps round-off negatives
  PosteriorPrediction clamped(2, {0.0, 0.0}, {-1.0e-17, 0.0, 0.0, 4.0});
  if (clamped.MarginalVariance(0) != 0.0 || clamped.MarginalStdDev(0) != 0.0 || clamped.MarginalStdDev(1) != 2.0) {
    ++total_errors;
  }

  return total_errors;
}

/*!\rst
  Duplicate inputs without noise make ``K`` singular: construction must fail unless jitter is enabled.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestDuplicatePoints() {
  int total_errors = 0;
  const std::vector<double> points = {1.0, 1.0};
  const std::vector<double> values = {0.3, 0.3};
  SquareExponential covariance(1, 1.0, 1.0);

  ++total_errors;
  try {
    GaussianProcess gaussian_process(covariance, points, values, 1, 0.0);
    GPR_ERROR_PRINTF("singular K factored; log likelihood = %.18E\n", gaussian_process.LogLikelihood());
  } catch (const NotPositiveDefiniteException& exception) {
    if (exception.matrix_name() == "K + noise_variance * I" && CheckIntEquals(exception.num_rows(), 2) &&
        CheckIntEquals(exception.leading_minor_index(), 2)) {
      --total_errors;
    }
  }

  try {
    GaussianProcess gaussian_process(covariance, points, values, 1, 0.0, JitterParameters(10, 1.0e-10, 10.0),
                                     ThreadSchedule());
    if (!(gaussian_process.jitter() > 0.0) || !std::isfinite(gaussian_process.LogLikelihood())) {
      ++total_errors;
    }
    PosteriorPrediction prediction(gaussian_process.PosteriorPredict(std::vector<double>({1.0})));
    if (!CheckDoubleWithin(prediction.mean[0], 0.3, 1.0e-5)) {
      ++total_errors;
    }
  } catch (const RegressionException& exception) {
    GPR_ERROR_PRINTF("%s\n", exception.what());
    ++total_errors;
  }

  return total_errors;
}

/*!\rst
  Empty test sets give empty predictions; an empty training set gives the prior and a zero log likelihood.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestEmptyPointSets() {
  int total_errors = 0;
  const double variance = 0.7;
  PeriodicKernel covariance(2, variance, 1.0, 3.0);

  GaussianProcess gaussian_process(covariance, {0.0, 0.0, 1.0, 0.5}, {1.0, -1.0}, 2, 0.1);
  PosteriorPrediction empty_prediction(gaussian_process.PosteriorPredict(std::vector<double>()));
  if (empty_prediction.num_to_sample != 0 || !empty_prediction.mean.empty() || !empty_prediction.covariance.empty()) {
    ++total_errors;
  }

  GaussianProcess prior(covariance, std::vector<double>(), std::vector<double>(), 2, 0.1);
  if (!CheckIntEquals(prior.num_sampled(), 0) || prior.LogLikelihood() != 0.0) {
    ++total_errors;
  }
  const std::vector<double> points_to_sample = {0.0, 0.0, 1.5, 0.0};
  PosteriorPrediction prediction(prior.PosteriorPredict(points_to_sample));
  std::vector<double> prior_covariance(2*2);
  BuildCovarianceMatrix(covariance, points_to_sample.data(), 2, 2, ThreadSchedule(1), prior_covariance.data());
  if (prediction.mean != std::vector<double>(2, 0.0) || prediction.covariance != prior_covariance) {
    ++total_errors;
  }

  return total_errors;
}

/*!\rst
  Each Update*() returns a new snapshot equal to a fresh fit of the updated inputs and leaves the original untouched.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestSnapshotUpdates() {
  int total_errors = 0;
  const int dim = 2;
  const int num_sampled = 10;
  const int num_initial = 6;
  UniformRandomGenerator uniform_generator(5150);
  std::vector<double> points;
  std::vector<double> values;
  BuildSineTrainingData(dim, num_sampled, -2.0, 2.0, &uniform_generator, &points, &values);
  const std::vector<double> points_to_sample = {0.1, 0.2, -1.3, 0.7, 1.9, -0.4};

  const KernelParameters kernel_parameters(KernelType::kMaternNu1p5, 1.1, 0.8);
  const std::vector<double> initial_points(points.begin(), points.begin() + dim*num_initial);
  const std::vector<double> initial_values(values.begin(), values.begin() + num_initial);
  GaussianProcess gaussian_process(kernel_parameters, initial_points, initial_values, dim, 0.05, JitterParameters(),
                                   ThreadSchedule());
  const double log_likelihood = gaussian_process.LogLikelihood();
  const PosteriorPrediction prediction(gaussian_process.PosteriorPredict(points_to_sample));

  // new data
  {
    const std::vector<double> new_points(points.begin() + dim*num_initial, points.end());
    const std::vector<double> new_values(values.begin() + num_initial, values.end());
    std::unique_ptr<GaussianProcess> updated(gaussian_process.AddTrainingPoints(new_points, new_values));
    GaussianProcess fresh(kernel_parameters, points, values, dim, 0.05, JitterParameters(), ThreadSchedule());

    if (!CheckIntEquals(updated->num_sampled(), num_sampled) ||
        !CheckDoubleWithinRelative(updated->LogLikelihood(), fresh.LogLikelihood(), 1.0e-14)) {
      ++total_errors;
    }
    PosteriorPrediction updated_prediction(updated->PosteriorPredict(points_to_sample));
    PosteriorPrediction fresh_prediction(fresh.PosteriorPredict(points_to_sample));
    if (!CheckMatrixNormWithin(updated_prediction.mean.data(), fresh_prediction.mean.data(), 3, 1, 1.0e-14) ||
        !CheckMatrixNormWithin(updated_prediction.covariance.data(), fresh_prediction.covariance.data(), 3, 3, 1.0e-14)) {
      ++total_errors;
    }
  }

  // new noise
  {
    std::unique_ptr<GaussianProcess> updated(gaussian_process.UpdateNoiseVariance(0.2));
    GaussianProcess fresh(kernel_parameters, initial_points, initial_values, dim, 0.2, JitterParameters(),
                          ThreadSchedule());
    if (updated->noise_variance() != 0.2 ||
        !CheckDoubleWithinRelative(updated->LogLikelihood(), fresh.LogLikelihood(), 1.0e-14)) {
      ++total_errors;
    }
  }

  // new kernel
  {
    const KernelParameters new_kernel_parameters(KernelType::kSquareExponential, 0.6, 1.5);
    std::unique_ptr<GaussianProcess> updated(gaussian_process.UpdateKernelParameters(new_kernel_parameters));
    std::unique_ptr<GaussianProcess> updated_covariance(gaussian_process.UpdateCovariance(SquareExponential(dim, 0.6, 1.5)));
    GaussianProcess fresh(new_kernel_parameters, initial_points, initial_values, dim, 0.05, JitterParameters(),
                          ThreadSchedule());
    if (std::string(updated->covariance().name()) != "SquareExponential" ||
        updated->LogLikelihood() != fresh.LogLikelihood() ||
        updated_covariance->LogLikelihood() != fresh.LogLikelihood()) {
      ++total_errors;
    }
  }

  // the original snapshot is unchanged
  PosteriorPrediction original_prediction(gaussian_process.PosteriorPredict(points_to_sample));
  if (gaussian_process.LogLikelihood() != log_likelihood || gaussian_process.num_sampled() != num_initial ||
      gaussian_process.noise_variance() != 0.05 || std::string(gaussian_process.covariance().name()) != "MaternNu1p5" ||
      original_prediction.mean != prediction.mean || original_prediction.covariance != prediction.covariance) {
    GPR_ERROR_PRINTF("update modified the original snapshot\n");
    ++total_errors;
  }

  // failed updates throw and produce nothing
  ++total_errors;
  try {
    std::unique_ptr<GaussianProcess> updated(gaussian_process.UpdateNoiseVariance(-1.0));
    GPR_ERROR_PRINTF("negative noise accepted: %.18E\n", updated->noise_variance());
  } catch (const ConfigurationException& exception) {
    if (exception.parameter_name() == "noise_variance") {
      --total_errors;
    }
  }
  ++total_errors;
  try {
    std::unique_ptr<GaussianProcess> updated(gaussian_process.AddTrainingPoints({0.0, 1.0, 2.0, 3.0}, {1.0}));
    GPR_ERROR_PRINTF("mismatched training data accepted: %d points\n", updated->num_sampled());
  } catch (const DimensionMismatchException& exception) {
    --total_errors;
  }

  return total_errors;
}

/*!\rst
  Checks SamplePosterior() with a known sequence of normal draws at test points far from the data, where the posterior
  is the prior with diagonal covariance and each sample is ``\sigma_f z``.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestSamplePosterior() {
  int total_errors = 0;
  const double variance = 2.25;
  GaussianProcess gaussian_process(SquareExponential(1, variance, 0.5), {0.0, 0.4, 1.0}, {0.1, 0.5, -0.2}, 1, 0.01);

  const std::vector<double> random_number_table = {0.5, -1.2, 2.0, 0.0, -0.3, 1.1};
  NormalRNGSimulator normal_rng(random_number_table);
  const std::vector<double> far_points = {50.0, 80.0};
  std::vector<double> samples(gaussian_process.SamplePosterior(far_points, 3, JitterParameters(), &normal_rng));

  if (!CheckIntEquals(samples.size(), 6) || !CheckIntEquals(normal_rng.index(), 6)) {
    ++total_errors;
  } else {
    for (int i = 0; i < 6; ++i) {
      if (!CheckDoubleWithin(samples[i], 1.5*random_number_table[i], 1.0e-14)) {
        ++total_errors;
      }
    }
  }

  // near the data: the sample mean over many draws approaches the posterior mean
  {
    NormalRNG normal_rng_real(8128);
    const std::vector<double> points_to_sample = {0.2, 0.7};
    const int num_samples = 4000;
    std::vector<double> draws(gaussian_process.SamplePosterior(points_to_sample, num_samples,
                                                               JitterParameters(5, 1.0e-12, 10.0), &normal_rng_real));
    PosteriorPrediction prediction(gaussian_process.PosteriorPredict(points_to_sample));
    for (int i = 0; i < 2; ++i) {
      double sample_mean = 0.0;
      for (int s = 0; s < num_samples; ++s) {
        sample_mean += draws[s*2 + i];
      }
      sample_mean /= num_samples;
      // 5 standard errors
      const double tolerance = 5.0*prediction.MarginalStdDev(i)/std::sqrt(static_cast<double>(num_samples)) + 1.0e-12;
      if (!CheckDoubleWithin(sample_mean, prediction.mean[i], tolerance)) {
        ++total_errors;
      }
    }
  }

  ++total_errors;
  try {
    std::vector<double> bad_samples(gaussian_process.SamplePosterior(far_points, -1, JitterParameters(), &normal_rng));
    GPR_ERROR_PRINTF("negative sample count accepted: %d\n", static_cast<int>(bad_samples.size()));
  } catch (const ConfigurationException& exception) {
    if (exception.parameter_name() == "num_samples") {
      --total_errors;
    }
  }

  return total_errors;
}

/*!\rst
  The model is invariant to the units of ``y``: scaling ``y`` by ``s`` together with ``\sigma_f^2`` and ``\sigma^2`` by
  ``s^2`` scales the posterior mean by ``s``, the posterior covariance by ``s^2``, and shifts the log likelihood by
  ``-n \log s``.  Checked at ``s = 10^{-9}``, where every entry of ``K + \sigma^2 I`` is at most ``10^{-18}``.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestSmallScaleData() {
  int total_errors = 0;
  const double scale = 1.0e-9;
  const double tolerance = 1.0e-12;

  // noiseless single point: K = [1e-18]
  try {
    const double value = 2.0*scale;
    GaussianProcess gaussian_process(SquareExponential(1, scale*scale, 1.0), {0.0}, {value}, 1, 0.0);
    const double truth = -0.5*(4.0 + std::log(scale*scale) + kLog2Pi);
    if (!CheckDoubleWithinRelative(gaussian_process.LogLikelihood(), truth, tolerance)) {
      ++total_errors;
    }
    PosteriorPrediction prediction(gaussian_process.PosteriorPredict(std::vector<double>({0.0})));
    if (!CheckDoubleWithinRelative(prediction.mean[0], value, tolerance)) {
      ++total_errors;
    }
  } catch (const RegressionException& exception) {
    GPR_ERROR_PRINTF("%s\n", exception.what());
    ++total_errors;
  }

  // the three point bump in units of 1e-9
  try {
    const std::vector<double> points = {0.0, 1.0, 2.0};
    const std::vector<double> values = {0.0, 1.0, 0.0};
    const std::vector<double> scaled_values = {0.0, scale, 0.0};
    const std::vector<double> points_to_sample = {-0.5, 1.0, 2.5};
    GaussianProcess gaussian_process(SquareExponential(1, 1.0, 1.0), points, values, 1, 0.01);
    GaussianProcess scaled_gaussian_process(SquareExponential(1, scale*scale, 1.0), points, scaled_values, 1,
                                            0.01*scale*scale);

    const double log_likelihood_shift = -3.0*std::log(scale);
    if (!CheckDoubleWithin(scaled_gaussian_process.LogLikelihood(),
                           gaussian_process.LogLikelihood() + log_likelihood_shift,
                           tolerance*std::fabs(log_likelihood_shift))) {
      ++total_errors;
    }

    PosteriorPrediction prediction(gaussian_process.PosteriorPredict(points_to_sample));
    PosteriorPrediction scaled_prediction(scaled_gaussian_process.PosteriorPredict(points_to_sample));
    for (int i = 0; i < 3; ++i) {
      if (!CheckDoubleWithin(scaled_prediction.mean[i], scale*prediction.mean[i], tolerance*scale) ||
          !CheckDoubleWithin(scaled_prediction.MarginalVariance(i), scale*scale*prediction.MarginalVariance(i),
                             tolerance*scale*scale)) {
        GPR_ERROR_PRINTF("point %d: scaled posterior disagrees\n", i);
        ++total_errors;
      }
    }
  } catch (const RegressionException& exception) {
    GPR_ERROR_PRINTF("%s\n", exception.what());
    ++total_errors;
  }

  return total_errors;
}

/*!\rst
  Malformed inputs must be rejected when the GaussianProcess is built or queried.

  \return
    number of test failures
\endrst*/
GPR_WARN_UNUSED_RESULT int TestInputValidation() {
  int total_errors = 0;
  SquareExponential covariance(2, 1.0, 1.0);
  const std::vector<double> points = {0.0, 0.0, 1.0, 1.0};
  const std::vector<double> values = {0.5, -0.5};

  ++total_errors;
  try {
    GaussianProcess gaussian_process(covariance, points, values, 2, -0.01);
    GPR_ERROR_PRINTF("negative noise accepted: %.18E\n", gaussian_process.noise_variance());
  } catch (const ConfigurationException& exception) {
    if (exception.parameter_name() == "noise_variance") {
      --total_errors;
    }
  }

  ++total_errors;
  try {
    GaussianProcess gaussian_process(covariance, points, values, 2, std::numeric_limits<double>::quiet_NaN());
    GPR_ERROR_PRINTF("NaN noise accepted: %.18E\n", gaussian_process.noise_variance());
  } catch (const ConfigurationException& exception) {
    --total_errors;
  }

  // 2 points, 3 values
  ++total_errors;
  try {
    GaussianProcess gaussian_process(covariance, points, {0.5, -0.5, 1.0}, 2, 0.1);
    GPR_ERROR_PRINTF("%d points accepted with 3 values\n", gaussian_process.num_sampled());
  } catch (const DimensionMismatchException& exception) {
    --total_errors;
  }

  // the covariance is 2-dimensional
  ++total_errors;
  try {
    GaussianProcess gaussian_process(covariance, points, {0.5, -0.5, 1.0, 0.0}, 1, 0.1);
    GPR_ERROR_PRINTF("dim %d accepted for a 2-d covariance\n", gaussian_process.dim());
  } catch (const DimensionMismatchException& exception) {
    if (CheckIntEquals(exception.value(), 2) && CheckIntEquals(exception.expected(), 1)) {
      --total_errors;
    }
  }

  // ragged nested points
  ++total_errors;
  try {
    GaussianProcess gaussian_process(covariance, std::vector<std::vector<double> >({{0.0, 0.0}, {1.0}}), values, 0.1,
                                     JitterParameters(), ThreadSchedule());
    GPR_ERROR_PRINTF("ragged points accepted: %d\n", gaussian_process.num_sampled());
  } catch (const DimensionMismatchException& exception) {
    --total_errors;
  }

  // 3 coordinates are not a list of 2-d points
  GaussianProcess gaussian_process(covariance, points, values, 2, 0.1);
  ++total_errors;
  try {
    PosteriorPrediction prediction(gaussian_process.PosteriorPredict(std::vector<double>({0.0, 1.0, 2.0})));
    GPR_ERROR_PRINTF("predicted at %d points from 3 coordinates\n", prediction.num_to_sample);
  } catch (const DimensionMismatchException& exception) {
    // the second point has 1 of 2 coordinates
    if (CheckIntEquals(exception.value(), 1) && CheckIntEquals(exception.expected(), 2)) {
      --total_errors;
    }
  }

  // 7 coordinates in 3-d: the third point has 1 of 3
  {
    GaussianProcess gaussian_process_3d(SquareExponential(3, 1.0, 1.0), {0.0, 0.0, 0.0}, {1.0}, 3, 0.1);
    ++total_errors;
    try {
      PosteriorPrediction prediction(gaussian_process_3d.PosteriorPredict(std::vector<double>(7, 0.5)));
      GPR_ERROR_PRINTF("predicted at %d points from 7 coordinates\n", prediction.num_to_sample);
    } catch (const DimensionMismatchException& exception) {
      const std::string message(exception.what());
      if (CheckIntEquals(exception.value(), 1) && CheckIntEquals(exception.expected(), 3) &&
          message.find("size 1 does not match expected size 3") != std::string::npos &&
          message.find("multiple of dim") != std::string::npos) {
        --total_errors;
      }
    }
  }

  ++total_errors;
  try {
    PosteriorPrediction prediction(gaussian_process.PosteriorPredict(std::vector<std::vector<double> >({{0.0, 1.0, 2.0}})));
    GPR_ERROR_PRINTF("predicted at a 3-d point with a 2-d model: %d\n", prediction.num_to_sample);
  } catch (const DimensionMismatchException& exception) {
    --total_errors;
  }

  return total_errors;
}

}  // end unnamed namespace

int RunGaussianProcessTests() {
  int total_errors = 0;
  int current_errors = 0;

  current_errors = TestThreePointBump();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("three point bump regression failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestLogLikelihoodHandValues();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("log likelihood hand values failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestInterpolationAndPriorReversion();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("interpolation/prior reversion failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestPosteriorConsistency();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("posterior consistency failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestDuplicatePoints();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("duplicate training points failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestEmptyPointSets();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("empty point sets failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestSnapshotUpdates();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("snapshot updates failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestSamplePosterior();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("posterior sampling failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestSmallScaleData();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("small-scale data failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  current_errors = TestInputValidation();
  if (current_errors != 0) {
    GPR_PARTIAL_FAILURE_PRINTF("input validation failed with %d errors\n", current_errors);
  }
  total_errors += current_errors;

  return total_errors;
}

}  // end namespace gp_regression
