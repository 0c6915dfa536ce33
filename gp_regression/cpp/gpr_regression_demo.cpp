/*!
  \file gpr_regression_demo.cpp
  \rst
  This is a demo for the Gaussian Process regression capability present in this project.  It walks through:

  1. Fitting a GaussianProcessModel to three noisy observations of a bump, ``X = {0, 1, 2}``, ``y = {0, 1, 0}``,
     with a unit squared exponential kernel and noise variance 0.01.
  2. Printing the log marginal likelihood, then the posterior mean and a ``\pm 2\sigma`` band on a grid over
     ``[-1, 3]``.  Away from the data the band widens and the mean reverts to 0.
  3. The marginal standard deviation alone at a few uniformly random locations, then joint samples of the latent
     function on a coarse grid with NormalRNG.
  4. Re-tuning the model (noise, kernel) and adding data; each update installs a new snapshot.
  5. A failed update (negative noise variance), the resulting ``update_failed`` state, and recovery.

  With GPR_USER_INPUTS set to 1 (the default), the training data is the bump above; edit it to try your own.  With 0,
  training data is drawn from a sum of sines at latin hypercube locations, as in the unit tests.
\endrst*/

#include <cstdio>

#include <memory>
#include <vector>

#include "gpr_common.hpp"
#include "gpr_covariance.hpp"
#include "gpr_exception.hpp"
#include "gpr_gaussian_process.hpp"
#include "gpr_logging.hpp"
#include "gpr_model_parameters.hpp"
#include "gpr_random.hpp"
#include "gpr_regression_model.hpp"
#include "gpr_test_utils.hpp"

#define GPR_USER_INPUTS 1

using namespace gp_regression;  // NOLINT, i'm lazy in this file which has no external linkage anyway

int main() {
  const int dim = 1;
  const double noise_variance = 0.01;
  const KernelParameters kernel_parameters(KernelType::kSquareExponential, 1.0, 1.0);
  const ThreadSchedule thread_schedule(1);

#if GPR_USER_INPUTS == 1
  std::vector<double> points_sampled = {0.0, 1.0, 2.0};
  std::vector<double> points_sampled_value = {0.0, 1.0, 0.0};
#else
  UniformRandomGenerator uniform_generator(314);
  std::vector<double> points_sampled;
  std::vector<double> points_sampled_value;
  BuildSineTrainingData(dim, 8, 0.0, 2.0, &uniform_generator, &points_sampled, &points_sampled_value);
#endif

  GaussianProcessModel model;
  model.Fit(kernel_parameters, points_sampled, points_sampled_value, dim, noise_variance, JitterParameters(),
            thread_schedule);

  printf(GPR_ANSI_COLOR_BLUE "TRAINING DATA:\n" GPR_ANSI_COLOR_RESET);
  printf("points_sampled (one per row):\n");
  PrintMatrixTrans(points_sampled.data(), static_cast<int>(points_sampled_value.size()), dim);
  printf("points_sampled_value:\n");
  PrintMatrix(points_sampled_value.data(), 1, static_cast<int>(points_sampled_value.size()));
  printf("log marginal likelihood = %.18E\n", model.LogLikelihood());

  // posterior on a grid; rows: x, mean, mean - 2 sigma, mean + 2 sigma
  const int num_grid_points = 17;
  std::vector<double> grid(num_grid_points);
  for (int i = 0; i < num_grid_points; ++i) {
    grid[i] = -1.0 + 4.0*static_cast<double>(i)/static_cast<double>(num_grid_points - 1);
  }
  PosteriorPrediction prediction(model.PosteriorPredict(grid));
  std::vector<double> band(4*num_grid_points);
  for (int i = 0; i < num_grid_points; ++i) {
    const double std_dev = prediction.MarginalStdDev(i);
    band[i*4 + 0] = grid[i];
    band[i*4 + 1] = prediction.mean[i];
    band[i*4 + 2] = prediction.mean[i] - 2.0*std_dev;
    band[i*4 + 3] = prediction.mean[i] + 2.0*std_dev;
  }
  printf(GPR_ANSI_COLOR_BLUE "POSTERIOR (x, mean, mean - 2 sigma, mean + 2 sigma):\n" GPR_ANSI_COLOR_RESET);
  PrintMatrixTrans(band.data(), num_grid_points, 4);

  // marginal uncertainty alone, at random locations in the same interval
  const int num_random_points = 5;
  const double grid_lower = -1.0;
  const double grid_upper = 3.0;
  UniformRandomGenerator point_generator(2024);
  std::vector<double> random_points(num_random_points);
  ComputeUniformPointsInBox(&grid_lower, &grid_upper, dim, num_random_points, &point_generator, random_points.data());
  std::vector<double> random_std_dev(num_random_points);
  model.snapshot()->ComputeMarginalStdDevOfPoints(random_points.data(), num_random_points, random_std_dev.data());
  printf(GPR_ANSI_COLOR_BLUE "MARGINAL STD DEV at random points (x, sigma):\n" GPR_ANSI_COLOR_RESET);
  for (int i = 0; i < num_random_points; ++i) {
    printf("%.18E %.18E\n", random_points[i], random_std_dev[i]);
  }

  // joint samples; the posterior covariance is only PSD, so allow a little jitter
  const int num_samples = 3;
  const std::vector<double> sample_points = {-0.5, 0.5, 1.5, 2.5};
  NormalRNG normal_rng(314);
  std::shared_ptr<const GaussianProcess> snapshot(model.snapshot());
  std::vector<double> samples(snapshot->SamplePosterior(sample_points, num_samples,
                                                        JitterParameters(5, 1.0e-12, 10.0), &normal_rng));
  printf(GPR_ANSI_COLOR_BLUE "POSTERIOR SAMPLES at x = -0.5, 0.5, 1.5, 2.5 (one per row):\n" GPR_ANSI_COLOR_RESET);
  PrintMatrixTrans(samples.data(), num_samples, static_cast<int>(sample_points.size()));

  // re-tuning: each update installs a new snapshot; the one held above is unchanged
  printf(GPR_ANSI_COLOR_BLUE "UPDATES:\n" GPR_ANSI_COLOR_RESET);
  model.UpdateNoiseVariance(0.1);
  printf("noise variance 0.1: log marginal likelihood = %.18E\n", model.LogLikelihood());
  model.UpdateKernelParameters(KernelParameters(KernelType::kMaternNu2p5, 1.0, 0.8));
  printf("matern 5/2, length 0.8: log marginal likelihood = %.18E\n", model.LogLikelihood());
  model.AddTrainingPoints({3.0}, {-0.5});
  printf("added (3, -0.5): %d points, log marginal likelihood = %.18E\n", model.snapshot()->num_sampled(),
         model.LogLikelihood());
  printf("held snapshot still has %d points, log marginal likelihood = %.18E\n", snapshot->num_sampled(),
         snapshot->LogLikelihood());

  // failure: a negative noise variance is rejected and the model refuses queries until restored
  printf(GPR_ANSI_COLOR_BLUE "FAILED UPDATE:\n" GPR_ANSI_COLOR_RESET);
  try {
    model.UpdateNoiseVariance(-0.01);
  } catch (const RegressionException& exception) {
    printf("update rejected: %s", exception.what());
  }
  printf("model state: %s\n", ModelStateName(model.state()));
  try {
    printf("log marginal likelihood = %.18E\n", model.LogLikelihood());
  } catch (const ModelNotReadyException& exception) {
    printf("query rejected: %s", exception.what());
  }
  model.RestoreLastValidSnapshot();
  printf("restored: state %s, %d points, log marginal likelihood = %.18E\n", ModelStateName(model.state()),
         model.snapshot()->num_sampled(), model.LogLikelihood());

  return 0;
}
