/*!
  \file gpr_gaussian_process.hpp
  \rst
  GaussianProcess: Gaussian Process regression with a zero prior mean and homoscedastic Gaussian observation noise.

  **1. Math**

  Notation: ``X`` (``points_sampled``) are the ``n`` training inputs with observations ``y`` (``points_sampled_value``);
  ``Xs`` (``points_to_sample``) are ``m`` test inputs.  ``K = K(X, X)``, ``Ks = K(X, Xs)`` and ``Kss = K(Xs, Xs)`` are
  covariance matrices (gpr_kernel_matrix.hpp), and ``\sigma^2`` is the noise variance.

  Training factors the regularized covariance once::

    R * R^T = K + \sigma^2 I          (CholeskySolver)
    w = R^{-1} y
    \alpha = R^{-T} w = (K + \sigma^2 I)^{-1} y

  The log marginal likelihood (Rasmussen & Williams, Equation 2.30) is::

    \log p(y | X) = -1/2 * (n \log(2\pi) + \log\det(K + \sigma^2 I) + y^T (K + \sigma^2 I)^{-1} y)

  where the data-fit term ``y^T (K + \sigma^2 I)^{-1} y = \|w\|_2^2`` and ``\log\det = 2 \sum_i \log R_{ii}``.

  The posterior at ``Xs`` (Equations 2.23, 2.24) is::

    mus = Ks^T \alpha
    Vars = Kss - Ks^T (K + \sigma^2 I)^{-1} Ks = Kss - V^T V,    V = R^{-1} Ks

  ``V^T V`` needs one triangular solve per test point and is symmetric by construction; no explicit inverse is ever
  formed for likelihood or prediction.

  **2. Immutability**

  A GaussianProcess is a snapshot: every derived quantity is computed in the ctor and never changes.  "Updates"
  (new noise, new kernel, more data) return a NEW object and leave ``this`` untouched, so a snapshot may be read from
  any number of threads while an update is being built.  The only mutable state involved in prediction lives in the
  caller (e.g., the NormalRNG passed to SamplePosterior()).

  The ctor either produces a complete snapshot or throws:

  * ConfigurationException: negative noise variance, bad kernel parameters, bad jitter settings
  * DimensionMismatchException: coordinates/observations of inconsistent size, or a covariance of the wrong dimension
  * NotPositiveDefiniteException: ``K + \sigma^2 I`` did not factor (and jitter was off or exhausted)

  GaussianProcessModel (gpr_regression_model.hpp) wraps snapshots in a stateful, lockable holder.
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_GAUSSIAN_PROCESS_HPP_
#define GP_REGRESSION_CPP_GPR_GAUSSIAN_PROCESS_HPP_

#include <memory>
#include <utility>
#include <vector>

#include "gpr_cholesky.hpp"
#include "gpr_common.hpp"
#include "gpr_covariance.hpp"
#include "gpr_model_parameters.hpp"
#include "gpr_random.hpp"

namespace gp_regression {

/*!\rst
  Posterior distribution of the GP at a list of test points: a multivariate normal with mean ``mean`` and covariance
  ``covariance``.
\endrst*/
struct PosteriorPrediction {
  PosteriorPrediction(int num_to_sample_in, std::vector<double> mean_in, std::vector<double> covariance_in)
      : num_to_sample(num_to_sample_in), mean(std::move(mean_in)), covariance(std::move(covariance_in)) {
  }

  /*!\rst
    Variance at the ``i``-th test point, ``covariance(i, i)``.  Round-off can make ``Kss - V^T V`` slightly negative on
    the diagonal when a test point nearly coincides with noiseless training data; such values are reported as 0.
  \endrst*/
  double MarginalVariance(int i) const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT;

  //! ``\sqrt{MarginalVariance(i)}``; e.g., for uncertainty bands
  double MarginalStdDev(int i) const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT;

  //! number of test points, ``m``
  int num_to_sample;
  //! posterior mean at each test point, ``mus[m]``
  std::vector<double> mean;
  //! posterior covariance ``Vars[m][m]``, stored in full; exactly symmetric
  std::vector<double> covariance;
};

/*!\rst
  Immutable Gaussian Process conditioned on training data.  See file comments for the math.
\endrst*/
class GaussianProcess final {
 public:
  /*!\rst
    Condition a GP on training data.

    \param
      :covariance: covariance function (cloned; the GP keeps its own copy); ``covariance.dim()`` must equal ``dim``
      :points_sampled[dim][num_sampled]: training inputs, ``X``
      :points_sampled_value[num_sampled]: observations, ``y``
      :dim: spatial dimension of a point
      :noise_variance: ``\sigma^2 >= 0``
      :jitter_parameters: opt-in diagonal jitter for the factorization (default: off)
      :thread_schedule: OpenMP settings for kernel matrix construction
    \raise
      see file comments, section 2
  \endrst*/
  GaussianProcess(const CovarianceInterface& covariance, std::vector<double> points_sampled,
                  std::vector<double> points_sampled_value, int dim, double noise_variance,
                  const JitterParameters& jitter_parameters, const ThreadSchedule& thread_schedule);

  //! Same as above with jitter disabled and the default ThreadSchedule.
  GaussianProcess(const CovarianceInterface& covariance, std::vector<double> points_sampled,
                  std::vector<double> points_sampled_value, int dim, double noise_variance);

  /*!\rst
    Same as above, building the covariance from ``kernel_parameters`` (see MakeCovariance()).
  \endrst*/
  GaussianProcess(const KernelParameters& kernel_parameters, std::vector<double> points_sampled,
                  std::vector<double> points_sampled_value, int dim, double noise_variance,
                  const JitterParameters& jitter_parameters, const ThreadSchedule& thread_schedule);

  /*!\rst
    Same as the first ctor, with training inputs as a list of points; ``dim`` is taken from ``covariance``.

    \raise
      DimensionMismatchException if a point does not have ``covariance.dim()`` coordinates or
      ``points_sampled.size() != points_sampled_value.size()``
  \endrst*/
  GaussianProcess(const CovarianceInterface& covariance, const std::vector<std::vector<double> >& points_sampled,
                  std::vector<double> points_sampled_value, double noise_variance,
                  const JitterParameters& jitter_parameters, const ThreadSchedule& thread_schedule);

  int dim() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return dim_;
  }

  int num_sampled() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return num_sampled_;
  }

  const std::vector<double>& points_sampled() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return points_sampled_;
  }

  const std::vector<double>& points_sampled_value() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return points_sampled_value_;
  }

  double noise_variance() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return noise_variance_;
  }

  const CovarianceInterface& covariance() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return *covariance_ptr_;
  }

  const JitterParameters& jitter_parameters() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return jitter_parameters_;
  }

  const ThreadSchedule& thread_schedule() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return thread_schedule_;
  }

  //! the factorization of ``K + \sigma^2 I`` (plus jitter, if any was needed)
  const CholeskySolver& cholesky() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return K_chol_;
  }

  //! diagonal jitter the factorization needed; 0.0 when ``K + \sigma^2 I`` factored as given
  double jitter() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return K_chol_.jitter();
  }

  //! ``\alpha = (K + \sigma^2 I)^{-1} y``
  const std::vector<double>& K_inv_y() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return K_inv_y_;
  }

  //! ``\log\det(K + \sigma^2 I)``
  double log_determinant() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return K_chol_.LogDeterminant();
  }

  //! ``y^T (K + \sigma^2 I)^{-1} y``
  double data_fit() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return data_fit_;
  }

  /*!\rst
    Log marginal likelihood, ``-1/2 * (n \log(2\pi) + \log\det(K + \sigma^2 I) + y^T (K + \sigma^2 I)^{-1} y)``.
    ``O(1)``: every term is cached.  0 for an empty training set.
  \endrst*/
  double LogLikelihood() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT;

  /*!\rst
    A new snapshot with the same data and kernel and noise variance ``noise_variance``.  Fully re-factors.
  \endrst*/
  std::unique_ptr<GaussianProcess> UpdateNoiseVariance(double noise_variance) const GPR_WARN_UNUSED_RESULT;

  /*!\rst
    A new snapshot with the same data and noise, conditioned under ``covariance``.  Fully re-factors.
  \endrst*/
  std::unique_ptr<GaussianProcess> UpdateCovariance(const CovarianceInterface& covariance) const GPR_WARN_UNUSED_RESULT;

  /*!\rst
    Same as UpdateCovariance(), building the covariance from ``kernel_parameters``.
  \endrst*/
  std::unique_ptr<GaussianProcess> UpdateKernelParameters(const KernelParameters& kernel_parameters) const GPR_WARN_UNUSED_RESULT;

  /*!\rst
    A new snapshot with ``new_points`` and ``new_points_value`` appended to the training data.

    \param
      :new_points[dim][num_new_points]: coordinates of the new points
      :new_points_value[num_new_points]: observations at the new points
  \endrst*/
  std::unique_ptr<GaussianProcess> AddTrainingPoints(const std::vector<double>& new_points,
                                                     const std::vector<double>& new_points_value) const GPR_WARN_UNUSED_RESULT;

  /*!\rst
    Posterior mean and covariance at ``Xs``.  An empty ``points_to_sample`` gives an empty prediction.

    \param
      :points_to_sample[dim][num_to_sample]: test inputs, ``Xs``
    \return
      the posterior prediction
    \raise
      DimensionMismatchException if ``points_to_sample.size()`` is not a multiple of ``dim()``
  \endrst*/
  PosteriorPrediction PosteriorPredict(const std::vector<double>& points_to_sample) const GPR_WARN_UNUSED_RESULT;

  /*!\rst
    Same as above with test inputs as a list of points.

    \raise
      DimensionMismatchException if any point does not have ``dim()`` coordinates
  \endrst*/
  PosteriorPrediction PosteriorPredict(const std::vector<std::vector<double> >& points_to_sample) const GPR_WARN_UNUSED_RESULT;

  /*!\rst
    Computes the posterior mean at each of ``Xs``, ``mus = Ks^T \alpha``.  ``O(n m dim)``.

    \param
      :points_to_sample[dim][num_to_sample]: test inputs, ``Xs``
      :num_to_sample: number of test points
    \output
      :mean_of_points[num_to_sample]: posterior mean
  \endrst*/
  void ComputeMeanOfPoints(double const * restrict points_to_sample, int num_to_sample,
                           double * restrict mean_of_points) const noexcept GPR_NONNULL_POINTERS;

  /*!\rst
    Computes the posterior covariance at ``Xs``, ``Vars = Kss - V^T V``.  ``O(n^2 m + n m^2)``.

    \param
      :points_to_sample[dim][num_to_sample]: test inputs, ``Xs``
      :num_to_sample: number of test points
    \output
      :var_star[num_to_sample][num_to_sample]: posterior covariance, stored in full
  \endrst*/
  void ComputeVarianceOfPoints(double const * restrict points_to_sample, int num_to_sample,
                               double * restrict var_star) const noexcept GPR_NONNULL_POINTERS;

  /*!\rst
    Computes only the diagonal of the posterior covariance, as standard deviations:
    ``\sqrt{\max(0, k(Xs_i, Xs_i) - \|V_i\|^2)}``.  Skips the ``O(n m^2)`` off-diagonal work of ComputeVarianceOfPoints().

    \output
      :std_dev[num_to_sample]: posterior standard deviation at each test point
  \endrst*/
  void ComputeMarginalStdDevOfPoints(double const * restrict points_to_sample, int num_to_sample,
                                     double * restrict std_dev) const noexcept GPR_NONNULL_POINTERS;

  /*!\rst
    Explicit ``(K + \sigma^2 I)^{-1}``.  Never needed for likelihood or prediction; provided for callers that need the
    dense matrix (e.g., leave-one-out diagnostics).  ``O(n^3)``.
  \endrst*/
  std::vector<double> ComputeInverseCovariance() const GPR_WARN_UNUSED_RESULT;

  /*!\rst
    Draws ``num_samples`` joint samples of the latent function at ``Xs`` from the posterior:
    ``f = mus + L_V z``, ``L_V L_V^T = Vars``, ``z ~ N(0, I)``.

    ``Vars`` is only positive SEMI-definite (e.g., at noiseless training inputs), so it is factored through
    FactorWithJitter() with ``jitter_parameters``.

    \param
      :points_to_sample[dim][num_to_sample]: test inputs, ``Xs``
      :num_samples: number of joint samples to draw
      :jitter_parameters: jitter policy for factoring ``Vars``
      :normal_rng[1]: source of ``N(0, 1)`` draws
    \output
      :normal_rng[1]: advanced by ``num_samples * num_to_sample`` draws
    \return
      ``samples[num_samples][num_to_sample]``: sample ``s`` occupies entries ``s*num_to_sample .. (s+1)*num_to_sample - 1``
    \raise
      DimensionMismatchException as in PosteriorPredict(); NotPositiveDefiniteException if ``Vars`` does not factor
  \endrst*/
  std::vector<double> SamplePosterior(const std::vector<double>& points_to_sample, int num_samples,
                                      const JitterParameters& jitter_parameters,
                                      NormalRNGInterface * normal_rng) const GPR_WARN_UNUSED_RESULT;

  GPR_DISALLOW_DEFAULT_AND_COPY_AND_ASSIGN(GaussianProcess);

 private:
  /*!\rst
    Checks inputs, builds ``K + \sigma^2 I`` and factors it.  Runs in the ctor's init list, before the derived vectors.
  \endrst*/
  CholeskySolver FactorTrainingCovariance() const;

  /*!\rst
    ``Ks = K(X, Xs)``, ``[num_to_sample][num_sampled]``.
  \endrst*/
  std::vector<double> BuildCrossCovariance(double const * restrict points_to_sample, int num_to_sample) const;

  /*!\rst
    Number of test points in a flattened list.  Throws DimensionMismatchException if the size is not a multiple of dim,
    reporting the coordinate count of the incomplete last point against ``dim``.
  \endrst*/
  int NumPointsInList(const std::vector<double>& points_to_sample) const;

  // size information
  //! spatial dimension (e.g., entries per point of ``points_sampled``)
  int dim_;
  //! number of points in ``points_sampled``
  int num_sampled_;

  // state variables for prior
  //! covariance function, ``k(x, x')``
  std::unique_ptr<CovarianceInterface> covariance_ptr_;
  //! coordinates of the training points, ``X``
  std::vector<double> points_sampled_;
  //! observations at points_sampled, ``y``
  std::vector<double> points_sampled_value_;
  //! ``\sigma^2``, the noise variance
  double noise_variance_;
  //! jitter policy for factoring ``K + \sigma^2 I``
  JitterParameters jitter_parameters_;
  //! OpenMP settings for kernel matrix construction
  ThreadSchedule thread_schedule_;

  // derived variables
  //! Cholesky factorization of ``K + \sigma^2 I``
  CholeskySolver K_chol_;
  //! ``\alpha = (K + \sigma^2 I)^{-1} y``; computed WITHOUT forming the inverse
  std::vector<double> K_inv_y_;
  //! ``\|R^{-1} y\|_2^2``
  double data_fit_;
};

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_GAUSSIAN_PROCESS_HPP_
