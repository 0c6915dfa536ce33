/*!
  \file gpr_regression_model.hpp
  \rst
  GaussianProcessModel: a stateful holder for GaussianProcess snapshots (gpr_gaussian_process.hpp).

  GaussianProcess objects are immutable; "updating" one produces a new object.  Applications usually want a single
  long-lived model instead, one that is fit once, re-tuned (noise, kernel) and fed more data over time.  This class
  provides that interface and the lifecycle rules around it:

  ::

    kUninitialized --Fit ok--> kReady --Update* ok--> kReady
                                 |
                                 +--Update* fails--> kUpdateFailed --RestoreLastValidSnapshot()--> kReady

  * LogLikelihood(), PosteriorPredict() and snapshot() require ``kReady``; otherwise they throw
    ModelNotReadyException.  A failed update therefore cannot be silently ignored: queries keep failing until the
    caller acknowledges it (RestoreLastValidSnapshot()) or installs a new fit/update.
  * A failed update (any RegressionException: bad configuration, wrong dimensions, a matrix that is not positive
    definite) rethrows the original exception.  The last valid snapshot is kept untouched.
  * A failed Fit() leaves the state and snapshot exactly as they were.
  * Update*() starting from ``kUpdateFailed`` works on the last valid snapshot; success returns the model to ``kReady``.

  **Threading**

  The current snapshot is a ``std::shared_ptr<const GaussianProcess>`` guarded by a mutex.  The lock is only held to
  read or swap the pointer (and the state); snapshots are built and queried outside it.  A reader that obtained a
  snapshot keeps using it safely even if an update swaps in a new one meanwhile.  Any number of threads may query;
  updates are meant to come from a single writer (concurrent writers do not corrupt the model, but the last one to
  finish wins).
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_REGRESSION_MODEL_HPP_
#define GP_REGRESSION_CPP_GPR_REGRESSION_MODEL_HPP_

#include <memory>
#include <mutex>  // NOLINT(build/c++11)
#include <vector>

#include "gpr_common.hpp"
#include "gpr_covariance.hpp"
#include "gpr_gaussian_process.hpp"
#include "gpr_model_parameters.hpp"

namespace gp_regression {

//! Lifecycle states of a GaussianProcessModel.
enum class ModelState {
  //! no successful Fit() yet; nothing can be queried or updated
  kUninitialized = 0,
  //! holds a valid snapshot; queries are allowed
  kReady = 1,
  //! the most recent update failed; the previous snapshot is retained but queries are refused
  kUpdateFailed = 2,
};

//! Lowercase name of ``state`` for messages, e.g., "update_failed".
char const * ModelStateName(ModelState state) noexcept GPR_CONST_FUNCTION GPR_WARN_UNUSED_RESULT;

/*!\rst
  Stateful Gaussian Process regression model.  See file comments.
\endrst*/
class GaussianProcessModel final {
 public:
  //! An empty model, in state ``kUninitialized``.
  GaussianProcessModel() noexcept;

  /*!\rst
    A model in state ``kReady`` holding ``gaussian_process``.

    \param
      :gaussian_process: an existing snapshot (must not be null)
  \endrst*/
  explicit GaussianProcessModel(std::unique_ptr<GaussianProcess> gaussian_process);

  /*!\rst
    Build and install a new snapshot (see GaussianProcess ctors); on success the model is ``kReady`` regardless of its
    previous state.

    \raise
      everything GaussianProcess construction raises; the model is then unchanged
  \endrst*/
  void Fit(const KernelParameters& kernel_parameters, std::vector<double> points_sampled,
           std::vector<double> points_sampled_value, int dim, double noise_variance,
           const JitterParameters& jitter_parameters, const ThreadSchedule& thread_schedule);

  //! Same as above with an explicit covariance object.
  void Fit(const CovarianceInterface& covariance, std::vector<double> points_sampled,
           std::vector<double> points_sampled_value, int dim, double noise_variance,
           const JitterParameters& jitter_parameters, const ThreadSchedule& thread_schedule);

  /*!\rst
    Re-fit the current data with a new noise variance.

    \raise
      ModelNotReadyException if the model was never fit; otherwise whatever the rebuild raises, after moving to
      ``kUpdateFailed``
  \endrst*/
  void UpdateNoiseVariance(double noise_variance);

  //! Re-fit the current data with new kernel parameters.  Same error handling as UpdateNoiseVariance().
  void UpdateKernelParameters(const KernelParameters& kernel_parameters);

  //! Re-fit the current data with a new covariance object.  Same error handling as UpdateNoiseVariance().
  void UpdateCovariance(const CovarianceInterface& covariance);

  /*!\rst
    Append training data (``new_points[dim][num_new_points]``, ``new_points_value[num_new_points]``) and re-fit.
    Same error handling as UpdateNoiseVariance().
  \endrst*/
  void AddTrainingPoints(const std::vector<double>& new_points, const std::vector<double>& new_points_value);

  /*!\rst
    Leave ``kUpdateFailed`` and serve the last valid snapshot again.  No-op in state ``kReady``.

    \raise
      ModelNotReadyException if the model was never fit
  \endrst*/
  void RestoreLastValidSnapshot();

  ModelState state() const GPR_WARN_UNUSED_RESULT;

  /*!\rst
    \return
      the current snapshot; stays valid (and unchanged) after later updates
    \raise
      ModelNotReadyException unless ``kReady``
  \endrst*/
  std::shared_ptr<const GaussianProcess> snapshot() const GPR_WARN_UNUSED_RESULT;

  /*!\rst
    GaussianProcess::LogLikelihood() of the current snapshot.

    \raise
      ModelNotReadyException unless ``kReady``
  \endrst*/
  double LogLikelihood() const GPR_WARN_UNUSED_RESULT;

  /*!\rst
    GaussianProcess::PosteriorPredict() of the current snapshot.

    \raise
      ModelNotReadyException unless ``kReady``; DimensionMismatchException for malformed test points
  \endrst*/
  PosteriorPrediction PosteriorPredict(const std::vector<double>& points_to_sample) const GPR_WARN_UNUSED_RESULT;

  //! Same as above with test inputs as a list of points.
  PosteriorPrediction PosteriorPredict(const std::vector<std::vector<double> >& points_to_sample) const GPR_WARN_UNUSED_RESULT;

  GPR_DISALLOW_COPY_AND_ASSIGN(GaussianProcessModel);

 private:
  /*!\rst
    Build a new snapshot from the current one with ``build_updated`` (called outside the lock) and install it.
    On RegressionException: move to ``kUpdateFailed``, log a warning and rethrow.
  \endrst*/
  template <typename UpdateFunction>
  void ApplyUpdate(char const * update_name, UpdateFunction build_updated);

  //! Install ``gaussian_process`` and move to ``kReady``.
  void InstallSnapshot(std::unique_ptr<GaussianProcess> gaussian_process);

  //! The current snapshot if ``kReady``; else throws ModelNotReadyException.
  std::shared_ptr<const GaussianProcess> ReadySnapshot() const;

  //! guards state_ and gaussian_process_
  mutable std::mutex mutex_;
  ModelState state_;
  //! the last valid snapshot; null only in ``kUninitialized``
  std::shared_ptr<const GaussianProcess> gaussian_process_;
};

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_REGRESSION_MODEL_HPP_
