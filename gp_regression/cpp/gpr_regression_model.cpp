/*!
  \file gpr_regression_model.cpp
  \rst
  Implementation of GaussianProcessModel.
\endrst*/

#include "gpr_regression_model.hpp"

#include <memory>
#include <mutex>  // NOLINT(build/c++11)
#include <utility>
#include <vector>

#include "gpr_common.hpp"
#include "gpr_covariance.hpp"
#include "gpr_exception.hpp"
#include "gpr_gaussian_process.hpp"
#include "gpr_logging.hpp"
#include "gpr_model_parameters.hpp"

namespace gp_regression {

char const * ModelStateName(ModelState state) noexcept {
  switch (state) {
    case ModelState::kUninitialized: {
      return "uninitialized";
    }
    case ModelState::kReady: {
      return "ready";
    }
    case ModelState::kUpdateFailed: {
      return "update_failed";
    }
  }
  return "unknown";
}

GaussianProcessModel::GaussianProcessModel() noexcept : state_(ModelState::kUninitialized), gaussian_process_() {
}

GaussianProcessModel::GaussianProcessModel(std::unique_ptr<GaussianProcess> gaussian_process)
    : state_(ModelState::kUninitialized), gaussian_process_() {
  if (unlikely(gaussian_process == nullptr)) {
    GPR_THROW_EXCEPTION(ModelNotReadyException, "Cannot build a model from a null snapshot.",
                        ModelStateName(state_));
  }
  InstallSnapshot(std::move(gaussian_process));
}

void GaussianProcessModel::InstallSnapshot(std::unique_ptr<GaussianProcess> gaussian_process) {
  std::shared_ptr<const GaussianProcess> installed(std::move(gaussian_process));
  std::lock_guard<std::mutex> lock(mutex_);
  gaussian_process_ = std::move(installed);
  state_ = ModelState::kReady;
}

void GaussianProcessModel::Fit(const KernelParameters& kernel_parameters, std::vector<double> points_sampled,
                               std::vector<double> points_sampled_value, int dim, double noise_variance,
                               const JitterParameters& jitter_parameters, const ThreadSchedule& thread_schedule) {
  std::unique_ptr<GaussianProcess> gaussian_process(
      new GaussianProcess(kernel_parameters, std::move(points_sampled), std::move(points_sampled_value), dim,
                          noise_variance, jitter_parameters, thread_schedule));
  InstallSnapshot(std::move(gaussian_process));
}

void GaussianProcessModel::Fit(const CovarianceInterface& covariance, std::vector<double> points_sampled,
                               std::vector<double> points_sampled_value, int dim, double noise_variance,
                               const JitterParameters& jitter_parameters, const ThreadSchedule& thread_schedule) {
  std::unique_ptr<GaussianProcess> gaussian_process(
      new GaussianProcess(covariance, std::move(points_sampled), std::move(points_sampled_value), dim,
                          noise_variance, jitter_parameters, thread_schedule));
  InstallSnapshot(std::move(gaussian_process));
}

template <typename UpdateFunction>
void GaussianProcessModel::ApplyUpdate(char const * update_name, UpdateFunction build_updated) {
  std::shared_ptr<const GaussianProcess> current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unlikely(state_ == ModelState::kUninitialized)) {
      GPR_THROW_EXCEPTION(ModelNotReadyException, "Cannot update a model that was never fit.",
                          ModelStateName(state_));
    }
    current = gaussian_process_;
  }

  std::unique_ptr<GaussianProcess> updated;
  try {
    updated = build_updated(*current);
  } catch (const RegressionException& exception) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_ = ModelState::kUpdateFailed;
    }
    GPR_WARNING_PRINTF("%s failed; model is now %s and keeps its last valid snapshot (%d points).\n%s\n",
                       update_name, ModelStateName(ModelState::kUpdateFailed), current->num_sampled(),
                       exception.what());
    throw;
  }
  InstallSnapshot(std::move(updated));
}

void GaussianProcessModel::UpdateNoiseVariance(double noise_variance) {
  ApplyUpdate("UpdateNoiseVariance", [noise_variance](const GaussianProcess& gaussian_process) {
    return gaussian_process.UpdateNoiseVariance(noise_variance);
  });
}

void GaussianProcessModel::UpdateKernelParameters(const KernelParameters& kernel_parameters) {
  ApplyUpdate("UpdateKernelParameters", [&kernel_parameters](const GaussianProcess& gaussian_process) {
    return gaussian_process.UpdateKernelParameters(kernel_parameters);
  });
}

void GaussianProcessModel::UpdateCovariance(const CovarianceInterface& covariance) {
  ApplyUpdate("UpdateCovariance", [&covariance](const GaussianProcess& gaussian_process) {
    return gaussian_process.UpdateCovariance(covariance);
  });
}

void GaussianProcessModel::AddTrainingPoints(const std::vector<double>& new_points,
                                             const std::vector<double>& new_points_value) {
  ApplyUpdate("AddTrainingPoints", [&new_points, &new_points_value](const GaussianProcess& gaussian_process) {
    return gaussian_process.AddTrainingPoints(new_points, new_points_value);
  });
}

void GaussianProcessModel::RestoreLastValidSnapshot() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unlikely(state_ == ModelState::kUninitialized)) {
    GPR_THROW_EXCEPTION(ModelNotReadyException, "No valid snapshot to restore.", ModelStateName(state_));
  }
  state_ = ModelState::kReady;
}

ModelState GaussianProcessModel::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::shared_ptr<const GaussianProcess> GaussianProcessModel::ReadySnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unlikely(state_ != ModelState::kReady)) {
    GPR_THROW_EXCEPTION(ModelNotReadyException, "Model cannot be queried.", ModelStateName(state_));
  }
  return gaussian_process_;
}

std::shared_ptr<const GaussianProcess> GaussianProcessModel::snapshot() const {
  return ReadySnapshot();
}

double GaussianProcessModel::LogLikelihood() const {
  return ReadySnapshot()->LogLikelihood();
}

PosteriorPrediction GaussianProcessModel::PosteriorPredict(const std::vector<double>& points_to_sample) const {
  return ReadySnapshot()->PosteriorPredict(points_to_sample);
}

PosteriorPrediction GaussianProcessModel::PosteriorPredict(const std::vector<std::vector<double> >& points_to_sample) const {
  return ReadySnapshot()->PosteriorPredict(points_to_sample);
}

}  // end namespace gp_regression
