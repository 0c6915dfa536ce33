/*!
  \file gpr_model_parameters.hpp
  \rst
  Structs holding the settings supplied when a model is built: which kernel to use and its parameters
  (KernelParameters), the opt-in diagonal jitter fallback for Cholesky factorization (JitterParameters), and how
  kernel matrix construction is spread over OpenMP threads (ThreadSchedule).

  These are plain containers; values are validated by the objects that consume them (e.g., the covariance ctors
  in gpr_covariance.hpp throw ConfigurationException on non-positive variance).
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_MODEL_PARAMETERS_HPP_
#define GP_REGRESSION_CPP_GPR_MODEL_PARAMETERS_HPP_

#include <omp.h>  // NOLINT(build/include_order)

#include "gpr_common.hpp"

namespace gp_regression {

/*!\rst
  Enum for the available covariance functions; used by MakeCovariance() (gpr_covariance.hpp).
\endrst*/
enum class KernelType {
  //! SquareExponential
  kSquareExponential = 0,
  //! MaternNu1p5
  kMaternNu1p5 = 1,
  //! MaternNu2p5
  kMaternNu2p5 = 2,
  //! LinearKernel
  kLinear = 3,
  //! PeriodicKernel
  kPeriodic = 4,
};

/*!\rst
  Name of a KernelType, for logging.
\endrst*/
inline char const * KernelTypeName(KernelType kernel_type) noexcept {
  switch (kernel_type) {
    case KernelType::kSquareExponential: return "SquareExponential";
    case KernelType::kMaternNu1p5: return "MaternNu1p5";
    case KernelType::kMaternNu2p5: return "MaternNu2p5";
    case KernelType::kLinear: return "Linear";
    case KernelType::kPeriodic: return "Periodic";
  }
  return "Unknown";
}

/*!\rst
  Flat set of named kernel parameters.  Each kernel reads the fields it needs and ignores the rest:

  ================== ==================================
  kernel             fields read
  ================== ==================================
  SquareExponential  variance, lengthscale
  MaternNu1p5        variance, lengthscale
  MaternNu2p5        variance, lengthscale
  Linear             variance, bias
  Periodic           variance, lengthscale, period
  ================== ==================================

  The lengthscale here is shared by all dimensions; per-dimension lengthscales are set by constructing the
  covariance class directly.
\endrst*/
struct KernelParameters {
  // Users must set parameters explicitly.
  KernelParameters() = delete;

  /*!\rst
    Construct a KernelParameters object with every field set.

    INPUTS:
    See member declarations below for a description of each parameter.
  \endrst*/
  KernelParameters(KernelType kernel_type_in, double variance_in, double lengthscale_in,
                   double period_in, double bias_in)
      : kernel_type(kernel_type_in),
        variance(variance_in),
        lengthscale(lengthscale_in),
        period(period_in),
        bias(bias_in) {
  }

  /*!\rst
    Parameters for a stationary kernel (square exponential or matern); ``period`` and ``bias`` are unused.
  \endrst*/
  KernelParameters(KernelType kernel_type_in, double variance_in, double lengthscale_in)
      : KernelParameters(kernel_type_in, variance_in, lengthscale_in, 1.0, 0.0) {
  }

  //! which covariance function to build
  KernelType kernel_type;
  //! signal variance, ``k(x, x)`` for stationary kernels (must be > 0)
  double variance;
  //! distance over which correlation decays (must be > 0)
  double lengthscale;
  //! period of PeriodicKernel (must be > 0)
  double period;
  //! constant offset of LinearKernel (must be >= 0)
  double bias;
};

/*!\rst
  Controls the diagonal "jitter" fallback used when ``K + \sigma^2 I`` fails to factor.

  On failure, factorization is retried on ``K + \sigma^2 I + jitter_k I`` with
  ``jitter_k = initial_jitter * growth_factor^k`` for ``k = 0, 1, ..., max_num_attempts - 1``.
  The first success wins; if all attempts fail, the last NotPositiveDefiniteException propagates.

  The default-constructed value has ``max_num_attempts = 0``: jitter is OFF and a non-SPD matrix is always an error.
  Turning it on alters the matrix being factored, so it is left to the caller.
\endrst*/
struct JitterParameters {
  /*!\rst
    Jitter disabled.
  \endrst*/
  JitterParameters() : JitterParameters(0, 1.0e-10, 10.0) {
  }

  /*!\rst
    \param
      :max_num_attempts: number of jittered retries (0 disables jitter)
      :initial_jitter: diagonal addition on the first retry (must be > 0)
      :growth_factor: multiplier applied to the jitter between retries (must be >= 1)
  \endrst*/
  JitterParameters(int max_num_attempts_in, double initial_jitter_in, double growth_factor_in)
      : max_num_attempts(max_num_attempts_in),
        initial_jitter(initial_jitter_in),
        growth_factor(growth_factor_in) {
  }

  bool enabled() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return max_num_attempts > 0;
  }

  //! number of retries with jitter after the unmodified matrix fails; 0 means no retries
  int max_num_attempts;
  //! jitter added to the diagonal on the first retry (suggest: 1.0e-10 to 1.0e-6 times the kernel variance)
  double initial_jitter;
  //! factor by which the jitter grows on each further retry (suggest: 10)
  double growth_factor;
};

/*!\rst
  Container for OpenMP settings used by the kernel matrix builders (gpr_kernel_matrix.hpp).

  Kernel matrix columns take equal time to fill (apart from the triangular shape of symmetric builds), so
  ``omp_sched_static`` or ``omp_sched_guided`` are reasonable.  Any schedule produces identical results since every
  entry is written by exactly one thread.

  Setting ``max_num_threads = 1`` disables threading.
\endrst*/
struct ThreadSchedule {
  /*!\rst
    \param
      :max_num_threads: maximum number of threads for use by OpenMP (generally should be <= # cores)
      :schedule: static, dynamic, guided, or auto
      :chunk_size: number of columns handed out at a time; zero or negative chunk_size asks OpenMP to use its
        default behavior
  \endrst*/
  ThreadSchedule(int max_num_threads_in, omp_sched_t schedule_in, int chunk_size_in)
      : max_num_threads(max_num_threads_in), schedule(schedule_in), chunk_size(chunk_size_in) {
  }

  explicit ThreadSchedule(int max_num_threads_in) : ThreadSchedule(max_num_threads_in, omp_sched_static, 0) {
  }

  /*!\rst
    Default number of threads, static schedule, default chunk_size.
  \endrst*/
  ThreadSchedule() : ThreadSchedule(0) {
  }

  /*!\rst
    Number of threads to request from OpenMP: ``max_num_threads`` if positive, otherwise ``omp_get_max_threads()``.
  \endrst*/
  int NumThreads() const noexcept GPR_WARN_UNUSED_RESULT {
    return max_num_threads > 0 ? max_num_threads : omp_get_max_threads();
  }

  //! The maximum number of threads for use by OpenMP (generally should be <= # cores).
  //! The (default) value of 0 uses omp_get_max_threads() threads.
  int max_num_threads;
  //! The thread schedule to use: static, dynamic, guided, or auto.
  omp_sched_t schedule;
  //! Chunk size to use when distributing work to threads; the precise meaning depends on schedule.
  int chunk_size;
};

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_MODEL_PARAMETERS_HPP_
