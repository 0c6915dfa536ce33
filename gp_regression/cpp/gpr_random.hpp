/*!
  \file gpr_random.hpp
  \rst
  Pseudo-random number generation for gp_regression:

  1. UniformRandomGenerator: owns a ``boost::mt19937`` engine and remembers its most recent seed
  2. NormalRNG: functor for ``N(0, 1)`` draws, built on UniformRandomGenerator; used to draw joint samples from a
     Gaussian Process posterior (GaussianProcess::SamplePosterior())
  3. NormalRNGSimulator: replays a fixed table of "normal" draws; lets tests predict sample paths exactly

  plus helpers for drawing points in an axis-aligned box ``[lower_0, upper_0] x ... x [lower_{d-1}, upper_{d-1}]``
  (plain uniform sampling and latin hypercube sampling), used to generate training and test inputs.

  Remembering the seed makes "rollbacks" easy (ResetToMostRecentSeed()), and SetRandomizedSeed() mixes the time of day
  and a thread id into a base seed so that generators on different threads do not produce the same stream.

  .. WARNING:: none of these classes are thread-safe.  Use one generator per thread.
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_RANDOM_HPP_
#define GP_REGRESSION_CPP_GPR_RANDOM_HPP_

#include <vector>

#include <boost/random/mersenne_twister.hpp>  // NOLINT(build/include_order)
#include <boost/random/normal_distribution.hpp>  // NOLINT(build/include_order)
#include <boost/random/variate_generator.hpp>  // NOLINT(build/include_order)

#include "gpr_common.hpp"

namespace gp_regression {

/*!\rst
  Interface for functors producing ``N(0, 1)`` draws.  Lets posterior sampling run against either a real PRNG
  (NormalRNG) or a scripted sequence (NormalRNGSimulator).
\endrst*/
class NormalRNGInterface {
 public:
  virtual ~NormalRNGInterface() = default;

  /*!\rst
    \return
      the next draw, distributed ~ ``N(0, 1)``
  \endrst*/
  virtual double operator()() = 0;

  /*!\rst
    Restart the sequence of draws from the beginning (i.e., from the most recent seed).
  \endrst*/
  virtual void ResetToMostRecentSeed() noexcept = 0;
};

/*!\rst
  Container for a uniform random engine (mersenne twister).

  .. Note:: seed values take type ``EngineType::result_type``. Do not pass in a wider integer type!
\endrst*/
struct UniformRandomGenerator final {
  using EngineType = boost::mt19937;

  //! Default seed value, so that test results are reproducible.
  static constexpr EngineType::result_type kDefaultSeed = 314;

  UniformRandomGenerator() noexcept;

  /*!\rst
    \param
      :seed: the seed to use
  \endrst*/
  explicit UniformRandomGenerator(EngineType::result_type seed) noexcept;

  /*!\rst
    Seeds with SetRandomizedSeed(base_seed, thread_id).
  \endrst*/
  UniformRandomGenerator(EngineType::result_type base_seed, int thread_id) noexcept;

  EngineType::result_type last_seed() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return last_seed_;
  }

  /*!\rst
    Seed the engine with ``seed`` and remember it.
  \endrst*/
  void SetExplicitSeed(EngineType::result_type seed) noexcept;

  /*!\rst
    Seed the engine with a hash (``boost::hash_combine``) of ``base_seed``, the current time (microseconds) and
    ``thread_id``.  Threads started at the same instant still receive different seeds.

    \param
      :base_seed: base value for the new seed
      :thread_id: id of the thread using this object
  \endrst*/
  void SetRandomizedSeed(EngineType::result_type base_seed, int thread_id) noexcept;

  /*!\rst
    Reseed with the most recently set seed; the engine then repeats the same stream.
  \endrst*/
  void ResetToMostRecentSeed() noexcept;

  bool operator==(const UniformRandomGenerator& other) const;

  bool operator!=(const UniformRandomGenerator& other) const;

  //! the underlying engine; pass it to boost distributions
  EngineType engine;

 private:
  //! the most recently set seed
  EngineType::result_type last_seed_;
};

/*!\rst
  Functor for ``N(0, 1)`` draws.  Owns a UniformRandomGenerator and transforms its output with
  ``boost::normal_distribution``.

  .. Note:: the normal distribution may cache a second draw internally; every reseed also resets the distribution so
    that reseeding fully determines the following draws.
\endrst*/
class NormalRNG final : public NormalRNGInterface {
 public:
  using EngineType = UniformRandomGenerator::EngineType;

  //! Default seed value, so that test results are reproducible.
  static constexpr EngineType::result_type kDefaultSeed = 314;

  NormalRNG() noexcept;

  explicit NormalRNG(EngineType::result_type seed) noexcept;

  NormalRNG(EngineType::result_type base_seed, int thread_id) noexcept;

  virtual double operator()() override;

  EngineType::result_type last_seed() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return uniform_generator.last_seed();
  }

  //! drop any normal draws cached by the distribution
  void ResetGenerator() noexcept;

  void SetExplicitSeed(EngineType::result_type seed) noexcept;

  void SetRandomizedSeed(EngineType::result_type base_seed, int thread_id) noexcept;

  virtual void ResetToMostRecentSeed() noexcept override;

  GPR_DISALLOW_COPY_AND_ASSIGN(NormalRNG);

  //! the uniform source transformed to ``N(0, 1)``
  UniformRandomGenerator uniform_generator;

 private:
  //! uniform to ``N(0, 1)`` transformation; may carry a cached draw
  boost::normal_distribution<double> normal_distribution_;
  //! binds the engine and the distribution into a nullary functor
  boost::variate_generator<EngineType&, boost::normal_distribution<double> > normal_random_variable_;
};

/*!\rst
  "RNG" that returns the entries of a fixed table in order.  Test-only.

  \raise
    operator() throws DimensionMismatchException once the table is exhausted
\endrst*/
class NormalRNGSimulator final : public NormalRNGInterface {
 public:
  /*!\rst
    \param
      :random_number_table: values to return, in order
  \endrst*/
  explicit NormalRNGSimulator(const std::vector<double>& random_number_table);

  virtual double operator()() override;

  //! restart from the first table entry
  virtual void ResetToMostRecentSeed() noexcept override;

  //! number of values returned since construction or the last reset
  int index() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return index_;
  }

  GPR_DISALLOW_DEFAULT_AND_COPY_AND_ASSIGN(NormalRNGSimulator);

 private:
  //! the values to replay
  std::vector<double> random_number_table_;
  //! position of the next value to return
  int index_;
};

/*!\rst
  Draws ``num_points`` points independently and uniformly from the box
  ``[lower_bounds[0], upper_bounds[0]] x ... x [lower_bounds[dim-1], upper_bounds[dim-1]]``.

  \param
    :lower_bounds[dim]: lower edge of the box in each dimension
    :upper_bounds[dim]: upper edge of the box in each dimension
    :dim: the number of spatial dimensions
    :num_points: number of points to draw
    :uniform_generator[1]: source of randomness
  \output
    :uniform_generator[1]: advanced by ``dim * num_points`` draws
    :points[dim][num_points]: the random points
\endrst*/
void ComputeUniformPointsInBox(double const * restrict lower_bounds, double const * restrict upper_bounds, int dim,
                               int num_points, UniformRandomGenerator * uniform_generator,
                               double * restrict points) GPR_NONNULL_POINTERS;

/*!\rst
  Draws ``num_points`` points in a latin hypercube over the same box: each edge is cut into ``num_points`` equal
  slices, and every slice of every edge contains exactly one point.  Spreads points more evenly than
  ComputeUniformPointsInBox(), which keeps training covariance matrices away from near-duplicate rows.

  Parameters as in ComputeUniformPointsInBox().
\endrst*/
void ComputeLatinHypercubePointsInBox(double const * restrict lower_bounds, double const * restrict upper_bounds,
                                      int dim, int num_points, UniformRandomGenerator * uniform_generator,
                                      double * restrict points) GPR_NONNULL_POINTERS;

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_RANDOM_HPP_
