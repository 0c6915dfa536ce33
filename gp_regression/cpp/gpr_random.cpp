/*!
  \file gpr_random.cpp
  \rst
  Definitions for gpr_random.hpp.  Kept out of the header so that boost/functional/hash.hpp and ``gettimeofday``
  stay private to this file.
\endrst*/

#include "gpr_random.hpp"

#include <sys/time.h>

#include <algorithm>
#include <numeric>
#include <utility>
#include <vector>

#include <boost/functional/hash.hpp>  // NOLINT(build/include_order)
#include <boost/random/uniform_int.hpp>  // NOLINT(build/include_order)
#include <boost/random/uniform_real.hpp>  // NOLINT(build/include_order)

#include "gpr_common.hpp"
#include "gpr_exception.hpp"

namespace gp_regression {

UniformRandomGenerator::UniformRandomGenerator(EngineType::result_type seed) noexcept
    : engine(seed), last_seed_(seed) {
}

UniformRandomGenerator::UniformRandomGenerator() noexcept : UniformRandomGenerator(kDefaultSeed) {
}

UniformRandomGenerator::UniformRandomGenerator(EngineType::result_type base_seed, int thread_id) noexcept
    : engine(base_seed), last_seed_(base_seed) {
  SetRandomizedSeed(base_seed, thread_id);
}

void UniformRandomGenerator::SetExplicitSeed(EngineType::result_type seed) noexcept {
  engine.seed(seed);
  last_seed_ = seed;
}

void UniformRandomGenerator::SetRandomizedSeed(EngineType::result_type base_seed, int thread_id) noexcept {
  struct timeval time;
  gettimeofday(&time, nullptr);

  // hash_combine takes a std::size_t&, which may be wider than result_type; the extra bits are dropped when seeding
  std::size_t seed = base_seed;
  boost::hash_combine(seed, time.tv_sec);
  boost::hash_combine(seed, time.tv_usec);
  boost::hash_combine(seed, thread_id);

  SetExplicitSeed(static_cast<EngineType::result_type>(seed));
}

void UniformRandomGenerator::ResetToMostRecentSeed() noexcept {
  SetExplicitSeed(last_seed_);
}

bool UniformRandomGenerator::operator==(const UniformRandomGenerator& other) const {
  return (engine == other.engine) && (last_seed_ == other.last_seed_);
}

bool UniformRandomGenerator::operator!=(const UniformRandomGenerator& other) const {
  return !(*this == other);
}

NormalRNG::NormalRNG(EngineType::result_type seed) noexcept
    : uniform_generator(seed),
      normal_distribution_(0.0, 1.0),
      normal_random_variable_(uniform_generator.engine, normal_distribution_) {
}

NormalRNG::NormalRNG() noexcept : NormalRNG(kDefaultSeed) {
}

NormalRNG::NormalRNG(EngineType::result_type base_seed, int thread_id) noexcept : NormalRNG(base_seed) {
  SetRandomizedSeed(base_seed, thread_id);
}

double NormalRNG::operator()() {
  return normal_random_variable_();
}

void NormalRNG::ResetGenerator() noexcept {
  normal_random_variable_.distribution().reset();
}

void NormalRNG::SetExplicitSeed(EngineType::result_type seed) noexcept {
  uniform_generator.SetExplicitSeed(seed);
  ResetGenerator();
}

void NormalRNG::SetRandomizedSeed(EngineType::result_type base_seed, int thread_id) noexcept {
  uniform_generator.SetRandomizedSeed(base_seed, thread_id);
  ResetGenerator();
}

void NormalRNG::ResetToMostRecentSeed() noexcept {
  uniform_generator.ResetToMostRecentSeed();
  ResetGenerator();
}

NormalRNGSimulator::NormalRNGSimulator(const std::vector<double>& random_number_table)
    : random_number_table_(random_number_table), index_(0) {
}

double NormalRNGSimulator::operator()() {
  const int table_size = static_cast<int>(random_number_table_.size());
  if (unlikely(index_ >= table_size)) {
    GPR_THROW_EXCEPTION(DimensionMismatchException, "Random number table exhausted.", index_ + 1, table_size);
  }
  return random_number_table_[index_++];
}

void NormalRNGSimulator::ResetToMostRecentSeed() noexcept {
  index_ = 0;
}

void ComputeUniformPointsInBox(double const * restrict lower_bounds, double const * restrict upper_bounds, int dim,
                               int num_points, UniformRandomGenerator * uniform_generator,
                               double * restrict points) {
  for (int i = 0; i < num_points; ++i) {
    for (int d = 0; d < dim; ++d) {
      boost::uniform_real<double> uniform_coordinate(lower_bounds[d], upper_bounds[d]);
      points[i*dim + d] = uniform_coordinate(uniform_generator->engine);
    }
  }
}

/*!\rst
  For each dimension: shuffle the slice indices ``0..num_points-1``, then place point ``i`` uniformly at random inside
  slice ``permutation[i]`` of that dimension's edge.
\endrst*/
void ComputeLatinHypercubePointsInBox(double const * restrict lower_bounds, double const * restrict upper_bounds,
                                      int dim, int num_points, UniformRandomGenerator * uniform_generator,
                                      double * restrict points) {
  std::vector<int> slice_permutation(num_points);
  for (int d = 0; d < dim; ++d) {
    const double slice_width = (upper_bounds[d] - lower_bounds[d])/static_cast<double>(num_points);

    std::iota(slice_permutation.begin(), slice_permutation.end(), 0);
    // Fisher-Yates
    for (int i = num_points - 1; i > 0; --i) {
      boost::uniform_int<int> uniform_index(0, i);
      std::swap(slice_permutation[i], slice_permutation[uniform_index(uniform_generator->engine)]);
    }

    boost::uniform_real<double> offset_in_slice(0.0, slice_width);
    for (int i = 0; i < num_points; ++i) {
      points[i*dim + d] = lower_bounds[d] + slice_width*slice_permutation[i] +
          offset_in_slice(uniform_generator->engine);
    }
  }
}

}  // end namespace gp_regression
