/*!
  \file gpr_covariance.hpp
  \rst
  CovarianceInterface, the interface for covariance (kernel) functions ``k(x, x')``, and its implementations:

  * SquareExponential: ``\sigma_f^2 \exp(-r^2/2)``
  * MaternNu1p5: ``\sigma_f^2 (1 + \sqrt{3} r) \exp(-\sqrt{3} r)``
  * MaternNu2p5: ``\sigma_f^2 (1 + \sqrt{5} r + 5/3 r^2) \exp(-\sqrt{5} r)``
  * LinearKernel: ``b + \sigma_f^2 x^T x'``
  * PeriodicKernel: ``\sigma_f^2 \exp(-2 \sum_i \sin^2(\pi |x_i - x'_i| / p) / l^2)``

  where ``r^2 = \sum_i (x_i - x'_i)^2 / l_i^2`` is the squared distance scaled by the length scales.

  Covariance functions are symmetric, ``k(x, x') = k(x', x)``, and positive semi-definite, so the covariance matrix of a
  set of points is SPSD (and SPD for distinct points under the stationary kernels).  The first three kernels are
  *stationary*: they depend on ``x - x'`` only.

  Objects are immutable after construction; changing a parameter means building a new object (MakeCovariance() or a
  ctor).  Ctors validate their parameters and throw ConfigurationException, so an existing covariance object is always
  valid.  Hence Covariance() may be called concurrently from any number of threads.

  For more details, see Rasmussen & Williams, Gaussian Processes for Machine Learning, Chapter 4.
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_COVARIANCE_HPP_
#define GP_REGRESSION_CPP_GPR_COVARIANCE_HPP_

#include <memory>
#include <vector>

#include "gpr_common.hpp"
#include "gpr_model_parameters.hpp"

namespace gp_regression {

/*!\rst
  Abstract class for evaluating covariance functions, ``cov(x_1, x_2)``, on points of a fixed dimension ``dim``.

  Parameters (called hyperparameters, ``\theta_j``) are stored by subclasses and fixed at construction.
\endrst*/
class CovarianceInterface {
 public:
  virtual ~CovarianceInterface() = default;

  /*!\rst
    Computes the covariance of two points, ``cov(point_one, point_two)``.  Points are arrays of length ``dim()``.

    Symmetric by definition: ``Covariance(x, y) = Covariance(y, x)``.

    \param
      :point_one[dim]: first spatial coordinate
      :point_two[dim]: second spatial coordinate
    \return
      covariance between the input points
  \endrst*/
  virtual double Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept GPR_PURE_FUNCTION GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT = 0;

  //! number of spatial dimensions of the points this covariance accepts
  virtual int dim() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT = 0;

  /*!\rst
    \return
      the number of hyperparameters, i.e., the length of the output of GetHyperparameters()
  \endrst*/
  virtual int GetNumberOfHyperparameters() const noexcept GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT = 0;

  /*!\rst
    Gets the hyperparameters; each subclass documents its ordering.

    \output
      :hyperparameters[this.GetNumberOfHyperparameters()]: values of the hyperparameters
  \endrst*/
  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept GPR_NONNULL_POINTERS = 0;

  //! name of the covariance function, for logging
  virtual char const * name() const noexcept GPR_WARN_UNUSED_RESULT = 0;

  /*!\rst
    For implementing the virtual (copy) constructor idiom.

    \return
      :Pointer to a constructed object that is a subclass of CovarianceInterface; the caller owns it
  \endrst*/
  virtual CovarianceInterface * Clone() const GPR_WARN_UNUSED_RESULT = 0;
};

/*!\rst
  Implements the square exponential (a.k.a. exponentiated quadratic, RBF) covariance function:
  ``cov(x_1, x_2) = \sigma_f^2 * \exp(-1/2 * ((x_1 - x_2)^T * L * (x_1 - x_2)) )``
  where L is the diagonal matrix with i-th diagonal entry ``1/lengths[i]/lengths[i]``.

  This covariance object has ``dim+1`` hyperparameters: ``\sigma_f^2, lengths_i``.
\endrst*/
class SquareExponential final : public CovarianceInterface {
 public:
  /*!\rst
    Constructs a SquareExponential object with the same length scale in every dimension.

    \param
      :dim: the number of spatial dimensions (must be > 0)
      :variance: the signal variance, ``\sigma_f^2`` (must be > 0)
      :length: the length scale used for all dimensions (must be > 0)
  \endrst*/
  SquareExponential(int dim, double variance, double length);

  /*!\rst
    Constructs a SquareExponential object with one length scale per dimension (automatic relevance determination).

    \param
      :dim: the number of spatial dimensions (must be > 0)
      :variance: the signal variance, ``\sigma_f^2`` (must be > 0)
      :lengths: the length scales, one per spatial dimension (each must be > 0)
  \endrst*/
  SquareExponential(int dim, double variance, std::vector<double> lengths);

  virtual double Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept override GPR_PURE_FUNCTION GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT;

  virtual int dim() const noexcept override GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return dim_;
  }

  virtual int GetNumberOfHyperparameters() const noexcept override GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return 1 + dim_;
  }

  //! ordering: ``[\sigma_f^2, length_0, ..., length_{dim-1}]``
  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override GPR_NONNULL_POINTERS;

  virtual char const * name() const noexcept override GPR_WARN_UNUSED_RESULT {
    return "SquareExponential";
  }

  virtual CovarianceInterface * Clone() const override GPR_WARN_UNUSED_RESULT;

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(SquareExponential);

 private:
  explicit SquareExponential(const SquareExponential& source);

  //! dimension of the problem
  int dim_;
  //! ``\sigma_f^2``, signal variance
  double variance_;
  //! length scales, one per dimension
  std::vector<double> lengths_;
  //! square of the length scales, one per dimension
  std::vector<double> lengths_sq_;
};

/*!\rst
  Implements a case of the Matern class of covariance functions with ``\nu = 3/2`` (smoothness parameter).
  The general form is complicated (involving a modified Bessel function) but for half-integer ``\nu`` it simplifies to
  an exponential times a polynomial.  With ``r = \sqrt{(x_1 - x_2)^T * L * (x_1 - x_2)}``, ``L`` as in
  SquareExponential::

    cov_{\nu=3/2}(r) = \sigma_f^2 * (1 + \sqrt{3}*r) * \exp(-\sqrt{3}*r)

  Sample paths are once differentiable.  Hyperparameters are ordered as in SquareExponential.
\endrst*/
class MaternNu1p5 final : public CovarianceInterface {
 public:
  MaternNu1p5(int dim, double variance, double length);

  MaternNu1p5(int dim, double variance, std::vector<double> lengths);

  virtual double Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept override GPR_PURE_FUNCTION GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT;

  virtual int dim() const noexcept override GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return dim_;
  }

  virtual int GetNumberOfHyperparameters() const noexcept override GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return 1 + dim_;
  }

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override GPR_NONNULL_POINTERS;

  virtual char const * name() const noexcept override GPR_WARN_UNUSED_RESULT {
    return "MaternNu1p5";
  }

  virtual CovarianceInterface * Clone() const override GPR_WARN_UNUSED_RESULT;

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(MaternNu1p5);

 private:
  explicit MaternNu1p5(const MaternNu1p5& source);

  //! dimension of the problem
  int dim_;
  //! ``\sigma_f^2``, signal variance
  double variance_;
  //! length scales, one per dimension
  std::vector<double> lengths_;
  //! square of the length scales, one per dimension
  std::vector<double> lengths_sq_;
};

/*!\rst
  Matern covariance with ``\nu = 5/2``::

    cov_{\nu=5/2}(r) = \sigma_f^2 * (1 + \sqrt{5}*r + 5/3*r^2) * \exp(-\sqrt{5}*r)

  Sample paths are twice differentiable.  ``r`` and hyperparameter ordering as in MaternNu1p5.
\endrst*/
class MaternNu2p5 final : public CovarianceInterface {
 public:
  MaternNu2p5(int dim, double variance, double length);

  MaternNu2p5(int dim, double variance, std::vector<double> lengths);

  virtual double Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept override GPR_PURE_FUNCTION GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT;

  virtual int dim() const noexcept override GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return dim_;
  }

  virtual int GetNumberOfHyperparameters() const noexcept override GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return 1 + dim_;
  }

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override GPR_NONNULL_POINTERS;

  virtual char const * name() const noexcept override GPR_WARN_UNUSED_RESULT {
    return "MaternNu2p5";
  }

  virtual CovarianceInterface * Clone() const override GPR_WARN_UNUSED_RESULT;

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(MaternNu2p5);

 private:
  explicit MaternNu2p5(const MaternNu2p5& source);

  //! dimension of the problem
  int dim_;
  //! ``\sigma_f^2``, signal variance
  double variance_;
  //! length scales, one per dimension
  std::vector<double> lengths_;
  //! square of the length scales, one per dimension
  std::vector<double> lengths_sq_;
};

/*!\rst
  Linear (dot product) covariance: ``cov(x_1, x_2) = b + \sigma_f^2 * x_1^T x_2``.

  Not stationary.  A GP with this covariance is Bayesian linear regression with a Gaussian prior on the slope
  (variance ``\sigma_f^2``) and on the offset (variance ``b``).  Its covariance matrices have rank at most ``dim + 1``, so
  more than ``dim + 1`` training points need noise (or jitter) to factor.

  Hyperparameters: ``[\sigma_f^2, b]``.
\endrst*/
class LinearKernel final : public CovarianceInterface {
 public:
  /*!\rst
    \param
      :dim: the number of spatial dimensions (must be > 0)
      :variance: the slope variance ``\sigma_f^2`` (must be > 0)
      :bias: the offset variance ``b`` (must be >= 0)
  \endrst*/
  LinearKernel(int dim, double variance, double bias);

  virtual double Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept override GPR_PURE_FUNCTION GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT;

  virtual int dim() const noexcept override GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return dim_;
  }

  virtual int GetNumberOfHyperparameters() const noexcept override GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return 2;
  }

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override GPR_NONNULL_POINTERS {
    hyperparameters[0] = variance_;
    hyperparameters[1] = bias_;
  }

  virtual char const * name() const noexcept override GPR_WARN_UNUSED_RESULT {
    return "Linear";
  }

  virtual CovarianceInterface * Clone() const override GPR_WARN_UNUSED_RESULT;

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(LinearKernel);

 private:
  explicit LinearKernel(const LinearKernel& source);

  //! dimension of the problem
  int dim_;
  //! ``\sigma_f^2``, slope variance
  double variance_;
  //! ``b``, offset variance
  double bias_;
};

/*!\rst
  Periodic (exp-sine-squared) covariance, applied independently along each axis:
  ``cov(x_1, x_2) = \sigma_f^2 * \exp(-2 * \sum_i \sin^2(\pi |x_{1,i} - x_{2,i}| / p) / l^2)``

  Points whose coordinates differ by whole multiples of the period ``p`` are perfectly correlated, so a training set
  containing such pairs needs noise to factor.

  Hyperparameters: ``[\sigma_f^2, l, p]``.
\endrst*/
class PeriodicKernel final : public CovarianceInterface {
 public:
  /*!\rst
    \param
      :dim: the number of spatial dimensions (must be > 0)
      :variance: the signal variance ``\sigma_f^2`` (must be > 0)
      :length: the length scale ``l`` (must be > 0)
      :period: the period ``p`` (must be > 0)
  \endrst*/
  PeriodicKernel(int dim, double variance, double length, double period);

  virtual double Covariance(double const * restrict point_one, double const * restrict point_two) const noexcept override GPR_PURE_FUNCTION GPR_NONNULL_POINTERS GPR_WARN_UNUSED_RESULT;

  virtual int dim() const noexcept override GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return dim_;
  }

  virtual int GetNumberOfHyperparameters() const noexcept override GPR_PURE_FUNCTION GPR_WARN_UNUSED_RESULT {
    return 3;
  }

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override GPR_NONNULL_POINTERS {
    hyperparameters[0] = variance_;
    hyperparameters[1] = length_;
    hyperparameters[2] = period_;
  }

  virtual char const * name() const noexcept override GPR_WARN_UNUSED_RESULT {
    return "Periodic";
  }

  virtual CovarianceInterface * Clone() const override GPR_WARN_UNUSED_RESULT;

  GPR_DISALLOW_DEFAULT_AND_ASSIGN(PeriodicKernel);

 private:
  explicit PeriodicKernel(const PeriodicKernel& source);

  //! dimension of the problem
  int dim_;
  //! ``\sigma_f^2``, signal variance
  double variance_;
  //! length scale
  double length_;
  //! period
  double period_;
};

/*!\rst
  Builds the covariance function described by ``kernel_parameters`` (see KernelParameters for which fields each
  kernel reads).

  \param
    :kernel_parameters: kernel type and parameter values
    :dim: the number of spatial dimensions (must be > 0)
  \return
    the new covariance object
  \raise
    ConfigurationException if ``dim`` or a parameter read by the chosen kernel is out of range
\endrst*/
std::unique_ptr<CovarianceInterface> MakeCovariance(const KernelParameters& kernel_parameters, int dim) GPR_WARN_UNUSED_RESULT;

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_COVARIANCE_HPP_
