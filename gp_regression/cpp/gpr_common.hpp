/*!
  \file gpr_common.hpp
  \rst
  Compiler macros, constants and implementation conventions shared by every file in gp_regression.

  **IMPLEMENTATION NOTES**

  1. No function allocates memory that the caller must free.  Array outputs are allocated by the caller (usually
     as a std::vector) and passed in as pointers.  Class members are never plain owning pointers; polymorphic members
     live in std::unique_ptr (or std::shared_ptr when a snapshot is shared between readers).

     ``new`` only appears in ``Clone()`` implementations and as the argument to a smart pointer ctor.

  2. Matrices are stored as flattened arrays and indexed in COLUMN-MAJOR order.  We describe them with C-style
     indexing for convenience: ``A[num_cols][num_rows]`` has ``num_rows`` rows and the row index varies fastest.
     For example::

       A = [4  32  5
            53 12  8]

     is stored as ``A_flat[6] = [4 53 32 12 5 8]`` and ``A(i, j) = A_flat[j*num_rows + i]``.

     Lists of points follow the same rule: ``points[num_points][dim]`` stores point ``i`` in
     ``points[i*dim .. i*dim + dim-1]``.  So a kernel matrix ``K(X, Xs)`` has one column per point of ``Xs``.

  3. Symmetric matrices are stored in full, but routines that consume them (e.g., ComputeCholeskyFactorL) only
     read the LOWER triangle.  Routines that produce them say whether the upper triangle is valid.

  4. Errors are reported with exceptions, thrown through GPR_THROW_EXCEPTION (gpr_exception.hpp).  Numerical
     kernels (linear algebra, covariance evaluation) are noexcept and report failure through return values; the
     classes wrapping them convert failures into exceptions.

  5. Evaluation objects are immutable once constructed: GaussianProcess computes every derived quantity in its
     ctor and "updates" produce a new object.  Mutable state (PRNGs, the current model pointer) is held outside of
     the snapshot and is never shared across threads without a lock.

  6. Templates used with a small, known set of types are explicitly instantiated in the .cpp
     (``extern template`` in the header).
\endrst*/

#ifndef GP_REGRESSION_CPP_GPR_COMMON_HPP_
#define GP_REGRESSION_CPP_GPR_COMMON_HPP_

namespace gp_regression {

/*!\rst
  Macros to disallow default ctor, copy ctor, and/or assignment.  Place these in the ``public`` section of a class
  so that the compiler error mentions a deleted function rather than a private one.
\endrst*/
#define GPR_DISALLOW_DEFAULT_CONSTRUCTOR(TypeName) \
  TypeName() = delete

#define GPR_DISALLOW_COPY(TypeName) \
  TypeName(const TypeName&) = delete

#define GPR_DISALLOW_ASSIGN(TypeName) \
  void operator=(const TypeName&) = delete

#define GPR_DISALLOW_COPY_AND_ASSIGN(TypeName) \
  GPR_DISALLOW_COPY(TypeName); \
  GPR_DISALLOW_ASSIGN(TypeName)

#define GPR_DISALLOW_DEFAULT_AND_COPY_AND_ASSIGN(TypeName) \
  GPR_DISALLOW_DEFAULT_CONSTRUCTOR(TypeName); \
  GPR_DISALLOW_COPY_AND_ASSIGN(TypeName)

#define GPR_DISALLOW_DEFAULT_AND_ASSIGN(TypeName) \
  GPR_DISALLOW_DEFAULT_CONSTRUCTOR(TypeName); \
  GPR_DISALLOW_ASSIGN(TypeName)

/*!\rst
  Name of the enclosing function, for error messages.  gcc's ``__PRETTY_FUNCTION__`` includes the signature.
\endrst*/
#ifdef __GNUC__
#define GPR_CURRENT_FUNCTION_NAME __PRETTY_FUNCTION__
#else
#define GPR_CURRENT_FUNCTION_NAME __func__
#endif

/*!\rst
  Branch prediction hints.  Only use these where the branch is overwhelmingly biased (e.g., error checks).
\endrst*/
#ifndef unlikely
#define unlikely(expr) __builtin_expect((expr), 0)
#endif

#ifndef likely
#define likely(expr) __builtin_expect((expr), 1)
#endif

/*!\rst
  ``restrict`` promises the compiler that memory reachable through a pointer is not reachable through any other
  pointer in the same scope.  Nearly every array argument in this project is ``restrict``; passing aliased arrays
  to such a function is undefined behavior.
\endrst*/
#ifdef __cplusplus
#define restrict __restrict__
#endif

/*!\rst
  Marks a parameter as unused; ``GPR_UNUSED(foo)`` expands to ``UNUSED_foo``.
\endrst*/
#ifdef __GNUC__
#define GPR_UNUSED(x) UNUSED_ ## x __attribute__((__unused__))
#else
#define GPR_UNUSED(x) UNUSED_ ## x
#endif

/*!\rst
  Promise that no pointer argument is ``nullptr``.  Not checked at runtime.
  For member functions, ``GPR_NONNULL_POINTERS_LIST`` indexing starts at 2 (``this`` is argument 1).
\endrst*/
#ifdef __GNUC__
#define GPR_NONNULL_POINTERS __attribute__((__nonnull__))
#define GPR_NONNULL_POINTERS_LIST(...) __attribute__((__nonnull__ (__VA_ARGS__)))
#else
#define GPR_NONNULL_POINTERS
#define GPR_NONNULL_POINTERS_LIST(...)
#endif

#ifdef __GNUC__
#define GPR_WARN_UNUSED_RESULT __attribute__((__warn_unused_result__))
#else
#define GPR_WARN_UNUSED_RESULT
#endif

/*!\rst
  "const" functions depend only on their arguments (no pointer dereferences, no globals).
  "pure" functions may additionally read (but not write) memory.
\endrst*/
#ifdef __GNUC__
#define GPR_CONST_FUNCTION __attribute__((__const__))
#define GPR_PURE_FUNCTION __attribute__((__pure__))
#else
#define GPR_CONST_FUNCTION
#define GPR_PURE_FUNCTION
#endif

#ifdef __GNUC__
#define GPR_NORETURN __attribute__((__noreturn__))
#else
#define GPR_NORETURN
#endif

/*!\rst
  Square a value.  Pass-by-value and ``constexpr``, so only meant for arithmetic types.

  \param
    :value: value to be squared
  \return
    value * value
\endrst*/
template <typename T>
constexpr GPR_WARN_UNUSED_RESULT GPR_CONST_FUNCTION T Square(T value) {
  return value*value;
}

// mathematical constants
static constexpr double kPi = 3.1415926535897932384626;
static constexpr double kSqrt3 = 1.7320508075688772935274;
static constexpr double kSqrt5 = 2.2360679774997896964092;
static constexpr double kLog2Pi = 1.8378770664093454835607;

}  // end namespace gp_regression

#endif  // GP_REGRESSION_CPP_GPR_COMMON_HPP_
