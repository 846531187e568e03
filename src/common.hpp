#pragma once

/**
 * @file common.hpp
 * @brief Common aliases, errors and contract checks shared across the minimizer components.
 */

#include <Eigen/Eigen>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>

/// @brief Contract check that throws @p error_type with message and source location.
#define BATCH_NEWTON_CHECK(condition, error_type, message)                                                              \
  do {                                                                                                                 \
    if (!(condition)) {                                                                                                \
      std::ostringstream batch_newton_check_msg_;                                                                      \
      batch_newton_check_msg_ << (message) << " [" << #condition << " at " << __FILE__ << ":" << __LINE__ << "]";     \
      throw error_type(batch_newton_check_msg_.str());                                                                 \
    }                                                                                                                  \
  } while (0)

namespace batch_newton {

/// @brief Base class of every error raised by the minimizer.
class NewtonError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// @brief Invalid arguments, rejected before the first iteration.
class InputError : public NewtonError {
public:
  using NewtonError::NewtonError;
};

/// @brief Gradient or Hessian evaluated to NaN.
class NumericalInstability : public NewtonError {
public:
  using NewtonError::NewtonError;
};

/// @brief The diagonal shift reached its bound without a valid Cholesky factor.
class RegularizationExhausted : public NumericalInstability {
public:
  using NumericalInstability::NumericalInstability;
};

/// @brief Iterate layout: one problem instance per row (batched) or the variable itself (unbatched).
using Batch = Eigen::MatrixXd;

class HessianBatch;

/// @brief Gradient function type alias (T -> T).
template <typename T> using GradFun = std::function<T(T)>;

/// @brief Objective function type alias (T -> W).
template <typename T, typename W> using VecFun = std::function<W(T)>;

/// @brief Hessian function type alias (V -> M).
template <typename V, typename M> using HessFun = std::function<M(V)>;

/// @brief Batched objective: one loss per row.
using BatchLossFun = std::function<Eigen::VectorXd(const Batch &)>;

/// @brief Batched gradient, same shape as the iterate.
using BatchGradFun = std::function<Batch(const Batch &)>;

/// @brief Batched Hessian, one square block per row.
using BatchHessFun = std::function<HessianBatch(const Batch &)>;

/// @brief Side-effect hook receiving the iterate after each update.
using Observer = std::function<void(const Batch &)>;

} // namespace batch_newton
