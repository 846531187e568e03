#pragma once

#include "../common.hpp"
#include "../hessian_batch.hpp"
#include "../iteration_recorder.hpp"
#include "../options.hpp"
#include <Eigen/Eigen>
#include <iostream>
#include <utility>
#include <vector>

namespace batch_newton {

/// @brief How a run ended. Fatal conditions are reported as exceptions instead.
enum class Status { Converged, MaxIterationsReached };

/**
 * @brief Result of a run, in the caller's layout.
 */
struct BatchResult {
  Batch x;                    ///< Best point seen over the whole trajectory.
  Eigen::VectorXd loss;       ///< Best loss per batch row.
  std::vector<Batch> history; ///< Initial point, every iterate, then the best point (full_output only).
  Status status = Status::MaxIterationsReached;
  unsigned int iterations = 0;
};

/**
 * @brief Evaluators over the flattened layout: one problem per row.
 */
struct FlatProblem {
  BatchLossFun loss;
  BatchGradFun gradient;
  BatchHessFun hessian;
  Observer observer;
};

/**
 * @brief Base class for batched second-order minimizers.
 * @details Owns the configuration and diagnostics hooks and converts between the
 *          caller's layout and the flattened (batch x n) layout that derived classes
 *          iterate on. With `batched` set, every row of the iterate is one problem;
 *          otherwise the whole matrix is a single variable, flattened column-major.
 */
class BatchMinimizer {
public:
  virtual ~BatchMinimizer() = default;

  /**
   * @brief Sets all options at once.
   * @param options Run configuration.
   */
  void setOptions(const NewtonOptions &options) { _options = options; }

  /// @brief Current options.
  const NewtonOptions &options() const noexcept { return _options; }

  /**
   * @brief Sets the maximum number of iterations.
   * @param max_iters Limit on iterations.
   */
  void setMaxIterations(int max_iters) noexcept { _options.max_it = max_iters; }

  /**
   * @brief Sets the tolerance on the convergence indicator.
   * @param tol Tolerance value.
   */
  void setTolerance(double tol) noexcept { _options.tolerance = tol; }

  /// @brief Whether rows of the iterate are independent problems.
  void setBatched(bool batched) noexcept { _options.batched = batched; }

  /// @brief Whether to keep every iterate in the result.
  void setFullOutput(bool full_output) noexcept { _options.full_output = full_output; }

  /**
   * @brief Sets the per-iteration observer.
   * @param observer Called with the iterate in the caller's layout; may be empty.
   */
  void setObserver(Observer observer) { _observer = std::move(observer); }

  /**
   * @brief Attach a recorder for per-iteration diagnostics.
   * @param recorder Recorder instance (may be null).
   */
  void setRecorder(IterationRecorder *recorder) noexcept { recorder_ = recorder; }

  /// @brief Stream receiving the progress table when verbose.
  void setReportStream(std::ostream &out) noexcept { report_ = &out; }

  /**
   * @brief Returns the number of iterations performed by the last run.
   * @return Iteration count.
   */
  unsigned int iterations() const noexcept { return _iters; }

  /**
   * @brief Returns the tolerance used.
   * @return Tolerance value.
   */
  double tolerance() const noexcept { return _options.tolerance; }

  /**
   * @brief Minimize over the iterate @p x.
   * @param x Starting point in the caller's layout.
   * @param f Objective, one loss per problem.
   * @param gradient Gradient, same shape as @p x.
   * @param hessian Hessian, one block per problem.
   * @return Best point and diagnostics.
   */
  BatchResult minimize(const Batch &x, const BatchLossFun &f, const BatchGradFun &gradient, const BatchHessFun &hessian) {
    return minimize(x, f, gradient, hessian, _options.batched);
  }

  /**
   * @brief Minimize over a list of variables; only a single variable is supported.
   * @throws InputError unless @p variables holds exactly one entry.
   */
  BatchResult minimize(const std::vector<Batch> &variables,
                       const BatchLossFun &f,
                       const BatchGradFun &gradient,
                       const BatchHessFun &hessian) {
    BATCH_NEWTON_CHECK(variables.size() == 1, InputError, "Newton minimizer only supports single variable functions");
    return minimize(variables.front(), f, gradient, hessian);
  }

  /**
   * @brief Unbatched convenience overload with a scalar objective.
   * @param x Initial guess (Eigen vector or matrix).
   * @param f Objective function.
   * @param Gradient Gradient function.
   * @param Hessian Hessian function over the column-major flattened variable.
   * @return Best point found.
   */
  template <typename V, typename M>
  V solve(V x, VecFun<V, double> &f, GradFun<V> &Gradient, HessFun<V, M> &Hessian) {
    BatchLossFun fb = [&f](const Batch &X) { return Eigen::VectorXd::Constant(1, f(V(X))); };
    BatchGradFun gb = [&Gradient](const Batch &X) -> Batch { return Gradient(V(X)); };
    BatchHessFun hb = [&Hessian](const Batch &X) { return HessianBatch::single(Hessian(V(X))); };

    BatchResult result = minimize(Batch(x), fb, gb, hb, false);
    _history.clear();
    for (const Batch &snapshot : result.history)
      _history.push_back(snapshot);
    return V(result.x);
  }

  /// @brief Iterates of the last `solve` call when full output is enabled.
  const std::vector<Batch> &history() const noexcept { return _history; }

protected:
  BatchResult minimize(
      const Batch &x, const BatchLossFun &f, const BatchGradFun &gradient, const BatchHessFun &hessian, bool batched) {
    BATCH_NEWTON_CHECK(static_cast<bool>(f) && static_cast<bool>(gradient) && static_cast<bool>(hessian), InputError,
                       "Objective, gradient and Hessian functions must all be set");
    BATCH_NEWTON_CHECK(x.size() > 0, InputError, "Optimization variable must not be empty");
    _options.validate();

    if (batched) {
      FlatProblem problem{f, gradient, hessian, _observer};
      return run(x, problem);
    }

    const Eigen::Index rows = x.rows();
    const Eigen::Index cols = x.cols();
    FlatProblem problem;
    problem.loss = [&f, rows, cols](const Batch &X) { return f(unflatten(X, rows, cols)); };
    problem.gradient = [&gradient, rows, cols](const Batch &X) -> Batch {
      Batch g = gradient(unflatten(X, rows, cols));
      BATCH_NEWTON_CHECK(g.rows() == rows && g.cols() == cols, InputError, "Gradient must have the shape of the variable");
      return flatten(g);
    };
    problem.hessian = [&hessian, rows, cols](const Batch &X) { return hessian(unflatten(X, rows, cols)); };
    if (_observer) {
      const Observer &observer = _observer;
      problem.observer = [&observer, rows, cols](const Batch &X) { observer(unflatten(X, rows, cols)); };
    }

    BatchResult result = run(flatten(x), problem);
    result.x = unflatten(result.x, rows, cols);
    for (Batch &snapshot : result.history)
      snapshot = unflatten(snapshot, rows, cols);
    return result;
  }

  /**
   * @brief Iterate on the flattened layout.
   * @param x Starting point, one problem per row.
   * @param problem Evaluators over the same layout.
   * @return Result in the flattened layout.
   */
  virtual BatchResult run(Batch x, const FlatProblem &problem) = 0;

  static Batch flatten(const Batch &x) { return Eigen::Map<const Eigen::MatrixXd>(x.data(), 1, x.size()); }

  static Batch unflatten(const Batch &x, Eigen::Index rows, Eigen::Index cols) {
    return Eigen::Map<const Eigen::MatrixXd>(x.data(), rows, cols);
  }

  NewtonOptions _options;
  Observer _observer;
  unsigned int _iters = 0;
  IterationRecorder *recorder_ = nullptr; ///< Optional recorder for diagnostics
  std::ostream *report_ = &std::cout;

private:
  std::vector<Batch> _history;
};

} // namespace batch_newton
