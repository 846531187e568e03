#pragma once

#include "common.hpp"
#include "hessian_batch.hpp"
#include "minimizer/batch_minimizer.hpp"
#include <autodiff/reverse/var.hpp>
#include <autodiff/reverse/var/eigen.hpp>
#include <Eigen/Eigen>
#include <utility>

namespace batch_newton {

/// @brief Objective written against reverse-mode autodiff variables.
using AutodiffObjective = VecFun<autodiff::VectorXvar, autodiff::var>;

/**
 * @brief Value, gradient and Hessian of an autodiff objective.
 * @details With `batched` set, every row of the iterate is an independent problem;
 *          otherwise the whole iterate is flattened column-major into one vector.
 */
class AutodiffProblem {
public:
  AutodiffProblem(AutodiffObjective f, bool batched) : _f(std::move(f)), _batched(batched) {}

  /// @brief Objective value at a flat point.
  double value(const Eigen::VectorXd &x) const {
    autodiff::VectorXvar x_var = x.cast<autodiff::var>();
    autodiff::var y = _f(x_var);
    return autodiff::reverse::detail::val(y);
  }

  /// @brief Gradient at a flat point.
  Eigen::VectorXd gradient(const Eigen::VectorXd &x) const {
    autodiff::VectorXvar x_var = x.cast<autodiff::var>();
    autodiff::var y = _f(x_var);
    return autodiff::gradient(y, x_var);
  }

  /// @brief Hessian at a flat point.
  Eigen::MatrixXd hessian(const Eigen::VectorXd &x) const {
    autodiff::VectorXvar x_var = x.cast<autodiff::var>();
    autodiff::var y = _f(x_var);
    Eigen::VectorXd g;
    Eigen::MatrixXd H = autodiff::hessian(y, x_var, g);
    return H;
  }

  /// @brief Batched objective; holds its own copy of the problem.
  BatchLossFun lossFun() const {
    return [self = *this](const Batch &X) {
      const Batch rows = self.asRows(X);
      Eigen::VectorXd out(rows.rows());
      for (Eigen::Index i = 0; i < rows.rows(); ++i)
        out(i) = self.value(rows.row(i).transpose());
      return out;
    };
  }

  BatchGradFun gradientFun() const {
    return [self = *this](const Batch &X) -> Batch {
      const Batch rows = self.asRows(X);
      Batch out(rows.rows(), rows.cols());
      for (Eigen::Index i = 0; i < rows.rows(); ++i)
        out.row(i) = self.gradient(rows.row(i).transpose()).transpose();
      if (self._batched)
        return out;
      return Eigen::Map<const Eigen::MatrixXd>(out.data(), X.rows(), X.cols());
    };
  }

  BatchHessFun hessianFun() const {
    return [self = *this](const Batch &X) {
      const Batch rows = self.asRows(X);
      HessianBatch out(rows.rows(), rows.cols());
      for (Eigen::Index i = 0; i < rows.rows(); ++i)
        out.block(i) = self.hessian(rows.row(i).transpose());
      return out;
    };
  }

  /**
   * @brief Run @p minimizer on this problem.
   * @param minimizer Minimizer whose `batched` option must match this problem.
   * @param x Starting point.
   */
  BatchResult minimize(BatchMinimizer &minimizer, const Batch &x) const {
    BATCH_NEWTON_CHECK(minimizer.options().batched == _batched, InputError,
                       "Autodiff problem and minimizer disagree on the batch layout");
    return minimizer.minimize(x, lossFun(), gradientFun(), hessianFun());
  }

private:
  Batch asRows(const Batch &X) const {
    if (_batched)
      return X;
    return Eigen::Map<const Eigen::MatrixXd>(X.data(), 1, X.size());
  }

  AutodiffObjective _f;
  bool _batched;
};

/**
 * @brief Minimize an unbatched autodiff objective.
 * @param minimizer Minimizer to run (its `batched` option is ignored).
 * @param x Initial guess.
 * @param f_ad Objective using autodiff types.
 * @return Best point found.
 */
template <typename V> V solve_autodiff(BatchMinimizer &minimizer, V x, AutodiffObjective &f_ad) {
  AutodiffProblem problem(f_ad, false);
  VecFun<V, double> f = [&problem](V v) { return problem.value(Eigen::Map<const Eigen::VectorXd>(v.data(), v.size())); };
  GradFun<V> g = [&problem](V v) -> V {
    Eigen::VectorXd grad = problem.gradient(Eigen::Map<const Eigen::VectorXd>(v.data(), v.size()));
    return Eigen::Map<const Eigen::MatrixXd>(grad.data(), v.rows(), v.cols());
  };
  HessFun<V, Eigen::MatrixXd> h = [&problem](V v) {
    return problem.hessian(Eigen::Map<const Eigen::VectorXd>(v.data(), v.size()));
  };
  return minimizer.solve(std::move(x), f, g, h);
}

} // namespace batch_newton
