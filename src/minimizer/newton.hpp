#pragma once

#include "../common.hpp"
#include "../table_printer.hpp"
#include "batch_minimizer.hpp"
#include "line_search.hpp"
#include "regularizer.hpp"
#include <Eigen/Eigen>
#include <chrono>
#include <optional>

namespace batch_newton {

/**
 * @brief Batched Newton minimizer with Hessian regularization and multi-point line search.
 *
 * At each iteration solves, for every batch row independently:
 *      (H(x_k) + reg I) d_k = -grad f(x_k)
 * with the smallest shift that keeps the factorization positive definite, then picks a
 * step among log-spaced multipliers of d_k. The best point of every row is tracked and
 * returned, which need not be the last iterate.
 */
class BatchNewton : public BatchMinimizer {
public:
  /// @brief Regularizer configured from the current options.
  HessianRegularizer regularizer() const {
    HessianRegularizer reg;
    reg.setInitialRegularization(_options.reg0);
    reg.setGrowth(_options.reg_growth);
    reg.setMaxRegularization(_options.reg_max);
    reg.setStrategy(_options.regularization);
    reg.setEigenEstimator(_options.eig_max_iters, _options.eig_tol);
    return reg;
  }

  /// @brief Line search configured from the current options.
  MultiPointLineSearch lineSearch() const { return MultiPointLineSearch(_options.ls_pts_nb, _options.force_step); }

protected:
  BatchResult run(Batch x, const FlatProblem &problem) override {
    const Eigen::Index M = x.rows();
    const Eigen::Index n = x.cols();
    const HessianRegularizer reg = regularizer();
    const MultiPointLineSearch line_search = lineSearch();

    Eigen::VectorXd f = problem.loss(x);
    BATCH_NEWTON_CHECK(f.size() == M, InputError, "Objective must return one loss per batch row");

    BatchResult result;
    result.x = x;
    result.loss = f;
    if (_options.full_output)
      result.history.push_back(x);
    if (problem.observer)
      problem.observer(x);

    std::optional<TablePrinter> table;
    if (_options.verbose) {
      table.emplace(std::vector<TablePrinter::Column>{{"it", 5, -1},
                                                      {"imprv", 10, 4},
                                                      {"loss", 10, 4},
                                                      {"reg_it", 6, -1},
                                                      {"bet", 10, 4},
                                                      {"||g_prev||_2", 12, 4}},
                    _options.verbose_prefix, *report_);
      table->header();
    }

    if (recorder_) recorder_->reset();
    auto start_time = std::chrono::steady_clock::now();

    _iters = 0;
    for (int it = 0; it < _options.max_it; ++it) {
      Batch g = problem.gradient(x);
      BATCH_NEWTON_CHECK(g.rows() == M && g.cols() == n, InputError, "Gradient must have the shape of the iterate");
      if (g.hasNaN())
        throw NumericalInstability("Gradient is NaN");

      HessianBatch H = problem.hessian(x);
      BATCH_NEWTON_CHECK(H.batch() == M && H.dim() == n, InputError, "Hessian must hold one n x n block per batch row");
      if (H.hasNaN())
        throw NumericalInstability("Hessian is NaN");

      const Factorization F = reg.factorize(H);
      const Batch d = F.solve(-g);

      const LineSearchResult ls = line_search.search(f, x, d, problem.loss);
      x += ls.step.asDiagonal() * d;
      if (_options.full_output)
        result.history.push_back(x);

      const double imprv = improvement(ls);
      if (problem.observer)
        problem.observer(x);

      // Keep, row by row, whichever of the new point and the previous best is lower.
      const Eigen::Array<bool, Eigen::Dynamic, 1> improved = ls.loss.array() < result.loss.array();
      result.x = improved.replicate(1, n).select(x.array(), result.x.array()).matrix();
      result.loss = improved.select(ls.loss.array(), result.loss.array()).matrix();
      f = ls.loss;

      const double mean_loss = f.mean();
      const double gnorm = g.norm();
      if (recorder_) {
        const double elapsed_ms =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();
        recorder_->record(it, mean_loss, imprv, F.escalation_count(), ls.step(0), gnorm, elapsed_ms);
      }
      if (table)
        table->row({static_cast<double>(it), imprv, mean_loss, static_cast<double>(F.escalation_count()), ls.step(0), gnorm});

      _iters = static_cast<unsigned int>(it + 1);
      if (imprv < _options.tolerance) {
        result.status = Status::Converged;
        break;
      }
    }
    if (table)
      table->footer();

    if (_options.full_output)
      result.history.push_back(result.x);
    result.iterations = _iters;
    return result;
  }

private:
  double improvement(const LineSearchResult &ls) const {
    const Eigen::ArrayXd per_row = ls.step.array() * ls.direction_norm.array();
    if (_options.convergence == ConvergenceMode::PerRow)
      return per_row.maxCoeff();
    return per_row.mean();
  }
};

} // namespace batch_newton
