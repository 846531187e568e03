#pragma once

#include "../common.hpp"
#include <Eigen/Eigen>
#include <cmath>
#include <limits>

namespace batch_newton {

/**
 * @brief Outcome of a line search, one entry per batch row.
 */
struct LineSearchResult {
  Eigen::VectorXd step;           ///< Chosen multiplier.
  Eigen::VectorXd loss;           ///< Loss at the chosen multiplier.
  Eigen::VectorXd direction_norm; ///< Norm of the direction (convergence signal).
};

/**
 * @brief Multi-point geometric line search.
 * @details Evaluates the objective at a fixed, log-spaced set of multipliers of the
 *          direction and keeps, per row, the one with the smallest loss. Unless a step is
 *          forced, the zero step with the incumbent loss competes too, so no row ever gets
 *          worse.
 */
class MultiPointLineSearch {
public:
  /**
   * @param points Number of candidate multipliers in [1e-1, 1e1].
   * @param force_step Whether to leave out the zero step.
   */
  explicit MultiPointLineSearch(int points = 5, bool force_step = false) : _points(points), _force_step(force_step) {}

  void setPoints(int points) noexcept { _points = points; }
  void setForceStep(bool force_step) noexcept { _force_step = force_step; }
  bool forceStep() const noexcept { return _force_step; }

  /// @brief Candidate multipliers, 10^linspace(-1, 1, points), or {1} below two points.
  Eigen::VectorXd multipliers() const {
    if (_points < 2)
      return Eigen::VectorXd::Ones(1);
    Eigen::VectorXd exponents = Eigen::VectorXd::LinSpaced(_points, -1.0, 1.0);
    return exponents.unaryExpr([](double e) { return std::pow(10.0, e); });
  }

  /**
   * @brief Search along @p d from @p x.
   * @param f Incumbent loss per row.
   * @param x Current iterate (batch x n).
   * @param d Direction (batch x n).
   * @param loss Batched objective.
   * @return Per-row step, loss and direction norm.
   */
  LineSearchResult search(const Eigen::VectorXd &f, const Batch &x, const Batch &d, const BatchLossFun &loss) const {
    const Eigen::VectorXd bets = multipliers();
    Eigen::MatrixXd y(x.rows(), bets.size());
    for (Eigen::Index k = 0; k < bets.size(); ++k) {
      Eigen::VectorXd yk = loss(x + bets(k) * d);
      BATCH_NEWTON_CHECK(yk.size() == x.rows(), InputError, "Objective must return one loss per batch row");
      y.col(k) = yk;
    }
    LineSearchResult result = select(y, bets, f, _force_step);
    result.direction_norm = d.rowwise().norm();
    return result;
  }

  /**
   * @brief Pick the best candidate of every row.
   * @param losses Loss matrix (rows x candidates); NaN entries count as +infinity.
   * @param bets Candidate multipliers.
   * @param incumbent Loss at the zero step.
   * @param force_step Whether to leave out the zero step.
   * @return Step and loss per row; direction_norm is left empty.
   */
  static LineSearchResult select(const Eigen::MatrixXd &losses,
                                 const Eigen::VectorXd &bets,
                                 const Eigen::VectorXd &incumbent,
                                 bool force_step) {
    const Eigen::Index rows = losses.rows();
    const Eigen::Index offset = force_step ? 0 : 1;

    Eigen::VectorXd candidates(bets.size() + offset);
    Eigen::MatrixXd y(rows, bets.size() + offset);
    if (!force_step) {
      BATCH_NEWTON_CHECK(incumbent.size() == rows, InputError, "Incumbent loss must have one entry per batch row");
      candidates(0) = 0.0;
      y.col(0) = incumbent;
    }
    candidates.tail(bets.size()) = bets;
    y.rightCols(bets.size()) = losses;
    y = y.unaryExpr([](double v) { return std::isnan(v) ? std::numeric_limits<double>::infinity() : v; });

    LineSearchResult result;
    result.step.resize(rows);
    result.loss.resize(rows);
    for (Eigen::Index i = 0; i < rows; ++i) {
      Eigen::Index idx = 0;
      result.loss(i) = y.row(i).minCoeff(&idx);
      result.step(i) = candidates(idx);
    }
    return result;
  }

private:
  int _points;
  bool _force_step;
};

} // namespace batch_newton
