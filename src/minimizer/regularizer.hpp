#pragma once

#include "../common.hpp"
#include "../hessian_batch.hpp"
#include "lowest_eigenvalue.hpp"
#include <Eigen/Cholesky>
#include <Eigen/Eigen>
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>

namespace batch_newton {

/// @brief How the initial diagonal shift of each row is chosen.
enum class RegularizationStrategy {
  EigenvalueShift, ///< reg = max(-2 * lambda_min, 0, reg0), then escalate.
  CholeskyOnly     ///< Start from reg0 and escalate.
};

/**
 * @brief Cholesky factors of H + reg * I for every row of a batch.
 */
struct Factorization {
  HessianBatch lower;              ///< Lower-triangular factors, one block per row.
  Eigen::VectorXd reg;             ///< Final shift per row.
  Eigen::VectorXi escalations;     ///< Escalation count per row.

  /// @brief Largest escalation count across the batch.
  int escalation_count() const { return escalations.size() ? escalations.maxCoeff() : 0; }

  /// @brief Largest final shift across the batch.
  double final_reg() const { return reg.size() ? reg.maxCoeff() : 0.0; }

  /**
   * @brief Solve (H_i + reg_i I) d_i = rhs_i for every row.
   * @param rhs Right-hand sides, one per row (batch x n).
   * @return Solutions with the same layout as @p rhs.
   */
  Batch solve(const Batch &rhs) const {
    Batch out(rhs.rows(), rhs.cols());
    for (Eigen::Index i = 0; i < rhs.rows(); ++i) {
      const auto L = lower.block(i).triangularView<Eigen::Lower>();
      Eigen::VectorXd y = L.solve(rhs.row(i).transpose());
      out.row(i) = L.transpose().solve(y).transpose();
    }
    return out;
  }
};

/**
 * @brief Turns a possibly indefinite batched Hessian into a positive-definite factorization.
 * @details Each row starts from its own shift and is escalated geometrically until its
 *          Cholesky factorization succeeds without NaN entries. Rows never share a shift.
 */
class HessianRegularizer {
public:
  HessianRegularizer() = default;

  /// @brief Initial shift floor.
  void setInitialRegularization(double reg0) noexcept { _reg0 = reg0; }

  /// @brief Multiplier applied on each failed attempt.
  void setGrowth(double growth) noexcept { _growth = growth; }

  /// @brief Bound at which escalation gives up.
  void setMaxRegularization(double reg_max) noexcept { _reg_max = reg_max; }

  /// @brief Strategy for the initial shift.
  void setStrategy(RegularizationStrategy strategy) noexcept { _strategy = strategy; }

  /// @brief Configure the lowest-eigenvalue estimator used for dimensions >= 3.
  void setEigenEstimator(int max_iters, double tol) { _lowest = LowestEigenvalue(max_iters, tol); }

  double initialRegularization() const noexcept { return _reg0; }
  double maxRegularization() const noexcept { return _reg_max; }

  /**
   * @brief Initial shift for one Hessian block.
   * @param H Square symmetric block.
   * @return max(-2 * lambda_min, 0, reg0), or reg0 when no estimate is available.
   */
  template <typename Derived> double initialShift(const Eigen::MatrixBase<Derived> &H) const {
    if (_strategy == RegularizationStrategy::CholeskyOnly)
      return _reg0;
    const double lambda_min = _lowest(H);
    if (std::isnan(lambda_min))
      return _reg0;
    return std::max({-2.0 * lambda_min, 0.0, _reg0});
  }

  /**
   * @brief Escalate the shift of one block starting at @p reg.
   * @param H Square symmetric block.
   * @param reg Starting shift.
   * @param L Receives the Cholesky factor on success.
   * @param escalations Receives the number of failed attempts.
   * @return The shift that produced a valid factor, or nothing once the bound is reached.
   */
  template <typename Derived, typename Out>
  std::optional<double> escalate(const Eigen::MatrixBase<Derived> &H, double reg, Out &&L, int &escalations) const {
    const Eigen::Index n = H.rows();
    Eigen::LLT<Eigen::MatrixXd> llt(n);
    escalations = 0;
    while (true) {
      Eigen::MatrixXd H_reg = H;
      H_reg.diagonal().array() += reg;
      llt.compute(H_reg);
      if (llt.info() == Eigen::Success) {
        Eigen::MatrixXd factor = llt.matrixL();
        if (!factor.hasNaN()) {
          L = factor;
          return reg;
        }
      }
      ++escalations;
      reg = reg > 0.0 ? reg * _growth : std::numeric_limits<double>::epsilon();
      if (!(reg < _reg_max))
        return std::nullopt;
    }
  }

  /**
   * @brief Factorize every row, reporting exhaustion as an empty outcome.
   * @param H Batched Hessian.
   * @param failed_row Receives the first row that could not be factorized.
   */
  std::optional<Factorization> try_factorize(const HessianBatch &H, Eigen::Index *failed_row = nullptr) const {
    const Eigen::Index batch = H.batch();
    Factorization F{HessianBatch(batch, H.dim()), Eigen::VectorXd(batch), Eigen::VectorXi(batch)};
    for (Eigen::Index i = 0; i < batch; ++i) {
      int escalations = 0;
      std::optional<double> reg = escalate(H.block(i), initialShift(H.block(i)), F.lower.block(i), escalations);
      if (!reg) {
        if (failed_row)
          *failed_row = i;
        return std::nullopt;
      }
      F.reg(i) = *reg;
      F.escalations(i) = escalations;
    }
    return F;
  }

  /**
   * @brief Factorize every row.
   * @throws RegularizationExhausted when some row reaches the shift bound.
   */
  Factorization factorize(const HessianBatch &H) const {
    Eigen::Index failed_row = -1;
    std::optional<Factorization> F = try_factorize(H, &failed_row);
    if (!F) {
      std::ostringstream msg;
      msg << "Numerical problems: Hessian regularization reached " << _reg_max << " without a positive-definite factor"
          << " (batch row " << failed_row << ")";
      throw RegularizationExhausted(msg.str());
    }
    return std::move(*F);
  }

private:
  double _reg0 = 1e-7;
  double _growth = 5.0;
  double _reg_max = 1e7;
  RegularizationStrategy _strategy = RegularizationStrategy::EigenvalueShift;
  LowestEigenvalue _lowest;
};

} // namespace batch_newton
