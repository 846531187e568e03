#pragma once

#include "common.hpp"
#include "minimizer/regularizer.hpp"
#include "simple_config.hpp"
#include <iostream>
#include <string>

namespace batch_newton {

/// @brief How the per-row improvements are turned into a stopping decision.
enum class ConvergenceMode {
  BatchMean, ///< Stop when the mean of step * ||d|| over the batch is below tolerance.
  PerRow     ///< Stop when every row's step * ||d|| is below tolerance.
};

/**
 * @struct NewtonOptions
 * @brief Configuration of a batched Newton run.
 */
struct NewtonOptions {
  std::string name = "newton";

  double reg0 = 1e-7;
  int max_it = 100;
  int ls_pts_nb = 5;
  bool force_step = false;
  bool batched = false;
  bool full_output = false;
  double tolerance = 1e-9;
  ConvergenceMode convergence = ConvergenceMode::BatchMean;

  // Regularization
  RegularizationStrategy regularization = RegularizationStrategy::EigenvalueShift;
  double reg_growth = 5.0;
  double reg_max = 1e7;
  int eig_max_iters = 100;
  double eig_tol = 1e-3;

  // Logging
  bool verbose = false;
  std::string verbose_prefix;
  int log_interval = 1;

  /**
   * @brief Read options from a config file, keeping defaults for missing keys.
   * @param cfg Parsed configuration.
   */
  static NewtonOptions fromConfig(const SimpleConfig &cfg) {
    NewtonOptions o;
    o.name = cfg.getString("name", o.name);
    o.reg0 = cfg.getDouble("reg0", o.reg0);
    o.max_it = cfg.getInt("max_it", o.max_it);
    o.ls_pts_nb = cfg.getInt("ls_pts_nb", o.ls_pts_nb);
    o.force_step = cfg.getBool("force_step", o.force_step);
    o.batched = cfg.getBool("batched", o.batched);
    o.full_output = cfg.getBool("full_output", o.full_output);
    o.tolerance = cfg.getDouble("tolerance", o.tolerance);
    o.reg_growth = cfg.getDouble("reg_growth", o.reg_growth);
    o.reg_max = cfg.getDouble("reg_max", o.reg_max);
    o.eig_max_iters = cfg.getInt("eig_max_iters", o.eig_max_iters);
    o.eig_tol = cfg.getDouble("eig_tol", o.eig_tol);
    o.verbose = cfg.getBool("verbose", o.verbose);
    o.verbose_prefix = cfg.getString("verbose_prefix", o.verbose_prefix);
    o.log_interval = cfg.getInt("log_interval", o.log_interval);

    const std::string convergence = cfg.getString("convergence", "mean");
    if (convergence == "per_row")
      o.convergence = ConvergenceMode::PerRow;
    else if (convergence != "mean")
      std::cerr << "Warning: unknown convergence mode '" << convergence << "', using 'mean'." << std::endl;

    const std::string regularization = cfg.getString("regularization", "eigenvalue_shift");
    if (regularization == "cholesky")
      o.regularization = RegularizationStrategy::CholeskyOnly;
    else if (regularization != "eigenvalue_shift")
      std::cerr << "Warning: unknown regularization '" << regularization << "', using 'eigenvalue_shift'." << std::endl;
    return o;
  }

  /// @brief Reject settings under which the iteration cannot terminate sensibly.
  void validate() const {
    BATCH_NEWTON_CHECK(reg0 > 0.0, InputError, "reg0 must be positive");
    BATCH_NEWTON_CHECK(reg_growth > 1.0, InputError, "reg_growth must exceed 1");
    BATCH_NEWTON_CHECK(reg_max > reg0, InputError, "reg_max must exceed reg0");
    BATCH_NEWTON_CHECK(max_it >= 0, InputError, "max_it must be non-negative");
    BATCH_NEWTON_CHECK(ls_pts_nb >= 1, InputError, "ls_pts_nb must be at least 1");
  }
};

} // namespace batch_newton
