#pragma once

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace batch_newton {

/**
 * @brief Host-side history of per-iteration diagnostics.
 */
class IterationRecorder {
public:
  /// @brief Allocate buffers for @p capacity iterations; recording past it grows them.
  void init(int capacity) {
    if (capacity <= 0) return;
    capacity_ = capacity;
    loss_.assign(static_cast<size_t>(capacity), 0.0);
    improvement_.assign(static_cast<size_t>(capacity), 0.0);
    reg_it_.assign(static_cast<size_t>(capacity), 0);
    step_.assign(static_cast<size_t>(capacity), 0.0);
    grad_norm_.assign(static_cast<size_t>(capacity), 0.0);
    time_ms_.assign(static_cast<size_t>(capacity), 0.0);
    size_ = 0;
  }

  /// @brief Reset recorded size without releasing memory.
  void reset() { size_ = 0; }

  /**
   * @brief Record one iteration.
   * @param idx Iteration index.
   * @param loss Mean loss over the batch after the step.
   * @param improvement Convergence indicator.
   * @param reg_it Largest regularization escalation count.
   * @param step Step of the first batch row.
   * @param grad_norm Gradient norm before the step.
   * @param time_ms Cumulative time in ms.
   */
  void record(int idx, double loss, double improvement, int reg_it, double step, double grad_norm, double time_ms = 0.0) {
    if (idx < 0) return;
    if (idx >= capacity_) grow(std::max(idx + 1, 2 * capacity_));
    size_t i = static_cast<size_t>(idx);
    loss_[i] = loss;
    improvement_[i] = improvement;
    reg_it_[i] = reg_it;
    step_[i] = step;
    grad_norm_[i] = grad_norm;
    time_ms_[i] = time_ms;
    size_ = std::max(size_, idx + 1);
  }

  /// @brief Copy recorded loss and improvement to output vectors.
  void copy_to_host(std::vector<double> &loss_out, std::vector<double> &improvement_out) const {
    loss_out.assign(loss_.begin(), loss_.begin() + size_);
    improvement_out.assign(improvement_.begin(), improvement_.begin() + size_);
  }

  /// @brief Current number of recorded entries.
  int size() const { return size_; }

  double loss(int i) const { return loss_[static_cast<size_t>(i)]; }
  double improvement(int i) const { return improvement_[static_cast<size_t>(i)]; }
  int regIterations(int i) const { return reg_it_[static_cast<size_t>(i)]; }
  double step(int i) const { return step_[static_cast<size_t>(i)]; }
  double gradNorm(int i) const { return grad_norm_[static_cast<size_t>(i)]; }
  double timeMs(int i) const { return time_ms_[static_cast<size_t>(i)]; }

private:
  /// @brief Enlarge the buffers to @p capacity, keeping recorded entries.
  void grow(int capacity) {
    capacity_ = capacity;
    const size_t n = static_cast<size_t>(capacity);
    loss_.resize(n, 0.0);
    improvement_.resize(n, 0.0);
    reg_it_.resize(n, 0);
    step_.resize(n, 0.0);
    grad_norm_.resize(n, 0.0);
    time_ms_.resize(n, 0.0);
  }

  std::vector<double> loss_;        ///< Mean loss per iteration.
  std::vector<double> improvement_; ///< Convergence indicator per iteration.
  std::vector<int> reg_it_;         ///< Regularization escalations per iteration.
  std::vector<double> step_;        ///< First-row step per iteration.
  std::vector<double> grad_norm_;   ///< Gradient norms per iteration.
  std::vector<double> time_ms_;     ///< Cumulative time in ms.
  int capacity_ = 0;                ///< Allocated capacity.
  int size_ = 0;                    ///< Current number of entries.
};

/// @brief Default history file name for a run called @p name.
inline std::string history_filename(const std::string &name) {
  std::string base = name.empty() ? "run" : name;
  return base + "_history.csv";
}

/**
 * @brief Write every @p log_interval-th recorded iteration as CSV.
 * @return false when nothing was written.
 */
inline bool write_history_csv(const std::string &filename, const IterationRecorder &recorder, int log_interval) {
  if (log_interval <= 0 || recorder.size() == 0) return false;

  std::ofstream log_file(filename);
  if (!log_file.is_open()) {
    std::cerr << "Warning: cannot open history file " << filename << std::endl;
    return false;
  }
  log_file << "Iteration,Loss,Improvement,RegIt,Step,GradNorm,TimeMs\n";
  for (int i = 0; i < recorder.size(); i += log_interval) {
    log_file << i << "," << recorder.loss(i) << "," << recorder.improvement(i) << "," << recorder.regIterations(i) << ","
             << recorder.step(i) << "," << recorder.gradNorm(i) << "," << recorder.timeMs(i) << "\n";
  }
  return true;
}

} // namespace batch_newton
