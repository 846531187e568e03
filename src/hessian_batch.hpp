#pragma once

#include "common.hpp"
#include <Eigen/Eigen>

namespace batch_newton {

/**
 * @brief A batch of square matrices stored side by side in one contiguous buffer.
 * @details Block i occupies columns [i*n, (i+1)*n) of an n x (batch*n) matrix, so
 *          the whole batch lives in a single column-major allocation.
 */
class HessianBatch {
public:
  HessianBatch() = default;

  /**
   * @brief Allocate @p batch zero blocks of size @p n x @p n.
   * @param batch Number of blocks (rows of the iterate).
   * @param n Block dimension (flattened variable size).
   */
  HessianBatch(Eigen::Index batch, Eigen::Index n) : _n(n), _batch(batch), _data(Eigen::MatrixXd::Zero(n, batch * n)) {}

  /// @brief Number of blocks.
  Eigen::Index batch() const noexcept { return _batch; }

  /// @brief Dimension of each block.
  Eigen::Index dim() const noexcept { return _n; }

  /// @brief Mutable view on block @p i.
  auto block(Eigen::Index i) { return _data.middleCols(i * _n, _n); }

  /// @brief Read-only view on block @p i.
  auto block(Eigen::Index i) const { return _data.middleCols(i * _n, _n); }

  /// @brief Wrap a single matrix as a batch of one.
  static HessianBatch single(const Eigen::MatrixXd &m) {
    BATCH_NEWTON_CHECK(m.rows() == m.cols(), InputError, "Hessian must be square");
    HessianBatch out(1, m.rows());
    out.block(0) = m;
    return out;
  }

  /// @brief Whether any entry of any block is NaN.
  bool hasNaN() const { return _data.hasNaN(); }

  /// @brief Underlying n x (batch*n) storage.
  const Eigen::MatrixXd &data() const noexcept { return _data; }

private:
  Eigen::Index _n = 0;
  Eigen::Index _batch = 0;
  Eigen::MatrixXd _data;
};

} // namespace batch_newton
