#pragma once

#include "../common.hpp"
#include <Eigen/Eigen>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace batch_newton {

/// @brief Fixed seed of the Lanczos start vector, so repeated runs pick the same shifts.
inline constexpr unsigned int kLanczosSeed = 123u;

/**
 * @brief Bounded estimator of the lowest eigenvalue of a symmetric matrix.
 * @details Below dimension 3 the spectrum is computed exactly. Otherwise a Lanczos
 *          iteration with full reorthogonalization is run until the lowest Ritz value
 *          moves by less than the tolerance, the Krylov space becomes invariant, or the
 *          iteration cap is hit.
 */
class LowestEigenvalue {
public:
  /**
   * @brief Configure the iterative estimator.
   * @param max_iters Iteration cap (also bounded by the matrix dimension).
   * @param tol Relative change of the Ritz value under which iteration stops.
   */
  explicit LowestEigenvalue(int max_iters = 100, double tol = 1e-3) : _max_iters(max_iters), _tol(tol) {}

  /**
   * @brief Estimate the lowest eigenvalue of @p H.
   * @param H Symmetric matrix (only the lower triangle is read by the exact path).
   * @return The estimate, NaN when the matrix has no meaningful spectrum.
   */
  template <typename Derived> double operator()(const Eigen::MatrixBase<Derived> &H) const {
    const Eigen::Index n = H.rows();
    if (n == 0)
      return 0.0;
    if (!H.allFinite())
      return std::numeric_limits<double>::quiet_NaN();
    if (n < 3)
      return exact(H);
    return lanczos(H);
  }

private:
  template <typename Derived> static double exact(const Eigen::MatrixBase<Derived> &H) {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eig(H.eval(), Eigen::EigenvaluesOnly);
    if (eig.info() != Eigen::Success)
      return std::numeric_limits<double>::quiet_NaN();
    return eig.eigenvalues().minCoeff();
  }

  template <typename Derived> double lanczos(const Eigen::MatrixBase<Derived> &H) const {
    const Eigen::Index n = H.rows();
    const Eigen::Index k_max = std::min<Eigen::Index>(std::max(_max_iters, 1), n);

    Eigen::MatrixXd Q(n, k_max);
    Eigen::VectorXd alpha(k_max);
    Eigen::VectorXd beta(k_max);

    std::mt19937 rng(kLanczosSeed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    Eigen::VectorXd q(n);
    for (Eigen::Index i = 0; i < n; ++i)
      q(i) = dist(rng);
    q.normalize();

    double theta = std::numeric_limits<double>::infinity();
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> tri;

    for (Eigen::Index j = 0; j < k_max; ++j) {
      Q.col(j) = q;
      Eigen::VectorXd w = H * q;
      alpha(j) = q.dot(w);
      w -= alpha(j) * q;
      if (j > 0)
        w -= beta(j - 1) * Q.col(j - 1);

      // Full reorthogonalization against the basis built so far.
      w -= Q.leftCols(j + 1) * (Q.leftCols(j + 1).transpose() * w);

      tri.computeFromTridiagonal(alpha.head(j + 1), beta.head(j), Eigen::EigenvaluesOnly);
      const double theta_new = tri.eigenvalues().minCoeff();
      const bool settled = std::abs(theta_new - theta) < _tol * std::max(1.0, std::abs(theta_new));
      theta = theta_new;

      beta(j) = w.norm();
      if (settled || beta(j) < 1e-12)
        break;
      q = w / beta(j);
    }
    return theta;
  }

  int _max_iters;
  double _tol;
};

} // namespace batch_newton
