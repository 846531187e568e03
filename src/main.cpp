#include "autodiff_problem.hpp"
#include "iteration_recorder.hpp"
#include "minimizer/newton.hpp"
#include "options.hpp"
#include "simple_config.hpp"
#include <autodiff/reverse/var.hpp>
#include <autodiff/reverse/var/eigen.hpp>
#include <iostream>
#include <string>

using namespace batch_newton;

using Mat = Eigen::MatrixXd;

int main(int argc, char **argv) {
  NewtonOptions options;
  if (argc > 1) {
    SimpleConfig cfg = SimpleConfig::load(argv[1]);
    if (!cfg.loaded())
      std::cerr << "Warning: cannot read config " << argv[1] << ", using defaults." << std::endl;
    options = NewtonOptions::fromConfig(cfg);
  }
  // The sample problems are independent rows of one batch.
  options.batched = true;

  // 2-D Rosenbrock valley, one starting point per row.
  AutodiffObjective rosenbrock = [](autodiff::VectorXvar v) {
    autodiff::var term1 = v(1) - v(0) * v(0);
    autodiff::var term2 = 1.0 - v(0);
    return 100.0 * term1 * term1 + term2 * term2;
  };

  Mat x0(4, 2);
  x0 << -1.2, 1.0,
        0.0, 0.0,
        2.0, -1.0,
        -0.5, 2.5;

  BatchNewton newton;
  newton.setOptions(options);
  IterationRecorder recorder;
  recorder.init(options.max_it);
  newton.setRecorder(&recorder);

  AutodiffProblem problem(rosenbrock, true);
  try {
    BatchResult result = problem.minimize(newton, x0);

    std::cout << "Status: " << (result.status == Status::Converged ? "converged" : "iteration limit reached")
              << " after " << result.iterations << " iterations" << std::endl;
    for (Eigen::Index i = 0; i < x0.rows(); ++i) {
      std::cout << "  start (" << x0(i, 0) << ", " << x0(i, 1) << ") -> (" << result.x(i, 0) << ", " << result.x(i, 1)
                << "), loss " << result.loss(i) << std::endl;
    }
  } catch (const NewtonError &e) {
    std::cerr << "Optimization failed: " << e.what() << std::endl;
    return 1;
  }

  const std::string filename = history_filename(options.name);
  if (write_history_csv(filename, recorder, options.log_interval))
    std::cout << "History written to " << filename << std::endl;
  return 0;
}
