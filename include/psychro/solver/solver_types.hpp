#pragma once
#include "psychro/core/constants.hpp"
#include "psychro/core/exceptions.hpp"
#include <expected>
#include <functional>

namespace psychro::solver {

/// Scalar residual f(x); a failing nested calculation propagates as its error
using ResidualFunction = std::function<std::expected<double, core::CalculationError>(double)>;

struct SolverConfig {
  double tolerance = constants::solver::tolerance;
  int max_iterations = constants::solver::max_iterations;
  int eval_cycles = constants::solver::eval_cycles;
  int p2_divisor = constants::solver::p2_divisor;
  int p3_divisor = constants::solver::p3_divisor;
  // Iteration limit exhaustion returns ConvergenceError instead of the last estimate
  bool strict_convergence = false;
};

struct SolverResult {
  double root = 0.0;
  double residual = 0.0;
  int iterations = 0;
  double bracket_width = 0.0;
  bool converged = false;
  bool stopped = false;
};

/**
 * @brief Pair of points around a root; b holds the smaller |f|
 */
struct Bracket {
  double a = constants::solver::default_point_a;
  double fa = 0.0;
  double b = constants::solver::default_point_b;
  double fb = 0.0;

  [[nodiscard]] auto has_sign_change() const noexcept -> bool { return fa * fb < 0.0; }
};

} // namespace psychro::solver
