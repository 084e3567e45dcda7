#pragma once
#include "psychro/solver/bracket_evaluator.hpp"
#include "psychro/solver/solver_types.hpp"
#include <expected>
#include <stop_token>

namespace psychro::solver {

/**
 * @brief Brent-Dekker root finder with Zhang's midpoint modification
 *
 * Each call to solve() owns its iteration state, so one solver can be shared
 * between threads. A pair of endpoints without a sign change is first passed
 * through the bracket evaluator.
 */
class BrentSolver {
private:
  const SolverConfig config_;

public:
  explicit BrentSolver(const SolverConfig& config = {}) : config_(config) {}

  /**
   * @brief Find a root of the residual starting from [point_a, point_b]
   *
   * @param residual Residual function
   * @param point_a First endpoint
   * @param point_b Second endpoint
   * @param stop Requesting a stop ends the run at the next iteration with the current estimate
   * @return Root with diagnostics, or the first calculation error
   */
  [[nodiscard]] auto solve(const ResidualFunction& residual, double point_a, double point_b,
                           std::stop_token stop = {}) const -> std::expected<SolverResult, core::CalculationError>;

  /// Same as above with the default bracket [-50, 50]
  [[nodiscard]] auto solve(const ResidualFunction& residual, std::stop_token stop = {}) const
      -> std::expected<SolverResult, core::CalculationError>;

  [[nodiscard]] auto config() const noexcept -> const SolverConfig& { return config_; }
};

/// Root only, for callers that do not need the diagnostics
[[nodiscard]] auto find_root(const ResidualFunction& residual, double point_a, double point_b,
                             const SolverConfig& config = {}) -> std::expected<double, core::CalculationError>;

[[nodiscard]] constexpr auto inverse_quadratic_interpolation(double x2, double x1, double xn, double f2, double f1,
                                                             double fn) noexcept -> double {
  return x2 * f1 * fn / ((f2 - f1) * (f2 - fn)) + x1 * f2 * fn / ((f1 - f2) * (f1 - fn)) +
         xn * f2 * f1 / ((fn - f2) * (fn - f1));
}

[[nodiscard]] constexpr auto secant_step(double x2, double x1, double f2, double f1) noexcept -> double {
  return x1 - f1 * (x1 - x2) / (f1 - f2);
}

} // namespace psychro::solver
