#include "psychro/solver/brent_solver.hpp"
#include "psychro/core/expected_utils.hpp"
#include <cmath>
#include <format>
#include <limits>
#include <utility>

namespace psychro::solver {

namespace {

// State of a single solve() call
struct SolverRun {
  const ResidualFunction& residual;
  const SolverConfig& config;
  Bracket bracket;
  double c = 0.0;
  double fc = 0.0;
  double s = 0.0;
  double fs = 0.0;
  int counter = 0;
  double diff = std::numeric_limits<double>::max();

  [[nodiscard]] auto result(bool converged, bool stopped) const -> SolverResult {
    return SolverResult{.root = bracket.b,
                        .residual = bracket.fb,
                        .iterations = counter,
                        .bracket_width = diff,
                        .converged = converged,
                        .stopped = stopped};
  }

  [[nodiscard]] auto step() -> std::expected<void, core::CalculationError> {
    auto& [a, fa, b, fb] = bracket;

    c = (a + b) / 2.0;
    PSYCHRO_TRY_ASSIGN(fc, evaluate(residual, c));

    if (fa != fc && fb != fc) {
      s = inverse_quadratic_interpolation(a, b, c, fa, fb, fc);
    } else {
      s = secant_step(a, b, fa, fb);
    }

    diff = std::abs(b - a);
    PSYCHRO_TRY_ASSIGN(fs, evaluate(residual, s));

    if (c > s) {
      std::swap(c, s);
      std::swap(fc, fs);
    }

    if (fc * fs < 0.0) {
      a = s;
      fa = fs;
      b = c;
      fb = fc;
    } else if (fs * fb < 0.0) {
      a = c;
      fa = fc;
    } else {
      b = s;
      fb = fs;
    }
    return {};
  }
};

} // namespace

auto BrentSolver::solve(const ResidualFunction& residual, double point_a, double point_b, std::stop_token stop) const
    -> std::expected<SolverResult, core::CalculationError> {

  SolverRun run{.residual = residual, .config = config_, .bracket = {}};
  PSYCHRO_TRY_ASSIGN(run.bracket, order_bracket(residual, point_a, point_b));

  if (std::abs(run.bracket.fb) < config_.tolerance) {
    return run.result(true, false);
  }
  if (stop.stop_requested()) {
    return run.result(false, true);
  }

  if (!run.bracket.has_sign_change()) {
    PSYCHRO_TRY_ASSIGN(run.bracket, expand_bracket(residual, run.bracket, config_));
    if (std::abs(run.bracket.fb) < config_.tolerance) {
      return run.result(true, false);
    }
    if (!run.bracket.has_sign_change()) {
      const auto& [a, fa, b, fb] = run.bracket;
      return std::unexpected(core::BracketConditionError(std::format(
          "f(a) and f(b) must have opposite signs after bracket evaluation: a = {:.3f}, b = {:.3f}, f(a) = {:.3f}, "
          "f(b) = {:.3f}",
          a, b, fa, fb)));
    }
  }

  while (!stop.stop_requested()) {
    ++run.counter;
    PSYCHRO_TRY_VOID(run.step());

    if (run.diff < config_.tolerance || run.bracket.fb == 0.0) {
      return run.result(true, false);
    }
    if (run.counter > config_.max_iterations) {
      if (config_.strict_convergence) {
        return std::unexpected(core::ConvergenceError(
            std::format("no convergence after {} iterations: b = {}, f(b) = {}, |b - a| = {}", run.counter,
                        run.bracket.b, run.bracket.fb, run.diff)));
      }
      return run.result(false, false);
    }
  }

  return run.result(false, true);
}

auto BrentSolver::solve(const ResidualFunction& residual, std::stop_token stop) const
    -> std::expected<SolverResult, core::CalculationError> {
  return solve(residual, constants::solver::default_point_a, constants::solver::default_point_b, std::move(stop));
}

auto find_root(const ResidualFunction& residual, double point_a, double point_b, const SolverConfig& config)
    -> std::expected<double, core::CalculationError> {
  return BrentSolver(config).solve(residual, point_a, point_b).transform([](const SolverResult& r) { return r.root; });
}

} // namespace psychro::solver
