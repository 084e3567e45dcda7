#include "psychro/solver/bracket_evaluator.hpp"
#include "psychro/core/expected_utils.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace psychro::solver {

auto evaluate(const ResidualFunction& residual, double x) -> std::expected<double, core::CalculationError> {
  auto value = residual(x);
  if (!value) {
    return std::unexpected(value.error());
  }
  if (std::isnan(*value)) {
    return std::unexpected(core::NumericResultError(std::format("NaN residual at x = {}", x)));
  }
  if (std::isinf(*value)) {
    return std::unexpected(core::NumericResultError(std::format("infinite residual at x = {}", x)));
  }
  return *value;
}

auto order_points(double point_a, double fa, double point_b, double fb) noexcept -> Bracket {
  if (std::abs(fa) < std::abs(fb)) {
    return Bracket{.a = point_b, .fa = fb, .b = point_a, .fb = fa};
  }
  return Bracket{.a = point_a, .fa = fa, .b = point_b, .fb = fb};
}

auto order_bracket(const ResidualFunction& residual, double point_a, double point_b)
    -> std::expected<Bracket, core::CalculationError> {

  double fa = 0.0;
  double fb = 0.0;
  PSYCHRO_TRY_ASSIGN(fa, evaluate(residual, point_a));
  PSYCHRO_TRY_ASSIGN(fb, evaluate(residual, point_b));

  return order_points(point_a, fa, point_b, fb);
}

auto expand_bracket(const ResidualFunction& residual, Bracket bracket, const SolverConfig& config)
    -> std::expected<Bracket, core::CalculationError> {

  const int p2 = config.p2_divisor;
  const int p3 = config.p3_divisor;
  const int cycles = std::max(config.eval_cycles, p3);

  if (p2 == 0) {
    return std::unexpected(core::InvalidArgumentError("p2_divisor", p2, "p2_divisor != 0"));
  }

  for (int i = 0; i <= cycles; ++i) {
    if (p3 - i == 0) {
      continue;
    }

    const double x1 = bracket.b;
    const double f1 = bracket.fb;
    const double x2 = bracket.b / p2;

    double f2 = 0.0;
    PSYCHRO_TRY_ASSIGN(f2, evaluate(residual, x2));

    const double fx = -f1 / (p3 - i);
    const double x = linear_extrapolation(x1, f1, x2, f2, fx);
    if (!std::isfinite(x)) {
      return std::unexpected(core::NumericResultError(
          std::format("bracket extrapolation through ({}, {}) and ({}, {}) is degenerate", x1, f1, x2, f2)));
    }

    double fx_exact = 0.0;
    PSYCHRO_TRY_ASSIGN(fx_exact, evaluate(residual, x));

    bracket = order_points(x1, f1, x, fx_exact);
    if (fx_exact * f1 < 0.0) {
      break;
    }
  }

  return bracket;
}

} // namespace psychro::solver
