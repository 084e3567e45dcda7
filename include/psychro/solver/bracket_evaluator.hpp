#pragma once
#include "psychro/solver/solver_types.hpp"
#include <expected>

namespace psychro::solver {

/**
 * @brief Evaluate the residual and reject non-finite values
 */
[[nodiscard]] auto evaluate(const ResidualFunction& residual, double x) -> std::expected<double, core::CalculationError>;

/// Order two evaluated points so that b has the smaller |f|
[[nodiscard]] auto order_points(double point_a, double fa, double point_b, double fb) noexcept -> Bracket;

/**
 * @brief Evaluate both endpoints and order them so that b has the smaller |f|
 *
 * @param residual Residual function
 * @param point_a First endpoint
 * @param point_b Second endpoint
 * @return Ordered bracket or the first evaluation error
 */
[[nodiscard]] auto order_bracket(const ResidualFunction& residual, double point_a, double point_b)
    -> std::expected<Bracket, core::CalculationError>;

/**
 * @brief Try to turn a non-bracketing pair into a sign-changing one
 *
 * Extrapolates linearly through (b, f(b)) and (b/p2, f(b/p2)) towards the value
 * -f(b)/(p3 - i) and re-orders the pair after each cycle. Stops as soon as the
 * new point has the opposite sign of f(b). The returned bracket is not checked:
 * the caller decides whether the sign condition now holds.
 *
 * @param residual Residual function
 * @param bracket Ordered initial bracket
 * @param config Supplies eval_cycles, p2_divisor and p3_divisor
 * @return Last ordered bracket or a numeric error
 */
[[nodiscard]] auto expand_bracket(const ResidualFunction& residual, Bracket bracket, const SolverConfig& config)
    -> std::expected<Bracket, core::CalculationError>;

/// x at which the line through (x1, f1), (x2, f2) reaches fx
[[nodiscard]] constexpr auto linear_extrapolation(double x1, double f1, double x2, double f2, double fx) noexcept
    -> double {
  return ((x1 - x2) / (f1 - f2)) * (fx - f1 + x1 * (f1 - f2) / (x1 - x2));
}

} // namespace psychro::solver
